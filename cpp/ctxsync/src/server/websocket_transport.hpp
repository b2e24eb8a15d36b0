#pragma once

#include <ctxsync/transport.hpp>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include <atomic>
#include <string>

namespace ctxsync {

using WebSocketEndpoint = websocketpp::server<websocketpp::config::asio>;

/// @brief A Transport over one websocketpp server connection.
///
/// send() only queues the frame on the connection. A connection whose outgoing buffer already
/// holds more than `max_pending_bytes` is treated as a failed recipient.
class WebSocketTransport final : public Transport {
public:
  WebSocketTransport(
    WebSocketEndpoint& endpoint, websocketpp::connection_hdl hdl, std::string remote,
    size_t max_pending_bytes
  );

  CtxError send(const std::string& payload) override;
  void close(CloseCode code, const std::string& reason) override;
  [[nodiscard]] std::string remoteEndpoint() const override;

  [[nodiscard]] bool closed() const {
    return closed_;
  }

private:
  WebSocketEndpoint& endpoint_;
  websocketpp::connection_hdl hdl_;
  std::string remote_;
  size_t max_pending_bytes_;
  std::atomic<bool> closed_{false};
};

}  // namespace ctxsync
