#include "websocket_transport.hpp"

#include <utility>

namespace ctxsync {

WebSocketTransport::WebSocketTransport(
  WebSocketEndpoint& endpoint, websocketpp::connection_hdl hdl, std::string remote,
  size_t max_pending_bytes
)
    : endpoint_(endpoint)
    , hdl_(std::move(hdl))
    , remote_(std::move(remote))
    , max_pending_bytes_(max_pending_bytes) {}

CtxError WebSocketTransport::send(const std::string& payload) {
  if (closed_) {
    return CtxError::TransportError;
  }
  std::error_code ec;
  auto connection = endpoint_.get_con_from_hdl(hdl_, ec);
  if (ec) {
    return CtxError::TransportError;
  }
  if (connection->get_state() != websocketpp::session::state::open) {
    return CtxError::TransportError;
  }
  if (connection->get_buffered_amount() + payload.size() > max_pending_bytes_) {
    warn() << "client at " << remote_ << " has " << connection->get_buffered_amount()
           << " bytes pending; dropping it";
    return CtxError::TransportError;
  }
  ec = connection->send(payload, websocketpp::frame::opcode::text);
  if (ec) {
    debug() << "send to " << remote_ << " failed: " << ec.message();
    return CtxError::TransportError;
  }
  return CtxError::Ok;
}

void WebSocketTransport::close(CloseCode code, const std::string& reason) {
  if (closed_.exchange(true)) {
    return;
  }
  std::error_code ec;
  endpoint_.close(hdl_, static_cast<websocketpp::close::status::value>(code), reason, ec);
  if (ec) {
    debug() << "closing connection to " << remote_ << ": " << ec.message();
  }
}

std::string WebSocketTransport::remoteEndpoint() const {
  return remote_;
}

}  // namespace ctxsync
