#pragma once

#include <ctxsync/error.hpp>

#include <cstdint>
#include <string>

namespace ctxsync {

/// @brief WebSocket close codes used by the context server.
enum class CloseCode : uint16_t {
  /// Normal closure.
  Normal = 1000,
  /// The server is shutting down.
  GoingAway = 1001,
  /// The credential was missing, malformed, or failed verification.
  InvalidCredential = 4001,
  /// The session was idle for longer than the configured timeout.
  IdleTimeout = 4002,
  /// The credential has expired. Clients may retry with a fresh credential.
  CredentialExpired = 4003,
  /// No credential was presented within the authentication window.
  AuthenticationTimeout = 4004,
};

/// @brief A bidirectional message channel to one client.
///
/// The rest of the system treats a transport opaquely. Implementations must be safe to call from
/// multiple threads, and send() must return promptly: a recipient that cannot accept more data
/// reports TransportError instead of blocking.
class Transport {
public:
  Transport() = default;
  Transport(const Transport&) = delete;
  Transport& operator=(const Transport&) = delete;
  Transport(Transport&&) = delete;
  Transport& operator=(Transport&&) = delete;
  virtual ~Transport() = default;

  /// @brief Queue one text message for delivery.
  virtual CtxError send(const std::string& payload) = 0;

  /// @brief Close the channel with the given code and reason. Idempotent.
  virtual void close(CloseCode code, const std::string& reason) = 0;

  /// @brief A printable description of the remote endpoint.
  [[nodiscard]] virtual std::string remoteEndpoint() const = 0;
};

}  // namespace ctxsync
