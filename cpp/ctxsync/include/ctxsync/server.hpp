#pragma once

#include <ctxsync/entry.hpp>
#include <ctxsync/error.hpp>
#include <ctxsync/key_source.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ctxsync {

/// @brief Options for a context server.
struct ContextServerOptions {
  /// @brief The host address of the server.
  std::string host = "127.0.0.1";
  /// @brief The port of the server. 0 selects an ephemeral port.
  uint16_t port = 9876;
  /// @brief The token budget of the context store.
  uint64_t max_tokens = 128000;
  /// @brief Serialized payload bytes per token.
  uint64_t bytes_per_token = 1;
  /// @brief Sessions without inbound activity for this long are closed.
  std::chrono::seconds idle_timeout = std::chrono::hours(24);
  /// @brief Interval of the idle session sweep.
  std::chrono::seconds sweep_interval = std::chrono::seconds(60);
  /// @brief Time a new connection has to present a credential.
  std::chrono::seconds auth_timeout = std::chrono::seconds(10);
  /// @brief Time allowed for one broadcast send to one client.
  std::chrono::milliseconds send_timeout = std::chrono::seconds(5);
  /// @brief Outgoing bytes a client may have queued before it counts as unresponsive.
  size_t max_pending_send_bytes = size_t(16) * 1024 * 1024;
  /// @brief Roles allowed to clear context written by other users.
  std::set<std::string> elevated_roles = {"admin"};
  /// @brief Number of threads running the network loop.
  size_t worker_threads = 1;
  /// @brief Where credential verification keys come from.
  ///
  /// If unset, the server generates a random secret, so that no client can authenticate.
  std::unique_ptr<KeySource> key_source;
  /// @brief Required `iss` claim, if set.
  std::optional<std::string> issuer;
  /// @brief Required `aud` claim, if set.
  std::optional<std::string> audience;
  /// @brief Minimum time between key set refreshes caused by failed verifications.
  std::chrono::seconds key_refresh_cooldown = std::chrono::seconds(30);

  /// @brief Build options from `CTXSYNC_*` environment variables, starting from the defaults.
  ///
  /// Also applies `CTXSYNC_LOG_LEVEL` to the logger. Fails with ConfigError on malformed values.
  static CtxResult<ContextServerOptions> fromEnvironment();
};

/// @brief One connected session, as reported by ContextServer::status().
struct SessionStatus {
  std::string client_id;
  std::string user_id;
  std::string role;
  TimePoint authenticated_at;
  TimePoint last_activity;
};

/// @brief A point-in-time summary of a running server.
struct ServerStatus {
  size_t connected_sessions = 0;
  size_t entry_count = 0;
  uint64_t total_tokens = 0;
  uint64_t max_tokens = 0;
  uint64_t version = 0;
  uint64_t evicted_total = 0;
  std::vector<SessionStatus> sessions;
};

/// @brief A WebSocket server that shares one token-budgeted context store among its clients.
///
/// Clients authenticate with a bearer credential, either at connection time (an `Authorization`
/// header or a `token` query parameter) or with an `authenticate` message. Every change to the
/// store is pushed to every authenticated client as a `context_update` snapshot.
class ContextServer final {
public:
  /// @brief Create and start a new server with the given options.
  static CtxResult<ContextServer> create(ContextServerOptions&& options);

  ContextServer(ContextServer&&) noexcept;
  ContextServer& operator=(ContextServer&&) noexcept;
  ContextServer(const ContextServer&) = delete;
  ContextServer& operator=(const ContextServer&) = delete;
  ~ContextServer();

  /// Get the port on which the server is listening.
  [[nodiscard]] uint16_t port() const;

  /// @brief Gracefully shut down the server, closing every connection with 1001.
  CtxError stop();

  /// @brief Connected sessions and store statistics.
  [[nodiscard]] ServerStatus status() const;

private:
  class Impl;

  explicit ContextServer(std::unique_ptr<Impl> impl);

  std::unique_ptr<Impl> impl_;
};

}  // namespace ctxsync
