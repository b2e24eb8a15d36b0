#pragma once

#include <ctxsync/entry.hpp>
#include <ctxsync/error.hpp>
#include <ctxsync/transport.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ctxsync {

/// @brief The resolved identity of an authenticated connection.
struct Principal {
  std::string user_id;
  std::string role;
  /// @brief Every claim of the verified credential.
  nlohmann::json claims = nlohmann::json::object();
};

/// @brief An authenticated, live connection.
struct Session {
  std::string client_id;
  /// @brief Fixed for the lifetime of the session.
  Principal principal;
  TimePoint authenticated_at;
  TimePoint last_activity;
  /// @brief Expiry of the most recently verified credential, if it has one.
  std::optional<TimePoint> credential_expires_at;
  std::shared_ptr<Transport> transport;
};

/// @brief A lightweight reference to a registered session's transport.
struct SessionHandle {
  std::string client_id;
  std::shared_ptr<Transport> transport;
};

/// @brief Tracks authenticated sessions and their activity.
///
/// The registry exclusively owns Session objects. Other components read copies or handles; none of
/// them keep references into the registry.
class SessionRegistry final {
public:
  explicit SessionRegistry(std::chrono::seconds idle_timeout = std::chrono::hours(24));

  SessionRegistry(const SessionRegistry&) = delete;
  SessionRegistry& operator=(const SessionRegistry&) = delete;
  SessionRegistry(SessionRegistry&&) = delete;
  SessionRegistry& operator=(SessionRegistry&&) = delete;
  ~SessionRegistry() = default;

  /// @brief Generate an 8 hex digit client id that is not in use in this process.
  [[nodiscard]] std::string nextClientId(std::string_view remote_endpoint);

  /// @brief Register a session. Fails with ValidationError if the client id is already taken.
  CtxError add(Session session);

  /// @brief Unregister a session and return it, so the caller can release its transport.
  std::optional<Session> remove(const std::string& client_id);

  /// @brief Record inbound activity. Returns false for unknown clients.
  bool touch(const std::string& client_id, TimePoint now = Clock::now());

  /// @brief Record the expiry of a refreshed credential. Returns false for unknown clients.
  bool setCredentialExpiry(const std::string& client_id, std::optional<TimePoint> expires_at);

  /// @brief A copy of one session.
  [[nodiscard]] std::optional<Session> find(const std::string& client_id) const;

  /// @brief Copies of every session, ordered by client id.
  [[nodiscard]] std::vector<Session> sessions() const;

  /// @brief A momentary snapshot of every registered transport.
  [[nodiscard]] std::vector<SessionHandle> handles() const;

  /// @brief Remove and return every session idle for longer than the timeout at `now`.
  std::vector<Session> sweepIdle(TimePoint now = Clock::now());

  [[nodiscard]] size_t size() const;

  [[nodiscard]] std::chrono::seconds idleTimeout() const {
    return std::chrono::duration_cast<std::chrono::seconds>(idle_timeout_);
  }

private:
  // Saturated to what Clock can represent.
  const Clock::duration idle_timeout_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Session> sessions_;
  uint64_t id_counter_ = 0;
};

}  // namespace ctxsync
