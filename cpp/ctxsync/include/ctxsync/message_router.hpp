#pragma once

#include <ctxsync/authenticator.hpp>
#include <ctxsync/broadcast.hpp>
#include <ctxsync/context_store.hpp>
#include <ctxsync/error.hpp>
#include <ctxsync/session_registry.hpp>

#include <nlohmann/json.hpp>

#include <set>
#include <string>
#include <string_view>
#include <unordered_map>

namespace ctxsync {

struct RouterOptions {
  /// @brief Roles allowed to clear the whole store or entries owned by other users.
  std::set<std::string> elevated_roles = {"admin"};
};

/// @brief Translates inbound messages of authenticated sessions into store and registry calls.
///
/// The router is the boundary at which internal errors become protocol `error` replies. Every
/// mutating message triggers exactly one broadcast, after the store operation has completed.
/// Malformed messages produce an error reply without side effects.
class MessageRouter final {
public:
  MessageRouter(
    ContextStore& store, SessionRegistry& registry, Authenticator& authenticator,
    BroadcastEngine& broadcaster, RouterOptions options = RouterOptions()
  );

  MessageRouter(const MessageRouter&) = delete;
  MessageRouter& operator=(const MessageRouter&) = delete;
  MessageRouter(MessageRouter&&) = delete;
  MessageRouter& operator=(MessageRouter&&) = delete;
  ~MessageRouter() = default;

  /// @brief Handle one raw text message from `client_id` and return the reply to send to it.
  nlohmann::json handle(const std::string& client_id, std::string_view raw, TimePoint now = Clock::now());

  /// @brief Whether the principal holds one of the elevated roles.
  [[nodiscard]] bool isElevated(const Principal& principal) const;

  /// @brief Whether the principal owns entries written by `source`.
  [[nodiscard]] static bool ownsSource(const Principal& principal, const std::string& source);

private:
  using Handler = nlohmann::json (MessageRouter::*)(const Session&, const nlohmann::json&);

  nlohmann::json handleUpdate(const Session& session, const nlohmann::json& message);
  nlohmann::json handleGet(const Session& session, const nlohmann::json& message);
  nlohmann::json handleQuery(const Session& session, const nlohmann::json& message);
  nlohmann::json handleClear(const Session& session, const nlohmann::json& message);
  nlohmann::json handleSetPriority(const Session& session, const nlohmann::json& message);
  nlohmann::json handleRefreshToken(const Session& session, const nlohmann::json& message);
  nlohmann::json handlePing(const Session& session, const nlohmann::json& message);
  nlohmann::json handleAuthenticate(const Session& session, const nlohmann::json& message);

  ContextStore& store_;
  SessionRegistry& registry_;
  Authenticator& authenticator_;
  BroadcastEngine& broadcaster_;
  RouterOptions options_;
  std::unordered_map<std::string_view, Handler> handlers_;
};

}  // namespace ctxsync
