#pragma once

#include <ctxsync/entry.hpp>
#include <ctxsync/error.hpp>
#include <ctxsync/session_registry.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

/// JSON messages exchanged with context clients.
namespace ctxsync::protocol {

constexpr const char* kVersion = "1.0.0";

// Inbound message types.
constexpr std::string_view kAuthenticate = "authenticate";
constexpr std::string_view kUpdateContext = "update_context";
constexpr std::string_view kGetContext = "get_context";
constexpr std::string_view kQueryContext = "query_context";
constexpr std::string_view kClearContext = "clear_context";
constexpr std::string_view kSetPriority = "set_priority";
constexpr std::string_view kRefreshToken = "refresh_token";
constexpr std::string_view kPing = "ping";

// Outbound message types.
constexpr const char* kAuthSuccess = "auth_success";
constexpr const char* kContext = "context";
constexpr const char* kContextUpdate = "context_update";
constexpr const char* kUpdateAck = "update_ack";
constexpr const char* kQueryResponse = "query_response";
constexpr const char* kClearAck = "clear_ack";
constexpr const char* kPriorityAck = "priority_ack";
constexpr const char* kTokenRefreshed = "token_refreshed";
constexpr const char* kPong = "pong";
constexpr const char* kError = "error";

/// @brief Format a time point as ISO-8601 UTC with microseconds, e.g. `2025-01-02T03:04:05.000006Z`.
std::string isoTimestamp(TimePoint time);

/// @brief `{content, tokens, source, priority, timestamp}` for one entry.
nlohmann::json entryToJson(const Entry& entry);

/// @brief The `data` map of a snapshot, keyed by entry key.
nlohmann::json snapshotData(const ContextSnapshot& snapshot);

/// @brief `{total_tokens, max_tokens, entry_count}`.
nlohmann::json snapshotMetadata(const ContextSnapshot& snapshot);

/// @brief A full snapshot message of the given type (`context` or `context_update`).
nlohmann::json snapshotMessage(const ContextSnapshot& snapshot, const char* type);

/// @brief An `error` message with the protocol name of `error`.
nlohmann::json errorMessage(
  CtxError error, std::string_view message, std::optional<std::string_view> request_type = std::nullopt
);

/// @brief The greeting sent after a successful authentication.
nlohmann::json authSuccessMessage(const Session& session, uint64_t max_tokens);

/// @brief A message of the given type with a `timestamp` field.
nlohmann::json makeMessage(const char* type);

}  // namespace ctxsync::protocol
