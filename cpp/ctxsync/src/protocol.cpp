#include <ctxsync/protocol.hpp>

#include <array>
#include <cstdio>
#include <ctime>

namespace ctxsync::protocol {

std::string isoTimestamp(TimePoint time) {
  auto since_epoch = time.time_since_epoch();
  auto seconds = std::chrono::floor<std::chrono::seconds>(since_epoch);
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(since_epoch - seconds);
  std::time_t tt = static_cast<std::time_t>(seconds.count());
  std::tm utc{};
  gmtime_r(&tt, &utc);
  std::array<char, 40> buf{};
  std::snprintf(
    buf.data(),
    buf.size(),
    "%04d-%02d-%02dT%02d:%02d:%02d.%06lldZ",
    utc.tm_year + 1900,
    utc.tm_mon + 1,
    utc.tm_mday,
    utc.tm_hour,
    utc.tm_min,
    utc.tm_sec,
    static_cast<long long>(micros.count())
  );
  return std::string{buf.data()};
}

nlohmann::json entryToJson(const Entry& entry) {
  return {
    {"content", entry.payload},
    {"tokens", entry.token_count},
    {"source", entry.source},
    {"priority", entry.priority},
    {"timestamp", isoTimestamp(entry.timestamp)},
  };
}

nlohmann::json snapshotData(const ContextSnapshot& snapshot) {
  auto data = nlohmann::json::object();
  for (const auto& [key, entry] : snapshot.entries) {
    data[key] = entryToJson(entry);
  }
  return data;
}

nlohmann::json snapshotMetadata(const ContextSnapshot& snapshot) {
  return {
    {"total_tokens", snapshot.total_tokens},
    {"max_tokens", snapshot.max_tokens},
    {"entry_count", snapshot.entryCount()},
  };
}

nlohmann::json snapshotMessage(const ContextSnapshot& snapshot, const char* type) {
  auto message = makeMessage(type);
  message["data"] = snapshotData(snapshot);
  message["metadata"] = snapshotMetadata(snapshot);
  return message;
}

nlohmann::json errorMessage(
  CtxError error, std::string_view text, std::optional<std::string_view> request_type
) {
  auto message = makeMessage(kError);
  message["error"] = protocolErrorName(error);
  message["message"] = std::string(text);
  if (request_type) {
    message["request_type"] = std::string(*request_type);
  }
  return message;
}

nlohmann::json authSuccessMessage(const Session& session, uint64_t max_tokens) {
  auto message = makeMessage(kAuthSuccess);
  message["client_id"] = session.client_id;
  message["user_id"] = session.principal.user_id;
  message["role"] = session.principal.role;
  message["authenticated_at"] = isoTimestamp(session.authenticated_at);
  if (session.credential_expires_at) {
    message["expires_at"] = isoTimestamp(*session.credential_expires_at);
  }
  message["server_info"] = {
    {"version", kVersion},
    {"max_tokens", max_tokens},
    {"features", {"jwt_auth", "token_refresh", "context_management"}},
  };
  return message;
}

nlohmann::json makeMessage(const char* type) {
  return {
    {"type", type},
    {"timestamp", isoTimestamp(Clock::now())},
  };
}

}  // namespace ctxsync::protocol
