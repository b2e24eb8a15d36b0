#include <ctxsync/session_registry.hpp>

#include <algorithm>
#include <array>
#include <cstdio>
#include <functional>
#include <utility>

namespace ctxsync {

namespace {

Clock::duration saturate(std::chrono::seconds timeout) {
  constexpr auto kLimit = std::chrono::duration_cast<std::chrono::seconds>(Clock::duration::max());
  if (timeout >= kLimit) {
    return Clock::duration::max();
  }
  return std::chrono::duration_cast<Clock::duration>(timeout);
}

}  // namespace

SessionRegistry::SessionRegistry(std::chrono::seconds idle_timeout)
    : idle_timeout_(saturate(idle_timeout)) {}

std::string SessionRegistry::nextClientId(std::string_view remote_endpoint) {
  std::scoped_lock lock{mutex_};
  std::array<char, 9> buf{};
  while (true) {
    size_t hash = std::hash<std::string_view>{}(remote_endpoint);
    hash ^= std::hash<uint64_t>{}(++id_counter_) + 0x9e3779b97f4a7c15ULL + (hash << 6) + (hash >> 2);
    std::snprintf(buf.data(), buf.size(), "%08x", static_cast<uint32_t>(hash ^ (hash >> 32)));
    std::string id{buf.data()};
    if (sessions_.find(id) == sessions_.end()) {
      return id;
    }
  }
}

CtxError SessionRegistry::add(Session session) {
  std::scoped_lock lock{mutex_};
  auto client_id = session.client_id;
  auto [it, inserted] = sessions_.emplace(client_id, std::move(session));
  if (!inserted) {
    return CtxError::ValidationError;
  }
  return CtxError::Ok;
}

std::optional<Session> SessionRegistry::remove(const std::string& client_id) {
  std::scoped_lock lock{mutex_};
  auto it = sessions_.find(client_id);
  if (it == sessions_.end()) {
    return std::nullopt;
  }
  Session session = std::move(it->second);
  sessions_.erase(it);
  return session;
}

bool SessionRegistry::touch(const std::string& client_id, TimePoint now) {
  std::scoped_lock lock{mutex_};
  auto it = sessions_.find(client_id);
  if (it == sessions_.end()) {
    return false;
  }
  it->second.last_activity = std::max(it->second.last_activity, now);
  return true;
}

bool SessionRegistry::setCredentialExpiry(
  const std::string& client_id, std::optional<TimePoint> expires_at
) {
  std::scoped_lock lock{mutex_};
  auto it = sessions_.find(client_id);
  if (it == sessions_.end()) {
    return false;
  }
  it->second.credential_expires_at = expires_at;
  return true;
}

std::optional<Session> SessionRegistry::find(const std::string& client_id) const {
  std::scoped_lock lock{mutex_};
  auto it = sessions_.find(client_id);
  if (it == sessions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<Session> SessionRegistry::sessions() const {
  std::vector<Session> result;
  {
    std::scoped_lock lock{mutex_};
    result.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
      result.push_back(session);
    }
  }
  std::sort(result.begin(), result.end(), [](const Session& a, const Session& b) {
    return a.client_id < b.client_id;
  });
  return result;
}

std::vector<SessionHandle> SessionRegistry::handles() const {
  std::scoped_lock lock{mutex_};
  std::vector<SessionHandle> result;
  result.reserve(sessions_.size());
  for (const auto& [id, session] : sessions_) {
    result.push_back({id, session.transport});
  }
  return result;
}

std::vector<Session> SessionRegistry::sweepIdle(TimePoint now) {
  std::vector<Session> expired;
  std::scoped_lock lock{mutex_};
  for (auto it = sessions_.begin(); it != sessions_.end();) {
    if (now - it->second.last_activity > idle_timeout_) {
      expired.push_back(std::move(it->second));
      it = sessions_.erase(it);
    } else {
      ++it;
    }
  }
  return expired;
}

size_t SessionRegistry::size() const {
  std::scoped_lock lock{mutex_};
  return sessions_.size();
}

}  // namespace ctxsync
