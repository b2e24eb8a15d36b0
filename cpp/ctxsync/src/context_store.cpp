#include <ctxsync/context_store.hpp>

#include <algorithm>
#include <mutex>
#include <utility>

namespace ctxsync {

ContextStore::ContextStore(uint64_t max_tokens, TokenAccountant accountant)
    : max_tokens_(max_tokens)
    , accountant_(std::move(accountant)) {}

CtxResult<UpdateResult> ContextStore::update(
  const std::string& key, Payload payload, const std::string& source,
  std::optional<int64_t> priority
) {
  // Cost the payload before taking the lock; serialization is the expensive part.
  auto tokens = accountant_.estimate(payload);
  if (!tokens.has_value()) {
    return tl::make_unexpected(tokens.error());
  }

  Entry entry;
  entry.key = key;
  entry.payload = std::move(payload);
  entry.token_count = *tokens;
  entry.source = source;
  entry.priority = clampPriority(priority.value_or(kDefaultPriority));

  std::unique_lock lock{mutex_};
  // Stamped under the lock so that commit order and timestamp order agree.
  entry.timestamp = Clock::now();
  entry.sequence = ++next_sequence_;

  auto it = entries_.find(key);
  if (it != entries_.end()) {
    total_tokens_ -= it->second.token_count;
    it->second = std::move(entry);
    total_tokens_ += it->second.token_count;
  } else {
    total_tokens_ += entry.token_count;
    entries_.emplace(key, std::move(entry));
  }

  UpdateResult result;
  result.key = key;
  result.token_count = *tokens;
  result.evicted = evictLocked();
  result.total_tokens = total_tokens_;
  result.entry_count = entries_.size();
  result.version = ++version_;
  return result;
}

ContextSnapshot ContextStore::get() const {
  std::shared_lock lock{mutex_};
  ContextSnapshot snapshot;
  for (const auto& [key, entry] : entries_) {
    snapshot.entries.emplace(key, entry);
  }
  snapshot.total_tokens = total_tokens_;
  snapshot.max_tokens = max_tokens_;
  snapshot.version = version_;
  snapshot.evicted_total = evicted_total_;
  return snapshot;
}

std::vector<Entry> ContextStore::query(const QueryFilter& filter) const {
  std::vector<Entry> matches;
  {
    std::shared_lock lock{mutex_};
    for (const auto& [key, entry] : entries_) {
      if (filter.source && entry.source != *filter.source) {
        continue;
      }
      if (filter.min_priority && entry.priority < *filter.min_priority) {
        continue;
      }
      matches.push_back(entry);
    }
  }
  std::sort(matches.begin(), matches.end(), [](const Entry& a, const Entry& b) {
    return a.key < b.key;
  });
  return matches;
}

std::optional<Entry> ContextStore::find(const std::string& key) const {
  std::shared_lock lock{mutex_};
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

ClearResult ContextStore::clear(const std::optional<std::vector<std::string>>& keys) {
  std::unique_lock lock{mutex_};
  return eraseLocked(keys);
}

CtxResult<ClearResult> ContextStore::clearIf(
  const std::optional<std::vector<std::string>>& keys,
  const std::function<bool(const Entry&)>& allowed
) {
  std::unique_lock lock{mutex_};
  if (!keys) {
    for (const auto& [key, entry] : entries_) {
      if (!allowed(entry)) {
        return tl::make_unexpected(CtxError::PermissionDenied);
      }
    }
  } else {
    for (const auto& key : *keys) {
      auto it = entries_.find(key);
      if (it != entries_.end() && !allowed(it->second)) {
        return tl::make_unexpected(CtxError::PermissionDenied);
      }
    }
  }
  return eraseLocked(keys);
}

ClearResult ContextStore::clearSource(const std::string& source) {
  std::unique_lock lock{mutex_};
  std::vector<std::string> keys;
  for (const auto& [key, entry] : entries_) {
    if (entry.source == source) {
      keys.push_back(key);
    }
  }
  return eraseLocked(keys);
}

ClearResult ContextStore::eraseLocked(const std::optional<std::vector<std::string>>& keys) {
  ClearResult result;
  if (!keys) {
    result.removed = entries_.size();
    entries_.clear();
    total_tokens_ = 0;
  } else {
    for (const auto& key : *keys) {
      auto it = entries_.find(key);
      if (it == entries_.end()) {
        continue;
      }
      total_tokens_ -= it->second.token_count;
      entries_.erase(it);
      ++result.removed;
    }
  }
  result.total_tokens = total_tokens_;
  result.entry_count = entries_.size();
  result.version = ++version_;
  return result;
}

CtxResult<PriorityResult> ContextStore::setPriority(const std::string& key, int64_t priority) {
  std::unique_lock lock{mutex_};
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return tl::make_unexpected(CtxError::NotFound);
  }
  it->second.priority = clampPriority(priority);

  PriorityResult result;
  result.key = key;
  result.priority = it->second.priority;
  result.evicted = evictLocked();
  result.total_tokens = total_tokens_;
  result.entry_count = entries_.size();
  result.version = ++version_;
  return result;
}

uint64_t ContextStore::totalTokens() const {
  std::shared_lock lock{mutex_};
  return total_tokens_;
}

size_t ContextStore::size() const {
  std::shared_lock lock{mutex_};
  return entries_.size();
}

uint64_t ContextStore::version() const {
  std::shared_lock lock{mutex_};
  return version_;
}

size_t ContextStore::evictLocked() {
  if (total_tokens_ <= max_tokens_) {
    return 0;
  }

  std::vector<const Entry*> ranked;
  ranked.reserve(entries_.size());
  for (const auto& [key, entry] : entries_) {
    ranked.push_back(&entry);
  }
  // Priority descending, then most recent first.
  std::sort(ranked.begin(), ranked.end(), [](const Entry* a, const Entry* b) {
    if (a->priority != b->priority) {
      return a->priority > b->priority;
    }
    if (a->timestamp != b->timestamp) {
      return a->timestamp > b->timestamp;
    }
    return a->sequence > b->sequence;
  });

  std::unordered_map<std::string, Entry> kept;
  uint64_t kept_tokens = 0;
  for (const Entry* entry : ranked) {
    // The top-ranked entry survives even when it alone exceeds the budget.
    if (!kept.empty() && kept_tokens + entry->token_count > max_tokens_) {
      break;
    }
    kept_tokens += entry->token_count;
    kept.emplace(entry->key, *entry);
  }

  size_t dropped = entries_.size() - kept.size();
  entries_ = std::move(kept);
  total_tokens_ = kept_tokens;
  evicted_total_ += dropped;
  debug() << "evicted " << dropped << " entries, " << total_tokens_ << "/" << max_tokens_
          << " tokens retained";
  return dropped;
}

}  // namespace ctxsync
