#pragma once

#include <ctxsync/entry.hpp>
#include <ctxsync/error.hpp>
#include <ctxsync/token_accountant.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ctxsync {

/// @brief Outcome of ContextStore::update.
struct UpdateResult {
  /// @brief Always true; the store never refuses a well-formed write.
  bool accepted = true;
  std::string key;
  /// @brief Token cost assigned to the written payload.
  uint64_t token_count = 0;
  uint64_t total_tokens = 0;
  size_t entry_count = 0;
  /// @brief Number of entries dropped by the eviction pass of this write.
  size_t evicted = 0;
  uint64_t version = 0;
};

/// @brief Outcome of ContextStore::clear.
struct ClearResult {
  size_t removed = 0;
  uint64_t total_tokens = 0;
  size_t entry_count = 0;
  uint64_t version = 0;
};

/// @brief Outcome of ContextStore::setPriority.
struct PriorityResult {
  std::string key;
  /// @brief The stored (clamped) priority.
  int priority = kDefaultPriority;
  size_t evicted = 0;
  uint64_t total_tokens = 0;
  size_t entry_count = 0;
  uint64_t version = 0;
};

/// @brief The authoritative, token-budgeted mapping of key to Entry.
///
/// Mutations (update, clear, setPriority) are serialized by an exclusive lock and each one
/// increments the store version. Readers (get, query, find) take a shared lock and observe either
/// the state before or after a mutation, never a partial one.
///
/// After every mutation the sum of token counts is at most `max_tokens`, except when the single
/// highest-ranked entry alone exceeds the budget; that entry is then kept by itself.
class ContextStore final {
public:
  explicit ContextStore(uint64_t max_tokens, TokenAccountant accountant = TokenAccountant());

  ContextStore(const ContextStore&) = delete;
  ContextStore& operator=(const ContextStore&) = delete;
  ContextStore(ContextStore&&) = delete;
  ContextStore& operator=(ContextStore&&) = delete;
  ~ContextStore() = default;

  /// @brief Write or replace the entry for `key`, then evict down to the token budget.
  ///
  /// @param priority Requested priority; clamped to [1, 10]. Defaults to 1.
  /// @return ValidationError if the payload cannot be serialized; otherwise the accepted write.
  CtxResult<UpdateResult> update(
    const std::string& key, Payload payload, const std::string& source,
    std::optional<int64_t> priority = std::nullopt
  );

  /// @brief A consistent copy of all entries with store metadata.
  [[nodiscard]] ContextSnapshot get() const;

  /// @brief Entries matching every predicate set in `filter`, ordered by key.
  [[nodiscard]] std::vector<Entry> query(const QueryFilter& filter) const;

  /// @brief A copy of one entry, if present.
  [[nodiscard]] std::optional<Entry> find(const std::string& key) const;

  /// @brief Remove the given keys, or every entry if `keys` is unset. Unknown keys are ignored.
  ClearResult clear(const std::optional<std::vector<std::string>>& keys = std::nullopt);

  /// @brief Like clear, but only if `allowed` accepts every targeted entry.
  ///
  /// The check and the removal happen under one exclusive lock, so `allowed` sees exactly the
  /// entries that would be removed.
  ///
  /// @return PermissionDenied, with the store unchanged, if any targeted entry is rejected.
  CtxResult<ClearResult> clearIf(
    const std::optional<std::vector<std::string>>& keys,
    const std::function<bool(const Entry&)>& allowed
  );

  /// @brief Remove every entry written by `source`.
  ClearResult clearSource(const std::string& source);

  /// @brief Change the priority of an existing entry, then re-run eviction.
  ///
  /// @return NotFound if no entry has `key`.
  CtxResult<PriorityResult> setPriority(const std::string& key, int64_t priority);

  [[nodiscard]] uint64_t maxTokens() const {
    return max_tokens_;
  }
  [[nodiscard]] uint64_t totalTokens() const;
  [[nodiscard]] size_t size() const;
  [[nodiscard]] uint64_t version() const;
  [[nodiscard]] const TokenAccountant& accountant() const {
    return accountant_;
  }

private:
  // Requires the exclusive lock. Returns the number of entries dropped.
  size_t evictLocked();
  // Requires the exclusive lock.
  ClearResult eraseLocked(const std::optional<std::vector<std::string>>& keys);

  const uint64_t max_tokens_;
  const TokenAccountant accountant_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, Entry> entries_;
  uint64_t total_tokens_ = 0;
  uint64_t version_ = 0;
  uint64_t next_sequence_ = 0;
  uint64_t evicted_total_ = 0;
};

}  // namespace ctxsync
