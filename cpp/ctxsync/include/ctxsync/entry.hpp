#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace ctxsync {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/// @brief An opaque structured value supplied by a producer. Never interpreted by the store.
using Payload = nlohmann::json;

constexpr int kMinPriority = 1;
constexpr int kMaxPriority = 10;
constexpr int kDefaultPriority = 1;

/// @brief One key-addressed unit of context.
struct Entry {
  /// @brief The unique key of the entry within the store.
  std::string key;
  /// @brief The producer's payload.
  Payload payload;
  /// @brief The token cost assigned by the TokenAccountant.
  uint64_t token_count = 0;
  /// @brief The producer that wrote the entry.
  std::string source;
  /// @brief Retention priority in [1, 10]. Higher is retained preferentially.
  int priority = kDefaultPriority;
  /// @brief Wall-clock time of the last write.
  TimePoint timestamp;
  /// @brief Store-wide write sequence; breaks recency ties between equal timestamps.
  uint64_t sequence = 0;
};

/// @brief Conjunctive filter for ContextStore::query. Unset fields match everything.
struct QueryFilter {
  std::optional<std::string> source;
  /// @brief Compared against the stored priority as given, without clamping.
  std::optional<int64_t> min_priority;
};

/// @brief A consistent read-only copy of the store.
struct ContextSnapshot {
  std::map<std::string, Entry> entries;
  uint64_t total_tokens = 0;
  uint64_t max_tokens = 0;
  /// @brief Incremented once per completed mutation.
  uint64_t version = 0;
  /// @brief Cumulative number of entries dropped by eviction.
  uint64_t evicted_total = 0;

  [[nodiscard]] size_t entryCount() const {
    return entries.size();
  }
};

/// @brief Clamp a requested priority into [kMinPriority, kMaxPriority].
constexpr int clampPriority(int64_t priority) {
  if (priority < kMinPriority) {
    return kMinPriority;
  }
  if (priority > kMaxPriority) {
    return kMaxPriority;
  }
  return static_cast<int>(priority);
}

}  // namespace ctxsync
