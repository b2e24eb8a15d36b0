#pragma once

#include <ctxsync/context_store.hpp>
#include <ctxsync/error.hpp>
#include <ctxsync/session_registry.hpp>

#include <chrono>
#include <cstdint>
#include <future>
#include <mutex>
#include <string>
#include <vector>

namespace ctxsync {

struct BroadcastOptions {
  /// @brief Time allowed for one recipient's send before it counts as failed.
  std::chrono::milliseconds send_timeout = std::chrono::seconds(5);
};

/// @brief The outcome of one publish() call.
struct BroadcastReport {
  /// @brief Store version of the snapshot that was sent.
  uint64_t version = 0;
  /// @brief True if an earlier cycle had already sent this version or a later one.
  bool coalesced = false;
  size_t recipients = 0;
  size_t delivered = 0;
  /// @brief Client ids whose send failed; these sessions were removed.
  std::vector<std::string> failed;
};

/// @brief Pushes the current store snapshot to every registered session.
///
/// One broadcast cycle runs at a time. Each cycle serializes a single `context_update` message
/// and sends it to every session concurrently, one task per recipient. A failed or timed-out send
/// removes that session from the registry and closes its transport; other recipients are
/// unaffected and the failure is never reported to the caller that triggered the cycle.
class BroadcastEngine final {
public:
  BroadcastEngine(
    const ContextStore& store, SessionRegistry& registry, BroadcastOptions options = BroadcastOptions()
  );

  BroadcastEngine(const BroadcastEngine&) = delete;
  BroadcastEngine& operator=(const BroadcastEngine&) = delete;
  BroadcastEngine(BroadcastEngine&&) = delete;
  BroadcastEngine& operator=(BroadcastEngine&&) = delete;
  ~BroadcastEngine();

  /// @brief Broadcast a snapshot that reflects at least store version `min_version`.
  ///
  /// If a previous cycle already sent a snapshot at or after `min_version`, nothing is sent.
  BroadcastReport publish(uint64_t min_version);

  /// @brief Store version of the most recently broadcast snapshot.
  [[nodiscard]] uint64_t lastVersion() const;

  /// @brief Number of cycles that sent a snapshot.
  [[nodiscard]] uint64_t cycles() const;

private:
  void reapStragglersLocked();

  const ContextStore& store_;
  SessionRegistry& registry_;
  BroadcastOptions options_;

  mutable std::mutex mutex_;
  uint64_t last_version_ = 0;
  uint64_t cycles_ = 0;
  // Sends that outlived their timeout. Kept so their completion never blocks a cycle.
  std::vector<std::future<CtxError>> stragglers_;
};

}  // namespace ctxsync
