#include <ctxsync/broadcast.hpp>
#include <ctxsync/protocol.hpp>

#include <memory>
#include <utility>

namespace ctxsync {

BroadcastEngine::BroadcastEngine(
  const ContextStore& store, SessionRegistry& registry, BroadcastOptions options
)
    : store_(store)
    , registry_(registry)
    , options_(options) {}

BroadcastEngine::~BroadcastEngine() {
  std::scoped_lock lock{mutex_};
  for (auto& future : stragglers_) {
    future.wait();
  }
}

BroadcastReport BroadcastEngine::publish(uint64_t min_version) {
  std::scoped_lock lock{mutex_};
  reapStragglersLocked();

  BroadcastReport report;
  if (cycles_ > 0 && last_version_ >= min_version) {
    report.version = last_version_;
    report.coalesced = true;
    return report;
  }

  // Snapshot after acquiring the cycle lock, so it is never older than min_version.
  auto snapshot = store_.get();
  auto handles = registry_.handles();
  report.version = snapshot.version;
  report.recipients = handles.size();
  last_version_ = snapshot.version;
  ++cycles_;
  if (handles.empty()) {
    return report;
  }

  auto payload = std::make_shared<const std::string>(
    protocol::snapshotMessage(snapshot, protocol::kContextUpdate).dump()
  );

  std::vector<std::future<CtxError>> sends;
  sends.reserve(handles.size());
  for (const auto& handle : handles) {
    sends.push_back(std::async(std::launch::async, [transport = handle.transport, payload]() {
      try {
        return transport->send(*payload);
      } catch (const std::exception& exc) {
        warn() << "broadcast send threw: " << exc.what();
        return CtxError::TransportError;
      }
    }));
  }

  auto deadline = std::chrono::steady_clock::now() + options_.send_timeout;
  for (size_t i = 0; i < sends.size(); ++i) {
    const auto& handle = handles[i];
    CtxError result = CtxError::TransportError;
    if (sends[i].wait_until(deadline) == std::future_status::ready) {
      result = sends[i].get();
    } else {
      warn() << "broadcast to client " << handle.client_id << " timed out";
      stragglers_.push_back(std::move(sends[i]));
    }

    if (result == CtxError::Ok) {
      ++report.delivered;
      continue;
    }
    report.failed.push_back(handle.client_id);
    if (auto removed = registry_.remove(handle.client_id)) {
      warn() << "removing client " << handle.client_id
             << " after failed broadcast: " << strerror(result);
      removed->transport->close(CloseCode::GoingAway, "Broadcast delivery failed");
    }
  }
  debug() << "broadcast version " << report.version << " to " << report.delivered << "/"
          << report.recipients << " clients";
  return report;
}

uint64_t BroadcastEngine::lastVersion() const {
  std::scoped_lock lock{mutex_};
  return last_version_;
}

uint64_t BroadcastEngine::cycles() const {
  std::scoped_lock lock{mutex_};
  return cycles_;
}

void BroadcastEngine::reapStragglersLocked() {
  for (auto it = stragglers_.begin(); it != stragglers_.end();) {
    if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
      it = stragglers_.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace ctxsync
