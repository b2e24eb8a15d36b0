#pragma once

#include <ctxsync/entry.hpp>
#include <ctxsync/error.hpp>

#include <cstdint>
#include <functional>

namespace ctxsync {

/// @brief Assigns a deterministic token cost to a payload.
///
/// The cost is a function of the payload's compact JSON serialization only. A custom estimator
/// receives the serialized size in bytes and must be monotonic: a larger size may never yield a
/// smaller estimate.
class TokenAccountant final {
public:
  using Estimator = std::function<uint64_t(size_t serialized_bytes)>;

  /// @brief Estimate one token per `bytes_per_token` serialized bytes, rounding up.
  explicit TokenAccountant(uint64_t bytes_per_token = 1);

  /// @brief Use a custom size-to-token function.
  explicit TokenAccountant(Estimator estimator);

  /// @brief Compute the token cost of a payload.
  ///
  /// Fails with ValidationError if the payload cannot be serialized (e.g. invalid UTF-8).
  [[nodiscard]] CtxResult<uint64_t> estimate(const Payload& payload) const;

  /// @brief The token cost for a given serialized size.
  [[nodiscard]] uint64_t estimateBytes(size_t serialized_bytes) const;

private:
  Estimator estimator_;
};

}  // namespace ctxsync
