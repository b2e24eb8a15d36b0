#include <ctxsync/token_accountant.hpp>

#include <string>
#include <utility>

namespace ctxsync {

TokenAccountant::TokenAccountant(uint64_t bytes_per_token) {
  if (bytes_per_token == 0) {
    warn() << "bytes_per_token must be positive, using 1";
    bytes_per_token = 1;
  }
  estimator_ = [bytes_per_token](size_t serialized_bytes) -> uint64_t {
    auto bytes = static_cast<uint64_t>(serialized_bytes);
    return bytes / bytes_per_token + (bytes % bytes_per_token != 0 ? 1 : 0);
  };
}

TokenAccountant::TokenAccountant(Estimator estimator)
    : estimator_(std::move(estimator)) {}

CtxResult<uint64_t> TokenAccountant::estimate(const Payload& payload) const {
  std::string serialized;
  try {
    serialized = payload.dump();
  } catch (const nlohmann::json::type_error& exc) {
    debug() << "payload is not serializable: " << exc.what();
    return tl::make_unexpected(CtxError::ValidationError);
  }
  return estimateBytes(serialized.size());
}

uint64_t TokenAccountant::estimateBytes(size_t serialized_bytes) const {
  return estimator_(serialized_bytes);
}

}  // namespace ctxsync
