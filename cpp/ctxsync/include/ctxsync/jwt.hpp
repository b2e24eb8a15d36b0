#pragma once

#include <ctxsync/entry.hpp>
#include <ctxsync/error.hpp>
#include <ctxsync/key_source.hpp>

#include <jwt-cpp/jwt.h>
#include <jwt-cpp/traits/nlohmann-json/traits.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ctxsync {

using JwtTraits = jwt::traits::nlohmann_json;

/// @brief A decoded compact JWS token. The signature is not yet verified.
using DecodedToken = jwt::decoded_jwt<JwtTraits>;

/// @brief Claim checks applied once the signature verifies.
struct ClaimRequirements {
  std::optional<std::string> issuer;
  std::optional<std::string> audience;
  std::chrono::seconds leeway{0};
};

/// @brief Outcome of checking a token against one key.
enum class TokenCheck : uint8_t {
  Valid,
  /// The key cannot verify the token's algorithm, or the signature does not match it.
  BadSignature,
  /// The signature matches but `exp` has passed.
  Expired,
  /// The signature matches but another claim check fails.
  Rejected
};

/// @brief Decode a compact JWS token.
///
/// Fails with AuthenticationError if the token is malformed or uses an unsupported algorithm.
CtxResult<DecodedToken> decodeToken(std::string_view token);

/// @brief Whether `alg` is one of HS256/384/512 or RS256/384/512.
bool isSupportedAlgorithm(std::string_view alg);

/// @brief Whether `key` can verify tokens signed with `alg`.
bool keyMatchesAlgorithm(const JsonWebKey& key, std::string_view alg);

/// @brief Verify the signature with one key, then the time and claim requirements at `now`.
TokenCheck checkToken(
  const DecodedToken& token, const JsonWebKey& key, const ClaimRequirements& requirements,
  TimePoint now
);

/// @brief Decode unpadded base64url text. Returns nullopt on invalid input.
std::optional<std::string> base64UrlDecode(std::string_view input);

/// @brief Encode bytes as unpadded base64url text.
std::string base64UrlEncode(std::string_view input);

}  // namespace ctxsync
