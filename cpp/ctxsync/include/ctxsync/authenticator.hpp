#pragma once

#include <ctxsync/entry.hpp>
#include <ctxsync/error.hpp>
#include <ctxsync/key_source.hpp>
#include <ctxsync/session_registry.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace ctxsync {

/// @brief Options for credential verification.
struct AuthenticatorOptions {
  /// @brief Required `iss` claim, if set.
  std::optional<std::string> issuer;
  /// @brief Required `aud` claim (string or array member), if set.
  std::optional<std::string> audience;
  /// @brief Minimum time between two key set refreshes triggered by failed verifications.
  std::chrono::seconds refresh_cooldown = std::chrono::seconds(30);
  /// @brief Clock skew tolerated when checking `exp` and `nbf`.
  std::chrono::seconds leeway = std::chrono::seconds(0);
  /// @brief Role assigned when the credential carries no `role` claim.
  std::string default_role = "user";
};

/// @brief The result of a successful verification.
struct VerifiedCredential {
  Principal principal;
  std::optional<TimePoint> expires_at;
};

/// @brief Verifies bearer credentials against a cached verification key set.
///
/// The key set is loaded lazily from the KeySource. When a signature does not verify, or names a
/// key id that is not cached, the key set is refreshed once (at most once per cooldown period) and
/// verification is retried, so that key rotation at the source is picked up.
///
/// Safe to call from multiple threads.
class Authenticator final {
public:
  explicit Authenticator(
    std::unique_ptr<KeySource> source, AuthenticatorOptions options = AuthenticatorOptions()
  );

  Authenticator(const Authenticator&) = delete;
  Authenticator& operator=(const Authenticator&) = delete;
  Authenticator(Authenticator&&) = delete;
  Authenticator& operator=(Authenticator&&) = delete;
  ~Authenticator() = default;

  /// @brief Verify a compact JWS credential and resolve its principal.
  ///
  /// @return CredentialExpired if the credential verifies but is past its `exp`;
  /// AuthenticationError for every other failure.
  CtxResult<VerifiedCredential> verify(std::string_view token, TimePoint now = Clock::now());

  /// @brief Reload the key set from the source now, ignoring the cooldown.
  CtxError refreshKeys();

  /// @brief Number of key set loads performed so far.
  [[nodiscard]] uint64_t refreshCount() const;

private:
  std::shared_ptr<const KeySet> currentKeys();
  // Refreshes if the cooldown allows. Returns the new set, or nullptr if no refresh happened.
  std::shared_ptr<const KeySet> refreshAfterFailure();
  CtxError loadKeysLocked();

  std::unique_ptr<KeySource> source_;
  AuthenticatorOptions options_;

  mutable std::mutex mutex_;
  std::shared_ptr<const KeySet> keys_;
  std::optional<std::chrono::steady_clock::time_point> last_refresh_;
  uint64_t refresh_count_ = 0;
};

/// @brief Extract the token from an `Authorization: Bearer <token>` header value.
std::optional<std::string> extractBearerToken(std::string_view authorization);

/// @brief Extract the `token` parameter from a request target such as `/?token=abc`.
std::optional<std::string> extractQueryToken(std::string_view resource);

}  // namespace ctxsync
