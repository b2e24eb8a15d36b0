#include <ctxsync/authenticator.hpp>
#include <ctxsync/jwt.hpp>

#include <cctype>
#include <utility>

namespace ctxsync {

namespace {

// The first outcome other than BadSignature among the keys the token's kid selects.
TokenCheck checkWithKeys(
  const DecodedToken& token, const KeySet& keys, const ClaimRequirements& requirements,
  TimePoint now
) {
  std::optional<std::string> kid;
  if (token.has_key_id()) {
    kid = token.get_key_id();
  }
  for (const auto& key : keys.keys) {
    if (kid && key.kid && *kid != *key.kid) {
      continue;
    }
    auto outcome = checkToken(token, key, requirements, now);
    if (outcome != TokenCheck::BadSignature) {
      return outcome;
    }
  }
  return TokenCheck::BadSignature;
}

std::optional<std::string> stringClaim(const nlohmann::json& claims, const char* name) {
  auto it = claims.find(name);
  if (it == claims.end()) {
    return std::nullopt;
  }
  if (it->is_string()) {
    return it->get<std::string>();
  }
  if (it->is_number_integer()) {
    return it->dump();
  }
  return std::nullopt;
}

int hexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

std::string percentDecode(std::string_view input) {
  std::string out;
  out.reserve(input.size());
  for (size_t i = 0; i < input.size(); ++i) {
    if (input[i] == '%' && i + 2 < input.size()) {
      int hi = hexValue(input[i + 1]);
      int lo = hexValue(input[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
        continue;
      }
    }
    out.push_back(input[i] == '+' ? ' ' : input[i]);
  }
  return out;
}

}  // namespace

Authenticator::Authenticator(std::unique_ptr<KeySource> source, AuthenticatorOptions options)
    : source_(std::move(source))
    , options_(std::move(options)) {}

CtxResult<VerifiedCredential> Authenticator::verify(std::string_view token, TimePoint now) {
  auto decoded = decodeToken(token);
  if (!decoded.has_value()) {
    debug() << "rejecting malformed credential";
    return tl::make_unexpected(CtxError::AuthenticationError);
  }

  const ClaimRequirements requirements{options_.issuer, options_.audience, options_.leeway};
  auto keys = currentKeys();
  auto outcome =
    keys ? checkWithKeys(*decoded, *keys, requirements, now) : TokenCheck::BadSignature;
  if (outcome == TokenCheck::BadSignature) {
    if (auto refreshed = refreshAfterFailure()) {
      outcome = checkWithKeys(*decoded, *refreshed, requirements, now);
    }
  }
  switch (outcome) {
    case TokenCheck::BadSignature:
      info() << "credential signature did not verify";
      return tl::make_unexpected(CtxError::AuthenticationError);
    case TokenCheck::Expired:
      info() << "credential expired";
      return tl::make_unexpected(CtxError::CredentialExpired);
    case TokenCheck::Rejected:
      info() << "credential claims rejected";
      return tl::make_unexpected(CtxError::AuthenticationError);
    case TokenCheck::Valid:
      break;
  }

  auto claims = nlohmann::json::parse(decoded->get_payload(), nullptr, false);
  if (!claims.is_object()) {
    return tl::make_unexpected(CtxError::AuthenticationError);
  }
  auto user_id = stringClaim(claims, "sub");
  if (!user_id || user_id->empty()) {
    user_id = stringClaim(claims, "user_id");
  }
  if (!user_id || user_id->empty()) {
    info() << "credential has no subject";
    return tl::make_unexpected(CtxError::AuthenticationError);
  }

  VerifiedCredential credential;
  credential.principal.user_id = std::move(*user_id);
  credential.principal.role = stringClaim(claims, "role").value_or(options_.default_role);
  credential.principal.claims = claims;
  if (decoded->has_expires_at()) {
    credential.expires_at = decoded->get_expires_at();
  }
  return credential;
}

CtxError Authenticator::refreshKeys() {
  std::scoped_lock lock{mutex_};
  return loadKeysLocked();
}

uint64_t Authenticator::refreshCount() const {
  std::scoped_lock lock{mutex_};
  return refresh_count_;
}

std::shared_ptr<const KeySet> Authenticator::currentKeys() {
  std::scoped_lock lock{mutex_};
  if (!keys_ && !last_refresh_ && loadKeysLocked() != CtxError::Ok) {
    return nullptr;
  }
  return keys_;
}

std::shared_ptr<const KeySet> Authenticator::refreshAfterFailure() {
  std::scoped_lock lock{mutex_};
  auto now = std::chrono::steady_clock::now();
  if (last_refresh_ && now - *last_refresh_ < options_.refresh_cooldown) {
    return nullptr;
  }
  debug() << "refreshing verification keys after failed verification";
  if (loadKeysLocked() != CtxError::Ok) {
    return nullptr;
  }
  return keys_;
}

CtxError Authenticator::loadKeysLocked() {
  last_refresh_ = std::chrono::steady_clock::now();
  ++refresh_count_;
  auto fetched = source_->fetch();
  if (!fetched.has_value()) {
    warn() << "failed to load verification keys from " << source_->describe() << ": "
           << strerror(fetched.error());
    return fetched.error();
  }
  debug() << "loaded " << fetched->keys.size() << " verification keys from "
          << source_->describe();
  keys_ = std::make_shared<const KeySet>(std::move(*fetched));
  return CtxError::Ok;
}

std::optional<std::string> extractBearerToken(std::string_view authorization) {
  constexpr std::string_view kScheme = "bearer";
  if (authorization.size() <= kScheme.size()) {
    return std::nullopt;
  }
  for (size_t i = 0; i < kScheme.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(authorization[i])) != kScheme[i]) {
      return std::nullopt;
    }
  }
  auto rest = authorization.substr(kScheme.size());
  if (rest.front() != ' ') {
    return std::nullopt;
  }
  while (!rest.empty() && rest.front() == ' ') {
    rest.remove_prefix(1);
  }
  while (!rest.empty() && rest.back() == ' ') {
    rest.remove_suffix(1);
  }
  if (rest.empty()) {
    return std::nullopt;
  }
  return std::string(rest);
}

std::optional<std::string> extractQueryToken(std::string_view resource) {
  auto question = resource.find('?');
  if (question == std::string_view::npos) {
    return std::nullopt;
  }
  auto query = resource.substr(question + 1);
  while (!query.empty()) {
    auto amp = query.find('&');
    auto pair = query.substr(0, amp);
    auto eq = pair.find('=');
    if (eq != std::string_view::npos && pair.substr(0, eq) == "token") {
      auto value = percentDecode(pair.substr(eq + 1));
      if (!value.empty()) {
        return value;
      }
    }
    if (amp == std::string_view::npos) {
      break;
    }
    query.remove_prefix(amp + 1);
  }
  return std::nullopt;
}

}  // namespace ctxsync
