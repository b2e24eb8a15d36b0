#include <ctxsync/jwt.hpp>

#include <system_error>

namespace ctxsync {

namespace {

// Pins verification to the caller's notion of "now".
struct FixedClock {
  jwt::date at;

  [[nodiscard]] jwt::date now() const {
    return at;
  }
};

using Verifier = jwt::verifier<FixedClock, JwtTraits>;

bool isHmac(std::string_view alg) {
  return alg.substr(0, 2) == "HS";
}

void allowKey(Verifier& verifier, const JsonWebKey& key, std::string_view alg) {
  if (alg == "HS256") {
    verifier.allow_algorithm(jwt::algorithm::hs256{key.secret});
  } else if (alg == "HS384") {
    verifier.allow_algorithm(jwt::algorithm::hs384{key.secret});
  } else if (alg == "HS512") {
    verifier.allow_algorithm(jwt::algorithm::hs512{key.secret});
  } else if (alg == "RS256") {
    verifier.allow_algorithm(jwt::algorithm::rs256{key.public_key_pem, "", "", ""});
  } else if (alg == "RS384") {
    verifier.allow_algorithm(jwt::algorithm::rs384{key.public_key_pem, "", "", ""});
  } else if (alg == "RS512") {
    verifier.allow_algorithm(jwt::algorithm::rs512{key.public_key_pem, "", "", ""});
  }
}

TokenCheck classify(
  const std::error_code& ec, const DecodedToken& token, const ClaimRequirements& requirements,
  TimePoint now
) {
  if (!ec) {
    return TokenCheck::Valid;
  }
  if (ec.category() == jwt::error::signature_verification_error_category() ||
      ec == jwt::error::token_verification_error::wrong_algorithm) {
    return TokenCheck::BadSignature;
  }
  // jwt-cpp reports early `iat` and future `nbf` as expiry too; only a past `exp` is retryable.
  if (ec == jwt::error::token_verification_error::token_expired && token.has_expires_at() &&
      now > token.get_expires_at() + requirements.leeway) {
    return TokenCheck::Expired;
  }
  debug() << "credential claims rejected: " << ec.message();
  return TokenCheck::Rejected;
}

}  // namespace

std::optional<std::string> base64UrlDecode(std::string_view input) {
  try {
    return jwt::base::decode<jwt::alphabet::base64url>(
      jwt::base::pad<jwt::alphabet::base64url>(std::string(input))
    );
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

std::string base64UrlEncode(std::string_view input) {
  return jwt::base::trim<jwt::alphabet::base64url>(
    jwt::base::encode<jwt::alphabet::base64url>(std::string(input))
  );
}

bool isSupportedAlgorithm(std::string_view alg) {
  return alg == "HS256" || alg == "HS384" || alg == "HS512" || alg == "RS256" || alg == "RS384" ||
         alg == "RS512";
}

bool keyMatchesAlgorithm(const JsonWebKey& key, std::string_view alg) {
  if (!isSupportedAlgorithm(alg) || (key.alg && *key.alg != alg)) {
    return false;
  }
  return isHmac(alg) ? key.kty == "oct" : key.kty == "RSA";
}

CtxResult<DecodedToken> decodeToken(std::string_view token) {
  try {
    auto decoded = jwt::decode<JwtTraits>(std::string(token));
    if (!isSupportedAlgorithm(decoded.get_algorithm())) {
      debug() << "unsupported credential algorithm " << decoded.get_algorithm();
      return tl::make_unexpected(CtxError::AuthenticationError);
    }
    return decoded;
  } catch (const std::exception& exc) {
    debug() << "malformed credential: " << exc.what();
    return tl::make_unexpected(CtxError::AuthenticationError);
  }
}

TokenCheck checkToken(
  const DecodedToken& token, const JsonWebKey& key, const ClaimRequirements& requirements,
  TimePoint now
) {
  const auto alg = token.get_algorithm();
  if (!keyMatchesAlgorithm(key, alg)) {
    return TokenCheck::BadSignature;
  }

  auto verifier = jwt::verify<FixedClock, JwtTraits>(FixedClock{now});
  try {
    allowKey(verifier, key, alg);
  } catch (const std::exception& exc) {
    warn() << "failed to load verification key" << (key.kid ? " " + *key.kid : std::string{})
           << ": " << exc.what();
    return TokenCheck::BadSignature;
  }
  verifier.leeway(static_cast<size_t>(requirements.leeway.count()));
  if (requirements.issuer) {
    verifier.with_issuer(*requirements.issuer);
  }
  if (requirements.audience) {
    verifier.with_audience(*requirements.audience);
  }

  try {
    std::error_code ec;
    verifier.verify(token, ec);
    return classify(ec, token, requirements, now);
  } catch (const std::exception& exc) {
    // Claims of the wrong JSON type surface as exceptions.
    debug() << "credential claims rejected: " << exc.what();
    return TokenCheck::Rejected;
  }
}

}  // namespace ctxsync
