#pragma once

#include <ctxsync/entry.hpp>
#include <ctxsync/jwt.hpp>
#include <ctxsync/transport.hpp>

#include <nlohmann/json.hpp>
#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace ctxsync::test {

class FileCleanup {
public:
  explicit FileCleanup(std::string&& path)
      : path_(std::move(path)) {}
  FileCleanup(const FileCleanup&) = delete;
  FileCleanup& operator=(const FileCleanup&) = delete;
  FileCleanup(FileCleanup&&) = delete;
  FileCleanup& operator=(FileCleanup&&) = delete;
  ~FileCleanup() {
    if (std::filesystem::exists(path_)) {
      std::filesystem::remove(path_);
    }
  }

private:
  std::string path_;
};

inline void writeFile(const std::string& path, const std::string& contents) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  file << contents;
}

/// A payload whose compact serialization is exactly `bytes` long (at least 8).
inline Payload payloadOfSize(size_t bytes) {
  return Payload{{"d", std::string(bytes - 8, 'x')}};
}

inline int64_t unixSeconds(TimePoint time) {
  return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
}

inline nlohmann::json claimsFor(
  const std::string& subject, const std::string& role = "user",
  std::chrono::seconds lifetime = std::chrono::hours(1)
) {
  auto now = Clock::now();
  return {
    {"sub", subject},
    {"role", role},
    {"iat", unixSeconds(now)},
    {"exp", unixSeconds(now + lifetime)},
  };
}

inline std::string signingInput(const nlohmann::json& header, const nlohmann::json& claims) {
  return base64UrlEncode(header.dump()) + "." + base64UrlEncode(claims.dump());
}

/// Start a token carrying `claims`.
inline auto tokenWith(
  const nlohmann::json& claims, const std::optional<std::string>& kid = std::nullopt
) {
  auto builder = jwt::create<JwtTraits>();
  builder.set_type("JWT");
  if (kid) {
    builder.set_key_id(*kid);
  }
  for (const auto& item : claims.items()) {
    builder.set_payload_claim(item.key(), jwt::basic_claim<JwtTraits>(item.value()));
  }
  return builder;
}

/// Mint an HS256 token signed with `secret`.
inline std::string mintHs256(
  const nlohmann::json& claims, const std::string& secret,
  const std::optional<std::string>& kid = std::nullopt
) {
  return tokenWith(claims, kid).sign(jwt::algorithm::hs256{secret});
}

/// An RSA key pair that can mint RS256 tokens and describe itself as a JWK.
class RsaKey {
public:
  explicit RsaKey(std::string kid)
      : kid_(std::move(kid))
      , pkey_(EVP_RSA_gen(2048), &EVP_PKEY_free) {
    if (!pkey_) {
      throw std::runtime_error("RSA key generation failed");
    }
  }

  [[nodiscard]] const std::string& kid() const {
    return kid_;
  }

  [[nodiscard]] nlohmann::json jwk() const {
    return {
      {"kty", "RSA"},
      {"kid", kid_},
      {"alg", "RS256"},
      {"use", "sig"},
      {"n", base64UrlEncode(bignumParam(OSSL_PKEY_PARAM_RSA_N))},
      {"e", base64UrlEncode(bignumParam(OSSL_PKEY_PARAM_RSA_E))},
    };
  }

  [[nodiscard]] std::string mint(const nlohmann::json& claims) const {
    return tokenWith(claims, kid_).sign(jwt::algorithm::rs256{"", privateKeyPem(), "", ""});
  }

private:
  [[nodiscard]] std::string bignumParam(const char* name) const {
    BIGNUM* bn = nullptr;
    if (EVP_PKEY_get_bn_param(pkey_.get(), name, &bn) != 1) {
      throw std::runtime_error("reading RSA parameter failed");
    }
    std::string bytes(static_cast<size_t>(BN_num_bytes(bn)), '\0');
    BN_bn2bin(bn, reinterpret_cast<unsigned char*>(bytes.data()));
    BN_free(bn);
    return bytes;
  }

  [[nodiscard]] std::string privateKeyPem() const {
    std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new(BIO_s_mem()), &BIO_free);
    if (!bio ||
        PEM_write_bio_PrivateKey(bio.get(), pkey_.get(), nullptr, nullptr, 0, nullptr, nullptr) !=
          1) {
      throw std::runtime_error("exporting RSA key failed");
    }
    char* data = nullptr;
    auto len = BIO_get_mem_data(bio.get(), &data);
    return std::string(data, static_cast<size_t>(len));
  }

  std::string kid_;
  std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> pkey_;
};

/// A Transport that records what it is asked to send.
class FakeTransport final : public Transport {
public:
  explicit FakeTransport(std::string remote = "127.0.0.1:50000")
      : remote_(std::move(remote)) {}

  CtxError send(const std::string& payload) override {
    std::scoped_lock lock{mutex_};
    if (fail_sends_ || closed_) {
      return CtxError::TransportError;
    }
    sent_.push_back(payload);
    return CtxError::Ok;
  }

  void close(CloseCode code, const std::string& reason) override {
    std::scoped_lock lock{mutex_};
    if (closed_) {
      return;
    }
    closed_ = true;
    close_code_ = code;
    close_reason_ = reason;
  }

  [[nodiscard]] std::string remoteEndpoint() const override {
    return remote_;
  }

  void failSends() {
    std::scoped_lock lock{mutex_};
    fail_sends_ = true;
  }

  [[nodiscard]] std::vector<nlohmann::json> messages() const {
    std::scoped_lock lock{mutex_};
    std::vector<nlohmann::json> parsed;
    parsed.reserve(sent_.size());
    for (const auto& payload : sent_) {
      parsed.push_back(nlohmann::json::parse(payload));
    }
    return parsed;
  }

  [[nodiscard]] size_t sentCount() const {
    std::scoped_lock lock{mutex_};
    return sent_.size();
  }

  [[nodiscard]] bool closed() const {
    std::scoped_lock lock{mutex_};
    return closed_;
  }

  [[nodiscard]] std::optional<CloseCode> closeCode() const {
    std::scoped_lock lock{mutex_};
    return close_code_;
  }

private:
  std::string remote_;
  mutable std::mutex mutex_;
  std::vector<std::string> sent_;
  bool fail_sends_ = false;
  bool closed_ = false;
  std::optional<CloseCode> close_code_;
  std::string close_reason_;
};

/// A Transport whose sends block until released, to exercise the send timeout.
class StallingTransport final : public Transport {
public:
  ~StallingTransport() override {
    release();
  }

  CtxError send(const std::string&) override {
    std::unique_lock lock{mutex_};
    cv_.wait(lock, [this] {
      return released_;
    });
    return CtxError::Ok;
  }

  void close(CloseCode, const std::string&) override {
    std::scoped_lock lock{mutex_};
    closed_ = true;
  }

  [[nodiscard]] std::string remoteEndpoint() const override {
    return "127.0.0.1:50001";
  }

  void release() {
    std::scoped_lock lock{mutex_};
    released_ = true;
    cv_.notify_all();
  }

  [[nodiscard]] bool closed() const {
    std::scoped_lock lock{mutex_};
    return closed_;
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool released_ = false;
  bool closed_ = false;
};

}  // namespace ctxsync::test
