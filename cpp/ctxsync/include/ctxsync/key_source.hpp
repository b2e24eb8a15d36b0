#pragma once

#include <ctxsync/error.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ctxsync {

/// @brief One verification key from a JWK Set.
struct JsonWebKey {
  /// @brief The key id, if the key has one.
  std::optional<std::string> kid;
  /// @brief "oct" for shared secrets or "RSA" for public keys.
  std::string kty;
  /// @brief The algorithm the key is restricted to, if any.
  std::optional<std::string> alg;
  /// @brief The decoded shared secret of an "oct" key.
  std::string secret;
  /// @brief The PEM public key of an "RSA" key, built from its modulus and exponent.
  std::string public_key_pem;
};

/// @brief A set of verification keys.
struct KeySet {
  std::vector<JsonWebKey> keys;

  /// @brief Parse a JWK Set document (`{"keys": [...]}`).
  ///
  /// Keys of unsupported types are skipped. Fails with KeySourceError if the document is not a
  /// JWK Set or holds no usable key.
  static CtxResult<KeySet> parse(std::string_view document);
};

/// @brief A source from which the verification key set is (re)loaded.
class KeySource {
public:
  KeySource() = default;
  KeySource(const KeySource&) = delete;
  KeySource& operator=(const KeySource&) = delete;
  KeySource(KeySource&&) = delete;
  KeySource& operator=(KeySource&&) = delete;
  virtual ~KeySource() = default;

  /// @brief Load the current key set.
  virtual CtxResult<KeySet> fetch() = 0;

  /// @brief A printable description of the source, for logging.
  [[nodiscard]] virtual std::string describe() const = 0;
};

/// @brief A single shared secret for HMAC-signed credentials.
class SecretKeySource final : public KeySource {
public:
  explicit SecretKeySource(std::string secret);

  CtxResult<KeySet> fetch() override;
  [[nodiscard]] std::string describe() const override;

private:
  std::string secret_;
};

/// @brief A JWK Set read from a local file on every fetch.
class FileKeySource final : public KeySource {
public:
  explicit FileKeySource(std::string path);

  CtxResult<KeySet> fetch() override;
  [[nodiscard]] std::string describe() const override;

private:
  std::string path_;
};

/// @brief A JWK Set fetched over plain HTTP with a GET request.
class HttpKeySource final : public KeySource {
public:
  /// @brief Create a source for an `http://host[:port]/path` URL.
  ///
  /// Fails with ConfigError if the URL is not a plain HTTP URL.
  static CtxResult<std::unique_ptr<HttpKeySource>> create(
    std::string_view url, std::chrono::milliseconds timeout = std::chrono::seconds(5)
  );

  CtxResult<KeySet> fetch() override;
  [[nodiscard]] std::string describe() const override;

private:
  HttpKeySource(
    std::string host, std::string port, std::string target, std::chrono::milliseconds timeout
  );

  std::string host_;
  std::string port_;
  std::string target_;
  std::chrono::milliseconds timeout_;
};

/// @brief Create a key source from a `file://` URL, an `http://` URL or a plain file path.
CtxResult<std::unique_ptr<KeySource>> makeKeySource(std::string_view url);

}  // namespace ctxsync
