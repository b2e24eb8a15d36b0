#include <ctxsync/jwt.hpp>
#include <ctxsync/key_source.hpp>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace ctxsync {

namespace {

constexpr std::string_view kFileScheme = "file://";
constexpr std::string_view kHttpScheme = "http://";

using Jwk = jwt::jwk<JwtTraits>;
using Jwks = jwt::jwks<JwtTraits>;

std::optional<std::string> claimText(const Jwk& jwk, const std::string& name) {
  if (!jwk.has_jwk_claim(name)) {
    return std::nullopt;
  }
  return jwk.get_jwk_claim(name).as_string();
}

std::optional<JsonWebKey> parseKey(const Jwk& jwk) {
  if (!jwk.has_key_type() || (jwk.has_use() && jwk.get_use() != "sig")) {
    return std::nullopt;
  }
  JsonWebKey key;
  key.kty = jwk.get_key_type();
  if (jwk.has_key_id()) {
    key.kid = jwk.get_key_id();
  }
  if (jwk.has_algorithm()) {
    key.alg = jwk.get_algorithm();
  }

  if (key.kty == "oct") {
    auto k = claimText(jwk, "k");
    auto secret = k ? base64UrlDecode(*k) : std::nullopt;
    if (!secret || secret->empty()) {
      return std::nullopt;
    }
    key.secret = std::move(*secret);
    return key;
  }
  if (key.kty == "RSA") {
    auto n = claimText(jwk, "n");
    auto e = claimText(jwk, "e");
    if (!n || !e || n->empty() || e->empty()) {
      return std::nullopt;
    }
    std::error_code ec;
    key.public_key_pem = jwt::helper::create_public_key_from_rsa_components(*n, *e, ec);
    if (ec) {
      debug() << "cannot build RSA key: " << ec.message();
      return std::nullopt;
    }
    return key;
  }
  return std::nullopt;
}

CtxResult<Jwks> parseJwks(std::string_view document) {
  try {
    return jwt::parse_jwks<JwtTraits>(std::string(document));
  } catch (const std::exception& exc) {
    warn() << "key set is not a JWK Set: " << exc.what();
    return tl::make_unexpected(CtxError::KeySourceError);
  }
}

}  // namespace

CtxResult<KeySet> KeySet::parse(std::string_view document) {
  auto jwks = parseJwks(document);
  if (!jwks.has_value()) {
    return tl::make_unexpected(jwks.error());
  }
  KeySet set;
  for (const auto& jwk : *jwks) {
    std::optional<JsonWebKey> key;
    try {
      key = parseKey(jwk);
    } catch (const std::exception& exc) {
      debug() << "skipping malformed key: " << exc.what();
      continue;
    }
    if (!key) {
      debug() << "skipping unsupported key";
      continue;
    }
    set.keys.push_back(std::move(*key));
  }
  if (set.keys.empty()) {
    warn() << "key set holds no usable key";
    return tl::make_unexpected(CtxError::KeySourceError);
  }
  return set;
}

SecretKeySource::SecretKeySource(std::string secret)
    : secret_(std::move(secret)) {}

CtxResult<KeySet> SecretKeySource::fetch() {
  if (secret_.empty()) {
    return tl::make_unexpected(CtxError::KeySourceError);
  }
  JsonWebKey key;
  key.kty = "oct";
  key.secret = secret_;
  KeySet set;
  set.keys.push_back(std::move(key));
  return set;
}

std::string SecretKeySource::describe() const {
  return "shared secret";
}

FileKeySource::FileKeySource(std::string path)
    : path_(std::move(path)) {}

CtxResult<KeySet> FileKeySource::fetch() {
  std::ifstream file(path_, std::ios::binary);
  if (!file.is_open()) {
    warn() << "cannot open key set file " << path_;
    return tl::make_unexpected(CtxError::KeySourceError);
  }
  std::ostringstream contents;
  contents << file.rdbuf();
  return KeySet::parse(contents.str());
}

std::string FileKeySource::describe() const {
  return "file " + path_;
}

HttpKeySource::HttpKeySource(
  std::string host, std::string port, std::string target, std::chrono::milliseconds timeout
)
    : host_(std::move(host))
    , port_(std::move(port))
    , target_(std::move(target))
    , timeout_(timeout) {}

CtxResult<std::unique_ptr<HttpKeySource>> HttpKeySource::create(
  std::string_view url, std::chrono::milliseconds timeout
) {
  if (url.substr(0, kHttpScheme.size()) != kHttpScheme) {
    return tl::make_unexpected(CtxError::ConfigError);
  }
  auto rest = url.substr(kHttpScheme.size());
  auto slash = rest.find('/');
  auto authority = rest.substr(0, slash);
  std::string target = slash == std::string_view::npos ? "/" : std::string(rest.substr(slash));
  if (authority.empty()) {
    return tl::make_unexpected(CtxError::ConfigError);
  }
  std::string host{authority};
  std::string port = "80";
  if (auto colon = authority.rfind(':'); colon != std::string_view::npos) {
    host = std::string(authority.substr(0, colon));
    port = std::string(authority.substr(colon + 1));
    if (host.empty() || port.empty()) {
      return tl::make_unexpected(CtxError::ConfigError);
    }
  }
  return std::unique_ptr<HttpKeySource>(
    new HttpKeySource(std::move(host), std::move(port), std::move(target), timeout)
  );
}

CtxResult<KeySet> HttpKeySource::fetch() {
  namespace beast = boost::beast;
  namespace http = beast::http;
  using tcp = boost::asio::ip::tcp;

  boost::asio::io_context ioc;
  tcp::resolver resolver(ioc);
  beast::tcp_stream stream(ioc);
  beast::error_code ec;

  auto results = resolver.resolve(host_, port_, ec);
  if (ec) {
    warn() << "cannot resolve key set host " << host_ << ": " << ec.message();
    return tl::make_unexpected(CtxError::KeySourceError);
  }
  stream.expires_after(timeout_);
  stream.connect(results, ec);
  if (ec) {
    warn() << "cannot connect to key set host " << host_ << ": " << ec.message();
    return tl::make_unexpected(CtxError::KeySourceError);
  }

  http::request<http::string_body> request{http::verb::get, target_, 11};
  request.set(http::field::host, host_);
  request.set(http::field::accept, "application/json");
  request.set(http::field::user_agent, "ctxsync");
  http::write(stream, request, ec);
  if (ec) {
    warn() << "key set request failed: " << ec.message();
    return tl::make_unexpected(CtxError::KeySourceError);
  }

  beast::flat_buffer buffer;
  http::response<http::string_body> response;
  http::read(stream, buffer, response, ec);
  if (ec) {
    warn() << "key set response failed: " << ec.message();
    return tl::make_unexpected(CtxError::KeySourceError);
  }
  stream.socket().shutdown(tcp::socket::shutdown_both, ec);

  if (response.result() != http::status::ok) {
    warn() << "key set request returned HTTP " << response.result_int();
    return tl::make_unexpected(CtxError::KeySourceError);
  }
  return KeySet::parse(response.body());
}

std::string HttpKeySource::describe() const {
  return "http://" + host_ + ":" + port_ + target_;
}

CtxResult<std::unique_ptr<KeySource>> makeKeySource(std::string_view url) {
  if (url.empty()) {
    return tl::make_unexpected(CtxError::ConfigError);
  }
  if (url.substr(0, kHttpScheme.size()) == kHttpScheme) {
    auto source = HttpKeySource::create(url);
    if (!source.has_value()) {
      return tl::make_unexpected(source.error());
    }
    return std::unique_ptr<KeySource>(std::move(*source));
  }
  if (url.substr(0, kFileScheme.size()) == kFileScheme) {
    url.remove_prefix(kFileScheme.size());
  } else if (url.find("://") != std::string_view::npos) {
    warn() << "unsupported key set URL scheme: " << url;
    return tl::make_unexpected(CtxError::ConfigError);
  }
  return std::unique_ptr<KeySource>(std::make_unique<FileKeySource>(std::string(url)));
}

}  // namespace ctxsync
