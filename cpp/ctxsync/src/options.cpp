#include <ctxsync/server.hpp>

#include <charconv>
#include <cstdlib>
#include <chrono>
#include <string_view>

namespace ctxsync {

namespace {

std::optional<std::string> env(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

template<typename T>
CtxError readNumber(const char* name, T& out) {
  auto value = env(name);
  if (!value) {
    return CtxError::Ok;
  }
  T parsed{};
  const char* end = value->data() + value->size();
  auto [ptr, ec] = std::from_chars(value->data(), end, parsed);
  if (ec != std::errc() || ptr != end) {
    error() << name << " is not a valid number: " << *value;
    return CtxError::ConfigError;
  }
  out = parsed;
  return CtxError::Ok;
}

template<typename Duration>
CtxError readDuration(const char* name, Duration& out) {
  uint64_t count = out.count();
  if (auto err = readNumber(name, count); err != CtxError::Ok) {
    return err;
  }
  // Timeouts are compared against Clock time points, so they must fit in Clock::duration.
  constexpr auto kLimit = std::chrono::duration_cast<Duration>(Clock::duration::max()).count();
  if (count > static_cast<uint64_t>(kLimit)) {
    error() << name << " is out of range";
    return CtxError::ConfigError;
  }
  out = Duration(static_cast<typename Duration::rep>(count));
  return CtxError::Ok;
}

std::set<std::string> splitRoles(std::string_view list) {
  std::set<std::string> roles;
  while (!list.empty()) {
    auto comma = list.find(',');
    auto item = list.substr(0, comma);
    list = comma == std::string_view::npos ? std::string_view{} : list.substr(comma + 1);
    while (!item.empty() && item.front() == ' ') {
      item.remove_prefix(1);
    }
    while (!item.empty() && item.back() == ' ') {
      item.remove_suffix(1);
    }
    if (!item.empty()) {
      roles.emplace(item);
    }
  }
  return roles;
}

}  // namespace

CtxResult<ContextServerOptions> ContextServerOptions::fromEnvironment() {
  if (auto level = env("CTXSYNC_LOG_LEVEL")) {
    auto parsed = parseLogLevel(*level);
    if (!parsed.has_value()) {
      error() << "CTXSYNC_LOG_LEVEL is not a log level: " << *level;
      return tl::make_unexpected(parsed.error());
    }
    setLogLevel(*parsed);
  }

  ContextServerOptions options;
  if (auto host = env("CTXSYNC_HOST")) {
    options.host = *host;
  }

  CtxError err = CtxError::Ok;
  for (auto result : {
         readNumber("CTXSYNC_PORT", options.port),
         readNumber("CTXSYNC_MAX_TOKENS", options.max_tokens),
         readNumber("CTXSYNC_BYTES_PER_TOKEN", options.bytes_per_token),
         readNumber("CTXSYNC_WORKER_THREADS", options.worker_threads),
         readDuration("CTXSYNC_IDLE_TIMEOUT_SECONDS", options.idle_timeout),
         readDuration("CTXSYNC_AUTH_TIMEOUT_SECONDS", options.auth_timeout),
         readDuration("CTXSYNC_SEND_TIMEOUT_MS", options.send_timeout),
       }) {
    if (result != CtxError::Ok) {
      err = result;
    }
  }
  if (err != CtxError::Ok) {
    return tl::make_unexpected(err);
  }
  if (options.max_tokens == 0 || options.bytes_per_token == 0 || options.worker_threads == 0) {
    error() << "CTXSYNC_MAX_TOKENS, CTXSYNC_BYTES_PER_TOKEN and CTXSYNC_WORKER_THREADS must be "
               "positive";
    return tl::make_unexpected(CtxError::ConfigError);
  }

  if (auto roles = env("CTXSYNC_ELEVATED_ROLES")) {
    options.elevated_roles = splitRoles(*roles);
  }
  options.issuer = env("CTXSYNC_JWT_ISSUER");
  options.audience = env("CTXSYNC_JWT_AUDIENCE");

  auto jwks_url = env("CTXSYNC_JWKS_URL");
  auto secret = env("CTXSYNC_JWT_SECRET");
  if (!secret) {
    secret = env("JWT_SECRET_KEY");
  }
  if (jwks_url) {
    auto source = makeKeySource(*jwks_url);
    if (!source.has_value()) {
      error() << "CTXSYNC_JWKS_URL is not usable: " << *jwks_url;
      return tl::make_unexpected(source.error());
    }
    if (secret) {
      warn() << "both a JWKS URL and a shared secret are configured; using the JWKS URL";
    }
    options.key_source = std::move(*source);
  } else if (secret) {
    options.key_source = std::make_unique<SecretKeySource>(std::move(*secret));
  }
  return options;
}

}  // namespace ctxsync
