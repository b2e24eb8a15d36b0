#include <ctxsync/error.hpp>

#include <atomic>

namespace ctxsync {

namespace {

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
std::atomic<LogLevel> g_log_level{LogLevel::Info};

}  // namespace

const char* strerror(CtxError error) {
  switch (error) {
    case CtxError::Ok:
      return "Ok";
    case CtxError::Unspecified:
      return "Unspecified Error";
    case CtxError::ValidationError:
      return "Validation Error";
    case CtxError::PermissionDenied:
      return "Permission Denied";
    case CtxError::AuthenticationError:
      return "Authentication Error";
    case CtxError::CredentialExpired:
      return "Credential Expired";
    case CtxError::TransportError:
      return "Transport Error";
    case CtxError::NotFound:
      return "Not Found";
    case CtxError::KeySourceError:
      return "Key Source Error";
    case CtxError::ServerAlreadyStarted:
      return "Server Already Started";
    case CtxError::Bind:
      return "Bind Error";
    case CtxError::ConfigError:
      return "Configuration Error";
  }
  return "Unknown Error";
}

const char* protocolErrorName(CtxError error) {
  switch (error) {
    case CtxError::ValidationError:
      return "validation_error";
    case CtxError::PermissionDenied:
      return "permission_denied";
    case CtxError::AuthenticationError:
      return "authentication_error";
    case CtxError::CredentialExpired:
      return "credential_expired";
    case CtxError::NotFound:
      return "not_found";
    default:
      return "internal_error";
  }
}

void setLogLevel(LogLevel level) {
  g_log_level.store(level, std::memory_order_relaxed);
}

LogLevel logLevel() {
  return g_log_level.load(std::memory_order_relaxed);
}

CtxResult<LogLevel> parseLogLevel(std::string_view name) {
  if (name == "debug") {
    return LogLevel::Debug;
  }
  if (name == "info") {
    return LogLevel::Info;
  }
  if (name == "warn" || name == "warning") {
    return LogLevel::Warn;
  }
  if (name == "error") {
    return LogLevel::Error;
  }
  if (name == "off") {
    return LogLevel::Off;
  }
  return tl::make_unexpected(CtxError::ConfigError);
}

const char* logLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::Debug:
      return "debug";
    case LogLevel::Info:
      return "info";
    case LogLevel::Warn:
      return "warn";
    case LogLevel::Error:
      return "error";
    case LogLevel::Off:
      return "off";
  }
  return "unknown";
}

}  // namespace ctxsync
