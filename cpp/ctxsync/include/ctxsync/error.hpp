#pragma once

#include <cstdint>
#include <iostream>
#include <sstream>
#include <string_view>
#include <type_traits>

#include <tl/expected.hpp>

namespace ctxsync {

enum class CtxError : uint8_t {
  Ok,
  Unspecified,
  ValidationError,
  PermissionDenied,
  AuthenticationError,
  CredentialExpired,
  TransportError,
  NotFound,
  KeySourceError,
  ServerAlreadyStarted,
  Bind,
  ConfigError
};

template<typename T>
using CtxResult = tl::expected<T, CtxError>;

const char* strerror(CtxError error);

/// @brief The protocol-level name of an error, as sent in `error` messages.
const char* protocolErrorName(CtxError error);

enum class LogLevel : uint8_t {
  Debug,
  Info,
  Warn,
  Error,
  Off
};

/// @brief Set the minimum level written by the ctxsync logger.
void setLogLevel(LogLevel level);

/// @brief Current minimum log level.
LogLevel logLevel();

/// @brief Parse "debug", "info", "warn", "error" or "off". Unknown names yield ConfigError.
CtxResult<LogLevel> parseLogLevel(std::string_view name);

const char* logLevelName(LogLevel level);

/// @brief Buffers one log line and writes it to stderr when destroyed.
class LogStream {
public:
  explicit LogStream(LogLevel level)
      : level_(level) {}
  LogStream(const LogStream&) = delete;
  LogStream(LogStream&&) = delete;
  LogStream& operator=(const LogStream&) = delete;
  LogStream& operator=(LogStream&&) = delete;

  template<typename T>
  LogStream& operator<<(const T& value) {
#ifndef CTXSYNC_DISABLE_LOGGING
    if (!enabled()) {
      return *this;
    }
    // If T is an array type, we need special handling to avoid
    // cppcoreguidelines-pro-bounds-array-to-pointer-decay.
    if constexpr (std::is_array_v<T>) {
      using ElementType = std::remove_cv_t<std::remove_all_extents_t<T>>;
      if constexpr (std::is_same_v<ElementType, char>) {
        buffer_ << static_cast<const char*>(value);
      } else {
        buffer_ << static_cast<const void*>(value);
      }
    } else {
      buffer_ << value;
    }
#endif
    return *this;
  }

  ~LogStream() {
#ifndef CTXSYNC_DISABLE_LOGGING
    if (!enabled()) {
      return;
    }
    auto msg = buffer_.str();
    std::cerr << "[ctxsync] " << logLevelName(level_) << ": " << msg << "\n";
#endif
  }

private:
  [[nodiscard]] bool enabled() const {
    return level_ >= logLevel();
  }

  LogLevel level_;
  std::ostringstream buffer_;
};

inline LogStream debug() {
  return LogStream{LogLevel::Debug};
}

inline LogStream info() {
  return LogStream{LogLevel::Info};
}

inline LogStream warn() {
  return LogStream{LogLevel::Warn};
}

inline LogStream error() {
  return LogStream{LogLevel::Error};
}

}  // namespace ctxsync
