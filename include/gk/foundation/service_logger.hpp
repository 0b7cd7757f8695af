#pragma once

/// @file service_logger.hpp
/// @brief ServiceLogger wrapping kcenon logger interfaces for structured,
///        category-filtered logging of authentication events.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "gk/foundation/service_result.hpp"
#include "gk/foundation/types.hpp"

namespace gk::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally:
///   Trace -> trace, Debug -> debug, Info -> info, Warning -> warning,
///   Error -> error, Critical -> critical, Off -> off
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories, one per service area.
enum class LogCategory : uint8_t {
    Core    = 0, ///< Startup, shutdown, wiring
    Auth    = 1, ///< Credential checks
    Session = 2, ///< Login, logout, device revocation
    Token   = 3, ///< Signed token issue/verify
    Account = 4, ///< Sign-up, confirmation, password reset, account edits
    Mail    = 5, ///< Outbound mail hand-off
    Storage = 6, ///< User and session stores
    Config  = 7  ///< Configuration loading
};

inline constexpr std::size_t kLogCategoryCount = 8;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Auth", "Session", "Token", "Account", "Mail", "Storage", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured context data attached to log entries.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.userId = UserId(42);
///   ctx.activeSessionId = ActiveSessionId(7);
///   ctx.extra["ip"] = "10.0.0.1";
///   logger.logWithContext(LogLevel::Info, LogCategory::Session,
///                         "Login succeeded", ctx);
/// @endcode
struct LogContext {
    std::optional<UserId> userId;
    std::optional<ActiveSessionId> activeSessionId;
    std::optional<std::string> traceId;
    std::unordered_map<std::string, std::string> extra;
};

/// Service logger wrapping kcenon's logger registry.
///
/// Provides category-based filtering, structured logging with context,
/// and per-category runtime log level control. Uses PIMPL to hide
/// kcenon implementation details from the public API.
///
/// Default log levels per category:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | Auth     | Info          |
/// | Session  | Info          |
/// | Token    | Warning       |
/// | Account  | Info          |
/// | Mail     | Info          |
/// | Storage  | Warning       |
/// | Config   | Info          |
class ServiceLogger {
public:
    ServiceLogger();
    ~ServiceLogger();

    ServiceLogger(const ServiceLogger&) = delete;
    ServiceLogger& operator=(const ServiceLogger&) = delete;
    ServiceLogger(ServiceLogger&&) noexcept;
    ServiceLogger& operator=(ServiceLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as key=value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush all buffered log messages.
    ServiceResult<void> flush();

    /// Process-wide logger used by the GK_LOG macros.
    static ServiceLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace gk::foundation

// ---------------------------------------------------------------------------
// Convenience macros (global, outside the namespace)
// ---------------------------------------------------------------------------

/// @name GK_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// GK_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef GK_MIN_LOG_LEVEL
    #define GK_MIN_LOG_LEVEL 0
#endif

#define GK_LOG(level, cat, msg)                                                    \
    do {                                                                           \
        _Pragma("GCC diagnostic push")                                             \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                        \
        if (static_cast<int>(level) >= GK_MIN_LOG_LEVEL &&                         \
            ::gk::foundation::ServiceLogger::instance().isEnabled((level), (cat)))  \
        {                                                                          \
            ::gk::foundation::ServiceLogger::instance().log((level), (cat), (msg)); \
        }                                                                          \
        _Pragma("GCC diagnostic pop")                                              \
    } while (0)

#define GK_LOG_CTX(level, cat, msg, ctx)                                           \
    do {                                                                           \
        if (static_cast<int>(level) >= GK_MIN_LOG_LEVEL &&                         \
            ::gk::foundation::ServiceLogger::instance().isEnabled((level), (cat)))  \
        {                                                                          \
            ::gk::foundation::ServiceLogger::instance().logWithContext(             \
                (level), (cat), (msg), (ctx));                                     \
        }                                                                          \
    } while (0)

#define GK_LOG_DEBUG(cat, msg) \
    GK_LOG(::gk::foundation::LogLevel::Debug, (cat), (msg))

#define GK_LOG_INFO(cat, msg) \
    GK_LOG(::gk::foundation::LogLevel::Info, (cat), (msg))

#define GK_LOG_WARN(cat, msg) \
    GK_LOG(::gk::foundation::LogLevel::Warning, (cat), (msg))

#define GK_LOG_ERROR(cat, msg) \
    GK_LOG(::gk::foundation::LogLevel::Error, (cat), (msg))

/// @}
