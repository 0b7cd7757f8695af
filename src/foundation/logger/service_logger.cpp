/// @file service_logger.cpp
/// @brief ServiceLogger implementation wrapping kcenon logger interfaces.

#include "gk/foundation/service_logger.hpp"

// kcenon logger headers (hidden behind PIMPL)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <array>
#include <atomic>
#include <sstream>
#include <string>

namespace gk::foundation {

namespace kci = kcenon::common::interfaces;

// ---------------------------------------------------------------------------
// Level mapping: GK -> kcenon
// ---------------------------------------------------------------------------
static kci::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

static constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,     // Core
    LogLevel::Info,     // Auth
    LogLevel::Info,     // Session
    LogLevel::Warning,  // Token
    LogLevel::Info,     // Account
    LogLevel::Info,     // Mail
    LogLevel::Warning,  // Storage
    LogLevel::Info      // Config
};

// ---------------------------------------------------------------------------
// Context serialization
// ---------------------------------------------------------------------------
static std::string formatContext(const LogContext& ctx) {
    std::ostringstream oss;
    bool first = true;

    auto append = [&](std::string_view key, std::string_view val) {
        if (!first) {
            oss << ", ";
        }
        oss << key << '=' << val;
        first = false;
    };

    if (ctx.userId && ctx.userId->isValid()) {
        append("user_id", std::to_string(ctx.userId->value()));
    }
    if (ctx.activeSessionId && ctx.activeSessionId->isValid()) {
        append("active_session_id", std::to_string(ctx.activeSessionId->value()));
    }
    if (ctx.traceId && !ctx.traceId->empty()) {
        append("trace_id", *ctx.traceId);
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }

    return oss.str();
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct ServiceLogger::Impl {
    // Per-category log levels (atomic for lock-free reads on the hot path)
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;

    // Per-category logger names ("gk.Session", ...) looked up in the registry
    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i], std::memory_order_relaxed);
            loggerNames[i] = std::string("gk.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    /// Named category logger if one is registered, otherwise the default.
    std::shared_ptr<kci::ILogger> getLogger(LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        if (idx >= kLogCategoryCount) {
            return kci::GlobalLoggerRegistry::null_logger();
        }
        auto& registry = kci::GlobalLoggerRegistry::instance();
        auto named = registry.get_logger(loggerNames[idx]);
        if (named && named != kci::GlobalLoggerRegistry::null_logger()) {
            return named;
        }
        return registry.get_default_logger();
    }

    void emit(LogLevel level, LogCategory cat, const std::string& formatted) const {
        auto logger = getLogger(cat);
        if (!logger) {
            return;
        }
        // Logging must never fail a request; a rejected write is dropped.
        (void)logger->log(mapLevel(level), formatted);
    }
};

// ---------------------------------------------------------------------------
// Construction / Destruction / Move
// ---------------------------------------------------------------------------
ServiceLogger::ServiceLogger() : impl_(std::make_unique<Impl>()) {}

ServiceLogger::~ServiceLogger() = default;

ServiceLogger::ServiceLogger(ServiceLogger&&) noexcept = default;
ServiceLogger& ServiceLogger::operator=(ServiceLogger&&) noexcept = default;

void ServiceLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }

    // Format: [Category] message
    std::string formatted;
    formatted.reserve(msg.size() + 16);
    formatted += '[';
    formatted += logCategoryName(cat);
    formatted += "] ";
    formatted += msg;

    impl_->emit(level, cat, formatted);
}

void ServiceLogger::logWithContext(LogLevel level, LogCategory cat,
                                   std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }

    std::string ctxStr = formatContext(ctx);

    // Format: [Category] message {key=val, ...}
    std::string formatted;
    formatted.reserve(msg.size() + ctxStr.size() + 20);
    formatted += '[';
    formatted += logCategoryName(cat);
    formatted += "] ";
    formatted += msg;
    if (!ctxStr.empty()) {
        formatted += " {";
        formatted += ctxStr;
        formatted += '}';
    }

    impl_->emit(level, cat, formatted);
}

void ServiceLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

LogLevel ServiceLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool ServiceLogger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount || level == LogLevel::Off) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

ServiceResult<void> ServiceLogger::flush() {
    auto& registry = kci::GlobalLoggerRegistry::instance();
    auto logger = registry.get_default_logger();
    auto result = logger->flush();
    if (result.is_err()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return ServiceResult<void>::ok();
}

ServiceLogger& ServiceLogger::instance() {
    static ServiceLogger inst;
    return inst;
}

} // namespace gk::foundation
