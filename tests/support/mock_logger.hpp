#pragma once

/// @file mock_logger.hpp
/// @brief kcenon ILogger that captures every message for assertions.

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

namespace gk::test {

using kcenon::common::interfaces::ILogger;
using kcenon::common::interfaces::log_level;

struct LogRecord {
    log_level level;
    std::string message;
};

class MockLogger : public ILogger {
public:
    kcenon::common::VoidResult log(log_level level,
                                    const std::string& message) override {
        std::lock_guard lock(mutex_);
        records_.push_back({level, message});
        logCount_.fetch_add(1, std::memory_order_relaxed);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kcenon::common::VoidResult log(
        log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& /*loc*/) override {
        return log(level, std::string(message));
    }

    kcenon::common::VoidResult log(
        const kcenon::common::interfaces::log_entry& entry) override {
        return log(entry.level, entry.message);
    }

    bool is_enabled(log_level level) const override {
        return level >= minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult set_level(log_level level) override {
        minLevel_.store(level, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    log_level get_level() const override {
        return minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult flush() override {
        flushed_.store(true, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    // Test helpers
    std::vector<LogRecord> records() const {
        std::lock_guard lock(mutex_);
        return records_;
    }

    std::size_t logCount() const {
        return logCount_.load(std::memory_order_relaxed);
    }

    bool wasFlushed() const {
        return flushed_.load(std::memory_order_acquire);
    }

    /// True if any captured message contains @p needle.
    bool contains(std::string_view needle) const {
        std::lock_guard lock(mutex_);
        for (const auto& r : records_) {
            if (r.message.find(needle) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    void reset() {
        std::lock_guard lock(mutex_);
        records_.clear();
        logCount_.store(0, std::memory_order_relaxed);
        flushed_.store(false, std::memory_order_relaxed);
    }

private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
    std::atomic<std::size_t> logCount_{0};
    std::atomic<log_level> minLevel_{log_level::trace};
    std::atomic<bool> flushed_{false};
};

}  // namespace gk::test
