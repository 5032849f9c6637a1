#pragma once

/// @file console_logger.hpp
/// @brief ConsoleLogger: kcenon ILogger writing one line per entry to a stream.

#include <atomic>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>

#include <kcenon/common/interfaces/logger_interface.h>

namespace interact::tools {

class ConsoleLogger : public kcenon::common::interfaces::ILogger {
public:
    using log_level = kcenon::common::interfaces::log_level;

    explicit ConsoleLogger(std::ostream& out, log_level minLevel = log_level::info)
        : out_(out), minLevel_(minLevel) {}

    kcenon::common::VoidResult log(log_level level, const std::string& message) override {
        if (!is_enabled(level)) {
            return kcenon::common::VoidResult::ok(std::monostate{});
        }
        std::lock_guard lock(mutex_);
        out_ << levelTag(level) << ' ' << message << '\n';
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
        std::lock_guard lock(mutex_);
        out_.flush();
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

private:
    static std::string_view levelTag(log_level level) {
        switch (level) {
            case log_level::trace:    return "[trace]";
            case log_level::debug:    return "[debug]";
            case log_level::info:     return "[info]";
            case log_level::warning:  return "[warn]";
            case log_level::error:    return "[error]";
            case log_level::critical: return "[crit]";
            default:                  return "[log]";
        }
    }

    std::mutex mutex_;
    std::ostream& out_;
    std::atomic<log_level> minLevel_;
};

}  // namespace interact::tools
