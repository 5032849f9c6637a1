#pragma once

/// @file mock_logger.hpp
/// @brief MockLogger: kcenon ILogger capturing messages for assertions,
///        plus a fixture that installs it as the default logger.

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include "interact/foundation/game_logger.hpp"

namespace interact::test {

using kcenon::common::interfaces::log_level;

struct LogRecord {
    log_level level;
    std::string message;
};

class MockLogger : public kcenon::common::interfaces::ILogger {
public:
    kcenon::common::VoidResult log(log_level level,
                                    const std::string& message) override {
        std::lock_guard lock(mutex_);
        records_.push_back({level, message});
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

    std::vector<LogRecord> records() const {
        std::lock_guard lock(mutex_);
        return records_;
    }

    /// True if any captured message contains @p needle.
    bool contains(std::string_view needle) const {
        std::lock_guard lock(mutex_);
        return std::any_of(records_.begin(), records_.end(), [&](const LogRecord& r) {
            return r.message.find(needle) != std::string::npos;
        });
    }

    bool wasFlushed() const {
        return flushed_.load(std::memory_order_acquire);
    }

    void reset() {
        std::lock_guard lock(mutex_);
        records_.clear();
        flushed_.store(false, std::memory_order_relaxed);
    }

private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
    std::atomic<log_level> minLevel_{log_level::trace};
    std::atomic<bool> flushed_{false};
};

/// Registers a MockLogger as the default logger and restores the
/// singleton GameLogger's category levels around each test.
class MockLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& registry = kcenon::common::interfaces::GlobalLoggerRegistry::instance();
        registry.clear();
        mockLogger_ = std::make_shared<MockLogger>();
        registry.set_default_logger(mockLogger_);
        foundation::GameLogger::instance().resetCategoryLevels();
    }

    void TearDown() override {
        foundation::GameLogger::instance().resetCategoryLevels();
        kcenon::common::interfaces::GlobalLoggerRegistry::instance().clear();
    }

    std::shared_ptr<MockLogger> mockLogger_;
};

}  // namespace interact::test
