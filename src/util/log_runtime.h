/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include "log.h"
#include "logmanager.h"
#include <memory>
#include <mutex>

namespace objreg {

/**
 * RAII manager for the logging subsystem.
 *
 * Usage:
 *   - Tests: Create in SetUpTestSuite(), destroy in TearDownTestSuite()
 *   - Hosts: Create beside the ObjectsRegistry in the composition root
 */
class LogRuntime {
public:
    struct Config {
        bool enable_file_logging;
        std::string log_dir;  // Empty = OBJREG_LOG_DIR

        // LOG_LEVEL in the environment overrides initial_level
        bool read_env;
        LogLevel initial_level;

        Config()
            : enable_file_logging(false)
            , read_env(true)
            , initial_level(LOG_WARNING) {}
    };

    explicit LogRuntime(const Config& config = Config())
        : config_(config) {

        logLevel.store(config_.initial_level, std::memory_order_relaxed);
        if (config_.read_env) {
            initLoggingFromEnv();
        }

        if (config_.enable_file_logging) {
            log_manager_ = std::make_unique<LogManager>(config_.log_dir);
        }
    }

    ~LogRuntime() {
        shutdown();
    }

    /**
     * Safe to call multiple times
     */
    void shutdown() {
        std::lock_guard<std::mutex> lock(mutex_);
        Logger::setLogFile(nullptr);
        log_manager_.reset();
    }

    LogManager* manager() { return log_manager_.get(); }

    LogRuntime(const LogRuntime&) = delete;
    LogRuntime& operator=(const LogRuntime&) = delete;

private:
    Config config_;
    std::unique_ptr<LogManager> log_manager_;
    std::mutex mutex_;
};

/**
 * Test helper: restores the previous log level on destruction
 */
class LogRuntimeGuard {
public:
    explicit LogRuntimeGuard(const LogRuntime::Config& config = LogRuntime::Config())
        : original_level_(logLevel.load(std::memory_order_relaxed)),  // Save BEFORE construction
          runtime_(std::make_unique<LogRuntime>(config)) {
    }

    ~LogRuntimeGuard() {
        runtime_->shutdown();
        logLevel.store(original_level_, std::memory_order_relaxed);
    }

    LogRuntime* operator->() { return runtime_.get(); }
    LogRuntime& operator*() { return *runtime_; }

private:
    int original_level_;
    std::unique_ptr<LogRuntime> runtime_;
};

} // namespace objreg
