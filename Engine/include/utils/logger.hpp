#pragma once

#include <iostream>
#include <string>
#include <mutex>
#include <atomic>
#include <cstdlib>

namespace Stanchion {

/**
 * @brief Thread-safe logging utility for the classification engine.
 *
 * Minimum level comes from STANCHION_LOG_LEVEL (debug|info|warn|error)
 * unless overridden with set_level().
 */
class Logger {
public:
    enum class Level {
        Debug,
        Info,
        Step,
        Success,
        Warning,
        Error
    };

    static void set_level(Level level) {
        threshold().store(static_cast<int>(level));
    }

    static Level level() {
        return static_cast<Level>(threshold().load());
    }

    static bool enabled(Level level) {
        return static_cast<int>(level) >= threshold().load();
    }

    static void log(Level level, const std::string& message) {
        if (!enabled(level)) return;

        static std::mutex mutex;
        std::lock_guard<std::mutex> lock(mutex);

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Debug:   color = "\033[0;90m"; prefix = "... "; break; // Grey
            case Level::Info:    color = "\033[0;36m"; prefix = "=== "; break; // Cyan
            case Level::Step:    color = "\033[1;33m"; prefix = ">>> "; break; // Yellow
            case Level::Success: color = "\033[0;32m"; prefix = "✓ ";   break; // Green
            case Level::Warning: color = "\033[1;33m"; prefix = "⚠ ";   break; // Yellow
            case Level::Error:   color = "\033[0;31m"; prefix = "✗ ";   break; // Red
        }

        std::ostream& out = (level >= Level::Warning) ? std::cerr : std::cout;
        out << color << prefix << message << "\033[0m" << std::endl;
    }

    static void debug(const std::string& msg)   { log(Level::Debug, msg); }
    static void info(const std::string& msg)    { log(Level::Info, msg); }
    static void step(const std::string& msg)    { log(Level::Step, msg); }
    static void success(const std::string& msg) { log(Level::Success, msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, msg); }
    static void error(const std::string& msg)   { log(Level::Error, msg); }

private:
    static std::atomic<int>& threshold() {
        static std::atomic<int> value(static_cast<int>(level_from_env()));
        return value;
    }

    static Level level_from_env() {
        const char* env = std::getenv("STANCHION_LOG_LEVEL");
        if (!env) return Level::Info;
        std::string name(env);
        if (name == "debug") return Level::Debug;
        if (name == "warn" || name == "warning") return Level::Warning;
        if (name == "error") return Level::Error;
        return Level::Info;
    }
};

} // namespace Stanchion
