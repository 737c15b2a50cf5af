#pragma once

#include <iostream>
#include <string>
#include <mutex>
#include <atomic>

namespace Bliss {

/**
 * @brief Thread-safe logging utility for the engine and its tools.
 *
 * Messages below the configured minimum level are dropped. Tests switch
 * the logger to Level::Quiet so dictionary loading stays silent.
 */
class Logger {
public:
    enum class Level {
        Info,
        Step,
        Success,
        Warning,
        Error,
        Quiet
    };

    static void log(Level level, const std::string& message) {
        if (level == Level::Quiet || level < min_level()) return;

        static std::mutex mutex;
        std::lock_guard<std::mutex> lock(mutex);

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Info:    color = "\033[0;36m"; prefix = "=== "; break; // Cyan
            case Level::Step:    color = "\033[1;33m"; prefix = ">>> "; break; // Yellow
            case Level::Success: color = "\033[0;32m"; prefix = "✓ ";   break; // Green
            case Level::Warning: color = "\033[1;33m"; prefix = "⚠ ";   break; // Yellow
            case Level::Error:   color = "\033[0;31m"; prefix = "✗ ";   break; // Red
            case Level::Quiet:   break;
        }

        // Diagnostics go to stderr so tool output on stdout stays parseable JSON
        std::cerr << color << prefix << message << "\033[0m" << std::endl;
    }

    static void set_min_level(Level level) { threshold().store(level); }
    static Level min_level() { return threshold().load(); }

    /**
     * @brief Parse "info", "warning", "error" or "quiet"; anything else is Info.
     */
    static Level parse_level(const std::string& name) {
        if (name == "warning" || name == "warn") return Level::Warning;
        if (name == "error") return Level::Error;
        if (name == "quiet" || name == "off") return Level::Quiet;
        return Level::Info;
    }

    static void info(const std::string& msg)    { log(Level::Info, msg); }
    static void step(const std::string& msg)    { log(Level::Step, msg); }
    static void success(const std::string& msg) { log(Level::Success, msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, msg); }
    static void error(const std::string& msg)   { log(Level::Error, msg); }

private:
    static std::atomic<Level>& threshold() {
        static std::atomic<Level> level{Level::Info};
        return level;
    }
};

} // namespace Bliss
