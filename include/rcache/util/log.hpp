#pragma once
#include <atomic>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <fmt/format.h>

namespace rcache::log {

    enum class Level { Trace = 0, Debug, Info, Warn, Error, Off };

    // Parses "trace", "debug", "info", "warn", "error" or "off" (case-insensitive).
    // Unknown names map to Info.
    Level level_from_string(std::string_view name);
    std::string_view to_string(Level level);

    class Logger {
    public:
        static Logger& instance();

        void write(Level level, std::string_view component, std::string_view message);

        bool enabled(Level level) const {
            return level >= min_level_.load(std::memory_order_relaxed);
        }
        void set_level(Level level) { min_level_.store(level, std::memory_order_relaxed); }
        Level level() const { return min_level_.load(std::memory_order_relaxed); }

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

    private:
        Logger() = default;

        std::mutex mu_;
        std::atomic<Level> min_level_{ Level::Info };
    };

    inline void set_level(Level level) { Logger::instance().set_level(level); }

    template <typename... Args>
    void logf(Level level, std::string_view component, fmt::format_string<Args...> fmt_str, Args&&... args) {
        auto& lg = Logger::instance();
        if (!lg.enabled(level)) return;
        lg.write(level, component, fmt::format(fmt_str, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void tracef(std::string_view component, fmt::format_string<Args...> fmt_str, Args&&... args) {
        logf(Level::Trace, component, fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void debugf(std::string_view component, fmt::format_string<Args...> fmt_str, Args&&... args) {
        logf(Level::Debug, component, fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void infof(std::string_view component, fmt::format_string<Args...> fmt_str, Args&&... args) {
        logf(Level::Info, component, fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void warnf(std::string_view component, fmt::format_string<Args...> fmt_str, Args&&... args) {
        logf(Level::Warn, component, fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void errorf(std::string_view component, fmt::format_string<Args...> fmt_str, Args&&... args) {
        logf(Level::Error, component, fmt_str, std::forward<Args>(args)...);
    }

} // namespace rcache::log
