#include <rcache/util/log.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace rcache::log {

    Level level_from_string(std::string_view name) {
        std::string s(name);
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
        if (s == "trace") return Level::Trace;
        if (s == "debug") return Level::Debug;
        if (s == "warn" || s == "warning") return Level::Warn;
        if (s == "error") return Level::Error;
        if (s == "off") return Level::Off;
        return Level::Info;
    }

    std::string_view to_string(Level level) {
        switch (level) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO";
        case Level::Warn:  return "WARN";
        case Level::Error: return "ERROR";
        case Level::Off:   return "OFF";
        }
        return "INFO";
    }

    Logger& Logger::instance() {
        static Logger lg;
        return lg;
    }

    void Logger::write(Level level, std::string_view component, std::string_view message) {
        if (!enabled(level) || level == Level::Off) return;

        auto now = std::chrono::system_clock::now();
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
        std::time_t t = std::chrono::system_clock::to_time_t(now);
        std::tm tm{};
        localtime_r(&t, &tm);

        auto line = fmt::format("[{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:03}][{}][{}] {}\n",
            tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
            static_cast<int>(ms), to_string(level), component, message);

        std::lock_guard lk(mu_);
        std::fwrite(line.data(), 1, line.size(), stderr);
    }

} // namespace rcache::log
