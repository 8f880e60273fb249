#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <format>
#include <initializer_list>
#include <mutex>
#include <print>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

// Everything goes to stderr, stdout is reserved for cipher output
namespace Codebreakers::Logging {
    enum class Level { ERROR = 1, WARN, INFO, DEBUG, TRACE };

    constexpr std::string_view LevelStr(Level level) {
        switch (level) {
            case Level::ERROR: return "ERROR";
            case Level::WARN:  return  "WARN";
            case Level::INFO:  return  "INFO";
            case Level::DEBUG: return "DEBUG";
            case Level::TRACE: return "TRACE";
        }
        return "UNKNOWN";
    }

    // "warn", "WARNING", "Debug" ...; throws std::invalid_argument otherwise
    inline Level parseLevel(std::string_view name_) {
        std::string name {name_};
        std::transform(name.begin(), name.end(), name.begin(), [](unsigned char ch) {
            return static_cast<char>(std::toupper(ch));
        });
        if (name == "WARNING") name = "WARN";
        for (Level lvl: {Level::ERROR, Level::WARN, Level::INFO, Level::DEBUG, Level::TRACE}) {
            if (LevelStr(lvl) == name) return lvl;
        }
        throw std::invalid_argument("Unknown log level: '" + std::string{name_} + "'");
    }

    inline std::string TimeStamp() {
        namespace cr = std::chrono;

        auto now = cr::system_clock::now();
        auto ms = cr::duration_cast<cr::milliseconds>(now.time_since_epoch()) % 1000;

        std::time_t t = cr::system_clock::to_time_t(now);
        std::tm tm = *std::localtime(&t);

        return std::format(
            "{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:03}",
            tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
            tm.tm_hour, tm.tm_min, tm.tm_sec, ms.count()
        );
    }

    namespace impl {
        class Logger {
            private:
                Level logLevel;
                mutable std::mutex mutex;

                Logger(): logLevel{Level::WARN} {}

            public:
                void setLevel(Level level) {
                    std::lock_guard lock {mutex};
                    logLevel = level;
                }

                Level getLevel() const {
                    std::lock_guard lock {mutex};
                    return logLevel;
                }

                [[nodiscard]] static Logger &instance() {
                    static Logger logger {};
                    return logger;
                }

                template<typename ...Args>
                void log(Level lvl, std::format_string<Args...> fmt, Args &&...args) const {
                    using levelT = std::underlying_type_t<Level>;
                    std::lock_guard lock {mutex};
                    if (static_cast<levelT>(logLevel) >= static_cast<levelT>(lvl)) {
                        auto msg = std::format(fmt, std::forward<Args>(args)...);
                        std::println(stderr, "[{} {}] {}", TimeStamp(), LevelStr(lvl), msg);
                    }
                }
        };
    }

    inline void setLogLevel(Level level) { impl::Logger::instance().setLevel(level); }
    inline Level getLogLevel() { return impl::Logger::instance().getLevel(); }

    template<typename ...Args>
    inline void Error(std::format_string<Args...> fmt, Args &&...args) {
        impl::Logger::instance().log(Level::ERROR, fmt, std::forward<Args>(args)...);
    }

    template<typename ...Args>
    inline void Warn(std::format_string<Args...> fmt, Args &&...args) {
        impl::Logger::instance().log(Level::WARN, fmt, std::forward<Args>(args)...);
    }

    template<typename ...Args>
    inline void Info(std::format_string<Args...> fmt, Args &&...args) {
        impl::Logger::instance().log(Level::INFO, fmt, std::forward<Args>(args)...);
    }

    template<typename ...Args>
    inline void Debug(std::format_string<Args...> fmt, Args &&...args) {
        impl::Logger::instance().log(Level::DEBUG, fmt, std::forward<Args>(args)...);
    }

    template<typename ...Args>
    inline void Trace(std::format_string<Args...> fmt, Args &&...args) {
        impl::Logger::instance().log(Level::TRACE, fmt, std::forward<Args>(args)...);
    }
}
