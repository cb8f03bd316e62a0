#ifndef MEMCACHE_UTIL_LOGGER_HPP
#define MEMCACHE_UTIL_LOGGER_HPP

#include <atomic>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

namespace memcache::util {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    None = 4
};

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    [[nodiscard]] LogLevel level() const;

    // redirect every level to one stream. nullptr restores stdout/stderr
    void set_output(std::ostream* out);

    void debug(std::string_view message);
    void info(std::string_view message);
    void warn(std::string_view message);
    void error(std::string_view message);

    void log(LogLevel level, std::string_view message);

private:
    Logger() = default;

    [[nodiscard]] std::string timestamp() const;
    [[nodiscard]] std::string_view level_string(LogLevel level) const;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::ostream* output_ = nullptr;
    std::mutex mutex_;
};

std::string_view to_string(LogLevel level);
LogLevel parse_log_level(std::string_view name);

// convenience macros
#define LOG_DEBUG(msg) memcache::util::Logger::instance().debug(msg)
#define LOG_INFO(msg) memcache::util::Logger::instance().info(msg)
#define LOG_WARN(msg) memcache::util::Logger::instance().warn(msg)
#define LOG_ERROR(msg) memcache::util::Logger::instance().error(msg)

}  // namespace memcache::util

#endif
