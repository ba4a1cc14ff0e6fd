#ifndef WALRUS_UTIL_LOGGER_HPP
#define WALRUS_UTIL_LOGGER_HPP

#include <atomic>
#include <mutex>
#include <string>
#include <string_view>

namespace walrus::util {

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

    void debug(std::string_view message);
    void info(std::string_view message);
    void warn(std::string_view message);
    void error(std::string_view message);

    void log(LogLevel level, std::string_view message);

   private:
    Logger() = default;

    [[nodiscard]] std::string timestamp() const;
    [[nodiscard]] std::string_view level_string(LogLevel level) const;

    // handler threads log while main may change the level
    std::atomic<LogLevel> level_{LogLevel::Info};
    std::mutex mutex_;
};

// convenience macros
#define WALRUS_LOG_DEBUG(msg) walrus::util::Logger::instance().debug(msg)
#define WALRUS_LOG_INFO(msg) walrus::util::Logger::instance().info(msg)
#define WALRUS_LOG_WARN(msg) walrus::util::Logger::instance().warn(msg)
#define WALRUS_LOG_ERROR(msg) walrus::util::Logger::instance().error(msg)

}  // namespace walrus::util

#endif
