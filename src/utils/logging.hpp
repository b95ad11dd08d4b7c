#ifndef UNSAFE_FETCH_LOGGING_HPP
#define UNSAFE_FETCH_LOGGING_HPP

#include <cstdarg>
#include <cstdio>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace logging {
    enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

    std::optional<LogLevel> parse_level(std::string_view name);
    const char* level_name(LogLevel level);

    struct LoggerOptions {
        LogLevel level_ = LogLevel::INFO;
        // Empty path disables the JSON-lines file sink.
        std::filesystem::path file_path_;
        bool console_ = true;
    };

    // Process-wide log sink. Holds no application state, only where lines go.
    class Logger {
       public:
        static Logger& instance();

        ~Logger();
        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;
        Logger(Logger&&) = delete;
        Logger& operator=(Logger&&) = delete;

        void configure(const LoggerOptions& options);
        void set_level(LogLevel level);
        [[nodiscard]] LogLevel level() const;
        [[nodiscard]] bool enabled(LogLevel level) const;

        void log(LogLevel level, const char* module, const char* fmt, ...) __attribute__((format(printf, 4, 5)));

       private:
        Logger() = default;

        void write_line(LogLevel level, const char* module, const std::string& message);
        void close_file();

        mutable std::mutex mutex_;
        LogLevel level_ = LogLevel::INFO;
        bool console_ = true;
        std::FILE* file_ = nullptr;
    };
}  // namespace logging

#define UNSAFE_FETCH_LOG(level, ...)                                                    \
    do {                                                                                \
        if (::logging::Logger::instance().enabled(level)) {                             \
            ::logging::Logger::instance().log(level, __FILE_NAME__, __VA_ARGS__);       \
        }                                                                               \
    } while (0)

#define LOG_DEBUG(...) UNSAFE_FETCH_LOG(::logging::LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INFO(...) UNSAFE_FETCH_LOG(::logging::LogLevel::INFO, __VA_ARGS__)
#define LOG_WARN(...) UNSAFE_FETCH_LOG(::logging::LogLevel::WARN, __VA_ARGS__)
#define LOG_ERROR(...) UNSAFE_FETCH_LOG(::logging::LogLevel::ERROR, __VA_ARGS__)

#endif
