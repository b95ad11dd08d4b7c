#include "logging.hpp"

#include <array>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

#include "string_utils.hpp"

namespace logging {
    namespace {
        constexpr size_t MESSAGE_BUFFER_SIZE = 1024;

        std::string format_args(const char* fmt, va_list args) {
            std::array<char, MESSAGE_BUFFER_SIZE> buffer{};

            va_list copy;
            va_copy(copy, args);
            const int needed = std::vsnprintf(buffer.data(), buffer.size(), fmt, copy);
            va_end(copy);

            if (needed < 0) {
                return fmt;
            }
            if (static_cast<size_t>(needed) < buffer.size()) {
                return {buffer.data(), static_cast<size_t>(needed)};
            }

            std::string large(static_cast<size_t>(needed) + 1, '\0');
            std::vsnprintf(large.data(), large.size(), fmt, args);
            large.resize(static_cast<size_t>(needed));
            return large;
        }
    }  // namespace

    std::optional<LogLevel> parse_level(std::string_view name) {
        const std::string lowered = string_utils::to_lower(std::string(name));
        if (lowered == "debug") {
            return LogLevel::DEBUG;
        }
        if (lowered == "info") {
            return LogLevel::INFO;
        }
        if (lowered == "warn" || lowered == "warning") {
            return LogLevel::WARN;
        }
        if (lowered == "error") {
            return LogLevel::ERROR;
        }
        return std::nullopt;
    }

    const char* level_name(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG:
                return "DEBUG";
            case LogLevel::INFO:
                return "INFO";
            case LogLevel::WARN:
                return "WARNING";
            case LogLevel::ERROR:
                return "ERROR";
        }
        return "INFO";
    }

    Logger& Logger::instance() {
        static Logger logger;
        return logger;
    }

    Logger::~Logger() { close_file(); }

    void Logger::configure(const LoggerOptions& options) {
        std::lock_guard<std::mutex> lock(mutex_);

        level_ = options.level_;
        console_ = options.console_;
        close_file();

        if (options.file_path_.empty()) {
            return;
        }

        if (options.file_path_.has_parent_path()) {
            std::filesystem::create_directories(options.file_path_.parent_path());
        }

        file_ = std::fopen(options.file_path_.c_str(), "a");
        if (file_ == nullptr) {
            throw std::runtime_error("Failed to open log file: " + options.file_path_.string());
        }
    }

    void Logger::set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = level;
    }

    LogLevel Logger::level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return level_;
    }

    bool Logger::enabled(LogLevel level) const {
        std::lock_guard<std::mutex> lock(mutex_);
        // The file sink records everything, as the console level only filters the terminal.
        return file_ != nullptr || level >= level_;
    }

    void Logger::log(LogLevel level, const char* module, const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);
        std::string message = format_args(fmt, args);
        va_end(args);

        write_line(level, module, message);
    }

    void Logger::write_line(LogLevel level, const char* module, const std::string& message) {
        const auto now = std::chrono::system_clock::now();

        std::lock_guard<std::mutex> lock(mutex_);

        if (console_ && level >= level_) {
            const std::time_t tt = std::chrono::system_clock::to_time_t(now);
            std::tm local{};
            localtime_r(&tt, &local);
            std::array<char, 16> clock{};
            std::strftime(clock.data(), clock.size(), "%H:%M:%S", &local);

            std::fprintf(stderr, "%s [%s] %s\n", clock.data(), level_name(level), message.c_str());
            std::fflush(stderr);
        }

        if (file_ != nullptr) {
            nlohmann::ordered_json line;
            line["timestamp"] = string_utils::iso8601_utc(now);
            line["level"] = level_name(level);
            line["module"] = module;
            line["message"] = message;

            const std::string text = line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
            std::fprintf(file_, "%s\n", text.c_str());
            std::fflush(file_);
        }
    }

    void Logger::close_file() {
        if (file_ != nullptr) {
            std::fclose(file_);
            file_ = nullptr;
        }
    }
}  // namespace logging
