#ifndef UNSAFE_FETCH_CONFIG_HPP
#define UNSAFE_FETCH_CONFIG_HPP

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "../utils/constants.hpp"
#include "../utils/logging.hpp"

namespace config {
    inline constexpr const char* ENV_PREFIX = "UNSAFE_FETCH_";

    struct BridgeConfig {
        size_t max_retries_ = 3;
        std::chrono::milliseconds retry_delay_{1000};
        std::chrono::milliseconds max_delay_{0};  // 0 = no cap
        std::chrono::milliseconds timeout_{30'000};
        std::chrono::milliseconds connect_timeout_{10'000};
        std::optional<std::string> proxy_;
        bool verify_ssl_ = false;
        std::string user_agent_ = constants::DEFAULT_USER_AGENT;

        std::filesystem::path session_dir_ = "sessions";
        std::filesystem::path download_dir_ = "downloads";
        std::filesystem::path log_dir_ = "logs";
        std::filesystem::path log_file_;  // empty keeps logging on the console only
        logging::LogLevel log_level_ = logging::LogLevel::INFO;

        size_t summary_limit_ = constants::DEFAULT_SUMMARY_LIMIT;
        size_t recorder_capacity_ = constants::DEFAULT_RECORDER_CAPACITY;
        size_t max_in_flight_ = 0;
    };

    // Returns nullptr when the variable is unset.
    using EnvLookup = std::function<const char*(const char*)>;

    // Reads a JSON object of overrides; unknown keys are logged and ignored. Throws std::runtime_error.
    void apply_file(BridgeConfig& config, const std::filesystem::path& path);

    // UNSAFE_FETCH_<KEY> for every key apply_file understands. Throws std::runtime_error.
    void apply_env(BridgeConfig& config, const EnvLookup& lookup);

    void validate(const BridgeConfig& config);

    // Defaults, then the file (if any), then the environment.
    [[nodiscard]] BridgeConfig load(const std::optional<std::filesystem::path>& file, const EnvLookup& lookup);

    [[nodiscard]] const std::vector<std::string>& known_keys();
}  // namespace config

#endif
