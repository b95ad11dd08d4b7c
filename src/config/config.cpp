#include "config.hpp"

#include <simdjson.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <string_view>

#include "../utils/string_utils.hpp"

namespace config {
    namespace {
        struct ParserOptions {
            std::string error_message_;
        };

        template <typename T>
        T parse_value(simdjson::simdjson_result<T> result, const ParserOptions& options) {
            if (result.error() != simdjson::error_code::SUCCESS) {
                throw std::runtime_error(options.error_message_);
            }
            return std::move(result).value_unsafe();
        }

        ParserOptions expect(const std::string& key, const char* what) { return ParserOptions{.error_message_ = "config key '" + key + "' must be " + what}; }

        size_t parse_count(std::string_view key, std::string_view raw) {
            const std::string s(raw);
            char* end = nullptr;
            const unsigned long long v = std::strtoull(s.c_str(), &end, constants::BASE_10);
            if (s.empty() || s.front() == '-' || end == nullptr || *end != '\0') {
                throw std::runtime_error(std::string(key) + " must be a non-negative integer, got '" + s + "'");
            }
            return static_cast<size_t>(v);
        }

        bool parse_flag(std::string_view key, std::string_view raw) {
            const std::string s = string_utils::to_lower(std::string(raw));
            if (s == "1" || s == "true" || s == "yes" || s == "on") {
                return true;
            }
            if (s == "0" || s == "false" || s == "no" || s == "off") {
                return false;
            }
            throw std::runtime_error(std::string(key) + " must be a boolean, got '" + std::string(raw) + "'");
        }

        logging::LogLevel parse_log_level(std::string_view raw) {
            auto level = logging::parse_level(raw);
            if (!level) {
                throw std::runtime_error("log_level must be one of debug, info, warning, error; got '" + std::string(raw) + "'");
            }
            return *level;
        }

        // Keys shared by the file and the environment; set() takes the textual form.
        struct Setting {
            const char* key_;
            std::function<void(BridgeConfig&, std::string_view)> set_;
        };

        const std::vector<Setting>& settings() {
            static const std::vector<Setting> all = {
                {"max_retries", [](BridgeConfig& c, std::string_view v) { c.max_retries_ = parse_count("max_retries", v); }},
                {"retry_delay_ms", [](BridgeConfig& c, std::string_view v) { c.retry_delay_ = std::chrono::milliseconds(parse_count("retry_delay_ms", v)); }},
                {"max_delay_ms", [](BridgeConfig& c, std::string_view v) { c.max_delay_ = std::chrono::milliseconds(parse_count("max_delay_ms", v)); }},
                {"timeout_ms", [](BridgeConfig& c, std::string_view v) { c.timeout_ = std::chrono::milliseconds(parse_count("timeout_ms", v)); }},
                {"connect_timeout_ms",
                 [](BridgeConfig& c, std::string_view v) { c.connect_timeout_ = std::chrono::milliseconds(parse_count("connect_timeout_ms", v)); }},
                {"proxy",
                 [](BridgeConfig& c, std::string_view v) {
                     c.proxy_ = v.empty() ? std::nullopt : std::optional<std::string>(std::string(v));
                 }},
                {"verify_ssl", [](BridgeConfig& c, std::string_view v) { c.verify_ssl_ = parse_flag("verify_ssl", v); }},
                {"user_agent", [](BridgeConfig& c, std::string_view v) { c.user_agent_ = std::string(v); }},
                {"session_dir", [](BridgeConfig& c, std::string_view v) { c.session_dir_ = std::string(v); }},
                {"download_dir", [](BridgeConfig& c, std::string_view v) { c.download_dir_ = std::string(v); }},
                {"log_dir", [](BridgeConfig& c, std::string_view v) { c.log_dir_ = std::string(v); }},
                {"log_file", [](BridgeConfig& c, std::string_view v) { c.log_file_ = std::string(v); }},
                {"log_level", [](BridgeConfig& c, std::string_view v) { c.log_level_ = parse_log_level(v); }},
                {"summary_limit", [](BridgeConfig& c, std::string_view v) { c.summary_limit_ = parse_count("summary_limit", v); }},
                {"recorder_capacity", [](BridgeConfig& c, std::string_view v) { c.recorder_capacity_ = parse_count("recorder_capacity", v); }},
                {"max_in_flight", [](BridgeConfig& c, std::string_view v) { c.max_in_flight_ = parse_count("max_in_flight", v); }},
            };
            return all;
        }

        const Setting* find_setting(std::string_view key) {
            const auto& all = settings();
            auto it = std::ranges::find_if(all, [key](const Setting& s) { return key == s.key_; });
            return it == all.end() ? nullptr : &*it;
        }

        // JSON scalars are normalised to the textual form the environment uses.
        std::string scalar_text(const std::string& key, simdjson::ondemand::value value) {
            simdjson::ondemand::json_type type = parse_value(value.type(), expect(key, "a scalar"));

            switch (type) {
                case simdjson::ondemand::json_type::string:
                    return std::string(parse_value(value.get_string(), expect(key, "a string")));
                case simdjson::ondemand::json_type::boolean:
                    return parse_value(value.get_bool(), expect(key, "a boolean")) ? "true" : "false";
                case simdjson::ondemand::json_type::number:
                    return std::to_string(parse_value(value.get_uint64(), expect(key, "a non-negative integer")));
                case simdjson::ondemand::json_type::null:
                    return "";
                default:
                    throw std::runtime_error("config key '" + key + "' must be a scalar");
            }
        }
    }  // namespace

    const std::vector<std::string>& known_keys() {
        static const std::vector<std::string> keys = [] {
            std::vector<std::string> out;
            for (const auto& s : settings()) {
                out.emplace_back(s.key_);
            }
            return out;
        }();
        return keys;
    }

    void apply_file(BridgeConfig& config, const std::filesystem::path& path) {
        if (!std::filesystem::exists(path) || !std::filesystem::is_regular_file(path)) {
            throw std::runtime_error("Config file not found: " + path.string());
        }

        auto loaded = simdjson::padded_string::load(path.string());
        if (loaded.error() != simdjson::error_code::SUCCESS) {
            throw std::runtime_error("Cannot read config file " + path.string() + ": " + simdjson::error_message(loaded.error()));
        }
        const simdjson::padded_string json = std::move(loaded).value_unsafe();

        simdjson::ondemand::parser parser;
        simdjson::ondemand::document doc;
        if (auto error = parser.iterate(json).get(doc); error != simdjson::error_code::SUCCESS) {
            throw std::runtime_error("Invalid config file " + path.string() + ": " + simdjson::error_message(error));
        }

        simdjson::ondemand::object root = parse_value(doc.get_object(), expect("<root>", "an object"));

        for (auto field : root) {
            const std::string key(parse_value(field.unescaped_key(), expect("<key>", "a string")));
            const Setting* setting = find_setting(key);
            if (setting == nullptr) {
                LOG_WARN("Ignoring unknown config key '%s' in %s", key.c_str(), path.c_str());
                continue;
            }
            setting->set_(config, scalar_text(key, parse_value(field.value(), expect(key, "present"))));
        }
    }

    void apply_env(BridgeConfig& config, const EnvLookup& lookup) {
        for (const auto& setting : settings()) {
            std::string name = std::string(ENV_PREFIX) + setting.key_;
            std::ranges::transform(name, name.begin(), [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });

            if (const char* value = lookup(name.c_str()); value != nullptr) {
                setting.set_(config, value);
            }
        }
    }

    void validate(const BridgeConfig& config) {
        if (config.max_retries_ == 0) {
            throw std::runtime_error("max_retries must be at least 1");
        }
        if (config.max_delay_.count() > 0 && config.retry_delay_ > config.max_delay_) {
            throw std::runtime_error("retry_delay_ms must not exceed max_delay_ms");
        }
        if (config.timeout_.count() <= 0) {
            throw std::runtime_error("timeout_ms must be positive");
        }
        if (config.connect_timeout_.count() <= 0) {
            throw std::runtime_error("connect_timeout_ms must be positive");
        }
        if (config.session_dir_.empty()) {
            throw std::runtime_error("session_dir is required");
        }
        if (config.download_dir_.empty()) {
            throw std::runtime_error("download_dir is required");
        }
    }

    BridgeConfig load(const std::optional<std::filesystem::path>& file, const EnvLookup& lookup) {
        BridgeConfig config;
        if (file) {
            apply_file(config, *file);
        }
        if (lookup) {
            apply_env(config, lookup);
        }
        validate(config);
        return config;
    }
}  // namespace config
