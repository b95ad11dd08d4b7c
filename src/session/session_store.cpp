#include "session_store.hpp"

#include <simdjson.h>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <chrono>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <system_error>
#include <unistd.h>

#include "../utils/constants.hpp"
#include "../utils/logging.hpp"
#include "../utils/string_utils.hpp"

namespace session {
    namespace {
        struct CorruptRecordError : public std::runtime_error {
            using std::runtime_error::runtime_error;
        };

        template <typename T>
        T required(simdjson::simdjson_result<T> result, const char* field) {
            if (result.error() != simdjson::error_code::SUCCESS) {
                throw CorruptRecordError(std::string("invalid or missing field '") + field + "': " + simdjson::error_message(result.error()));
            }
            return std::move(result).value_unsafe();
        }

        // Missing fields take the fallback; present fields of the wrong type are still corrupt.
        template <typename T>
        T field_or(simdjson::simdjson_result<T> result, const char* field, T fallback) {
            if (result.error() == simdjson::error_code::NO_SUCH_FIELD) {
                return fallback;
            }
            return required(std::move(result), field);
        }

        std::atomic<unsigned long> temp_counter = 0;

        Cookie parse_cookie(simdjson::ondemand::object obj) {
            const Cookie defaults;

            Cookie c;
            c.name_ = std::string(required(obj["name"].get_string(), "cookies[].name"));
            c.value_ = std::string(required(obj["value"].get_string(), "cookies[].value"));
            c.domain_ = std::string(required(obj["domain"].get_string(), "cookies[].domain"));
            c.path_ = std::string(field_or(obj["path"].get_string(), "cookies[].path", std::string_view(defaults.path_)));
            c.expires_ = field_or(obj["expires"].get_double(), "cookies[].expires", defaults.expires_);
            c.http_only_ = field_or(obj["httpOnly"].get_bool(), "cookies[].httpOnly", defaults.http_only_);
            c.secure_ = field_or(obj["secure"].get_bool(), "cookies[].secure", defaults.secure_);
            c.same_site_ = std::string(field_or(obj["sameSite"].get_string(), "cookies[].sameSite", std::string_view(defaults.same_site_)));
            return c;
        }

        nlohmann::ordered_json to_json(const Cookie& c) {
            return nlohmann::ordered_json{
                {"name", c.name_},           {"value", c.value_},        {"domain", c.domain_},   {"path", c.path_},
                {"expires", c.expires_},     {"httpOnly", c.http_only_}, {"secure", c.secure_},   {"sameSite", c.same_site_},
            };
        }
    }  // namespace

    const char* to_string(StoreErrorKind kind) {
        switch (kind) {
            case StoreErrorKind::NOT_FOUND:
                return "NotFound";
            case StoreErrorKind::IO_FAILURE:
                return "IOFailure";
            case StoreErrorKind::INVALID_NAME:
                return "InvalidName";
            case StoreErrorKind::CORRUPT_RECORD:
                return "CorruptRecord";
        }
        return "Unknown";
    }

    SessionStore::SessionStore(std::filesystem::path directory) : directory_(std::move(directory)) {
        std::error_code ec;
        std::filesystem::create_directories(directory_, ec);
        if (ec) {
            throw std::runtime_error("cannot create session directory " + directory_.string() + ": " + ec.message());
        }
    }

    bool SessionStore::is_valid_name(std::string_view name) {
        if (name.empty() || name.front() == '.') {
            return false;
        }
        return std::ranges::none_of(name, [](char ch) { return ch == '/' || ch == '\\' || ch == '\0'; });
    }

    std::filesystem::path SessionStore::path_for(const std::string& name) const { return directory_ / (name + constants::SESSION_FILE_EXT); }

    void SessionStore::write_atomic(const std::filesystem::path& p, std::string_view bytes) {
        // Unique per writer so concurrent saves of one name never share a temp file.
        auto tmp = p;
        tmp += "." + std::to_string(::getpid()) + "." + std::to_string(temp_counter.fetch_add(1)) + constants::TEMP_FILE_EXT;
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out) {
                throw std::runtime_error("open failed: " + tmp.string());
            }
            out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
            out.flush();
            if (!out) {
                out.close();
                std::error_code ignored;
                std::filesystem::remove(tmp, ignored);
                throw std::runtime_error("write failed: " + tmp.string());
            }
        }

        std::error_code ec;
        std::filesystem::rename(tmp, p, ec);
        if (ec) {
            std::error_code ignored;
            std::filesystem::remove(tmp, ignored);
            throw std::runtime_error("rename failed: " + p.string() + ": " + ec.message());
        }
    }

    SaveResult SessionStore::save(const std::vector<Cookie>& cookies, const std::optional<std::string>& current_url, const std::string& name) const {
        if (!is_valid_name(name)) {
            return StoreError{.kind_ = StoreErrorKind::INVALID_NAME, .message_ = "invalid session name: '" + name + "'"};
        }

        std::set<std::string> domains;
        nlohmann::ordered_json cookie_array = nlohmann::ordered_json::array();
        for (const auto& c : cookies) {
            cookie_array.push_back(to_json(c));
            if (!c.domain_.empty()) {
                domains.insert(c.domain_);
            }
        }

        nlohmann::ordered_json doc;
        doc["saved_at"] = string_utils::iso8601_utc(std::chrono::system_clock::now());
        doc["cookies"] = std::move(cookie_array);
        doc["cookie_count"] = cookies.size();
        doc["domains"] = domains;
        doc["current_url"] = current_url ? nlohmann::ordered_json(*current_url) : nlohmann::ordered_json(nullptr);
        doc["name"] = name;

        const auto path = path_for(name);
        try {
            write_atomic(path, doc.dump(2));
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to save session %s: %s", name.c_str(), e.what());
            return StoreError{.kind_ = StoreErrorKind::IO_FAILURE, .message_ = e.what()};
        }

        LOG_INFO("Session saved: %s (%zu cookies)", path.c_str(), cookies.size());
        return path;
    }

    SessionRecord SessionStore::parse_record(const std::filesystem::path& p) {
        auto loaded = simdjson::padded_string::load(p.string());
        if (loaded.error() != simdjson::error_code::SUCCESS) {
            throw std::runtime_error("read failed: " + p.string() + ": " + simdjson::error_message(loaded.error()));
        }
        const simdjson::padded_string json = std::move(loaded).value_unsafe();

        simdjson::ondemand::parser parser;
        simdjson::ondemand::document doc;
        if (auto error = parser.iterate(json).get(doc); error != simdjson::error_code::SUCCESS) {
            throw CorruptRecordError(std::string("not a JSON document: ") + simdjson::error_message(error));
        }

        SessionRecord record;
        record.saved_at_ = std::string(required(doc["saved_at"].get_string(), "saved_at"));

        simdjson::ondemand::array raw_cookies = required(doc["cookies"].get_array(), "cookies");
        for (auto raw_cookie : raw_cookies) {
            record.cookies_.push_back(parse_cookie(required(raw_cookie.get_object(), "cookies[]")));
        }

        const int64_t count = required(doc["cookie_count"].get_int64(), "cookie_count");
        if (count < 0 || static_cast<size_t>(count) != record.cookies_.size()) {
            throw CorruptRecordError("cookie_count " + std::to_string(count) + " does not match " + std::to_string(record.cookies_.size()) + " stored cookies");
        }
        record.cookie_count_ = static_cast<size_t>(count);

        simdjson::ondemand::array raw_domains = required(doc["domains"].get_array(), "domains");
        for (auto raw_domain : raw_domains) {
            record.domains_.emplace_back(required(raw_domain.get_string(), "domains[]"));
        }

        simdjson::ondemand::value raw_url;
        if (doc["current_url"].get(raw_url) == simdjson::error_code::SUCCESS && !required(raw_url.is_null(), "current_url")) {
            record.current_url_ = std::string(required(raw_url.get_string(), "current_url"));
        }

        record.name_ = std::string(required(doc["name"].get_string(), "name"));
        return record;
    }

    LoadResult SessionStore::load(const std::string& name) const {
        if (!is_valid_name(name)) {
            return StoreError{.kind_ = StoreErrorKind::INVALID_NAME, .message_ = "invalid session name: '" + name + "'"};
        }

        const auto path = path_for(name);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            LOG_WARN("Session not found: %s", name.c_str());
            return StoreError{.kind_ = StoreErrorKind::NOT_FOUND, .message_ = "session not found: " + name};
        }

        try {
            SessionRecord record = parse_record(path);
            LOG_INFO("Session loaded: %s (%zu cookies)", name.c_str(), record.cookie_count_);
            return record;
        } catch (const CorruptRecordError& e) {
            LOG_ERROR("Corrupt session %s: %s", name.c_str(), e.what());
            return StoreError{.kind_ = StoreErrorKind::CORRUPT_RECORD, .message_ = e.what()};
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to load session %s: %s", name.c_str(), e.what());
            return StoreError{.kind_ = StoreErrorKind::IO_FAILURE, .message_ = e.what()};
        }
    }

    std::set<std::string> SessionStore::list() const {
        std::set<std::string> names;

        std::error_code ec;
        for (std::filesystem::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
            const auto& p = it->path();
            if (!it->is_regular_file(ec) || p.extension() != constants::SESSION_FILE_EXT) {
                continue;
            }
            const std::string stem = p.stem().string();
            if (is_valid_name(stem)) {
                names.insert(stem);
            }
        }
        if (ec) {
            LOG_WARN("Listing %s stopped early: %s", directory_.c_str(), ec.message().c_str());
        }

        return names;
    }

    std::vector<SessionInfo> SessionStore::list_details() const {
        std::vector<SessionInfo> details;

        for (const auto& name : list()) {
            auto loaded = load(name);
            if (const auto* error = std::get_if<StoreError>(&loaded)) {
                LOG_WARN("Skipping session %s: %s", name.c_str(), error->message_.c_str());
                continue;
            }
            const auto& record = std::get<SessionRecord>(loaded);
            details.push_back(SessionInfo{
                .name_ = name,
                .cookie_count_ = record.cookie_count_,
                .current_url_ = record.current_url_,
                .saved_at_ = record.saved_at_,
            });
        }

        return details;
    }

    bool SessionStore::remove(const std::string& name) const {
        if (!is_valid_name(name)) {
            return false;
        }

        std::error_code ec;
        const bool removed = std::filesystem::remove(path_for(name), ec);
        if (ec) {
            LOG_WARN("Failed to delete session %s: %s", name.c_str(), ec.message().c_str());
            return false;
        }
        if (removed) {
            LOG_INFO("Session deleted: %s", name.c_str());
        }
        return removed;
    }
}  // namespace session
