#ifndef UNSAFE_FETCH_SESSION_STORE_HPP
#define UNSAFE_FETCH_SESSION_STORE_HPP

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "cookie.hpp"

namespace session {
    enum class StoreErrorKind { NOT_FOUND, IO_FAILURE, INVALID_NAME, CORRUPT_RECORD };

    [[nodiscard]] const char* to_string(StoreErrorKind kind);

    struct StoreError {
        StoreErrorKind kind_ = StoreErrorKind::IO_FAILURE;
        std::string message_;
    };

    using SaveResult = std::variant<std::filesystem::path, StoreError>;
    using LoadResult = std::variant<SessionRecord, StoreError>;

    // One JSON document per session name under a single directory.
    class SessionStore {
       public:
        explicit SessionStore(std::filesystem::path directory);

        ~SessionStore() = default;
        SessionStore(const SessionStore&) = delete;
        SessionStore& operator=(const SessionStore&) = delete;
        SessionStore(SessionStore&&) = delete;
        SessionStore& operator=(SessionStore&&) = delete;

        // Overwrites any existing session of the same name.
        [[nodiscard]] SaveResult save(const std::vector<Cookie>& cookies, const std::optional<std::string>& current_url, const std::string& name) const;
        [[nodiscard]] LoadResult load(const std::string& name) const;
        [[nodiscard]] std::set<std::string> list() const;
        [[nodiscard]] std::vector<SessionInfo> list_details() const;
        // false when nothing was stored under the name
        bool remove(const std::string& name) const;

        [[nodiscard]] const std::filesystem::path& directory() const { return directory_; }

        // Non-empty, no path separators, no leading dot.
        [[nodiscard]] static bool is_valid_name(std::string_view name);

       private:
        [[nodiscard]] std::filesystem::path path_for(const std::string& name) const;

        static void write_atomic(const std::filesystem::path& p, std::string_view bytes);
        static SessionRecord parse_record(const std::filesystem::path& p);

        std::filesystem::path directory_;
    };
}  // namespace session

#endif
