#include "src/session/session_store.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

#include "fakes/temp_dir.hpp"

using session::Cookie;
using session::SessionRecord;
using session::SessionStore;
using session::StoreError;
using session::StoreErrorKind;

namespace {
    std::vector<Cookie> sample_cookies() {
        return {
            Cookie{.name_ = "sid", .value_ = "abc123", .domain_ = ".example.com", .path_ = "/", .expires_ = 1893456000, .http_only_ = true, .secure_ = true,
                   .same_site_ = "Lax"},
            Cookie{.name_ = "pref", .value_ = "dark", .domain_ = "app.example.org", .path_ = "/settings", .expires_ = -1, .http_only_ = false,
                   .secure_ = false, .same_site_ = "None"},
            Cookie{.name_ = "csrf", .value_ = "t0k3n", .domain_ = ".example.com", .path_ = "/", .expires_ = 1893456000.5, .http_only_ = false,
                   .secure_ = true, .same_site_ = "Strict"},
        };
    }

    class SessionStoreTest : public ::testing::Test {
       protected:
        fakes::TempDir dir_;
        SessionStore store_{dir_.path() / "sessions"};
    };
}  // namespace

TEST_F(SessionStoreTest, SaveThenLoadRoundTrips) {
    const auto cookies = sample_cookies();

    auto saved = store_.save(cookies, std::string("https://example.com/dashboard"), "work");
    ASSERT_TRUE(std::holds_alternative<std::filesystem::path>(saved));
    EXPECT_EQ(std::get<std::filesystem::path>(saved), dir_.path() / "sessions" / "work.json");

    auto loaded = store_.load("work");
    ASSERT_TRUE(std::holds_alternative<SessionRecord>(loaded));
    const auto& record = std::get<SessionRecord>(loaded);

    EXPECT_EQ(record.name_, "work");
    EXPECT_EQ(record.cookies_, cookies);
    EXPECT_EQ(record.cookie_count_, cookies.size());
    EXPECT_EQ(record.domains_, (std::vector<std::string>{".example.com", "app.example.org"}));
    ASSERT_TRUE(record.current_url_.has_value());
    EXPECT_EQ(*record.current_url_, "https://example.com/dashboard");
    EXPECT_EQ(record.saved_at_.back(), 'Z');
}

TEST_F(SessionStoreTest, SaveWithoutCurrentUrlStoresNull) {
    ASSERT_TRUE(std::holds_alternative<std::filesystem::path>(store_.save({}, std::nullopt, "empty")));

    auto loaded = store_.load("empty");
    ASSERT_TRUE(std::holds_alternative<SessionRecord>(loaded));
    const auto& record = std::get<SessionRecord>(loaded);
    EXPECT_FALSE(record.current_url_.has_value());
    EXPECT_EQ(record.cookie_count_, 0u);
    EXPECT_TRUE(record.domains_.empty());
}

TEST_F(SessionStoreTest, SaveOverwritesExistingSession) {
    ASSERT_TRUE(std::holds_alternative<std::filesystem::path>(store_.save(sample_cookies(), std::nullopt, "dup")));
    ASSERT_TRUE(std::holds_alternative<std::filesystem::path>(store_.save({sample_cookies()[1]}, std::nullopt, "dup")));

    const auto& record = std::get<SessionRecord>(store_.load("dup"));
    EXPECT_EQ(record.cookie_count_, 1u);
    EXPECT_EQ(store_.list(), (std::set<std::string>{"dup"}));
}

TEST_F(SessionStoreTest, LoadMissingIsNotFound) {
    auto loaded = store_.load("nope");
    ASSERT_TRUE(std::holds_alternative<StoreError>(loaded));
    EXPECT_EQ(std::get<StoreError>(loaded).kind_, StoreErrorKind::NOT_FOUND);
}

TEST_F(SessionStoreTest, RemoveIsIdempotent) {
    ASSERT_TRUE(std::holds_alternative<std::filesystem::path>(store_.save(sample_cookies(), std::nullopt, "gone")));

    EXPECT_TRUE(store_.remove("gone"));
    EXPECT_FALSE(store_.remove("gone"));
    EXPECT_FALSE(store_.remove("never-existed"));
    EXPECT_TRUE(store_.list().empty());
}

TEST_F(SessionStoreTest, ListReturnsSessionNamesOnly) {
    ASSERT_TRUE(std::holds_alternative<std::filesystem::path>(store_.save({}, std::nullopt, "alpha")));
    ASSERT_TRUE(std::holds_alternative<std::filesystem::path>(store_.save({}, std::nullopt, "beta")));
    std::ofstream(dir_.path() / "sessions" / "notes.txt") << "not a session";
    std::ofstream(dir_.path() / "sessions" / "alpha.json.1.tmp") << "{}";

    EXPECT_EQ(store_.list(), (std::set<std::string>{"alpha", "beta"}));
}

TEST_F(SessionStoreTest, ListDetailsSkipsCorruptRecords) {
    ASSERT_TRUE(std::holds_alternative<std::filesystem::path>(store_.save(sample_cookies(), std::string("https://example.com/"), "good")));
    std::ofstream(dir_.path() / "sessions" / "bad.json") << "{ truncated";

    const auto details = store_.list_details();

    ASSERT_EQ(details.size(), 1u);
    EXPECT_EQ(details[0].name_, "good");
    EXPECT_EQ(details[0].cookie_count_, 3u);
    EXPECT_EQ(details[0].current_url_, std::optional<std::string>("https://example.com/"));
}

TEST_F(SessionStoreTest, MismatchedCookieCountIsCorrupt) {
    ASSERT_TRUE(std::holds_alternative<std::filesystem::path>(store_.save(sample_cookies(), std::nullopt, "tampered")));

    const auto path = dir_.path() / "sessions" / "tampered.json";
    nlohmann::json doc;
    {
        std::ifstream in(path);
        doc = nlohmann::json::parse(in);
    }
    doc["cookie_count"] = 7;
    std::ofstream(path, std::ios::trunc) << doc.dump(2);

    auto loaded = store_.load("tampered");
    ASSERT_TRUE(std::holds_alternative<StoreError>(loaded));
    EXPECT_EQ(std::get<StoreError>(loaded).kind_, StoreErrorKind::CORRUPT_RECORD);
}

TEST_F(SessionStoreTest, MalformedJsonIsCorrupt) {
    std::ofstream(dir_.path() / "sessions" / "broken.json") << "[1, 2";

    auto loaded = store_.load("broken");
    ASSERT_TRUE(std::holds_alternative<StoreError>(loaded));
    EXPECT_EQ(std::get<StoreError>(loaded).kind_, StoreErrorKind::CORRUPT_RECORD);
}

TEST_F(SessionStoreTest, NamesCannotEscapeTheDirectory) {
    for (const std::string name : {"", "../escape", "a/b", ".hidden", "back\\slash"}) {
        auto saved = store_.save({}, std::nullopt, name);
        ASSERT_TRUE(std::holds_alternative<StoreError>(saved)) << name;
        EXPECT_EQ(std::get<StoreError>(saved).kind_, StoreErrorKind::INVALID_NAME) << name;

        auto loaded = store_.load(name);
        ASSERT_TRUE(std::holds_alternative<StoreError>(loaded)) << name;
        EXPECT_EQ(std::get<StoreError>(loaded).kind_, StoreErrorKind::INVALID_NAME) << name;

        EXPECT_FALSE(store_.remove(name)) << name;
    }
    EXPECT_FALSE(std::filesystem::exists(dir_.path() / "escape.json"));
}

TEST_F(SessionStoreTest, MinimalCookiesLoadWithDefaults) {
    std::ofstream(dir_.path() / "sessions" / "s1.json") << R"({
        "saved_at": "2025-11-01T12:30:45.000000Z",
        "cookies": [{"domain": "example.com", "name": "x", "value": "1"}],
        "cookie_count": 1,
        "domains": ["example.com"],
        "current_url": "https://example.com",
        "name": "s1"
    })";

    auto loaded = store_.load("s1");
    ASSERT_TRUE(std::holds_alternative<SessionRecord>(loaded)) << std::get<StoreError>(loaded).message_;
    const auto& record = std::get<SessionRecord>(loaded);

    EXPECT_EQ(record.cookie_count_, 1u);
    EXPECT_EQ(record.domains_, std::vector<std::string>{"example.com"});
    EXPECT_EQ(record.current_url_, std::optional<std::string>("https://example.com"));

    ASSERT_EQ(record.cookies_.size(), 1u);
    const Cookie& c = record.cookies_[0];
    EXPECT_EQ(c.name_, "x");
    EXPECT_EQ(c.value_, "1");
    EXPECT_EQ(c.path_, "/");
    EXPECT_EQ(c.expires_, -1);
    EXPECT_FALSE(c.http_only_);
    EXPECT_FALSE(c.secure_);
    EXPECT_EQ(c.same_site_, "Lax");
}

TEST_F(SessionStoreTest, CookieWithoutDomainIsCorrupt) {
    std::ofstream(dir_.path() / "sessions" / "nodomain.json") << R"({
        "saved_at": "2025-11-01T12:30:45.000000Z",
        "cookies": [{"name": "x", "value": "1"}],
        "cookie_count": 1,
        "domains": [],
        "name": "nodomain"
    })";

    auto loaded = store_.load("nodomain");
    ASSERT_TRUE(std::holds_alternative<StoreError>(loaded));
    EXPECT_EQ(std::get<StoreError>(loaded).kind_, StoreErrorKind::CORRUPT_RECORD);
}

TEST_F(SessionStoreTest, FailedSaveLeavesNoTempFile) {
    // A directory in the record's place makes the final rename fail.
    std::filesystem::create_directories(dir_.path() / "sessions" / "blocked.json" / "inner");

    auto saved = store_.save(sample_cookies(), std::nullopt, "blocked");
    ASSERT_TRUE(std::holds_alternative<StoreError>(saved));
    EXPECT_EQ(std::get<StoreError>(saved).kind_, StoreErrorKind::IO_FAILURE);

    for (const auto& entry : std::filesystem::directory_iterator(dir_.path() / "sessions")) {
        EXPECT_NE(entry.path().extension(), ".tmp") << entry.path();
    }
}
