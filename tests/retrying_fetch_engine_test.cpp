#include "src/http/fetch/retrying_fetch_engine.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>

#include "fakes/fake_transport.hpp"
#include "fakes/temp_dir.hpp"

using namespace std::chrono_literals;
using http::error::ErrorKind;
using http::fetch::RetryingFetchEngine;
using http::fetch::RetryPolicy;

namespace {
    const std::string URL = "https://example.test/page";

    class RetryingFetchEngineTest : public ::testing::Test {
       protected:
        std::unique_ptr<RetryingFetchEngine> make_engine(RetryPolicy policy = RetryPolicy{}) {
            auto engine = std::make_unique<RetryingFetchEngine>(fakes::factory_for(script_), policy);
            engine->set_sleeper(sleeper_.sleeper());
            return engine;
        }

        static http::model::FetchRequest request(const std::string& url = URL) { return http::model::FetchRequest{.url_ = url}; }

        static std::string read_file(const std::filesystem::path& p) {
            std::ifstream in(p, std::ios::binary);
            std::stringstream ss;
            ss << in.rdbuf();
            return ss.str();
        }

        std::shared_ptr<fakes::Script> script_ = std::make_shared<fakes::Script>();
        fakes::RecordingSleeper sleeper_;
    };
}  // namespace

TEST(BackoffDelayTest, DoublesFromBaseDelay) {
    const RetryPolicy policy{.max_retries_ = 5, .retry_delay_ = 1000ms, .max_delay_ = 30'000ms};
    EXPECT_EQ(http::fetch::backoff_delay(policy, 0), 1000ms);
    EXPECT_EQ(http::fetch::backoff_delay(policy, 1), 2000ms);
    EXPECT_EQ(http::fetch::backoff_delay(policy, 2), 4000ms);
}

TEST(BackoffDelayTest, UncappedByDefault) {
    const RetryPolicy policy{.max_retries_ = 7, .retry_delay_ = 1000ms};
    EXPECT_EQ(http::fetch::backoff_delay(policy, 5), 32'000ms);

    std::chrono::milliseconds total{0};
    for (size_t i = 0; i + 1 < policy.max_retries_; ++i) {
        total += http::fetch::backoff_delay(policy, i);
    }
    EXPECT_EQ(total, 63'000ms);
}

TEST(BackoffDelayTest, SaturatesInsteadOfOverflowing) {
    const RetryPolicy policy{.max_retries_ = 3, .retry_delay_ = 1000ms};
    EXPECT_GT(http::fetch::backoff_delay(policy, 200), http::fetch::backoff_delay(policy, 30));
}

TEST(BackoffDelayTest, OptionalCapAtMaxDelay) {
    const RetryPolicy policy{.max_retries_ = 10, .retry_delay_ = 1000ms, .max_delay_ = 5000ms};
    EXPECT_EQ(http::fetch::backoff_delay(policy, 3), 5000ms);
    EXPECT_EQ(http::fetch::backoff_delay(policy, 60), 5000ms);
}

TEST_F(RetryingFetchEngineTest, SuccessOnFirstAttempt) {
    script_->push(URL, fakes::ok("hello"));
    auto engine = make_engine();

    auto result = engine->fetch(request());

    ASSERT_TRUE(http::model::succeeded(result));
    const auto& s = std::get<http::model::FetchSuccess>(result);
    EXPECT_EQ(s.status_, 200);
    EXPECT_EQ(s.content_, "hello");
    EXPECT_EQ(s.size_, 5u);
    EXPECT_EQ(s.attempts_, 1u);
    EXPECT_FALSE(s.ssl_verified_);
    EXPECT_TRUE(sleeper_.delays_->empty());
}

TEST_F(RetryingFetchEngineTest, TimeoutsExhaustRetriesWithExponentialBackoff) {
    script_->push(URL, fakes::fails_with(ErrorKind::TIMEOUT, "timed out"));
    auto engine = make_engine(RetryPolicy{.max_retries_ = 3, .retry_delay_ = 1000ms, .max_delay_ = 30'000ms});

    auto result = engine->fetch(request());

    ASSERT_FALSE(http::model::succeeded(result));
    const auto& f = std::get<http::model::FetchFailure>(result);
    EXPECT_EQ(f.kind_, ErrorKind::TIMEOUT);
    EXPECT_EQ(f.attempts_, 3u);
    EXPECT_EQ(f.message_, "timed out");
    EXPECT_EQ(script_->calls(URL), 3u);
    ASSERT_EQ(sleeper_.delays_->size(), 2u);
    EXPECT_EQ(sleeper_.total(), 3000ms);
}

TEST_F(RetryingFetchEngineTest, RecoversAfterTransientFailure) {
    script_->push(URL, fakes::fails_with(ErrorKind::CONNECTION_FAILURE));
    script_->push(URL, fakes::ok("second time lucky"));
    auto engine = make_engine();

    auto result = engine->fetch(request());

    ASSERT_TRUE(http::model::succeeded(result));
    EXPECT_EQ(std::get<http::model::FetchSuccess>(result).attempts_, 2u);
    ASSERT_EQ(sleeper_.delays_->size(), 1u);
    EXPECT_EQ(sleeper_.delays_->front(), 1000ms);
}

TEST_F(RetryingFetchEngineTest, ServerErrorIsNotRetried) {
    script_->push(URL, fakes::ok("internal error details", 500));
    auto engine = make_engine();

    auto result = engine->fetch(request());

    ASSERT_FALSE(http::model::succeeded(result));
    const auto& f = std::get<http::model::FetchFailure>(result);
    EXPECT_EQ(f.kind_, ErrorKind::HTTP_STATUS_FAILURE);
    ASSERT_TRUE(f.http_status_.has_value());
    EXPECT_EQ(*f.http_status_, 500);
    EXPECT_EQ(f.attempts_, 1u);
    EXPECT_EQ(f.message_, "HTTP 500: internal error details");
    EXPECT_EQ(script_->calls(URL), 1u);
    EXPECT_TRUE(sleeper_.delays_->empty());
}

TEST_F(RetryingFetchEngineTest, ErrorBodyPreviewIsTruncated) {
    script_->push(URL, fakes::ok(std::string(500, 'x'), 404));
    auto engine = make_engine();

    auto result = engine->fetch(request());

    const auto& f = std::get<http::model::FetchFailure>(result);
    EXPECT_EQ(f.message_, "HTTP 404: " + std::string(200, 'x'));
}

TEST_F(RetryingFetchEngineTest, Latin1BodyIsTranscoded) {
    script_->push(URL, fakes::ok(std::string("caf\xE9", 4)));
    auto engine = make_engine();

    auto result = engine->fetch(request());

    const auto& s = std::get<http::model::FetchSuccess>(result);
    EXPECT_EQ(s.content_, "caf\xC3\xA9");
    EXPECT_EQ(s.size_, 4u);
}

TEST_F(RetryingFetchEngineTest, UnexpectedExceptionBecomesClientProtocolFailure) {
    int calls = 0;
    auto engine = std::make_unique<RetryingFetchEngine>(
        [&calls]() -> std::unique_ptr<http::client::ITransport> {
            ++calls;
            throw std::runtime_error("no handles left");
        },
        RetryPolicy{});

    auto result = engine->fetch(request());

    const auto& f = std::get<http::model::FetchFailure>(result);
    EXPECT_EQ(f.kind_, ErrorKind::CLIENT_PROTOCOL_FAILURE);
    EXPECT_NE(f.message_.find("no handles left"), std::string::npos);
    EXPECT_EQ(calls, 1);
}

TEST_F(RetryingFetchEngineTest, NonStandardExceptionBecomesClientProtocolFailure) {
    class ThrowingTransport : public http::client::ITransport {
       public:
        http::client::ResponseHead perform(const http::model::FetchRequest&, http::client::IResponseSink&, const http::fetch::CancellationToken*) override {
            throw 42;
        }
    };

    auto engine = std::make_unique<RetryingFetchEngine>([]() -> std::unique_ptr<http::client::ITransport> { return std::make_unique<ThrowingTransport>(); },
                                                        RetryPolicy{.max_retries_ = 2, .retry_delay_ = 10ms});
    engine->set_sleeper(sleeper_.sleeper());

    auto result = engine->fetch(request());

    ASSERT_FALSE(http::model::succeeded(result));
    const auto& f = std::get<http::model::FetchFailure>(result);
    EXPECT_EQ(f.kind_, ErrorKind::CLIENT_PROTOCOL_FAILURE);
    EXPECT_EQ(f.message_, "unknown exception");
    EXPECT_EQ(f.attempts_, 2u);
}

TEST_F(RetryingFetchEngineTest, CancelledBeforeFirstAttempt) {
    script_->push(URL, fakes::ok("never seen"));
    auto engine = make_engine();
    engine->cancellation()->cancel();

    auto result = engine->fetch(request());

    const auto& f = std::get<http::model::FetchFailure>(result);
    EXPECT_EQ(f.kind_, ErrorKind::CANCELLED);
    EXPECT_EQ(f.attempts_, 0u);
    EXPECT_EQ(script_->calls(URL), 0u);
}

TEST_F(RetryingFetchEngineTest, CancelledDuringBackoffStopsRetrying) {
    script_->push(URL, fakes::fails_with(ErrorKind::TIMEOUT));
    sleeper_.keep_going_ = false;
    auto engine = make_engine();

    auto result = engine->fetch(request());

    const auto& f = std::get<http::model::FetchFailure>(result);
    EXPECT_EQ(f.kind_, ErrorKind::CANCELLED);
    EXPECT_EQ(f.attempts_, 1u);
    EXPECT_EQ(script_->calls(URL), 1u);
}

TEST_F(RetryingFetchEngineTest, DefaultSleeperWakesOnCancel) {
    script_->push(URL, fakes::fails_with(ErrorKind::TIMEOUT));
    auto cancel = std::make_shared<http::fetch::CancellationToken>();
    RetryingFetchEngine engine(fakes::factory_for(script_), RetryPolicy{.max_retries_ = 3, .retry_delay_ = 60'000ms, .max_delay_ = 60'000ms}, cancel);

    std::thread canceller([cancel]() {
        std::this_thread::sleep_for(50ms);
        cancel->cancel();
    });

    const auto started = std::chrono::steady_clock::now();
    auto result = engine.fetch(request());
    canceller.join();

    EXPECT_EQ(std::get<http::model::FetchFailure>(result).kind_, ErrorKind::CANCELLED);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 30s);
}

TEST_F(RetryingFetchEngineTest, ObserverSeesEveryAttemptAndItsExceptionsAreIgnored) {
    script_->push(URL, fakes::fails_with(ErrorKind::CONNECTION_FAILURE, "refused"));
    script_->push(URL, fakes::ok("fine"));
    auto engine = make_engine();

    std::vector<http::fetch::AttemptRecord> seen;
    engine->set_attempt_observer([&seen](const http::fetch::AttemptRecord& record) {
        seen.push_back(record);
        throw std::runtime_error("observer bug");
    });

    auto result = engine->fetch(request());

    ASSERT_TRUE(http::model::succeeded(result));
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].attempt_index_, 0u);
    ASSERT_TRUE(seen[0].error_.has_value());
    EXPECT_EQ(*seen[0].error_, ErrorKind::CONNECTION_FAILURE);
    EXPECT_FALSE(seen[0].response_.has_value());
    EXPECT_EQ(seen[1].attempt_index_, 1u);
    EXPECT_FALSE(seen[1].error_.has_value());
    ASSERT_TRUE(seen[1].response_.has_value());
    EXPECT_EQ(seen[1].response_->status_, 200);
}

TEST_F(RetryingFetchEngineTest, ObserverThrowingNonStandardValueDoesNotChangeOutcome) {
    script_->push(URL, fakes::ok("fine"));
    auto engine = make_engine();

    size_t notified = 0;
    engine->set_attempt_observer([&notified](const http::fetch::AttemptRecord&) {
        ++notified;
        throw 7;
    });

    auto result = engine->fetch(request());

    ASSERT_TRUE(http::model::succeeded(result));
    EXPECT_EQ(std::get<http::model::FetchSuccess>(result).content_, "fine");
    EXPECT_EQ(notified, 1u);
}

TEST_F(RetryingFetchEngineTest, FetchJsonParsesBody) {
    script_->push(URL, fakes::ok(R"({"items": [1, 2, 3]})"));
    auto engine = make_engine();

    auto result = engine->fetch_json(request());

    ASSERT_TRUE(http::model::succeeded(result));
    const auto& s = std::get<http::fetch::JsonFetchSuccess>(result);
    EXPECT_EQ(s.json_["items"].size(), 3u);
}

TEST_F(RetryingFetchEngineTest, FetchJsonReportsParseFailureDistinctly) {
    script_->push(URL, fakes::ok("<html>not json</html>"));
    auto engine = make_engine();

    auto result = engine->fetch_json(request());

    const auto& f = std::get<http::model::FetchFailure>(result);
    EXPECT_EQ(f.kind_, ErrorKind::PARSE_FAILURE);
    EXPECT_EQ(f.message_.rfind("JSON parse error: ", 0), 0u);
    EXPECT_EQ(f.attempts_, 1u);
}

TEST_F(RetryingFetchEngineTest, DownloadWritesFileAndReportsProgressPerChunk) {
    fakes::TempDir dir;
    const std::string payload(20'000, 'a');
    auto response = fakes::ok(payload);
    response.chunk_size_ = 3000;
    script_->push(URL, response);

    auto progress = std::make_shared<fakes::RecordingProgress>();
    auto engine = make_engine();
    engine->set_progress_reporter(progress);

    const auto dest = dir.path() / "nested" / "file.bin";
    auto result = engine->download(http::model::DownloadRequest{.fetch_ = request(), .destination_ = dest, .show_progress_ = true});

    ASSERT_TRUE(http::model::succeeded(result));
    const auto& s = std::get<http::model::DownloadSuccess>(result);
    EXPECT_EQ(s.bytes_written_, payload.size());
    EXPECT_EQ(read_file(dest), payload);

    // 8 KiB chunks: 8192 + 8192 + 3616
    const auto updates = progress->updates();
    ASSERT_EQ(updates.size(), 3u);
    EXPECT_EQ(updates[0].downloaded_bytes_, 8192u);
    EXPECT_EQ(updates[2].downloaded_bytes_, payload.size());
    EXPECT_EQ(updates[2].total_bytes_, payload.size());
    EXPECT_EQ(updates[2].filename_, "file.bin");
}

TEST_F(RetryingFetchEngineTest, DownloadWithoutContentLengthReportsNoProgress) {
    fakes::TempDir dir;
    auto response = fakes::ok(std::string(10'000, 'b'));
    response.declare_length_ = false;
    script_->push(URL, response);

    auto progress = std::make_shared<fakes::RecordingProgress>();
    auto engine = make_engine();
    engine->set_progress_reporter(progress);

    auto result = engine->download(http::model::DownloadRequest{.fetch_ = request(), .destination_ = dir.path() / "f.bin", .show_progress_ = true});

    ASSERT_TRUE(http::model::succeeded(result));
    EXPECT_TRUE(progress->updates().empty());
}

TEST_F(RetryingFetchEngineTest, DownloadErrorStatusLeavesDestinationUntouched) {
    fakes::TempDir dir;
    const auto dest = dir.path() / "keep.txt";
    {
        std::ofstream out(dest);
        out << "previous contents";
    }
    script_->push(URL, fakes::ok("gone", 404));
    auto engine = make_engine();

    auto result = engine->download(http::model::DownloadRequest{.fetch_ = request(), .destination_ = dest});

    ASSERT_FALSE(http::model::succeeded(result));
    const auto& f = std::get<http::model::DownloadFailure>(result);
    EXPECT_EQ(f.failure_.kind_, ErrorKind::HTTP_STATUS_FAILURE);
    EXPECT_EQ(f.output_path_, dest);
    EXPECT_EQ(read_file(dest), "previous contents");
}

TEST_F(RetryingFetchEngineTest, DownloadInterruptedMidStreamLeavesPartialFile) {
    fakes::TempDir dir;
    auto engine = make_engine(RetryPolicy{.max_retries_ = 1, .retry_delay_ = 10ms, .max_delay_ = 10ms});

    auto response = fakes::ok(std::string(32 * 1024, 'c'));
    response.chunk_size_ = 8192;
    int delivered = 0;
    auto cancel = engine->cancellation();
    response.during_transfer_ = [&delivered, cancel]() {
        if (++delivered == 3) {
            cancel->cancel();
        }
    };
    script_->push(URL, response);

    const auto dest = dir.path() / "partial.bin";
    auto result = engine->download(http::model::DownloadRequest{.fetch_ = request(), .destination_ = dest, .show_progress_ = false});

    const auto& f = std::get<http::model::DownloadFailure>(result);
    EXPECT_EQ(f.failure_.kind_, ErrorKind::CANCELLED);
    ASSERT_TRUE(std::filesystem::exists(dest));
    EXPECT_EQ(std::filesystem::file_size(dest), 16u * 1024u);
}

TEST_F(RetryingFetchEngineTest, StatsCountOutcomes) {
    script_->push("https://a.test/", fakes::ok("a"));
    script_->push("https://b.test/", fakes::ok("missing", 404));
    auto engine = make_engine();

    (void)engine->fetch(request("https://a.test/"));
    (void)engine->fetch(request("https://b.test/"));

    const auto stats = engine->stats();
    EXPECT_EQ(stats.fetches_, 2u);
    EXPECT_EQ(stats.attempts_, 2u);
    EXPECT_EQ(stats.successes_, 1u);
    EXPECT_EQ(stats.failures_, 1u);
}

TEST(RetryingFetchEngineConstruction, RejectsZeroAttempts) {
    auto script = std::make_shared<fakes::Script>();
    EXPECT_THROW(RetryingFetchEngine(fakes::factory_for(script), RetryPolicy{.max_retries_ = 0}), std::invalid_argument);
}

TEST(RetryingFetchEngineConstruction, RejectsMissingFactory) { EXPECT_THROW(RetryingFetchEngine(nullptr, RetryPolicy{}), std::invalid_argument); }
