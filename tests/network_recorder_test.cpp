#include "src/network/network_recorder.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <thread>

#include "fakes/fake_transport.hpp"
#include "fakes/temp_dir.hpp"
#include "src/network/engine_tracing.hpp"

using network::NetworkRecorder;
using network::RequestEvent;
using network::ResponseEvent;

namespace {
    const std::chrono::system_clock::time_point T0{std::chrono::seconds(1'700'000'000)};

    RequestEvent request(network::CorrelationId id, const std::string& url) {
        return RequestEvent{.id_ = id, .timestamp_ = T0, .method_ = "GET", .url_ = url, .headers_ = {{"accept", "*/*"}}, .resource_type_ = "document"};
    }

    ResponseEvent response(network::CorrelationId id, const std::string& url, long status) {
        return ResponseEvent{.id_ = id, .timestamp_ = T0, .url_ = url, .status_ = status, .headers_ = {{"content-type", "text/html"}}};
    }
}  // namespace

TEST(NetworkRecorderTest, SummaryCountsAndFailures) {
    NetworkRecorder recorder;
    recorder.record_request(request(1, "https://a.test/"));
    recorder.record_response(response(1, "https://a.test/", 200));
    recorder.record_request(request(2, "https://b.test/"));
    recorder.record_response(response(2, "https://b.test/", 503));

    auto failed = response(3, "https://c.test/", 0);
    failed.error_ = "ConnectionFailure: refused";
    recorder.record_response(failed);

    const auto summary = recorder.summary();
    EXPECT_EQ(summary.total_requests_, 2u);
    EXPECT_EQ(summary.total_responses_, 3u);
    EXPECT_EQ(summary.failed_responses_, 2u);
    ASSERT_EQ(summary.recent_responses_.size(), 3u);
    EXPECT_TRUE(summary.recent_responses_[0].ok_);
    EXPECT_FALSE(summary.recent_responses_[1].ok_);
}

TEST(NetworkRecorderTest, SummaryKeepsMostRecentEntries) {
    NetworkRecorder recorder;
    for (int i = 0; i < 15; ++i) {
        recorder.record_request(request(0, "https://site.test/" + std::to_string(i)));
    }

    const auto summary = recorder.summary(10);
    EXPECT_EQ(summary.total_requests_, 15u);
    ASSERT_EQ(summary.recent_requests_.size(), 10u);
    EXPECT_EQ(summary.recent_requests_.front().url_, "https://site.test/5");
    EXPECT_EQ(summary.recent_requests_.back().url_, "https://site.test/14");
}

TEST(NetworkRecorderTest, ClearThenSummaryIsEmpty) {
    NetworkRecorder recorder;
    recorder.record_request(request(1, "https://a.test/"));
    recorder.record_response(response(1, "https://a.test/", 404));

    recorder.clear();

    const auto summary = recorder.summary();
    EXPECT_EQ(summary.total_requests_, 0u);
    EXPECT_EQ(summary.total_responses_, 0u);
    EXPECT_EQ(summary.failed_responses_, 0u);
    EXPECT_TRUE(summary.recent_requests_.empty());
    EXPECT_TRUE(summary.recent_responses_.empty());
}

TEST(NetworkRecorderTest, DisabledRecorderIgnoresEvents) {
    NetworkRecorder recorder;
    recorder.set_enabled(false);
    recorder.record_request(request(1, "https://a.test/"));
    recorder.record_response(response(1, "https://a.test/", 200));

    EXPECT_EQ(recorder.summary().total_requests_, 0u);
    EXPECT_EQ(recorder.summary().total_responses_, 0u);
}

TEST(NetworkRecorderTest, CapacityBoundsBufferButNotTotals) {
    NetworkRecorder recorder(3);
    for (int i = 0; i < 5; ++i) {
        recorder.record_request(request(0, "https://site.test/" + std::to_string(i)));
    }

    const auto summary = recorder.summary(100);
    EXPECT_EQ(summary.total_requests_, 5u);
    ASSERT_EQ(summary.recent_requests_.size(), 3u);
    EXPECT_EQ(summary.recent_requests_.front().url_, "https://site.test/2");
}

TEST(NetworkRecorderTest, ExportIsDeterministicAndLeavesBufferIntact) {
    NetworkRecorder recorder;
    recorder.record_request(request(1, "https://a.test/"));
    recorder.record_response(response(1, "https://a.test/", 200));

    const std::string first = recorder.export_trace();
    const std::string second = recorder.export_trace();

    EXPECT_EQ(first, second);
    EXPECT_EQ(recorder.summary().total_requests_, 1u);
}

TEST(NetworkRecorderTest, ExportHasHarShape) {
    NetworkRecorder recorder;
    recorder.record_request(request(1, "https://a.test/"));
    recorder.record_response(response(1, "https://a.test/", 200));

    const auto har = nlohmann::json::parse(recorder.export_trace());

    EXPECT_EQ(har["log"]["version"], "1.2");
    EXPECT_EQ(har["log"]["creator"]["name"], "unsafe_fetch");
    ASSERT_EQ(har["log"]["entries"].size(), 1u);

    const auto& entry = har["log"]["entries"][0];
    EXPECT_EQ(entry["startedDateTime"], "2023-11-14T22:13:20.000000Z");
    EXPECT_EQ(entry["request"]["method"], "GET");
    EXPECT_EQ(entry["request"]["url"], "https://a.test/");
    EXPECT_EQ(entry["request"]["headers"][0]["name"], "accept");
    EXPECT_EQ(entry["request"]["headers"][0]["value"], "*/*");
    EXPECT_EQ(entry["response"]["status"], 200);
    EXPECT_EQ(entry["response"]["headers"][0]["name"], "content-type");
    EXPECT_FALSE(entry.contains("comment"));
}

TEST(NetworkRecorderTest, CorrelatedEventsPairByIdRegardlessOfOrder) {
    NetworkRecorder recorder;
    recorder.record_request(request(1, "https://slow.test/"));
    recorder.record_request(request(2, "https://fast.test/"));
    recorder.record_response(response(2, "https://fast.test/", 201));
    recorder.record_response(response(1, "https://slow.test/", 202));

    const auto entries = nlohmann::json::parse(recorder.export_trace())["log"]["entries"];

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0]["request"]["url"], "https://slow.test/");
    EXPECT_EQ(entries[0]["response"]["status"], 202);
    EXPECT_EQ(entries[1]["request"]["url"], "https://fast.test/");
    EXPECT_EQ(entries[1]["response"]["status"], 201);
}

TEST(NetworkRecorderTest, UncorrelatedEventsPairByPositionAndAreMarked) {
    NetworkRecorder recorder;
    recorder.record_request(request(0, "https://first.test/"));
    recorder.record_request(request(0, "https://second.test/"));
    recorder.record_response(response(0, "https://first.test/", 200));

    const auto entries = nlohmann::json::parse(recorder.export_trace())["log"]["entries"];

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0]["request"]["url"], "https://first.test/");
    EXPECT_EQ(entries[0]["comment"], "paired by position");
}

TEST(NetworkRecorderTest, ExportToFileWritesTrace) {
    fakes::TempDir dir;
    NetworkRecorder recorder;
    recorder.record_request(request(1, "https://a.test/"));
    recorder.record_response(response(1, "https://a.test/", 200));

    const auto path = dir.path() / "logs" / "network.har";
    recorder.export_trace_to_file(path);

    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    EXPECT_EQ(ss.str(), recorder.export_trace());
}

TEST(NetworkRecorderTest, ExportSurvivesNonUtf8HeaderBytes) {
    NetworkRecorder recorder;
    recorder.record_request(request(1, "https://a.test/report"));
    ResponseEvent resp = response(1, "https://a.test/report", 200);
    resp.headers_["content-disposition"] = "attachment; filename=caf\xE9.txt";
    recorder.record_response(std::move(resp));

    std::string trace;
    ASSERT_NO_THROW(trace = recorder.export_trace());

    const auto har = nlohmann::json::parse(trace);
    const auto& headers = har["log"]["entries"][0]["response"]["headers"];
    bool found = false;
    for (const auto& h : headers) {
        if (h["name"] == "content-disposition") {
            found = true;
            EXPECT_NE(h["value"].get<std::string>().find("\xEF\xBF\xBD"), std::string::npos);
        }
    }
    EXPECT_TRUE(found);
}

TEST(NetworkRecorderTest, FailedExportLeavesNoTempFile) {
    fakes::TempDir dir;
    NetworkRecorder recorder;
    recorder.record_request(request(1, "https://a.test/"));
    recorder.record_response(response(1, "https://a.test/", 200));

    // A non-empty directory in the trace's place makes the final rename fail.
    const auto path = dir.path() / "network.har";
    std::filesystem::create_directories(path / "inner");

    EXPECT_THROW(recorder.export_trace_to_file(path), std::runtime_error);

    auto tmp = path;
    tmp += ".tmp";
    EXPECT_FALSE(std::filesystem::exists(tmp));
}

TEST(NetworkRecorderTest, ConcurrentRecordingLosesNothing) {
    NetworkRecorder recorder(0);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&recorder]() {
            for (int i = 0; i < 250; ++i) {
                const auto id = recorder.next_correlation_id();
                recorder.record_request(request(id, "https://t.test/"));
                recorder.record_response(response(id, "https://t.test/", 200));
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(recorder.summary().total_requests_, 1000u);
    EXPECT_EQ(nlohmann::json::parse(recorder.export_trace())["log"]["entries"].size(), 1000u);
}

TEST(EngineTracingTest, EveryAttemptIsRecorded) {
    auto script = std::make_shared<fakes::Script>();
    script->push("https://flaky.test/", fakes::fails_with(http::error::ErrorKind::TIMEOUT, "slow"));
    script->push("https://flaky.test/", fakes::ok("done"));

    http::fetch::RetryingFetchEngine engine(fakes::factory_for(script), http::fetch::RetryPolicy{});
    engine.set_sleeper(fakes::RecordingSleeper{}.sleeper());
    NetworkRecorder recorder;
    network::attach_recorder(engine, recorder);

    ASSERT_TRUE(http::model::succeeded(engine.fetch(http::model::FetchRequest{.url_ = "https://flaky.test/"})));

    const auto summary = recorder.summary();
    EXPECT_EQ(summary.total_requests_, 2u);
    EXPECT_EQ(summary.total_responses_, 2u);
    EXPECT_EQ(summary.failed_responses_, 1u);
    ASSERT_EQ(summary.recent_responses_.size(), 2u);
    EXPECT_EQ(summary.recent_responses_[0].status_, 0);
    ASSERT_TRUE(summary.recent_responses_[0].error_.has_value());
    EXPECT_EQ(*summary.recent_responses_[0].error_, "Timeout: slow");
    EXPECT_EQ(summary.recent_responses_[1].status_, 200);
    EXPECT_EQ(summary.recent_requests_[0].id_, summary.recent_responses_[0].id_);
}
