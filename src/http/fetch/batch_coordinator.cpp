#include "batch_coordinator.hpp"

#include <algorithm>
#include <future>
#include <memory>
#include <stdexcept>

#include "../../utils/logging.hpp"

namespace http::fetch {
    BatchCoordinator::BatchCoordinator(RetryingFetchEngine* engine, BatchOptions options) : engine_(engine), options_(options) {
        if (engine_ == nullptr) {
            throw std::invalid_argument("BatchCoordinator requires an engine");
        }
    }

    std::vector<http::model::FetchResult> BatchCoordinator::batch_fetch(const std::vector<std::string>& urls, const http::model::FetchRequest& prototype) const {
        std::vector<http::model::FetchResult> results;
        if (urls.empty()) {
            return results;
        }

        LOG_INFO("Batch fetching %zu URLs", urls.size());

        const size_t workers = options_.max_in_flight_ == 0 ? urls.size() : std::min(options_.max_in_flight_, urls.size());
        std::unique_ptr<concurrency::ThreadPool> pool;
        try {
            pool = std::make_unique<concurrency::ThreadPool>(workers, options_.launcher_);
        } catch (const std::exception& e) {
            LOG_ERROR("Batch could not start %zu workers: %s", workers, e.what());
            results.reserve(urls.size());
            for (const auto& url : urls) {
                results.emplace_back(http::model::FetchFailure{
                    .kind_ = http::error::ErrorKind::CLIENT_PROTOCOL_FAILURE,
                    .message_ = std::string("could not start worker threads: ") + e.what(),
                    .url_ = url,
                });
            }
            return results;
        }

        std::vector<std::future<http::model::FetchResult>> pending;
        pending.reserve(urls.size());

        for (const auto& url : urls) {
            http::model::FetchRequest req = prototype;
            req.url_ = url;
            pending.push_back(pool->submit([engine = engine_, req = std::move(req)]() { return engine->fetch(req); }));
        }

        results.reserve(urls.size());
        for (size_t i = 0; i < pending.size(); ++i) {
            try {
                results.push_back(pending[i].get());
            } catch (const std::exception& e) {
                results.emplace_back(http::model::FetchFailure{
                    .kind_ = http::error::ErrorKind::CLIENT_PROTOCOL_FAILURE,
                    .message_ = e.what(),
                    .url_ = urls[i],
                });
            }
        }

        const auto ok = std::ranges::count_if(results, [](const auto& r) { return http::model::succeeded(r); });
        LOG_INFO("Batch complete: %lld/%zu successful", static_cast<long long>(ok), results.size());

        return results;
    }
}  // namespace http::fetch
