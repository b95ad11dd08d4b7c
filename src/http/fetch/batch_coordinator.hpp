#ifndef UNSAFE_FETCH_BATCH_COORDINATOR_HPP
#define UNSAFE_FETCH_BATCH_COORDINATOR_HPP

#include <string>
#include <vector>

#include "../../utils/thread_pool.hpp"
#include "../model/model.hpp"
#include "retrying_fetch_engine.hpp"

namespace http::fetch {
    struct BatchOptions {
        // 0 runs every URL on its own worker
        size_t max_in_flight_ = 0;
        concurrency::ThreadLauncher launcher_ = concurrency::default_launcher();
    };

    class BatchCoordinator {
       public:
        BatchCoordinator(RetryingFetchEngine* engine, BatchOptions options);

        // result[i] belongs to urls[i]; never throws for a single bad URL.
        [[nodiscard]] std::vector<http::model::FetchResult> batch_fetch(const std::vector<std::string>& urls,
                                                                        const http::model::FetchRequest& prototype = {}) const;

        [[nodiscard]] const BatchOptions& options() const { return options_; }

       private:
        RetryingFetchEngine* engine_;
        BatchOptions options_;
    };
}  // namespace http::fetch

#endif
