#ifndef UNSAFE_FETCH_ENGINE_TRACING_HPP
#define UNSAFE_FETCH_ENGINE_TRACING_HPP

#include "../http/fetch/retrying_fetch_engine.hpp"
#include "network_recorder.hpp"

namespace network {
    inline constexpr const char* ENGINE_RESOURCE_TYPE = "fetch";

    // Every attempt becomes one correlated request/response pair. The recorder must outlive the engine.
    void attach_recorder(http::fetch::RetryingFetchEngine& engine, NetworkRecorder& recorder);
}  // namespace network

#endif
