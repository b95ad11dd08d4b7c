#ifndef UNSAFE_FETCH_CLIENT_INTERFACE_HPP
#define UNSAFE_FETCH_CLIENT_INTERFACE_HPP

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "../fetch/cancellation.hpp"
#include "../model/model.hpp"

namespace http::client {
    struct ResponseHead {
        long status_ = 0;
        std::string effective_url_;
        http::model::Headers headers_;
        std::optional<std::uint64_t> content_length_;
    };

    // Receives one response. on_head() always runs before the first on_body() call,
    // even for empty bodies.
    class IResponseSink {
       public:
        IResponseSink() = default;
        virtual ~IResponseSink() = default;
        IResponseSink(const IResponseSink&) = delete;
        IResponseSink& operator=(const IResponseSink&) = delete;
        IResponseSink(IResponseSink&&) = delete;
        IResponseSink& operator=(IResponseSink&&) = delete;

        virtual void on_head(const ResponseHead& head) = 0;
        // Returning false aborts the transfer with an IO failure.
        virtual bool on_body(std::string_view chunk) = 0;
    };

    class ITransport {
       public:
        ITransport() = default;
        virtual ~ITransport() = default;
        ITransport(const ITransport&) = delete;
        ITransport& operator=(const ITransport&) = delete;
        ITransport(ITransport&&) = delete;
        ITransport& operator=(ITransport&&) = delete;

        // Performs one HTTP GET. Throws http::error::TransportError on transport failure;
        // HTTP error statuses are not failures at this level.
        virtual ResponseHead perform(const http::model::FetchRequest& req, IResponseSink& sink, const http::fetch::CancellationToken* cancel) = 0;
    };

    using TransportFactory = std::function<std::unique_ptr<ITransport>()>;
}  // namespace http::client

#endif
