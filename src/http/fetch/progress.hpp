#ifndef UNSAFE_FETCH_PROGRESS_HPP
#define UNSAFE_FETCH_PROGRESS_HPP

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>

namespace http::fetch {
    struct DownloadProgress {
        std::string url_;
        std::string filename_;
        std::uint64_t total_bytes_{0};
        std::uint64_t downloaded_bytes_{0};
        std::chrono::milliseconds elapsed_{0};
    };

    class IProgressReporter {
       public:
        IProgressReporter() = default;
        virtual ~IProgressReporter() = default;
        IProgressReporter(const IProgressReporter&) = delete;
        IProgressReporter& operator=(const IProgressReporter&) = delete;
        IProgressReporter(IProgressReporter&&) = delete;
        IProgressReporter& operator=(IProgressReporter&&) = delete;

        virtual void update(const DownloadProgress& progress) = 0;
    };

    // Single-line bar on a terminal stream, e.g.
    // Downloading x.bin: [#########...........] 45.0% (0.44/0.98 MB) @ 1.20 MB/s
    class ConsoleProgressBar : public IProgressReporter {
       public:
        explicit ConsoleProgressBar(std::FILE* out = stderr);

        void update(const DownloadProgress& progress) override;

        [[nodiscard]] static std::string render(const DownloadProgress& progress);

       private:
        std::FILE* out_;
        std::mutex mutex_;
    };
}  // namespace http::fetch

#endif
