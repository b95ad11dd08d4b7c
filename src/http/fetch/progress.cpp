#include "progress.hpp"

#include <algorithm>
#include <array>
#include <string>

namespace http::fetch {
    namespace {
        constexpr int BAR_LENGTH = 40;
        constexpr double BYTES_PER_MB = 1024.0 * 1024.0;
        constexpr double MS_PER_S = 1000.0;
    }  // namespace

    ConsoleProgressBar::ConsoleProgressBar(std::FILE* out) : out_(out) {}

    std::string ConsoleProgressBar::render(const DownloadProgress& progress) {
        const double percent =
            progress.total_bytes_ > 0 ? std::min(100.0, 100.0 * static_cast<double>(progress.downloaded_bytes_) / static_cast<double>(progress.total_bytes_)) : 0.0;

        const double seconds = static_cast<double>(progress.elapsed_.count()) / MS_PER_S;
        const double speed = seconds > 0 ? static_cast<double>(progress.downloaded_bytes_) / seconds : 0.0;

        const int filled = static_cast<int>(BAR_LENGTH * percent / 100.0);
        std::string bar(static_cast<size_t>(filled), '#');
        bar.append(static_cast<size_t>(BAR_LENGTH - filled), '.');

        std::array<char, 256> line{};
        std::snprintf(line.data(), line.size(), "Downloading %s: [%s] %.1f%% (%.2f/%.2f MB) @ %.2f MB/s", progress.filename_.c_str(), bar.c_str(), percent,
                      static_cast<double>(progress.downloaded_bytes_) / BYTES_PER_MB, static_cast<double>(progress.total_bytes_) / BYTES_PER_MB,
                      speed / BYTES_PER_MB);
        return line.data();
    }

    void ConsoleProgressBar::update(const DownloadProgress& progress) {
        const std::string line = render(progress);

        std::lock_guard<std::mutex> lock(mutex_);
        std::fprintf(out_, "\r%s", line.c_str());
        if (progress.downloaded_bytes_ >= progress.total_bytes_) {
            std::fprintf(out_, "\n");
        }
        std::fflush(out_);
    }
}  // namespace http::fetch
