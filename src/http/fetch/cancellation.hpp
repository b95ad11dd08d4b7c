#ifndef UNSAFE_FETCH_CANCELLATION_HPP
#define UNSAFE_FETCH_CANCELLATION_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace http::fetch {
    // Shared by every in-flight fetch of one context; cancel() is sticky.
    class CancellationToken {
       public:
        void cancel() {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                cancelled_ = true;
            }
            cv_.notify_all();
        }

        [[nodiscard]] bool is_cancelled() const { return cancelled_.load(); }

        // Returns false when woken early by cancel().
        bool wait_for(std::chrono::milliseconds delay) {
            std::unique_lock<std::mutex> lock(mutex_);
            return !cv_.wait_for(lock, delay, [this]() { return cancelled_.load(); });
        }

       private:
        std::atomic<bool> cancelled_ = false;
        std::mutex mutex_;
        std::condition_variable cv_;
    };
}  // namespace http::fetch

#endif
