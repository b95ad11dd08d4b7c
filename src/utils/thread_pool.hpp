#ifndef UNSAFE_FETCH_THREAD_POOL_HPP
#define UNSAFE_FETCH_THREAD_POOL_HPP

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace concurrency {
    // Starts one worker thread; may throw std::system_error like std::thread itself.
    using ThreadLauncher = std::function<std::thread(std::function<void()>)>;

    ThreadLauncher default_launcher();

    class ThreadPool {
       public:
        // Throws if any worker fails to start; workers already running are joined first.
        explicit ThreadPool(size_t num_threads, ThreadLauncher launcher = default_launcher());

        ~ThreadPool();
        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;
        ThreadPool(ThreadPool&&) = delete;
        ThreadPool& operator=(ThreadPool&&) = delete;

        void enqueue(std::function<void()> next_task);

        // The returned future carries the task's value or the exception it threw.
        template <typename F>
        auto submit(F&& task) -> std::future<std::invoke_result_t<F>> {
            using R = std::invoke_result_t<F>;
            auto packaged = std::make_shared<std::packaged_task<R()>>(std::forward<F>(task));
            std::future<R> result = packaged->get_future();
            enqueue([packaged]() { (*packaged)(); });
            return result;
        }

        void wait_all();

        [[nodiscard]] size_t size() const { return threads_.size(); }

       private:
        void worker_loop();
        void stop_and_join();

        std::vector<std::thread> threads_;
        std::queue<std::function<void()> > tasks_;
        std::mutex queue_mutex_;
        std::condition_variable condition_variable_;
        std::atomic<bool> stop_ = false;
        std::atomic<size_t> active_tasks_ = 0;
        std::condition_variable completion_cv_;
    };
}  // namespace concurrency

#endif
