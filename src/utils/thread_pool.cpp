#include "thread_pool.hpp"

#include <condition_variable>
#include <exception>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

#include "logging.hpp"

namespace concurrency {

    ThreadLauncher default_launcher() {
        return [](std::function<void()> body) { return std::thread(std::move(body)); };
    }

    ThreadPool::ThreadPool(size_t num_threads, ThreadLauncher launcher) {
        if (num_threads == 0) {
            throw std::invalid_argument("ThreadPool needs at least one thread");
        }
        if (!launcher) {
            throw std::invalid_argument("ThreadPool needs a thread launcher");
        }

        threads_.reserve(num_threads);

        try {
            for (size_t i = 0; i < num_threads; ++i) {
                threads_.push_back(launcher([this] { worker_loop(); }));
            }
        } catch (const std::exception& e) {
            LOG_ERROR("thread pool could not start worker %zu of %zu: %s", threads_.size() + 1, num_threads, e.what());
            stop_and_join();
            throw;
        }
    }

    ThreadPool::~ThreadPool() { stop_and_join(); }

    void ThreadPool::stop_and_join() {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            stop_ = true;
        }

        condition_variable_.notify_all();

        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }

    void ThreadPool::worker_loop() {
        while (true) {
            std::function<void()> activate_task_from_queue;

            {
                std::unique_lock<std::mutex> lock(queue_mutex_);

                condition_variable_.wait(lock, [this]() { return !tasks_.empty() || stop_; });

                if (stop_ && tasks_.empty()) {
                    return;
                }

                activate_task_from_queue = std::move(tasks_.front());
                tasks_.pop();

                ++active_tasks_;
            }

            // An escaping exception would terminate the worker thread and the process with it.
            try {
                activate_task_from_queue();
            } catch (const std::exception& e) {
                LOG_ERROR("thread pool task failed: %s", e.what());
            } catch (...) {
                LOG_ERROR("thread pool task failed with a non-standard exception");
            }

            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                --active_tasks_;
            }
            completion_cv_.notify_all();
        }
    }

    void ThreadPool::enqueue(std::function<void()> next_task) {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (stop_) {
                throw std::runtime_error("enqueue on stopped ThreadPool");
            }
            tasks_.emplace(std::move(next_task));
        }

        condition_variable_.notify_one();
    }

    void ThreadPool::wait_all() {
        std::unique_lock<std::mutex> lock(queue_mutex_);

        completion_cv_.wait(lock, [this]() { return tasks_.empty() && active_tasks_ == 0; });
    }
};  // namespace concurrency
