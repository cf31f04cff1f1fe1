#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace geoharvest {

    // Fixed set of workers draining a FIFO queue. The destructor finishes queued work before joining.
    class ThreadPool {
      private:
        std::vector<std::thread> workers_;
        std::queue<std::function<void()>> tasks_;
        std::mutex mutex_;
        std::condition_variable cv_;
        bool stop_ = false;

      public:
        explicit ThreadPool(std::size_t threads);
        ~ThreadPool();

        ThreadPool(const ThreadPool &) = delete;
        ThreadPool &operator=(const ThreadPool &) = delete;

        template <typename F> auto enqueue(F &&f) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
            using R = std::invoke_result_t<std::decay_t<F>>;
            auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
            std::future<R> res = task->get_future();
            {
                std::unique_lock<std::mutex> lock(mutex_);
                if (stop_)
                    throw std::runtime_error("ThreadPool::enqueue(): pool is stopped");
                tasks_.emplace([task]() { (*task)(); });
            }
            cv_.notify_one();
            return res;
        }

        std::size_t size() const { return workers_.size(); }
    };

} // namespace geoharvest
