#pragma once

#include <atomic>
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

namespace resolvit {

    /// Fixed-size pool of worker threads executing queued tasks in FIFO order
    class WorkerPool {
      public:
        explicit WorkerPool(size_t threads) : stop_(false), active_(0), threads_(threads == 0 ? 1 : threads) {
            for (size_t i = 0; i < threads_; i++) {
                workers_.emplace_back([this] { workerLoop(); });
            }
        }

        ~WorkerPool() { shutdown(); }

        WorkerPool(const WorkerPool &) = delete;
        WorkerPool &operator=(const WorkerPool &) = delete;

        template <class F> auto submit(F &&f) -> std::future<std::invoke_result_t<F>> {
            using return_type = std::invoke_result_t<F>;

            auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
            std::future<return_type> res = task->get_future();
            {
                std::unique_lock<std::mutex> lock(mutex_);
                if (stop_) {
                    throw std::runtime_error("submit on stopped WorkerPool");
                }
                tasks_.emplace([task]() { (*task)(); });
            }
            condition_.notify_one();
            return res;
        }

        /// Drain queued tasks and join all workers
        void shutdown() {
            {
                std::unique_lock<std::mutex> lock(mutex_);
                if (stop_)
                    return;
                stop_ = true;
            }
            condition_.notify_all();
            for (std::thread &worker : workers_) {
                if (worker.joinable()) {
                    worker.join();
                }
            }
        }

        size_t threadCount() const { return threads_; }

        int activeTasks() const { return active_.load(); }

        size_t queuedTasks() {
            std::lock_guard<std::mutex> lock(mutex_);
            return tasks_.size();
        }

      private:
        void workerLoop() {
            while (true) {
                std::function<void()> task;
                {
                    std::unique_lock<std::mutex> lock(mutex_);
                    condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
                    if (stop_ && tasks_.empty())
                        return;
                    task = std::move(tasks_.front());
                    tasks_.pop();
                }
                active_++;
                task();
                active_--;
            }
        }

        std::vector<std::thread> workers_;
        std::queue<std::function<void()>> tasks_;
        std::mutex mutex_;
        std::condition_variable condition_;
        bool stop_;
        std::atomic<int> active_;
        size_t threads_;
    };

} // namespace resolvit
