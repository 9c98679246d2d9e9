#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

namespace resolvit {

    /// Runs one-shot delayed tasks on a single background thread.
    /// Tasks run without the scheduler lock held, so a task may schedule or cancel others.
    /// The thread shares its state with the scheduler, so a task may also drop the last owner.
    class DeferredScheduler {
      public:
        using TaskId = uint64_t;
        using Clock = std::chrono::steady_clock;

        DeferredScheduler() : state_(std::make_shared<State>()) { thread_ = std::thread(&DeferredScheduler::run, state_); }

        ~DeferredScheduler() { stop(); }

        DeferredScheduler(const DeferredScheduler &) = delete;
        DeferredScheduler &operator=(const DeferredScheduler &) = delete;

        /// Process-wide instance, created on first use
        inline static std::shared_ptr<DeferredScheduler> shared() {
            static std::shared_ptr<DeferredScheduler> instance = std::make_shared<DeferredScheduler>();
            return instance;
        }

        TaskId scheduleOnce(std::function<void()> task, std::chrono::milliseconds delay) {
            std::lock_guard<std::mutex> lock(state_->mutex);
            TaskId id = state_->next_id++;
            state_->tasks.emplace(id, Entry{Clock::now() + delay, std::move(task)});
            state_->cv.notify_one();
            return id;
        }

        /// True when the task was removed before it started running
        bool cancel(TaskId id) {
            std::lock_guard<std::mutex> lock(state_->mutex);
            return state_->tasks.erase(id) > 0;
        }

        size_t pending() {
            std::lock_guard<std::mutex> lock(state_->mutex);
            return state_->tasks.size();
        }

        void stop() {
            std::map<TaskId, Entry> dropped;
            {
                std::lock_guard<std::mutex> lock(state_->mutex);
                if (!state_->running)
                    return;
                state_->running = false;
                dropped.swap(state_->tasks);
            }
            state_->cv.notify_all();
            if (thread_.joinable()) {
                // A task releasing the last owner would otherwise join its own thread
                if (thread_.get_id() == std::this_thread::get_id()) {
                    thread_.detach();
                } else {
                    thread_.join();
                }
            }
        }

      private:
        struct Entry {
            Clock::time_point due;
            std::function<void()> task;
        };

        struct State {
            std::map<TaskId, Entry> tasks;
            std::mutex mutex;
            std::condition_variable cv;
            bool running = true;
            TaskId next_id = 1;
        };

        static void run(std::shared_ptr<State> state) {
            std::unique_lock<std::mutex> lock(state->mutex);
            while (state->running) {
                if (state->tasks.empty()) {
                    state->cv.wait(lock);
                    continue;
                }

                auto next = state->tasks.begin();
                for (auto it = state->tasks.begin(); it != state->tasks.end(); ++it) {
                    if (it->second.due < next->second.due)
                        next = it;
                }

                auto now = Clock::now();
                if (next->second.due > now) {
                    state->cv.wait_until(lock, next->second.due);
                    continue;
                }

                auto task = std::move(next->second.task);
                state->tasks.erase(next);
                lock.unlock();
                task();
                // The task object may own the scheduler; release it before touching shared state again
                task = nullptr;
                lock.lock();
            }
        }

        std::shared_ptr<State> state_;
        std::thread thread_;
    };

} // namespace resolvit
