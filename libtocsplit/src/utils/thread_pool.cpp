#include "thread_pool.hpp"
#include "logger.hpp"
#include <string>

ThreadPool::ThreadPool(unsigned threads) {
    if (threads == 0) threads = 1;
    workers_.reserve(threads);
    for (unsigned i = 0; i < threads; ++i) {
        workers_.emplace_back([this](const std::stop_token& st) {
            for (;;) {
                std::function<void(std::stop_token)> task;
                {
                    std::unique_lock lock(queue_mutex_);
                    condition_.wait(lock, st, [this] {
                        return stop_ || !tasks_.empty();
                    });
                    if (st.stop_requested() || (stop_ && tasks_.empty()))
                        return;
                    if (tasks_.empty())
                        continue;
                    task = std::move(tasks_.front());
                    tasks_.pop();
                }
                struct PendingGuard {
                    std::size_t& pending;
                    std::mutex& mtx;
                    std::condition_variable& cv;
                    ~PendingGuard() {
                        std::lock_guard lock(mtx);
                        if (pending > 0) --pending;
                        cv.notify_all();
                    }
                } guard{pending_, queue_mutex_, idle_cv_};
                try {
                    task(st);
                } catch (const std::exception& e) {
                    Logger::log(LogLevel::Error, std::string("Unhandled exception in thread pool: ") + e.what(), "ThreadPool");
                }
            }
        });
    }
}

void ThreadPool::wait_idle() {
    std::unique_lock lock(queue_mutex_);
    idle_cv_.wait(lock, [this] {
        return pending_ == 0 && tasks_.empty();
    });
}

ThreadPool::~ThreadPool() {
    {
        std::unique_lock lock(queue_mutex_);
        stop_ = true;
    }
    condition_.notify_all();
    // join explicitly so the jthread destructor does not request a stop
    // while queued tasks are still draining
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}
