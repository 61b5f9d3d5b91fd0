#include "ThreadPool.h"
#include "Logger.h"

#include <exception>

namespace ChatCast {

    ThreadPool::ThreadPool(std::size_t threadCount, std::string name)
        : name_(std::move(name)) {
        if (threadCount == 0) {
            auto hw = std::thread::hardware_concurrency();
            threadCount = hw == 0 ? 1 : hw;
        }

        threadCount_ = threadCount;
        workers_.reserve(threadCount);
        for (std::size_t i = 0; i < threadCount; ++i) {
            workers_.emplace_back(&ThreadPool::workerLoop, this);
        }

        Logger::instance().debug("Started " + std::to_string(threadCount) + " workers", name_);
    }

    ThreadPool::~ThreadPool() {
        shutdown();
    }

    void ThreadPool::shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                return;
            }
            stopping_ = true;
        }

        cv_.notify_all();

        for (auto& t : workers_) {
            if (t.joinable()) {
                t.join();
            }
        }

        workers_.clear();
    }

    bool ThreadPool::submit(std::function<void()> task) {
        std::string name = name_;
        return post([task = std::move(task), name]() {
            try {
                task();
            } catch (const std::exception& e) {
                Logger::instance().error("Task failed: " + std::string(e.what()), name);
            }
        });
    }

    std::size_t ThreadPool::pendingTasks() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_.size();
    }

    bool ThreadPool::post(std::function<void()> task) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                return false;
            }
            tasks_.push(std::move(task));
        }
        cv_.notify_one();
        return true;
    }

    void ThreadPool::workerLoop() {
        for (;;) {
            std::function<void()> task;

            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this]() {
                    return stopping_ || !tasks_.empty();
                });

                // Drain queued work before exiting
                if (stopping_ && tasks_.empty()) {
                    return;
                }

                task = std::move(tasks_.front());
                tasks_.pop();
            }

            if (task) {
                task();
            }
        }
    }

} // namespace ChatCast
