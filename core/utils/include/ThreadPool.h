#pragma once

#include <vector>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <cstddef>

namespace ChatCast {

    /**
     * @brief Fixed-size worker pool used by the relay to dispatch frames.
     *
     * Each inbound frame becomes one task, so frames of different transfers
     * (even from the same connection) are processed concurrently.
     */
    class ThreadPool {
    public:
        /**
         * @param threadCount Number of workers, 0 = hardware concurrency
         * @param name Component name used when logging task failures
         */
        explicit ThreadPool(std::size_t threadCount, std::string name = "ThreadPool");
        ~ThreadPool();

        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;

        /**
         * @brief Enqueue a task for execution.
         * @return std::future that becomes ready when the task finishes; an
         *         exception thrown by the task is stored in the future.
         */
        template<typename F>
        std::future<void> enqueue(F&& func) {
            using TaskType = std::packaged_task<void()>;

            auto task = std::make_shared<TaskType>(std::forward<F>(func));
            std::future<void> fut = task->get_future();

            if (!post([task]() { (*task)(); })) {
                // Pool stopped: run the task so the future is never left broken.
                (*task)();
            }

            return fut;
        }

        /**
         * @brief Fire-and-forget submission. Exceptions are logged, not rethrown.
         * @return false if the pool is shutting down and the task was dropped
         */
        bool submit(std::function<void()> task);

        /**
         * @brief Gracefully stop all workers and drain the queue.
         */
        void shutdown();

        std::size_t threadCount() const { return threadCount_; }
        std::size_t pendingTasks() const;

    private:
        void workerLoop();
        bool post(std::function<void()> task);

        std::string name_;
        std::size_t threadCount_{0};
        std::vector<std::thread> workers_;
        std::queue<std::function<void()>> tasks_;
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        bool stopping_{false};
    };

} // namespace ChatCast
