#ifndef PHISCAN_UTIL_THREAD_POOL_HPP
#define PHISCAN_UTIL_THREAD_POOL_HPP

#include <algorithm>
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

/**
 * @file thread_pool.hpp
 * @brief A fixed-size worker pool. Used for batch document detection and by
 *        the remote confidence ranker, whose futures must never block on
 *        destruction (unlike std::async futures).
 *
 * Usage Example:
 *  @code
 *    phiscan::util::ThreadPool pool(4);
 *    auto spans = pool.enqueue([&engine, text] { return engine.detect(text); });
 *    // ...
 *    auto result = spans.get();
 *  @endcode
 */

namespace phiscan {
namespace util {

/**
 * @class ThreadPool
 * @brief A basic fixed-size thread pool implementation.
 *
 * - Constructor spawns a given number of worker threads.
 * - enqueue(...) schedules a task and returns its future.
 * - Destructor drains the queue and joins every worker.
 */
class ThreadPool
{
public:
    /**
     * @param threadCount Number of worker threads. Zero means hardware concurrency.
     */
    explicit ThreadPool(std::size_t threadCount = 0)
        : stop_(false)
    {
        if (threadCount == 0) {
            threadCount = std::max<std::size_t>(1, std::thread::hardware_concurrency());
        }
        workers_.reserve(threadCount);

        for (std::size_t i = 0; i < threadCount; ++i) {
            workers_.emplace_back([this] { workerLoop(); });
        }
    }

    ~ThreadPool()
    {
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            stop_ = true;
        }
        condVar_.notify_all();

        for (auto &worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Enqueue a callable for asynchronous execution.
     * @return A std::future for the callable's result. Exceptions thrown by the
     *         callable are delivered through the future.
     * @throw std::runtime_error when the pool is shutting down.
     */
    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>
    {
        using return_type = typename std::invoke_result<F, Args...>::type;

        auto taskPtr = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<return_type> res = taskPtr->get_future();
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            if (stop_) {
                throw std::runtime_error("ThreadPool: enqueue on stopped pool");
            }
            taskQueue_.emplace([taskPtr]() { (*taskPtr)(); });
        }
        condVar_.notify_one();
        return res;
    }

    std::size_t size() const { return workers_.size(); }

private:
    void workerLoop()
    {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queueMutex_);
                condVar_.wait(lock, [this] {
                    return !taskQueue_.empty() || stop_;
                });

                if (stop_ && taskQueue_.empty()) {
                    return;
                }
                task = std::move(taskQueue_.front());
                taskQueue_.pop();
            }
            task();
        }
    }

    std::vector<std::thread> workers_;               ///< The pool of worker threads
    std::queue<std::function<void()>> taskQueue_;    ///< Pending tasks
    std::mutex queueMutex_;                          ///< Protects taskQueue_ and stop_
    std::condition_variable condVar_;                ///< Signals task readiness
    bool stop_;                                      ///< Pool no longer accepts tasks
};

} // namespace util
} // namespace phiscan

#endif // PHISCAN_UTIL_THREAD_POOL_HPP
