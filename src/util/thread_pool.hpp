#ifndef TOKENVAULT_UTIL_THREAD_POOL_HPP
#define TOKENVAULT_UTIL_THREAD_POOL_HPP

#include <algorithm>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

/**
 * @file thread_pool.hpp
 * @brief A fixed-size worker pool. The batch coordinator uses it to run the
 *        detection and span resolution of several documents at once.
 *
 * Usage Example:
 *  @code
 *    tokenvault::util::ThreadPool pool(4);
 *    auto fut = pool.enqueue([&] { return detector.detect(text, types); });
 *    auto entities = fut.get(); // rethrows whatever the task threw
 *  @endcode
 */

namespace tokenvault {
namespace util {

/**
 * @class ThreadPool
 * @brief A basic fixed-size thread pool.
 *
 * - Constructor spawns the worker threads.
 * - enqueue(...) schedules a callable and returns a std::future for its result.
 *   Exceptions thrown by the callable are stored in the future.
 * - Destructor drains the queue and joins every worker.
 */
class ThreadPool
{
public:
    /**
     * @param threadCount Number of worker threads. Zero means hardware concurrency.
     */
    explicit ThreadPool(size_t threadCount = 0)
        : stop_(false)
    {
        if (threadCount == 0) {
            threadCount = std::max<size_t>(1, std::thread::hardware_concurrency());
        }
        workers_.reserve(threadCount);
        for (size_t i = 0; i < threadCount; ++i) {
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

    size_t threadCount() const { return workers_.size(); }

    /**
     * @brief Enqueue a callable for asynchronous execution.
     * @throw std::runtime_error if the pool is shutting down.
     */
    template<typename F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>>
    {
        using return_type = std::invoke_result_t<std::decay_t<F>>;

        auto taskPtr = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
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

private:
    void workerLoop()
    {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queueMutex_);
                condVar_.wait(lock, [this] { return !taskQueue_.empty() || stop_; });
                if (stop_ && taskQueue_.empty()) {
                    return;
                }
                task = std::move(taskQueue_.front());
                taskQueue_.pop();
            }
            // packaged_task captures exceptions into the future
            task();
        }
    }

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> taskQueue_;
    std::mutex queueMutex_;
    std::condition_variable condVar_;
    bool stop_;
};

} // namespace util
} // namespace tokenvault

#endif // TOKENVAULT_UTIL_THREAD_POOL_HPP
