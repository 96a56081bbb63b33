/**
 * SHOTGATE - Signed Screenshot Gateway
 * Background Tasks - completion-tracked fire-and-forget work
 *
 * Work submitted here runs on a dedicated Asio thread pool, off the request
 * path. Every task is counted until it finishes so the process can wait for
 * outstanding work (cache population) before it exits.
 */

#ifndef SHOTGATE_UTIL_BACKGROUND_TASKS_HPP
#define SHOTGATE_UTIL_BACKGROUND_TASKS_HPP

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace shotgate::util {

class BackgroundTasks {
public:
    using Task = std::function<void()>;

    explicit BackgroundTasks(std::size_t thread_count = 2);

    /**
     * Waits for pending tasks, then joins the pool
     */
    ~BackgroundTasks();

    BackgroundTasks(const BackgroundTasks&) = delete;
    BackgroundTasks& operator=(const BackgroundTasks&) = delete;

    /**
     * Queue a task. Returns false once shutdown() has been called.
     * A task that throws is logged under its name and still counted as done.
     */
    bool submit(std::string name, Task task);

    /**
     * Block until no task is pending or the timeout expires
     * @return true if the queue drained
     */
    bool wait_idle(std::chrono::milliseconds timeout);

    /**
     * Stop accepting tasks and join the threads
     * @param run_pending false drops queued tasks that have not started
     */
    void shutdown(bool run_pending = true);

    std::size_t pending() const noexcept { return pending_.load(); }
    std::uint64_t completed() const noexcept { return completed_.load(); }
    std::uint64_t failed() const noexcept { return failed_.load(); }

private:
    void finish_one(bool ok);

    boost::asio::thread_pool pool_;
    std::atomic<bool> accepting_{true};
    std::atomic<std::size_t> pending_{0};
    std::atomic<std::uint64_t> completed_{0};
    std::atomic<std::uint64_t> failed_{0};

    std::mutex idle_mutex_;
    std::condition_variable idle_cv_;
};

} // namespace shotgate::util

#endif // SHOTGATE_UTIL_BACKGROUND_TASKS_HPP
