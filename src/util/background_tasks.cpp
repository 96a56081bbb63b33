/**
 * SHOTGATE - Signed Screenshot Gateway
 * Background Tasks Implementation
 */

#include "util/background_tasks.hpp"
#include "util/logger.hpp"

#include <boost/asio/post.hpp>

#include <exception>

namespace shotgate::util {

BackgroundTasks::BackgroundTasks(std::size_t thread_count)
    : pool_(thread_count > 0 ? thread_count : 1)
{
}

BackgroundTasks::~BackgroundTasks() {
    shutdown();
}

bool BackgroundTasks::submit(std::string name, Task task) {
    if (!accepting_.load()) {
        SHOTGATE_LOG_WARN(log_component::Server,
                          "Background task '{}' rejected: shutting down", name);
        return false;
    }

    pending_.fetch_add(1);

    boost::asio::post(pool_, [this, name = std::move(name), task = std::move(task)]() {
        bool ok = true;
        try {
            task();
        } catch (const std::exception& e) {
            ok = false;
            SHOTGATE_LOG_ERROR(log_component::Server,
                               "Background task '{}' failed: {}", name, e.what());
        }
        finish_one(ok);
    });

    return true;
}

bool BackgroundTasks::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(idle_mutex_);
    return idle_cv_.wait_for(lock, timeout, [this]() { return pending_.load() == 0; });
}

void BackgroundTasks::shutdown(bool run_pending) {
    if (!accepting_.exchange(false)) {
        return;
    }

    if (!run_pending) {
        SHOTGATE_LOG_WARN(log_component::Server, "Dropping {} queued background tasks", pending_.load());
        pool_.stop();
    }
    // join() runs everything already posted before returning, unless stopped
    pool_.join();

    SHOTGATE_LOG_DEBUG(log_component::Server,
                       "Background tasks stopped: completed={}, failed={}",
                       completed_.load(), failed_.load());
}

void BackgroundTasks::finish_one(bool ok) {
    if (ok) {
        completed_.fetch_add(1);
    } else {
        failed_.fetch_add(1);
    }

    {
        std::lock_guard<std::mutex> lock(idle_mutex_);
        pending_.fetch_sub(1);
    }
    idle_cv_.notify_all();
}

} // namespace shotgate::util
