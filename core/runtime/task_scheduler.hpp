#pragma once

/**
 * @file task_scheduler.hpp
 * @brief Delayed task execution on a single dedicated thread
 *
 * The client runs two instances:
 * - a timer scheduler for request timeouts and periodic stale-id cleanup
 *   (tasks are short and never block)
 * - a recovery scheduler on which restarts run (tasks may block for the
 *   length of a spawn + readiness probe)
 *
 * Tasks run outside the internal lock, so a task may schedule or cancel
 * other tasks. Tasks still queued when the scheduler stops are dropped.
 */

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>

#include "logging/logger.hpp"

namespace wordserve {
namespace runtime {

/**
 * @brief Scheduling seam; tests substitute a manually driven implementation
 */
class IScheduler {
public:
    using TaskId = uint64_t;
    using Task = std::function<void()>;

    virtual ~IScheduler() = default;

    /**
     * @brief Run task once after delay
     * @return Id usable with cancel(), 0 if the scheduler no longer accepts tasks
     */
    virtual TaskId schedule_after(std::chrono::milliseconds delay, Task task) = 0;

    /**
     * @brief Remove a task that has not started yet
     * @return true if the task was removed
     */
    virtual bool cancel(TaskId id) = 0;

    TaskId post(Task task) { return schedule_after(std::chrono::milliseconds(0), std::move(task)); }
};

class TimerScheduler : public IScheduler {
public:
    TimerScheduler(std::string name, logging::LoggerPtr logger);
    ~TimerScheduler() override;

    TimerScheduler(const TimerScheduler &) = delete;
    TimerScheduler &operator=(const TimerScheduler &) = delete;

    TaskId schedule_after(std::chrono::milliseconds delay, Task task) override;
    bool cancel(TaskId id) override;

    /**
     * @brief Stop the worker and drop queued tasks. Must not be called from a task.
     */
    void stop();

    size_t pending() const;
    bool on_worker_thread() const { return std::this_thread::get_id() == worker_.get_id(); }

private:
    using Clock = std::chrono::steady_clock;
    using Key = std::pair<Clock::time_point, TaskId>;

    std::string name_;
    logging::LoggerPtr logger_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<Key, Task> queue_;
    std::unordered_map<TaskId, Clock::time_point> index_;
    TaskId next_id_ = 1;
    bool stopping_ = false;
    std::thread worker_;

    void run();
};

}  // namespace runtime
}  // namespace wordserve
