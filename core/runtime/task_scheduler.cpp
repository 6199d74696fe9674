#include "task_scheduler.hpp"

#include <exception>

namespace wordserve {
namespace runtime {

TimerScheduler::TimerScheduler(std::string name, logging::LoggerPtr logger)
    : name_(std::move(name)), logger_(std::move(logger)) {
    worker_ = std::thread(&TimerScheduler::run, this);
}

TimerScheduler::~TimerScheduler() { stop(); }

IScheduler::TaskId TimerScheduler::schedule_after(std::chrono::milliseconds delay, Task task) {
    if (delay.count() < 0) {
        delay = std::chrono::milliseconds(0);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
        return 0;
    }

    TaskId id = next_id_++;
    auto due = Clock::now() + delay;
    queue_.emplace(Key{due, id}, std::move(task));
    index_.emplace(id, due);
    cv_.notify_one();
    return id;
}

bool TimerScheduler::cancel(TaskId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(id);
    if (it == index_.end()) {
        return false;
    }
    queue_.erase(Key{it->second, id});
    index_.erase(it);
    return true;
}

void TimerScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && !worker_.joinable()) {
            return;
        }
        stopping_ = true;
        queue_.clear();
        index_.clear();
    }
    cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }
}

size_t TimerScheduler::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void TimerScheduler::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (queue_.empty()) {
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            continue;
        }

        auto next = queue_.begin();
        auto due = next->first.first;
        if (Clock::now() < due) {
            cv_.wait_until(lock, due);
            continue;  // queue may have changed
        }

        Task task = std::move(next->second);
        index_.erase(next->first.second);
        queue_.erase(next);

        lock.unlock();
        try {
            task();
        } catch (const std::exception &e) {
            LOG_ERROR(*logger_, "[Scheduler:" << name_ << "] Task threw: " << e.what());
        }
        lock.lock();
    }
}

}  // namespace runtime
}  // namespace wordserve
