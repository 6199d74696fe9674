#include "request_broker.hpp"

#include <vector>

#include "transport/frame_codec.hpp"

namespace wordserve {
namespace broker {

namespace {

std::future<v1::Response> failed_future(ErrorCode code, const std::string &message) {
    std::promise<v1::Response> promise;
    promise.set_exception(std::make_exception_ptr(EngineError(code, message)));
    return promise.get_future();
}

}  // namespace

const char *request_kind(const v1::Request &request) {
    switch (request.payload_case()) {
        case v1::Request::kComplete:
            return "complete";
        case v1::Request::kConfig:
            return "config";
        case v1::Request::kDictionary:
            return "dictionary";
        default:
            return "empty";
    }
}

RequestBroker::RequestBroker(runtime::IScheduler &timers, logging::LoggerPtr logger, BrokerConfig config)
    : timers_(timers), logger_(std::move(logger)), config_(config) {
    std::lock_guard<std::mutex> lock(mutex_);
    schedule_periodic_cleanup();
}

RequestBroker::~RequestBroker() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        if (cleanup_task_ != 0) {
            timers_.cancel(cleanup_task_);
            cleanup_task_ = 0;
        }
    }
    cancel_all(ErrorCode::CANCELLED, "Request broker destroyed");
}

void RequestBroker::attach_writer(IRequestWriter *writer) {
    std::lock_guard<std::mutex> lock(writer_mutex_);
    writer_ = writer;
}

std::future<v1::Response> RequestBroker::send(v1::Request request, int timeout_ms) {
    std::unique_lock<std::mutex> writer_lock(writer_mutex_);
    if (writer_ == nullptr || !writer_->is_running()) {
        LOG_DEBUG(*logger_, "[Broker] Rejecting " << request_kind(request) << " request: engine not running");
        return failed_future(ErrorCode::NOT_RUNNING, "Engine process not running");
    }

    std::string id;
    std::string frame;
    std::string error;
    std::future<v1::Response> future;
    bool needs_cleanup = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        // Counter ids cannot collide before wrap-around; the bound only guards that case
        bool found = false;
        for (int attempt = 0; attempt < kMaxIdAttempts; ++attempt) {
            id = std::to_string(next_id_++);
            if (pending_.count(id) == 0 && finished_.count(id) == 0) {
                found = true;
                break;
            }
        }
        if (!found) {
            LOG_ERROR(*logger_, "[Broker] Correlation id space exhausted");
            return failed_future(ErrorCode::ID_SPACE_EXHAUSTED, "No free correlation id");
        }

        request.set_id(id);
        if (!transport::encode_frame(request, frame, error)) {
            LOG_ERROR(*logger_, "[Broker] Failed to encode request " << id << ": " << error);
            return failed_future(ErrorCode::WRITE_FAILED, error);
        }

        PendingRequest entry;
        entry.created_at = Clock::now();
        entry.kind = request_kind(request);
        future = entry.promise.get_future();
        entry.timer = timers_.schedule_after(std::chrono::milliseconds(timeout_ms),
                                             [this, id, timeout_ms] { on_timeout(id, timeout_ms); });
        pending_.emplace(id, std::move(entry));
        stats_.sent++;
        needs_cleanup = tracked_locked() > config_.cleanup_threshold;
    }

    bool written = false;
    try {
        written = writer_->write_frame(frame, error);
    } catch (const std::exception &e) {
        error = e.what();
    }
    if (!written) {
        writer_lock.unlock();
        PendingRequest entry;
        bool taken;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            taken = take_pending_locked(id, entry);
            if (taken) {
                stats_.rejected++;
            }
        }
        if (taken) {
            LOG_WARN(*logger_, "[Broker] Write failed for request " << id << ": " << error);
            entry.promise.set_exception(
                std::make_exception_ptr(EngineError(ErrorCode::WRITE_FAILED, "Failed to write request: " + error)));
        }
        return future;
    }
    writer_lock.unlock();

    if (needs_cleanup) {
        cleanup_stale();
    }
    return future;
}

void RequestBroker::on_message(const v1::Response &response) {
    const std::string &id = response.id();
    PendingRequest entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!take_pending_locked(id, entry)) {
            if (finished_.count(id) != 0) {
                stats_.late_responses++;
                LOG_DEBUG(*logger_, "[Broker] Dropping late response for request " << id);
            } else {
                stats_.unknown_responses++;
                LOG_WARN(*logger_, "[Broker] Dropping response for unknown request id '" << id << "'");
            }
            return;
        }
        if (response.has_error()) {
            stats_.rejected++;
        } else {
            stats_.resolved++;
        }
    }

    if (response.has_error()) {
        LOG_DEBUG(*logger_, "[Broker] Engine error for " << entry.kind << " request " << id << ": "
                                                        << response.error().message());
        entry.promise.set_exception(std::make_exception_ptr(
            EngineError(ErrorCode::BACKEND, response.error().message(), response.error().code())));
        return;
    }
    entry.promise.set_value(response);
}

void RequestBroker::on_timeout(const std::string &id, int timeout_ms) {
    PendingRequest entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            return;
        }
        it->second.timer = 0;  // this timer is the one firing
        take_pending_locked(id, entry);
        stats_.timed_out++;
        stats_.rejected++;
    }

    LOG_WARN(*logger_, "[Broker] " << entry.kind << " request " << id << " timed out after " << timeout_ms << "ms");
    entry.promise.set_exception(std::make_exception_ptr(
        EngineError(ErrorCode::TIMEOUT, "Timeout waiting for response (" + std::to_string(timeout_ms) + "ms)")));
}

size_t RequestBroker::cleanup_stale() {
    const auto now = Clock::now();
    const auto cutoff = now - std::chrono::milliseconds(config_.stale_age_ms);
    std::vector<std::pair<std::string, PendingRequest>> aged;
    size_t evicted = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        for (auto it = pending_.begin(); it != pending_.end();) {
            if (it->second.created_at <= cutoff) {
                if (it->second.timer != 0) {
                    timers_.cancel(it->second.timer);
                }
                aged.emplace_back(it->first, std::move(it->second));
                it = pending_.erase(it);
            } else {
                ++it;
            }
        }
        stats_.aged_out += aged.size();
        stats_.rejected += aged.size();
        evicted += aged.size();

        // Over the threshold, also drop the oldest finished ids regardless of age
        size_t keep = finished_.size();
        if (tracked_locked() > config_.cleanup_threshold) {
            keep = config_.cleanup_threshold / 2;
        }
        evicted += evict_finished_locked(cutoff, keep);
    }

    for (auto &item : aged) {
        item.second.promise.set_exception(std::make_exception_ptr(
            EngineError(ErrorCode::AGED_OUT, "Request " + item.first + " aged out of the pending table")));
    }

    if (evicted > 0) {
        LOG_DEBUG(*logger_, "[Broker] Stale cleanup evicted " << evicted << " ids (" << aged.size()
                                                             << " still pending)");
    }
    return evicted;
}

void RequestBroker::cancel_all(ErrorCode code, const std::string &reason) {
    std::unordered_map<std::string, PendingRequest> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &item : pending_) {
            if (item.second.timer != 0) {
                timers_.cancel(item.second.timer);
            }
        }
        drained.swap(pending_);
        finished_.clear();
        finished_order_.clear();
        stats_.rejected += drained.size();
    }

    if (drained.empty()) {
        return;
    }

    LOG_INFO(*logger_, "[Broker] Rejecting " << drained.size() << " pending request(s): " << reason);
    for (auto &item : drained) {
        item.second.promise.set_exception(std::make_exception_ptr(EngineError(code, reason)));
    }
}

size_t RequestBroker::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

size_t RequestBroker::tracked_id_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tracked_locked();
}

bool RequestBroker::is_pending(const std::string &id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.count(id) != 0;
}

RequestBroker::Stats RequestBroker::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void RequestBroker::schedule_periodic_cleanup() {
    if (stopping_ || config_.cleanup_interval_ms <= 0) {
        return;
    }
    cleanup_task_ = timers_.schedule_after(std::chrono::milliseconds(config_.cleanup_interval_ms), [this] {
        cleanup_stale();
        std::lock_guard<std::mutex> lock(mutex_);
        schedule_periodic_cleanup();
    });
}

bool RequestBroker::take_pending_locked(const std::string &id, PendingRequest &out) {
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return false;
    }
    if (it->second.timer != 0) {
        timers_.cancel(it->second.timer);
    }
    out = std::move(it->second);
    pending_.erase(it);
    remember_finished_locked(id, Clock::now());
    return true;
}

void RequestBroker::remember_finished_locked(const std::string &id, Clock::time_point now) {
    if (finished_.insert(id).second) {
        finished_order_.emplace_back(id, now);
    }
}

size_t RequestBroker::evict_finished_locked(Clock::time_point cutoff, size_t keep_at_most) {
    size_t evicted = 0;
    while (!finished_order_.empty() &&
           (finished_order_.front().second <= cutoff || finished_.size() > keep_at_most)) {
        finished_.erase(finished_order_.front().first);
        finished_order_.pop_front();
        evicted++;
    }
    return evicted;
}

}  // namespace broker
}  // namespace wordserve
