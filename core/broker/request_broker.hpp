#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "engine_error.hpp"
#include "logging/logger.hpp"
#include "protocol.pb.h"
#include "runtime/task_scheduler.hpp"

namespace wordserve {
namespace broker {

namespace v1 = wordserve::engine::v1;

// Write side of the engine connection, implemented by ProcessSupervisor
class IRequestWriter {
public:
    virtual ~IRequestWriter() = default;

    virtual bool is_running() const = 0;

    // Write one encoded frame to the engine's stdin
    virtual bool write_frame(const std::string &frame, std::string &error) = 0;
};

struct BrokerConfig {
    int stale_age_ms = 5 * 60 * 1000;     // Pending entries and finished ids older than this are evicted
    int cleanup_interval_ms = 60 * 1000;  // Periodic stale-id sweep
    size_t cleanup_threshold = 1000;      // Tracked ids above this trigger a sweep on send
};

// RequestBroker correlates requests with asynchronous engine responses.
//
// Each send() gets a fresh correlation id and a PendingRequest holding the
// caller's promise and a timeout timer. Responses are matched by id only, so
// arrival order does not matter. Once a request terminates its id is kept in a
// finished set for a grace period so late responses are recognised.
//
// Thread safety: pending_ and the finished set are guarded by mutex_; promises
// are always completed after the entry has been removed and the lock released.
// The timer scheduler must outlive the broker (or be stopped before it).
class RequestBroker {
public:
    struct Stats {
        uint64_t sent = 0;
        uint64_t resolved = 0;
        uint64_t rejected = 0;
        uint64_t timed_out = 0;
        uint64_t aged_out = 0;
        uint64_t late_responses = 0;
        uint64_t unknown_responses = 0;
    };

    RequestBroker(runtime::IScheduler &timers, logging::LoggerPtr logger, BrokerConfig config = {});
    ~RequestBroker();

    RequestBroker(const RequestBroker &) = delete;
    RequestBroker &operator=(const RequestBroker &) = delete;

    // Attach the engine writer; nullptr detaches. Blocks while a send is writing.
    void attach_writer(IRequestWriter *writer);

    // Send a request. The returned future holds the matching Response, or an
    // EngineError (NOT_RUNNING, ID_SPACE_EXHAUSTED, WRITE_FAILED, TIMEOUT,
    // PROCESS_EXIT, AGED_OUT, CANCELLED, BACKEND).
    std::future<v1::Response> send(v1::Request request, int timeout_ms);

    // Route one decoded response to its pending request
    void on_message(const v1::Response &response);

    // Evict entries older than stale_age_ms; pending ones are rejected with AGED_OUT.
    // Returns the number of ids evicted.
    size_t cleanup_stale();

    // Reject everything outstanding with code/reason and forget all ids. Idempotent.
    void cancel_all(ErrorCode code, const std::string &reason);

    size_t pending_count() const;
    size_t tracked_id_count() const;
    bool is_pending(const std::string &id) const;
    Stats stats() const;

private:
    using Clock = std::chrono::steady_clock;

    struct PendingRequest {
        std::promise<v1::Response> promise;
        runtime::IScheduler::TaskId timer = 0;
        Clock::time_point created_at;
        const char *kind = "";
    };

    static constexpr int kMaxIdAttempts = 3;

    runtime::IScheduler &timers_;
    logging::LoggerPtr logger_;
    BrokerConfig config_;

    std::mutex writer_mutex_;
    IRequestWriter *writer_ = nullptr;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, PendingRequest> pending_;
    std::unordered_set<std::string> finished_;
    std::deque<std::pair<std::string, Clock::time_point>> finished_order_;
    uint64_t next_id_ = 1;
    runtime::IScheduler::TaskId cleanup_task_ = 0;
    bool stopping_ = false;
    Stats stats_;

    void on_timeout(const std::string &id, int timeout_ms);
    void schedule_periodic_cleanup();

    // Caller holds mutex_
    bool take_pending_locked(const std::string &id, PendingRequest &out);
    void remember_finished_locked(const std::string &id, Clock::time_point now);
    size_t evict_finished_locked(Clock::time_point cutoff, size_t keep_at_most);
    size_t tracked_locked() const { return pending_.size() + finished_.size(); }
};

const char *request_kind(const v1::Request &request);

}  // namespace broker
}  // namespace wordserve
