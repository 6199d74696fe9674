#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>

#include "logging/logger.hpp"

namespace wordserve {
namespace runtime {

struct AutoRespawnConfig {
    bool enabled = true;
    int request_threshold = 4000;     // Successful requests before a proactive restart
    int time_threshold_minutes = 120;  // Whole minutes since the last respawn
};

// AutoRespawnPolicy proactively restarts a long-running engine.
// Counts successful requests and, once the request or time threshold is
// reached, invokes the respawn callback. Counters reset only when the callback
// reports success; failures are logged and retried on the next request.
class AutoRespawnPolicy {
public:
    using Clock = std::chrono::steady_clock;
    using RespawnCallback = std::function<bool()>;
    using TimeSource = std::function<Clock::time_point()>;  // defaults to Clock::now

    struct Stats {
        int request_count = 0;
        int64_t minutes_since_last_respawn = 0;
    };

    AutoRespawnPolicy(const AutoRespawnConfig &config, RespawnCallback callback, logging::LoggerPtr logger,
                      TimeSource now = nullptr);

    // Count one successful request; may run the callback on the calling thread.
    // Returns true if a respawn was attempted.
    bool on_successful_request();

    // Zero the counter and restart the clock (explicit restart succeeded)
    void reset();

    void update_config(const AutoRespawnConfig &config);
    AutoRespawnConfig config() const;
    Stats stats() const;

private:
    mutable std::mutex mutex_;
    AutoRespawnConfig config_;
    RespawnCallback callback_;
    logging::LoggerPtr logger_;
    TimeSource now_;

    int request_count_ = 0;
    Clock::time_point last_respawn_time_;
    bool respawn_in_progress_ = false;

    int64_t minutes_since_last_respawn_locked() const;
};

}  // namespace runtime
}  // namespace wordserve
