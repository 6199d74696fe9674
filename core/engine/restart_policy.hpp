#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>

#include "engine_config.hpp"
#include "logging/logger.hpp"

namespace wordserve {
namespace engine {

// RestartPolicy tracks crash-restart attempts for the engine process.
// Implements exponential backoff and a circuit breaker: after max_attempts
// consecutive unexpected exits no further automatic restart is allowed until
// record_success() is called.
class RestartPolicy {
public:
    // Immutable snapshot of restart state, safe for cross-thread reads
    struct Snapshot {
        bool enabled = false;
        int attempt_count = 0;
        int max_attempts = 0;
        bool circuit_open = false;
        std::optional<int64_t> next_restart_in_ms;  // nullopt: healthy or circuit open
        int64_t uptime_ms = 0;                      // 0 before the first successful start
    };

    RestartPolicy(const RestartPolicyConfig &config, logging::LoggerPtr logger);

    // Record an unexpected exit.
    // Returns the delay before the next restart attempt (base * 2^attempts, then
    // attempts is incremented), or nullopt when the policy is disabled or the
    // attempt budget is spent (circuit breaker opens).
    std::optional<int> record_crash();

    // Delay for the nth restart attempt (1-based)
    int backoff_for_attempt(int attempt) const;

    // Record a confirmed recovery - resets attempt count and closes circuit breaker
    void record_success();

    // Process is up again; starts the stability window used by should_mark_recovered
    void record_started();

    // True once an automatically restarted process has stayed up for success_reset_ms
    bool should_mark_recovered() const;

    bool is_circuit_open() const;
    int attempt_count() const;
    bool enabled() const;
    int success_reset_ms() const;

    void update_config(const RestartPolicyConfig &config);

    Snapshot snapshot() const;

private:
    struct RestartState {
        int attempt_count = 0;                                    // Consecutive unexpected exits
        bool circuit_open = false;                                // True when max attempts exceeded
        std::chrono::steady_clock::time_point next_restart_time;  // Earliest time for next restart
        std::chrono::steady_clock::time_point process_start_time;
    };

    mutable std::mutex mutex_;
    RestartPolicyConfig config_;
    RestartState state_;
    logging::LoggerPtr logger_;

    int backoff_locked(int attempt) const;
};

}  // namespace engine
}  // namespace wordserve
