#include "restart_policy.hpp"

#include <algorithm>
#include <limits>

namespace wordserve {
namespace engine {

namespace {
constexpr int kMaxBackoffShift = 20;
}  // namespace

RestartPolicy::RestartPolicy(const RestartPolicyConfig &config, logging::LoggerPtr logger)
    : config_(config), logger_(std::move(logger)) {}

int RestartPolicy::backoff_locked(int attempt) const {
    const int shift = std::min(std::max(attempt - 1, 0), kMaxBackoffShift);
    const int64_t delay = static_cast<int64_t>(std::max(config_.base_backoff_ms, 0)) << shift;
    // Saturate; a negative delay would make the scheduler fire immediately
    return static_cast<int>(std::min<int64_t>(delay, std::numeric_limits<int>::max()));
}

int RestartPolicy::backoff_for_attempt(int attempt) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backoff_locked(attempt);
}

std::optional<int> RestartPolicy::record_crash() {
    std::lock_guard<std::mutex> lock(mutex_);

    // Crash ends the current uptime window
    state_.process_start_time = std::chrono::steady_clock::time_point{};

    if (!config_.enabled) {
        state_.circuit_open = true;
        LOG_INFO(*logger_, "[Supervisor] Engine crashed (restart policy disabled)");
        return std::nullopt;
    }

    if (state_.attempt_count >= config_.max_attempts) {
        state_.circuit_open = true;
        LOG_ERROR(*logger_, "[Supervisor] Engine crashed (circuit breaker open, exhausted "
                                << config_.max_attempts << " restart attempts)");
        return std::nullopt;
    }

    state_.attempt_count++;
    int backoff_ms = backoff_locked(state_.attempt_count);
    state_.next_restart_time = std::chrono::steady_clock::now() + std::chrono::milliseconds(backoff_ms);

    LOG_WARN(*logger_, "[Supervisor] Engine crashed (attempt " << state_.attempt_count << "/" << config_.max_attempts
                                                              << ", retry in " << backoff_ms << "ms)");
    return backoff_ms;
}

void RestartPolicy::record_success() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_.attempt_count > 0) {
        LOG_INFO(*logger_, "[Supervisor] Engine recovered (after " << state_.attempt_count << " restart attempts)");
    }

    state_.attempt_count = 0;
    state_.circuit_open = false;
    state_.next_restart_time = std::chrono::steady_clock::time_point{};
}

void RestartPolicy::record_started() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.process_start_time = std::chrono::steady_clock::now();
}

bool RestartPolicy::should_mark_recovered() const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!config_.enabled || state_.circuit_open || state_.attempt_count == 0) {
        return false;
    }
    if (state_.process_start_time == std::chrono::steady_clock::time_point{}) {
        return false;
    }

    const auto stable_for = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                                  state_.process_start_time)
                                .count();
    return stable_for >= config_.success_reset_ms;
}

bool RestartPolicy::is_circuit_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.circuit_open;
}

int RestartPolicy::attempt_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.attempt_count;
}

bool RestartPolicy::enabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.enabled;
}

int RestartPolicy::success_reset_ms() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.success_reset_ms;
}

void RestartPolicy::update_config(const RestartPolicyConfig &config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
}

RestartPolicy::Snapshot RestartPolicy::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = std::chrono::steady_clock::now();

    Snapshot snap;
    snap.enabled = config_.enabled;
    snap.attempt_count = state_.attempt_count;
    snap.max_attempts = config_.max_attempts;
    snap.circuit_open = state_.circuit_open;

    if (state_.circuit_open || state_.attempt_count == 0) {
        snap.next_restart_in_ms = std::nullopt;
    } else if (now >= state_.next_restart_time) {
        snap.next_restart_in_ms = int64_t{0};
    } else {
        snap.next_restart_in_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(state_.next_restart_time - now).count();
    }

    if (state_.process_start_time != std::chrono::steady_clock::time_point{}) {
        snap.uptime_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(now - state_.process_start_time).count();
    }
    return snap;
}

}  // namespace engine
}  // namespace wordserve
