#include "auto_respawn_policy.hpp"

#include <exception>

namespace wordserve {
namespace runtime {

AutoRespawnPolicy::AutoRespawnPolicy(const AutoRespawnConfig &config, RespawnCallback callback,
                                     logging::LoggerPtr logger, TimeSource now)
    : config_(config),
      callback_(std::move(callback)),
      logger_(std::move(logger)),
      now_(now ? std::move(now) : TimeSource([] { return Clock::now(); })),
      last_respawn_time_(now_()) {}

bool AutoRespawnPolicy::on_successful_request() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!config_.enabled) {
            return false;
        }

        request_count_++;
        if (respawn_in_progress_) {
            return false;
        }

        if (request_count_ >= config_.request_threshold) {
            LOG_DEBUG(*logger_, "[AutoRespawn] Request threshold reached (" << request_count_ << "/"
                                                                           << config_.request_threshold << ")");
        } else if (minutes_since_last_respawn_locked() >= config_.time_threshold_minutes) {
            LOG_DEBUG(*logger_, "[AutoRespawn] Time threshold reached (" << minutes_since_last_respawn_locked() << "/"
                                                                        << config_.time_threshold_minutes
                                                                        << " minutes)");
        } else {
            return false;
        }
        respawn_in_progress_ = true;
    }

    bool success = false;
    try {
        success = callback_ && callback_();
    } catch (const std::exception &e) {
        LOG_ERROR(*logger_, "[AutoRespawn] Respawn threw: " << e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    respawn_in_progress_ = false;
    if (success) {
        request_count_ = 0;
        last_respawn_time_ = now_();
        LOG_INFO(*logger_, "[AutoRespawn] Engine respawned");
    } else {
        LOG_WARN(*logger_, "[AutoRespawn] Failed to respawn engine");
    }
    return true;
}

void AutoRespawnPolicy::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    request_count_ = 0;
    last_respawn_time_ = now_();
}

void AutoRespawnPolicy::update_config(const AutoRespawnConfig &config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
}

AutoRespawnConfig AutoRespawnPolicy::config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

AutoRespawnPolicy::Stats AutoRespawnPolicy::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Stats stats;
    stats.request_count = request_count_;
    stats.minutes_since_last_respawn = minutes_since_last_respawn_locked();
    return stats;
}

int64_t AutoRespawnPolicy::minutes_since_last_respawn_locked() const {
    return std::chrono::duration_cast<std::chrono::minutes>(now_() - last_respawn_time_).count();
}

}  // namespace runtime
}  // namespace wordserve
