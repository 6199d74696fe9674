#pragma once

#include <sys/types.h>

#include <atomic>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "binary_installer.hpp"
#include "broker/engine_error.hpp"
#include "broker/request_broker.hpp"
#include "engine/process_supervisor.hpp"
#include "logging/engine_log_classifier.hpp"
#include "logging/logger.hpp"
#include "runtime/auto_respawn_policy.hpp"
#include "runtime/config.hpp"
#include "runtime/initialization_gate.hpp"
#include "runtime/task_scheduler.hpp"

namespace wordserve {
namespace client {

/**
 * @brief Whole-client lifecycle
 *
 * Uninitialized -> Initializing -> Ready
 * Ready -> Recovering -> Ready | Failed   (timeout or engine death)
 * any -> ShuttingDown -> Terminated       (cleanup)
 *
 * initialize()/restart() from Failed or Terminated starts over.
 */
enum class ClientState { Uninitialized, Initializing, Ready, Recovering, Failed, ShuttingDown, Terminated };

const char *client_state_to_string(ClientState state);

struct Suggestion {
    std::string word;
    int rank = 0;  // 1-based
};

/**
 * @brief Outcome of a control call; never thrown
 */
struct ControlResult {
    bool ok = false;
    std::optional<broker::ErrorCode> error_code;  // set when the request itself failed
    std::string message;                          // error text, or engine status on success
    std::string status;
    std::string config_path;
    uint32_t current_chunks = 0;
    uint32_t available_chunks = 0;
};

struct ClientStats {
    ClientState state = ClientState::Uninitialized;
    uint64_t lookups = 0;
    uint64_t lookup_failures = 0;
    uint64_t restarts = 0;
    size_t pending_requests = 0;
    size_t tracked_ids = 0;
    broker::RequestBroker::Stats broker;
    engine::ProcessSupervisor::Snapshot supervisor;
    runtime::AutoRespawnPolicy::Stats auto_respawn;
};

/**
 * @brief Caller-facing facade over the engine connection
 *
 * Composes the request broker, the process supervisor, the auto-respawn
 * policy and the initialization gate, and owns the two scheduler threads.
 * Suggestion lookups never throw; control calls return ControlResult.
 *
 * All restart paths hold restart_mutex_. Automatic triggers (crash recovery,
 * auto-respawn, lookup timeout) only try-lock it and stand down when a
 * restart is already running; restart() waits for its turn.
 */
class CompletionClient {
public:
    CompletionClient(const runtime::ClientConfig &config, logging::LoggerPtr logger,
                     std::shared_ptr<IBinaryInstaller> installer = nullptr,
                     std::shared_ptr<logging::ILogClassifier> classifier = nullptr);
    ~CompletionClient();

    CompletionClient(const CompletionClient &) = delete;
    CompletionClient &operator=(const CompletionClient &) = delete;

    /**
     * @brief Install check (first time only), spawn, readiness probe
     * @return true once the engine answered the probe
     */
    bool initialize();

    /**
     * @brief Tear down, wait restart_delay_ms, initialize again
     *
     * On success the crash-restart attempts and auto-respawn counters reset.
     */
    bool restart();

    /**
     * @brief Stop the engine and reject everything pending. Idempotent.
     */
    void cleanup();

    /**
     * @brief Ranked suggestions for a prefix; empty on any failure
     */
    std::vector<Suggestion> get_suggestions(const std::string &query);
    std::vector<Suggestion> get_suggestions(const std::string &query, int limit);

    ControlResult set_dictionary_size(int chunks);
    ControlResult get_dictionary_info();
    ControlResult update_config(uint32_t min_prefix, uint32_t max_limit);
    ControlResult get_config_path();

    // Raw broker access; the future may hold an EngineError
    std::future<broker::v1::Response> send(broker::v1::Request request, int timeout_ms);

    ClientState state() const;
    bool ready() const;
    bool manual_intervention_required() const;
    ClientStats stats() const;

    std::optional<pid_t> engine_pid() const;
    void kill_engine();

private:
    logging::LoggerPtr logger_;
    runtime::ClientConfig config_;
    std::shared_ptr<IBinaryInstaller> installer_;

    runtime::TimerScheduler timers_;
    runtime::TimerScheduler recovery_;
    broker::RequestBroker broker_;
    engine::ProcessSupervisor supervisor_;
    runtime::AutoRespawnPolicy auto_respawn_;
    runtime::InitializationGate gate_;

    std::mutex restart_mutex_;

    mutable std::mutex state_mutex_;
    ClientState state_ = ClientState::Uninitialized;

    std::atomic<bool> installer_checked_{false};
    std::atomic<bool> opportunistic_restart_pending_{false};
    std::atomic<int> min_prefix_;
    std::atomic<int> limit_;
    std::atomic<uint64_t> lookups_{0};
    std::atomic<uint64_t> lookup_failures_{0};
    std::atomic<uint64_t> restarts_{0};

    bool run_initialize_sequence();
    bool probe();
    bool ensure_started();

    // Caller holds restart_mutex_
    bool restart_locked(const std::string &reason);

    // try-lock variant; when another restart is already running returns `supervised`
    bool restart_automatic(const std::string &reason, bool supervised);

    void post_opportunistic_restart();
    void post_auto_respawn_check();
    void on_supervisor_event(engine::SupervisorEvent event, const std::string &detail);

    ControlResult send_control(broker::v1::Request request, int timeout_ms, broker::v1::Response &response);
    broker::v1::Response await_response(std::future<broker::v1::Response> &future, int timeout_ms);

    void set_state(ClientState state);
};

}  // namespace client
}  // namespace wordserve
