#pragma once

#include <sys/types.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "broker/request_broker.hpp"
#include "engine_config.hpp"
#include "engine_process.hpp"
#include "logging/engine_log_classifier.hpp"
#include "logging/logger.hpp"
#include "restart_policy.hpp"
#include "runtime/task_scheduler.hpp"
#include "transport/frame_codec.hpp"

namespace wordserve {
namespace engine {

enum class SupervisorEvent {
    STARTED,            // Process spawned and I/O thread running
    EXITED,             // Unexpected exit detected, pending requests rejected
    RESTART_SCHEDULED,  // Backoff timer armed on the recovery scheduler
    RESTART_FAILED,     // A scheduled restart did not bring the engine back
    GAVE_UP,            // Circuit open or policy disabled; manual intervention required
    RECOVERED           // Restarted engine stayed healthy; attempts reset
};

const char *supervisor_event_to_string(SupervisorEvent event);

// ProcessSupervisor owns the engine process and everything attached to it:
// the stdout/stderr reader thread, frame decoding, log classification and
// crash handling. It is the broker's IRequestWriter.
//
// Crash handling: when stdout reaches EOF outside of cleanup(), pending
// requests are rejected with PROCESS_EXIT, the restart policy is consulted and
// the restart handler is scheduled on the recovery scheduler after the backoff
// delay. Every start()/cleanup() bumps a generation counter so exit callbacks
// and scheduled restarts from an older process become no-ops.
//
// Listener callbacks run on the I/O thread and must not call cleanup().
class ProcessSupervisor : public broker::IRequestWriter {
public:
    // Brings the engine back (cleanup + start + probe); true on success
    using RestartHandler = std::function<bool()>;
    using EventListener = std::function<void(SupervisorEvent, const std::string &)>;

    struct Snapshot {
        bool running = false;
        pid_t pid = -1;
        uint64_t generation = 0;
        bool manual_intervention_required = false;
        std::optional<int> last_exit_code;
        RestartPolicy::Snapshot restart;
        transport::FrameDecoder::Stats decoder;
    };

    ProcessSupervisor(broker::RequestBroker &broker, runtime::IScheduler &recovery,
                      const RestartPolicyConfig &policy, const TimeoutConfig &timeouts, logging::LoggerPtr logger,
                      std::shared_ptr<logging::ILogClassifier> classifier = nullptr);
    ~ProcessSupervisor() override;

    ProcessSupervisor(const ProcessSupervisor &) = delete;
    ProcessSupervisor &operator=(const ProcessSupervisor &) = delete;

    // Spawn the engine and start reading its output. Any previous process is cleaned up first.
    bool start(const std::string &binary, const std::vector<std::string> &args);

    // Stop the engine (EOF, grace period, SIGKILL), join the I/O thread and
    // reject pending requests with CANCELLED. Safe to call repeatedly.
    void cleanup();

    // IRequestWriter
    bool is_running() const override;
    bool write_frame(const std::string &frame, std::string &error) override;

    void set_restart_handler(RestartHandler handler);
    void set_event_listener(EventListener listener);

    bool manual_intervention_required() const;

    // Explicit restart succeeded: reset attempts, close the circuit
    void reset_restart_state();

    // SIGKILL the engine without cleanup; the exit path runs as for a crash
    void kill_engine();

    void update_policy(const RestartPolicyConfig &policy);
    void update_timeouts(const TimeoutConfig &timeouts);

    std::optional<pid_t> pid() const;
    Snapshot snapshot() const;
    std::string last_error() const;

private:
    broker::RequestBroker &broker_;
    runtime::IScheduler &recovery_;
    RestartPolicy policy_;
    logging::LoggerPtr logger_;
    std::shared_ptr<logging::ILogClassifier> classifier_;

    mutable std::mutex mutex_;
    std::unique_ptr<EngineProcess> process_;
    std::thread io_thread_;
    std::atomic<bool> stop_io_{false};
    uint64_t generation_ = 0;
    bool shutting_down_ = false;  // destructor running
    bool manual_intervention_ = false;
    std::optional<int> last_exit_code_;
    TimeoutConfig timeouts_;
    std::string error_;
    RestartHandler restart_handler_;
    EventListener listener_;

    mutable std::mutex decoder_mutex_;
    transport::FrameDecoder decoder_;

    void io_loop(EngineProcess *process, uint64_t generation);
    void handle_stdout(const uint8_t *data, size_t len);
    void handle_stderr(std::string &pending, const uint8_t *data, size_t len);
    void handle_exit(uint64_t generation);
    void schedule_restart(int delay_ms, uint64_t generation);
    void run_scheduled_restart(uint64_t generation);
    void schedule_recovery_check(uint64_t generation);
    void give_up(const std::string &reason);
    void emit(SupervisorEvent event, const std::string &detail);
};

}  // namespace engine
}  // namespace wordserve
