#include "process_supervisor.hpp"

#include <chrono>

namespace wordserve {
namespace engine {

namespace {
constexpr int kPollIntervalMs = 50;
constexpr size_t kReadChunkSize = 64 * 1024;
constexpr size_t kMaxStderrLine = 64 * 1024;
constexpr int kStderrDrainMs = 200;
constexpr int kKillWaitMs = 500;
}  // namespace

const char *supervisor_event_to_string(SupervisorEvent event) {
    switch (event) {
        case SupervisorEvent::STARTED:
            return "STARTED";
        case SupervisorEvent::EXITED:
            return "EXITED";
        case SupervisorEvent::RESTART_SCHEDULED:
            return "RESTART_SCHEDULED";
        case SupervisorEvent::RESTART_FAILED:
            return "RESTART_FAILED";
        case SupervisorEvent::GAVE_UP:
            return "GAVE_UP";
        case SupervisorEvent::RECOVERED:
            return "RECOVERED";
        default:
            return "UNKNOWN";
    }
}

ProcessSupervisor::ProcessSupervisor(broker::RequestBroker &broker, runtime::IScheduler &recovery,
                                     const RestartPolicyConfig &policy, const TimeoutConfig &timeouts,
                                     logging::LoggerPtr logger, std::shared_ptr<logging::ILogClassifier> classifier)
    : broker_(broker),
      recovery_(recovery),
      policy_(policy, logger),
      logger_(std::move(logger)),
      classifier_(std::move(classifier)),
      timeouts_(timeouts),
      decoder_(logger_) {
    if (!classifier_) {
        classifier_ = std::make_shared<logging::EngineLogClassifier>(logger_);
    }
    broker_.attach_writer(this);
}

ProcessSupervisor::~ProcessSupervisor() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutting_down_ = true;
    }
    broker_.attach_writer(nullptr);
    cleanup();
}

bool ProcessSupervisor::start(const std::string &binary, const std::vector<std::string> &args) {
    cleanup();

    int shutdown_ms;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) {
            error_ = "Supervisor is shutting down";
            return false;
        }
        shutdown_ms = timeouts_.shutdown_ms;
    }

    auto process = std::make_unique<EngineProcess>(binary, args, logger_, shutdown_ms);
    if (!process->spawn()) {
        std::lock_guard<std::mutex> lock(mutex_);
        error_ = process->last_error();
        LOG_ERROR(*logger_, "[Supervisor] Failed to start engine: " << error_);
        return false;
    }

    {
        std::lock_guard<std::mutex> decoder_lock(decoder_mutex_);
        decoder_.reset();
    }

    pid_t pid;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        generation_++;
        pid = process->pid();
        process_ = std::move(process);
        manual_intervention_ = false;
        last_exit_code_.reset();
        error_.clear();
        stop_io_.store(false);
        io_thread_ = std::thread(&ProcessSupervisor::io_loop, this, process_.get(), generation_);
    }

    policy_.record_started();
    emit(SupervisorEvent::STARTED, "pid " + std::to_string(pid));
    return true;
}

void ProcessSupervisor::cleanup() {
    std::unique_ptr<EngineProcess> process;
    std::thread io_thread;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        generation_++;  // exit callbacks and scheduled restarts for the old process are now stale
        process = std::move(process_);
        io_thread = std::move(io_thread_);
    }

    if (process) {
        LOG_INFO(*logger_, "[Supervisor] Stopping engine (PID=" << process->pid() << ")");
        process->shutdown();
    }

    stop_io_.store(true);
    if (io_thread.joinable()) {
        io_thread.join();
    }
    process.reset();

    broker_.cancel_all(broker::ErrorCode::CANCELLED, "Engine stopped");
}

bool ProcessSupervisor::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return process_ && process_->is_running();
}

bool ProcessSupervisor::write_frame(const std::string &frame, std::string &error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!process_ || !process_->is_running()) {
        error = "Engine process not running";
        return false;
    }

    auto &channel = process_->channel();
    if (!channel.write_all(reinterpret_cast<const uint8_t *>(frame.data()), frame.size(), timeouts_.write_ms)) {
        error = channel.last_write_error();
        error_ = error;
        // Stream is unusable; the exit path takes over from here
        LOG_ERROR(*logger_, "[Supervisor] Write to engine failed (" << error << "), terminating process");
        process_->kill_now();
        return false;
    }
    return true;
}

void ProcessSupervisor::set_restart_handler(RestartHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    restart_handler_ = std::move(handler);
}

void ProcessSupervisor::set_event_listener(EventListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

bool ProcessSupervisor::manual_intervention_required() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return manual_intervention_;
}

void ProcessSupervisor::reset_restart_state() {
    policy_.record_success();
    std::lock_guard<std::mutex> lock(mutex_);
    manual_intervention_ = false;
}

void ProcessSupervisor::kill_engine() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (process_) {
        LOG_WARN(*logger_, "[Supervisor] Killing engine (PID=" << process_->pid() << ")");
        process_->kill_now();
    }
}

void ProcessSupervisor::update_policy(const RestartPolicyConfig &policy) { policy_.update_config(policy); }

void ProcessSupervisor::update_timeouts(const TimeoutConfig &timeouts) {
    std::lock_guard<std::mutex> lock(mutex_);
    timeouts_ = timeouts;
}

std::optional<pid_t> ProcessSupervisor::pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!process_) {
        return std::nullopt;
    }
    return process_->pid();
}

ProcessSupervisor::Snapshot ProcessSupervisor::snapshot() const {
    Snapshot snap;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snap.running = process_ && process_->is_running();
        snap.pid = process_ ? process_->pid() : -1;
        snap.generation = generation_;
        snap.manual_intervention_required = manual_intervention_;
        snap.last_exit_code = last_exit_code_;
    }
    snap.restart = policy_.snapshot();
    {
        std::lock_guard<std::mutex> decoder_lock(decoder_mutex_);
        snap.decoder = decoder_.stats();
    }
    return snap;
}

std::string ProcessSupervisor::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

void ProcessSupervisor::io_loop(EngineProcess *process, uint64_t generation) {
    auto &channel = process->channel();
    std::vector<uint8_t> buf(kReadChunkSize);
    std::string stderr_pending;

    while (!stop_io_.load()) {
        transport::StdioChannel::PollResult ready;
        if (!channel.wait_for_data(kPollIntervalMs, ready)) {
            if (!channel.last_read_error().empty()) {
                LOG_ERROR(*logger_, "[Supervisor] Engine output error: " << channel.last_read_error());
                break;
            }
            continue;
        }

        if (ready.stderr_ready) {
            ssize_t n = channel.read_some(transport::StdioChannel::Stream::STDERR, buf.data(), buf.size());
            if (n > 0) {
                handle_stderr(stderr_pending, buf.data(), static_cast<size_t>(n));
            } else {
                channel.close_stream(transport::StdioChannel::Stream::STDERR);
            }
        }

        if (ready.stdout_ready) {
            ssize_t n = channel.read_some(transport::StdioChannel::Stream::STDOUT, buf.data(), buf.size());
            if (n > 0) {
                handle_stdout(buf.data(), static_cast<size_t>(n));
            } else {
                if (n < 0) {
                    LOG_WARN(*logger_, "[Supervisor] " << channel.last_read_error());
                }
                channel.close_stream(transport::StdioChannel::Stream::STDOUT);
                break;
            }
        }
    }

    // Pick up the engine's last words before reporting the exit
    auto drain_deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(kStderrDrainMs);
    while (channel.is_open(transport::StdioChannel::Stream::STDERR) &&
           std::chrono::steady_clock::now() < drain_deadline) {
        transport::StdioChannel::PollResult ready;
        if (!channel.wait_for_data(kPollIntervalMs, ready) || !ready.stderr_ready) {
            break;
        }
        ssize_t n = channel.read_some(transport::StdioChannel::Stream::STDERR, buf.data(), buf.size());
        if (n <= 0) {
            channel.close_stream(transport::StdioChannel::Stream::STDERR);
            break;
        }
        handle_stderr(stderr_pending, buf.data(), static_cast<size_t>(n));
    }
    if (!stderr_pending.empty()) {
        classifier_->classify_line(stderr_pending);
    }

    if (stop_io_.load()) {
        return;
    }
    handle_exit(generation);
}

void ProcessSupervisor::handle_stdout(const uint8_t *data, size_t len) {
    std::vector<broker::v1::Response> responses;
    {
        std::lock_guard<std::mutex> decoder_lock(decoder_mutex_);
        responses = decoder_.feed(data, len);
    }
    for (const auto &response : responses) {
        broker_.on_message(response);
    }
}

void ProcessSupervisor::handle_stderr(std::string &pending, const uint8_t *data, size_t len) {
    pending.append(reinterpret_cast<const char *>(data), len);

    size_t start = 0;
    size_t newline;
    while ((newline = pending.find('\n', start)) != std::string::npos) {
        classifier_->classify_line(pending.substr(start, newline - start));
        start = newline + 1;
    }
    pending.erase(0, start);

    if (pending.size() > kMaxStderrLine) {
        classifier_->classify_line(pending);
        pending.clear();
    }
}

void ProcessSupervisor::handle_exit(uint64_t generation) {
    std::unique_ptr<EngineProcess> process;
    int shutdown_ms;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_ || generation != generation_) {
            return;  // expected exit (cleanup or restart in progress)
        }
        process = std::move(process_);
        shutdown_ms = timeouts_.shutdown_ms;
    }

    std::optional<int> exit_code;
    if (process) {
        // stdout EOF normally means the process is gone; make sure of it
        if (!process->wait_for_exit(shutdown_ms)) {
            process->kill_now();
            process->wait_for_exit(kKillWaitMs);
        }
        exit_code = process->exit_code();
    }

    std::string detail = "Engine process exited";
    if (exit_code) {
        detail += " with code " + std::to_string(*exit_code);
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_exit_code_ = exit_code;
    }

    LOG_WARN(*logger_, "[Supervisor] " << detail);
    broker_.cancel_all(broker::ErrorCode::PROCESS_EXIT, detail);
    emit(SupervisorEvent::EXITED, detail);

    auto delay = policy_.record_crash();
    if (!delay) {
        give_up(policy_.enabled() ? "restart attempts exhausted" : "restart policy disabled");
        return;
    }
    schedule_restart(*delay, generation);
}

void ProcessSupervisor::schedule_restart(int delay_ms, uint64_t generation) {
    auto task = recovery_.schedule_after(std::chrono::milliseconds(delay_ms),
                                         [this, generation] { run_scheduled_restart(generation); });
    if (task == 0) {
        LOG_DEBUG(*logger_, "[Supervisor] Recovery scheduler stopped; restart not scheduled");
        return;
    }
    LOG_INFO(*logger_, "[Supervisor] Restart scheduled in " << delay_ms << "ms");
    emit(SupervisorEvent::RESTART_SCHEDULED, std::to_string(delay_ms) + "ms");
}

void ProcessSupervisor::run_scheduled_restart(uint64_t generation) {
    RestartHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_ || generation != generation_ || process_) {
            LOG_DEBUG(*logger_, "[Supervisor] Skipping stale scheduled restart");
            return;
        }
        handler = restart_handler_;
    }

    if (!handler) {
        give_up("no restart handler installed");
        return;
    }

    LOG_INFO(*logger_, "[Supervisor] Attempting automatic restart (attempt " << policy_.attempt_count() << ")");
    if (handler()) {
        uint64_t current;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            current = generation_;
        }
        schedule_recovery_check(current);
        return;
    }

    uint64_t current;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) {
            return;
        }
        current = generation_;
    }

    emit(SupervisorEvent::RESTART_FAILED, last_error());
    auto delay = policy_.record_crash();
    if (!delay) {
        give_up("restart attempts exhausted");
        return;
    }
    schedule_restart(*delay, current);
}

void ProcessSupervisor::schedule_recovery_check(uint64_t generation) {
    if (!policy_.enabled()) {
        return;
    }

    // Fire just after the stability window so should_mark_recovered() sees it elapsed
    const int delay_ms = policy_.success_reset_ms() + kPollIntervalMs;
    recovery_.schedule_after(std::chrono::milliseconds(delay_ms), [this, generation] {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutting_down_ || generation != generation_ || !process_) {
                return;
            }
        }
        if (policy_.should_mark_recovered()) {
            policy_.record_success();
            emit(SupervisorEvent::RECOVERED, "engine stable");
        }
    });
}

void ProcessSupervisor::give_up(const std::string &reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        manual_intervention_ = true;
    }
    LOG_ERROR(*logger_, "[Supervisor] Automatic restart stopped (" << reason << "); manual restart required");
    emit(SupervisorEvent::GAVE_UP, reason);
}

void ProcessSupervisor::emit(SupervisorEvent event, const std::string &detail) {
    EventListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = listener_;
    }
    if (listener) {
        listener(event, detail);
    }
}

}  // namespace engine
}  // namespace wordserve
