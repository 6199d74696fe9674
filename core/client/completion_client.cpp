#include "completion_client.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

namespace wordserve {
namespace client {

namespace {

namespace v1 = broker::v1;

// Extra wait on top of a request timeout before the caller gives up on its future
constexpr int kAwaitSlackMs = 500;

std::string trim(const std::string &s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

}  // namespace

const char *client_state_to_string(ClientState state) {
    switch (state) {
        case ClientState::Uninitialized:
            return "UNINITIALIZED";
        case ClientState::Initializing:
            return "INITIALIZING";
        case ClientState::Ready:
            return "READY";
        case ClientState::Recovering:
            return "RECOVERING";
        case ClientState::Failed:
            return "FAILED";
        case ClientState::ShuttingDown:
            return "SHUTTING_DOWN";
        case ClientState::Terminated:
            return "TERMINATED";
        default:
            return "UNKNOWN";
    }
}

CompletionClient::CompletionClient(const runtime::ClientConfig &config, logging::LoggerPtr logger,
                                   std::shared_ptr<IBinaryInstaller> installer,
                                   std::shared_ptr<logging::ILogClassifier> classifier)
    : logger_(std::move(logger)),
      config_(config),
      installer_(installer ? std::move(installer)
                           : std::make_shared<LocalBinaryInstaller>(config.engine.binary, logger_)),
      timers_("timers", logger_),
      recovery_("recovery", logger_),
      broker_(timers_, logger_, config.broker),
      supervisor_(broker_, recovery_, config.engine.restart_policy, config.timeouts, logger_, std::move(classifier)),
      auto_respawn_(
          config.auto_respawn, [this] { return restart_automatic("auto-respawn", false); }, logger_),
      gate_([this] { return run_initialize_sequence(); }, logger_),
      min_prefix_(config.suggestions.min_prefix),
      limit_(config.suggestions.limit) {
    supervisor_.set_restart_handler([this] { return restart_automatic("crash recovery", true); });
    supervisor_.set_event_listener(
        [this](engine::SupervisorEvent event, const std::string &detail) { on_supervisor_event(event, detail); });
}

CompletionClient::~CompletionClient() {
    // Recovery tasks call back into this object; let a running one finish, drop the rest
    recovery_.stop();
    cleanup();
    timers_.stop();
}

/*** Lifecycle ***/

bool CompletionClient::initialize() { return gate_.initialize(); }

bool CompletionClient::restart() {
    std::lock_guard<std::mutex> lock(restart_mutex_);
    bool ok = restart_locked("explicit restart");
    if (ok) {
        supervisor_.reset_restart_state();
        auto_respawn_.reset();
    }
    return ok;
}

void CompletionClient::cleanup() {
    std::lock_guard<std::mutex> lock(restart_mutex_);
    if (state() == ClientState::Terminated && !supervisor_.is_running()) {
        return;
    }
    set_state(ClientState::ShuttingDown);
    gate_.mark_not_ready();
    supervisor_.cleanup();
    set_state(ClientState::Terminated);
    LOG_INFO(*logger_, "[Client] Cleanup complete");
}

bool CompletionClient::run_initialize_sequence() {
    set_state(ClientState::Initializing);

    if (!installer_checked_.load()) {
        InstallResult install = installer_->ensure_binary();
        if (!install.success) {
            LOG_ERROR(*logger_, "[Client] Engine binary unavailable: " << install.error);
            set_state(ClientState::Failed);
            return false;
        }
        installer_checked_.store(true);
    }

    if (!supervisor_.start(config_.engine.binary, engine::build_engine_args(config_.engine))) {
        LOG_ERROR(*logger_, "[Client] Failed to start engine: " << supervisor_.last_error());
        set_state(ClientState::Failed);
        return false;
    }

    if (!probe()) {
        LOG_ERROR(*logger_, "[Client] Engine did not answer the readiness probe");
        supervisor_.cleanup();
        set_state(ClientState::Failed);
        return false;
    }

    set_state(ClientState::Ready);
    LOG_INFO(*logger_, "[Client] Engine ready (PID=" << supervisor_.pid().value_or(-1) << ")");
    return true;
}

bool CompletionClient::probe() {
    v1::Request request;
    auto *complete = request.mutable_complete();
    complete->set_prefix("test");
    complete->set_limit(1);

    const int timeout_ms = config_.timeouts.probe_ms;
    auto future = broker_.send(request, timeout_ms);
    try {
        v1::Response response = await_response(future, timeout_ms);
        if (!response.has_completion()) {
            LOG_WARN(*logger_, "[Client] Probe answered without a completion payload");
        }
        return true;
    } catch (const broker::EngineError &e) {
        if (e.code() == broker::ErrorCode::BACKEND) {
            // Engine is up and speaking the protocol
            LOG_WARN(*logger_, "[Client] Probe returned engine error: " << e.what());
            return true;
        }
        LOG_WARN(*logger_, "[Client] Probe failed (" << broker::error_code_to_string(e.code()) << "): " << e.what());
        return false;
    }
}

bool CompletionClient::ensure_started() {
    switch (state()) {
        case ClientState::Uninitialized:
            return initialize();
        case ClientState::ShuttingDown:
        case ClientState::Terminated:
            return false;
        default:
            return true;
    }
}

bool CompletionClient::restart_locked(const std::string &reason) {
    LOG_INFO(*logger_, "[Client] Restarting engine (" << reason << ")");
    set_state(ClientState::Recovering);
    gate_.mark_not_ready();
    supervisor_.cleanup();

    std::this_thread::sleep_for(std::chrono::milliseconds(config_.engine.restart_policy.restart_delay_ms));

    bool ok = gate_.initialize();
    restarts_++;
    if (!ok) {
        LOG_ERROR(*logger_, "[Client] Restart failed (" << reason << ")");
    }
    return ok;
}

bool CompletionClient::restart_automatic(const std::string &reason, bool supervised) {
    std::unique_lock<std::mutex> lock(restart_mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        LOG_DEBUG(*logger_, "[Client] Skipping " << reason << " restart: another restart is running");
        return supervised;
    }

    ClientState current = state();
    if (current == ClientState::ShuttingDown || current == ClientState::Terminated) {
        LOG_DEBUG(*logger_, "[Client] Skipping " << reason << " restart: client is shut down");
        return supervised;
    }

    bool ok = restart_locked(reason);
    if (!ok && supervised) {
        // The supervisor decides whether another attempt follows
        set_state(ClientState::Recovering);
    }
    return ok;
}

void CompletionClient::post_opportunistic_restart() {
    if (opportunistic_restart_pending_.exchange(true)) {
        return;
    }
    auto task = recovery_.post([this] {
        opportunistic_restart_pending_.store(false);
        if (state() != ClientState::Ready) {
            return;
        }
        if (!restart_automatic("lookup timeout", false)) {
            LOG_WARN(*logger_, "[Client] Opportunistic restart after lookup timeout did not succeed");
        }
    });
    if (task == 0) {
        opportunistic_restart_pending_.store(false);
    }
}

void CompletionClient::post_auto_respawn_check() {
    recovery_.post([this] { auto_respawn_.on_successful_request(); });
}

void CompletionClient::on_supervisor_event(engine::SupervisorEvent event, const std::string &detail) {
    switch (event) {
        case engine::SupervisorEvent::EXITED: {
            gate_.mark_not_ready();
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (state_ != ClientState::ShuttingDown && state_ != ClientState::Terminated) {
                LOG_INFO(*logger_, "[Client] State " << client_state_to_string(state_) << " -> RECOVERING");
                state_ = ClientState::Recovering;
            }
            break;
        }
        case engine::SupervisorEvent::GAVE_UP:
            LOG_ERROR(*logger_, "[Client] Engine unavailable (" << detail << "), manual restart required");
            set_state(ClientState::Failed);
            break;
        case engine::SupervisorEvent::RECOVERED:
            LOG_INFO(*logger_, "[Client] Engine stable after automatic restart");
            break;
        default:
            LOG_DEBUG(*logger_, "[Client] Supervisor " << engine::supervisor_event_to_string(event) << ": " << detail);
            break;
    }
}

/*** Requests ***/

std::vector<Suggestion> CompletionClient::get_suggestions(const std::string &query) {
    return get_suggestions(query, limit_.load());
}

std::vector<Suggestion> CompletionClient::get_suggestions(const std::string &query, int limit) {
    lookups_++;
    const std::string prefix = trim(query);
    if (prefix.empty() || static_cast<int>(prefix.size()) < min_prefix_.load()) {
        return {};
    }
    if (!ensure_started()) {
        lookup_failures_++;
        return {};
    }

    v1::Request request;
    auto *complete = request.mutable_complete();
    complete->set_prefix(prefix);
    complete->set_limit(static_cast<uint32_t>(std::max(limit, 1)));

    const int timeout_ms = config_.timeouts.lookup_ms;
    try {
        auto future = broker_.send(request, timeout_ms);
        v1::Response response = await_response(future, timeout_ms);
        if (!response.has_completion()) {
            lookup_failures_++;
            LOG_WARN(*logger_, "[Client] Lookup for '" << prefix << "' answered without completion payload");
            return {};
        }

        const auto &completion = response.completion();
        std::vector<Suggestion> suggestions;
        suggestions.reserve(completion.suggestions_size());
        for (int i = 0; i < completion.suggestions_size(); ++i) {
            const auto &s = completion.suggestions(i);
            Suggestion suggestion;
            suggestion.word = s.word();
            suggestion.rank = s.rank() != 0 ? static_cast<int>(s.rank()) : i + 1;
            suggestions.push_back(std::move(suggestion));
        }

        post_auto_respawn_check();
        return suggestions;
    } catch (const broker::EngineError &e) {
        lookup_failures_++;
        LOG_DEBUG(*logger_, "[Client] Lookup for '" << prefix << "' failed ("
                                                   << broker::error_code_to_string(e.code()) << "): " << e.what());
        if (e.code() == broker::ErrorCode::TIMEOUT) {
            post_opportunistic_restart();
        }
        return {};
    } catch (const std::exception &e) {
        lookup_failures_++;
        LOG_ERROR(*logger_, "[Client] Lookup for '" << prefix << "' failed: " << e.what());
        return {};
    }
}

ControlResult CompletionClient::set_dictionary_size(int chunks) {
    const int clamped = std::max(1, chunks);
    v1::Request request;
    request.mutable_dictionary()->set_set_size(static_cast<uint32_t>(clamped));

    v1::Response response;
    ControlResult result = send_control(request, config_.timeouts.dictionary_ms, response);
    if (!result.ok) {
        return result;
    }
    if (!response.has_dictionary()) {
        result.ok = false;
        result.message = "Response missing dictionary field";
        return result;
    }
    result.status = response.dictionary().status();
    result.message = result.status;
    result.current_chunks = response.dictionary().current_chunks();
    result.available_chunks = response.dictionary().available_chunks();
    LOG_INFO(*logger_, "[Client] Dictionary size set to " << clamped << " chunks (" << result.status << ")");
    return result;
}

ControlResult CompletionClient::get_dictionary_info() {
    v1::Request request;
    request.mutable_dictionary()->set_get_info(true);

    v1::Response response;
    ControlResult result = send_control(request, config_.timeouts.control_ms, response);
    if (!result.ok) {
        return result;
    }
    if (!response.has_dictionary()) {
        result.ok = false;
        result.message = "Response missing dictionary field";
        return result;
    }
    result.status = response.dictionary().status();
    result.message = result.status;
    result.current_chunks = response.dictionary().current_chunks();
    result.available_chunks = response.dictionary().available_chunks();
    return result;
}

ControlResult CompletionClient::update_config(uint32_t min_prefix, uint32_t max_limit) {
    v1::Request request;
    auto *config = request.mutable_config();
    config->set_action("update_config");
    config->set_min_prefix(min_prefix);
    config->set_max_limit(max_limit);

    v1::Response response;
    ControlResult result = send_control(request, config_.timeouts.control_ms, response);
    if (!result.ok) {
        return result;
    }
    if (!response.has_config()) {
        result.ok = false;
        result.message = "Response missing config field";
        return result;
    }
    result.status = response.config().status();
    result.message = result.status;

    // Keep the local gate in line with what the engine now enforces
    if (min_prefix > 0) {
        min_prefix_.store(static_cast<int>(min_prefix));
    }
    if (max_limit > 0 && limit_.load() > static_cast<int>(max_limit)) {
        limit_.store(static_cast<int>(max_limit));
    }
    return result;
}

ControlResult CompletionClient::get_config_path() {
    v1::Request request;
    request.mutable_config()->set_action("get_config_path");

    v1::Response response;
    ControlResult result = send_control(request, config_.timeouts.control_ms, response);
    if (!result.ok) {
        return result;
    }
    if (!response.has_config()) {
        result.ok = false;
        result.message = "Response missing config field";
        return result;
    }
    result.status = response.config().status();
    result.config_path = response.config().config_path();
    result.message = result.config_path;
    return result;
}

std::future<v1::Response> CompletionClient::send(v1::Request request, int timeout_ms) {
    return broker_.send(std::move(request), timeout_ms);
}

ControlResult CompletionClient::send_control(v1::Request request, int timeout_ms, v1::Response &response) {
    ControlResult result;
    if (!ensure_started()) {
        result.error_code = broker::ErrorCode::NOT_RUNNING;
        result.message = "Engine not started";
        return result;
    }

    const char *kind = broker::request_kind(request);
    try {
        auto future = broker_.send(std::move(request), timeout_ms);
        response = await_response(future, timeout_ms);
        result.ok = true;
    } catch (const broker::EngineError &e) {
        result.error_code = e.code();
        result.message = e.what();
        LOG_WARN(*logger_, "[Client] " << kind << " request failed (" << broker::error_code_to_string(e.code())
                                       << "): " << e.what());
    } catch (const std::exception &e) {
        result.message = e.what();
        LOG_ERROR(*logger_, "[Client] " << kind << " request failed: " << e.what());
    }
    return result;
}

v1::Response CompletionClient::await_response(std::future<v1::Response> &future, int timeout_ms) {
    if (future.wait_for(std::chrono::milliseconds(timeout_ms + kAwaitSlackMs)) != std::future_status::ready) {
        throw broker::EngineError(broker::ErrorCode::TIMEOUT,
                                  "No response within " + std::to_string(timeout_ms) + "ms");
    }
    return future.get();
}

/*** State ***/

ClientState CompletionClient::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

bool CompletionClient::ready() const { return gate_.ready() && supervisor_.is_running(); }

bool CompletionClient::manual_intervention_required() const { return supervisor_.manual_intervention_required(); }

ClientStats CompletionClient::stats() const {
    ClientStats stats;
    stats.state = state();
    stats.lookups = lookups_.load();
    stats.lookup_failures = lookup_failures_.load();
    stats.restarts = restarts_.load();
    stats.pending_requests = broker_.pending_count();
    stats.tracked_ids = broker_.tracked_id_count();
    stats.broker = broker_.stats();
    stats.supervisor = supervisor_.snapshot();
    stats.auto_respawn = auto_respawn_.stats();
    return stats;
}

std::optional<pid_t> CompletionClient::engine_pid() const { return supervisor_.pid(); }

void CompletionClient::kill_engine() { supervisor_.kill_engine(); }

void CompletionClient::set_state(ClientState state) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == state) {
        return;
    }
    LOG_DEBUG(*logger_, "[Client] State " << client_state_to_string(state_) << " -> " << client_state_to_string(state));
    state_ = state;
}

}  // namespace client
}  // namespace wordserve
