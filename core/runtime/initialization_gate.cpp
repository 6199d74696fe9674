#include "initialization_gate.hpp"

#include <exception>

namespace wordserve {
namespace runtime {

namespace {

// Clears the in-flight marker however the sequence ends
class InFlightGuard {
public:
    InFlightGuard(std::mutex &mutex, bool &in_flight) : mutex_(mutex), in_flight_(in_flight) {}
    ~InFlightGuard() {
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_ = false;
    }

private:
    std::mutex &mutex_;
    bool &in_flight_;
};

}  // namespace

InitializationGate::InitializationGate(Sequence sequence, logging::LoggerPtr logger)
    : sequence_(std::move(sequence)), logger_(std::move(logger)) {}

bool InitializationGate::initialize() {
    std::shared_future<bool> in_progress;
    std::promise<bool> promise;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ready_) {
            return true;
        }
        if (in_flight_) {
            in_progress = current_;
        } else {
            in_flight_ = true;
            current_ = promise.get_future().share();
        }
    }

    if (in_progress.valid()) {
        LOG_DEBUG(*logger_, "[Init] Initialization already running, waiting for its result");
        return in_progress.get();
    }

    bool ok;
    {
        InFlightGuard guard(mutex_, in_flight_);
        ok = run_sequence();
        std::lock_guard<std::mutex> lock(mutex_);
        ready_ = ok;
    }
    promise.set_value(ok);
    return ok;
}

bool InitializationGate::ready() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ready_;
}

bool InitializationGate::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

void InitializationGate::mark_not_ready() {
    std::lock_guard<std::mutex> lock(mutex_);
    ready_ = false;
}

bool InitializationGate::run_sequence() {
    try {
        return sequence_ && sequence_();
    } catch (const std::exception &e) {
        LOG_ERROR(*logger_, "[Init] Initialization failed: " << e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace wordserve
