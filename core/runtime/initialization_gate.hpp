#pragma once

#include <functional>
#include <future>
#include <mutex>

#include "logging/logger.hpp"

namespace wordserve {
namespace runtime {

// InitializationGate single-flights the spawn sequence.
//
// The first initialize() caller runs the sequence on its own thread; callers
// arriving while it runs wait on the same shared result. Once the sequence
// succeeds the gate stays ready until mark_not_ready().
class InitializationGate {
public:
    using Sequence = std::function<bool()>;

    InitializationGate(Sequence sequence, logging::LoggerPtr logger);

    InitializationGate(const InitializationGate &) = delete;
    InitializationGate &operator=(const InitializationGate &) = delete;

    bool initialize();

    bool ready() const;
    bool in_flight() const;
    void mark_not_ready();

private:
    Sequence sequence_;
    logging::LoggerPtr logger_;

    mutable std::mutex mutex_;
    bool ready_ = false;
    bool in_flight_ = false;
    std::shared_future<bool> current_;

    bool run_sequence();
};

}  // namespace runtime
}  // namespace wordserve
