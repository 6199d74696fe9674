#pragma once

#include <string>
#include <vector>

namespace wordserve {
namespace engine {

struct RestartPolicyConfig {
    bool enabled = true;           // Enable automatic restart on crash
    int max_attempts = 3;          // Max restart attempts before giving up
    int base_backoff_ms = 500;     // Delay before attempt n is base * 2^(n-1)
    int success_reset_ms = 10000;  // Healthy duration required before resetting crash attempts
    int restart_delay_ms = 100;    // Pause between teardown and respawn on explicit restart
};

struct EngineConfig {
    std::string binary;             // Path to engine executable
    std::string data_dir;           // Passed as --data=<dir>
    std::vector<std::string> args;  // Extra command-line arguments
    bool debug = false;             // Adds -d
    RestartPolicyConfig restart_policy;
};

// Per-kind request timeouts
struct TimeoutConfig {
    int lookup_ms = 1000;      // Suggestion lookups (latency sensitive)
    int control_ms = 3000;     // Config requests
    int dictionary_ms = 5000;  // Dictionary resize / info (engine may reload data)
    int probe_ms = 3000;       // Readiness probe after spawn
    int write_ms = 1000;       // Bounded write to engine stdin
    int shutdown_ms = 2000;    // Grace period after stdin EOF before SIGKILL
};

// Builds the engine argv: --data=<dir> always, -d in debug mode, then extra args
std::vector<std::string> build_engine_args(const EngineConfig &config);

}  // namespace engine
}  // namespace wordserve
