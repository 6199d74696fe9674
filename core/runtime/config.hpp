#pragma once

#include <string>
#include <vector>

#include "broker/request_broker.hpp"
#include "engine/engine_config.hpp"
#include "logging/logger.hpp"
#include "runtime/auto_respawn_policy.hpp"

namespace wordserve {
namespace runtime {

struct SuggestionsConfig {
    int limit = 24;      // Suggestions requested per lookup
    int min_prefix = 2;  // Shorter queries are answered locally with no suggestions
};

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct ClientConfig {
    engine::EngineConfig engine;
    engine::TimeoutConfig timeouts;
    AutoRespawnConfig auto_respawn;
    broker::BrokerConfig broker;
    SuggestionsConfig suggestions;
    LoggingConfig logging;
};

// Loads configuration from a YAML file
bool load_config(const std::string &config_path, ClientConfig &config, std::string &error,
                 const logging::LoggerPtr &logger);

// Validates the configuration
bool validate_config(const ClientConfig &config, std::string &error);

}  // namespace runtime
}  // namespace wordserve
