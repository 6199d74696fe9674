#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <sstream>
#include <string>

namespace wordserve {
namespace runtime {

namespace {

void warn_unknown_keys(const YAML::Node &node, const std::string &section, const std::vector<std::string> &valid_keys,
                       const logging::LoggerPtr &logger) {
    if (!node.IsMap()) {
        return;
    }
    for (const auto &key_node : node) {
        std::string key = key_node.first.as<std::string>();
        if (std::find(valid_keys.begin(), valid_keys.end(), key) == valid_keys.end()) {
            if (section.empty()) {
                LOG_WARN(*logger, "[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            } else {
                LOG_WARN(*logger, "[Config] Unknown key '" << section << "." << key << "' (will be ignored)");
            }
        }
    }
}

template <typename T>
void read_value(const YAML::Node &node, const char *key, T &out) {
    if (node[key]) {
        out = node[key].as<T>();
    }
}

}  // namespace

bool validate_config(const ClientConfig &config, std::string &error) {
    // Engine
    if (config.engine.binary.empty()) {
        error = "engine.binary must be set";
        return false;
    }
    if (config.engine.data_dir.empty()) {
        error = "engine.data_dir must be set";
        return false;
    }

    // Timeouts
    const auto &t = config.timeouts;
    if (t.lookup_ms < 10 || t.control_ms < 10 || t.dictionary_ms < 10 || t.probe_ms < 10) {
        error = "Request timeouts must be >= 10ms";
        return false;
    }
    if (t.write_ms < 10) {
        error = "timeouts.write_ms must be >= 10ms";
        return false;
    }
    if (t.shutdown_ms < 100 || t.shutdown_ms > 30000) {
        error = "timeouts.shutdown_ms must be between 100 and 30000ms";
        return false;
    }

    // Restart policy
    const auto &rp = config.engine.restart_policy;
    if (rp.enabled) {
        if (rp.max_attempts < 1) {
            error = "restart_policy.max_attempts must be >= 1";
            return false;
        }
        if (rp.max_attempts > 20) {
            error = "restart_policy.max_attempts must be <= 20";
            return false;
        }
        if (rp.base_backoff_ms < 0) {
            error = "restart_policy.base_backoff_ms must be >= 0";
            return false;
        }
        const int64_t longest_backoff = static_cast<int64_t>(rp.base_backoff_ms) << (rp.max_attempts - 1);
        if (longest_backoff > std::numeric_limits<int>::max()) {
            error = "restart_policy.base_backoff_ms * 2^(max_attempts-1) must fit in " +
                    std::to_string(std::numeric_limits<int>::max()) + "ms";
            return false;
        }
    }
    if (rp.success_reset_ms < 0) {
        error = "restart_policy.success_reset_ms must be >= 0";
        return false;
    }
    if (rp.restart_delay_ms < 0) {
        error = "restart_policy.restart_delay_ms must be >= 0";
        return false;
    }

    // Auto-respawn
    if (config.auto_respawn.enabled) {
        if (config.auto_respawn.request_threshold < 1) {
            error = "auto_respawn.request_threshold must be >= 1";
            return false;
        }
        if (config.auto_respawn.time_threshold_minutes < 1) {
            error = "auto_respawn.time_threshold_minutes must be >= 1";
            return false;
        }
    }

    // Broker
    if (config.broker.stale_age_ms < 1000) {
        error = "broker.stale_age_ms must be >= 1000ms";
        return false;
    }
    if (config.broker.cleanup_interval_ms < 100) {
        error = "broker.cleanup_interval_ms must be >= 100ms";
        return false;
    }
    if (config.broker.cleanup_threshold < 1) {
        error = "broker.cleanup_threshold must be >= 1";
        return false;
    }

    // Suggestions
    if (config.suggestions.limit < 1) {
        error = "suggestions.limit must be >= 1";
        return false;
    }
    if (config.suggestions.min_prefix < 0) {
        error = "suggestions.min_prefix must be >= 0";
        return false;
    }

    // Logging
    if (config.logging.level != "debug" && config.logging.level != "info" && config.logging.level != "warn" &&
        config.logging.level != "error") {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, ClientConfig &config, std::string &error,
                 const logging::LoggerPtr &logger) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        warn_unknown_keys(yaml, "",
                          {"engine", "timeouts", "restart_policy", "auto_respawn", "broker", "suggestions", "logging"},
                          logger);

        // Load engine config
        if (yaml["engine"]) {
            const auto &node = yaml["engine"];
            warn_unknown_keys(node, "engine", {"binary", "data_dir", "args", "debug"}, logger);
            read_value(node, "binary", config.engine.binary);
            read_value(node, "data_dir", config.engine.data_dir);
            read_value(node, "debug", config.engine.debug);
            if (node["args"]) {
                config.engine.args.clear();  // Ensure idempotent parsing
                for (const auto &arg : node["args"]) {
                    config.engine.args.push_back(arg.as<std::string>());
                }
            }
        }

        if (yaml["timeouts"]) {
            const auto &node = yaml["timeouts"];
            warn_unknown_keys(
                node, "timeouts",
                {"lookup_ms", "control_ms", "dictionary_ms", "probe_ms", "write_ms", "shutdown_ms"}, logger);
            read_value(node, "lookup_ms", config.timeouts.lookup_ms);
            read_value(node, "control_ms", config.timeouts.control_ms);
            read_value(node, "dictionary_ms", config.timeouts.dictionary_ms);
            read_value(node, "probe_ms", config.timeouts.probe_ms);
            read_value(node, "write_ms", config.timeouts.write_ms);
            read_value(node, "shutdown_ms", config.timeouts.shutdown_ms);
        }

        // Parse restart policy
        if (yaml["restart_policy"]) {
            const auto &rp = yaml["restart_policy"];
            warn_unknown_keys(
                rp, "restart_policy",
                {"enabled", "max_attempts", "base_backoff_ms", "success_reset_ms", "restart_delay_ms"}, logger);
            auto &policy = config.engine.restart_policy;
            read_value(rp, "enabled", policy.enabled);
            read_value(rp, "max_attempts", policy.max_attempts);
            read_value(rp, "base_backoff_ms", policy.base_backoff_ms);
            read_value(rp, "success_reset_ms", policy.success_reset_ms);
            read_value(rp, "restart_delay_ms", policy.restart_delay_ms);
        }

        if (yaml["auto_respawn"]) {
            const auto &node = yaml["auto_respawn"];
            warn_unknown_keys(node, "auto_respawn", {"enabled", "request_threshold", "time_threshold_minutes"},
                              logger);
            read_value(node, "enabled", config.auto_respawn.enabled);
            read_value(node, "request_threshold", config.auto_respawn.request_threshold);
            read_value(node, "time_threshold_minutes", config.auto_respawn.time_threshold_minutes);
        }

        if (yaml["broker"]) {
            const auto &node = yaml["broker"];
            warn_unknown_keys(node, "broker", {"stale_age_ms", "cleanup_interval_ms", "cleanup_threshold"}, logger);
            read_value(node, "stale_age_ms", config.broker.stale_age_ms);
            read_value(node, "cleanup_interval_ms", config.broker.cleanup_interval_ms);
            read_value(node, "cleanup_threshold", config.broker.cleanup_threshold);
        }

        if (yaml["suggestions"]) {
            const auto &node = yaml["suggestions"];
            warn_unknown_keys(node, "suggestions", {"limit", "min_prefix"}, logger);
            read_value(node, "limit", config.suggestions.limit);
            read_value(node, "min_prefix", config.suggestions.min_prefix);
        }

        // Load logging config
        if (yaml["logging"]) {
            read_value(yaml["logging"], "level", config.logging.level);
        }

        if (!validate_config(config, error)) {
            return false;
        }

        LOG_INFO(*logger, "[Config] Engine: " << config.engine.binary << " (data: " << config.engine.data_dir
                                              << (config.engine.debug ? ", debug" : "") << ")");
        LOG_INFO(*logger, "[Config] Timeouts: lookup " << config.timeouts.lookup_ms << "ms, control "
                                                       << config.timeouts.control_ms << "ms, dictionary "
                                                       << config.timeouts.dictionary_ms << "ms");

        std::stringstream restart_msg;
        restart_msg << "[Config] Restart policy: "
                    << (config.engine.restart_policy.enabled ? "enabled" : "disabled");
        if (config.engine.restart_policy.enabled) {
            restart_msg << " (max " << config.engine.restart_policy.max_attempts << " attempts, base backoff "
                        << config.engine.restart_policy.base_backoff_ms << "ms)";
        }
        LOG_INFO(*logger, restart_msg.str());

        std::stringstream respawn_msg;
        respawn_msg << "[Config] Auto-respawn: " << (config.auto_respawn.enabled ? "enabled" : "disabled");
        if (config.auto_respawn.enabled) {
            respawn_msg << " (" << config.auto_respawn.request_threshold << " requests / "
                        << config.auto_respawn.time_threshold_minutes << " min)";
        }
        LOG_INFO(*logger, respawn_msg.str());

        LOG_INFO(*logger, "[Config] Log level: " << config.logging.level);
        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace wordserve
