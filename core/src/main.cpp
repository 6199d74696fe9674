// wordserve-client
// Config-based engine host: reads words from stdin, prints ranked suggestions

#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>

#include "client/completion_client.hpp"
#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/signal_handler.hpp"

namespace
{
    void print_help()
    {
        std::cout << "Commands:\n";
        std::cout << "  <word>           Print suggestions for the prefix\n";
        std::cout << "  :restart         Restart the engine\n";
        std::cout << "  :dict N          Set dictionary size to N chunks\n";
        std::cout << "  :info            Show dictionary chunk counts\n";
        std::cout << "  :config-path     Show the engine's config file path\n";
        std::cout << "  :stats           Show client statistics\n";
        std::cout << "  :quit            Exit\n";
    }

    void print_result(const wordserve::client::ControlResult &result)
    {
        if (!result.ok)
        {
            std::cout << "error";
            if (result.error_code)
            {
                std::cout << " [" << wordserve::broker::error_code_to_string(*result.error_code) << "]";
            }
            std::cout << ": " << result.message << "\n";
            return;
        }
        std::cout << "ok: " << result.message << "\n";
    }

    void print_stats(const wordserve::client::ClientStats &stats)
    {
        std::cout << "state:            " << wordserve::client::client_state_to_string(stats.state) << "\n";
        std::cout << "engine pid:       " << stats.supervisor.pid << (stats.supervisor.running ? "" : " (not running)")
                  << "\n";
        std::cout << "lookups:          " << stats.lookups << " (" << stats.lookup_failures << " failed)\n";
        std::cout << "restarts:         " << stats.restarts << "\n";
        std::cout << "crash attempts:   " << stats.supervisor.restart.attempt_count << "/"
                  << stats.supervisor.restart.max_attempts
                  << (stats.supervisor.manual_intervention_required ? " (manual restart required)" : "") << "\n";
        std::cout << "pending requests: " << stats.pending_requests << " (" << stats.tracked_ids << " ids tracked)\n";
        std::cout << "broker:           sent " << stats.broker.sent << ", resolved " << stats.broker.resolved
                  << ", rejected " << stats.broker.rejected << ", timed out " << stats.broker.timed_out << ", late "
                  << stats.broker.late_responses << "\n";
        std::cout << "auto-respawn:     " << stats.auto_respawn.request_count << " requests, "
                  << stats.auto_respawn.minutes_since_last_respawn << " min since last respawn\n";
    }

    // Returns false when the loop should stop
    bool handle_command(wordserve::client::CompletionClient &client, const std::string &line)
    {
        std::istringstream in(line);
        std::string command;
        in >> command;

        if (command == ":quit" || command == ":q")
        {
            return false;
        }
        if (command == ":help")
        {
            print_help();
        }
        else if (command == ":restart")
        {
            std::cout << (client.restart() ? "engine restarted\n" : "restart failed\n");
        }
        else if (command == ":dict")
        {
            int chunks = 0;
            if (!(in >> chunks))
            {
                std::cout << "usage: :dict N\n";
                return true;
            }
            auto result = client.set_dictionary_size(chunks);
            print_result(result);
            if (result.ok)
            {
                std::cout << "chunks: " << result.current_chunks << "/" << result.available_chunks << "\n";
            }
        }
        else if (command == ":info")
        {
            auto result = client.get_dictionary_info();
            if (result.ok)
            {
                std::cout << "chunks: " << result.current_chunks << "/" << result.available_chunks << "\n";
            }
            else
            {
                print_result(result);
            }
        }
        else if (command == ":config-path")
        {
            print_result(client.get_config_path());
        }
        else if (command == ":stats")
        {
            print_stats(client.stats());
        }
        else
        {
            std::cout << "unknown command: " << command << " (try :help)\n";
        }
        return true;
    }
} // namespace

int main(int argc, char **argv)
{
    // Parse CLI arguments
    std::string config_path = "wordserve.yaml"; // Default

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if (arg.substr(0, 9) == "--config=")
        {
            config_path = arg.substr(9);
        }
        else if (arg == "--help" || arg == "-h")
        {
            std::cerr << "Usage: wordserve-client [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to config file (default: wordserve.yaml)\n";
            std::cerr << "  --help, -h       Show this help\n";
            return 0;
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    // Check if config exists
    if (!std::filesystem::exists(config_path))
    {
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        std::cerr << "\nCreate a config file or specify path with --config=PATH\n";
        return 1;
    }

    auto logger = wordserve::logging::make_logger();
    LOG_INFO(*logger, "wordserve-client starting...");
    LOG_INFO(*logger, "Loading config: " << config_path);

    // Load configuration
    wordserve::runtime::ClientConfig config;
    std::string error;

    if (!wordserve::runtime::load_config(config_path, config, error, logger))
    {
        LOG_ERROR(*logger, "Failed to load config: " << error);
        return 1;
    }

    // Initialize logger level
    logger->set_level(wordserve::logging::string_to_level(config.logging.level));

    wordserve::client::CompletionClient client(config, logger);

    if (!client.initialize())
    {
        LOG_ERROR(*logger, "Engine initialization failed");
        return 1;
    }

    // Install signal handler for graceful shutdown
    wordserve::runtime::SignalHandler::install();

    LOG_INFO(*logger, "Client Ready (type :help for commands)");

    std::string line;
    while (!wordserve::runtime::SignalHandler::is_shutdown_requested() && std::getline(std::cin, line))
    {
        if (line.empty())
        {
            continue;
        }
        if (line[0] == ':')
        {
            if (!handle_command(client, line))
            {
                break;
            }
            continue;
        }

        auto suggestions = client.get_suggestions(line);
        if (suggestions.empty())
        {
            std::cout << "(no suggestions)\n";
        }
        for (const auto &s : suggestions)
        {
            std::cout << s.rank << ". " << s.word << "\n";
        }
        std::cout.flush();
    }

    if (wordserve::runtime::SignalHandler::is_shutdown_requested())
    {
        LOG_INFO(*logger, "Signal received, stopping client...");
    }

    client.cleanup();
    LOG_INFO(*logger, "Shutdown complete");
    return 0;
}
