#pragma once

#include <sys/types.h>

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "logging/logger.hpp"
#include "transport/stdio_channel.hpp"

namespace wordserve
{
    namespace engine
    {

        // EngineProcess manages the lifecycle of the completion engine child process
        // Responsibilities:
        // - Spawn process with redirected stdin/stdout/stderr
        // - Reap the child and remember its exit status
        // - Clean/forced shutdown
        class EngineProcess
        {
        public:
            EngineProcess(const std::string &executable_path, const std::vector<std::string> &args,
                          logging::LoggerPtr logger, int shutdown_timeout_ms = 2000);
            ~EngineProcess();

            // Delete copy/move
            EngineProcess(const EngineProcess &) = delete;
            EngineProcess &operator=(const EngineProcess &) = delete;

            // Spawn the engine process
            // Returns true on success, false on failure (sets error_)
            bool spawn();

            // Check if process is still running (reaps it if it has exited)
            bool is_running();

            // Block up to timeout_ms (-1 = forever) for the child to exit.
            // Returns true once the child has been reaped.
            bool wait_for_exit(int timeout_ms);

            // Exit code once reaped; 128+signal for signalled children
            std::optional<int> exit_code() const;

            // Shutdown sequence: EOF -> wait -> kill
            void shutdown();

            // Send SIGKILL without waiting (simulates a crash / external kill)
            void kill_now();

            transport::StdioChannel &channel() { return channel_; }

            pid_t pid() const { return pid_; }
            const std::string &executable_path() const { return executable_path_; }
            const std::vector<std::string> &args() const { return args_; }
            const std::string &last_error() const { return error_; }

        private:
            std::string executable_path_;
            std::vector<std::string> args_;
            logging::LoggerPtr logger_;
            int shutdown_timeout_ms_;
            std::string error_;

            transport::StdioChannel channel_;

            pid_t pid_;
            bool reaped_;
            std::optional<int> exit_code_;
            mutable std::mutex reap_mutex_;

            // Non-blocking waitpid; true if the child is gone
            bool try_reap();
        };

    } // namespace engine
} // namespace wordserve
