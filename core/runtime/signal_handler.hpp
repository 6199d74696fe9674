#pragma once

#include <atomic>

namespace wordserve
{
    namespace runtime
    {

        // Process-wide SIGINT/SIGTERM latch for the CLI host
        class SignalHandler
        {
        public:
            // Installed without SA_RESTART so a blocking stdin read returns EINTR
            static void install();

            static bool is_shutdown_requested();

            // Test hook
            static void reset();

        private:
            static void handle_signal(int signal);
            static std::atomic<bool> shutdown_requested_;
        };

    } // namespace runtime
} // namespace wordserve
