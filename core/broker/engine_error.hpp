#pragma once

#include <stdexcept>
#include <string>

namespace wordserve
{
    namespace broker
    {

        /**
         * @brief Failure categories for requests sent to the engine
         *
         * - NOT_RUNNING: no live engine process at send time
         * - TIMEOUT: no response within the request deadline
         * - PROCESS_EXIT: engine exited while the request was pending
         * - DECODE_FAILURE: malformed engine output (logged, never delivered to callers)
         * - ID_SPACE_EXHAUSTED: no free correlation id
         * - AGED_OUT: evicted by stale-id cleanup
         * - CANCELLED: torn down by cleanup or restart
         * - WRITE_FAILED: frame could not be written to engine stdin
         * - BACKEND: engine answered with an embedded error
         */
        enum class ErrorCode
        {
            NOT_RUNNING,
            TIMEOUT,
            PROCESS_EXIT,
            DECODE_FAILURE,
            ID_SPACE_EXHAUSTED,
            AGED_OUT,
            CANCELLED,
            WRITE_FAILED,
            BACKEND
        };

        inline const char *error_code_to_string(ErrorCode code)
        {
            switch (code)
            {
            case ErrorCode::NOT_RUNNING:
                return "NOT_RUNNING";
            case ErrorCode::TIMEOUT:
                return "TIMEOUT";
            case ErrorCode::PROCESS_EXIT:
                return "PROCESS_EXIT";
            case ErrorCode::DECODE_FAILURE:
                return "DECODE_FAILURE";
            case ErrorCode::ID_SPACE_EXHAUSTED:
                return "ID_SPACE_EXHAUSTED";
            case ErrorCode::AGED_OUT:
                return "AGED_OUT";
            case ErrorCode::CANCELLED:
                return "CANCELLED";
            case ErrorCode::WRITE_FAILED:
                return "WRITE_FAILED";
            case ErrorCode::BACKEND:
                return "BACKEND";
            default:
                return "UNKNOWN";
            }
        }

        /**
         * @brief Exception stored in a rejected request future
         */
        class EngineError : public std::runtime_error
        {
        public:
            EngineError(ErrorCode code, const std::string &message, int backend_code = 0)
                : std::runtime_error(message), code_(code), backend_code_(backend_code) {}

            ErrorCode code() const { return code_; }

            // Engine-provided error code, only meaningful for BACKEND
            int backend_code() const { return backend_code_; }

        private:
            ErrorCode code_;
            int backend_code_;
        };

    } // namespace broker
} // namespace wordserve
