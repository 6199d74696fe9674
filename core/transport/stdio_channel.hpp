#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <sys/types.h>

namespace wordserve {
namespace transport {

// StdioChannel owns the parent's ends of the three pipes connected to the
// engine: stdin (write), stdout (read), stderr (read).
//
// The write side and the read side may be driven from different threads
// (callers write frames while the I/O thread polls). Each side records its
// errors in its own field so neither thread touches the other's state.
// set_handles() and close_all() must not race with either side.
class StdioChannel {
public:
    using PipeHandle = int;  // file descriptor

    enum class Stream { STDOUT, STDERR };

    struct PollResult {
        bool stdout_ready = false;
        bool stderr_ready = false;
    };

    StdioChannel();
    ~StdioChannel();

    // Delete copy/move (manages OS handles)
    StdioChannel(const StdioChannel &) = delete;
    StdioChannel &operator=(const StdioChannel &) = delete;

    void set_handles(PipeHandle stdin_write, PipeHandle stdout_read, PipeHandle stderr_read);

    // Write all bytes to the engine's stdin (handles partial writes, EINTR, etc.)
    // Returns true on success, false on error or timeout (sets last_write_error())
    bool write_all(const uint8_t *data, size_t len, int timeout_ms = -1);

    // Wait until stdout or stderr has data or hit EOF. A closed stream reports
    // ready so the following read_some() observes the EOF.
    // Returns false on timeout or error (sets last_read_error() on error)
    bool wait_for_data(int timeout_ms, PollResult &result);

    // Read whatever is available: >0 bytes read, 0 on EOF, -1 on error (sets last_read_error())
    ssize_t read_some(Stream stream, uint8_t *buf, size_t n);

    bool is_open(Stream stream) const;

    // Close stdin (signals EOF to the engine)
    void close_stdin();
    void close_stream(Stream stream);
    void close_all();

    const std::string &last_write_error() const { return write_error_; }
    const std::string &last_read_error() const { return read_error_; }

private:
    PipeHandle stdin_write_;
    PipeHandle stdout_read_;
    PipeHandle stderr_read_;
    std::string write_error_;  // write_all() only
    std::string read_error_;   // wait_for_data() and read_some() only

    PipeHandle &handle(Stream stream) { return stream == Stream::STDOUT ? stdout_read_ : stderr_read_; }
    PipeHandle handle(Stream stream) const { return stream == Stream::STDOUT ? stdout_read_ : stderr_read_; }
};

}  // namespace transport
}  // namespace wordserve
