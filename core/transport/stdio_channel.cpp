#include "stdio_channel.hpp"

#include <errno.h>
#include <poll.h>
#include <unistd.h>

#include <chrono>
#include <cstring>
#include <thread>

namespace wordserve {
namespace transport {

namespace {
constexpr StdioChannel::PipeHandle kInvalidHandle = -1;

void close_handle(StdioChannel::PipeHandle &fd) {
    if (fd >= 0) {
        close(fd);
        fd = kInvalidHandle;
    }
}
}  // namespace

StdioChannel::StdioChannel()
    : stdin_write_(kInvalidHandle), stdout_read_(kInvalidHandle), stderr_read_(kInvalidHandle) {}

StdioChannel::~StdioChannel() { close_all(); }

void StdioChannel::set_handles(PipeHandle stdin_write, PipeHandle stdout_read, PipeHandle stderr_read) {
    close_all();
    stdin_write_ = stdin_write;
    stdout_read_ = stdout_read;
    stderr_read_ = stderr_read;
    write_error_.clear();
    read_error_.clear();
}

bool StdioChannel::write_all(const uint8_t *data, size_t len, int timeout_ms) {
    if (stdin_write_ < 0) {
        write_error_ = "stdin pipe closed";
        return false;
    }

    size_t total = 0;
    auto start_time = std::chrono::steady_clock::now();

    while (total < len) {
        if (timeout_ms >= 0) {
            auto elapsed = std::chrono::steady_clock::now() - start_time;
            auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
            if (elapsed_ms >= timeout_ms) {
                write_error_ = "Timeout writing frame";
                return false;
            }

            // Engine not draining stdin: wait for room instead of blocking in write()
            struct pollfd pfd;
            pfd.fd = stdin_write_;
            pfd.events = POLLOUT;
            int result = poll(&pfd, 1, static_cast<int>(timeout_ms - elapsed_ms));
            if (result < 0) {
                if (errno == EINTR) {
                    continue;
                }
                write_error_ = "poll failed: " + std::string(strerror(errno));
                return false;
            }
            if (result == 0) {
                continue;  // re-check the deadline
            }
            if ((pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) != 0 && (pfd.revents & POLLOUT) == 0) {
                write_error_ = "Broken pipe (engine terminated)";
                return false;
            }
        }

        ssize_t w = write(stdin_write_, data + total, len - total);
        if (w < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                continue;
            }
            if (errno == EPIPE) {
                write_error_ = "Broken pipe (engine terminated)";
            } else {
                write_error_ = "Write failed: " + std::string(strerror(errno));
            }
            return false;
        }
        if (w == 0) {
            write_error_ = "Write returned 0 bytes";
            return false;
        }
        total += static_cast<size_t>(w);
    }
    return true;
}

bool StdioChannel::wait_for_data(int timeout_ms, PollResult &result) {
    read_error_.clear();
    result = PollResult{};

    struct pollfd pfds[2];
    nfds_t count = 0;
    int stdout_index = -1;
    int stderr_index = -1;
    if (stdout_read_ >= 0) {
        pfds[count].fd = stdout_read_;
        pfds[count].events = POLLIN;
        pfds[count].revents = 0;
        stdout_index = static_cast<int>(count++);
    }
    if (stderr_read_ >= 0) {
        pfds[count].fd = stderr_read_;
        pfds[count].events = POLLIN;
        pfds[count].revents = 0;
        stderr_index = static_cast<int>(count++);
    }
    if (count == 0) {
        read_error_ = "No open output pipes";
        return false;
    }

    int rc = poll(pfds, count, timeout_ms);
    if (rc < 0) {
        if (errno == EINTR) {
            return false;
        }
        read_error_ = "poll failed: " + std::string(strerror(errno));
        return false;
    }
    if (rc == 0) {
        return false;
    }

    // POLLHUP without POLLIN means EOF; let the reader see it
    const short ready_mask = POLLIN | POLLHUP | POLLERR;
    if (stdout_index >= 0 && (pfds[stdout_index].revents & ready_mask) != 0) {
        result.stdout_ready = true;
    }
    if (stderr_index >= 0 && (pfds[stderr_index].revents & ready_mask) != 0) {
        result.stderr_ready = true;
    }
    if ((stdout_index >= 0 && (pfds[stdout_index].revents & POLLNVAL) != 0) ||
        (stderr_index >= 0 && (pfds[stderr_index].revents & POLLNVAL) != 0)) {
        read_error_ = "poll error on output pipe";
        return false;
    }
    return result.stdout_ready || result.stderr_ready;
}

ssize_t StdioChannel::read_some(Stream stream, uint8_t *buf, size_t n) {
    PipeHandle fd = handle(stream);
    if (fd < 0) {
        return 0;
    }

    while (true) {
        ssize_t r = read(fd, buf, n);
        if (r < 0) {
            if (errno == EINTR) {
                continue;
            }
            read_error_ = "Read failed: " + std::string(strerror(errno));
            return -1;
        }
        return r;
    }
}

bool StdioChannel::is_open(Stream stream) const { return handle(stream) >= 0; }

void StdioChannel::close_stdin() { close_handle(stdin_write_); }

void StdioChannel::close_stream(Stream stream) { close_handle(handle(stream)); }

void StdioChannel::close_all() {
    close_handle(stdin_write_);
    close_handle(stdout_read_);
    close_handle(stderr_read_);
}

}  // namespace transport
}  // namespace wordserve
