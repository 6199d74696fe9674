#include "engine_process.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <filesystem>
#include <thread>

namespace wordserve {
namespace engine {

namespace {

// A dead engine must surface as EPIPE on write, not as a signal killing the host
void ignore_sigpipe_once() {
    static std::once_flag flag;
    std::call_once(flag, [] { signal(SIGPIPE, SIG_IGN); });
}

void set_cloexec(int fd) {
    int flags = fcntl(fd, F_GETFD);
    if (flags >= 0) {
        fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
    }
}

void close_pair(int fds[2]) {
    close(fds[0]);
    close(fds[1]);
}

}  // namespace

EngineProcess::EngineProcess(const std::string &executable_path, const std::vector<std::string> &args,
                             logging::LoggerPtr logger, int shutdown_timeout_ms)
    : executable_path_(executable_path),
      args_(args),
      logger_(std::move(logger)),
      shutdown_timeout_ms_(shutdown_timeout_ms),
      pid_(-1),
      reaped_(false) {}

EngineProcess::~EngineProcess() { shutdown(); }

bool EngineProcess::spawn() {
    LOG_INFO(*logger_, "[Engine] Spawning: " << executable_path_);
    error_.clear();

    if (pid_ > 0 && !reaped_) {
        error_ = "Engine process already spawned";
        return false;
    }

    // Check executable exists
    if (executable_path_.empty() || !std::filesystem::exists(executable_path_)) {
        error_ = "Executable not found: " + executable_path_;
        LOG_ERROR(*logger_, "[Engine] " << error_);
        return false;
    }

    ignore_sigpipe_once();

    int stdin_pipe[2];
    int stdout_pipe[2];
    int stderr_pipe[2];

    if (pipe(stdin_pipe) < 0) {
        error_ = "Failed to create stdin pipe";
        return false;
    }
    if (pipe(stdout_pipe) < 0) {
        error_ = "Failed to create stdout pipe";
        close_pair(stdin_pipe);
        return false;
    }
    if (pipe(stderr_pipe) < 0) {
        error_ = "Failed to create stderr pipe";
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        return false;
    }

    // Parent-side ends must not leak into later children
    set_cloexec(stdin_pipe[1]);
    set_cloexec(stdout_pipe[0]);
    set_cloexec(stderr_pipe[0]);

    // Build argv before fork; only async-signal-safe calls in the child
    std::string abs_path = std::filesystem::absolute(executable_path_).string();
    std::vector<char *> argv;
    argv.push_back(const_cast<char *>(abs_path.c_str()));
    for (const auto &arg : args_) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        error_ = "Fork failed";
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        return false;
    }

    if (pid == 0) {
        // Child process
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);

        signal(SIGPIPE, SIG_DFL);
        execv(abs_path.c_str(), argv.data());

        // If we get here, exec failed
        _exit(127);
    }

    // Parent process
    close(stdin_pipe[0]);
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    {
        std::lock_guard<std::mutex> lock(reap_mutex_);
        pid_ = pid;
        reaped_ = false;
        exit_code_.reset();
    }
    channel_.set_handles(stdin_pipe[1], stdout_pipe[0], stderr_pipe[0]);

    LOG_INFO(*logger_, "[Engine] Process spawned successfully (PID=" << pid_ << ")");
    return true;
}

bool EngineProcess::try_reap() {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    if (pid_ <= 0 || reaped_) {
        return true;
    }

    int status = 0;
    pid_t result;
    do {
        result = waitpid(pid_, &status, WNOHANG);
    } while (result == -1 && errno == EINTR);

    if (result == 0) {
        return false;
    }
    if (result == pid_) {
        reaped_ = true;
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code_ = 128 + WTERMSIG(status);
        } else {
            exit_code_ = -1;
        }
        return true;
    }

    // ECHILD: somebody else reaped it
    reaped_ = true;
    exit_code_ = -1;
    return true;
}

bool EngineProcess::is_running() { return pid_ > 0 && !try_reap(); }

bool EngineProcess::wait_for_exit(int timeout_ms) {
    auto start = std::chrono::steady_clock::now();
    while (true) {
        if (try_reap()) {
            return true;
        }

        if (timeout_ms >= 0) {
            auto elapsed = std::chrono::steady_clock::now() - start;
            if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() >= timeout_ms) {
                return false;
            }
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

std::optional<int> EngineProcess::exit_code() const {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    return exit_code_;
}

void EngineProcess::shutdown() {
    if (!is_running()) {
        channel_.close_stdin();
        return;
    }

    LOG_INFO(*logger_, "[Engine] Initiating shutdown (PID=" << pid_ << ")");

    // 1. Send EOF
    channel_.close_stdin();

    // 2. Wait with timeout
    if (wait_for_exit(shutdown_timeout_ms_)) {
        LOG_INFO(*logger_, "[Engine] Clean shutdown");
        return;
    }

    // 3. Forced kill
    LOG_WARN(*logger_, "[Engine] Timeout - forcing termination");
    kill_now();
    if (!wait_for_exit(500)) {
        LOG_ERROR(*logger_, "[Engine] Process " << pid_ << " did not exit after SIGKILL");
    }
}

void EngineProcess::kill_now() {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    if (pid_ > 0 && !reaped_) {
        kill(pid_, SIGKILL);
    }
}

}  // namespace engine
}  // namespace wordserve
