#include "vdl/platform.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace vdl {

namespace {

// RAII pair of pipe descriptors
class Pipe {
public:
    Pipe() {
        if (::pipe(fds_) != 0) {
            fds_[0] = fds_[1] = -1;
        }
    }
    ~Pipe() {
        close_read();
        close_write();
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    explicit operator bool() const { return fds_[0] >= 0 && fds_[1] >= 0; }

    int read_fd() const { return fds_[0]; }
    int write_fd() const { return fds_[1]; }

    void close_read() {
        if (fds_[0] >= 0) {
            ::close(fds_[0]);
            fds_[0] = -1;
        }
    }
    void close_write() {
        if (fds_[1] >= 0) {
            ::close(fds_[1]);
            fds_[1] = -1;
        }
    }

private:
    int fds_[2];
};

// Returns false once the descriptor reached EOF or failed
bool drain(int fd, std::string& sink) {
    char buffer[4096];
    ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if (n > 0) {
        sink.append(buffer, static_cast<size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    return false;
}

} // namespace

ProcessResult run_process(const std::vector<std::string>& args, int timeout_seconds) {
    ProcessResult result;

    if (args.empty()) {
        result.error = "empty command";
        return result;
    }

    Pipe out_pipe;
    Pipe err_pipe;
    if (!out_pipe || !err_pipe) {
        result.error = "pipe failed: " + std::string(strerror(errno));
        return result;
    }

    // Build C-style argv before fork
    std::vector<char*> argv;
    for (const auto& s : args) {
        argv.push_back(const_cast<char*>(s.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();

    if (pid == -1) {
        result.error = "fork failed: " + std::string(strerror(errno));
        return result;
    }

    if (pid == 0) {
        // Child process
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        ::dup2(out_pipe.write_fd(), STDOUT_FILENO);
        ::dup2(err_pipe.write_fd(), STDERR_FILENO);
        out_pipe.close_read();
        err_pipe.close_read();

        execvp(argv[0], argv.data());

        // If execvp returns, it failed
        _exit(127);
    }

    // Parent process
    out_pipe.close_write();
    err_pipe.close_write();

    using clock = std::chrono::steady_clock;
    auto deadline = clock::now() + std::chrono::seconds(timeout_seconds);

    bool out_open = true;
    bool err_open = true;
    while (out_open || err_open) {
        struct pollfd fds[2];
        nfds_t count = 0;
        if (out_open) fds[count++] = {out_pipe.read_fd(), POLLIN, 0};
        if (err_open) fds[count++] = {err_pipe.read_fd(), POLLIN, 0};

        int wait_ms = -1;
        if (timeout_seconds > 0) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - clock::now()).count();
            if (remaining <= 0) {
                result.timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(remaining);
        }

        int ready = ::poll(fds, count, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            result.error = "poll failed: " + std::string(strerror(errno));
            break;
        }
        if (ready == 0) {
            continue;  // deadline re-checked at loop top
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) continue;
            if (fds[i].fd == out_pipe.read_fd()) {
                out_open = drain(fds[i].fd, result.out);
            } else {
                err_open = drain(fds[i].fd, result.err);
            }
        }
    }

    if (result.timed_out || !result.error.empty()) {
        ::kill(pid, SIGKILL);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            result.error = "waitpid failed: " + std::string(strerror(errno));
            return result;
        }
    }

    if (!result.error.empty()) {
        return result;
    }
    if (result.timed_out) {
        result.error = "process timed out after " + std::to_string(timeout_seconds) + "s";
        return result;
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        result.ok = true;
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
        result.ok = true;
    } else {
        result.error = "process terminated abnormally";
    }

    return result;
}

} // namespace vdl
