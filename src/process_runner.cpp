#include "process_runner.hpp"
#include "errors.hpp"

#include <cerrno>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace blossom {

namespace {

class Pipe {
public:
    Pipe() {
        if (::pipe(fds_) != 0) {
            throw ProcessError(std::string("pipe() failed: ") + std::strerror(errno));
        }
    }
    ~Pipe() {
        close_read();
        close_write();
    }
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    int read_end() const { return fds_[0]; }
    int write_end() const { return fds_[1]; }

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
    int fds_[2] = {-1, -1};
};

void set_cloexec(int fd) {
    int flags = ::fcntl(fd, F_GETFD);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
    }
}

int exit_code_from(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

int wait_for_child(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    return exit_code_from(status);
}

// A child can close its pipes and keep running, so reaping is held to the
// same deadline as reading. Sets timed_out when the child had to be killed.
int wait_for_child_until(pid_t pid, std::chrono::steady_clock::time_point deadline, bool& timed_out) {
    for (;;) {
        int status = 0;
        pid_t done = ::waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            return exit_code_from(status);
        }
        if (done < 0 && errno != EINTR) {
            return -1;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            timed_out = true;
            ::kill(pid, SIGKILL);
            return wait_for_child(pid);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

// Returns false once the descriptor hits EOF.
bool drain(int fd, std::string& sink) {
    char buffer[16384];
    for (;;) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            sink.append(buffer, static_cast<size_t>(n));
            if (static_cast<size_t>(n) < sizeof(buffer)) {
                return true;
            }
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

} // namespace

std::string describe_command(const std::vector<std::string>& argv) {
    std::string out;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i) out += ' ';
        out += argv[i];
    }
    return out;
}

ProcessResult SubprocessRunner::run(const std::vector<std::string>& argv,
                                    std::chrono::milliseconds timeout) {
    if (argv.empty()) {
        throw ProcessError("Cannot run an empty command");
    }

    Pipe out_pipe;
    Pipe err_pipe;
    Pipe exec_pipe;
    set_cloexec(exec_pipe.write_end());

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        throw ProcessError(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        ::dup2(out_pipe.write_end(), STDOUT_FILENO);
        ::dup2(err_pipe.write_end(), STDERR_FILENO);
        ::close(out_pipe.read_end());
        ::close(out_pipe.write_end());
        ::close(err_pipe.read_end());
        ::close(err_pipe.write_end());
        ::close(exec_pipe.read_end());

        ::execvp(c_argv[0], c_argv.data());

        int err = errno;
        ssize_t ignored = ::write(exec_pipe.write_end(), &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    out_pipe.close_write();
    err_pipe.close_write();
    exec_pipe.close_write();

    int exec_errno = 0;
    ssize_t got;
    do {
        got = ::read(exec_pipe.read_end(), &exec_errno, sizeof(exec_errno));
    } while (got < 0 && errno == EINTR);

    if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
        wait_for_child(pid);
        throw ProcessError("Failed to execute " + argv[0] + ": " + std::strerror(exec_errno));
    }

    ProcessResult result;
    const bool bounded = timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    ::fcntl(out_pipe.read_end(), F_SETFL, ::fcntl(out_pipe.read_end(), F_GETFL) | O_NONBLOCK);
    ::fcntl(err_pipe.read_end(), F_SETFL, ::fcntl(err_pipe.read_end(), F_GETFL) | O_NONBLOCK);

    bool out_open = true;
    bool err_open = true;

    while (out_open || err_open) {
        int wait_ms = -1;
        if (bounded) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                result.timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(remaining.count());
        }

        struct pollfd fds[2];
        nfds_t count = 0;
        if (out_open) fds[count++] = {out_pipe.read_end(), POLLIN, 0};
        if (err_open) fds[count++] = {err_pipe.read_end(), POLLIN, 0};

        int ready = ::poll(fds, count, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            ::kill(pid, SIGKILL);
            wait_for_child(pid);
            throw ProcessError(std::string("poll() failed: ") + std::strerror(errno));
        }
        if (ready == 0) {
            continue;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }
            if (fds[i].fd == out_pipe.read_end()) {
                out_open = drain(fds[i].fd, result.stdout_data);
            } else {
                err_open = drain(fds[i].fd, result.stderr_data);
            }
        }
    }

    if (result.timed_out) {
        ::kill(pid, SIGKILL);
        result.exit_code = wait_for_child(pid);
    } else if (bounded) {
        result.exit_code = wait_for_child_until(pid, deadline, result.timed_out);
    } else {
        result.exit_code = wait_for_child(pid);
    }

    return result;
}

} // namespace blossom
