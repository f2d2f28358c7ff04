#include "exec/process_runner.hpp"
#include "exec/deadline.hpp"
#include "exec/scratch_dir.hpp"
#include "util/log.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <sstream>
#include <stdexcept>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace codegym {

// ─── Exec Result ───────────────────────────────────────────────

std::string formatSeconds(double seconds) {
    std::ostringstream os;
    if (std::floor(seconds) == seconds) {
        os << static_cast<long long>(seconds);
    } else {
        os << seconds;
    }
    return os.str();
}

ExecResult ExecResult::timeout(double seconds) {
    ExecResult r;
    r.exit_code = -1;
    r.timed_out = true;
    r.stderr_text = "Execution timed out after " + formatSeconds(seconds) + " seconds";
    return r;
}

ExecResult ExecResult::launchFailure(const std::string& message) {
    ExecResult r;
    r.exit_code = -1;
    r.stderr_text = message;
    return r;
}

// ─── Process Runner ────────────────────────────────────────────

ExecResult ProcessRunner::execute(const Invocation& invocation) {
    try {
        ScratchDir dir;
        for (const auto& [name, content] : invocation.files) {
            dir.writeFile(name, content);
        }

        for (const auto& cmd : invocation.setup) {
            ExecResult r = run(cmd, dir.path(), timeout_seconds_);
            if (r.timed_out) return r;
            if (!r.ok()) {
                CODEGYM_LOG_DEBUG("Setup command " << (cmd.empty() ? "" : cmd[0])
                                  << " exited with " << r.exit_code << ": " << r.stderr_text);
            }
        }

        return run(invocation.argv, dir.path(), timeout_seconds_);
    } catch (const std::exception& e) {
        return ExecResult::launchFailure(std::string("Error preparing execution: ") + e.what());
    }
}

// ─── Local Process Runner ──────────────────────────────────────

namespace {

struct Pipe {
    int fds[2] = {-1, -1};

    bool open() { return pipe2(fds, O_CLOEXEC) == 0; }
    int readEnd() const { return fds[0]; }
    int writeEnd() const { return fds[1]; }

    void closeRead() { closeFd(fds[0]); }
    void closeWrite() { closeFd(fds[1]); }

    ~Pipe() {
        closeRead();
        closeWrite();
    }

private:
    static void closeFd(int& fd) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
};

/// Read whatever is available on fd into out (up to cap bytes kept).
/// Returns false once the write end is closed.
bool drain(int fd, std::string& out, std::size_t cap) {
    char buffer[4096];
    while (true) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            if (out.size() < cap) {
                std::size_t keep = std::min(static_cast<std::size_t>(n), cap - out.size());
                out.append(buffer, keep);
            }
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

/// Non-blocking read of the close-on-exec status pipe. EOF means
/// exec succeeded; an int means it failed with that errno. Returns
/// false once the pipe has said either.
bool readExecStatus(int fd, int& exec_errno) {
    int err = 0;
    ssize_t got;
    do {
        got = ::read(fd, &err, sizeof(err));
    } while (got < 0 && errno == EINTR);
    if (got == static_cast<ssize_t>(sizeof(err))) {
        exec_errno = err;
        return false;
    }
    return got < 0 && (errno == EAGAIN || errno == EWOULDBLOCK);
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

/// SIGKILL the child's process group. The direct child is only
/// signalled by pid while it has not been reaped yet.
void killGroup(pid_t pid, bool reaped) {
    if (::kill(-pid, SIGKILL) != 0 && !reaped) {
        ::kill(pid, SIGKILL);
    }
}

[[noreturn]] void execChild(const std::vector<std::string>& argv,
                            const std::string& workdir,
                            int out_fd, int err_fd, int status_fd) {
    ::setpgid(0, 0);

    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
        ::dup2(devnull, STDIN_FILENO);
        ::close(devnull);
    }
    ::dup2(out_fd, STDOUT_FILENO);
    ::dup2(err_fd, STDERR_FILENO);

    if (!workdir.empty() && ::chdir(workdir.c_str()) != 0) {
        int err = errno;
        ssize_t ignored = ::write(status_fd, &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    ::execvp(args[0], args.data());

    int err = errno;
    ssize_t ignored = ::write(status_fd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

} // namespace

ExecResult LocalProcessRunner::run(const std::vector<std::string>& argv,
                                   const std::string& workdir,
                                   double timeout_seconds) {
    if (argv.empty() || argv[0].empty()) {
        return ExecResult::launchFailure("Error executing command: empty command line");
    }

    Pipe out_pipe, err_pipe, status_pipe;
    if (!out_pipe.open() || !err_pipe.open() || !status_pipe.open()) {
        return ExecResult::launchFailure("Error executing " + argv[0] +
                                         ": cannot create pipes: " + std::strerror(errno));
    }

    Deadline deadline(timeout_seconds);
    pid_t pid = ::fork();
    if (pid < 0) {
        return ExecResult::launchFailure("Error executing " + argv[0] +
                                         ": fork failed: " + std::strerror(errno));
    }
    if (pid == 0) {
        execChild(argv, workdir, out_pipe.writeEnd(), err_pipe.writeEnd(),
                  status_pipe.writeEnd());
    }

    ::setpgid(pid, pid);
    out_pipe.closeWrite();
    err_pipe.closeWrite();
    status_pipe.closeWrite();

    ::fcntl(out_pipe.readEnd(), F_SETFL, O_NONBLOCK);
    ::fcntl(err_pipe.readEnd(), F_SETFL, O_NONBLOCK);
    ::fcntl(status_pipe.readEnd(), F_SETFL, O_NONBLOCK);

    auto launchFailed = [&argv](int err) {
        return ExecResult::launchFailure("Error executing " + argv[0] + ": " + std::strerror(err));
    };

    ExecResult result;
    bool out_open = true;
    bool err_open = true;
    bool status_open = true;
    int exec_errno = 0;
    bool exited = false;
    int status = 0;

    while (!exited) {
        if (deadline.expired()) {
            killGroup(pid, false);
            ::waitpid(pid, &status, 0);
            CODEGYM_LOG_WARN("Killed " << argv[0] << " after " << formatSeconds(timeout_seconds) << "s");
            return ExecResult::timeout(timeout_seconds);
        }

        // The child is polled from fork on, so a stall before exec
        // is bounded by the deadline too.
        pollfd fds[3];
        nfds_t nfds = 0;
        if (out_open) fds[nfds++] = {out_pipe.readEnd(), POLLIN, 0};
        if (err_open) fds[nfds++] = {err_pipe.readEnd(), POLLIN, 0};
        if (status_open) fds[nfds++] = {status_pipe.readEnd(), POLLIN, 0};

        int wait_ms = deadline.remainingMillis(50);
        if (nfds > 0) {
            int rc = ::poll(fds, nfds, wait_ms);
            if (rc < 0 && errno != EINTR) {
                killGroup(pid, false);
                ::waitpid(pid, &status, 0);
                return ExecResult::launchFailure("Error executing " + argv[0] +
                                                 ": poll failed: " + std::strerror(errno));
            }
        } else {
            ::usleep(static_cast<useconds_t>(wait_ms) * 1000);
        }

        if (status_open) {
            status_open = readExecStatus(status_pipe.readEnd(), exec_errno);
            if (exec_errno != 0) {
                ::waitpid(pid, &status, 0);
                return launchFailed(exec_errno);
            }
        }
        if (out_open) out_open = drain(out_pipe.readEnd(), result.stdout_text, max_output_bytes_);
        if (err_open) err_open = drain(err_pipe.readEnd(), result.stderr_text, max_output_bytes_);

        pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid || (w < 0 && errno == ECHILD)) {
            exited = true;
        }
    }

    // A child that failed exec may be reaped before its status was read.
    if (status_open) {
        readExecStatus(status_pipe.readEnd(), exec_errno);
        if (exec_errno != 0) return launchFailed(exec_errno);
    }

    // Collect what the child wrote right before exiting, then make
    // sure nothing it left behind keeps running.
    if (out_open) drain(out_pipe.readEnd(), result.stdout_text, max_output_bytes_);
    if (err_open) drain(err_pipe.readEnd(), result.stderr_text, max_output_bytes_);
    killGroup(pid, true);

    result.exit_code = decodeStatus(status);
    return result;
}

} // namespace codegym
