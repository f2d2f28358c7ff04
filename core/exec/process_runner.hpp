#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace codegym {

// ─── Exec Result ───────────────────────────────────────────────
// Captured outcome of one process launch. exit_code == -1 means
// the process timed out or could not be launched at all.

struct ExecResult {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
    bool timed_out = false;

    bool ok() const { return exit_code == 0; }

    static ExecResult timeout(double seconds);
    static ExecResult launchFailure(const std::string& message);
};

/// Render a timeout as "N seconds" without trailing zeros.
std::string formatSeconds(double seconds);

// ─── Invocation ────────────────────────────────────────────────
// Everything needed to run one snippet: the source files to place
// in a fresh working directory, optional setup commands run there
// first, and the command whose output is captured.

struct Invocation {
    std::map<std::string, std::string> files;   // relative name → content
    std::vector<std::vector<std::string>> setup;
    std::vector<std::string> argv;
};

// ─── Process Runner ────────────────────────────────────────────
// Runs commands with a bounded wall-clock timeout. Never throws
// past run()/execute(): launch failures and timeouts come back as
// ExecResult values.
//
// run() is the primitive subclasses implement. execute() wraps it
// with a scoped scratch directory that is deleted on every path.

class ProcessRunner {
public:
    explicit ProcessRunner(double timeout_seconds = 60.0)
        : timeout_seconds_(timeout_seconds) {}
    virtual ~ProcessRunner() = default;

    /// Run argv inside workdir, killing it after timeout_seconds.
    virtual ExecResult run(const std::vector<std::string>& argv,
                           const std::string& workdir,
                           double timeout_seconds) = 0;

    /// Materialize the invocation in a scratch directory and run it
    /// with this runner's default timeout.
    ExecResult execute(const Invocation& invocation);

    double timeoutSeconds() const { return timeout_seconds_; }
    void setTimeoutSeconds(double seconds) { timeout_seconds_ = seconds; }

private:
    double timeout_seconds_;
};

// ─── Local Process Runner ──────────────────────────────────────
// fork/exec on the local machine. The child runs in its own process
// group so a timeout kills everything it spawned. stdin is
// /dev/null; stdout and stderr are captured up to max_output_bytes
// each (the rest is drained and discarded).

class LocalProcessRunner : public ProcessRunner {
public:
    static constexpr std::size_t DEFAULT_MAX_OUTPUT = 1024 * 1024;

    explicit LocalProcessRunner(double timeout_seconds = 60.0,
                                std::size_t max_output_bytes = DEFAULT_MAX_OUTPUT)
        : ProcessRunner(timeout_seconds), max_output_bytes_(max_output_bytes) {}

    ExecResult run(const std::vector<std::string>& argv,
                   const std::string& workdir,
                   double timeout_seconds) override;

    std::size_t maxOutputBytes() const { return max_output_bytes_; }

private:
    std::size_t max_output_bytes_;
};

} // namespace codegym
