#pragma once

#include "utils.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Cancellation shared by the orchestrator and every in-flight invocation.
// Set from a signal handler (cancel()) or by an overall run deadline.
class CancelToken {
public:
    void cancel() noexcept { cancelled_.store(true); }
    void set_deadline(std::chrono::steady_clock::time_point deadline) noexcept {
        deadline_.store(deadline.time_since_epoch().count());
    }
    bool cancelled() const noexcept;

private:
    std::atomic<bool> cancelled_{false};
    std::atomic<std::chrono::steady_clock::rep> deadline_{0};
};

struct ProcessRequest {
    std::vector<std::string> argv;
    std::map<std::string, std::string> env;  // overrides on top of the inherited environment
    std::chrono::milliseconds timeout{0};    // zero means no limit
    // The command may prompt (sudo asking for a password): it stays in our
    // process group and inherits stdin so it can read the terminal.
    bool interactive = false;
};

struct ProcessOutput {
    int exit_code = -1;
    std::string out;
    std::string err;
    bool timed_out = false;
    bool cancelled = false;
    std::chrono::milliseconds elapsed{0};
};

// The raw execution surface: spawn a command, wait for it (bounded by the
// request timeout and the cancel token), return exit status and output.
class ProcessSpawner {
public:
    virtual ~ProcessSpawner() = default;
    virtual ProcessOutput spawn(const ProcessRequest& request, const CancelToken* cancel) = 0;
};

// fork/exec based spawner. The child runs in its own process group with
// stdin on /dev/null; on timeout or cancellation the whole group gets
// SIGTERM, then SIGKILL after a grace period. Interactive requests keep the
// terminal instead, and only the child itself is signalled.
class PosixSpawner : public ProcessSpawner {
public:
    ProcessOutput spawn(const ProcessRequest& request, const CancelToken* cancel) override;
};

enum class Effect {
    ReadOnly,
    Mutating
};

struct ExecOptions {
    Effect effect = Effect::ReadOnly;
    std::chrono::milliseconds timeout{0};  // zero uses the executor default
    std::vector<int> ok_exit_codes{0};
    std::map<std::string, std::string> env;
    bool interactive = false;
};

// Looks `program` up in a colon separated search path. Names containing a
// slash are checked as given.
std::optional<std::string> find_program(const std::string& program, const std::string& search_path);

// The single chokepoint every manager uses to run its tool.
class Executor {
public:
    Executor(ProcessSpawner& spawner, Logger& logger, std::chrono::seconds default_timeout);

    // In dry-run mode mutating invocations are refused outright.
    void set_dry_run(bool dry_run) { dry_run_ = dry_run; }
    bool dry_run() const { return dry_run_; }
    void set_cancel_token(const CancelToken* cancel) { cancel_ = cancel; }
    void set_extra_path(std::vector<std::string> dirs) { extra_path_ = std::move(dirs); }
    void set_env(const std::string& key, const std::string& value) { env_[key] = value; }

    // Runs the command and returns whatever happened. Throws only when a
    // mutating command is requested in dry-run mode.
    ProcessOutput run(const std::vector<std::string>& argv, const ExecOptions& options = {});

    // Like run(), but an exit code outside options.ok_exit_codes, a timeout
    // or a cancellation becomes an InvocationError.
    ProcessOutput check(const std::vector<std::string>& argv, const ExecOptions& options = {});

    bool resolve(const std::string& program) const;
    std::string search_path() const;

private:
    ProcessSpawner& spawner_;
    Logger& logger_;
    std::chrono::seconds default_timeout_;
    bool dry_run_ = false;
    const CancelToken* cancel_ = nullptr;
    std::vector<std::string> extra_path_;
    std::map<std::string, std::string> env_;
};
