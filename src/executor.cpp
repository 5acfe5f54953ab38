#include "executor.hpp"

#include "exception.hpp"
#include "localization.hpp"

#include <sys/stat.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>

extern char** environ;

namespace {

constexpr auto TERMINATE_GRACE = std::chrono::seconds(2);
constexpr int POLL_SLICE_MS = 100;

void close_fd(int& fd) {
    if (fd != -1) {
        close(fd);
        fd = -1;
    }
}

// Drains whatever is currently readable. Returns false once the writer side
// has been closed.
bool drain(int fd, std::string& sink) {
    char buffer[4096];
    while (true) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            sink.append(buffer, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        return false;
    }
}

std::string last_line(const std::string& text) {
    std::string t = trim(text);
    size_t pos = t.rfind('\n');
    return pos == std::string::npos ? t : t.substr(pos + 1);
}

} // anonymous namespace

bool CancelToken::cancelled() const noexcept {
    if (cancelled_.load()) return true;
    auto deadline = deadline_.load();
    return deadline != 0 && std::chrono::steady_clock::now().time_since_epoch().count() >= deadline;
}

std::optional<std::string> find_program(const std::string& program, const std::string& search_path) {
    auto executable = [](const std::string& path) {
        struct stat st;
        return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
    };

    if (program.empty()) return std::nullopt;
    if (program.find('/') != std::string::npos) {
        if (executable(program)) return program;
        return std::nullopt;
    }

    size_t start = 0;
    while (start <= search_path.size()) {
        size_t pos = search_path.find(':', start);
        if (pos == std::string::npos) pos = search_path.size();
        std::string dir = search_path.substr(start, pos - start);
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + program;
        if (executable(candidate)) return candidate;
        start = pos + 1;
    }
    return std::nullopt;
}

ProcessOutput PosixSpawner::spawn(const ProcessRequest& request, const CancelToken* cancel) {
    if (request.argv.empty()) {
        throw SysupException(get_string("error.empty_command"));
    }

    std::map<std::string, std::string> env_map;
    for (char** e = environ; e && *e; ++e) {
        std::string kv(*e);
        size_t pos = kv.find('=');
        if (pos != std::string::npos) env_map[kv.substr(0, pos)] = kv.substr(pos + 1);
    }
    for (const auto& [key, value] : request.env) env_map[key] = value;

    ProcessOutput output;
    const std::string path = env_map.contains("PATH") ? env_map["PATH"] : std::string("/usr/bin:/bin");
    const auto exe = find_program(request.argv[0], path);
    if (!exe) {
        output.exit_code = 127;
        output.err = request.argv[0] + ": command not found";
        return output;
    }

    std::vector<std::string> env_strings;
    env_strings.reserve(env_map.size());
    for (const auto& [key, value] : env_map) env_strings.push_back(key + "=" + value);

    std::vector<char*> c_args;
    for (const auto& arg : request.argv) c_args.push_back(const_cast<char*>(arg.c_str()));
    c_args.push_back(nullptr);
    std::vector<char*> c_env;
    for (const auto& kv : env_strings) c_env.push_back(const_cast<char*>(kv.c_str()));
    c_env.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        close_fd(err_pipe[0]); close_fd(err_pipe[1]);
        throw SysupException(string_format("error.pipe_failed", strerror(err)));
    }

    const auto start = std::chrono::steady_clock::now();
    pid_t pid = fork();
    if (pid == -1) {
        int err = errno;
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        close_fd(err_pipe[0]); close_fd(err_pipe[1]);
        throw SysupException(string_format("error.fork_failed", strerror(err)));
    }
    if (pid == 0) {
        if (!request.interactive) {
            setpgid(0, 0);
            int devnull = open("/dev/null", O_RDONLY);
            if (devnull != -1) dup2(devnull, STDIN_FILENO);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        execve(exe->c_str(), c_args.data(), c_env.data());
        _exit(127);
    }

    // Also set from the parent so the group exists before we might signal it.
    // A background group would be stopped by SIGTTIN on its first terminal
    // read, so interactive children stay in ours.
    if (!request.interactive) setpgid(pid, pid);
    const pid_t target = request.interactive ? pid : -pid;
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

    bool reaped = false;
    int status = 0;
    bool terminating = false;
    bool killed = false;
    std::chrono::steady_clock::time_point kill_at;

    while (out_pipe[0] != -1 || err_pipe[0] != -1 || !reaped) {
        const auto now = std::chrono::steady_clock::now();
        if (!terminating) {
            if (request.timeout.count() > 0 && now - start >= request.timeout) {
                output.timed_out = true;
            } else if (cancel && cancel->cancelled()) {
                output.cancelled = true;
            }
            if (output.timed_out || output.cancelled) {
                kill(target, SIGTERM);
                terminating = true;
                kill_at = now + TERMINATE_GRACE;
            }
        } else if (!killed && now >= kill_at) {
            kill(target, SIGKILL);
            killed = true;
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (out_pipe[0] != -1) fds[nfds++] = {out_pipe[0], POLLIN, 0};
        if (err_pipe[0] != -1) fds[nfds++] = {err_pipe[0], POLLIN, 0};
        if (nfds > 0) {
            int ready = poll(fds, nfds, POLL_SLICE_MS);
            if (ready < 0 && errno != EINTR) {
                close_fd(out_pipe[0]);
                close_fd(err_pipe[0]);
            }
        } else {
            poll(nullptr, 0, POLL_SLICE_MS / 2);
        }
        if (out_pipe[0] != -1 && !drain(out_pipe[0], output.out)) close_fd(out_pipe[0]);
        if (err_pipe[0] != -1 && !drain(err_pipe[0], output.err)) close_fd(err_pipe[0]);

        if (!reaped) {
            pid_t r = waitpid(pid, &status, WNOHANG);
            if (r == pid || (r == -1 && errno == ECHILD)) reaped = true;
        }
        // Output handles inherited by a lingering grandchild must not keep us
        // waiting once the direct child is gone and we are tearing down.
        if (reaped && killed) {
            close_fd(out_pipe[0]);
            close_fd(err_pipe[0]);
        }
    }

    output.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    if (WIFEXITED(status)) {
        output.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        output.exit_code = 128 + WTERMSIG(status);
    }
    return output;
}

Executor::Executor(ProcessSpawner& spawner, Logger& logger, std::chrono::seconds default_timeout)
    : spawner_(spawner), logger_(logger), default_timeout_(default_timeout) {}

ProcessOutput Executor::run(const std::vector<std::string>& argv, const ExecOptions& options) {
    if (argv.empty()) {
        throw SysupException(get_string("error.empty_command"));
    }
    const std::string command = join(argv);
    if (dry_run_ && options.effect == Effect::Mutating) {
        throw SysupException(string_format("error.dry_run_mutation", command));
    }

    if (cancel_ && cancel_->cancelled()) {
        ProcessOutput output;
        output.cancelled = true;
        return output;
    }

    ProcessRequest request;
    request.argv = argv;
    request.env = env_;
    for (const auto& [key, value] : options.env) request.env[key] = value;
    request.env["PATH"] = search_path();
    request.interactive = options.interactive;
    request.timeout = options.timeout.count() > 0
        ? options.timeout
        : std::chrono::duration_cast<std::chrono::milliseconds>(default_timeout_);

    logger_.debug(string_format("debug.exec_command", command));
    ProcessOutput output = spawner_.spawn(request, cancel_);
    logger_.debug(string_format("debug.exec_result", command, output.exit_code, output.elapsed.count()));
    return output;
}

ProcessOutput Executor::check(const std::vector<std::string>& argv, const ExecOptions& options) {
    ProcessOutput output = run(argv, options);
    const std::string command = join(argv);
    const std::string captured = output.err.empty() ? output.out : output.err;

    if (output.cancelled) {
        throw InvocationError(InvocationError::Kind::Cancelled,
                              string_format("error.invocation_cancelled", command), std::nullopt, captured);
    }
    if (output.timed_out) {
        throw InvocationError(InvocationError::Kind::Timeout,
                              string_format("error.invocation_timeout", command), std::nullopt, captured);
    }
    const auto& ok = options.ok_exit_codes;
    if (std::find(ok.begin(), ok.end(), output.exit_code) == ok.end()) {
        std::string message = string_format("error.invocation_failed", command, output.exit_code);
        if (std::string detail = last_line(captured); !detail.empty()) {
            message += ": " + detail;
        }
        throw InvocationError(InvocationError::Kind::Failed, message, output.exit_code, captured);
    }
    return output;
}

bool Executor::resolve(const std::string& program) const {
    return find_program(program, search_path()).has_value();
}

std::string Executor::search_path() const {
    std::string base;
    if (auto it = env_.find("PATH"); it != env_.end()) {
        base = it->second;
    } else if (const char* p = getenv("PATH")) {
        base = p;
    } else {
        base = "/usr/bin:/bin";
    }
    if (extra_path_.empty()) return base;
    return join(extra_path_, ":") + ":" + base;
}
