#pragma once

#include "exception.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

// Color codes
inline constexpr std::string_view COLOR_GREEN = "\033[1;32m";
inline constexpr std::string_view COLOR_WHITE = "\033[1;37m";
inline constexpr std::string_view COLOR_YELLOW = "\033[1;33m";
inline constexpr std::string_view COLOR_RED = "\033[1;31m";
inline constexpr std::string_view COLOR_CYAN = "\033[1;36m";
inline constexpr std::string_view COLOR_RESET = "\033[0m";

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

std::optional<LogLevel> parse_log_level(std::string_view name);
std::string_view log_level_name(LogLevel level);

// Console plus optional append-only file log. Every call writes exactly one
// whole line under a mutex, so concurrent managers never interleave mid-line.
class Logger {
public:
    explicit Logger(LogLevel level = LogLevel::Info, bool console = true);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // Opens (creating parent directories) the file sink in append mode.
    void open_file(const fs::path& path);
    void set_level(LogLevel level);
    LogLevel level() const { return level_; }

    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warning(std::string_view msg);
    void error(std::string_view msg);

private:
    void write(LogLevel level, std::string_view color, std::string_view msg);

    std::mutex mutex_;
    LogLevel level_;
    bool console_;
    bool stdout_tty_ = false;
    bool stderr_tty_ = false;
    std::ofstream file_;
};

// Prevents two sysup update runs (e.g. a scheduled one and a manual one)
// from driving the same tools at the same time.
class RunLock {
public:
    explicit RunLock(const fs::path& lock_file);
    ~RunLock();
    RunLock(const RunLock&) = delete;
    RunLock& operator=(const RunLock&) = delete;
private:
    int lock_fd = -1;
};

// True when stdin and stderr are both attached to a terminal.
bool is_interactive_session();

// String helpers
std::string trim(std::string_view s);
std::vector<std::string> split_list(std::string_view s, char sep = ',');
std::vector<std::string> split_whitespace(std::string_view s);
std::string join(const std::vector<std::string>& parts, std::string_view sep = " ");
std::string format_timestamp(std::chrono::system_clock::time_point tp);

// Filesystem utilities
fs::path expand_user_path(const std::string& path);
void ensure_dir_exists(const fs::path& path);
