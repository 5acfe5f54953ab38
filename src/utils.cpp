#include "utils.hpp"

#include "localization.hpp"

#include <sys/file.h>
#include <unistd.h>
#include <fcntl.h>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

std::optional<LogLevel> parse_log_level(std::string_view name) {
    std::string lower;
    for (char c : name) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error" || lower == "critical") return LogLevel::Error;
    return std::nullopt;
}

std::string_view log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

Logger::Logger(LogLevel level, bool console)
    : level_(level), console_(console) {
    stdout_tty_ = isatty(STDOUT_FILENO);
    stderr_tty_ = isatty(STDERR_FILENO);
}

void Logger::open_file(const fs::path& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (path.has_parent_path()) {
        ensure_dir_exists(path.parent_path());
    }
    file_.open(path, std::ios::app);
    if (!file_.is_open()) {
        throw SysupException(string_format("error.open_file_failed", path.string()) + ": " + strerror(errno));
    }
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

void Logger::debug(std::string_view msg) {
    write(LogLevel::Debug, COLOR_CYAN, msg);
}

void Logger::info(std::string_view msg) {
    write(LogLevel::Info, COLOR_GREEN, msg);
}

void Logger::warning(std::string_view msg) {
    write(LogLevel::Warning, COLOR_YELLOW, msg);
}

void Logger::error(std::string_view msg) {
    write(LogLevel::Error, COLOR_RED, msg);
}

void Logger::write(LogLevel level, std::string_view color, std::string_view msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < level_) return;

    if (file_.is_open()) {
        file_ << format_timestamp(std::chrono::system_clock::now()) << " - "
              << log_level_name(level) << " - " << msg << '\n';
        file_.flush();
    }

    if (!console_) return;

    std::string prefix;
    switch (level) {
        case LogLevel::Debug: prefix = get_string("debug.prefix") + " "; break;
        case LogLevel::Info: prefix = get_string("info.log_prefix"); break;
        case LogLevel::Warning: prefix = get_string("warning.prefix") + " "; break;
        case LogLevel::Error: prefix = get_string("error.prefix") + " "; break;
    }

    const bool to_stderr = level >= LogLevel::Warning;
    std::ostream& stream = to_stderr ? std::cerr : std::cout;
    const bool tty = to_stderr ? stderr_tty_ : stdout_tty_;
    if (tty) {
        stream << color << prefix << COLOR_WHITE << msg << COLOR_RESET << std::endl;
    } else {
        stream << prefix << msg << std::endl;
    }
}

RunLock::RunLock(const fs::path& lock_file) {
    if (lock_file.has_parent_path()) {
        ensure_dir_exists(lock_file.parent_path());
    }
    lock_fd = open(lock_file.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (lock_fd < 0) {
        throw SysupException(string_format("error.create_file_failed", lock_file.string()));
    }

    if (flock(lock_fd, LOCK_EX | LOCK_NB) < 0) {
        int err = errno;
        close(lock_fd);
        lock_fd = -1;
        if (err == EWOULDBLOCK) {
            throw SysupException(get_string("error.run_locked"));
        } else {
            throw SysupException(get_string("error.run_lock_failed"));
        }
    }
}

RunLock::~RunLock() {
    if (lock_fd != -1) {
        flock(lock_fd, LOCK_UN);
        close(lock_fd);
        lock_fd = -1;
    }
}

bool is_interactive_session() {
    return isatty(STDIN_FILENO) && isatty(STDERR_FILENO);
}

std::string trim(std::string_view s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return std::string(s.substr(begin, end - begin));
}

std::vector<std::string> split_list(std::string_view s, char sep) {
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= s.size()) {
        size_t pos = s.find(sep, start);
        if (pos == std::string_view::npos) pos = s.size();
        std::string item = trim(s.substr(start, pos - start));
        if (!item.empty()) items.push_back(std::move(item));
        start = pos + 1;
    }
    return items;
}

std::vector<std::string> split_whitespace(std::string_view s) {
    std::istringstream iss{std::string(s)};
    std::vector<std::string> words;
    std::string word;
    while (iss >> word) words.push_back(word);
    return words;
}

std::string join(const std::vector<std::string>& parts, std::string_view sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

fs::path expand_user_path(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    const char* home = getenv("HOME");
    if (!home) return path;
    if (path.size() == 1) return fs::path(home);
    if (path[1] == '/') return fs::path(home) / path.substr(2);
    return path;
}

void ensure_dir_exists(const fs::path& path) {
    if (!fs::exists(path)) {
        std::error_code ec;
        if (!fs::create_directories(path, ec)) {
            throw SysupException(string_format("error.create_dir_failed", path.string()) + ": " + ec.message());
        }
    }
    else if (!fs::is_directory(path)) {
        throw SysupException(string_format("error.path_not_dir", path.string()));
    }
}
