#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

class SysupException : public std::runtime_error {
public:
    explicit SysupException(const std::string& message)
        : std::runtime_error(message) {}
};

// Invalid or contradictory configuration, raised before a run starts.
class ConfigError : public SysupException {
public:
    explicit ConfigError(const std::string& message)
        : SysupException(message) {}
};

// Unknown manager id referenced from the command line or configuration.
class NotFoundError : public SysupException {
public:
    explicit NotFoundError(const std::string& message)
        : SysupException(message) {}
};

// A manager method other than is_available() was called on a manager whose
// tool is not installed.
class ManagerUnavailableError : public SysupException {
public:
    explicit ManagerUnavailableError(const std::string& message)
        : SysupException(message) {}
};

class PrivilegeAbortedError : public SysupException {
public:
    explicit PrivilegeAbortedError(const std::string& message)
        : SysupException(message) {}
};

class InvocationError : public SysupException {
public:
    enum class Kind {
        Failed,
        Timeout,
        Cancelled
    };

    InvocationError(Kind kind, const std::string& message,
                    std::optional<int> exit_code = std::nullopt,
                    std::string output = {})
        : SysupException(message), kind_(kind), exit_code_(exit_code), output_(std::move(output)) {}

    Kind kind() const { return kind_; }
    std::optional<int> exit_code() const { return exit_code_; }
    // Captured stderr (or stdout when stderr was empty), possibly partial.
    const std::string& output() const { return output_; }

private:
    Kind kind_;
    std::optional<int> exit_code_;
    std::string output_;
};
