#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

// One discoverable update. Versions are whatever the ecosystem prints; they
// are carried through for display and never compared.
struct PackageInfo {
    std::string name;
    std::string current_version;
    std::string latest_version;
    std::string manager;
    bool requires_privilege = false;
};

using PackageList = std::vector<PackageInfo>;

struct SkippedPackage {
    PackageInfo package;
    std::string reason;
};

enum class ErrorKind {
    Unavailable,
    Timeout,
    InvocationFailed,
    PrivilegeAborted,
    Cancelled,
    Internal
};

// The step of a manager's run an error was raised from. Cleanup and
// self-update failures only degrade a result, they never fail it.
enum class Step {
    Discover,
    Privilege,
    Apply,
    Cleanup,
    SelfUpdate
};

struct ErrorRecord {
    ErrorKind kind = ErrorKind::Internal;
    Step step = Step::Apply;
    std::string message;
    std::optional<int> exit_code;
    std::string package;  // empty when not tied to a single package
};

// A cleanup or self-update step that privilege policy kept from running.
struct SkippedStep {
    Step step = Step::Cleanup;
    std::string reason;
};

enum class Status {
    Success,
    Simulated,
    Degraded,
    PartialSuccess,
    Skipped,
    Unavailable,
    Failed,
    Cancelled
};

enum class RunMode {
    Status,
    Update
};

struct UpdateResult {
    std::string manager;
    Status status = Status::Success;
    std::string message;
    PackageList available;  // discovered candidates after exclusions
    PackageList excluded;   // discovered but removed by exclusion sets
    PackageList updated;
    std::vector<SkippedPackage> skipped;
    std::vector<SkippedStep> skipped_steps;
    std::vector<ErrorRecord> errors;
    std::chrono::milliseconds duration{0};
};
