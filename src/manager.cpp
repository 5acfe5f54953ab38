#include "manager.hpp"

#include "localization.hpp"

#include <utility>

namespace {

constexpr auto VERSION_PROBE_TIMEOUT = std::chrono::seconds(30);

ErrorKind kind_of(InvocationError::Kind kind) {
    switch (kind) {
        case InvocationError::Kind::Timeout: return ErrorKind::Timeout;
        case InvocationError::Kind::Cancelled: return ErrorKind::Cancelled;
        case InvocationError::Kind::Failed: return ErrorKind::InvocationFailed;
    }
    return ErrorKind::InvocationFailed;
}

} // anonymous namespace

ErrorRecord to_error_record(const InvocationError& e, Step step, const std::string& package) {
    ErrorRecord record;
    record.kind = kind_of(e.kind());
    record.step = step;
    record.message = e.what();
    record.exit_code = e.exit_code();
    record.package = package;
    return record;
}

CommandManager::CommandManager(std::string id, std::string display_name, std::string program, ManagerContext ctx)
    : ctx_(std::move(ctx)), program_(std::move(program)), id_(std::move(id)),
      display_name_(std::move(display_name)) {}

bool CommandManager::is_available() {
    if (available_) return *available_;

    if (!ctx_.executor.resolve(program_)) {
        log_debug(string_format("debug.tool_not_found", program_));
        available_ = false;
        return false;
    }
    ExecOptions opts = options(Effect::ReadOnly);
    opts.timeout = VERSION_PROBE_TIMEOUT;
    ProcessOutput output = ctx_.executor.run(version_command(), opts);
    available_ = !output.timed_out && !output.cancelled && output.exit_code == 0;
    if (!*available_) {
        log_debug(string_format("debug.tool_probe_failed", program_, output.exit_code));
    }
    return *available_;
}

PackageList CommandManager::check_updates() {
    ensure_available();
    PackageList packages = discover();
    const bool privileged = requires_privilege();
    for (auto& pkg : packages) {
        pkg.manager = id_;
        pkg.requires_privilege = privileged;
    }
    log_debug(string_format("debug.discovered", packages.size()));
    return packages;
}

UpdateResult CommandManager::apply_updates(const PackageList& candidates, bool dry_run) {
    ensure_available();
    UpdateResult result;
    result.manager = id_;

    if (dry_run) {
        for (const auto& pkg : candidates) {
            log_info(string_format("info.would_upgrade", pkg.name, join(privileged_command(pkg))));
        }
        result.updated = candidates;
        result.status = Status::Simulated;
        return result;
    }

    for (const auto& pkg : candidates) {
        try {
            log_info(string_format("info.upgrading", pkg.name, pkg.current_version, pkg.latest_version));
            run_mutating(upgrade_command(pkg), pkg.requires_privilege);
            result.updated.push_back(pkg);
        } catch (const InvocationError& e) {
            ctx_.logger.error("[" + id_ + "] " + e.what());
            result.errors.push_back(to_error_record(e, Step::Apply, pkg.name));
            if (e.kind() == InvocationError::Kind::Cancelled) break;
        }
    }

    if (result.errors.empty()) {
        result.status = Status::Success;
    } else {
        result.status = result.updated.empty() ? Status::Failed : Status::PartialSuccess;
    }
    return result;
}

std::vector<std::string> CommandManager::privileged_command(const PackageInfo& package) const {
    return upgrade_command(package);
}

bool CommandManager::supports_cleanup() const {
    return ctx_.config.cleanup && !cleanup_command().empty();
}

void CommandManager::cleanup() {
    ensure_available();
    log_info(get_string("info.cleanup"));
    run_mutating(cleanup_command(), maintenance_privileged());
}

bool CommandManager::supports_self_update() const {
    return ctx_.config.self_update && !self_update_command().empty();
}

void CommandManager::self_update() {
    ensure_available();
    log_info(get_string("info.self_update"));
    run_mutating(self_update_command(), maintenance_privileged());
}

std::optional<std::vector<std::string>> CommandManager::privileged_maintenance(Step step) const {
    if (!maintenance_privileged()) return std::nullopt;
    auto command = step == Step::Cleanup ? cleanup_command() : self_update_command();
    if (command.empty()) return std::nullopt;
    return command;
}

bool CommandManager::requires_privilege() const {
    return ctx_.config.requires_sudo.value_or(privileged_by_default());
}

void CommandManager::ensure_available() {
    if (!is_available()) {
        throw ManagerUnavailableError(string_format("error.manager_unavailable", id_));
    }
}

ProcessOutput CommandManager::run_query(const std::vector<std::string>& argv, std::vector<int> ok_exit_codes) {
    ExecOptions opts = options(Effect::ReadOnly);
    opts.ok_exit_codes = std::move(ok_exit_codes);
    return ctx_.executor.check(argv, opts);
}

ProcessOutput CommandManager::run_mutating(const std::vector<std::string>& argv, bool privileged) {
    std::vector<std::string> command;
    if (privileged && !escalates_itself()) {
        command.push_back("sudo");
        if (!ctx_.interactive) command.push_back("-n");
    }
    command.insert(command.end(), argv.begin(), argv.end());
    ExecOptions opts = options(Effect::Mutating);
    // Tools that escalate on their own may ask for a password at any point.
    opts.interactive = ctx_.interactive && (privileged || escalates_itself());
    return ctx_.executor.check(command, opts);
}

ExecOptions CommandManager::options(Effect effect) const {
    ExecOptions opts;
    opts.effect = effect;
    if (ctx_.config.timeout) {
        opts.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(*ctx_.config.timeout);
    }
    opts.env = env_;
    return opts;
}

void CommandManager::log_debug(const std::string& msg) const {
    ctx_.logger.debug("[" + id_ + "] " + msg);
}

void CommandManager::log_info(const std::string& msg) const {
    ctx_.logger.info("[" + id_ + "] " + msg);
}
