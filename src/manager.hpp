#pragma once

#include "config.hpp"
#include "exception.hpp"
#include "executor.hpp"
#include "package.hpp"
#include "utils.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Everything a manager gets from the outside. The config is a copy of the
// manager's own section; nothing else of the run is visible to it.
struct ManagerContext {
    Executor& executor;
    Logger& logger;
    ManagerConfig config;
    bool interactive = false;
};

// One ecosystem (Homebrew, npm, pip, ...). Calling anything but
// is_available() on a manager whose tool is missing throws
// ManagerUnavailableError.
class Manager {
public:
    virtual ~Manager() = default;

    virtual const std::string& id() const = 0;
    virtual std::string display_name() const = 0;

    // Fast presence probe, no side effects.
    virtual bool is_available() = 0;
    // Never mutates; an empty list means everything is up to date.
    virtual PackageList check_updates() = 0;
    // Upgrades every candidate. In dry run nothing is executed and `updated`
    // lists what would have been applied.
    virtual UpdateResult apply_updates(const PackageList& candidates, bool dry_run) = 0;

    virtual bool supports_cleanup() const { return false; }
    virtual void cleanup() {}
    virtual bool supports_self_update() const { return false; }
    virtual void self_update() {}

    // The command apply_updates would run for `package`, without sudo.
    virtual std::vector<std::string> privileged_command(const PackageInfo& package) const = 0;
    // The command a cleanup or self-update step runs under sudo, if it does.
    virtual std::optional<std::vector<std::string>> privileged_maintenance(Step) const { return std::nullopt; }
};

using ManagerPtr = std::unique_ptr<Manager>;

ErrorRecord to_error_record(const InvocationError& e, Step step, const std::string& package = "");

// Base for managers that drive a command line tool through the Executor.
// Subclasses provide discovery and the per-package upgrade command.
class CommandManager : public Manager {
public:
    CommandManager(std::string id, std::string display_name, std::string program, ManagerContext ctx);

    const std::string& id() const override { return id_; }
    std::string display_name() const override { return display_name_; }

    bool is_available() override;
    PackageList check_updates() override;
    UpdateResult apply_updates(const PackageList& candidates, bool dry_run) override;
    std::vector<std::string> privileged_command(const PackageInfo& package) const override;

    bool supports_cleanup() const override;
    void cleanup() override;
    bool supports_self_update() const override;
    void self_update() override;
    std::optional<std::vector<std::string>> privileged_maintenance(Step step) const override;

protected:
    virtual PackageList discover() = 0;
    virtual std::vector<std::string> upgrade_command(const PackageInfo& package) const = 0;
    // Empty when the tool has no such step.
    virtual std::vector<std::string> cleanup_command() const { return {}; }
    virtual std::vector<std::string> self_update_command() const { return {}; }
    virtual std::vector<std::string> version_command() const { return {program_, "--version"}; }
    virtual bool privileged_by_default() const { return false; }
    // The tool asks for a password itself (brew for casks); never prefix sudo.
    virtual bool escalates_itself() const { return false; }
    virtual bool maintenance_privileged() const { return requires_privilege() && !escalates_itself(); }

    bool requires_privilege() const;
    void ensure_available();

    ProcessOutput run_query(const std::vector<std::string>& argv, std::vector<int> ok_exit_codes = {0});
    ProcessOutput run_mutating(const std::vector<std::string>& argv, bool privileged);

    void log_debug(const std::string& msg) const;
    void log_info(const std::string& msg) const;

    ManagerContext ctx_;
    std::string program_;
    std::map<std::string, std::string> env_;

private:
    ExecOptions options(Effect effect) const;

    std::string id_;
    std::string display_name_;
    std::optional<bool> available_;
};
