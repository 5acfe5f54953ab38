#pragma once

#include "config.hpp"
#include "executor.hpp"
#include "registry.hpp"
#include "report.hpp"
#include "sudo.hpp"
#include "utils.hpp"

#include <optional>
#include <string>
#include <vector>

struct RunRequest {
    RunMode mode = RunMode::Update;
    bool dry_run = false;
    // Manager ids to run; empty (or "all") means every enabled manager.
    std::vector<std::string> managers;
};

// Drives a run over the registry: for each selected manager availability,
// discovery, exclusion filtering, privilege negotiation, apply, cleanup and
// self-update. Every failure is contained in that manager's result.
class Orchestrator {
public:
    Orchestrator(const Config& config, ManagerRegistry& registry, SudoNegotiator& negotiator, Logger& logger,
                 const CancelToken& cancel);

    RunReport run_status(const std::vector<std::string>& managers = {});
    RunReport run_update(const std::vector<std::string>& managers, bool dry_run);
    std::vector<ManagerListing> list_managers();

    // Throws NotFoundError for an unknown manager id before anything runs.
    RunReport run(const RunRequest& request);

private:
    struct Target {
        Manager* manager;
        bool enabled;
    };

    std::vector<Target> resolve_targets(const std::vector<std::string>& ids) const;
    UpdateResult run_manager(const Target& target, RunMode mode, bool dry_run);
    void run_steps(Manager& manager, RunMode mode, bool dry_run, UpdateResult& result, Step& step);
    PackageList apply_exclusions(const std::string& id, PackageList discovered, PackageList& excluded) const;
    void run_maintenance(Manager& manager, Step step, UpdateResult& result);
    void check_cancelled() const;

    const Config& config_;
    ManagerRegistry& registry_;
    SudoNegotiator& negotiator_;
    Logger& logger_;
    const CancelToken& cancel_;
};

// Per-manager status from what happened during its run. Unavailable and
// disabled managers are decided before this is consulted.
Status derive_status(const UpdateResult& result, RunMode mode, bool dry_run);
