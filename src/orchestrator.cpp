#include "orchestrator.hpp"

#include "localization.hpp"

#include <algorithm>
#include <atomic>
#include <future>

namespace {

constexpr const char* MESSAGE_DISABLED = "manager is disabled";
constexpr const char* MESSAGE_NOT_STARTED = "not started, run cancelled";
constexpr const char* MESSAGE_UNAVAILABLE = "tool not installed";
constexpr const char* MESSAGE_UNKNOWN_EXCEPTION = "unknown exception";

bool core_step(Step step) {
    return step == Step::Privilege || step == Step::Apply;
}

ErrorRecord make_error(ErrorKind kind, Step step, const std::string& message) {
    ErrorRecord record;
    record.kind = kind;
    record.step = step;
    record.message = message;
    return record;
}

} // anonymous namespace

Status derive_status(const UpdateResult& result, RunMode mode, bool dry_run) {
    const auto& errors = result.errors;
    auto any = [&](auto pred) { return std::any_of(errors.begin(), errors.end(), pred); };

    if (any([](const ErrorRecord& e) { return e.kind == ErrorKind::Cancelled; })) {
        return Status::Cancelled;
    }
    if (any([](const ErrorRecord& e) { return e.step == Step::Discover; })) {
        return Status::Failed;
    }
    if (mode == RunMode::Status) {
        return Status::Success;
    }

    const auto core_errors = std::count_if(errors.begin(), errors.end(),
                                           [](const ErrorRecord& e) { return core_step(e.step); });
    if (dry_run) {
        return core_errors > 0 && result.updated.empty() ? Status::Failed : Status::Simulated;
    }

    Status status;
    if (core_errors == 0 && result.skipped.empty()) {
        status = Status::Success;
    } else if (result.updated.empty() && core_errors == 0) {
        status = Status::Skipped;
    } else if (result.updated.empty()) {
        status = Status::Failed;
    } else {
        status = Status::PartialSuccess;
    }

    if (status == Status::Success && any([](const ErrorRecord& e) { return !core_step(e.step); })) {
        status = Status::Degraded;
    }
    return status;
}

Orchestrator::Orchestrator(const Config& config, ManagerRegistry& registry, SudoNegotiator& negotiator,
                           Logger& logger, const CancelToken& cancel)
    : config_(config), registry_(registry), negotiator_(negotiator), logger_(logger), cancel_(cancel) {}

RunReport Orchestrator::run_status(const std::vector<std::string>& managers) {
    return run({RunMode::Status, false, managers});
}

RunReport Orchestrator::run_update(const std::vector<std::string>& managers, bool dry_run) {
    return run({RunMode::Update, dry_run, managers});
}

std::vector<ManagerListing> Orchestrator::list_managers() {
    std::vector<ManagerListing> listings;
    for (Manager* manager : registry_.all()) {
        ManagerListing listing;
        listing.id = manager->id();
        listing.display_name = manager->display_name();
        listing.enabled = registry_.is_enabled(manager->id());
        try {
            listing.available = manager->is_available();
        } catch (const std::exception& e) {
            logger_.warning(string_format("warning.availability_failed", manager->id(), e.what()));
        }
        listings.push_back(std::move(listing));
    }
    return listings;
}

std::vector<Orchestrator::Target> Orchestrator::resolve_targets(const std::vector<std::string>& ids) const {
    std::vector<Target> targets;
    const bool everything = ids.empty() || std::find(ids.begin(), ids.end(), "all") != ids.end();
    if (everything) {
        for (Manager* manager : registry_.enabled_managers()) targets.push_back({manager, true});
    } else {
        for (Manager* manager : registry_.select(ids)) {
            targets.push_back({manager, registry_.is_enabled(manager->id())});
        }
    }
    return targets;
}

RunReport Orchestrator::run(const RunRequest& request) {
    const std::vector<Target> targets = resolve_targets(request.managers);
    RunReport report(request.mode, request.dry_run);

    std::vector<std::optional<UpdateResult>> slots(targets.size());
    const size_t workers = std::min<size_t>(std::max(1u, config_.parallelism), targets.size());

    if (workers <= 1) {
        for (size_t i = 0; i < targets.size() && !cancel_.cancelled(); ++i) {
            slots[i] = run_manager(targets[i], request.mode, request.dry_run);
        }
    } else {
        // Workers pull the next index; each result lands in its own slot so the
        // report keeps configured order whatever finishes first.
        std::atomic<size_t> next{0};
        std::vector<std::future<void>> futures;
        for (size_t w = 0; w < workers; ++w) {
            futures.push_back(std::async(std::launch::async, [&] {
                for (size_t i = next++; i < targets.size(); i = next++) {
                    if (cancel_.cancelled()) break;
                    slots[i] = run_manager(targets[i], request.mode, request.dry_run);
                }
            }));
        }
        for (auto& f : futures) f.get();
    }

    for (size_t i = 0; i < targets.size(); ++i) {
        if (slots[i]) {
            report.add(std::move(*slots[i]));
        } else {
            UpdateResult result;
            result.manager = targets[i].manager->id();
            result.status = Status::Cancelled;
            result.message = MESSAGE_NOT_STARTED;
            report.add(std::move(result));
        }
    }
    report.freeze(cancel_.cancelled());
    return report;
}

UpdateResult Orchestrator::run_manager(const Target& target, RunMode mode, bool dry_run) {
    Manager& manager = *target.manager;
    const auto start = std::chrono::steady_clock::now();
    UpdateResult result;
    result.manager = manager.id();

    auto finish = [&](UpdateResult& r) -> UpdateResult {
        r.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        logger_.info(string_format("info.manager_done", manager.id(), status_name(r.status), r.duration.count()));
        return std::move(r);
    };

    if (!target.enabled) {
        result.status = Status::Skipped;
        result.message = MESSAGE_DISABLED;
        return finish(result);
    }

    logger_.info(string_format("info.manager_start", manager.display_name()));
    Step step = Step::Discover;
    try {
        if (!manager.is_available()) {
            result.status = Status::Unavailable;
            result.message = MESSAGE_UNAVAILABLE;
            logger_.info(string_format("info.manager_unavailable", manager.id()));
            return finish(result);
        }
        run_steps(manager, mode, dry_run, result, step);
    } catch (const InvocationError& e) {
        result.errors.push_back(to_error_record(e, step));
    } catch (const PrivilegeAbortedError& e) {
        result.errors.push_back(make_error(ErrorKind::PrivilegeAborted, Step::Privilege, e.what()));
    } catch (const ManagerUnavailableError& e) {
        result.errors.push_back(make_error(ErrorKind::Unavailable, step, e.what()));
    } catch (const std::exception& e) {
        result.errors.push_back(make_error(ErrorKind::Internal, step, e.what()));
    } catch (...) {
        result.errors.push_back(make_error(ErrorKind::Internal, step, MESSAGE_UNKNOWN_EXCEPTION));
    }

    for (const auto& error : result.errors) {
        if (error.step == Step::Discover || error.step == Step::Privilege) {
            logger_.error(string_format("error.manager_step_failed", manager.id(), step_name(error.step), error.message));
        }
    }
    result.status = derive_status(result, mode, dry_run);
    return finish(result);
}

void Orchestrator::run_steps(Manager& manager, RunMode mode, bool dry_run, UpdateResult& result, Step& step) {
    const std::string& id = manager.id();

    check_cancelled();
    result.available = apply_exclusions(id, manager.check_updates(), result.excluded);
    if (mode == RunMode::Status) return;

    step = Step::Privilege;
    PackageList to_apply;
    for (const auto& pkg : result.available) {
        if (!pkg.requires_privilege) {
            to_apply.push_back(pkg);
            continue;
        }
        SudoDecision decision = negotiator_.decide({id, manager.privileged_command(pkg)});
        switch (decision.outcome) {
            case SudoOutcome::Proceed:
                to_apply.push_back(pkg);
                break;
            case SudoOutcome::Skip:
                logger_.info(string_format("info.privilege_skipped", id, pkg.name, decision.reason));
                result.skipped.push_back({pkg, decision.reason});
                break;
            case SudoOutcome::Abort:
                throw PrivilegeAbortedError(decision.reason);
        }
    }

    step = Step::Apply;
    if (!to_apply.empty()) {
        check_cancelled();
        UpdateResult applied = manager.apply_updates(to_apply, dry_run);
        result.updated = std::move(applied.updated);
        result.skipped.insert(result.skipped.end(), applied.skipped.begin(), applied.skipped.end());
        result.errors.insert(result.errors.end(), applied.errors.begin(), applied.errors.end());
        result.message = applied.message;
    }

    if (dry_run) return;
    if (manager.supports_cleanup()) run_maintenance(manager, Step::Cleanup, result);
    if (manager.supports_self_update()) run_maintenance(manager, Step::SelfUpdate, result);
}

PackageList Orchestrator::apply_exclusions(const std::string& id, PackageList discovered, PackageList& excluded) const {
    const auto& global = config_.exclude_packages;
    const auto& local = config_.manager(id).exclude_packages;
    PackageList kept;
    for (auto& pkg : discovered) {
        if (global.contains(pkg.name) || local.contains(pkg.name)) {
            logger_.debug(string_format("debug.excluded", id, pkg.name));
            excluded.push_back(std::move(pkg));
        } else {
            kept.push_back(std::move(pkg));
        }
    }
    return kept;
}

void Orchestrator::run_maintenance(Manager& manager, Step step, UpdateResult& result) {
    if (cancel_.cancelled()) {
        result.errors.push_back(make_error(ErrorKind::Cancelled, step, get_string("error.run_cancelled")));
        return;
    }
    if (auto command = manager.privileged_maintenance(step)) {
        SudoDecision decision = negotiator_.decide({manager.id(), *command});
        if (decision.outcome == SudoOutcome::Skip) {
            logger_.info(string_format("info.maintenance_skipped", manager.id(), step_name(step), decision.reason));
            result.skipped_steps.push_back({step, decision.reason});
            return;
        }
        if (decision.outcome == SudoOutcome::Abort) {
            result.errors.push_back(make_error(ErrorKind::PrivilegeAborted, step, decision.reason));
            return;
        }
    }

    try {
        if (step == Step::Cleanup) {
            manager.cleanup();
        } else {
            manager.self_update();
        }
    } catch (const InvocationError& e) {
        logger_.warning(string_format("warning.maintenance_failed", manager.id(), step_name(step), e.what()));
        result.errors.push_back(to_error_record(e, step));
    } catch (const std::exception& e) {
        logger_.warning(string_format("warning.maintenance_failed", manager.id(), step_name(step), e.what()));
        result.errors.push_back(make_error(ErrorKind::Internal, step, e.what()));
    } catch (...) {
        logger_.warning(string_format("warning.maintenance_failed", manager.id(), step_name(step),
                                      MESSAGE_UNKNOWN_EXCEPTION));
        result.errors.push_back(make_error(ErrorKind::Internal, step, MESSAGE_UNKNOWN_EXCEPTION));
    }
}

void Orchestrator::check_cancelled() const {
    if (cancel_.cancelled()) {
        throw InvocationError(InvocationError::Kind::Cancelled, get_string("error.run_cancelled"));
    }
}
