#pragma once

#include "package.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

// Outcome of a whole run. The orchestrator is the only writer; once frozen
// the report is read-only.
class RunReport {
public:
    RunReport(RunMode mode, bool dry_run);

    // Appends a manager's result. Ids are unique, order is execution order.
    void add(UpdateResult result);
    void freeze(bool cancelled);

    bool frozen() const { return frozen_; }
    bool cancelled() const { return cancelled_; }
    RunMode mode() const { return mode_; }
    bool dry_run() const { return dry_run_; }
    std::chrono::system_clock::time_point started_at() const { return started_at_; }
    std::chrono::system_clock::time_point finished_at() const { return finished_at_; }

    const std::vector<UpdateResult>& results() const { return results_; }
    const UpdateResult* find(std::string_view manager) const;

    Status overall_status() const;

private:
    RunMode mode_;
    bool dry_run_;
    bool frozen_ = false;
    bool cancelled_ = false;
    std::chrono::system_clock::time_point started_at_;
    std::chrono::system_clock::time_point finished_at_;
    std::vector<UpdateResult> results_;
};

struct ReportTotals {
    size_t available = 0;
    size_t updated = 0;
    size_t skipped = 0;
    size_t errors = 0;
    size_t failed_managers = 0;
};

// Worst-of rule: Failed > PartialSuccess > Degraded > Success > Skipped.
// Simulated counts as Success and Unavailable as Skipped. No statuses at all
// is a vacuous Success; only skipped managers is Skipped.
Status aggregate_status(const std::vector<Status>& statuses);

// Process exit code a caller (CLI, scheduler) should report for a status.
int exit_code_for(Status status);

std::string_view status_name(Status status);
std::string_view error_kind_name(ErrorKind kind);
std::string_view step_name(Step step);

ReportTotals compute_totals(const RunReport& report);

// Plain-text rendering, stable across runs so reports can be diffed.
// Package lists are counts only; verbose adds the first five packages of
// each list with their versions.
std::string render_report(const RunReport& report, bool verbose);
