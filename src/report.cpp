#include "report.hpp"

#include "exception.hpp"
#include "localization.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace {

constexpr size_t VERBOSE_PACKAGE_LIMIT = 5;

int severity(Status status) {
    switch (status) {
        case Status::Skipped:
        case Status::Unavailable:
            return 0;
        case Status::Success:
        case Status::Simulated:
            return 1;
        case Status::Degraded:
            return 2;
        case Status::PartialSuccess:
            return 3;
        case Status::Failed:
            return 4;
        case Status::Cancelled:
            return 5;
    }
    return 0;
}

Status normalize(Status status) {
    switch (status) {
        case Status::Simulated: return Status::Success;
        case Status::Unavailable: return Status::Skipped;
        default: return status;
    }
}

std::string version_arrow(const PackageInfo& pkg) {
    if (pkg.current_version.empty() && pkg.latest_version.empty()) return "";
    std::string current = pkg.current_version.empty() ? "?" : pkg.current_version;
    std::string latest = pkg.latest_version.empty() ? "?" : pkg.latest_version;
    return " (" + current + " -> " + latest + ")";
}

void render_packages(std::ostringstream& out, const std::string& title, const PackageList& pkgs, bool verbose) {
    if (pkgs.empty()) return;
    out << "  " << title << ": " << pkgs.size() << "\n";
    if (!verbose) return;
    const size_t limit = std::min<size_t>(pkgs.size(), VERBOSE_PACKAGE_LIMIT);
    for (size_t i = 0; i < limit; ++i) {
        out << "    - " << pkgs[i].name << version_arrow(pkgs[i]) << "\n";
    }
    if (limit < pkgs.size()) {
        out << "    " << string_format("report.and_more", pkgs.size() - limit) << "\n";
    }
}

} // anonymous namespace

RunReport::RunReport(RunMode mode, bool dry_run)
    : mode_(mode), dry_run_(dry_run), started_at_(std::chrono::system_clock::now()),
      finished_at_(started_at_) {}

void RunReport::add(UpdateResult result) {
    if (frozen_) {
        throw SysupException("report is frozen, cannot add result for " + result.manager);
    }
    if (find(result.manager)) {
        throw SysupException("duplicate result for manager " + result.manager);
    }
    results_.push_back(std::move(result));
}

void RunReport::freeze(bool cancelled) {
    if (frozen_) return;
    cancelled_ = cancelled;
    finished_at_ = std::chrono::system_clock::now();
    frozen_ = true;
}

const UpdateResult* RunReport::find(std::string_view manager) const {
    auto it = std::find_if(results_.begin(), results_.end(),
                           [manager](const UpdateResult& r) { return r.manager == manager; });
    return it == results_.end() ? nullptr : &*it;
}

Status RunReport::overall_status() const {
    if (cancelled_) return Status::Cancelled;
    std::vector<Status> statuses;
    statuses.reserve(results_.size());
    for (const auto& r : results_) statuses.push_back(r.status);
    return aggregate_status(statuses);
}

Status aggregate_status(const std::vector<Status>& statuses) {
    if (statuses.empty()) return Status::Success;
    Status worst = Status::Skipped;
    for (Status s : statuses) {
        Status n = normalize(s);
        if (severity(n) > severity(worst)) worst = n;
    }
    return worst;
}

int exit_code_for(Status status) {
    switch (status) {
        case Status::Success:
        case Status::Simulated:
            return 0;
        case Status::Failed:
            return 1;
        case Status::PartialSuccess:
            return 2;
        case Status::Degraded:
            return 3;
        case Status::Skipped:
        case Status::Unavailable:
            return 4;
        case Status::Cancelled:
            return 130;
    }
    return 1;
}

std::string_view status_name(Status status) {
    switch (status) {
        case Status::Success: return "success";
        case Status::Simulated: return "simulated";
        case Status::Degraded: return "degraded";
        case Status::PartialSuccess: return "partial_success";
        case Status::Skipped: return "skipped";
        case Status::Unavailable: return "unavailable";
        case Status::Failed: return "failed";
        case Status::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::string_view error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Unavailable: return "manager_unavailable";
        case ErrorKind::Timeout: return "invocation_timeout";
        case ErrorKind::InvocationFailed: return "invocation_failed";
        case ErrorKind::PrivilegeAborted: return "privilege_aborted";
        case ErrorKind::Cancelled: return "cancelled";
        case ErrorKind::Internal: return "internal";
    }
    return "internal";
}

std::string_view step_name(Step step) {
    switch (step) {
        case Step::Discover: return "discover";
        case Step::Privilege: return "privilege";
        case Step::Apply: return "apply";
        case Step::Cleanup: return "cleanup";
        case Step::SelfUpdate: return "self_update";
    }
    return "apply";
}

ReportTotals compute_totals(const RunReport& report) {
    ReportTotals totals;
    for (const auto& r : report.results()) {
        totals.available += r.available.size();
        totals.updated += r.updated.size();
        totals.skipped += r.skipped.size() + r.skipped_steps.size();
        totals.errors += r.errors.size();
        if (r.status == Status::Failed) ++totals.failed_managers;
    }
    return totals;
}

std::string render_report(const RunReport& report, bool verbose) {
    std::ostringstream out;
    const bool status_mode = report.mode() == RunMode::Status;

    out << (status_mode ? get_string("report.title_status") : get_string("report.title_update"));
    if (report.dry_run()) out << " " << get_string("report.dry_run_tag");
    out << "\n";

    for (const auto& r : report.results()) {
        out << r.manager << ": " << status_name(r.status);
        if (!r.message.empty()) out << " - " << r.message;
        out << "\n";

        if (status_mode) {
            if (r.status == Status::Success && r.available.empty()) {
                out << "  " << get_string("report.up_to_date") << "\n";
            }
            render_packages(out, get_string("report.available"), r.available, verbose);
        } else {
            render_packages(out, report.dry_run() ? get_string("report.would_update") : get_string("report.updated"),
                            r.updated, verbose);
        }
        for (const auto& s : r.skipped) {
            out << "  " << get_string("report.skipped") << ": " << s.package.name << " (" << s.reason << ")\n";
        }
        for (const auto& s : r.skipped_steps) {
            out << "  " << get_string("report.skipped_step") << ": " << step_name(s.step) << " (" << s.reason << ")\n";
        }
        if (verbose) {
            for (const auto& e : r.excluded) {
                out << "  " << get_string("report.excluded") << ": " << e.name << "\n";
            }
        }
        for (const auto& e : r.errors) {
            out << "  " << get_string("report.error") << " [" << step_name(e.step) << "/" << error_kind_name(e.kind) << "]";
            if (!e.package.empty()) out << " " << e.package;
            if (e.exit_code) out << " (exit " << *e.exit_code << ")";
            out << ": " << e.message << "\n";
        }
    }

    ReportTotals totals = compute_totals(report);
    out << string_format("report.summary", totals.available, totals.updated, totals.skipped, totals.errors) << "\n";
    out << get_string("report.overall") << ": " << status_name(report.overall_status()) << "\n";
    return out.str();
}
