#include <gtest/gtest.h>
#include "../src/report.hpp"
#include "../src/exception.hpp"
#include "../src/localization.hpp"

namespace {

UpdateResult result_for(const std::string& manager, Status status) {
    UpdateResult r;
    r.manager = manager;
    r.status = status;
    return r;
}

PackageList packages(int n) {
    PackageList list;
    for (int i = 0; i < n; ++i) {
        PackageInfo pkg;
        pkg.name = "pkg" + std::to_string(i);
        pkg.current_version = "1." + std::to_string(i);
        pkg.latest_version = "2." + std::to_string(i);
        list.push_back(pkg);
    }
    return list;
}

} // anonymous namespace

class ReportTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_localization(SYSUP_SOURCE_DIR "/l10n");
    }
};

TEST_F(ReportTest, WorstOfAggregation) {
    EXPECT_EQ(aggregate_status({Status::Success, Status::PartialSuccess, Status::Skipped}), Status::PartialSuccess);
    EXPECT_EQ(aggregate_status({Status::Failed, Status::PartialSuccess, Status::Degraded}), Status::Failed);
    EXPECT_EQ(aggregate_status({Status::Degraded, Status::Success}), Status::Degraded);
    EXPECT_EQ(aggregate_status({Status::Simulated, Status::Unavailable}), Status::Success);
    EXPECT_EQ(aggregate_status({Status::Skipped, Status::Unavailable}), Status::Skipped);
    EXPECT_EQ(aggregate_status({}), Status::Success);
}

TEST_F(ReportTest, ExitCodes) {
    EXPECT_EQ(exit_code_for(Status::Success), 0);
    EXPECT_EQ(exit_code_for(Status::Simulated), 0);
    EXPECT_EQ(exit_code_for(Status::Failed), 1);
    EXPECT_EQ(exit_code_for(Status::PartialSuccess), 2);
    EXPECT_EQ(exit_code_for(Status::Degraded), 3);
    EXPECT_EQ(exit_code_for(Status::Skipped), 4);
    EXPECT_EQ(exit_code_for(Status::Cancelled), 130);
}

TEST_F(ReportTest, ResultsKeepInsertionOrderAndUniqueIds) {
    RunReport report(RunMode::Update, false);
    report.add(result_for("b", Status::Success));
    report.add(result_for("a", Status::Failed));
    EXPECT_THROW(report.add(result_for("b", Status::Success)), SysupException);

    ASSERT_EQ(report.results().size(), 2u);
    EXPECT_EQ(report.results()[0].manager, "b");
    EXPECT_EQ(report.results()[1].manager, "a");
    EXPECT_EQ(report.overall_status(), Status::Failed);
}

TEST_F(ReportTest, FrozenReportRejectsResults) {
    RunReport report(RunMode::Status, false);
    report.freeze(false);
    EXPECT_TRUE(report.frozen());
    EXPECT_GE(report.finished_at(), report.started_at());
    EXPECT_THROW(report.add(result_for("a", Status::Success)), SysupException);
}

TEST_F(ReportTest, CancelledRunOverridesAggregate) {
    RunReport report(RunMode::Update, false);
    report.add(result_for("a", Status::Success));
    report.freeze(true);
    EXPECT_EQ(report.overall_status(), Status::Cancelled);
}

TEST_F(ReportTest, Totals) {
    RunReport report(RunMode::Update, false);
    UpdateResult a = result_for("a", Status::PartialSuccess);
    a.available = packages(3);
    a.updated = packages(2);
    a.skipped.push_back({packages(1)[0], "no cached credentials"});
    UpdateResult b = result_for("b", Status::Failed);
    b.errors.push_back({ErrorKind::InvocationFailed, Step::Discover, "boom", 1, ""});
    report.add(a);
    report.add(b);

    ReportTotals totals = compute_totals(report);
    EXPECT_EQ(totals.available, 3u);
    EXPECT_EQ(totals.updated, 2u);
    EXPECT_EQ(totals.skipped, 1u);
    EXPECT_EQ(totals.errors, 1u);
    EXPECT_EQ(totals.failed_managers, 1u);
}

TEST_F(ReportTest, StatusRenderingShowsCountsUnlessVerbose) {
    RunReport report(RunMode::Status, false);
    UpdateResult r = result_for("homebrew", Status::Success);
    r.available = packages(7);
    report.add(r);
    report.add(result_for("npm", Status::Success));
    report.freeze(false);

    std::string brief = render_report(report, false);
    EXPECT_NE(brief.find("homebrew: success"), std::string::npos);
    EXPECT_NE(brief.find("available: 7"), std::string::npos);
    EXPECT_EQ(brief.find("pkg0"), std::string::npos);
    EXPECT_NE(brief.find("Everything up to date."), std::string::npos);

    std::string verbose = render_report(report, true);
    EXPECT_NE(verbose.find("pkg0 (1.0 -> 2.0)"), std::string::npos);
    EXPECT_NE(verbose.find("pkg4"), std::string::npos);
    EXPECT_EQ(verbose.find("pkg5"), std::string::npos);
    EXPECT_NE(verbose.find("... and 2 more"), std::string::npos);
    EXPECT_NE(verbose.find("Overall: success"), std::string::npos);
}

TEST_F(ReportTest, UpdateRenderingListsSkipsAndErrors) {
    RunReport report(RunMode::Update, true);
    UpdateResult r = result_for("texlive", Status::Failed);
    r.skipped.push_back({packages(1)[0], "privileged execution disabled by policy"});
    r.errors.push_back({ErrorKind::Timeout, Step::Apply, "'tlmgr update pkg0' timed out", std::nullopt, "pkg0"});
    report.add(r);
    report.freeze(false);

    std::string text = render_report(report, false);
    EXPECT_NE(text.find("(dry run)"), std::string::npos);
    EXPECT_NE(text.find("skipped: pkg0 (privileged execution disabled by policy)"), std::string::npos);
    EXPECT_NE(text.find("[apply/invocation_timeout] pkg0"), std::string::npos);
    EXPECT_NE(text.find("Summary: 0 available, 0 updated, 1 skipped, 1 errors"), std::string::npos);
}
