#include <gtest/gtest.h>
#include "../src/orchestrator.hpp"
#include "../src/localization.hpp"
#include "fake_manager.hpp"

#include <algorithm>
#include <memory>
#include <string>

namespace {

class FakeProbe : public CredentialProbe {
public:
    bool credentials_cached(const std::vector<std::string>&) override {
        ++calls;
        return cached;
    }
    bool cached = false;
    int calls = 0;
};

} // anonymous namespace

class OrchestratorTest : public ::testing::Test {
protected:
    Config config;
    ManagerRegistry registry;
    FakeProbe probe;
    Logger logger{LogLevel::Error, false};
    CancelToken cancel;
    std::unique_ptr<SudoNegotiator> negotiator;

    void SetUp() override {
        init_localization(SYSUP_SOURCE_DIR "/l10n");
    }

    FakeManager* add(const std::string& id, bool enabled = true) {
        auto manager = std::make_unique<FakeManager>(id);
        FakeManager* raw = manager.get();
        registry.add(std::move(manager), enabled);
        return raw;
    }

    Orchestrator make(SudoStrategy strategy, std::vector<std::string> whitelist = {}, bool resolvable = true,
                      bool interactive = false) {
        negotiator = std::make_unique<SudoNegotiator>(
            strategy, std::move(whitelist), probe,
            [resolvable](const std::string&) { return resolvable; }, interactive);
        return Orchestrator(config, registry, *negotiator, logger, cancel);
    }
};

TEST_F(OrchestratorTest, UnavailableAndPolicySkippedScenario) {
    FakeManager* a = add("a");
    a->available = false;
    FakeManager* b = add("b");
    b->packages = {make_package("tool"), make_package("system-lib", true)};

    RunReport report = make(SudoStrategy::SkipPrivileged).run_update({}, false);

    ASSERT_EQ(report.results().size(), 2u);
    EXPECT_EQ(report.find("a")->status, Status::Unavailable);
    const UpdateResult* rb = report.find("b");
    EXPECT_EQ(rb->status, Status::PartialSuccess);
    ASSERT_EQ(rb->updated.size(), 1u);
    EXPECT_EQ(rb->updated[0].name, "tool");
    ASSERT_EQ(rb->skipped.size(), 1u);
    EXPECT_EQ(rb->skipped[0].package.name, "system-lib");
    EXPECT_EQ(rb->skipped[0].reason, "privileged execution disabled by policy");
    EXPECT_EQ(report.overall_status(), Status::PartialSuccess);
    EXPECT_EQ(exit_code_for(report.overall_status()), 2);
    EXPECT_EQ(probe.calls, 0);
    EXPECT_TRUE(a->applied.empty());
}

TEST_F(OrchestratorTest, DryRunNeverMutates) {
    FakeManager* m = add("m");
    m->packages = {make_package("x"), make_package("y")};
    m->has_cleanup = true;
    m->has_self_update = true;

    RunReport report = make(SudoStrategy::Prompt).run_update({}, true);

    EXPECT_EQ(m->mutations, 0);
    ASSERT_EQ(m->dry_runs.size(), 1u);
    EXPECT_TRUE(m->dry_runs[0]);
    const UpdateResult* r = report.find("m");
    EXPECT_EQ(r->status, Status::Simulated);
    EXPECT_EQ(r->updated.size(), 2u);
    EXPECT_TRUE(report.dry_run());
    EXPECT_EQ(report.overall_status(), Status::Success);
}

TEST_F(OrchestratorTest, ExclusionsAreRemovedBeforeApply) {
    config.exclude_packages = {"a"};
    config.manager_configs["m"].exclude_packages = {"b"};
    FakeManager* m = add("m");
    m->packages = {make_package("a"), make_package("b"), make_package("c")};

    RunReport report = make(SudoStrategy::Prompt).run_update({}, false);

    ASSERT_EQ(m->applied.size(), 1u);
    ASSERT_EQ(m->applied[0].size(), 1u);
    EXPECT_EQ(m->applied[0][0].name, "c");
    const UpdateResult* r = report.find("m");
    EXPECT_EQ(r->excluded.size(), 2u);
    EXPECT_EQ(r->status, Status::Success);
}

TEST_F(OrchestratorTest, DiscoveryFailureDoesNotStopOtherManagers) {
    FakeManager* broken = add("broken");
    broken->discover_error = "outdated listing failed";
    FakeManager* fine = add("fine");
    fine->packages = {make_package("p")};

    RunReport report = make(SudoStrategy::Prompt).run_update({}, false);

    const UpdateResult* rb = report.find("broken");
    EXPECT_EQ(rb->status, Status::Failed);
    ASSERT_EQ(rb->errors.size(), 1u);
    EXPECT_EQ(rb->errors[0].kind, ErrorKind::InvocationFailed);
    EXPECT_EQ(rb->errors[0].step, Step::Discover);
    EXPECT_EQ(report.find("fine")->status, Status::Success);
    EXPECT_EQ(report.overall_status(), Status::Failed);
}

TEST_F(OrchestratorTest, UnexpectedExceptionBecomesFailedResult) {
    FakeManager* m = add("m");
    m->discover_crash = true;

    RunReport report = make(SudoStrategy::Prompt).run_update({}, false);

    const UpdateResult* r = report.find("m");
    EXPECT_EQ(r->status, Status::Failed);
    ASSERT_EQ(r->errors.size(), 1u);
    EXPECT_EQ(r->errors[0].kind, ErrorKind::Internal);
}

TEST_F(OrchestratorTest, NonStandardExceptionStaysInsideItsManager) {
    FakeManager* odd = add("odd");
    odd->discover_throws_int = true;
    FakeManager* fine = add("fine");
    fine->packages = {make_package("p")};

    RunReport report = make(SudoStrategy::Prompt).run_update({}, false);

    const UpdateResult* r = report.find("odd");
    EXPECT_EQ(r->status, Status::Failed);
    ASSERT_EQ(r->errors.size(), 1u);
    EXPECT_EQ(r->errors[0].kind, ErrorKind::Internal);
    EXPECT_EQ(r->errors[0].step, Step::Discover);
    EXPECT_EQ(report.find("fine")->status, Status::Success);
    EXPECT_EQ(fine->applied.size(), 1u);
}

TEST_F(OrchestratorTest, StatusRunOnlyDiscovers) {
    FakeManager* m = add("m");
    m->packages = {make_package("p", true)};
    m->has_cleanup = true;

    RunReport report = make(SudoStrategy::Prompt).run_status();

    EXPECT_EQ(report.mode(), RunMode::Status);
    EXPECT_TRUE(m->applied.empty());
    EXPECT_EQ(m->mutations, 0);
    EXPECT_EQ(probe.calls, 0);
    const UpdateResult* r = report.find("m");
    EXPECT_EQ(r->status, Status::Success);
    ASSERT_EQ(r->available.size(), 1u);
    EXPECT_EQ(r->available[0].name, "p");
}

TEST_F(OrchestratorTest, ConsecutiveStatusRunsAgree) {
    FakeManager* m = add("m");
    m->packages = {make_package("p"), make_package("q")};
    Orchestrator orchestrator = make(SudoStrategy::Prompt);

    RunReport first = orchestrator.run_status();
    RunReport second = orchestrator.run_status();

    const auto& a = first.find("m")->available;
    const auto& b = second.find("m")->available;
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].name, b[i].name);
        EXPECT_EQ(a[i].latest_version, b[i].latest_version);
    }
}

TEST_F(OrchestratorTest, CleanupFailureDegradesOnly) {
    FakeManager* m = add("m");
    m->packages = {make_package("p")};
    m->has_cleanup = true;
    m->cleanup_fails = true;
    m->has_self_update = true;

    RunReport report = make(SudoStrategy::Prompt).run_update({}, false);

    const UpdateResult* r = report.find("m");
    EXPECT_EQ(r->status, Status::Degraded);
    EXPECT_EQ(r->updated.size(), 1u);
    ASSERT_EQ(r->errors.size(), 1u);
    EXPECT_EQ(r->errors[0].step, Step::Cleanup);
    EXPECT_EQ(report.overall_status(), Status::Degraded);
    EXPECT_EQ(exit_code_for(report.overall_status()), 3);
    // self-update still runs after a failed cleanup
    EXPECT_EQ(m->events.back(), "self_update");
}

TEST_F(OrchestratorTest, StepsRunInOrder) {
    FakeManager* m = add("m");
    m->packages = {make_package("p")};
    m->has_cleanup = true;
    m->has_self_update = true;

    make(SudoStrategy::Prompt).run_update({}, false);

    std::vector<std::string> expected = {"available", "check", "apply", "cleanup", "self_update"};
    EXPECT_EQ(m->events, expected);
}

TEST_F(OrchestratorTest, SelfUpdateTimeoutIsRecordedWithItsStep) {
    FakeManager* m = add("m");
    m->has_self_update = true;
    m->self_update_fails = true;

    RunReport report = make(SudoStrategy::Prompt).run_update({}, false);

    const UpdateResult* r = report.find("m");
    EXPECT_EQ(r->status, Status::Degraded);
    ASSERT_EQ(r->errors.size(), 1u);
    EXPECT_EQ(r->errors[0].kind, ErrorKind::Timeout);
    EXPECT_EQ(r->errors[0].step, Step::SelfUpdate);
}

TEST_F(OrchestratorTest, PolicySkippedSelfUpdateIsReported) {
    FakeManager* m = add("texlive");
    m->packages = {make_package("p")};
    m->has_self_update = true;
    m->privileged_self_update = std::vector<std::string>{"tlmgr", "update", "--self"};

    RunReport report = make(SudoStrategy::SkipPrivileged).run_update({}, false);

    const UpdateResult* r = report.find("texlive");
    EXPECT_EQ(r->status, Status::Success);
    EXPECT_TRUE(r->errors.empty());
    ASSERT_EQ(r->skipped_steps.size(), 1u);
    EXPECT_EQ(r->skipped_steps[0].step, Step::SelfUpdate);
    EXPECT_EQ(r->skipped_steps[0].reason, "privileged execution disabled by policy");
    EXPECT_EQ(std::count(m->events.begin(), m->events.end(), "self_update"), 0);

    const std::string text = render_report(report, false);
    EXPECT_NE(text.find("self_update (privileged execution disabled by policy)"), std::string::npos) << text;
    EXPECT_EQ(compute_totals(report).skipped, 1u);
}

TEST_F(OrchestratorTest, ApprovedPrivilegedSelfUpdateRuns) {
    probe.cached = true;
    FakeManager* m = add("texlive");
    m->has_self_update = true;
    m->privileged_self_update = std::vector<std::string>{"tlmgr", "update", "--self"};

    RunReport report = make(SudoStrategy::PasswordlessAll).run_update({}, false);

    const UpdateResult* r = report.find("texlive");
    EXPECT_EQ(r->status, Status::Success);
    EXPECT_TRUE(r->skipped_steps.empty());
    EXPECT_EQ(m->events.back(), "self_update");
}

TEST_F(OrchestratorTest, AbortedPrivilegedSelfUpdateDegrades) {
    FakeManager* m = add("texlive");
    m->packages = {make_package("p")};
    m->has_self_update = true;
    m->privileged_self_update = std::vector<std::string>{"tlmgr", "update", "--self"};

    RunReport report = make(SudoStrategy::PasswordlessWhitelist, {"tlmgr update"}, false).run_update({}, false);

    const UpdateResult* r = report.find("texlive");
    EXPECT_EQ(r->status, Status::Degraded);
    ASSERT_EQ(r->errors.size(), 1u);
    EXPECT_EQ(r->errors[0].kind, ErrorKind::PrivilegeAborted);
    EXPECT_EQ(r->errors[0].step, Step::SelfUpdate);
    EXPECT_EQ(std::count(m->events.begin(), m->events.end(), "self_update"), 0);
}

TEST_F(OrchestratorTest, EverythingPolicySkippedIsSkipped) {
    FakeManager* m = add("m");
    m->packages = {make_package("p", true), make_package("q", true)};

    RunReport report = make(SudoStrategy::SkipPrivileged).run_update({}, false);

    const UpdateResult* r = report.find("m");
    EXPECT_EQ(r->status, Status::Skipped);
    EXPECT_EQ(r->skipped.size(), 2u);
    EXPECT_TRUE(m->applied.empty());
    EXPECT_EQ(report.overall_status(), Status::Skipped);
    EXPECT_EQ(exit_code_for(report.overall_status()), 4);
}

TEST_F(OrchestratorTest, AllUpgradesFailingIsFailed) {
    FakeManager* m = add("m");
    m->packages = {make_package("p"), make_package("q")};
    m->failing = {"p", "q"};

    RunReport report = make(SudoStrategy::Prompt).run_update({}, false);

    const UpdateResult* r = report.find("m");
    EXPECT_EQ(r->status, Status::Failed);
    EXPECT_EQ(r->errors.size(), 2u);
}

TEST_F(OrchestratorTest, SomeUpgradesFailingIsPartial) {
    FakeManager* m = add("m");
    m->packages = {make_package("p"), make_package("q")};
    m->failing = {"q"};

    RunReport report = make(SudoStrategy::Prompt).run_update({}, false);

    EXPECT_EQ(report.find("m")->status, Status::PartialSuccess);
}

TEST_F(OrchestratorTest, UnresolvableWhitelistEntryAbortsManagerUpdate) {
    FakeManager* m = add("m");
    m->packages = {make_package("plain"), make_package("root-only", true)};

    RunReport report = make(SudoStrategy::PasswordlessWhitelist, {"fake-m upgrade"}, false).run_update({}, false);

    const UpdateResult* r = report.find("m");
    EXPECT_EQ(r->status, Status::Failed);
    ASSERT_EQ(r->errors.size(), 1u);
    EXPECT_EQ(r->errors[0].kind, ErrorKind::PrivilegeAborted);
    EXPECT_TRUE(m->applied.empty());
}

TEST_F(OrchestratorTest, WhitelistedWithCachedCredentialsProceeds) {
    probe.cached = true;
    FakeManager* m = add("m");
    m->packages = {make_package("root-only", true)};

    RunReport report = make(SudoStrategy::PasswordlessWhitelist, {"fake-m upgrade"}).run_update({}, false);

    EXPECT_EQ(report.find("m")->status, Status::Success);
    EXPECT_EQ(report.find("m")->updated.size(), 1u);
}

TEST_F(OrchestratorTest, UnattendedPromptSkipsPrivileged) {
    FakeManager* m = add("m");
    m->packages = {make_package("root-only", true)};

    RunReport report = make(SudoStrategy::Prompt, {}, true, false).run_update({}, false);

    const UpdateResult* r = report.find("m");
    ASSERT_EQ(r->skipped.size(), 1u);
    EXPECT_EQ(r->skipped[0].reason, "no interactive session and no cached credentials");
}

TEST_F(OrchestratorTest, NoManagersIsVacuousSuccess) {
    RunReport report = make(SudoStrategy::Prompt).run_update({}, false);
    EXPECT_TRUE(report.results().empty());
    EXPECT_EQ(report.overall_status(), Status::Success);
    EXPECT_EQ(exit_code_for(report.overall_status()), 0);
}

TEST_F(OrchestratorTest, UnknownSelectionFailsBeforeRunning) {
    FakeManager* m = add("m");
    Orchestrator orchestrator = make(SudoStrategy::Prompt);

    EXPECT_THROW(orchestrator.run_update({"m", "nope"}, false), NotFoundError);
    EXPECT_TRUE(m->events.empty());
}

TEST_F(OrchestratorTest, SelectionRunsInRegistryOrder) {
    add("first");
    add("second");
    add("third");

    RunReport report = make(SudoStrategy::Prompt).run_update({"third", "first"}, false);

    ASSERT_EQ(report.results().size(), 2u);
    EXPECT_EQ(report.results()[0].manager, "first");
    EXPECT_EQ(report.results()[1].manager, "third");
}

TEST_F(OrchestratorTest, DisabledManagers) {
    FakeManager* off = add("off", false);
    add("on");
    Orchestrator orchestrator = make(SudoStrategy::Prompt);

    RunReport all = orchestrator.run_update({}, false);
    EXPECT_EQ(all.results().size(), 1u);
    EXPECT_EQ(all.find("off"), nullptr);

    RunReport explicit_run = orchestrator.run_update({"off"}, false);
    const UpdateResult* r = explicit_run.find("off");
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->status, Status::Skipped);
    EXPECT_EQ(r->message, "manager is disabled");
    EXPECT_TRUE(off->events.empty());
}

TEST_F(OrchestratorTest, CancelledBeforeStartRunsNothing) {
    FakeManager* m = add("m");
    cancel.cancel();

    RunReport report = make(SudoStrategy::Prompt).run_update({}, false);

    EXPECT_TRUE(m->events.empty());
    EXPECT_EQ(report.find("m")->status, Status::Cancelled);
    EXPECT_TRUE(report.cancelled());
    EXPECT_EQ(report.overall_status(), Status::Cancelled);
    EXPECT_EQ(exit_code_for(report.overall_status()), 130);
}

TEST_F(OrchestratorTest, CancellationKeepsCompletedResults) {
    FakeManager* first = add("first");
    first->packages = {make_package("p")};
    first->on_apply = [this] { cancel.cancel(); };
    FakeManager* second = add("second");

    RunReport report = make(SudoStrategy::Prompt).run_update({}, false);

    const UpdateResult* r1 = report.find("first");
    EXPECT_EQ(r1->status, Status::Success);
    EXPECT_EQ(r1->updated.size(), 1u);
    EXPECT_EQ(report.find("second")->status, Status::Cancelled);
    EXPECT_TRUE(second->events.empty());
    EXPECT_EQ(report.overall_status(), Status::Cancelled);
}

TEST_F(OrchestratorTest, ParallelRunKeepsConfiguredOrder) {
    config.parallelism = 4;
    std::vector<FakeManager*> managers;
    for (int i = 0; i < 6; ++i) {
        FakeManager* m = add("m" + std::to_string(i));
        m->packages = {make_package("p" + std::to_string(i))};
        m->check_delay = std::chrono::milliseconds((6 - i) * 20);
        managers.push_back(m);
    }

    RunReport report = make(SudoStrategy::Prompt).run_update({}, false);

    ASSERT_EQ(report.results().size(), 6u);
    for (int i = 0; i < 6; ++i) {
        EXPECT_EQ(report.results()[i].manager, "m" + std::to_string(i));
        EXPECT_EQ(report.results()[i].status, Status::Success);
    }
    EXPECT_EQ(report.overall_status(), Status::Success);
}

TEST_F(OrchestratorTest, ListManagersReportsAvailabilityAndEnablement) {
    FakeManager* a = add("a");
    a->available = false;
    add("b", false);

    auto listings = make(SudoStrategy::Prompt).list_managers();

    ASSERT_EQ(listings.size(), 2u);
    EXPECT_EQ(listings[0].id, "a");
    EXPECT_FALSE(listings[0].available);
    EXPECT_TRUE(listings[0].enabled);
    EXPECT_EQ(listings[1].id, "b");
    EXPECT_TRUE(listings[1].available);
    EXPECT_FALSE(listings[1].enabled);
}

TEST(DeriveStatusTest, Rules) {
    UpdateResult r;
    EXPECT_EQ(derive_status(r, RunMode::Update, false), Status::Success);
    EXPECT_EQ(derive_status(r, RunMode::Update, true), Status::Simulated);

    r.updated = {make_package("a")};
    r.errors.push_back({ErrorKind::InvocationFailed, Step::Cleanup, "cleanup", 1, ""});
    EXPECT_EQ(derive_status(r, RunMode::Update, false), Status::Degraded);

    r.skipped.push_back({make_package("b", true), "no cached credentials"});
    EXPECT_EQ(derive_status(r, RunMode::Update, false), Status::PartialSuccess);

    UpdateResult failed;
    failed.errors.push_back({ErrorKind::Timeout, Step::Discover, "timed out", std::nullopt, ""});
    EXPECT_EQ(derive_status(failed, RunMode::Status, false), Status::Failed);
    EXPECT_EQ(derive_status(failed, RunMode::Update, true), Status::Failed);
}
