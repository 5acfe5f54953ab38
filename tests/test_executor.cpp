#include <gtest/gtest.h>
#include "../src/executor.hpp"
#include "../src/localization.hpp"

#include <fcntl.h>
#include <string>
#include <thread>
#include <unistd.h>

class ExecutorTest : public ::testing::Test {
protected:
    PosixSpawner spawner;
    Logger logger{LogLevel::Error, false};
    Executor executor{spawner, logger, std::chrono::seconds(30)};

    void SetUp() override {
        init_localization(SYSUP_SOURCE_DIR "/l10n");
    }

    static ExecOptions with_timeout(std::chrono::milliseconds timeout) {
        ExecOptions options;
        options.timeout = timeout;
        return options;
    }
};

TEST_F(ExecutorTest, CapturesBothStreamsAndExitCode) {
    ProcessOutput out = executor.run({"/bin/sh", "-c", "echo out; echo err 1>&2; exit 3"});
    EXPECT_EQ(out.exit_code, 3);
    EXPECT_EQ(out.out, "out\n");
    EXPECT_EQ(out.err, "err\n");
    EXPECT_FALSE(out.timed_out);
}

TEST_F(ExecutorTest, CheckTurnsNonZeroExitIntoInvocationError) {
    try {
        executor.check({"/bin/sh", "-c", "echo 'Error: no such formula' 1>&2; exit 2"});
        FAIL() << "expected InvocationError";
    } catch (const InvocationError& e) {
        EXPECT_EQ(e.kind(), InvocationError::Kind::Failed);
        ASSERT_TRUE(e.exit_code().has_value());
        EXPECT_EQ(*e.exit_code(), 2);
        EXPECT_NE(std::string(e.what()).find("no such formula"), std::string::npos);
        EXPECT_NE(e.output().find("no such formula"), std::string::npos);
    }
}

TEST_F(ExecutorTest, ToolSpecificSuccessCodes) {
    ExecOptions options;
    options.ok_exit_codes = {0, 1};
    EXPECT_NO_THROW(executor.check({"/bin/sh", "-c", "exit 1"}, options));
    EXPECT_THROW(executor.check({"/bin/sh", "-c", "exit 2"}, options), InvocationError);
}

TEST_F(ExecutorTest, TimeoutTerminatesAndKeepsPartialOutput) {
    const auto start = std::chrono::steady_clock::now();
    ProcessOutput out = executor.run({"/bin/sh", "-c", "echo partial; sleep 30"},
                                     with_timeout(std::chrono::milliseconds(300)));
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(out.timed_out);
    EXPECT_EQ(out.out, "partial\n");
    EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST_F(ExecutorTest, CheckReportsTimeout) {
    try {
        executor.check({"/bin/sh", "-c", "sleep 30"}, with_timeout(std::chrono::milliseconds(200)));
        FAIL() << "expected InvocationError";
    } catch (const InvocationError& e) {
        EXPECT_EQ(e.kind(), InvocationError::Kind::Timeout);
        EXPECT_FALSE(e.exit_code().has_value());
    }
}

TEST_F(ExecutorTest, MissingProgramExits127) {
    ProcessOutput out = executor.run({"sysup-definitely-missing-tool", "--version"});
    EXPECT_EQ(out.exit_code, 127);
    EXPECT_NE(out.err.find("command not found"), std::string::npos);
    EXPECT_FALSE(executor.resolve("sysup-definitely-missing-tool"));
    EXPECT_TRUE(executor.resolve("sh"));
}

TEST_F(ExecutorTest, DryRunRefusesMutatingCommands) {
    executor.set_dry_run(true);
    ExecOptions mutating;
    mutating.effect = Effect::Mutating;
    EXPECT_THROW(executor.run({"/bin/sh", "-c", "exit 0"}, mutating), SysupException);
    EXPECT_EQ(executor.run({"/bin/sh", "-c", "exit 0"}).exit_code, 0);
}

TEST_F(ExecutorTest, CancelledTokenPreventsSpawn) {
    CancelToken token;
    token.cancel();
    executor.set_cancel_token(&token);
    ProcessOutput out = executor.run({"/bin/sh", "-c", "echo should-not-run"});
    EXPECT_TRUE(out.cancelled);
    EXPECT_TRUE(out.out.empty());
    try {
        executor.check({"/bin/sh", "-c", "exit 0"});
        FAIL() << "expected InvocationError";
    } catch (const InvocationError& e) {
        EXPECT_EQ(e.kind(), InvocationError::Kind::Cancelled);
    }
}

TEST_F(ExecutorTest, CancellationStopsRunningCommand) {
    CancelToken token;
    executor.set_cancel_token(&token);
    std::thread canceller([&token] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        token.cancel();
    });
    const auto start = std::chrono::steady_clock::now();
    ProcessOutput out = executor.run({"/bin/sh", "-c", "sleep 30"});
    canceller.join();
    EXPECT_TRUE(out.cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
}

TEST_F(ExecutorTest, DeadlineActsAsCancellation) {
    CancelToken token;
    token.set_deadline(std::chrono::steady_clock::now() - std::chrono::seconds(1));
    EXPECT_TRUE(token.cancelled());
}

TEST_F(ExecutorTest, ExtraPathComesFirst) {
    executor.set_extra_path({"/opt/homebrew/bin", "/usr/local/bin"});
    EXPECT_EQ(executor.search_path().rfind("/opt/homebrew/bin:/usr/local/bin:", 0), 0u);
    ProcessOutput out = executor.run({"/bin/sh", "-c", "echo $PATH"});
    EXPECT_EQ(out.out.rfind("/opt/homebrew/bin:", 0), 0u);
}

TEST_F(ExecutorTest, EnvironmentOverrides) {
    executor.set_env("SYSUP_TEST_GLOBAL", "g");
    ExecOptions options;
    options.env["SYSUP_TEST_LOCAL"] = "l";
    ProcessOutput out = executor.run({"/bin/sh", "-c", "echo $SYSUP_TEST_GLOBAL$SYSUP_TEST_LOCAL"}, options);
    EXPECT_EQ(out.out, "gl\n");
}

TEST_F(ExecutorTest, ChildStdinIsClosed) {
    ProcessOutput out = executor.run({"/bin/sh", "-c", "cat; echo done"}, with_timeout(std::chrono::seconds(5)));
    EXPECT_FALSE(out.timed_out);
    EXPECT_EQ(out.out, "done\n");
}

// Feeds `input` to this process's stdin for the lifetime of the object.
class StdinFeed {
public:
    explicit StdinFeed(const std::string& input) {
        saved_ = dup(STDIN_FILENO);
        int fds[2];
        if (pipe(fds) != 0) return;
        if (write(fds[1], input.data(), input.size()) != static_cast<ssize_t>(input.size())) {
            close(fds[0]);
            close(fds[1]);
            return;
        }
        close(fds[1]);
        dup2(fds[0], STDIN_FILENO);
        close(fds[0]);
    }
    ~StdinFeed() {
        if (saved_ != -1) {
            dup2(saved_, STDIN_FILENO);
            close(saved_);
        }
    }
    StdinFeed(const StdinFeed&) = delete;
    StdinFeed& operator=(const StdinFeed&) = delete;

private:
    int saved_ = -1;
};

TEST_F(ExecutorTest, InteractiveChildReadsOurStdin) {
    StdinFeed feed("typed\n");
    ExecOptions options = with_timeout(std::chrono::seconds(5));
    options.interactive = true;
    ProcessOutput out = executor.run({"/bin/sh", "-c", "read answer; echo got-$answer"}, options);
    EXPECT_FALSE(out.timed_out);
    EXPECT_EQ(out.exit_code, 0);
    EXPECT_EQ(out.out, "got-typed\n");
}

TEST_F(ExecutorTest, NonInteractiveChildNeverSeesOurStdin) {
    StdinFeed feed("typed\n");
    ProcessOutput out = executor.run({"/bin/sh", "-c", "read answer; echo got-$answer"},
                                     with_timeout(std::chrono::seconds(5)));
    EXPECT_FALSE(out.timed_out);
    EXPECT_EQ(out.out, "got-\n");
}

TEST_F(ExecutorTest, InteractiveChildStaysInOurProcessGroup) {
    const std::string script = "cut -d' ' -f5 /proc/$$/stat; echo $$";
    ExecOptions options = with_timeout(std::chrono::seconds(5));
    options.interactive = true;
    ProcessOutput shared = executor.run({"/bin/sh", "-c", script}, options);
    ASSERT_EQ(shared.exit_code, 0);
    EXPECT_EQ(shared.out.substr(0, shared.out.find('\n')), std::to_string(getpgrp()));

    ProcessOutput own = executor.run({"/bin/sh", "-c", script}, with_timeout(std::chrono::seconds(5)));
    ASSERT_EQ(own.exit_code, 0);
    const auto newline = own.out.find('\n');
    ASSERT_NE(newline, std::string::npos);
    EXPECT_EQ(own.out.substr(0, newline), own.out.substr(newline + 1, own.out.size() - newline - 2));
}

TEST_F(ExecutorTest, InteractiveTimeoutStillTerminates) {
    ExecOptions options = with_timeout(std::chrono::milliseconds(200));
    options.interactive = true;
    ProcessOutput out = executor.run({"/bin/sh", "-c", "exec sleep 30"}, options);
    EXPECT_TRUE(out.timed_out);
}

TEST_F(ExecutorTest, EmptyCommandIsRejected) {
    EXPECT_THROW(executor.run({}), SysupException);
}

TEST(FindProgramTest, SearchesPath) {
    EXPECT_TRUE(find_program("sh", "/nonexistent:/bin:/usr/bin").has_value());
    EXPECT_FALSE(find_program("sh", "/nonexistent").has_value());
    EXPECT_EQ(find_program("/bin/sh", "").value_or(""), "/bin/sh");
}
