/**
 * @file test_supervisor.cpp
 * @brief Unit tests for ExecutionSupervisor, driven through /bin/sh scripts.
 */

#include "supervisor/supervisor.hpp"

#include "support/test_support.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <csignal>
#include <string>

#include <fcntl.h>
#include <unistd.h>

using namespace exec_sandbox;
using namespace std::chrono_literals;

class SupervisorTest : public ::testing::Test {
protected:
    test_support::TempDir root_{"supervisor"};
    test_support::CaptureSink* sink_ = nullptr;
    std::unique_ptr<Logger> logger_;
    MockProbe probe_{MockProbe::Options{.running_kb = 0, .reaped_kb = 0,
                                        .fail_running = true, .fail_reaped = true}};

    void SetUp() override {
        auto sink = std::make_unique<test_support::CaptureSink>();
        sink_ = sink.get();
        logger_ = std::make_unique<Logger>(std::move(sink), LogLevel::Debug);
    }

    SupervisorConfig shell_config() const {
        SupervisorConfig cfg;
        cfg.interpreter = "/bin/sh";
        cfg.max_time_limit_ms = 8000;
        cfg.poll_interval_ms = 10;
        return cfg;
    }

    Workspace workspace(const std::string& script, const std::string& input = "") {
        WorkspaceConfig cfg;
        cfg.root = root_.path();
        cfg.source_filename = "code.sh";
        WorkspaceManager manager(cfg, *logger_);
        ExecutionRequest request;
        request.code = script;
        request.input = input;
        return manager.acquire(request).value();
    }

    ExecutionOutcome run(const std::string& script, Milliseconds limit = 5000ms,
                         const std::string& input = "") {
        ExecutionSupervisor supervisor(shell_config(), probe_, *logger_);
        auto ws = workspace(script, input);
        return supervisor.run(ws, limit);
    }
};

// ── Natural completion ───────────────────────

TEST_F(SupervisorTest, SuccessReturnsStdout) {
    auto outcome = run("echo 'Hello, World!'");
    EXPECT_EQ(outcome.status, OutcomeStatus::Success);
    EXPECT_EQ(outcome.output, "Hello, World!\n");
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_FALSE(outcome.time_limit_clamped);
}

TEST_F(SupervisorTest, InputReachesStdin) {
    auto outcome = run("read line; echo \"got $line\"", 5000ms, "42\n");
    EXPECT_EQ(outcome.status, OutcomeStatus::Success);
    EXPECT_EQ(outcome.output, "got 42\n");
}

TEST_F(SupervisorTest, NonZeroExitReturnsStderrOnly) {
    auto outcome = run("echo partial; echo 'boom' 1>&2; exit 3");
    EXPECT_EQ(outcome.status, OutcomeStatus::RuntimeError);
    EXPECT_EQ(outcome.output, "boom\n");
    EXPECT_EQ(outcome.exit_code, 3);
}

TEST_F(SupervisorTest, SuccessIgnoresStderr) {
    auto outcome = run("echo warning 1>&2; echo result");
    EXPECT_EQ(outcome.status, OutcomeStatus::Success);
    EXPECT_EQ(outcome.output, "result\n");
}

TEST_F(SupervisorTest, DeathBySignalIsRuntimeError) {
    auto outcome = run("kill -KILL $$");
    EXPECT_EQ(outcome.status, OutcomeStatus::RuntimeError);
    EXPECT_FALSE(outcome.exit_code.has_value());
    EXPECT_EQ(outcome.term_signal, SIGKILL);
}

TEST_F(SupervisorTest, RunsInsideWorkspace) {
    ExecutionSupervisor supervisor(shell_config(), probe_, *logger_);
    auto ws = workspace("pwd -P; ls");
    auto outcome = supervisor.run(ws, 5000ms);
    ASSERT_EQ(outcome.status, OutcomeStatus::Success);
    auto expected_dir = std::filesystem::canonical(ws.root()).string();
    EXPECT_EQ(outcome.output, expected_dir + "\ncode.sh\ninput.txt\n");
}

TEST_F(SupervisorTest, LargeOutputDoesNotDeadlock) {
    auto outcome = run("head -c 1000000 /dev/zero | tr '\\000' 'a'");
    ASSERT_EQ(outcome.status, OutcomeStatus::Success);
    EXPECT_EQ(outcome.output.size(), 1000000u);
    EXPECT_FALSE(outcome.output_truncated);
}

TEST_F(SupervisorTest, OutputCapIsEnforced) {
    auto cfg = shell_config();
    cfg.max_output_bytes = 16;
    ExecutionSupervisor supervisor(cfg, probe_, *logger_);
    auto ws = workspace("head -c 5000 /dev/zero | tr '\\000' 'x'");
    auto outcome = supervisor.run(ws, 5000ms);

    ASSERT_EQ(outcome.status, OutcomeStatus::Success);
    EXPECT_EQ(outcome.output, std::string(16, 'x'));
    EXPECT_TRUE(outcome.output_truncated);
    EXPECT_TRUE(sink_->contains("truncated"));
}

TEST_F(SupervisorTest, StrayDescendantsAreKilledAfterExit) {
    auto outcome = run("sleep 30 & echo $!");
    ASSERT_EQ(outcome.status, OutcomeStatus::Success);
    pid_t orphan = static_cast<pid_t>(std::stol(outcome.output));
    EXPECT_TRUE(test_support::wait_until_gone(orphan));
}

TEST_F(SupervisorTest, NewSessionDescendantIsKilledAfterExit) {
    if (!test_support::command_available("setsid")) GTEST_SKIP() << "setsid not installed";
    auto pid_file = root_.path() / "session.pid";
    auto outcome = run("setsid sh -c 'echo $$ > \"" + pid_file.string() + "\"; exec sleep 30' &\n"
                       "while [ ! -s '" + pid_file.string() + "' ]; do sleep 0.02; done\n");
    ASSERT_EQ(outcome.status, OutcomeStatus::Success);

    auto text = test_support::read_text(pid_file);
    ASSERT_FALSE(text.empty());
    EXPECT_TRUE(test_support::wait_until_gone(static_cast<pid_t>(std::stol(text))));
}

TEST_F(SupervisorTest, ChildInheritsOnlyItsOwnDescriptors) {
    auto log_dir = root_.path() / "logs";
    JsonFileSink log_file(log_dir, "service");
    log_file.write(R"({"msg":"before"})");

    // Opened without O_CLOEXEC on purpose: the spawn must still drop it.
    auto leaked_path = root_.path() / "leaked.txt";
    int leaked = ::open(leaked_path.c_str(), O_WRONLY | O_CREAT, 0600);
    ASSERT_GE(leaked, 0);

    auto outcome = run("ls -l /proc/$$/fd");
    ::close(leaked);

    ASSERT_EQ(outcome.status, OutcomeStatus::Success) << outcome.output;
    EXPECT_NE(outcome.output.find("pipe:"), std::string::npos);
    EXPECT_EQ(outcome.output.find(log_file.current_path().string()), std::string::npos);
    EXPECT_EQ(outcome.output.find(leaked_path.string()), std::string::npos);
}

// ── Deadline ─────────────────────────────────

TEST_F(SupervisorTest, InfiniteLoopTimesOut) {
    auto start = std::chrono::steady_clock::now();
    auto outcome = run("while :; do :; done", 300ms);
    auto wall = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(outcome.status, OutcomeStatus::TimeLimitExceeded);
    EXPECT_EQ(outcome.output, "Execution timed out after 0.3 seconds");
    EXPECT_GE(outcome.elapsed, 300ms);
    EXPECT_LT(wall, 600ms);
    EXPECT_EQ(outcome.term_signal, SIGKILL);
}

TEST_F(SupervisorTest, PartialOutputIsDiscardedOnTimeout) {
    auto outcome = run("echo started; sleep 30", 200ms);
    EXPECT_EQ(outcome.status, OutcomeStatus::TimeLimitExceeded);
    EXPECT_EQ(outcome.output.find("started"), std::string::npos);
}

TEST_F(SupervisorTest, DescendantsAreKilledOnTimeout) {
    auto pid_file = root_.path() / "descendant.pid";
    auto outcome = run("sleep 30 & echo $! > '" + pid_file.string() + "'; wait", 300ms);
    ASSERT_EQ(outcome.status, OutcomeStatus::TimeLimitExceeded);

    auto text = test_support::read_text(pid_file);
    ASSERT_FALSE(text.empty());
    EXPECT_TRUE(test_support::wait_until_gone(static_cast<pid_t>(std::stol(text))));
}

TEST_F(SupervisorTest, NewSessionDescendantIsKilledOnTimeout) {
    if (!test_support::command_available("setsid")) GTEST_SKIP() << "setsid not installed";
    auto pid_file = root_.path() / "session.pid";
    auto outcome = run("setsid sh -c 'echo $$ > \"" + pid_file.string() + "\"; exec sleep 30' &\n"
                       "while :; do :; done\n", 500ms);
    ASSERT_EQ(outcome.status, OutcomeStatus::TimeLimitExceeded);

    auto text = test_support::read_text(pid_file);
    ASSERT_FALSE(text.empty());
    EXPECT_TRUE(test_support::wait_until_gone(static_cast<pid_t>(std::stol(text))));
}

TEST_F(SupervisorTest, LimitIsClampedToCeiling) {
    auto cfg = shell_config();
    cfg.max_time_limit_ms = 200;
    ExecutionSupervisor supervisor(cfg, probe_, *logger_);
    auto ws = workspace("sleep 30");

    auto start = std::chrono::steady_clock::now();
    auto outcome = supervisor.run(ws, 10000ms);
    auto wall = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(outcome.status, OutcomeStatus::TimeLimitExceeded);
    EXPECT_TRUE(outcome.time_limit_clamped);
    EXPECT_EQ(outcome.output, "Execution timed out after 0.2 seconds");
    EXPECT_LT(wall, 1000ms);
    EXPECT_TRUE(sink_->contains("clamped"));
}

TEST_F(SupervisorTest, EffectiveLimitBounds) {
    ExecutionSupervisor supervisor(shell_config(), probe_, *logger_);
    EXPECT_EQ(supervisor.effective_time_limit(0ms), 1ms);
    EXPECT_EQ(supervisor.effective_time_limit(-50ms), 1ms);
    EXPECT_EQ(supervisor.effective_time_limit(500ms), 500ms);
    EXPECT_EQ(supervisor.effective_time_limit(10000ms), 8000ms);
    EXPECT_EQ(supervisor.effective_time_limit(Milliseconds::max()), 8000ms);
}

// ── Launch failure ───────────────────────────

TEST_F(SupervisorTest, MissingInterpreterIsSetupError) {
    auto cfg = shell_config();
    cfg.interpreter = "/nonexistent/python3";
    ExecutionSupervisor supervisor(cfg, probe_, *logger_);
    auto ws = workspace("echo never");

    auto outcome = supervisor.run(ws, 1000ms);
    EXPECT_EQ(outcome.status, OutcomeStatus::SetupError);
    EXPECT_NE(outcome.output.find("/nonexistent/python3"), std::string::npos);
    EXPECT_EQ(outcome.elapsed, 0ms);
    EXPECT_EQ(outcome.memory_kb, 0u);
}

// ── Memory accounting ────────────────────────

TEST_F(SupervisorTest, MemoryIsMaximumOfSamples) {
    MockProbe probe(MockProbe::Options{.running_kb = 100, .reaped_kb = 500});
    ExecutionSupervisor supervisor(shell_config(), probe, *logger_);
    auto ws = workspace("sleep 0.05");
    EXPECT_EQ(supervisor.run(ws, 5000ms).memory_kb, 500u);

    MockProbe running_peak(MockProbe::Options{.running_kb = 900, .reaped_kb = 500});
    ExecutionSupervisor supervisor2(shell_config(), running_peak, *logger_);
    auto ws2 = workspace("sleep 0.05");
    EXPECT_EQ(supervisor2.run(ws2, 5000ms).memory_kb, 900u);
}

TEST_F(SupervisorTest, ProbeFailureReportsZero) {
    auto outcome = run("echo ok");
    EXPECT_EQ(outcome.status, OutcomeStatus::Success);
    EXPECT_EQ(outcome.memory_kb, 0u);
}

TEST_F(SupervisorTest, RusageProbeReportsMemory) {
    RusageProbe probe;
    ExecutionSupervisor supervisor(shell_config(), probe, *logger_);
    auto ws = workspace("echo ok");
    auto outcome = supervisor.run(ws, 5000ms);
    EXPECT_EQ(outcome.status, OutcomeStatus::Success);
    EXPECT_GT(outcome.memory_kb, 0u);
}

// ── Helpers ──────────────────────────────────

TEST_F(SupervisorTest, SpawnSpecOrdersArguments) {
    auto cfg = shell_config();
    cfg.interpreter_args = {"-e", "-u"};
    ExecutionSupervisor supervisor(cfg, probe_, *logger_);
    auto ws = workspace("true");

    auto spec = supervisor.spawn_spec(ws);
    EXPECT_EQ(spec.program, "/bin/sh");
    ASSERT_EQ(spec.args.size(), 3u);
    EXPECT_EQ(spec.args[0], "-e");
    EXPECT_EQ(spec.args[1], "-u");
    EXPECT_EQ(spec.args[2], ws.source_path().string());
    EXPECT_EQ(spec.stdin_path.string(), ws.input_path().string());
    EXPECT_EQ(spec.working_dir.string(), ws.root().string());
    EXPECT_FALSE(spec.run_tag.empty());
    EXPECT_NE(supervisor.spawn_spec(ws).run_tag, spec.run_tag);
}

TEST(TimeoutMessageTest, FormatsSeconds) {
    EXPECT_EQ(timeout_message(Milliseconds{8000}), "Execution timed out after 8.0 seconds");
    EXPECT_EQ(timeout_message(Milliseconds{500}), "Execution timed out after 0.5 seconds");
    EXPECT_EQ(timeout_message(Milliseconds{1250}), "Execution timed out after 1.25 seconds");
}

TEST(TimeoutMessageTest, WholeSecondsKeepFractionalPart) {
    EXPECT_EQ(timeout_message(Milliseconds{5000}), "Execution timed out after 5.0 seconds");
    EXPECT_EQ(timeout_message(Milliseconds{1}), "Execution timed out after 0.001 seconds");
    EXPECT_EQ(timeout_message(Milliseconds{30000}), "Execution timed out after 30.0 seconds");
}
