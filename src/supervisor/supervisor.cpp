/**
 * @file supervisor.cpp
 * @brief ExecutionSupervisor: launch, deadline race, termination and
 *        outcome classification.
 *
 * The supervision loop multiplexes the child's stdout/stderr pipes with
 * poll() in short ticks. After every tick it drains both pipes, samples
 * memory and asks whether the leader has exited (without reaping it). The
 * loop ends on exit or on the deadline, whichever is observed first; an exit
 * observed at or after the deadline still counts as a timeout. Either way
 * the whole process group is killed before the leader is reaped, so stray
 * descendants never outlive the invocation.
 */

#include "supervisor/supervisor.hpp"

#include "supervisor/process_tree.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <thread>

#include <poll.h>

namespace exec_sandbox {

ExecutionSupervisor::ExecutionSupervisor(SupervisorConfig config,
                                         const IMemoryProbe& probe,
                                         Logger& logger)
    : config_(std::move(config)), probe_(probe), logger_(logger) {}

Milliseconds ExecutionSupervisor::effective_time_limit(Milliseconds requested) const noexcept {
    return std::clamp(requested, Milliseconds{1}, Milliseconds{config_.max_time_limit_ms});
}

SpawnSpec ExecutionSupervisor::spawn_spec(const Workspace& workspace) const {
    SpawnSpec spec;
    spec.program = config_.interpreter;
    spec.args = config_.interpreter_args;
    spec.args.push_back(workspace.source_path().string());
    spec.stdin_path = workspace.input_path();
    spec.working_dir = workspace.root();
    spec.run_tag = next_run_tag();
    return spec;
}

uint64_t ExecutionSupervisor::sample_memory(const ChildProcess& child, uint64_t peak_kb) const {
    // Failures mean "unknown" and leave the running maximum untouched.
    auto sample = probe_.sample_running(child.pid());
    return sample.has_value() ? std::max(peak_kb, *sample) : peak_kb;
}

ExecutionOutcome ExecutionSupervisor::run(const Workspace& workspace,
                                          Milliseconds time_limit) const {
    using Clock = std::chrono::steady_clock;

    RunStateMachine state;
    ExecutionOutcome outcome;

    const auto limit = effective_time_limit(time_limit);
    outcome.time_limit_clamped = (limit != time_limit);
    if (outcome.time_limit_clamped) {
        logger_.info("Time limit " + std::to_string(time_limit.count()) + "ms clamped to "
                     + std::to_string(limit.count()) + "ms");
    }

    // ── Launch ───────────────────────────────
    state.advance(RunState::Launching);
    const auto started = Clock::now();
    auto spawned = ChildProcess::spawn(spawn_spec(workspace));
    if (!spawned) {
        state.advance(RunState::LaunchFailed);
        logger_.warn("Launch failed: " + spawned.error().message);
        auto failed = ExecutionOutcome::setup_error(spawned.error().message);
        failed.time_limit_clamped = outcome.time_limit_clamped;
        return failed;
    }
    ChildProcess child = std::move(spawned).value();
    state.advance(RunState::Running);
    logger_.debug("Child " + std::to_string(child.pid()) + " running with limit "
                  + std::to_string(limit.count()) + "ms");

    // ── Deadline race ────────────────────────
    const auto deadline = started + limit;
    const Milliseconds tick{config_.poll_interval_ms};
    OutputCapture out(child.stdout_fd(), config_.max_output_bytes);
    OutputCapture err(child.stderr_fd(), config_.max_output_bytes);
    uint64_t peak_kb = 0;
    bool timed_out = false;

    while (true) {
        auto now = Clock::now();
        if (now >= deadline) {
            timed_out = true;
            break;
        }
        auto wait = std::min(std::chrono::ceil<Milliseconds>(deadline - now), tick);

        std::array<pollfd, 2> fds{};
        nfds_t nfds = 0;
        for (auto* capture : {&out, &err}) {
            if (capture->open()) {
                fds[nfds].fd = capture->fd();
                fds[nfds].events = POLLIN;
                ++nfds;
            }
        }
        if (nfds > 0) {
            if (::poll(fds.data(), nfds, static_cast<int>(wait.count())) < 0 && errno != EINTR) {
                throw std::runtime_error(std::string{"poll failed: "} + std::strerror(errno));
            }
        } else {
            std::this_thread::sleep_for(wait);
        }

        out.read_available();
        err.read_available();
        peak_kb = sample_memory(child, peak_kb);

        auto exited = child.has_exited();
        if (!exited.has_value()) {
            throw std::runtime_error(exited.error().message);
        }
        if (*exited) {
            timed_out = Clock::now() >= deadline;
            break;
        }
    }

    // ── Termination and reaping ──────────────
    // On timeout this is the forced kill; after a natural exit it removes
    // descendants left behind by the program, including those that moved to
    // another group or session. A failure here never changes the
    // classification.
    if (auto killed = child.kill_tree(); !killed) {
        logger_.warn("Process group " + std::to_string(child.pid())
                     + " termination failed: " + killed.error().message);
    } else if (*killed > 0) {
        logger_.debug("Killed " + std::to_string(*killed) + " descendant(s) of child "
                      + std::to_string(child.pid()));
    }
    auto reaped = child.reap();
    const auto finished = Clock::now();

    out.read_available();
    err.read_available();
    child.close_pipes();

    if (!reaped) {
        throw std::runtime_error(reaped.error().message);
    }
    const ExitStatus& exit_status = *reaped;

    outcome.elapsed = std::chrono::duration_cast<Milliseconds>(finished - started);
    outcome.exit_code = exit_status.exit_code;
    outcome.term_signal = exit_status.term_signal;
    if (auto reaped_kb = probe_.sample_reaped(exit_status.usage); reaped_kb.has_value()) {
        peak_kb = std::max(peak_kb, *reaped_kb);
    } else {
        logger_.debug("Memory sample unavailable: " + reaped_kb.error().message);
    }
    outcome.memory_kb = peak_kb;

    // ── Classification ───────────────────────
    if (timed_out) {
        state.advance(RunState::TimedOut);
        outcome.status = OutcomeStatus::TimeLimitExceeded;
        outcome.output = timeout_message(limit);
        logger_.info("Child " + std::to_string(child.pid()) + " killed after "
                     + std::to_string(outcome.elapsed.count()) + "ms");
        return outcome;
    }

    state.advance(RunState::Completed);
    if (exit_status.success()) {
        outcome.status = OutcomeStatus::Success;
        outcome.output_truncated = out.truncated();
        outcome.output = std::move(out).take();
    } else {
        outcome.status = OutcomeStatus::RuntimeError;
        outcome.output_truncated = err.truncated();
        outcome.output = std::move(err).take();
        if (exit_status.term_signal) {
            logger_.info("Child " + std::to_string(child.pid()) + " terminated by signal "
                         + std::to_string(*exit_status.term_signal));
        }
    }
    if (outcome.output_truncated) {
        logger_.warn("Captured output truncated at "
                     + std::to_string(config_.max_output_bytes) + " bytes");
    }
    return outcome;
}

std::string timeout_message(Milliseconds limit) {
    // Shortest round-trip form, always with a fractional part: 5000ms -> "5.0".
    char buf[32];
    double seconds = static_cast<double>(limit.count()) / 1000.0;
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), seconds);
    std::string text = ec == std::errc{} ? std::string(buf, end) : std::to_string(seconds);
    if (text.find_first_of(".e") == std::string::npos) {
        text += ".0";
    }
    return "Execution timed out after " + text + " seconds";
}

}  // namespace exec_sandbox
