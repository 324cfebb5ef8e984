/**
 * @file types.hpp
 * @brief Vocabulary types shared by every exec_sandbox module.
 *
 * Defines the request/outcome pair that crosses the executor boundary, the
 * four-way status taxonomy, and the per-invocation run state machine.
 */

#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace exec_sandbox {

using Milliseconds = std::chrono::milliseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

/// Default caller time limit when a request does not carry one.
inline constexpr Milliseconds kDefaultTimeLimit{10000};

// ─────────────────────────────────────────────
// Request
// ─────────────────────────────────────────────

/**
 * @brief One code submission to execute.
 *
 * Immutable once constructed and owned by the invocation that created it.
 * `input` is fed to the child's stdin byte-for-byte.
 */
struct ExecutionRequest {
    std::string code;
    std::string input;
    Milliseconds time_limit{kDefaultTimeLimit};
};

// ─────────────────────────────────────────────
// Outcome
// ─────────────────────────────────────────────

enum class OutcomeStatus : uint8_t {
    Success,
    RuntimeError,
    TimeLimitExceeded,
    SetupError
};

/**
 * @brief Wire name of a status.
 *
 * SetupError keeps the historical "compilation_error" name even though the
 * failure is usually not a compilation problem.
 */
[[nodiscard]] constexpr std::string_view to_string(OutcomeStatus status) noexcept {
    switch (status) {
        case OutcomeStatus::Success:           return "success";
        case OutcomeStatus::RuntimeError:      return "runtime_error";
        case OutcomeStatus::TimeLimitExceeded: return "time_limit_exceeded";
        case OutcomeStatus::SetupError:        return "compilation_error";
    }
    return "unknown";
}

/// Inverse of to_string(OutcomeStatus).
[[nodiscard]] constexpr std::optional<OutcomeStatus> status_from_string(std::string_view name) noexcept {
    constexpr std::array all{OutcomeStatus::Success, OutcomeStatus::RuntimeError,
                             OutcomeStatus::TimeLimitExceeded, OutcomeStatus::SetupError};
    for (auto status : all) {
        if (to_string(status) == name) return status;
    }
    return std::nullopt;
}

/**
 * @brief Result of one invocation.
 *
 * `output` holds captured stdout for Success, captured stderr for
 * RuntimeError and a diagnostic message otherwise.
 */
struct ExecutionOutcome {
    OutcomeStatus status{OutcomeStatus::SetupError};
    std::string output;
    Milliseconds elapsed{0};
    uint64_t memory_kb{0};

    // Diagnostics. Not part of the wire response.
    std::optional<int> exit_code;
    std::optional<int> term_signal;
    bool time_limit_clamped{false};
    bool output_truncated{false};

    [[nodiscard]] static ExecutionOutcome setup_error(std::string message) {
        ExecutionOutcome outcome;
        outcome.status = OutcomeStatus::SetupError;
        outcome.output = std::move(message);
        return outcome;
    }
};

// ─────────────────────────────────────────────
// Run State
// ─────────────────────────────────────────────

enum class RunState : uint8_t {
    Pending,
    Launching,
    Running,
    Completed,     ///< Exited on its own before the deadline
    TimedOut,      ///< Deadline fired first, process group killed
    LaunchFailed   ///< Never started
};

[[nodiscard]] constexpr std::string_view to_string(RunState state) noexcept {
    switch (state) {
        case RunState::Pending:      return "pending";
        case RunState::Launching:    return "launching";
        case RunState::Running:      return "running";
        case RunState::Completed:    return "completed";
        case RunState::TimedOut:     return "timed_out";
        case RunState::LaunchFailed: return "launch_failed";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_terminal(RunState state) noexcept {
    return state == RunState::Completed
        || state == RunState::TimedOut
        || state == RunState::LaunchFailed;
}

/// Legal edges of the per-invocation state machine.
[[nodiscard]] constexpr bool can_transition(RunState from, RunState to) noexcept {
    switch (from) {
        case RunState::Pending:
            return to == RunState::Launching || to == RunState::LaunchFailed;
        case RunState::Launching:
            return to == RunState::Running || to == RunState::LaunchFailed;
        case RunState::Running:
            return to == RunState::Completed || to == RunState::TimedOut;
        case RunState::Completed:
        case RunState::TimedOut:
        case RunState::LaunchFailed:
            return false;
    }
    return false;
}

/**
 * @brief Tracks one invocation through the run state machine.
 *
 * advance() refuses illegal edges, so nothing re-enters Running once a
 * terminal state is reached.
 */
class RunStateMachine {
public:
    [[nodiscard]] RunState state() const noexcept { return state_; }

    bool advance(RunState next) noexcept {
        if (!can_transition(state_, next)) return false;
        state_ = next;
        return true;
    }

private:
    RunState state_{RunState::Pending};
};

}  // namespace exec_sandbox
