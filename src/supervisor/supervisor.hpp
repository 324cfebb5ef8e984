/**
 * @file supervisor.hpp
 * @brief Runs one workspace's source under a wall-clock deadline.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "resource_monitor/memory_probe.hpp"
#include "supervisor/child_process.hpp"
#include "workspace/workspace.hpp"

namespace exec_sandbox {

/**
 * @brief Launches the interpreter against a workspace, races its exit
 *        against the deadline, and classifies the result.
 *
 * Holds only immutable configuration and references to thread-safe
 * collaborators, so a single instance serves concurrent invocations. The
 * child handle and output buffers live on the stack of run().
 *
 * run() never retries. A failed run is reported, not repeated.
 */
class ExecutionSupervisor {
public:
    ExecutionSupervisor(SupervisorConfig config, const IMemoryProbe& probe, Logger& logger);

    /**
     * @brief Execute the workspace's source file.
     *
     * Returns Success (stdout) or RuntimeError (stderr) when the child exits
     * before the deadline, TimeLimitExceeded after killing the process group
     * otherwise, and SetupError when the child cannot be launched.
     *
     * @throws std::runtime_error if waiting on the child fails after launch.
     *         The child is killed and reaped before the exception leaves.
     */
    ExecutionOutcome run(const Workspace& workspace, Milliseconds time_limit) const;

    /// Clamp a requested limit into [1 ms, max_time_limit].
    [[nodiscard]] Milliseconds effective_time_limit(Milliseconds requested) const noexcept;

    [[nodiscard]] SpawnSpec spawn_spec(const Workspace& workspace) const;

    [[nodiscard]] const SupervisorConfig& config() const noexcept { return config_; }

private:
    uint64_t sample_memory(const ChildProcess& child, uint64_t peak_kb) const;

    SupervisorConfig config_;
    const IMemoryProbe& probe_;
    Logger& logger_;
};

/// "Execution timed out after <seconds> seconds", seconds always with a
/// fractional part ("5.0", "0.5").
[[nodiscard]] std::string timeout_message(Milliseconds limit);

}  // namespace exec_sandbox
