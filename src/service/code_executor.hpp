/**
 * @file code_executor.hpp
 * @brief Synchronous entry point: one request in, one outcome out.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "resource_monitor/memory_probe.hpp"
#include "supervisor/supervisor.hpp"
#include "telemetry/metrics_collector.hpp"
#include "workspace/workspace.hpp"

#include <string>
#include <string_view>

namespace exec_sandbox {

/**
 * @brief Runs requests through workspace → supervisor → cleanup.
 *
 * execute() never throws for request-dependent reasons and always returns
 * exactly one outcome. Unexpected faults are downgraded to SetupError at
 * this boundary. The executor is immutable after construction and may be
 * shared by any number of threads.
 */
class CodeExecutor {
public:
    /// `metrics` may be null.
    CodeExecutor(const Config& config, const IMemoryProbe& probe, Logger& logger,
                 MetricsCollector* metrics = nullptr);

    ExecutionOutcome execute(const ExecutionRequest& request) const;

    /// Decode a request document, execute it, and encode the response.
    std::string handle(std::string_view request_json) const;

    [[nodiscard]] Milliseconds default_time_limit() const noexcept { return default_limit_; }
    [[nodiscard]] const ExecutionSupervisor& supervisor() const noexcept { return supervisor_; }

private:
    ExecutionOutcome run_pipeline(const ExecutionRequest& request) const;
    void finish(const ExecutionOutcome& outcome) const;

    WorkspaceManager workspaces_;
    ExecutionSupervisor supervisor_;
    Logger& logger_;
    MetricsCollector* metrics_;
    Milliseconds default_limit_;
};

}  // namespace exec_sandbox
