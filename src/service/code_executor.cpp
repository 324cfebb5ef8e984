/**
 * @file code_executor.cpp
 * @brief CodeExecutor implementation.
 */

#include "service/code_executor.hpp"

#include "protocol/codec.hpp"

#include <exception>

namespace exec_sandbox {

CodeExecutor::CodeExecutor(const Config& config, const IMemoryProbe& probe, Logger& logger,
                           MetricsCollector* metrics)
    : workspaces_(config.workspace, logger)
    , supervisor_(config.supervisor, probe, logger)
    , logger_(logger)
    , metrics_(metrics)
    , default_limit_(config.supervisor.default_time_limit_ms) {}

ExecutionOutcome CodeExecutor::execute(const ExecutionRequest& request) const {
    if (request.code.empty()) {
        auto outcome = ExecutionOutcome::setup_error("No code provided");
        finish(outcome);
        return outcome;
    }

    ExecutionOutcome outcome;
    try {
        outcome = run_pipeline(request);
    } catch (const std::exception& e) {
        logger_.error(std::string{"Invocation aborted: "} + e.what());
        outcome = ExecutionOutcome::setup_error(e.what());
    }
    finish(outcome);
    return outcome;
}

ExecutionOutcome CodeExecutor::run_pipeline(const ExecutionRequest& request) const {
    auto workspace = workspaces_.acquire(request);
    if (!workspace) {
        logger_.warn("Workspace setup failed: " + workspace.error().message);
        return ExecutionOutcome::setup_error(workspace.error().message);
    }

    auto outcome = supervisor_.run(*workspace, request.time_limit);
    workspace->release();
    return outcome;
}

void CodeExecutor::finish(const ExecutionOutcome& outcome) const {
    if (logger_.enabled(LogLevel::Info)) {
        logger_.info("Invocation finished: status=" + std::string{to_string(outcome.status)}
                     + " elapsed=" + std::to_string(outcome.elapsed.count()) + "ms"
                     + " memory=" + std::to_string(outcome.memory_kb) + "KB");
    }
    if (metrics_ != nullptr) {
        metrics_->record_invocation(outcome);
    }
}

std::string CodeExecutor::handle(std::string_view request_json) const {
    auto request = decode_request(request_json, default_limit_);
    if (!request) {
        logger_.warn("Rejected request: " + request.error().message);
        auto outcome = ExecutionOutcome::setup_error(request.error().message);
        finish(outcome);
        return encode_response(outcome);
    }
    return encode_response(execute(*request));
}

}  // namespace exec_sandbox
