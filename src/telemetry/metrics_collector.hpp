/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>

namespace exec_sandbox {

/**
 * @brief Per-status invocation counters, readable without the sink.
 */
struct InvocationCounters {
    uint64_t success = 0;
    uint64_t runtime_error = 0;
    uint64_t time_limit_exceeded = 0;
    uint64_t setup_error = 0;
    uint64_t rejected = 0;

    [[nodiscard]] uint64_t total() const noexcept {
        return success + runtime_error + time_limit_exceeded + setup_error;
    }
};

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    /// One "invocation" event per executed request.
    void record_invocation(const ExecutionOutcome& outcome);

    /// A request refused before execution (queue full, bad frame).
    void record_rejection(std::string_view reason);

    [[nodiscard]] InvocationCounters counters() const;

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    mutable std::mutex write_mutex_;
    InvocationCounters counters_;
};

}  // namespace exec_sandbox
