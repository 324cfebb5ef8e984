/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 */

#include "telemetry/metrics_collector.hpp"

#include <chrono>
#include <sstream>

namespace exec_sandbox {

namespace {

int64_t now_epoch_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

}  // anonymous namespace

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_invocation(const ExecutionOutcome& outcome) {
    std::ostringstream oss;
    oss << R"({"event":"invocation")"
        << R"(,"ts_ms":)" << now_epoch_ms()
        << R"(,"status":")" << to_string(outcome.status) << "\""
        << R"(,"elapsed_ms":)" << outcome.elapsed.count()
        << R"(,"memory_kb":)" << outcome.memory_kb
        << R"(,"output_bytes":)" << outcome.output.size()
        << R"(,"clamped":)" << (outcome.time_limit_clamped ? "true" : "false")
        << R"(,"truncated":)" << (outcome.output_truncated ? "true" : "false");
    if (outcome.exit_code) {
        oss << R"(,"exit_code":)" << *outcome.exit_code;
    }
    if (outcome.term_signal) {
        oss << R"(,"signal":)" << *outcome.term_signal;
    }
    oss << "}";

    std::lock_guard lock(write_mutex_);
    switch (outcome.status) {
        case OutcomeStatus::Success:           ++counters_.success; break;
        case OutcomeStatus::RuntimeError:      ++counters_.runtime_error; break;
        case OutcomeStatus::TimeLimitExceeded: ++counters_.time_limit_exceeded; break;
        case OutcomeStatus::SetupError:        ++counters_.setup_error; break;
    }
    sink_->write(oss.str());
}

void MetricsCollector::record_rejection(std::string_view reason) {
    std::ostringstream oss;
    oss << R"({"event":"rejected")"
        << R"(,"ts_ms":)" << now_epoch_ms()
        << R"(,"reason":")" << json_escape(reason) << "\""
        << "}";

    std::lock_guard lock(write_mutex_);
    ++counters_.rejected;
    sink_->write(oss.str());
}

InvocationCounters MetricsCollector::counters() const {
    std::lock_guard lock(write_mutex_);
    return counters_;
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace exec_sandbox
