/**
 * @file mock_probe.cpp
 * @brief NullProbe, MockProbe and the probe factory.
 */

#include "resource_monitor/memory_probe.hpp"

namespace exec_sandbox {

// ── NullProbe ────────────────────────────────

Result<uint64_t> NullProbe::sample_running(pid_t /*pid*/) const {
    return Error{ErrorKind::Internal, "memory accounting disabled"};
}

Result<uint64_t> NullProbe::sample_reaped(const struct rusage& /*usage*/) const {
    return Error{ErrorKind::Internal, "memory accounting disabled"};
}

// ── MockProbe ────────────────────────────────

MockProbe::MockProbe(Options options) : options_(options) {}

Result<uint64_t> MockProbe::sample_running(pid_t /*pid*/) const {
    if (options_.fail_running) {
        return Error{ErrorKind::Io, "mock running sample failure"};
    }
    return options_.running_kb;
}

Result<uint64_t> MockProbe::sample_reaped(const struct rusage& /*usage*/) const {
    if (options_.fail_reaped) {
        return Error{ErrorKind::Io, "mock reaped sample failure"};
    }
    return options_.reaped_kb;
}

// ── Factory ──────────────────────────────────

Result<std::unique_ptr<IMemoryProbe>> make_memory_probe(std::string_view name) {
    if (name == "proc") {
        return std::unique_ptr<IMemoryProbe>(std::make_unique<ProcStatusProbe>());
    }
    if (name == "rusage") {
        return std::unique_ptr<IMemoryProbe>(std::make_unique<RusageProbe>());
    }
    if (name == "none") {
        return std::unique_ptr<IMemoryProbe>(std::make_unique<NullProbe>());
    }
    return Error{ErrorKind::Config, "Unknown memory probe: " + std::string{name}};
}

}  // namespace exec_sandbox
