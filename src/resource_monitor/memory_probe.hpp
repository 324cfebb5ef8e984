/**
 * @file memory_probe.hpp
 * @brief Memory accounting capability for supervised children.
 *
 * The supervisor asks a probe for the child's resident memory while it runs
 * and once more after it is reaped, and keeps the maximum. Memory accounting
 * is advisory: any probe failure is reported as an Error and the supervisor
 * treats it as "unknown" (0 KB).
 *
 * Implementations are stateless so one instance can serve every concurrent
 * invocation.
 */

#pragma once

#include "core/result.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <sys/resource.h>
#include <sys/types.h>

namespace exec_sandbox {

class IMemoryProbe {
public:
    virtual ~IMemoryProbe() = default;

    /// Peak resident set of a live process, in KB.
    virtual Result<uint64_t> sample_running(pid_t pid) const = 0;

    /// Peak resident set from the rusage returned when reaping, in KB.
    virtual Result<uint64_t> sample_reaped(const struct rusage& usage) const = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

// ─────────────────────────────────────────────
// RusageProbe
// ─────────────────────────────────────────────

/**
 * @brief Uses only the kernel's ru_maxrss accounting collected by wait4().
 */
class RusageProbe : public IMemoryProbe {
public:
    Result<uint64_t> sample_running(pid_t pid) const override;
    Result<uint64_t> sample_reaped(const struct rusage& usage) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "rusage"; }
};

// ─────────────────────────────────────────────
// ProcStatusProbe
// ─────────────────────────────────────────────

/**
 * @brief Reads VmHWM (falling back to VmRSS) from /proc/<pid>/status while
 *        the child runs; uses ru_maxrss after reaping.
 */
class ProcStatusProbe : public IMemoryProbe {
public:
    explicit ProcStatusProbe(std::string proc_root = "/proc");

    Result<uint64_t> sample_running(pid_t pid) const override;
    Result<uint64_t> sample_reaped(const struct rusage& usage) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "proc"; }

private:
    std::string proc_root_;
};

// ─────────────────────────────────────────────
// NullProbe
// ─────────────────────────────────────────────

/**
 * @brief Memory accounting disabled; every sample fails.
 */
class NullProbe : public IMemoryProbe {
public:
    Result<uint64_t> sample_running(pid_t pid) const override;
    Result<uint64_t> sample_reaped(const struct rusage& usage) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "none"; }
};

// ─────────────────────────────────────────────
// MockProbe
// ─────────────────────────────────────────────

/**
 * @brief Test double returning fixed values, or failing on request.
 */
class MockProbe : public IMemoryProbe {
public:
    struct Options {
        uint64_t running_kb = 0;
        uint64_t reaped_kb = 0;
        bool fail_running = false;
        bool fail_reaped = false;
    };

    MockProbe() = default;
    explicit MockProbe(Options options);

    Result<uint64_t> sample_running(pid_t pid) const override;
    Result<uint64_t> sample_reaped(const struct rusage& usage) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "mock"; }

private:
    Options options_;
};

/**
 * @brief Build the probe named by configuration ("proc", "rusage", "none").
 */
Result<std::unique_ptr<IMemoryProbe>> make_memory_probe(std::string_view name);

/**
 * @brief Parse a "<Key>:   <value> kB" line of /proc/<pid>/status.
 */
Result<uint64_t> parse_status_kb(std::string_view status_text, std::string_view key);

}  // namespace exec_sandbox
