/**
 * @file proc_probe.cpp
 * @brief Kernel-backed memory probes: /proc/<pid>/status and rusage.
 */

#include "resource_monitor/memory_probe.hpp"

#include "core/file_descriptor.hpp"

#include <string>

namespace exec_sandbox {

namespace {

Result<uint64_t> from_maxrss(const struct rusage& usage) {
    // ru_maxrss is reported in kilobytes on Linux.
    if (usage.ru_maxrss <= 0) {
        return Error{ErrorKind::Io, "ru_maxrss not reported"};
    }
    return static_cast<uint64_t>(usage.ru_maxrss);
}

}  // anonymous namespace

Result<uint64_t> parse_status_kb(std::string_view status_text, std::string_view key) {
    size_t pos = 0;
    while (pos < status_text.size()) {
        auto eol = status_text.find('\n', pos);
        if (eol == std::string_view::npos) eol = status_text.size();
        auto line = status_text.substr(pos, eol - pos);
        pos = eol + 1;

        if (line.size() <= key.size() || !line.starts_with(key) || line[key.size()] != ':') {
            continue;
        }

        std::istringstream iss(std::string{line.substr(key.size() + 1)});
        uint64_t value = 0;
        std::string unit;
        if (!(iss >> value)) {
            return Error{ErrorKind::Parse, "Malformed " + std::string{key} + " line"};
        }
        iss >> unit;
        if (!unit.empty() && unit != "kB") {
            return Error{ErrorKind::Parse, "Unexpected unit for " + std::string{key} + ": " + unit};
        }
        return value;
    }
    return Error{ErrorKind::Parse, std::string{key} + " not present"};
}

// ── RusageProbe ──────────────────────────────

Result<uint64_t> RusageProbe::sample_running(pid_t /*pid*/) const {
    return Error{ErrorKind::Internal, "rusage probe samples only reaped processes"};
}

Result<uint64_t> RusageProbe::sample_reaped(const struct rusage& usage) const {
    return from_maxrss(usage);
}

// ── ProcStatusProbe ──────────────────────────

ProcStatusProbe::ProcStatusProbe(std::string proc_root)
    : proc_root_(std::move(proc_root)) {}

Result<uint64_t> ProcStatusProbe::sample_running(pid_t pid) const {
    auto text = read_file(proc_root_ + "/" + std::to_string(pid) + "/status");
    if (!text || text->empty()) {
        return Error{ErrorKind::Io, "Cannot read status of pid " + std::to_string(pid)};
    }
    auto hwm = parse_status_kb(*text, "VmHWM");
    if (hwm.has_value()) return hwm;
    return parse_status_kb(*text, "VmRSS");
}

Result<uint64_t> ProcStatusProbe::sample_reaped(const struct rusage& usage) const {
    return from_maxrss(usage);
}

}  // namespace exec_sandbox
