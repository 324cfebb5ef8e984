/**
 * @file process_tree.hpp
 * @brief Locates and kills every process belonging to one invocation.
 *
 * Killing the child's process group misses descendants that called setsid()
 * or setpgid(). Two independent markers identify them: ancestry (the ppid
 * chain back to the leader, intact while intermediate parents live) and a
 * per-invocation tag exported in the environment, which survives
 * reparenting to init. A process that both escapes the ancestry chain and
 * execs with a scrubbed environment is not found; containing that needs a
 * cgroup.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace exec_sandbox {

/// Environment variable carrying the invocation tag into every descendant.
inline constexpr std::string_view kRunTagVariable = "EXEC_SANDBOX_RUN";

struct ProcessInfo {
    pid_t pid = 0;
    pid_t ppid = 0;
    char state = '?';

    [[nodiscard]] bool dead() const noexcept { return state == 'Z' || state == 'X'; }
};

/// Tag unique to this process and invocation, e.g. "4211-17".
std::string next_run_tag();

/// Parse one /proc/<pid>/stat line.
std::optional<ProcessInfo> parse_stat_line(std::string_view line);

/// Snapshot of all processes visible under `proc_root`.
std::vector<ProcessInfo> list_processes(const std::filesystem::path& proc_root = "/proc");

/// True when the process's initial environment holds `EXEC_SANDBOX_RUN=<tag>`.
bool carries_run_tag(pid_t pid, std::string_view tag,
                     const std::filesystem::path& proc_root = "/proc");

/**
 * @brief Live processes of the invocation led by `leader`, leader excluded:
 *        descendants by ppid plus any process carrying `tag` (when non-empty).
 */
std::vector<pid_t> invocation_members(pid_t leader, std::string_view tag,
                                      const std::vector<ProcessInfo>& table,
                                      const std::filesystem::path& proc_root = "/proc");

/**
 * @brief SIGKILL invocation members until a sweep finds no new ones.
 *
 * A member forked between two sweeps inherits the tag and is found by the
 * next one. Returns the number of processes killed.
 */
size_t kill_invocation_tree(pid_t leader, std::string_view tag,
                            const std::filesystem::path& proc_root = "/proc");

}  // namespace exec_sandbox
