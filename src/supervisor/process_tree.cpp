/**
 * @file process_tree.cpp
 * @brief /proc scanning and tree termination for invocations.
 */

#include "supervisor/process_tree.hpp"

#include "core/file_descriptor.hpp"

#include <atomic>
#include <charconv>
#include <cstdint>
#include <csignal>
#include <deque>
#include <system_error>
#include <unordered_map>
#include <unordered_set>

#include <unistd.h>

namespace exec_sandbox {

namespace {

constexpr int kMaxSweepRounds = 16;

std::optional<pid_t> parse_pid(std::string_view text) {
    pid_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size() || value <= 0) {
        return std::nullopt;
    }
    return value;
}

}  // anonymous namespace

std::string next_run_tag() {
    static std::atomic<uint64_t> counter{0};
    return std::to_string(::getpid()) + "-" + std::to_string(counter.fetch_add(1) + 1);
}

std::optional<ProcessInfo> parse_stat_line(std::string_view line) {
    // "<pid> (<comm>) <state> <ppid> ..."; comm may itself contain ") ".
    auto lparen = line.find(" (");
    auto rparen = line.rfind(") ");
    if (lparen == std::string_view::npos || rparen == std::string_view::npos || rparen < lparen) {
        return std::nullopt;
    }
    auto pid = parse_pid(line.substr(0, lparen));
    if (!pid) return std::nullopt;

    auto rest = line.substr(rparen + 2);
    if (rest.size() < 3 || rest[1] != ' ') return std::nullopt;
    char state = rest[0];
    rest.remove_prefix(2);
    auto ppid_text = rest.substr(0, rest.find(' '));

    pid_t ppid = 0;
    auto [end, ec] = std::from_chars(ppid_text.data(), ppid_text.data() + ppid_text.size(), ppid);
    if (ec != std::errc{}) return std::nullopt;

    return ProcessInfo{*pid, ppid, state};
}

std::vector<ProcessInfo> list_processes(const std::filesystem::path& proc_root) {
    std::vector<ProcessInfo> table;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(proc_root, ec), end; !ec && it != end;
         it.increment(ec)) {
        auto name = it->path().filename().string();
        if (!parse_pid(name)) continue;

        // Processes exit while we scan; a missing stat file is not an error.
        auto stat = read_file(it->path() / "stat");
        if (!stat) continue;
        if (auto info = parse_stat_line(*stat)) {
            table.push_back(*info);
        }
    }
    return table;
}

bool carries_run_tag(pid_t pid, std::string_view tag, const std::filesystem::path& proc_root) {
    if (tag.empty()) return false;
    auto env_block = read_file(proc_root / std::to_string(pid) / "environ");
    if (!env_block) return false;

    std::string wanted{kRunTagVariable};
    wanted += '=';
    wanted += tag;

    std::string_view entries = *env_block;
    while (!entries.empty()) {
        auto nul = entries.find('\0');
        auto entry = entries.substr(0, nul);
        if (entry == wanted) return true;
        if (nul == std::string_view::npos) break;
        entries.remove_prefix(nul + 1);
    }
    return false;
}

std::vector<pid_t> invocation_members(pid_t leader, std::string_view tag,
                                      const std::vector<ProcessInfo>& table,
                                      const std::filesystem::path& proc_root) {
    std::unordered_multimap<pid_t, pid_t> children;
    for (const auto& info : table) {
        children.emplace(info.ppid, info.pid);
    }

    std::unordered_set<pid_t> found;
    std::deque<pid_t> pending{leader};
    while (!pending.empty()) {
        pid_t parent = pending.front();
        pending.pop_front();
        auto [first, last] = children.equal_range(parent);
        for (auto it = first; it != last; ++it) {
            if (found.insert(it->second).second) pending.push_back(it->second);
        }
    }

    std::vector<pid_t> members;
    for (const auto& info : table) {
        if (info.pid == leader || info.dead()) continue;
        if (found.count(info.pid) > 0 || carries_run_tag(info.pid, tag, proc_root)) {
            members.push_back(info.pid);
        }
    }
    return members;
}

size_t kill_invocation_tree(pid_t leader, std::string_view tag,
                            const std::filesystem::path& proc_root) {
    std::unordered_set<pid_t> seen;
    size_t killed = 0;
    for (int round = 0; round < kMaxSweepRounds; ++round) {
        size_t fresh = 0;
        for (pid_t pid : invocation_members(leader, tag, list_processes(proc_root), proc_root)) {
            if (!seen.insert(pid).second) continue;
            ++fresh;
            // ESRCH: it exited between the scan and the signal.
            if (::kill(pid, SIGKILL) == 0) ++killed;
        }
        if (fresh == 0) break;
    }
    return killed;
}

}  // namespace exec_sandbox
