/**
 * @file child_process.hpp
 * @brief RAII handle for a spawned child running in its own process group.
 *
 * The child is started with posix_spawnp() as the leader of a fresh process
 * group, with stdin read from a file and stdout/stderr connected to
 * close-on-exec pipes owned by the handle. Every other descriptor is closed
 * in the child. Destroying a handle that was not
 * reaped kills the whole group and reaps the leader, so no exit path of the
 * supervisor can leak a process or a descriptor.
 */

#pragma once

#include "core/file_descriptor.hpp"
#include "core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <sys/resource.h>
#include <sys/types.h>

namespace exec_sandbox {

struct SpawnSpec {
    std::string program;                  ///< Resolved through PATH
    std::vector<std::string> args;        ///< argv[1..]
    std::filesystem::path stdin_path;
    std::filesystem::path working_dir;
    std::string run_tag;                  ///< Exported as EXEC_SANDBOX_RUN when set
};

struct ExitStatus {
    std::optional<int> exit_code;         ///< Set when the child called exit()
    std::optional<int> term_signal;       ///< Set when a signal killed it
    struct rusage usage{};

    [[nodiscard]] bool success() const noexcept {
        return exit_code.has_value() && *exit_code == 0;
    }
};

class ChildProcess {
public:
    /**
     * @brief Start the child. Fails with ErrorKind::Launch when a pipe cannot
     *        be created or the program cannot be executed.
     */
    static Result<ChildProcess> spawn(const SpawnSpec& spec);

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;
    ~ChildProcess();

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }
    [[nodiscard]] bool reaped() const noexcept { return reaped_; }
    [[nodiscard]] const std::string& run_tag() const noexcept { return run_tag_; }

    /// Read ends of the stdout/stderr pipes (non-blocking).
    [[nodiscard]] int stdout_fd() const noexcept { return stdout_.get(); }
    [[nodiscard]] int stderr_fd() const noexcept { return stderr_.get(); }

    /**
     * @brief Non-blocking check whether the leader has exited.
     *
     * Uses WNOWAIT so the zombie keeps the process group id reserved until
     * kill_group() has run.
     */
    Result<bool> has_exited() const;

    /**
     * @brief SIGKILL every process in the group.
     *
     * Idempotent: a group that is already gone is not an error, and calling
     * it after reap() does nothing.
     */
    Result<void> kill_group();

    /**
     * @brief kill_group() plus every descendant or tagged process that left
     *        the group. Must run before reap() so the leader's pid stays
     *        reserved. Returns how many non-leader processes the sweeps
     *        killed.
     */
    Result<size_t> kill_tree();

    /**
     * @brief Block until the leader is reaped and return its status.
     */
    Result<ExitStatus> reap();

    void close_pipes() noexcept;

private:
    ChildProcess(pid_t pid, std::string run_tag, FileDescriptor out, FileDescriptor err) noexcept;

    void dispose() noexcept;

    pid_t pid_ = -1;
    bool reaped_ = false;
    std::string run_tag_;
    FileDescriptor stdout_;
    FileDescriptor stderr_;
};

/**
 * @brief Accumulates bytes from a non-blocking pipe up to a cap.
 *
 * Bytes past the cap are still read, so the writer never stalls on a full
 * pipe, but they are discarded.
 */
class OutputCapture {
public:
    OutputCapture(int fd, uint64_t max_bytes) noexcept;

    /// Read whatever is available now. Never blocks.
    void read_available();

    [[nodiscard]] bool open() const noexcept { return open_; }
    [[nodiscard]] int fd() const noexcept { return fd_; }
    [[nodiscard]] bool truncated() const noexcept { return truncated_; }
    [[nodiscard]] const std::string& data() const& noexcept { return data_; }
    [[nodiscard]] std::string take() && { return std::move(data_); }

private:
    int fd_;
    uint64_t max_bytes_;
    std::string data_;
    bool open_;
    bool truncated_ = false;
};

}  // namespace exec_sandbox
