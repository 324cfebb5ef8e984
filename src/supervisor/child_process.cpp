/**
 * @file child_process.cpp
 * @brief posix_spawn-based child launch, process-group kill and reaping.
 */

#include "supervisor/child_process.hpp"

#include "supervisor/process_tree.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <string_view>
#include <utility>

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace exec_sandbox {

namespace {

std::string errno_text(int err) {
    return std::strerror(err);
}

/**
 * @brief Owns posix_spawn attribute and file-action objects.
 */
struct SpawnAttributes {
    posix_spawnattr_t attr{};
    posix_spawn_file_actions_t actions{};
    bool attr_ready = false;
    bool actions_ready = false;

    ~SpawnAttributes() {
        if (actions_ready) posix_spawn_file_actions_destroy(&actions);
        if (attr_ready) posix_spawnattr_destroy(&attr);
    }
};

Result<void> make_pipe(FileDescriptor& read_end, FileDescriptor& write_end) {
    int fds[2] = {-1, -1};
    // Close-on-exec so children spawned by concurrent invocations never
    // inherit this invocation's pipe ends.
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return Error{ErrorKind::Launch, "pipe2 failed: " + errno_text(errno)};
    }
    read_end = FileDescriptor(fds[0]);
    write_end = FileDescriptor(fds[1]);

    int flags = ::fcntl(read_end.get(), F_GETFL, 0);
    if (flags < 0 || ::fcntl(read_end.get(), F_SETFL, flags | O_NONBLOCK) < 0) {
        return Error{ErrorKind::Launch, "fcntl(O_NONBLOCK) failed: " + errno_text(errno)};
    }
    return Result<void>{};
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// ChildProcess
// ─────────────────────────────────────────────

ChildProcess::ChildProcess(pid_t pid, std::string run_tag, FileDescriptor out,
                           FileDescriptor err) noexcept
    : pid_(pid), run_tag_(std::move(run_tag)), stdout_(std::move(out)), stderr_(std::move(err)) {}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_(std::exchange(other.pid_, -1))
    , reaped_(std::exchange(other.reaped_, false))
    , run_tag_(std::move(other.run_tag_))
    , stdout_(std::move(other.stdout_))
    , stderr_(std::move(other.stderr_)) {}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        dispose();
        pid_ = std::exchange(other.pid_, -1);
        reaped_ = std::exchange(other.reaped_, false);
        run_tag_ = std::move(other.run_tag_);
        stdout_ = std::move(other.stdout_);
        stderr_ = std::move(other.stderr_);
    }
    return *this;
}

ChildProcess::~ChildProcess() {
    dispose();
}

void ChildProcess::dispose() noexcept {
    if (pid_ > 0 && !reaped_) {
        (void)kill_tree();
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
        reaped_ = true;
    }
    close_pipes();
    pid_ = -1;
}

Result<ChildProcess> ChildProcess::spawn(const SpawnSpec& spec) {
    if (spec.program.empty()) {
        return Error{ErrorKind::Launch, "No program to launch"};
    }

    FileDescriptor out_read, out_write, err_read, err_write;
    if (auto made = make_pipe(out_read, out_write); !made) return made.error();
    if (auto made = make_pipe(err_read, err_write); !made) return made.error();

    SpawnAttributes sa;
    if (int rc = posix_spawnattr_init(&sa.attr); rc != 0) {
        return Error{ErrorKind::Launch, "posix_spawnattr_init: " + errno_text(rc)};
    }
    sa.attr_ready = true;
    if (int rc = posix_spawn_file_actions_init(&sa.actions); rc != 0) {
        return Error{ErrorKind::Launch, "posix_spawn_file_actions_init: " + errno_text(rc)};
    }
    sa.actions_ready = true;

    // New process group led by the child, default dispositions, empty mask.
    sigset_t all_signals;
    sigset_t no_signals;
    sigfillset(&all_signals);
    sigemptyset(&no_signals);
    posix_spawnattr_setflags(&sa.attr, POSIX_SPAWN_SETPGROUP
                                      | POSIX_SPAWN_SETSIGDEF
                                      | POSIX_SPAWN_SETSIGMASK);
    posix_spawnattr_setpgroup(&sa.attr, 0);
    posix_spawnattr_setsigdefault(&sa.attr, &all_signals);
    posix_spawnattr_setsigmask(&sa.attr, &no_signals);

    int rc = posix_spawn_file_actions_addopen(&sa.actions, STDIN_FILENO,
                                              spec.stdin_path.c_str(), O_RDONLY, 0);
    if (rc == 0) rc = posix_spawn_file_actions_adddup2(&sa.actions, out_write.get(), STDOUT_FILENO);
    if (rc == 0) rc = posix_spawn_file_actions_adddup2(&sa.actions, err_write.get(), STDERR_FILENO);
    if (rc == 0 && !spec.working_dir.empty()) {
        rc = posix_spawn_file_actions_addchdir_np(&sa.actions, spec.working_dir.c_str());
    }
    // Descriptors opened elsewhere in the process without O_CLOEXEC, or in
    // the window before a flag could be set, stay out of the child.
    if (rc == 0) rc = posix_spawn_file_actions_addclosefrom_np(&sa.actions, STDERR_FILENO + 1);
    if (rc != 0) {
        return Error{ErrorKind::Launch, "Failed to prepare child I/O: " + errno_text(rc)};
    }

    std::string tag_entry;
    std::vector<char*> envp;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string_view current{*entry};
        if (current.starts_with(kRunTagVariable) && current.size() > kRunTagVariable.size()
            && current[kRunTagVariable.size()] == '=') {
            continue;
        }
        envp.push_back(*entry);
    }
    if (!spec.run_tag.empty()) {
        tag_entry = std::string{kRunTagVariable} + "=" + spec.run_tag;
        envp.push_back(tag_entry.data());
    }
    envp.push_back(nullptr);

    std::vector<char*> argv;
    argv.reserve(spec.args.size() + 2);
    argv.push_back(const_cast<char*>(spec.program.c_str()));
    for (const auto& arg : spec.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = -1;
    rc = posix_spawnp(&pid, spec.program.c_str(), &sa.actions, &sa.attr, argv.data(), envp.data());
    if (rc != 0) {
        return Error{ErrorKind::Launch, "Failed to launch " + spec.program + ": " + errno_text(rc)};
    }

    // The parent never writes; dropping the write ends lets EOF reach us
    // once every process in the group has exited.
    out_write.reset();
    err_write.reset();

    return ChildProcess(pid, spec.run_tag, std::move(out_read), std::move(err_read));
}

Result<bool> ChildProcess::has_exited() const {
    if (pid_ <= 0) {
        return Error{ErrorKind::Internal, "No child process"};
    }
    if (reaped_) return true;

    while (true) {
        siginfo_t info{};
        if (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOHANG | WNOWAIT) == 0) {
            return info.si_pid != 0;
        }
        if (errno == EINTR) continue;
        return Error{ErrorKind::Internal, "waitid failed: " + errno_text(errno)};
    }
}

Result<void> ChildProcess::kill_group() {
    if (pid_ <= 0 || reaped_) return Result<void>{};

    if (::killpg(pid_, SIGKILL) == 0 || errno == ESRCH) {
        return Result<void>{};
    }
    int group_errno = errno;

    // Fall back to the leader alone so reap() cannot block forever.
    if (::kill(pid_, SIGKILL) == 0 || errno == ESRCH) {
        return Error{ErrorKind::Internal, "killpg failed: " + errno_text(group_errno)};
    }
    return Error{ErrorKind::Internal, "kill failed: " + errno_text(errno)};
}

Result<size_t> ChildProcess::kill_tree() {
    if (pid_ <= 0 || reaped_) return size_t{0};

    // Sweep before and after the group kill: the first pass still sees the
    // ppid links of processes that left the group, the second catches
    // anything forked in between.
    size_t strays = kill_invocation_tree(pid_, run_tag_);
    auto group = kill_group();
    strays += kill_invocation_tree(pid_, run_tag_);
    if (!group) return group.error();
    return strays;
}

Result<ExitStatus> ChildProcess::reap() {
    if (pid_ <= 0) {
        return Error{ErrorKind::Internal, "No child process"};
    }
    if (reaped_) {
        return Error{ErrorKind::Internal, "Child already reaped"};
    }

    ExitStatus exit;
    int status = 0;
    while (true) {
        pid_t waited = ::wait4(pid_, &status, 0, &exit.usage);
        if (waited == pid_) break;
        if (waited < 0 && errno == EINTR) continue;
        return Error{ErrorKind::Internal, "wait4 failed: " + errno_text(errno)};
    }
    reaped_ = true;

    if (WIFEXITED(status)) {
        exit.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit.term_signal = WTERMSIG(status);
    }
    return exit;
}

void ChildProcess::close_pipes() noexcept {
    stdout_.reset();
    stderr_.reset();
}

// ─────────────────────────────────────────────
// OutputCapture
// ─────────────────────────────────────────────

OutputCapture::OutputCapture(int fd, uint64_t max_bytes) noexcept
    : fd_(fd), max_bytes_(max_bytes), open_(fd >= 0) {}

void OutputCapture::read_available() {
    char buf[16384];
    while (open_) {
        ssize_t n = ::read(fd_, buf, sizeof(buf));
        if (n > 0) {
            auto room = max_bytes_ > data_.size() ? max_bytes_ - data_.size() : 0;
            auto keep = std::min<uint64_t>(room, static_cast<uint64_t>(n));
            data_.append(buf, static_cast<size_t>(keep));
            if (keep < static_cast<uint64_t>(n)) truncated_ = true;
        } else if (n == 0) {
            open_ = false;
        } else if (errno == EINTR) {
            continue;
        } else if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        } else {
            open_ = false;
        }
    }
}

}  // namespace exec_sandbox
