/**
 * @file file_descriptor.hpp
 * @brief Owning descriptor wrapper and close-on-exec file helpers.
 *
 * Every descriptor the executor opens must carry O_CLOEXEC: children are
 * spawned concurrently from pool threads and would otherwise inherit log
 * files and other invocations' workspace files.
 */

#pragma once

#include "core/result.hpp"

#include <filesystem>
#include <string>
#include <string_view>

#include <sys/types.h>

namespace exec_sandbox {

/**
 * @brief Owning descriptor wrapper; closes on destruction.
 */
class FileDescriptor {
public:
    FileDescriptor() noexcept = default;
    explicit FileDescriptor(int fd) noexcept : fd_(fd) {}
    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
    FileDescriptor(FileDescriptor&& other) noexcept;
    FileDescriptor& operator=(FileDescriptor&& other) noexcept;
    ~FileDescriptor();

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }
    void reset() noexcept;

private:
    int fd_ = -1;
};

/**
 * @brief open(2) with O_CLOEXEC always added to `flags`.
 */
Result<FileDescriptor> open_cloexec(const std::filesystem::path& path, int flags,
                                    mode_t mode = 0644);

/// Write all of `data`, retrying on EINTR and short writes.
Result<void> write_all(int fd, std::string_view data);

/// Read until EOF.
Result<std::string> read_all(int fd);

/// Read a whole file through a close-on-exec descriptor.
Result<std::string> read_file(const std::filesystem::path& path);

}  // namespace exec_sandbox
