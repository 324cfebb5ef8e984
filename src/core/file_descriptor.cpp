/**
 * @file file_descriptor.cpp
 * @brief FileDescriptor and close-on-exec file helpers.
 */

#include "core/file_descriptor.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

namespace exec_sandbox {

FileDescriptor::FileDescriptor(FileDescriptor&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)) {}

FileDescriptor& FileDescriptor::operator=(FileDescriptor&& other) noexcept {
    if (this != &other) {
        reset();
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

FileDescriptor::~FileDescriptor() {
    reset();
}

void FileDescriptor::reset() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

Result<FileDescriptor> open_cloexec(const std::filesystem::path& path, int flags, mode_t mode) {
    int fd = -1;
    do {
        fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) {
        return Error{ErrorKind::Io, "Cannot open " + path.string() + ": " + std::strerror(errno)};
    }
    return FileDescriptor(fd);
}

Result<void> write_all(int fd, std::string_view data) {
    while (!data.empty()) {
        ssize_t n = ::write(fd, data.data(), data.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return Error{ErrorKind::Io, std::string{"write failed: "} + std::strerror(errno)};
        }
        data.remove_prefix(static_cast<size_t>(n));
    }
    return Result<void>{};
}

Result<std::string> read_all(int fd) {
    std::string contents;
    char buf[8192];
    while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            contents.append(buf, static_cast<size_t>(n));
        } else if (n == 0) {
            return contents;
        } else if (errno != EINTR) {
            return Error{ErrorKind::Io, std::string{"read failed: "} + std::strerror(errno)};
        }
    }
}

Result<std::string> read_file(const std::filesystem::path& path) {
    auto fd = open_cloexec(path, O_RDONLY);
    if (!fd) return fd.error();
    return read_all(fd->get());
}

}  // namespace exec_sandbox
