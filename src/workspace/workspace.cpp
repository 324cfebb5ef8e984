/**
 * @file workspace.cpp
 * @brief Workspace allocation, payload materialization and cleanup.
 */

#include "workspace/workspace.hpp"

#include "core/file_descriptor.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <system_error>
#include <vector>

#include <fcntl.h>

namespace exec_sandbox {

// ─────────────────────────────────────────────
// Workspace
// ─────────────────────────────────────────────

Workspace::Workspace(std::filesystem::path root,
                     std::filesystem::path source_path,
                     std::filesystem::path input_path,
                     Logger* logger) noexcept
    : root_(std::move(root))
    , source_path_(std::move(source_path))
    , input_path_(std::move(input_path))
    , logger_(logger) {}

Workspace::Workspace(Workspace&& other) noexcept
    : root_(std::move(other.root_))
    , source_path_(std::move(other.source_path_))
    , input_path_(std::move(other.input_path_))
    , logger_(std::exchange(other.logger_, nullptr)) {}

Workspace& Workspace::operator=(Workspace&& other) noexcept {
    if (this != &other) {
        release();
        root_ = std::move(other.root_);
        source_path_ = std::move(other.source_path_);
        input_path_ = std::move(other.input_path_);
        logger_ = std::exchange(other.logger_, nullptr);
    }
    return *this;
}

Workspace::~Workspace() {
    release();
}

void Workspace::release() noexcept {
    if (logger_ == nullptr) return;
    Logger* logger = std::exchange(logger_, nullptr);

    try {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
        if (ec) {
            logger->warn("Workspace cleanup failed for " + root_.string() + ": " + ec.message());
        } else {
            logger->debug("Workspace released: " + root_.string());
        }
    } catch (const std::exception& e) {
        std::fprintf(stderr, "workspace cleanup of %s failed: %s\n", root_.c_str(), e.what());
    }
}

// ─────────────────────────────────────────────
// WorkspaceManager
// ─────────────────────────────────────────────

WorkspaceManager::WorkspaceManager(WorkspaceConfig config, Logger& logger)
    : config_(std::move(config)), logger_(logger) {}

Result<Workspace> WorkspaceManager::acquire(const ExecutionRequest& request) const {
    auto pattern = (config_.root / (config_.prefix + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    // mkdtemp picks a name no other caller can obtain and creates it 0700.
    if (::mkdtemp(buffer.data()) == nullptr) {
        return Error{ErrorKind::Io,
                     "Failed to create workspace under " + config_.root.string()
                     + ": " + std::strerror(errno)};
    }

    std::filesystem::path root(buffer.data());
    Workspace workspace(root,
                        root / config_.source_filename,
                        root / config_.input_filename,
                        &logger_);

    if (auto written = write_file_exact(workspace.source_path(), request.code); !written) {
        return written.error();
    }
    if (auto written = write_file_exact(workspace.input_path(), request.input); !written) {
        return written.error();
    }

    logger_.debug("Workspace acquired: " + root.string());
    return workspace;
}

Result<void> write_file_exact(const std::filesystem::path& path, std::string_view contents) {
    auto fd = open_cloexec(path, O_WRONLY | O_CREAT | O_TRUNC);
    if (!fd) return fd.error();

    if (auto written = write_all(fd->get(), contents); !written) {
        return Error{ErrorKind::Io, "Failed writing " + path.string() + ": " + written.error().message};
    }
    return Result<void>{};
}

}  // namespace exec_sandbox
