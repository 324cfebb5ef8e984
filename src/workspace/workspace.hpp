/**
 * @file workspace.hpp
 * @brief Per-invocation scratch directories holding the source and input.
 *
 * Every invocation gets its own directory created with mkdtemp(), so two
 * concurrent invocations can never observe each other's files. The
 * Workspace handle is move-only and removes its directory when destroyed,
 * which covers every exit path of the caller including exceptions.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <string>

namespace exec_sandbox {

class WorkspaceManager;

/**
 * @brief Exclusively-owned, invocation-scoped directory.
 */
class Workspace {
public:
    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;
    Workspace(Workspace&& other) noexcept;
    Workspace& operator=(Workspace&& other) noexcept;
    ~Workspace();

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }
    [[nodiscard]] const std::filesystem::path& source_path() const noexcept { return source_path_; }
    [[nodiscard]] const std::filesystem::path& input_path() const noexcept { return input_path_; }

    /// True until release() has run (explicitly or from the destructor).
    [[nodiscard]] bool active() const noexcept { return logger_ != nullptr; }

    /**
     * @brief Remove the directory tree. Idempotent; failures are logged
     *        at warn and never escalated.
     */
    void release() noexcept;

private:
    friend class WorkspaceManager;

    Workspace(std::filesystem::path root,
              std::filesystem::path source_path,
              std::filesystem::path input_path,
              Logger* logger) noexcept;

    std::filesystem::path root_;
    std::filesystem::path source_path_;
    std::filesystem::path input_path_;
    Logger* logger_;
};

/**
 * @brief Creates workspaces under a configured root.
 *
 * Holds no mutable state, so one instance is shared by all invocations.
 */
class WorkspaceManager {
public:
    WorkspaceManager(WorkspaceConfig config, Logger& logger);

    /**
     * @brief Allocate a fresh directory and write the request's code and
     *        input into it byte-for-byte.
     *
     * On failure nothing is left behind and an Io error is returned.
     */
    Result<Workspace> acquire(const ExecutionRequest& request) const;

    [[nodiscard]] const WorkspaceConfig& config() const noexcept { return config_; }

private:
    WorkspaceConfig config_;
    Logger& logger_;
};

/**
 * @brief Write `contents` to `path` in binary mode, truncating.
 */
Result<void> write_file_exact(const std::filesystem::path& path, std::string_view contents);

}  // namespace exec_sandbox
