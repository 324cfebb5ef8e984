/**
 * @file json_sink.hpp
 * @brief NDJSON log sinks: rotating file, stderr and null.
 */

#pragma once

#include "core/file_descriptor.hpp"
#include "core/logger.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace exec_sandbox {

/**
 * @brief Writes NDJSON to `<log_dir>/<prefix>.ndjson`, rotating by size.
 *
 * When the active file reaches the size cap it becomes `<prefix>.1.ndjson`,
 * older generations shift up by one and anything past `max_files` is
 * removed. Lines are written unbuffered through a close-on-exec descriptor,
 * so supervised children never inherit the log file.
 */
class JsonFileSink : public ILogSink {
public:
    JsonFileSink(const std::filesystem::path& log_dir,
                 const std::string& prefix,
                 uint32_t max_file_size_mb = 50,
                 uint32_t max_files = 5);
    ~JsonFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    [[nodiscard]] bool is_open() const noexcept { return file_.valid(); }
    [[nodiscard]] std::filesystem::path current_path() const;

    /// Test hook: rotate at an exact byte count instead of whole megabytes.
    void set_max_file_size_bytes(uint64_t bytes) noexcept { max_file_size_bytes_ = bytes; }

private:
    void rotate_if_needed();
    void open_active(int extra_flags);
    [[nodiscard]] std::filesystem::path generation_path(uint32_t index) const;

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    FileDescriptor file_;
    uint64_t current_size_{0};
};

/**
 * @brief Writes to stderr. Default for the CLI, whose stdout carries the
 *        response document.
 */
class StderrSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Discards all output.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

}  // namespace exec_sandbox
