/**
 * @file json_sink.cpp
 * @brief Log sink implementations.
 */

#include "telemetry/json_sink.hpp"

#include <iostream>
#include <string>
#include <system_error>

#include <fcntl.h>

namespace exec_sandbox {

// ── JsonFileSink ─────────────────────────────

JsonFileSink::JsonFileSink(const std::filesystem::path& log_dir,
                           const std::string& prefix,
                           uint32_t max_file_size_mb,
                           uint32_t max_files)
    : log_dir_(log_dir)
    , prefix_(prefix)
    , max_file_size_bytes_(static_cast<uint64_t>(max_file_size_mb) * 1024 * 1024)
    , max_files_(max_files == 0 ? 1 : max_files) {
    std::filesystem::create_directories(log_dir_);
    open_active(O_APPEND);

    std::error_code ec;
    auto existing = std::filesystem::file_size(current_path(), ec);
    current_size_ = ec ? 0 : existing;
}

JsonFileSink::~JsonFileSink() = default;

std::filesystem::path JsonFileSink::current_path() const {
    return log_dir_ / (prefix_ + ".ndjson");
}

std::filesystem::path JsonFileSink::generation_path(uint32_t index) const {
    return log_dir_ / (prefix_ + "." + std::to_string(index) + ".ndjson");
}

void JsonFileSink::open_active(int extra_flags) {
    auto opened = open_cloexec(current_path(), O_WRONLY | O_CREAT | extra_flags);
    if (opened) {
        file_ = std::move(opened).value();
    } else {
        // No logger to report to; the sink becomes a no-op.
        std::cerr << "JsonFileSink: " << opened.error().message << '\n';
        file_.reset();
    }
}

void JsonFileSink::write(std::string_view json_line) {
    rotate_if_needed();
    if (!file_.valid()) return;

    std::string line;
    line.reserve(json_line.size() + 1);
    line.append(json_line);
    line.push_back('\n');
    if (write_all(file_.get(), line)) {
        current_size_ += line.size();
    }
}

void JsonFileSink::flush() {
    // Writes are unbuffered.
}

void JsonFileSink::rotate_if_needed() {
    if (current_size_ < max_file_size_bytes_) return;

    file_.reset();

    // Rotation is best-effort: a failed rename leaves the old file in place
    // and logging continues into a fresh active file.
    std::error_code ec;
    std::filesystem::remove(generation_path(max_files_), ec);
    for (uint32_t i = max_files_; i > 1; --i) {
        auto from = generation_path(i - 1);
        if (std::filesystem::exists(from, ec)) {
            std::filesystem::rename(from, generation_path(i), ec);
        }
    }
    std::filesystem::rename(current_path(), generation_path(1), ec);

    open_active(O_TRUNC | O_APPEND);
    current_size_ = 0;
}

// ── StderrSink ───────────────────────────────

void StderrSink::write(std::string_view json_line) {
    std::cerr << json_line << '\n';
}

void StderrSink::flush() {
    std::cerr.flush();
}

}  // namespace exec_sandbox
