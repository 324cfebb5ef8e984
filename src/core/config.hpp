/**
 * @file config.hpp
 * @brief Executor configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "core/result.hpp"

namespace exec_sandbox {

struct SupervisorConfig {
    std::string interpreter = "python3";
    std::vector<std::string> interpreter_args;
    uint32_t max_time_limit_ms = 8000;        ///< Hard platform ceiling
    uint32_t default_time_limit_ms = 10000;   ///< Used when a request omits one
    uint64_t max_output_bytes = 16 * 1024 * 1024;  ///< Per captured stream
    uint32_t poll_interval_ms = 20;
};

struct WorkspaceConfig {
    std::filesystem::path root = "/tmp";
    std::string prefix = "exec-sandbox-";
    std::string source_filename = "code.py";
    std::string input_filename = "input.txt";
};

struct MonitorConfig {
    std::string memory_probe = "proc";        ///< "proc", "rusage", "none"
};

struct ServiceConfig {
    uint16_t port = 8002;
    uint32_t threads = 0;                     ///< 0 = hardware_concurrency
    uint32_t max_queued = 64;
};

struct TelemetryConfig {
    std::filesystem::path log_dir;            ///< Empty = stderr
    std::string log_level = "info";
    bool metrics = false;
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    SupervisorConfig supervisor;
    WorkspaceConfig workspace;
    MonitorConfig monitor;
    ServiceConfig service;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file and validate it.
 *
 * Absent tables and keys keep their defaults.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Check cross-field constraints (non-zero limits, known names).
 */
Result<void> validate_config(const Config& config);

Config default_config();

}  // namespace exec_sandbox
