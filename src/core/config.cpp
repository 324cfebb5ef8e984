/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <limits>
#include <string_view>

namespace exec_sandbox {

namespace {

/// Read a non-negative integer that must fit in T; absent keys keep `fallback`.
template <typename T>
Result<T> unsigned_value(toml::node_view<toml::node> node, std::string_view name, T fallback) {
    if (!node) return fallback;
    auto value = node.value<int64_t>();
    if (!value) {
        return Error{ErrorKind::Config, std::string{name} + " must be an integer"};
    }
    if (*value < 0 || static_cast<uint64_t>(*value) > std::numeric_limits<T>::max()) {
        return Error{ErrorKind::Config,
                     std::string{name} + " out of range: " + std::to_string(*value)};
    }
    return static_cast<T>(*value);
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorKind::Config, "Configuration file not found: " + path.string()};
    }

    Config config;
    try {
        auto tbl = toml::parse_file(path.string());

        // [supervisor]
        if (auto sup = tbl["supervisor"]; sup.is_table()) {
            config.supervisor.interpreter =
                sup["interpreter"].value_or(config.supervisor.interpreter);

            auto& s = config.supervisor;
            auto max_limit = unsigned_value(sup["max_time_limit_ms"],
                                            "supervisor.max_time_limit_ms", s.max_time_limit_ms);
            if (!max_limit) return max_limit.error();
            s.max_time_limit_ms = *max_limit;

            auto default_limit = unsigned_value(sup["default_time_limit_ms"],
                                                "supervisor.default_time_limit_ms",
                                                s.default_time_limit_ms);
            if (!default_limit) return default_limit.error();
            s.default_time_limit_ms = *default_limit;

            auto max_output = unsigned_value(sup["max_output_bytes"],
                                             "supervisor.max_output_bytes", s.max_output_bytes);
            if (!max_output) return max_output.error();
            s.max_output_bytes = *max_output;

            auto poll = unsigned_value(sup["poll_interval_ms"],
                                       "supervisor.poll_interval_ms", s.poll_interval_ms);
            if (!poll) return poll.error();
            s.poll_interval_ms = *poll;

            if (auto args = sup["interpreter_args"].as_array()) {
                for (const auto& element : *args) {
                    auto arg = element.value<std::string>();
                    if (!arg) {
                        return Error{ErrorKind::Config,
                                     "supervisor.interpreter_args must contain only strings"};
                    }
                    config.supervisor.interpreter_args.push_back(std::move(*arg));
                }
            }
        }

        // [workspace]
        if (auto ws = tbl["workspace"]; ws.is_table()) {
            config.workspace.root = ws["root"].value_or(std::string{"/tmp"});
            config.workspace.prefix = ws["prefix"].value_or(config.workspace.prefix);
            config.workspace.source_filename =
                ws["source_filename"].value_or(config.workspace.source_filename);
            config.workspace.input_filename =
                ws["input_filename"].value_or(config.workspace.input_filename);
        }

        // [monitor]
        if (auto monitor = tbl["monitor"]; monitor.is_table()) {
            config.monitor.memory_probe =
                monitor["memory_probe"].value_or(config.monitor.memory_probe);
        }

        // [service]
        if (auto service = tbl["service"]; service.is_table()) {
            auto port = unsigned_value(service["port"], "service.port", config.service.port);
            if (!port) return port.error();
            config.service.port = *port;

            auto threads = unsigned_value(service["threads"], "service.threads",
                                          config.service.threads);
            if (!threads) return threads.error();
            config.service.threads = *threads;

            auto max_queued = unsigned_value(service["max_queued"], "service.max_queued",
                                             config.service.max_queued);
            if (!max_queued) return max_queued.error();
            config.service.max_queued = *max_queued;
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            config.telemetry.metrics = telemetry["metrics"].value_or(false);
        }

    } catch (const toml::parse_error& err) {
        return Error{ErrorKind::Config,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }

    if (auto valid = validate_config(config); !valid) {
        return valid.error();
    }
    return config;
}

Result<void> validate_config(const Config& config) {
    const auto& sup = config.supervisor;
    if (sup.interpreter.empty()) {
        return Error{ErrorKind::Config, "supervisor.interpreter must not be empty"};
    }
    if (sup.max_time_limit_ms == 0) {
        return Error{ErrorKind::Config, "supervisor.max_time_limit_ms must be positive"};
    }
    if (sup.default_time_limit_ms == 0) {
        return Error{ErrorKind::Config, "supervisor.default_time_limit_ms must be positive"};
    }
    if (sup.poll_interval_ms == 0) {
        return Error{ErrorKind::Config, "supervisor.poll_interval_ms must be positive"};
    }

    const auto& ws = config.workspace;
    if (ws.root.empty()) {
        return Error{ErrorKind::Config, "workspace.root must not be empty"};
    }
    for (const auto& name : {ws.source_filename, ws.input_filename}) {
        if (name.empty() || name.find('/') != std::string::npos || name == "." || name == "..") {
            return Error{ErrorKind::Config, "workspace file names must be plain file names: '" + name + "'"};
        }
    }
    if (ws.source_filename == ws.input_filename) {
        return Error{ErrorKind::Config, "workspace.source_filename and input_filename must differ"};
    }
    if (ws.prefix.find('/') != std::string::npos) {
        return Error{ErrorKind::Config, "workspace.prefix must not contain '/'"};
    }

    const auto& probe = config.monitor.memory_probe;
    if (probe != "proc" && probe != "rusage" && probe != "none") {
        return Error{ErrorKind::Config, "Unknown monitor.memory_probe: " + probe};
    }

    if (!log_level_from_string(config.telemetry.log_level)) {
        return Error{ErrorKind::Config, "Unknown telemetry.log_level: " + config.telemetry.log_level};
    }

    if (config.service.max_queued == 0) {
        return Error{ErrorKind::Config, "service.max_queued must be positive"};
    }

    return Result<void>{};
}

Config default_config() {
    return Config{};
}

}  // namespace exec_sandbox
