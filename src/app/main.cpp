/**
 * @file main.cpp
 * @brief exec_sandbox entry point.
 *
 * Wires the modules into either a one-shot executor or a TCP service:
 *   Config → Logger → MemoryProbe → CodeExecutor → (stdout | ExecutorServer)
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/thread_pool.hpp"
#include "resource_monitor/memory_probe.hpp"
#include "service/code_executor.hpp"
#include "service/executor_server.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <charconv>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>

using namespace exec_sandbox;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

constexpr int kExitUsage = 2;
constexpr int kExitFailure = 1;

struct CLIArgs {
    std::filesystem::path config_path;
    std::string request_path = "-";
    bool serve = false;
    std::optional<uint16_t> port;
    std::optional<std::string> log_dir;
    std::optional<std::string> log_level;
};

void print_usage(std::ostream& out) {
    out << "Usage: exec_sandbox [OPTIONS]\n"
        << "  --config <path>      TOML configuration file (default: built-in defaults)\n"
        << "  --request <file|->   Request document to execute (default: stdin)\n"
        << "  --serve              Serve requests over TCP until SIGINT/SIGTERM\n"
        << "  --port <port>        TCP port for --serve (overrides [service].port)\n"
        << "  --log-dir <path>     Write NDJSON logs here instead of stderr\n"
        << "  --log-level <level>  debug | info | warn | error\n"
        << "  --help, -h           Show this help message\n";
}

std::optional<uint16_t> parse_port(std::string_view text) {
    unsigned value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size() || value > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(value);
}

/// nullopt means "exit with the given code".
std::optional<CLIArgs> parse_args(int argc, char* argv[], int& exit_code) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;
        if (arg == "--config" && has_value) {
            args.config_path = argv[++i];
        } else if (arg == "--request" && has_value) {
            args.request_path = argv[++i];
        } else if (arg == "--serve") {
            args.serve = true;
        } else if (arg == "--port" && has_value) {
            args.port = parse_port(argv[++i]);
            if (!args.port) {
                std::cerr << "Invalid port: " << argv[i] << "\n";
                exit_code = kExitUsage;
                return std::nullopt;
            }
        } else if (arg == "--log-dir" && has_value) {
            args.log_dir = argv[++i];
        } else if (arg == "--log-level" && has_value) {
            args.log_level = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage(std::cout);
            exit_code = 0;
            return std::nullopt;
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << "\n";
            print_usage(std::cerr);
            exit_code = kExitUsage;
            return std::nullopt;
        }
    }
    return args;
}

std::optional<std::string> read_request(const std::string& path) {
    if (path == "-") {
        std::ostringstream oss;
        oss << std::cin.rdbuf();
        return oss.str();
    }
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) return std::nullopt;
    return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

std::unique_ptr<ILogSink> make_sink(const std::filesystem::path& log_dir, const std::string& prefix) {
    if (log_dir.empty()) {
        return std::make_unique<StderrSink>();
    }
    return std::make_unique<JsonFileSink>(log_dir, prefix);
}

int serve(const Config& config, const CodeExecutor& executor, Logger& logger,
          MetricsCollector* metrics) {
    ThreadPool pool(config.service.threads, config.service.max_queued);
    logger.info("Invocation pool: " + std::to_string(pool.thread_count()) + " threads, "
                + std::to_string(pool.max_queued()) + " queued max");

    ExecutorServer server(executor, pool, logger, metrics);
    if (auto started = server.start(config.service.port); !started) {
        logger.error("Could not start executor service: " + started.error().message);
        return kExitFailure;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    logger.info("Shutdown requested. Draining in-flight requests...");
    server.stop();
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    int exit_code = 0;
    auto args = parse_args(argc, argv, exit_code);
    if (!args) return exit_code;

    // Load configuration
    std::optional<Error> config_error;
    Config config = default_config();
    if (!args->config_path.empty()) {
        auto loaded = load_config(args->config_path);
        if (loaded) {
            config = *loaded;
        } else {
            config_error = loaded.error();
        }
    }

    // Apply CLI overrides
    if (args->port) config.service.port = *args->port;
    if (args->log_dir) config.telemetry.log_dir = *args->log_dir;
    if (args->log_level) config.telemetry.log_level = *args->log_level;

    auto level = log_level_from_string(config.telemetry.log_level);
    if (!level) {
        std::cerr << "Invalid log level: " << config.telemetry.log_level << "\n";
        return kExitUsage;
    }

    // ── Initialize Logger ────────────────────
    Logger logger(make_sink(config.telemetry.log_dir, "exec_sandbox"), *level);
    if (config_error) {
        logger.error("Failed to load config: " + config_error->message);
        logger.warn("Using default configuration.");
    }

    std::unique_ptr<MetricsCollector> metrics;
    if (config.telemetry.metrics) {
        metrics = std::make_unique<MetricsCollector>(
            make_sink(config.telemetry.log_dir, "exec_sandbox_metrics"));
    }

    // ── Initialize Memory Probe ──────────────
    auto probe = make_memory_probe(config.monitor.memory_probe);
    if (!probe) {
        logger.error("Memory probe unavailable: " + probe.error().message);
        return kExitFailure;
    }
    logger.debug("Memory probe: " + std::string{(*probe)->name()});

    CodeExecutor executor(config, **probe, logger, metrics.get());

    if (args->serve) {
        int rc = serve(config, executor, logger, metrics.get());
        if (metrics) metrics->flush();
        logger.flush();
        return rc;
    }

    // ── One-shot mode ────────────────────────
    auto request = read_request(args->request_path);
    if (!request) {
        logger.error("Cannot read request from " + args->request_path);
        return kExitFailure;
    }

    std::cout << executor.handle(*request) << std::endl;
    if (metrics) metrics->flush();
    logger.flush();
    return 0;
}
