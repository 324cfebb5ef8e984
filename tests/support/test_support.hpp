/**
 * @file test_support.hpp
 * @brief Shared fixtures for unit and integration tests.
 */

#pragma once

#include "core/logger.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>
#include <unistd.h>

namespace exec_sandbox::test_support {

/**
 * @brief Log sink that keeps every line in memory.
 */
class CaptureSink : public ILogSink {
public:
    void write(std::string_view json_line) override {
        std::lock_guard lock(mutex_);
        lines_.emplace_back(json_line);
    }
    void flush() override {}

    std::vector<std::string> lines() const {
        std::lock_guard lock(mutex_);
        return lines_;
    }

    bool contains(std::string_view needle) const {
        std::lock_guard lock(mutex_);
        for (const auto& line : lines_) {
            if (line.find(needle) != std::string::npos) return true;
        }
        return false;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
};

/**
 * @brief Unique scratch directory removed on destruction.
 */
class TempDir {
public:
    explicit TempDir(const std::string& tag) {
        auto base = std::filesystem::temp_directory_path();
        path_ = base / ("exec_sandbox_test_" + tag + "_" + std::to_string(::getpid()) + "_"
                        + std::to_string(counter()++));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const noexcept { return path_; }

    size_t entry_count() const {
        size_t n = 0;
        for ([[maybe_unused]] const auto& entry : std::filesystem::directory_iterator(path_)) ++n;
        return n;
    }

private:
    static int& counter() {
        static int value = 0;
        return value;
    }

    std::filesystem::path path_;
};

inline std::string read_text(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    std::ostringstream oss;
    oss << ifs.rdbuf();
    return oss.str();
}

/**
 * @brief True while `pid` names a process that is neither gone nor a zombie.
 */
inline bool process_alive(pid_t pid) {
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    if (!stat.is_open()) return false;
    std::string line;
    std::getline(stat, line);
    auto close_paren = line.rfind(')');
    if (close_paren == std::string::npos || close_paren + 2 >= line.size()) return false;
    char state = line[close_paren + 2];
    return state != 'Z' && state != 'X';
}

/// Poll process_alive() until it turns false or `timeout` passes.
inline bool wait_until_gone(pid_t pid,
                            std::chrono::milliseconds timeout = std::chrono::milliseconds(1000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!process_alive(pid)) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return !process_alive(pid);
}

inline bool command_available(const std::string& name) {
    return std::system(("command -v " + name + " >/dev/null 2>&1").c_str()) == 0;
}

inline bool python_available() {
    return command_available("python3");
}

}  // namespace exec_sandbox::test_support
