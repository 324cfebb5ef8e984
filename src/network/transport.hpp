/**
 * @file transport.hpp
 * @brief TCP transport for execution requests with length-prefixed framing.
 *
 * Provides both client (connect + send/receive) and server (accept +
 * dispatch) sides. Messages are framed as [4-byte big-endian length][payload].
 * Uses poll() for timeouts. Every socket is close-on-exec so supervised
 * children never inherit a client connection.
 */

#pragma once

#include "core/result.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace exec_sandbox {

inline constexpr uint32_t kMaxFrameSize = 16 * 1024 * 1024;  // 16 MB

/// Write one frame to a connected socket.
Result<void> send_frame(int fd, const std::vector<uint8_t>& data, uint32_t timeout_ms = 5000);

/// Read one frame from a connected socket.
Result<std::vector<uint8_t>> receive_frame(int fd, uint32_t timeout_ms = 10000);

/**
 * @brief One accepted server-side connection; closes on destruction.
 */
class TcpConnection {
public:
    explicit TcpConnection(int fd) noexcept : fd_(fd) {}
    ~TcpConnection();

    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;

    Result<std::vector<uint8_t>> receive(uint32_t timeout_ms = 10000);
    Result<void> send(const std::vector<uint8_t>& data);

    [[nodiscard]] int fd() const noexcept { return fd_; }

private:
    int fd_;
};

/**
 * @brief Length-prefixed TCP transport.
 *
 * Wire format per message:
 *   [uint32_t big-endian length][payload bytes]
 *
 * Maximum message size: kMaxFrameSize.
 */
class TcpTransport {
public:
    static constexpr int DEFAULT_BACKLOG = 64;

    TcpTransport();
    ~TcpTransport();

    // Non-copyable
    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    // ── Client-side ──────────────────────────
    Result<void> connect(const std::string& address, uint16_t port,
                         uint32_t timeout_ms = 5000);
    Result<void> send(const std::vector<uint8_t>& data);
    Result<std::vector<uint8_t>> receive(uint32_t timeout_ms = 10000);
    void disconnect();

    // ── Server-side ──────────────────────────
    /// Called on the accept thread for every new connection.
    using ConnectionHandler = std::function<void(std::shared_ptr<TcpConnection>)>;

    /// Port 0 binds an ephemeral port; see bound_port().
    Result<void> listen(uint16_t port, int backlog = DEFAULT_BACKLOG,
                        const std::string& bind_address = "0.0.0.0");
    void serve(ConnectionHandler handler);
    void stop_serving();

    // ── State queries ────────────────────────
    [[nodiscard]] bool is_connected() const noexcept;
    [[nodiscard]] bool is_listening() const noexcept;
    [[nodiscard]] uint16_t bound_port() const noexcept { return bound_port_; }

private:
    int client_fd_ = -1;
    int server_fd_ = -1;
    uint16_t bound_port_ = 0;
    std::jthread serve_thread_;
    std::atomic<bool> serving_{false};
};

}  // namespace exec_sandbox
