/**
 * @file transport.cpp
 * @brief TcpTransport implementation: length-prefixed TCP messaging.
 *
 * Wire format: [uint32_t big-endian length][payload bytes]
 * Uses poll() for non-blocking I/O with timeouts.
 */

#include "network/transport.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace exec_sandbox {

namespace {

/**
 * @brief Set TCP_NODELAY and keepalive on a connected socket.
 */
void configure_socket(int fd) {
    int flag = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
    ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &flag, sizeof(flag));
}

void encode_u32(uint8_t* buf, uint32_t val) {
    buf[0] = static_cast<uint8_t>((val >> 24) & 0xFF);
    buf[1] = static_cast<uint8_t>((val >> 16) & 0xFF);
    buf[2] = static_cast<uint8_t>((val >> 8) & 0xFF);
    buf[3] = static_cast<uint8_t>(val & 0xFF);
}

uint32_t decode_u32(const uint8_t* buf) {
    return (static_cast<uint32_t>(buf[0]) << 24)
         | (static_cast<uint32_t>(buf[1]) << 16)
         | (static_cast<uint32_t>(buf[2]) << 8)
         | static_cast<uint32_t>(buf[3]);
}

bool send_all(int fd, const void* buf, size_t len, uint32_t timeout_ms) {
    const auto* ptr = static_cast<const uint8_t*>(buf);
    size_t remaining = len;

    while (remaining > 0) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;

        int ready = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
        if (ready < 0 && errno == EINTR) continue;
        if (ready <= 0) return false;

        auto sent = ::send(fd, ptr, remaining, MSG_NOSIGNAL);
        if (sent <= 0) {
            if (sent < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) continue;
            return false;
        }

        ptr += sent;
        remaining -= static_cast<size_t>(sent);
    }

    return true;
}

bool recv_all(int fd, void* buf, size_t len, uint32_t timeout_ms) {
    auto* ptr = static_cast<uint8_t*>(buf);
    size_t remaining = len;

    while (remaining > 0) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;

        int ready = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
        if (ready < 0 && errno == EINTR) continue;
        if (ready <= 0) return false;

        auto received = ::recv(fd, ptr, remaining, 0);
        if (received <= 0) {
            if (received < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) continue;
            return false;  // Connection closed or error
        }

        ptr += received;
        remaining -= static_cast<size_t>(received);
    }

    return true;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Framing
// ─────────────────────────────────────────────

Result<void> send_frame(int fd, const std::vector<uint8_t>& data, uint32_t timeout_ms) {
    if (data.size() > kMaxFrameSize) {
        return Error{ErrorKind::Parse, "Message too large: " + std::to_string(data.size()) + " bytes"};
    }

    uint8_t header[4];
    encode_u32(header, static_cast<uint32_t>(data.size()));

    if (!send_all(fd, header, 4, timeout_ms)) {
        return Error{ErrorKind::Io, "Failed to send header"};
    }
    if (!data.empty() && !send_all(fd, data.data(), data.size(), timeout_ms)) {
        return Error{ErrorKind::Io, "Failed to send payload"};
    }
    return Result<void>{};
}

Result<std::vector<uint8_t>> receive_frame(int fd, uint32_t timeout_ms) {
    uint8_t header[4];
    if (!recv_all(fd, header, 4, timeout_ms)) {
        return Error{ErrorKind::Io, "Failed to receive header"};
    }

    uint32_t length = decode_u32(header);
    if (length > kMaxFrameSize) {
        return Error{ErrorKind::Parse, "Message too large: " + std::to_string(length) + " bytes"};
    }

    std::vector<uint8_t> payload(length);
    if (length > 0 && !recv_all(fd, payload.data(), length, timeout_ms)) {
        return Error{ErrorKind::Io, "Failed to receive payload"};
    }
    return payload;
}

// ─────────────────────────────────────────────
// TcpConnection
// ─────────────────────────────────────────────

TcpConnection::~TcpConnection() {
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
        ::close(fd_);
    }
}

Result<std::vector<uint8_t>> TcpConnection::receive(uint32_t timeout_ms) {
    return receive_frame(fd_, timeout_ms);
}

Result<void> TcpConnection::send(const std::vector<uint8_t>& data) {
    return send_frame(fd_, data);
}

// ─────────────────────────────────────────────
// Construction / Destruction
// ─────────────────────────────────────────────

TcpTransport::TcpTransport() = default;

TcpTransport::~TcpTransport() {
    stop_serving();
    disconnect();
}

// ─────────────────────────────────────────────
// Client Side
// ─────────────────────────────────────────────

Result<void> TcpTransport::connect(const std::string& address, uint16_t port,
                                   uint32_t timeout_ms) {
    if (client_fd_ >= 0) {
        return Error{ErrorKind::Internal, "Already connected"};
    }

    client_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (client_fd_ < 0) {
        return Error{ErrorKind::Io, "Failed to create socket: " + std::string(strerror(errno))};
    }

    sockaddr_in server{};
    server.sin_family = AF_INET;
    server.sin_port = htons(port);

    if (::inet_pton(AF_INET, address.c_str(), &server.sin_addr) != 1) {
        disconnect();
        return Error{ErrorKind::Config, "Invalid address: " + address};
    }

    int ret = ::connect(client_fd_, reinterpret_cast<const sockaddr*>(&server), sizeof(server));
    if (ret < 0 && errno != EINPROGRESS) {
        int err = errno;
        disconnect();
        return Error{ErrorKind::Io, "Connect failed: " + std::string(strerror(err))};
    }

    if (ret < 0) {
        // Wait for connection to complete
        pollfd pfd{};
        pfd.fd = client_fd_;
        pfd.events = POLLOUT;

        int ready = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
        if (ready <= 0) {
            disconnect();
            return Error{ErrorKind::Io, "Connect timed out"};
        }

        int err = 0;
        socklen_t len = sizeof(err);
        ::getsockopt(client_fd_, SOL_SOCKET, SO_ERROR, &err, &len);
        if (err != 0) {
            disconnect();
            return Error{ErrorKind::Io, "Connect failed: " + std::string(strerror(err))};
        }
    }

    configure_socket(client_fd_);
    return Result<void>{};
}

Result<void> TcpTransport::send(const std::vector<uint8_t>& data) {
    if (client_fd_ < 0) {
        return Error{ErrorKind::Io, "Not connected"};
    }
    return send_frame(client_fd_, data);
}

Result<std::vector<uint8_t>> TcpTransport::receive(uint32_t timeout_ms) {
    if (client_fd_ < 0) {
        return Error{ErrorKind::Io, "Not connected"};
    }
    return receive_frame(client_fd_, timeout_ms);
}

void TcpTransport::disconnect() {
    if (client_fd_ >= 0) {
        ::shutdown(client_fd_, SHUT_RDWR);
        ::close(client_fd_);
        client_fd_ = -1;
    }
}

// ─────────────────────────────────────────────
// Server Side
// ─────────────────────────────────────────────

Result<void> TcpTransport::listen(uint16_t port, int backlog, const std::string& bind_address) {
    if (server_fd_ >= 0) {
        return Error{ErrorKind::Internal, "Already listening"};
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (::inet_pton(AF_INET, bind_address.c_str(), &addr.sin_addr) != 1) {
        return Error{ErrorKind::Config, "Invalid bind address: " + bind_address};
    }

    server_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        return Error{ErrorKind::Io, "Failed to create server socket: " + std::string(strerror(errno))};
    }

    int optval = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

    if (::bind(server_fd_, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        ::close(server_fd_);
        server_fd_ = -1;
        return Error{ErrorKind::Io, "Bind failed: " + std::string(strerror(err))};
    }

    if (::listen(server_fd_, backlog) < 0) {
        int err = errno;
        ::close(server_fd_);
        server_fd_ = -1;
        return Error{ErrorKind::Io, "Listen failed: " + std::string(strerror(err))};
    }

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = port;
    }

    return Result<void>{};
}

void TcpTransport::serve(ConnectionHandler handler) {
    if (server_fd_ < 0) return;

    serving_ = true;
    serve_thread_ = std::jthread([this, handler = std::move(handler)](std::stop_token stop) {
        while (!stop.stop_requested() && serving_) {
            pollfd pfd{};
            pfd.fd = server_fd_;
            pfd.events = POLLIN;

            int ready = ::poll(&pfd, 1, 100);  // 100ms timeout for stop check
            if (ready <= 0) continue;

            int client_fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_CLOEXEC);
            if (client_fd < 0) continue;

            configure_socket(client_fd);
            handler(std::make_shared<TcpConnection>(client_fd));
        }
    });
}

void TcpTransport::stop_serving() {
    serving_ = false;
    if (serve_thread_.joinable()) {
        serve_thread_.request_stop();
        serve_thread_.join();
    }
    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }
}

// ─────────────────────────────────────────────
// State Queries
// ─────────────────────────────────────────────

bool TcpTransport::is_connected() const noexcept {
    return client_fd_ >= 0;
}

bool TcpTransport::is_listening() const noexcept {
    return server_fd_ >= 0;
}

}  // namespace exec_sandbox
