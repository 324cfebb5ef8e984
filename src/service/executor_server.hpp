/**
 * @file executor_server.hpp
 * @brief Serves CodeExecutor::handle over the length-prefixed TCP transport.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "executor/thread_pool.hpp"
#include "network/transport.hpp"
#include "service/code_executor.hpp"
#include "telemetry/metrics_collector.hpp"

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace exec_sandbox {

/**
 * @brief One request frame and one response frame per connection.
 *
 * Accepted connections are handed to the pool. When the pool refuses work
 * the connection goes to a small rejection pool of its own, which answers
 * with an "executor busy" compilation_error at once, so the caller always
 * receives a well-formed response and the accept thread never waits on a
 * slow client. When even that pool is full the connection is closed.
 */
class ExecutorServer {
public:
    static constexpr uint32_t kReceiveTimeoutMs = 10000;
    static constexpr uint32_t kBusyReceiveTimeoutMs = 200;
    static constexpr size_t kRejectionThreads = 2;
    static constexpr size_t kMaxPendingRejections = 256;

    ExecutorServer(const CodeExecutor& executor, ThreadPool& pool, Logger& logger,
                   MetricsCollector* metrics = nullptr);
    ~ExecutorServer();

    ExecutorServer(const ExecutorServer&) = delete;
    ExecutorServer& operator=(const ExecutorServer&) = delete;

    /// Bind and start accepting. Port 0 picks an ephemeral port.
    Result<void> start(uint16_t port, const std::string& bind_address = "0.0.0.0");

    /// Stop accepting and wait for connections already handed to the pool.
    void stop();

    [[nodiscard]] uint16_t port() const noexcept { return transport_.bound_port(); }
    [[nodiscard]] bool running() const noexcept { return transport_.is_listening(); }

private:
    void dispatch(std::shared_ptr<TcpConnection> connection);
    void handle_connection(TcpConnection& connection) const;
    void reply_busy(TcpConnection& connection) const;
    void connection_done();

    const CodeExecutor& executor_;
    ThreadPool& pool_;
    Logger& logger_;
    MetricsCollector* metrics_;
    TcpTransport transport_;

    std::mutex in_flight_mutex_;
    std::condition_variable in_flight_cv_;
    size_t in_flight_ = 0;

    // Last member: destroyed first, while everything its tasks touch lives.
    ThreadPool rejections_;
};

}  // namespace exec_sandbox
