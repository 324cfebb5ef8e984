/**
 * @file executor_server.cpp
 * @brief ExecutorServer implementation.
 */

#include "service/executor_server.hpp"

#include "protocol/codec.hpp"

#include <exception>

namespace exec_sandbox {

namespace {

std::vector<uint8_t> to_bytes(const std::string& text) {
    return {text.begin(), text.end()};
}

}  // anonymous namespace

ExecutorServer::ExecutorServer(const CodeExecutor& executor, ThreadPool& pool, Logger& logger,
                               MetricsCollector* metrics)
    : executor_(executor)
    , pool_(pool)
    , logger_(logger)
    , metrics_(metrics)
    , rejections_(kRejectionThreads, kMaxPendingRejections) {}

ExecutorServer::~ExecutorServer() {
    stop();
}

Result<void> ExecutorServer::start(uint16_t port, const std::string& bind_address) {
    if (auto listening = transport_.listen(port, TcpTransport::DEFAULT_BACKLOG, bind_address);
        !listening) {
        return listening.error();
    }

    transport_.serve([this](std::shared_ptr<TcpConnection> connection) {
        dispatch(std::move(connection));
    });
    logger_.info("Executor service listening on " + bind_address + ":"
                 + std::to_string(transport_.bound_port()));
    return Result<void>{};
}

void ExecutorServer::stop() {
    if (!transport_.is_listening()) return;
    transport_.stop_serving();

    std::unique_lock lock(in_flight_mutex_);
    in_flight_cv_.wait(lock, [this] { return in_flight_ == 0; });
    logger_.info("Executor service stopped");
}

void ExecutorServer::dispatch(std::shared_ptr<TcpConnection> connection) {
    {
        std::lock_guard lock(in_flight_mutex_);
        ++in_flight_;
    }
    auto submitted = pool_.submit([this, connection] {
        handle_connection(*connection);
        connection_done();
    });
    if (submitted) return;

    const auto& reason = submitted.error().message;
    logger_.warn("Executor busy, rejecting request: " + reason);
    if (metrics_ != nullptr) {
        metrics_->record_rejection(reason);
    }

    auto rejected = rejections_.submit([this, connection] {
        reply_busy(*connection);
        connection_done();
    });
    if (!rejected) {
        // Dropping the last reference closes the socket; the client sees EOF.
        logger_.warn("Rejection queue full, closing connection: " + rejected.error().message);
        connection_done();
    }
}

void ExecutorServer::connection_done() {
    std::lock_guard lock(in_flight_mutex_);
    --in_flight_;
    in_flight_cv_.notify_all();
}

void ExecutorServer::handle_connection(TcpConnection& connection) const {
    // Runs on a pool worker; nothing may escape into the discarded future.
    try {
        auto frame = connection.receive(kReceiveTimeoutMs);
        if (!frame) {
            logger_.debug("Dropping connection: " + frame.error().message);
            return;
        }

        std::string request(frame->begin(), frame->end());
        auto response = executor_.handle(request);
        if (auto sent = connection.send(to_bytes(response)); !sent) {
            logger_.warn("Failed to send response: " + sent.error().message);
        }
    } catch (const std::exception& e) {
        logger_.error(std::string{"Connection handler failed: "} + e.what());
    }
}

void ExecutorServer::reply_busy(TcpConnection& connection) const {
    // Answer before reading, so an idle client costs nothing but a send.
    try {
        auto response = encode_response(ExecutionOutcome::setup_error("executor busy"));
        if (auto sent = connection.send(to_bytes(response)); !sent) {
            logger_.debug("Failed to send busy response: " + sent.error().message);
            return;
        }

        // Consume the request so closing does not reset the connection before
        // the client has read the response.
        if (auto frame = connection.receive(kBusyReceiveTimeoutMs); !frame) {
            logger_.debug("Busy connection sent no request: " + frame.error().message);
        }
    } catch (const std::exception& e) {
        logger_.error(std::string{"Busy reply failed: "} + e.what());
    }
}

}  // namespace exec_sandbox
