#include "bkc/network/connection.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace bkc::network {

TcpConnection::TcpConnection(Socket socket)
    : socket_(std::move(socket)) {
}

TcpConnection::~TcpConnection() {
    close();
}

Result<std::unique_ptr<Connection>> TcpConnection::open(const Endpoint& endpoint,
                                                        const TransportOptions& options) {
    if (endpoint.host.empty() || endpoint.port == 0) {
        return Fail<std::unique_ptr<Connection>>(ErrorKind::InvalidArgument,
                                                 "Invalid endpoint: " + endpoint.to_string());
    }

    Socket socket;
    if (auto res = socket.create(); res.is_error()) {
        return Err<std::unique_ptr<Connection>>(res.error());
    }
    if (auto res = socket.connect(endpoint.host, endpoint.port, options.connect_timeout); res.is_error()) {
        return Err<std::unique_ptr<Connection>>(res.error());
    }
    if (auto res = socket.set_io_timeout(options.io_timeout); res.is_error()) {
        return Err<std::unique_ptr<Connection>>(res.error());
    }

    return Ok<std::unique_ptr<Connection>>(std::make_unique<TcpConnection>(std::move(socket)));
}

Result<void> TcpConnection::send_exact(const std::uint8_t* data, std::size_t size) {
    std::size_t total_sent = 0;
    while (total_sent < size) {
        const std::size_t chunk = std::min(size - total_sent, kMaxTransferPerCall);
        auto sent = socket_.send(data + total_sent, chunk);
        if (sent.is_error()) {
            return Err<void>(sent.error());
        }
        if (sent.value() == 0) {
            return Fail<void>(ErrorKind::Io, "Peer stopped accepting data after " +
                                             std::to_string(total_sent) + " of " +
                                             std::to_string(size) + " bytes");
        }
        total_sent += sent.value();
    }
    return Ok();
}

Result<std::vector<std::uint8_t>> TcpConnection::recv_exact(std::size_t count) {
    std::vector<std::uint8_t> buffer(count);
    std::size_t total_received = 0;
    while (total_received < count) {
        const std::size_t chunk = std::min(count - total_received, kMaxTransferPerCall);
        auto received = socket_.receive(buffer.data() + total_received, chunk);
        if (received.is_error()) {
            return Err<std::vector<std::uint8_t>>(received.error());
        }
        if (received.value() == 0) {
            return Fail<std::vector<std::uint8_t>>(
                ErrorKind::Io, "Connection closed by peer after " + std::to_string(total_received) +
                               " of " + std::to_string(count) + " bytes");
        }
        total_received += received.value();
    }
    return Ok(std::move(buffer));
}

void TcpConnection::close() {
    socket_.close();
}

Result<std::unique_ptr<Connection>> TcpConnector::connect(const Endpoint& endpoint) {
    spdlog::debug("Opening connection to {}", endpoint.to_string());
    return TcpConnection::open(endpoint, options_);
}

} // namespace bkc::network
