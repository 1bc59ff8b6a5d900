#pragma once

#include "bkc/core/result.hpp"
#include "bkc/network/endpoint.hpp"
#include "bkc/network/socket.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace bkc::network {

/**
 * @brief Bidirectional byte stream to one server
 *
 * send_exact() writes every byte or fails; recv_exact() returns exactly
 * `count` bytes or fails. Neither retries after an error: the caller owns
 * any retry policy. close() is idempotent.
 */
class Connection {
public:
    virtual ~Connection() = default;

    virtual Result<void> send_exact(const std::uint8_t* data, std::size_t size) = 0;
    virtual Result<std::vector<std::uint8_t>> recv_exact(std::size_t count) = 0;
    virtual void close() = 0;
    [[nodiscard]] virtual bool is_open() const = 0;

    Result<void> send_exact(const std::vector<std::uint8_t>& data) {
        return send_exact(data.data(), data.size());
    }
};

struct TransportOptions {
    std::chrono::milliseconds connect_timeout{5000}; ///< 0 disables the limit
    std::chrono::milliseconds io_timeout{30000};     ///< applies to each send/receive
};

class TcpConnection final : public Connection {
public:
    explicit TcpConnection(Socket socket);
    ~TcpConnection() override;

    static Result<std::unique_ptr<Connection>> open(const Endpoint& endpoint,
                                                    const TransportOptions& options);

    Result<void> send_exact(const std::uint8_t* data, std::size_t size) override;
    Result<std::vector<std::uint8_t>> recv_exact(std::size_t count) override;
    void close() override;
    [[nodiscard]] bool is_open() const override { return socket_.is_valid(); }

    using Connection::send_exact;

private:
    static constexpr std::size_t kMaxTransferPerCall = 64 * 1024;

    Socket socket_;
};

/**
 * @brief Opens connections for the protocol engine
 *
 * Kept separate from Connection so the engine can be driven by scripted
 * connections in tests.
 */
class Connector {
public:
    virtual ~Connector() = default;
    virtual Result<std::unique_ptr<Connection>> connect(const Endpoint& endpoint) = 0;
};

class TcpConnector final : public Connector {
public:
    explicit TcpConnector(TransportOptions options = {}) : options_(options) {}

    Result<std::unique_ptr<Connection>> connect(const Endpoint& endpoint) override;

    [[nodiscard]] const TransportOptions& options() const noexcept { return options_; }

private:
    TransportOptions options_;
};

} // namespace bkc::network
