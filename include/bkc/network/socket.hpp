#pragma once

#include "bkc/core/platform.hpp"
#include "bkc/core/result.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>

namespace bkc::network {

using socket_t = platform::socket_t;
constexpr socket_t INVALID_SOCKET_VALUE = platform::kInvalidSocket;

/**
 * @brief Owning wrapper over a TCP socket handle
 *
 * send() and receive() perform a single system call and may transfer fewer
 * bytes than asked; TcpConnection builds the exact-count contract on top.
 * Connect failures are reported as ErrorKind::Connection, transfer failures
 * as ErrorKind::Io.
 */
class Socket {
public:
    Socket();
    ~Socket();

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;

    Result<void> create();
    Result<void> bind(const std::string& address, uint16_t port);
    Result<void> listen(int backlog = 5);
    Result<std::unique_ptr<Socket>> accept();

    /// A zero timeout blocks until the OS gives up.
    Result<void> connect(const std::string& host, uint16_t port,
                         std::chrono::milliseconds timeout = std::chrono::milliseconds{0});

    Result<size_t> send(const uint8_t* data, size_t size);
    Result<size_t> receive(uint8_t* buffer, size_t max_size);

    Result<void> set_non_blocking(bool enable);
    Result<void> set_reuse_address(bool enable);
    Result<void> set_io_timeout(std::chrono::milliseconds timeout);

    Result<uint16_t> local_port() const;

    void close();
    bool is_valid() const { return socket_ != INVALID_SOCKET_VALUE; }

    socket_t native_handle() const { return socket_; }

    static std::unique_ptr<Socket> create_from_native(socket_t socket) {
        return std::unique_ptr<Socket>(new Socket(socket));
    }

private:
    explicit Socket(socket_t socket);

    Result<void> wait_for_connect(std::chrono::milliseconds timeout);

    socket_t socket_;

    static bool platform_initialized_;
    static Result<void> initialize_platform();
};

} // namespace bkc::network
