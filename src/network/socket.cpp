#include "bkc/network/socket.hpp"
#include <spdlog/spdlog.h>

#ifdef BKC_PLATFORM_WINDOWS
    #define close_socket closesocket
    #define poll_socket WSAPoll
    using socklen_t = int;
    using io_length_t = int;
    constexpr int kSendFlags = 0;
#else
    #define close_socket ::close
    #define poll_socket ::poll
    #include <fcntl.h>
    using io_length_t = size_t;
    constexpr int kSendFlags = MSG_NOSIGNAL;
#endif

namespace bkc::network {
namespace {

using platform::describe_error;
using platform::is_in_progress;
using platform::is_interrupted;
using platform::is_timeout;
using platform::last_socket_error;

Result<sockaddr_in> resolve_ipv4(const std::string& host, uint16_t port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) == 1) {
        return Ok(addr);
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* resolved = nullptr;
    const int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &resolved);
    if (rc != 0 || resolved == nullptr) {
        return Fail<sockaddr_in>(ErrorKind::Connection, "Cannot resolve host: " + host);
    }

    addr.sin_addr = reinterpret_cast<const sockaddr_in*>(resolved->ai_addr)->sin_addr;
    ::freeaddrinfo(resolved);
    return Ok(addr);
}

} // namespace

bool Socket::platform_initialized_ = false;

Result<void> Socket::initialize_platform() {
    if (platform_initialized_) {
        return Ok();
    }

#ifdef BKC_PLATFORM_WINDOWS
    WSADATA wsa_data;
    if (WSAStartup(MAKEWORD(2, 2), &wsa_data) != 0) {
        return Fail<void>(ErrorKind::Connection, "Failed to initialize Winsock");
    }
#endif

    platform_initialized_ = true;
    return Ok();
}

Socket::Socket()
    : socket_(INVALID_SOCKET_VALUE) {
    auto init = initialize_platform();
    if (init.is_error()) {
        spdlog::error("{}", init.error().describe());
    }
}

Socket::Socket(socket_t socket)
    : socket_(socket) {
}

Socket::~Socket() {
    close();
}

Socket::Socket(Socket&& other) noexcept
    : socket_(other.socket_) {
    other.socket_ = INVALID_SOCKET_VALUE;
}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        close();
        socket_ = other.socket_;
        other.socket_ = INVALID_SOCKET_VALUE;
    }
    return *this;
}

Result<void> Socket::create() {
    if (socket_ != INVALID_SOCKET_VALUE) {
        return Fail<void>(ErrorKind::InvalidArgument, "Socket already created");
    }

    socket_ = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Fail<void>(ErrorKind::Connection,
                          "Failed to create socket: " + describe_error(last_socket_error()));
    }

    spdlog::debug("Socket created: fd={}", socket_);
    return Ok();
}

Result<void> Socket::bind(const std::string& address, uint16_t port) {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Fail<void>(ErrorKind::InvalidArgument, "Socket not created");
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (address == "0.0.0.0" || address.empty()) {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else {
        if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) <= 0) {
            return Fail<void>(ErrorKind::InvalidArgument, "Invalid address: " + address);
        }
    }

    if (::bind(socket_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        return Fail<void>(ErrorKind::Connection,
                          "Failed to bind to " + address + ":" + std::to_string(port));
    }

    spdlog::debug("Socket bound to {}:{}", address, port);
    return Ok();
}

Result<void> Socket::listen(int backlog) {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Fail<void>(ErrorKind::InvalidArgument, "Socket not created");
    }

    if (::listen(socket_, backlog) < 0) {
        return Fail<void>(ErrorKind::Connection, "Failed to listen");
    }

    spdlog::debug("Socket listening with backlog={}", backlog);
    return Ok();
}

Result<std::unique_ptr<Socket>> Socket::accept() {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Fail<std::unique_ptr<Socket>>(ErrorKind::InvalidArgument, "Socket not created");
    }

    sockaddr_in client_addr{};
    socklen_t addr_len = sizeof(client_addr);

    socket_t client_socket = ::accept(socket_,
                                      reinterpret_cast<sockaddr*>(&client_addr),
                                      &addr_len);

    if (client_socket == INVALID_SOCKET_VALUE) {
        return Fail<std::unique_ptr<Socket>>(ErrorKind::Connection, "Failed to accept connection");
    }

    char addr_str[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &client_addr.sin_addr, addr_str, INET_ADDRSTRLEN);
    spdlog::debug("Accepted connection from {}:{}", addr_str, ntohs(client_addr.sin_port));

    return Ok(Socket::create_from_native(client_socket));
}

Result<void> Socket::connect(const std::string& host, uint16_t port,
                             std::chrono::milliseconds timeout) {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Fail<void>(ErrorKind::InvalidArgument, "Socket not created");
    }

    auto resolved = resolve_ipv4(host, port);
    if (resolved.is_error()) {
        return Err<void>(resolved.error());
    }
    const sockaddr_in addr = resolved.value();
    const std::string target = host + ":" + std::to_string(port);

    if (timeout.count() <= 0) {
        if (::connect(socket_, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
            return Fail<void>(ErrorKind::Connection,
                              "Failed to connect to " + target + ": " + describe_error(last_socket_error()));
        }
    } else {
        if (auto res = set_non_blocking(true); res.is_error()) {
            return res;
        }
        if (::connect(socket_, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
            const int code = last_socket_error();
            if (!is_in_progress(code)) {
                return Fail<void>(ErrorKind::Connection,
                                  "Failed to connect to " + target + ": " + describe_error(code));
            }
            auto waited = wait_for_connect(timeout);
            if (waited.is_error()) {
                return Fail<void>(ErrorKind::Connection,
                                  "Failed to connect to " + target + ": " + waited.error().message);
            }
        }
        if (auto res = set_non_blocking(false); res.is_error()) {
            return res;
        }
    }

    spdlog::info("Connected to {}", target);
    return Ok();
}

Result<void> Socket::wait_for_connect(std::chrono::milliseconds timeout) {
    pollfd pfd{};
    pfd.fd = socket_;
    pfd.events = POLLOUT;

    int rc = 0;
    do {
        rc = poll_socket(&pfd, 1, static_cast<int>(timeout.count()));
    } while (rc < 0 && is_interrupted(last_socket_error()));

    if (rc == 0) {
        return Fail<void>(ErrorKind::Connection, "timed out");
    }
    if (rc < 0) {
        return Fail<void>(ErrorKind::Connection, describe_error(last_socket_error()));
    }

    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (getsockopt(socket_, SOL_SOCKET, SO_ERROR,
                   reinterpret_cast<char*>(&so_error), &len) < 0) {
        return Fail<void>(ErrorKind::Connection, describe_error(last_socket_error()));
    }
    if (so_error != 0) {
        return Fail<void>(ErrorKind::Connection, describe_error(so_error));
    }
    return Ok();
}

Result<size_t> Socket::send(const uint8_t* data, size_t size) {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Fail<size_t>(ErrorKind::Io, "Socket not created");
    }

    while (true) {
        auto sent = ::send(socket_, reinterpret_cast<const char*>(data),
                           static_cast<io_length_t>(size), kSendFlags);
        if (sent >= 0) {
            return Ok(static_cast<size_t>(sent));
        }
        const int code = last_socket_error();
        if (is_interrupted(code)) {
            continue;
        }
        if (is_timeout(code)) {
            return Fail<size_t>(ErrorKind::Io, "Send timed out");
        }
        return Fail<size_t>(ErrorKind::Io, "Failed to send data: " + describe_error(code));
    }
}

Result<size_t> Socket::receive(uint8_t* buffer, size_t max_size) {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Fail<size_t>(ErrorKind::Io, "Socket not created");
    }

    while (true) {
        auto received = ::recv(socket_, reinterpret_cast<char*>(buffer),
                               static_cast<io_length_t>(max_size), 0);
        if (received >= 0) {
            return Ok(static_cast<size_t>(received));
        }
        const int code = last_socket_error();
        if (is_interrupted(code)) {
            continue;
        }
        if (is_timeout(code)) {
            return Fail<size_t>(ErrorKind::Io, "Receive timed out");
        }
        return Fail<size_t>(ErrorKind::Io, "Failed to receive data: " + describe_error(code));
    }
}

Result<void> Socket::set_non_blocking(bool enable) {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Fail<void>(ErrorKind::InvalidArgument, "Socket not created");
    }

#ifdef BKC_PLATFORM_WINDOWS
    u_long mode = enable ? 1 : 0;
    if (ioctlsocket(socket_, FIONBIO, &mode) != 0) {
        return Fail<void>(ErrorKind::Connection, "Failed to set non-blocking mode");
    }
#else
    int flags = fcntl(socket_, F_GETFL, 0);
    if (flags == -1) {
        return Fail<void>(ErrorKind::Connection, "Failed to get socket flags");
    }

    if (enable) {
        flags |= O_NONBLOCK;
    } else {
        flags &= ~O_NONBLOCK;
    }

    if (fcntl(socket_, F_SETFL, flags) == -1) {
        return Fail<void>(ErrorKind::Connection, "Failed to set non-blocking mode");
    }
#endif

    return Ok();
}

Result<void> Socket::set_reuse_address(bool enable) {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Fail<void>(ErrorKind::InvalidArgument, "Socket not created");
    }

    int opt = enable ? 1 : 0;
    if (setsockopt(socket_, SOL_SOCKET, SO_REUSEADDR,
                   reinterpret_cast<const char*>(&opt), sizeof(opt)) < 0) {
        return Fail<void>(ErrorKind::Connection, "Failed to set SO_REUSEADDR");
    }

    return Ok();
}

Result<void> Socket::set_io_timeout(std::chrono::milliseconds timeout) {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Fail<void>(ErrorKind::InvalidArgument, "Socket not created");
    }

    const auto millis = timeout.count() > 0 ? timeout.count() : 0;
#ifdef BKC_PLATFORM_WINDOWS
    DWORD value = static_cast<DWORD>(millis);
#else
    timeval value{};
    value.tv_sec = static_cast<decltype(value.tv_sec)>(millis / 1000);
    value.tv_usec = static_cast<decltype(value.tv_usec)>((millis % 1000) * 1000);
#endif

    for (int option : {SO_RCVTIMEO, SO_SNDTIMEO}) {
        if (setsockopt(socket_, SOL_SOCKET, option,
                       reinterpret_cast<const char*>(&value), sizeof(value)) < 0) {
            return Fail<void>(ErrorKind::Connection, "Failed to set socket timeout");
        }
    }

    return Ok();
}

Result<uint16_t> Socket::local_port() const {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Fail<uint16_t>(ErrorKind::InvalidArgument, "Socket not created");
    }

    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(socket_, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return Fail<uint16_t>(ErrorKind::Connection, "Failed to query local address");
    }
    return Ok(static_cast<uint16_t>(ntohs(addr.sin_port)));
}

void Socket::close() {
    if (socket_ != INVALID_SOCKET_VALUE) {
        close_socket(socket_);
        socket_ = INVALID_SOCKET_VALUE;
        spdlog::debug("Socket closed");
    }
}

} // namespace bkc::network
