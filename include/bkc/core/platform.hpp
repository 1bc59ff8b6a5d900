#pragma once

#ifdef _WIN32
    #define BKC_PLATFORM_WINDOWS
    #include <winsock2.h>
    #include <ws2tcpip.h>
    #pragma comment(lib, "ws2_32.lib")
#else
    #define BKC_PLATFORM_LINUX
    #include <sys/socket.h>
    #include <netinet/in.h>
    #include <arpa/inet.h>
    #include <netdb.h>
    #include <poll.h>
    #include <unistd.h>
    #include <cerrno>
    #include <cstring>
#endif

#include <string>

namespace bkc::platform {

#ifdef BKC_PLATFORM_WINDOWS
    using socket_t = SOCKET;
    constexpr socket_t kInvalidSocket = INVALID_SOCKET;
#else
    using socket_t = int;
    constexpr socket_t kInvalidSocket = -1;
#endif

inline int last_socket_error() {
#ifdef BKC_PLATFORM_WINDOWS
    return WSAGetLastError();
#else
    return errno;
#endif
}

/// Call was cut short by a signal and can be retried.
inline bool is_interrupted(int code) {
#ifdef BKC_PLATFORM_WINDOWS
    return code == WSAEINTR;
#else
    return code == EINTR;
#endif
}

/// SO_RCVTIMEO / SO_SNDTIMEO expired.
inline bool is_timeout(int code) {
#ifdef BKC_PLATFORM_WINDOWS
    return code == WSAETIMEDOUT || code == WSAEWOULDBLOCK;
#else
    return code == EAGAIN || code == EWOULDBLOCK;
#endif
}

/// Non-blocking connect has started but not finished.
inline bool is_in_progress(int code) {
#ifdef BKC_PLATFORM_WINDOWS
    return code == WSAEWOULDBLOCK;
#else
    return code == EINPROGRESS;
#endif
}

inline std::string describe_error(int code) {
#ifdef BKC_PLATFORM_WINDOWS
    return "WSA error " + std::to_string(code);
#else
    return std::strerror(code);
#endif
}

} // namespace bkc::platform
