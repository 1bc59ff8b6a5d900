#pragma once

#include <cstdint>
#include <string>

namespace bkc::network {

/**
 * @brief Server address a client operation connects to
 *
 * Host is either a dotted IPv4 address or a name resolvable by the system
 * resolver. Built once from configuration and passed by value.
 */
struct Endpoint {
    std::string host;
    std::uint16_t port = 0;

    [[nodiscard]] std::string to_string() const {
        return host + ":" + std::to_string(port);
    }
};

inline bool operator==(const Endpoint& lhs, const Endpoint& rhs) {
    return lhs.host == rhs.host && lhs.port == rhs.port;
}

inline bool operator!=(const Endpoint& lhs, const Endpoint& rhs) {
    return !(lhs == rhs);
}

} // namespace bkc::network
