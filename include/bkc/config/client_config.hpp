#pragma once

#include "bkc/client/channel.hpp"
#include "bkc/core/result.hpp"
#include "bkc/network/connection.hpp"
#include "bkc/network/endpoint.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bkc::config {

/**
 * @brief Everything the command line client needs before talking to a server
 */
struct ClientConfig {
    network::Endpoint endpoint;
    std::vector<std::string> backup_files;
    std::optional<std::uint32_t> user_id; ///< Generated per run when absent
    network::TransportOptions transport;
    client::ChannelLimits limits;
    std::string log_level = "info";
};

/// "host:port" with a port in 1..65535.
Result<network::Endpoint> parse_endpoint(const std::string& text);

/// First line of the file holds "host:port".
Result<network::Endpoint> load_server_info(const std::string& path);

/// One path per line; surrounding whitespace and blank lines are dropped.
Result<std::vector<std::string>> load_backup_list(const std::string& path);

/**
 * Load a JSON configuration file:
 * {"server": "127.0.0.1:1234", "files": ["a.txt"], "user_id": 42,
 *  "connect_timeout_ms": 5000, "io_timeout_ms": 30000,
 *  "max_payload_bytes": 1073741824, "log_level": "info"}
 * Only "server" is required.
 */
Result<ClientConfig> load_client_config(const std::string& path);

Result<ClientConfig> parse_client_config(const std::string& json_text);

std::uint32_t generate_user_id();

} // namespace bkc::config
