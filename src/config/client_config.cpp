#include "bkc/config/client_config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <charconv>
#include <fstream>
#include <limits>
#include <random>
#include <sstream>

namespace bkc::config {

using json = nlohmann::json;

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

Result<std::string> read_text_file(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        return Fail<std::string>(ErrorKind::InvalidArgument, "Cannot open configuration file: " + path);
    }
    std::ostringstream oss;
    oss << input.rdbuf();
    return Ok(oss.str());
}

Result<std::optional<std::uint64_t>> optional_unsigned(const json& object,
                                                       const char* key,
                                                       std::uint64_t max_value) {
    if (!object.contains(key)) {
        return Ok<std::optional<std::uint64_t>>(std::nullopt);
    }
    const auto& value = object.at(key);
    if (!value.is_number_unsigned()) {
        return Fail<std::optional<std::uint64_t>>(ErrorKind::InvalidArgument,
                                                  std::string("\"") + key + "\" must be a non-negative integer");
    }
    const auto number = value.get<std::uint64_t>();
    if (number > max_value) {
        return Fail<std::optional<std::uint64_t>>(ErrorKind::InvalidArgument,
                                                  std::string("\"") + key + "\" is out of range");
    }
    return Ok<std::optional<std::uint64_t>>(number);
}

} // namespace

Result<network::Endpoint> parse_endpoint(const std::string& text) {
    const std::string value = trim(text);
    const auto colon = value.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == value.size()) {
        return Fail<network::Endpoint>(ErrorKind::InvalidArgument,
                                       "Expected host:port, got '" + value + "'");
    }

    unsigned int port = 0;
    const char* first = value.data() + colon + 1;
    const char* last = value.data() + value.size();
    const auto [ptr, ec] = std::from_chars(first, last, port);
    if (ec != std::errc() || ptr != last || port == 0 || port > std::numeric_limits<std::uint16_t>::max()) {
        return Fail<network::Endpoint>(ErrorKind::InvalidArgument,
                                       "Invalid port in '" + value + "'");
    }

    network::Endpoint endpoint;
    endpoint.host = value.substr(0, colon);
    endpoint.port = static_cast<std::uint16_t>(port);
    return Ok(std::move(endpoint));
}

Result<network::Endpoint> load_server_info(const std::string& path) {
    auto text = read_text_file(path);
    if (text.is_error()) {
        return Err<network::Endpoint>(text.error());
    }
    std::istringstream lines(text.value());
    std::string first_line;
    std::getline(lines, first_line);
    return parse_endpoint(first_line);
}

Result<std::vector<std::string>> load_backup_list(const std::string& path) {
    auto text = read_text_file(path);
    if (text.is_error()) {
        return Err<std::vector<std::string>>(text.error());
    }

    std::vector<std::string> files;
    std::istringstream lines(text.value());
    std::string line;
    while (std::getline(lines, line)) {
        auto entry = trim(line);
        if (!entry.empty()) {
            files.push_back(std::move(entry));
        }
    }
    return Ok(std::move(files));
}

Result<ClientConfig> load_client_config(const std::string& path) {
    auto text = read_text_file(path);
    if (text.is_error()) {
        return Err<ClientConfig>(text.error());
    }
    auto config = parse_client_config(text.value());
    if (config.is_error()) {
        return Fail<ClientConfig>(config.error().kind, path + ": " + config.error().message);
    }
    return config;
}

Result<ClientConfig> parse_client_config(const std::string& json_text) {
    auto doc = json::parse(json_text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Fail<ClientConfig>(ErrorKind::InvalidArgument, "Invalid JSON configuration");
    }

    ClientConfig config;

    if (!doc.contains("server") || !doc.at("server").is_string()) {
        return Fail<ClientConfig>(ErrorKind::InvalidArgument, "\"server\" (host:port) is required");
    }
    auto endpoint = parse_endpoint(doc.at("server").get<std::string>());
    if (endpoint.is_error()) {
        return Err<ClientConfig>(endpoint.error());
    }
    config.endpoint = endpoint.value();

    if (doc.contains("files")) {
        const auto& files = doc.at("files");
        if (!files.is_array()) {
            return Fail<ClientConfig>(ErrorKind::InvalidArgument, "\"files\" must be an array of paths");
        }
        for (const auto& entry : files) {
            if (!entry.is_string()) {
                return Fail<ClientConfig>(ErrorKind::InvalidArgument, "\"files\" must be an array of paths");
            }
            config.backup_files.push_back(entry.get<std::string>());
        }
    }

    auto user_id = optional_unsigned(doc, "user_id", std::numeric_limits<std::uint32_t>::max());
    if (user_id.is_error()) {
        return Err<ClientConfig>(user_id.error());
    }
    if (user_id.value()) {
        config.user_id = static_cast<std::uint32_t>(*user_id.value());
    }

    auto connect_timeout = optional_unsigned(doc, "connect_timeout_ms", std::numeric_limits<std::int32_t>::max());
    if (connect_timeout.is_error()) {
        return Err<ClientConfig>(connect_timeout.error());
    }
    if (connect_timeout.value()) {
        config.transport.connect_timeout = std::chrono::milliseconds(*connect_timeout.value());
    }

    auto io_timeout = optional_unsigned(doc, "io_timeout_ms", std::numeric_limits<std::int32_t>::max());
    if (io_timeout.is_error()) {
        return Err<ClientConfig>(io_timeout.error());
    }
    if (io_timeout.value()) {
        config.transport.io_timeout = std::chrono::milliseconds(*io_timeout.value());
    }

    auto max_payload = optional_unsigned(doc, "max_payload_bytes", std::numeric_limits<std::uint32_t>::max());
    if (max_payload.is_error()) {
        return Err<ClientConfig>(max_payload.error());
    }
    if (max_payload.value()) {
        config.limits.max_payload_bytes = static_cast<std::uint32_t>(*max_payload.value());
    }

    if (doc.contains("log_level")) {
        if (!doc.at("log_level").is_string()) {
            return Fail<ClientConfig>(ErrorKind::InvalidArgument, "\"log_level\" must be a string");
        }
        config.log_level = doc.at("log_level").get<std::string>();
        if (spdlog::level::from_str(config.log_level) == spdlog::level::off && config.log_level != "off") {
            return Fail<ClientConfig>(ErrorKind::InvalidArgument,
                                      "Unknown \"log_level\": '" + config.log_level + "'");
        }
    }

    spdlog::debug("Loaded configuration for {}", config.endpoint.to_string());
    return Ok(std::move(config));
}

std::uint32_t generate_user_id() {
    std::random_device device;
    std::mt19937 rng(device());
    std::uniform_int_distribution<std::uint32_t> dist(1, std::numeric_limits<std::uint32_t>::max());
    return dist(rng);
}

} // namespace bkc::config
