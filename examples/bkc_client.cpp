#include "bkc/client/backup_client.hpp"
#include "bkc/client/file_adapter.hpp"
#include "bkc/client/report.hpp"
#include "bkc/config/client_config.hpp"
#include "bkc/network/connection.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using bkc::client::BackupClient;
using bkc::client::OperationReport;
using bkc::client::RestoreRequest;

namespace {

struct Options {
    std::optional<std::string> config_path;
    std::string server_info = "server.info";
    std::string backup_info = "backup.info";
    std::optional<std::uint32_t> user_id;
    std::optional<std::string> restore_as;
    bool json_output = false;
    bool verbose = false;
    std::string command;
    std::vector<std::string> arguments;
};

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <list|backup|restore|delete|demo> [files...]\n"
              << "  --config <file.json>     JSON configuration (server, files, user_id, timeouts)\n"
              << "  --server-info <path>     host:port file (default server.info)\n"
              << "  --backup-info <path>     files to back up, one per line (default backup.info)\n"
              << "  --user-id <n>            32-bit user identity (random when omitted)\n"
              << "  --as <path>              local target when restoring a single file\n"
              << "  --json                   print reports as JSON\n"
              << "  -v, --verbose            debug logging\n";
}

std::optional<Options> parse_arguments(int argc, char* argv[]) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            options.config_path = argv[++i];
        } else if (arg == "--server-info" && i + 1 < argc) {
            options.server_info = argv[++i];
        } else if (arg == "--backup-info" && i + 1 < argc) {
            options.backup_info = argv[++i];
        } else if (arg == "--user-id" && i + 1 < argc) {
            try {
                const unsigned long value = std::stoul(argv[++i]);
                if (value > 0xFFFFFFFFUL) {
                    return std::nullopt;
                }
                options.user_id = static_cast<std::uint32_t>(value);
            } catch (const std::exception&) {
                return std::nullopt;
            }
        } else if (arg == "--as" && i + 1 < argc) {
            options.restore_as = argv[++i];
        } else if (arg == "--json") {
            options.json_output = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        } else if (options.command.empty()) {
            options.command = arg;
        } else {
            options.arguments.push_back(arg);
        }
    }
    if (options.command.empty()) {
        return std::nullopt;
    }
    return options;
}

bkc::Result<bkc::config::ClientConfig> resolve_config(const Options& options, bool needs_backup_list) {
    if (options.config_path) {
        return bkc::config::load_client_config(*options.config_path);
    }

    bkc::config::ClientConfig config;
    auto endpoint = bkc::config::load_server_info(options.server_info);
    if (endpoint.is_error()) {
        return bkc::Err<bkc::config::ClientConfig>(endpoint.error());
    }
    config.endpoint = endpoint.value();

    if (needs_backup_list) {
        auto files = bkc::config::load_backup_list(options.backup_info);
        if (files.is_error()) {
            return bkc::Err<bkc::config::ClientConfig>(files.error());
        }
        config.backup_files = std::move(files.value());
    }
    return bkc::Ok(std::move(config));
}

void print_report(const OperationReport& report, bool json_output) {
    if (json_output) {
        std::cout << bkc::client::report_to_json(report).dump(2) << std::endl;
    } else {
        std::cout << bkc::client::format_report(report) << std::endl;
    }
}

bool emit(const OperationReport& report, bool json_output) {
    print_report(report, json_output);
    return report.succeeded();
}

// Replays the reference walk-through: list, back up two files, list,
// restore the first as "tmp", delete it, then try to restore it again.
bool run_demo(BackupClient& client, const std::vector<std::string>& files, bool json_output) {
    bool ok = emit(client.list_files(), json_output);

    std::vector<std::string> first_two(files.begin(), files.begin() + std::min<std::size_t>(2, files.size()));
    if (!first_two.empty()) {
        ok = emit(client.backup(first_two), json_output) && ok;
    }

    ok = emit(client.list_files(), json_output) && ok;

    if (!files.empty()) {
        const std::string stored = std::filesystem::path(files.front()).filename().string();
        ok = emit(client.restore({RestoreRequest{stored, "tmp"}}), json_output) && ok;
        ok = emit(client.remove({stored}), json_output) && ok;
        // Expected to report FILE_NOT_FOUND; not counted against the demo.
        print_report(client.restore({RestoreRequest{stored, {}}}), json_output);
    }
    return ok;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    auto parsed = parse_arguments(argc, argv);
    if (!parsed) {
        print_usage(argv[0]);
        return 2;
    }
    const Options& options = *parsed;

    const bool needs_backup_list =
        options.command == "demo" || (options.command == "backup" && options.arguments.empty());
    auto config_result = resolve_config(options, needs_backup_list);
    if (config_result.is_error()) {
        spdlog::error("Configuration error: {}", config_result.error().describe());
        return 2;
    }
    auto config = std::move(config_result.value());

    spdlog::set_level(options.verbose ? spdlog::level::debug : spdlog::level::from_str(config.log_level));

    bkc::client::ClientIdentity identity;
    identity.user_id = options.user_id.value_or(config.user_id.value_or(bkc::config::generate_user_id()));

    bkc::network::TcpConnector connector(config.transport);
    bkc::client::LocalFileAdapter files;
    BackupClient client(config.endpoint, identity, connector, files, config.limits);

    spdlog::info("User {} talking to {}", identity.user_id, config.endpoint.to_string());

    bool ok = false;
    if (options.command == "list") {
        ok = emit(client.list_files(), options.json_output);
    } else if (options.command == "backup") {
        const auto& paths = options.arguments.empty() ? config.backup_files : options.arguments;
        if (paths.empty()) {
            spdlog::error("No files to back up");
            return 2;
        }
        ok = emit(client.backup(paths), options.json_output);
    } else if (options.command == "restore") {
        if (options.arguments.empty() || (options.restore_as && options.arguments.size() != 1)) {
            print_usage(argv[0]);
            return 2;
        }
        std::vector<RestoreRequest> requests;
        for (const auto& name : options.arguments) {
            requests.push_back(RestoreRequest{name, options.restore_as.value_or(std::string{})});
        }
        ok = emit(client.restore(requests), options.json_output);
    } else if (options.command == "delete") {
        if (options.arguments.empty()) {
            print_usage(argv[0]);
            return 2;
        }
        ok = emit(client.remove(options.arguments), options.json_output);
    } else if (options.command == "demo") {
        ok = run_demo(client, config.backup_files, options.json_output);
    } else {
        print_usage(argv[0]);
        return 2;
    }

    return ok ? 0 : 1;
}
