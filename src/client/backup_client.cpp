#include "bkc/client/backup_client.hpp"
#include "bkc/protocol/codec.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <variant>

namespace bkc::client {

using protocol::Codec;
using protocol::RequestCode;
using protocol::StatusCode;

namespace {

FileOutcome server_refusal(const std::string& name, StatusCode status) {
    FileOutcome outcome;
    outcome.name = name;
    outcome.status = OutcomeStatus::Failed;
    outcome.server_status = status;
    spdlog::warn("Server answered {} for '{}'", protocol::to_string(status), name);
    return outcome;
}

} // namespace

BackupClient::BackupClient(network::Endpoint endpoint,
                           ClientIdentity identity,
                           network::Connector& connector,
                           FileAdapter& files,
                           ChannelLimits limits)
    : endpoint_(std::move(endpoint))
    , identity_(identity)
    , connector_(connector)
    , files_(files)
    , limits_(limits) {
}

OperationReport BackupClient::list_files() {
    OperationReport report;
    report.kind = OperationKind::List;
    OperationSession session(OperationKind::List);

    spdlog::info("Listing files of user {} on {}", identity_.user_id, endpoint_.to_string());

    auto connected = connector_.connect(endpoint_);
    if (connected.is_error()) {
        fail_operation(report, session, connected.error());
        report.final_state = session.state();
        return report;
    }
    std::unique_ptr<network::Connection> connection = std::move(connected.value());
    RequestChannel channel(*connection, session, identity_.version, limits_);

    auto run = [&]() -> Result<void> {
        if (auto res = session.transition_to(OperationState::Connected); res.is_error()) {
            return res;
        }
        if (auto res = channel.send(make_request(RequestCode::List, {})); res.is_error()) {
            return res;
        }
        auto response = channel.receive(RequestCode::List);
        if (response.is_error()) {
            return Err<void>(response.error());
        }

        const auto status = response.value().status;
        report.server_status = status;
        if (status == StatusCode::NoFiles) {
            return Ok();
        }
        if (status != StatusCode::SuccessFileList) {
            return Fail<void>(ErrorKind::ServerStatus,
                              std::string("Server answered ") + protocol::to_string(status));
        }

        auto payload = Codec::decode_payload(RequestCode::List, status, response.value().payload);
        if (payload.is_error()) {
            return Err<void>(payload.error());
        }
        report.listing = std::get<protocol::FileListing>(std::move(payload.value()));
        return Ok();
    };

    auto result = run();
    if (result.is_error()) {
        fail_operation(report, session, result.error());
    } else if (auto done = session.transition_to(OperationState::Completed); done.is_error()) {
        fail_operation(report, session, done.error());
    } else {
        spdlog::info("Server lists {} file(s)", report.listing.size());
    }

    connection->close();
    spdlog::debug("Connection to {} closed", endpoint_.to_string());
    report.bytes_sent = channel.bytes_sent();
    report.bytes_received = channel.bytes_received();
    report.final_state = session.state();
    return report;
}

OperationReport BackupClient::backup(const std::vector<std::string>& paths) {
    return run_batch(OperationKind::Backup, paths,
                     [this, &paths](RequestChannel& channel, std::size_t index) {
                         return backup_one(channel, paths[index]);
                     });
}

OperationReport BackupClient::restore(const std::vector<RestoreRequest>& requests) {
    std::vector<std::string> names;
    names.reserve(requests.size());
    for (const auto& request : requests) {
        names.push_back(request.remote_name);
    }
    return run_batch(OperationKind::Restore, names,
                     [this, &requests](RequestChannel& channel, std::size_t index) {
                         return restore_one(channel, requests[index]);
                     });
}

OperationReport BackupClient::remove(const std::vector<std::string>& names) {
    return run_batch(OperationKind::Delete, names,
                     [this, &names](RequestChannel& channel, std::size_t index) {
                         return delete_one(channel, names[index]);
                     });
}

OperationReport BackupClient::run_batch(OperationKind kind,
                                        const std::vector<std::string>& names,
                                        const FileStep& step) {
    OperationReport report;
    report.kind = kind;
    report.files.reserve(names.size());
    for (const auto& name : names) {
        FileOutcome pending;
        pending.name = name;
        report.files.push_back(std::move(pending));
    }

    OperationSession session(kind);
    spdlog::info("Starting {} of {} file(s) for user {} on {}",
                 to_string(kind), names.size(), identity_.user_id, endpoint_.to_string());

    auto connected = connector_.connect(endpoint_);
    if (connected.is_error()) {
        fail_operation(report, session, connected.error());
        report.final_state = session.state();
        return report;
    }
    std::unique_ptr<network::Connection> connection = std::move(connected.value());

    if (auto res = session.transition_to(OperationState::Connected); res.is_error()) {
        fail_operation(report, session, res.error());
    }

    RequestChannel channel(*connection, session, identity_.version, limits_);
    for (std::size_t i = 0; i < names.size() && !session.is_terminal(); ++i) {
        auto outcome = step(channel, i);
        auto& slot = report.files[i];

        if (outcome.is_ok()) {
            slot = std::move(outcome.value());
            if (slot.status == OutcomeStatus::Succeeded) {
                spdlog::info("{} '{}' succeeded ({} bytes)", to_string(kind), slot.name, slot.bytes);
            }
            continue;
        }

        slot.status = OutcomeStatus::Failed;
        slot.error = outcome.error();
        if (is_fatal(outcome.error().kind)) {
            fail_operation(report, session, outcome.error());
            break;
        }
        spdlog::warn("{} '{}' failed: {}", to_string(kind), slot.name, outcome.error().describe());
    }

    if (!session.is_terminal()) {
        if (auto done = session.transition_to(OperationState::Completed); done.is_error()) {
            fail_operation(report, session, done.error());
        }
    }

    connection->close();
    spdlog::debug("Connection to {} closed", endpoint_.to_string());
    report.bytes_sent = channel.bytes_sent();
    report.bytes_received = channel.bytes_received();
    report.final_state = session.state();
    return report;
}

Result<FileOutcome> BackupClient::backup_one(RequestChannel& channel, const std::string& path) {
    const std::string stored_name = std::filesystem::path(path).filename().string();
    if (stored_name.empty()) {
        return Fail<FileOutcome>(ErrorKind::InvalidArgument, "No file name in path: " + path);
    }

    auto content = files_.read_all(path);
    if (content.is_error()) {
        return Err<FileOutcome>(content.error());
    }
    if (content.value().size() > protocol::kMaxContentSize) {
        return Fail<FileOutcome>(ErrorKind::InvalidArgument, "File too large for protocol: " + path);
    }

    const std::uint64_t size = content.value().size();
    const auto request = make_request(RequestCode::Backup, stored_name, std::move(content.value()));
    if (auto res = channel.send(request); res.is_error()) {
        return Err<FileOutcome>(res.error());
    }

    auto response = channel.receive(RequestCode::Backup);
    if (response.is_error()) {
        return Err<FileOutcome>(response.error());
    }
    if (response.value().status != StatusCode::SuccessNoPayload) {
        return Ok(server_refusal(path, response.value().status));
    }

    FileOutcome outcome;
    outcome.name = path;
    outcome.status = OutcomeStatus::Succeeded;
    outcome.server_status = response.value().status;
    outcome.bytes = size;
    return Ok(std::move(outcome));
}

Result<FileOutcome> BackupClient::restore_one(RequestChannel& channel, const RestoreRequest& request) {
    if (auto res = channel.send(make_request(RequestCode::Restore, request.remote_name)); res.is_error()) {
        return Err<FileOutcome>(res.error());
    }

    auto response = channel.receive(RequestCode::Restore);
    if (response.is_error()) {
        return Err<FileOutcome>(response.error());
    }
    const auto status = response.value().status;
    if (status != StatusCode::SuccessFound) {
        return Ok(server_refusal(request.remote_name, status));
    }

    auto payload = Codec::decode_payload(RequestCode::Restore, status, response.value().payload);
    if (payload.is_error()) {
        return Err<FileOutcome>(payload.error());
    }
    const auto& content = std::get<protocol::FileContent>(payload.value());

    const std::string& target = request.local_path.empty() ? request.remote_name : request.local_path;
    if (auto res = files_.write_all(target, content); res.is_error()) {
        return Err<FileOutcome>(res.error());
    }
    if (target != request.remote_name) {
        spdlog::info("Restored '{}' to '{}'", request.remote_name, target);
    }

    FileOutcome outcome;
    outcome.name = request.remote_name;
    outcome.status = OutcomeStatus::Succeeded;
    outcome.server_status = status;
    outcome.bytes = content.size();
    return Ok(std::move(outcome));
}

Result<FileOutcome> BackupClient::delete_one(RequestChannel& channel, const std::string& name) {
    if (auto res = channel.send(make_request(RequestCode::Delete, name)); res.is_error()) {
        return Err<FileOutcome>(res.error());
    }

    auto response = channel.receive(RequestCode::Delete);
    if (response.is_error()) {
        return Err<FileOutcome>(response.error());
    }
    if (response.value().status != StatusCode::SuccessNoPayload) {
        return Ok(server_refusal(name, response.value().status));
    }

    FileOutcome outcome;
    outcome.name = name;
    outcome.status = OutcomeStatus::Succeeded;
    outcome.server_status = response.value().status;
    return Ok(std::move(outcome));
}

protocol::RequestMessage BackupClient::make_request(RequestCode code,
                                                    std::string filename,
                                                    std::vector<std::uint8_t> content) const {
    protocol::RequestMessage message;
    message.version = identity_.version;
    message.code = code;
    message.user_id = identity_.user_id;
    message.filename = std::move(filename);
    message.content = std::move(content);
    return message;
}

void BackupClient::fail_operation(OperationReport& report, OperationSession& session, const Error& error) {
    spdlog::error("{} operation failed: {}", to_string(report.kind), error.describe());
    report.fatal_error = error;
    if (auto res = session.mark_failed(error.describe()); res.is_error()) {
        spdlog::error("Could not record failure: {}", res.error().describe());
    }
}

} // namespace bkc::client
