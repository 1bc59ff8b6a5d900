#include "bkc/client/report.hpp"

#include <sstream>

namespace bkc::client {

using json = nlohmann::json;

namespace {

json error_to_json(const Error& error) {
    return json{{"kind", to_string(error.kind)}, {"message", error.message}};
}

json outcome_to_json(const FileOutcome& outcome) {
    json j;
    j["name"] = outcome.name;
    j["status"] = to_string(outcome.status);
    j["bytes"] = outcome.bytes;
    if (outcome.server_status) {
        j["server_status"] = protocol::to_string(*outcome.server_status);
    }
    if (outcome.error) {
        j["error"] = error_to_json(*outcome.error);
    }
    return j;
}

} // namespace

json report_to_json(const OperationReport& report) {
    json j;
    j["operation"] = to_string(report.kind);
    j["state"] = to_string(report.final_state);
    j["succeeded"] = report.succeeded();

    json files = json::array();
    for (const auto& outcome : report.files) {
        files.push_back(outcome_to_json(outcome));
    }
    j["files"] = std::move(files);
    j["bytes_sent"] = report.bytes_sent;
    j["bytes_received"] = report.bytes_received;

    if (report.kind == OperationKind::List) {
        json listing = json::array();
        for (const auto& file : report.listing) {
            listing.push_back(json{{"name", file.name}, {"size", file.size}});
        }
        j["listing"] = std::move(listing);
    }
    if (report.server_status) {
        j["server_status"] = protocol::to_string(*report.server_status);
    }
    if (report.fatal_error) {
        j["error"] = error_to_json(*report.fatal_error);
    }
    return j;
}

std::string format_report(const OperationReport& report) {
    std::ostringstream out;
    out << "--- " << to_string(report.kind) << " (" << to_string(report.final_state) << ") ---\n";

    if (report.kind == OperationKind::List) {
        if (report.listing.empty() && !report.fatal_error) {
            out << "No files stored on the server.\n";
        }
        for (const auto& file : report.listing) {
            out << "  " << file.name << "  " << file.size << " bytes\n";
        }
    }

    for (const auto& outcome : report.files) {
        out << "  " << outcome.name << ": " << to_string(outcome.status);
        if (outcome.server_status && outcome.status != OutcomeStatus::Succeeded) {
            out << " [" << protocol::to_string(*outcome.server_status) << "]";
        }
        if (outcome.error) {
            out << " (" << outcome.error->describe() << ")";
        }
        out << "\n";
    }

    if (report.fatal_error) {
        out << "Operation aborted: " << report.fatal_error->describe() << "\n";
    }
    out << (report.succeeded() ? "Result: success" : "Result: failure") << "\n";
    return out.str();
}

} // namespace bkc::client
