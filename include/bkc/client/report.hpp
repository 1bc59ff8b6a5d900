#pragma once

#include "bkc/client/types.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace bkc::client {

/**
 * @brief JSON view of an operation report
 *
 * {"operation": "backup", "state": "completed", "succeeded": false,
 *  "files": [{"name": ..., "status": ..., "server_status": ..., "error": ..., "bytes": ...}],
 *  "listing": [{"name": ..., "size": ...}], "error": {...}}
 */
nlohmann::json report_to_json(const OperationReport& report);

/// One line per file, as printed by the command line client.
std::string format_report(const OperationReport& report);

} // namespace bkc::client
