#pragma once

#include "bkc/core/error.hpp"
#include "bkc/protocol/codes.hpp"
#include "bkc/protocol/messages.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bkc::client {

using protocol::FileDescriptor;

enum class OperationKind {
    List,
    Backup,
    Restore,
    Delete
};

enum class OperationState {
    Idle,
    Connected,
    AwaitingResponse,
    Processing,
    Completed,
    Failed
};

enum class OutcomeStatus {
    Succeeded,
    Failed,
    NotAttempted ///< A fatal error ended the operation before this file
};

/**
 * @brief Result for one filename within a batch operation
 */
struct FileOutcome {
    std::string name;
    OutcomeStatus status = OutcomeStatus::NotAttempted;
    std::optional<protocol::StatusCode> server_status; ///< Status the server answered with, if any
    std::optional<Error> error;                         ///< Local or transport failure, if any
    std::uint64_t bytes = 0;                            ///< Content bytes sent or received
};

/**
 * @brief Remote file to restore and where to write it locally
 */
struct RestoreRequest {
    std::string remote_name;
    std::string local_path; ///< Empty means "same as remote_name"
};

/**
 * @brief Everything the caller learns about one operation
 */
struct OperationReport {
    OperationKind kind = OperationKind::List;
    OperationState final_state = OperationState::Idle;
    std::vector<FileOutcome> files;
    std::vector<FileDescriptor> listing;               ///< List only
    std::optional<protocol::StatusCode> server_status; ///< List only: status of the single answer
    std::optional<Error> fatal_error;
    std::uint64_t bytes_sent = 0;     ///< Wire bytes written, headers included
    std::uint64_t bytes_received = 0; ///< Wire bytes read, headers included

    /// False when a fatal error occurred or any file did not succeed.
    [[nodiscard]] bool succeeded() const noexcept;
};

const char* to_string(OperationKind kind) noexcept;
const char* to_string(OperationState state) noexcept;
const char* to_string(OutcomeStatus status) noexcept;

} // namespace bkc::client
