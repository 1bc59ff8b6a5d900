#include "bkc/client/types.hpp"

namespace bkc::client {

bool OperationReport::succeeded() const noexcept {
    if (fatal_error.has_value() || final_state != OperationState::Completed) {
        return false;
    }
    for (const auto& file : files) {
        if (file.status != OutcomeStatus::Succeeded) {
            return false;
        }
    }
    return true;
}

const char* to_string(OperationKind kind) noexcept {
    switch (kind) {
        case OperationKind::List: return "list";
        case OperationKind::Backup: return "backup";
        case OperationKind::Restore: return "restore";
        case OperationKind::Delete: return "delete";
    }
    return "unknown";
}

const char* to_string(OperationState state) noexcept {
    switch (state) {
        case OperationState::Idle: return "idle";
        case OperationState::Connected: return "connected";
        case OperationState::AwaitingResponse: return "awaiting-response";
        case OperationState::Processing: return "processing";
        case OperationState::Completed: return "completed";
        case OperationState::Failed: return "failed";
    }
    return "unknown";
}

const char* to_string(OutcomeStatus status) noexcept {
    switch (status) {
        case OutcomeStatus::Succeeded: return "succeeded";
        case OutcomeStatus::Failed: return "failed";
        case OutcomeStatus::NotAttempted: return "not-attempted";
    }
    return "unknown";
}

} // namespace bkc::client
