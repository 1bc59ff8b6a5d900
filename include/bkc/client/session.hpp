#pragma once

#include "bkc/core/result.hpp"
#include "bkc/client/types.hpp"

#include <cstddef>
#include <string>

namespace bkc::client {

/**
 * @brief State machine for one logical operation
 *
 * Idle -> Connected -> AwaitingResponse -> Processing -> (AwaitingResponse ...)
 * ending in Completed or Failed. Failed is reachable from every non-terminal
 * state; terminal states reject any other transition.
 */
class OperationSession {
public:
    explicit OperationSession(OperationKind kind);

    [[nodiscard]] OperationKind kind() const noexcept { return kind_; }
    [[nodiscard]] OperationState state() const noexcept { return state_; }
    [[nodiscard]] const std::string& last_error() const noexcept { return last_error_; }
    [[nodiscard]] std::size_t exchanges() const noexcept { return exchanges_; }
    [[nodiscard]] bool is_terminal() const noexcept {
        return state_ == OperationState::Completed || state_ == OperationState::Failed;
    }

    Result<void> transition_to(OperationState next_state);
    Result<void> mark_failed(std::string error_message);

private:
    [[nodiscard]] bool can_transition(OperationState target) const noexcept;

    OperationKind kind_;
    OperationState state_ = OperationState::Idle;
    std::string last_error_;
    std::size_t exchanges_ = 0;
};

} // namespace bkc::client
