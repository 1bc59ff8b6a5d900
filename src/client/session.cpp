#include "bkc/client/session.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace bkc::client {
namespace {

bool is_progressive(OperationState current, OperationState target) {
    static const std::unordered_map<OperationState, std::vector<OperationState>> transitions {
        {OperationState::Idle, {OperationState::Connected}},
        {OperationState::Connected, {OperationState::AwaitingResponse, OperationState::Completed}},
        {OperationState::AwaitingResponse, {OperationState::Processing}},
        {OperationState::Processing, {OperationState::AwaitingResponse, OperationState::Completed}},
    };

    if (target == OperationState::Failed) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace

OperationSession::OperationSession(OperationKind kind)
    : kind_(kind) {
}

Result<void> OperationSession::transition_to(OperationState next_state) {
    if (state_ == next_state) {
        return Ok();
    }

    if (!can_transition(next_state)) {
        return Fail<void>(ErrorKind::InvalidArgument,
                          std::string("Illegal operation state transition: ") +
                          to_string(state_) + " -> " + to_string(next_state));
    }

    if (next_state == OperationState::AwaitingResponse) {
        ++exchanges_;
    }
    state_ = next_state;
    if (next_state != OperationState::Failed) {
        last_error_.clear();
    }
    return Ok();
}

Result<void> OperationSession::mark_failed(std::string error_message) {
    if (state_ == OperationState::Completed) {
        return Fail<void>(ErrorKind::InvalidArgument, "Operation already completed");
    }
    last_error_ = std::move(error_message);
    return transition_to(OperationState::Failed);
}

bool OperationSession::can_transition(OperationState target) const noexcept {
    if (state_ == target) {
        return true;
    }

    if (is_terminal()) {
        return false;
    }

    return is_progressive(state_, target);
}

} // namespace bkc::client
