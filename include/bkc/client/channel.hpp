#pragma once

#include "bkc/client/session.hpp"
#include "bkc/core/result.hpp"
#include "bkc/network/connection.hpp"
#include "bkc/protocol/messages.hpp"

#include <cstddef>
#include <cstdint>

namespace bkc::client {

struct ChannelLimits {
    std::size_t stream_chunk_size = 4096;           ///< Backup content is written in pieces of this size
    std::uint32_t max_payload_bytes = 1u << 30;     ///< Larger declared payloads are rejected unread
};

/**
 * @brief One request/response exchange at a time over an operation's connection
 *
 * send() moves the session to AwaitingResponse, receive() to Processing.
 * Every response is checked against the expected protocol version before
 * anything past its fixed header is read.
 */
class RequestChannel {
public:
    RequestChannel(network::Connection& connection,
                   OperationSession& session,
                   std::uint8_t expected_version,
                   ChannelLimits limits = {});

    Result<void> send(const protocol::RequestMessage& message);

    Result<protocol::ResponseMessage> receive(protocol::RequestCode answering);

    [[nodiscard]] std::uint64_t bytes_sent() const noexcept { return bytes_sent_; }
    [[nodiscard]] std::uint64_t bytes_received() const noexcept { return bytes_received_; }

private:
    Result<std::vector<std::uint8_t>> read(std::size_t count);

    network::Connection& connection_;
    OperationSession& session_;
    std::uint8_t expected_version_;
    ChannelLimits limits_;
    std::uint64_t bytes_sent_ = 0;
    std::uint64_t bytes_received_ = 0;
};

} // namespace bkc::client
