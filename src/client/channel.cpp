#include "bkc/client/channel.hpp"
#include "bkc/protocol/codec.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace bkc::client {

using protocol::Codec;
using protocol::RequestCode;
using protocol::StatusCode;

RequestChannel::RequestChannel(network::Connection& connection,
                               OperationSession& session,
                               std::uint8_t expected_version,
                               ChannelLimits limits)
    : connection_(connection)
    , session_(session)
    , expected_version_(expected_version)
    , limits_(limits) {
    if (limits_.stream_chunk_size == 0) {
        limits_.stream_chunk_size = ChannelLimits{}.stream_chunk_size;
    }
}

Result<void> RequestChannel::send(const protocol::RequestMessage& message) {
    auto preamble = Codec::encode_request_preamble(message);
    if (preamble.is_error()) {
        return Err<void>(preamble.error());
    }

    if (auto res = session_.transition_to(OperationState::AwaitingResponse); res.is_error()) {
        return res;
    }

    spdlog::debug("Sending {} request for '{}' ({} header bytes)",
                  protocol::to_string(message.code), message.filename, preamble.value().size());

    if (auto res = connection_.send_exact(preamble.value()); res.is_error()) {
        return res;
    }
    bytes_sent_ += preamble.value().size();

    if (message.code != RequestCode::Backup) {
        return Ok();
    }

    const auto& content = message.content;
    std::size_t offset = 0;
    while (offset < content.size()) {
        const std::size_t chunk = std::min(limits_.stream_chunk_size, content.size() - offset);
        if (auto res = connection_.send_exact(content.data() + offset, chunk); res.is_error()) {
            return Fail<void>(res.error().kind,
                              res.error().message + " (after " + std::to_string(offset) +
                              " of " + std::to_string(content.size()) + " content bytes)");
        }
        offset += chunk;
        bytes_sent_ += chunk;
    }
    return Ok();
}

Result<protocol::ResponseMessage> RequestChannel::receive(RequestCode answering) {
    auto header_bytes = read(protocol::kResponseHeaderSize);
    if (header_bytes.is_error()) {
        return Err<protocol::ResponseMessage>(header_bytes.error());
    }

    // The version byte comes first; a server on another version may use other status codes.
    const std::uint8_t version = header_bytes.value()[0];
    if (version != expected_version_) {
        return Fail<protocol::ResponseMessage>(
            ErrorKind::VersionMismatch,
            "Server answered with protocol version " + std::to_string(version) +
            ", expected " + std::to_string(expected_version_));
    }

    auto header = Codec::decode_response_header(header_bytes.value());
    if (header.is_error()) {
        return Err<protocol::ResponseMessage>(header.error());
    }

    const auto& head = header.value();
    if (head.status == StatusCode::VersionMismatch) {
        return Fail<protocol::ResponseMessage>(
            ErrorKind::VersionMismatch,
            "Server rejected protocol version " + std::to_string(expected_version_));
    }
    if (!protocol::answers(answering, head.status)) {
        return Fail<protocol::ResponseMessage>(
            ErrorKind::MalformedMessage,
            std::string("Status ") + protocol::to_string(head.status) +
            " does not answer a " + protocol::to_string(answering) + " request");
    }

    protocol::ResponseMessage response;
    response.version = head.version;
    response.status = head.status;

    if (head.name_length > 0) {
        auto name = read(head.name_length);
        if (name.is_error()) {
            return Err<protocol::ResponseMessage>(name.error());
        }
        response.filename.assign(name.value().begin(), name.value().end());
    }

    if (protocol::carries_payload(head.status)) {
        auto size_bytes = read(protocol::kSizeFieldSize);
        if (size_bytes.is_error()) {
            return Err<protocol::ResponseMessage>(size_bytes.error());
        }
        auto size = Codec::decode_size_field(size_bytes.value());
        if (size.is_error()) {
            return Err<protocol::ResponseMessage>(size.error());
        }
        if (size.value() > limits_.max_payload_bytes) {
            return Fail<protocol::ResponseMessage>(
                ErrorKind::MalformedMessage,
                "Declared payload of " + std::to_string(size.value()) +
                " bytes exceeds limit of " + std::to_string(limits_.max_payload_bytes));
        }
        auto payload = read(size.value());
        if (payload.is_error()) {
            return Err<protocol::ResponseMessage>(payload.error());
        }
        response.payload = std::move(payload.value());
    }

    if (auto res = session_.transition_to(OperationState::Processing); res.is_error()) {
        return Err<protocol::ResponseMessage>(res.error());
    }

    spdlog::debug("Received {} for {} request ({} payload bytes)",
                  protocol::to_string(response.status), protocol::to_string(answering),
                  response.payload.size());
    return Ok(std::move(response));
}

Result<std::vector<std::uint8_t>> RequestChannel::read(std::size_t count) {
    auto bytes = connection_.recv_exact(count);
    if (bytes.is_ok()) {
        bytes_received_ += bytes.value().size();
    }
    return bytes;
}

} // namespace bkc::client
