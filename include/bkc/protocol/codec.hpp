#pragma once

/**
 * @file codec.hpp
 * @brief Byte-exact encoding of backup protocol messages
 *
 * BINARY FORMAT (all integers little-endian):
 *
 * Request:
 * [user_id: 4] [version: 1] [op: 1] [name_len: 2] [filename: name_len]
 * Backup only: [size: 4] [content: size]
 *
 * Response:
 * [version: 1] [status: 2] [name_len: 2] [filename: name_len]
 * Statuses 210/211 only: [size: 4] [payload: size]
 *
 * List payload is text, one "<name>\t<size>\n" line per stored file.
 */

#include "bkc/core/result.hpp"
#include "bkc/protocol/messages.hpp"

#include <cstdint>
#include <vector>

namespace bkc::protocol {

class Codec {
public:
    /// Full request including Backup content.
    static Result<std::vector<std::uint8_t>> encode_request(const RequestMessage& message);

    /// Request without Backup content; the size field is still included so
    /// content can be streamed right after.
    static Result<std::vector<std::uint8_t>> encode_request_preamble(const RequestMessage& message);

    static Result<RequestHeader> decode_request_header(const std::vector<std::uint8_t>& bytes);

    static Result<std::vector<std::uint8_t>> encode_response(const ResponseMessage& message);

    static Result<ResponseHeader> decode_response_header(const std::vector<std::uint8_t>& bytes);

    static Result<std::uint32_t> decode_size_field(const std::vector<std::uint8_t>& bytes);

    /**
     * Interpret a response payload according to the request it answers.
     *
     * @return listing for List, bytes for Restore, monostate for acks and
     *         failure statuses; MalformedMessage when `status` is a success
     *         the request cannot receive.
     */
    static Result<ResponsePayload> decode_payload(RequestCode request,
                                                  StatusCode status,
                                                  const std::vector<std::uint8_t>& payload);

    static std::vector<std::uint8_t> encode_file_listing(const FileListing& listing);
    static Result<FileListing> decode_file_listing(const std::vector<std::uint8_t>& payload);

private:
    static void write_uint8(std::vector<std::uint8_t>& buffer, std::uint8_t value);
    static void write_uint16(std::vector<std::uint8_t>& buffer, std::uint16_t value);
    static void write_uint32(std::vector<std::uint8_t>& buffer, std::uint32_t value);

    static std::uint16_t read_uint16(const std::vector<std::uint8_t>& buffer, std::size_t offset);
    static std::uint32_t read_uint32(const std::vector<std::uint8_t>& buffer, std::size_t offset);
};

} // namespace bkc::protocol
