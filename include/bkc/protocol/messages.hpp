#pragma once

#include "bkc/protocol/codes.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace bkc::protocol {

constexpr std::size_t kRequestHeaderSize = 8;   ///< user_id(4) version(1) op(1) name_len(2)
constexpr std::size_t kResponseHeaderSize = 5;  ///< version(1) status(2) name_len(2)
constexpr std::size_t kSizeFieldSize = 4;
constexpr std::size_t kMaxFilenameLength = 0xFFFF;
constexpr std::uint64_t kMaxContentSize = 0xFFFFFFFFULL;

/**
 * @brief A file as seen by the protocol: name, size and optionally content
 */
struct FileDescriptor {
    std::string name;
    std::uint64_t size = 0;
    std::optional<std::vector<std::uint8_t>> content;
};

inline bool operator==(const FileDescriptor& lhs, const FileDescriptor& rhs) {
    return lhs.name == rhs.name && lhs.size == rhs.size && lhs.content == rhs.content;
}

/**
 * @brief One client request; built per exchange and never modified afterwards
 *
 * `content` is only put on the wire for Backup, preceded by its size.
 */
struct RequestMessage {
    std::uint8_t version = kProtocolVersion;
    RequestCode code = RequestCode::List;
    std::uint32_t user_id = 0;
    std::string filename;
    std::vector<std::uint8_t> content;
};

struct RequestHeader {
    std::uint32_t user_id = 0;
    std::uint8_t version = 0;
    RequestCode code = RequestCode::List;
    std::uint16_t name_length = 0;
};

struct ResponseMessage {
    std::uint8_t version = kProtocolVersion;
    StatusCode status = StatusCode::SuccessNoPayload;
    std::string filename;
    std::vector<std::uint8_t> payload;
};

struct ResponseHeader {
    std::uint8_t version = 0;
    StatusCode status = StatusCode::ServerError;
    std::uint16_t name_length = 0;
};

using FileListing = std::vector<FileDescriptor>;
using FileContent = std::vector<std::uint8_t>;

/// Typed response payload: nothing, a listing (list) or file bytes (restore).
using ResponsePayload = std::variant<std::monostate, FileListing, FileContent>;

} // namespace bkc::protocol
