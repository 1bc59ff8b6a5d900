#include "bkc/protocol/codec.hpp"

#include <charconv>
#include <string>

namespace bkc::protocol {
namespace {

Result<void> validate_request(const RequestMessage& message) {
    if (message.filename.size() > kMaxFilenameLength) {
        return Fail<void>(ErrorKind::InvalidArgument,
                          "Filename exceeds " + std::to_string(kMaxFilenameLength) + " bytes");
    }
    if (message.code != RequestCode::List && message.filename.empty()) {
        return Fail<void>(ErrorKind::InvalidArgument,
                          std::string(to_string(message.code)) + " request requires a filename");
    }
    if (message.code == RequestCode::Backup) {
        if (message.content.size() > kMaxContentSize) {
            return Fail<void>(ErrorKind::InvalidArgument,
                              "File too large for protocol: " + message.filename);
        }
    } else if (!message.content.empty()) {
        return Fail<void>(ErrorKind::InvalidArgument,
                          std::string(to_string(message.code)) + " request cannot carry content");
    }
    return Ok();
}

} // namespace

Result<std::vector<std::uint8_t>> Codec::encode_request(const RequestMessage& message) {
    auto preamble = encode_request_preamble(message);
    if (preamble.is_error()) {
        return preamble;
    }
    auto& buffer = preamble.value();
    if (message.code == RequestCode::Backup) {
        buffer.insert(buffer.end(), message.content.begin(), message.content.end());
    }
    return preamble;
}

Result<std::vector<std::uint8_t>> Codec::encode_request_preamble(const RequestMessage& message) {
    if (auto valid = validate_request(message); valid.is_error()) {
        return Err<std::vector<std::uint8_t>>(valid.error());
    }

    std::vector<std::uint8_t> buffer;
    buffer.reserve(kRequestHeaderSize + message.filename.size() + kSizeFieldSize);

    write_uint32(buffer, message.user_id);
    write_uint8(buffer, message.version);
    write_uint8(buffer, static_cast<std::uint8_t>(message.code));
    write_uint16(buffer, static_cast<std::uint16_t>(message.filename.size()));
    buffer.insert(buffer.end(), message.filename.begin(), message.filename.end());

    if (message.code == RequestCode::Backup) {
        write_uint32(buffer, static_cast<std::uint32_t>(message.content.size()));
    }
    return Ok(std::move(buffer));
}

Result<RequestHeader> Codec::decode_request_header(const std::vector<std::uint8_t>& bytes) {
    if (bytes.size() < kRequestHeaderSize) {
        return Fail<RequestHeader>(ErrorKind::MalformedMessage,
                                   "Request header needs " + std::to_string(kRequestHeaderSize) +
                                   " bytes, got " + std::to_string(bytes.size()));
    }

    const auto code = request_code_from_wire(bytes[5]);
    if (!code) {
        return Fail<RequestHeader>(ErrorKind::MalformedMessage,
                                   "Unknown request code: " + std::to_string(bytes[5]));
    }

    RequestHeader header;
    header.user_id = read_uint32(bytes, 0);
    header.version = bytes[4];
    header.code = *code;
    header.name_length = read_uint16(bytes, 6);
    return Ok(header);
}

Result<std::vector<std::uint8_t>> Codec::encode_response(const ResponseMessage& message) {
    if (message.filename.size() > kMaxFilenameLength) {
        return Fail<std::vector<std::uint8_t>>(ErrorKind::InvalidArgument, "Filename too long");
    }
    if (!carries_payload(message.status) && !message.payload.empty()) {
        return Fail<std::vector<std::uint8_t>>(
            ErrorKind::InvalidArgument,
            std::string("Status ") + to_string(message.status) + " cannot carry a payload");
    }
    if (message.payload.size() > kMaxContentSize) {
        return Fail<std::vector<std::uint8_t>>(ErrorKind::InvalidArgument, "Payload too large");
    }

    std::vector<std::uint8_t> buffer;
    buffer.reserve(kResponseHeaderSize + message.filename.size() + kSizeFieldSize + message.payload.size());

    write_uint8(buffer, message.version);
    write_uint16(buffer, static_cast<std::uint16_t>(message.status));
    write_uint16(buffer, static_cast<std::uint16_t>(message.filename.size()));
    buffer.insert(buffer.end(), message.filename.begin(), message.filename.end());

    if (carries_payload(message.status)) {
        write_uint32(buffer, static_cast<std::uint32_t>(message.payload.size()));
        buffer.insert(buffer.end(), message.payload.begin(), message.payload.end());
    }
    return Ok(std::move(buffer));
}

Result<ResponseHeader> Codec::decode_response_header(const std::vector<std::uint8_t>& bytes) {
    if (bytes.size() < kResponseHeaderSize) {
        return Fail<ResponseHeader>(ErrorKind::MalformedMessage,
                                    "Response header needs " + std::to_string(kResponseHeaderSize) +
                                    " bytes, got " + std::to_string(bytes.size()));
    }

    const std::uint16_t raw_status = read_uint16(bytes, 1);
    const auto status = status_code_from_wire(raw_status);
    if (!status) {
        return Fail<ResponseHeader>(ErrorKind::MalformedMessage,
                                    "Unknown status code: " + std::to_string(raw_status));
    }

    ResponseHeader header;
    header.version = bytes[0];
    header.status = *status;
    header.name_length = read_uint16(bytes, 3);
    return Ok(header);
}

Result<std::uint32_t> Codec::decode_size_field(const std::vector<std::uint8_t>& bytes) {
    if (bytes.size() < kSizeFieldSize) {
        return Fail<std::uint32_t>(ErrorKind::MalformedMessage, "Truncated size field");
    }
    return Ok(read_uint32(bytes, 0));
}

Result<ResponsePayload> Codec::decode_payload(RequestCode request,
                                              StatusCode status,
                                              const std::vector<std::uint8_t>& payload) {
    if (!answers(request, status)) {
        return Fail<ResponsePayload>(ErrorKind::MalformedMessage,
                                     std::string("Status ") + to_string(status) +
                                     " does not answer a " + to_string(request) + " request");
    }
    if (!carries_payload(status) && !payload.empty()) {
        return Fail<ResponsePayload>(ErrorKind::MalformedMessage,
                                     std::string("Unexpected payload with status ") + to_string(status));
    }

    switch (status) {
        case StatusCode::SuccessFileList: {
            auto listing = decode_file_listing(payload);
            if (listing.is_error()) {
                return Err<ResponsePayload>(listing.error());
            }
            return Ok<ResponsePayload>(std::move(listing.value()));
        }
        case StatusCode::SuccessFound:
            return Ok<ResponsePayload>(FileContent(payload));
        case StatusCode::SuccessNoPayload:
        case StatusCode::FileNotFound:
        case StatusCode::NoFiles:
        case StatusCode::ServerError:
        case StatusCode::VersionMismatch:
            return Ok<ResponsePayload>(std::monostate{});
    }
    return Fail<ResponsePayload>(ErrorKind::MalformedMessage, "Unhandled status");
}

std::vector<std::uint8_t> Codec::encode_file_listing(const FileListing& listing) {
    std::string text;
    for (const auto& file : listing) {
        text += file.name;
        text += '\t';
        text += std::to_string(file.size);
        text += '\n';
    }
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

Result<FileListing> Codec::decode_file_listing(const std::vector<std::uint8_t>& payload) {
    FileListing listing;
    const std::string text(payload.begin(), payload.end());

    std::size_t line_start = 0;
    while (line_start < text.size()) {
        std::size_t line_end = text.find('\n', line_start);
        if (line_end == std::string::npos) {
            line_end = text.size();
        }
        std::string line = text.substr(line_start, line_end - line_start);
        line_start = line_end + 1;

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }

        const auto tab = line.rfind('\t');
        if (tab == std::string::npos || tab == 0 || tab + 1 == line.size()) {
            return Fail<FileListing>(ErrorKind::MalformedMessage, "Malformed listing entry: " + line);
        }

        FileDescriptor file;
        file.name = line.substr(0, tab);
        const char* first = line.data() + tab + 1;
        const char* last = line.data() + line.size();
        const auto [ptr, ec] = std::from_chars(first, last, file.size);
        if (ec != std::errc() || ptr != last) {
            return Fail<FileListing>(ErrorKind::MalformedMessage, "Malformed size in listing entry: " + line);
        }
        listing.push_back(std::move(file));
    }
    return Ok(std::move(listing));
}

void Codec::write_uint8(std::vector<std::uint8_t>& buffer, std::uint8_t value) {
    buffer.push_back(value);
}

void Codec::write_uint16(std::vector<std::uint8_t>& buffer, std::uint16_t value) {
    buffer.push_back(static_cast<std::uint8_t>(value & 0xFF));
    buffer.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
}

void Codec::write_uint32(std::vector<std::uint8_t>& buffer, std::uint32_t value) {
    for (int shift = 0; shift < 32; shift += 8) {
        buffer.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFF));
    }
}

std::uint16_t Codec::read_uint16(const std::vector<std::uint8_t>& buffer, std::size_t offset) {
    return static_cast<std::uint16_t>(buffer[offset] | (buffer[offset + 1] << 8));
}

std::uint32_t Codec::read_uint32(const std::vector<std::uint8_t>& buffer, std::size_t offset) {
    std::uint32_t value = 0;
    for (int i = 3; i >= 0; --i) {
        value = (value << 8) | buffer[offset + static_cast<std::size_t>(i)];
    }
    return value;
}

} // namespace bkc::protocol
