#include "bkc/protocol/codec.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

using bkc::ErrorKind;
using bkc::protocol::Codec;
using bkc::protocol::FileDescriptor;
using bkc::protocol::FileListing;
using bkc::protocol::RequestCode;
using bkc::protocol::RequestMessage;
using bkc::protocol::ResponseMessage;
using bkc::protocol::StatusCode;

namespace {

std::vector<std::uint8_t> bytes_of(const std::string& text) {
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

RequestMessage make_request(RequestCode code, const std::string& filename, const std::string& content = {}) {
    RequestMessage message;
    message.version = 1;
    message.code = code;
    message.user_id = 0xA1B2C3D4;
    message.filename = filename;
    message.content = bytes_of(content);
    return message;
}

} // namespace

TEST(CodecTest, BackupRequestLayoutIsLittleEndian) {
    auto encoded = Codec::encode_request(make_request(RequestCode::Backup, "a.txt", "hello"));
    ASSERT_TRUE(encoded.is_ok());

    const std::vector<std::uint8_t> expected = {
        0xD4, 0xC3, 0xB2, 0xA1,     // user_id
        0x01,                       // version
        100,                        // op
        0x05, 0x00,                 // name_len
        'a', '.', 't', 'x', 't',
        0x05, 0x00, 0x00, 0x00,     // size
        'h', 'e', 'l', 'l', 'o'
    };
    EXPECT_EQ(encoded.value(), expected);
}

TEST(CodecTest, ListRequestHasEmptyName) {
    auto encoded = Codec::encode_request(make_request(RequestCode::List, ""));
    ASSERT_TRUE(encoded.is_ok());
    ASSERT_EQ(encoded.value().size(), bkc::protocol::kRequestHeaderSize);
    EXPECT_EQ(encoded.value()[5], 202);
    EXPECT_EQ(encoded.value()[6], 0);
    EXPECT_EQ(encoded.value()[7], 0);
}

TEST(CodecTest, RequestHeaderRoundTrip) {
    const std::vector<RequestMessage> messages = {
        make_request(RequestCode::List, ""),
        make_request(RequestCode::Backup, "report.pdf", std::string(300, 'x')),
        make_request(RequestCode::Restore, "demofile.txt"),
        make_request(RequestCode::Delete, std::string(1024, 'n')),
    };

    for (const auto& message : messages) {
        auto encoded = Codec::encode_request(message);
        ASSERT_TRUE(encoded.is_ok());
        auto header = Codec::decode_request_header(encoded.value());
        ASSERT_TRUE(header.is_ok()) << header.error().describe();
        EXPECT_EQ(header.value().code, message.code);
        EXPECT_EQ(header.value().version, message.version);
        EXPECT_EQ(header.value().user_id, message.user_id);
        EXPECT_EQ(header.value().name_length, message.filename.size());
    }
}

TEST(CodecTest, PreambleStopsBeforeContent) {
    const auto message = make_request(RequestCode::Backup, "f", "0123456789");
    auto preamble = Codec::encode_request_preamble(message);
    auto full = Codec::encode_request(message);
    ASSERT_TRUE(preamble.is_ok());
    ASSERT_TRUE(full.is_ok());
    EXPECT_EQ(preamble.value().size() + message.content.size(), full.value().size());
    EXPECT_TRUE(std::equal(preamble.value().begin(), preamble.value().end(), full.value().begin()));
}

TEST(CodecTest, RejectsUnencodableRequests) {
    auto long_name = Codec::encode_request(make_request(RequestCode::Restore, std::string(70000, 'a')));
    ASSERT_TRUE(long_name.is_error());
    EXPECT_EQ(long_name.error().kind, ErrorKind::InvalidArgument);

    auto missing_name = Codec::encode_request(make_request(RequestCode::Delete, ""));
    ASSERT_TRUE(missing_name.is_error());
    EXPECT_EQ(missing_name.error().kind, ErrorKind::InvalidArgument);

    auto content_on_restore = Codec::encode_request(make_request(RequestCode::Restore, "a", "data"));
    EXPECT_TRUE(content_on_restore.is_error());
}

TEST(CodecTest, DecodeRequestHeaderRejectsUnknownCode) {
    std::vector<std::uint8_t> bytes = {1, 0, 0, 0, 1, 99, 0, 0};
    auto header = Codec::decode_request_header(bytes);
    ASSERT_TRUE(header.is_error());
    EXPECT_EQ(header.error().kind, ErrorKind::MalformedMessage);
}

TEST(CodecTest, ResponseHeaderDecodesStatusAndName) {
    ResponseMessage response;
    response.status = StatusCode::FileNotFound;
    response.filename = "missing.bin";
    auto encoded = Codec::encode_response(response);
    ASSERT_TRUE(encoded.is_ok());
    ASSERT_EQ(encoded.value().size(), bkc::protocol::kResponseHeaderSize + response.filename.size());

    auto header = Codec::decode_response_header(encoded.value());
    ASSERT_TRUE(header.is_ok());
    EXPECT_EQ(header.value().version, 1);
    EXPECT_EQ(header.value().status, StatusCode::FileNotFound);
    EXPECT_EQ(header.value().name_length, response.filename.size());
}

TEST(CodecTest, ResponseWithPayloadCarriesSizeField) {
    ResponseMessage response;
    response.status = StatusCode::SuccessFound;
    response.payload = bytes_of("abc");
    auto encoded = Codec::encode_response(response);
    ASSERT_TRUE(encoded.is_ok());

    const std::vector<std::uint8_t> expected = {1, 210, 0, 0, 0, 3, 0, 0, 0, 'a', 'b', 'c'};
    EXPECT_EQ(encoded.value(), expected);
}

TEST(CodecTest, ShortResponseHeaderIsMalformed) {
    auto header = Codec::decode_response_header({1, 212, 0, 0});
    ASSERT_TRUE(header.is_error());
    EXPECT_EQ(header.error().kind, ErrorKind::MalformedMessage);
}

TEST(CodecTest, UnknownStatusIsMalformed) {
    // 0x0309 == 777
    auto header = Codec::decode_response_header({1, 0x09, 0x03, 0, 0});
    ASSERT_TRUE(header.is_error());
    EXPECT_EQ(header.error().kind, ErrorKind::MalformedMessage);
}

TEST(CodecTest, StatusCannotCarryUndeclaredPayload) {
    ResponseMessage response;
    response.status = StatusCode::SuccessNoPayload;
    response.payload = bytes_of("unexpected");
    EXPECT_TRUE(Codec::encode_response(response).is_error());
}

TEST(CodecTest, ListingDecodesInOrder) {
    auto listing = Codec::decode_file_listing(bytes_of("demofile.txt\t120\nmaman14.pdf\t20480\n"));
    ASSERT_TRUE(listing.is_ok()) << listing.error().describe();

    const FileListing expected = {
        FileDescriptor{"demofile.txt", 120, std::nullopt},
        FileDescriptor{"maman14.pdf", 20480, std::nullopt},
    };
    EXPECT_EQ(listing.value(), expected);
}

TEST(CodecTest, ListingToleratesMissingFinalNewlineAndBlankLines) {
    auto listing = Codec::decode_file_listing(bytes_of("a b.txt\t1\r\n\nc\t0"));
    ASSERT_TRUE(listing.is_ok());
    ASSERT_EQ(listing.value().size(), 2u);
    EXPECT_EQ(listing.value()[0].name, "a b.txt");
    EXPECT_EQ(listing.value()[1].size, 0u);
}

TEST(CodecTest, ListingRejectsBadEntries) {
    EXPECT_TRUE(Codec::decode_file_listing(bytes_of("no-size-here\n")).is_error());
    EXPECT_TRUE(Codec::decode_file_listing(bytes_of("file\t12kb\n")).is_error());
    EXPECT_TRUE(Codec::decode_file_listing(bytes_of("\t12\n")).is_error());
}

TEST(CodecTest, EncodedListingDecodesToSameEntries) {
    const FileListing listing = {
        FileDescriptor{"x.bin", 4294967296ULL, std::nullopt},
        FileDescriptor{"y", 7, std::nullopt},
    };
    auto decoded = Codec::decode_file_listing(Codec::encode_file_listing(listing));
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value(), listing);
}

TEST(CodecTest, PayloadShapeFollowsRequest) {
    auto list = Codec::decode_payload(RequestCode::List, StatusCode::SuccessFileList, bytes_of("a\t1\n"));
    ASSERT_TRUE(list.is_ok());
    ASSERT_TRUE(std::holds_alternative<FileListing>(list.value()));

    auto restore = Codec::decode_payload(RequestCode::Restore, StatusCode::SuccessFound, bytes_of("raw"));
    ASSERT_TRUE(restore.is_ok());
    ASSERT_TRUE(std::holds_alternative<bkc::protocol::FileContent>(restore.value()));
    EXPECT_EQ(std::get<bkc::protocol::FileContent>(restore.value()), bytes_of("raw"));

    auto ack = Codec::decode_payload(RequestCode::Backup, StatusCode::SuccessNoPayload, {});
    ASSERT_TRUE(ack.is_ok());
    EXPECT_TRUE(std::holds_alternative<std::monostate>(ack.value()));

    auto failure = Codec::decode_payload(RequestCode::Delete, StatusCode::FileNotFound, {});
    ASSERT_TRUE(failure.is_ok());
    EXPECT_TRUE(std::holds_alternative<std::monostate>(failure.value()));
}

TEST(CodecTest, MismatchedSuccessIsMalformed) {
    auto wrong = Codec::decode_payload(RequestCode::Backup, StatusCode::SuccessFileList, bytes_of("a\t1\n"));
    ASSERT_TRUE(wrong.is_error());
    EXPECT_EQ(wrong.error().kind, ErrorKind::MalformedMessage);
}

TEST(CodecTest, WireCodeMappingIsClosed) {
    EXPECT_EQ(bkc::protocol::request_code_from_wire(201), RequestCode::Delete);
    EXPECT_FALSE(bkc::protocol::request_code_from_wire(0).has_value());
    EXPECT_EQ(bkc::protocol::status_code_from_wire(1002), StatusCode::NoFiles);
    EXPECT_FALSE(bkc::protocol::status_code_from_wire(213).has_value());
}
