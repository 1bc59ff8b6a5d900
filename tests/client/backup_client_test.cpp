#include "bkc/client/backup_client.hpp"
#include "bkc/protocol/codec.hpp"
#include "support/scripted_connection.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

using bkc::ErrorKind;
using bkc::client::BackupClient;
using bkc::client::ChannelLimits;
using bkc::client::ClientIdentity;
using bkc::client::OperationState;
using bkc::client::OutcomeStatus;
using bkc::client::RestoreRequest;
using bkc::protocol::Codec;
using bkc::protocol::FileDescriptor;
using bkc::protocol::RequestCode;
using bkc::protocol::StatusCode;
using bkc::testing::bytes_of;
using bkc::testing::captured_requests;
using bkc::testing::MemoryFileAdapter;
using bkc::testing::queue_status;
using bkc::testing::ScriptedConnector;
using bkc::testing::ScriptState;

namespace {

constexpr std::uint32_t kUserId = 342725405;

class BackupClientTest : public ::testing::Test {
protected:
    BackupClientTest()
        : state_(std::make_shared<ScriptState>())
        , connector_(state_) {}

    BackupClient make_client(ChannelLimits limits = {}) {
        ClientIdentity identity;
        identity.user_id = kUserId;
        return BackupClient({"127.0.0.1", 1234}, identity, connector_, files_, limits);
    }

    void expect_closed() const {
        EXPECT_FALSE(state_->open);
        EXPECT_EQ(state_->close_calls, state_->connects);
    }

    std::shared_ptr<ScriptState> state_;
    ScriptedConnector connector_;
    MemoryFileAdapter files_;
};

} // namespace

TEST_F(BackupClientTest, ListReturnsServerListingInOrder) {
    const std::vector<FileDescriptor> expected = {
        FileDescriptor{"demofile.txt", 120, std::nullopt},
        FileDescriptor{"maman14.pdf", 20480, std::nullopt},
    };
    queue_status(*state_, StatusCode::SuccessFileList, Codec::encode_file_listing(expected));

    auto client = make_client();
    const auto report = client.list_files();

    EXPECT_TRUE(report.succeeded());
    EXPECT_EQ(report.final_state, OperationState::Completed);
    EXPECT_EQ(report.listing, expected);
    EXPECT_TRUE(report.files.empty());

    const auto requests = captured_requests(state_->outbound);
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].header.code, RequestCode::List);
    EXPECT_EQ(requests[0].header.user_id, kUserId);
    EXPECT_EQ(requests[0].header.version, bkc::protocol::kProtocolVersion);
    EXPECT_TRUE(requests[0].filename.empty());
    expect_closed();
}

TEST_F(BackupClientTest, ListWithNoFilesIsEmptySuccess) {
    queue_status(*state_, StatusCode::NoFiles);

    auto client = make_client();
    const auto report = client.list_files();

    EXPECT_TRUE(report.succeeded());
    EXPECT_TRUE(report.listing.empty());
    EXPECT_EQ(report.server_status, StatusCode::NoFiles);
}

TEST_F(BackupClientTest, ListServerErrorFailsOperation) {
    queue_status(*state_, StatusCode::ServerError);

    auto client = make_client();
    const auto report = client.list_files();

    EXPECT_FALSE(report.succeeded());
    EXPECT_EQ(report.final_state, OperationState::Failed);
    ASSERT_TRUE(report.fatal_error.has_value());
    EXPECT_EQ(report.fatal_error->kind, ErrorKind::ServerStatus);
    EXPECT_EQ(report.server_status, StatusCode::ServerError);
    expect_closed();
}

TEST_F(BackupClientTest, BackupContinuesPastUnreadableFile) {
    files_.put("docs/first.txt", "first file");
    files_.put("docs/second.txt", "second file");
    files_.put("docs/third.bin", std::string(9000, 'z'));
    files_.unreadable.insert("docs/second.txt");
    queue_status(*state_, StatusCode::SuccessNoPayload);
    queue_status(*state_, StatusCode::SuccessNoPayload);

    auto client = make_client();
    const auto report = client.backup({"docs/first.txt", "docs/second.txt", "docs/third.bin"});

    ASSERT_EQ(report.files.size(), 3u);
    EXPECT_EQ(report.files[0].status, OutcomeStatus::Succeeded);
    EXPECT_EQ(report.files[1].status, OutcomeStatus::Failed);
    ASSERT_TRUE(report.files[1].error.has_value());
    EXPECT_EQ(report.files[1].error->kind, ErrorKind::FileAccess);
    EXPECT_EQ(report.files[2].status, OutcomeStatus::Succeeded);
    EXPECT_EQ(report.files[2].bytes, 9000u);

    EXPECT_FALSE(report.succeeded());
    EXPECT_FALSE(report.fatal_error.has_value());
    EXPECT_EQ(report.final_state, OperationState::Completed);
    EXPECT_EQ(state_->connects, 1);

    const auto requests = captured_requests(state_->outbound);
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].header.code, RequestCode::Backup);
    EXPECT_EQ(requests[0].filename, "first.txt");
    EXPECT_EQ(requests[0].content, bytes_of("first file"));
    EXPECT_EQ(requests[1].filename, "third.bin");
    EXPECT_EQ(requests[1].content, bytes_of(std::string(9000, 'z')));
    expect_closed();
}

TEST_F(BackupClientTest, BrokenSendAbortsRemainingFiles) {
    files_.put("a.txt", "0123456789");
    files_.put("b.bin", std::string(10000, 'b'));
    files_.put("c.txt", "never sent");
    queue_status(*state_, StatusCode::SuccessNoPayload);

    bkc::protocol::RequestMessage first;
    first.code = RequestCode::Backup;
    first.user_id = kUserId;
    first.filename = "a.txt";
    first.content = bytes_of("0123456789");
    const std::size_t first_request_size = Codec::encode_request(first).value().size();
    state_->fail_send_after = first_request_size + 500;

    auto client = make_client();
    const auto report = client.backup({"a.txt", "b.bin", "c.txt"});

    ASSERT_EQ(report.files.size(), 3u);
    EXPECT_EQ(report.files[0].status, OutcomeStatus::Succeeded);
    EXPECT_EQ(report.files[1].status, OutcomeStatus::Failed);
    ASSERT_TRUE(report.files[1].error.has_value());
    EXPECT_EQ(report.files[1].error->kind, ErrorKind::Io);
    EXPECT_EQ(report.files[2].status, OutcomeStatus::NotAttempted);

    EXPECT_FALSE(report.succeeded());
    ASSERT_TRUE(report.fatal_error.has_value());
    EXPECT_EQ(report.fatal_error->kind, ErrorKind::Io);
    EXPECT_EQ(report.final_state, OperationState::Failed);
    EXPECT_EQ(state_->outbound.size(), first_request_size + 500);
    expect_closed();
}

TEST_F(BackupClientTest, VersionMismatchStopsFurtherRequests) {
    queue_status(*state_, StatusCode::SuccessNoPayload, {}, 2);
    queue_status(*state_, StatusCode::SuccessNoPayload, {}, 2);

    auto client = make_client();
    const auto report = client.remove({"one.txt", "two.txt"});

    ASSERT_TRUE(report.fatal_error.has_value());
    EXPECT_EQ(report.fatal_error->kind, ErrorKind::VersionMismatch);
    EXPECT_EQ(report.final_state, OperationState::Failed);
    EXPECT_EQ(report.files[0].status, OutcomeStatus::Failed);
    EXPECT_EQ(report.files[1].status, OutcomeStatus::NotAttempted);

    const auto requests = captured_requests(state_->outbound);
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].filename, "one.txt");
    EXPECT_EQ(state_->outbound.size(), bkc::protocol::kRequestHeaderSize + std::string("one.txt").size());
    expect_closed();
}

TEST_F(BackupClientTest, VersionMismatchStatusIsFatal) {
    queue_status(*state_, StatusCode::VersionMismatch);

    auto client = make_client();
    const auto report = client.list_files();

    ASSERT_TRUE(report.fatal_error.has_value());
    EXPECT_EQ(report.fatal_error->kind, ErrorKind::VersionMismatch);
    EXPECT_FALSE(report.succeeded());
}

TEST_F(BackupClientTest, DeleteOfMissingFileIsPerFileFailure) {
    queue_status(*state_, StatusCode::FileNotFound);

    auto client = make_client();
    const auto report = client.remove({"ghost.txt"});

    ASSERT_EQ(report.files.size(), 1u);
    EXPECT_EQ(report.files[0].status, OutcomeStatus::Failed);
    EXPECT_EQ(report.files[0].server_status, StatusCode::FileNotFound);
    EXPECT_FALSE(report.files[0].error.has_value());
    EXPECT_FALSE(report.fatal_error.has_value());
    EXPECT_FALSE(report.succeeded());
    EXPECT_EQ(report.final_state, OperationState::Completed);
    expect_closed();
}

TEST_F(BackupClientTest, DeleteBatchContinuesAfterNotFound) {
    queue_status(*state_, StatusCode::FileNotFound);
    queue_status(*state_, StatusCode::SuccessNoPayload);

    auto client = make_client();
    const auto report = client.remove({"missing", "present"});

    ASSERT_EQ(report.files.size(), 2u);
    EXPECT_EQ(report.files[0].status, OutcomeStatus::Failed);
    EXPECT_EQ(report.files[1].status, OutcomeStatus::Succeeded);

    const auto requests = captured_requests(state_->outbound);
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[1].header.code, RequestCode::Delete);
    EXPECT_EQ(requests[1].filename, "present");
}

TEST_F(BackupClientTest, RestoreWritesContentToAlternateTarget) {
    queue_status(*state_, StatusCode::SuccessFound, bytes_of("restored bytes"));

    auto client = make_client();
    const auto report = client.restore({RestoreRequest{"demofile.txt", "tmp"}});

    EXPECT_TRUE(report.succeeded());
    EXPECT_EQ(report.files[0].bytes, 14u);
    ASSERT_EQ(files_.files.count("tmp"), 1u);
    EXPECT_EQ(files_.files["tmp"], bytes_of("restored bytes"));
    EXPECT_EQ(files_.files.count("demofile.txt"), 0u);

    const auto requests = captured_requests(state_->outbound);
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].header.code, RequestCode::Restore);
    EXPECT_EQ(requests[0].filename, "demofile.txt");
}

TEST_F(BackupClientTest, RestoreDefaultsTargetToRemoteName) {
    queue_status(*state_, StatusCode::SuccessFound, {});

    auto client = make_client();
    const auto report = client.restore({RestoreRequest{"empty.txt", {}}});

    EXPECT_TRUE(report.succeeded());
    ASSERT_EQ(files_.files.count("empty.txt"), 1u);
    EXPECT_TRUE(files_.files["empty.txt"].empty());
}

TEST_F(BackupClientTest, RestoreNotFoundDoesNotAbortLaterFiles) {
    queue_status(*state_, StatusCode::FileNotFound);
    queue_status(*state_, StatusCode::SuccessFound, bytes_of("second"));

    auto client = make_client();
    const auto report = client.restore({RestoreRequest{"gone", {}}, RestoreRequest{"here", {}}});

    ASSERT_EQ(report.files.size(), 2u);
    EXPECT_EQ(report.files[0].status, OutcomeStatus::Failed);
    EXPECT_EQ(report.files[0].server_status, StatusCode::FileNotFound);
    EXPECT_EQ(report.files[1].status, OutcomeStatus::Succeeded);
    EXPECT_EQ(files_.files["here"], bytes_of("second"));
    EXPECT_EQ(report.final_state, OperationState::Completed);
}

TEST_F(BackupClientTest, RestoreWriteFailureIsPerFile) {
    files_.unwritable.insert("locked");
    queue_status(*state_, StatusCode::SuccessFound, bytes_of("one"));
    queue_status(*state_, StatusCode::SuccessFound, bytes_of("two"));

    auto client = make_client();
    const auto report = client.restore({RestoreRequest{"a", "locked"}, RestoreRequest{"b", {}}});

    EXPECT_EQ(report.files[0].status, OutcomeStatus::Failed);
    ASSERT_TRUE(report.files[0].error.has_value());
    EXPECT_EQ(report.files[0].error->kind, ErrorKind::FileAccess);
    EXPECT_EQ(report.files[1].status, OutcomeStatus::Succeeded);
    EXPECT_FALSE(report.fatal_error.has_value());
}

TEST_F(BackupClientTest, ConnectFailureLeavesFilesNotAttempted) {
    connector_.connect_error = bkc::Error(ErrorKind::Connection, "Connection refused");

    auto client = make_client();
    const auto report = client.remove({"a", "b"});

    ASSERT_TRUE(report.fatal_error.has_value());
    EXPECT_EQ(report.fatal_error->kind, ErrorKind::Connection);
    EXPECT_EQ(report.final_state, OperationState::Failed);
    ASSERT_EQ(report.files.size(), 2u);
    EXPECT_EQ(report.files[0].status, OutcomeStatus::NotAttempted);
    EXPECT_EQ(report.files[1].status, OutcomeStatus::NotAttempted);
    EXPECT_TRUE(state_->outbound.empty());
}

TEST_F(BackupClientTest, TruncatedResponseIsFatal) {
    files_.put("a.txt", "abc");
    files_.put("b.txt", "def");
    state_->inbound = {1, 212};

    auto client = make_client();
    const auto report = client.backup({"a.txt", "b.txt"});

    ASSERT_TRUE(report.fatal_error.has_value());
    EXPECT_EQ(report.fatal_error->kind, ErrorKind::Io);
    EXPECT_EQ(report.files[0].status, OutcomeStatus::Failed);
    EXPECT_EQ(report.files[1].status, OutcomeStatus::NotAttempted);
    EXPECT_EQ(captured_requests(state_->outbound).size(), 1u);
    expect_closed();
}

TEST_F(BackupClientTest, UnknownStatusIsMalformed) {
    // status 0x0309 is not part of the protocol
    state_->inbound = {1, 0x09, 0x03, 0, 0};

    auto client = make_client();
    const auto report = client.remove({"a"});

    ASSERT_TRUE(report.fatal_error.has_value());
    EXPECT_EQ(report.fatal_error->kind, ErrorKind::MalformedMessage);
}

TEST_F(BackupClientTest, SuccessForWrongRequestIsMalformed) {
    files_.put("a.txt", "abc");
    queue_status(*state_, StatusCode::SuccessFileList, Codec::encode_file_listing({}));

    auto client = make_client();
    const auto report = client.backup({"a.txt"});

    ASSERT_TRUE(report.fatal_error.has_value());
    EXPECT_EQ(report.fatal_error->kind, ErrorKind::MalformedMessage);
    EXPECT_EQ(report.final_state, OperationState::Failed);
}

TEST_F(BackupClientTest, OversizedPayloadIsRejectedUnread) {
    queue_status(*state_, StatusCode::SuccessFound, std::vector<std::uint8_t>(100, 0x42));

    ChannelLimits limits;
    limits.max_payload_bytes = 16;
    auto client = make_client(limits);
    const auto report = client.restore({RestoreRequest{"big", {}}});

    ASSERT_TRUE(report.fatal_error.has_value());
    EXPECT_EQ(report.fatal_error->kind, ErrorKind::MalformedMessage);
    EXPECT_TRUE(files_.files.empty());
}

TEST_F(BackupClientTest, EachOperationUsesItsOwnConnection) {
    queue_status(*state_, StatusCode::NoFiles);
    queue_status(*state_, StatusCode::SuccessNoPayload);

    auto client = make_client();
    EXPECT_TRUE(client.list_files().succeeded());
    EXPECT_TRUE(client.remove({"x"}).succeeded());

    EXPECT_EQ(state_->connects, 2);
    EXPECT_EQ(state_->close_calls, 2);
}

TEST_F(BackupClientTest, EmptyBatchCompletesWithoutRequests) {
    auto client = make_client();
    const auto report = client.backup({});

    EXPECT_TRUE(report.succeeded());
    EXPECT_EQ(report.final_state, OperationState::Completed);
    EXPECT_TRUE(state_->outbound.empty());
    expect_closed();
}

TEST_F(BackupClientTest, ForeignVersionIsMismatchEvenWithUnknownStatus) {
    // version 2 and a status outside the v1 set
    state_->inbound = {2, 0x09, 0x03, 0, 0};

    auto client = make_client();
    const auto report = client.remove({"a", "b"});

    ASSERT_TRUE(report.fatal_error.has_value());
    EXPECT_EQ(report.fatal_error->kind, ErrorKind::VersionMismatch);
    EXPECT_EQ(report.files[1].status, OutcomeStatus::NotAttempted);
    EXPECT_EQ(captured_requests(state_->outbound).size(), 1u);
}

TEST_F(BackupClientTest, ReportCountsWireBytes) {
    files_.put("a.txt", "0123456789");
    files_.put("b.txt", std::string(5000, 'q'));
    queue_status(*state_, StatusCode::SuccessNoPayload);
    queue_status(*state_, StatusCode::SuccessNoPayload);

    auto client = make_client();
    const auto report = client.backup({"a.txt", "b.txt"});

    ASSERT_TRUE(report.succeeded());
    EXPECT_EQ(report.bytes_sent, state_->outbound.size());
    EXPECT_EQ(report.bytes_received, state_->inbound.size());
    EXPECT_EQ(report.bytes_received, 2 * bkc::protocol::kResponseHeaderSize);
}

TEST_F(BackupClientTest, ListReportCountsPayloadBytes) {
    queue_status(*state_, StatusCode::SuccessFileList,
                 Codec::encode_file_listing({FileDescriptor{"x.bin", 3, std::nullopt}}));

    auto client = make_client();
    const auto report = client.list_files();

    ASSERT_TRUE(report.succeeded());
    EXPECT_EQ(report.bytes_received, state_->inbound.size());
    EXPECT_EQ(report.bytes_sent, bkc::protocol::kRequestHeaderSize);
}
