#pragma once

#include "bkc/client/channel.hpp"
#include "bkc/client/file_adapter.hpp"
#include "bkc/client/types.hpp"
#include "bkc/core/result.hpp"
#include "bkc/network/connection.hpp"
#include "bkc/network/endpoint.hpp"
#include "bkc/protocol/codes.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace bkc::client {

struct ClientIdentity {
    std::uint32_t user_id = 0;
    std::uint8_t version = protocol::kProtocolVersion;
};

/**
 * @brief Client side of the backup protocol
 *
 * Every operation opens one connection through the Connector, runs its
 * exchanges strictly one after another and closes the connection before
 * returning. Per-file failures (missing local file, FILE_NOT_FOUND, ...)
 * are recorded and the batch continues; connection, I/O, framing and
 * version errors end the operation and leave remaining files NotAttempted.
 */
class BackupClient {
public:
    BackupClient(network::Endpoint endpoint,
                 ClientIdentity identity,
                 network::Connector& connector,
                 FileAdapter& files,
                 ChannelLimits limits = {});

    OperationReport list_files();

    /// Uploads each path in order; the stored name is the path's file name.
    OperationReport backup(const std::vector<std::string>& paths);

    OperationReport restore(const std::vector<RestoreRequest>& requests);

    OperationReport remove(const std::vector<std::string>& names);

private:
    using FileStep = std::function<Result<FileOutcome>(RequestChannel&, std::size_t)>;

    OperationReport run_batch(OperationKind kind,
                              const std::vector<std::string>& names,
                              const FileStep& step);

    Result<FileOutcome> backup_one(RequestChannel& channel, const std::string& path);
    Result<FileOutcome> restore_one(RequestChannel& channel, const RestoreRequest& request);
    Result<FileOutcome> delete_one(RequestChannel& channel, const std::string& name);

    protocol::RequestMessage make_request(protocol::RequestCode code,
                                          std::string filename,
                                          std::vector<std::uint8_t> content = {}) const;

    static void fail_operation(OperationReport& report, OperationSession& session, const Error& error);

    network::Endpoint endpoint_;
    ClientIdentity identity_;
    network::Connector& connector_;
    FileAdapter& files_;
    ChannelLimits limits_;
};

} // namespace bkc::client
