#include "fakes.hpp"
#include "webxfer/helpers.hpp"
#include "webxfer/transfer_service.hpp"
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace webxfer;

class TransferServiceTest : public ::testing::Test {
protected:
    TimerQueue timers;
    std::shared_ptr<FakeConnection> connection = std::make_shared<FakeConnection>();
    std::shared_ptr<FakeConnection> other = std::make_shared<FakeConnection>();
    int lookups = 0;
    std::unique_ptr<TransferService> service;

    struct Stream {
        std::vector<DownloadChunk> chunks;
        std::optional<TransferCompletion> completion;
        std::optional<Error> error;
    };

    static SftpConfig make_config() {
        SftpConfig c;
        c.enabled = true;
        c.chunk_size = 1024;
        c.max_concurrent_transfers = 2;
        return c;
    }

    void SetUp() override {
        this->start(make_config());
    }

    void start(const SftpConfig &config) {
        this->service.reset();
        this->service = std::make_unique<TransferService>(config,
            [this](const std::string &id) -> std::shared_ptr<RemoteConnection> {
                this->lookups++;
                if (id == "c1") {
                    return this->connection;
                }
                if (id == "c2") {
                    return this->other;
                }
                return nullptr;
            },
            timers);
    }

    UploadStartRequest upload(const std::string &path, const std::uint64_t &size, const std::string &id = "", const std::string &session = "s1") const {
        UploadStartRequest request;
        request.transfer_id = id;
        request.session_id = session;
        request.connection_id = "c1";
        request.remote_path = path;
        request.file_name = path.substr(path.find_last_of('/') + 1);
        request.file_size = size;
        return request;
    }

    std::string startUpload(const std::string &path, const std::uint64_t &size, const std::string &session = "s1") {
        Capture<UploadReady> ready;
        service->startUpload(upload(path, size, "", session), ready.callback());
        EXPECT_TRUE(ready.ok());
        return ready.ok() ? ready.value->unwrap().transfer_id : "";
    }

    DownloadCallbacks callbacks(Stream &stream) {
        DownloadCallbacks cb;
        cb.on_chunk = [&stream](const DownloadChunk &chunk) { stream.chunks.push_back(chunk); };
        cb.on_progress = [](const TransferProgress &) {};
        cb.on_complete = [&stream](const TransferCompletion &completion) { stream.completion = completion; };
        cb.on_error = [&stream](const Error &error) { stream.error = error; };
        return cb;
    }
};

TEST_F(TransferServiceTest, TraversalIsRejectedBeforeAnyLookup) {
    const std::string path = "../../etc/passwd";
    const OperationContext ctx{"c1", "s1"};

    Capture<DirectoryListing> listed;
    service->listDirectory(ctx, path, false, listed.callback());
    Capture<StatResult> stat;
    service->stat(ctx, path, stat.callback());
    Capture<OperationResult> made;
    service->mkdir(ctx, path, std::nullopt, made.callback());
    Capture<OperationResult> removed;
    service->deletePath(ctx, path, true, removed.callback());
    Capture<UploadReady> uploaded;
    service->startUpload(upload(path, 10), uploaded.callback());
    Capture<DownloadReady> downloaded;
    Stream stream;
    service->startDownload(DownloadStartRequest{"", "s1", "c1", path}, downloaded.callback(), callbacks(stream));

    ASSERT_TRUE(listed.value);
    EXPECT_EQ(listed.code(), ErrorCode::InvalidRequest);
    EXPECT_EQ(listed.value->error().reason, "PATH_TRAVERSAL");
    EXPECT_EQ(stat.code(), ErrorCode::InvalidRequest);
    EXPECT_EQ(made.code(), ErrorCode::InvalidRequest);
    EXPECT_EQ(removed.code(), ErrorCode::InvalidRequest);
    EXPECT_EQ(uploaded.code(), ErrorCode::InvalidRequest);
    EXPECT_EQ(uploaded.value->error().reason, "PATH_TRAVERSAL");
    EXPECT_EQ(downloaded.code(), ErrorCode::InvalidRequest);
    EXPECT_TRUE(stream.chunks.empty());
    EXPECT_EQ(lookups, 0);
    EXPECT_EQ(service->activeTransfers(), 0u);
}

TEST_F(TransferServiceTest, DisabledServiceAnswersNotEnabled) {
    SftpConfig config = make_config();
    config.enabled = false;
    start(config);

    Capture<DirectoryListing> listed;
    service->listDirectory(OperationContext{"c1", "s1"}, "/", false, listed.callback());
    ASSERT_TRUE(listed.value);
    EXPECT_EQ(listed.code(), ErrorCode::NotEnabled);

    Capture<UploadReady> uploaded;
    service->startUpload(upload("/tmp/a.txt", 1), uploaded.callback());
    EXPECT_EQ(uploaded.code(), ErrorCode::NotEnabled);
    EXPECT_EQ(lookups, 0);
}

TEST_F(TransferServiceTest, HomeAllowlistConfinesRequests) {
    SftpConfig config = make_config();
    config.allowed_paths = std::vector<std::string>{"~"};
    start(config);
    connection->sftp->addDir("/home/alice/docs");

    Capture<DirectoryListing> outside;
    service->listDirectory(OperationContext{"c1", "s1"}, "/etc", false, outside.callback());
    ASSERT_TRUE(outside.value);
    EXPECT_EQ(outside.code(), ErrorCode::PathForbidden);
    EXPECT_EQ(lookups, 0);

    Capture<DirectoryListing> inside;
    service->listDirectory(OperationContext{"c1", "s1"}, "~/docs", false, inside.callback());
    ASSERT_TRUE(inside.ok());
    EXPECT_EQ(inside.value->unwrap().path, "/home/alice/docs");
}

TEST_F(TransferServiceTest, BlockedExtensionOnlyAppliesToTransfers) {
    SftpConfig config = make_config();
    config.blocked_extensions = {".exe"};
    start(config);
    connection->sftp->addFile("/home/alice/setup.exe", "MZ");

    Capture<UploadReady> uploaded;
    service->startUpload(upload("~/tool.EXE", 2), uploaded.callback());
    ASSERT_TRUE(uploaded.value);
    EXPECT_EQ(uploaded.code(), ErrorCode::ExtensionBlocked);

    Capture<StatResult> stat;
    service->stat(OperationContext{"c1", "s1"}, "~/setup.exe", stat.callback());
    EXPECT_TRUE(stat.ok());
}

TEST_F(TransferServiceTest, InvalidModeIsRejectedLocally) {
    Capture<OperationResult> made;
    service->mkdir(OperationContext{"c1", "s1"}, "/tmp/x", 01777, made.callback());
    ASSERT_TRUE(made.value);
    EXPECT_EQ(made.code(), ErrorCode::InvalidRequest);
    EXPECT_EQ(lookups, 0);
}

TEST_F(TransferServiceTest, OversizedUploadIsRejected) {
    SftpConfig config = make_config();
    config.max_file_size = 100;
    start(config);

    Capture<UploadReady> uploaded;
    service->startUpload(upload("~/big.bin", 101), uploaded.callback());
    ASSERT_TRUE(uploaded.value);
    EXPECT_EQ(uploaded.code(), ErrorCode::FileTooLarge);
    EXPECT_FALSE(uploaded.value->error().transfer_id.empty());
    EXPECT_EQ(lookups, 0);
}

TEST_F(TransferServiceTest, ZeroByteUploadCompletesAfterLastChunk) {
    const std::string id = startUpload("~/empty.txt", 0);

    Capture<UploadAck> acked;
    Capture<TransferCompletion> completed;
    service->processUploadChunk("s1", UploadChunkRequest{id, 0, "", true}, acked.callback(), completed.callback());
    ASSERT_TRUE(acked.ok());
    ASSERT_TRUE(completed.ok());
    EXPECT_EQ(completed.value->unwrap().bytes_transferred, 0u);
    EXPECT_TRUE(connection->sftp->exists("/home/alice/empty.txt"));
    EXPECT_EQ(service->activeTransfers(), 0u);
}

TEST_F(TransferServiceTest, ZeroByteUploadCompletesWithoutChunks) {
    const std::string id = startUpload("~/touch.txt", 0);

    Capture<TransferCompletion> completed;
    service->completeUpload("s1", id, completed.callback());
    ASSERT_TRUE(completed.ok());
    EXPECT_EQ(completed.value->unwrap().bytes_transferred, 0u);
    EXPECT_EQ(connection->sftp->openHandles(), 0u);

    Capture<TransferCompletion> foreign;
    service->completeUpload("s2", id, foreign.callback());
    ASSERT_TRUE(foreign.value);
    EXPECT_EQ(foreign.code(), ErrorCode::InvalidRequest);
}

TEST_F(TransferServiceTest, CompletionFollowsOnlyTheLastAck) {
    const std::string id = startUpload("~/two.bin", 1500);

    Capture<UploadAck> first;
    Capture<TransferCompletion> not_yet;
    service->processUploadChunk("s1", UploadChunkRequest{id, 0, std::string(1024, 'a'), false}, first.callback(), not_yet.callback());
    ASSERT_TRUE(first.ok());
    EXPECT_FALSE(not_yet.value);

    Capture<UploadAck> last;
    Capture<TransferCompletion> completed;
    service->processUploadChunk("s1", UploadChunkRequest{id, 1, std::string(476, 'b'), true}, last.callback(), completed.callback());
    ASSERT_TRUE(last.ok());
    ASSERT_TRUE(completed.ok());
    EXPECT_EQ(completed.value->unwrap().transfer_id, id);
    EXPECT_EQ(connection->sftp->contents("/home/alice/two.bin").size(), 1500u);
}

TEST_F(TransferServiceTest, ShortLastChunkDoesNotHoldTheSlot) {
    SftpConfig single = make_config();
    single.max_concurrent_transfers = 1;
    start(single);
    const std::string id = startUpload("~/short.bin", 2000);

    Capture<UploadAck> early;
    Capture<TransferCompletion> never;
    service->processUploadChunk("s1", UploadChunkRequest{id, 0, std::string(100, 'x'), true}, early.callback(), never.callback());
    ASSERT_TRUE(early.value);
    EXPECT_EQ(early.code(), ErrorCode::ChunkError);
    EXPECT_FALSE(never.value);

    Capture<UploadAck> first;
    Capture<TransferCompletion> not_yet;
    service->processUploadChunk("s1", UploadChunkRequest{id, 0, std::string(1024, 'a'), false}, first.callback(), not_yet.callback());
    ASSERT_TRUE(first.ok());
    Capture<UploadAck> last;
    Capture<TransferCompletion> completed;
    service->processUploadChunk("s1", UploadChunkRequest{id, 1, std::string(976, 'b'), true}, last.callback(), completed.callback());
    ASSERT_TRUE(last.ok());
    ASSERT_TRUE(completed.ok());
    EXPECT_EQ(service->activeTransfers(), 0u);

    Capture<UploadReady> next;
    service->startUpload(upload("~/next.bin", 1), next.callback());
    EXPECT_TRUE(next.ok());
}

TEST_F(TransferServiceTest, ClientTransferIdsAreKeptOnlyWhenValid) {
    Capture<UploadReady> kept;
    service->startUpload(upload("~/a.txt", 1, "my-upload_1"), kept.callback());
    ASSERT_TRUE(kept.ok());
    EXPECT_EQ(kept.value->unwrap().transfer_id, "my-upload_1");

    Capture<UploadReady> replaced;
    service->startUpload(upload("~/b.txt", 1, "bad id!"), replaced.callback());
    ASSERT_TRUE(replaced.ok());
    EXPECT_NE(replaced.value->unwrap().transfer_id, "bad id!");
    EXPECT_TRUE(is_valid_transfer_id(replaced.value->unwrap().transfer_id));

    EXPECT_NE(service->resolveTransferId("my-upload_1"), "my-upload_1");
    EXPECT_EQ(service->resolveTransferId("fresh-id"), "fresh-id");
}

TEST_F(TransferServiceTest, ForeignSessionCannotTouchTransfer) {
    const std::string id = startUpload("~/mine.bin", 10, "s1");

    Capture<UploadAck> foreign;
    Capture<TransferCompletion> foreign_done;
    service->processUploadChunk("s2", UploadChunkRequest{id, 0, "0123456789", true}, foreign.callback(), foreign_done.callback());
    ASSERT_TRUE(foreign.value);
    EXPECT_EQ(foreign.code(), ErrorCode::InvalidRequest);
    EXPECT_EQ(foreign.value->error().message, "Transfer not found");

    Capture<UploadAck> unknown;
    Capture<TransferCompletion> unknown_done;
    service->processUploadChunk("s1", UploadChunkRequest{"no-such-id", 0, "x", true}, unknown.callback(), unknown_done.callback());
    ASSERT_TRUE(unknown.value);
    EXPECT_EQ(unknown.value->error().message, foreign.value->error().message);

    service->cancelUpload("s2", id);
    EXPECT_EQ(service->activeTransfers(), 1u);
    EXPECT_TRUE(service->pauseTransfer("s2", id).is_err());
    EXPECT_TRUE(service->getProgress("s2", id).is_err());

    Capture<UploadAck> owner;
    Capture<TransferCompletion> owner_done;
    service->processUploadChunk("s1", UploadChunkRequest{id, 0, "0123456789", true}, owner.callback(), owner_done.callback());
    EXPECT_TRUE(owner.ok());
    EXPECT_TRUE(owner_done.ok());
}

TEST_F(TransferServiceTest, OwnerCancelReleasesSlot) {
    const std::string id = startUpload("~/a.bin", 10);
    EXPECT_EQ(service->activeTransfers(), 1u);

    service->cancelUpload("s1", id);
    EXPECT_EQ(service->activeTransfers(), 0u);

    Capture<UploadAck> late;
    Capture<TransferCompletion> late_done;
    service->processUploadChunk("s1", UploadChunkRequest{id, 0, "0123456789", true}, late.callback(), late_done.callback());
    ASSERT_TRUE(late.value);
    EXPECT_EQ(late.code(), ErrorCode::InvalidRequest);
}

TEST_F(TransferServiceTest, ConcurrencyCapCountsEverySession) {
    const std::string first = startUpload("~/a.bin", 10, "s1");
    startUpload("~/b.bin", 10, "s2");

    Capture<UploadReady> third;
    service->startUpload(upload("~/c.bin", 10, "", "s3"), third.callback());
    ASSERT_TRUE(third.value);
    EXPECT_EQ(third.code(), ErrorCode::MaxTransfers);

    connection->sftp->addFile("/home/alice/d.bin", "data");
    Capture<DownloadReady> download;
    Stream stream;
    service->startDownload(DownloadStartRequest{"", "s3", "c1", "~/d.bin"}, download.callback(), callbacks(stream));
    ASSERT_TRUE(download.value);
    EXPECT_EQ(download.code(), ErrorCode::MaxTransfers);

    service->cancelUpload("s1", first);
    Capture<UploadReady> retry;
    service->startUpload(upload("~/c.bin", 10, "", "s3"), retry.callback());
    EXPECT_TRUE(retry.ok());
}

TEST_F(TransferServiceTest, DownloadStreamsAfterReady) {
    connection->sftp->addFile("/home/alice/notes.md", std::string(1500, 'n'));

    bool ready_first = false;
    Capture<DownloadReady> ready;
    Stream stream;
    service->startDownload(DownloadStartRequest{"dl-1", "s1", "c1", "~/notes.md"},
        [&](Result<DownloadReady> info) {
            ready_first = stream.chunks.empty();
            ready.callback()(std::move(info));
        },
        callbacks(stream));

    ASSERT_TRUE(ready.ok());
    EXPECT_TRUE(ready_first);
    EXPECT_EQ(ready.value->unwrap().transfer_id, "dl-1");
    EXPECT_EQ(ready.value->unwrap().mime_type, "text/markdown");
    ASSERT_EQ(stream.chunks.size(), 2u);
    EXPECT_TRUE(stream.chunks[1].is_last);
    ASSERT_TRUE(stream.completion);
    EXPECT_EQ(service->activeTransfers(), 0u);
}

TEST_F(TransferServiceTest, PausedDownloadWaitsForResume) {
    connection->sftp->addFile("/home/alice/big.bin", std::string(3000, 'p'));

    std::string id;
    Stream stream;
    service->startDownload(DownloadStartRequest{"", "s1", "c1", "~/big.bin"},
        [&](Result<DownloadReady> info) {
            ASSERT_TRUE(info.is_ok());
            id = info.unwrap().transfer_id;
            EXPECT_TRUE(service->pauseTransfer("s1", id).is_ok());
        },
        callbacks(stream));
    EXPECT_TRUE(stream.chunks.empty());

    auto progress = service->getProgress("s1", id);
    ASSERT_TRUE(progress.is_ok());
    EXPECT_EQ(progress.unwrap().bytes_transferred, 0u);
    EXPECT_EQ(progress.unwrap().total_bytes, 3000u);

    ASSERT_TRUE(service->resumeTransfer("s1", id).is_ok());
    timers.advance(std::chrono::milliseconds(1000));
    EXPECT_EQ(stream.chunks.size(), 3u);
    EXPECT_TRUE(stream.completion);
}

TEST_F(TransferServiceTest, OversizedDownloadIsRejected) {
    SftpConfig config = make_config();
    config.max_file_size = 100;
    start(config);
    connection->sftp->addFile("/home/alice/big.bin", std::string(101, 'x'));

    Capture<DownloadReady> ready;
    Stream stream;
    service->startDownload(DownloadStartRequest{"", "s1", "c1", "~/big.bin"}, ready.callback(), callbacks(stream));
    ASSERT_TRUE(ready.value);
    EXPECT_EQ(ready.code(), ErrorCode::FileTooLarge);
    EXPECT_TRUE(stream.chunks.empty());
    EXPECT_EQ(service->activeTransfers(), 0u);
}

TEST_F(TransferServiceTest, UnknownConnectionIsNoConnection) {
    Capture<DirectoryListing> listed;
    service->listDirectory(OperationContext{"gone", "s1"}, "/", false, listed.callback());
    ASSERT_TRUE(listed.value);
    EXPECT_EQ(listed.code(), ErrorCode::NoConnection);
    EXPECT_EQ(lookups, 1);
}

TEST_F(TransferServiceTest, AutoBackendFallsBackToShell) {
    SftpConfig config = make_config();
    config.backend = BackendKind::Auto;
    start(config);
    connection->sftp_error = RemoteError{SSH_FX_FAILURE, "subsystem request failed"};
    connection->respond = [](const std::string &command) {
        ExecScript script;
        if (command == "ls -la -- '/srv'") {
            script.out = {"total 0\n-rw-r--r-- 1 root root 3 Jan 10 09:30 a.txt\n"};
        } else {
            script.err = "unexpected command";
            script.exit_code = 127;
        }
        return script;
    };

    Capture<DirectoryListing> first;
    service->listDirectory(OperationContext{"c1", "s1"}, "/srv", false, first.callback());
    ASSERT_TRUE(first.ok());
    ASSERT_EQ(first.value->unwrap().entries.size(), 1u);
    EXPECT_EQ(first.value->unwrap().entries[0].name, "a.txt");

    Capture<DirectoryListing> second;
    service->listDirectory(OperationContext{"c1", "s1"}, "/srv", false, second.callback());
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(connection->open_sftp_calls, 1);
    EXPECT_EQ(connection->commands.size(), 2u);
}

TEST_F(TransferServiceTest, AutoBackendPrefersSubsystem) {
    SftpConfig config = make_config();
    config.backend = BackendKind::Auto;
    start(config);

    Capture<DirectoryListing> listed;
    service->listDirectory(OperationContext{"c1", "s1"}, "~", false, listed.callback());
    ASSERT_TRUE(listed.ok());
    EXPECT_EQ(connection->open_sftp_calls, 1);
    EXPECT_TRUE(connection->commands.empty());
}

TEST_F(TransferServiceTest, DisconnectOnlyAffectsThatSession) {
    connection->sftp->addFile("/home/alice/a.bin", std::string(2048, 'a'));
    other->sftp->addFile("/home/alice/b.bin", std::string(2048, 'b'));
    connection->sftp->defer_reads = true;
    other->sftp->defer_reads = true;

    Capture<DownloadReady> mine;
    Stream mine_stream;
    service->startDownload(DownloadStartRequest{"dl-a", "s1", "c1", "~/a.bin"}, mine.callback(), callbacks(mine_stream));
    Capture<DownloadReady> theirs;
    Stream theirs_stream;
    service->startDownload(DownloadStartRequest{"dl-b", "s2", "c2", "~/b.bin"}, theirs.callback(), callbacks(theirs_stream));
    ASSERT_TRUE(mine.ok());
    ASSERT_TRUE(theirs.ok());
    EXPECT_EQ(service->activeTransfers(), 2u);

    service->disconnect("c1", "s1");
    EXPECT_EQ(service->activeTransfers(), 1u);
    EXPECT_TRUE(connection->sftp->ended);
    EXPECT_FALSE(other->sftp->ended);
    EXPECT_TRUE(service->getProgress("s1", "dl-a").is_err());

    other->sftp->completeAllDeferredReversed();
    EXPECT_EQ(theirs_stream.chunks.size(), 3u);
    EXPECT_TRUE(theirs_stream.completion);
    EXPECT_TRUE(mine_stream.chunks.empty());
    EXPECT_FALSE(mine_stream.error);
}

TEST_F(TransferServiceTest, DisconnectWhileSubsystemOpensLeavesNoBinding) {
    SftpConfig config = make_config();
    config.backend = BackendKind::Auto;
    start(config);
    connection->defer_open = true;

    Capture<DirectoryListing> pending;
    service->listDirectory(OperationContext{"c1", "s1"}, "~", false, pending.callback());
    EXPECT_FALSE(pending.value);

    service->disconnect("c1", "s1");
    ASSERT_TRUE(pending.value);
    EXPECT_EQ(pending.code(), ErrorCode::NoConnection);
    EXPECT_TRUE(connection->commands.empty());

    connection->completeOpens();
    EXPECT_TRUE(connection->sftp->ended);
    EXPECT_EQ(pending.calls, 1);

    connection->defer_open = false;
    Capture<DirectoryListing> again;
    service->listDirectory(OperationContext{"c1", "s1"}, "~", false, again.callback());
    ASSERT_TRUE(again.ok());
    EXPECT_EQ(connection->open_sftp_calls, 2);
    EXPECT_TRUE(connection->commands.empty());
}

TEST_F(TransferServiceTest, ShutdownDropsEverything) {
    startUpload("~/a.bin", 10);
    Capture<StatResult> stat;
    service->stat(OperationContext{"c1", "s1"}, "/", stat.callback());

    service->shutdown();
    EXPECT_EQ(service->activeTransfers(), 0u);
    EXPECT_TRUE(connection->sftp->ended);
}
