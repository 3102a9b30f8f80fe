#include "fakes.hpp"
#include "webxfer/native_backend.hpp"
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

using namespace webxfer;

class NativeBackendTest : public ::testing::Test {
protected:
    SftpConfig config = make_config();
    TimerQueue timers;
    TransferManager transfers{2};
    SessionStore sessions;
    std::shared_ptr<FakeConnection> connection = std::make_shared<FakeConnection>();
    std::shared_ptr<FakeSftpChannel> sftp = connection->sftp;
    int lookups = 0;
    NativeBackend backend{config, transfers, sessions,
        [this](const std::string &id) -> std::shared_ptr<RemoteConnection> {
            this->lookups++;
            return id == "c1" ? this->connection : nullptr;
        },
        timers};
    OperationContext ctx{"c1", "s1"};

    // chunks, completion and error collected from one download stream
    struct Stream {
        std::vector<DownloadChunk> chunks;
        std::optional<TransferCompletion> completion;
        std::optional<Error> error;

        std::string joined() const {
            std::string data;
            for (const auto &chunk : this->chunks) {
                data += chunk.data;
            }
            return data;
        }
    };

    static SftpConfig make_config() {
        SftpConfig c;
        c.enabled = true;
        c.chunk_size = 1024;
        c.download_concurrency = 4;
        return c;
    }

    DownloadCallbacks callbacks(Stream &stream) {
        DownloadCallbacks cb;
        cb.on_chunk = [&stream](const DownloadChunk &chunk) { stream.chunks.push_back(chunk); };
        cb.on_progress = [](const TransferProgress &) {};
        cb.on_complete = [&stream](const TransferCompletion &completion) { stream.completion = completion; };
        cb.on_error = [&stream](const Error &error) { stream.error = error; };
        return cb;
    }

    UploadStartRequest uploadRequest(const std::string &id, const std::string &path, const std::uint64_t &size, const bool &overwrite = false) const {
        UploadStartRequest request;
        request.transfer_id = id;
        request.session_id = "s1";
        request.connection_id = "c1";
        request.remote_path = path;
        request.file_name = path.substr(path.find_last_of('/') + 1);
        request.file_size = size;
        request.overwrite = overwrite;
        return request;
    }

    void startDownload(const std::string &id, const std::string &path, Stream &stream, const std::string &session = "s1") {
        Capture<DownloadReady> ready;
        backend.startDownload(DownloadStartRequest{id, session, "c1", path}, ready.callback());
        ASSERT_TRUE(ready.ok());
        backend.streamDownloadChunks(id, callbacks(stream));
    }
};

TEST_F(NativeBackendTest, ListSkipsDotEntriesAndHiddenFiles) {
    sftp->addFile("/home/alice/notes.txt", "hello");
    sftp->addFile("/home/alice/.bashrc", "export X=1");
    sftp->addDir("/home/alice/docs");

    Capture<DirectoryListing> listed;
    backend.listDirectory(ctx, "~", false, listed.callback());
    ASSERT_TRUE(listed.ok());
    const DirectoryListing &listing = listed.value->unwrap();
    EXPECT_EQ(listing.path, "/home/alice");
    ASSERT_EQ(listing.entries.size(), 2u);
    EXPECT_EQ(listing.entries[0].name, "docs");
    EXPECT_EQ(listing.entries[0].type, EntryType::Directory);
    EXPECT_EQ(listing.entries[0].path, "/home/alice/docs");
    EXPECT_EQ(listing.entries[1].name, "notes.txt");
    EXPECT_EQ(listing.entries[1].size, 5u);

    Capture<DirectoryListing> all;
    backend.listDirectory(ctx, "~", true, all.callback());
    ASSERT_TRUE(all.ok());
    EXPECT_EQ(all.value->unwrap().entries.size(), 3u);
}

TEST_F(NativeBackendTest, ListingIsCappedAtMaxEntries) {
    config.max_directory_entries = 3;
    for (int i = 0; i < 5; ++i) {
        sftp->addFile("/srv/f" + std::to_string(i), "");
    }
    sftp->addDir("/srv");

    Capture<DirectoryListing> listed;
    backend.listDirectory(ctx, "/srv", false, listed.callback());
    ASSERT_TRUE(listed.ok());
    EXPECT_EQ(listed.value->unwrap().entries.size(), 3u);
}

TEST_F(NativeBackendTest, MissingDirectoryIsNotFound) {
    Capture<DirectoryListing> listed;
    backend.listDirectory(ctx, "/nope", false, listed.callback());
    ASSERT_TRUE(listed.value);
    EXPECT_EQ(listed.code(), ErrorCode::NotFound);
    EXPECT_EQ(listed.value->error().path, "/nope");
}

TEST_F(NativeBackendTest, SessionAndHomeAreResolvedOnce) {
    sftp->addFile("/home/alice/notes.txt", "hello");

    Capture<StatResult> first;
    backend.stat(ctx, "~/notes.txt", first.callback());
    Capture<StatResult> second;
    backend.stat(ctx, "~/notes.txt", second.callback());

    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(first.value->unwrap().path, "/home/alice/notes.txt");
    EXPECT_EQ(first.value->unwrap().entry.name, "notes.txt");
    EXPECT_EQ(first.value->unwrap().entry.type, EntryType::File);
    EXPECT_EQ(first.value->unwrap().entry.permissions, "rw-r--r--");
    EXPECT_EQ(connection->open_sftp_calls, 1);
    EXPECT_EQ(sftp->realpath_calls, 1);
    EXPECT_EQ(lookups, 1);
    EXPECT_EQ(sessions.size(), 1u);
}

TEST_F(NativeBackendTest, MkdirAppliesRequestedOrDefaultMode) {
    Capture<OperationResult> defaulted;
    backend.mkdir(ctx, "~/new", std::nullopt, defaulted.callback());
    ASSERT_TRUE(defaulted.ok());
    EXPECT_EQ(defaulted.value->unwrap().path, "/home/alice/new");
    EXPECT_EQ(sftp->nodes["/home/alice/new"].attrs.mode & 0777, 0755u);

    Capture<OperationResult> explicit_mode;
    backend.mkdir(ctx, "~/private", 0700, explicit_mode.callback());
    ASSERT_TRUE(explicit_mode.ok());
    EXPECT_EQ(sftp->nodes["/home/alice/private"].attrs.mode & 0777, 0700u);

    Capture<OperationResult> again;
    backend.mkdir(ctx, "~/new", std::nullopt, again.callback());
    ASSERT_TRUE(again.value);
    EXPECT_EQ(again.code(), ErrorCode::AlreadyExists);
}

TEST_F(NativeBackendTest, DeleteRemovesFilesAndEmptyDirectories) {
    sftp->addFile("/home/alice/a.txt", "a");
    sftp->addDir("/home/alice/empty");

    Capture<OperationResult> file;
    backend.deletePath(ctx, "~/a.txt", false, file.callback());
    ASSERT_TRUE(file.ok());
    EXPECT_FALSE(sftp->exists("/home/alice/a.txt"));

    Capture<OperationResult> dir;
    backend.deletePath(ctx, "~/empty", false, dir.callback());
    ASSERT_TRUE(dir.ok());
    EXPECT_FALSE(sftp->exists("/home/alice/empty"));
}

TEST_F(NativeBackendTest, NonRecursiveDeleteOfFullDirectoryFails) {
    sftp->addDir("/home/alice/tree");
    sftp->addFile("/home/alice/tree/a.txt", "a");

    Capture<OperationResult> removed;
    backend.deletePath(ctx, "~/tree", false, removed.callback());
    ASSERT_TRUE(removed.value);
    EXPECT_TRUE(removed.value->is_err());
    EXPECT_TRUE(sftp->exists("/home/alice/tree/a.txt"));
}

TEST_F(NativeBackendTest, RecursiveDeleteRemovesWholeTree) {
    sftp->addDir("/home/alice/tree");
    sftp->addFile("/home/alice/tree/a.txt", "a");
    sftp->addDir("/home/alice/tree/sub");
    sftp->addFile("/home/alice/tree/sub/b.txt", "b");

    Capture<OperationResult> removed;
    backend.deletePath(ctx, "~/tree", true, removed.callback());
    ASSERT_TRUE(removed.ok());
    EXPECT_FALSE(sftp->exists("/home/alice/tree"));
    EXPECT_FALSE(sftp->exists("/home/alice/tree/sub/b.txt"));
    EXPECT_EQ(sftp->log.back(), "rmdir /home/alice/tree");
}

TEST_F(NativeBackendTest, RecursiveDeleteRefusesEscapingEntryNames) {
    sftp->addDir("/home/alice/tree");
    sftp->addFile("/home/alice/keep.txt", "k");
    sftp->extra_names["/home/alice/tree"] = {"../keep.txt"};

    Capture<OperationResult> removed;
    backend.deletePath(ctx, "~/tree", true, removed.callback());
    ASSERT_TRUE(removed.value);
    EXPECT_TRUE(removed.value->is_err());
    EXPECT_TRUE(sftp->exists("/home/alice/keep.txt"));
    EXPECT_TRUE(sftp->exists("/home/alice/tree"));
}

TEST_F(NativeBackendTest, UploadWritesChunksAtTheirOffsets) {
    Capture<UploadReady> ready;
    backend.startUpload(uploadRequest("up1", "~/upload.bin", 2000), ready.callback());
    ASSERT_TRUE(ready.ok());
    EXPECT_EQ(ready.value->unwrap().transfer_id, "up1");
    EXPECT_EQ(ready.value->unwrap().chunk_size, 1024u);
    EXPECT_EQ(transfers.getTransfer("up1")->status, TransferStatus::Active);

    Capture<UploadAck> first;
    backend.processUploadChunk(UploadChunkRequest{"up1", 0, std::string(1024, 'a'), false}, first.callback());
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(first.value->unwrap().bytes_received, 1024u);

    Capture<UploadAck> last;
    backend.processUploadChunk(UploadChunkRequest{"up1", 1, std::string(976, 'b'), true}, last.callback());
    ASSERT_TRUE(last.ok());
    EXPECT_EQ(last.value->unwrap().chunk_index, 1u);
    EXPECT_EQ(last.value->unwrap().bytes_received, 2000u);

    Capture<TransferCompletion> completed;
    backend.completeUpload("up1", completed.callback());
    ASSERT_TRUE(completed.ok());
    EXPECT_EQ(completed.value->unwrap().bytes_transferred, 2000u);
    EXPECT_EQ(sftp->contents("/home/alice/upload.bin"), std::string(1024, 'a') + std::string(976, 'b'));
    EXPECT_EQ(sftp->openHandles(), 0u);
    EXPECT_FALSE(transfers.getTransfer("up1"));
}

TEST_F(NativeBackendTest, UploadRefusesExistingFileUnlessOverwriting) {
    sftp->addFile("/home/alice/report.txt", "old contents");

    Capture<UploadReady> refused;
    backend.startUpload(uploadRequest("up1", "~/report.txt", 3), refused.callback());
    ASSERT_TRUE(refused.value);
    EXPECT_EQ(refused.code(), ErrorCode::AlreadyExists);
    EXPECT_EQ(refused.value->error().transfer_id, "up1");
    EXPECT_EQ(transfers.getTotalCount(), 0u);

    Capture<UploadReady> ready;
    backend.startUpload(uploadRequest("up2", "~/report.txt", 3, true), ready.callback());
    ASSERT_TRUE(ready.ok());
    Capture<UploadAck> ack;
    backend.processUploadChunk(UploadChunkRequest{"up2", 0, "new", true}, ack.callback());
    ASSERT_TRUE(ack.ok());
    EXPECT_EQ(sftp->contents("/home/alice/report.txt"), "new");
}

TEST_F(NativeBackendTest, OutOfOrderChunkIsRejected) {
    Capture<UploadReady> ready;
    backend.startUpload(uploadRequest("up1", "~/upload.bin", 2000), ready.callback());
    ASSERT_TRUE(ready.ok());

    Capture<UploadAck> skipped;
    backend.processUploadChunk(UploadChunkRequest{"up1", 1, std::string(10, 'x'), false}, skipped.callback());
    ASSERT_TRUE(skipped.value);
    EXPECT_EQ(skipped.code(), ErrorCode::ChunkError);
}

TEST_F(NativeBackendTest, CompletingShortUploadFails) {
    Capture<UploadReady> ready;
    backend.startUpload(uploadRequest("up1", "~/upload.bin", 2000), ready.callback());
    ASSERT_TRUE(ready.ok());
    Capture<UploadAck> ack;
    backend.processUploadChunk(UploadChunkRequest{"up1", 0, std::string(1000, 'x'), false}, ack.callback());
    ASSERT_TRUE(ack.ok());

    Capture<TransferCompletion> completed;
    backend.completeUpload("up1", completed.callback());
    ASSERT_TRUE(completed.value);
    EXPECT_EQ(completed.code(), ErrorCode::ChunkError);
}

TEST_F(NativeBackendTest, LastChunkMustEndAtDeclaredSize) {
    Capture<UploadReady> ready;
    backend.startUpload(uploadRequest("up1", "~/upload.bin", 2000), ready.callback());
    ASSERT_TRUE(ready.ok());

    Capture<UploadAck> early;
    backend.processUploadChunk(UploadChunkRequest{"up1", 0, std::string(100, 'x'), true}, early.callback());
    ASSERT_TRUE(early.value);
    EXPECT_EQ(early.code(), ErrorCode::ChunkError);
    EXPECT_EQ(transfers.getTransfer("up1")->bytes_transferred, 0u);
    EXPECT_EQ(sftp->openHandles(), 1u);

    Capture<UploadAck> overflow;
    backend.processUploadChunk(UploadChunkRequest{"up1", 0, std::string(2001, 'x'), false}, overflow.callback());
    ASSERT_TRUE(overflow.value);
    EXPECT_EQ(overflow.code(), ErrorCode::ChunkError);

    Capture<UploadAck> first;
    backend.processUploadChunk(UploadChunkRequest{"up1", 0, std::string(1024, 'a'), false}, first.callback());
    ASSERT_TRUE(first.ok());
    Capture<UploadAck> last;
    backend.processUploadChunk(UploadChunkRequest{"up1", 1, std::string(976, 'b'), true}, last.callback());
    ASSERT_TRUE(last.ok());

    Capture<TransferCompletion> completed;
    backend.completeUpload("up1", completed.callback());
    ASSERT_TRUE(completed.ok());
    EXPECT_EQ(transfers.getActiveCount(), 0u);
}

TEST_F(NativeBackendTest, ZeroByteUploadCreatesEmptyFile) {
    Capture<UploadReady> ready;
    backend.startUpload(uploadRequest("up1", "~/empty.txt", 0), ready.callback());
    ASSERT_TRUE(ready.ok());

    Capture<UploadAck> ack;
    backend.processUploadChunk(UploadChunkRequest{"up1", 0, "", true}, ack.callback());
    ASSERT_TRUE(ack.ok());
    EXPECT_EQ(ack.value->unwrap().bytes_received, 0u);

    Capture<TransferCompletion> completed;
    backend.completeUpload("up1", completed.callback());
    ASSERT_TRUE(completed.ok());
    EXPECT_EQ(completed.value->unwrap().bytes_transferred, 0u);
    ASSERT_TRUE(sftp->exists("/home/alice/empty.txt"));
    EXPECT_TRUE(sftp->contents("/home/alice/empty.txt").empty());
}

TEST_F(NativeBackendTest, CancelledUploadStopsAcceptingChunks) {
    Capture<UploadReady> ready;
    backend.startUpload(uploadRequest("up1", "~/upload.bin", 2000), ready.callback());
    ASSERT_TRUE(ready.ok());

    backend.cancelUpload("up1");
    EXPECT_EQ(sftp->openHandles(), 0u);
    EXPECT_FALSE(transfers.getTransfer("up1"));

    Capture<UploadAck> late;
    backend.processUploadChunk(UploadChunkRequest{"up1", 0, "x", false}, late.callback());
    ASSERT_TRUE(late.value);
    EXPECT_EQ(late.code(), ErrorCode::InvalidRequest);
}

TEST_F(NativeBackendTest, WriteFailureFailsTheUpload) {
    Capture<UploadReady> ready;
    backend.startUpload(uploadRequest("up1", "~/upload.bin", 10), ready.callback());
    ASSERT_TRUE(ready.ok());

    sftp->fail_ops["write"] = RemoteError{SSH_FX_FAILURE, "disk full"};
    Capture<UploadAck> ack;
    backend.processUploadChunk(UploadChunkRequest{"up1", 0, "0123456789", true}, ack.callback());
    ASSERT_TRUE(ack.value);
    EXPECT_EQ(ack.code(), ErrorCode::ChunkError);
    EXPECT_EQ(ack.value->error().transfer_id, "up1");
    EXPECT_FALSE(transfers.getTransfer("up1"));
}

TEST_F(NativeBackendTest, DownloadSendsFinalPartialChunk) {
    const std::string data(2500, 'd');
    sftp->addFile("/home/alice/big.bin", data);

    Capture<DownloadReady> ready;
    backend.startDownload(DownloadStartRequest{"dl1", "s1", "c1", "~/big.bin"}, ready.callback());
    ASSERT_TRUE(ready.ok());
    EXPECT_EQ(ready.value->unwrap().file_name, "big.bin");
    EXPECT_EQ(ready.value->unwrap().file_size, 2500u);
    EXPECT_EQ(ready.value->unwrap().mime_type, "application/octet-stream");

    Stream stream;
    backend.streamDownloadChunks("dl1", callbacks(stream));
    ASSERT_EQ(stream.chunks.size(), 3u);
    EXPECT_EQ(stream.chunks[2].data.size(), 452u);
    EXPECT_FALSE(stream.chunks[1].is_last);
    EXPECT_TRUE(stream.chunks[2].is_last);
    EXPECT_EQ(stream.joined(), data);
    ASSERT_TRUE(stream.completion);
    EXPECT_EQ(stream.completion->bytes_transferred, 2500u);
    EXPECT_FALSE(stream.error);
    EXPECT_EQ(sftp->openHandles(), 0u);
    EXPECT_EQ(backend.activeDownloads(), 0u);
}

TEST_F(NativeBackendTest, ExactMultipleEndsWithEmptyChunk) {
    sftp->addFile("/home/alice/even.bin", std::string(2048, 'e'));

    Stream stream;
    startDownload("dl1", "~/even.bin", stream);
    ASSERT_EQ(stream.chunks.size(), 3u);
    EXPECT_EQ(stream.chunks[1].data.size(), 1024u);
    EXPECT_FALSE(stream.chunks[1].is_last);
    EXPECT_TRUE(stream.chunks[2].data.empty());
    EXPECT_TRUE(stream.chunks[2].is_last);
    EXPECT_EQ(sftp->reads, 2);
}

TEST_F(NativeBackendTest, ZeroByteDownloadIsOneEmptyLastChunk) {
    sftp->addFile("/home/alice/empty.txt", "");

    Stream stream;
    startDownload("dl1", "~/empty.txt", stream);
    ASSERT_EQ(stream.chunks.size(), 1u);
    EXPECT_EQ(stream.chunks[0].chunk_index, 0u);
    EXPECT_TRUE(stream.chunks[0].data.empty());
    EXPECT_TRUE(stream.chunks[0].is_last);
    ASSERT_TRUE(stream.completion);
    EXPECT_EQ(stream.completion->bytes_transferred, 0u);
}

TEST_F(NativeBackendTest, ParallelReadsAreDeliveredInOrder) {
    std::string data;
    for (char c : std::string("abcd")) {
        data += std::string(1024, c);
    }
    sftp->addFile("/home/alice/four.bin", data);
    sftp->defer_reads = true;

    Stream stream;
    startDownload("dl1", "~/four.bin", stream);
    ASSERT_EQ(sftp->deferredCount(), 4u);

    sftp->completeDeferred(3);
    sftp->completeDeferred(2);
    sftp->completeDeferred(1);
    EXPECT_TRUE(stream.chunks.empty());

    sftp->completeDeferred(0);
    ASSERT_EQ(stream.chunks.size(), 5u);
    for (size_t i = 0; i < stream.chunks.size(); ++i) {
        EXPECT_EQ(stream.chunks[i].chunk_index, i);
    }
    EXPECT_EQ(stream.chunks[0].data, std::string(1024, 'a'));
    EXPECT_EQ(stream.chunks[3].data, std::string(1024, 'd'));
    EXPECT_TRUE(stream.chunks[4].is_last);
    EXPECT_EQ(stream.joined(), data);
    EXPECT_TRUE(stream.completion);
}

TEST_F(NativeBackendTest, ShortReadsAreCompleted) {
    std::string data;
    for (int i = 0; i < 1500; ++i) {
        data += static_cast<char>('a' + i % 26);
    }
    sftp->addFile("/home/alice/short.bin", data);
    sftp->max_read = 100;

    Stream stream;
    startDownload("dl1", "~/short.bin", stream);
    ASSERT_EQ(stream.chunks.size(), 2u);
    EXPECT_EQ(stream.chunks[0].data.size(), 1024u);
    EXPECT_EQ(stream.joined(), data);
    EXPECT_TRUE(stream.completion);
}

TEST_F(NativeBackendTest, CancelledDownloadGoesQuiet) {
    sftp->addFile("/home/alice/big.bin", std::string(4096, 'x'));
    sftp->defer_reads = true;

    Stream stream;
    startDownload("dl1", "~/big.bin", stream);
    backend.cancelDownload("dl1");
    sftp->completeAllDeferredReversed();

    EXPECT_TRUE(stream.chunks.empty());
    EXPECT_FALSE(stream.completion);
    EXPECT_FALSE(stream.error);
    EXPECT_EQ(sftp->openHandles(), 0u);
    EXPECT_EQ(backend.activeDownloads(), 0u);
    EXPECT_FALSE(transfers.getTransfer("dl1"));
}

TEST_F(NativeBackendTest, ReadErrorReportsChunkError) {
    sftp->addFile("/home/alice/big.bin", std::string(3000, 'x'));
    sftp->fail_ops["read"] = RemoteError{SSH_FX_FAILURE, "I/O error"};

    Stream stream;
    startDownload("dl1", "~/big.bin", stream);
    ASSERT_TRUE(stream.error);
    EXPECT_EQ(stream.error->code, ErrorCode::ChunkError);
    EXPECT_EQ(stream.error->transfer_id, "dl1");
    EXPECT_FALSE(stream.completion);
    EXPECT_FALSE(transfers.getTransfer("dl1"));
}

TEST_F(NativeBackendTest, DownloadRejectsDirectoriesAndOversizedFiles) {
    sftp->addDir("/home/alice/docs");
    Capture<DownloadReady> dir;
    backend.startDownload(DownloadStartRequest{"dl1", "s1", "c1", "~/docs"}, dir.callback());
    ASSERT_TRUE(dir.value);
    EXPECT_EQ(dir.code(), ErrorCode::InvalidRequest);

    config.max_file_size = 100;
    sftp->addFile("/home/alice/big.bin", std::string(101, 'x'));
    Capture<DownloadReady> big;
    backend.startDownload(DownloadStartRequest{"dl2", "s1", "c1", "~/big.bin"}, big.callback());
    ASSERT_TRUE(big.value);
    EXPECT_EQ(big.code(), ErrorCode::FileTooLarge);
    EXPECT_EQ(transfers.getTotalCount(), 0u);
}

TEST_F(NativeBackendTest, UnknownConnectionIsNoConnection) {
    Capture<DirectoryListing> listed;
    backend.listDirectory(OperationContext{"gone", "s1"}, "/", false, listed.callback());
    ASSERT_TRUE(listed.value);
    EXPECT_EQ(listed.code(), ErrorCode::NoConnection);
}

TEST_F(NativeBackendTest, MissingSubsystemIsSessionError) {
    connection->sftp_error = RemoteError{SSH_FX_FAILURE, "subsystem request failed"};

    Capture<Ok> probed;
    backend.probe(ctx, probed.callback());
    ASSERT_TRUE(probed.value);
    EXPECT_EQ(probed.code(), ErrorCode::SessionError);
    EXPECT_EQ(probed.value->error().message.rfind("Failed to open SFTP subsystem", 0), 0u);
    EXPECT_EQ(sessions.size(), 0u);
}

TEST_F(NativeBackendTest, UnansweredCallTimesOut) {
    sftp->hang_ops.insert("stat");

    Capture<StatResult> stat;
    backend.stat(ctx, "/srv", stat.callback());
    EXPECT_FALSE(stat.value);

    timers.advance(config.timeout);
    ASSERT_TRUE(stat.value);
    EXPECT_EQ(stat.code(), ErrorCode::Timeout);
    EXPECT_EQ(stat.calls, 1);
}

TEST_F(NativeBackendTest, CloseSessionEndsTheChannel) {
    Capture<StatResult> stat;
    backend.stat(ctx, "/", stat.callback());
    ASSERT_TRUE(stat.ok());

    backend.closeSession("c1");
    EXPECT_TRUE(sftp->ended);
    EXPECT_EQ(sessions.size(), 0u);
}

TEST_F(NativeBackendTest, CloseSessionFailsSubsystemStillOpening) {
    connection->defer_open = true;

    Capture<StatResult> stat;
    backend.stat(ctx, "/", stat.callback());
    EXPECT_FALSE(stat.value);

    backend.closeSession("c1");
    ASSERT_TRUE(stat.value);
    EXPECT_EQ(stat.code(), ErrorCode::SessionError);

    connection->completeOpens();
    EXPECT_EQ(stat.calls, 1);
    EXPECT_TRUE(sftp->ended);
    EXPECT_EQ(sessions.size(), 0u);
}

TEST_F(NativeBackendTest, SessionCancelLeavesOtherSessionsAlone) {
    sftp->addFile("/home/alice/a.bin", std::string(4096, 'a'));
    sftp->addFile("/home/alice/b.bin", std::string(4096, 'b'));
    sftp->defer_reads = true;

    Stream mine;
    startDownload("dl1", "~/a.bin", mine, "s1");
    Stream theirs;
    startDownload("dl2", "~/b.bin", theirs, "s2");

    backend.cancelSessionTransfers("s1");
    EXPECT_FALSE(transfers.getTransfer("dl1"));
    ASSERT_TRUE(transfers.getTransfer("dl2"));
    EXPECT_EQ(backend.activeDownloads(), 1u);

    sftp->completeAllDeferredReversed();
    EXPECT_TRUE(mine.chunks.empty());
    EXPECT_EQ(theirs.chunks.size(), 5u);
    EXPECT_TRUE(theirs.completion);
}
