#include <algorithm>
#include <cassert>
#include <cctype>
#include <span>
#include <string>
#include <vector>

#include "filedock/crypto.hpp"
#include "filedock/server/memory_filesystem.hpp"
#include "filedock/server/transfer_store.hpp"
#include "test_support.hpp"

using namespace filedock;
using namespace filedock::server;

namespace
{

    const std::string kContent = "0123456789";

    ChunkRequest chunk_request(const std::string &upload_id, std::uint64_t index)
    {
        ChunkRequest request{};
        request.upload_id = upload_id;
        request.chunk_index = index;
        request.path = "/data/up/file.bin";
        request.destination = "/srv/data/up/file.bin";
        request.total_size = kContent.size();
        request.chunk_size = 4;
        return request;
    }

    // Chunk i of kContent split in 4-byte pieces.
    std::vector<std::byte> chunk_bytes(std::uint64_t index)
    {
        const auto offset = static_cast<std::size_t>(index * 4);
        return test::to_bytes(kContent.substr(offset, 4));
    }

    ChunkOutcome send_chunk(TransferSessionStore &store, const std::string &upload_id, std::uint64_t index)
    {
        const auto bytes = chunk_bytes(index);
        return store.put_chunk(chunk_request(upload_id, index), bytes);
    }

    std::string content_checksum()
    {
        const auto bytes = test::to_bytes(kContent);
        return crypto::sha256_hex(bytes);
    }

    void prepare(MemoryFilesystem &filesystem)
    {
        filesystem.create_directories("/srv/data");
    }

    void test_chunked_upload_round_trip()
    {
        test::ManualClock clock;
        MemoryFilesystem filesystem(clock);
        prepare(filesystem);
        TransferSessionStore store(filesystem, clock, TransferOptions{});

        auto first = send_chunk(store, "upload-1", 0);
        assert(first.error == ErrorCode::Ok);
        assert(first.next_expected_chunk == 1);
        assert(first.total_chunks == 3);
        assert(!first.duplicate);

        const std::filesystem::path temp = "/srv/data/up/.file.bin.upload-1.part";
        assert(filesystem.exists(temp));
        assert(filesystem.read_file(temp) == "0123");

        // A resent chunk is acknowledged without being appended twice.
        auto again = send_chunk(store, "upload-1", 0);
        assert(again.error == ErrorCode::Ok);
        assert(again.duplicate);
        assert(again.next_expected_chunk == 1);
        assert(filesystem.read_file(temp) == "0123");

        auto skipped = send_chunk(store, "upload-1", 2);
        assert(skipped.error == ErrorCode::ChunkMissing);
        assert(skipped.next_expected_chunk == 1);

        const auto short_payload = test::to_bytes("45");
        auto wrong_size = store.put_chunk(chunk_request("upload-1", 1), short_payload);
        assert(wrong_size.error == ErrorCode::ValidationError);
        assert(filesystem.read_file(temp) == "0123");

        assert(send_chunk(store, "upload-1", 1).error == ErrorCode::Ok);

        auto early = store.complete("upload-1", content_checksum());
        assert(early.error == ErrorCode::ChunkMissing);
        assert(early.session);
        assert(early.session->next_chunk == 2);

        auto last = send_chunk(store, "upload-1", 2);
        assert(last.error == ErrorCode::Ok);
        assert(last.next_expected_chunk == 3);

        auto status = store.status("upload-1");
        assert(status);
        assert(status->bytes_received == kContent.size());
        assert(status->last_contiguous_chunk() == 2);
        assert(status->all_bytes_received());

        auto mismatch = store.complete("upload-1", std::string(64, '0'));
        assert(mismatch.error == ErrorCode::ChecksumMismatch);
        assert(mismatch.message.find("Checksum mismatch") != std::string::npos);
        assert(!filesystem.exists("/srv/data/up/file.bin"));
        assert(store.status("upload-1"));

        std::string declared = content_checksum();
        std::transform(declared.begin(), declared.end(), declared.begin(), [](unsigned char c)
                       { return static_cast<char>(std::toupper(c)); });
        auto done = store.complete("upload-1", "SHA256:" + declared);
        assert(done.error == ErrorCode::Ok);
        assert(done.session);
        assert(done.session->total_size == kContent.size());
        assert(filesystem.read_file("/srv/data/up/file.bin") == kContent);
        assert(!filesystem.exists(temp));
        assert(!store.status("upload-1"));
        assert(store.size() == 0);

        // The identifier is free again once the upload finished.
        assert(send_chunk(store, "upload-1", 1).error == ErrorCode::UploadNotFound);
    }

    void test_session_validation()
    {
        test::ManualClock clock;
        MemoryFilesystem filesystem(clock);
        prepare(filesystem);
        TransferSessionStore store(filesystem, clock, TransferOptions{.max_sessions = 1});

        assert(send_chunk(store, "missing", 1).error == ErrorCode::UploadNotFound);
        assert(send_chunk(store, "../escape", 0).error == ErrorCode::ValidationError);
        assert(send_chunk(store, "", 0).error == ErrorCode::ValidationError);
        assert(!valid_upload_id(".."));
        assert(!valid_upload_id(std::string(129, 'a')));
        assert(valid_upload_id("a.b_c-D9"));

        auto request = chunk_request("counted", 0);
        request.total_chunks = 4;
        const auto bytes = chunk_bytes(0);
        assert(store.put_chunk(request, bytes).error == ErrorCode::ValidationError);
        request.total_chunks = 3;
        assert(store.put_chunk(request, bytes).error == ErrorCode::Ok);

        auto zero_size = chunk_request("empty", 0);
        zero_size.total_size = 0;
        assert(store.put_chunk(zero_size, {}).error == ErrorCode::ValidationError);

        assert(send_chunk(store, "second", 0).error == ErrorCode::UploadLimit);

        auto changed = chunk_request("counted", 0);
        changed.total_size = 20;
        assert(store.put_chunk(changed, bytes).error == ErrorCode::Conflict);

        assert(store.complete("counted", "").error == ErrorCode::ValidationError);
        assert(store.complete("unknown", content_checksum()).error == ErrorCode::UploadNotFound);

        assert(store.abort("counted"));
        assert(!store.abort("counted"));
        assert(!filesystem.exists("/srv/data/up/.file.bin.counted.part"));
        assert(send_chunk(store, "second", 0).error == ErrorCode::Ok);
    }

    void test_idle_sessions_expire()
    {
        test::ManualClock clock;
        MemoryFilesystem filesystem(clock);
        prepare(filesystem);
        TransferSessionStore store(filesystem, clock, TransferOptions{});

        assert(send_chunk(store, "stale", 0).error == ErrorCode::Ok);
        assert(send_chunk(store, "fresh", 0).error == ErrorCode::Ok);

        clock.advance(std::chrono::seconds{1800});
        assert(send_chunk(store, "fresh", 1).error == ErrorCode::Ok);
        assert(store.sweep_expired() == 0);

        clock.advance(std::chrono::seconds{1801});
        assert(store.sweep_expired() == 1);
        assert(!store.status("stale"));
        assert(store.status("fresh"));
        assert(!filesystem.exists("/srv/data/up/.file.bin.stale.part"));
        assert(send_chunk(store, "stale", 1).error == ErrorCode::UploadNotFound);
    }

    void test_sessions_survive_restart()
    {
        test::ManualClock clock;
        MemoryFilesystem filesystem(clock);
        prepare(filesystem);
        const TransferOptions options{.state_dir = std::filesystem::path("/state")};

        {
            TransferSessionStore store(filesystem, clock, options);
            assert(send_chunk(store, "resume", 0).error == ErrorCode::Ok);
            assert(send_chunk(store, "resume", 1).error == ErrorCode::Ok);
            assert(filesystem.exists("/state/resume.json"));
        }

        // State whose temporary file disappeared is dropped on load.
        filesystem.write_file("/state/orphan.json",
                              R"({"upload_id":"orphan","path":"/data/o","destination":"/srv/data/o",)"
                              R"("temp_path":"/srv/data/.o.orphan.part","total_size":4,"chunk_size":4,)"
                              R"("total_chunks":1,"next_chunk":0,"bytes_received":0})");

        TransferSessionStore reopened(filesystem, clock, options);
        assert(reopened.size() == 1);
        assert(!filesystem.exists("/state/orphan.json"));

        auto status = reopened.status("resume");
        assert(status);
        assert(status->next_chunk == 2);
        assert(status->bytes_received == 8);

        assert(send_chunk(reopened, "resume", 2).error == ErrorCode::Ok);
        auto done = reopened.complete("resume", content_checksum());
        assert(done.error == ErrorCode::Ok);
        assert(filesystem.read_file("/srv/data/up/file.bin") == kContent);
        assert(!filesystem.exists("/state/resume.json"));
    }

    void test_failed_write_keeps_accepted_chunks()
    {
        test::ManualClock clock;
        MemoryFilesystem filesystem(clock);
        prepare(filesystem);
        TransferSessionStore store(filesystem, clock, TransferOptions{});
        const std::filesystem::path temp = "/srv/data/up/.file.bin.flaky.part";

        assert(send_chunk(store, "flaky", 0).error == ErrorCode::Ok);
        // The disk fills up halfway through chunk 1.
        filesystem.fail_next_write_to(temp, 2);

        auto outcome = send_chunk(store, "flaky", 1);
        assert(outcome.error == ErrorCode::InternalError);
        assert(outcome.next_expected_chunk == 1);
        assert(filesystem.read_file(temp) == "0123");

        auto status = store.status("flaky");
        assert(status);
        assert(status->next_chunk == 1);
        assert(status->bytes_received == 4);

        assert(send_chunk(store, "flaky", 1).error == ErrorCode::Ok);
        assert(send_chunk(store, "flaky", 2).error == ErrorCode::Ok);
        assert(store.complete("flaky", content_checksum()).error == ErrorCode::Ok);
        assert(filesystem.read_file("/srv/data/up/file.bin") == kContent);
    }

    void test_corrupted_chunks_can_be_resent()
    {
        test::ManualClock clock;
        MemoryFilesystem filesystem(clock);
        prepare(filesystem);
        TransferSessionStore store(filesystem, clock, TransferOptions{});
        const std::filesystem::path temp = "/srv/data/up/.file.bin.retry.part";

        assert(send_chunk(store, "retry", 0).error == ErrorCode::Ok);
        assert(send_chunk(store, "retry", 1).error == ErrorCode::Ok);
        const auto garbled = test::to_bytes("XY");
        assert(store.put_chunk(chunk_request("retry", 2), garbled).error == ErrorCode::Ok);
        assert(send_chunk(store, "retry", 3).error == ErrorCode::ValidationError);

        auto mismatch = store.complete("retry", content_checksum());
        assert(mismatch.error == ErrorCode::ChecksumMismatch);
        assert(store.status("retry")->verify_failed);

        // The correct final chunk replaces the corrupted one.
        auto resent = send_chunk(store, "retry", 2);
        assert(resent.error == ErrorCode::Ok);
        assert(!resent.duplicate);
        assert(resent.next_expected_chunk == 3);
        assert(filesystem.read_file(temp) == kContent);
        assert(!store.status("retry")->verify_failed);

        // Without a failed verification a resent chunk is a duplicate again.
        assert(send_chunk(store, "retry", 2).duplicate);

        auto done = store.complete("retry", content_checksum());
        assert(done.error == ErrorCode::Ok);
        assert(filesystem.read_file("/srv/data/up/file.bin") == kContent);
    }

    void test_resending_earlier_chunk_rewinds_session()
    {
        test::ManualClock clock;
        MemoryFilesystem filesystem(clock);
        prepare(filesystem);
        TransferSessionStore store(filesystem, clock, TransferOptions{});
        const std::filesystem::path temp = "/srv/data/up/.file.bin.middle.part";

        assert(send_chunk(store, "middle", 0).error == ErrorCode::Ok);
        const auto garbled = test::to_bytes("abcd");
        assert(store.put_chunk(chunk_request("middle", 1), garbled).error == ErrorCode::Ok);
        assert(send_chunk(store, "middle", 2).error == ErrorCode::Ok);
        assert(store.complete("middle", content_checksum()).error == ErrorCode::ChecksumMismatch);

        auto rewound = send_chunk(store, "middle", 1);
        assert(rewound.error == ErrorCode::Ok);
        assert(rewound.next_expected_chunk == 2);
        assert(filesystem.read_file(temp) == "01234567");
        assert(store.complete("middle", content_checksum()).error == ErrorCode::ChunkMissing);

        assert(send_chunk(store, "middle", 2).error == ErrorCode::Ok);
        assert(store.complete("middle", content_checksum()).error == ErrorCode::Ok);
    }

} // namespace

void run_transfer_store_tests()
{
    test_chunked_upload_round_trip();
    test_session_validation();
    test_idle_sessions_expire();
    test_sessions_survive_restart();
    test_failed_write_keeps_accepted_chunks();
    test_corrupted_chunks_can_be_resent();
    test_resending_earlier_chunk_rewinds_session();
}
