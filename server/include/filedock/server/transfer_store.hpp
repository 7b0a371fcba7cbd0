#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>

#include "filedock/error_codes.hpp"
#include "filedock/server/clock.hpp"
#include "filedock/server/filesystem.hpp"

namespace filedock::server
{

    struct TransferOptions
    {
        std::chrono::seconds idle_timeout{std::chrono::seconds{3600}};
        std::size_t max_sessions{64};
        std::uint64_t max_chunk_size{64ULL * 1024 * 1024};
        // Session metadata is persisted here when set.
        std::optional<std::filesystem::path> state_dir;
    };

    struct TransferSession
    {
        std::string upload_id;
        std::string path;
        std::filesystem::path destination;
        std::filesystem::path temp_path;
        std::uint64_t total_size{};
        std::uint64_t chunk_size{};
        std::uint64_t total_chunks{};
        std::uint64_t next_chunk{};
        std::uint64_t bytes_received{};
        // Set by a checksum mismatch. While set, re-sending an accepted chunk rewinds the session to it.
        bool verify_failed{};
        Timestamp created_at{};
        Timestamp last_activity{};

        // -1 while nothing has been accepted.
        std::int64_t last_contiguous_chunk() const noexcept { return static_cast<std::int64_t>(next_chunk) - 1; }
        bool all_bytes_received() const noexcept { return bytes_received == total_size; }
    };

    struct ChunkRequest
    {
        std::string upload_id;
        std::uint64_t chunk_index{};
        // Session declaration, only used when chunk 0 opens the session.
        std::string path;
        std::filesystem::path destination;
        std::uint64_t total_size{};
        std::uint64_t chunk_size{};
        std::optional<std::uint64_t> total_chunks;
    };

    struct ChunkOutcome
    {
        filedock::ErrorCode error{filedock::ErrorCode::Ok};
        std::string message;
        std::uint64_t next_expected_chunk{};
        std::uint64_t total_chunks{};
        bool duplicate{};
    };

    struct CompleteOutcome
    {
        filedock::ErrorCode error{filedock::ErrorCode::Ok};
        std::string message;
        std::optional<TransferSession> session;
    };

    // Resumable chunked uploads. Chunks are appended strictly in order to a temporary file next to the
    // destination, which is renamed into place once the whole-file SHA-256 matches.
    class TransferSessionStore
    {
    public:
        TransferSessionStore(Filesystem &filesystem, const Clock &clock, TransferOptions options);

        ChunkOutcome put_chunk(const ChunkRequest &request, std::span<const std::byte> payload);

        std::optional<TransferSession> status(const std::string &upload_id) const;

        CompleteOutcome complete(const std::string &upload_id, std::string_view expected_checksum);

        bool abort(const std::string &upload_id);

        // Drops sessions idle for longer than the configured window. Returns the number evicted.
        std::size_t sweep_expired();

        std::size_t size() const;

        const TransferOptions &options() const noexcept { return options_; }

    private:
        struct Entry
        {
            std::mutex mutex;
            TransferSession session;
            bool closed{false};
        };

        std::shared_ptr<Entry> find_entry(const std::string &upload_id) const;
        ChunkOutcome open_session(const ChunkRequest &request, std::shared_ptr<Entry> &entry);
        void discard(Entry &entry);
        void restore_tail(const TransferSession &session);
        void erase(const std::string &upload_id);

        std::optional<std::filesystem::path> metadata_path(const std::string &upload_id) const;
        void load_existing();
        void persist_state(const TransferSession &session);
        void remove_state(const std::string &upload_id);

        Filesystem &filesystem_;
        const Clock &clock_;
        TransferOptions options_;

        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::shared_ptr<Entry>> sessions_;
    };

    bool valid_upload_id(std::string_view upload_id) noexcept;

} // namespace filedock::server
