#include "filedock/server/transfer_store.hpp"

#include <algorithm>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "filedock/crypto.hpp"

namespace filedock::server
{

    namespace
    {
        constexpr std::size_t kMaxUploadIdLength = 128;
        constexpr std::size_t kHashBufferSize = 64 * 1024;

        std::int64_t to_seconds(Timestamp time)
        {
            return std::chrono::duration_cast<std::chrono::seconds>(time.time_since_epoch()).count();
        }

        Timestamp from_seconds(std::int64_t seconds)
        {
            return Timestamp{std::chrono::seconds{seconds}};
        }

        nlohmann::json to_json(const TransferSession &session)
        {
            return {
                {"upload_id", session.upload_id},
                {"path", session.path},
                {"destination", session.destination.generic_string()},
                {"temp_path", session.temp_path.generic_string()},
                {"total_size", session.total_size},
                {"chunk_size", session.chunk_size},
                {"total_chunks", session.total_chunks},
                {"next_chunk", session.next_chunk},
                {"bytes_received", session.bytes_received},
                {"verify_failed", session.verify_failed},
                {"created_at", to_seconds(session.created_at)},
                {"last_activity", to_seconds(session.last_activity)},
            };
        }

        TransferSession session_from_json(const nlohmann::json &json)
        {
            TransferSession session{};
            session.upload_id = json.at("upload_id").get<std::string>();
            session.path = json.at("path").get<std::string>();
            session.destination = json.at("destination").get<std::string>();
            session.temp_path = json.at("temp_path").get<std::string>();
            session.total_size = json.value("total_size", 0ULL);
            session.chunk_size = json.value("chunk_size", 0ULL);
            session.total_chunks = json.value("total_chunks", 0ULL);
            session.next_chunk = json.value("next_chunk", 0ULL);
            session.bytes_received = json.value("bytes_received", 0ULL);
            session.verify_failed = json.value("verify_failed", false);
            session.created_at = from_seconds(json.value("created_at", 0LL));
            session.last_activity = from_seconds(json.value("last_activity", 0LL));
            return session;
        }

        std::filesystem::path temp_path_for(const std::filesystem::path &destination, const std::string &upload_id)
        {
            return destination.parent_path() / ("." + destination.filename().string() + "." + upload_id + ".part");
        }

        std::string read_all(Filesystem &filesystem, const std::filesystem::path &path)
        {
            auto input = filesystem.open_read(path);
            std::string content;
            std::vector<std::byte> buffer(kHashBufferSize);
            while (const auto count = input->read(buffer))
            {
                content.append(reinterpret_cast<const char *>(buffer.data()), count);
            }
            return content;
        }

    } // namespace

    bool valid_upload_id(std::string_view upload_id) noexcept
    {
        if (upload_id.empty() || upload_id.size() > kMaxUploadIdLength || upload_id == "." || upload_id == "..")
        {
            return false;
        }
        return std::all_of(upload_id.begin(), upload_id.end(), [](char c)
                           { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                                    c == '-' || c == '_' || c == '.'; });
    }

    TransferSessionStore::TransferSessionStore(Filesystem &filesystem, const Clock &clock, TransferOptions options)
        : filesystem_(filesystem), clock_(clock), options_(std::move(options))
    {
        if (options_.state_dir)
        {
            filesystem_.create_directories(*options_.state_dir);
            load_existing();
        }
    }

    ChunkOutcome TransferSessionStore::put_chunk(const ChunkRequest &request, std::span<const std::byte> payload)
    {
        if (!valid_upload_id(request.upload_id))
        {
            return {.error = filedock::ErrorCode::ValidationError, .message = "A valid upload ID is required"};
        }

        auto entry = find_entry(request.upload_id);
        if (!entry)
        {
            if (request.chunk_index != 0)
            {
                return {.error = filedock::ErrorCode::UploadNotFound,
                        .message = "Upload session not found, restart from chunk 0"};
            }
            auto opened = open_session(request, entry);
            if (opened.error != filedock::ErrorCode::Ok)
            {
                return opened;
            }
        }

        std::lock_guard lock(entry->mutex);
        if (entry->closed)
        {
            return {.error = filedock::ErrorCode::UploadNotFound, .message = "Upload session is no longer active"};
        }

        auto &session = entry->session;
        const auto now = clock_.now();
        if (request.chunk_index == 0 &&
            (request.total_size != session.total_size || request.destination != session.destination))
        {
            return {.error = filedock::ErrorCode::Conflict,
                    .message = "Upload ID is already in use for a different file",
                    .next_expected_chunk = session.next_chunk,
                    .total_chunks = session.total_chunks};
        }
        if (request.chunk_index >= session.total_chunks)
        {
            return {.error = filedock::ErrorCode::ValidationError,
                    .message = "Chunk index " + std::to_string(request.chunk_index) + " is out of range, upload has " +
                               std::to_string(session.total_chunks) + " chunks",
                    .next_expected_chunk = session.next_chunk,
                    .total_chunks = session.total_chunks};
        }
        if (request.chunk_index < session.next_chunk && !session.verify_failed)
        {
            session.last_activity = now;
            spdlog::debug("Upload {}: chunk {} already received", session.upload_id, request.chunk_index);
            return {.next_expected_chunk = session.next_chunk, .total_chunks = session.total_chunks, .duplicate = true};
        }
        if (request.chunk_index > session.next_chunk)
        {
            return {.error = filedock::ErrorCode::ChunkMissing,
                    .message = "Chunk " + std::to_string(request.chunk_index) + " received out of order, expected " +
                               std::to_string(session.next_chunk),
                    .next_expected_chunk = session.next_chunk,
                    .total_chunks = session.total_chunks};
        }

        const auto offset = request.chunk_index * session.chunk_size;
        const auto expected_size = std::min(session.chunk_size, session.total_size - offset);
        if (payload.size() != expected_size)
        {
            return {.error = filedock::ErrorCode::ValidationError,
                    .message = "Chunk " + std::to_string(request.chunk_index) + " must be " +
                               std::to_string(expected_size) + " bytes, received " + std::to_string(payload.size()),
                    .next_expected_chunk = session.next_chunk,
                    .total_chunks = session.total_chunks};
        }

        try
        {
            if (request.chunk_index < session.next_chunk)
            {
                filesystem_.resize(session.temp_path, offset);
                spdlog::info("Upload {}: rewound to chunk {} after failed verification", session.upload_id,
                             request.chunk_index);
                session.next_chunk = request.chunk_index;
                session.bytes_received = offset;
                session.verify_failed = false;
                persist_state(session);
            }
            else if (filesystem_.stat(session.temp_path).size != session.bytes_received)
            {
                // Left over from an earlier failed append.
                filesystem_.resize(session.temp_path, session.bytes_received);
            }
            auto file = filesystem_.open_write(session.temp_path, WriteMode::Append);
            file->write(payload);
            file->close();
        }
        catch (const FilesystemError &ex)
        {
            spdlog::error("Upload {}: failed to store chunk {}: {}", session.upload_id, request.chunk_index, ex.what());
            restore_tail(session);
            session.last_activity = now;
            return {.error = filedock::ErrorCode::InternalError,
                    .message = std::string("Failed to store chunk, retry it: ") + ex.what(),
                    .next_expected_chunk = session.next_chunk,
                    .total_chunks = session.total_chunks};
        }

        ++session.next_chunk;
        session.bytes_received += payload.size();
        session.last_activity = now;
        persist_state(session);
        spdlog::debug("Upload {}: stored chunk {}/{}", session.upload_id, request.chunk_index, session.total_chunks);
        return {.next_expected_chunk = session.next_chunk, .total_chunks = session.total_chunks};
    }

    std::optional<TransferSession> TransferSessionStore::status(const std::string &upload_id) const
    {
        auto entry = find_entry(upload_id);
        if (!entry)
        {
            return std::nullopt;
        }
        std::lock_guard lock(entry->mutex);
        if (entry->closed)
        {
            return std::nullopt;
        }
        return entry->session;
    }

    CompleteOutcome TransferSessionStore::complete(const std::string &upload_id, std::string_view expected_checksum)
    {
        const auto expected = crypto::normalize_checksum(expected_checksum);
        if (expected.empty())
        {
            return {.error = filedock::ErrorCode::ValidationError, .message = "Checksum is required"};
        }

        auto entry = find_entry(upload_id);
        if (!entry)
        {
            return {.error = filedock::ErrorCode::UploadNotFound, .message = "Upload session not found"};
        }

        std::unique_lock lock(entry->mutex);
        if (entry->closed)
        {
            return {.error = filedock::ErrorCode::UploadNotFound, .message = "Upload session not found"};
        }
        auto &session = entry->session;
        session.last_activity = clock_.now();

        if (!session.all_bytes_received())
        {
            return {.error = filedock::ErrorCode::ChunkMissing,
                    .message = "Upload incomplete, next expected chunk is " + std::to_string(session.next_chunk),
                    .session = session};
        }

        std::string actual;
        try
        {
            auto input = filesystem_.open_read(session.temp_path);
            crypto::Sha256 hasher;
            std::vector<std::byte> buffer(kHashBufferSize);
            while (const auto count = input->read(buffer))
            {
                hasher.update(std::span<const std::byte>(buffer.data(), count));
            }
            actual = hasher.finish_hex();
        }
        catch (const FilesystemError &ex)
        {
            spdlog::error("Upload {}: failed to hash assembled file: {}", upload_id, ex.what());
            return {.error = ex.code(), .message = ex.what(), .session = session};
        }

        if (!crypto::constant_time_equals(actual, expected))
        {
            spdlog::warn("Upload {}: checksum mismatch (expected {}, got {})", upload_id, expected, actual);
            session.verify_failed = true;
            persist_state(session);
            return {.error = filedock::ErrorCode::ChecksumMismatch,
                    .message = "Checksum mismatch: expected " + expected + ", got " + actual,
                    .session = session};
        }

        try
        {
            filesystem_.rename(session.temp_path, session.destination);
        }
        catch (const FilesystemError &ex)
        {
            spdlog::error("Upload {}: failed to move file into place: {}", upload_id, ex.what());
            return {.error = ex.code(), .message = ex.what(), .session = session};
        }

        entry->closed = true;
        remove_state(upload_id);
        auto finished = session;
        lock.unlock();
        erase(upload_id);

        spdlog::info("Upload {} completed: {} ({} bytes)", upload_id, finished.path, finished.total_size);
        return {.session = std::move(finished)};
    }

    bool TransferSessionStore::abort(const std::string &upload_id)
    {
        auto entry = find_entry(upload_id);
        if (!entry)
        {
            return false;
        }
        {
            std::lock_guard lock(entry->mutex);
            if (entry->closed)
            {
                return false;
            }
            discard(*entry);
        }
        erase(upload_id);
        spdlog::info("Upload {} aborted", upload_id);
        return true;
    }

    std::size_t TransferSessionStore::sweep_expired()
    {
        const auto now = clock_.now();
        std::size_t evicted = 0;
        std::lock_guard lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();)
        {
            auto &entry = *it->second;
            // Sessions busy with a chunk are active by definition.
            std::unique_lock entry_lock(entry.mutex, std::try_to_lock);
            if (!entry_lock.owns_lock() || entry.closed || now - entry.session.last_activity <= options_.idle_timeout)
            {
                ++it;
                continue;
            }
            spdlog::info("Upload {} expired after {}s of inactivity", it->first,
                         std::chrono::duration_cast<std::chrono::seconds>(now - entry.session.last_activity).count());
            discard(entry);
            entry_lock.unlock();
            it = sessions_.erase(it);
            ++evicted;
        }
        return evicted;
    }

    std::size_t TransferSessionStore::size() const
    {
        std::lock_guard lock(mutex_);
        return sessions_.size();
    }

    std::shared_ptr<TransferSessionStore::Entry> TransferSessionStore::find_entry(const std::string &upload_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(upload_id);
        if (it == sessions_.end())
        {
            return nullptr;
        }
        return it->second;
    }

    ChunkOutcome TransferSessionStore::open_session(const ChunkRequest &request, std::shared_ptr<Entry> &entry)
    {
        if (request.path.empty() || request.destination.empty() || !request.destination.has_filename())
        {
            return {.error = filedock::ErrorCode::ValidationError, .message = "Upload destination is required"};
        }
        if (request.total_size == 0)
        {
            return {.error = filedock::ErrorCode::ValidationError, .message = "Total size must be positive"};
        }
        if (request.chunk_size == 0 || request.chunk_size > options_.max_chunk_size)
        {
            return {.error = filedock::ErrorCode::ValidationError,
                    .message = "Chunk size must be between 1 and " + std::to_string(options_.max_chunk_size)};
        }
        const auto total_chunks = (request.total_size + request.chunk_size - 1) / request.chunk_size;
        if (request.total_chunks && *request.total_chunks != total_chunks)
        {
            return {.error = filedock::ErrorCode::ValidationError,
                    .message = "Total chunks does not match total size and chunk size (expected " +
                               std::to_string(total_chunks) + ")"};
        }

        std::lock_guard lock(mutex_);
        if (auto it = sessions_.find(request.upload_id); it != sessions_.end())
        {
            entry = it->second;
            return {};
        }
        if (sessions_.size() >= options_.max_sessions)
        {
            return {.error = filedock::ErrorCode::UploadLimit,
                    .message = "Too many concurrent uploads, try again later"};
        }

        const auto now = clock_.now();
        auto created = std::make_shared<Entry>();
        auto &session = created->session;
        session.upload_id = request.upload_id;
        session.path = request.path;
        session.destination = request.destination;
        session.temp_path = temp_path_for(request.destination, request.upload_id);
        session.total_size = request.total_size;
        session.chunk_size = request.chunk_size;
        session.total_chunks = total_chunks;
        session.created_at = now;
        session.last_activity = now;

        try
        {
            filesystem_.create_directories(session.temp_path.parent_path());
            filesystem_.open_write(session.temp_path, WriteMode::Truncate)->close();
        }
        catch (const FilesystemError &ex)
        {
            spdlog::error("Upload {}: failed to create temporary file: {}", request.upload_id, ex.what());
            return {.error = ex.code(), .message = ex.what()};
        }

        persist_state(session);
        sessions_.emplace(request.upload_id, created);
        entry = std::move(created);
        spdlog::info("Upload {} started: {} ({} bytes in {} chunks)", request.upload_id, request.path,
                     request.total_size, total_chunks);
        return {};
    }

    void TransferSessionStore::discard(Entry &entry)
    {
        entry.closed = true;
        try
        {
            if (filesystem_.exists(entry.session.temp_path))
            {
                filesystem_.remove(entry.session.temp_path);
            }
        }
        catch (const FilesystemError &ex)
        {
            spdlog::warn("Upload {}: failed to remove temporary file: {}", entry.session.upload_id, ex.what());
        }
        remove_state(entry.session.upload_id);
    }

    void TransferSessionStore::restore_tail(const TransferSession &session)
    {
        try
        {
            filesystem_.resize(session.temp_path, session.bytes_received);
        }
        catch (const FilesystemError &ex)
        {
            // The next chunk retries the truncation before appending.
            spdlog::warn("Upload {}: failed to restore temporary file: {}", session.upload_id, ex.what());
        }
    }

    void TransferSessionStore::erase(const std::string &upload_id)
    {
        std::lock_guard lock(mutex_);
        sessions_.erase(upload_id);
    }

    std::optional<std::filesystem::path> TransferSessionStore::metadata_path(const std::string &upload_id) const
    {
        if (!options_.state_dir)
        {
            return std::nullopt;
        }
        return *options_.state_dir / (upload_id + ".json");
    }

    void TransferSessionStore::load_existing()
    {
        for (const auto &file : filesystem_.list_directory(*options_.state_dir))
        {
            if (file.is_directory || file.path.extension() != ".json")
            {
                continue;
            }
            try
            {
                auto session = session_from_json(nlohmann::json::parse(read_all(filesystem_, file.path)));
                const bool consistent = valid_upload_id(session.upload_id) && session.chunk_size > 0 &&
                                        filesystem_.exists(session.temp_path) &&
                                        filesystem_.stat(session.temp_path).size == session.bytes_received;
                if (!consistent)
                {
                    spdlog::warn("Discarding stale upload state {}", file.path.generic_string());
                    filesystem_.remove(file.path);
                    if (filesystem_.exists(session.temp_path))
                    {
                        filesystem_.remove(session.temp_path);
                    }
                    continue;
                }
                auto entry = std::make_shared<Entry>();
                entry->session = std::move(session);
                sessions_.emplace(entry->session.upload_id, std::move(entry));
            }
            catch (const std::exception &ex)
            {
                spdlog::warn("Skipping unreadable upload state {}: {}", file.path.generic_string(), ex.what());
            }
        }
        if (!sessions_.empty())
        {
            spdlog::info("Restored {} upload sessions", sessions_.size());
        }
    }

    void TransferSessionStore::persist_state(const TransferSession &session)
    {
        const auto path = metadata_path(session.upload_id);
        if (!path)
        {
            return;
        }
        try
        {
            const auto content = to_json(session).dump(2);
            auto file = filesystem_.open_write(*path, WriteMode::Truncate);
            file->write(std::as_bytes(std::span(content.data(), content.size())));
            file->close();
        }
        catch (const FilesystemError &ex)
        {
            spdlog::warn("Upload {}: failed to persist state: {}", session.upload_id, ex.what());
        }
    }

    void TransferSessionStore::remove_state(const std::string &upload_id)
    {
        const auto path = metadata_path(upload_id);
        if (!path)
        {
            return;
        }
        try
        {
            if (filesystem_.exists(*path))
            {
                filesystem_.remove(*path);
            }
        }
        catch (const FilesystemError &ex)
        {
            spdlog::warn("Upload {}: failed to remove persisted state: {}", upload_id, ex.what());
        }
    }

} // namespace filedock::server
