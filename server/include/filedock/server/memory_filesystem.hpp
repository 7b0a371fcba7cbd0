#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "filedock/server/filesystem.hpp"

namespace filedock::server
{

    // In-memory tree with the same observable semantics as LocalFilesystem. The root "/" always exists.
    class MemoryFilesystem final : public Filesystem
    {
    public:
        explicit MemoryFilesystem(const Clock &clock);

        EntryInfo stat(const std::filesystem::path &path) const override;
        bool exists(const std::filesystem::path &path) const override;
        std::vector<EntryInfo> list_directory(const std::filesystem::path &path) const override;
        void create_directories(const std::filesystem::path &path) override;
        std::unique_ptr<InputFile> open_read(const std::filesystem::path &path) const override;
        std::unique_ptr<OutputFile> open_write(const std::filesystem::path &path, WriteMode mode) override;
        void remove(const std::filesystem::path &path) override;
        void remove_all(const std::filesystem::path &path) override;
        void rename(const std::filesystem::path &from, const std::filesystem::path &to) override;
        void resize(const std::filesystem::path &path, std::uint64_t size) override;

        void write_file(const std::filesystem::path &path, const std::string &content);
        std::string read_file(const std::filesystem::path &path) const;

        // Subsequent open_read calls for this path fail with INTERNAL_ERROR.
        void fail_reads_of(const std::filesystem::path &path);
        // The next write to this path stores only the first bytes_kept bytes, then fails with INTERNAL_ERROR.
        void fail_next_write_to(const std::filesystem::path &path, std::size_t bytes_kept);

    private:
        struct Node
        {
            bool is_directory{};
            std::vector<std::byte> data;
            Timestamp modified{};
        };

        friend class MemoryOutputFile;

        static std::string key(const std::filesystem::path &path);
        static std::string parent_key(const std::string &key);
        const Node &find_locked(const std::string &key) const;
        void require_parent_directory_locked(const std::string &key) const;
        void append_locked(const std::string &key, std::span<const std::byte> data);

        const Clock &clock_;
        mutable std::mutex mutex_;
        std::map<std::string, Node> nodes_;
        std::set<std::string> failing_reads_;
        std::map<std::string, std::size_t> failing_writes_;
    };

} // namespace filedock::server
