#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "filedock/error_codes.hpp"
#include "filedock/server/clock.hpp"

namespace filedock::server
{

    class FilesystemError : public std::runtime_error
    {
    public:
        FilesystemError(filedock::ErrorCode code, std::string message);

        filedock::ErrorCode code() const noexcept { return code_; }

    private:
        filedock::ErrorCode code_;
    };

    struct EntryInfo
    {
        std::filesystem::path path;
        bool is_directory{};
        std::uint64_t size{};
        Timestamp modified{};
    };

    class InputFile
    {
    public:
        virtual ~InputFile() = default;

        // Returns 0 at end of file.
        virtual std::size_t read(std::span<std::byte> buffer) = 0;
        virtual void seek(std::uint64_t offset) = 0;
    };

    class OutputFile
    {
    public:
        virtual ~OutputFile() = default;

        virtual void write(std::span<const std::byte> data) = 0;
        virtual void close() = 0;
    };

    enum class WriteMode : std::uint8_t
    {
        Truncate,
        Append
    };

    // Uniform storage operations consumed by the job engine and the transfer store.
    class Filesystem
    {
    public:
        virtual ~Filesystem() = default;

        virtual EntryInfo stat(const std::filesystem::path &path) const = 0;
        virtual bool exists(const std::filesystem::path &path) const = 0;
        // Entries sorted by name.
        virtual std::vector<EntryInfo> list_directory(const std::filesystem::path &path) const = 0;
        virtual void create_directories(const std::filesystem::path &path) = 0;
        virtual std::unique_ptr<InputFile> open_read(const std::filesystem::path &path) const = 0;
        virtual std::unique_ptr<OutputFile> open_write(const std::filesystem::path &path, WriteMode mode) = 0;
        // Removes a file or an empty directory.
        virtual void remove(const std::filesystem::path &path) = 0;
        virtual void remove_all(const std::filesystem::path &path) = 0;
        // Replaces an existing destination file.
        virtual void rename(const std::filesystem::path &from, const std::filesystem::path &to) = 0;
        // Shrinks or extends an existing file to exactly size bytes.
        virtual void resize(const std::filesystem::path &path, std::uint64_t size) = 0;
    };

    class LocalFilesystem final : public Filesystem
    {
    public:
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
    };

} // namespace filedock::server
