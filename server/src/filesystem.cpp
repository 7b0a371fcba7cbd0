#include "filedock/server/filesystem.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <system_error>

namespace filedock::server
{

    FilesystemError::FilesystemError(filedock::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    namespace
    {

        filedock::ErrorCode classify(const std::error_code &ec)
        {
            if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory)
            {
                return filedock::ErrorCode::NotFound;
            }
            if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted ||
                ec == std::errc::read_only_file_system)
            {
                return filedock::ErrorCode::AccessDenied;
            }
            if (ec == std::errc::file_exists || ec == std::errc::directory_not_empty ||
                ec == std::errc::is_a_directory)
            {
                return filedock::ErrorCode::Conflict;
            }
            return filedock::ErrorCode::InternalError;
        }

        [[noreturn]] void throw_error(const std::string &operation, const std::filesystem::path &path,
                                      const std::error_code &ec)
        {
            throw FilesystemError(classify(ec), operation + " " + path.generic_string() + ": " + ec.message());
        }

        Timestamp to_system_time(const std::filesystem::file_time_type &time)
        {
            using namespace std::chrono;
            return time_point_cast<system_clock::duration>(time - std::filesystem::file_time_type::clock::now() +
                                                           system_clock::now());
        }

        EntryInfo entry_from_path(const std::filesystem::path &path)
        {
            std::error_code ec;
            const auto status = std::filesystem::status(path, ec);
            if (ec)
            {
                throw_error("stat", path, ec);
            }
            EntryInfo info{};
            info.path = path;
            info.is_directory = std::filesystem::is_directory(status);
            if (!info.is_directory)
            {
                info.size = std::filesystem::file_size(path, ec);
                if (ec)
                {
                    throw_error("stat", path, ec);
                }
            }
            const auto modified = std::filesystem::last_write_time(path, ec);
            if (!ec)
            {
                info.modified = to_system_time(modified);
            }
            return info;
        }

        class LocalInputFile final : public InputFile
        {
        public:
            explicit LocalInputFile(const std::filesystem::path &path) : path_(path), stream_(path, std::ios::binary)
            {
                if (!stream_.is_open())
                {
                    throw FilesystemError(std::filesystem::exists(path) ? filedock::ErrorCode::AccessDenied
                                                                        : filedock::ErrorCode::NotFound,
                                          "Failed to open file for reading: " + path.generic_string());
                }
            }

            std::size_t read(std::span<std::byte> buffer) override
            {
                stream_.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
                if (stream_.bad())
                {
                    throw FilesystemError(filedock::ErrorCode::InternalError,
                                          "Read failed: " + path_.generic_string());
                }
                return static_cast<std::size_t>(stream_.gcount());
            }

            void seek(std::uint64_t offset) override
            {
                stream_.clear();
                stream_.seekg(static_cast<std::streamoff>(offset));
                if (!stream_)
                {
                    throw FilesystemError(filedock::ErrorCode::InternalError,
                                          "Seek failed: " + path_.generic_string());
                }
            }

        private:
            std::filesystem::path path_;
            std::ifstream stream_;
        };

        class LocalOutputFile final : public OutputFile
        {
        public:
            LocalOutputFile(const std::filesystem::path &path, WriteMode mode)
                : path_(path),
                  stream_(path, std::ios::binary | (mode == WriteMode::Append ? std::ios::app : std::ios::trunc))
            {
                if (!stream_.is_open())
                {
                    throw FilesystemError(std::filesystem::exists(path.parent_path())
                                              ? filedock::ErrorCode::AccessDenied
                                              : filedock::ErrorCode::NotFound,
                                          "Failed to open file for writing: " + path.generic_string());
                }
            }

            void write(std::span<const std::byte> data) override
            {
                stream_.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
                if (!stream_)
                {
                    throw FilesystemError(filedock::ErrorCode::InternalError,
                                          "Write failed: " + path_.generic_string());
                }
            }

            void close() override
            {
                if (!stream_.is_open())
                {
                    return;
                }
                stream_.flush();
                const bool ok = static_cast<bool>(stream_);
                stream_.close();
                if (!ok)
                {
                    throw FilesystemError(filedock::ErrorCode::InternalError,
                                          "Flush failed: " + path_.generic_string());
                }
            }

        private:
            std::filesystem::path path_;
            std::ofstream stream_;
        };

    } // namespace

    EntryInfo LocalFilesystem::stat(const std::filesystem::path &path) const
    {
        return entry_from_path(path);
    }

    bool LocalFilesystem::exists(const std::filesystem::path &path) const
    {
        std::error_code ec;
        const bool found = std::filesystem::exists(path, ec);
        if (ec && ec != std::errc::no_such_file_or_directory)
        {
            throw_error("exists", path, ec);
        }
        return found;
    }

    std::vector<EntryInfo> LocalFilesystem::list_directory(const std::filesystem::path &path) const
    {
        std::error_code ec;
        std::filesystem::directory_iterator it(path, ec);
        if (ec)
        {
            throw_error("list", path, ec);
        }
        std::vector<EntryInfo> entries;
        for (const auto &entry : it)
        {
            entries.push_back(entry_from_path(entry.path()));
        }
        std::sort(entries.begin(), entries.end(), [](const EntryInfo &lhs, const EntryInfo &rhs)
                  { return lhs.path.filename() < rhs.path.filename(); });
        return entries;
    }

    void LocalFilesystem::create_directories(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec)
        {
            throw_error("mkdir", path, ec);
        }
    }

    std::unique_ptr<InputFile> LocalFilesystem::open_read(const std::filesystem::path &path) const
    {
        return std::make_unique<LocalInputFile>(path);
    }

    std::unique_ptr<OutputFile> LocalFilesystem::open_write(const std::filesystem::path &path, WriteMode mode)
    {
        return std::make_unique<LocalOutputFile>(path, mode);
    }

    void LocalFilesystem::remove(const std::filesystem::path &path)
    {
        std::error_code ec;
        if (!std::filesystem::remove(path, ec))
        {
            throw_error("remove", path, ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory));
        }
    }

    void LocalFilesystem::remove_all(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
        if (ec)
        {
            throw_error("remove", path, ec);
        }
    }

    void LocalFilesystem::rename(const std::filesystem::path &from, const std::filesystem::path &to)
    {
        std::error_code ec;
        std::filesystem::rename(from, to, ec);
        if (ec)
        {
            throw_error("rename", from, ec);
        }
    }

    void LocalFilesystem::resize(const std::filesystem::path &path, std::uint64_t size)
    {
        std::error_code ec;
        std::filesystem::resize_file(path, size, ec);
        if (ec)
        {
            throw_error("resize", path, ec);
        }
    }

} // namespace filedock::server
