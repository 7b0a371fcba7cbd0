#include "filedock/server/memory_filesystem.hpp"

#include <algorithm>
#include <cstring>

namespace filedock::server
{

    namespace
    {

        std::string child_prefix(const std::string &key)
        {
            return key == "/" ? key : key + "/";
        }

        bool is_descendant(const std::string &candidate, const std::string &key)
        {
            return candidate.starts_with(child_prefix(key)) && candidate != key;
        }

        class MemoryInputFile final : public InputFile
        {
        public:
            explicit MemoryInputFile(std::vector<std::byte> data) : data_(std::move(data)) {}

            std::size_t read(std::span<std::byte> buffer) override
            {
                const auto remaining = data_.size() - std::min<std::size_t>(position_, data_.size());
                const auto count = std::min(remaining, buffer.size());
                if (count > 0)
                {
                    std::memcpy(buffer.data(), data_.data() + position_, count);
                }
                position_ += count;
                return count;
            }

            void seek(std::uint64_t offset) override
            {
                position_ = static_cast<std::size_t>(std::min<std::uint64_t>(offset, data_.size()));
            }

        private:
            std::vector<std::byte> data_;
            std::size_t position_{0};
        };

    } // namespace

    class MemoryOutputFile final : public OutputFile
    {
    public:
        MemoryOutputFile(MemoryFilesystem &filesystem, std::string key) : filesystem_(filesystem), key_(std::move(key)) {}

        void write(std::span<const std::byte> data) override
        {
            if (closed_)
            {
                throw FilesystemError(filedock::ErrorCode::InternalError, "Write after close: " + key_);
            }
            std::lock_guard lock(filesystem_.mutex_);
            filesystem_.append_locked(key_, data);
        }

        void close() override { closed_ = true; }

    private:
        MemoryFilesystem &filesystem_;
        std::string key_;
        bool closed_{false};
    };

    MemoryFilesystem::MemoryFilesystem(const Clock &clock) : clock_(clock)
    {
        nodes_.emplace("/", Node{.is_directory = true, .data = {}, .modified = clock_.now()});
    }

    std::string MemoryFilesystem::key(const std::filesystem::path &path)
    {
        auto normal = (std::filesystem::path("/") / path).lexically_normal().generic_string();
        while (normal.size() > 1 && normal.back() == '/')
        {
            normal.pop_back();
        }
        return normal;
    }

    std::string MemoryFilesystem::parent_key(const std::string &key)
    {
        const auto slash = key.find_last_of('/');
        if (slash == 0 || slash == std::string::npos)
        {
            return "/";
        }
        return key.substr(0, slash);
    }

    const MemoryFilesystem::Node &MemoryFilesystem::find_locked(const std::string &key) const
    {
        auto it = nodes_.find(key);
        if (it == nodes_.end())
        {
            throw FilesystemError(filedock::ErrorCode::NotFound, "No such file or directory: " + key);
        }
        return it->second;
    }

    void MemoryFilesystem::require_parent_directory_locked(const std::string &key) const
    {
        const auto &parent = find_locked(parent_key(key));
        if (!parent.is_directory)
        {
            throw FilesystemError(filedock::ErrorCode::NotFound, "Parent is not a directory: " + key);
        }
    }

    void MemoryFilesystem::append_locked(const std::string &key, std::span<const std::byte> data)
    {
        auto it = nodes_.find(key);
        if (it == nodes_.end() || it->second.is_directory)
        {
            throw FilesystemError(filedock::ErrorCode::NotFound, "File vanished during write: " + key);
        }
        if (auto failing = failing_writes_.find(key); failing != failing_writes_.end())
        {
            const auto kept = std::min(failing->second, data.size());
            failing_writes_.erase(failing);
            it->second.data.insert(it->second.data.end(), data.begin(), data.begin() + static_cast<std::ptrdiff_t>(kept));
            it->second.modified = clock_.now();
            throw FilesystemError(filedock::ErrorCode::InternalError, "No space left on device: " + key);
        }
        it->second.data.insert(it->second.data.end(), data.begin(), data.end());
        it->second.modified = clock_.now();
    }

    EntryInfo MemoryFilesystem::stat(const std::filesystem::path &path) const
    {
        const auto node_key = key(path);
        std::lock_guard lock(mutex_);
        const auto &node = find_locked(node_key);
        return EntryInfo{
            .path = node_key,
            .is_directory = node.is_directory,
            .size = node.is_directory ? 0 : static_cast<std::uint64_t>(node.data.size()),
            .modified = node.modified,
        };
    }

    bool MemoryFilesystem::exists(const std::filesystem::path &path) const
    {
        const auto node_key = key(path);
        std::lock_guard lock(mutex_);
        return nodes_.contains(node_key);
    }

    std::vector<EntryInfo> MemoryFilesystem::list_directory(const std::filesystem::path &path) const
    {
        const auto node_key = key(path);
        std::lock_guard lock(mutex_);
        const auto &node = find_locked(node_key);
        if (!node.is_directory)
        {
            throw FilesystemError(filedock::ErrorCode::NotFound, "Not a directory: " + node_key);
        }

        const auto prefix = child_prefix(node_key);
        std::vector<EntryInfo> entries;
        for (auto it = nodes_.lower_bound(prefix); it != nodes_.end() && it->first.starts_with(prefix); ++it)
        {
            if (it->first == node_key || it->first.find('/', prefix.size()) != std::string::npos)
            {
                continue;
            }
            entries.push_back(EntryInfo{
                .path = it->first,
                .is_directory = it->second.is_directory,
                .size = it->second.is_directory ? 0 : static_cast<std::uint64_t>(it->second.data.size()),
                .modified = it->second.modified,
            });
        }
        return entries;
    }

    void MemoryFilesystem::create_directories(const std::filesystem::path &path)
    {
        const auto node_key = key(path);
        std::lock_guard lock(mutex_);
        std::vector<std::string> chain;
        for (auto current = node_key; current != "/"; current = parent_key(current))
        {
            chain.push_back(current);
        }
        std::reverse(chain.begin(), chain.end());
        for (const auto &element : chain)
        {
            auto it = nodes_.find(element);
            if (it == nodes_.end())
            {
                nodes_.emplace(element, Node{.is_directory = true, .data = {}, .modified = clock_.now()});
            }
            else if (!it->second.is_directory)
            {
                throw FilesystemError(filedock::ErrorCode::Conflict, "File exists: " + element);
            }
        }
    }

    std::unique_ptr<InputFile> MemoryFilesystem::open_read(const std::filesystem::path &path) const
    {
        const auto node_key = key(path);
        std::lock_guard lock(mutex_);
        if (failing_reads_.contains(node_key))
        {
            throw FilesystemError(filedock::ErrorCode::InternalError, "Input/output error: " + node_key);
        }
        const auto &node = find_locked(node_key);
        if (node.is_directory)
        {
            throw FilesystemError(filedock::ErrorCode::Conflict, "Is a directory: " + node_key);
        }
        return std::make_unique<MemoryInputFile>(node.data);
    }

    std::unique_ptr<OutputFile> MemoryFilesystem::open_write(const std::filesystem::path &path, WriteMode mode)
    {
        const auto node_key = key(path);
        std::lock_guard lock(mutex_);
        require_parent_directory_locked(node_key);
        auto it = nodes_.find(node_key);
        if (it == nodes_.end())
        {
            nodes_.emplace(node_key, Node{.is_directory = false, .data = {}, .modified = clock_.now()});
        }
        else if (it->second.is_directory)
        {
            throw FilesystemError(filedock::ErrorCode::Conflict, "Is a directory: " + node_key);
        }
        else if (mode == WriteMode::Truncate)
        {
            it->second.data.clear();
            it->second.modified = clock_.now();
        }
        return std::make_unique<MemoryOutputFile>(*this, node_key);
    }

    void MemoryFilesystem::remove(const std::filesystem::path &path)
    {
        const auto node_key = key(path);
        std::lock_guard lock(mutex_);
        if (node_key == "/")
        {
            throw FilesystemError(filedock::ErrorCode::AccessDenied, "Cannot remove the root directory");
        }
        const auto &node = find_locked(node_key);
        if (node.is_directory)
        {
            const auto prefix = child_prefix(node_key);
            auto next = nodes_.lower_bound(prefix);
            if (next != nodes_.end() && next->first.starts_with(prefix))
            {
                throw FilesystemError(filedock::ErrorCode::Conflict, "Directory not empty: " + node_key);
            }
        }
        nodes_.erase(node_key);
    }

    void MemoryFilesystem::remove_all(const std::filesystem::path &path)
    {
        const auto node_key = key(path);
        std::lock_guard lock(mutex_);
        if (node_key == "/")
        {
            throw FilesystemError(filedock::ErrorCode::AccessDenied, "Cannot remove the root directory");
        }
        std::erase_if(nodes_, [&](const auto &item)
                      { return item.first == node_key || is_descendant(item.first, node_key); });
    }

    void MemoryFilesystem::rename(const std::filesystem::path &from, const std::filesystem::path &to)
    {
        const auto from_key = key(from);
        const auto to_key = key(to);
        std::lock_guard lock(mutex_);
        const auto &source = find_locked(from_key);
        require_parent_directory_locked(to_key);
        if (from_key == to_key)
        {
            return;
        }
        if (is_descendant(to_key, from_key))
        {
            throw FilesystemError(filedock::ErrorCode::InvalidPath, "Cannot move a directory into itself: " + from_key);
        }
        if (auto existing = nodes_.find(to_key); existing != nodes_.end())
        {
            if (existing->second.is_directory || source.is_directory)
            {
                throw FilesystemError(filedock::ErrorCode::Conflict, "Destination exists: " + to_key);
            }
        }

        std::vector<std::pair<std::string, Node>> moved;
        for (auto it = nodes_.begin(); it != nodes_.end();)
        {
            if (it->first == from_key || is_descendant(it->first, from_key))
            {
                moved.emplace_back(to_key + it->first.substr(from_key.size()), std::move(it->second));
                it = nodes_.erase(it);
            }
            else
            {
                ++it;
            }
        }
        for (auto &[moved_key, node] : moved)
        {
            nodes_.insert_or_assign(moved_key, std::move(node));
        }
    }

    void MemoryFilesystem::resize(const std::filesystem::path &path, std::uint64_t size)
    {
        const auto node_key = key(path);
        std::lock_guard lock(mutex_);
        auto it = nodes_.find(node_key);
        if (it == nodes_.end())
        {
            throw FilesystemError(filedock::ErrorCode::NotFound, "No such file or directory: " + node_key);
        }
        if (it->second.is_directory)
        {
            throw FilesystemError(filedock::ErrorCode::Conflict, "Is a directory: " + node_key);
        }
        it->second.data.resize(static_cast<std::size_t>(size));
        it->second.modified = clock_.now();
    }

    void MemoryFilesystem::write_file(const std::filesystem::path &path, const std::string &content)
    {
        auto file = open_write(path, WriteMode::Truncate);
        file->write(std::as_bytes(std::span(content.data(), content.size())));
        file->close();
    }

    std::string MemoryFilesystem::read_file(const std::filesystem::path &path) const
    {
        const auto node_key = key(path);
        std::lock_guard lock(mutex_);
        const auto &node = find_locked(node_key);
        return std::string(reinterpret_cast<const char *>(node.data.data()), node.data.size());
    }

    void MemoryFilesystem::fail_reads_of(const std::filesystem::path &path)
    {
        const auto node_key = key(path);
        std::lock_guard lock(mutex_);
        failing_reads_.insert(node_key);
    }

    void MemoryFilesystem::fail_next_write_to(const std::filesystem::path &path, std::size_t bytes_kept)
    {
        const auto node_key = key(path);
        std::lock_guard lock(mutex_);
        failing_writes_[node_key] = bytes_kept;
    }

} // namespace filedock::server
