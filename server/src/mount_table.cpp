#include "filedock/server/mount_table.hpp"

#include <stdexcept>

#include "filedock/server/filesystem.hpp"

namespace filedock::server
{

    namespace
    {
        constexpr std::string_view kReadOnlySuffix = ":ro";

        bool valid_mount_name(std::string_view name)
        {
            return !name.empty() && name != "." && name != ".." && name.find('/') == std::string_view::npos;
        }
    } // namespace

    MountTable::MountTable(std::vector<MountPoint> mounts) : mounts_(std::move(mounts))
    {
        for (std::size_t i = 0; i < mounts_.size(); ++i)
        {
            if (!valid_mount_name(mounts_[i].name))
            {
                throw std::invalid_argument("Invalid mount name: " + mounts_[i].name);
            }
            for (std::size_t j = 0; j < i; ++j)
            {
                if (mounts_[j].name == mounts_[i].name)
                {
                    throw std::invalid_argument("Duplicate mount name: " + mounts_[i].name);
                }
            }
            mounts_[i].root = mounts_[i].root.lexically_normal();
        }
    }

    ResolvedPath MountTable::resolve(std::string_view virtual_path, Access access) const
    {
        if (virtual_path.empty())
        {
            throw FilesystemError(filedock::ErrorCode::InvalidPath, "Path is empty");
        }
        if (virtual_path.find('\0') != std::string_view::npos)
        {
            throw FilesystemError(filedock::ErrorCode::InvalidPath, "Path contains a NUL byte");
        }

        std::vector<std::string> parts;
        std::filesystem::path requested{std::string(virtual_path)};
        for (const auto &part : requested)
        {
            const auto part_string = part.generic_string();
            if (part_string.empty() || part_string == "." || part_string == "/")
            {
                continue;
            }
            if (part_string == "..")
            {
                throw FilesystemError(filedock::ErrorCode::InvalidPath, "Path traversal detected");
            }
            parts.push_back(part_string);
        }
        if (parts.empty())
        {
            throw FilesystemError(filedock::ErrorCode::InvalidPath, "Path does not name a mount point");
        }

        const auto *mount = find(parts.front());
        if (mount == nullptr)
        {
            throw FilesystemError(filedock::ErrorCode::NotFound, "Unknown mount point: " + parts.front());
        }
        if (access == Access::Write && mount->read_only)
        {
            throw FilesystemError(filedock::ErrorCode::ReadOnly, "Mount point is read-only: " + mount->name);
        }

        ResolvedPath resolved{};
        resolved.mount = mount->name;
        resolved.physical = mount->root;
        resolved.virtual_path = "/" + mount->name;
        for (std::size_t i = 1; i < parts.size(); ++i)
        {
            resolved.physical /= parts[i];
            resolved.virtual_path += "/" + parts[i];
        }
        resolved.is_mount_root = parts.size() == 1;
        return resolved;
    }

    const MountPoint *MountTable::find(std::string_view name) const
    {
        for (const auto &mount : mounts_)
        {
            if (mount.name == name)
            {
                return &mount;
            }
        }
        return nullptr;
    }

    std::optional<MountPoint> parse_mount_spec(std::string_view spec)
    {
        const auto equals = spec.find('=');
        if (equals == std::string_view::npos || equals == 0 || equals + 1 == spec.size())
        {
            return std::nullopt;
        }
        MountPoint mount{};
        mount.name = std::string(spec.substr(0, equals));
        auto path = spec.substr(equals + 1);
        if (path.ends_with(kReadOnlySuffix))
        {
            mount.read_only = true;
            path.remove_suffix(kReadOnlySuffix.size());
        }
        if (path.empty() || !valid_mount_name(mount.name))
        {
            return std::nullopt;
        }
        mount.root = std::filesystem::path(std::string(path));
        return mount;
    }

} // namespace filedock::server
