#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace filedock::server
{

    struct MountPoint
    {
        std::string name;
        std::filesystem::path root;
        bool read_only{};
    };

    enum class Access : std::uint8_t
    {
        Read,
        Write
    };

    struct ResolvedPath
    {
        std::string mount;
        std::string virtual_path;
        std::filesystem::path physical;
        bool is_mount_root{};
    };

    // Maps virtual "/<mount>/<relative>" paths onto mount roots. Throws FilesystemError.
    class MountTable
    {
    public:
        explicit MountTable(std::vector<MountPoint> mounts);

        ResolvedPath resolve(std::string_view virtual_path, Access access) const;

        const std::vector<MountPoint> &mounts() const noexcept { return mounts_; }

    private:
        const MountPoint *find(std::string_view name) const;

        std::vector<MountPoint> mounts_;
    };

    // "name=path" or "name=path:ro"
    std::optional<MountPoint> parse_mount_spec(std::string_view spec);

} // namespace filedock::server
