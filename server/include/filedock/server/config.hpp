#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "filedock/server/mount_table.hpp"

namespace filedock::server
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{8080};
        std::vector<MountPoint> mounts;
        // user -> token
        std::unordered_map<std::string, std::string> tokens;
        std::vector<std::string> allowed_origins;
        std::size_t http_threads{0};
        std::size_t job_workers{4};
        std::size_t job_queue{100};
        std::size_t copy_buffer{1024 * 1024};
        std::chrono::seconds upload_timeout{std::chrono::seconds{3600}};
        std::chrono::seconds upload_sweep{std::chrono::seconds{60}};
        std::size_t max_uploads{64};
        std::optional<std::filesystem::path> state_dir;
        std::chrono::seconds ping_period{std::chrono::seconds{30}};
        std::uint32_t max_missed_pings{2};
        std::size_t observer_buffer{256};
        std::optional<std::filesystem::path> log_file;
        std::string log_level{"info"};
    };

} // namespace filedock::server
