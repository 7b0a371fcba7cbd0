#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "filedock/protocol.hpp"
#include "filedock/server/clock.hpp"

namespace filedock::server
{

    struct Job
    {
        std::string id;
        protocol::JobType type{protocol::JobType::Copy};
        protocol::JobState state{protocol::JobState::Pending};
        int progress{};
        std::string source_path;
        std::optional<std::string> dest_path;
        std::optional<std::string> error;
        Timestamp created_at{};
        std::optional<Timestamp> started_at;
        std::optional<Timestamp> completed_at;
    };

    protocol::JobUpdate to_update(const Job &job);

    void to_json(nlohmann::json &json, const Job &job);

} // namespace filedock::server
