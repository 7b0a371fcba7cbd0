#include "filedock/protocol.hpp"

#include <array>
#include <stdexcept>

namespace filedock::protocol
{

    namespace
    {

        struct JobTypeMapping
        {
            JobType type;
            std::string_view label;
        };

        constexpr std::array<JobTypeMapping, 3> kJobTypeMappings{{
            {JobType::Copy, "copy"},
            {JobType::Move, "move"},
            {JobType::Delete, "delete"},
        }};

        struct JobStateMapping
        {
            JobState state;
            std::string_view label;
        };

        constexpr std::array<JobStateMapping, 5> kJobStateMappings{{
            {JobState::Pending, "pending"},
            {JobState::Running, "running"},
            {JobState::Completed, "completed"},
            {JobState::Failed, "failed"},
            {JobState::Cancelled, "cancelled"},
        }};

        struct MessageTypeMapping
        {
            MessageType type;
            std::string_view label;
        };

        constexpr std::array<MessageTypeMapping, 7> kMessageTypeMappings{{
            {MessageType::Subscribe, "subscribe"},
            {MessageType::Unsubscribe, "unsubscribe"},
            {MessageType::Ping, "ping"},
            {MessageType::JobUpdate, "job_update"},
            {MessageType::JobComplete, "job_complete"},
            {MessageType::Error, "error"},
            {MessageType::Pong, "pong"},
        }};

        std::optional<std::string> optional_string(const nlohmann::json &json, const char *key)
        {
            if (auto it = json.find(key); it != json.end() && it->is_string())
            {
                return it->get<std::string>();
            }
            return std::nullopt;
        }

    } // namespace

    std::string_view to_string(JobType type) noexcept
    {
        for (const auto &mapping : kJobTypeMappings)
        {
            if (mapping.type == type)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<JobType> job_type_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kJobTypeMappings)
        {
            if (mapping.label == value)
            {
                return mapping.type;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(JobState state) noexcept
    {
        for (const auto &mapping : kJobStateMappings)
        {
            if (mapping.state == state)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<JobState> job_state_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kJobStateMappings)
        {
            if (mapping.label == value)
            {
                return mapping.state;
            }
        }
        return std::nullopt;
    }

    std::string_view to_string(MessageType type) noexcept
    {
        for (const auto &mapping : kMessageTypeMappings)
        {
            if (mapping.type == type)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<MessageType> message_type_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kMessageTypeMappings)
        {
            if (mapping.label == value)
            {
                return mapping.type;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const JobUpdate &update)
    {
        json = {
            {"jobId", update.job_id},
            {"state", to_string(update.state)},
            {"progress", update.progress},
        };
        if (update.error)
        {
            json["error"] = *update.error;
        }
    }

    void from_json(const nlohmann::json &json, JobUpdate &update)
    {
        update.job_id = json.at("jobId").get<std::string>();
        const auto state_label = json.at("state").get<std::string>();
        auto state = job_state_from_string(state_label);
        if (!state)
        {
            throw std::runtime_error("Unknown job state: " + state_label);
        }
        update.state = *state;
        update.progress = json.value("progress", 0);
        update.error = optional_string(json, "error");
    }

    void to_json(nlohmann::json &json, const ClientMessage &message)
    {
        json = {{"type", to_string(message.type)}};
        if (message.job_id)
        {
            json["jobId"] = *message.job_id;
        }
    }

    void from_json(const nlohmann::json &json, ClientMessage &message)
    {
        const auto type_label = json.at("type").get<std::string>();
        auto type = message_type_from_string(type_label);
        if (!type)
        {
            throw std::runtime_error("Unknown message type: " + type_label);
        }
        message.type = *type;
        message.job_id = optional_string(json, "jobId");
        if (message.job_id && message.job_id->empty())
        {
            message.job_id.reset();
        }
    }

    void to_json(nlohmann::json &json, const ServerMessage &message)
    {
        json = {{"type", to_string(message.type)}};
        if (!message.payload.is_null())
        {
            json["payload"] = message.payload;
        }
    }

    void from_json(const nlohmann::json &json, ServerMessage &message)
    {
        const auto type_label = json.at("type").get<std::string>();
        auto type = message_type_from_string(type_label);
        if (!type)
        {
            throw std::runtime_error("Unknown message type: " + type_label);
        }
        message.type = *type;
        message.payload = json.value("payload", nlohmann::json{});
    }

    ServerMessage make_job_message(const JobUpdate &update)
    {
        return {
            .type = is_terminal(update.state) ? MessageType::JobComplete : MessageType::JobUpdate,
            .payload = update,
        };
    }

    ServerMessage make_error_message(std::string message)
    {
        return {
            .type = MessageType::Error,
            .payload = {{"message", std::move(message)}},
        };
    }

    ServerMessage make_pong_message()
    {
        return {.type = MessageType::Pong, .payload = {}};
    }

    void to_json(nlohmann::json &json, const CreateJobRequest &request)
    {
        json = {
            {"type", request.type},
            {"sourcePath", request.source_path},
        };
        if (request.dest_path)
        {
            json["destPath"] = *request.dest_path;
        }
    }

    void from_json(const nlohmann::json &json, CreateJobRequest &request)
    {
        request.type = json.value("type", std::string{});
        request.source_path = json.value("sourcePath", std::string{});
        request.dest_path = optional_string(json, "destPath");
        if (request.dest_path && request.dest_path->empty())
        {
            request.dest_path.reset();
        }
    }

    void to_json(nlohmann::json &json, const CompleteUploadRequest &request)
    {
        json = {
            {"uploadId", request.upload_id},
            {"checksum", request.checksum},
        };
    }

    void from_json(const nlohmann::json &json, CompleteUploadRequest &request)
    {
        request.upload_id = json.value("uploadId", std::string{});
        request.checksum = json.value("checksum", std::string{});
    }

    void to_json(nlohmann::json &json, const ErrorResponse &response)
    {
        json = {
            {"error", response.error},
            {"code", to_string(response.code)},
        };
        if (response.details)
        {
            json["details"] = *response.details;
        }
    }

    void from_json(const nlohmann::json &json, ErrorResponse &response)
    {
        response.error = json.value("error", std::string{});
        const auto code_label = json.value("code", std::string{});
        response.code = error_code_from_string(code_label).value_or(ErrorCode::InternalError);
        response.details = optional_string(json, "details");
    }

} // namespace filedock::protocol
