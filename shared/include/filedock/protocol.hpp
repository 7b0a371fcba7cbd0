/**
 * FileDock - Shared wire schema: job enums, observer socket messages and REST bodies.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "filedock/error_codes.hpp"

namespace filedock::protocol
{

    enum class JobType : std::uint8_t
    {
        Copy,
        Move,
        Delete
    };

    std::string_view to_string(JobType type) noexcept;
    std::optional<JobType> job_type_from_string(std::string_view value) noexcept;

    enum class JobState : std::uint8_t
    {
        Pending,
        Running,
        Completed,
        Failed,
        Cancelled
    };

    std::string_view to_string(JobState state) noexcept;
    std::optional<JobState> job_state_from_string(std::string_view value) noexcept;

    constexpr bool is_terminal(JobState state) noexcept
    {
        return state == JobState::Completed || state == JobState::Failed || state == JobState::Cancelled;
    }

    struct JobUpdate
    {
        std::string job_id;
        JobState state{JobState::Pending};
        int progress{};
        std::optional<std::string> error{};
    };

    void to_json(nlohmann::json &json, const JobUpdate &update);
    void from_json(const nlohmann::json &json, JobUpdate &update);

    enum class MessageType : std::uint8_t
    {
        Subscribe,
        Unsubscribe,
        Ping,
        JobUpdate,
        JobComplete,
        Error,
        Pong
    };

    std::string_view to_string(MessageType type) noexcept;
    std::optional<MessageType> message_type_from_string(std::string_view value) noexcept;

    // Client -> server: {type, jobId?}
    struct ClientMessage
    {
        MessageType type{MessageType::Ping};
        std::optional<std::string> job_id{};
    };

    void to_json(nlohmann::json &json, const ClientMessage &message);
    void from_json(const nlohmann::json &json, ClientMessage &message);

    // Server -> client: {type, payload?}
    struct ServerMessage
    {
        MessageType type{MessageType::Pong};
        nlohmann::json payload{};
    };

    void to_json(nlohmann::json &json, const ServerMessage &message);
    void from_json(const nlohmann::json &json, ServerMessage &message);

    // job_complete when the update carries a terminal state, job_update otherwise.
    ServerMessage make_job_message(const JobUpdate &update);
    ServerMessage make_error_message(std::string message);
    ServerMessage make_pong_message();

    struct CreateJobRequest
    {
        std::string type{};
        std::string source_path{};
        std::optional<std::string> dest_path{};
    };

    void to_json(nlohmann::json &json, const CreateJobRequest &request);
    void from_json(const nlohmann::json &json, CreateJobRequest &request);

    struct CompleteUploadRequest
    {
        std::string upload_id{};
        std::string checksum{};
    };

    void to_json(nlohmann::json &json, const CompleteUploadRequest &request);
    void from_json(const nlohmann::json &json, CompleteUploadRequest &request);

    struct ErrorResponse
    {
        std::string error{};
        ErrorCode code{ErrorCode::InternalError};
        std::optional<std::string> details{};
    };

    void to_json(nlohmann::json &json, const ErrorResponse &response);
    void from_json(const nlohmann::json &json, ErrorResponse &response);

} // namespace filedock::protocol
