#include "filedock/error_codes.hpp"

#include <array>

namespace filedock
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view label;
        };

        constexpr std::array<ErrorCodeDescription, 16> kDescriptions{{
            {ErrorCode::Ok, "OK"},
            {ErrorCode::ValidationError, "VALIDATION_ERROR"},
            {ErrorCode::NotFound, "NOT_FOUND"},
            {ErrorCode::JobNotFound, "JOB_NOT_FOUND"},
            {ErrorCode::NotCancellable, "NOT_CANCELLABLE"},
            {ErrorCode::QueueFull, "QUEUE_FULL"},
            {ErrorCode::UploadLimit, "UPLOAD_LIMIT"},
            {ErrorCode::UploadNotFound, "UPLOAD_NOT_FOUND"},
            {ErrorCode::ChunkMissing, "CHUNK_MISSING"},
            {ErrorCode::ChecksumMismatch, "CHECKSUM_MISMATCH"},
            {ErrorCode::Unauthorized, "UNAUTHORIZED"},
            {ErrorCode::AccessDenied, "ACCESS_DENIED"},
            {ErrorCode::ReadOnly, "READ_ONLY"},
            {ErrorCode::InvalidPath, "INVALID_PATH"},
            {ErrorCode::Conflict, "CONFLICT"},
            {ErrorCode::InternalError, "INTERNAL_ERROR"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.label;
            }
        }
        return "INTERNAL_ERROR";
    }

    std::optional<ErrorCode> error_code_from_string(std::string_view value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.label == value)
            {
                return entry.code;
            }
        }
        return std::nullopt;
    }

} // namespace filedock
