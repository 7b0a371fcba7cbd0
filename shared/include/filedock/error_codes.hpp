/**
 * FileDock - Error taxonomy shared by the core and the REST surface.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace filedock
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        ValidationError = 1,
        NotFound = 2,
        JobNotFound = 3,
        NotCancellable = 4,
        QueueFull = 5,
        UploadLimit = 6,
        UploadNotFound = 7,
        ChunkMissing = 8,
        ChecksumMismatch = 9,
        Unauthorized = 10,
        AccessDenied = 11,
        ReadOnly = 12,
        InvalidPath = 13,
        Conflict = 14,
        InternalError = 15
    };

    // Wire label, e.g. "CHUNK_MISSING".
    std::string_view to_string(ErrorCode code) noexcept;

    std::optional<ErrorCode> error_code_from_string(std::string_view value) noexcept;

    // Resource errors are reported separately from validation errors.
    constexpr bool is_resource_error(ErrorCode code) noexcept
    {
        return code == ErrorCode::QueueFull || code == ErrorCode::UploadLimit;
    }

} // namespace filedock
