#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <status_code.hpp>

#include "filedock/error_codes.hpp"

namespace filedock::server
{

    enum class RangeKind : std::uint8_t
    {
        None,
        Satisfiable,
        Unsatisfiable
    };

    struct ByteRange
    {
        RangeKind kind{RangeKind::None};
        std::uint64_t offset{};
        std::uint64_t length{};
    };

    // Single "bytes=" range. Only the first range of a list is honoured.
    ByteRange parse_range(std::optional<std::string_view> header, std::uint64_t size);

    std::string_view mime_type_for(const std::filesystem::path &path);

    SimpleWeb::StatusCode http_status(filedock::ErrorCode code) noexcept;

    // JSON {error, code, details?}
    std::string error_body(filedock::ErrorCode code, std::string message, std::optional<std::string> details = {});

} // namespace filedock::server
