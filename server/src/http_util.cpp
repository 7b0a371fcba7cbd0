#include "filedock/server/http_util.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <utility>

#include <nlohmann/json.hpp>

#include "filedock/protocol.hpp"

namespace filedock::server
{

    namespace
    {

        constexpr std::array<std::pair<std::string_view, std::string_view>, 40> kMimeTypes{{
            {".aac", "audio/aac"},
            {".avi", "video/x-msvideo"},
            {".bmp", "image/bmp"},
            {".css", "text/css; charset=utf-8"},
            {".csv", "text/csv; charset=utf-8"},
            {".doc", "application/msword"},
            {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
            {".flac", "audio/flac"},
            {".gif", "image/gif"},
            {".gz", "application/gzip"},
            {".htm", "text/html; charset=utf-8"},
            {".html", "text/html; charset=utf-8"},
            {".ico", "image/vnd.microsoft.icon"},
            {".jpeg", "image/jpeg"},
            {".jpg", "image/jpeg"},
            {".js", "text/javascript; charset=utf-8"},
            {".json", "application/json"},
            {".m4a", "audio/mp4"},
            {".md", "text/markdown; charset=utf-8"},
            {".mkv", "video/x-matroska"},
            {".mov", "video/quicktime"},
            {".mp3", "audio/mpeg"},
            {".mp4", "video/mp4"},
            {".ogg", "audio/ogg"},
            {".pdf", "application/pdf"},
            {".png", "image/png"},
            {".svg", "image/svg+xml"},
            {".tar", "application/x-tar"},
            {".tif", "image/tiff"},
            {".tiff", "image/tiff"},
            {".ts", "video/mp2t"},
            {".txt", "text/plain; charset=utf-8"},
            {".wav", "audio/wav"},
            {".webm", "video/webm"},
            {".webp", "image/webp"},
            {".xls", "application/vnd.ms-excel"},
            {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
            {".xml", "text/xml; charset=utf-8"},
            {".yaml", "application/yaml"},
            {".zip", "application/zip"},
        }};

        constexpr std::string_view kDefaultMimeType = "application/octet-stream";

        std::optional<std::uint64_t> parse_number(std::string_view text)
        {
            if (text.empty())
            {
                return std::nullopt;
            }
            std::uint64_t value = 0;
            const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || end != text.data() + text.size())
            {
                return std::nullopt;
            }
            return value;
        }

        std::string_view trim(std::string_view text)
        {
            while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
            {
                text.remove_prefix(1);
            }
            while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
            {
                text.remove_suffix(1);
            }
            return text;
        }

    } // namespace

    ByteRange parse_range(std::optional<std::string_view> header, std::uint64_t size)
    {
        if (!header)
        {
            return {};
        }
        auto spec = trim(*header);
        constexpr std::string_view prefix = "bytes=";
        if (!spec.starts_with(prefix))
        {
            return {};
        }
        spec.remove_prefix(prefix.size());
        if (const auto comma = spec.find(','); comma != std::string_view::npos)
        {
            spec = spec.substr(0, comma);
        }
        spec = trim(spec);

        const ByteRange unsatisfiable{.kind = RangeKind::Unsatisfiable};
        const auto dash = spec.find('-');
        if (dash == std::string_view::npos || size == 0)
        {
            return unsatisfiable;
        }

        const auto first = trim(spec.substr(0, dash));
        const auto last = trim(spec.substr(dash + 1));
        if (first.empty())
        {
            // Suffix form: the final N bytes.
            const auto suffix = parse_number(last);
            if (!suffix || *suffix == 0)
            {
                return unsatisfiable;
            }
            const auto length = std::min(*suffix, size);
            return {.kind = RangeKind::Satisfiable, .offset = size - length, .length = length};
        }

        const auto start = parse_number(first);
        if (!start || *start >= size)
        {
            return unsatisfiable;
        }
        auto end = size - 1;
        if (!last.empty())
        {
            const auto parsed = parse_number(last);
            if (!parsed || *parsed < *start)
            {
                return unsatisfiable;
            }
            end = std::min(*parsed, size - 1);
        }
        return {.kind = RangeKind::Satisfiable, .offset = *start, .length = end - *start + 1};
    }

    std::string_view mime_type_for(const std::filesystem::path &path)
    {
        auto extension = path.extension().string();
        std::transform(extension.begin(), extension.end(), extension.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        const auto it = std::find_if(kMimeTypes.begin(), kMimeTypes.end(), [&](const auto &entry)
                                     { return entry.first == extension; });
        return it == kMimeTypes.end() ? kDefaultMimeType : it->second;
    }

    SimpleWeb::StatusCode http_status(filedock::ErrorCode code) noexcept
    {
        using filedock::ErrorCode;
        using SimpleWeb::StatusCode;
        switch (code)
        {
        case ErrorCode::Ok:
            return StatusCode::success_ok;
        case ErrorCode::ValidationError:
        case ErrorCode::NotCancellable:
        case ErrorCode::InvalidPath:
            return StatusCode::client_error_bad_request;
        case ErrorCode::NotFound:
        case ErrorCode::JobNotFound:
        case ErrorCode::UploadNotFound:
            return StatusCode::client_error_not_found;
        case ErrorCode::QueueFull:
        case ErrorCode::UploadLimit:
            return StatusCode::server_error_service_unavailable;
        case ErrorCode::ChunkMissing:
        case ErrorCode::Conflict:
            return StatusCode::client_error_conflict;
        case ErrorCode::ChecksumMismatch:
            return StatusCode::client_error_unprocessable_entity;
        case ErrorCode::Unauthorized:
            return StatusCode::client_error_unauthorized;
        case ErrorCode::AccessDenied:
        case ErrorCode::ReadOnly:
            return StatusCode::client_error_forbidden;
        case ErrorCode::InternalError:
            return StatusCode::server_error_internal_server_error;
        }
        return StatusCode::server_error_internal_server_error;
    }

    std::string error_body(filedock::ErrorCode code, std::string message, std::optional<std::string> details)
    {
        const protocol::ErrorResponse response{
            .error = std::move(message),
            .code = code,
            .details = std::move(details),
        };
        return nlohmann::json(response).dump();
    }

} // namespace filedock::server
