#include "filedock/server/http_api.hpp"

#include <algorithm>
#include <charconv>
#include <span>
#include <vector>

#include <spdlog/spdlog.h>

#include "filedock/protocol.hpp"
#include "filedock/server/http_util.hpp"
#include "filedock/server/job.hpp"

namespace filedock::server
{

    namespace
    {
        using SimpleWeb::StatusCode;

        ApiResponse json_response(StatusCode status, const nlohmann::json &body)
        {
            ApiResponse response{.status = status, .header = {}, .body = body.dump()};
            response.header.emplace("Content-Type", "application/json");
            return response;
        }

        ApiResponse error_response(filedock::ErrorCode code, std::string message,
                                   std::optional<std::string> details = {})
        {
            ApiResponse response{.status = http_status(code), .header = {}, .body = {}};
            response.header.emplace("Content-Type", "application/json");
            response.body = error_body(code, std::move(message), std::move(details));
            return response;
        }

        std::optional<std::string> header_value(const SimpleWeb::CaseInsensitiveMultimap &header,
                                                const std::string &name)
        {
            auto it = header.find(name);
            if (it == header.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

        std::optional<std::uint64_t> parse_unsigned(const std::string &text)
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

        // Parsed X-* upload headers, or the 400 response describing the first bad one.
        struct UploadHeaders
        {
            std::string upload_id;
            std::uint64_t chunk_index{};
            std::uint64_t chunk_size{};
            std::uint64_t total_size{};
            std::optional<std::uint64_t> total_chunks;
            std::optional<std::string> checksum;
        };

        std::optional<ApiResponse> parse_upload_headers(const SimpleWeb::CaseInsensitiveMultimap &header,
                                                        UploadHeaders &parsed)
        {
            auto upload_id = header_value(header, "X-Upload-ID");
            if (!upload_id || upload_id->empty())
            {
                return error_response(filedock::ErrorCode::ValidationError, "X-Upload-ID header is required");
            }
            if (!valid_upload_id(*upload_id))
            {
                return error_response(filedock::ErrorCode::ValidationError,
                                      "X-Upload-ID may only contain letters, digits, '.', '_' and '-'");
            }
            parsed.upload_id = std::move(*upload_id);

            const auto required = [&](const std::string &name, bool positive,
                                      std::uint64_t &target) -> std::optional<ApiResponse>
            {
                const auto value = header_value(header, name);
                if (!value)
                {
                    return error_response(filedock::ErrorCode::ValidationError, name + " header is required");
                }
                const auto number = parse_unsigned(*value);
                if (!number || (positive && *number == 0))
                {
                    return error_response(filedock::ErrorCode::ValidationError,
                                          name + (positive ? " must be a positive integer"
                                                           : " must be a non-negative integer"));
                }
                target = *number;
                return std::nullopt;
            };

            if (auto error = required("X-Chunk-Index", false, parsed.chunk_index))
            {
                return error;
            }
            if (auto error = required("X-Chunk-Size", true, parsed.chunk_size))
            {
                return error;
            }
            if (auto error = required("X-Total-Size", true, parsed.total_size))
            {
                return error;
            }
            if (header.find("X-Total-Chunks") != header.end())
            {
                std::uint64_t total_chunks = 0;
                if (auto error = required("X-Total-Chunks", true, total_chunks))
                {
                    return error;
                }
                parsed.total_chunks = total_chunks;
            }
            if (auto checksum = header_value(header, "X-Checksum"); checksum && !checksum->empty())
            {
                parsed.checksum = std::move(*checksum);
            }
            return std::nullopt;
        }

        ApiRequest to_api_request(const HttpServer::Request &request)
        {
            ApiRequest api{
                .method = request.method,
                .query_string = request.query_string,
                .header = request.header,
                .body = {},
                .match = {},
            };
            if (request.path_match.size() > 1)
            {
                api.match = SimpleWeb::Percent::decode(request.path_match[1].str());
            }
            return api;
        }

        void write_response(const std::shared_ptr<HttpServer::Response> &response, const ApiResponse &result)
        {
            response->write(result.status, result.body, result.header);
        }

        std::string virtual_path(const std::string &match)
        {
            return match.starts_with('/') ? match : "/" + match;
        }

    } // namespace

    nlohmann::json upload_status_json(const TransferSession &session)
    {
        std::vector<std::uint64_t> missing;
        for (auto index = session.next_chunk; index < session.total_chunks; ++index)
        {
            missing.push_back(index);
        }
        return {
            {"uploadId", session.upload_id},
            {"path", session.path},
            {"totalChunks", session.total_chunks},
            {"receivedChunks", session.next_chunk},
            {"lastContiguousChunk", session.last_contiguous_chunk()},
            {"nextExpectedChunk", session.next_chunk},
            {"missingChunks", missing},
            {"complete", session.all_bytes_received()},
            {"createdAt", format_timestamp(session.created_at)},
            {"lastActivity", format_timestamp(session.last_activity)},
        };
    }

    HttpApi::HttpApi(ApiServices services) : services_(services) {}

    void HttpApi::register_routes(HttpServer &server)
    {
        const auto route = [this, &server](const std::string &pattern, const std::string &method, auto handler)
        {
            server.resource[pattern][method] = [this, handler](std::shared_ptr<HttpServer::Response> response,
                                                               std::shared_ptr<HttpServer::Request> request)
            {
                auto api = to_api_request(*request);
                if (auto denied = authenticate(api))
                {
                    write_response(response, *denied);
                    return;
                }
                ApiResponse result;
                try
                {
                    api.body = request->content.string();
                    result = (this->*handler)(api);
                }
                catch (const std::exception &ex)
                {
                    spdlog::error("{} {} failed: {}", request->method, request->path, ex.what());
                    result = error_response(filedock::ErrorCode::InternalError, "Internal server error");
                }
                write_response(response, result);
            };
        };

        route("^/api/v1/jobs/?$", "POST", &HttpApi::create_job);
        route("^/api/v1/jobs/?$", "GET", &HttpApi::list_jobs);
        route("^/api/v1/jobs/([^/]+)$", "GET", &HttpApi::get_job);
        route("^/api/v1/jobs/([^/]+)$", "DELETE", &HttpApi::cancel_job);

        route("^/api/v1/upload/(.+)$", "POST", &HttpApi::put_chunk);
        route("^/api/v1/upload/status(/.*)?$", "GET", &HttpApi::upload_status_by_query);
        route("^/api/v1/uploads/complete$", "POST", &HttpApi::complete_upload);
        route("^/api/v1/uploads/([^/]+)$", "GET", &HttpApi::upload_status);
        route("^/api/v1/uploads/([^/]+)$", "DELETE", &HttpApi::abort_upload);

        const auto download_route = [this, &server](const std::string &pattern, bool attachment)
        {
            server.resource[pattern]["GET"] = [this, attachment](std::shared_ptr<HttpServer::Response> response,
                                                                 std::shared_ptr<HttpServer::Request> request)
            {
                const auto api = to_api_request(*request);
                if (auto denied = authenticate(api))
                {
                    write_response(response, *denied);
                    return;
                }
                serve_download(response, api, attachment);
            };
        };
        download_route("^/api/v1/download/(.+)$", true);
        download_route("^/api/v1/preview/(.+)$", false);

        server.default_resource["GET"] = [](std::shared_ptr<HttpServer::Response> response,
                                            std::shared_ptr<HttpServer::Request> /*request*/)
        {
            write_response(response, error_response(filedock::ErrorCode::NotFound, "Route not found"));
        };
    }

    std::optional<ApiResponse> HttpApi::authenticate(const ApiRequest &request) const
    {
        std::optional<std::string> token;
        if (auto authorization = header_value(request.header, "Authorization"))
        {
            token = bearer_token(*authorization);
        }
        if (!token)
        {
            const auto query = SimpleWeb::QueryString::parse(request.query_string);
            if (auto it = query.find("token"); it != query.end() && !it->second.empty())
            {
                token = it->second;
            }
        }
        if (token && services_.verifier.verify(*token))
        {
            return std::nullopt;
        }
        return error_response(filedock::ErrorCode::Unauthorized, "Authentication required");
    }

    ApiResponse HttpApi::create_job(const ApiRequest &request)
    {
        protocol::CreateJobRequest body;
        try
        {
            body = nlohmann::json::parse(request.body).get<protocol::CreateJobRequest>();
        }
        catch (const nlohmann::json::exception &)
        {
            return error_response(filedock::ErrorCode::ValidationError, "Invalid request body");
        }

        try
        {
            const auto job = services_.scheduler.submit(body);
            return json_response(StatusCode::success_created, nlohmann::json(job));
        }
        catch (const JobError &ex)
        {
            if (filedock::is_resource_error(ex.code()))
            {
                spdlog::warn("Job rejected: {}", ex.what());
            }
            return error_response(ex.code(), ex.what());
        }
    }

    ApiResponse HttpApi::list_jobs(const ApiRequest & /*request*/)
    {
        return json_response(StatusCode::success_ok, {{"jobs", services_.scheduler.list()}});
    }

    ApiResponse HttpApi::get_job(const ApiRequest &request)
    {
        auto job = services_.scheduler.get(request.match);
        if (!job)
        {
            return error_response(filedock::ErrorCode::JobNotFound, "Job not found");
        }
        return json_response(StatusCode::success_ok, nlohmann::json(*job));
    }

    ApiResponse HttpApi::cancel_job(const ApiRequest &request)
    {
        switch (services_.scheduler.cancel(request.match))
        {
        case CancelResult::Cancelled:
        case CancelResult::CancelRequested:
            return json_response(StatusCode::success_ok, {{"message", "Job cancelled successfully"}});
        case CancelResult::NotFound:
            return error_response(filedock::ErrorCode::JobNotFound, "Job not found");
        case CancelResult::NotCancellable:
            break;
        }
        return error_response(filedock::ErrorCode::NotCancellable, "Job cannot be cancelled");
    }

    ApiResponse HttpApi::put_chunk(const ApiRequest &request)
    {
        UploadHeaders headers;
        if (auto error = parse_upload_headers(request.header, headers))
        {
            return *error;
        }

        ResolvedPath destination;
        try
        {
            destination = services_.mounts.resolve(virtual_path(request.match), Access::Write);
        }
        catch (const FilesystemError &ex)
        {
            return error_response(ex.code(), ex.what());
        }
        if (destination.is_mount_root)
        {
            return error_response(filedock::ErrorCode::ValidationError,
                                  "Upload destination must be a file inside a mount point");
        }

        const ChunkRequest chunk{
            .upload_id = headers.upload_id,
            .chunk_index = headers.chunk_index,
            .path = destination.virtual_path,
            .destination = destination.physical,
            .total_size = headers.total_size,
            .chunk_size = headers.chunk_size,
            .total_chunks = headers.total_chunks,
        };
        const auto payload = std::as_bytes(std::span(request.body.data(), request.body.size()));
        const auto outcome = services_.transfers.put_chunk(chunk, payload);
        if (outcome.error != filedock::ErrorCode::Ok)
        {
            std::optional<std::string> details;
            if (outcome.error == filedock::ErrorCode::ChunkMissing)
            {
                details = "nextExpectedChunk=" + std::to_string(outcome.next_expected_chunk);
            }
            return error_response(outcome.error, outcome.message, std::move(details));
        }

        if (headers.checksum && outcome.next_expected_chunk == outcome.total_chunks)
        {
            return finish_upload(headers.upload_id, *headers.checksum);
        }

        return json_response(StatusCode::success_ok, {
                                                         {"uploadId", headers.upload_id},
                                                         {"chunkIndex", headers.chunk_index},
                                                         {"nextExpectedChunk", outcome.next_expected_chunk},
                                                         {"receivedChunks", outcome.next_expected_chunk},
                                                         {"totalChunks", outcome.total_chunks},
                                                         {"complete", false},
                                                     });
    }

    ApiResponse HttpApi::complete_upload(const ApiRequest &request)
    {
        protocol::CompleteUploadRequest body;
        try
        {
            body = nlohmann::json::parse(request.body).get<protocol::CompleteUploadRequest>();
        }
        catch (const nlohmann::json::exception &)
        {
            return error_response(filedock::ErrorCode::ValidationError, "Invalid request body");
        }
        if (body.upload_id.empty())
        {
            return error_response(filedock::ErrorCode::ValidationError, "uploadId is required");
        }
        return finish_upload(body.upload_id, body.checksum);
    }

    ApiResponse HttpApi::upload_status(const ApiRequest &request)
    {
        auto session = services_.transfers.status(request.match);
        if (!session)
        {
            return error_response(filedock::ErrorCode::UploadNotFound, "Upload session not found");
        }
        return json_response(StatusCode::success_ok, upload_status_json(*session));
    }

    ApiResponse HttpApi::upload_status_by_query(const ApiRequest &request)
    {
        const auto query = SimpleWeb::QueryString::parse(request.query_string);
        auto it = query.find("uploadId");
        if (it == query.end() || it->second.empty())
        {
            return error_response(filedock::ErrorCode::ValidationError, "uploadId query parameter is required");
        }
        auto forwarded = request;
        forwarded.match = it->second;
        return upload_status(forwarded);
    }

    ApiResponse HttpApi::abort_upload(const ApiRequest &request)
    {
        if (!services_.transfers.abort(request.match))
        {
            return error_response(filedock::ErrorCode::UploadNotFound, "Upload session not found");
        }
        return json_response(StatusCode::success_ok, {{"message", "Upload aborted"}});
    }

    ApiResponse HttpApi::finish_upload(const std::string &upload_id, const std::string &checksum)
    {
        auto outcome = services_.transfers.complete(upload_id, checksum);
        if (outcome.error != filedock::ErrorCode::Ok)
        {
            std::optional<std::string> details;
            if (outcome.error == filedock::ErrorCode::ChunkMissing && outcome.session)
            {
                details = "nextExpectedChunk=" + std::to_string(outcome.session->next_chunk);
            }
            return error_response(outcome.error, outcome.message, std::move(details));
        }

        const auto &session = *outcome.session;
        services_.hub.publish(protocol::JobUpdate{
            .job_id = session.upload_id,
            .state = protocol::JobState::Completed,
            .progress = 100,
            .error = std::nullopt,
        });
        return json_response(StatusCode::success_created, {
                                                              {"uploadId", session.upload_id},
                                                              {"path", session.path},
                                                              {"size", session.total_size},
                                                              {"totalChunks", session.total_chunks},
                                                              {"complete", true},
                                                          });
    }

    DownloadPlan HttpApi::prepare_download(const ApiRequest &request, bool attachment)
    {
        if (request.match.empty())
        {
            return {.head = error_response(filedock::ErrorCode::ValidationError, "Path is required")};
        }

        ResolvedPath target;
        EntryInfo info;
        try
        {
            target = services_.mounts.resolve(virtual_path(request.match), Access::Read);
            info = services_.filesystem.stat(target.physical);
        }
        catch (const FilesystemError &ex)
        {
            return {.head = error_response(ex.code(), ex.what())};
        }
        if (info.is_directory)
        {
            return {.head = error_response(filedock::ErrorCode::ValidationError, "Path is not a file")};
        }

        const auto name = target.physical.filename().string();
        DownloadPlan plan;
        auto &header = plan.head.header;
        header.emplace("Content-Type", std::string(mime_type_for(target.physical)));
        header.emplace("Content-Disposition",
                       std::string(attachment ? "attachment" : "inline") + "; filename=\"" + name + "\"");
        header.emplace("Accept-Ranges", "bytes");
        if (!attachment)
        {
            header.emplace("Access-Control-Allow-Origin", "*");
            header.emplace("Access-Control-Allow-Methods", "GET, HEAD, OPTIONS");
            header.emplace("Access-Control-Allow-Headers", "Range");
            header.emplace("Access-Control-Expose-Headers", "Content-Length, Content-Range, Accept-Ranges");
        }

        const auto range = parse_range(header_value(request.header, "Range"), info.size);
        switch (range.kind)
        {
        case RangeKind::Unsatisfiable:
        {
            auto refused = error_response(filedock::ErrorCode::ValidationError, "Requested range not satisfiable");
            refused.status = StatusCode::client_error_range_not_satisfiable;
            refused.header.emplace("Content-Range", "bytes */" + std::to_string(info.size));
            return {.head = std::move(refused)};
        }
        case RangeKind::Satisfiable:
            plan.head.status = StatusCode::success_partial_content;
            plan.offset = range.offset;
            plan.length = range.length;
            header.emplace("Content-Range", "bytes " + std::to_string(range.offset) + "-" +
                                                std::to_string(range.offset + range.length - 1) + "/" +
                                                std::to_string(info.size));
            break;
        case RangeKind::None:
            plan.head.status = StatusCode::success_ok;
            plan.offset = 0;
            plan.length = info.size;
            break;
        }
        header.emplace("Content-Length", std::to_string(plan.length));
        plan.physical = target.physical;
        return plan;
    }

    void HttpApi::serve_download(const std::shared_ptr<HttpServer::Response> &response, const ApiRequest &request,
                                 bool attachment)
    {
        auto plan = prepare_download(request, attachment);
        if (!plan.physical)
        {
            write_response(response, plan.head);
            return;
        }

        std::shared_ptr<InputFile> input;
        try
        {
            input = services_.filesystem.open_read(*plan.physical);
            input->seek(plan.offset);
        }
        catch (const FilesystemError &ex)
        {
            spdlog::error("Download of {} failed: {}", plan.physical->generic_string(), ex.what());
            write_response(response, error_response(ex.code(), ex.what()));
            return;
        }

        spdlog::debug("Serving {} bytes of {}", plan.length, plan.physical->generic_string());
        response->write(plan.head.status, plan.head.header);
        stream(response, std::move(input), plan.length);
    }

    void HttpApi::stream(std::shared_ptr<HttpServer::Response> response, std::shared_ptr<InputFile> input,
                         std::uint64_t remaining)
    {
        if (remaining == 0)
        {
            return;
        }
        std::vector<std::byte> buffer(
            static_cast<std::size_t>(std::min<std::uint64_t>(services_.download_block, remaining)));
        std::size_t count = 0;
        try
        {
            count = input->read(buffer);
        }
        catch (const FilesystemError &ex)
        {
            spdlog::error("Download aborted while reading: {}", ex.what());
            response->close_connection_after_response = true;
            return;
        }
        if (count == 0)
        {
            spdlog::warn("File shrank during download, {} bytes missing", remaining);
            response->close_connection_after_response = true;
            return;
        }

        response->write(reinterpret_cast<const char *>(buffer.data()), static_cast<std::streamsize>(count));
        remaining -= count;
        response->send([this, response, input, remaining](const SimpleWeb::error_code &ec)
                       {
            if (ec)
            {
                spdlog::debug("Download interrupted: {}", ec.message());
                return;
            }
            stream(response, input, remaining); });
    }

} // namespace filedock::server
