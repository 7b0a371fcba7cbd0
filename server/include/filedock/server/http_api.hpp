#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>
#include <server_http.hpp>

#include "filedock/server/filesystem.hpp"
#include "filedock/server/identity.hpp"
#include "filedock/server/job_scheduler.hpp"
#include "filedock/server/mount_table.hpp"
#include "filedock/server/notification_hub.hpp"
#include "filedock/server/transfer_store.hpp"

namespace filedock::server
{

    using HttpServer = SimpleWeb::Server<SimpleWeb::HTTP>;

    struct ApiRequest
    {
        std::string method;
        std::string query_string;
        SimpleWeb::CaseInsensitiveMultimap header;
        std::string body;
        // Percent-decoded capture of the route pattern, e.g. the job id or the file path.
        std::string match;
    };

    struct ApiResponse
    {
        SimpleWeb::StatusCode status{SimpleWeb::StatusCode::success_ok};
        SimpleWeb::CaseInsensitiveMultimap header;
        std::string body;
    };

    // Response head for a download. When `physical` is empty the head is the whole (error) response.
    struct DownloadPlan
    {
        ApiResponse head;
        std::optional<std::filesystem::path> physical;
        std::uint64_t offset{};
        std::uint64_t length{};
    };

    struct ApiServices
    {
        JobScheduler &scheduler;
        TransferSessionStore &transfers;
        NotificationHub &hub;
        Filesystem &filesystem;
        const MountTable &mounts;
        const IdentityVerifier &verifier;
        std::size_t download_block{256 * 1024};
    };

    nlohmann::json upload_status_json(const TransferSession &session);

    // REST surface under /api/v1. Handlers take already authenticated requests.
    class HttpApi
    {
    public:
        explicit HttpApi(ApiServices services);

        void register_routes(HttpServer &server);

        // 401 response when the request carries no valid token.
        std::optional<ApiResponse> authenticate(const ApiRequest &request) const;

        ApiResponse create_job(const ApiRequest &request);
        ApiResponse list_jobs(const ApiRequest &request);
        ApiResponse get_job(const ApiRequest &request);
        ApiResponse cancel_job(const ApiRequest &request);

        ApiResponse put_chunk(const ApiRequest &request);
        ApiResponse complete_upload(const ApiRequest &request);
        ApiResponse upload_status(const ApiRequest &request);
        // Same report, addressed as /upload/status/...?uploadId=<id>.
        ApiResponse upload_status_by_query(const ApiRequest &request);
        ApiResponse abort_upload(const ApiRequest &request);

        DownloadPlan prepare_download(const ApiRequest &request, bool attachment);

    private:
        ApiResponse finish_upload(const std::string &upload_id, const std::string &checksum);
        void serve_download(const std::shared_ptr<HttpServer::Response> &response, const ApiRequest &request,
                            bool attachment);
        void stream(std::shared_ptr<HttpServer::Response> response, std::shared_ptr<InputFile> input,
                    std::uint64_t remaining);

        ApiServices services_;
    };

} // namespace filedock::server
