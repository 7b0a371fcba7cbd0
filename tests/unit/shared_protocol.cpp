#include <array>
#include <cassert>
#include <cctype>
#include <iostream>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "filedock/crypto.hpp"
#include "filedock/error_codes.hpp"
#include "filedock/protocol.hpp"

using namespace filedock;
using namespace filedock::protocol;

void run_server_component_tests();
void run_job_engine_tests();
void run_transfer_store_tests();
void run_notification_tests();
void run_http_api_tests();

namespace
{

    void test_job_update_json()
    {
        JobUpdate update{.job_id = "job-7", .state = JobState::Failed, .progress = 42, .error = "disk full"};

        const auto json = nlohmann::json(update);
        assert(json["jobId"] == "job-7");
        assert(json["state"] == "failed");
        assert(json["progress"] == 42);
        assert(json["error"] == "disk full");

        const auto decoded = json.get<JobUpdate>();
        assert(decoded.job_id == update.job_id);
        assert(decoded.state == JobState::Failed);
        assert(decoded.error == update.error);

        JobUpdate running{.job_id = "job-8", .state = JobState::Running, .progress = 5};
        assert(!nlohmann::json(running).contains("error"));
    }

    void test_server_messages()
    {
        const auto update = nlohmann::json(make_job_message({.job_id = "a", .state = JobState::Running, .progress = 1}));
        assert(update["type"] == "job_update");
        assert(update["payload"]["jobId"] == "a");

        const auto complete =
            nlohmann::json(make_job_message({.job_id = "a", .state = JobState::Cancelled, .progress = 1}));
        assert(complete["type"] == "job_complete");

        const auto error = nlohmann::json(make_error_message("bad"));
        assert(error["type"] == "error");
        assert(error["payload"]["message"] == "bad");

        const auto pong = nlohmann::json(make_pong_message());
        assert(pong["type"] == "pong");
        assert(!pong.contains("payload"));

        const auto decoded = error.get<ServerMessage>();
        assert(decoded.type == MessageType::Error);
        assert(decoded.payload["message"] == "bad");
    }

    void test_client_messages()
    {
        const auto subscribe = nlohmann::json::parse(R"({"type":"subscribe","jobId":"j-1"})").get<ClientMessage>();
        assert(subscribe.type == MessageType::Subscribe);
        assert(subscribe.job_id == std::optional<std::string>("j-1"));

        const auto empty_id = nlohmann::json::parse(R"({"type":"unsubscribe","jobId":""})").get<ClientMessage>();
        assert(!empty_id.job_id);

        bool rejected = false;
        try
        {
            (void)nlohmann::json::parse(R"({"type":"shout"})").get<ClientMessage>();
        }
        catch (const std::runtime_error &)
        {
            rejected = true;
        }
        assert(rejected);

        const auto ping = nlohmann::json(ClientMessage{.type = MessageType::Ping});
        assert(ping == nlohmann::json::parse(R"({"type":"ping"})"));
    }

    void test_request_bodies()
    {
        const auto create =
            nlohmann::json::parse(R"({"type":"move","sourcePath":"/data/a","destPath":""})").get<CreateJobRequest>();
        assert(create.type == "move");
        assert(create.source_path == "/data/a");
        assert(!create.dest_path);

        const auto complete = nlohmann::json::parse(R"({"uploadId":"u-1","checksum":"sha256:ab"})")
                                  .get<CompleteUploadRequest>();
        assert(complete.upload_id == "u-1");
        assert(complete.checksum == "sha256:ab");

        ErrorResponse response{.error = "Chunk missing", .code = ErrorCode::ChunkMissing, .details = "nextExpectedChunk=3"};
        const auto json = nlohmann::json(response);
        assert(json["code"] == "CHUNK_MISSING");
        assert(json["details"] == "nextExpectedChunk=3");
        assert(json.get<ErrorResponse>().code == ErrorCode::ChunkMissing);
    }

    void test_labels()
    {
        assert(to_string(JobType::Delete) == "delete");
        assert(job_type_from_string("copy") == JobType::Copy);
        assert(!job_type_from_string("Copy"));
        assert(job_state_from_string("cancelled") == JobState::Cancelled);
        assert(is_terminal(JobState::Completed));
        assert(!is_terminal(JobState::Running));

        assert(filedock::to_string(ErrorCode::QueueFull) == "QUEUE_FULL");
        assert(filedock::to_string(ErrorCode::ChecksumMismatch) == "CHECKSUM_MISMATCH");
        assert(error_code_from_string("UPLOAD_LIMIT") == ErrorCode::UploadLimit);
        assert(!error_code_from_string("NOPE"));
        assert(is_resource_error(ErrorCode::UploadLimit));
        assert(!is_resource_error(ErrorCode::ValidationError));
    }

    void test_crypto()
    {
        const std::string abc = "abc";
        const auto digest = crypto::sha256_hex(std::as_bytes(std::span(abc.data(), abc.size())));
        assert(digest == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

        crypto::Sha256 incremental;
        const std::array<std::byte, 1> a{std::byte{'a'}};
        const std::array<std::byte, 2> bc{std::byte{'b'}, std::byte{'c'}};
        incremental.update(a);
        incremental.update(bc);
        assert(incremental.finish_hex() == digest);

        assert(crypto::normalize_checksum("SHA256:ABCDEF") == "abcdef");
        assert(crypto::normalize_checksum("abcdef") == "abcdef");

        assert(crypto::constant_time_equals("token", "token"));
        assert(!crypto::constant_time_equals("token", "tokem"));
        assert(!crypto::constant_time_equals("token", "token2"));

        const auto id = crypto::random_id();
        assert(id.size() == 36);
        for (std::size_t i = 0; i < id.size(); ++i)
        {
            if (i == 8 || i == 13 || i == 18 || i == 23)
            {
                assert(id[i] == '-');
            }
            else
            {
                assert(std::isxdigit(static_cast<unsigned char>(id[i])));
            }
        }
        assert(crypto::random_id() != id);
    }

} // namespace

int main()
{
    try
    {
        test_job_update_json();
        test_server_messages();
        test_client_messages();
        test_request_bodies();
        test_labels();
        test_crypto();
        run_server_component_tests();
        run_job_engine_tests();
        run_transfer_store_tests();
        run_notification_tests();
        run_http_api_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
