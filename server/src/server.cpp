#include "filedock/server/server.hpp"

#include <csignal>
#include <thread>

#include <spdlog/spdlog.h>

#include "filedock/server/job.hpp"

namespace filedock::server
{

    namespace
    {

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

    } // namespace

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          io_context_(std::make_shared<asio::io_context>(static_cast<int>(resolve_worker_threads(config_.http_threads)))),
          signals_(*io_context_),
          sweep_timer_(*io_context_),
          liveness_timer_(*io_context_),
          mounts_(config_.mounts),
          verifier_(config_.tokens),
          scheduler_(filesystem_, mounts_, clock_,
                     SchedulerOptions{
                         .worker_count = config_.job_workers,
                         .queue_capacity = config_.job_queue,
                         .buffer_size = config_.copy_buffer,
                     },
                     [this](const Job &job)
                     { hub_.publish(to_update(job)); }),
          transfers_(filesystem_, clock_,
                     TransferOptions{
                         .idle_timeout = config_.upload_timeout,
                         .max_sessions = config_.max_uploads,
                         .state_dir = config_.state_dir,
                     }),
          api_(ApiServices{
              .scheduler = scheduler_,
              .transfers = transfers_,
              .hub = hub_,
              .filesystem = filesystem_,
              .mounts = mounts_,
              .verifier = verifier_,
          }),
          observers_(hub_, verifier_, config_.allowed_origins,
                     ObserverOptions{
                         .send_buffer = config_.observer_buffer,
                         .max_missed_pings = config_.max_missed_pings,
                     })
    {
        http_.config.address = config_.address;
        http_.config.port = config_.port;
        http_.io_service = io_context_;
        ws_.io_service = io_context_;

        api_.register_routes(http_);
        observers_.attach(ws_);
        http_.on_upgrade = [this](std::unique_ptr<SimpleWeb::HTTP> &socket,
                                  std::shared_ptr<HttpServer::Request> request)
        {
            auto connection = std::make_shared<WsServer::Connection>(std::move(socket));
            connection->method = std::move(request->method);
            connection->path = std::move(request->path);
            connection->query_string = std::move(request->query_string);
            connection->http_version = std::move(request->http_version);
            connection->header = std::move(request->header);
            ws_.upgrade(connection);
        };

        for (const auto &mount : mounts_.mounts())
        {
            spdlog::info("Mount {} -> {}{}", mount.name, mount.root.string(), mount.read_only ? " (read-only)" : "");
        }

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int /*signal*/)
                            {
            if (!ec)
            {
                handle_signal();
            } });
    }

    void Server::run()
    {
        hub_.start();
        scheduler_.start();
        http_.start([this](unsigned short port)
                    { spdlog::info("Listening on {}:{}", config_.address, port); });
        schedule_sweep();
        schedule_liveness();

        const auto worker_count = resolve_worker_threads(config_.http_threads);
        workers_.reserve(worker_count > 0 ? worker_count - 1 : 0);
        for (std::size_t i = 1; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_->run(); });
        }
        spdlog::info("Server event loop running with {} threads", worker_count);
        io_context_->run();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
        workers_.clear();

        scheduler_.stop();
        hub_.stop();
        spdlog::info("Server stopped");
    }

    void Server::schedule_sweep()
    {
        sweep_timer_.expires_after(config_.upload_sweep);
        sweep_timer_.async_wait([this](const std::error_code &ec)
                                {
            if (ec)
            {
                return;
            }
            if (const auto evicted = transfers_.sweep_expired(); evicted > 0)
            {
                spdlog::info("Evicted {} idle upload sessions", evicted);
            }
            schedule_sweep(); });
    }

    void Server::schedule_liveness()
    {
        liveness_timer_.expires_after(config_.ping_period);
        liveness_timer_.async_wait([this](const std::error_code &ec)
                                   {
            if (ec)
            {
                return;
            }
            observers_.check_liveness();
            schedule_liveness(); });
    }

    void Server::handle_signal()
    {
        spdlog::info("Signal received, shutting down");
        sweep_timer_.cancel();
        liveness_timer_.cancel();
        http_.stop();
        ws_.stop();
        io_context_->stop();
    }

} // namespace filedock::server
