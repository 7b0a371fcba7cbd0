#pragma once

#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>
#include <asio/steady_timer.hpp>
#include <memory>
#include <thread>
#include <vector>

#include "filedock/server/clock.hpp"
#include "filedock/server/config.hpp"
#include "filedock/server/filesystem.hpp"
#include "filedock/server/http_api.hpp"
#include "filedock/server/identity.hpp"
#include "filedock/server/job_scheduler.hpp"
#include "filedock/server/mount_table.hpp"
#include "filedock/server/notification_hub.hpp"
#include "filedock/server/observer_endpoint.hpp"
#include "filedock/server/transfer_store.hpp"

namespace filedock::server
{

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        void run();

    private:
        void schedule_sweep();
        void schedule_liveness();
        void handle_signal();

        ServerConfig config_;
        std::shared_ptr<asio::io_context> io_context_;
        asio::signal_set signals_;
        asio::steady_timer sweep_timer_;
        asio::steady_timer liveness_timer_;

        SystemClock clock_;
        LocalFilesystem filesystem_;
        MountTable mounts_;
        StaticTokenVerifier verifier_;
        NotificationHub hub_;
        JobScheduler scheduler_;
        TransferSessionStore transfers_;
        HttpApi api_;
        ObserverEndpoint observers_;

        HttpServer http_;
        WsServer ws_;

        std::vector<std::thread> workers_;
    };

} // namespace filedock::server
