#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <server_ws.hpp>

#include "filedock/error_codes.hpp"
#include "filedock/server/identity.hpp"
#include "filedock/server/notification_hub.hpp"
#include "filedock/server/observer_connection.hpp"

namespace filedock::server
{

    using WsServer = SimpleWeb::SocketServer<SimpleWeb::WS>;

    struct UpgradeDecision
    {
        filedock::ErrorCode error{filedock::ErrorCode::Ok};
        std::optional<Identity> identity;
    };

    // Token from the "token" query parameter or an Authorization bearer header, then the Origin allow-list.
    UpgradeDecision authorize_upgrade(const IdentityVerifier &verifier, const std::string &query_string,
                                      const SimpleWeb::CaseInsensitiveMultimap &header,
                                      const std::vector<std::string> &allowed_origins);

    // Serves /api/v1/ws and keeps one ObserverConnection per accepted socket.
    class ObserverEndpoint
    {
    public:
        ObserverEndpoint(NotificationHub &hub, const IdentityVerifier &verifier,
                         std::vector<std::string> allowed_origins, ObserverOptions options);

        void attach(WsServer &server);

        // Pings every open connection; see ObserverConnection::check_liveness.
        void check_liveness();

        std::size_t connection_count() const;

    private:
        std::shared_ptr<ObserverConnection> find(const WsServer::Connection *connection) const;
        std::shared_ptr<ObserverConnection> take(const WsServer::Connection *connection);

        NotificationHub &hub_;
        const IdentityVerifier &verifier_;
        std::vector<std::string> allowed_origins_;
        ObserverOptions options_;

        mutable std::mutex mutex_;
        std::unordered_map<const WsServer::Connection *, Identity> handshakes_;
        std::unordered_map<const WsServer::Connection *, std::shared_ptr<ObserverConnection>> connections_;
    };

} // namespace filedock::server
