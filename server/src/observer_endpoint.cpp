#include "filedock/server/observer_endpoint.hpp"

#include <spdlog/spdlog.h>

namespace filedock::server
{

    namespace
    {

        class WsTransport final : public ObserverTransport
        {
        public:
            explicit WsTransport(const std::shared_ptr<WsServer::Connection> &connection)
                : connection_(connection)
            {
                const auto endpoint = connection->remote_endpoint();
                peer_ = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
            }

            void send_text(const std::string &message, SendHandler handler) override
            {
                auto connection = connection_.lock();
                if (!connection)
                {
                    handler(std::make_error_code(std::errc::not_connected));
                    return;
                }
                connection->send(message, [handler = std::move(handler)](const SimpleWeb::error_code &ec)
                                 { handler(ec); });
            }

            void send_ping(SendHandler handler) override
            {
                auto connection = connection_.lock();
                if (!connection)
                {
                    handler(std::make_error_code(std::errc::not_connected));
                    return;
                }
                // RFC 6455 section 5.2: FIN bit with the ping opcode.
                connection->send(
                    "", [handler = std::move(handler)](const SimpleWeb::error_code &ec)
                    { handler(ec); },
                    137);
            }

            void close(int status, const std::string &reason) override
            {
                if (auto connection = connection_.lock())
                {
                    connection->send_close(status, reason);
                }
            }

            void terminate() override
            {
                if (auto connection = connection_.lock())
                {
                    connection->close();
                }
            }

            std::string remote_endpoint() const override { return peer_; }

        private:
            std::weak_ptr<WsServer::Connection> connection_;
            std::string peer_;
        };

        std::optional<std::string> header_value(const SimpleWeb::CaseInsensitiveMultimap &header, const std::string &name)
        {
            auto it = header.find(name);
            if (it == header.end())
            {
                return std::nullopt;
            }
            return it->second;
        }

    } // namespace

    UpgradeDecision authorize_upgrade(const IdentityVerifier &verifier, const std::string &query_string,
                                      const SimpleWeb::CaseInsensitiveMultimap &header,
                                      const std::vector<std::string> &allowed_origins)
    {
        std::optional<std::string> token;
        const auto query = SimpleWeb::QueryString::parse(query_string);
        if (auto it = query.find("token"); it != query.end() && !it->second.empty())
        {
            token = it->second;
        }
        else if (auto authorization = header_value(header, "Authorization"))
        {
            token = bearer_token(*authorization);
        }

        std::optional<Identity> identity;
        if (token)
        {
            identity = verifier.verify(*token);
        }
        if (!identity)
        {
            return {.error = filedock::ErrorCode::Unauthorized};
        }

        const auto origin = header_value(header, "Origin");
        if (origin && !origin_allowed(*origin, allowed_origins))
        {
            return {.error = filedock::ErrorCode::AccessDenied};
        }
        return {.identity = std::move(identity)};
    }

    ObserverEndpoint::ObserverEndpoint(NotificationHub &hub, const IdentityVerifier &verifier,
                                       std::vector<std::string> allowed_origins, ObserverOptions options)
        : hub_(hub), verifier_(verifier), allowed_origins_(std::move(allowed_origins)), options_(options)
    {
    }

    void ObserverEndpoint::attach(WsServer &server)
    {
        auto &endpoint = server.endpoint["^/api/v1/ws/?$"];

        endpoint.on_handshake = [this](const std::shared_ptr<WsServer::Connection> &connection,
                                       SimpleWeb::CaseInsensitiveMultimap & /*response_header*/)
        {
            auto decision = authorize_upgrade(verifier_, connection->query_string, connection->header,
                                              allowed_origins_);
            if (decision.error == filedock::ErrorCode::Unauthorized)
            {
                spdlog::warn("Refused observer upgrade: missing or invalid token");
                return SimpleWeb::StatusCode::client_error_unauthorized;
            }
            if (decision.error != filedock::ErrorCode::Ok)
            {
                spdlog::warn("Refused observer upgrade: origin not allowed");
                return SimpleWeb::StatusCode::client_error_forbidden;
            }
            std::lock_guard lock(mutex_);
            handshakes_[connection.get()] = std::move(*decision.identity);
            return SimpleWeb::StatusCode::information_switching_protocols;
        };

        endpoint.on_open = [this](const std::shared_ptr<WsServer::Connection> &connection)
        {
            std::shared_ptr<ObserverConnection> observer;
            {
                std::lock_guard lock(mutex_);
                auto it = handshakes_.find(connection.get());
                if (it == handshakes_.end())
                {
                    connection->close();
                    return;
                }
                observer = std::make_shared<ObserverConnection>(std::make_unique<WsTransport>(connection), hub_,
                                                                std::move(it->second), options_);
                handshakes_.erase(it);
                connections_[connection.get()] = observer;
            }
            observer->open();
        };

        endpoint.on_message = [this](const std::shared_ptr<WsServer::Connection> &connection,
                                     const std::shared_ptr<WsServer::InMessage> &in_message)
        {
            if (auto observer = find(connection.get()))
            {
                observer->handle_text(in_message->string());
            }
        };

        endpoint.on_pong = [this](const std::shared_ptr<WsServer::Connection> &connection)
        {
            if (auto observer = find(connection.get()))
            {
                observer->handle_pong();
            }
        };

        // See RFC 6455 7.4.1. for status codes
        endpoint.on_close = [this](const std::shared_ptr<WsServer::Connection> &connection, int status,
                                   const std::string & /*reason*/)
        {
            spdlog::debug("Observer socket closed with status {}", status);
            if (auto observer = take(connection.get()))
            {
                observer->handle_closed();
            }
        };

        endpoint.on_error = [this](const std::shared_ptr<WsServer::Connection> &connection,
                                   const SimpleWeb::error_code &ec)
        {
            spdlog::warn("Observer socket error: {}", ec.message());
            if (auto observer = take(connection.get()))
            {
                observer->handle_closed();
            }
        };
    }

    void ObserverEndpoint::check_liveness()
    {
        std::vector<std::shared_ptr<ObserverConnection>> observers;
        {
            std::lock_guard lock(mutex_);
            observers.reserve(connections_.size());
            for (auto it = connections_.begin(); it != connections_.end();)
            {
                if (it->second->state() == ConnectionState::Closed)
                {
                    it = connections_.erase(it);
                    continue;
                }
                observers.push_back(it->second);
                ++it;
            }
        }
        for (const auto &observer : observers)
        {
            observer->check_liveness();
        }
    }

    std::size_t ObserverEndpoint::connection_count() const
    {
        std::lock_guard lock(mutex_);
        return connections_.size();
    }

    std::shared_ptr<ObserverConnection> ObserverEndpoint::find(const WsServer::Connection *connection) const
    {
        std::lock_guard lock(mutex_);
        auto it = connections_.find(connection);
        return it == connections_.end() ? nullptr : it->second;
    }

    std::shared_ptr<ObserverConnection> ObserverEndpoint::take(const WsServer::Connection *connection)
    {
        std::lock_guard lock(mutex_);
        handshakes_.erase(connection);
        auto it = connections_.find(connection);
        if (it == connections_.end())
        {
            return nullptr;
        }
        auto observer = std::move(it->second);
        connections_.erase(it);
        return observer;
    }

} // namespace filedock::server
