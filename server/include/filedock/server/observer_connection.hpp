#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>

#include "filedock/server/identity.hpp"
#include "filedock/server/notification_hub.hpp"

namespace filedock::server
{

    // The socket side of an observer, implemented over the websocket library by the endpoint.
    class ObserverTransport
    {
    public:
        using SendHandler = std::function<void(const std::error_code &)>;

        virtual ~ObserverTransport() = default;

        virtual void send_text(const std::string &message, SendHandler handler) = 0;
        virtual void send_ping(SendHandler handler) = 0;
        // Starts the closing handshake.
        virtual void close(int status, const std::string &reason) = 0;
        // Drops the socket without a handshake.
        virtual void terminate() = 0;
        virtual std::string remote_endpoint() const = 0;
    };

    struct ObserverOptions
    {
        std::size_t send_buffer{256};
        std::uint32_t max_missed_pings{2};
    };

    enum class ConnectionState : std::uint8_t
    {
        Connecting,
        Open,
        Closing,
        Closed
    };

    std::string_view to_string(ConnectionState state) noexcept;

    class ObserverConnection : public Observer, public std::enable_shared_from_this<ObserverConnection>
    {
    public:
        ObserverConnection(std::unique_ptr<ObserverTransport> transport, NotificationHub &hub, Identity identity,
                           ObserverOptions options);

        // Registers with the hub. Call once, after the handshake finished.
        void open();

        bool deliver(const std::string &message) override;
        void on_hub_shutdown() override;

        // Inbound control message from the peer.
        void handle_text(std::string_view text);
        void handle_pong();

        // Called every ping period. Terminates the connection once too many pings went unanswered.
        void check_liveness();

        void close(int status, const std::string &reason);
        // Peer closed, the socket failed or liveness expired. Idempotent.
        void handle_closed();

        ConnectionState state() const;
        const Identity &identity() const noexcept { return identity_; }
        std::uint32_t missed_pings() const;
        std::size_t queued() const;

    private:
        void reply(const std::string &message);
        void reply_error(std::string message);
        void send_next();
        void on_sent(const std::error_code &ec);

        std::unique_ptr<ObserverTransport> transport_;
        NotificationHub &hub_;
        Identity identity_;
        ObserverOptions options_;
        std::string peer_;

        mutable std::mutex mutex_;
        ConnectionState state_{ConnectionState::Connecting};
        std::deque<std::string> outbound_;
        bool sending_{false};
        std::uint32_t missed_pings_{0};
    };

} // namespace filedock::server
