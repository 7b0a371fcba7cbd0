#include "filedock/server/observer_connection.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "filedock/protocol.hpp"

namespace filedock::server
{

    std::string_view to_string(ConnectionState state) noexcept
    {
        switch (state)
        {
        case ConnectionState::Connecting:
            return "connecting";
        case ConnectionState::Open:
            return "open";
        case ConnectionState::Closing:
            return "closing";
        case ConnectionState::Closed:
            return "closed";
        }
        return "closed";
    }

    ObserverConnection::ObserverConnection(std::unique_ptr<ObserverTransport> transport, NotificationHub &hub,
                                           Identity identity, ObserverOptions options)
        : transport_(std::move(transport)),
          hub_(hub),
          identity_(std::move(identity)),
          options_(options),
          peer_(transport_->remote_endpoint())
    {
        if (options_.send_buffer == 0)
        {
            options_.send_buffer = 1;
        }
    }

    void ObserverConnection::open()
    {
        {
            std::lock_guard lock(mutex_);
            if (state_ != ConnectionState::Connecting)
            {
                return;
            }
            state_ = ConnectionState::Open;
        }
        hub_.register_observer(shared_from_this());
        spdlog::info("Observer connected: {} ({})", peer_, identity_.user);
    }

    bool ObserverConnection::deliver(const std::string &message)
    {
        {
            std::lock_guard lock(mutex_);
            if (state_ != ConnectionState::Open)
            {
                return false;
            }
            if (outbound_.size() >= options_.send_buffer)
            {
                spdlog::warn("Observer {} is not keeping up, dropping message", peer_);
                return false;
            }
            outbound_.push_back(message);
        }
        send_next();
        return true;
    }

    void ObserverConnection::on_hub_shutdown()
    {
        close(1001, "Server shutting down");
    }

    void ObserverConnection::handle_text(std::string_view text)
    {
        {
            std::lock_guard lock(mutex_);
            missed_pings_ = 0;
        }

        protocol::ClientMessage message;
        try
        {
            message = nlohmann::json::parse(text).get<protocol::ClientMessage>();
        }
        catch (const nlohmann::json::exception &)
        {
            spdlog::warn("Observer {} sent a malformed message", peer_);
            reply_error("Invalid message format");
            return;
        }
        catch (const std::runtime_error &ex)
        {
            spdlog::warn("Observer {}: {}", peer_, ex.what());
            reply_error("Unknown message type");
            return;
        }

        switch (message.type)
        {
        case protocol::MessageType::Subscribe:
        case protocol::MessageType::Unsubscribe:
            if (!message.job_id)
            {
                reply_error("Job ID is required for subscription");
                return;
            }
            spdlog::debug("Observer {} {} {}", peer_, protocol::to_string(message.type), *message.job_id);
            if (message.type == protocol::MessageType::Subscribe)
            {
                hub_.subscribe(this, std::move(*message.job_id));
            }
            else
            {
                hub_.unsubscribe(this, std::move(*message.job_id));
            }
            return;
        case protocol::MessageType::Ping:
            reply(nlohmann::json(protocol::make_pong_message()).dump());
            return;
        default:
            reply_error("Unknown message type");
            return;
        }
    }

    void ObserverConnection::handle_pong()
    {
        std::lock_guard lock(mutex_);
        missed_pings_ = 0;
    }

    void ObserverConnection::check_liveness()
    {
        bool expired = false;
        {
            std::lock_guard lock(mutex_);
            if (state_ != ConnectionState::Open)
            {
                return;
            }
            if (missed_pings_ < options_.max_missed_pings)
            {
                ++missed_pings_;
            }
            else
            {
                state_ = ConnectionState::Closing;
                expired = true;
                spdlog::warn("Observer {} stopped answering pings, closing", peer_);
            }
        }

        if (expired)
        {
            transport_->terminate();
            handle_closed();
            return;
        }

        std::weak_ptr<ObserverConnection> weak = weak_from_this();
        transport_->send_ping([weak](const std::error_code &ec)
                              {
            if (!ec)
            {
                return;
            }
            if (auto self = weak.lock())
            {
                spdlog::warn("Ping to observer {} failed: {}", self->peer_, ec.message());
                self->handle_closed();
            } });
    }

    void ObserverConnection::close(int status, const std::string &reason)
    {
        {
            std::lock_guard lock(mutex_);
            if (state_ == ConnectionState::Closing || state_ == ConnectionState::Closed)
            {
                return;
            }
            state_ = ConnectionState::Closing;
        }
        transport_->close(status, reason);
    }

    void ObserverConnection::handle_closed()
    {
        {
            std::lock_guard lock(mutex_);
            if (state_ == ConnectionState::Closed)
            {
                return;
            }
            state_ = ConnectionState::Closed;
            outbound_.clear();
        }
        hub_.unregister_observer(this);
        spdlog::info("Observer disconnected: {} ({})", peer_, identity_.user);
    }

    ConnectionState ObserverConnection::state() const
    {
        std::lock_guard lock(mutex_);
        return state_;
    }

    std::uint32_t ObserverConnection::missed_pings() const
    {
        std::lock_guard lock(mutex_);
        return missed_pings_;
    }

    std::size_t ObserverConnection::queued() const
    {
        std::lock_guard lock(mutex_);
        return outbound_.size() + (sending_ ? 1 : 0);
    }

    void ObserverConnection::reply(const std::string &message)
    {
        if (!deliver(message))
        {
            spdlog::debug("Reply to observer {} dropped", peer_);
        }
    }

    void ObserverConnection::reply_error(std::string message)
    {
        reply(nlohmann::json(protocol::make_error_message(std::move(message))).dump());
    }

    void ObserverConnection::send_next()
    {
        std::string message;
        {
            std::lock_guard lock(mutex_);
            if (sending_ || outbound_.empty() || state_ != ConnectionState::Open)
            {
                return;
            }
            message = std::move(outbound_.front());
            outbound_.pop_front();
            sending_ = true;
        }

        std::weak_ptr<ObserverConnection> weak = weak_from_this();
        transport_->send_text(message, [weak](const std::error_code &ec)
                              {
            if (auto self = weak.lock())
            {
                self->on_sent(ec);
            } });
    }

    void ObserverConnection::on_sent(const std::error_code &ec)
    {
        {
            std::lock_guard lock(mutex_);
            sending_ = false;
        }
        if (ec)
        {
            spdlog::warn("Send to observer {} failed: {}", peer_, ec.message());
            transport_->terminate();
            handle_closed();
            return;
        }
        send_next();
    }

} // namespace filedock::server
