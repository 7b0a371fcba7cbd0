#pragma once

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>

#include "filedock/protocol.hpp"

namespace filedock::server
{

    class Observer
    {
    public:
        virtual ~Observer() = default;

        // Queues an already serialized message. Must not block; returns false when the message was dropped.
        virtual bool deliver(const std::string &message) = 0;

        virtual void on_hub_shutdown() {}
    };

    struct HubOptions
    {
        // Beyond this the observer's oldest subscription is dropped.
        std::size_t max_subscriptions_per_observer{256};
    };

    struct HubStats
    {
        std::size_t observers{};
        // Job ids with at least one subscriber.
        std::size_t subscriptions{};
        std::uint64_t delivered{};
        std::uint64_t dropped{};
    };

    // Owns the observer set and the per-job subscription sets. Every mutation is posted to one loop thread,
    // so the sets themselves are never locked.
    class NotificationHub
    {
    public:
        explicit NotificationHub(HubOptions options = {});
        ~NotificationHub();

        NotificationHub(const NotificationHub &) = delete;
        NotificationHub &operator=(const NotificationHub &) = delete;

        void start();
        // Tells every observer the hub is going away, clears all sets and joins the loop thread.
        void stop();

        void register_observer(std::shared_ptr<Observer> observer);
        void unregister_observer(const Observer *observer);
        void subscribe(const Observer *observer, std::string job_id);
        void unsubscribe(const Observer *observer, std::string job_id);

        // Subscribers of the job receive the update; with no subscribers every observer does.
        void publish(protocol::JobUpdate update);

        // Blocks until everything posted before the call has run. Never call from an observer callback.
        void flush();

        HubStats stats() const;

    private:
        void do_publish(const protocol::JobUpdate &update);
        void send_to(Observer &observer, const std::string &message);
        void drop_subscription(const Observer *observer, const std::string &job_id);
        void update_counts();

        HubOptions options_;
        asio::io_context io_context_;
        std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
        std::thread thread_;
        std::atomic<bool> running_{false};

        // Loop-owned state.
        std::unordered_map<const Observer *, std::shared_ptr<Observer>> observers_;
        std::unordered_map<std::string, std::unordered_set<const Observer *>> subscriptions_;
        // Per observer, oldest first.
        std::unordered_map<const Observer *, std::deque<std::string>> observer_jobs_;

        std::atomic<std::size_t> observer_count_{0};
        std::atomic<std::size_t> subscription_count_{0};
        std::atomic<std::uint64_t> delivered_{0};
        std::atomic<std::uint64_t> dropped_{0};
    };

} // namespace filedock::server
