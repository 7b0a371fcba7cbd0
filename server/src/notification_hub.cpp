#include "filedock/server/notification_hub.hpp"

#include <asio/post.hpp>

#include <algorithm>
#include <future>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace filedock::server
{

    NotificationHub::NotificationHub(HubOptions options) : options_(options) {}

    NotificationHub::~NotificationHub()
    {
        stop();
    }

    void NotificationHub::start()
    {
        if (running_.exchange(true))
        {
            return;
        }
        io_context_.restart();
        work_.emplace(asio::make_work_guard(io_context_));
        thread_ = std::thread([this]
                              {
            try
            {
                io_context_.run();
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Notification hub loop terminated: {}", ex.what());
            } });
        spdlog::debug("Notification hub started");
    }

    void NotificationHub::stop()
    {
        if (!running_.exchange(false))
        {
            return;
        }
        asio::post(io_context_, [this]
                   {
            auto observers = std::move(observers_);
            observers_.clear();
            subscriptions_.clear();
            observer_jobs_.clear();
            update_counts();
            for (auto &[key, observer] : observers)
            {
                observer->on_hub_shutdown();
            } });
        work_.reset();
        if (thread_.joinable())
        {
            thread_.join();
        }
        spdlog::debug("Notification hub stopped");
    }

    void NotificationHub::register_observer(std::shared_ptr<Observer> observer)
    {
        if (!observer)
        {
            return;
        }
        asio::post(io_context_, [this, observer = std::move(observer)]() mutable
                   {
            const auto *key = observer.get();
            observers_.emplace(key, std::move(observer));
            update_counts(); });
    }

    void NotificationHub::unregister_observer(const Observer *observer)
    {
        asio::post(io_context_, [this, observer]
                   {
            if (observers_.erase(observer) == 0)
            {
                return;
            }
            if (auto jobs = observer_jobs_.find(observer); jobs != observer_jobs_.end())
            {
                const auto job_ids = std::move(jobs->second);
                observer_jobs_.erase(jobs);
                for (const auto &job_id : job_ids)
                {
                    if (auto it = subscriptions_.find(job_id); it != subscriptions_.end())
                    {
                        it->second.erase(observer);
                        if (it->second.empty())
                        {
                            subscriptions_.erase(it);
                        }
                    }
                }
            }
            update_counts(); });
    }

    void NotificationHub::subscribe(const Observer *observer, std::string job_id)
    {
        asio::post(io_context_, [this, observer, job_id = std::move(job_id)]() mutable
                   {
            if (!observers_.contains(observer) || !subscriptions_[job_id].insert(observer).second)
            {
                return;
            }
            auto &jobs = observer_jobs_[observer];
            jobs.push_back(std::move(job_id));
            if (jobs.size() > options_.max_subscriptions_per_observer)
            {
                const auto oldest = jobs.front();
                spdlog::debug("Observer subscription limit reached, dropping job {}", oldest);
                drop_subscription(observer, oldest);
            }
            update_counts(); });
    }

    void NotificationHub::unsubscribe(const Observer *observer, std::string job_id)
    {
        asio::post(io_context_, [this, observer, job_id = std::move(job_id)]
                   {
            drop_subscription(observer, job_id);
            update_counts(); });
    }

    void NotificationHub::publish(protocol::JobUpdate update)
    {
        asio::post(io_context_, [this, update = std::move(update)]
                   { do_publish(update); });
    }

    void NotificationHub::flush()
    {
        if (!running_.load())
        {
            return;
        }
        std::promise<void> done;
        auto future = done.get_future();
        asio::post(io_context_, [&done]
                   { done.set_value(); });
        future.wait();
    }

    HubStats NotificationHub::stats() const
    {
        return {
            .observers = observer_count_.load(),
            .subscriptions = subscription_count_.load(),
            .delivered = delivered_.load(),
            .dropped = dropped_.load(),
        };
    }

    void NotificationHub::do_publish(const protocol::JobUpdate &update)
    {
        std::string message;
        try
        {
            message = nlohmann::json(protocol::make_job_message(update)).dump();
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Dropping update for job {}: {}", update.job_id, ex.what());
            return;
        }

        auto it = subscriptions_.find(update.job_id);
        if (it != subscriptions_.end())
        {
            for (const auto *key : it->second)
            {
                if (auto observer = observers_.find(key); observer != observers_.end())
                {
                    send_to(*observer->second, message);
                }
            }
            if (protocol::is_terminal(update.state))
            {
                for (const auto *key : it->second)
                {
                    if (auto jobs = observer_jobs_.find(key); jobs != observer_jobs_.end())
                    {
                        std::erase(jobs->second, update.job_id);
                        if (jobs->second.empty())
                        {
                            observer_jobs_.erase(jobs);
                        }
                    }
                }
                subscriptions_.erase(it);
                update_counts();
            }
            return;
        }

        for (auto &[key, observer] : observers_)
        {
            send_to(*observer, message);
        }
    }

    void NotificationHub::send_to(Observer &observer, const std::string &message)
    {
        if (observer.deliver(message))
        {
            delivered_.fetch_add(1);
        }
        else
        {
            dropped_.fetch_add(1);
        }
    }

    void NotificationHub::drop_subscription(const Observer *observer, const std::string &job_id)
    {
        if (auto it = subscriptions_.find(job_id); it != subscriptions_.end())
        {
            it->second.erase(observer);
            if (it->second.empty())
            {
                subscriptions_.erase(it);
            }
        }
        if (auto jobs = observer_jobs_.find(observer); jobs != observer_jobs_.end())
        {
            std::erase(jobs->second, job_id);
            if (jobs->second.empty())
            {
                observer_jobs_.erase(jobs);
            }
        }
    }

    void NotificationHub::update_counts()
    {
        observer_count_.store(observers_.size());
        subscription_count_.store(subscriptions_.size());
    }

} // namespace filedock::server
