#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "filedock/server/clock.hpp"
#include "filedock/server/filesystem.hpp"
#include "filedock/server/memory_filesystem.hpp"
#include "filedock/server/notification_hub.hpp"
#include "filedock/server/observer_connection.hpp"

namespace filedock::test
{

    // Polls until the predicate holds or the timeout expires.
    inline bool wait_until(const std::function<bool()> &predicate,
                           std::chrono::milliseconds timeout = std::chrono::milliseconds{5000})
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (predicate())
            {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds{2});
        }
        return predicate();
    }

    class ManualClock final : public server::Clock
    {
    public:
        ManualClock() : now_(std::chrono::sys_days{std::chrono::year{2024} / 5 / 1}) {}

        server::Timestamp now() const override
        {
            std::lock_guard lock(mutex_);
            return now_;
        }

        void advance(std::chrono::seconds delta)
        {
            std::lock_guard lock(mutex_);
            now_ += delta;
        }

    private:
        mutable std::mutex mutex_;
        server::Timestamp now_;
    };

    class RecordingObserver final : public server::Observer
    {
    public:
        explicit RecordingObserver(std::size_t capacity = 1024) : capacity_(capacity) {}

        bool deliver(const std::string &message) override
        {
            std::lock_guard lock(mutex_);
            if (messages_.size() >= capacity_)
            {
                return false;
            }
            messages_.push_back(message);
            return true;
        }

        void on_hub_shutdown() override
        {
            std::lock_guard lock(mutex_);
            shutdown_ = true;
        }

        std::vector<std::string> messages() const
        {
            std::lock_guard lock(mutex_);
            return messages_;
        }

        bool shutdown() const
        {
            std::lock_guard lock(mutex_);
            return shutdown_;
        }

    private:
        std::size_t capacity_;
        mutable std::mutex mutex_;
        std::vector<std::string> messages_;
        bool shutdown_{false};
    };

    // Completes sends inline unless holding is enabled, in which case handlers wait for release_sends().
    class FakeTransport final : public server::ObserverTransport
    {
    public:
        struct State
        {
            std::mutex mutex;
            std::vector<std::string> sent;
            std::vector<SendHandler> held;
            bool hold_sends{false};
            std::error_code send_error;
            int pings{0};
            bool closed{false};
            int close_status{0};
            bool terminated{false};
        };

        explicit FakeTransport(std::shared_ptr<State> state) : state_(std::move(state)) {}

        void send_text(const std::string &message, SendHandler handler) override
        {
            std::error_code error;
            {
                std::lock_guard lock(state_->mutex);
                state_->sent.push_back(message);
                if (state_->hold_sends)
                {
                    state_->held.push_back(std::move(handler));
                    return;
                }
                error = state_->send_error;
            }
            handler(error);
        }

        void send_ping(SendHandler handler) override
        {
            {
                std::lock_guard lock(state_->mutex);
                ++state_->pings;
            }
            handler({});
        }

        void close(int status, const std::string & /*reason*/) override
        {
            std::lock_guard lock(state_->mutex);
            state_->closed = true;
            state_->close_status = status;
        }

        void terminate() override
        {
            std::lock_guard lock(state_->mutex);
            state_->terminated = true;
        }

        std::string remote_endpoint() const override { return "127.0.0.1:50000"; }

        static void release_sends(State &state)
        {
            std::vector<SendHandler> held;
            {
                std::lock_guard lock(state.mutex);
                state.hold_sends = false;
                held.swap(state.held);
            }
            for (auto &handler : held)
            {
                handler({});
            }
        }

    private:
        std::shared_ptr<State> state_;
    };

    // Memory filesystem whose open_read can be parked until the test releases it.
    class GatedFilesystem final : public server::Filesystem
    {
    public:
        explicit GatedFilesystem(const server::Clock &clock) : inner_(clock) {}

        server::MemoryFilesystem &inner() { return inner_; }

        void close_gate()
        {
            std::lock_guard lock(mutex_);
            gate_open_ = false;
        }

        void open_gate()
        {
            {
                std::lock_guard lock(mutex_);
                gate_open_ = true;
            }
            cv_.notify_all();
        }

        std::size_t waiting() const
        {
            std::lock_guard lock(mutex_);
            return waiting_;
        }

        server::EntryInfo stat(const std::filesystem::path &path) const override { return inner_.stat(path); }
        bool exists(const std::filesystem::path &path) const override { return inner_.exists(path); }
        std::vector<server::EntryInfo> list_directory(const std::filesystem::path &path) const override
        {
            return inner_.list_directory(path);
        }
        void create_directories(const std::filesystem::path &path) override { inner_.create_directories(path); }

        std::unique_ptr<server::InputFile> open_read(const std::filesystem::path &path) const override
        {
            {
                std::unique_lock lock(mutex_);
                ++waiting_;
                cv_.wait(lock, [this]
                         { return gate_open_; });
                --waiting_;
            }
            return inner_.open_read(path);
        }

        std::unique_ptr<server::OutputFile> open_write(const std::filesystem::path &path,
                                                       server::WriteMode mode) override
        {
            return inner_.open_write(path, mode);
        }
        void remove(const std::filesystem::path &path) override { inner_.remove(path); }
        void remove_all(const std::filesystem::path &path) override { inner_.remove_all(path); }
        void rename(const std::filesystem::path &from, const std::filesystem::path &to) override
        {
            inner_.rename(from, to);
        }
        void resize(const std::filesystem::path &path, std::uint64_t size) override { inner_.resize(path, size); }

    private:
        server::MemoryFilesystem inner_;
        mutable std::mutex mutex_;
        mutable std::condition_variable cv_;
        bool gate_open_{true};
        mutable std::size_t waiting_{0};
    };

    inline std::vector<std::byte> to_bytes(const std::string &text)
    {
        std::vector<std::byte> bytes(text.size());
        for (std::size_t i = 0; i < text.size(); ++i)
        {
            bytes[i] = static_cast<std::byte>(text[i]);
        }
        return bytes;
    }

} // namespace filedock::test
