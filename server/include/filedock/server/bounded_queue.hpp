#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace filedock::server
{

    // Multi-producer, multi-consumer FIFO with a fixed capacity. Producers never block.
    template <typename T>
    class BoundedQueue
    {
    public:
        explicit BoundedQueue(std::size_t capacity) : capacity_(capacity) {}

        BoundedQueue(const BoundedQueue &) = delete;
        BoundedQueue &operator=(const BoundedQueue &) = delete;

        // False when the queue is full or closed.
        bool try_push(T item)
        {
            {
                std::lock_guard lock(mutex_);
                if (closed_ || items_.size() >= capacity_)
                {
                    return false;
                }
                items_.push_back(std::move(item));
            }
            available_.notify_one();
            return true;
        }

        // Blocks until an item is available. After close() the remaining items are still handed out,
        // then nullopt is returned.
        std::optional<T> pop()
        {
            std::unique_lock lock(mutex_);
            available_.wait(lock, [this]
                            { return !items_.empty() || closed_; });
            if (items_.empty())
            {
                return std::nullopt;
            }
            T item = std::move(items_.front());
            items_.pop_front();
            return item;
        }

        void close()
        {
            {
                std::lock_guard lock(mutex_);
                closed_ = true;
            }
            available_.notify_all();
        }

        bool full() const
        {
            std::lock_guard lock(mutex_);
            return items_.size() >= capacity_;
        }

        std::size_t size() const
        {
            std::lock_guard lock(mutex_);
            return items_.size();
        }

        std::size_t capacity() const noexcept { return capacity_; }

    private:
        const std::size_t capacity_;
        mutable std::mutex mutex_;
        std::condition_variable available_;
        std::deque<T> items_;
        bool closed_{false};
    };

} // namespace filedock::server
