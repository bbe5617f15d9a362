#ifndef DELAYED_QUEUE_HPP
#define DELAYED_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>

namespace delayed_queue
{

    // FIFO shared between one producer and one consumer thread.
    //
    // Items put with delay == true are only handed out by get() once
    // `delay` has elapsed since they were inserted. Items behind a delayed
    // head wait for it; find() and remove() ignore the delay entirely.
    template <typename T>
    class DelayedQueue
    {
    public:
        using Clock = std::chrono::steady_clock;
        using Predicate = std::function<bool(const T &)>;

        explicit DelayedQueue(std::chrono::duration<double> delay)
            : delay_(std::chrono::duration_cast<Clock::duration>(delay))
        {
        }

        DelayedQueue(const DelayedQueue &) = delete;
        DelayedQueue &operator=(const DelayedQueue &) = delete;

        void put(T element, bool delay = false)
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                queue_.push_back(Entry{std::move(element), Clock::now(), delay, next_id_++});
            }
            not_empty_.notify_all();
        }

        // No further put() is expected after close().
        void close()
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                closed_ = true;
            }
            not_empty_.notify_all();
        }

        // Blocks until the head is available. Returns std::nullopt once closed.
        std::optional<T> get()
        {
            std::unique_lock<std::mutex> lock(mutex_);
            while (true)
            {
                not_empty_.wait(lock, [this]()
                                { return !queue_.empty() || closed_; });
                if (closed_)
                    return std::nullopt;

                const uint64_t head_id = queue_.front().id;
                if (queue_.front().delay)
                {
                    const auto deadline = queue_.front().insert_time + delay_;
                    // The lock is released while waiting.
                    bool interrupted = not_empty_.wait_until(lock, deadline, [this, head_id]()
                                                             { return closed_ || queue_.empty() ||
                                                                      queue_.front().id != head_id; });
                    if (closed_)
                        return std::nullopt;
                    if (interrupted)
                        continue; // head was removed, start over from the new head
                }

                T element = std::move(queue_.front().element);
                queue_.pop_front();
                return element;
            }
        }

        // First item matching the predicate, ignoring delay.
        std::optional<T> find(const Predicate &predicate) const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto &entry : queue_)
            {
                if (predicate(entry.element))
                    return entry.element;
            }
            return std::nullopt;
        }

        // Remove and return the first item matching the predicate, ignoring delay.
        std::optional<T> remove(const Predicate &predicate)
        {
            std::optional<T> removed;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                for (auto it = queue_.begin(); it != queue_.end(); ++it)
                {
                    if (predicate(it->element))
                    {
                        removed = std::move(it->element);
                        queue_.erase(it);
                        break;
                    }
                }
            }
            if (removed)
                not_empty_.notify_all();
            return removed;
        }

        std::size_t size() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return queue_.size();
        }

        bool closed() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return closed_;
        }

        std::chrono::duration<double> delay() const { return delay_; }

    private:
        struct Entry
        {
            T element;
            Clock::time_point insert_time;
            bool delay;
            uint64_t id;
        };

        const Clock::duration delay_;
        mutable std::mutex mutex_;
        std::condition_variable not_empty_;
        std::deque<Entry> queue_;
        uint64_t next_id_ = 0;
        bool closed_ = false;
    };

} // namespace delayed_queue

#endif // DELAYED_QUEUE_HPP
