#ifndef VMXFER_QUEUE_HPP
#define VMXFER_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

#include <vmxfer/cancellation.hpp>

namespace vmxfer
{
    // Fixed capacity FIFO shared between threads.
    // Blocking calls observe cancellation of the token within `poll_interval`.
    template <class T>
    class BoundedQueue
    {
    public:
        static constexpr std::chrono::milliseconds poll_interval{ 50 };

        explicit BoundedQueue(std::size_t capacity)
            : m_capacity(capacity == 0 ? 1 : capacity)
        {
        }

        BoundedQueue(const BoundedQueue&) = delete;
        BoundedQueue& operator=(const BoundedQueue&) = delete;

        // Never blocks. Fails if the queue is full or closed.
        bool try_push(T value)
        {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (m_closed || m_items.size() >= m_capacity)
                    return false;
                m_items.push_back(std::move(value));
            }
            m_not_empty.notify_one();
            return true;
        }

        // Blocks until there is a free slot. Fails if the queue gets closed or the token
        // is cancelled first.
        bool push(T value, const CancellationToken& token)
        {
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                while (!m_closed && m_items.size() >= m_capacity)
                {
                    if (token.cancelled())
                        return false;
                    m_not_full.wait_for(lock, poll_interval);
                }
                if (m_closed)
                    return false;
                m_items.push_back(std::move(value));
            }
            m_not_empty.notify_one();
            return true;
        }

        // Blocks until an item is available. Returns nothing once the queue is closed and
        // drained, or when the token is cancelled.
        std::optional<T> pop(const CancellationToken& token)
        {
            std::optional<T> result;
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                while (m_items.empty())
                {
                    if (m_closed || token.cancelled())
                        return std::nullopt;
                    m_not_empty.wait_for(lock, poll_interval);
                }
                if (token.cancelled())
                    return std::nullopt;
                result.emplace(std::move(m_items.front()));
                m_items.pop_front();
            }
            m_not_full.notify_one();
            return result;
        }

        // Like pop() but gives up after `timeout`.
        template <class Rep, class Period>
        std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout)
        {
            std::optional<T> result;
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                if (!m_not_empty.wait_for(
                        lock, timeout, [this] { return !m_items.empty() || m_closed; }))
                    return std::nullopt;
                if (m_items.empty())
                    return std::nullopt;
                result.emplace(std::move(m_items.front()));
                m_items.pop_front();
            }
            m_not_full.notify_one();
            return result;
        }

        std::optional<T> try_pop()
        {
            return pop_for(std::chrono::milliseconds(0));
        }

        // Items already queued remain available to pop().
        void close()
        {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_closed = true;
            }
            m_not_empty.notify_all();
            m_not_full.notify_all();
        }

        bool closed() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_closed;
        }

        std::size_t size() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_items.size();
        }

        std::size_t capacity() const noexcept
        {
            return m_capacity;
        }

    private:
        const std::size_t m_capacity;
        std::deque<T> m_items;
        bool m_closed = false;
        mutable std::mutex m_mutex;
        std::condition_variable m_not_empty;
        std::condition_variable m_not_full;
    };
}

#endif
