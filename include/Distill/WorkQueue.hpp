// =================================================================
// include/Distill/WorkQueue.hpp
// =================================================================
// Bounded blocking queue between the directory walker and the workers.

#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>

namespace Distill {

/**
 * @brief Bounded multi-producer, multi-consumer queue
 *
 * push() blocks while the queue is full, pop() blocks while it is empty.
 * After close() no new items are accepted; consumers drain what is left
 * and then pop() returns false. cancel() also discards pending items.
 */
template<typename T>
class WorkQueue {
public:
    explicit WorkQueue(size_t capacity) : m_capacity(capacity > 0 ? capacity : 1) {}

    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    /**
     * @brief Add an item, waiting for space
     * @return false if the queue was closed before the item was accepted
     */
    bool push(T item) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_not_full.wait(lock, [this] { return m_closed || m_items.size() < m_capacity; });

        if (m_closed) {
            return false;
        }

        m_items.push(std::move(item));
        lock.unlock();
        m_not_empty.notify_one();
        return true;
    }

    /**
     * @brief Take the next item, waiting until one is available
     * @return false once the queue is closed and drained
     */
    bool pop(T& item) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_not_empty.wait(lock, [this] { return m_closed || !m_items.empty(); });

        if (m_items.empty()) {
            return false;
        }

        item = std::move(m_items.front());
        m_items.pop();
        lock.unlock();
        m_not_full.notify_one();
        return true;
    }

    /**
     * @brief Stop accepting items; pending items are still delivered
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
        }
        m_not_empty.notify_all();
        m_not_full.notify_all();
    }

    /**
     * @brief Stop accepting items and drop the pending ones
     * @return Number of items discarded
     */
    size_t cancel() {
        size_t discarded = 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
            discarded = m_items.size();
            std::queue<T> empty;
            m_items.swap(empty);
        }
        m_not_empty.notify_all();
        m_not_full.notify_all();
        return discarded;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_items.size();
    }

    size_t capacity() const { return m_capacity; }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

private:
    const size_t m_capacity;
    std::queue<T> m_items;
    bool m_closed = false;

    mutable std::mutex m_mutex;
    std::condition_variable m_not_empty;
    std::condition_variable m_not_full;
};

} // namespace Distill
