#ifndef RESULT_QUEUE_H
#define RESULT_QUEUE_H

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

/**
 * @brief Bounded thread-safe queue whose producer never blocks
 *
 * Pushing into a full queue discards the oldest item.
 */
template <typename T>
class ResultQueue {
public:
    explicit ResultQueue(size_t maxItems = 4) : maxItems(maxItems > 0 ? maxItems : 1) {}

    /**
     * @brief Add an item
     * @return Number of items dropped to make room (0 or 1)
     */
    size_t push(T item) {
        size_t dropped = 0;
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            if (items.size() >= maxItems) {
                items.pop_front();
                dropped = 1;
            }
            items.push_back(std::move(item));
        }
        notEmpty.notify_one();
        return dropped;
    }

    /**
     * @brief Take the oldest item, waiting up to timeout for one to arrive
     * @return False if nothing arrived in time
     */
    template <typename Rep, typename Period>
    bool pop(T& out, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(queueMutex);
        if (!notEmpty.wait_for(lock, timeout, [this] { return !items.empty(); })) {
            return false;
        }
        out = std::move(items.front());
        items.pop_front();
        return true;
    }

    bool tryPop(T& out) {
        std::lock_guard<std::mutex> lock(queueMutex);
        if (items.empty()) {
            return false;
        }
        out = std::move(items.front());
        items.pop_front();
        return true;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(queueMutex);
        items.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(queueMutex);
        return items.size();
    }

    size_t capacity() const { return maxItems; }

private:
    size_t maxItems;
    std::deque<T> items;
    mutable std::mutex queueMutex;
    std::condition_variable notEmpty;
};

#endif // RESULT_QUEUE_H
