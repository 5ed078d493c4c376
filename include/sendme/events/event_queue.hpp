/**
 * @file event_queue.hpp
 * @brief Blocking FIFO used to hand transfer events between threads
 *
 * The getter runs the network download on a worker thread and pushes
 * TransferEvents here; the foreground thread pops them, feeds the
 * progress reducer and redraws the bars. close() marks end-of-stream.
 *
 * EXAMPLE:
 * ThreadSafeQueue<TransferEvent> feed;
 * feed.push(Connected{});        // producer
 * while (auto ev = feed.pop()) { // consumer, nullopt once closed and drained
 *     reducer.apply(*ev);
 * }
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace sendme::events {

/**
 * @brief Thread-safe FIFO queue
 *
 * THREAD SAFETY:
 * - Any number of producers and consumers
 * - pop() blocks until an item arrives or the queue is closed
 */
template<typename T>
class ThreadSafeQueue {
public:
    ThreadSafeQueue() = default;

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    void push(T item) {
        {
            std::lock_guard lock(mutex_);
            queue_.push(std::move(item));
        }
        cv_.notify_one();
    }

    /**
     * @brief Non-blocking pop
     *
     * RETURNS: the front item, or nullopt when nothing is queued
     */
    std::optional<T> try_pop() {
        std::lock_guard lock(mutex_);
        return take_locked();
    }

    /**
     * @brief Blocking pop
     *
     * RETURNS: the front item, or nullopt once closed and drained
     */
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this]() { return !queue_.empty() || closed_; });
        return take_locked();
    }

    /**
     * @brief Blocking pop bounded by a timeout
     *
     * RETURNS: nullopt on timeout, or once closed and drained
     */
    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, timeout, [this]() { return !queue_.empty() || closed_; });
        return take_locked();
    }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::lock_guard lock(mutex_);
        return queue_.empty();
    }

    bool closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    /**
     * @brief Mark end-of-stream and wake every waiting consumer
     *
     * Items already queued are still delivered.
     */
    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

private:
    std::optional<T> take_locked() {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
};

} // namespace sendme::events
