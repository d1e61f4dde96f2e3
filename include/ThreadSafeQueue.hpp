#pragma once

#include <queue>
#include <mutex>
#include <condition_variable>
#include <optional>

/**
 * @brief Mutex/condition-variable queue between the shell's threads.
 * @details Carries raw command lines from the console reader to the processing
 * thread, and formatted OutputEnvelopes from the ledger to the output thread.
 * Consumers either pop one item at a time or steal the whole backlog with
 * pop_all(). stop() wakes every waiter; items already queued are still handed
 * out before consumers see the stopped state.
 */
template <typename T>
class ThreadSafeQueue {
private:
    // Separate cache lines for the lock and the data it guards.
    alignas(64) mutable std::mutex mutex_;
    alignas(64) std::condition_variable cv_;
    alignas(64) std::queue<T> queue_;

    bool stopped_ = false;

public:
    ThreadSafeQueue() = default;

    void push(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push(std::move(value));
        }
        // Notify outside the lock so the woken consumer does not block on it.
        cv_.notify_one();
    }

    /**
     * @brief Blocking pop.
     * @return The next item, or nullopt once the queue is stopped and drained.
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !queue_.empty() || stopped_; });

        if (queue_.empty() && stopped_) return std::nullopt;

        T value = std::move(queue_.front());
        queue_.pop();
        return value;
    }

    /**
     * @brief Blocking batch pop: swaps the whole backlog into `local_queue`.
     * @details One lock per batch instead of one per line; the producer can
     * refill the (now empty) internal queue while the batch is written out.
     * @return False once the queue is stopped and drained.
     */
    bool pop_all(std::queue<T>& local_queue) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !queue_.empty() || stopped_; });

        if (queue_.empty() && stopped_) return false;

        std::swap(local_queue, queue_);
        return true;
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
        }
        cv_.notify_all();
    }

    // Non-blocking pop; never waits on the condition variable.
    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) return std::nullopt;

        T value = std::move(queue_.front());
        queue_.pop();
        return value;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }
};
