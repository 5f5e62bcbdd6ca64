#ifndef IRCCONN_THREAD_SAFE_QUEUE_H
#define IRCCONN_THREAD_SAFE_QUEUE_H

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <iterator>
#include <mutex>
#include <optional>

namespace ircconn::common {

/// Outcome of a waiting pop.
enum class WaitStatus {
    Ready,       // a value was retrieved
    Timeout,     // the wait expired
    Closed,      // the queue is closed and empty
    Interrupted  // the caller's stop condition became true
};

/**
 * @brief A closable, optionally bounded thread-safe queue.
 *
 * - capacity 0 means unbounded; otherwise push() blocks while the queue is full.
 * - close() makes pushes fail; pops drain what is left and then report Closed.
 *   reopen() starts a fresh, empty stream on the same queue.
 * - Waits that take a stop condition re-check it whenever interrupt() is called,
 *   so whoever flips the condition must call interrupt() afterwards.
 * @tparam T The type of data to be stored in the queue.
 */
template <typename T>
class ThreadSafeQueue {
public:
    using StopCondition = std::function<bool()>;

    explicit ThreadSafeQueue(std::size_t capacity = 0) : capacity_(capacity) {}

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    /**
     * @brief Pushes data to the queue, waiting for room if the queue is bounded and full.
     * @param value The data to be pushed.
     * @param stop Optional condition that abandons the wait for room.
     * @return False if the queue is closed or the stop condition fired.
     */
    bool push(T value, const StopCondition& stop = {}) {
        std::unique_lock<std::mutex> lock(mtx_);
        cvNotFull_.wait(lock, [&] {
            return closed_ || !full() || (stop && stop());
        });
        if (closed_ || full()) return false;
        queue_.push_back(std::move(value));
        cvNotEmpty_.notify_one();
        return true;
    }

    /**
     * @brief Pushes data without waiting.
     * @return False if the queue is closed or full. A full capacity-1 queue therefore
     *         coalesces repeated pushes into the one pending value.
     */
    bool try_push(T value) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (closed_ || full()) return false;
        queue_.push_back(std::move(value));
        cvNotEmpty_.notify_one();
        return true;
    }

    /**
     * @brief Pops data from the queue. Waits until data arrives or the queue is closed.
     * @return The data popped from the queue, or std::nullopt once closed and empty.
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mtx_);
        cvNotEmpty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        if (queue_.empty()) return std::nullopt;
        return takeFront();
    }

    /**
     * @brief Tries to pop data from the queue with a timeout.
     * @param value A reference to the variable to store the data.
     * @param timeout_ms Timeout duration in milliseconds.
     */
    WaitStatus try_pop(T& value, int timeout_ms) {
        std::unique_lock<std::mutex> lock(mtx_);
        if (!cvNotEmpty_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                  [this] { return closed_ || !queue_.empty(); })) {
            return WaitStatus::Timeout;
        }
        if (queue_.empty()) return WaitStatus::Closed;
        value = takeFront();
        return WaitStatus::Ready;
    }

    /**
     * @brief Pops data, giving up as soon as the stop condition holds.
     *
     * The stop condition wins over queued data: a caller that wants to flush after
     * being stopped uses drain().
     */
    WaitStatus pop_until(T& value, const StopCondition& stop) {
        std::unique_lock<std::mutex> lock(mtx_);
        cvNotEmpty_.wait(lock, [&] { return stop() || closed_ || !queue_.empty(); });
        if (stop()) return WaitStatus::Interrupted;
        if (queue_.empty()) return WaitStatus::Closed;
        value = takeFront();
        return WaitStatus::Ready;
    }

    /// Removes and returns everything currently queued.
    std::deque<T> drain() {
        std::lock_guard<std::mutex> lock(mtx_);
        std::deque<T> out;
        out.swap(queue_);
        cvNotFull_.notify_all();
        return out;
    }

    /// Discards everything currently queued and returns how many entries were dropped.
    std::size_t clear() {
        return drain().size();
    }

    /// Wakes every waiter so it re-evaluates its stop condition.
    void interrupt() {
        std::lock_guard<std::mutex> lock(mtx_);
        cvNotEmpty_.notify_all();
        cvNotFull_.notify_all();
    }

    /// Closes the queue. Returns true only for the call that actually closed it.
    bool close() {
        std::lock_guard<std::mutex> lock(mtx_);
        if (closed_) return false;
        closed_ = true;
        cvNotEmpty_.notify_all();
        cvNotFull_.notify_all();
        return true;
    }

    /// Empties the queue and accepts pushes again. Returns how many stale entries were dropped.
    std::size_t reopen() {
        std::lock_guard<std::mutex> lock(mtx_);
        auto dropped = queue_.size();
        queue_.clear();
        closed_ = false;
        cvNotFull_.notify_all();
        return dropped;
    }

    /// Removes every queued entry matching `pred`, keeping the order of the rest.
    template <typename Pred>
    std::size_t remove_if(Pred pred) {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = std::remove_if(queue_.begin(), queue_.end(), pred);
        auto removed = static_cast<std::size_t>(std::distance(it, queue_.end()));
        queue_.erase(it, queue_.end());
        if (removed > 0) cvNotFull_.notify_all();
        return removed;
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return closed_;
    }

    /**
     * @brief Checks if the queue is empty.
     * @return True if the queue is empty, false otherwise.
     */
    bool empty() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return queue_.empty();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return queue_.size();
    }

    std::size_t capacity() const noexcept { return capacity_; }

private:
    bool full() const { return capacity_ != 0 && queue_.size() >= capacity_; }

    T takeFront() {
        T value = std::move(queue_.front());
        queue_.pop_front();
        cvNotFull_.notify_one();
        return value;
    }

    const std::size_t capacity_;
    std::deque<T> queue_;
    bool closed_{false};
    mutable std::mutex mtx_;
    std::condition_variable cvNotEmpty_;
    std::condition_variable cvNotFull_;
};

} // namespace ircconn::common

#endif // IRCCONN_THREAD_SAFE_QUEUE_H
