#pragma once
/**
 * Latch.hpp
 *
 * Two small condition-variable rendezvous points used by the connection lifecycle.
 *
 *  - Latch: single-fire broadcast. fire() is race-free under concurrent callers and
 *    reports which caller won; every waiter is released and stays released.
 *    Used for the quit signal and for aborting one connection's loops.
 *  - CountdownLatch: releases waiters once countDown() was called `count` times.
 *    Used for the readiness barrier and for joining the reader/writer pair.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace ircconn::common {

class Latch {
public:
    Latch() = default;
    Latch(const Latch&) = delete;
    Latch& operator=(const Latch&) = delete;

    // Returns true only for the call that performed the transition.
    bool fire();
    bool fired() const noexcept { return fired_.load(); }

    void wait() const;
    // True if the latch fired before the timeout.
    bool waitFor(std::chrono::milliseconds timeout) const;

private:
    std::atomic<bool> fired_{false};
    mutable std::mutex mtx_;
    mutable std::condition_variable cv_;
};

class CountdownLatch {
public:
    explicit CountdownLatch(std::size_t count);
    CountdownLatch(const CountdownLatch&) = delete;
    CountdownLatch& operator=(const CountdownLatch&) = delete;

    // Extra calls after reaching zero are ignored.
    void countDown();
    std::size_t count() const;

    void wait() const;
    bool waitFor(std::chrono::milliseconds timeout) const;

private:
    std::size_t count_;
    mutable std::mutex mtx_;
    mutable std::condition_variable cv_;
};

} // namespace ircconn::common
