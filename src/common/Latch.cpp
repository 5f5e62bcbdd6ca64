#include "common/Latch.hpp"

namespace ircconn::common {

bool Latch::fire() {
    bool expected = false;
    if (!fired_.compare_exchange_strong(expected, true)) return false;
    // take the lock so a waiter between its predicate check and its sleep cannot miss us
    std::lock_guard<std::mutex> lk(mtx_);
    cv_.notify_all();
    return true;
}

void Latch::wait() const {
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait(lk, [this]() { return fired_.load(); });
}

bool Latch::waitFor(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lk(mtx_);
    return cv_.wait_for(lk, timeout, [this]() { return fired_.load(); });
}

CountdownLatch::CountdownLatch(std::size_t count)
    : count_(count) {}

void CountdownLatch::countDown() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (count_ == 0) return;
    if (--count_ == 0) cv_.notify_all();
}

std::size_t CountdownLatch::count() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return count_;
}

void CountdownLatch::wait() const {
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait(lk, [this]() { return count_ == 0; });
}

bool CountdownLatch::waitFor(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lk(mtx_);
    return cv_.wait_for(lk, timeout, [this]() { return count_ == 0; });
}

} // namespace ircconn::common
