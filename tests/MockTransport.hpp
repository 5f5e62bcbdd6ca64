// tests/MockTransport.hpp
// Scripted in-memory line transport for Reader/Writer/Client tests.

#pragma once

#include "comm/ILineTransport.hpp"
#include "common/ThreadSafeQueue.h"

#include <boost/system/error_code.hpp>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ircconn::test {

class MockTransport : public comm::ILineTransport {
public:
    // Reads return `script` in order, then block until feed(), failReads() or shutdown().
    explicit MockTransport(std::vector<std::string> script = {})
        : script_(script.begin(), script.end()) {}

    bool readLine(std::string& line, boost::system::error_code& ec) override {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait(lk, [this] { return closed_ || readFail_ || !script_.empty(); });
        if (closed_) {
            ec = boost::system::errc::make_error_code(boost::system::errc::operation_canceled);
            return false;
        }
        if (!script_.empty()) {
            line = script_.front();
            script_.pop_front();
            while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();
            return true;
        }
        ec = boost::system::errc::make_error_code(boost::system::errc::connection_reset);
        return false;
    }

    void writeLine(const std::string& line, boost::system::error_code& ec) override {
        {
            std::unique_lock<std::mutex> lk(mtx_);
            ++waitingWrites_;
            cv_.wait(lk, [this] { return !holdWrites_; });
            --waitingWrites_;
            if (closed_ || writeFail_) {
                ec = boost::system::errc::make_error_code(boost::system::errc::broken_pipe);
                return;
            }
        }
        written_.push(line);
    }

    void shutdown() noexcept override {
        std::lock_guard<std::mutex> lk(mtx_);
        closed_ = true;
        ++shutdowns_;
        cv_.notify_all();
    }

    bool isOpen() const noexcept override {
        std::lock_guard<std::mutex> lk(mtx_);
        return !closed_;
    }

    // ---- test controls ----

    void feed(const std::string& line) {
        std::lock_guard<std::mutex> lk(mtx_);
        script_.push_back(line);
        cv_.notify_all();
    }

    // once the script is exhausted, reads fail as if the peer reset the connection
    void failReads() {
        std::lock_guard<std::mutex> lk(mtx_);
        readFail_ = true;
        cv_.notify_all();
    }

    void failWrites() {
        std::lock_guard<std::mutex> lk(mtx_);
        writeFail_ = true;
    }

    // writes block until releaseWrites(); shutdown() does not release them
    void holdWrites() {
        std::lock_guard<std::mutex> lk(mtx_);
        holdWrites_ = true;
    }

    void releaseWrites() {
        std::lock_guard<std::mutex> lk(mtx_);
        holdWrites_ = false;
        cv_.notify_all();
    }

    int waitingWrites() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return waitingWrites_;
    }

    // next written line (CRLF included), or nullopt after `timeout_ms`
    std::optional<std::string> nextWrite(int timeout_ms = 1000) {
        std::string line;
        if (written_.try_pop(line, timeout_ms) == common::WaitStatus::Ready) return line;
        return std::nullopt;
    }

    std::size_t pendingWrites() const { return written_.size(); }

    int shutdowns() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return shutdowns_;
    }

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<std::string> script_;
    bool closed_{false};
    bool readFail_{false};
    bool writeFail_{false};
    bool holdWrites_{false};
    int waitingWrites_{0};
    int shutdowns_{0};
    common::ThreadSafeQueue<std::string> written_;
};

} // namespace ircconn::test
