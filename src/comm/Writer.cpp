#include "comm/Writer.hpp"
#include "spdlog/spdlog.h"

namespace ircconn::comm {

Writer::Writer(std::shared_ptr<Session> session, OutboundQueue& queue, const common::Latch& quit)
    : session_(std::move(session)), queue_(queue), quit_(quit) {}

Writer::~Writer() {
    join();
}

void Writer::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) return;
    workerThread_ = std::thread([this]() { workerLoop(); });
}

void Writer::join() {
    if (workerThread_.joinable()) {
        workerThread_.join();
    }
}

std::string Writer::terminate(const std::string& line) {
    std::string out = line;
    if (out.size() < 2 || out[out.size() - 1] != '\n' || out[out.size() - 2] != '\r') {
        // ensure CRLF
        if (!out.empty() && out.back() == '\n') {
            out.insert(out.end() - 1, '\r');
        } else {
            out += "\r\n";
        }
    }
    return out;
}

bool Writer::send(const std::string& line) {
    boost::system::error_code ec;
    session_->transport->writeLine(terminate(line), ec);
    if (!ec) {
        spdlog::debug("[Writer] -> {}", line);
        return true;
    }

    if (quit_.fired()) {
        spdlog::info("[Writer] write during shutdown failed: {}", ec.message());
        return false;
    }
    // the reader got there first; nothing left to report
    if (!session_->aborted.fire()) {
        return false;
    }

    spdlog::error("[Writer] write error: {}", ec.message());
    auto dropped = queue_.clear();
    if (dropped > 0) {
        spdlog::warn("[Writer] discarded {} queued line(s) after write failure", dropped);
    }
    queue_.interrupt();
    return false;
}

void Writer::workerLoop() {
    session_->ready.wait();

    auto stopped = [this]() { return quit_.fired() || session_->aborted.fired(); };
    for (;;) {
        std::string item;
        auto status = queue_.pop_until(item, stopped);
        if (status == common::WaitStatus::Ready) {
            if (!send(item)) break;
            continue;
        }

        if (status == common::WaitStatus::Interrupted && quit_.fired() && !session_->aborted.fired()) {
            // flush what is left before stopping
            for (const auto& line : queue_.drain()) {
                if (!send(line)) break;
            }
        }
        break;
    } // end for

    spdlog::debug("[Writer] worker exiting");
    session_->writerDone.countDown();
    session_->loopsDone.countDown();
}

} // namespace ircconn::comm
