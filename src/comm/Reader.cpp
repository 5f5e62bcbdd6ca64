#include "comm/Reader.hpp"
#include "protocol/CommandBuilder.hpp"
#include "protocol/exceptions/ParseError.h"
#include "spdlog/spdlog.h"

namespace ircconn::comm {

Reader::Reader(std::shared_ptr<Session> session,
               OutboundQueue& outbound,
               MessageQueue& inbound,
               ReconnectSignal& reconnect,
               const common::Latch& quit)
    : session_(std::move(session)),
      outbound_(outbound),
      inbound_(inbound),
      reconnect_(reconnect),
      quit_(quit) {}

Reader::~Reader() {
    join();
}

void Reader::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) return;
    thread_ = std::thread([this]() { readLoop(); });
}

void Reader::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

void Reader::readLoop() {
    session_->ready.wait();

    for (;;) {
        std::string line;
        boost::system::error_code ec;
        if (!session_->transport->readLine(line, ec)) {
            if (quit_.fired()) {
                spdlog::debug("[Reader] stopped: {}", ec.message());
            } else {
                spdlog::warn("[Reader] read error: {}", ec.message());
                session_->aborted.fire();
                outbound_.interrupt();
                if (!reconnect_.try_push(LinkEvent::ConnectionLost)) {
                    spdlog::debug("[Reader] reconnect already pending");
                }
                // one notification per lost connection; connect() reopens the signal
                reconnect_.close();
            }
            break;
        }
        handleLine(line);
    }

    session_->loopsDone.countDown();
}

void Reader::handleLine(const std::string& line) {
    protocol::Message msg;
    try {
        msg = protocol::parse(line);
    } catch (const ParseError& e) {
        spdlog::warn("[Reader] discarding line: {}", e.what());
        return;
    }
    spdlog::debug("[Reader] <- {}", line);

    if (msg.command == "PING") {
        auto stopped = [this]() { return quit_.fired() || session_->aborted.fired(); };
        if (!outbound_.push(protocol::CommandBuilder::pong(msg), stopped)) {
            spdlog::debug("[Reader] keep-alive reply dropped, session is ending");
        }
        return;
    }

    if (!inbound_.push(std::move(msg))) {
        spdlog::debug("[Reader] inbound queue closed, message dropped");
    }
}

} // namespace ircconn::comm
