#pragma once
/**
 * Reader.hpp
 *
 * Threaded reader: the only code that reads from the socket.
 *
 * - Each line is decoded with protocol::parse(). Lines that fail to parse are logged
 *   and dropped; the session goes on.
 * - PING is answered by queueing the matching PONG for the Writer and is not forwarded.
 * - Every other message is pushed to the inbound message queue in wire order.
 * - A read failure outside of shutdown aborts the session, emits one
 *   LinkEvent::ConnectionLost on the reconnect signal (coalesced if one is pending)
 *   and then closes the signal, so a consumer that keeps draining sees closure.
 *   The reader never closes the inbound queue; the client owns that.
 */

#include "Session.hpp"
#include "common/Latch.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace ircconn::comm {

class Reader {
public:
    Reader(std::shared_ptr<Session> session,
           OutboundQueue& outbound,
           MessageQueue& inbound,
           ReconnectSignal& reconnect,
           const common::Latch& quit);

    Reader(const Reader&) = delete;
    Reader& operator=(const Reader&) = delete;

    ~Reader();

    void start();
    void join();

private:
    void readLoop();
    void handleLine(const std::string& line);

    std::shared_ptr<Session> session_;
    OutboundQueue& outbound_;
    MessageQueue& inbound_;
    ReconnectSignal& reconnect_;
    const common::Latch& quit_;

    std::atomic<bool> running_{false};
    std::thread thread_;
};

} // namespace ircconn::comm
