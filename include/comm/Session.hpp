#pragma once
/**
 * Session.hpp
 *
 * Shared state of one connection attempt and the queues that outlive it.
 *
 *  - Session is created by the client for every successful connect and handed to the
 *    Reader/Writer pair. They borrow the transport; the client owns it and replaces the
 *    whole Session on reconnect.
 *  - ready: readiness barrier, released by the client once setup is complete.
 *  - writerDone / loopsDone: countdowns the client waits on before it shuts the socket
 *    and before it joins the loops.
 *  - aborted: fired by whichever loop first hits a socket failure; wakes the other one.
 */

#include "ILineTransport.hpp"
#include "common/Latch.hpp"
#include "common/ThreadSafeQueue.h"
#include "protocol/Message.hpp"

#include <memory>
#include <string>

namespace ircconn::comm {

// Token carried by the reconnect signal
enum class LinkEvent {
    ConnectionLost
};

// raw lines awaiting the writer; many producers, one consumer
using OutboundQueue = common::ThreadSafeQueue<std::string>;
// decoded inbound messages; the reader is the only producer
using MessageQueue = common::ThreadSafeQueue<protocol::Message>;
// capacity 1: a pending signal absorbs duplicates; closed after each loss, reopened on connect
using ReconnectSignal = common::ThreadSafeQueue<LinkEvent>;

struct Session {
    explicit Session(std::shared_ptr<ILineTransport> t)
        : transport(std::move(t)) {}

    std::shared_ptr<ILineTransport> transport;
    common::CountdownLatch ready{1};
    common::CountdownLatch writerDone{1};
    common::CountdownLatch loopsDone{2};
    common::Latch aborted;
};

} // namespace ircconn::comm
