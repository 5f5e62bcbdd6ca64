#pragma once
/**
 * Writer.hpp
 *
 * Threaded, line-oriented writer: the single consumer of the outbound queue.
 *
 * Design notes:
 * - Lines are written in queue order, each terminated with CRLF if it lacks one.
 *   Every producer (application sends, keep-alive replies) goes through the queue,
 *   so concurrent sends never interleave on the wire.
 * - The worker waits on the session's readiness barrier before touching the socket.
 * - quit: the worker flushes whatever is still queued (best effort) and exits.
 * - write failure: the session is aborted, queued lines are discarded and the worker exits.
 *   The client then closes the socket, which makes the reader report the lost connection.
 * - Construction is lightweight; the worker thread starts on start().
 */

#include "Session.hpp"
#include "common/Latch.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace ircconn::comm {

class Writer {
public:
    Writer(std::shared_ptr<Session> session, OutboundQueue& queue, const common::Latch& quit);

    // non-copyable
    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    ~Writer();

    /**
     * start the internal worker thread. Calling it twice has no effect.
     */
    void start();

    /**
     * wait for the worker thread to exit. The worker exits on its own
     * (quit or session abort); join() does not request anything.
     */
    void join();

    // line + CRLF, unless the line already ends with CRLF (a bare LF gets its CR)
    static std::string terminate(const std::string& line);

private:
    void workerLoop();
    // false once the session cannot take more writes
    bool send(const std::string& line);

    std::shared_ptr<Session> session_;
    OutboundQueue& queue_;
    const common::Latch& quit_;

    std::atomic<bool> running_{false};
    std::thread workerThread_;
};

} // namespace ircconn::comm
