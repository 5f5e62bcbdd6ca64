#pragma once
/**
 * Client.hpp
 *
 * Connection lifecycle for one server: owns the socket, the outbound/inbound queues,
 * the reconnect signal and the quit latch, and runs one Reader/Writer pair per connection.
 *
 * State machine:
 *   Disconnected -> Connecting -> Connected -> { ReconnectPending, Closing } -> Disconnected
 *
 *  - connect(): one socket establishment (ConnectionError on failure, never retried here),
 *    registration handshake, then both loops are started and the readiness barrier released.
 *  - When both loops of a connection have exited, a per-connection supervisor thread decides:
 *    quit requested -> Closing (inbound queue and reconnect signal are closed exactly once,
 *    the socket is released); otherwise -> ReconnectPending, and the caller may connect() again.
 *  - quit(): queues QUIT (best effort) and fires the quit latch. Idempotent. Without a live
 *    connection nothing is sent and the client closes its streams right away.
 *
 * Consumers read messages() until it reports closed, and watch reconnects() for
 * LinkEvent::ConnectionLost (see ClientManager for a ready-made reconnect loop).
 * The reconnect signal carries at most one notification per connection and is closed
 * right after it; the next successful connect() reopens it empty.
 */

#include "ClientConfig.hpp"
#include "comm/Endpoint.hpp"
#include "comm/ILineTransport.hpp"
#include "comm/Session.hpp"
#include "common/Latch.hpp"

#include <fmt/printf.h>

#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace ircconn::client {

class Client {
public:
    enum class State {
        Disconnected,
        Connecting,
        Connected,
        ReconnectPending,
        Closing
    };

    // Opens a connected transport or throws ConnectionError. Injected by tests.
    using TransportFactory = std::function<std::shared_ptr<comm::ILineTransport>(
        const comm::Endpoint&, const comm::TransportOptions&)>;

    explicit Client(ClientConfig config, TransportFactory factory = {});
    ~Client();

    // non-copyable
    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    /**
     * Connects to `address` ("host", "host:port", IPv6 in brackets). The default port
     * (6667, or 6697 with TLS) is applied when none is given.
     * Throws ConnectionError on resolve/dial/handshake failure, when a connection is
     * already active, or after quit().
     */
    void connect(const std::string& address);

    bool connected() const;
    State state() const;
    // true once quit() has been called; the client cannot be reused afterwards
    bool quitRequested() const noexcept { return quit_.fired(); }

    /**
     * Queues a raw line; CRLF is appended by the writer when missing.
     * Blocks while the outbound queue is full. Throws ConnectionError after quit().
     */
    void write(const std::string& line);

    // printf-style variant: writef("PRIVMSG %s :%s", target, text)
    template <typename... Args>
    void writef(const std::string& format, const Args&... args) {
        write(fmt::sprintf(format, args...));
    }

    void quit();
    // same as quit(), with `message` instead of the configured quit message
    void quit(const std::string& message);

    comm::MessageQueue& messages() noexcept { return inbound_; }
    comm::ReconnectSignal& reconnects() noexcept { return reconnect_; }

    // host and "host:port" of the most recent successful connect
    std::string host() const;
    std::string serverAddress() const;

    const ClientConfig& config() const noexcept { return config_; }

private:
    struct Connection;

    void registerOn(comm::ILineTransport& transport);
    void supervise(Connection* connection);
    void failConnect();
    void closeStreamsLocked();

    ClientConfig config_;
    TransportFactory factory_;

    comm::OutboundQueue outbound_;
    comm::MessageQueue inbound_;
    comm::ReconnectSignal reconnect_;
    common::Latch quit_;

    mutable std::mutex mtx_; // protects everything below
    State state_{State::Disconnected};
    bool streamsClosed_{false};
    std::string host_;
    std::string serverAddress_;
    std::unique_ptr<Connection> connection_;
};

const char* toString(Client::State state);

} // namespace ircconn::client
