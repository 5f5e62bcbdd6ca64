#include "client/Client.hpp"
#include "comm/AsioTransport.hpp"
#include "comm/Reader.hpp"
#include "comm/Writer.hpp"
#include "protocol/CommandBuilder.hpp"
#include "protocol/exceptions/ConnectionError.h"
#include "spdlog/spdlog.h"

#include <thread>
#include <vector>

namespace ircconn::client {

struct Client::Connection {
    std::shared_ptr<comm::Session> session;
    std::unique_ptr<comm::Writer> writer;
    std::unique_ptr<comm::Reader> reader;
    std::thread supervisor;

    void join() {
        if (supervisor.joinable()) supervisor.join();
    }
};

Client::Client(ClientConfig config, TransportFactory factory)
    : config_(std::move(config)),
      factory_(std::move(factory)),
      outbound_(config_.outboundQueueSize),
      inbound_(),
      reconnect_(1) {
    if (!factory_) {
        factory_ = [](const comm::Endpoint& endpoint, const comm::TransportOptions& options)
            -> std::shared_ptr<comm::ILineTransport> {
            return comm::AsioTransport::open(endpoint, options);
        };
    }
}

Client::~Client() {
    quit();

    Connection* current = nullptr;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        current = connection_.get();
    }
    if (current) current->join();

    std::lock_guard<std::mutex> lk(mtx_);
    closeStreamsLocked();
}

void Client::connect(const std::string& address) {
    std::unique_ptr<Connection> previous;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (quit_.fired()) {
            throw ConnectionError("client has been shut down");
        }
        if (state_ == State::Connecting) {
            throw ConnectionError("a connection attempt is already in progress");
        }
        // a lost connection whose loops are still winding down counts as pending
        if (state_ == State::Connected && connection_ && !connection_->session->aborted.fired()) {
            throw ConnectionError("already connected to " + serverAddress_);
        }
        state_ = State::Connecting;
        previous = std::move(connection_);
    }

    // the old pair is finished or about to be; wait for its supervisor before dialing again
    if (previous) previous->join();
    previous.reset();
    if (quit_.fired()) {
        failConnect();
        throw ConnectionError("client was shut down before dialing " + address);
    }

    comm::Endpoint endpoint;
    std::shared_ptr<comm::ILineTransport> transport;
    try {
        endpoint = comm::resolveEndpoint(address, config_.transport.tls);
        spdlog::info("[Client] connecting to {}{}", endpoint.address(),
                     config_.transport.tls ? " (tls)" : "");
        transport = factory_(endpoint, config_.transport);
        if (!transport) {
            throw ConnectionError("no transport for " + endpoint.address());
        }
    } catch (const ConnectionError& e) {
        spdlog::error("[Client] {}", e.what());
        failConnect();
        throw;
    } catch (const std::exception& e) {
        spdlog::error("[Client] connect to {} failed: {}", address, e.what());
        failConnect();
        throw ConnectionError(std::string("connect to ") + address + " failed: " + e.what());
    }

    try {
        registerOn(*transport);
    } catch (const ConnectionError& e) {
        spdlog::error("[Client] {}", e.what());
        transport->shutdown();
        failConnect();
        throw;
    }

    auto connection = std::make_unique<Connection>();
    connection->session = std::make_shared<comm::Session>(transport);
    connection->writer = std::make_unique<comm::Writer>(connection->session, outbound_, quit_);
    connection->reader = std::make_unique<comm::Reader>(
        connection->session, outbound_, inbound_, reconnect_, quit_);

    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (quit_.fired()) {
            transport->shutdown();
            state_ = State::Disconnected;
            closeStreamsLocked();
            throw ConnectionError("client was shut down while connecting to " + endpoint.address());
        }

        // fresh signal for this connection; anything left over belongs to the old one
        if (reconnect_.reopen() > 0) {
            spdlog::debug("[Client] stale reconnect notification discarded");
        }

        host_ = endpoint.host;
        serverAddress_ = endpoint.address();
        state_ = State::Connected;
        connection_ = std::move(connection);

        Connection* c = connection_.get();
        c->writer->start();
        c->reader->start();
        c->supervisor = std::thread([this, c]() { supervise(c); });
        c->session->ready.countDown();
    }

    spdlog::info("[Client] connected to {}", endpoint.address());
}

void Client::registerOn(comm::ILineTransport& transport) {
    if (config_.nick.empty()) return;

    const std::string& username = config_.username.empty() ? config_.nick : config_.username;
    const std::string& realname = config_.realname.empty() ? config_.nick : config_.realname;

    std::vector<std::string> lines;
    if (!config_.password.empty()) {
        lines.push_back(protocol::CommandBuilder::pass(config_.password));
    }
    lines.push_back(protocol::CommandBuilder::nick(config_.nick));
    lines.push_back(protocol::CommandBuilder::user(username, realname));

    for (const auto& line : lines) {
        boost::system::error_code ec;
        transport.writeLine(comm::Writer::terminate(line), ec);
        if (ec) {
            throw ConnectionError("registration failed: " + ec.message());
        }
    }
    spdlog::debug("[Client] registered as {}", config_.nick);
}

void Client::supervise(Connection* connection) {
    auto& session = *connection->session;

    // the writer stops first (quit flushed, or session aborted); closing the socket
    // then unblocks the reader
    session.writerDone.wait();
    session.transport->shutdown();
    session.loopsDone.wait();
    connection->writer->join();
    connection->reader->join();

    std::lock_guard<std::mutex> lk(mtx_);
    if (connection_.get() != connection) {
        // superseded by a newer connect()
        return;
    }
    if (quit_.fired()) {
        state_ = State::Closing;
        closeStreamsLocked();
        state_ = State::Disconnected;
        spdlog::info("[Client] connection to {} closed", serverAddress_);
    } else {
        state_ = State::ReconnectPending;
        // keep-alive replies answer the dead session's PINGs; user lines wait for the next connect
        auto stale = outbound_.remove_if([](const std::string& line) {
            return line.compare(0, 5, "PONG ") == 0;
        });
        if (stale > 0) {
            spdlog::debug("[Client] dropped {} keep-alive reply(ies) of the lost session", stale);
        }
        spdlog::warn("[Client] connection to {} lost, reconnect pending", serverAddress_);
    }
}

void Client::failConnect() {
    std::lock_guard<std::mutex> lk(mtx_);
    state_ = State::Disconnected;
    if (quit_.fired()) {
        closeStreamsLocked();
    }
}

void Client::closeStreamsLocked() {
    if (streamsClosed_) return;
    streamsClosed_ = true;

    inbound_.close();
    // a pending reconnect request is stale once the client is closing
    reconnect_.clear();
    reconnect_.close();

    auto dropped = outbound_.clear();
    outbound_.close();
    if (dropped > 0) {
        spdlog::debug("[Client] {} unsent line(s) dropped on close", dropped);
    }
}

bool Client::connected() const {
    std::lock_guard<std::mutex> lk(mtx_);
    if (state_ != State::Connected || quit_.fired() || !connection_) return false;
    const auto& session = connection_->session;
    return !session->aborted.fired() && session->transport && session->transport->isOpen();
}

Client::State Client::state() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return state_;
}

void Client::write(const std::string& line) {
    if (quit_.fired()) {
        throw ConnectionError("client is shutting down, write rejected");
    }
    if (!outbound_.push(line)) {
        throw ConnectionError("outbound queue is closed, write rejected");
    }
}

void Client::quit() {
    quit(config_.quitMessage);
}

void Client::quit(const std::string& message) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (quit_.fired()) return;

    if (state_ == State::Connected || state_ == State::Connecting) {
        if (!outbound_.try_push(protocol::CommandBuilder::quit(message))) {
            spdlog::warn("[Client] outbound queue full, QUIT not queued");
        }
        quit_.fire();
        outbound_.interrupt();
        spdlog::info("[Client] quit requested");
        return;
    }

    // no live connection: nothing goes on the wire
    quit_.fire();
    state_ = State::Closing;
    closeStreamsLocked();
    state_ = State::Disconnected;
    spdlog::info("[Client] quit while disconnected");
}

std::string Client::host() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return host_;
}

std::string Client::serverAddress() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return serverAddress_;
}

const char* toString(Client::State state) {
    switch (state) {
        case Client::State::Disconnected:     return "Disconnected";
        case Client::State::Connecting:       return "Connecting";
        case Client::State::Connected:        return "Connected";
        case Client::State::ReconnectPending: return "ReconnectPending";
        case Client::State::Closing:          return "Closing";
    }
    return "Unknown";
}

} // namespace ircconn::client
