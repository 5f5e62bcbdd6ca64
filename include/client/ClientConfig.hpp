#pragma once

#include "comm/TransportOptions.hpp"
#include "config/Config.hpp"

#include <cstddef>
#include <string>

namespace ircconn::client {

struct ClientConfig {
    // TLS flag, verification options and timeouts
    comm::TransportOptions transport;

    // Registration sent on every new connection; nothing is sent when nick is empty.
    // username/realname fall back to the nick.
    std::string nick;
    std::string username;
    std::string realname;
    std::string password;

    std::string quitMessage;

    // bound of the outbound queue; write() blocks while it is full
    std::size_t outboundQueueSize{config::DEFAULT_WRITER_MAX_QUEUE};
};

} // namespace ircconn::client
