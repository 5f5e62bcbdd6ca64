#include "comm/Endpoint.hpp"
#include "config/Config.hpp"
#include "protocol/exceptions/ConnectionError.h"

#include <algorithm>
#include <cctype>

namespace ircconn::comm {

namespace {
    static bool is_valid_port(const std::string& port) {
        if (port.empty() || port.size() > 5) return false;
        if (!std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c); })) {
            return false;
        }
        int value = std::stoi(port);
        return value > 0 && value <= 65535;
    }
} // namespace

std::string Endpoint::address() const {
    if (host.find(':') != std::string::npos) {
        return "[" + host + "]:" + port;
    }
    return host + ":" + port;
}

Endpoint resolveEndpoint(const std::string& address, bool tls) {
    Endpoint ep;

    if (!address.empty() && address.front() == '[') {
        auto close = address.find(']');
        if (close == std::string::npos) {
            throw ConnectionError("unterminated IPv6 literal in address: " + address);
        }
        ep.host = address.substr(1, close - 1);
        std::string rest = address.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') {
                throw ConnectionError("unexpected text after IPv6 literal: " + address);
            }
            ep.port = rest.substr(1);
            ep.explicitPort = true;
        }
    } else {
        auto first = address.find(':');
        auto last = address.rfind(':');
        if (first != std::string::npos && first == last) {
            ep.host = address.substr(0, first);
            ep.port = address.substr(first + 1);
            ep.explicitPort = true;
        } else {
            // no colon, or a bare IPv6 literal which cannot carry a port
            ep.host = address;
        }
    }

    if (ep.host.empty()) {
        throw ConnectionError("missing host in address: '" + address + "'");
    }
    if (!ep.explicitPort) {
        ep.port = tls ? config::DEFAULT_TLS_PORT : config::DEFAULT_PORT;
    } else if (!is_valid_port(ep.port)) {
        throw ConnectionError("invalid port in address: " + address);
    }
    return ep;
}

} // namespace ircconn::comm
