#pragma once

#include <string>

namespace ircconn::comm {

/**
 * Endpoint: a server address split into host and port.
 * - host never carries IPv6 brackets
 * - explicitPort records whether the caller supplied the port
 */
struct Endpoint {
    std::string host;
    std::string port;
    bool explicitPort{false};

    // "host:port", with IPv6 hosts re-bracketed ("[::1]:6667")
    std::string address() const;
};

/**
 * Split `address` and apply the protocol default port (6667, or 6697 with TLS)
 * when none is given. Accepted forms: host, host:port, [v6], [v6]:port, bare v6.
 * Throws ircconn::ConnectionError for an empty host or an invalid port.
 */
Endpoint resolveEndpoint(const std::string& address, bool tls);

} // namespace ircconn::comm
