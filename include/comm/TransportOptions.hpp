#pragma once

#include "config/Config.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace ircconn::comm {

struct TlsOptions {
    // Accept any peer certificate (self-signed servers in controlled deployments, tests)
    bool skipVerify{false};
    // Extra PEM trust anchors on top of the system store
    std::string caFile;
    // Name used for SNI and host name verification; defaults to the connect host
    std::string serverName;
};

struct TransportOptions {
    bool tls{false};
    TlsOptions tlsOptions;

    std::chrono::milliseconds connectTimeout{config::DEFAULT_CONNECT_TIMEOUT_MS};
    std::chrono::milliseconds readTimeout{config::DEFAULT_READ_TIMEOUT_MS};
    std::chrono::milliseconds writeTimeout{config::DEFAULT_WRITE_TIMEOUT_MS};
    std::size_t maxLineLength{config::DEFAULT_MAX_LINE_LENGTH};
};

} // namespace ircconn::comm
