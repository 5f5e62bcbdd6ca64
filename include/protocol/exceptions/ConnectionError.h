#ifndef IRCCONN_CONNECTION_ERROR_H
#define IRCCONN_CONNECTION_ERROR_H

#include <stdexcept>
#include <string>

namespace ircconn {

/**
 * @brief Exception class for transport layer errors.
 *
 * Raised synchronously by connect: DNS failure, dial failure, TLS handshake failure,
 * an unusable address, or a client that can no longer connect.
 */
class ConnectionError : public std::runtime_error {
public:
    explicit ConnectionError(const std::string& message)
        : std::runtime_error("Connection Error: " + message) {}
};

} // namespace ircconn

#endif // IRCCONN_CONNECTION_ERROR_H
