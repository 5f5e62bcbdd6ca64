#ifndef IRCCONN_PARSE_ERROR_H
#define IRCCONN_PARSE_ERROR_H

#include <stdexcept>
#include <string>

namespace ircconn {

/**
 * @brief Exception class for wire lines that do not form a message.
 *
 * This indicates an empty line, or a prefix or trailing parameter with no command.
 */
class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& message)
        : std::runtime_error("Parse Error: " + message) {}
};

} // namespace ircconn

#endif // IRCCONN_PARSE_ERROR_H
