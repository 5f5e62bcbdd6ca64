#pragma once
#include <optional>
#include <string>
#include <vector>

namespace ircconn::protocol {

/**
 * Message: one protocol line in structured form
 * - prefix: sender identity, present only when the line starts with ':'
 * - command: command token (e.g., "PRIVMSG", "PING", "001")
 * - params: middle parameters (no spaces, no leading ':')
 * - trailing: final parameter after " :", verbatim; may be empty or contain spaces
 */
struct Message {
    std::optional<std::string> prefix;
    std::string command;
    std::vector<std::string> params;
    std::optional<std::string> trailing;

    // nick part of the prefix ("nick!user@host" -> "nick"); empty without a prefix
    std::string nick() const;

    // trailing if present, else the last middle parameter, else empty
    std::string lastParam() const;

    bool operator==(const Message& other) const;
    bool operator!=(const Message& other) const { return !(*this == other); }
};

/**
 * Parse one wire line. A residual CR/LF is ignored.
 * Throws ircconn::ParseError for an empty line or a line without a command.
 */
Message parse(const std::string& line);

// Wire form without the CRLF terminator
std::string toLine(const Message& message);

// Wire form terminated by CRLF
std::string serialize(const Message& message);

} // namespace ircconn::protocol
