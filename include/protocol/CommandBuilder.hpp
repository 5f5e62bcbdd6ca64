#pragma once
#include "Message.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ircconn::protocol {

struct CommandBuilder {
    // Build a command line (no CRLF; the Writer terminates lines).
    // trailing, when given, is sent after " :" and may contain spaces.
    static std::string makeCommand(const std::string& cmd,
                                   const std::vector<std::string>& params = {},
                                   const std::optional<std::string>& trailing = std::nullopt) {
        Message m;
        m.command = cmd;
        m.params = params;
        m.trailing = trailing;
        return toLine(m);
    }

    // Keep-alive reply: echoes the PING argument in the form it arrived
    static std::string pong(const Message& ping) {
        Message m;
        m.command = "PONG";
        m.params = ping.params;
        m.trailing = ping.trailing;
        return toLine(m);
    }

    static std::string pass(const std::string& password) {
        return makeCommand("PASS", {password});
    }

    static std::string nick(const std::string& nick) {
        return makeCommand("NICK", {nick});
    }

    static std::string user(const std::string& username, const std::string& realname) {
        return makeCommand("USER", {username, "0", "*"}, realname);
    }

    static std::string quit(const std::string& message = {}) {
        if (message.empty()) return makeCommand("QUIT");
        return makeCommand("QUIT", {}, message);
    }

    static std::string join(const std::string& channel) {
        return makeCommand("JOIN", {channel});
    }

    static std::string part(const std::string& channel) {
        return makeCommand("PART", {channel});
    }

    static std::string privmsg(const std::string& target, const std::string& text) {
        return makeCommand("PRIVMSG", {target}, text);
    }

    static std::string notice(const std::string& target, const std::string& text) {
        return makeCommand("NOTICE", {target}, text);
    }
};

} // namespace ircconn::protocol
