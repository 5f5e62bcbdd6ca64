// src/protocol/Message.cpp
#include "protocol/Message.hpp"
#include "protocol/exceptions/ParseError.h"

namespace ircconn::protocol {

namespace {
    // strip a CRLF (or a lone CR/LF) left on the line
    static std::string trim_terminator(const std::string& s) {
        std::string out = s;
        while (!out.empty() && (out.back() == '\n' || out.back() == '\r')) out.pop_back();
        return out;
    }

    static std::size_t skip_spaces(const std::string& s, std::size_t pos) {
        while (pos < s.size() && s[pos] == ' ') ++pos;
        return pos;
    }
} // namespace

std::string Message::nick() const {
    if (!prefix) return {};
    auto bang = prefix->find('!');
    return bang == std::string::npos ? *prefix : prefix->substr(0, bang);
}

std::string Message::lastParam() const {
    if (trailing) return *trailing;
    if (!params.empty()) return params.back();
    return {};
}

bool Message::operator==(const Message& other) const {
    return prefix == other.prefix &&
           command == other.command &&
           params == other.params &&
           trailing == other.trailing;
}

Message parse(const std::string& lineIn) {
    std::string line = trim_terminator(lineIn);
    if (line.empty()) {
        throw ParseError("empty line");
    }

    Message msg;
    std::size_t pos = 0;

    // 1. prefix runs up to the first space
    if (line[0] == ':') {
        auto space = line.find(' ');
        if (space == std::string::npos) {
            throw ParseError("prefix without command: " + line);
        }
        msg.prefix = line.substr(1, space - 1);
        pos = space + 1;
    }

    // 2. command token
    pos = skip_spaces(line, pos);
    if (pos >= line.size() || line[pos] == ':') {
        throw ParseError("missing command: " + line);
    }
    auto end = line.find(' ', pos);
    msg.command = line.substr(pos, end == std::string::npos ? std::string::npos : end - pos);

    // 3. middle params until the line ends or a " :" introduces the trailing param
    while (end != std::string::npos) {
        pos = skip_spaces(line, end);
        if (pos >= line.size()) break;
        if (line[pos] == ':') {
            msg.trailing = line.substr(pos + 1);
            break;
        }
        end = line.find(' ', pos);
        msg.params.push_back(line.substr(pos, end == std::string::npos ? std::string::npos : end - pos));
    }

    return msg;
}

std::string toLine(const Message& message) {
    std::string out;
    if (message.prefix) {
        out += ':';
        out += *message.prefix;
        out += ' ';
    }
    out += message.command;
    for (const auto& p : message.params) {
        out += ' ';
        out += p;
    }
    if (message.trailing) {
        out += " :";
        out += *message.trailing;
    }
    return out;
}

std::string serialize(const Message& message) {
    return toLine(message) + "\r\n";
}

} // namespace ircconn::protocol
