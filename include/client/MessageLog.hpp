#pragma once
/**
 * MessageLog.hpp
 *
 * Chat history hand-off. The connection core never depends on this; a consumer of
 * Client::messages() calls forwardToLog() for every message it pops.
 */

#include "protocol/Message.hpp"

#include <memory>
#include <string>

namespace spdlog {
class logger;
}

namespace ircconn::client {

// persistence collaborator
class IMessageLog {
public:
    virtual ~IMessageLog() = default;
    virtual void logMessage(const std::string& server,
                            const std::string& from,
                            const std::string& to,
                            const std::string& content) = 0;
};

/**
 * Hands PRIVMSG and NOTICE messages that carry a target and text to `log`.
 * Returns true if the message was logged.
 */
bool forwardToLog(const protocol::Message& msg, const std::string& server, IMessageLog& log);

// Records history lines through a named spdlog logger ("history" by default).
class SpdlogMessageLog : public IMessageLog {
public:
    explicit SpdlogMessageLog(std::shared_ptr<spdlog::logger> logger = nullptr);

    void logMessage(const std::string& server,
                    const std::string& from,
                    const std::string& to,
                    const std::string& content) override;

    const std::shared_ptr<spdlog::logger>& logger() const noexcept { return logger_; }

private:
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace ircconn::client
