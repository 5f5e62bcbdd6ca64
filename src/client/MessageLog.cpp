#include "client/MessageLog.hpp"
#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"

namespace ircconn::client {

namespace {
constexpr const char* HISTORY_LOGGER = "history";

std::shared_ptr<spdlog::logger> historyLogger() {
    if (auto existing = spdlog::get(HISTORY_LOGGER)) {
        return existing;
    }
    try {
        return spdlog::stdout_color_mt(HISTORY_LOGGER);
    } catch (const spdlog::spdlog_ex&) {
        // registered by a concurrent caller in the meantime
        if (auto existing = spdlog::get(HISTORY_LOGGER)) {
            return existing;
        }
        throw;
    }
}
} // namespace

bool forwardToLog(const protocol::Message& msg, const std::string& server, IMessageLog& log) {
    if (msg.command != "PRIVMSG" && msg.command != "NOTICE") return false;
    if (msg.params.empty()) return false;

    // "PRIVMSG #chan hello" without the colon carries its text as the last middle param
    std::string content;
    if (msg.trailing) {
        content = *msg.trailing;
    } else if (msg.params.size() >= 2) {
        content = msg.params.back();
    } else {
        return false;
    }

    log.logMessage(server, msg.nick(), msg.params.front(), content);
    return true;
}

SpdlogMessageLog::SpdlogMessageLog(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : historyLogger()) {}

void SpdlogMessageLog::logMessage(const std::string& server,
                                  const std::string& from,
                                  const std::string& to,
                                  const std::string& content) {
    logger_->info("[{}] {} <{}> {}", server, to, from, content);
}

} // namespace ircconn::client
