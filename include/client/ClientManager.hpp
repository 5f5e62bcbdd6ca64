#pragma once
/**
 * ClientManager.hpp
 *
 * Manager that keeps one Client connected to one server.
 *
 * Responsibilities:
 *  - single connect attempt (connectOnce)
 *  - optionally run a reconnect loop (startAsync): after a lost connection the client is
 *    reconnected right away; failed attempts are retried with a back-off that starts at
 *    reconnectInterval and doubles up to maxReconnectInterval (reset after a success)
 *  - stop(): quits the client and joins the background thread
 *
 * Threading:
 *  - startAsync launches a background thread; if autoReconnect==false it makes a single
 *    attempt and exits
 *  - The loop also ends by itself once the client has quit (its reconnect signal closes)
 */

#include "Client.hpp"
#include "common/Latch.hpp"
#include "config/Config.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace ircconn::client {

class ClientManager {
public:
    using ms = std::chrono::milliseconds;

    ClientManager(std::shared_ptr<Client> client,
                  std::string address,
                  bool autoReconnect = false,
                  ms reconnectInterval = ms(config::DEFAULT_RECONNECT_INTERVAL_MS),
                  ms maxReconnectInterval = ms(config::DEFAULT_MAX_RECONNECT_INTERVAL_MS));
    ~ClientManager();

    // non-copyable
    ClientManager(const ClientManager&) = delete;
    ClientManager& operator=(const ClientManager&) = delete;

    void startAsync();
    void stop();

    // returns true on success; ConnectionError is logged, not rethrown
    bool connectOnce();

    bool isRunning() const noexcept;   // reconnect thread alive
    bool isConnected() const;          // client connected

    const std::shared_ptr<Client>& client() const noexcept { return client_; }

private:
    void reconnectionLoop();

    std::shared_ptr<Client> client_;
    std::string address_;

    // options
    bool autoReconnect_;
    ms reconnectInterval_;
    ms maxReconnectInterval_;

    std::thread reconThread_;
    std::atomic<bool> running_{false};
    common::Latch stopRequested_;
    std::mutex mtx_;
};

} // namespace ircconn::client
