// src/client/ClientManager.cpp
#include "client/ClientManager.hpp"
#include "protocol/exceptions/ConnectionError.h"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <stdexcept>

namespace ircconn::client {

ClientManager::ClientManager(std::shared_ptr<Client> client,
                             std::string address,
                             bool autoReconnect,
                             ms reconnectInterval,
                             ms maxReconnectInterval)
    : client_(std::move(client)),
      address_(std::move(address)),
      autoReconnect_(autoReconnect),
      reconnectInterval_(reconnectInterval),
      maxReconnectInterval_(std::max(reconnectInterval, maxReconnectInterval)) {
    if (!client_) {
        throw std::invalid_argument("ClientManager requires a client");
    }
    if (reconnectInterval_ <= ms(0)) {
        throw std::invalid_argument("reconnect interval must be positive");
    }
}

ClientManager::~ClientManager() {
    stop();
}

void ClientManager::startAsync() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (running_.load() || stopRequested_.fired()) return;
    if (reconThread_.joinable()) {
        // previous single-shot run already finished
        reconThread_.join();
    }
    running_.store(true);
    reconThread_ = std::thread(&ClientManager::reconnectionLoop, this);
}

void ClientManager::stop() {
    if (stopRequested_.fire()) {
        spdlog::info("[ClientManager] stop requested");
    }
    client_->quit();

    std::lock_guard<std::mutex> lk(mtx_);
    if (reconThread_.joinable()) {
        reconThread_.join();
    }
    running_.store(false);
}

bool ClientManager::connectOnce() {
    try {
        client_->connect(address_);
        return true;
    } catch (const ConnectionError& ex) {
        spdlog::warn("[ClientManager] connectOnce failed: {}", ex.what());
        return false;
    }
}

bool ClientManager::isRunning() const noexcept {
    return running_.load();
}

bool ClientManager::isConnected() const {
    return client_->connected();
}

void ClientManager::reconnectionLoop() {
    // If autoReconnect_ is false, attempt a single connect and return
    if (!autoReconnect_) {
        if (!connectOnce()) {
            spdlog::error("[ClientManager] single connect to {} failed and autoReconnect disabled", address_);
        }
        running_.store(false);
        return;
    }

    ms delay = reconnectInterval_;
    while (!stopRequested_.fired()) {
        if (connectOnce()) {
            delay = reconnectInterval_;
            // blocks until the link is lost or the client quits
            auto event = client_->reconnects().pop();
            if (!event || client_->quitRequested()) break;
            spdlog::warn("[ClientManager] connection to {} lost, reconnecting", address_);
            continue;
        }

        if (client_->quitRequested()) break;

        spdlog::info("[ClientManager] retrying in {} ms", delay.count());
        if (stopRequested_.waitFor(delay)) break;
        delay = std::min(delay * 2, maxReconnectInterval_);
    }

    spdlog::debug("[ClientManager] reconnect loop exiting");
    running_.store(false);
}

} // namespace ircconn::client
