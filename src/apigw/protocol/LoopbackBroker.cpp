//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/apigw/protocol/LoopbackBroker.cpp
// Purpose: LoopbackBroker hub and client implementation
//==========================================================================================================

#include "logging/Logger.h"
#include "apigw/errors/Errors.h"
#include "apigw/protocol/LoopbackBroker.hpp"

namespace apigw::protocol {

void LoopbackBroker::SetUnreachable(const std::string& serverUrl, bool value) {
    std::lock_guard<std::mutex> lock(mtx);
    if (value) {
        unreachable.insert(serverUrl);
    } else {
        unreachable.erase(serverUrl);
    }
}

bool LoopbackBroker::IsUnreachable(const std::string& serverUrl) const {
    std::lock_guard<std::mutex> lock(mtx);
    return unreachable.count(serverUrl) > 0;
}

void LoopbackBroker::Publish(const std::string& serverUrl, const std::string& channel, const std::string& payload) {
    std::vector<IBrokerClient::DeliveryCallback> targets;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (historyLimit > 0) {
            history.push_back({serverUrl, channel, payload});
            while (history.size() > historyLimit) {
                history.pop_front();
            }
        }
        for (const auto& kv : subscribers) {
            if (kv.second.server == serverUrl && kv.second.channel == channel) {
                targets.push_back(kv.second.callback);
            }
        }
    }
    for (const auto& cb : targets) {
        cb(channel, payload);
    }
}

uint64_t LoopbackBroker::Subscribe(const std::string& serverUrl, const std::string& channel,
                                   IBrokerClient::DeliveryCallback callback) {
    std::lock_guard<std::mutex> lock(mtx);
    const uint64_t token = nextToken++;
    subscribers.emplace(token, Subscriber{serverUrl, channel, std::move(callback)});
    return token;
}

void LoopbackBroker::Unsubscribe(uint64_t token) {
    std::lock_guard<std::mutex> lock(mtx);
    subscribers.erase(token);
}

uint64_t LoopbackBroker::Attach(const std::string& serverUrl, IBrokerClient::ConnectionLostCallback onLost) {
    std::lock_guard<std::mutex> lock(mtx);
    const uint64_t token = nextToken++;
    sessions.emplace(token, Session{serverUrl, std::move(onLost)});
    return token;
}

void LoopbackBroker::Detach(uint64_t session) {
    std::lock_guard<std::mutex> lock(mtx);
    sessions.erase(session);
}

std::size_t LoopbackBroker::DropServer(const std::string& serverUrl) {
    std::vector<IBrokerClient::ConnectionLostCallback> notify;
    {
        std::lock_guard<std::mutex> lock(mtx);
        for (auto it = sessions.begin(); it != sessions.end();) {
            if (it->second.server == serverUrl) {
                notify.push_back(std::move(it->second.onLost));
                it = sessions.erase(it);
            } else {
                ++it;
            }
        }
        std::erase_if(subscribers, [&](const auto& kv) { return kv.second.server == serverUrl; });
    }
    LOG_INFO("Loopback broker dropped {} session(s) on {}", notify.size(), serverUrl);
    for (const auto& cb : notify) {
        if (cb) {
            cb("broker closed the connection");
        }
    }
    return notify.size();
}

void LoopbackBroker::SetHistoryLimit(std::size_t limit) {
    std::lock_guard<std::mutex> lock(mtx);
    historyLimit = limit;
    while (history.size() > historyLimit) {
        history.pop_front();
    }
}

std::vector<LoopbackBroker::Published> LoopbackBroker::History() const {
    std::lock_guard<std::mutex> lock(mtx);
    return {history.begin(), history.end()};
}

std::size_t LoopbackBroker::SubscriberCount(const std::string& serverUrl, const std::string& channel) const {
    std::lock_guard<std::mutex> lock(mtx);
    std::size_t n = 0;
    for (const auto& kv : subscribers) {
        if (kv.second.server == serverUrl && kv.second.channel == channel) {
            ++n;
        }
    }
    return n;
}

LoopbackBrokerClient::LoopbackBrokerClient(std::shared_ptr<LoopbackBroker> h)
    : hub(std::move(h)), state(std::make_shared<State>()) {}

LoopbackBrokerClient::~LoopbackBrokerClient() {
    Disconnect();
}

void LoopbackBrokerClient::SetConnectionLostCallback(ConnectionLostCallback callback) {
    std::lock_guard<std::mutex> lock(state->mtx);
    state->onLost = std::move(callback);
}

void LoopbackBrokerClient::Connect(const ServerConfig& cfg) {
    if (hub->IsUnreachable(cfg.url)) {
        throw errors::transportConnection("Loopback broker refused connection to " + cfg.url,
                                          errors::reasons::ConnectionRefused);
    }
    std::weak_ptr<State> weak = state;
    std::lock_guard<std::mutex> lock(state->mtx);
    if (state->session != 0) {
        hub->Detach(state->session);
    }
    state->server = cfg.url;
    state->connected = true;
    state->session = hub->Attach(cfg.url, [weak](const std::string& reason) {
        auto st = weak.lock();
        if (!st) {
            return;
        }
        ConnectionLostCallback onLost;
        {
            std::lock_guard<std::mutex> stLock(st->mtx);
            if (!st->connected) {
                return;
            }
            st->connected = false;
            st->session = 0;
            st->tokens.clear();
            onLost = st->onLost;
        }
        if (onLost) {
            onLost(reason);
        }
    });
}

void LoopbackBrokerClient::Publish(const std::string& channel, const std::string& payload) {
    std::string target;
    {
        std::lock_guard<std::mutex> lock(state->mtx);
        if (!state->connected) {
            throw errors::transportConnection("Loopback client is not connected", errors::reasons::Io);
        }
        target = state->server;
    }
    hub->Publish(target, channel, payload);
}

void LoopbackBrokerClient::Subscribe(const std::string& channel, DeliveryCallback callback) {
    std::lock_guard<std::mutex> lock(state->mtx);
    if (!state->connected) {
        throw errors::transportConnection("Loopback client is not connected", errors::reasons::Io);
    }
    auto existing = state->tokens.find(channel);
    if (existing != state->tokens.end()) {
        hub->Unsubscribe(existing->second);
    }
    state->tokens[channel] = hub->Subscribe(state->server, channel, std::move(callback));
}

void LoopbackBrokerClient::Unsubscribe(const std::string& channel) {
    std::lock_guard<std::mutex> lock(state->mtx);
    auto it = state->tokens.find(channel);
    if (it != state->tokens.end()) {
        hub->Unsubscribe(it->second);
        state->tokens.erase(it);
    }
}

void LoopbackBrokerClient::Disconnect() {
    std::lock_guard<std::mutex> lock(state->mtx);
    for (const auto& kv : state->tokens) {
        hub->Unsubscribe(kv.second);
    }
    state->tokens.clear();
    if (state->session != 0) {
        hub->Detach(state->session);
        state->session = 0;
    }
    state->connected = false;
}

BrokerClientFactory MakeLoopbackBrokerFactory(std::shared_ptr<LoopbackBroker> hub) {
    return [hub](const std::string& protocolName) -> std::unique_ptr<IBrokerClient> {
        LOG_DEBUG("Loopback broker client created for {}", protocolName);
        return std::make_unique<LoopbackBrokerClient>(hub);
    };
}

} // namespace apigw::protocol
