//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/apigw/protocol/BrokerAdapter.cpp
// Purpose: BrokerAdapter implementation (connection cache, channel reference counting, dispatch)
//==========================================================================================================

#include <map>
#include <mutex>
#include <set>
#include <utility>
#include <vector>

#include "logging/Logger.h"
#include "apigw/errors/Errors.h"
#include "apigw/protocol/BrokerAdapter.hpp"
#include "apigw/protocol/MessageDispatcher.hpp"

namespace apigw::protocol {

class BrokerAdapter::Impl {
public:
    struct Connection {
        std::string key;
        std::string url;
        std::shared_ptr<IBrokerClient> client;
        std::map<std::string, std::set<SubscriptionHandle>> channels;
    };

    struct Subscription {
        ConnectionHandle connection;
        std::string channel;
        MessageHandler handler;
    };

    std::string protocolName;
    BrokerClientFactory factory;
    Clock clock;
    MessageDispatcher dispatcher;

    mutable std::mutex mtx;
    std::map<ConnectionHandle, Connection> connections;
    std::map<std::string, ConnectionHandle> byKey;
    std::map<SubscriptionHandle, Subscription> subscriptions;
    // Clients whose session was lost; released from caller threads, never from their own callback.
    std::vector<std::shared_ptr<IBrokerClient>> retired;

    Impl(std::string p, BrokerClientFactory f, Clock c)
        : protocolName(std::move(p)), factory(std::move(f)), clock(std::move(c)), dispatcher(protocolName) {}

    std::shared_ptr<IBrokerClient> clientFor(const ConnectionHandle& handle) {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = connections.find(handle);
        if (it == connections.end()) {
            throw errors::transportConnection(protocolName + ": unknown connection " + handle, errors::reasons::Io);
        }
        return it->second.client;
    }

    void onConnectionLost(const ConnectionHandle& handle, const std::string& reason) {
        std::size_t dropped = 0;
        std::string url;
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto it = connections.find(handle);
            if (it == connections.end()) {
                return;
            }
            url = it->second.url;
            for (const auto& [channel, subs] : it->second.channels) {
                for (const auto& subId : subs) {
                    dropped += subscriptions.erase(subId);
                }
            }
            byKey.erase(it->second.key);
            retired.push_back(std::move(it->second.client));
            connections.erase(it);
        }
        LOG_WARN("{}: connection {} to {} lost ({}); evicted with {} subscriptions", protocolName, handle, url,
                 reason, dropped);
    }

    std::vector<std::shared_ptr<IBrokerClient>> takeRetired() {
        std::lock_guard<std::mutex> lock(mtx);
        return std::exchange(retired, {});
    }

    void onDelivery(const ConnectionHandle& handle, const std::string& channel, const std::string& payload) {
        std::vector<std::pair<SubscriptionHandle, MessageHandler>> targets;
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto conn = connections.find(handle);
            if (conn == connections.end()) {
                return;
            }
            auto ch = conn->second.channels.find(channel);
            if (ch == conn->second.channels.end()) {
                return;
            }
            for (const auto& subId : ch->second) {
                auto sub = subscriptions.find(subId);
                if (sub != subscriptions.end()) {
                    targets.emplace_back(subId, sub->second.handler);
                }
            }
        }
        const JSONValue decoded = decodeFrame(payload);
        for (auto& [subId, handler] : targets) {
            InboundMessage msg;
            msg.subscriptionId = subId;
            msg.channel = channel;
            msg.payload = decoded;
            msg.raw = payload;
            dispatcher.Post(std::move(handler), std::move(msg));
        }
    }
};

BrokerAdapter::BrokerAdapter(std::string protocolName, BrokerClientFactory factory, Clock clock)
    : pImpl(std::make_shared<Impl>(std::move(protocolName), std::move(factory), std::move(clock))) {}

BrokerAdapter::~BrokerAdapter() {
    Shutdown();
}

std::string BrokerAdapter::Protocol() const { return pImpl->protocolName; }

ConnectionHandle BrokerAdapter::Connect(const ServerConfig& server) {
    FUNC_SCOPE();
    const std::string key = connectionKey(pImpl->protocolName, server.url);
    pImpl->takeRetired();
    {
        std::lock_guard<std::mutex> lock(pImpl->mtx);
        auto it = pImpl->byKey.find(key);
        if (it != pImpl->byKey.end()) {
            return it->second;
        }
    }
    if (!pImpl->factory) {
        throw errors::transportConnection("No " + pImpl->protocolName + " client library is bound to the gateway",
                                          errors::reasons::NoClient);
    }
    std::shared_ptr<IBrokerClient> client = pImpl->factory(pImpl->protocolName);
    if (!client) {
        throw errors::transportConnection("Broker client factory has no " + pImpl->protocolName + " client",
                                          errors::reasons::NoClient);
    }
    const ConnectionHandle candidate = generateId();
    std::weak_ptr<Impl> weak = pImpl;
    client->SetConnectionLostCallback([weak, candidate](const std::string& reason) {
        if (auto self = weak.lock()) {
            self->onConnectionLost(candidate, reason);
        }
    });
    client->Connect(server);
    logAdapterOperation(pImpl->protocolName, "connect", server.url);

    std::shared_ptr<IBrokerClient> loser;
    ConnectionHandle handle;
    {
        std::lock_guard<std::mutex> lock(pImpl->mtx);
        auto it = pImpl->byKey.find(key);
        if (it != pImpl->byKey.end()) {
            // Another caller connected concurrently; keep theirs
            handle = it->second;
            loser = std::move(client);
        } else {
            handle = candidate;
            Impl::Connection conn;
            conn.key = key;
            conn.url = server.url;
            conn.client = std::move(client);
            pImpl->connections.emplace(handle, std::move(conn));
            pImpl->byKey.emplace(key, handle);
        }
    }
    if (loser) {
        loser->Disconnect();
    }
    return handle;
}

std::string BrokerAdapter::Publish(const ConnectionHandle& connection, const std::string& channel,
                                   const JSONValue& payload, const HeaderList& headers) {
    FUNC_SCOPE();
    auto client = pImpl->clientFor(connection);
    const JSONValue envelope = makeEnvelope(channel, "publish", headers, payload, pImpl->clock());
    client->Publish(channel, serializeJSONValue(envelope));
    logAdapterOperation(pImpl->protocolName, "publish", channel);
    return envelope.getString("id");
}

SubscriptionHandle BrokerAdapter::Subscribe(const ConnectionHandle& connection, const std::string& channel,
                                            MessageHandler handler) {
    FUNC_SCOPE();
    std::shared_ptr<IBrokerClient> client;
    const SubscriptionHandle subId = generateId();
    bool first = false;
    {
        std::lock_guard<std::mutex> lock(pImpl->mtx);
        auto it = pImpl->connections.find(connection);
        if (it == pImpl->connections.end()) {
            throw errors::transportConnection(pImpl->protocolName + ": unknown connection " + connection, errors::reasons::Io);
        }
        client = it->second.client;
        auto& subs = it->second.channels[channel];
        first = subs.empty();
        subs.insert(subId);
        pImpl->subscriptions.emplace(subId, Impl::Subscription{connection, channel, std::move(handler)});
    }
    if (first) {
        std::weak_ptr<Impl> weak = pImpl;
        try {
            client->Subscribe(channel, [weak, connection](const std::string& ch, const std::string& payload) {
                if (auto self = weak.lock()) {
                    self->onDelivery(connection, ch, payload);
                }
            });
        } catch (const std::exception&) {
            // Callers that joined the channel while the client subscribed share its failure
            std::lock_guard<std::mutex> lock(pImpl->mtx);
            pImpl->subscriptions.erase(subId);
            auto it = pImpl->connections.find(connection);
            if (it != pImpl->connections.end()) {
                auto ch = it->second.channels.find(channel);
                if (ch != it->second.channels.end()) {
                    for (const auto& joined : ch->second) {
                        pImpl->subscriptions.erase(joined);
                    }
                    it->second.channels.erase(ch);
                }
            }
            throw;
        }
    }
    logAdapterOperation(pImpl->protocolName, "subscribe", channel);
    return subId;
}

void BrokerAdapter::Unsubscribe(const SubscriptionHandle& subscription) {
    FUNC_SCOPE();
    std::shared_ptr<IBrokerClient> client;
    std::string channel;
    {
        std::lock_guard<std::mutex> lock(pImpl->mtx);
        auto sub = pImpl->subscriptions.find(subscription);
        if (sub == pImpl->subscriptions.end()) {
            return;
        }
        channel = sub->second.channel;
        auto conn = pImpl->connections.find(sub->second.connection);
        pImpl->subscriptions.erase(sub);
        if (conn != pImpl->connections.end()) {
            auto ch = conn->second.channels.find(channel);
            if (ch != conn->second.channels.end()) {
                ch->second.erase(subscription);
                if (ch->second.empty()) {
                    conn->second.channels.erase(ch);
                    client = conn->second.client;
                }
            }
        }
    }
    if (client) {
        client->Unsubscribe(channel);
    }
    logAdapterOperation(pImpl->protocolName, "unsubscribe", channel);
}

void BrokerAdapter::Disconnect(const ConnectionHandle& connection) {
    FUNC_SCOPE();
    Impl::Connection conn;
    {
        std::lock_guard<std::mutex> lock(pImpl->mtx);
        auto it = pImpl->connections.find(connection);
        if (it == pImpl->connections.end()) {
            return;
        }
        conn = std::move(it->second);
        pImpl->connections.erase(it);
        pImpl->byKey.erase(conn.key);
        for (const auto& [channel, subs] : conn.channels) {
            for (const auto& subId : subs) {
                pImpl->subscriptions.erase(subId);
            }
        }
    }
    for (const auto& [channel, subs] : conn.channels) {
        try {
            conn.client->Unsubscribe(channel);
        } catch (const std::exception& e) {
            LOG_WARN("{}: unsubscribe from {} during disconnect failed: {}", pImpl->protocolName, channel, e.what());
        }
    }
    conn.client->Disconnect();
    logAdapterOperation(pImpl->protocolName, "disconnect", conn.url);
}

void BrokerAdapter::Shutdown() {
    FUNC_SCOPE();
    std::vector<ConnectionHandle> handles;
    {
        std::lock_guard<std::mutex> lock(pImpl->mtx);
        for (const auto& kv : pImpl->connections) {
            handles.push_back(kv.first);
        }
    }
    for (const auto& h : handles) {
        try {
            Disconnect(h);
        } catch (const std::exception& e) {
            LOG_WARN("{}: disconnect during shutdown failed: {}", pImpl->protocolName, e.what());
        }
    }
    pImpl->takeRetired();
    pImpl->dispatcher.Stop();
}

std::size_t BrokerAdapter::ConnectionCount() const {
    std::lock_guard<std::mutex> lock(pImpl->mtx);
    return pImpl->connections.size();
}

std::size_t BrokerAdapter::SubscriptionCount() const {
    std::lock_guard<std::mutex> lock(pImpl->mtx);
    return pImpl->subscriptions.size();
}

} // namespace apigw::protocol
