//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/apigw/protocol/LoopbackBroker.hpp
// Purpose: In-process broker hub and IBrokerClient used for tests and embedding
//==========================================================================================================
#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "apigw/protocol/BrokerAdapter.hpp"

namespace apigw::protocol {

//==========================================================================================================
// LoopbackBroker
// Purpose: Routes published payloads to subscribers of the same (server URL, channel) pair. Delivery is
//          synchronous on the publisher's thread; the BrokerAdapter moves it onto its dispatcher.
// Notes:
//   - History keeps the most recent publishes only (kDefaultHistoryLimit unless changed).
//   - DropServer ends every client session attached to a server URL as a broker outage would.
//==========================================================================================================
class LoopbackBroker {
public:
    struct Published {
        std::string server;
        std::string channel;
        std::string payload;
    };

    static constexpr std::size_t kDefaultHistoryLimit = 256;

    // Marks a server URL as unreachable; Connect to it fails with TransportConnection.
    void SetUnreachable(const std::string& serverUrl, bool unreachable = true);
    bool IsUnreachable(const std::string& serverUrl) const;

    void Publish(const std::string& serverUrl, const std::string& channel, const std::string& payload);
    uint64_t Subscribe(const std::string& serverUrl, const std::string& channel, IBrokerClient::DeliveryCallback callback);
    void Unsubscribe(uint64_t token);

    // Client sessions register here so DropServer can tell them the connection is gone.
    uint64_t Attach(const std::string& serverUrl, IBrokerClient::ConnectionLostCallback onLost);
    void Detach(uint64_t session);
    // Ends all sessions and subscriptions on serverUrl; returns the number of sessions notified.
    std::size_t DropServer(const std::string& serverUrl);

    // 0 disables recording.
    void SetHistoryLimit(std::size_t limit);
    std::vector<Published> History() const;
    std::size_t SubscriberCount(const std::string& serverUrl, const std::string& channel) const;

private:
    struct Subscriber {
        std::string server;
        std::string channel;
        IBrokerClient::DeliveryCallback callback;
    };

    struct Session {
        std::string server;
        IBrokerClient::ConnectionLostCallback onLost;
    };

    mutable std::mutex mtx;
    uint64_t nextToken{1};
    std::map<uint64_t, Subscriber> subscribers;
    std::map<uint64_t, Session> sessions;
    std::set<std::string> unreachable;
    std::size_t historyLimit{kDefaultHistoryLimit};
    std::deque<Published> history;
};

class LoopbackBrokerClient final : public IBrokerClient {
public:
    explicit LoopbackBrokerClient(std::shared_ptr<LoopbackBroker> hub);
    ~LoopbackBrokerClient() override;

    void SetConnectionLostCallback(ConnectionLostCallback callback) override;
    void Connect(const ServerConfig& server) override;
    void Publish(const std::string& channel, const std::string& payload) override;
    void Subscribe(const std::string& channel, DeliveryCallback callback) override;
    void Unsubscribe(const std::string& channel) override;
    void Disconnect() override;

private:
    // Shared with the hub's connection-lost hook, which can outlive a call into this client.
    struct State {
        std::mutex mtx;
        std::string server;
        bool connected{false};
        uint64_t session{0};
        ConnectionLostCallback onLost;
        std::map<std::string, uint64_t> tokens;
    };

    std::shared_ptr<LoopbackBroker> hub;
    std::shared_ptr<State> state;
};

// Factory producing LoopbackBrokerClient instances bound to `hub` for every protocol.
BrokerClientFactory MakeLoopbackBrokerFactory(std::shared_ptr<LoopbackBroker> hub);

} // namespace apigw::protocol
