//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/apigw/protocol/BrokerAdapter.hpp
// Purpose: Pub/sub adapter for broker protocols (MQTT, AMQP, Kafka, NATS) over a pluggable client boundary
//==========================================================================================================
#pragma once

#include <functional>
#include <memory>
#include <string>

#include "apigw/protocol/IProtocolAdapter.hpp"

namespace apigw::protocol {

//==========================================================================================================
// IBrokerClient
// Purpose: One live session with a broker, as provided by a protocol client library.
// Notes:
//   - Connect must honor ServerConfig::connectTimeoutMs and report failures by throwing
//     GatewayError(TransportConnection | TransportTimeout).
//   - Delivery callbacks may run on any thread and must not block.
//   - The connection-lost callback is installed before Connect and fires at most once, when the broker
//     session ends without a Disconnect call. It may run on a library thread; the client must not be
//     destroyed from inside it.
//==========================================================================================================
class IBrokerClient {
public:
    using DeliveryCallback = std::function<void(const std::string& channel, const std::string& payload)>;
    using ConnectionLostCallback = std::function<void(const std::string& reason)>;

    virtual ~IBrokerClient() = default;
    virtual void SetConnectionLostCallback(ConnectionLostCallback callback) = 0;
    virtual void Connect(const ServerConfig& server) = 0;
    virtual void Publish(const std::string& channel, const std::string& payload) = 0;
    virtual void Subscribe(const std::string& channel, DeliveryCallback callback) = 0;
    virtual void Unsubscribe(const std::string& channel) = 0;
    virtual void Disconnect() = 0;
};

// Produces a client for a protocol name ("mqtt", "amqp", ...); may return nullptr when unsupported.
using BrokerClientFactory = std::function<std::unique_ptr<IBrokerClient>(const std::string& protocol)>;

//==========================================================================================================
// BrokerAdapter
// Purpose: IPubSubAdapter over IBrokerClient sessions.
// Notes:
//   - One client per (protocol, server URL); Connect returns the cached handle afterwards.
//   - The first subscription on a channel subscribes the client; the last Unsubscribe releases it.
//   - Inbound payloads are decoded with decodeFrame() and handed to a MessageDispatcher.
//   - A session the client reports as lost is evicted with its subscriptions; the next Connect to the
//     same server creates a new client.
// Throws (GatewayError):
//   TransportConnection (reason "no_client") from Connect when no factory is bound or it yields nothing.
//==========================================================================================================
class BrokerAdapter final : public IPubSubAdapter {
public:
    BrokerAdapter(std::string protocolName, BrokerClientFactory factory, Clock clock = systemClock());
    ~BrokerAdapter() override;

    std::string Protocol() const override;
    void Shutdown() override;

    ConnectionHandle Connect(const ServerConfig& server) override;
    std::string Publish(const ConnectionHandle& connection, const std::string& channel,
                        const JSONValue& payload, const HeaderList& headers) override;
    SubscriptionHandle Subscribe(const ConnectionHandle& connection, const std::string& channel,
                                 MessageHandler handler) override;
    void Unsubscribe(const SubscriptionHandle& subscription) override;
    void Disconnect(const ConnectionHandle& connection) override;

    std::size_t ConnectionCount() const;
    std::size_t SubscriptionCount() const;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace apigw::protocol
