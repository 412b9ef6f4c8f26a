//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/apigw/protocol/WebSocketAdapter.hpp
// Purpose: Pub/sub adapter over Boost.Beast websockets (ws:// and wss://)
//==========================================================================================================
#pragma once

#include <memory>
#include <string>

#include "apigw/protocol/IProtocolAdapter.hpp"

namespace apigw::protocol {

//==========================================================================================================
// WebSocketAdapter
// Purpose: One websocket per server URL, a read loop per connection, and channel routing of inbound frames.
// Wire format:
//   subscribe:   {"type":"subscribe","channel":<name>,"subscription_id":<id>}
//   unsubscribe: {"type":"unsubscribe","channel":<name>,"subscription_id":<id>}
//   publish:     the envelope from makeEnvelope() as a text frame
//   inbound:     any JSON object with a "channel" member is routed to that channel's subscriptions
// Notes:
//   - ServerConfig::headers are sent on the upgrade request.
//   - Writes on one connection are serialized.
//   - A connection whose peer closes is evicted together with its subscriptions; the next Connect
//     to the same server opens a new one.
//==========================================================================================================
class WebSocketAdapter final : public IPubSubAdapter {
public:
    struct Options {
        std::string caFile;
        std::string caPath;
        bool verifyPeer{true};
        unsigned int writeTimeoutMs{30000};
    };

    WebSocketAdapter();
    explicit WebSocketAdapter(Options opts, Clock clock = systemClock());
    ~WebSocketAdapter() override;

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

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace apigw::protocol
