//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/apigw/protocol/IProtocolAdapter.hpp
// Purpose: Protocol adapter interfaces (request/response and pub/sub) plus shared free helpers
//==========================================================================================================
#pragma once

#include <functional>
#include <memory>
#include <string>

#include "apigw/JSONValue.h"
#include "apigw/Types.h"

namespace apigw::protocol {

//==========================================================================================================
// IProtocolAdapter
// Purpose: Minimal base for every transport adapter.
//==========================================================================================================
class IProtocolAdapter {
public:
    virtual ~IProtocolAdapter() = default;

    // Protocol name this adapter serves (e.g. "http", "mqtt").
    virtual std::string Protocol() const = 0;

    // Tears down subscriptions, then connections, and stops any I/O threads. Idempotent.
    virtual void Shutdown() = 0;
};

//==========================================================================================================
// IRequestResponseAdapter
// Purpose: Executes one built request and returns the normalized response.
// Throws (GatewayError):
//   TransportTimeout when the bounded timeout expires; TransportConnection for refused connections,
//   DNS failures, TLS failures and other I/O errors (detail() carries the reason).
//==========================================================================================================
class IRequestResponseAdapter : public IProtocolAdapter {
public:
    virtual WireResponse Execute(const WireRequest& request) = 0;
};

struct ServerConfig {
    std::string protocol;
    std::string url;
    HeaderList headers;
    unsigned int connectTimeoutMs{30000};
};

struct InboundMessage {
    std::string subscriptionId;
    std::string channel;
    JSONValue payload; // decoded JSON when the frame parses, otherwise the raw text as a string
    std::string raw;
};

using MessageHandler = std::function<void(const InboundMessage&)>;
using ConnectionHandle = std::string;
using SubscriptionHandle = std::string;

//==========================================================================================================
// IPubSubAdapter
// Purpose: Connection and subscription management for channel-oriented protocols.
// Notes:
//   - Connect returns a cached handle when a connection to the same (protocol, server) already exists.
//   - Publish wraps the payload with makeEnvelope() and returns the envelope id.
//   - Handlers run on a dispatcher thread, never on the caller's or the network reader's thread.
//   - Disconnect removes dependent subscriptions before closing the connection.
//==========================================================================================================
class IPubSubAdapter : public IProtocolAdapter {
public:
    virtual ConnectionHandle Connect(const ServerConfig& server) = 0;
    virtual std::string Publish(const ConnectionHandle& connection, const std::string& channel,
                                const JSONValue& payload, const HeaderList& headers) = 0;
    virtual SubscriptionHandle Subscribe(const ConnectionHandle& connection, const std::string& channel,
                                         MessageHandler handler) = 0;
    virtual void Unsubscribe(const SubscriptionHandle& subscription) = 0;
    virtual void Disconnect(const ConnectionHandle& connection) = 0;
};

using ProtocolAdapterFactory = std::function<std::shared_ptr<IProtocolAdapter>()>;

//==========================================================================================================
// Free helpers shared by adapters
//==========================================================================================================

// Envelope { id, timestamp, channel, operation, headers, payload } used for published messages.
JSONValue makeEnvelope(const std::string& channel, const std::string& operation,
                       const HeaderList& headers, const JSONValue& payload, TimePoint now);

// Cache key for a (protocol, server) connection.
std::string connectionKey(const std::string& protocol, const std::string& serverUrl);

// Decodes an inbound frame: JSON when it parses, otherwise the raw text.
JSONValue decodeFrame(const std::string& raw);

// Debug log line for an adapter operation (never includes header values).
void logAdapterOperation(const std::string& protocol, const std::string& operation, const std::string& target);

} // namespace apigw::protocol
