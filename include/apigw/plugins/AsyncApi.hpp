//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/apigw/plugins/AsyncApi.hpp
// Purpose: Pub/sub spec family: AsyncAPI 2.x model, channel extractor and publish/subscribe executor
//==========================================================================================================
#pragma once

#include <string>
#include <vector>

#include "apigw/spec/ISpecModel.hpp"

namespace apigw::plugins {

// Maps a channel binding key ("websockets", "mqtt", ...) to a gateway protocol name; "unknown" otherwise.
std::string protocolFromBinding(const std::string& bindingKey);

// Maps a server protocol ("ws", "wss", "mqtts", "nats-secure", ...) to a gateway protocol name.
std::string protocolFromServerScheme(const std::string& serverProtocol);

class AsyncApiModel final : public spec::ISpecModel {
public:
    explicit AsyncApiModel(JSONValue resolvedDocument);

    std::string Family() const override;
    void Validate() const override;
    std::string Title() const override;
    std::string Version() const override;
    std::vector<ServerInfo> Servers() const override;
    JSONValue SecuritySchemes() const override;
    JSONValue Operations() const override;
    const JSONValue& Document() const override { return doc; }

private:
    JSONValue doc;
};

//==========================================================================================================
// AsyncApiParser
// Purpose: One endpoint per (channel, publish|subscribe). The protocol comes from the channel bindings
//          (falling back to the operation bindings); servers are attached when their protocol matches.
//==========================================================================================================
class AsyncApiParser final : public spec::ISpecParser {
public:
    bool CanParse(const JSONValue& rawDocument) const override;
    std::vector<Endpoint> ExtractEndpoints(const spec::ISpecModel& model) const override;
};

//==========================================================================================================
// PubSubExecutor
// Purpose: publish -> Connect + Publish (returns { messageId, channel, protocol, status: "sent" });
//          subscribe -> Connect + Subscribe (returns { subscriptionId, channel, protocol, status: "subscribed" }).
// Notes:
//   - Credential headers (Authorization, Proxy-Authorization, Cookie) go to the connection only; the
//     remaining headers plus unconsumed channel parameters travel as envelope headers.
//==========================================================================================================
class PubSubExecutor final : public spec::IExecutor {
public:
    spec::ExecutionResult Execute(const Endpoint& endpoint, const WireRequest& request,
                                  protocol::IProtocolAdapter& adapter, const spec::ExecutionContext& ctx) override;
};

} // namespace apigw::plugins
