//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/apigw/registry/Builtins.cpp
// Purpose: Built-in plugin registration
//==========================================================================================================

#include "apigw/registry/Builtins.hpp"
#include "apigw/plugins/AsyncApi.hpp"
#include "apigw/plugins/OpenApi.hpp"
#include "logging/Logger.h"

namespace apigw::registry {

void RegisterBuiltins(Registry& registry, const BuiltinOptions& options) {
    registry.RegisterSpecFamily(
        family::Rest,
        [](const JSONValue& doc) -> std::unique_ptr<spec::ISpecModel> { return std::make_unique<plugins::OpenApiModel>(doc); },
        std::make_shared<plugins::OpenApiParser>(), std::make_shared<plugins::RestExecutor>());
    registry.RegisterSpecFamily(
        family::PubSub,
        [](const JSONValue& doc) -> std::unique_ptr<spec::ISpecModel> { return std::make_unique<plugins::AsyncApiModel>(doc); },
        std::make_shared<plugins::AsyncApiParser>(), std::make_shared<plugins::PubSubExecutor>());

    const auto httpOpts = options.http;
    registry.RegisterProtocol(protocol::Http, [httpOpts]() -> std::shared_ptr<protocol::IProtocolAdapter> {
        return std::make_shared<protocol::HttpAdapter>(httpOpts);
    });
    const auto wsOpts = options.websocket;
    const Clock clock = options.clock;
    registry.RegisterProtocol(protocol::WebSocket, [wsOpts, clock]() -> std::shared_ptr<protocol::IProtocolAdapter> {
        return std::make_shared<protocol::WebSocketAdapter>(wsOpts, clock);
    });
    for (const char* name : {protocol::Mqtt, protocol::Amqp, protocol::Kafka, protocol::Nats}) {
        const std::string proto(name);
        const auto factory = options.brokerFactory;
        registry.RegisterProtocol(proto, [proto, factory, clock]() -> std::shared_ptr<protocol::IProtocolAdapter> {
            return std::make_shared<protocol::BrokerAdapter>(proto, factory, clock);
        });
    }
    LOG_DEBUG("Registered built-in families and protocols{}", options.brokerFactory ? "" : " (no broker client bound)");
}

} // namespace apigw::registry
