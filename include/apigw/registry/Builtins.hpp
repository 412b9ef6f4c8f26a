//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/apigw/registry/Builtins.hpp
// Purpose: Installs the built-in spec families and protocol adapters into a Registry
//==========================================================================================================
#pragma once

#include "apigw/Types.h"
#include "apigw/protocol/BrokerAdapter.hpp"
#include "apigw/protocol/HttpAdapter.hpp"
#include "apigw/protocol/WebSocketAdapter.hpp"
#include "apigw/registry/Registry.hpp"

namespace apigw::registry {

struct BuiltinOptions {
    protocol::HttpAdapter::Options http;
    protocol::WebSocketAdapter::Options websocket;
    protocol::BrokerClientFactory brokerFactory; // empty: broker connects fail with reason no_client
    Clock clock{systemClock()};
};

//==========================================================================================================
// RegisterBuiltins
// Purpose: Registers
//   families:  rest (OpenAPI 3.x) and pubsub (AsyncAPI 2.x)
//   protocols: http, websocket, mqtt, amqp, kafka, nats
// Existing registrations under the same names are replaced.
//==========================================================================================================
void RegisterBuiltins(Registry& registry, const BuiltinOptions& options = BuiltinOptions());

} // namespace apigw::registry
