//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/apigw/protocol/NativeBrokers.hpp
// Purpose: Broker client factory over the MQTT (Eclipse Paho C), Kafka (librdkafka), AMQP (rabbitmq-c)
//          and NATS (nats.c) client libraries
//==========================================================================================================
#pragma once

#include <string>

#include "apigw/protocol/BrokerAdapter.hpp"

namespace apigw::protocol {

// True when this build links a client library for `protocol`.
bool HasNativeBrokerClient(const std::string& protocol);

//==========================================================================================================
// MakeNativeBrokerFactory
// Purpose: Default BrokerClientFactory of the Gateway.
// Notes:
//   - Client libraries are optional at build time; a protocol without one yields nullptr, so
//     BrokerAdapter::Connect fails with TransportConnection (reason "no_client").
//   - Server URLs use the protocol's scheme: mqtt(s)://host:port, kafka://host:port[,host:port],
//     amqp(s)://user:pass@host:port/vhost, nats://host:port or tls://host:port.
//==========================================================================================================
BrokerClientFactory MakeNativeBrokerFactory();

} // namespace apigw::protocol
