//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/apigw/protocol/NativeBrokers.cpp
// Purpose: MakeNativeBrokerFactory over the client libraries found at build time
//==========================================================================================================

#include "logging/Logger.h"
#include "apigw/Types.h"
#include "apigw/protocol/NativeBrokers.hpp"
#include "NativeClients.hpp"

namespace apigw::protocol {

bool HasNativeBrokerClient(const std::string& protocol) {
#if defined(APIGW_WITH_MQTT)
    if (protocol == Mqtt) return true;
#endif
#if defined(APIGW_WITH_KAFKA)
    if (protocol == Kafka) return true;
#endif
#if defined(APIGW_WITH_AMQP)
    if (protocol == Amqp) return true;
#endif
#if defined(APIGW_WITH_NATS)
    if (protocol == Nats) return true;
#endif
    (void)protocol;
    return false;
}

BrokerClientFactory MakeNativeBrokerFactory() {
    return [](const std::string& protocol) -> std::unique_ptr<IBrokerClient> {
#if defined(APIGW_WITH_MQTT)
        if (protocol == Mqtt) return MakeMqttClient();
#endif
#if defined(APIGW_WITH_KAFKA)
        if (protocol == Kafka) return MakeKafkaClient();
#endif
#if defined(APIGW_WITH_AMQP)
        if (protocol == Amqp) return MakeAmqpClient();
#endif
#if defined(APIGW_WITH_NATS)
        if (protocol == Nats) return MakeNatsClient();
#endif
        LOG_DEBUG("No {} client library in this build", protocol);
        return nullptr;
    };
}

} // namespace apigw::protocol
