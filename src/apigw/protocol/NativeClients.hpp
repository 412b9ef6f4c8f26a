//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/apigw/protocol/NativeClients.hpp
// Purpose: Constructors of the library-backed IBrokerClient implementations (internal to the adapters)
//==========================================================================================================
#pragma once

#include <memory>

#include "apigw/protocol/BrokerAdapter.hpp"

namespace apigw::protocol {

// Each is defined only when the build found the matching client library.
std::unique_ptr<IBrokerClient> MakeMqttClient();
std::unique_ptr<IBrokerClient> MakeKafkaClient();
std::unique_ptr<IBrokerClient> MakeAmqpClient();
std::unique_ptr<IBrokerClient> MakeNatsClient();

} // namespace apigw::protocol
