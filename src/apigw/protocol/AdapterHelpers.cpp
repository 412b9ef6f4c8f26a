//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/apigw/protocol/AdapterHelpers.cpp
// Purpose: Envelope construction, connection keys and frame decoding shared by protocol adapters
//==========================================================================================================

#include <stdexcept>

#include "logging/Logger.h"
#include "apigw/protocol/IProtocolAdapter.hpp"

namespace apigw::protocol {

JSONValue makeEnvelope(const std::string& channel, const std::string& operation,
                       const HeaderList& headers, const JSONValue& payload, TimePoint now) {
    JSONValue hdrs = JSONValue::object();
    for (const auto& h : headers) {
        hdrs.set(h.name, JSONValue(h.value));
    }
    JSONValue env = JSONValue::object();
    env.set("id", JSONValue(generateId()));
    env.set("timestamp", JSONValue(formatTimestamp(now)));
    env.set("channel", JSONValue(channel));
    env.set("operation", JSONValue(operation));
    env.set("headers", std::move(hdrs));
    env.set("payload", payload);
    return env;
}

std::string connectionKey(const std::string& protocol, const std::string& serverUrl) {
    return protocol + "|" + serverUrl;
}

JSONValue decodeFrame(const std::string& raw) {
    try {
        return parseJSON(raw);
    } catch (const std::exception&) {
        return JSONValue(raw);
    }
}

void logAdapterOperation(const std::string& protocol, const std::string& operation, const std::string& target) {
    LOG_DEBUG("{} adapter: {} {}", protocol, operation, target);
}

} // namespace apigw::protocol
