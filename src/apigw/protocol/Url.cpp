//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/apigw/protocol/Url.cpp
// Purpose: parseUrl implementation
//==========================================================================================================

#include <algorithm>
#include <cctype>

#include "apigw/errors/Errors.h"
#include "apigw/protocol/Url.hpp"

namespace apigw::protocol {

namespace {

std::string defaultPort(const std::string& scheme) {
    if (scheme == "https" || scheme == "wss") return "443";
    if (scheme == "mqtt") return "1883";
    if (scheme == "mqtts") return "8883";
    if (scheme == "amqp") return "5672";
    if (scheme == "amqps") return "5671";
    if (scheme == "nats") return "4222";
    if (scheme == "kafka") return "9092";
    return "80";
}

} // namespace

std::string UrlParts::hostHeader() const {
    const std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    return port == defaultPort(scheme) ? h : h + ":" + port;
}

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;
    std::size_t pos = 0;
    const std::size_t schemeEnd = url.find("://");
    if (schemeEnd != std::string::npos) {
        parts.scheme = url.substr(0, schemeEnd);
        std::transform(parts.scheme.begin(), parts.scheme.end(), parts.scheme.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        pos = schemeEnd + 3;
    } else {
        parts.scheme = "http";
    }
    parts.secure = parts.scheme == "https" || parts.scheme == "wss";

    const std::size_t end = url.find_first_of("/?#", pos);
    std::string hostPort = url.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
    if (end == std::string::npos) {
        parts.target = "/";
    } else {
        parts.target = url.substr(end);
        if (parts.target[0] != '/') {
            parts.target.insert(parts.target.begin(), '/');
        }
        const std::size_t hash = parts.target.find('#');
        if (hash != std::string::npos) {
            parts.target.erase(hash);
        }
    }
    const std::size_t at = hostPort.rfind('@');
    if (at != std::string::npos) {
        const std::string userInfo = hostPort.substr(0, at);
        const std::size_t colon = userInfo.find(':');
        parts.user = userInfo.substr(0, colon);
        parts.password = colon == std::string::npos ? std::string() : userInfo.substr(colon + 1);
        hostPort.erase(0, at + 1);
    }

    if (!hostPort.empty() && hostPort[0] == '[') {
        const std::size_t close = hostPort.find(']');
        if (close == std::string::npos) {
            throw errors::GatewayError(errors::ErrorKind::InvalidConfiguration, "Malformed IPv6 host in URL: " + url, url);
        }
        parts.host = hostPort.substr(1, close - 1);
        parts.port = (close + 1 < hostPort.size() && hostPort[close + 1] == ':') ? hostPort.substr(close + 2) : std::string();
    } else {
        const std::size_t colon = hostPort.find(':');
        parts.host = hostPort.substr(0, colon);
        parts.port = colon == std::string::npos ? std::string() : hostPort.substr(colon + 1);
    }
    if (parts.port.empty()) {
        parts.port = defaultPort(parts.scheme);
    }
    if (parts.host.empty()) {
        throw errors::GatewayError(errors::ErrorKind::InvalidConfiguration, "URL has no host: " + url, url);
    }
    parts.serverName = parts.host;
    return parts;
}

} // namespace apigw::protocol
