//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/apigw/protocol/Url.hpp
// Purpose: Minimal URL splitting used by the network adapters
//==========================================================================================================
#pragma once

#include <string>

namespace apigw::protocol {

struct UrlParts {
    std::string scheme;     // lower-case; "http" when the URL has none
    std::string host;       // without IPv6 brackets
    std::string port;       // explicit port or the scheme default
    std::string target;     // path plus query, "/" when empty
    std::string serverName; // SNI / certificate host name
    std::string user;       // userinfo before ':', broker credentials
    std::string password;
    bool secure{false};     // https or wss

    // Host header value ("host" or "host:port" when the port is not the scheme default).
    std::string hostHeader() const;
};

// Throws GatewayError(InvalidConfiguration) when no host can be found.
UrlParts parseUrl(const std::string& url);

} // namespace apigw::protocol
