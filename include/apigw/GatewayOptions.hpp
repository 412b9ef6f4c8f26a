//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/apigw/GatewayOptions.hpp
// Purpose: Gateway settings with config-string and environment loaders
//==========================================================================================================
#pragma once

#include <cstddef>
#include <string>

#include "apigw/request/RequestBuilder.hpp"
#include "apigw/version.h"

namespace apigw {

//==========================================================================================================
// GatewayOptions
// Purpose: Tunables for timeouts, OAuth2 defaults, URL joining, $ref resolution and logging.
// Notes:
//   - FromConfigString accepts "key=value; key=value" using the field names below.
//   - FromEnvironment reads the APIGW_* variables (APIGW_HTTP_TIMEOUT_MS, APIGW_CONNECT_TIMEOUT_MS,
//     APIGW_TOKEN_TIMEOUT_MS, APIGW_OAUTH2_STATE_EXPIRE_MINUTES, APIGW_OAUTH2_DEFAULT_SCOPE,
//     APIGW_URL_JOIN, APIGW_USER_AGENT, APIGW_MAX_REF_DEPTH, APIGW_ALLOW_EXTERNAL_REFS,
//     APIGW_LOG_LEVEL, APIGW_LOG_FILE).
//   - Unparsable values keep their defaults.
//==========================================================================================================
struct GatewayOptions {
    unsigned int httpTimeoutMs{30000};
    unsigned int connectTimeoutMs{30000};
    unsigned int tokenTimeoutMs{30000};
    unsigned int oauthStateTtlMinutes{10};
    std::string oauthDefaultScope{"read"};
    request::UrlJoinMode urlJoinMode{request::UrlJoinMode::PreserveBasePath};
    std::string userAgent{getDefaultUserAgent()};
    std::size_t maxRefDepth{64};
    bool allowExternalRefs{true};
    std::string logLevel{"INFO"};
    std::string logFile;

    // TLS trust settings shared by the HTTP and WebSocket adapters.
    std::string caFile;
    std::string caPath;
    bool verifyPeer{true};

    static GatewayOptions FromConfigString(const std::string& config);
    static GatewayOptions FromEnvironment();

    // Applies one setting; returns false for an unknown key or unparsable value.
    bool Set(const std::string& key, const std::string& value);
};

} // namespace apigw
