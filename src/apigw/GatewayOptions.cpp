//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/apigw/GatewayOptions.cpp
// Purpose: GatewayOptions parsing
//==========================================================================================================

#include <cerrno>
#include <cstdlib>
#include <limits>

#include "apigw/GatewayOptions.hpp"
#include "apigw/Types.h"
#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace apigw {

namespace {

std::string trim(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) {
        ++b;
    }
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) {
        --e;
    }
    return s.substr(b, e - b);
}

// Accepts decimal values in [1, UINT_MAX]; zero, signs and overflow are rejected.
bool parsePositiveUInt(const std::string& v, unsigned int& out) {
    if (v.empty() || v[0] < '0' || v[0] > '9') {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    const unsigned long long parsed = std::strtoull(v.c_str(), &end, 10);
    if (end == v.c_str() || *end != '\0' || errno == ERANGE) {
        return false;
    }
    if (parsed == 0 || parsed > std::numeric_limits<unsigned int>::max()) {
        return false;
    }
    out = static_cast<unsigned int>(parsed);
    return true;
}

// Applies an environment variable through Set(); invalid values keep the current setting.
void applyEnv(GatewayOptions& opts, const char* name, const std::string& key) {
    const std::string v = GetEnvOrDefault(name, std::string());
    if (!v.empty() && !opts.Set(key, v)) {
        LOG_WARN("Ignoring {}={}", name, v);
    }
}

bool parseBool(const std::string& v, bool& out) {
    if (v == "1" || iequals(v, "true") || iequals(v, "yes") || iequals(v, "on")) {
        out = true;
        return true;
    }
    if (v == "0" || iequals(v, "false") || iequals(v, "no") || iequals(v, "off")) {
        out = false;
        return true;
    }
    return false;
}

} // namespace

bool GatewayOptions::Set(const std::string& key, const std::string& val) {
    unsigned int n = 0;
    if (key == "httpTimeoutMs") {
        if (!parsePositiveUInt(val, n)) return false;
        httpTimeoutMs = n;
    } else if (key == "connectTimeoutMs") {
        if (!parsePositiveUInt(val, n)) return false;
        connectTimeoutMs = n;
    } else if (key == "tokenTimeoutMs") {
        if (!parsePositiveUInt(val, n)) return false;
        tokenTimeoutMs = n;
    } else if (key == "oauthStateTtlMinutes") {
        if (!parsePositiveUInt(val, n)) return false;
        oauthStateTtlMinutes = n;
    } else if (key == "oauthDefaultScope") {
        oauthDefaultScope = val;
    } else if (key == "urlJoinMode") {
        if (iequals(val, "preserve")) {
            urlJoinMode = request::UrlJoinMode::PreserveBasePath;
        } else if (iequals(val, "replace")) {
            urlJoinMode = request::UrlJoinMode::ReplaceBasePath;
        } else {
            return false;
        }
    } else if (key == "userAgent") {
        if (val.empty()) return false;
        userAgent = val;
    } else if (key == "maxRefDepth") {
        if (!parsePositiveUInt(val, n)) return false;
        maxRefDepth = n;
    } else if (key == "allowExternalRefs") {
        return parseBool(val, allowExternalRefs);
    } else if (key == "logLevel") {
        logLevel = val;
    } else if (key == "logFile") {
        logFile = val;
    } else if (key == "caFile") {
        caFile = val;
    } else if (key == "caPath") {
        caPath = val;
    } else if (key == "verifyPeer") {
        return parseBool(val, verifyPeer);
    } else {
        return false;
    }
    return true;
}

GatewayOptions GatewayOptions::FromConfigString(const std::string& config) {
    GatewayOptions opts;
    std::size_t start = 0;
    while (start < config.size()) {
        std::size_t sep = config.find(';', start);
        if (sep == std::string::npos) {
            sep = config.size();
        }
        const std::string kv = trim(config.substr(start, sep - start));
        if (!kv.empty()) {
            const std::size_t eq = kv.find('=');
            if (eq != std::string::npos) {
                const std::string key = trim(kv.substr(0, eq));
                const std::string val = trim(kv.substr(eq + 1));
                if (!opts.Set(key, val)) {
                    LOG_WARN("Ignoring gateway option {}={}", key, val);
                }
            }
        }
        start = sep + 1;
    }
    return opts;
}

GatewayOptions GatewayOptions::FromEnvironment() {
    GatewayOptions opts;
    applyEnv(opts, "APIGW_HTTP_TIMEOUT_MS", "httpTimeoutMs");
    applyEnv(opts, "APIGW_CONNECT_TIMEOUT_MS", "connectTimeoutMs");
    applyEnv(opts, "APIGW_TOKEN_TIMEOUT_MS", "tokenTimeoutMs");
    applyEnv(opts, "APIGW_OAUTH2_STATE_EXPIRE_MINUTES", "oauthStateTtlMinutes");
    opts.oauthDefaultScope = GetEnvOrDefault("APIGW_OAUTH2_DEFAULT_SCOPE", opts.oauthDefaultScope);
    applyEnv(opts, "APIGW_MAX_REF_DEPTH", "maxRefDepth");
    opts.logLevel = GetEnvOrDefault("APIGW_LOG_LEVEL", opts.logLevel);
    opts.logFile = GetEnvOrDefault("APIGW_LOG_FILE", opts.logFile);
    applyEnv(opts, "APIGW_URL_JOIN", "urlJoinMode");
    applyEnv(opts, "APIGW_USER_AGENT", "userAgent");
    applyEnv(opts, "APIGW_ALLOW_EXTERNAL_REFS", "allowExternalRefs");
    return opts;
}

} // namespace apigw
