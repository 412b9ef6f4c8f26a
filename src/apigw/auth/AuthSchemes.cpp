//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/apigw/auth/AuthSchemes.cpp
// Purpose: Built-in auth scheme implementations
//==========================================================================================================

#include <algorithm>

#include "apigw/auth/AuthSchemes.hpp"
#include "apigw/auth/Crypto.hpp"
#include "apigw/errors/Errors.h"

namespace apigw::auth {

using errors::ErrorKind;
using errors::GatewayError;

namespace {

GatewayError unsatisfied(const std::string& reason) {
    return GatewayError(ErrorKind::AuthenticationFailed, reason);
}

// True when the caller already supplied "Authorization: <prefix> ...".
bool callerAuthorizationHas(const AuthContext& ctx, const std::string& prefix) {
    const HeaderKV* h = findHeader(ctx.callerHeaders, "Authorization");
    return h && h->value.size() > prefix.size() && iequals(h->value.substr(0, prefix.size()), prefix);
}

std::string normalizeTokenType(const std::string& type) {
    if (type.empty() || iequals(type, "bearer")) {
        return "Bearer";
    }
    return type;
}

} // namespace

std::string BasicAuth::Scheme() const { return scheme::Basic; }

void BasicAuth::Apply(const AuthConfig& config, const AuthContext& ctx, WireRequest& request) const {
    const std::string username = config.config.getString("username");
    if (!username.empty()) {
        const std::string password = config.config.getString("password");
        setHeader(request.headers, "Authorization", "Basic " + base64Encode(username + ":" + password));
        return;
    }
    if (callerAuthorizationHas(ctx, "Basic ")) {
        return;
    }
    throw unsatisfied("basic: no username configured and no Basic Authorization header supplied");
}

std::string BearerAuth::Scheme() const { return scheme::Bearer; }

void BearerAuth::Apply(const AuthConfig& config, const AuthContext& ctx, WireRequest& request) const {
    const std::string token = config.config.getString("token");
    if (!token.empty()) {
        setHeader(request.headers, "Authorization", "Bearer " + token);
        return;
    }
    if (callerAuthorizationHas(ctx, "Bearer ")) {
        return;
    }
    throw unsatisfied("bearer: no token configured and no Bearer Authorization header supplied");
}

std::string ApiKeyAuth::Scheme() const { return scheme::ApiKey; }

void ApiKeyAuth::Apply(const AuthConfig& config, const AuthContext& ctx, WireRequest& request) const {
    const std::string location = config.config.getString("location", "header");
    const std::string name = config.config.getString("name");
    const std::string value = config.config.getString("value");
    if (name.empty()) {
        throw unsatisfied("api_key: no key name configured");
    }
    if (location == "header") {
        if (!value.empty()) {
            setHeader(request.headers, name, value);
            return;
        }
        if (findHeader(ctx.callerHeaders, name)) {
            return;
        }
        throw unsatisfied("api_key: no value configured for header " + name);
    }
    if (value.empty()) {
        throw unsatisfied("api_key: no value configured for " + location + " " + name);
    }
    if (location == "query") {
        std::erase_if(request.query, [&](const auto& kv) { return kv.first == name; });
        request.query.emplace_back(name, value);
        return;
    }
    if (location == "cookie") {
        std::string cookie;
        if (const HeaderKV* existing = findHeader(request.headers, "Cookie")) {
            cookie = existing->value + "; ";
        }
        setHeader(request.headers, "Cookie", cookie + name + "=" + value);
        return;
    }
    throw unsatisfied("api_key: unsupported location '" + location + "'");
}

OAuth2Auth::OAuth2Auth(std::shared_ptr<store::IGatewayStore> s) : store(std::move(s)) {}

std::string OAuth2Auth::Scheme() const { return scheme::OAuth2; }

void OAuth2Auth::Apply(const AuthConfig&, const AuthContext& ctx, WireRequest& request) const {
    if (ctx.userId.empty()) {
        throw unsatisfied("oauth2: no user id supplied for a per-user authorization");
    }
    const auto authorization = store->GetUserAuthorization(ctx.userId, ctx.apiDocumentId);
    if (!authorization || authorization->accessToken.empty()) {
        throw unsatisfied("oauth2: user " + ctx.userId + " has not authorized this API");
    }
    if (authorization->expiresAt && *authorization->expiresAt <= ctx.now) {
        throw GatewayError(ErrorKind::AuthorizationExpired,
                           "oauth2: authorization for user " + ctx.userId + " has expired", ctx.apiDocumentId);
    }
    setHeader(request.headers, "Authorization",
              normalizeTokenType(authorization->tokenType) + " " + authorization->accessToken);
}

} // namespace apigw::auth
