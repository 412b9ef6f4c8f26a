//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/apigw/Redaction.cpp
// Purpose: Secret redaction helpers
//==========================================================================================================

#include "apigw/Redaction.hpp"

namespace apigw {

bool isSecretName(const std::string& name, const std::vector<std::string>& extraSecretNames) {
    if (iequals(name, "Authorization") || iequals(name, "Proxy-Authorization") || iequals(name, "Cookie")) {
        return true;
    }
    for (const auto& extra : extraSecretNames) {
        if (iequals(name, extra)) {
            return true;
        }
    }
    return false;
}

HeaderList redactHeaders(const HeaderList& headers, const std::vector<std::string>& extraSecretNames) {
    HeaderList out;
    out.reserve(headers.size());
    for (const auto& h : headers) {
        out.push_back(HeaderKV{h.name, isSecretName(h.name, extraSecretNames) ? std::string(RedactedValue) : h.value});
    }
    return out;
}

JSONValue redactedRequestValue(const WireRequest& request, const std::vector<std::string>& extraSecretNames) {
    WireRequest copy;
    copy.url = request.url;
    for (const auto& [k, v] : request.query) {
        copy.query.emplace_back(k, isSecretName(k, extraSecretNames) ? std::string(RedactedValue) : v);
    }

    JSONValue out = JSONValue::object();
    out.set("method", JSONValue(request.method));
    out.set("url", JSONValue(buildTargetUrl(copy)));
    JSONValue headers = JSONValue::object();
    for (const auto& h : redactHeaders(request.headers, extraSecretNames)) {
        headers.set(h.name, JSONValue(h.value));
    }
    out.set("headers", headers);
    if (request.body) {
        out.set("body", *request.body);
    }
    if (!request.channel.empty()) {
        out.set("channel", JSONValue(request.channel));
    }
    if (!request.channelParams.empty()) {
        JSONValue params = JSONValue::object();
        for (const auto& [k, v] : request.channelParams) {
            params.set(k, JSONValue(isSecretName(k, extraSecretNames) ? std::string(RedactedValue) : v));
        }
        out.set("channelParams", params);
    }
    return out;
}

JSONValue responseValue(const WireResponse& response) {
    JSONValue out = JSONValue::object();
    out.set("status", JSONValue(response.status));
    JSONValue headers = JSONValue::object();
    for (const auto& h : redactHeaders(response.headers, {"Set-Cookie"})) {
        headers.set(h.name, JSONValue(h.value));
    }
    out.set("headers", headers);
    out.set("body", response.structured ? response.body : JSONValue(response.rawBody));
    return out;
}

} // namespace apigw
