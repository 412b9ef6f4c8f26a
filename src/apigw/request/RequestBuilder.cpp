//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/apigw/request/RequestBuilder.cpp
// Purpose: RequestBuilder implementation (validation, coercion, placement, URL join)
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <set>

#include "logging/Logger.h"
#include "apigw/errors/Errors.h"
#include "apigw/request/PathMatcher.hpp"
#include "apigw/request/RequestBuilder.hpp"

namespace apigw::request {

using errors::ErrorKind;
using errors::GatewayError;

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<int64_t> parseInteger(const std::string& s) {
    if (s.empty()) {
        return std::nullopt;
    }
    int64_t v = 0;
    const char* begin = s.data();
    const char* end = s.data() + s.size();
    if (*begin == '+') {
        ++begin;
    }
    auto [ptr, ec] = std::from_chars(begin, end, v);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return v;
}

std::optional<double> parseNumber(const std::string& s) {
    if (s.empty() || std::isspace(static_cast<unsigned char>(s.front()))) {
        return std::nullopt;
    }
    char* end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size() || !std::isfinite(v)) {
        return std::nullopt;
    }
    return v;
}

std::string declaredType(const Parameter& param) {
    return param.schema.isObject() ? param.schema.getString("type") : std::string();
}

bool caseInsensitiveLocation(const Parameter& p) {
    return p.location == "header" || p.location == "cookie";
}

const Parameter* findDeclared(const Endpoint& endpoint, const std::string& name) {
    auto it = std::find_if(endpoint.parameters.begin(), endpoint.parameters.end(),
                           [&](const Parameter& p) { return p.name == name; });
    if (it == endpoint.parameters.end()) {
        it = std::find_if(endpoint.parameters.begin(), endpoint.parameters.end(),
                          [&](const Parameter& p) { return caseInsensitiveLocation(p) && iequals(p.name, name); });
    }
    return it == endpoint.parameters.end() ? nullptr : &*it;
}

// Caller entry for a parameter. Header and cookie names match case-insensitively; an exact key wins.
template <typename Map>
auto findSupplied(Map& params, const Parameter& p) -> decltype(params.find(p.name)) {
    auto it = params.find(p.name);
    if (it != params.end() || !caseInsensitiveLocation(p)) {
        return it;
    }
    return std::find_if(params.begin(), params.end(), [&](const auto& kv) { return iequals(kv.first, p.name); });
}

// Supplied value for a parameter name; null counts as not supplied.
const JSONValue* suppliedValue(const CallInput& input, const std::string& name) {
    auto it = input.params.find(name);
    if (it == input.params.end() || it->second.isNull()) {
        return nullptr;
    }
    return &it->second;
}

std::string originOf(const std::string& url) {
    const std::size_t scheme = url.find("://");
    if (scheme == std::string::npos) {
        return std::string();
    }
    const std::size_t slash = url.find('/', scheme + 3);
    return slash == std::string::npos ? url : url.substr(0, slash);
}

} // namespace

RequestBuilder::RequestBuilder() = default;

RequestBuilder::RequestBuilder(RequestBuilderOptions o) : opts(std::move(o)) {}

std::string RequestBuilder::JoinUrl(const std::string& base, const std::string& relative, UrlJoinMode mode) {
    if (relative.find("://") != std::string::npos) {
        return relative;
    }
    if (base.empty()) {
        throw GatewayError(ErrorKind::InvalidConfiguration,
                           "No base address available to resolve relative address " + relative, "base_address");
    }
    std::string rel = relative;
    if (!rel.empty() && rel.front() != '/') {
        rel.insert(rel.begin(), '/');
    }
    std::string root = base;
    if (mode == UrlJoinMode::ReplaceBasePath) {
        const std::string origin = originOf(base);
        if (!origin.empty()) {
            root = origin;
        }
    }
    while (!root.empty() && root.back() == '/') {
        root.pop_back();
    }
    return root + rel;
}

JSONValue RequestBuilder::Coerce(const Parameter& param, const JSONValue& value) {
    const std::string type = declaredType(param);
    if (type == "integer") {
        if (value.isInt()) {
            return value;
        }
        if (value.isDouble()) {
            const double d = std::get<double>(value.value);
            if (std::isfinite(d) && std::floor(d) == d && std::fabs(d) < 9.2e18) {
                return JSONValue(static_cast<int64_t>(d));
            }
        } else if (value.isString()) {
            if (auto v = parseInteger(value.asString())) {
                return JSONValue(*v);
            }
        }
        throw errors::typeMismatch(param.name, type);
    }
    if (type == "number") {
        if (value.isNumber()) {
            return value;
        }
        if (value.isString()) {
            if (auto i = parseInteger(value.asString())) {
                return JSONValue(*i);
            }
            if (auto d = parseNumber(value.asString())) {
                return JSONValue(*d);
            }
        }
        throw errors::typeMismatch(param.name, type);
    }
    if (type == "boolean") {
        if (value.isBool()) {
            return value;
        }
        if (value.isInt()) {
            const int64_t i = std::get<int64_t>(value.value);
            if (i == 0 || i == 1) {
                return JSONValue(i == 1);
            }
        } else if (value.isString()) {
            const std::string s = lower(value.asString());
            if (s == "true" || s == "1") return JSONValue(true);
            if (s == "false" || s == "0") return JSONValue(false);
        }
        throw errors::typeMismatch(param.name, type);
    }
    if (type == "array") {
        if (!value.isArray()) {
            throw errors::typeMismatch(param.name, type);
        }
        return value;
    }
    if (type == "object") {
        if (!value.isObject()) {
            throw errors::typeMismatch(param.name, type);
        }
        return value;
    }
    if (type == "string" && (value.isArray() || value.isObject())) {
        throw errors::typeMismatch(param.name, type);
    }
    return value;
}

WireRequest RequestBuilder::Build(const Endpoint& endpoint, const ApiDocument& document, const CallInput& input,
                                  const AuthStep& auth) const {
    FUNC_SCOPE();
    const bool rest = endpoint.protocol == protocol::Http;
    const auto tokens = PathMatcher::ExtractTokens(endpoint.addressPattern);

    // 1) Presence checks (declaration order), then tokens, then coercion
    for (const auto& p : endpoint.parameters) {
        if (!p.required) {
            continue;
        }
        if (auto it = findSupplied(input.params, p); it != input.params.end() && !it->second.isNull()) {
            continue;
        }
        if (p.location == "header" && findHeader(input.headers, p.name)) {
            continue;
        }
        throw errors::missingRequiredParameter(p.name);
    }
    for (const auto& t : tokens) {
        if (!suppliedValue(input, t)) {
            throw errors::missingRequiredParameter(t);
        }
    }
    std::map<std::string, JSONValue> values;
    for (const auto& [name, value] : input.params) {
        if (value.isNull()) {
            continue;
        }
        const Parameter* declared = findDeclared(endpoint, name);
        values.emplace(name, declared ? Coerce(*declared, value) : value);
    }

    WireRequest req;
    req.protocol = endpoint.protocol;
    req.timeoutMs = opts.timeoutMs;
    req.body = input.body;
    if (rest) {
        req.method = endpoint.operationKind;
        std::transform(req.method.begin(), req.method.end(), req.method.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    } else {
        req.method = endpoint.operationKind;
    }

    // 2) Token substitution
    std::set<std::string> consumed;
    std::string address = endpoint.addressPattern;
    for (const auto& t : tokens) {
        const std::string plain = jsonToPlainString(values.at(t));
        const std::string encoded = rest ? percentEncode(plain) : plain;
        const std::string token = "{" + t + "}";
        std::size_t pos = 0;
        while ((pos = address.find(token, pos)) != std::string::npos) {
            address.replace(pos, token.size(), encoded);
            pos += encoded.size();
        }
        consumed.insert(t);
    }

    // 3) Caller headers, then header and cookie parameters
    req.headers = input.headers;
    std::vector<std::string> cookies;
    for (const auto& p : endpoint.parameters) {
        if (p.location != "header" && p.location != "cookie") {
            continue;
        }
        auto it = findSupplied(values, p);
        if (it == values.end()) {
            continue;
        }
        if (p.location == "header") {
            setHeader(req.headers, p.name, jsonToPlainString(it->second));
        } else {
            cookies.push_back(p.name + "=" + jsonToPlainString(it->second));
        }
        consumed.insert(it->first);
    }
    if (!cookies.empty()) {
        std::string cookie;
        if (const HeaderKV* existing = findHeader(req.headers, "Cookie")) {
            cookie = existing->value;
        }
        for (const auto& c : cookies) {
            if (!cookie.empty()) cookie += "; ";
            cookie += c;
        }
        setHeader(req.headers, "Cookie", cookie);
    }

    // Leftovers become query parameters (REST) or channel parameters (pub/sub)
    for (const auto& [name, value] : values) {
        if (consumed.count(name)) {
            continue;
        }
        if (!rest) {
            req.channelParams[name] = jsonToPlainString(value);
        } else if (value.isArray()) {
            for (const auto& item : value.asArray()) {
                req.query.emplace_back(name, item ? jsonToPlainString(*item) : std::string());
            }
        } else {
            req.query.emplace_back(name, jsonToPlainString(value));
        }
    }

    // 4) Defaults
    if (req.body) {
        setHeaderIfAbsent(req.headers, "Content-Type", "application/json");
    }
    setHeaderIfAbsent(req.headers, "User-Agent", opts.userAgent);

    // 5) Addressing
    if (rest) {
        std::string base = document.baseAddress;
        if (base.empty() && !endpoint.servers.empty()) {
            base = endpoint.servers.front().url;
        }
        req.url = JoinUrl(base, address, opts.joinMode);
    } else {
        req.channel = address;
        if (!document.baseAddress.empty()) {
            req.url = document.baseAddress;
        } else if (!endpoint.servers.empty()) {
            req.url = endpoint.servers.front().url;
        }
    }

    // 6) Auth
    if (auth) {
        auth(req);
    }
    LOG_DEBUG("RequestBuilder: built {} {} ({} query params)", req.method, rest ? req.url : req.channel, req.query.size());
    return req;
}

} // namespace apigw::request
