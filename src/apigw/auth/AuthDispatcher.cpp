//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/apigw/auth/AuthDispatcher.cpp
// Purpose: Priority-ordered auth config selection
//==========================================================================================================

#include <algorithm>

#include "apigw/auth/AuthDispatcher.hpp"
#include "apigw/errors/Errors.h"
#include "logging/Logger.h"

namespace apigw::auth {

using errors::ErrorKind;
using errors::GatewayError;

AuthDispatcher::AuthDispatcher(std::shared_ptr<store::IGatewayStore> s, Clock c)
    : store(std::move(s)), clock(c ? std::move(c) : systemClock()) {}

void AuthDispatcher::RegisterScheme(std::shared_ptr<IAuthScheme> scheme) {
    if (!scheme) {
        throw GatewayError(ErrorKind::InvalidConfiguration, "Cannot register a null auth scheme");
    }
    std::lock_guard<std::mutex> lock(mutex);
    schemes[scheme->Scheme()] = std::move(scheme);
}

bool AuthDispatcher::SupportsScheme(const std::string& name) const {
    return lookup(name) != nullptr;
}

std::vector<std::string> AuthDispatcher::Schemes() const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<std::string> out;
    for (const auto& [name, _] : schemes) {
        out.push_back(name);
    }
    return out;
}

std::shared_ptr<IAuthScheme> AuthDispatcher::lookup(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = schemes.find(name);
    return it == schemes.end() ? nullptr : it->second;
}

std::string AuthDispatcher::Apply(const ApiDocument& document, const std::string& userId,
                                  const HeaderList& callerHeaders, WireRequest& request) const {
    FUNC_SCOPE();
    std::vector<AuthConfig> configs = store->ListAuthConfigs(document.id);
    if (configs.empty()) {
        return std::string();
    }
    std::stable_sort(configs.begin(), configs.end(),
                     [](const AuthConfig& a, const AuthConfig& b) { return a.priority > b.priority; });

    AuthContext ctx;
    ctx.userId = userId;
    ctx.apiDocumentId = document.id;
    ctx.callerHeaders = callerHeaders;
    ctx.now = clock();

    std::vector<std::string> reasons;
    bool expired = false;
    bool anyRequired = false;
    for (const auto& cfg : configs) {
        anyRequired = anyRequired || cfg.required;
        auto scheme = lookup(cfg.scheme);
        if (!scheme) {
            reasons.push_back(cfg.scheme + ": unsupported scheme");
            continue;
        }
        WireRequest attempt = request;
        try {
            scheme->Apply(cfg, ctx, attempt);
        } catch (const GatewayError& e) {
            if (e.kind() == ErrorKind::AuthorizationExpired) {
                expired = true;
            } else if (e.kind() != ErrorKind::AuthenticationFailed) {
                throw;
            }
            LOG_DEBUG("Auth config {} ({}) not applicable: {}", cfg.id, cfg.scheme, e.what());
            reasons.push_back(e.what());
            continue;
        }
        request = std::move(attempt);
        LOG_DEBUG("Applied auth config {} ({}) for document {}", cfg.id, cfg.scheme, document.id);
        return cfg.id;
    }

    std::string joined;
    for (const auto& r : reasons) {
        if (!joined.empty()) joined += "; ";
        joined += r;
    }
    if (!anyRequired) {
        LOG_WARN("No optional auth config applied for document {}; continuing unauthenticated ({})", document.id, joined);
        return std::string();
    }
    if (expired) {
        throw GatewayError(ErrorKind::AuthorizationExpired, "Stored authorization has expired; refresh or re-authorize",
                           document.id, joined);
    }
    throw GatewayError(ErrorKind::AuthenticationFailed, "No authentication configuration could be applied",
                       document.id, joined);
}

} // namespace apigw::auth
