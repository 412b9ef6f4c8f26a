//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/apigw/auth/OAuth2Flow.cpp
// Purpose: OAuth2 PKCE flow implementation
//==========================================================================================================

#include <algorithm>

#include "apigw/auth/Crypto.hpp"
#include "apigw/auth/OAuth2Flow.hpp"
#include "apigw/errors/Errors.h"
#include "logging/Logger.h"

namespace apigw::auth {

using errors::ErrorKind;
using errors::GatewayError;

namespace {

std::string encodeForm(const FormFields& form) {
    std::string body;
    for (const auto& [k, v] : form) {
        if (!body.empty()) body += '&';
        body += urlEncodeForm(k) + "=" + urlEncodeForm(v);
    }
    return body;
}

std::string requireField(const JSONValue& cfg, const std::string& key) {
    std::string v = cfg.getString(key);
    if (v.empty()) {
        throw GatewayError(ErrorKind::InvalidConfiguration, "OAuth2 config is missing " + key, key);
    }
    return v;
}

// Token responses carry provider ids as strings or integers.
std::string scalarText(const JSONValue* v) {
    if (!v) return std::string();
    if (v->isString()) return v->asString();
    if (v->isInt()) return std::to_string(std::get<int64_t>(v->value));
    return std::string();
}

} // namespace

HttpTokenEndpointClient::HttpTokenEndpointClient(std::shared_ptr<protocol::IRequestResponseAdapter> a)
    : adapter(std::move(a)) {}

JSONValue HttpTokenEndpointClient::PostForm(const std::string& tokenUrl, const FormFields& form, unsigned int timeoutMs) {
    WireRequest req;
    req.protocol = protocol::Http;
    req.method = "POST";
    req.url = tokenUrl;
    req.timeoutMs = timeoutMs;
    setHeader(req.headers, "Content-Type", "application/x-www-form-urlencoded");
    setHeader(req.headers, "Accept", "application/json");
    req.body = JSONValue(encodeForm(form));

    WireResponse res = adapter->Execute(req);
    if (!res.structured || !res.body.isObject()) {
        throw GatewayError(ErrorKind::AuthenticationFailed,
                           "Token endpoint returned a non-JSON response (status " + std::to_string(res.status) + ")",
                           tokenUrl);
    }
    if (res.status >= 400) {
        std::string reason = res.body.getString("error", "error");
        const std::string description = res.body.getString("error_description");
        if (!description.empty()) reason += ": " + description;
        throw GatewayError(ErrorKind::AuthenticationFailed,
                           "Token endpoint returned " + std::to_string(res.status) + " (" + reason + ")", tokenUrl);
    }
    return res.body;
}

OAuth2Flow::OAuth2Flow(std::shared_ptr<store::IGatewayStore> s, std::shared_ptr<ITokenEndpointClient> client,
                       Clock c, OAuth2FlowOptions opts)
    : store(std::move(s)), tokenClient(std::move(client)), clock(c ? std::move(c) : systemClock()),
      options(std::move(opts)) {}

OAuth2Settings OAuth2Flow::ReadSettings(const AuthConfig& config, const std::string& defaultScope) {
    const JSONValue& cfg = config.config;
    if (!cfg.isObject()) {
        throw GatewayError(ErrorKind::InvalidConfiguration, "OAuth2 config must be an object", config.id);
    }
    OAuth2Settings s;
    s.clientId = requireField(cfg, "client_id");
    s.authorizationUrl = cfg.getString("authorization_url", cfg.getString("auth_url"));
    if (s.authorizationUrl.empty()) {
        throw GatewayError(ErrorKind::InvalidConfiguration, "OAuth2 config is missing authorization_url",
                           "authorization_url");
    }
    s.tokenUrl = requireField(cfg, "token_url");
    s.redirectUri = requireField(cfg, "redirect_uri");
    s.clientSecret = cfg.getString("client_secret");
    s.scope = cfg.getString("scope", defaultScope);
    return s;
}

AuthConfig OAuth2Flow::selectConfig(const std::string& documentId) const {
    std::vector<AuthConfig> configs = store->ListAuthConfigs(documentId);
    std::erase_if(configs, [](const AuthConfig& c) { return c.scheme != scheme::OAuth2; });
    if (configs.empty()) {
        throw GatewayError(ErrorKind::InvalidConfiguration, "No oauth2 auth config for document " + documentId,
                           documentId);
    }
    std::stable_sort(configs.begin(), configs.end(),
                     [](const AuthConfig& a, const AuthConfig& b) { return a.priority > b.priority; });
    return configs.front();
}

AuthorizationStart OAuth2Flow::InitiateAuthorization(const std::string& userId, const std::string& documentId) {
    FUNC_SCOPE();
    if (userId.empty()) {
        throw GatewayError(ErrorKind::InvalidConfiguration, "OAuth2 authorization requires a user id", "user_id");
    }
    const AuthConfig config = selectConfig(documentId);
    const OAuth2Settings settings = ReadSettings(config, options.defaultScope);

    OAuth2AuthState st;
    st.id = generateId();
    st.authConfigId = config.id;
    st.userId = userId;
    st.apiDocumentId = documentId;
    st.stateNonce = randomToken(16);
    st.codeVerifier = randomToken(32);
    st.codeChallenge = pkceChallenge(st.codeVerifier);
    st.redirectUri = settings.redirectUri;
    st.scope = settings.scope;
    st.createdAt = clock();
    st.expiresAt = st.createdAt + options.stateTtl;
    store->SaveAuthState(st);

    std::string url = settings.authorizationUrl;
    url += (url.find('?') == std::string::npos) ? '?' : '&';
    url += "response_type=code";
    url += "&client_id=" + percentEncode(settings.clientId);
    url += "&redirect_uri=" + percentEncode(settings.redirectUri);
    url += "&scope=" + percentEncode(settings.scope);
    url += "&state=" + percentEncode(st.stateNonce);
    url += "&code_challenge=" + percentEncode(st.codeChallenge);
    url += "&code_challenge_method=S256";

    LOG_INFO("OAuth2 authorization started for user {} document {} (state {})", userId, documentId, st.id);
    return AuthorizationStart{st.id, url, st.expiresAt};
}

UserAuthorization OAuth2Flow::HandleCallback(const std::string& stateId, const std::string& code,
                                             const std::string& state) {
    FUNC_SCOPE();
    const auto pending = store->GetAuthState(stateId);
    if (!pending || pending->consumed) {
        throw GatewayError(ErrorKind::InvalidState, "Unknown or already used authorization state", stateId);
    }
    if (pending->stateNonce != state) {
        throw GatewayError(ErrorKind::InvalidState, "Authorization state does not match", stateId);
    }
    if (clock() >= pending->expiresAt) {
        throw GatewayError(ErrorKind::ExpiredState, "Authorization state has expired", stateId);
    }
    const auto st = store->ConsumeAuthState(stateId);
    if (!st) {
        throw GatewayError(ErrorKind::InvalidState, "Unknown or already used authorization state", stateId);
    }
    const auto config = store->GetAuthConfig(st->authConfigId);
    if (!config) {
        throw GatewayError(ErrorKind::InvalidConfiguration, "OAuth2 auth config no longer exists", st->authConfigId);
    }
    const OAuth2Settings settings = ReadSettings(*config, options.defaultScope);

    FormFields form{{"grant_type", "authorization_code"},
                    {"code", code},
                    {"redirect_uri", st->redirectUri},
                    {"client_id", settings.clientId}};
    if (!settings.clientSecret.empty()) {
        form.emplace_back("client_secret", settings.clientSecret);
    }
    form.emplace_back("code_verifier", st->codeVerifier);
    const JSONValue token = tokenClient->PostForm(settings.tokenUrl, form, options.tokenTimeoutMs);

    UserAuthorization ua;
    if (auto existing = store->GetUserAuthorization(st->userId, st->apiDocumentId)) {
        ua.id = existing->id;
    } else {
        ua.id = generateId();
    }
    ua.userId = st->userId;
    ua.apiDocumentId = st->apiDocumentId;
    ua.authConfigId = st->authConfigId;
    ua.scope = st->scope;
    ua = persistTokens(token, std::move(ua));
    LOG_INFO("OAuth2 authorization completed for user {} document {}", ua.userId, ua.apiDocumentId);
    return ua;
}

UserAuthorization OAuth2Flow::RefreshAuthorization(const std::string& userId, const std::string& documentId) {
    FUNC_SCOPE();
    auto current = store->GetUserAuthorization(userId, documentId);
    if (!current) {
        throw GatewayError(ErrorKind::AuthenticationFailed, "User " + userId + " has not authorized this API",
                           documentId);
    }
    if (current->refreshToken.empty()) {
        throw GatewayError(ErrorKind::AuthorizationExpired, "No refresh token stored; re-authorization required",
                           documentId);
    }
    auto config = store->GetAuthConfig(current->authConfigId);
    const AuthConfig cfg = config ? *config : selectConfig(documentId);
    const OAuth2Settings settings = ReadSettings(cfg, options.defaultScope);

    FormFields form{{"grant_type", "refresh_token"},
                    {"refresh_token", current->refreshToken},
                    {"client_id", settings.clientId}};
    if (!settings.clientSecret.empty()) {
        form.emplace_back("client_secret", settings.clientSecret);
    }
    if (!current->scope.empty()) {
        form.emplace_back("scope", current->scope);
    }
    const JSONValue token = tokenClient->PostForm(settings.tokenUrl, form, options.tokenTimeoutMs);
    current->authConfigId = cfg.id;
    UserAuthorization ua = persistTokens(token, std::move(*current));
    LOG_INFO("OAuth2 authorization refreshed for user {} document {}", userId, documentId);
    return ua;
}

UserAuthorization OAuth2Flow::persistTokens(const JSONValue& token, UserAuthorization ua) {
    const std::string access = token.getString("access_token");
    if (access.empty()) {
        throw GatewayError(ErrorKind::AuthenticationFailed, "Token response is missing access_token",
                           "access_token");
    }
    const TimePoint now = clock();
    ua.accessToken = access;
    const std::string refresh = token.getString("refresh_token");
    if (!refresh.empty()) {
        ua.refreshToken = refresh;
    }
    ua.tokenType = token.getString("token_type", "Bearer");
    ua.scope = token.getString("scope", ua.scope);
    if (const JSONValue* expiresIn = token.find("expires_in"); expiresIn && expiresIn->isNumber()) {
        const int64_t seconds = expiresIn->isInt() ? std::get<int64_t>(expiresIn->value)
                                                   : static_cast<int64_t>(std::get<double>(expiresIn->value));
        ua.expiresAt = now + std::chrono::seconds(seconds);
    } else {
        ua.expiresAt.reset();
    }
    for (const char* key : {"sub", "user_id", "id"}) {
        std::string subject = scalarText(token.find(key));
        if (!subject.empty()) {
            ua.providerSubject = subject;
            break;
        }
    }
    ua.updatedAt = now;
    store->SaveUserAuthorization(ua);
    return ua;
}

} // namespace apigw::auth
