//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/apigw/auth/AuthSchemes.hpp
// Purpose: Built-in Basic, Bearer, API-key and OAuth2 (stored token) schemes
//==========================================================================================================
#pragma once

#include <memory>

#include "apigw/auth/IAuthScheme.hpp"
#include "apigw/store/IGatewayStore.hpp"

namespace apigw::auth {

// config: { "username", "password" }, or a caller-supplied "Authorization: Basic ..." header.
class BasicAuth final : public IAuthScheme {
public:
    std::string Scheme() const override;
    void Apply(const AuthConfig& config, const AuthContext& ctx, WireRequest& request) const override;
};

// config: { "token" }, or a caller-supplied "Authorization: Bearer ..." header.
class BearerAuth final : public IAuthScheme {
public:
    std::string Scheme() const override;
    void Apply(const AuthConfig& config, const AuthContext& ctx, WireRequest& request) const override;
};

// config: { "location": "header"|"query"|"cookie", "name", "value" }.
class ApiKeyAuth final : public IAuthScheme {
public:
    std::string Scheme() const override;
    void Apply(const AuthConfig& config, const AuthContext& ctx, WireRequest& request) const override;
};

//==========================================================================================================
// OAuth2Auth
// Purpose: Uses the caller's stored UserAuthorization for the document ("<TokenType> <access token>").
//==========================================================================================================
class OAuth2Auth final : public IAuthScheme {
public:
    explicit OAuth2Auth(std::shared_ptr<store::IGatewayStore> store);
    std::string Scheme() const override;
    void Apply(const AuthConfig& config, const AuthContext& ctx, WireRequest& request) const override;

private:
    std::shared_ptr<store::IGatewayStore> store;
};

} // namespace apigw::auth
