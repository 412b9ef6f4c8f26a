//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/apigw/auth/OAuth2Flow.hpp
// Purpose: OAuth2 authorization-code flow with PKCE (S256) and explicit token refresh
//==========================================================================================================
#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "apigw/Types.h"
#include "apigw/protocol/IProtocolAdapter.hpp"
#include "apigw/store/IGatewayStore.hpp"

namespace apigw::auth {

using FormFields = std::vector<std::pair<std::string, std::string>>;

//==========================================================================================================
// ITokenEndpointClient
// Purpose: Posts an application/x-www-form-urlencoded body to a token endpoint.
// Returns:
//   The decoded JSON response object.
// Throws:
//   GatewayError(AuthenticationFailed) for an error status or a non-JSON reply; transport kinds otherwise.
//   Messages never include the submitted form.
//==========================================================================================================
class ITokenEndpointClient {
public:
    virtual ~ITokenEndpointClient() = default;
    virtual JSONValue PostForm(const std::string& tokenUrl, const FormFields& form, unsigned int timeoutMs) = 0;
};

// Token endpoint client over a request/response adapter (normally the HttpAdapter).
class HttpTokenEndpointClient final : public ITokenEndpointClient {
public:
    explicit HttpTokenEndpointClient(std::shared_ptr<protocol::IRequestResponseAdapter> adapter);
    JSONValue PostForm(const std::string& tokenUrl, const FormFields& form, unsigned int timeoutMs) override;

private:
    std::shared_ptr<protocol::IRequestResponseAdapter> adapter;
};

//==========================================================================================================
// OAuth2Settings
// Purpose: Fields read from an oauth2 AuthConfig.config object.
//==========================================================================================================
struct OAuth2Settings {
    std::string clientId;
    std::string clientSecret;
    std::string authorizationUrl; // "authorization_url" (or "auth_url")
    std::string tokenUrl;
    std::string redirectUri;
    std::string scope;
};

struct OAuth2FlowOptions {
    std::chrono::minutes stateTtl{10};
    std::string defaultScope{"read"};
    unsigned int tokenTimeoutMs{30000};
};

struct AuthorizationStart {
    std::string stateId;
    std::string authorizationUrl;
    TimePoint expiresAt{};
};

//==========================================================================================================
// OAuth2Flow
// Purpose: Drives NO_AUTHORIZATION -> AWAITING_CALLBACK -> AUTHORIZED for (user, document) pairs.
// Notes:
//   - The document's highest-priority oauth2 config (document or global) is used.
//   - States are single use; consumption happens in the store before the token exchange.
//==========================================================================================================
class OAuth2Flow {
public:
    OAuth2Flow(std::shared_ptr<store::IGatewayStore> store, std::shared_ptr<ITokenEndpointClient> tokenClient,
               Clock clock, OAuth2FlowOptions options = OAuth2FlowOptions());

    AuthorizationStart InitiateAuthorization(const std::string& userId, const std::string& documentId);
    UserAuthorization HandleCallback(const std::string& stateId, const std::string& code, const std::string& state);
    UserAuthorization RefreshAuthorization(const std::string& userId, const std::string& documentId);

    // Throws GatewayError(InvalidConfiguration) naming the first missing field.
    static OAuth2Settings ReadSettings(const AuthConfig& config, const std::string& defaultScope);

private:
    AuthConfig selectConfig(const std::string& documentId) const;
    UserAuthorization persistTokens(const JSONValue& token, UserAuthorization authorization);

    std::shared_ptr<store::IGatewayStore> store;
    std::shared_ptr<ITokenEndpointClient> tokenClient;
    Clock clock;
    OAuth2FlowOptions options;
};

} // namespace apigw::auth
