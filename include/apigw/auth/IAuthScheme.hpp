//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/apigw/auth/IAuthScheme.hpp
// Purpose: Authentication scheme interface applied to built requests
//==========================================================================================================
#pragma once

#include <string>

#include "apigw/Types.h"

namespace apigw::auth {

//==========================================================================================================
// AuthContext
// Purpose: Per-call inputs a scheme may consult.
// Fields:
//   userId: Caller identity (per-user schemes such as OAuth2).
//   apiDocumentId: Document being called.
//   callerHeaders: Headers the caller supplied (pre-existing credentials).
//   now: Evaluation time for expiry checks.
//==========================================================================================================
struct AuthContext {
    std::string userId;
    std::string apiDocumentId;
    HeaderList callerHeaders;
    TimePoint now{};
};

//==========================================================================================================
// IAuthScheme
// Purpose: Injects credentials for one scheme into a WireRequest.
// Throws (GatewayError):
//   AuthenticationFailed with a human-readable reason when the config cannot be satisfied;
//   AuthorizationExpired when a stored authorization is past its expiry.
//==========================================================================================================
class IAuthScheme {
public:
    virtual ~IAuthScheme() = default;
    virtual std::string Scheme() const = 0;
    virtual void Apply(const AuthConfig& config, const AuthContext& ctx, WireRequest& request) const = 0;
};

} // namespace apigw::auth
