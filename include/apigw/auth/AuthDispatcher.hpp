//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/apigw/auth/AuthDispatcher.hpp
// Purpose: Selects and applies the auth configuration for a call in priority order
//==========================================================================================================
#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "apigw/auth/IAuthScheme.hpp"
#include "apigw/store/IGatewayStore.hpp"

namespace apigw::auth {

//==========================================================================================================
// AuthDispatcher
// Purpose: Applies the first satisfiable auth config of a document (plus global configs) to a request.
// Notes:
//   - Configs are tried in descending priority; equal priorities keep store order.
//   - A failed attempt leaves the request untouched.
//   - No configs at all means the call proceeds unauthenticated.
//   - When every config fails: AuthorizationExpired if an expired authorization was among the causes,
//     otherwise AuthenticationFailed with the per-config reasons joined in detail(). If none of the
//     failed configs is required the call proceeds unauthenticated with a warning.
//==========================================================================================================
class AuthDispatcher {
public:
    AuthDispatcher(std::shared_ptr<store::IGatewayStore> store, Clock clock);

    void RegisterScheme(std::shared_ptr<IAuthScheme> scheme);
    bool SupportsScheme(const std::string& name) const;
    std::vector<std::string> Schemes() const;

    // Returns the id of the applied config, or an empty string when the call stays unauthenticated.
    std::string Apply(const ApiDocument& document, const std::string& userId, const HeaderList& callerHeaders,
                      WireRequest& request) const;

private:
    std::shared_ptr<IAuthScheme> lookup(const std::string& name) const;

    std::shared_ptr<store::IGatewayStore> store;
    Clock clock;
    mutable std::mutex mutex;
    std::map<std::string, std::shared_ptr<IAuthScheme>> schemes;
};

} // namespace apigw::auth
