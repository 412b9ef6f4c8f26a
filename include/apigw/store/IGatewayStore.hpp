//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/apigw/store/IGatewayStore.hpp
// Purpose: Persistence boundary for specifications, endpoints, auth records and call logs
//==========================================================================================================
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "apigw/Types.h"

namespace apigw::store {

//==========================================================================================================
// IGatewayStore
// Purpose: Record store used by the Gateway. Implementations must be safe for concurrent use.
// Notes:
//   - SaveRegistration writes a specification, its document and all endpoints as one unit.
//   - RecordCallResult updates endpoint statistics atomically (running mean for latency).
//   - ConsumeAuthState marks a state consumed and returns it only for the first caller.
//   - ListAuthConfigs returns the document's configs plus every global config.
//==========================================================================================================
class IGatewayStore {
public:
    virtual ~IGatewayStore() = default;

    // Specifications, documents and endpoints
    virtual void SaveRegistration(const Specification& spec, const ApiDocument& document,
                                  const std::vector<Endpoint>& endpoints) = 0;
    virtual std::optional<Specification> GetSpecification(const std::string& specId) const = 0;
    virtual std::optional<ApiDocument> GetApiDocument(const std::string& documentId) const = 0;
    virtual std::vector<ApiDocument> ListApiDocuments() const = 0;

    // Removes the document with its endpoints, document-scoped auth records and unreferenced spec.
    virtual bool DeleteApiDocument(const std::string& documentId) = 0;

    virtual std::optional<Endpoint> GetEndpoint(const std::string& endpointId) const = 0;
    virtual std::vector<Endpoint> ListEndpoints(const std::string& documentId) const = 0;
    virtual void RecordCallResult(const std::string& endpointId, bool success, double latencyMs) = 0;

    // Auth configurations
    virtual void SaveAuthConfig(const AuthConfig& config) = 0;
    virtual std::optional<AuthConfig> GetAuthConfig(const std::string& configId) const = 0;
    virtual std::vector<AuthConfig> ListAuthConfigs(const std::string& documentId) const = 0;
    virtual bool DeleteAuthConfig(const std::string& configId) = 0;

    // OAuth2 authorization states
    virtual void SaveAuthState(const OAuth2AuthState& state) = 0;
    virtual std::optional<OAuth2AuthState> GetAuthState(const std::string& stateId) const = 0;
    virtual std::optional<OAuth2AuthState> ConsumeAuthState(const std::string& stateId) = 0;
    virtual std::size_t PurgeExpiredAuthStates(TimePoint now) = 0;

    // Per-user authorizations, keyed by (userId, documentId)
    virtual void SaveUserAuthorization(const UserAuthorization& authorization) = 0;
    virtual std::optional<UserAuthorization> GetUserAuthorization(const std::string& userId,
                                                                  const std::string& documentId) const = 0;
    virtual bool DeleteUserAuthorization(const std::string& userId, const std::string& documentId) = 0;

    // Append-only call log; ListCallLogs returns newest first ("" lists every endpoint, 0 means no limit).
    virtual void AppendCallLog(const CallLogRecord& record) = 0;
    virtual std::vector<CallLogRecord> ListCallLogs(const std::string& endpointId, std::size_t limit) const = 0;
};

} // namespace apigw::store
