//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/apigw/store/InMemoryStore.hpp
// Purpose: Mutex-guarded in-memory IGatewayStore
//==========================================================================================================
#pragma once

#include <map>
#include <mutex>
#include <utility>

#include "apigw/store/IGatewayStore.hpp"

namespace apigw::store {

class InMemoryStore final : public IGatewayStore {
public:
    void SaveRegistration(const Specification& spec, const ApiDocument& document,
                          const std::vector<Endpoint>& endpoints) override;
    std::optional<Specification> GetSpecification(const std::string& specId) const override;
    std::optional<ApiDocument> GetApiDocument(const std::string& documentId) const override;
    std::vector<ApiDocument> ListApiDocuments() const override;
    bool DeleteApiDocument(const std::string& documentId) override;

    std::optional<Endpoint> GetEndpoint(const std::string& endpointId) const override;
    std::vector<Endpoint> ListEndpoints(const std::string& documentId) const override;
    void RecordCallResult(const std::string& endpointId, bool success, double latencyMs) override;

    void SaveAuthConfig(const AuthConfig& config) override;
    std::optional<AuthConfig> GetAuthConfig(const std::string& configId) const override;
    std::vector<AuthConfig> ListAuthConfigs(const std::string& documentId) const override;
    bool DeleteAuthConfig(const std::string& configId) override;

    void SaveAuthState(const OAuth2AuthState& state) override;
    std::optional<OAuth2AuthState> GetAuthState(const std::string& stateId) const override;
    std::optional<OAuth2AuthState> ConsumeAuthState(const std::string& stateId) override;
    std::size_t PurgeExpiredAuthStates(TimePoint now) override;

    void SaveUserAuthorization(const UserAuthorization& authorization) override;
    std::optional<UserAuthorization> GetUserAuthorization(const std::string& userId,
                                                          const std::string& documentId) const override;
    bool DeleteUserAuthorization(const std::string& userId, const std::string& documentId) override;

    void AppendCallLog(const CallLogRecord& record) override;
    std::vector<CallLogRecord> ListCallLogs(const std::string& endpointId, std::size_t limit) const override;

private:
    mutable std::mutex mtx;
    std::map<std::string, Specification> specs;
    std::map<std::string, ApiDocument> documents;
    std::map<std::string, Endpoint> endpoints;
    std::map<std::string, std::vector<std::string>> documentEndpoints; // extraction order
    std::map<std::string, AuthConfig> authConfigs;
    std::map<std::string, OAuth2AuthState> authStates;
    std::map<std::pair<std::string, std::string>, UserAuthorization> userAuthorizations;
    std::vector<CallLogRecord> callLog;
};

} // namespace apigw::store
