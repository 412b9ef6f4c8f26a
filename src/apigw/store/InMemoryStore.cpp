//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/apigw/store/InMemoryStore.cpp
// Purpose: InMemoryStore implementation
//==========================================================================================================

#include <algorithm>

#include "logging/Logger.h"
#include "apigw/errors/Errors.h"
#include "apigw/store/InMemoryStore.hpp"

namespace apigw::store {

void InMemoryStore::SaveRegistration(const Specification& spec, const ApiDocument& document,
                                     const std::vector<Endpoint>& eps) {
    std::lock_guard<std::mutex> lock(mtx);
    if (documents.count(document.id)) {
        throw errors::GatewayError(errors::ErrorKind::Internal, "Duplicate document id " + document.id, document.id);
    }
    specs[spec.specId] = spec;
    documents[document.id] = document;
    auto& ids = documentEndpoints[document.id];
    for (const auto& ep : eps) {
        endpoints[ep.id] = ep;
        ids.push_back(ep.id);
    }
}

std::optional<Specification> InMemoryStore::GetSpecification(const std::string& specId) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = specs.find(specId);
    if (it == specs.end()) return std::nullopt;
    return it->second;
}

std::optional<ApiDocument> InMemoryStore::GetApiDocument(const std::string& documentId) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = documents.find(documentId);
    if (it == documents.end()) return std::nullopt;
    return it->second;
}

std::vector<ApiDocument> InMemoryStore::ListApiDocuments() const {
    std::vector<ApiDocument> out;
    {
        std::lock_guard<std::mutex> lock(mtx);
        for (const auto& kv : documents) {
            out.push_back(kv.second);
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const ApiDocument& a, const ApiDocument& b) { return a.createdAt < b.createdAt; });
    return out;
}

bool InMemoryStore::DeleteApiDocument(const std::string& documentId) {
    std::lock_guard<std::mutex> lock(mtx);
    auto doc = documents.find(documentId);
    if (doc == documents.end()) {
        return false;
    }
    const std::string specId = doc->second.specId;
    documents.erase(doc);

    auto ids = documentEndpoints.find(documentId);
    if (ids != documentEndpoints.end()) {
        for (const auto& id : ids->second) {
            endpoints.erase(id);
        }
        documentEndpoints.erase(ids);
    }
    std::erase_if(authConfigs, [&](const auto& kv) { return kv.second.apiDocumentId == documentId && !kv.second.global; });
    std::erase_if(authStates, [&](const auto& kv) { return kv.second.apiDocumentId == documentId; });
    std::erase_if(userAuthorizations, [&](const auto& kv) { return kv.first.second == documentId; });

    const bool specInUse = std::any_of(documents.begin(), documents.end(),
                                       [&](const auto& kv) { return kv.second.specId == specId; });
    if (!specInUse) {
        specs.erase(specId);
    }
    return true;
}

std::optional<Endpoint> InMemoryStore::GetEndpoint(const std::string& endpointId) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = endpoints.find(endpointId);
    if (it == endpoints.end()) return std::nullopt;
    return it->second;
}

std::vector<Endpoint> InMemoryStore::ListEndpoints(const std::string& documentId) const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<Endpoint> out;
    auto ids = documentEndpoints.find(documentId);
    if (ids == documentEndpoints.end()) {
        return out;
    }
    for (const auto& id : ids->second) {
        auto it = endpoints.find(id);
        if (it != endpoints.end()) {
            out.push_back(it->second);
        }
    }
    return out;
}

void InMemoryStore::RecordCallResult(const std::string& endpointId, bool success, double latencyMs) {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = endpoints.find(endpointId);
    if (it == endpoints.end()) {
        LOG_DEBUG("InMemoryStore: stats for unknown endpoint {} dropped", endpointId);
        return;
    }
    auto& s = it->second.stats;
    ++s.callCount;
    if (success) {
        ++s.successCount;
    } else {
        ++s.errorCount;
    }
    s.avgLatencyMs += (latencyMs - s.avgLatencyMs) / static_cast<double>(s.callCount);
}

void InMemoryStore::SaveAuthConfig(const AuthConfig& config) {
    std::lock_guard<std::mutex> lock(mtx);
    authConfigs[config.id] = config;
}

std::optional<AuthConfig> InMemoryStore::GetAuthConfig(const std::string& configId) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = authConfigs.find(configId);
    if (it == authConfigs.end()) return std::nullopt;
    return it->second;
}

std::vector<AuthConfig> InMemoryStore::ListAuthConfigs(const std::string& documentId) const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<AuthConfig> out;
    for (const auto& kv : authConfigs) {
        if (kv.second.global || kv.second.apiDocumentId == documentId) {
            out.push_back(kv.second);
        }
    }
    return out;
}

bool InMemoryStore::DeleteAuthConfig(const std::string& configId) {
    std::lock_guard<std::mutex> lock(mtx);
    return authConfigs.erase(configId) > 0;
}

void InMemoryStore::SaveAuthState(const OAuth2AuthState& state) {
    std::lock_guard<std::mutex> lock(mtx);
    authStates[state.id] = state;
}

std::optional<OAuth2AuthState> InMemoryStore::GetAuthState(const std::string& stateId) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = authStates.find(stateId);
    if (it == authStates.end()) return std::nullopt;
    return it->second;
}

std::optional<OAuth2AuthState> InMemoryStore::ConsumeAuthState(const std::string& stateId) {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = authStates.find(stateId);
    if (it == authStates.end() || it->second.consumed) {
        return std::nullopt;
    }
    it->second.consumed = true;
    return it->second;
}

std::size_t InMemoryStore::PurgeExpiredAuthStates(TimePoint now) {
    std::lock_guard<std::mutex> lock(mtx);
    return std::erase_if(authStates, [&](const auto& kv) { return kv.second.consumed || kv.second.expiresAt <= now; });
}

void InMemoryStore::SaveUserAuthorization(const UserAuthorization& authorization) {
    std::lock_guard<std::mutex> lock(mtx);
    userAuthorizations[{authorization.userId, authorization.apiDocumentId}] = authorization;
}

std::optional<UserAuthorization> InMemoryStore::GetUserAuthorization(const std::string& userId,
                                                                     const std::string& documentId) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = userAuthorizations.find({userId, documentId});
    if (it == userAuthorizations.end()) return std::nullopt;
    return it->second;
}

bool InMemoryStore::DeleteUserAuthorization(const std::string& userId, const std::string& documentId) {
    std::lock_guard<std::mutex> lock(mtx);
    return userAuthorizations.erase({userId, documentId}) > 0;
}

void InMemoryStore::AppendCallLog(const CallLogRecord& record) {
    std::lock_guard<std::mutex> lock(mtx);
    callLog.push_back(record);
}

std::vector<CallLogRecord> InMemoryStore::ListCallLogs(const std::string& endpointId, std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<CallLogRecord> out;
    for (auto it = callLog.rbegin(); it != callLog.rend(); ++it) {
        if (!endpointId.empty() && it->endpointId != endpointId) {
            continue;
        }
        out.push_back(*it);
        if (limit != 0 && out.size() >= limit) {
            break;
        }
    }
    return out;
}

} // namespace apigw::store
