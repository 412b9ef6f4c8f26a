//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/apigw/Gateway.hpp
// Purpose: Gateway composition root: registration, calls, auth management and subscriptions
//==========================================================================================================
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "apigw/GatewayOptions.hpp"
#include "apigw/Types.h"
#include "apigw/auth/AuthDispatcher.hpp"
#include "apigw/auth/OAuth2Flow.hpp"
#include "apigw/protocol/BrokerAdapter.hpp"
#include "apigw/registry/Registry.hpp"
#include "apigw/request/RequestBuilder.hpp"
#include "apigw/store/IGatewayStore.hpp"

namespace apigw {

using request::CallInput;

struct RegistrationOptions {
    std::string familyHint;  // "rest" | "pubsub"; detected when empty
    std::string baseAddress; // overrides the first declared server
    std::string version;     // defaults to info.version
};

struct RegistrationResult {
    std::string documentId;
    std::string specId;
    std::vector<Endpoint> endpoints;
};

//==========================================================================================================
// CallResult
// Purpose: Outcome of one call. Failures never throw out of CallEndpoint/CallByAddress.
// Fields:
//   success: No error was raised (any HTTP status counts).
//   status: Wire status (HTTP status; 200 for accepted publish/subscribe).
//   result: Decoded body (JSON) or raw text; for pub/sub the acknowledgement object.
//   errorKind/error/errorDetail: toString(ErrorKind), message and GatewayError::detail() on failure.
//   callLogId: Id of the appended CallLogRecord (empty when the endpoint was unknown).
//   subscriptionId: Set for subscribe operations.
//==========================================================================================================
struct CallResult {
    bool success{false};
    int status{0};
    JSONValue result;
    std::string errorKind;
    std::string error;
    std::string errorDetail;
    double latencyMs{0.0};
    std::string callLogId;
    std::string subscriptionId;
};

//==========================================================================================================
// Gateway
// Purpose: Owns the Registry, the cached protocol adapters, the auth dispatcher and the store handle.
// Notes:
//   - Registration is all-or-nothing: nothing is stored unless every endpoint was extracted and every
//     endpoint protocol has a registered adapter.
//   - Calls build, authenticate and execute a request, then record statistics and a call log entry.
//   - Adapters are created lazily, one per protocol, and torn down by Shutdown().
//   - Without a brokerFactory, broker protocols use MakeNativeBrokerFactory().
//==========================================================================================================
class Gateway {
public:
    explicit Gateway(GatewayOptions options = GatewayOptions(),
                     std::shared_ptr<store::IGatewayStore> store = nullptr,
                     protocol::BrokerClientFactory brokerFactory = protocol::BrokerClientFactory(),
                     Clock clock = systemClock());
    ~Gateway();

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    const GatewayOptions& Options() const;
    registry::Registry& GetRegistry();
    auth::AuthDispatcher& GetAuthDispatcher();
    std::shared_ptr<store::IGatewayStore> GetStore() const;

    // Replaces the token endpoint client used by the OAuth2 flow (default: HTTP adapter).
    void SetTokenEndpointClient(std::shared_ptr<auth::ITokenEndpointClient> client);

    // Throws GatewayError (InvalidSpecification, UnsupportedFamily, UnsupportedProtocol,
    // MalformedReference, UnsupportedReference).
    RegistrationResult RegisterSpecification(const std::string& name, const std::string& rawContent,
                                             const RegistrationOptions& options = RegistrationOptions());
    bool UnregisterDocument(const std::string& documentId);

    std::vector<ApiDocument> ListApiDocuments() const;
    std::optional<ApiDocument> GetApiDocument(const std::string& documentId) const;
    std::vector<Endpoint> ListEndpoints(const std::string& documentId) const;
    std::optional<Endpoint> GetEndpoint(const std::string& endpointId) const;

    CallResult CallEndpoint(const std::string& endpointId, const CallInput& input);
    CallResult CallByAddress(const std::string& address, const std::string& operationKind,
                             const std::string& documentId, const CallInput& input);

    // Subscribe endpoint with a caller handler; returns the subscription id. Throws GatewayError.
    std::string Subscribe(const std::string& endpointId, const CallInput& input, protocol::MessageHandler handler);
    bool Unsubscribe(const std::string& subscriptionId);

    std::vector<CallLogRecord> ListCallLogs(const std::string& endpointId, std::size_t limit = 0) const;

    // Assigns an id when empty; throws InvalidConfiguration for unknown schemes or documents.
    AuthConfig AddAuthConfig(AuthConfig config);
    std::vector<AuthConfig> ListAuthConfigs(const std::string& documentId) const;
    bool RemoveAuthConfig(const std::string& configId);

    auth::AuthorizationStart BeginAuthorization(const std::string& userId, const std::string& documentId);
    UserAuthorization CompleteAuthorization(const std::string& stateId, const std::string& code,
                                            const std::string& state);
    UserAuthorization RefreshAuthorization(const std::string& userId, const std::string& documentId);
    std::size_t PurgeExpiredAuthStates();

    // Cached adapter for a protocol; null when none is registered.
    std::shared_ptr<protocol::IProtocolAdapter> AdapterFor(const std::string& protocolName);

    void Shutdown();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace apigw
