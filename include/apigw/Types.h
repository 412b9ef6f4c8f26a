//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Types.h
// Purpose: Gateway record types (specifications, endpoints, auth records, call logs) and wire shapes
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "apigw/JSONValue.h"

namespace apigw {

using TimePoint = std::chrono::system_clock::time_point;

// Injectable wall clock; tests substitute a controllable one.
using Clock = std::function<TimePoint()>;

inline Clock systemClock() {
    return []() { return std::chrono::system_clock::now(); };
}

struct HeaderKV {
    std::string name;
    std::string value;
};

using HeaderList = std::vector<HeaderKV>;

// Caller-supplied parameter values keyed by parameter name.
using ParamMap = std::map<std::string, JSONValue>;

//==========================================================================================================
// Spec family and operation vocabulary
//==========================================================================================================
namespace family {
inline constexpr const char* Rest = "rest";
inline constexpr const char* PubSub = "pubsub";
} // namespace family

namespace protocol {
inline constexpr const char* Http = "http";
inline constexpr const char* WebSocket = "websocket";
inline constexpr const char* Mqtt = "mqtt";
inline constexpr const char* Amqp = "amqp";
inline constexpr const char* Kafka = "kafka";
inline constexpr const char* Nats = "nats";
inline constexpr const char* Unknown = "unknown";
} // namespace protocol

struct ServerInfo {
    std::string name;
    std::string url;
    std::string protocol;
    std::string description;
};

struct Parameter {
    std::string name;
    std::string location; // path | query | header | cookie | channel
    bool required{false};
    JSONValue schema;
    std::string description;
};

struct SecurityRequirement {
    std::string name;
    std::string type;
    std::vector<std::string> scopes;
};

struct EndpointStats {
    uint64_t callCount{0};
    uint64_t successCount{0};
    uint64_t errorCount{0};
    double avgLatencyMs{0.0};
};

//==========================================================================================================
// Endpoint
// Purpose: Uniform representation of one callable operation regardless of the source spec family.
//          Only `stats` changes after registration.
//==========================================================================================================
struct Endpoint {
    std::string id;
    std::string apiDocumentId;
    std::string addressPattern;
    std::string protocol;
    std::string operationKind; // get | post | ... | publish | subscribe
    std::string operationId;
    std::string description;
    std::vector<Parameter> parameters;
    JSONValue requestSchema;
    JSONValue responseSchema;
    std::vector<SecurityRequirement> securityRequirements;
    std::vector<std::string> tags;
    std::vector<ServerInfo> servers;
    EndpointStats stats;
};

struct Specification {
    std::string specId;
    std::string name;
    std::string specFamily;
    std::string rawContent;
    JSONValue resolvedContent;
    std::string version;
    std::vector<ServerInfo> servers;
};

struct ApiDocument {
    std::string id;
    std::string specId;
    std::string name;
    std::string version;
    std::string baseAddress;
    std::string specFamily;
    TimePoint createdAt{};
};

namespace scheme {
inline constexpr const char* Basic = "basic";
inline constexpr const char* Bearer = "bearer";
inline constexpr const char* ApiKey = "api_key";
inline constexpr const char* OAuth2 = "oauth2";
} // namespace scheme

struct AuthConfig {
    std::string id;
    std::string apiDocumentId;
    std::string scheme;
    JSONValue config; // scheme-specific secret material
    bool required{true};
    bool global{false};
    int priority{0};
};

struct OAuth2AuthState {
    std::string id;
    std::string authConfigId;
    std::string userId;
    std::string apiDocumentId;
    std::string stateNonce;
    std::string codeVerifier;
    std::string codeChallenge;
    std::string redirectUri;
    std::string scope;
    TimePoint createdAt{};
    TimePoint expiresAt{};
    bool consumed{false};
};

struct UserAuthorization {
    std::string id;
    std::string userId;
    std::string apiDocumentId;
    std::string authConfigId;
    std::string accessToken;
    std::string refreshToken;
    std::string tokenType{"Bearer"};
    std::string scope;
    std::optional<TimePoint> expiresAt;
    std::string providerSubject;
    TimePoint updatedAt{};
};

struct CallLogRecord {
    std::string id;
    std::string endpointId;
    std::string operationKind;
    std::string protocol;
    JSONValue request;
    JSONValue response;
    int status{0};
    bool success{false};
    std::string errorKind;
    std::string error;
    double latencyMs{0.0};
    TimePoint timestamp{};
};

//==========================================================================================================
// WireRequest
// Purpose: Fully addressed request produced by the RequestBuilder and consumed by protocol adapters.
// Fields:
//   url: Absolute URL without query (request/response) or the server URL (pub/sub).
//   query: Ordered query parameters appended by buildTargetUrl().
//   channel: Substituted channel name (pub/sub only).
//   channelParams: Leftover caller parameters for pub/sub operations.
//==========================================================================================================
struct WireRequest {
    std::string protocol;
    std::string method;
    std::string url;
    std::vector<std::pair<std::string, std::string>> query;
    HeaderList headers;
    std::optional<JSONValue> body;
    std::string channel;
    std::map<std::string, std::string> channelParams;
    unsigned int timeoutMs{30000};
};

struct WireResponse {
    int status{0};
    HeaderList headers;
    JSONValue body;
    std::string rawBody;
    bool structured{false};
};

// Case-insensitive header helpers.
bool iequals(const std::string& a, const std::string& b);
const HeaderKV* findHeader(const HeaderList& headers, const std::string& name);
void setHeader(HeaderList& headers, const std::string& name, const std::string& value);
void setHeaderIfAbsent(HeaderList& headers, const std::string& name, const std::string& value);
bool removeHeader(HeaderList& headers, const std::string& name);

// RFC 3986 percent-encoding of everything outside the unreserved set.
std::string percentEncode(const std::string& s);

// Appends the request's query parameters to its URL.
std::string buildTargetUrl(const WireRequest& request);

// Random identifier in UUID v4 textual form.
std::string generateId();

// ISO-8601 UTC rendering used in envelopes and record dumps.
std::string formatTimestamp(TimePoint tp);

} // namespace apigw
