//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_gateway.cpp
// Purpose: Gateway end to end: registration, REST calls against a loopback HTTP server, auth management,
//          OAuth2 authorization and pub/sub through the loopback broker
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include <utility>

#include <boost/asio.hpp>

#include "apigw/Gateway.hpp"
#include "apigw/errors/Errors.h"
#include "apigw/protocol/LoopbackBroker.hpp"
#include "support/MiniHttpServer.hpp"

using namespace apigw;
using apigw::errors::ErrorKind;
using apigw::errors::GatewayError;
using apigw::test_support::MiniHttpServer;
using apigw::test_support::SeenRequest;
using apigw::test_support::CannedResponse;
using apigw::test_support::jsonResponse;

namespace {

std::string petstore(const std::string& serverUrl) {
    return R"({
  "openapi": "3.0.3",
  "info": {"title": "Petstore", "version": "1.2.0"},
  "servers": [{"url": ")" + serverUrl + R"("}],
  "paths": {
    "/pets": {
      "get": {
        "operationId": "listPets",
        "parameters": [{"name": "limit", "in": "query", "schema": {"type": "integer"}}]
      },
      "post": {
        "operationId": "createPet",
        "requestBody": {"content": {"application/json": {"schema": {"$ref": "#/components/schemas/Pet"}}}}
      }
    },
    "/pets/mine": {
      "get": {"operationId": "myPets"}
    },
    "/pets/{petId}": {
      "get": {
        "operationId": "getPet",
        "parameters": [{"name": "petId", "in": "path", "required": true, "schema": {"type": "integer"}}]
      }
    }
  },
  "components": {
    "schemas": {"Pet": {"type": "object", "properties": {"name": {"type": "string"}}}}
  }
})";
}

const char* kSensors = R"({
  "asyncapi": "2.6.0",
  "info": {"title": "Sensors", "version": "0.9.0"},
  "servers": {"broker": {"url": "broker.local:1883", "protocol": "mqtt"}},
  "channels": {
    "sensors/{room}/temp": {
      "parameters": {"room": {"schema": {"type": "string"}}},
      "bindings": {"mqtt": {}},
      "publish": {"operationId": "reportTemp", "message": {"payload": {"type": "object"}}},
      "subscribe": {"operationId": "watchTemp", "message": {"payload": {"type": "object"}}}
    }
  }
})";

// Records posted token forms and answers with a fixed token response.
class FakeTokenEndpoint final : public auth::ITokenEndpointClient {
public:
    JSONValue PostForm(const std::string& tokenUrl, const auth::FormFields& form, unsigned int) override {
        std::lock_guard<std::mutex> lk(mtx);
        lastUrl = tokenUrl;
        lastForm.clear();
        for (const auto& [k, v] : form) {
            lastForm[k] = v;
        }
        return parseJSON(R"({"access_token": "at-1", "refresh_token": "rt-1", "token_type": "bearer", "expires_in": 3600})");
    }

    std::mutex mtx;
    std::string lastUrl;
    std::map<std::string, std::string> lastForm;
};

std::string queryValue(const std::string& url, const std::string& key) {
    const std::string needle = key + "=";
    std::size_t pos = url.find('?');
    while (pos != std::string::npos) {
        ++pos;
        if (url.compare(pos, needle.size(), needle) == 0) {
            const std::size_t end = url.find('&', pos);
            return url.substr(pos + needle.size(), end == std::string::npos ? std::string::npos : end - pos - needle.size());
        }
        pos = url.find('&', pos);
    }
    return std::string();
}

unsigned short closedPort() {
    boost::asio::io_context io;
    boost::asio::ip::tcp::acceptor a{io, boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)};
    const unsigned short p = a.local_endpoint().port();
    a.close();
    return p;
}

const Endpoint& byOperationId(const std::vector<Endpoint>& eps, const std::string& operationId) {
    for (const auto& ep : eps) {
        if (ep.operationId == operationId) {
            return ep;
        }
    }
    throw std::runtime_error("no endpoint " + operationId);
}

GatewayOptions quietOptions() {
    GatewayOptions o;
    o.logLevel = "ERROR";
    o.httpTimeoutMs = 5000;
    o.connectTimeoutMs = 2000;
    return o;
}

class GatewayTest : public ::testing::Test {
protected:
    void SetUp() override {
        http.route("/v1/pets", [](const SeenRequest& r) {
            if (r.method == "POST") {
                return jsonResponse(201, r.body);
            }
            return jsonResponse(200, R"([{"id": 1, "name": "rex"}])");
        });
        http.route("/v1/pets/42", jsonResponse(200, R"({"id": 42, "name": "tom"})"));
        http.route("/v1/pets/mine", jsonResponse(200, R"([{"id": 7}])"));
        http.start();

        hub = std::make_shared<protocol::LoopbackBroker>();
        gateway = std::make_unique<Gateway>(quietOptions(), nullptr, protocol::MakeLoopbackBrokerFactory(hub));
        reg = gateway->RegisterSpecification("petstore", petstore(http.baseUrl() + "/v1"));
    }

    void TearDown() override {
        gateway->Shutdown();
        http.stop();
    }

    AuthConfig apiKeyConfig(int priority = 5) {
        AuthConfig c;
        c.apiDocumentId = reg.documentId;
        c.scheme = scheme::ApiKey;
        c.priority = priority;
        c.config = parseJSON(R"({"location": "header", "name": "X-API-Key", "value": "k-secret"})");
        return c;
    }

    MiniHttpServer http;
    std::shared_ptr<protocol::LoopbackBroker> hub;
    std::unique_ptr<Gateway> gateway;
    RegistrationResult reg;
};

} // namespace

TEST_F(GatewayTest, RegistrationStoresDocumentAndEndpoints) {
    EXPECT_FALSE(reg.documentId.empty());
    EXPECT_EQ(reg.endpoints.size(), 4u);

    const auto doc = gateway->GetApiDocument(reg.documentId);
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->name, "petstore");
    EXPECT_EQ(doc->version, "1.2.0");
    EXPECT_EQ(doc->specFamily, family::Rest);
    EXPECT_EQ(doc->baseAddress, http.baseUrl() + "/v1");

    const auto eps = gateway->ListEndpoints(reg.documentId);
    ASSERT_EQ(eps.size(), 4u);
    for (const auto& ep : eps) {
        EXPECT_EQ(ep.apiDocumentId, reg.documentId);
        EXPECT_EQ(ep.protocol, protocol::Http);
        EXPECT_TRUE(gateway->GetEndpoint(ep.id).has_value());
    }
    // $ref inside the request body schema was inlined
    const auto& create = byOperationId(eps, "createPet");
    EXPECT_EQ(serializeJSONValue(create.requestSchema).find("$ref"), std::string::npos);
    EXPECT_EQ(gateway->ListApiDocuments().size(), 1u);
}

TEST_F(GatewayTest, RegistrationFailuresStoreNothing) {
    auto kindOf = [&](const std::string& raw, const RegistrationOptions& o = RegistrationOptions()) {
        try {
            gateway->RegisterSpecification("bad", raw, o);
        } catch (const GatewayError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "expected GatewayError";
        return ErrorKind::Internal;
    };
    EXPECT_EQ(kindOf("{not json"), ErrorKind::InvalidSpecification);
    EXPECT_EQ(kindOf(R"({"swagger": "2.0"})"), ErrorKind::UnsupportedFamily);
    EXPECT_EQ(kindOf(R"({"openapi": "3.0.0", "paths": {}})"), ErrorKind::InvalidSpecification);
    EXPECT_EQ(kindOf(R"({"openapi": "3.0.0", "info": {"title": "x", "version": "1"}, "paths": {}})",
                     RegistrationOptions{"graphql", "", ""}),
              ErrorKind::UnsupportedFamily);
    EXPECT_EQ(kindOf(R"({"openapi": "3.0.0", "info": {"title": "x", "version": "1"},
                        "paths": {"/a": {"get": {"responses": {"200": {"$ref": "#/components/responses/Nope"}}}}}})"),
              ErrorKind::MalformedReference);
    EXPECT_EQ(kindOf(R"({"asyncapi": "2.0.0", "info": {"title": "feed", "version": "1"},
                        "channels": {"feed": {"bindings": {"sns": {}}, "publish": {"message": {}}}}})"),
              ErrorKind::UnsupportedProtocol);
    EXPECT_EQ(gateway->ListApiDocuments().size(), 1u);
}

TEST_F(GatewayTest, CallEndpointRecordsStatsAndLogs) {
    const auto& getPet = byOperationId(reg.endpoints, "getPet");
    CallInput in;
    in.params["petId"] = JSONValue(42);
    const CallResult r = gateway->CallEndpoint(getPet.id, in);
    ASSERT_TRUE(r.success) << r.error;
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(r.result.getString("name"), "tom");
    EXPECT_FALSE(r.callLogId.empty());
    EXPECT_EQ(http.lastRequest().target, "/v1/pets/42");

    CallInput missing;
    const CallResult bad = gateway->CallEndpoint(getPet.id, missing);
    EXPECT_FALSE(bad.success);
    EXPECT_EQ(bad.errorKind, "missing_required_parameter");
    EXPECT_EQ(bad.errorDetail, "");

    const auto stored = gateway->GetEndpoint(getPet.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->stats.callCount, 2u);
    EXPECT_EQ(stored->stats.successCount, 1u);
    EXPECT_EQ(stored->stats.errorCount, 1u);

    const auto logs = gateway->ListCallLogs(getPet.id);
    ASSERT_EQ(logs.size(), 2u);
    EXPECT_EQ(logs[0].id, bad.callLogId);
    EXPECT_EQ(logs[0].errorKind, "missing_required_parameter");
    EXPECT_EQ(logs[0].request.getString("address"), "/pets/{petId}");
    EXPECT_EQ(logs[1].id, r.callLogId);
    EXPECT_EQ(logs[1].status, 200);
    EXPECT_TRUE(logs[1].success);
    EXPECT_EQ(gateway->ListCallLogs(getPet.id, 1).size(), 1u);
}

TEST_F(GatewayTest, PostSendsJsonBody) {
    const auto& create = byOperationId(reg.endpoints, "createPet");
    CallInput in;
    in.body = parseJSON(R"({"name": "kit"})");
    const CallResult r = gateway->CallEndpoint(create.id, in);
    ASSERT_TRUE(r.success) << r.error;
    EXPECT_EQ(r.status, 201);
    EXPECT_EQ(r.result.getString("name"), "kit");
    EXPECT_EQ(http.lastRequest().method, "POST");
    EXPECT_EQ(http.lastRequest().headers["content-type"], "application/json");
}

TEST_F(GatewayTest, UnknownEndpointIsNotLogged) {
    const CallResult r = gateway->CallEndpoint("no-such-endpoint", CallInput());
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.errorKind, "endpoint_not_found");
    EXPECT_TRUE(r.callLogId.empty());
    EXPECT_TRUE(gateway->ListCallLogs("no-such-endpoint").empty());
}

TEST_F(GatewayTest, CallByAddressPrefersLiteralPattern) {
    CallResult mine = gateway->CallByAddress("/pets/mine", "GET", reg.documentId, CallInput());
    ASSERT_TRUE(mine.success) << mine.error;
    EXPECT_EQ(http.lastRequest().target, "/v1/pets/mine");

    CallResult pet = gateway->CallByAddress("/pets/42", "get", reg.documentId, CallInput());
    ASSERT_TRUE(pet.success) << pet.error;
    EXPECT_EQ(pet.result.getString("name"), "tom");

    CallResult listed = gateway->CallByAddress("/pets?limit=3", "get", reg.documentId, CallInput());
    ASSERT_TRUE(listed.success) << listed.error;
    EXPECT_EQ(http.lastRequest().target, "/v1/pets?limit=3");

    CallResult none = gateway->CallByAddress("/owners/1", "get", reg.documentId, CallInput());
    EXPECT_FALSE(none.success);
    EXPECT_EQ(none.errorKind, "endpoint_not_found");
}

TEST_F(GatewayTest, ApiKeyIsAppliedAndRedactedInLogs) {
    const AuthConfig added = gateway->AddAuthConfig(apiKeyConfig());
    EXPECT_FALSE(added.id.empty());
    ASSERT_EQ(gateway->ListAuthConfigs(reg.documentId).size(), 1u);

    const auto& list = byOperationId(reg.endpoints, "listPets");
    const CallResult r = gateway->CallEndpoint(list.id, CallInput());
    ASSERT_TRUE(r.success) << r.error;
    EXPECT_EQ(http.lastRequest().headers["x-api-key"], "k-secret");

    const auto logs = gateway->ListCallLogs(list.id);
    ASSERT_EQ(logs.size(), 1u);
    const JSONValue* headers = logs[0].request.find("headers");
    ASSERT_NE(headers, nullptr);
    EXPECT_EQ(headers->getString("X-API-Key"), "[REDACTED]");
    EXPECT_EQ(serializeJSONValue(logs[0].request).find("k-secret"), std::string::npos);

    EXPECT_TRUE(gateway->RemoveAuthConfig(added.id));
    EXPECT_TRUE(gateway->ListAuthConfigs(reg.documentId).empty());
}

TEST_F(GatewayTest, AddAuthConfigValidation) {
    AuthConfig unknownScheme = apiKeyConfig();
    unknownScheme.scheme = "kerberos";
    EXPECT_THROW(gateway->AddAuthConfig(unknownScheme), GatewayError);

    AuthConfig unknownDoc = apiKeyConfig();
    unknownDoc.apiDocumentId = "missing-doc";
    EXPECT_THROW(gateway->AddAuthConfig(unknownDoc), GatewayError);

    AuthConfig oauthWithoutToken;
    oauthWithoutToken.apiDocumentId = reg.documentId;
    oauthWithoutToken.scheme = scheme::OAuth2;
    oauthWithoutToken.config = parseJSON(R"({"client_id": "c", "authorization_url": "https://idp/authorize"})");
    EXPECT_THROW(gateway->AddAuthConfig(oauthWithoutToken), GatewayError);
    EXPECT_TRUE(gateway->ListAuthConfigs(reg.documentId).empty());
}

TEST_F(GatewayTest, OAuth2AuthorizationThenAuthenticatedCall) {
    auto tokens = std::make_shared<FakeTokenEndpoint>();
    gateway->SetTokenEndpointClient(tokens);

    AuthConfig oauth;
    oauth.apiDocumentId = reg.documentId;
    oauth.scheme = scheme::OAuth2;
    oauth.priority = 10;
    oauth.config = parseJSON(R"({
        "client_id": "gw-client",
        "client_secret": "gw-secret",
        "authorization_url": "https://idp.example.com/authorize",
        "token_url": "https://idp.example.com/token",
        "redirect_uri": "https://app.example.com/callback"
    })");
    gateway->AddAuthConfig(oauth);
    gateway->AddAuthConfig(apiKeyConfig(1));

    const auto& list = byOperationId(reg.endpoints, "listPets");
    CallInput alice;
    alice.userId = "alice";

    // Not yet authorized: the lower-priority api key is used instead
    ASSERT_TRUE(gateway->CallEndpoint(list.id, alice).success);
    EXPECT_EQ(http.lastRequest().headers["x-api-key"], "k-secret");
    EXPECT_EQ(http.lastRequest().headers.count("authorization"), 0u);

    const auth::AuthorizationStart start = gateway->BeginAuthorization("alice", reg.documentId);
    EXPECT_EQ(start.authorizationUrl.rfind("https://idp.example.com/authorize?", 0), 0u);
    const std::string state = queryValue(start.authorizationUrl, "state");
    ASSERT_FALSE(state.empty());

    const UserAuthorization granted = gateway->CompleteAuthorization(start.stateId, "code-1", state);
    EXPECT_EQ(granted.accessToken, "at-1");
    EXPECT_EQ(tokens->lastForm["code"], "code-1");
    EXPECT_EQ(tokens->lastForm["grant_type"], "authorization_code");

    ASSERT_TRUE(gateway->CallEndpoint(list.id, alice).success);
    EXPECT_EQ(http.lastRequest().headers["authorization"], "Bearer at-1");
    EXPECT_EQ(http.lastRequest().headers.count("x-api-key"), 0u);

    // The state was single use
    try {
        gateway->CompleteAuthorization(start.stateId, "code-1", state);
        FAIL() << "expected InvalidState";
    } catch (const GatewayError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidState);
    }

    const UserAuthorization refreshed = gateway->RefreshAuthorization("alice", reg.documentId);
    EXPECT_EQ(refreshed.accessToken, "at-1");
    EXPECT_EQ(tokens->lastForm["grant_type"], "refresh_token");
    EXPECT_EQ(gateway->PurgeExpiredAuthStates(), 1u);
}

TEST_F(GatewayTest, ConnectionFailureIsReported) {
    RegistrationOptions o;
    o.baseAddress = "http://127.0.0.1:" + std::to_string(closedPort());
    const auto offline = gateway->RegisterSpecification("offline", petstore("http://unused.invalid"), o);
    const CallResult r = gateway->CallEndpoint(byOperationId(offline.endpoints, "myPets").id, CallInput());
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.errorKind, "transport_connection");
    EXPECT_EQ(r.errorDetail, errors::reasons::ConnectionRefused);
    EXPECT_FALSE(r.callLogId.empty());
}

TEST_F(GatewayTest, PubSubSubscribeAndPublishThroughBroker) {
    const auto sensors = gateway->RegisterSpecification("sensors", kSensors);
    ASSERT_EQ(sensors.endpoints.size(), 2u);
    const auto doc = gateway->GetApiDocument(sensors.documentId);
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->specFamily, family::PubSub);

    std::mutex mtx;
    std::condition_variable cv;
    std::vector<protocol::InboundMessage> inbox;

    CallInput room;
    room.params["room"] = JSONValue("kitchen");
    const std::string sub = gateway->Subscribe(byOperationId(sensors.endpoints, "watchTemp").id, room,
                                               [&](const protocol::InboundMessage& m) {
                                                   std::lock_guard<std::mutex> lk(mtx);
                                                   inbox.push_back(m);
                                                   cv.notify_all();
                                               });
    ASSERT_FALSE(sub.empty());
    EXPECT_EQ(hub->SubscriberCount("mqtt://broker.local:1883", "sensors/kitchen/temp"), 1u);

    CallInput publish = room;
    publish.body = parseJSON(R"({"celsius": 21.5})");
    const CallResult sent = gateway->CallEndpoint(byOperationId(sensors.endpoints, "reportTemp").id, publish);
    ASSERT_TRUE(sent.success) << sent.error;
    EXPECT_EQ(sent.status, 200);
    EXPECT_EQ(sent.result.getString("status"), "sent");
    EXPECT_FALSE(sent.result.getString("messageId").empty());

    {
        std::unique_lock<std::mutex> lk(mtx);
        ASSERT_TRUE(cv.wait_for(lk, std::chrono::seconds(2), [&] { return !inbox.empty(); }));
        EXPECT_EQ(inbox.front().subscriptionId, sub);
        EXPECT_EQ(inbox.front().channel, "sensors/kitchen/temp");
        EXPECT_NE(inbox.front().raw.find("21.5"), std::string::npos);
    }

    EXPECT_TRUE(gateway->Unsubscribe(sub));
    EXPECT_FALSE(gateway->Unsubscribe(sub));
    EXPECT_EQ(hub->SubscriberCount("mqtt://broker.local:1883", "sensors/kitchen/temp"), 0u);

    try {
        gateway->Subscribe(byOperationId(sensors.endpoints, "reportTemp").id, room, protocol::MessageHandler());
        FAIL() << "expected InvalidConfiguration";
    } catch (const GatewayError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidConfiguration);
    }
}

TEST_F(GatewayTest, UnregisterRemovesEndpoints) {
    const std::string endpointId = reg.endpoints.front().id;
    EXPECT_TRUE(gateway->UnregisterDocument(reg.documentId));
    EXPECT_FALSE(gateway->UnregisterDocument(reg.documentId));
    EXPECT_TRUE(gateway->ListApiDocuments().empty());
    EXPECT_TRUE(gateway->ListEndpoints(reg.documentId).empty());
    const CallResult r = gateway->CallEndpoint(endpointId, CallInput());
    EXPECT_EQ(r.errorKind, "endpoint_not_found");
}

TEST_F(GatewayTest, ShutdownStopsAdapters) {
    EXPECT_NE(gateway->AdapterFor(protocol::Http), nullptr);
    EXPECT_EQ(gateway->AdapterFor("gopher"), nullptr);
    gateway->Shutdown();
    const CallResult r = gateway->CallEndpoint(byOperationId(reg.endpoints, "myPets").id, CallInput());
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.errorKind, "transport_connection");
}
