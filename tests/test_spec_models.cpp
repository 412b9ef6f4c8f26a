//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_spec_models.cpp
// Purpose: OpenAPI / AsyncAPI validation and endpoint extraction
//==========================================================================================================

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>
#include <string>

#include "apigw/errors/Errors.h"
#include "apigw/plugins/AsyncApi.hpp"
#include "apigw/plugins/OpenApi.hpp"
#include "apigw/resolve/RefResolver.hpp"

using namespace apigw;
using apigw::errors::ErrorKind;
using apigw::errors::GatewayError;
using apigw::plugins::AsyncApiModel;
using apigw::plugins::AsyncApiParser;
using apigw::plugins::OpenApiModel;
using apigw::plugins::OpenApiParser;

namespace {

const char* kPetstore = R"({
  "openapi": "3.0.3",
  "info": {"title": "Petstore", "version": "1.2.0"},
  "servers": [{"url": "https://{region}.example.com/v1", "variables": {"region": {"default": "eu"}}}],
  "security": [{"apiKey": []}],
  "components": {
    "securitySchemes": {
      "apiKey": {"type": "apiKey", "in": "header", "name": "X-API-Key"},
      "oauth": {"type": "oauth2"}
    },
    "schemas": {"Pet": {"type": "object", "properties": {"name": {"type": "string"}}}}
  },
  "paths": {
    "/pets": {
      "get": {"operationId": "listPets", "summary": "List pets", "tags": ["pets"],
              "parameters": [{"name": "limit", "in": "query", "schema": {"type": "integer"}}],
              "responses": {"200": {"description": "ok"}}},
      "post": {"operationId": "createPet", "description": "Create a pet",
               "security": [{"oauth": ["write"]}],
               "requestBody": {"required": true,
                               "content": {"application/json": {"schema": {"$ref": "#/components/schemas/Pet"}}}},
               "responses": {"201": {"description": "created"}}}
    },
    "/pets/{petId}": {
      "parameters": [{"name": "petId", "in": "path", "schema": {"type": "string"}, "description": "path level"}],
      "get": {"operationId": "getPet",
              "parameters": [{"name": "petId", "in": "path", "schema": {"type": "integer"}, "description": "op level"}],
              "responses": {"200": {"description": "ok"}}},
      "delete": {"operationId": "deletePet", "responses": {"204": {"description": "gone"}}},
      "x-extension": {"ignored": true}
    }
  }
})";

const char* kChat = R"({
  "asyncapi": "2.6.0",
  "info": {"title": "Chat", "version": "0.1.0"},
  "servers": {
    "live": {"url": "chat.example.com/ws", "protocol": "wss", "security": [{"token": []}]},
    "events": {"url": "mqtt://broker.example.com:1883", "protocol": "mqtt"}
  },
  "components": {"securitySchemes": {"token": {"type": "httpApiKey", "in": "query", "name": "token"}}},
  "channels": {
    "rooms/{roomId}/messages": {
      "parameters": {"roomId": {"schema": {"type": "string"}, "required": true}},
      "bindings": {"ws": {}},
      "publish": {"operationId": "sendMessage",
                  "message": {"name": "ChatMessage", "payload": {"type": "object"}}},
      "subscribe": {"operationId": "onMessage",
                    "message": {"payload": {"type": "object"}, "contentType": "text/plain"}}
    },
    "sensors/temperature": {
      "bindings": {"mqtt": {"qos": 1}},
      "subscribe": {"summary": "Temperature readings"}
    },
    "legacy/feed": {
      "bindings": {"sns": {}},
      "publish": {}
    }
  }
})";

JSONValue resolved(const char* text) {
    return resolve::RefResolver().Resolve(parseJSON(text));
}

const Endpoint& findEndpoint(const std::vector<Endpoint>& eps, const std::string& pattern, const std::string& kind) {
    auto it = std::find_if(eps.begin(), eps.end(), [&](const Endpoint& e) {
        return e.addressPattern == pattern && e.operationKind == kind;
    });
    if (it == eps.end()) {
        throw std::runtime_error("endpoint not found: " + kind + " " + pattern);
    }
    return *it;
}

std::string validationField(const std::string& text, bool asyncApi) {
    JSONValue doc = parseJSON(text);
    try {
        if (asyncApi) {
            AsyncApiModel(doc).Validate();
        } else {
            OpenApiModel(doc).Validate();
        }
    } catch (const GatewayError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidSpecification);
        return e.field();
    }
    return std::string();
}

} // namespace

TEST(OpenApiModel, ValidationNamesFirstMissingField) {
    EXPECT_EQ(validationField(R"({"info": {"title": "t"}, "paths": {}})", false), "openapi");
    EXPECT_EQ(validationField(R"({"openapi": "2.0", "info": {"title": "t"}, "paths": {}})", false), "openapi");
    EXPECT_EQ(validationField(R"({"openapi": "3.1.0", "paths": {}})", false), "info");
    EXPECT_EQ(validationField(R"({"openapi": "3.1.0", "info": {}, "paths": {}})", false), "info.title");
    EXPECT_EQ(validationField(R"({"openapi": "3.1.0", "info": {"title": "t"}})", false), "paths");
    EXPECT_EQ(validationField(R"({"openapi": "3.1.0", "info": {"title": "t"}, "paths": {}})", false), "");
}

TEST(OpenApiModel, ServersSubstituteVariableDefaults) {
    OpenApiModel model(resolved(kPetstore));
    auto servers = model.Servers();
    ASSERT_EQ(servers.size(), 1u);
    EXPECT_EQ(servers[0].url, "https://eu.example.com/v1");
    EXPECT_EQ(servers[0].protocol, "http");
    EXPECT_EQ(model.Title(), "Petstore");
    EXPECT_EQ(model.Version(), "1.2.0");
}

TEST(OpenApiParser, ExtractsOneEndpointPerPathAndVerb) {
    OpenApiModel model(resolved(kPetstore));
    auto eps = OpenApiParser().ExtractEndpoints(model);
    ASSERT_EQ(eps.size(), 4u);
    for (const auto& ep : eps) {
        EXPECT_EQ(ep.protocol, "http");
    }
    EXPECT_EQ(findEndpoint(eps, "/pets", "get").operationId, "listPets");
    EXPECT_EQ(findEndpoint(eps, "/pets", "post").operationId, "createPet");
    EXPECT_EQ(findEndpoint(eps, "/pets/{petId}", "delete").operationId, "deletePet");
}

TEST(OpenApiParser, EndpointCountIsPathsTimesVerbs) {
    JSONValue doc = parseJSON(R"({"openapi": "3.0.0", "info": {"title": "grid"}, "paths": {}})");
    JSONValue paths = JSONValue::object();
    const std::vector<std::string> verbs = {"get", "put", "patch"};
    for (int i = 0; i < 5; ++i) {
        JSONValue item = JSONValue::object();
        for (const auto& v : verbs) {
            item.set(v, parseJSON(R"({"responses": {}})"));
        }
        paths.set("/r" + std::to_string(i), item);
    }
    doc.set("paths", paths);
    EXPECT_EQ(OpenApiParser().ExtractEndpoints(OpenApiModel(doc)).size(), 15u);
}

TEST(OpenApiParser, OperationParametersOverridePathParameters) {
    auto eps = OpenApiParser().ExtractEndpoints(OpenApiModel(resolved(kPetstore)));
    const Endpoint& get = findEndpoint(eps, "/pets/{petId}", "get");
    ASSERT_EQ(get.parameters.size(), 1u);
    EXPECT_EQ(get.parameters[0].description, "op level");
    EXPECT_EQ(get.parameters[0].schema.getString("type"), "integer");
    EXPECT_TRUE(get.parameters[0].required);

    const Endpoint& del = findEndpoint(eps, "/pets/{petId}", "delete");
    ASSERT_EQ(del.parameters.size(), 1u);
    EXPECT_EQ(del.parameters[0].description, "path level");
}

TEST(OpenApiParser, RequestAndResponseSchemas) {
    auto eps = OpenApiParser().ExtractEndpoints(OpenApiModel(resolved(kPetstore)));
    const Endpoint& post = findEndpoint(eps, "/pets", "post");
    EXPECT_TRUE(post.requestSchema.getBool("required"));
    JSONValue schema = resolve::RefResolver::ResolvePointer(post.requestSchema, "#/content/application~1json");
    EXPECT_EQ(schema.getString("type"), "object");
    EXPECT_EQ(post.responseSchema.find("201")->getString("description"), "created");
    EXPECT_EQ(post.description, "Create a pet");

    const Endpoint& list = findEndpoint(eps, "/pets", "get");
    EXPECT_TRUE(list.requestSchema.isNull());
    EXPECT_EQ(list.description, "List pets");
    ASSERT_EQ(list.tags.size(), 1u);
    EXPECT_EQ(list.tags[0], "pets");
}

TEST(OpenApiParser, SecurityFallsBackToDocumentLevel) {
    auto eps = OpenApiParser().ExtractEndpoints(OpenApiModel(resolved(kPetstore)));
    const Endpoint& list = findEndpoint(eps, "/pets", "get");
    ASSERT_EQ(list.securityRequirements.size(), 1u);
    EXPECT_EQ(list.securityRequirements[0].name, "apiKey");
    EXPECT_EQ(list.securityRequirements[0].type, "apiKey");

    const Endpoint& create = findEndpoint(eps, "/pets", "post");
    ASSERT_EQ(create.securityRequirements.size(), 1u);
    EXPECT_EQ(create.securityRequirements[0].name, "oauth");
    EXPECT_EQ(create.securityRequirements[0].type, "oauth2");
    ASSERT_EQ(create.securityRequirements[0].scopes.size(), 1u);
    EXPECT_EQ(create.securityRequirements[0].scopes[0], "write");
}

TEST(OpenApiParser, DetectsOnlyOpenApiDocuments) {
    EXPECT_TRUE(OpenApiParser().CanParse(parseJSON(kPetstore)));
    EXPECT_FALSE(OpenApiParser().CanParse(parseJSON(kChat)));
    EXPECT_FALSE(AsyncApiParser().CanParse(parseJSON(kPetstore)));
    EXPECT_TRUE(AsyncApiParser().CanParse(parseJSON(kChat)));
}

TEST(AsyncApiModel, ValidationNamesFirstMissingField) {
    EXPECT_EQ(validationField(R"({"info": {"title": "t"}, "channels": {}})", true), "asyncapi");
    EXPECT_EQ(validationField(R"({"asyncapi": "3.0.0", "info": {"title": "t"}, "channels": {}})", true), "asyncapi");
    EXPECT_EQ(validationField(R"({"asyncapi": "2.0.0", "channels": {}})", true), "info");
    EXPECT_EQ(validationField(R"({"asyncapi": "2.0.0", "info": {"version": "1"}, "channels": {}})", true), "info.title");
    EXPECT_EQ(validationField(R"({"asyncapi": "2.0.0", "info": {"title": "t"}})", true), "channels");
}

TEST(AsyncApiModel, ServersGetSchemeAndProtocol) {
    auto servers = AsyncApiModel(resolved(kChat)).Servers();
    ASSERT_EQ(servers.size(), 2u);
    EXPECT_EQ(servers[0].name, "events");
    EXPECT_EQ(servers[0].protocol, "mqtt");
    EXPECT_EQ(servers[0].url, "mqtt://broker.example.com:1883");
    EXPECT_EQ(servers[1].name, "live");
    EXPECT_EQ(servers[1].protocol, "websocket");
    EXPECT_EQ(servers[1].url, "wss://chat.example.com/ws");
}

TEST(AsyncApiParser, ExtractsChannelOperations) {
    auto eps = AsyncApiParser().ExtractEndpoints(AsyncApiModel(resolved(kChat)));
    ASSERT_EQ(eps.size(), 4u);

    const Endpoint& send = findEndpoint(eps, "rooms/{roomId}/messages", "publish");
    EXPECT_EQ(send.protocol, "websocket");
    ASSERT_EQ(send.parameters.size(), 1u);
    EXPECT_EQ(send.parameters[0].location, "channel");
    EXPECT_TRUE(send.parameters[0].required);
    EXPECT_EQ(send.requestSchema.getString("name"), "ChatMessage");
    EXPECT_EQ(send.requestSchema.getString("contentType"), "application/json");
    ASSERT_EQ(send.servers.size(), 1u);
    EXPECT_EQ(send.servers[0].name, "live");
    ASSERT_EQ(send.securityRequirements.size(), 1u);
    EXPECT_EQ(send.securityRequirements[0].name, "token");

    const Endpoint& receive = findEndpoint(eps, "rooms/{roomId}/messages", "subscribe");
    EXPECT_EQ(receive.requestSchema.getString("contentType"), "text/plain");

    const Endpoint& temp = findEndpoint(eps, "sensors/temperature", "subscribe");
    EXPECT_EQ(temp.protocol, "mqtt");
    EXPECT_EQ(temp.description, "Temperature readings");
    ASSERT_EQ(temp.servers.size(), 1u);
    EXPECT_EQ(temp.servers[0].url, "mqtt://broker.example.com:1883");
    EXPECT_TRUE(temp.securityRequirements.empty());

    EXPECT_EQ(findEndpoint(eps, "legacy/feed", "publish").protocol, "unknown");
}

TEST(AsyncApiParser, ProtocolNameMappings) {
    EXPECT_EQ(plugins::protocolFromBinding("websockets"), "websocket");
    EXPECT_EQ(plugins::protocolFromBinding("KAFKA"), "kafka");
    EXPECT_EQ(plugins::protocolFromBinding("http"), "unknown");
    EXPECT_EQ(plugins::protocolFromServerScheme("mqtts"), "mqtt");
    EXPECT_EQ(plugins::protocolFromServerScheme("amqps"), "amqp");
    EXPECT_EQ(plugins::protocolFromServerScheme("nats-secure"), "nats");
    EXPECT_EQ(plugins::protocolFromServerScheme("wss"), "websocket");
    EXPECT_EQ(plugins::protocolFromServerScheme("stomp"), "unknown");
}
