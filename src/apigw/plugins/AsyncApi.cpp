//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/apigw/plugins/AsyncApi.cpp
// Purpose: AsyncAPI 2.x model validation, channel extraction and pub/sub execution
//==========================================================================================================

#include <algorithm>

#include "logging/Logger.h"
#include "apigw/errors/Errors.h"
#include "apigw/plugins/AsyncApi.hpp"
#include "apigw/plugins/OpenApi.hpp"

namespace apigw::plugins {

using errors::ErrorKind;
using errors::GatewayError;

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> sortedKeys(const JSONValue& obj) {
    std::vector<std::string> keys;
    if (obj.isObject()) {
        for (const auto& kv : obj.asObject()) {
            keys.push_back(kv.first);
        }
        std::sort(keys.begin(), keys.end());
    }
    return keys;
}

std::string protocolFromBindings(const JSONValue* bindings) {
    if (!bindings || !bindings->isObject()) {
        return protocol::Unknown;
    }
    for (const auto& key : sortedKeys(*bindings)) {
        std::string p = protocolFromBinding(key);
        if (p != protocol::Unknown) {
            return p;
        }
    }
    return protocol::Unknown;
}

JSONValue requestSchemaFrom(const JSONValue& op) {
    const JSONValue* message = op.find("message");
    if (!message || !message->isObject()) {
        return JSONValue();
    }
    JSONValue schema = JSONValue::object();
    const JSONValue* payload = message->find("payload");
    schema.set("payload", payload ? *payload : JSONValue::object());
    if (const JSONValue* headers = message->find("headers")) {
        schema.set("headers", *headers);
    }
    schema.set("contentType", JSONValue(message->getString("contentType", "application/json")));
    for (const char* key : {"name", "title", "summary", "description"}) {
        if (const JSONValue* v = message->find(key); v && v->isString()) {
            schema.set(key, *v);
        }
    }
    if (const JSONValue* oneOf = message->find("oneOf")) {
        schema.set("oneOf", *oneOf);
    }
    return schema;
}

bool hasRequirement(const std::vector<SecurityRequirement>& list, const std::string& name) {
    return std::any_of(list.begin(), list.end(), [&](const SecurityRequirement& s) { return s.name == name; });
}

} // namespace

std::string protocolFromBinding(const std::string& bindingKey) {
    const std::string key = lower(bindingKey);
    if (key == "websockets" || key == "ws") return protocol::WebSocket;
    if (key == "mqtt") return protocol::Mqtt;
    if (key == "amqp") return protocol::Amqp;
    if (key == "kafka") return protocol::Kafka;
    if (key == "nats") return protocol::Nats;
    return protocol::Unknown;
}

std::string protocolFromServerScheme(const std::string& serverProtocol) {
    const std::string p = lower(serverProtocol);
    if (p == "ws" || p == "wss" || p == "websocket" || p == "websockets") return protocol::WebSocket;
    if (p == "mqtt" || p == "mqtts" || p == "secure-mqtt") return protocol::Mqtt;
    if (p == "amqp" || p == "amqps") return protocol::Amqp;
    if (p == "kafka" || p == "kafka-secure") return protocol::Kafka;
    if (p == "nats" || p == "nats-secure") return protocol::Nats;
    if (p == "http" || p == "https") return protocol::Http;
    return protocol::Unknown;
}

//==========================================================================================================
// AsyncApiModel
//==========================================================================================================
AsyncApiModel::AsyncApiModel(JSONValue resolvedDocument) : doc(std::move(resolvedDocument)) {}

std::string AsyncApiModel::Family() const { return family::PubSub; }

void AsyncApiModel::Validate() const {
    if (!doc.isObject()) {
        throw errors::invalidSpecification("$", "document must be a JSON object");
    }
    const JSONValue* version = doc.find("asyncapi");
    if (!version || !version->isString() || version->asString().rfind("2.", 0) != 0) {
        throw errors::invalidSpecification("asyncapi", "'asyncapi' must be a 2.x version string");
    }
    const JSONValue* info = doc.find("info");
    if (!info || !info->isObject()) {
        throw errors::invalidSpecification("info", "'info' object is required");
    }
    const JSONValue* title = info->find("title");
    if (!title || !title->isString() || title->asString().empty()) {
        throw errors::invalidSpecification("info.title", "'info.title' is required");
    }
    const JSONValue* channels = doc.find("channels");
    if (!channels || !channels->isObject()) {
        throw errors::invalidSpecification("channels", "'channels' object is required");
    }
}

std::string AsyncApiModel::Title() const {
    const JSONValue* info = doc.find("info");
    return info ? info->getString("title") : std::string();
}

std::string AsyncApiModel::Version() const {
    const JSONValue* info = doc.find("info");
    return info ? info->getString("version") : std::string();
}

std::vector<ServerInfo> AsyncApiModel::Servers() const {
    std::vector<ServerInfo> out;
    const JSONValue* servers = doc.find("servers");
    if (!servers || !servers->isObject()) {
        return out;
    }
    for (const auto& name : sortedKeys(*servers)) {
        const JSONValue* s = servers->find(name);
        if (!s || !s->isObject() || s->getString("url").empty()) {
            continue;
        }
        ServerInfo info;
        info.name = name;
        const std::string scheme = s->getString("protocol");
        const JSONValue* vars = s->find("variables");
        info.url = vars ? detail::substituteServerVariables(s->getString("url"), *vars) : s->getString("url");
        // AsyncAPI server urls frequently omit the scheme
        if (info.url.find("://") == std::string::npos && !scheme.empty()) {
            info.url = lower(scheme) + "://" + info.url;
        }
        info.protocol = protocolFromServerScheme(scheme);
        info.description = s->getString("description");
        out.push_back(std::move(info));
    }
    return out;
}

JSONValue AsyncApiModel::SecuritySchemes() const {
    const JSONValue* components = doc.find("components");
    const JSONValue* schemes = components ? components->find("securitySchemes") : nullptr;
    return (schemes && schemes->isObject()) ? *schemes : JSONValue::object();
}

JSONValue AsyncApiModel::Operations() const {
    const JSONValue* channels = doc.find("channels");
    return channels ? *channels : JSONValue::object();
}

//==========================================================================================================
// AsyncApiParser
//==========================================================================================================
bool AsyncApiParser::CanParse(const JSONValue& rawDocument) const {
    const JSONValue* marker = rawDocument.find("asyncapi");
    return marker && marker->isString();
}

std::vector<Endpoint> AsyncApiParser::ExtractEndpoints(const spec::ISpecModel& model) const {
    FUNC_SCOPE();
    std::vector<Endpoint> endpoints;
    const JSONValue channels = model.Operations();
    const JSONValue schemes = model.SecuritySchemes();
    const auto servers = model.Servers();
    const JSONValue* rawServers = model.Document().find("servers");

    for (const auto& channel : sortedKeys(channels)) {
        const JSONValue* item = channels.find(channel);
        if (!item || !item->isObject()) {
            continue;
        }
        std::vector<Parameter> params;
        if (const JSONValue* defs = item->find("parameters"); defs && defs->isObject()) {
            for (const auto& name : sortedKeys(*defs)) {
                const JSONValue* def = defs->find(name);
                Parameter p;
                p.name = name;
                p.location = "channel";
                p.required = def ? def->getBool("required", false) : false;
                const JSONValue* schema = def ? def->find("schema") : nullptr;
                p.schema = schema ? *schema : JSONValue::object();
                p.description = def ? def->getString("description") : std::string();
                params.push_back(std::move(p));
            }
        }
        const std::string channelProtocol = protocolFromBindings(item->find("bindings"));

        for (const char* kind : {"publish", "subscribe"}) {
            const JSONValue* op = item->find(kind);
            if (!op || !op->isObject()) {
                continue;
            }
            Endpoint ep;
            ep.addressPattern = channel;
            ep.protocol = channelProtocol != protocol::Unknown ? channelProtocol : protocolFromBindings(op->find("bindings"));
            ep.operationKind = kind;
            ep.operationId = op->getString("operationId");
            ep.description = op->getString("summary");
            if (ep.description.empty()) {
                ep.description = op->getString("description");
            }
            ep.parameters = params;
            ep.requestSchema = requestSchemaFrom(*op);
            if (const JSONValue* tags = op->find("tags")) {
                ep.tags = detail::tagsFromJson(*tags);
            }
            for (const auto& server : servers) {
                if (server.protocol != ep.protocol) {
                    continue;
                }
                ep.servers.push_back(server);
                const JSONValue* raw = rawServers ? rawServers->find(server.name) : nullptr;
                const JSONValue* security = raw ? raw->find("security") : nullptr;
                if (!security) {
                    continue;
                }
                for (auto& req : detail::expandSecurity(*security, schemes)) {
                    if (!hasRequirement(ep.securityRequirements, req.name)) {
                        ep.securityRequirements.push_back(std::move(req));
                    }
                }
            }
            endpoints.push_back(std::move(ep));
        }
    }
    LOG_DEBUG("AsyncApiParser: extracted {} endpoints from '{}'", endpoints.size(), model.Title());
    return endpoints;
}

//==========================================================================================================
// PubSubExecutor
//==========================================================================================================
spec::ExecutionResult PubSubExecutor::Execute(const Endpoint& endpoint, const WireRequest& request,
                                              protocol::IProtocolAdapter& adapter, const spec::ExecutionContext& ctx) {
    auto* ps = dynamic_cast<protocol::IPubSubAdapter*>(&adapter);
    if (!ps) {
        throw GatewayError(ErrorKind::UnsupportedProtocol,
                           "Adapter for " + adapter.Protocol() + " cannot execute publish/subscribe operations",
                           endpoint.protocol);
    }
    if (request.url.empty()) {
        throw GatewayError(ErrorKind::InvalidConfiguration,
                           "No server address available for channel " + request.channel, endpoint.id);
    }

    protocol::ServerConfig server;
    server.protocol = endpoint.protocol;
    server.url = request.url;
    server.headers = request.headers;
    server.connectTimeoutMs = ctx.connectTimeoutMs;

    spec::ExecutionResult result;
    result.connectionId = ps->Connect(server);

    JSONValue body = JSONValue::object();
    body.set("channel", JSONValue(request.channel));
    body.set("protocol", JSONValue(endpoint.protocol));

    if (endpoint.operationKind == "subscribe") {
        protocol::MessageHandler handler = ctx.handler;
        if (!handler) {
            handler = [](const protocol::InboundMessage& msg) {
                LOG_INFO("Inbound message on {} (subscription {}): {}", msg.channel, msg.subscriptionId, msg.raw);
            };
        }
        result.subscriptionId = ps->Subscribe(result.connectionId, request.channel, std::move(handler));
        body.set("subscriptionId", JSONValue(result.subscriptionId));
        body.set("status", JSONValue("subscribed"));
    } else {
        HeaderList envelopeHeaders;
        for (const auto& h : request.headers) {
            if (iequals(h.name, "Authorization") || iequals(h.name, "Proxy-Authorization") || iequals(h.name, "Cookie")) {
                continue;
            }
            envelopeHeaders.push_back(h);
        }
        for (const auto& [name, value] : request.channelParams) {
            setHeaderIfAbsent(envelopeHeaders, name, value);
        }
        const std::string messageId = ps->Publish(result.connectionId, request.channel,
                                                  request.body ? *request.body : JSONValue(), envelopeHeaders);
        body.set("messageId", JSONValue(messageId));
        body.set("status", JSONValue("sent"));
    }

    result.response.status = 200;
    result.response.body = std::move(body);
    result.response.rawBody = serializeJSONValue(result.response.body);
    result.response.structured = true;
    return result;
}

} // namespace apigw::plugins
