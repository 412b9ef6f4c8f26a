//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/apigw/plugins/OpenApi.cpp
// Purpose: OpenAPI 3.x model validation, endpoint extraction and REST execution
//==========================================================================================================

#include <algorithm>

#include "logging/Logger.h"
#include "apigw/errors/Errors.h"
#include "apigw/plugins/OpenApi.hpp"

namespace apigw::plugins {

using errors::ErrorKind;
using errors::GatewayError;

namespace {

std::vector<std::string> sortedKeys(const JSONValue& obj) {
    std::vector<std::string> keys;
    if (!obj.isObject()) {
        return keys;
    }
    keys.reserve(obj.asObject().size());
    for (const auto& kv : obj.asObject()) {
        keys.push_back(kv.first);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

std::vector<Parameter> parametersFromArray(const JSONValue* arr) {
    std::vector<Parameter> out;
    if (!arr || !arr->isArray()) {
        return out;
    }
    for (const auto& p : arr->asArray()) {
        if (p && p->isObject() && !p->getString("name").empty()) {
            out.push_back(detail::parameterFromJson(*p, "query"));
        }
    }
    return out;
}

JSONValue contentSchemas(const JSONValue* content) {
    JSONValue out = JSONValue::object();
    if (!content || !content->isObject()) {
        return out;
    }
    for (const auto& [contentType, media] : content->asObject()) {
        const JSONValue* schema = media ? media->find("schema") : nullptr;
        out.set(contentType, schema ? *schema : JSONValue::object());
    }
    return out;
}

JSONValue requestSchemaFrom(const JSONValue& op) {
    const JSONValue* body = op.find("requestBody");
    if (!body || !body->isObject()) {
        return JSONValue();
    }
    JSONValue schema = JSONValue::object();
    schema.set("required", JSONValue(body->getBool("required", false)));
    schema.set("description", JSONValue(body->getString("description")));
    schema.set("content", contentSchemas(body->find("content")));
    return schema;
}

JSONValue responseSchemaFrom(const JSONValue& op) {
    JSONValue out = JSONValue::object();
    const JSONValue* responses = op.find("responses");
    if (!responses || !responses->isObject()) {
        return out;
    }
    for (const auto& [status, resp] : responses->asObject()) {
        if (!resp || !resp->isObject()) {
            continue;
        }
        JSONValue entry = JSONValue::object();
        entry.set("description", JSONValue(resp->getString("description")));
        entry.set("content", contentSchemas(resp->find("content")));
        out.set(status, std::move(entry));
    }
    return out;
}

} // namespace

//==========================================================================================================
// Shared helpers
//==========================================================================================================
namespace detail {

Parameter parameterFromJson(const JSONValue& p, const std::string& defaultLocation) {
    Parameter param;
    param.name = p.getString("name");
    param.location = p.getString("in", defaultLocation);
    // Path parameters are always required in OpenAPI
    param.required = param.location == "path" ? true : p.getBool("required", false);
    const JSONValue* schema = p.find("schema");
    param.schema = schema ? *schema : JSONValue::object();
    param.description = p.getString("description");
    return param;
}

std::vector<SecurityRequirement> expandSecurity(const JSONValue& requirements, const JSONValue& schemes) {
    std::vector<SecurityRequirement> out;
    if (!requirements.isArray()) {
        return out;
    }
    for (const auto& req : requirements.asArray()) {
        if (!req || !req->isObject()) {
            continue;
        }
        for (const auto& name : sortedKeys(*req)) {
            SecurityRequirement sr;
            sr.name = name;
            const JSONValue* def = schemes.find(name);
            sr.type = def ? def->getString("type") : std::string();
            const JSONValue* scopes = req->find(name);
            if (scopes && scopes->isArray()) {
                for (const auto& s : scopes->asArray()) {
                    if (s && s->isString()) {
                        sr.scopes.push_back(s->asString());
                    }
                }
            }
            out.push_back(std::move(sr));
        }
    }
    return out;
}

std::string substituteServerVariables(const std::string& url, const JSONValue& variables) {
    if (!variables.isObject()) {
        return url;
    }
    std::string out = url;
    for (const auto& [name, def] : variables.asObject()) {
        if (!def || !def->isObject()) {
            continue;
        }
        const JSONValue* dflt = def->find("default");
        if (!dflt) {
            continue;
        }
        const std::string token = "{" + name + "}";
        const std::string value = jsonToPlainString(*dflt);
        std::size_t pos = 0;
        while ((pos = out.find(token, pos)) != std::string::npos) {
            out.replace(pos, token.size(), value);
            pos += value.size();
        }
    }
    return out;
}

std::vector<std::string> tagsFromJson(const JSONValue& tags) {
    std::vector<std::string> out;
    if (!tags.isArray()) {
        return out;
    }
    for (const auto& t : tags.asArray()) {
        if (!t) continue;
        if (t->isString()) {
            out.push_back(t->asString());
        } else if (t->isObject() && !t->getString("name").empty()) {
            out.push_back(t->getString("name"));
        }
    }
    return out;
}

} // namespace detail

const std::vector<std::string>& openApiVerbs() {
    static const std::vector<std::string> verbs = {"get", "post", "put", "delete", "patch", "head", "options", "trace"};
    return verbs;
}

//==========================================================================================================
// OpenApiModel
//==========================================================================================================
OpenApiModel::OpenApiModel(JSONValue resolvedDocument) : doc(std::move(resolvedDocument)) {}

std::string OpenApiModel::Family() const { return family::Rest; }

void OpenApiModel::Validate() const {
    if (!doc.isObject()) {
        throw errors::invalidSpecification("$", "document must be a JSON object");
    }
    const JSONValue* version = doc.find("openapi");
    if (!version || !version->isString() || version->asString().rfind("3.", 0) != 0) {
        throw errors::invalidSpecification("openapi", "'openapi' must be a 3.x version string");
    }
    const JSONValue* info = doc.find("info");
    if (!info || !info->isObject()) {
        throw errors::invalidSpecification("info", "'info' object is required");
    }
    const JSONValue* title = info->find("title");
    if (!title || !title->isString() || title->asString().empty()) {
        throw errors::invalidSpecification("info.title", "'info.title' is required");
    }
    const JSONValue* paths = doc.find("paths");
    if (!paths || !paths->isObject()) {
        throw errors::invalidSpecification("paths", "'paths' object is required");
    }
}

std::string OpenApiModel::Title() const {
    const JSONValue* info = doc.find("info");
    return info ? info->getString("title") : std::string();
}

std::string OpenApiModel::Version() const {
    const JSONValue* info = doc.find("info");
    return info ? info->getString("version") : std::string();
}

std::vector<ServerInfo> OpenApiModel::Servers() const {
    std::vector<ServerInfo> out;
    const JSONValue* servers = doc.find("servers");
    if (!servers || !servers->isArray()) {
        return out;
    }
    std::size_t index = 0;
    for (const auto& s : servers->asArray()) {
        if (!s || !s->isObject() || s->getString("url").empty()) {
            continue;
        }
        ServerInfo info;
        info.name = "server" + std::to_string(index++);
        const JSONValue* vars = s->find("variables");
        info.url = vars ? detail::substituteServerVariables(s->getString("url"), *vars) : s->getString("url");
        info.protocol = protocol::Http;
        info.description = s->getString("description");
        out.push_back(std::move(info));
    }
    return out;
}

JSONValue OpenApiModel::SecuritySchemes() const {
    const JSONValue* components = doc.find("components");
    const JSONValue* schemes = components ? components->find("securitySchemes") : nullptr;
    return (schemes && schemes->isObject()) ? *schemes : JSONValue::object();
}

JSONValue OpenApiModel::Operations() const {
    const JSONValue* paths = doc.find("paths");
    return paths ? *paths : JSONValue::object();
}

JSONValue OpenApiModel::GlobalSecurity() const {
    const JSONValue* security = doc.find("security");
    return (security && security->isArray()) ? *security : JSONValue::array();
}

//==========================================================================================================
// OpenApiParser
//==========================================================================================================
bool OpenApiParser::CanParse(const JSONValue& rawDocument) const {
    const JSONValue* marker = rawDocument.find("openapi");
    return marker && marker->isString();
}

std::vector<Parameter> OpenApiParser::MergeParameters(const std::vector<Parameter>& base, const std::vector<Parameter>& overrides) {
    std::vector<Parameter> merged = base;
    for (const auto& p : overrides) {
        auto it = std::find_if(merged.begin(), merged.end(), [&](const Parameter& q) { return q.name == p.name; });
        if (it != merged.end()) {
            *it = p;
        } else {
            merged.push_back(p);
        }
    }
    return merged;
}

std::vector<Endpoint> OpenApiParser::ExtractEndpoints(const spec::ISpecModel& model) const {
    FUNC_SCOPE();
    std::vector<Endpoint> endpoints;
    const JSONValue paths = model.Operations();
    const JSONValue schemes = model.SecuritySchemes();
    const JSONValue* docSecurity = model.Document().find("security");

    for (const auto& path : sortedKeys(paths)) {
        const JSONValue* item = paths.find(path);
        if (!item || !item->isObject()) {
            continue;
        }
        const auto pathParams = parametersFromArray(item->find("parameters"));
        for (const auto& verb : openApiVerbs()) {
            const JSONValue* op = item->find(verb);
            if (!op || !op->isObject()) {
                continue;
            }
            Endpoint ep;
            ep.addressPattern = path;
            ep.protocol = protocol::Http;
            ep.operationKind = verb;
            ep.operationId = op->getString("operationId");
            ep.description = op->getString("summary");
            if (ep.description.empty()) {
                ep.description = op->getString("description");
            }
            ep.parameters = MergeParameters(pathParams, parametersFromArray(op->find("parameters")));
            ep.requestSchema = requestSchemaFrom(*op);
            ep.responseSchema = responseSchemaFrom(*op);

            const JSONValue* opSecurity = op->find("security");
            if (opSecurity && opSecurity->isArray()) {
                ep.securityRequirements = detail::expandSecurity(*opSecurity, schemes);
            } else if (docSecurity && docSecurity->isArray()) {
                ep.securityRequirements = detail::expandSecurity(*docSecurity, schemes);
            }
            if (const JSONValue* tags = op->find("tags")) {
                ep.tags = detail::tagsFromJson(*tags);
            }
            endpoints.push_back(std::move(ep));
        }
    }
    LOG_DEBUG("OpenApiParser: extracted {} endpoints from '{}'", endpoints.size(), model.Title());
    return endpoints;
}

//==========================================================================================================
// RestExecutor
//==========================================================================================================
spec::ExecutionResult RestExecutor::Execute(const Endpoint& endpoint, const WireRequest& request,
                                            protocol::IProtocolAdapter& adapter, const spec::ExecutionContext&) {
    auto* rr = dynamic_cast<protocol::IRequestResponseAdapter*>(&adapter);
    if (!rr) {
        throw GatewayError(ErrorKind::UnsupportedProtocol,
                           "Adapter for " + adapter.Protocol() + " cannot execute request/response operations",
                           endpoint.protocol);
    }
    LOG_DEBUG("RestExecutor: {} {}", request.method, request.url);
    spec::ExecutionResult result;
    result.response = rr->Execute(request);
    return result;
}

} // namespace apigw::plugins
