//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/apigw/plugins/OpenApi.hpp
// Purpose: REST-style spec family: OpenAPI 3.x model, endpoint extractor and request/response executor
//==========================================================================================================
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "apigw/spec/ISpecModel.hpp"

namespace apigw::plugins {

// HTTP verbs recognized as operations inside an OpenAPI path item, in extraction order.
const std::vector<std::string>& openApiVerbs();

class OpenApiModel final : public spec::ISpecModel {
public:
    explicit OpenApiModel(JSONValue resolvedDocument);

    std::string Family() const override;
    void Validate() const override;
    std::string Title() const override;
    std::string Version() const override;
    std::vector<ServerInfo> Servers() const override;
    JSONValue SecuritySchemes() const override;
    JSONValue Operations() const override;
    const JSONValue& Document() const override { return doc; }

    // Document-level security requirements ([] when absent).
    JSONValue GlobalSecurity() const;

private:
    JSONValue doc;
};

//==========================================================================================================
// OpenApiParser
// Purpose: One endpoint per (path, recognized verb). Path-level parameters are merged with
//          operation-level ones; operation-level wins on a name collision.
//==========================================================================================================
class OpenApiParser final : public spec::ISpecParser {
public:
    bool CanParse(const JSONValue& rawDocument) const override;
    std::vector<Endpoint> ExtractEndpoints(const spec::ISpecModel& model) const override;

    // Merge helper exposed for reuse: entries of `overrides` replace same-named entries of `base`.
    static std::vector<Parameter> MergeParameters(const std::vector<Parameter>& base, const std::vector<Parameter>& overrides);
};

class RestExecutor final : public spec::IExecutor {
public:
    spec::ExecutionResult Execute(const Endpoint& endpoint, const WireRequest& request,
                                  protocol::IProtocolAdapter& adapter, const spec::ExecutionContext& ctx) override;
};

// Shared extraction helpers used by both families.
namespace detail {
Parameter parameterFromJson(const JSONValue& p, const std::string& defaultLocation);
std::vector<SecurityRequirement> expandSecurity(const JSONValue& requirements, const JSONValue& schemes);
std::string substituteServerVariables(const std::string& url, const JSONValue& variables);
std::vector<std::string> tagsFromJson(const JSONValue& tags);
} // namespace detail

} // namespace apigw::plugins
