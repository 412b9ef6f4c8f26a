//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_ref_resolver.cpp
// Purpose: $ref expansion: internal pointers, cycles, external documents and failure kinds
//==========================================================================================================

#include <gtest/gtest.h>

#include <functional>
#include <map>
#include <stdexcept>
#include <string>

#include "apigw/errors/Errors.h"
#include "apigw/resolve/RefResolver.hpp"

using namespace apigw;
using apigw::errors::ErrorKind;
using apigw::errors::GatewayError;
using apigw::resolve::RefResolver;

namespace {

ErrorKind kindOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const GatewayError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected GatewayError";
    return ErrorKind::Internal;
}

const char* kPetDoc = R"({
  "paths": {"/pets": {"get": {"responses": {"200": {"content": {"application/json": {
      "schema": {"$ref": "#/components/schemas/Pet"}}}}}}}},
  "components": {"schemas": {
    "Pet": {"type": "object", "properties": {"id": {"type": "integer"}, "tag": {"$ref": "#/components/schemas/Tag"}}},
    "Tag": {"type": "string"}
  }}
})";

} // namespace

TEST(RefResolver, InlinesInternalReferences) {
    RefResolver resolver;
    JSONValue out = resolver.Resolve(parseJSON(kPetDoc));
    JSONValue schema = RefResolver::ResolvePointer(
        out, "#/paths/~1pets/get/responses/200/content/application~1json/schema");
    EXPECT_EQ(schema.getString("type"), "object");
    EXPECT_EQ(RefResolver::ResolvePointer(schema, "#/properties/tag").getString("type"), "string");
    EXPECT_EQ(schema.find("$ref"), nullptr);
}

TEST(RefResolver, ResolutionIsIdempotent) {
    RefResolver resolver;
    JSONValue once = resolver.Resolve(parseJSON(kPetDoc));
    JSONValue twice = resolver.Resolve(once);
    EXPECT_TRUE(jsonEquals(once, twice));
}

TEST(RefResolver, SelfReferenceBecomesCircularMarker) {
    const char* doc = R"({
      "root": {"$ref": "#/definitions/Node"},
      "definitions": {"Node": {"type": "object", "properties": {"child": {"$ref": "#/definitions/Node"}}}}
    })";
    JSONValue out = RefResolver().Resolve(parseJSON(doc));
    const JSONValue* root = out.find("root");
    ASSERT_NE(root, nullptr);
    EXPECT_EQ(root->getString("type"), "object");
    JSONValue child = RefResolver::ResolvePointer(*root, "#/properties/child");
    EXPECT_TRUE(RefResolver::IsCircularMarker(child));
    EXPECT_EQ(child.getString("$ref"), "#/definitions/Node");
}

TEST(RefResolver, MutualCycleTerminates) {
    const char* doc = R"({
      "a": {"$ref": "#/defs/A"},
      "defs": {"A": {"next": {"$ref": "#/defs/B"}}, "B": {"next": {"$ref": "#/defs/A"}}}
    })";
    JSONValue out = RefResolver().Resolve(parseJSON(doc));
    JSONValue marker = RefResolver::ResolvePointer(out, "#/a/next/next");
    EXPECT_TRUE(RefResolver::IsCircularMarker(marker));
}

TEST(RefResolver, MutualCycleMarkerSitsWhereEachEntryRepeats) {
    const char* doc = R"({
      "x": {"$ref": "#/defs/A"},
      "y": {"$ref": "#/defs/B"},
      "defs": {"A": {"b": {"$ref": "#/defs/B"}}, "B": {"a": {"$ref": "#/defs/A"}}}
    })";
    JSONValue out = RefResolver().Resolve(parseJSON(doc));

    EXPECT_TRUE(RefResolver::IsCircularMarker(RefResolver::ResolvePointer(out, "#/x/b/a")));
    EXPECT_FALSE(RefResolver::IsCircularMarker(RefResolver::ResolvePointer(out, "#/x/b")));
    EXPECT_TRUE(RefResolver::IsCircularMarker(RefResolver::ResolvePointer(out, "#/y/a/b")));
    EXPECT_FALSE(RefResolver::IsCircularMarker(RefResolver::ResolvePointer(out, "#/y/a")));
    EXPECT_TRUE(RefResolver::IsCircularMarker(RefResolver::ResolvePointer(out, "#/defs/A/b/a")));
}

TEST(RefResolver, PointerDecodingAndArrayIndices) {
    JSONValue root = parseJSON(R"({"a/b": {"c~d": [10, 20, {"e f": "ok"}]}})");
    EXPECT_EQ(RefResolver::ResolvePointer(root, "#/a~1b/c~0d/2/e%20f").asString(), "ok");
    EXPECT_EQ(std::get<int64_t>(RefResolver::ResolvePointer(root, "#/a~1b/c~0d/1").value), 20);
    EXPECT_TRUE(jsonEquals(RefResolver::ResolvePointer(root, "#"), root));
}

TEST(RefResolver, UnlocatablePointerIsMalformed) {
    JSONValue doc = parseJSON(R"({"x": {"$ref": "#/missing/thing"}})");
    EXPECT_EQ(kindOf([&] { (void)RefResolver().Resolve(doc); }), ErrorKind::MalformedReference);
    EXPECT_EQ(kindOf([&] { (void)RefResolver::ResolvePointer(parseJSON("[1]"), "#/5"); }),
              ErrorKind::MalformedReference);
}

TEST(RefResolver, RelativeFileReferenceIsUnsupported) {
    JSONValue doc = parseJSON(R"({"x": {"$ref": "common.json#/Pet"}})");
    EXPECT_EQ(kindOf([&] { (void)RefResolver().Resolve(doc); }), ErrorKind::UnsupportedReference);
}

TEST(RefResolver, ExternalReferenceWithoutFetcherIsUnsupported) {
    JSONValue doc = parseJSON(R"({"x": {"$ref": "https://schemas.example.com/pet.json#/Pet"}})");
    EXPECT_EQ(kindOf([&] { (void)RefResolver().Resolve(doc); }), ErrorKind::UnsupportedReference);
}

TEST(RefResolver, ExternalDocumentsAreFetchedOncePerResolve) {
    std::map<std::string, int> fetches;
    RefResolver::Options opts;
    opts.fetcher = [&](const std::string& url) {
        ++fetches[url];
        return parseJSON(R"({"Pet": {"type": "object", "properties": {"owner": {"$ref": "#/Owner"}}},
                             "Owner": {"type": "string"}})");
    };
    RefResolver resolver(opts);
    JSONValue doc = parseJSON(R"({
      "a": {"$ref": "https://schemas.example.com/pet.json#/Pet"},
      "b": {"$ref": "https://schemas.example.com/pet.json#/Owner"}
    })");
    JSONValue out = resolver.Resolve(doc);
    EXPECT_EQ(fetches["https://schemas.example.com/pet.json"], 1);
    EXPECT_EQ(RefResolver::ResolvePointer(out, "#/a/properties/owner").getString("type"), "string");
    EXPECT_EQ(out.find("b")->getString("type"), "string");
}

TEST(RefResolver, FetcherFailureIsMalformedReference) {
    RefResolver::Options opts;
    opts.fetcher = [](const std::string&) -> JSONValue { throw std::runtime_error("404"); };
    JSONValue doc = parseJSON(R"({"x": {"$ref": "http://unreachable.example/doc.json"}})");
    EXPECT_EQ(kindOf([&] { (void)RefResolver(opts).Resolve(doc); }), ErrorKind::MalformedReference);
}

TEST(RefResolver, ChainDeeperThanLimitIsRejected) {
    JSONValue doc = parseJSON(R"({"x": {"$ref": "#/a"}, "a": {"$ref": "#/b"}, "b": {"$ref": "#/c"}, "c": 1})");
    RefResolver::Options opts;
    opts.maxDepth = 2;
    EXPECT_EQ(kindOf([&] { (void)RefResolver(opts).Resolve(doc); }), ErrorKind::MalformedReference);

    JSONValue ok = RefResolver().Resolve(doc);
    EXPECT_EQ(std::get<int64_t>(ok.find("x")->value), 1);
}

TEST(RefResolver, SiblingKeysNextToRefAreIgnored) {
    JSONValue doc = parseJSON(R"({"x": {"$ref": "#/t", "description": "ignored"}, "t": {"type": "string"}})");
    JSONValue out = RefResolver().Resolve(doc);
    EXPECT_EQ(out.find("x")->find("description"), nullptr);
    EXPECT_EQ(out.find("x")->getString("type"), "string");
}
