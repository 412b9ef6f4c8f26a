//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/apigw/resolve/RefResolver.hpp
// Purpose: Expands $ref pointers (internal fragments and external documents) into an inlined tree
//==========================================================================================================
#pragma once

#include <cstddef>
#include <functional>
#include <string>

#include "apigw/JSONValue.h"

namespace apigw::resolve {

//==========================================================================================================
// RefResolver
// Purpose: Depth-first $ref expansion with cycle truncation.
// Notes:
//   - "#/a/b" pointers navigate from the root of the document that contains the reference.
//   - "http(s)://host/doc.json#/a" fetches the document through Options::fetcher once per Resolve call.
//   - A reference met again while it is still being expanded becomes {"$ref": ref, "circular": true}.
//   - Expanded references are memoized per Resolve call, so a repeated ref is expanded once.
//   - Sibling keys next to "$ref" are ignored.
// Throws (GatewayError):
//   MalformedReference when a pointer cannot be located or the chain exceeds maxDepth.
//   UnsupportedReference for relative-path refs, or for external refs without a fetcher.
//==========================================================================================================
class RefResolver {
public:
    // Fetches and parses an external document by absolute URL (no fragment).
    using DocumentFetcher = std::function<JSONValue(const std::string& url)>;

    struct Options {
        DocumentFetcher fetcher;
        std::size_t maxDepth{64};
    };

    RefResolver();
    explicit RefResolver(Options opts);

    JSONValue Resolve(const JSONValue& document) const;

    //======================================================================================================
    // ResolvePointer
    // Purpose: Locates the node addressed by a fragment ("", "#", "#/a/b~1c/0") within root.
    // Throws:
    //   GatewayError(MalformedReference) when any segment is missing.
    //======================================================================================================
    static JSONValue ResolvePointer(const JSONValue& root, const std::string& fragment);

    // Marker object emitted at a re-entrant reference.
    static JSONValue CircularMarker(const std::string& ref);
    static bool IsCircularMarker(const JSONValue& value);

private:
    Options opts;
};

} // namespace apigw::resolve
