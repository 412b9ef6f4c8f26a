//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/apigw/resolve/RefResolver.cpp
// Purpose: $ref expansion with a resolution stack, per-call memoization and external document cache
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <limits>
#include <unordered_map>
#include <vector>

#include "logging/Logger.h"
#include "apigw/errors/Errors.h"
#include "apigw/resolve/RefResolver.hpp"

namespace apigw::resolve {

using errors::ErrorKind;
using errors::GatewayError;

namespace {

bool isExternalRef(const std::string& ref) {
    return ref.rfind("http://", 0) == 0 || ref.rfind("https://", 0) == 0;
}

std::string percentDecode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size() &&
            std::isxdigit(static_cast<unsigned char>(s[i + 1])) && std::isxdigit(static_cast<unsigned char>(s[i + 2]))) {
            out.push_back(static_cast<char>(std::stoi(s.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        } else {
            out.push_back(s[i]);
        }
    }
    return out;
}

std::string unescapeSegment(const std::string& raw) {
    std::string seg = percentDecode(raw);
    std::string out;
    out.reserve(seg.size());
    for (std::size_t i = 0; i < seg.size(); ++i) {
        if (seg[i] == '~' && i + 1 < seg.size() && (seg[i + 1] == '0' || seg[i + 1] == '1')) {
            out.push_back(seg[i + 1] == '1' ? '/' : '~');
            ++i;
        } else {
            out.push_back(seg[i]);
        }
    }
    return out;
}

//==========================================================================================================
// ResolvePass
// Purpose: State for one Resolve call: resolution stack, memo, fetched documents and the low-water mark
//          of circular markers (index of the outermost in-progress ref that a marker pointed at).
//==========================================================================================================
struct ResolvePass {
    const RefResolver::Options& opts;
    std::vector<std::string> stack;
    std::unordered_map<std::string, JSONValue> memo;
    std::unordered_map<std::string, JSONValue> documents;
    std::size_t markerLowWater{std::numeric_limits<std::size_t>::max()};

    explicit ResolvePass(const RefResolver::Options& o) : opts(o) {}

    const JSONValue& fetchDocument(const std::string& baseUrl, const std::string& ref) {
        auto it = documents.find(baseUrl);
        if (it != documents.end()) {
            return it->second;
        }
        if (!opts.fetcher) {
            throw GatewayError(ErrorKind::UnsupportedReference,
                               "External reference requires a document fetcher: " + ref, ref);
        }
        LOG_DEBUG("RefResolver: fetching external document {}", baseUrl);
        JSONValue doc;
        try {
            doc = opts.fetcher(baseUrl);
        } catch (const std::exception& e) {
            throw GatewayError(ErrorKind::MalformedReference,
                               "Cannot load external document " + baseUrl + ": " + e.what(), ref);
        }
        auto inserted = documents.emplace(baseUrl, std::move(doc));
        return inserted.first->second;
    }

    JSONValue walk(const JSONValue& node, const JSONValue& docRoot, const std::string& baseUrl) {
        if (node.isObject()) {
            const JSONValue* ref = node.find("$ref");
            if (ref && ref->isString()) {
                return resolveRef(ref->asString(), docRoot, baseUrl);
            }
            JSONValue::Object out;
            out.reserve(node.asObject().size());
            for (const auto& [key, child] : node.asObject()) {
                out[key] = std::make_shared<JSONValue>(child ? walk(*child, docRoot, baseUrl) : JSONValue());
            }
            return JSONValue(std::move(out));
        }
        if (node.isArray()) {
            JSONValue::Array out;
            out.reserve(node.asArray().size());
            for (const auto& child : node.asArray()) {
                out.push_back(std::make_shared<JSONValue>(child ? walk(*child, docRoot, baseUrl) : JSONValue()));
            }
            return JSONValue(std::move(out));
        }
        return node;
    }

    JSONValue resolveRef(const std::string& ref, const JSONValue& docRoot, const std::string& baseUrl) {
        const JSONValue* targetDoc = nullptr;
        std::string targetBase;
        std::string fragment;
        std::string key;

        if (!ref.empty() && ref[0] == '#') {
            targetDoc = &docRoot;
            targetBase = baseUrl;
            fragment = ref;
            key = baseUrl + ref;
        } else if (isExternalRef(ref)) {
            const std::size_t hash = ref.find('#');
            targetBase = ref.substr(0, hash);
            fragment = (hash == std::string::npos) ? std::string() : ref.substr(hash);
            key = targetBase + (fragment.empty() ? std::string("#") : fragment);
        } else {
            throw GatewayError(ErrorKind::UnsupportedReference, "Relative references are not supported: " + ref, ref);
        }

        auto onStack = std::find(stack.begin(), stack.end(), key);
        if (onStack != stack.end()) {
            const auto position = static_cast<std::size_t>(onStack - stack.begin());
            markerLowWater = std::min(markerLowWater, position);
            LOG_DEBUG("RefResolver: circular reference {}", ref);
            return RefResolver::CircularMarker(ref);
        }

        if (stack.size() >= opts.maxDepth) {
            throw GatewayError(ErrorKind::MalformedReference,
                               "Reference chain exceeds maximum depth of " + std::to_string(opts.maxDepth), ref);
        }

        auto memoHit = memo.find(key);
        if (memoHit != memo.end()) {
            return memoHit->second;
        }

        if (!targetDoc) {
            targetDoc = &fetchDocument(targetBase, ref);
        }

        JSONValue target;
        try {
            target = RefResolver::ResolvePointer(*targetDoc, fragment);
        } catch (const GatewayError& e) {
            throw GatewayError(ErrorKind::MalformedReference, std::string("Cannot resolve reference ") + ref + ": " + e.what(), ref);
        }

        const std::size_t outerLowWater = markerLowWater;
        markerLowWater = std::numeric_limits<std::size_t>::max();

        stack.push_back(key);
        JSONValue expanded = walk(target, *targetDoc, targetBase);
        stack.pop_back();

        // Only cache expansions without circular markers; a marker's depth depends on where the
        // expansion started, so reusing one from another entry point would misplace it
        if (markerLowWater == std::numeric_limits<std::size_t>::max()) {
            memo.emplace(key, expanded);
        }
        markerLowWater = std::min(outerLowWater, markerLowWater);
        return expanded;
    }
};

} // namespace

RefResolver::RefResolver() = default;

RefResolver::RefResolver(Options o) : opts(std::move(o)) {}

JSONValue RefResolver::Resolve(const JSONValue& document) const {
    FUNC_SCOPE();
    ResolvePass pass(opts);
    return pass.walk(document, document, std::string());
}

JSONValue RefResolver::ResolvePointer(const JSONValue& root, const std::string& fragment) {
    std::string pointer = fragment;
    if (!pointer.empty() && pointer[0] == '#') {
        pointer.erase(0, 1);
    }
    if (pointer.empty()) {
        return root;
    }
    if (pointer[0] != '/') {
        throw GatewayError(ErrorKind::MalformedReference, "Pointer must start with '/': " + fragment, fragment);
    }

    const JSONValue* current = &root;
    std::size_t start = 1;
    while (true) {
        std::size_t slash = pointer.find('/', start);
        const std::string segment = unescapeSegment(pointer.substr(start, slash == std::string::npos ? std::string::npos : slash - start));
        if (current->isObject()) {
            const JSONValue* next = current->find(segment);
            if (!next) {
                throw GatewayError(ErrorKind::MalformedReference, "Pointer segment not found: " + segment, fragment);
            }
            current = next;
        } else if (current->isArray()) {
            const auto& arr = current->asArray();
            if (segment.empty() || segment.size() > 18 || !std::all_of(segment.begin(), segment.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; })) {
                throw GatewayError(ErrorKind::MalformedReference, "Invalid array index in pointer: " + segment, fragment);
            }
            const std::size_t index = static_cast<std::size_t>(std::stoull(segment));
            if (index >= arr.size() || !arr[index]) {
                throw GatewayError(ErrorKind::MalformedReference, "Array index out of range in pointer: " + segment, fragment);
            }
            current = arr[index].get();
        } else {
            throw GatewayError(ErrorKind::MalformedReference, "Pointer traverses a scalar at: " + segment, fragment);
        }
        if (slash == std::string::npos) {
            break;
        }
        start = slash + 1;
    }
    return *current;
}

JSONValue RefResolver::CircularMarker(const std::string& ref) {
    JSONValue marker = JSONValue::object();
    marker.set("$ref", JSONValue(ref));
    marker.set("circular", JSONValue(true));
    return marker;
}

bool RefResolver::IsCircularMarker(const JSONValue& value) {
    const JSONValue* circular = value.find("circular");
    return value.find("$ref") != nullptr && circular && circular->isBool() && std::get<bool>(circular->value);
}

} // namespace apigw::resolve
