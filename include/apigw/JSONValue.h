//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONValue.h
// Purpose: JSON document model, parser and serializer used for specifications, payloads and records
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <variant>
#include <optional>
#include <unordered_map>
#include <vector>

namespace apigw {

//==========================================================================================================
// JSONValue
// Purpose: Simplified JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
// Notes:
//   Copies share child nodes. Code that needs to modify a subtree builds a new node instead of writing
//   through a shared child.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::unordered_map<std::string, std::shared_ptr<JSONValue>>;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    // Constructors and special members (defined out-of-line)
    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&);
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&);
    ~JSONValue();

    // Explicit constructors for supported types
    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    // Access the underlying variant
    auto& get() { return value; }
    const auto& get() const { return value; }

    bool isNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool isBool() const { return std::holds_alternative<bool>(value); }
    bool isInt() const { return std::holds_alternative<int64_t>(value); }
    bool isDouble() const { return std::holds_alternative<double>(value); }
    bool isNumber() const { return isInt() || isDouble(); }
    bool isString() const { return std::holds_alternative<std::string>(value); }
    bool isArray() const { return std::holds_alternative<Array>(value); }
    bool isObject() const { return std::holds_alternative<Object>(value); }

    const std::string& asString() const { return std::get<std::string>(value); }
    const Array& asArray() const { return std::get<Array>(value); }
    const Object& asObject() const { return std::get<Object>(value); }
    Array& asArray() { return std::get<Array>(value); }
    Object& asObject() { return std::get<Object>(value); }

    // Member lookup on objects; returns nullptr for non-objects and missing keys.
    const JSONValue* find(const std::string& key) const;

    // Convenience accessors for object members with fallback values.
    std::string getString(const std::string& key, const std::string& fallback = std::string()) const;
    bool getBool(const std::string& key, bool fallback = false) const;
    int64_t getInt(const std::string& key, int64_t fallback = 0) const;

    // Object builder: sets (or replaces) a member, converting this value into an object when null.
    JSONValue& set(const std::string& key, JSONValue v);

    // Array builder: appends an element, converting this value into an array when null.
    JSONValue& push(JSONValue v);

    static JSONValue object();
    static JSONValue array();
};

//==========================================================================================================
// parseJSON
// Purpose: Parses a complete JSON text.
// Throws:
//   std::runtime_error with the byte offset when the input is malformed or carries trailing content.
//==========================================================================================================
JSONValue parseJSON(const std::string& text);

//==========================================================================================================
// serializeJSONValue
// Purpose: Compact JSON serialization. Object keys are emitted in sorted order so output is stable.
//==========================================================================================================
std::string serializeJSONValue(const JSONValue& value);

//==========================================================================================================
// jsonEquals
// Purpose: Structural (deep) equality. Integers and doubles compare by numeric value.
//==========================================================================================================
bool jsonEquals(const JSONValue& a, const JSONValue& b);

//==========================================================================================================
// jsonToPlainString
// Purpose: Renders scalars without quotes (strings verbatim, numbers/bools textual); containers as JSON.
//==========================================================================================================
std::string jsonToPlainString(const JSONValue& value);

} // namespace apigw
