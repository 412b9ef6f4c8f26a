//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_json.cpp
// Purpose: JSONValue parsing, serialization and equality
//==========================================================================================================

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "apigw/JSONValue.h"

using namespace apigw;

TEST(JSONValue, ParsesNestedDocument) {
    JSONValue v = parseJSON(R"({"a": [1, 2.5, "x", true, null], "b": {"c": "d"}})");
    ASSERT_TRUE(v.isObject());
    const JSONValue* a = v.find("a");
    ASSERT_NE(a, nullptr);
    ASSERT_TRUE(a->isArray());
    ASSERT_EQ(a->asArray().size(), 5u);
    EXPECT_TRUE(a->asArray()[0]->isInt());
    EXPECT_TRUE(a->asArray()[1]->isDouble());
    EXPECT_EQ(a->asArray()[2]->asString(), "x");
    EXPECT_TRUE(a->asArray()[3]->isBool());
    EXPECT_TRUE(a->asArray()[4]->isNull());
    EXPECT_EQ(v.find("b")->getString("c"), "d");
}

TEST(JSONValue, SerializationSortsObjectKeys) {
    JSONValue v = JSONValue::object();
    v.set("zeta", JSONValue(1));
    v.set("alpha", JSONValue("a"));
    v.set("mid", JSONValue::array().push(JSONValue(true)));
    EXPECT_EQ(serializeJSONValue(v), R"({"alpha":"a","mid":[true],"zeta":1})");
}

TEST(JSONValue, EscapesStrings) {
    JSONValue v(std::string("line\n\"quoted\"\\"));
    EXPECT_EQ(serializeJSONValue(v), R"("line\n\"quoted\"\\")");
    EXPECT_EQ(parseJSON(serializeJSONValue(v)).asString(), "line\n\"quoted\"\\");
}

TEST(JSONValue, RejectsMalformedInput) {
    EXPECT_THROW(parseJSON("{"), std::runtime_error);
    EXPECT_THROW(parseJSON(R"({"a":1} trailing)"), std::runtime_error);
    EXPECT_THROW(parseJSON(""), std::runtime_error);
}

TEST(JSONValue, DeepEqualityComparesNumbersByValue) {
    EXPECT_TRUE(jsonEquals(parseJSON(R"({"n": 2, "l": [1, {"k": "v"}]})"),
                           parseJSON(R"({"l": [1.0, {"k": "v"}], "n": 2.0})")));
    EXPECT_FALSE(jsonEquals(parseJSON(R"({"n": 2})"), parseJSON(R"({"n": "2"})")));
    EXPECT_FALSE(jsonEquals(parseJSON("[1,2]"), parseJSON("[2,1]")));
}

TEST(JSONValue, AccessorsFallBackOnTypeMismatch) {
    JSONValue v = parseJSON(R"({"s": "text", "i": 7, "b": true})");
    EXPECT_EQ(v.getString("i", "fallback"), "fallback");
    EXPECT_EQ(v.getInt("i"), 7);
    EXPECT_EQ(v.getInt("s", -1), -1);
    EXPECT_TRUE(v.getBool("b"));
    EXPECT_EQ(v.find("missing"), nullptr);
    EXPECT_EQ(JSONValue(5).find("x"), nullptr);
}

TEST(JSONValue, PlainStringRendering) {
    EXPECT_EQ(jsonToPlainString(JSONValue("abc")), "abc");
    EXPECT_EQ(jsonToPlainString(JSONValue(42)), "42");
    EXPECT_EQ(jsonToPlainString(JSONValue(true)), "true");
    EXPECT_EQ(jsonToPlainString(JSONValue()), "");
    EXPECT_EQ(jsonToPlainString(parseJSON(R"({"a":1})")), R"({"a":1})");
}

TEST(JSONValue, SetOnScalarThrows) {
    JSONValue v(1);
    EXPECT_THROW(v.set("k", JSONValue(2)), std::logic_error);
    JSONValue n;
    n.set("k", JSONValue(2));
    EXPECT_TRUE(n.isObject());
}
