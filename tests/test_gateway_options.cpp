//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_gateway_options.cpp
// Purpose: GatewayOptions defaults, Set(), config-string and environment loading
//==========================================================================================================

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>
#include <vector>

#include "apigw/GatewayOptions.hpp"

using namespace apigw;

namespace {

class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name(name) {
        ::setenv(name, value, 1);
    }
    ~ScopedEnv() { ::unsetenv(name); }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    const char* name;
};

} // namespace

TEST(GatewayOptions, Defaults) {
    GatewayOptions o;
    EXPECT_EQ(o.httpTimeoutMs, 30000u);
    EXPECT_EQ(o.connectTimeoutMs, 30000u);
    EXPECT_EQ(o.tokenTimeoutMs, 30000u);
    EXPECT_EQ(o.oauthStateTtlMinutes, 10u);
    EXPECT_EQ(o.oauthDefaultScope, "read");
    EXPECT_EQ(o.urlJoinMode, request::UrlJoinMode::PreserveBasePath);
    EXPECT_EQ(o.maxRefDepth, 64u);
    EXPECT_TRUE(o.allowExternalRefs);
    EXPECT_TRUE(o.verifyPeer);
    EXPECT_FALSE(o.userAgent.empty());
}

TEST(GatewayOptions, SetRejectsUnknownKeysAndBadValues) {
    GatewayOptions o;
    EXPECT_FALSE(o.Set("nope", "1"));
    EXPECT_FALSE(o.Set("httpTimeoutMs", "-5"));
    EXPECT_FALSE(o.Set("httpTimeoutMs", "12abc"));
    EXPECT_FALSE(o.Set("urlJoinMode", "sideways"));
    EXPECT_FALSE(o.Set("maxRefDepth", "0"));
    EXPECT_FALSE(o.Set("allowExternalRefs", "maybe"));
    EXPECT_FALSE(o.Set("userAgent", ""));
    EXPECT_EQ(o.httpTimeoutMs, 30000u);
    EXPECT_EQ(o.maxRefDepth, 64u);
    EXPECT_TRUE(o.allowExternalRefs);

    EXPECT_TRUE(o.Set("urlJoinMode", "REPLACE"));
    EXPECT_EQ(o.urlJoinMode, request::UrlJoinMode::ReplaceBasePath);
    EXPECT_TRUE(o.Set("verifyPeer", "off"));
    EXPECT_FALSE(o.verifyPeer);
}

TEST(GatewayOptions, NumericValuesMustBePositiveAndFitUnsignedInt) {
    GatewayOptions o;
    for (const char* key : {"httpTimeoutMs", "connectTimeoutMs", "tokenTimeoutMs", "oauthStateTtlMinutes", "maxRefDepth"}) {
        EXPECT_FALSE(o.Set(key, "0")) << key;
        EXPECT_FALSE(o.Set(key, "4294967296")) << key;
        EXPECT_FALSE(o.Set(key, "99999999999999999999999")) << key;
        EXPECT_FALSE(o.Set(key, "+5")) << key;
        EXPECT_FALSE(o.Set(key, " 5")) << key;
    }
    EXPECT_EQ(o.httpTimeoutMs, 30000u);
    EXPECT_EQ(o.oauthStateTtlMinutes, 10u);

    EXPECT_TRUE(o.Set("httpTimeoutMs", "4294967295"));
    EXPECT_EQ(o.httpTimeoutMs, 4294967295u);
    EXPECT_TRUE(o.Set("oauthStateTtlMinutes", "1"));
    EXPECT_EQ(o.oauthStateTtlMinutes, 1u);
}

TEST(GatewayOptions, FromConfigString) {
    const auto o = GatewayOptions::FromConfigString(
        " httpTimeoutMs = 1500 ; oauthDefaultScope=openid profile;;bogus=1; maxRefDepth=x; urlJoinMode=replace");
    EXPECT_EQ(o.httpTimeoutMs, 1500u);
    EXPECT_EQ(o.oauthDefaultScope, "openid profile");
    EXPECT_EQ(o.maxRefDepth, 64u);
    EXPECT_EQ(o.urlJoinMode, request::UrlJoinMode::ReplaceBasePath);
}

TEST(GatewayOptions, FromEnvironment) {
    ScopedEnv timeout("APIGW_HTTP_TIMEOUT_MS", "2500");
    ScopedEnv ttl("APIGW_OAUTH2_STATE_EXPIRE_MINUTES", "3");
    ScopedEnv join("APIGW_URL_JOIN", "replace");
    ScopedEnv ext("APIGW_ALLOW_EXTERNAL_REFS", "false");
    ScopedEnv depth("APIGW_MAX_REF_DEPTH", "0");
    ScopedEnv connect("APIGW_CONNECT_TIMEOUT_MS", "not-a-number");
    ScopedEnv ua("APIGW_USER_AGENT", "ops-agent/1.0");
    ScopedEnv token("APIGW_TOKEN_TIMEOUT_MS", "4294967296");

    const auto o = GatewayOptions::FromEnvironment();
    EXPECT_EQ(o.httpTimeoutMs, 2500u);
    EXPECT_EQ(o.oauthStateTtlMinutes, 3u);
    EXPECT_EQ(o.urlJoinMode, request::UrlJoinMode::ReplaceBasePath);
    EXPECT_FALSE(o.allowExternalRefs);
    EXPECT_EQ(o.maxRefDepth, 64u);
    EXPECT_EQ(o.connectTimeoutMs, 30000u);
    EXPECT_EQ(o.userAgent, "ops-agent/1.0");
    EXPECT_EQ(o.tokenTimeoutMs, 30000u);
}
