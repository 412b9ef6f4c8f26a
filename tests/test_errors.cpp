//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_errors.cpp
// Purpose: GatewayError kinds, helpers and JSON error mapping
//==========================================================================================================

#include <gtest/gtest.h>

#include "apigw/errors/Errors.h"

using namespace apigw;
using namespace apigw::errors;

TEST(Errors, KindNamesAreStableSnakeCase) {
    EXPECT_STREQ(toString(ErrorKind::MalformedReference), "malformed_reference");
    EXPECT_STREQ(toString(ErrorKind::MissingRequiredParameter), "missing_required_parameter");
    EXPECT_STREQ(toString(ErrorKind::AuthorizationExpired), "authorization_expired");
    EXPECT_STREQ(toString(ErrorKind::TransportTimeout), "transport_timeout");
    EXPECT_STREQ(toString(ErrorKind::InvalidConfiguration), "invalid_configuration");
}

TEST(Errors, HelpersCarryFieldAndDetail) {
    GatewayError missing = missingRequiredParameter("petId");
    EXPECT_EQ(missing.kind(), ErrorKind::MissingRequiredParameter);
    EXPECT_EQ(missing.field(), "petId");

    GatewayError mismatch = typeMismatch("limit", "integer");
    EXPECT_EQ(mismatch.kind(), ErrorKind::TypeMismatch);
    EXPECT_EQ(mismatch.field(), "limit");
    EXPECT_EQ(mismatch.detail(), "integer");

    GatewayError conn = transportConnection("refused", reasons::ConnectionRefused);
    EXPECT_EQ(conn.kind(), ErrorKind::TransportConnection);
    EXPECT_EQ(conn.detail(), "connection_refused");

    GatewayError timeout = transportTimeout("slow");
    EXPECT_EQ(timeout.kind(), ErrorKind::TransportTimeout);
    EXPECT_EQ(timeout.detail(), "timeout");
}

TEST(Errors, ErrorValueOmitsEmptyFields) {
    JSONValue full = makeErrorValue(invalidSpecification("info.title", "missing info.title"));
    EXPECT_EQ(full.getString("kind"), "invalid_specification");
    EXPECT_EQ(full.getString("field"), "info.title");
    EXPECT_NE(full.getString("message").find("info.title"), std::string::npos);
    EXPECT_EQ(full.find("detail"), nullptr);

    JSONValue bare = makeErrorValue(GatewayError(ErrorKind::Internal, "boom"));
    EXPECT_EQ(bare.find("field"), nullptr);
    EXPECT_EQ(bare.getString("message"), "boom");
}

TEST(Errors, CaughtAsRuntimeError) {
    try {
        throw GatewayError(ErrorKind::EndpointNotFound, "no such endpoint", "ep-1");
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "no such endpoint");
        return;
    }
    FAIL() << "GatewayError was not caught as std::runtime_error";
}
