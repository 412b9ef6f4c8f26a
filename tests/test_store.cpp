//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_store.cpp
// Purpose: In-memory gateway store: registrations, cascade delete, auth states and call logs
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "apigw/errors/Errors.h"
#include "apigw/store/InMemoryStore.hpp"

using namespace apigw;
using apigw::store::InMemoryStore;

namespace {

TimePoint t0() {
    return TimePoint(std::chrono::seconds(1700000000));
}

void registerDoc(InMemoryStore& s, const std::string& docId, const std::string& specId,
                 const std::vector<std::string>& endpointIds, TimePoint created = t0()) {
    Specification spec;
    spec.specId = specId;
    spec.name = docId;
    ApiDocument doc;
    doc.id = docId;
    doc.specId = specId;
    doc.createdAt = created;
    std::vector<Endpoint> eps;
    for (const auto& id : endpointIds) {
        Endpoint ep;
        ep.id = id;
        ep.apiDocumentId = docId;
        eps.push_back(ep);
    }
    s.SaveRegistration(spec, doc, eps);
}

AuthConfig config(const std::string& id, const std::string& docId, bool global = false) {
    AuthConfig c;
    c.id = id;
    c.apiDocumentId = docId;
    c.scheme = scheme::Bearer;
    c.global = global;
    return c;
}

OAuth2AuthState state(const std::string& id, const std::string& docId, TimePoint expiresAt) {
    OAuth2AuthState st;
    st.id = id;
    st.apiDocumentId = docId;
    st.userId = "u1";
    st.expiresAt = expiresAt;
    return st;
}

CallLogRecord logRecord(const std::string& id, const std::string& endpointId) {
    CallLogRecord r;
    r.id = id;
    r.endpointId = endpointId;
    return r;
}

} // namespace

TEST(InMemoryStore, RegistrationIsStoredAsOneUnit) {
    InMemoryStore s;
    registerDoc(s, "d1", "s1", {"e1", "e2"});
    ASSERT_TRUE(s.GetApiDocument("d1").has_value());
    ASSERT_TRUE(s.GetSpecification("s1").has_value());
    auto eps = s.ListEndpoints("d1");
    ASSERT_EQ(eps.size(), 2u);
    EXPECT_EQ(eps[0].id, "e1");
    EXPECT_EQ(eps[1].id, "e2");
    EXPECT_TRUE(s.GetEndpoint("e2").has_value());
    EXPECT_TRUE(s.ListEndpoints("missing").empty());
}

TEST(InMemoryStore, DuplicateDocumentIdIsRejected) {
    InMemoryStore s;
    registerDoc(s, "d1", "s1", {"e1"});
    EXPECT_THROW(registerDoc(s, "d1", "s2", {"e9"}), errors::GatewayError);
    EXPECT_FALSE(s.GetEndpoint("e9").has_value());
}

TEST(InMemoryStore, DocumentsListInCreationOrder) {
    InMemoryStore s;
    registerDoc(s, "b", "s1", {}, t0() + std::chrono::seconds(5));
    registerDoc(s, "a", "s2", {}, t0() + std::chrono::seconds(9));
    registerDoc(s, "c", "s3", {}, t0());
    auto docs = s.ListApiDocuments();
    ASSERT_EQ(docs.size(), 3u);
    EXPECT_EQ(docs[0].id, "c");
    EXPECT_EQ(docs[1].id, "b");
    EXPECT_EQ(docs[2].id, "a");
}

TEST(InMemoryStore, DeleteCascadesToDependents) {
    InMemoryStore s;
    registerDoc(s, "d1", "s1", {"e1"});
    registerDoc(s, "d2", "s2", {"e2"});
    s.SaveAuthConfig(config("c1", "d1"));
    s.SaveAuthConfig(config("c2", "d2"));
    s.SaveAuthConfig(config("g", "", true));
    s.SaveAuthState(state("st1", "d1", t0()));
    UserAuthorization ua;
    ua.userId = "u1";
    ua.apiDocumentId = "d1";
    ua.accessToken = "t";
    s.SaveUserAuthorization(ua);

    EXPECT_TRUE(s.DeleteApiDocument("d1"));
    EXPECT_FALSE(s.DeleteApiDocument("d1"));
    EXPECT_FALSE(s.GetApiDocument("d1").has_value());
    EXPECT_FALSE(s.GetSpecification("s1").has_value());
    EXPECT_FALSE(s.GetEndpoint("e1").has_value());
    EXPECT_FALSE(s.GetAuthConfig("c1").has_value());
    EXPECT_FALSE(s.GetAuthState("st1").has_value());
    EXPECT_FALSE(s.GetUserAuthorization("u1", "d1").has_value());

    EXPECT_TRUE(s.GetAuthConfig("c2").has_value());
    EXPECT_TRUE(s.GetAuthConfig("g").has_value());
    EXPECT_TRUE(s.GetEndpoint("e2").has_value());
}

TEST(InMemoryStore, SharedSpecSurvivesUntilLastDocument) {
    InMemoryStore s;
    registerDoc(s, "d1", "shared", {});
    registerDoc(s, "d2", "shared", {});
    EXPECT_TRUE(s.DeleteApiDocument("d1"));
    EXPECT_TRUE(s.GetSpecification("shared").has_value());
    EXPECT_TRUE(s.DeleteApiDocument("d2"));
    EXPECT_FALSE(s.GetSpecification("shared").has_value());
}

TEST(InMemoryStore, AuthConfigsIncludeGlobals) {
    InMemoryStore s;
    s.SaveAuthConfig(config("c1", "d1"));
    s.SaveAuthConfig(config("c2", "d2"));
    s.SaveAuthConfig(config("g", "", true));
    auto list = s.ListAuthConfigs("d1");
    ASSERT_EQ(list.size(), 2u);
    for (const auto& c : list) {
        EXPECT_TRUE(c.id == "c1" || c.id == "g");
    }
    EXPECT_TRUE(s.DeleteAuthConfig("g"));
    EXPECT_EQ(s.ListAuthConfigs("d1").size(), 1u);
}

TEST(InMemoryStore, AuthStateConsumedOnce) {
    InMemoryStore s;
    s.SaveAuthState(state("st", "d1", t0() + std::chrono::minutes(10)));
    auto first = s.ConsumeAuthState("st");
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(first->consumed);
    EXPECT_FALSE(s.ConsumeAuthState("st").has_value());
    EXPECT_FALSE(s.ConsumeAuthState("unknown").has_value());
    EXPECT_TRUE(s.GetAuthState("st")->consumed);
}

TEST(InMemoryStore, ConcurrentConsumeHasSingleWinner) {
    InMemoryStore s;
    s.SaveAuthState(state("race", "d1", t0() + std::chrono::minutes(10)));
    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            if (s.ConsumeAuthState("race")) {
                ++winners;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(winners.load(), 1);
}

TEST(InMemoryStore, PurgeRemovesExpiredAndConsumed) {
    InMemoryStore s;
    s.SaveAuthState(state("old", "d1", t0() - std::chrono::seconds(1)));
    s.SaveAuthState(state("used", "d1", t0() + std::chrono::minutes(5)));
    s.SaveAuthState(state("live", "d1", t0() + std::chrono::minutes(5)));
    ASSERT_TRUE(s.ConsumeAuthState("used").has_value());
    EXPECT_EQ(s.PurgeExpiredAuthStates(t0()), 2u);
    EXPECT_TRUE(s.GetAuthState("live").has_value());
    EXPECT_FALSE(s.GetAuthState("old").has_value());
}

TEST(InMemoryStore, UserAuthorizationKeyedByUserAndDocument) {
    InMemoryStore s;
    UserAuthorization a;
    a.userId = "u1";
    a.apiDocumentId = "d1";
    a.accessToken = "first";
    s.SaveUserAuthorization(a);
    a.accessToken = "second";
    s.SaveUserAuthorization(a);
    EXPECT_EQ(s.GetUserAuthorization("u1", "d1")->accessToken, "second");
    EXPECT_FALSE(s.GetUserAuthorization("u2", "d1").has_value());
    EXPECT_TRUE(s.DeleteUserAuthorization("u1", "d1"));
    EXPECT_FALSE(s.DeleteUserAuthorization("u1", "d1"));
}

TEST(InMemoryStore, CallLogsNewestFirstWithFilterAndLimit) {
    InMemoryStore s;
    s.AppendCallLog(logRecord("1", "e1"));
    s.AppendCallLog(logRecord("2", "e2"));
    s.AppendCallLog(logRecord("3", "e1"));
    s.AppendCallLog(logRecord("4", "e1"));

    auto all = s.ListCallLogs("", 0);
    ASSERT_EQ(all.size(), 4u);
    EXPECT_EQ(all[0].id, "4");
    EXPECT_EQ(all[3].id, "1");

    auto e1 = s.ListCallLogs("e1", 2);
    ASSERT_EQ(e1.size(), 2u);
    EXPECT_EQ(e1[0].id, "4");
    EXPECT_EQ(e1[1].id, "3");
}

TEST(InMemoryStore, StatisticsUseRunningMean) {
    InMemoryStore s;
    registerDoc(s, "d1", "s1", {"e1"});
    s.RecordCallResult("e1", true, 10.0);
    s.RecordCallResult("e1", false, 20.0);
    s.RecordCallResult("e1", true, 30.0);
    s.RecordCallResult("nope", true, 1.0);
    const auto stats = s.GetEndpoint("e1")->stats;
    EXPECT_EQ(stats.callCount, 3u);
    EXPECT_EQ(stats.successCount, 2u);
    EXPECT_EQ(stats.errorCount, 1u);
    EXPECT_DOUBLE_EQ(stats.avgLatencyMs, 20.0);
}
