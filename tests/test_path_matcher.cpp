//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_path_matcher.cpp
// Purpose: Address pattern matching and token capture
//==========================================================================================================

#include <gtest/gtest.h>

#include <map>
#include <string>

#include "apigw/request/PathMatcher.hpp"

using apigw::request::PathMatcher;

TEST(PathMatcher, CapturesTokens) {
    PathMatcher m("/users/{userId}/posts/{postId}");
    std::map<std::string, std::string> caps;
    ASSERT_TRUE(m.Match("/users/7/posts/abc", &caps));
    EXPECT_EQ(caps["userId"], "7");
    EXPECT_EQ(caps["postId"], "abc");
    ASSERT_EQ(m.ParameterNames().size(), 2u);
    EXPECT_EQ(m.ParameterNames()[0], "userId");
    EXPECT_EQ(m.Pattern(), "/users/{userId}/posts/{postId}");
}

TEST(PathMatcher, MatchIsAnchored) {
    PathMatcher m("/pets/{id}");
    EXPECT_FALSE(m.Match("/pets"));
    EXPECT_FALSE(m.Match("/pets/"));
    EXPECT_FALSE(m.Match("/pets/1/owner"));
    EXPECT_FALSE(m.Match("/api/pets/1"));
    EXPECT_TRUE(m.Match("/pets/1"));
}

TEST(PathMatcher, TokenDoesNotSpanSegments) {
    PathMatcher m("/files/{name}");
    EXPECT_FALSE(m.Match("/files/a/b"));
}

TEST(PathMatcher, QueryStringIsIgnored) {
    PathMatcher m("/search/{term}");
    std::map<std::string, std::string> caps;
    ASSERT_TRUE(m.Match("/search/cats?limit=5", &caps));
    EXPECT_EQ(caps["term"], "cats");
}

TEST(PathMatcher, RegexCharactersInLiteralsAreEscaped) {
    PathMatcher m("/v1.0/items(+)/{id}");
    EXPECT_TRUE(m.Match("/v1.0/items(+)/3"));
    EXPECT_FALSE(m.Match("/v1x0/items(+)/3"));
    EXPECT_FALSE(m.Match("/v1.0/itemss/3"));
}

TEST(PathMatcher, ChannelPatterns) {
    PathMatcher m("rooms/{roomId}/messages");
    std::map<std::string, std::string> caps;
    ASSERT_TRUE(m.Match("rooms/lobby/messages", &caps));
    EXPECT_EQ(caps["roomId"], "lobby");
    EXPECT_FALSE(m.Match("/rooms/lobby/messages"));
}

TEST(PathMatcher, LiteralOnlyPattern) {
    PathMatcher m("/health");
    EXPECT_TRUE(m.Match("/health"));
    EXPECT_FALSE(m.Match("/healthz"));
    EXPECT_TRUE(m.ParameterNames().empty());
}

TEST(PathMatcher, ExtractTokensInOrder) {
    auto tokens = PathMatcher::ExtractTokens("/a/{x}/b/{y}/{z}");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0], "x");
    EXPECT_EQ(tokens[1], "y");
    EXPECT_EQ(tokens[2], "z");
    EXPECT_TRUE(PathMatcher::ExtractTokens("/plain").empty());
}
