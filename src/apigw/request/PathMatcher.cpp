//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/apigw/request/PathMatcher.cpp
// Purpose: PathMatcher implementation
//==========================================================================================================

#include "apigw/request/PathMatcher.hpp"

namespace apigw::request {

namespace {

std::string escapeLiteral(const std::string& text) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string out;
    out.reserve(text.size() * 2);
    for (char c : text) {
        if (special.find(c) != std::string::npos) {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

} // namespace

std::vector<std::string> PathMatcher::ExtractTokens(const std::string& pattern) {
    std::vector<std::string> tokens;
    std::size_t pos = 0;
    while (true) {
        const std::size_t open = pattern.find('{', pos);
        if (open == std::string::npos) break;
        const std::size_t close = pattern.find('}', open + 1);
        if (close == std::string::npos) break;
        if (close > open + 1) {
            tokens.push_back(pattern.substr(open + 1, close - open - 1));
        }
        pos = close + 1;
    }
    return tokens;
}

PathMatcher::PathMatcher(const std::string& pattern) : source(pattern) {
    std::string expr;
    std::size_t pos = 0;
    while (pos < pattern.size()) {
        const std::size_t open = pattern.find('{', pos);
        const std::size_t close = open == std::string::npos ? std::string::npos : pattern.find('}', open + 1);
        if (open == std::string::npos || close == std::string::npos || close == open + 1) {
            expr += escapeLiteral(pattern.substr(pos));
            break;
        }
        expr += escapeLiteral(pattern.substr(pos, open - pos));
        expr += "([^/]+)";
        names.push_back(pattern.substr(open + 1, close - open - 1));
        pos = close + 1;
    }
    compiled = std::regex(expr, std::regex::ECMAScript);
}

bool PathMatcher::Match(const std::string& address, std::map<std::string, std::string>* captures) const {
    const std::string path = address.substr(0, address.find('?'));
    std::smatch m;
    if (!std::regex_match(path, m, compiled)) {
        return false;
    }
    if (captures) {
        for (std::size_t i = 0; i < names.size() && i + 1 < m.size(); ++i) {
            (*captures)[names[i]] = m[i + 1].str();
        }
    }
    return true;
}

} // namespace apigw::request
