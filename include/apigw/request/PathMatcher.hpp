//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/apigw/request/PathMatcher.hpp
// Purpose: Anchored matching of concrete addresses against "{name}" address patterns
//==========================================================================================================
#pragma once

#include <map>
#include <regex>
#include <string>
#include <vector>

namespace apigw::request {

//==========================================================================================================
// PathMatcher
// Purpose: Compiles an address pattern such as "/users/{id}/posts" into an anchored matcher.
// Notes:
//   - A token matches one non-empty segment ([^/]+). Literal text is matched exactly.
//   - Any "?query" suffix on the concrete address is ignored.
//==========================================================================================================
class PathMatcher {
public:
    explicit PathMatcher(const std::string& pattern);

    // True when the whole address matches; captured token values are written to `captures` if given.
    bool Match(const std::string& address, std::map<std::string, std::string>* captures = nullptr) const;

    const std::vector<std::string>& ParameterNames() const { return names; }
    const std::string& Pattern() const { return source; }

    // "{name}" tokens of a pattern in order of appearance.
    static std::vector<std::string> ExtractTokens(const std::string& pattern);

private:
    std::string source;
    std::vector<std::string> names;
    std::regex compiled;
};

} // namespace apigw::request
