//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Implements version helpers returning semantic version string.
//==========================================================================================================
#include "apigw/version.h"

#include <sstream>

namespace apigw {

VersionInfo getVersion() {
    auto v = VersionInfo{0, 3, 0};
    return v;
}

std::string getVersionString() {
    const auto v = getVersion();
    std::ostringstream oss;
    oss << v.major << "." << v.minor << "." << v.patch;
    return oss.str();
}

std::string getDefaultUserAgent() {
    return std::string("apigw/") + getVersionString();
}

} // namespace apigw
