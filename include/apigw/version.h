//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for the gateway library (semantic version helpers).
//==========================================================================================================
#pragma once

#include <string>

namespace apigw {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
// Fields:
//   major, minor, patch: Version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

//==========================================================================================================
// getVersion
// Purpose: Returns the library semantic version components.
//==========================================================================================================
VersionInfo getVersion();

//==========================================================================================================
// getVersionString
// Purpose: Returns the semantic version string formatted as "MAJOR.MINOR.PATCH".
//==========================================================================================================
std::string getVersionString();

//==========================================================================================================
// getDefaultUserAgent
// Purpose: Returns the User-Agent value stamped on outgoing requests ("apigw/MAJOR.MINOR.PATCH").
//==========================================================================================================
std::string getDefaultUserAgent();

} // namespace apigw
