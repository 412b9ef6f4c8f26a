//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/apigw/Redaction.hpp
// Purpose: Secret redaction for logged and recorded requests
//==========================================================================================================
#pragma once

#include <string>
#include <vector>

#include "apigw/JSONValue.h"
#include "apigw/Types.h"

namespace apigw {

inline constexpr const char* RedactedValue = "[REDACTED]";

// Authorization, Proxy-Authorization and Cookie, plus any name in `extraSecretNames` (case-insensitive).
bool isSecretName(const std::string& name, const std::vector<std::string>& extraSecretNames);

// Copy of `headers` with secret values replaced by RedactedValue.
HeaderList redactHeaders(const HeaderList& headers, const std::vector<std::string>& extraSecretNames);

//==========================================================================================================
// redactedRequestValue
// Purpose: JSON view of a request for call logs:
//   { method, url, headers: {..}, body?, channel?, channelParams? }
//   with secret headers and query parameters redacted.
//==========================================================================================================
JSONValue redactedRequestValue(const WireRequest& request, const std::vector<std::string>& extraSecretNames);

// { status, headers: {..}, body } for call logs.
JSONValue responseValue(const WireResponse& response);

} // namespace apigw
