//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/apigw/request/RequestBuilder.hpp
// Purpose: Turns an Endpoint plus caller data into a fully addressed WireRequest
//==========================================================================================================
#pragma once

#include <functional>
#include <optional>
#include <string>

#include "apigw/JSONValue.h"
#include "apigw/Types.h"
#include "apigw/version.h"

namespace apigw::request {

// How a relative address is joined to the document base address.
enum class UrlJoinMode {
    PreserveBasePath, // http://host/v1 + /x -> http://host/v1/x
    ReplaceBasePath   // http://host/v1 + /x -> http://host/x
};

//==========================================================================================================
// CallInput
// Purpose: Caller-supplied data for one call.
// Fields:
//   params: Parameter values by name (path, query, header, cookie or channel).
//   headers: Extra request headers; also the fallback source for header parameters.
//   body: Optional request body / message payload.
//   userId: Caller identity used by per-user auth schemes.
//==========================================================================================================
struct CallInput {
    ParamMap params;
    HeaderList headers;
    std::optional<JSONValue> body;
    std::string userId;
};

struct RequestBuilderOptions {
    UrlJoinMode joinMode{UrlJoinMode::PreserveBasePath};
    unsigned int timeoutMs{30000};
    std::string userAgent{getDefaultUserAgent()};
};

// Auth hook executed as the final build step.
using AuthStep = std::function<void(WireRequest&)>;

//==========================================================================================================
// RequestBuilder
// Purpose: Stateless request construction.
// Steps:
//   1) Required parameters and "{token}" values are checked (MissingRequiredParameter), then supplied
//      values are coerced to their declared schema type (TypeMismatch).
//   2) Tokens are replaced with percent-encoded values (raw values for channel names).
//   3) Header and cookie parameters are placed; everything left becomes query or channel parameters.
//   4) Caller headers are copied; Content-Type and User-Agent defaults are added when absent.
//   5) The address is joined to the base address (REST) or the server address is selected (pub/sub).
//   6) The auth step runs.
//==========================================================================================================
class RequestBuilder {
public:
    RequestBuilder();
    explicit RequestBuilder(RequestBuilderOptions opts);

    WireRequest Build(const Endpoint& endpoint, const ApiDocument& document, const CallInput& input,
                      const AuthStep& auth = AuthStep()) const;

    // Throws GatewayError(InvalidConfiguration) when `relative` is not absolute and `base` is empty.
    static std::string JoinUrl(const std::string& base, const std::string& relative, UrlJoinMode mode);

    // Coerces `value` to the parameter's declared schema type or throws GatewayError(TypeMismatch).
    static JSONValue Coerce(const Parameter& param, const JSONValue& value);

    const RequestBuilderOptions& Options() const { return opts; }

private:
    RequestBuilderOptions opts;
};

} // namespace apigw::request
