//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/apigw/protocol/HttpAdapter.hpp
// Purpose: Coroutine-based HTTP/HTTPS request/response adapter using Boost.Beast (TLS 1.3 for HTTPS)
//==========================================================================================================
#pragma once

#include <memory>
#include <string>

#include "apigw/protocol/IProtocolAdapter.hpp"

namespace apigw::protocol {

//==========================================================================================================
// HttpAdapter
// Purpose: Executes WireRequests over plain TCP or TLS on a private io_context thread.
// Notes:
//   - Any HTTP status is a structural success; interpretation is left to the caller.
//   - JSON content types (application/json, *+json) are decoded into WireResponse::body.
//   - A string body with a non-JSON Content-Type is sent verbatim (form posts); other bodies are
//     serialized as JSON.
//==========================================================================================================
class HttpAdapter final : public IRequestResponseAdapter {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   connectTimeoutMs: Bound for resolve + connect (+ TLS handshake), capped by the request timeout.
    //   caFile/caPath: Optional trust store; system defaults are used when both are empty.
    //   verifyPeer: Certificate verification for HTTPS (default: on).
    //==========================================================================================================
    struct Options {
        unsigned int connectTimeoutMs{30000};
        std::string caFile;
        std::string caPath;
        bool verifyPeer{true};
    };

    HttpAdapter();
    explicit HttpAdapter(Options opts);
    ~HttpAdapter() override;

    std::string Protocol() const override;
    void Shutdown() override;
    WireResponse Execute(const WireRequest& request) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// True for application/json and structured-syntax "+json" media types.
bool isJsonContentType(const std::string& contentType);

} // namespace apigw::protocol
