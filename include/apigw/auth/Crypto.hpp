//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/apigw/auth/Crypto.hpp
// Purpose: OpenSSL-backed encoding, hashing and randomness helpers for the auth schemes
//==========================================================================================================
#pragma once

#include <cstddef>
#include <string>

namespace apigw::auth {

// Standard base64 with padding.
std::string base64Encode(const std::string& data);

// RFC 4648 base64url without padding.
std::string base64UrlEncode(const std::string& data);

// Raw SHA-256 digest (32 bytes).
std::string sha256(const std::string& data);

// `count` bytes from the OpenSSL CSPRNG, base64url-encoded. Throws GatewayError(Internal) on RNG failure.
std::string randomToken(std::size_t count);

// PKCE S256 challenge: base64url(SHA-256(verifier)) without padding.
std::string pkceChallenge(const std::string& verifier);

// application/x-www-form-urlencoded value encoding (space as '+').
std::string urlEncodeForm(const std::string& s);

} // namespace apigw::auth
