//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/apigw/auth/Crypto.cpp
// Purpose: Crypto helper implementation over OpenSSL (EVP_EncodeBlock, SHA256, RAND_bytes)
//==========================================================================================================

#include <sstream>
#include <vector>

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include "apigw/auth/Crypto.hpp"
#include "apigw/errors/Errors.h"

namespace apigw::auth {

std::string base64Encode(const std::string& data) {
    if (data.empty()) {
        return std::string();
    }
    std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
    const int n = ::EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(data.data()),
                                    static_cast<int>(data.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(n));
}

std::string base64UrlEncode(const std::string& data) {
    std::string s = base64Encode(data);
    for (auto& c : s) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    while (!s.empty() && s.back() == '=') {
        s.pop_back();
    }
    return s;
}

std::string sha256(const std::string& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    ::SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest);
    return std::string(reinterpret_cast<const char*>(digest), SHA256_DIGEST_LENGTH);
}

std::string randomToken(std::size_t count) {
    std::string bytes(count, '\0');
    if (::RAND_bytes(reinterpret_cast<unsigned char*>(bytes.data()), static_cast<int>(count)) != 1) {
        throw errors::GatewayError(errors::ErrorKind::Internal, "OpenSSL RAND_bytes failed");
    }
    return base64UrlEncode(bytes);
}

std::string pkceChallenge(const std::string& verifier) {
    return base64UrlEncode(sha256(verifier));
}

std::string urlEncodeForm(const std::string& s) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else if (c == ' ') {
            oss << '+';
        } else {
            oss << '%';
            const char* hex = "0123456789ABCDEF";
            oss << hex[(c >> 4) & 0xFu] << hex[c & 0xFu];
        }
    }
    return oss.str();
}

} // namespace apigw::auth
