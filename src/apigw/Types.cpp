//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Types.cpp
// Purpose: Header helpers, URL encoding, identifiers and timestamps shared by gateway components
//==========================================================================================================

#include <cctype>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

#include "apigw/Types.h"

namespace apigw {

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

const HeaderKV* findHeader(const HeaderList& headers, const std::string& name) {
    for (const auto& h : headers) {
        if (iequals(h.name, name)) {
            return &h;
        }
    }
    return nullptr;
}

void setHeader(HeaderList& headers, const std::string& name, const std::string& value) {
    for (auto& h : headers) {
        if (iequals(h.name, name)) {
            h.value = value;
            return;
        }
    }
    headers.push_back(HeaderKV{name, value});
}

void setHeaderIfAbsent(HeaderList& headers, const std::string& name, const std::string& value) {
    if (!findHeader(headers, name)) {
        headers.push_back(HeaderKV{name, value});
    }
}

bool removeHeader(HeaderList& headers, const std::string& name) {
    const auto before = headers.size();
    std::erase_if(headers, [&name](const HeaderKV& h) { return iequals(h.name, name); });
    return headers.size() != before;
}

std::string percentEncode(const std::string& s) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else {
            oss << '%';
            const char* hex = "0123456789ABCDEF";
            oss << hex[(c >> 4) & 0xFu] << hex[c & 0xFu];
        }
    }
    return oss.str();
}

std::string buildTargetUrl(const WireRequest& request) {
    if (request.query.empty()) {
        return request.url;
    }
    std::string out = request.url;
    char sep = (out.find('?') == std::string::npos) ? '?' : '&';
    for (const auto& [key, value] : request.query) {
        out.push_back(sep);
        out += percentEncode(key);
        out.push_back('=');
        out += percentEncode(value);
        sep = '&';
    }
    return out;
}

std::string generateId() {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dis;
    uint64_t hi = dis(gen);
    uint64_t lo = dis(gen);
    // Version 4, RFC 4122 variant
    hi = (hi & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    lo = (lo & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;
    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(8) << static_cast<uint32_t>(hi >> 32) << '-'
        << std::setw(4) << static_cast<uint32_t>((hi >> 16) & 0xFFFFu) << '-'
        << std::setw(4) << static_cast<uint32_t>(hi & 0xFFFFu) << '-'
        << std::setw(4) << static_cast<uint32_t>(lo >> 48) << '-'
        << std::setw(12) << (lo & 0xFFFFFFFFFFFFull);
    return oss.str();
}

std::string formatTimestamp(TimePoint tp) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm buf{};
    ::gmtime_r(&t, &buf);
    std::ostringstream oss;
    oss << std::put_time(&buf, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << (ms < 0 ? ms + 1000 : ms) << 'Z';
    return oss.str();
}

} // namespace apigw
