//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/apigw/protocol/NetErrors.hpp
// Purpose: Maps Boost.Asio/Beast error codes onto transport GatewayErrors (internal to the adapters)
//==========================================================================================================
#pragma once

#include <string>

#include <utility>

#include <boost/asio/error.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/system/error_code.hpp>

#include "apigw/errors/Errors.h"

namespace apigw::protocol {

inline errors::GatewayError mapNetworkError(const boost::system::error_code& ec, const std::string& context) {
    namespace net = boost::asio;
    const std::string msg = context + ": " + ec.message();
    if (ec == boost::beast::error::timeout || ec == net::error::timed_out) {
        return errors::transportTimeout(msg);
    }
    if (ec == net::error::host_not_found || ec == net::error::host_not_found_try_again ||
        ec == net::error::no_data || ec == net::error::no_recovery) {
        return errors::transportConnection(msg, errors::reasons::DnsFailure);
    }
    if (ec == net::error::connection_refused) {
        return errors::transportConnection(msg, errors::reasons::ConnectionRefused);
    }
    if (ec.category() == net::error::get_ssl_category() || ec == net::ssl::error::stream_truncated) {
        return errors::transportConnection(msg, errors::reasons::Tls);
    }
    return errors::transportConnection(msg, errors::reasons::Io);
}

} // namespace apigw::protocol
