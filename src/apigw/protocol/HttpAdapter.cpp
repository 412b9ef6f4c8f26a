//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/apigw/protocol/HttpAdapter.cpp
// Purpose: HTTP/HTTPS request/response adapter using Boost.Beast coroutines (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <thread>

#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "apigw/errors/Errors.h"
#include "apigw/protocol/HttpAdapter.hpp"
#include "apigw/protocol/Url.hpp"
#include "NetErrors.hpp"

namespace apigw::protocol {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

// Extra wait on top of the request timeout before the caller gives up on the coroutine.
constexpr unsigned int kCompletionSlackMs = 2000;

std::string toStd(beast::string_view sv) {
    return std::string(sv.data(), sv.size());
}

} // namespace

bool isJsonContentType(const std::string& contentType) {
    std::string ct = contentType.substr(0, contentType.find(';'));
    std::transform(ct.begin(), ct.end(), ct.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    ct.erase(0, ct.find_first_not_of(" \t"));
    ct.erase(ct.find_last_not_of(" \t") + 1);
    return ct == "application/json" || (ct.size() > 5 && ct.compare(ct.size() - 5, 5, "+json") == 0);
}

class HttpAdapter::Impl {
public:
    HttpAdapter::Options opts;
    net::io_context ioc;
    std::thread ioThread;
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;
    std::unique_ptr<ssl::context> sslCtx;
    std::atomic<bool> stopped{false};
    std::mutex stopMutex;

    explicit Impl(HttpAdapter::Options o) : opts(std::move(o)) {
        sslCtx = std::make_unique<ssl::context>(ssl::context::tls_client);
        ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
        ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
        if (!opts.caFile.empty() || !opts.caPath.empty()) {
            boost::system::error_code ec;
            if (!opts.caFile.empty()) {
                sslCtx->load_verify_file(opts.caFile, ec);
            }
            if (!ec && !opts.caPath.empty()) {
                sslCtx->add_verify_path(opts.caPath, ec);
            }
            if (ec) {
                LOG_WARN("HTTPS: failed to load CA file/path: {}", ec.message());
            }
        } else {
            boost::system::error_code ec;
            sslCtx->set_default_verify_paths(ec);
            if (ec) {
                LOG_DEBUG("HTTPS: set_default_verify_paths failed: {}", ec.message());
            }
        }
        sslCtx->set_verify_mode(opts.verifyPeer ? ssl::verify_peer : ssl::verify_none);

        workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(ioc));
        ioThread = std::thread([this]() {
            try {
                ioc.run();
            } catch (const std::exception& e) {
                LOG_ERROR("HTTP adapter io thread terminated: {}", e.what());
            }
        });
    }

    ~Impl() { stop(); }

    void stop() {
        std::lock_guard<std::mutex> lk(stopMutex);
        stopped.store(true);
        if (workGuard) {
            workGuard->reset();
            workGuard.reset();
        }
        ioc.stop();
        if (ioThread.joinable()) {
            ioThread.join();
        }
    }

    static http::request<http::string_body> buildHttpRequest(const WireRequest& req, const UrlParts& u) {
        http::request<http::string_body> hreq;
        hreq.version(11);
        hreq.target(u.target);
        const http::verb verb = http::string_to_verb(req.method);
        if (verb == http::verb::unknown) {
            hreq.method_string(req.method);
        } else {
            hreq.method(verb);
        }
        for (const auto& h : req.headers) {
            hreq.insert(h.name, h.value);
        }
        if (!findHeader(req.headers, "Host")) {
            hreq.set(http::field::host, u.hostHeader());
        }
        hreq.set(http::field::connection, "close");
        if (req.body) {
            const HeaderKV* ct = findHeader(req.headers, "Content-Type");
            if (req.body->isString() && ct && !isJsonContentType(ct->value)) {
                hreq.body() = req.body->asString();
            } else {
                hreq.body() = serializeJSONValue(*req.body);
            }
        }
        hreq.prepare_payload();
        return hreq;
    }

    static WireResponse toWireResponse(const http::response<http::string_body>& res) {
        WireResponse out;
        out.status = static_cast<int>(res.result_int());
        for (const auto& field : res) {
            out.headers.push_back({toStd(field.name_string()), toStd(field.value())});
        }
        out.rawBody = res.body();
        const std::string contentType = toStd(res[http::field::content_type]);
        if (!out.rawBody.empty() && isJsonContentType(contentType)) {
            try {
                out.body = parseJSON(out.rawBody);
                out.structured = true;
            } catch (const std::exception& e) {
                LOG_DEBUG("HTTP adapter: JSON body did not parse ({}); keeping raw text", e.what());
                out.body = JSONValue(out.rawBody);
            }
        } else {
            out.body = JSONValue(out.rawBody);
        }
        return out;
    }

    net::awaitable<WireResponse> coExecute(WireRequest req) {
        const UrlParts u = parseUrl(buildTargetUrl(req));
        const auto connectBudget = std::chrono::milliseconds(std::min(opts.connectTimeoutMs, req.timeoutMs));
        const auto ioBudget = std::chrono::milliseconds(req.timeoutMs);
        auto ex = co_await net::this_coro::executor;
        boost::system::error_code ec;

        tcp::resolver resolver(ex);
        auto results = co_await resolver.async_resolve(u.host, u.port, net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            throw mapNetworkError(ec, "resolve " + u.host);
        }
        LOG_DEBUG("HTTP adapter: resolved {}:{} target={}", u.host, u.port, u.target);

        http::request<http::string_body> hreq = buildHttpRequest(req, u);
        http::response<http::string_body> res;
        beast::flat_buffer buffer;

        if (u.secure) {
            beast::ssl_stream<beast::tcp_stream> stream(ex, *sslCtx);
            if (!::SSL_set_tlsext_host_name(stream.native_handle(), u.serverName.c_str())) {
                LOG_DEBUG("HTTPS: SNI set failed for {}", u.serverName);
            }
            if (opts.verifyPeer) {
                (void)::SSL_set1_host(stream.native_handle(), u.serverName.c_str());
            }
            stream.next_layer().expires_after(connectBudget);
            co_await stream.next_layer().async_connect(results, net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                throw mapNetworkError(ec, "connect " + u.hostHeader());
            }
            co_await stream.async_handshake(ssl::stream_base::client, net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                throw errors::transportConnection("TLS handshake with " + u.hostHeader() + " failed: " + ec.message(),
                                                  ec == beast::error::timeout ? errors::reasons::Timeout : errors::reasons::Tls);
            }
            stream.next_layer().expires_after(ioBudget);
            co_await http::async_write(stream, hreq, net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                throw mapNetworkError(ec, "write " + u.hostHeader());
            }
            co_await http::async_read(stream, buffer, res, net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                throw mapNetworkError(ec, "read " + u.hostHeader());
            }
            stream.next_layer().expires_after(std::chrono::seconds(2));
            co_await stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
        } else {
            beast::tcp_stream stream(ex);
            stream.expires_after(connectBudget);
            co_await stream.async_connect(results, net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                throw mapNetworkError(ec, "connect " + u.hostHeader());
            }
            stream.expires_after(ioBudget);
            co_await http::async_write(stream, hreq, net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                throw mapNetworkError(ec, "write " + u.hostHeader());
            }
            co_await http::async_read(stream, buffer, res, net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                throw mapNetworkError(ec, "read " + u.hostHeader());
            }
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        }
        co_return toWireResponse(res);
    }
};

HttpAdapter::HttpAdapter() : HttpAdapter(Options{}) {}

HttpAdapter::HttpAdapter(Options opts) : pImpl(std::make_unique<Impl>(std::move(opts))) {}

HttpAdapter::~HttpAdapter() = default;

std::string HttpAdapter::Protocol() const { return protocol::Http; }

void HttpAdapter::Shutdown() {
    FUNC_SCOPE();
    pImpl->stop();
}

WireResponse HttpAdapter::Execute(const WireRequest& request) {
    FUNC_SCOPE();
    if (pImpl->stopped.load()) {
        throw errors::transportConnection("HTTP adapter is shut down", errors::reasons::Io);
    }
    const UrlParts target = parseUrl(request.url);
    if (target.scheme != "http" && target.scheme != "https") {
        throw errors::GatewayError(errors::ErrorKind::InvalidConfiguration,
                                   "Unsupported URL scheme for HTTP: " + target.scheme, request.url);
    }
    logAdapterOperation(protocol::Http, request.method, request.url);

    auto prom = std::make_shared<std::promise<WireResponse>>();
    auto fut = prom->get_future();
    net::co_spawn(pImpl->ioc, pImpl->coExecute(request), [prom](std::exception_ptr e, WireResponse r) {
        if (e) {
            prom->set_exception(e);
        } else {
            prom->set_value(std::move(r));
        }
    });

    const auto budget = std::chrono::milliseconds(request.timeoutMs) + std::chrono::milliseconds(kCompletionSlackMs);
    if (fut.wait_for(budget) != std::future_status::ready) {
        throw errors::transportTimeout("HTTP request to " + request.url + " timed out after " +
                                       std::to_string(request.timeoutMs) + " ms");
    }
    return fut.get();
}

} // namespace apigw::protocol
