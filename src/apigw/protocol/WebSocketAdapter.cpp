//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/apigw/protocol/WebSocketAdapter.cpp
// Purpose: WebSocket pub/sub adapter using Boost.Beast coroutines (TLS 1.3 only for wss)
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>
#include <vector>

#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "apigw/errors/Errors.h"
#include "apigw/protocol/MessageDispatcher.hpp"
#include "apigw/protocol/Url.hpp"
#include "apigw/protocol/WebSocketAdapter.hpp"
#include "NetErrors.hpp"

namespace apigw::protocol {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp = net::ip::tcp;

namespace {

constexpr unsigned int kCompletionSlackMs = 2000;

//==========================================================================================================
// WsSession
// Purpose: Type-erased websocket over plain TCP or TLS.
//==========================================================================================================
class WsSession {
public:
    virtual ~WsSession() = default;
    virtual net::awaitable<void> open(tcp::resolver::results_type results, UrlParts u, HeaderList headers,
                                      std::chrono::milliseconds budget) = 0;
    virtual net::awaitable<void> write(std::string text) = 0;
    virtual net::awaitable<std::string> read(boost::system::error_code& ec) = 0;
    virtual net::awaitable<void> close() = 0;
};

template <bool Secure>
class BasicWsSession final : public WsSession {
public:
    using NextLayer = std::conditional_t<Secure, beast::ssl_stream<beast::tcp_stream>, beast::tcp_stream>;

    template <class... Args>
    explicit BasicWsSession(Args&&... args) : ws(std::forward<Args>(args)...) {}

    net::awaitable<void> open(tcp::resolver::results_type results, UrlParts u, HeaderList headers,
                              std::chrono::milliseconds budget) override {
        boost::system::error_code ec;
        auto& lowest = beast::get_lowest_layer(ws);
        lowest.expires_after(budget);
        co_await lowest.async_connect(results, net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            throw mapNetworkError(ec, "connect " + u.hostHeader());
        }
        if constexpr (Secure) {
            if (!::SSL_set_tlsext_host_name(ws.next_layer().native_handle(), u.serverName.c_str())) {
                LOG_DEBUG("WSS: SNI set failed for {}", u.serverName);
            }
            (void)::SSL_set1_host(ws.next_layer().native_handle(), u.serverName.c_str());
            co_await ws.next_layer().async_handshake(ssl::stream_base::client, net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                throw errors::transportConnection("TLS handshake with " + u.hostHeader() + " failed: " + ec.message(),
                                                  errors::reasons::Tls);
            }
        }
        lowest.expires_never();

        auto timeouts = websocket::stream_base::timeout::suggested(beast::role_type::client);
        timeouts.handshake_timeout = budget;
        ws.set_option(timeouts);
        ws.set_option(websocket::stream_base::decorator([headers](websocket::request_type& req) {
            for (const auto& h : headers) {
                req.set(h.name, h.value);
            }
        }));
        ws.text(true);
        co_await ws.async_handshake(u.hostHeader(), u.target, net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            throw mapNetworkError(ec, "websocket upgrade " + u.hostHeader() + u.target);
        }
    }

    net::awaitable<void> write(std::string text) override {
        boost::system::error_code ec;
        co_await ws.async_write(net::buffer(text), net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            throw mapNetworkError(ec, "websocket write");
        }
    }

    net::awaitable<std::string> read(boost::system::error_code& ec) override {
        beast::flat_buffer buffer;
        co_await ws.async_read(buffer, net::redirect_error(net::use_awaitable, ec));
        co_return beast::buffers_to_string(buffer.data());
    }

    net::awaitable<void> close() override {
        boost::system::error_code ec;
        co_await ws.async_close(websocket::close_code::normal, net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            LOG_DEBUG("websocket close: {}", ec.message());
        }
    }

private:
    websocket::stream<NextLayer> ws;
};

net::awaitable<void> coWrite(std::shared_ptr<WsSession> session, std::string text) {
    co_await session->write(std::move(text));
}

net::awaitable<void> coClose(std::shared_ptr<WsSession> session) {
    co_await session->close();
}

} // namespace

class WebSocketAdapter::Impl {
public:
    struct Connection {
        std::string key;
        std::string url;
        std::shared_ptr<WsSession> session;
        std::shared_ptr<std::mutex> writeMutex;
    };

    struct Subscription {
        ConnectionHandle connection;
        std::string channel;
        MessageHandler handler;
    };

    WebSocketAdapter::Options opts;
    Clock clock;
    net::io_context ioc;
    std::thread ioThread;
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;
    ssl::context sslCtx{ssl::context::tls_client};
    MessageDispatcher dispatcher{"websocket"};
    std::atomic<bool> stopped{false};

    mutable std::mutex mtx;
    std::map<ConnectionHandle, Connection> connections;
    std::map<std::string, ConnectionHandle> byKey;
    std::map<SubscriptionHandle, Subscription> subscriptions;

    Impl(WebSocketAdapter::Options o, Clock c) : opts(std::move(o)), clock(std::move(c)) {
        ::SSL_CTX_set_min_proto_version(sslCtx.native_handle(), TLS1_3_VERSION);
        ::SSL_CTX_set_max_proto_version(sslCtx.native_handle(), TLS1_3_VERSION);
        boost::system::error_code ec;
        if (!opts.caFile.empty()) {
            sslCtx.load_verify_file(opts.caFile, ec);
        } else if (!opts.caPath.empty()) {
            sslCtx.add_verify_path(opts.caPath, ec);
        } else {
            sslCtx.set_default_verify_paths(ec);
        }
        if (ec) {
            LOG_WARN("WSS: trust store setup failed: {}", ec.message());
        }
        sslCtx.set_verify_mode(opts.verifyPeer ? ssl::verify_peer : ssl::verify_none);

        workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(ioc));
        ioThread = std::thread([this]() {
            try {
                ioc.run();
            } catch (const std::exception& e) {
                LOG_ERROR("WebSocket adapter io thread terminated: {}", e.what());
            }
        });
    }

    ~Impl() { stopIo(); }

    void stopIo() {
        stopped.store(true);
        if (workGuard) {
            workGuard->reset();
            workGuard.reset();
        }
        ioc.stop();
        if (ioThread.joinable() && ioThread.get_id() != std::this_thread::get_id()) {
            ioThread.join();
        }
    }

    // Runs a coroutine on the io thread and waits for it from the calling thread.
    template <class T>
    T runSync(net::awaitable<T> aw, std::chrono::milliseconds timeout, const std::string& what) {
        if (stopped.load()) {
            throw errors::transportConnection("WebSocket adapter is shut down", errors::reasons::Io);
        }
        auto prom = std::make_shared<std::promise<T>>();
        auto fut = prom->get_future();
        if constexpr (std::is_void_v<T>) {
            net::co_spawn(ioc, std::move(aw), [prom](std::exception_ptr e) {
                if (e) prom->set_exception(e); else prom->set_value();
            });
        } else {
            net::co_spawn(ioc, std::move(aw), [prom](std::exception_ptr e, T v) {
                if (e) prom->set_exception(e); else prom->set_value(std::move(v));
            });
        }
        if (fut.wait_for(timeout + std::chrono::milliseconds(kCompletionSlackMs)) != std::future_status::ready) {
            throw errors::transportTimeout(what + " timed out after " + std::to_string(timeout.count()) + " ms");
        }
        return fut.get();
    }

    net::awaitable<std::shared_ptr<WsSession>> coOpen(UrlParts u, HeaderList headers, std::chrono::milliseconds budget) {
        auto ex = co_await net::this_coro::executor;
        boost::system::error_code ec;
        tcp::resolver resolver(ex);
        auto results = co_await resolver.async_resolve(u.host, u.port, net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            throw mapNetworkError(ec, "resolve " + u.host);
        }
        std::shared_ptr<WsSession> session;
        if (u.secure) {
            session = std::make_shared<BasicWsSession<true>>(ex, sslCtx);
        } else {
            session = std::make_shared<BasicWsSession<false>>(ex);
        }
        co_await session->open(results, u, std::move(headers), budget);
        co_return session;
    }

    net::awaitable<void> readLoop(std::shared_ptr<WsSession> session, ConnectionHandle handle) {
        for (;;) {
            boost::system::error_code ec;
            std::string frame = co_await session->read(ec);
            if (ec) {
                LOG_DEBUG("websocket {} read loop ended: {}", handle, ec.message());
                break;
            }
            onFrame(handle, frame);
        }
        evict(handle, session);
    }

    // Drops a connection whose socket is gone so the next Connect opens a fresh one.
    // No-op when the handle was already removed or now refers to another session.
    void evict(const ConnectionHandle& handle, const std::shared_ptr<WsSession>& session) {
        std::size_t dropped = 0;
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto it = connections.find(handle);
            if (it == connections.end() || it->second.session != session) {
                return;
            }
            byKey.erase(it->second.key);
            connections.erase(it);
            dropped = std::erase_if(subscriptions, [&](const auto& kv) { return kv.second.connection == handle; });
        }
        LOG_WARN("websocket {}: connection closed by peer; evicted with {} subscriptions", handle, dropped);
    }

    void onFrame(const ConnectionHandle& handle, const std::string& frame) {
        const JSONValue decoded = decodeFrame(frame);
        const std::string channel = decoded.isObject() ? decoded.getString("channel") : std::string();
        if (channel.empty()) {
            LOG_DEBUG("websocket {}: dropping frame without channel", handle);
            return;
        }
        std::vector<std::pair<SubscriptionHandle, MessageHandler>> targets;
        {
            std::lock_guard<std::mutex> lock(mtx);
            for (const auto& [subId, sub] : subscriptions) {
                if (sub.connection == handle && sub.channel == channel) {
                    targets.emplace_back(subId, sub.handler);
                }
            }
        }
        for (auto& [subId, handler] : targets) {
            InboundMessage msg;
            msg.subscriptionId = subId;
            msg.channel = channel;
            msg.payload = decoded;
            msg.raw = frame;
            dispatcher.Post(std::move(handler), std::move(msg));
        }
    }

    Connection connectionFor(const ConnectionHandle& handle) {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = connections.find(handle);
        if (it == connections.end()) {
            throw errors::transportConnection("websocket: unknown connection " + handle, errors::reasons::Io);
        }
        return it->second;
    }

    void send(const Connection& conn, std::string text) {
        std::lock_guard<std::mutex> writeLock(*conn.writeMutex);
        runSync(coWrite(conn.session, std::move(text)), std::chrono::milliseconds(opts.writeTimeoutMs),
                "websocket write to " + conn.url);
    }

    static std::string controlFrame(const char* type, const std::string& channel, const SubscriptionHandle& subId) {
        JSONValue frame = JSONValue::object();
        frame.set("type", JSONValue(type));
        frame.set("channel", JSONValue(channel));
        frame.set("subscription_id", JSONValue(subId));
        return serializeJSONValue(frame);
    }
};

WebSocketAdapter::WebSocketAdapter() : WebSocketAdapter(Options{}) {}

WebSocketAdapter::WebSocketAdapter(Options opts, Clock clock)
    : pImpl(std::make_unique<Impl>(std::move(opts), std::move(clock))) {}

WebSocketAdapter::~WebSocketAdapter() {
    Shutdown();
}

std::string WebSocketAdapter::Protocol() const { return protocol::WebSocket; }

ConnectionHandle WebSocketAdapter::Connect(const ServerConfig& server) {
    FUNC_SCOPE();
    const std::string key = connectionKey(protocol::WebSocket, server.url);
    {
        std::lock_guard<std::mutex> lock(pImpl->mtx);
        auto it = pImpl->byKey.find(key);
        if (it != pImpl->byKey.end()) {
            return it->second;
        }
    }
    const UrlParts u = parseUrl(server.url);
    if (u.scheme != "ws" && u.scheme != "wss") {
        throw errors::GatewayError(errors::ErrorKind::InvalidConfiguration,
                                   "WebSocket server URL must use ws:// or wss://: " + server.url, server.url);
    }
    const auto budget = std::chrono::milliseconds(server.connectTimeoutMs);
    auto session = pImpl->runSync(pImpl->coOpen(u, server.headers, budget), budget, "websocket connect to " + server.url);
    logAdapterOperation(protocol::WebSocket, "connect", server.url);

    ConnectionHandle handle;
    bool raced = false;
    {
        std::lock_guard<std::mutex> lock(pImpl->mtx);
        auto it = pImpl->byKey.find(key);
        if (it != pImpl->byKey.end()) {
            handle = it->second;
            raced = true;
        } else {
            handle = generateId();
            pImpl->connections.emplace(handle, Impl::Connection{key, server.url, session, std::make_shared<std::mutex>()});
            pImpl->byKey.emplace(key, handle);
        }
    }
    if (raced) {
        net::co_spawn(pImpl->ioc, coClose(session), net::detached);
    } else {
        net::co_spawn(pImpl->ioc, pImpl->readLoop(session, handle), net::detached);
    }
    return handle;
}

std::string WebSocketAdapter::Publish(const ConnectionHandle& connection, const std::string& channel,
                                      const JSONValue& payload, const HeaderList& headers) {
    FUNC_SCOPE();
    const auto conn = pImpl->connectionFor(connection);
    const JSONValue envelope = makeEnvelope(channel, "publish", headers, payload, pImpl->clock());
    pImpl->send(conn, serializeJSONValue(envelope));
    logAdapterOperation(protocol::WebSocket, "publish", channel);
    return envelope.getString("id");
}

SubscriptionHandle WebSocketAdapter::Subscribe(const ConnectionHandle& connection, const std::string& channel,
                                               MessageHandler handler) {
    FUNC_SCOPE();
    const auto conn = pImpl->connectionFor(connection);
    const SubscriptionHandle subId = generateId();
    {
        std::lock_guard<std::mutex> lock(pImpl->mtx);
        pImpl->subscriptions.emplace(subId, Impl::Subscription{connection, channel, std::move(handler)});
    }
    try {
        pImpl->send(conn, Impl::controlFrame("subscribe", channel, subId));
    } catch (const std::exception&) {
        std::lock_guard<std::mutex> lock(pImpl->mtx);
        pImpl->subscriptions.erase(subId);
        throw;
    }
    logAdapterOperation(protocol::WebSocket, "subscribe", channel);
    return subId;
}

void WebSocketAdapter::Unsubscribe(const SubscriptionHandle& subscription) {
    FUNC_SCOPE();
    Impl::Subscription sub;
    std::optional<Impl::Connection> conn;
    {
        std::lock_guard<std::mutex> lock(pImpl->mtx);
        auto it = pImpl->subscriptions.find(subscription);
        if (it == pImpl->subscriptions.end()) {
            return;
        }
        sub = std::move(it->second);
        pImpl->subscriptions.erase(it);
        auto c = pImpl->connections.find(sub.connection);
        if (c != pImpl->connections.end()) {
            conn = c->second;
        }
    }
    if (conn) {
        try {
            pImpl->send(*conn, Impl::controlFrame("unsubscribe", sub.channel, subscription));
        } catch (const std::exception& e) {
            LOG_WARN("websocket: unsubscribe frame for {} not sent: {}", sub.channel, e.what());
        }
    }
    logAdapterOperation(protocol::WebSocket, "unsubscribe", sub.channel);
}

void WebSocketAdapter::Disconnect(const ConnectionHandle& connection) {
    FUNC_SCOPE();
    std::vector<SubscriptionHandle> subs;
    {
        std::lock_guard<std::mutex> lock(pImpl->mtx);
        if (pImpl->connections.find(connection) == pImpl->connections.end()) {
            return;
        }
        for (const auto& [subId, sub] : pImpl->subscriptions) {
            if (sub.connection == connection) {
                subs.push_back(subId);
            }
        }
    }
    for (const auto& subId : subs) {
        Unsubscribe(subId);
    }

    Impl::Connection conn;
    {
        std::lock_guard<std::mutex> lock(pImpl->mtx);
        auto it = pImpl->connections.find(connection);
        if (it == pImpl->connections.end()) {
            return;
        }
        conn = it->second;
        pImpl->byKey.erase(it->second.key);
        pImpl->connections.erase(it);
    }
    if (!pImpl->stopped.load()) {
        std::lock_guard<std::mutex> writeLock(*conn.writeMutex);
        try {
            pImpl->runSync(coClose(conn.session), std::chrono::milliseconds(pImpl->opts.writeTimeoutMs),
                           "websocket close of " + conn.url);
        } catch (const std::exception& e) {
            LOG_WARN("websocket: close of {} failed: {}", conn.url, e.what());
        }
    }
    logAdapterOperation(protocol::WebSocket, "disconnect", conn.url);
}

void WebSocketAdapter::Shutdown() {
    FUNC_SCOPE();
    std::vector<ConnectionHandle> handles;
    {
        std::lock_guard<std::mutex> lock(pImpl->mtx);
        for (const auto& kv : pImpl->connections) {
            handles.push_back(kv.first);
        }
    }
    for (const auto& h : handles) {
        Disconnect(h);
    }
    pImpl->dispatcher.Stop();
    pImpl->stopIo();
}

std::size_t WebSocketAdapter::ConnectionCount() const {
    std::lock_guard<std::mutex> lock(pImpl->mtx);
    return pImpl->connections.size();
}

} // namespace apigw::protocol
