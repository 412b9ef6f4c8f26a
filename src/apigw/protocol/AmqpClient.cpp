//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/apigw/protocol/AmqpClient.cpp
// Purpose: IBrokerClient over rabbitmq-c. Publishes go to the default exchange with the channel as
//          routing key; each subscription declares a queue named after the channel and consumes it.
//==========================================================================================================

#include <atomic>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

#include <sys/time.h>

#include <rabbitmq-c/amqp.h>
#include <rabbitmq-c/ssl_socket.h>
#include <rabbitmq-c/tcp_socket.h>

#include "logging/Logger.h"
#include "apigw/errors/Errors.h"
#include "apigw/protocol/Url.hpp"
#include "NativeClients.hpp"

namespace apigw::protocol {

namespace {

constexpr int kFrameMax = 131072;
constexpr long kConsumeWaitUsec = 100000;
constexpr amqp_channel_t kPublishChannel = 1;

errors::GatewayError statusError(int status, const std::string& context) {
    const std::string msg = context + ": " + amqp_error_string2(status);
    switch (status) {
        case AMQP_STATUS_TIMEOUT:
            return errors::transportTimeout(msg);
        case AMQP_STATUS_HOSTNAME_RESOLUTION_FAILED:
            return errors::transportConnection(msg, errors::reasons::DnsFailure);
        case AMQP_STATUS_SOCKET_ERROR:
            return errors::transportConnection(msg, errors::reasons::ConnectionRefused);
        case AMQP_STATUS_SSL_ERROR:
        case AMQP_STATUS_SSL_HOSTNAME_VERIFY_FAILED:
        case AMQP_STATUS_SSL_PEER_VERIFY_FAILED:
        case AMQP_STATUS_SSL_CONNECTION_FAILED:
            return errors::transportConnection(msg, errors::reasons::Tls);
        default:
            return errors::transportConnection(msg, errors::reasons::Io);
    }
}

void checkReply(const amqp_rpc_reply_t& reply, const std::string& context) {
    switch (reply.reply_type) {
        case AMQP_RESPONSE_NORMAL:
            return;
        case AMQP_RESPONSE_LIBRARY_EXCEPTION:
            throw statusError(reply.library_error, context);
        case AMQP_RESPONSE_SERVER_EXCEPTION:
            throw errors::transportConnection(context + ": broker closed the channel (method " +
                                                  std::to_string(reply.reply.id) + ")",
                                              errors::reasons::Io);
        default:
            throw errors::transportConnection(context + ": missing RPC reply", errors::reasons::Io);
    }
}

std::string toString(const amqp_bytes_t& bytes) {
    return std::string(static_cast<const char*>(bytes.bytes), bytes.len);
}

amqp_bytes_t toBytes(const std::string& s) {
    amqp_bytes_t b;
    b.len = s.size();
    b.bytes = const_cast<char*>(s.data());
    return b;
}

// One AMQP connection with channel kPublishChannel open. Not thread-safe; callers serialize access.
class AmqpSession {
public:
    AmqpSession() = default;
    AmqpSession(const AmqpSession&) = delete;
    AmqpSession& operator=(const AmqpSession&) = delete;
    ~AmqpSession() { close(false); }

    void open(const std::string& url, unsigned int timeoutMs) {
        std::vector<char> buffer(url.begin(), url.end());
        buffer.push_back('\0');
        amqp_connection_info info;
        if (amqp_parse_url(buffer.data(), &info) != AMQP_STATUS_OK) {
            throw errors::GatewayError(errors::ErrorKind::InvalidConfiguration, "Malformed AMQP URL: " + url, url);
        }
        conn = amqp_new_connection();
        amqp_socket_t* socket = info.ssl ? amqp_ssl_socket_new(conn) : amqp_tcp_socket_new(conn);
        if (!socket) {
            close(false);
            throw errors::transportConnection("amqp: cannot create socket for " + url, errors::reasons::Io);
        }
        if (info.ssl) {
            amqp_ssl_socket_set_verify_peer(socket, 1);
            amqp_ssl_socket_set_verify_hostname(socket, 1);
        }
        struct timeval timeout;
        timeout.tv_sec = static_cast<long>(timeoutMs / 1000);
        timeout.tv_usec = static_cast<long>((timeoutMs % 1000) * 1000);
        const int status = amqp_socket_open_noblock(socket, info.host, info.port, &timeout);
        if (status != AMQP_STATUS_OK) {
            close(false);
            throw statusError(status, std::string("amqp connect ") + info.host);
        }
        try {
            checkReply(amqp_login(conn, info.vhost, 0, kFrameMax, 0, AMQP_SASL_METHOD_PLAIN, info.user, info.password),
                       "amqp login");
            amqp_channel_open(conn, kPublishChannel);
            checkReply(amqp_get_rpc_reply(conn), "amqp channel open");
        } catch (const errors::GatewayError&) {
            close(false);
            throw;
        }
    }

    void close(bool graceful) {
        if (!conn) {
            return;
        }
        if (graceful) {
            amqp_channel_close(conn, kPublishChannel, AMQP_REPLY_SUCCESS);
            amqp_connection_close(conn, AMQP_REPLY_SUCCESS);
        }
        amqp_destroy_connection(conn);
        conn = nullptr;
    }

    amqp_connection_state_t conn{nullptr};
};

class AmqpClient final : public IBrokerClient {
public:
    ~AmqpClient() override { Disconnect(); }

    void SetConnectionLostCallback(ConnectionLostCallback callback) override {
        std::lock_guard<std::mutex> lock(cbMtx);
        onLost = std::move(callback);
    }

    void Connect(const ServerConfig& server) override {
        const UrlParts url = parseUrl(server.url);
        std::lock_guard<std::mutex> lock(apiMtx);
        {
            std::lock_guard<std::mutex> pubLock(publishMtx);
            publisher.open(server.url, server.connectTimeoutMs);
        }
        try {
            std::lock_guard<std::mutex> conLock(consumeMtx);
            consumer.open(server.url, server.connectTimeoutMs);
        } catch (const errors::GatewayError&) {
            std::lock_guard<std::mutex> pubLock(publishMtx);
            publisher.close(true);
            throw;
        }
        LOG_INFO("amqp: connected to {}:{}", url.host, url.port);
        worker = std::jthread([this](std::stop_token st) { consumeLoop(st); });
    }

    void Publish(const std::string& channel, const std::string& payload) override {
        std::lock_guard<std::mutex> pubLock(publishMtx);
        if (!publisher.conn || lost.load()) {
            throw errors::transportConnection("amqp client is not connected", errors::reasons::Io);
        }
        amqp_basic_properties_t props;
        props._flags = AMQP_BASIC_CONTENT_TYPE_FLAG;
        props.content_type = amqp_cstring_bytes("application/json");
        const int status = amqp_basic_publish(publisher.conn, kPublishChannel, amqp_empty_bytes, toBytes(channel), 0, 0,
                                              &props, toBytes(payload));
        if (status != AMQP_STATUS_OK) {
            if (status == AMQP_STATUS_SOCKET_ERROR || status == AMQP_STATUS_CONNECTION_CLOSED) {
                reportLost(amqp_error_string2(status));
            }
            throw statusError(status, "amqp publish " + channel);
        }
    }

    void Subscribe(const std::string& channel, DeliveryCallback callback) override {
        std::lock_guard<std::mutex> conLock(consumeMtx);
        if (!consumer.conn || lost.load()) {
            throw errors::transportConnection("amqp client is not connected", errors::reasons::Io);
        }
        // A channel per subscription keeps deliveries for other consumers out of this RPC
        const amqp_channel_t ch = nextChannel++;
        amqp_channel_open(consumer.conn, ch);
        checkReply(amqp_get_rpc_reply(consumer.conn), "amqp channel open");
        amqp_queue_declare(consumer.conn, ch, toBytes(channel), 0, 0, 0, 0, amqp_empty_table);
        checkReply(amqp_get_rpc_reply(consumer.conn), "amqp queue declare " + channel);
        amqp_basic_consume_ok_t* ok =
            amqp_basic_consume(consumer.conn, ch, toBytes(channel), amqp_empty_bytes, 0, 1, 0, amqp_empty_table);
        checkReply(amqp_get_rpc_reply(consumer.conn), "amqp consume " + channel);

        std::lock_guard<std::mutex> cbLock(cbMtx);
        consumers[channel] = Consumer{ch, toString(ok->consumer_tag), std::move(callback)};
    }

    void Unsubscribe(const std::string& channel) override {
        std::lock_guard<std::mutex> conLock(consumeMtx);
        Consumer c;
        {
            std::lock_guard<std::mutex> cbLock(cbMtx);
            auto it = consumers.find(channel);
            if (it == consumers.end()) {
                return;
            }
            c = std::move(it->second);
            consumers.erase(it);
        }
        if (!consumer.conn || lost.load()) {
            return;
        }
        amqp_basic_cancel(consumer.conn, c.amqpChannel, toBytes(c.tag));
        amqp_channel_close(consumer.conn, c.amqpChannel, AMQP_REPLY_SUCCESS);
        const amqp_rpc_reply_t reply = amqp_get_rpc_reply(consumer.conn);
        if (reply.reply_type != AMQP_RESPONSE_NORMAL) {
            LOG_WARN("amqp: closing the consumer of {} did not complete cleanly", channel);
        }
    }

    void Disconnect() override {
        std::lock_guard<std::mutex> lock(apiMtx);
        if (worker.joinable()) {
            worker.request_stop();
            worker.join();
        }
        const bool graceful = !lost.load();
        {
            std::lock_guard<std::mutex> conLock(consumeMtx);
            consumer.close(graceful);
        }
        {
            std::lock_guard<std::mutex> pubLock(publishMtx);
            publisher.close(graceful);
        }
        std::lock_guard<std::mutex> cbLock(cbMtx);
        consumers.clear();
    }

private:
    struct Consumer {
        amqp_channel_t amqpChannel{0};
        std::string tag;
        DeliveryCallback callback;
    };

    void consumeLoop(std::stop_token st) {
        while (!st.stop_requested()) {
            std::string tag;
            std::string body;
            {
                std::lock_guard<std::mutex> conLock(consumeMtx);
                if (!consumer.conn) {
                    return;
                }
                amqp_maybe_release_buffers(consumer.conn);
                amqp_envelope_t envelope;
                struct timeval wait;
                wait.tv_sec = 0;
                wait.tv_usec = kConsumeWaitUsec;
                const amqp_rpc_reply_t res = amqp_consume_message(consumer.conn, &envelope, &wait, 0);
                if (res.reply_type == AMQP_RESPONSE_NORMAL) {
                    tag = toString(envelope.consumer_tag);
                    body = toString(envelope.message.body);
                    amqp_destroy_envelope(&envelope);
                } else if (res.reply_type == AMQP_RESPONSE_LIBRARY_EXCEPTION &&
                           res.library_error == AMQP_STATUS_TIMEOUT) {
                    continue;
                } else if (res.reply_type == AMQP_RESPONSE_LIBRARY_EXCEPTION &&
                           res.library_error == AMQP_STATUS_UNEXPECTED_STATE) {
                    if (!drainFrame()) {
                        break;
                    }
                    continue;
                } else {
                    const int status = res.reply_type == AMQP_RESPONSE_LIBRARY_EXCEPTION ? res.library_error
                                                                                        : AMQP_STATUS_CONNECTION_CLOSED;
                    reportLost(amqp_error_string2(status));
                    break;
                }
            }
            dispatch(tag, body);
        }
    }

    // Reads the non-delivery frame behind AMQP_STATUS_UNEXPECTED_STATE; false when it ends the connection.
    bool drainFrame() {
        amqp_frame_t frame;
        struct timeval wait;
        wait.tv_sec = 0;
        wait.tv_usec = kConsumeWaitUsec;
        const int status = amqp_simple_wait_frame_noblock(consumer.conn, &frame, &wait);
        if (status == AMQP_STATUS_TIMEOUT) {
            return true;
        }
        if (status != AMQP_STATUS_OK) {
            reportLost(amqp_error_string2(status));
            return false;
        }
        if (frame.frame_type == AMQP_FRAME_METHOD && frame.payload.method.id == AMQP_CONNECTION_CLOSE_METHOD) {
            reportLost("broker closed the connection");
            return false;
        }
        if (frame.frame_type == AMQP_FRAME_METHOD && frame.payload.method.id == AMQP_CHANNEL_CLOSE_METHOD) {
            LOG_WARN("amqp: broker closed channel {}", frame.channel);
        }
        return true;
    }

    void dispatch(const std::string& tag, const std::string& body) {
        std::string channel;
        DeliveryCallback callback;
        {
            std::lock_guard<std::mutex> cbLock(cbMtx);
            for (const auto& [name, c] : consumers) {
                if (c.tag == tag) {
                    channel = name;
                    callback = c.callback;
                    break;
                }
            }
        }
        if (callback) {
            callback(channel, body);
        }
    }

    void reportLost(const std::string& reason) {
        if (lost.exchange(true)) {
            return;
        }
        ConnectionLostCallback callback;
        {
            std::lock_guard<std::mutex> cbLock(cbMtx);
            callback = onLost;
        }
        LOG_WARN("amqp: connection lost: {}", reason);
        if (callback) {
            callback(reason);
        }
    }

    // Lock order: apiMtx, consumeMtx, publishMtx, cbMtx
    std::mutex apiMtx;
    std::mutex consumeMtx;
    std::mutex publishMtx;
    std::mutex cbMtx;
    AmqpSession publisher;
    AmqpSession consumer;
    amqp_channel_t nextChannel{kPublishChannel + 1};
    std::atomic<bool> lost{false};
    ConnectionLostCallback onLost;
    std::map<std::string, Consumer> consumers;
    std::jthread worker;
};

} // namespace

std::unique_ptr<IBrokerClient> MakeAmqpClient() {
    return std::make_unique<AmqpClient>();
}

} // namespace apigw::protocol
