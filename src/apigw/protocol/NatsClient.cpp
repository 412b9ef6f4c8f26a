//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/apigw/protocol/NatsClient.cpp
// Purpose: IBrokerClient over the NATS C client (nats.c)
//==========================================================================================================

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include <nats/nats.h>

#include "logging/Logger.h"
#include "apigw/errors/Errors.h"
#include "NativeClients.hpp"

namespace apigw::protocol {

namespace {

constexpr auto kClosedWait = std::chrono::seconds(2);

errors::GatewayError natsError(natsStatus s, const std::string& context) {
    const std::string msg = context + ": " + natsStatus_GetText(s);
    switch (s) {
        case NATS_TIMEOUT:
            return errors::transportTimeout(msg);
        case NATS_NO_SERVER:
            return errors::transportConnection(msg, errors::reasons::ConnectionRefused);
        case NATS_SSL_ERROR:
            return errors::transportConnection(msg, errors::reasons::Tls);
        default:
            return errors::transportConnection(msg, errors::reasons::Io);
    }
}

class NatsClient final : public IBrokerClient {
public:
    ~NatsClient() override { Disconnect(); }

    void SetConnectionLostCallback(ConnectionLostCallback callback) override {
        std::lock_guard<std::mutex> lock(cbMtx);
        onLost = std::move(callback);
    }

    void Connect(const ServerConfig& server) override {
        std::lock_guard<std::mutex> lock(apiMtx);
        timeoutMs = server.connectTimeoutMs;
        natsOptions* opts = nullptr;
        natsStatus s = natsOptions_Create(&opts);
        if (s == NATS_OK) s = natsOptions_SetURL(opts, server.url.c_str());
        if (s == NATS_OK) s = natsOptions_SetTimeout(opts, static_cast<int64_t>(timeoutMs));
        if (s == NATS_OK) s = natsOptions_SetAllowReconnect(opts, false);
        if (s == NATS_OK) s = natsOptions_SetClosedCB(opts, &NatsClient::onClosed, this);
        if (s == NATS_OK && server.url.rfind("tls://", 0) == 0) s = natsOptions_SetSecure(opts, true);
        if (s == NATS_OK) s = natsConnection_Connect(&conn, opts);
        natsOptions_Destroy(opts);
        if (s != NATS_OK) {
            conn = nullptr;
            throw natsError(s, "nats connect " + server.url);
        }
        {
            std::lock_guard<std::mutex> cbLock(cbMtx);
            closed = false;
            closing = false;
        }
        LOG_INFO("nats: connected to {}", server.url);
    }

    void Publish(const std::string& channel, const std::string& payload) override {
        std::lock_guard<std::mutex> lock(apiMtx);
        requireConnected();
        natsStatus s = natsConnection_Publish(conn, channel.c_str(), payload.data(), static_cast<int>(payload.size()));
        if (s == NATS_OK) {
            s = natsConnection_FlushTimeout(conn, static_cast<int64_t>(timeoutMs));
        }
        if (s != NATS_OK) {
            throw natsError(s, "nats publish " + channel);
        }
    }

    void Subscribe(const std::string& channel, DeliveryCallback callback) override {
        std::lock_guard<std::mutex> lock(apiMtx);
        requireConnected();
        auto entry = std::make_unique<Entry>();
        entry->owner = this;
        entry->channel = channel;
        entry->callback = std::move(callback);
        natsSubscription* sub = nullptr;
        const natsStatus s = natsConnection_Subscribe(&sub, conn, channel.c_str(), &NatsClient::onMessage, entry.get());
        if (s != NATS_OK) {
            throw natsError(s, "nats subscribe " + channel);
        }
        entry->subscription = sub;
        std::unique_ptr<Entry> replaced;
        {
            std::lock_guard<std::mutex> cbLock(cbMtx);
            auto existing = entries.find(channel);
            if (existing != entries.end()) {
                existing->second->active = false;
                replaced = std::move(existing->second);
            }
            entries[channel] = std::move(entry);
        }
        if (replaced) {
            retire(std::move(replaced));
        }
    }

    void Unsubscribe(const std::string& channel) override {
        std::lock_guard<std::mutex> lock(apiMtx);
        std::unique_ptr<Entry> entry;
        {
            std::lock_guard<std::mutex> cbLock(cbMtx);
            auto it = entries.find(channel);
            if (it == entries.end()) {
                return;
            }
            it->second->active = false;
            entry = std::move(it->second);
            entries.erase(it);
        }
        retire(std::move(entry));
    }

    void Disconnect() override {
        std::lock_guard<std::mutex> lock(apiMtx);
        if (!conn) {
            return;
        }
        std::map<std::string, std::unique_ptr<Entry>> open;
        {
            std::lock_guard<std::mutex> cbLock(cbMtx);
            closing = true;
            for (auto& [channel, entry] : entries) {
                entry->active = false;
            }
            open.swap(entries);
        }
        for (auto& [channel, entry] : open) {
            retire(std::move(entry));
        }
        natsConnection_Close(conn);
        {
            // The closed callback holds `this`; wait for it before the object can go away
            std::unique_lock<std::mutex> cbLock(cbMtx);
            if (!closedCv.wait_for(cbLock, kClosedWait, [this] { return closed; })) {
                LOG_WARN("nats: closed notification did not arrive in time");
            }
        }
        natsConnection_Destroy(conn);
        conn = nullptr;
        retired.clear();
    }

private:
    struct Entry {
        NatsClient* owner{nullptr};
        std::string channel;
        DeliveryCallback callback;
        natsSubscription* subscription{nullptr};
        bool active{true};
    };

    void requireConnected() {
        std::lock_guard<std::mutex> cbLock(cbMtx);
        if (!conn || closed) {
            throw errors::transportConnection("nats client is not connected", errors::reasons::Io);
        }
    }

    // Caller holds apiMtx and has cleared entry->active. The entry stays allocated until Disconnect
    // since a message handler may still be running with it.
    void retire(std::unique_ptr<Entry> entry) {
        if (entry->subscription) {
            natsSubscription_Unsubscribe(entry->subscription);
            natsSubscription_Destroy(entry->subscription);
            entry->subscription = nullptr;
        }
        retired.push_back(std::move(entry));
    }

    static void onMessage(natsConnection*, natsSubscription*, natsMsg* msg, void* closure) {
        auto* entry = static_cast<Entry*>(closure);
        const std::string payload(natsMsg_GetData(msg), static_cast<std::size_t>(natsMsg_GetDataLength(msg)));
        natsMsg_Destroy(msg);
        DeliveryCallback callback;
        {
            std::lock_guard<std::mutex> cbLock(entry->owner->cbMtx);
            if (!entry->active) {
                return;
            }
            callback = entry->callback;
        }
        callback(entry->channel, payload);
    }

    static void onClosed(natsConnection*, void* closure) {
        auto* self = static_cast<NatsClient*>(closure);
        ConnectionLostCallback callback;
        {
            std::lock_guard<std::mutex> cbLock(self->cbMtx);
            self->closed = true;
            if (!self->closing) {
                callback = self->onLost;
            }
            self->closedCv.notify_all();
        }
        if (callback) {
            LOG_WARN("nats: connection closed by the server");
            callback("nats connection closed");
        }
    }

    std::mutex apiMtx;
    std::mutex cbMtx;
    std::condition_variable closedCv;
    natsConnection* conn{nullptr};
    unsigned int timeoutMs{30000};
    bool closed{false};
    bool closing{false};
    ConnectionLostCallback onLost;
    std::map<std::string, std::unique_ptr<Entry>> entries;
    std::vector<std::unique_ptr<Entry>> retired; // guarded by apiMtx
};

} // namespace

std::unique_ptr<IBrokerClient> MakeNatsClient() {
    return std::make_unique<NatsClient>();
}

} // namespace apigw::protocol
