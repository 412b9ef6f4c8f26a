//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/apigw/protocol/MqttClient.cpp
// Purpose: IBrokerClient over the Eclipse Paho MQTT C synchronous client
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <vector>

#include <MQTTClient.h>

#include "logging/Logger.h"
#include "apigw/Types.h"
#include "apigw/errors/Errors.h"
#include "apigw/protocol/Url.hpp"
#include "NativeClients.hpp"

namespace apigw::protocol {

namespace {

constexpr int kQos = 0;
constexpr int kKeepAliveSeconds = 30;
constexpr int kDisconnectTimeoutMs = 1000;

// MQTT topic filter match: '+' is one level, a trailing '#' any remainder.
bool topicMatches(const std::string& filter, const std::string& topic) {
    std::size_t f = 0;
    std::size_t t = 0;
    while (f <= filter.size()) {
        const std::size_t fEnd = std::min(filter.find('/', f), filter.size());
        const std::string level = filter.substr(f, fEnd - f);
        if (level == "#") {
            return true;
        }
        if (t > topic.size()) {
            return false;
        }
        const std::size_t tEnd = std::min(topic.find('/', t), topic.size());
        if (level != "+" && level != topic.substr(t, tEnd - t)) {
            return false;
        }
        f = fEnd + 1;
        t = tEnd + 1;
    }
    return t > topic.size();
}

errors::GatewayError pahoError(int rc, const std::string& context) {
    const char* text = MQTTClient_strerror(rc);
    const std::string msg = context + ": " + (text ? text : "error " + std::to_string(rc));
    // Positive codes are CONNACK refusals from the broker
    return errors::transportConnection(msg, rc > 0 ? errors::reasons::ConnectionRefused : errors::reasons::Io);
}

class MqttClient final : public IBrokerClient {
public:
    ~MqttClient() override { Disconnect(); }

    void SetConnectionLostCallback(ConnectionLostCallback callback) override {
        std::lock_guard<std::mutex> lock(cbMtx);
        onLost = std::move(callback);
    }

    void Connect(const ServerConfig& server) override {
        const UrlParts url = parseUrl(server.url);
        const bool tls = url.scheme == "mqtts" || url.scheme == "ssl";
        const std::string host = url.host.find(':') != std::string::npos ? "[" + url.host + "]" : url.host;
        const std::string uri = std::string(tls ? "ssl://" : "tcp://") + host + ":" + url.port;
        const std::string clientId = "apigw-" + generateId();

        std::lock_guard<std::mutex> lock(apiMtx);
        int rc = MQTTClient_create(&client, uri.c_str(), clientId.c_str(), MQTTCLIENT_PERSISTENCE_NONE, nullptr);
        if (rc != MQTTCLIENT_SUCCESS) {
            client = nullptr;
            throw pahoError(rc, "mqtt create " + uri);
        }
        rc = MQTTClient_setCallbacks(client, this, &MqttClient::connectionLost, &MqttClient::messageArrived, nullptr);
        if (rc != MQTTCLIENT_SUCCESS) {
            MQTTClient_destroy(&client);
            throw pahoError(rc, "mqtt callbacks " + uri);
        }

        MQTTClient_connectOptions opts = MQTTClient_connectOptions_initializer;
        opts.keepAliveInterval = kKeepAliveSeconds;
        opts.cleansession = 1;
        opts.connectTimeout = static_cast<int>(std::max(1u, (server.connectTimeoutMs + 999) / 1000));
        if (!url.user.empty()) {
            opts.username = url.user.c_str();
            opts.password = url.password.c_str();
        }
        MQTTClient_SSLOptions ssl = MQTTClient_SSLOptions_initializer;
        if (tls) {
            ssl.enableServerCertAuth = 1;
            opts.ssl = &ssl;
        }
        rc = MQTTClient_connect(client, &opts);
        if (rc != MQTTCLIENT_SUCCESS) {
            MQTTClient_destroy(&client);
            throw pahoError(rc, "mqtt connect " + uri);
        }
        connected.store(true);
        LOG_INFO("mqtt: connected to {} as {}", uri, clientId);
    }

    void Publish(const std::string& channel, const std::string& payload) override {
        std::lock_guard<std::mutex> lock(apiMtx);
        requireConnected();
        MQTTClient_deliveryToken token = 0;
        const int rc = MQTTClient_publish(client, channel.c_str(), static_cast<int>(payload.size()), payload.data(),
                                          kQos, 0, &token);
        if (rc != MQTTCLIENT_SUCCESS) {
            throw pahoError(rc, "mqtt publish " + channel);
        }
    }

    void Subscribe(const std::string& channel, DeliveryCallback callback) override {
        std::lock_guard<std::mutex> lock(apiMtx);
        requireConnected();
        {
            std::lock_guard<std::mutex> cbLock(cbMtx);
            callbacks[channel] = std::move(callback);
        }
        const int rc = MQTTClient_subscribe(client, channel.c_str(), kQos);
        if (rc != MQTTCLIENT_SUCCESS) {
            std::lock_guard<std::mutex> cbLock(cbMtx);
            callbacks.erase(channel);
            throw pahoError(rc, "mqtt subscribe " + channel);
        }
    }

    void Unsubscribe(const std::string& channel) override {
        std::lock_guard<std::mutex> lock(apiMtx);
        {
            std::lock_guard<std::mutex> cbLock(cbMtx);
            callbacks.erase(channel);
        }
        if (!client || !connected.load()) {
            return;
        }
        const int rc = MQTTClient_unsubscribe(client, channel.c_str());
        if (rc != MQTTCLIENT_SUCCESS) {
            LOG_WARN("mqtt: unsubscribe from {} failed: {}", channel, pahoError(rc, "unsubscribe").what());
        }
    }

    void Disconnect() override {
        std::lock_guard<std::mutex> lock(apiMtx);
        if (!client) {
            return;
        }
        if (connected.exchange(false)) {
            MQTTClient_disconnect(client, kDisconnectTimeoutMs);
        }
        MQTTClient_destroy(&client);
        client = nullptr;
        std::lock_guard<std::mutex> cbLock(cbMtx);
        callbacks.clear();
    }

private:
    void requireConnected() const {
        if (!client || !connected.load()) {
            throw errors::transportConnection("mqtt client is not connected", errors::reasons::Io);
        }
    }

    static void connectionLost(void* context, char* cause) {
        auto* self = static_cast<MqttClient*>(context);
        if (!self->connected.exchange(false)) {
            return;
        }
        ConnectionLostCallback callback;
        {
            std::lock_guard<std::mutex> cbLock(self->cbMtx);
            callback = self->onLost;
        }
        const std::string reason = cause ? cause : "mqtt connection lost";
        LOG_WARN("mqtt: {}", reason);
        if (callback) {
            callback(reason);
        }
    }

    static int messageArrived(void* context, char* topicName, int topicLen, MQTTClient_message* message) {
        auto* self = static_cast<MqttClient*>(context);
        const std::string topic = topicLen > 0 ? std::string(topicName, static_cast<std::size_t>(topicLen))
                                               : std::string(topicName);
        const std::string payload(static_cast<const char*>(message->payload),
                                  static_cast<std::size_t>(message->payloadlen));
        MQTTClient_freeMessage(&message);
        MQTTClient_free(topicName);

        std::vector<std::pair<std::string, DeliveryCallback>> targets;
        {
            std::lock_guard<std::mutex> cbLock(self->cbMtx);
            for (const auto& [filter, cb] : self->callbacks) {
                if (topicMatches(filter, topic)) {
                    targets.emplace_back(filter, cb);
                }
            }
        }
        for (const auto& [filter, cb] : targets) {
            cb(filter, payload);
        }
        return 1;
    }

    // apiMtx orders library calls; cbMtx guards state the library threads read
    std::mutex apiMtx;
    std::mutex cbMtx;
    MQTTClient client{nullptr};
    std::atomic<bool> connected{false};
    ConnectionLostCallback onLost;
    std::map<std::string, DeliveryCallback> callbacks;
};

} // namespace

std::unique_ptr<IBrokerClient> MakeMqttClient() {
    return std::make_unique<MqttClient>();
}

} // namespace apigw::protocol
