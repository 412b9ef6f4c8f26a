//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/apigw/protocol/KafkaClient.cpp
// Purpose: IBrokerClient over librdkafka (one producer, one consumer in its own group, a poll thread)
//==========================================================================================================

#include <atomic>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

#include <librdkafka/rdkafka.h>

#include "logging/Logger.h"
#include "apigw/Types.h"
#include "apigw/errors/Errors.h"
#include "NativeClients.hpp"

namespace apigw::protocol {

namespace {

constexpr int kPollMs = 100;
constexpr int kCloseFlushMs = 1000;

// kafka://host:port[,host:port] -> host:port[,host:port]
std::string bootstrapServers(const std::string& url) {
    const std::size_t scheme = url.find("://");
    std::string hosts = scheme == std::string::npos ? url : url.substr(scheme + 3);
    const std::size_t slash = hosts.find('/');
    if (slash != std::string::npos) {
        hosts.erase(slash);
    }
    if (hosts.empty()) {
        throw errors::GatewayError(errors::ErrorKind::InvalidConfiguration, "Kafka URL has no brokers: " + url, url);
    }
    return hosts;
}

errors::GatewayError kafkaError(rd_kafka_resp_err_t err, const std::string& context) {
    const std::string msg = context + ": " + rd_kafka_err2str(err);
    if (err == RD_KAFKA_RESP_ERR__TIMED_OUT) {
        return errors::transportTimeout(msg);
    }
    if (err == RD_KAFKA_RESP_ERR__RESOLVE) {
        return errors::transportConnection(msg, errors::reasons::DnsFailure);
    }
    if (err == RD_KAFKA_RESP_ERR__SSL) {
        return errors::transportConnection(msg, errors::reasons::Tls);
    }
    if (err == RD_KAFKA_RESP_ERR__TRANSPORT || err == RD_KAFKA_RESP_ERR__ALL_BROKERS_DOWN) {
        return errors::transportConnection(msg, errors::reasons::ConnectionRefused);
    }
    return errors::transportConnection(msg, errors::reasons::Io);
}

class KafkaClient final : public IBrokerClient {
public:
    ~KafkaClient() override { Disconnect(); }

    void SetConnectionLostCallback(ConnectionLostCallback callback) override {
        std::lock_guard<std::mutex> lock(cbMtx);
        onLost = std::move(callback);
    }

    void Connect(const ServerConfig& server) override {
        const std::string brokers = bootstrapServers(server.url);
        const bool tls = server.url.rfind("kafka+ssl://", 0) == 0 || server.url.rfind("kafka-secure://", 0) == 0;
        timeoutMs = static_cast<int>(server.connectTimeoutMs);

        std::lock_guard<std::mutex> lock(apiMtx);
        producer = create(RD_KAFKA_PRODUCER, brokers, tls, std::string());
        const struct rd_kafka_metadata* metadata = nullptr;
        const rd_kafka_resp_err_t err = rd_kafka_metadata(producer, 0, nullptr, &metadata, timeoutMs);
        if (err != RD_KAFKA_RESP_ERR_NO_ERROR) {
            rd_kafka_destroy(producer);
            producer = nullptr;
            throw kafkaError(err, "kafka connect " + brokers);
        }
        LOG_INFO("kafka: connected to {} ({} brokers)", brokers, metadata->broker_cnt);
        rd_kafka_metadata_destroy(metadata);

        try {
            consumer = create(RD_KAFKA_CONSUMER, brokers, tls, "apigw-" + generateId());
        } catch (const errors::GatewayError&) {
            rd_kafka_destroy(producer);
            producer = nullptr;
            throw;
        }
        rd_kafka_poll_set_consumer(consumer);
        poller = std::jthread([this](std::stop_token st) { pollLoop(st); });
    }

    void Publish(const std::string& channel, const std::string& payload) override {
        std::lock_guard<std::mutex> lock(apiMtx);
        requireConnected();
        rd_kafka_resp_err_t err = rd_kafka_producev(producer, RD_KAFKA_V_TOPIC(channel.c_str()),
                                                    RD_KAFKA_V_VALUE(const_cast<char*>(payload.data()), payload.size()),
                                                    RD_KAFKA_V_MSGFLAGS(RD_KAFKA_MSG_F_COPY), RD_KAFKA_V_END);
        if (err != RD_KAFKA_RESP_ERR_NO_ERROR) {
            throw kafkaError(err, "kafka publish " + channel);
        }
        err = rd_kafka_flush(producer, timeoutMs);
        if (err != RD_KAFKA_RESP_ERR_NO_ERROR) {
            throw kafkaError(err, "kafka publish " + channel);
        }
    }

    void Subscribe(const std::string& channel, DeliveryCallback callback) override {
        std::lock_guard<std::mutex> lock(apiMtx);
        requireConnected();
        {
            std::lock_guard<std::mutex> cbLock(cbMtx);
            callbacks[channel] = std::move(callback);
        }
        try {
            applySubscription();
        } catch (const errors::GatewayError&) {
            std::lock_guard<std::mutex> cbLock(cbMtx);
            callbacks.erase(channel);
            throw;
        }
    }

    void Unsubscribe(const std::string& channel) override {
        std::lock_guard<std::mutex> lock(apiMtx);
        {
            std::lock_guard<std::mutex> cbLock(cbMtx);
            if (callbacks.erase(channel) == 0) {
                return;
            }
        }
        if (!consumer) {
            return;
        }
        try {
            applySubscription();
        } catch (const errors::GatewayError& e) {
            LOG_WARN("kafka: unsubscribe from {} failed: {}", channel, e.what());
        }
    }

    void Disconnect() override {
        std::lock_guard<std::mutex> lock(apiMtx);
        if (poller.joinable()) {
            poller.request_stop();
            poller.join();
        }
        if (consumer) {
            rd_kafka_consumer_close(consumer);
            rd_kafka_destroy(consumer);
            consumer = nullptr;
        }
        if (producer) {
            rd_kafka_flush(producer, kCloseFlushMs);
            rd_kafka_destroy(producer);
            producer = nullptr;
        }
        std::lock_guard<std::mutex> cbLock(cbMtx);
        callbacks.clear();
    }

private:
    rd_kafka_t* create(rd_kafka_type_t type, const std::string& brokers, bool tls, const std::string& groupId) {
        char errstr[512] = {0};
        rd_kafka_conf_t* conf = rd_kafka_conf_new();
        auto set = [&](const char* name, const std::string& value) {
            if (rd_kafka_conf_set(conf, name, value.c_str(), errstr, sizeof(errstr)) != RD_KAFKA_CONF_OK) {
                rd_kafka_conf_destroy(conf);
                throw errors::GatewayError(errors::ErrorKind::InvalidConfiguration,
                                           std::string("kafka setting ") + name + ": " + errstr, name);
            }
        };
        set("bootstrap.servers", brokers);
        set("client.id", "apigw");
        if (tls) {
            set("security.protocol", "ssl");
        }
        if (!groupId.empty()) {
            set("group.id", groupId);
            set("auto.offset.reset", "latest");
        }
        rd_kafka_conf_set_opaque(conf, this);
        rd_kafka_conf_set_error_cb(conf, &KafkaClient::onError);

        rd_kafka_t* handle = rd_kafka_new(type, conf, errstr, sizeof(errstr));
        if (!handle) {
            rd_kafka_conf_destroy(conf);
            throw errors::transportConnection(std::string("kafka client: ") + errstr, errors::reasons::Io);
        }
        return handle;
    }

    void requireConnected() const {
        if (!producer || !consumer || lost.load()) {
            throw errors::transportConnection("kafka client is not connected", errors::reasons::Io);
        }
    }

    // rd_kafka_subscribe replaces the whole topic set
    void applySubscription() {
        std::vector<std::string> topics;
        {
            std::lock_guard<std::mutex> cbLock(cbMtx);
            for (const auto& kv : callbacks) {
                topics.push_back(kv.first);
            }
        }
        if (topics.empty()) {
            const rd_kafka_resp_err_t err = rd_kafka_unsubscribe(consumer);
            if (err != RD_KAFKA_RESP_ERR_NO_ERROR) {
                throw kafkaError(err, "kafka unsubscribe");
            }
            return;
        }
        rd_kafka_topic_partition_list_t* list = rd_kafka_topic_partition_list_new(static_cast<int>(topics.size()));
        for (const auto& t : topics) {
            rd_kafka_topic_partition_list_add(list, t.c_str(), RD_KAFKA_PARTITION_UA);
        }
        const rd_kafka_resp_err_t err = rd_kafka_subscribe(consumer, list);
        rd_kafka_topic_partition_list_destroy(list);
        if (err != RD_KAFKA_RESP_ERR_NO_ERROR) {
            throw kafkaError(err, "kafka subscribe");
        }
    }

    void pollLoop(std::stop_token st) {
        while (!st.stop_requested()) {
            rd_kafka_poll(producer, 0);
            rd_kafka_message_t* msg = rd_kafka_consumer_poll(consumer, kPollMs);
            if (!msg) {
                continue;
            }
            if (msg->err == RD_KAFKA_RESP_ERR_NO_ERROR) {
                const std::string topic = rd_kafka_topic_name(msg->rkt);
                const std::string payload(static_cast<const char*>(msg->payload), msg->len);
                DeliveryCallback callback;
                {
                    std::lock_guard<std::mutex> cbLock(cbMtx);
                    auto it = callbacks.find(topic);
                    if (it != callbacks.end()) {
                        callback = it->second;
                    }
                }
                if (callback) {
                    callback(topic, payload);
                }
            } else if (msg->err != RD_KAFKA_RESP_ERR__PARTITION_EOF) {
                LOG_DEBUG("kafka: consumer event: {}", rd_kafka_message_errstr(msg));
            }
            rd_kafka_message_destroy(msg);
        }
    }

    // Served from rd_kafka_poll / rd_kafka_consumer_poll on the poll thread
    static void onError(rd_kafka_t*, int err, const char* reason, void* opaque) {
        auto* self = static_cast<KafkaClient*>(opaque);
        LOG_WARN("kafka: {} ({})", reason ? reason : "", rd_kafka_err2str(static_cast<rd_kafka_resp_err_t>(err)));
        if (err != RD_KAFKA_RESP_ERR__ALL_BROKERS_DOWN && err != RD_KAFKA_RESP_ERR__FATAL) {
            return;
        }
        if (self->lost.exchange(true)) {
            return;
        }
        ConnectionLostCallback callback;
        {
            std::lock_guard<std::mutex> cbLock(self->cbMtx);
            callback = self->onLost;
        }
        if (callback) {
            callback(reason ? reason : "all kafka brokers are down");
        }
    }

    std::mutex apiMtx;
    std::mutex cbMtx;
    rd_kafka_t* producer{nullptr};
    rd_kafka_t* consumer{nullptr};
    int timeoutMs{30000};
    std::atomic<bool> lost{false};
    ConnectionLostCallback onLost;
    std::map<std::string, DeliveryCallback> callbacks;
    std::jthread poller;
};

} // namespace

std::unique_ptr<IBrokerClient> MakeKafkaClient() {
    return std::make_unique<KafkaClient>();
}

} // namespace apigw::protocol
