//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_broker_adapter.cpp
// Purpose: BrokerAdapter over the loopback broker: connection reuse, fan-out, envelopes and teardown
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "apigw/errors/Errors.h"
#include "apigw/protocol/BrokerAdapter.hpp"
#include "apigw/protocol/LoopbackBroker.hpp"
#include "apigw/protocol/MessageDispatcher.hpp"

using namespace apigw;
using namespace apigw::protocol;
using apigw::errors::ErrorKind;
using apigw::errors::GatewayError;

namespace {

// Collects inbound messages and lets the test wait for a count.
class Inbox {
public:
    MessageHandler handler() {
        return [this](const InboundMessage& m) {
            std::lock_guard<std::mutex> lk(mtx);
            messages.push_back(m);
            threads.push_back(std::this_thread::get_id());
            cv.notify_all();
        };
    }

    bool waitFor(std::size_t n, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        std::unique_lock<std::mutex> lk(mtx);
        return cv.wait_for(lk, timeout, [&] { return messages.size() >= n; });
    }

    std::vector<InboundMessage> snapshot() {
        std::lock_guard<std::mutex> lk(mtx);
        return messages;
    }

    std::vector<std::thread::id> threadIds() {
        std::lock_guard<std::mutex> lk(mtx);
        return threads;
    }

private:
    std::mutex mtx;
    std::condition_variable cv;
    std::vector<InboundMessage> messages;
    std::vector<std::thread::id> threads;
};

ServerConfig server(const std::string& url) {
    ServerConfig s;
    s.protocol = protocol::Mqtt;
    s.url = url;
    s.connectTimeoutMs = 1000;
    return s;
}

// Client whose first Subscribe call parks until released and then fails.
struct SubscribeGate {
    std::promise<void> entered;
    std::promise<void> release;
};

class GatedClient final : public IBrokerClient {
public:
    explicit GatedClient(std::shared_ptr<SubscribeGate> g) : gate(std::move(g)) {}
    void SetConnectionLostCallback(ConnectionLostCallback) override {}
    void Connect(const ServerConfig&) override {}
    void Publish(const std::string&, const std::string&) override {}
    void Subscribe(const std::string& channel, DeliveryCallback) override {
        gate->entered.set_value();
        gate->release.get_future().wait();
        throw errors::transportConnection("subscribe to " + channel + " rejected", errors::reasons::Io);
    }
    void Unsubscribe(const std::string&) override {}
    void Disconnect() override {}

private:
    std::shared_ptr<SubscribeGate> gate;
};

class BrokerAdapterTest : public ::testing::Test {
protected:
    void TearDown() override { adapter.Shutdown(); }

    std::shared_ptr<LoopbackBroker> hub = std::make_shared<LoopbackBroker>();
    BrokerAdapter adapter{protocol::Mqtt, MakeLoopbackBrokerFactory(hub)};
};

} // namespace

TEST(BrokerAdapterNoClient, ConnectFailsWithNoClientReason) {
    BrokerAdapter adapter(protocol::Kafka, BrokerClientFactory());
    EXPECT_EQ(adapter.Protocol(), "kafka");
    try {
        adapter.Connect(server("kafka://broker:9092"));
        FAIL() << "expected TransportConnection";
    } catch (const GatewayError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TransportConnection);
        EXPECT_EQ(e.detail(), errors::reasons::NoClient);
    }

    BrokerAdapter nullFactory(protocol::Nats, [](const std::string&) { return std::unique_ptr<IBrokerClient>(); });
    try {
        nullFactory.Connect(server("nats://broker:4222"));
        FAIL() << "expected TransportConnection";
    } catch (const GatewayError& e) {
        EXPECT_EQ(e.detail(), errors::reasons::NoClient);
    }
}

TEST_F(BrokerAdapterTest, ConnectionsAreCachedPerServer) {
    const auto a = adapter.Connect(server("mqtt://one:1883"));
    const auto b = adapter.Connect(server("mqtt://one:1883"));
    const auto c = adapter.Connect(server("mqtt://two:1883"));
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(adapter.ConnectionCount(), 2u);
}

TEST_F(BrokerAdapterTest, UnreachableServerIsRefused) {
    hub->SetUnreachable("mqtt://down:1883");
    try {
        adapter.Connect(server("mqtt://down:1883"));
        FAIL() << "expected TransportConnection";
    } catch (const GatewayError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TransportConnection);
        EXPECT_EQ(e.detail(), errors::reasons::ConnectionRefused);
    }
    EXPECT_EQ(adapter.ConnectionCount(), 0u);
}

TEST_F(BrokerAdapterTest, PublishWrapsPayloadInEnvelope) {
    const auto conn = adapter.Connect(server("mqtt://one:1883"));
    Inbox inbox;
    const auto sub = adapter.Subscribe(conn, "sensors/temp", inbox.handler());

    HeaderList headers{{"X-Source", "unit-test"}};
    const std::string id = adapter.Publish(conn, "sensors/temp", parseJSON(R"({"celsius": 21.5})"), headers);
    EXPECT_FALSE(id.empty());

    ASSERT_TRUE(inbox.waitFor(1));
    const InboundMessage m = inbox.snapshot().front();
    EXPECT_EQ(m.subscriptionId, sub);
    EXPECT_EQ(m.channel, "sensors/temp");
    ASSERT_TRUE(m.payload.isObject());
    EXPECT_EQ(m.payload.getString("id"), id);
    EXPECT_EQ(m.payload.getString("operation"), "publish");
    EXPECT_EQ(m.payload.getString("channel"), "sensors/temp");
    EXPECT_FALSE(m.payload.getString("timestamp").empty());
    EXPECT_EQ(m.payload.find("headers")->getString("X-Source"), "unit-test");
    EXPECT_TRUE(jsonEquals(*m.payload.find("payload"), parseJSON(R"({"celsius": 21.5})")));

    auto history = hub->History();
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].server, "mqtt://one:1883");
}

TEST_F(BrokerAdapterTest, HandlersRunOffThePublisherThread) {
    const auto conn = adapter.Connect(server("mqtt://one:1883"));
    Inbox inbox;
    adapter.Subscribe(conn, "t", inbox.handler());
    adapter.Publish(conn, "t", JSONValue("x"), HeaderList());
    ASSERT_TRUE(inbox.waitFor(1));
    EXPECT_NE(inbox.threadIds().front(), std::this_thread::get_id());
}

TEST_F(BrokerAdapterTest, NonJsonFramesArriveAsText) {
    const auto conn = adapter.Connect(server("mqtt://one:1883"));
    Inbox inbox;
    adapter.Subscribe(conn, "raw", inbox.handler());
    hub->Publish("mqtt://one:1883", "raw", "not json at all");
    ASSERT_TRUE(inbox.waitFor(1));
    const InboundMessage m = inbox.snapshot().front();
    EXPECT_TRUE(m.payload.isString());
    EXPECT_EQ(m.raw, "not json at all");
}

TEST_F(BrokerAdapterTest, ChannelSubscriptionIsSharedAndReleasedByLastUnsubscribe) {
    const auto conn = adapter.Connect(server("mqtt://one:1883"));
    Inbox first;
    Inbox second;
    const auto s1 = adapter.Subscribe(conn, "news", first.handler());
    const auto s2 = adapter.Subscribe(conn, "news", second.handler());
    EXPECT_EQ(hub->SubscriberCount("mqtt://one:1883", "news"), 1u);
    EXPECT_EQ(adapter.SubscriptionCount(), 2u);

    hub->Publish("mqtt://one:1883", "news", "{}");
    ASSERT_TRUE(first.waitFor(1));
    ASSERT_TRUE(second.waitFor(1));

    adapter.Unsubscribe(s1);
    EXPECT_EQ(hub->SubscriberCount("mqtt://one:1883", "news"), 1u);
    adapter.Unsubscribe(s2);
    EXPECT_EQ(hub->SubscriberCount("mqtt://one:1883", "news"), 0u);
    adapter.Unsubscribe("unknown-subscription");
    EXPECT_EQ(adapter.SubscriptionCount(), 0u);
}

TEST_F(BrokerAdapterTest, DisconnectRemovesDependentSubscriptions) {
    const auto conn = adapter.Connect(server("mqtt://one:1883"));
    Inbox inbox;
    adapter.Subscribe(conn, "a", inbox.handler());
    adapter.Subscribe(conn, "b", inbox.handler());
    adapter.Disconnect(conn);
    EXPECT_EQ(adapter.SubscriptionCount(), 0u);
    EXPECT_EQ(adapter.ConnectionCount(), 0u);
    EXPECT_EQ(hub->SubscriberCount("mqtt://one:1883", "a"), 0u);

    EXPECT_THROW(adapter.Publish(conn, "a", JSONValue(), HeaderList()), GatewayError);
    EXPECT_THROW(adapter.Subscribe(conn, "a", inbox.handler()), GatewayError);
}

TEST_F(BrokerAdapterTest, LostSessionIsEvictedAndReconnectsFresh) {
    const auto conn = adapter.Connect(server("mqtt://one:1883"));
    const auto other = adapter.Connect(server("mqtt://two:1883"));
    Inbox inbox;
    adapter.Subscribe(conn, "a", inbox.handler());
    adapter.Subscribe(conn, "b", inbox.handler());
    adapter.Subscribe(other, "a", inbox.handler());
    ASSERT_EQ(adapter.SubscriptionCount(), 3u);

    EXPECT_EQ(hub->DropServer("mqtt://one:1883"), 1u);
    EXPECT_EQ(adapter.ConnectionCount(), 1u);
    EXPECT_EQ(adapter.SubscriptionCount(), 1u);
    EXPECT_THROW(adapter.Publish(conn, "a", JSONValue(), HeaderList()), GatewayError);

    const auto again = adapter.Connect(server("mqtt://one:1883"));
    EXPECT_NE(again, conn);
    EXPECT_EQ(adapter.Connect(server("mqtt://two:1883")), other);
    adapter.Subscribe(again, "a", inbox.handler());
    adapter.Publish(again, "a", JSONValue("after"), HeaderList());
    ASSERT_TRUE(inbox.waitFor(1));
    EXPECT_EQ(inbox.snapshot().front().channel, "a");
}

TEST_F(BrokerAdapterTest, DisconnectedClientIsNotReportedLost) {
    const auto conn = adapter.Connect(server("mqtt://one:1883"));
    adapter.Disconnect(conn);
    EXPECT_EQ(hub->DropServer("mqtt://one:1883"), 0u);
    EXPECT_EQ(adapter.ConnectionCount(), 0u);
}

TEST_F(BrokerAdapterTest, LoopbackHistoryKeepsMostRecentPublishes) {
    hub->SetHistoryLimit(3);
    for (int i = 0; i < 10; ++i) {
        hub->Publish("mqtt://one:1883", "t", std::to_string(i));
    }
    auto history = hub->History();
    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history.front().payload, "7");
    EXPECT_EQ(history.back().payload, "9");

    hub->SetHistoryLimit(0);
    EXPECT_TRUE(hub->History().empty());
    hub->Publish("mqtt://one:1883", "t", "dropped");
    EXPECT_TRUE(hub->History().empty());
}

TEST(BrokerAdapterSubscribeFailure, SubscribersJoinedDuringFailedSubscribeAreReleased) {
    auto gate = std::make_shared<SubscribeGate>();
    BrokerAdapter adapter(protocol::Amqp, [gate](const std::string&) -> std::unique_ptr<IBrokerClient> {
        return std::make_unique<GatedClient>(gate);
    });
    const auto conn = adapter.Connect(server("amqp://broker:5672"));

    std::promise<bool> firstFailed;
    std::thread first([&] {
        try {
            adapter.Subscribe(conn, "orders", [](const InboundMessage&) {});
            firstFailed.set_value(false);
        } catch (const GatewayError&) {
            firstFailed.set_value(true);
        }
    });
    gate->entered.get_future().wait();

    // Joins the channel while the client subscription is still pending
    adapter.Subscribe(conn, "orders", [](const InboundMessage&) {});
    EXPECT_EQ(adapter.SubscriptionCount(), 2u);

    gate->release.set_value();
    first.join();
    EXPECT_TRUE(firstFailed.get_future().get());
    EXPECT_EQ(adapter.SubscriptionCount(), 0u);
    adapter.Shutdown();
}

TEST(MessageDispatcher, HandlerFailuresAreCountedNotPropagated) {
    MessageDispatcher dispatcher("test");
    int calls = 0;
    dispatcher.Post([](const InboundMessage&) { throw std::runtime_error("handler bug"); }, InboundMessage());
    dispatcher.Post([&calls](const InboundMessage&) { ++calls; }, InboundMessage());
    ASSERT_TRUE(dispatcher.WaitIdle(std::chrono::milliseconds(2000)));
    EXPECT_EQ(dispatcher.HandlerFailures(), 1u);
    EXPECT_EQ(dispatcher.Delivered(), 1u);
    EXPECT_EQ(calls, 1);

    dispatcher.Stop();
    dispatcher.Post([&calls](const InboundMessage&) { ++calls; }, InboundMessage());
    EXPECT_EQ(calls, 1);
}
