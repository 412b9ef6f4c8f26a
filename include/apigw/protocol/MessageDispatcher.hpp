//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/apigw/protocol/MessageDispatcher.hpp
// Purpose: Queue + worker thread that delivers inbound pub/sub messages to subscription handlers
//==========================================================================================================
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include "apigw/protocol/IProtocolAdapter.hpp"

namespace apigw::protocol {

//==========================================================================================================
// MessageDispatcher
// Purpose: Decouples network readers from user handlers. Handlers run one at a time on the worker
//          thread; an exception from a handler is logged and counted, never propagated.
//==========================================================================================================
class MessageDispatcher {
public:
    explicit MessageDispatcher(std::string name);
    ~MessageDispatcher();

    MessageDispatcher(const MessageDispatcher&) = delete;
    MessageDispatcher& operator=(const MessageDispatcher&) = delete;

    // Enqueues a delivery; ignored after Stop().
    void Post(MessageHandler handler, InboundMessage message);

    // Stops the worker; undelivered messages are dropped. Idempotent.
    void Stop();

    // Blocks until the queue is empty and no handler is running, or the timeout passes.
    bool WaitIdle(std::chrono::milliseconds timeout);

    uint64_t Delivered() const { return delivered.load(); }
    uint64_t HandlerFailures() const { return failures.load(); }

private:
    void run(std::stop_token st);

    std::string name;
    std::deque<std::pair<MessageHandler, InboundMessage>> queue;
    std::mutex queueMutex;
    std::condition_variable queueCondition;
    std::condition_variable idleCondition;
    bool busy{false};
    bool stopped{false};
    std::atomic<uint64_t> delivered{0};
    std::atomic<uint64_t> failures{0};
    std::jthread worker;
};

} // namespace apigw::protocol
