//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/apigw/protocol/MessageDispatcher.cpp
// Purpose: MessageDispatcher implementation
//==========================================================================================================

#include "logging/Logger.h"
#include "apigw/protocol/MessageDispatcher.hpp"

namespace apigw::protocol {

MessageDispatcher::MessageDispatcher(std::string n) : name(std::move(n)) {
    worker = std::jthread([this](std::stop_token st) { run(st); });
}

MessageDispatcher::~MessageDispatcher() {
    Stop();
}

void MessageDispatcher::Post(MessageHandler handler, InboundMessage message) {
    if (!handler) {
        return;
    }
    std::lock_guard<std::mutex> lock(queueMutex);
    if (stopped) {
        return;
    }
    queue.emplace_back(std::move(handler), std::move(message));
    queueCondition.notify_one();
}

void MessageDispatcher::Stop() {
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        if (stopped) {
            return;
        }
        stopped = true;
        queue.clear();
    }
    queueCondition.notify_all();
    idleCondition.notify_all();
    if (worker.joinable()) {
        worker.request_stop();
        if (worker.get_id() != std::this_thread::get_id()) {
            worker.join();
        } else {
            worker.detach();
        }
    }
}

bool MessageDispatcher::WaitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(queueMutex);
    return idleCondition.wait_for(lock, timeout, [this]() { return stopped || (queue.empty() && !busy); });
}

void MessageDispatcher::run(std::stop_token st) {
    std::unique_lock<std::mutex> lock(queueMutex);
    while (!st.stop_requested()) {
        queueCondition.wait(lock, [this, &st]() { return !queue.empty() || stopped || st.stop_requested(); });
        if (stopped || st.stop_requested()) {
            break;
        }
        auto item = std::move(queue.front());
        queue.pop_front();
        busy = true;
        lock.unlock();
        try {
            item.first(item.second);
            ++delivered;
        } catch (const std::exception& e) {
            ++failures;
            LOG_ERROR("{} dispatcher: handler for subscription {} threw: {}", name, item.second.subscriptionId, e.what());
        } catch (...) {
            ++failures;
            LOG_ERROR("{} dispatcher: handler for subscription {} threw a non-standard exception", name, item.second.subscriptionId);
        }
        lock.lock();
        busy = false;
        if (queue.empty()) {
            idleCondition.notify_all();
        }
    }
}

} // namespace apigw::protocol
