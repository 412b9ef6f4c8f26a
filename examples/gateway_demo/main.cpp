//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Gateway example: register a specification file, list its endpoints and optionally call one
//==========================================================================================================

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

#include "apigw/Gateway.hpp"
#include "apigw/errors/Errors.h"
#include "apigw/protocol/LoopbackBroker.hpp"
#include "apigw/protocol/NativeBrokers.hpp"
#include "apigw/version.h"
#include "env/EnvVars.h"
#include "logging/Logger.h"

using namespace apigw;

//==========================================================================================================
// Parses simple key=value style command-line options.
// Args:
//   argc: Argument count
//   argv: Argument values
//   key: Option name including leading dashes (e.g., "--spec")
// Returns:
//   Optional value string when present; empty optional otherwise
//==========================================================================================================
static bool hasFlag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] != nullptr && flag == argv[i]) {
            return true;
        }
    }
    return false;
}

static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == nullptr) {
            continue;
        }
        const std::string a = argv[i];
        const std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

static bool readFile(const std::string& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

// "a=1,b=two" -> params; values are JSON when they parse, strings otherwise
static ParamMap parseParams(const std::string& spec) {
    ParamMap params;
    std::stringstream ss(spec);
    std::string item;
    while (std::getline(ss, item, ',')) {
        const std::size_t eq = item.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        const std::string value = item.substr(eq + 1);
        try {
            params[item.substr(0, eq)] = parseJSON(value);
        } catch (const std::exception&) {
            params[item.substr(0, eq)] = JSONValue(value);
        }
    }
    return params;
}

static void printUsage() {
    std::cout << "usage: apigw_demo --spec=<file.json> [--name=<name>] [--family=rest|pubsub] [--base=<url>]\n"
                 "                  [--config=\"key=value;...\"] [--call=<operationId|address>]\n"
                 "                  [--method=<get|post|publish|...>] [--params=k=v,...] [--body=<json>]\n"
                 "                  [--loopback]   serve broker protocols from an in-process hub\n";
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::setLogLevel(Logger::levelFromString(GetEnvOrDefault("APIGW_LOG_LEVEL", "INFO")));

    const auto specPath = getArgValue(argc, argv, "--spec");
    if (!specPath) {
        printUsage();
        return 2;
    }
    std::string raw;
    if (!readFile(*specPath, raw)) {
        LOG_ERROR("Cannot read specification file {}", *specPath);
        return 1;
    }

    GatewayOptions options = GatewayOptions::FromEnvironment();
    if (auto cfg = getArgValue(argc, argv, "--config")) {
        std::stringstream ss(*cfg);
        std::string kv;
        while (std::getline(ss, kv, ';')) {
            const std::size_t eq = kv.find('=');
            if (eq != std::string::npos && !options.Set(kv.substr(0, eq), kv.substr(eq + 1))) {
                LOG_WARN("Ignoring option {}", kv);
            }
        }
    }
    LOG_INFO("apigw {} starting", getVersionString());

    protocol::BrokerClientFactory brokers;
    if (hasFlag(argc, argv, "--loopback")) {
        brokers = protocol::MakeLoopbackBrokerFactory(std::make_shared<protocol::LoopbackBroker>());
    }
    for (const char* name : {protocol::Mqtt, protocol::Kafka, protocol::Amqp, protocol::Nats}) {
        LOG_DEBUG("{} client library: {}", name, protocol::HasNativeBrokerClient(name) ? "linked" : "absent");
    }
    Gateway gateway(options, nullptr, std::move(brokers));

    RegistrationOptions ro;
    ro.familyHint = getArgValue(argc, argv, "--family").value_or("");
    ro.baseAddress = getArgValue(argc, argv, "--base").value_or("");
    RegistrationResult reg;
    try {
        reg = gateway.RegisterSpecification(getArgValue(argc, argv, "--name").value_or(*specPath), raw, ro);
    } catch (const errors::GatewayError& e) {
        LOG_ERROR("Registration failed [{}] {}", errors::toString(e.kind()), e.what());
        return 1;
    }

    for (const auto& ep : reg.endpoints) {
        std::cout << ep.id << "  " << ep.protocol << "  " << ep.operationKind << "  " << ep.addressPattern;
        if (!ep.operationId.empty()) {
            std::cout << "  (" << ep.operationId << ")";
        }
        std::cout << "\n";
    }

    const auto target = getArgValue(argc, argv, "--call");
    if (!target) {
        return 0;
    }

    CallInput input;
    input.params = parseParams(getArgValue(argc, argv, "--params").value_or(""));
    if (auto body = getArgValue(argc, argv, "--body")) {
        try {
            input.body = parseJSON(*body);
        } catch (const std::exception& e) {
            LOG_ERROR("--body is not valid JSON: {}", e.what());
            return 2;
        }
    }

    CallResult result;
    const Endpoint* byId = nullptr;
    for (const auto& ep : reg.endpoints) {
        if (ep.operationId == *target || ep.id == *target) {
            byId = &ep;
            break;
        }
    }
    if (byId) {
        result = gateway.CallEndpoint(byId->id, input);
    } else {
        result = gateway.CallByAddress(*target, getArgValue(argc, argv, "--method").value_or("get"), reg.documentId,
                                       input);
    }

    if (!result.success) {
        std::cout << "error [" << result.errorKind << "] " << result.error << "\n";
        return 1;
    }
    std::cout << "status " << result.status << " (" << result.latencyMs << " ms)\n"
              << serializeJSONValue(result.result) << std::endl;
    gateway.Shutdown();
    return 0;
}
