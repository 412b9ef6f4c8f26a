//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: include/apigw/registry/Registry.hpp
// Purpose: Name-keyed registry of spec-family plugins (model factory, parser, executor) and protocol
//          adapter factories
//==========================================================================================================
#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "apigw/JSONValue.h"
#include "apigw/protocol/IProtocolAdapter.hpp"
#include "apigw/spec/ISpecModel.hpp"

namespace apigw::registry {

struct FamilyCompleteness {
    bool hasModel{false};
    bool hasParser{false};
    bool hasExecutor{false};

    bool complete() const { return hasModel && hasParser && hasExecutor; }
};

//==========================================================================================================
// Registry
// Purpose: Thread-safe plugin table owned by the Gateway. Registration is last-write-wins.
// Notes:
//   - Lookups return empty handles (null pointer / empty std::function) when nothing is registered.
//   - Listings are in name order.
//==========================================================================================================
class Registry {
public:
    void RegisterSpecFamily(const std::string& name, spec::SpecModelFactory modelFactory,
                            std::shared_ptr<spec::ISpecParser> parser, std::shared_ptr<spec::IExecutor> executor);
    void RegisterModel(const std::string& name, spec::SpecModelFactory modelFactory);
    void RegisterParser(const std::string& name, std::shared_ptr<spec::ISpecParser> parser);
    void RegisterExecutor(const std::string& name, std::shared_ptr<spec::IExecutor> executor);
    void RegisterProtocol(const std::string& name, protocol::ProtocolAdapterFactory factory);

    // Return true when something was removed.
    bool UnregisterSpecFamily(const std::string& name);
    bool UnregisterProtocol(const std::string& name);

    spec::SpecModelFactory LookupModel(const std::string& name) const;
    std::shared_ptr<spec::ISpecParser> LookupParser(const std::string& name) const;
    std::shared_ptr<spec::IExecutor> LookupExecutor(const std::string& name) const;
    protocol::ProtocolAdapterFactory LookupProtocol(const std::string& name) const;
    bool HasProtocol(const std::string& name) const;

    FamilyCompleteness ValidateCompleteness(const std::string& name) const;

    std::vector<std::string> ListFamilies() const;
    std::vector<std::string> ListProtocols() const;

    // First family (in name order) whose parser accepts the raw document.
    std::optional<std::string> DetectFamily(const JSONValue& rawDocument) const;

    // { families: { name: { model, parser, executor, complete } }, protocols: [..] }
    JSONValue Summary() const;

private:
    struct FamilyEntry {
        spec::SpecModelFactory model;
        std::shared_ptr<spec::ISpecParser> parser;
        std::shared_ptr<spec::IExecutor> executor;
    };

    mutable std::mutex mtx;
    std::map<std::string, FamilyEntry> families;
    std::map<std::string, protocol::ProtocolAdapterFactory> protocols;
};

} // namespace apigw::registry
