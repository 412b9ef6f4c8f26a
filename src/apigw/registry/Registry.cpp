//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/apigw/registry/Registry.cpp
// Purpose: Registry implementation
//==========================================================================================================

#include "logging/Logger.h"
#include "apigw/registry/Registry.hpp"

namespace apigw::registry {

void Registry::RegisterSpecFamily(const std::string& name, spec::SpecModelFactory modelFactory,
                                  std::shared_ptr<spec::ISpecParser> parser, std::shared_ptr<spec::IExecutor> executor) {
    std::lock_guard<std::mutex> lock(mtx);
    auto& entry = families[name];
    entry.model = std::move(modelFactory);
    entry.parser = std::move(parser);
    entry.executor = std::move(executor);
    LOG_DEBUG("Registry: spec family '{}' registered", name);
}

void Registry::RegisterModel(const std::string& name, spec::SpecModelFactory modelFactory) {
    std::lock_guard<std::mutex> lock(mtx);
    families[name].model = std::move(modelFactory);
}

void Registry::RegisterParser(const std::string& name, std::shared_ptr<spec::ISpecParser> parser) {
    std::lock_guard<std::mutex> lock(mtx);
    families[name].parser = std::move(parser);
}

void Registry::RegisterExecutor(const std::string& name, std::shared_ptr<spec::IExecutor> executor) {
    std::lock_guard<std::mutex> lock(mtx);
    families[name].executor = std::move(executor);
}

void Registry::RegisterProtocol(const std::string& name, protocol::ProtocolAdapterFactory factory) {
    std::lock_guard<std::mutex> lock(mtx);
    protocols[name] = std::move(factory);
    LOG_DEBUG("Registry: protocol '{}' registered", name);
}

bool Registry::UnregisterSpecFamily(const std::string& name) {
    std::lock_guard<std::mutex> lock(mtx);
    return families.erase(name) > 0;
}

bool Registry::UnregisterProtocol(const std::string& name) {
    std::lock_guard<std::mutex> lock(mtx);
    return protocols.erase(name) > 0;
}

spec::SpecModelFactory Registry::LookupModel(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = families.find(name);
    return it == families.end() ? spec::SpecModelFactory() : it->second.model;
}

std::shared_ptr<spec::ISpecParser> Registry::LookupParser(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = families.find(name);
    return it == families.end() ? nullptr : it->second.parser;
}

std::shared_ptr<spec::IExecutor> Registry::LookupExecutor(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = families.find(name);
    return it == families.end() ? nullptr : it->second.executor;
}

protocol::ProtocolAdapterFactory Registry::LookupProtocol(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = protocols.find(name);
    return it == protocols.end() ? protocol::ProtocolAdapterFactory() : it->second;
}

bool Registry::HasProtocol(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = protocols.find(name);
    return it != protocols.end() && static_cast<bool>(it->second);
}

FamilyCompleteness Registry::ValidateCompleteness(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mtx);
    FamilyCompleteness c;
    auto it = families.find(name);
    if (it != families.end()) {
        c.hasModel = static_cast<bool>(it->second.model);
        c.hasParser = it->second.parser != nullptr;
        c.hasExecutor = it->second.executor != nullptr;
    }
    return c;
}

std::vector<std::string> Registry::ListFamilies() const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<std::string> out;
    for (const auto& kv : families) {
        out.push_back(kv.first);
    }
    return out;
}

std::vector<std::string> Registry::ListProtocols() const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<std::string> out;
    for (const auto& kv : protocols) {
        out.push_back(kv.first);
    }
    return out;
}

std::optional<std::string> Registry::DetectFamily(const JSONValue& rawDocument) const {
    std::vector<std::pair<std::string, std::shared_ptr<spec::ISpecParser>>> parsers;
    {
        std::lock_guard<std::mutex> lock(mtx);
        for (const auto& [name, entry] : families) {
            if (entry.parser) {
                parsers.emplace_back(name, entry.parser);
            }
        }
    }
    // Parsers run outside the lock
    for (const auto& [name, parser] : parsers) {
        if (parser->CanParse(rawDocument)) {
            return name;
        }
    }
    return std::nullopt;
}

JSONValue Registry::Summary() const {
    JSONValue fams = JSONValue::object();
    for (const auto& name : ListFamilies()) {
        const auto c = ValidateCompleteness(name);
        JSONValue entry = JSONValue::object();
        entry.set("model", JSONValue(c.hasModel));
        entry.set("parser", JSONValue(c.hasParser));
        entry.set("executor", JSONValue(c.hasExecutor));
        entry.set("complete", JSONValue(c.complete()));
        fams.set(name, std::move(entry));
    }
    JSONValue protos = JSONValue::array();
    for (const auto& name : ListProtocols()) {
        protos.push(JSONValue(name));
    }
    JSONValue out = JSONValue::object();
    out.set("families", std::move(fams));
    out.set("protocols", std::move(protos));
    return out;
}

} // namespace apigw::registry
