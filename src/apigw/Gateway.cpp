//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/apigw/Gateway.cpp
// Purpose: Gateway composition root implementation
//==========================================================================================================

#include <chrono>
#include <map>
#include <mutex>

#include "apigw/Gateway.hpp"
#include "apigw/Redaction.hpp"
#include "apigw/auth/AuthSchemes.hpp"
#include "apigw/errors/Errors.h"
#include "apigw/protocol/NativeBrokers.hpp"
#include "apigw/registry/Builtins.hpp"
#include "apigw/request/PathMatcher.hpp"
#include "apigw/resolve/RefResolver.hpp"
#include "apigw/store/InMemoryStore.hpp"
#include "logging/Logger.h"

namespace apigw {

using errors::ErrorKind;
using errors::GatewayError;

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string percentDecode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            const int hi = hexValue(s[i + 1]);
            const int lo = hexValue(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

double elapsedMs(std::chrono::steady_clock::time_point started) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
}

void fillFailure(CallResult& out, const GatewayError& e) {
    out.success = false;
    out.errorKind = errors::toString(e.kind());
    out.error = e.what();
    out.errorDetail = e.detail();
}

} // namespace

class Gateway::Impl {
public:
    Impl(GatewayOptions opts, std::shared_ptr<store::IGatewayStore> st, protocol::BrokerClientFactory brokerFactory,
         Clock c)
        : options(std::move(opts)),
          store(st ? std::move(st) : std::make_shared<store::InMemoryStore>()),
          clock(c ? std::move(c) : systemClock()),
          dispatcher(store, clock) {
        Logger::setLogLevel(Logger::levelFromString(options.logLevel));
        if (!options.logFile.empty()) {
            Logger::setLogFile(options.logFile);
        }

        registry::BuiltinOptions builtins;
        builtins.http.connectTimeoutMs = options.connectTimeoutMs;
        builtins.http.caFile = options.caFile;
        builtins.http.caPath = options.caPath;
        builtins.http.verifyPeer = options.verifyPeer;
        builtins.websocket.caFile = options.caFile;
        builtins.websocket.caPath = options.caPath;
        builtins.websocket.verifyPeer = options.verifyPeer;
        builtins.websocket.writeTimeoutMs = options.httpTimeoutMs;
        builtins.brokerFactory = brokerFactory ? std::move(brokerFactory) : protocol::MakeNativeBrokerFactory();
        builtins.clock = clock;
        registry::RegisterBuiltins(registry, builtins);

        dispatcher.RegisterScheme(std::make_shared<auth::BasicAuth>());
        dispatcher.RegisterScheme(std::make_shared<auth::BearerAuth>());
        dispatcher.RegisterScheme(std::make_shared<auth::ApiKeyAuth>());
        dispatcher.RegisterScheme(std::make_shared<auth::OAuth2Auth>(store));
    }

    std::shared_ptr<protocol::IProtocolAdapter> adapterFor(const std::string& name) {
        std::lock_guard<std::mutex> lock(adaptersMutex);
        if (shutDown) {
            throw errors::transportConnection("Gateway has been shut down", errors::reasons::Io);
        }
        auto it = adapters.find(name);
        if (it != adapters.end()) {
            return it->second;
        }
        auto factory = registry.LookupProtocol(name);
        if (!factory) {
            return nullptr;
        }
        auto adapter = factory();
        if (adapter) {
            adapters.emplace(name, adapter);
            LOG_DEBUG("Created {} adapter", name);
        }
        return adapter;
    }

    JSONValue fetchDocument(const std::string& url) {
        auto rr = std::dynamic_pointer_cast<protocol::IRequestResponseAdapter>(adapterFor(protocol::Http));
        if (!rr) {
            throw GatewayError(ErrorKind::UnsupportedReference, "No HTTP adapter available to fetch " + url, url);
        }
        WireRequest req;
        req.protocol = protocol::Http;
        req.method = "GET";
        req.url = url;
        req.timeoutMs = options.httpTimeoutMs;
        setHeader(req.headers, "Accept", "application/json");
        setHeader(req.headers, "User-Agent", options.userAgent);
        WireResponse res = rr->Execute(req);
        if (res.status >= 400) {
            throw GatewayError(ErrorKind::MalformedReference,
                               "HTTP " + std::to_string(res.status) + " while fetching " + url, url);
        }
        return res.structured ? res.body : parseJSON(res.rawBody);
    }

    std::vector<std::string> secretNames(const std::string& documentId) const {
        std::vector<std::string> names;
        for (const auto& cfg : store->ListAuthConfigs(documentId)) {
            if (cfg.scheme == scheme::ApiKey) {
                const std::string n = cfg.config.getString("name");
                if (!n.empty()) names.push_back(n);
            }
        }
        return names;
    }

    std::unique_ptr<auth::OAuth2Flow> oauthFlow() {
        std::shared_ptr<auth::ITokenEndpointClient> client;
        {
            std::lock_guard<std::mutex> lock(tokenMutex);
            client = tokenClient;
        }
        if (!client) {
            auto rr = std::dynamic_pointer_cast<protocol::IRequestResponseAdapter>(adapterFor(protocol::Http));
            if (!rr) {
                throw GatewayError(ErrorKind::UnsupportedProtocol, "No HTTP adapter available for the token endpoint",
                                   std::string(protocol::Http));
            }
            client = std::make_shared<auth::HttpTokenEndpointClient>(rr);
        }
        auth::OAuth2FlowOptions flowOpts;
        flowOpts.stateTtl = std::chrono::minutes(options.oauthStateTtlMinutes);
        flowOpts.defaultScope = options.oauthDefaultScope;
        flowOpts.tokenTimeoutMs = options.tokenTimeoutMs;
        return std::make_unique<auth::OAuth2Flow>(store, client, clock, flowOpts);
    }

    // Builds, authenticates and executes; `built`/`secrets` are filled as far as the call progressed.
    spec::ExecutionResult execute(const Endpoint& ep, const CallInput& input, protocol::MessageHandler handler,
                                  WireRequest& built, bool& haveRequest, std::vector<std::string>& secrets) {
        const auto doc = store->GetApiDocument(ep.apiDocumentId);
        if (!doc) {
            throw GatewayError(ErrorKind::EndpointNotFound, "Endpoint " + ep.id + " belongs to no registered document",
                               ep.apiDocumentId);
        }
        auto executor = registry.LookupExecutor(doc->specFamily);
        if (!executor) {
            throw GatewayError(ErrorKind::UnsupportedFamily, "No executor registered for family " + doc->specFamily,
                               doc->specFamily);
        }
        auto adapter = adapterFor(ep.protocol);
        if (!adapter) {
            throw GatewayError(ErrorKind::UnsupportedProtocol, "No adapter registered for protocol " + ep.protocol,
                               ep.protocol);
        }
        secrets = secretNames(doc->id);

        request::RequestBuilderOptions bopts;
        bopts.joinMode = options.urlJoinMode;
        bopts.timeoutMs = options.httpTimeoutMs;
        bopts.userAgent = options.userAgent;
        request::RequestBuilder builder(bopts);
        built = builder.Build(ep, *doc, input, [&](WireRequest& r) {
            (void)dispatcher.Apply(*doc, input.userId, input.headers, r);
        });
        haveRequest = true;

        spec::ExecutionContext ctx;
        ctx.handler = std::move(handler);
        ctx.connectTimeoutMs = options.connectTimeoutMs;
        ctx.clock = clock;
        auto result = executor->Execute(ep, built, *adapter, ctx);
        if (!result.subscriptionId.empty()) {
            std::lock_guard<std::mutex> lock(adaptersMutex);
            subscriptions[result.subscriptionId] = adapter;
        }
        return result;
    }

    CallResult call(const std::string& endpointId, const CallInput& input, protocol::MessageHandler handler,
                    std::optional<GatewayError>* failure) {
        FUNC_SCOPE();
        const auto started = std::chrono::steady_clock::now();
        CallResult out;
        const auto ep = store->GetEndpoint(endpointId);
        if (!ep) {
            GatewayError e(ErrorKind::EndpointNotFound, "Endpoint not found: " + endpointId, endpointId);
            fillFailure(out, e);
            out.latencyMs = elapsedMs(started);
            if (failure) failure->emplace(e);
            LOG_WARN("Call to unknown endpoint {}", endpointId);
            return out;
        }

        WireRequest built;
        bool haveRequest = false;
        std::vector<std::string> secrets;
        WireResponse response;
        try {
            auto result = execute(*ep, input, std::move(handler), built, haveRequest, secrets);
            response = result.response;
            out.success = true;
            out.status = response.status;
            out.result = response.structured ? response.body : JSONValue(response.rawBody);
            out.subscriptionId = result.subscriptionId;
        } catch (const GatewayError& e) {
            fillFailure(out, e);
            if (failure) failure->emplace(e);
        } catch (const std::exception& e) {
            GatewayError internal(ErrorKind::Internal, std::string("Unexpected error: ") + e.what(), endpointId);
            fillFailure(out, internal);
            if (failure) failure->emplace(internal);
        }
        out.latencyMs = elapsedMs(started);

        store->RecordCallResult(ep->id, out.success, out.latencyMs);

        CallLogRecord record;
        record.id = generateId();
        record.endpointId = ep->id;
        record.operationKind = ep->operationKind;
        record.protocol = ep->protocol;
        if (haveRequest) {
            record.request = redactedRequestValue(built, secrets);
        } else {
            record.request = JSONValue::object();
            record.request.set("method", JSONValue(ep->operationKind));
            record.request.set("address", JSONValue(ep->addressPattern));
        }
        record.response = out.success ? responseValue(response) : JSONValue();
        record.status = out.status;
        record.success = out.success;
        record.errorKind = out.errorKind;
        record.error = out.error;
        record.latencyMs = out.latencyMs;
        record.timestamp = clock();
        store->AppendCallLog(record);
        out.callLogId = record.id;

        if (out.success) {
            LOG_INFO("{} {} {} -> {} ({:.1f} ms)", ep->protocol, ep->operationKind, ep->addressPattern, out.status,
                     out.latencyMs);
        } else {
            LOG_WARN("{} {} {} failed: {} {} ({:.1f} ms)", ep->protocol, ep->operationKind, ep->addressPattern,
                     out.errorKind, out.error, out.latencyMs);
        }
        return out;
    }

    GatewayOptions options;
    std::shared_ptr<store::IGatewayStore> store;
    Clock clock;
    registry::Registry registry;
    auth::AuthDispatcher dispatcher;

    std::mutex adaptersMutex;
    std::map<std::string, std::shared_ptr<protocol::IProtocolAdapter>> adapters;
    std::map<std::string, std::shared_ptr<protocol::IProtocolAdapter>> subscriptions;
    bool shutDown{false};

    std::mutex tokenMutex;
    std::shared_ptr<auth::ITokenEndpointClient> tokenClient;
};

Gateway::Gateway(GatewayOptions options, std::shared_ptr<store::IGatewayStore> store,
                 protocol::BrokerClientFactory brokerFactory, Clock clock)
    : pImpl(std::make_unique<Impl>(std::move(options), std::move(store), std::move(brokerFactory), std::move(clock))) {}

Gateway::~Gateway() {
    Shutdown();
}

const GatewayOptions& Gateway::Options() const { return pImpl->options; }

registry::Registry& Gateway::GetRegistry() { return pImpl->registry; }

auth::AuthDispatcher& Gateway::GetAuthDispatcher() { return pImpl->dispatcher; }

std::shared_ptr<store::IGatewayStore> Gateway::GetStore() const { return pImpl->store; }

void Gateway::SetTokenEndpointClient(std::shared_ptr<auth::ITokenEndpointClient> client) {
    std::lock_guard<std::mutex> lock(pImpl->tokenMutex);
    pImpl->tokenClient = std::move(client);
}

RegistrationResult Gateway::RegisterSpecification(const std::string& name, const std::string& rawContent,
                                                  const RegistrationOptions& options) {
    FUNC_SCOPE();
    JSONValue raw;
    try {
        raw = parseJSON(rawContent);
    } catch (const std::exception& e) {
        throw errors::invalidSpecification("$", std::string("document is not valid JSON: ") + e.what());
    }
    if (!raw.isObject()) {
        throw errors::invalidSpecification("$", "document root must be an object");
    }

    std::string familyName = options.familyHint;
    if (familyName.empty()) {
        auto detected = pImpl->registry.DetectFamily(raw);
        if (!detected) {
            throw GatewayError(ErrorKind::UnsupportedFamily, "No registered spec family accepts document " + name, name);
        }
        familyName = *detected;
    }
    if (!pImpl->registry.ValidateCompleteness(familyName).complete()) {
        throw GatewayError(ErrorKind::UnsupportedFamily, "Spec family " + familyName + " is not fully registered",
                           familyName);
    }

    resolve::RefResolver::Options ropts;
    ropts.maxDepth = pImpl->options.maxRefDepth;
    if (pImpl->options.allowExternalRefs) {
        Impl* impl = pImpl.get();
        ropts.fetcher = [impl](const std::string& url) { return impl->fetchDocument(url); };
    }
    const JSONValue resolved = resolve::RefResolver(ropts).Resolve(raw);

    auto model = pImpl->registry.LookupModel(familyName)(resolved);
    model->Validate();
    std::vector<Endpoint> endpoints = pImpl->registry.LookupParser(familyName)->ExtractEndpoints(*model);
    for (const auto& ep : endpoints) {
        if (ep.protocol == protocol::Unknown || !pImpl->registry.HasProtocol(ep.protocol)) {
            throw GatewayError(ErrorKind::UnsupportedProtocol,
                               "Operation " + ep.operationKind + " " + ep.addressPattern + " uses unsupported protocol " +
                                   ep.protocol,
                               ep.addressPattern, ep.protocol);
        }
    }

    Specification spec;
    spec.specId = generateId();
    spec.name = name;
    spec.specFamily = familyName;
    spec.rawContent = rawContent;
    spec.resolvedContent = resolved;
    spec.version = model->Version();
    spec.servers = model->Servers();

    ApiDocument doc;
    doc.id = generateId();
    doc.specId = spec.specId;
    doc.name = name;
    doc.version = options.version.empty() ? spec.version : options.version;
    doc.specFamily = familyName;
    doc.createdAt = pImpl->clock();
    doc.baseAddress = options.baseAddress;
    if (doc.baseAddress.empty() && familyName == family::Rest && !spec.servers.empty()) {
        doc.baseAddress = spec.servers.front().url;
    }

    for (auto& ep : endpoints) {
        ep.id = generateId();
        ep.apiDocumentId = doc.id;
    }
    pImpl->store->SaveRegistration(spec, doc, endpoints);
    LOG_INFO("Registered {} document '{}' ({}) with {} endpoints", familyName, name, doc.id, endpoints.size());
    return RegistrationResult{doc.id, spec.specId, std::move(endpoints)};
}

bool Gateway::UnregisterDocument(const std::string& documentId) {
    const bool removed = pImpl->store->DeleteApiDocument(documentId);
    if (removed) {
        LOG_INFO("Unregistered document {}", documentId);
    }
    return removed;
}

std::vector<ApiDocument> Gateway::ListApiDocuments() const { return pImpl->store->ListApiDocuments(); }

std::optional<ApiDocument> Gateway::GetApiDocument(const std::string& documentId) const {
    return pImpl->store->GetApiDocument(documentId);
}

std::vector<Endpoint> Gateway::ListEndpoints(const std::string& documentId) const {
    return pImpl->store->ListEndpoints(documentId);
}

std::optional<Endpoint> Gateway::GetEndpoint(const std::string& endpointId) const {
    return pImpl->store->GetEndpoint(endpointId);
}

CallResult Gateway::CallEndpoint(const std::string& endpointId, const CallInput& input) {
    return pImpl->call(endpointId, input, protocol::MessageHandler(), nullptr);
}

CallResult Gateway::CallByAddress(const std::string& address, const std::string& operationKind,
                                  const std::string& documentId, const CallInput& input) {
    FUNC_SCOPE();
    const Endpoint* best = nullptr;
    std::map<std::string, std::string> bestCaptures;
    std::size_t bestTokens = 0;
    const std::vector<Endpoint> endpoints = pImpl->store->ListEndpoints(documentId);
    for (const auto& ep : endpoints) {
        if (!iequals(ep.operationKind, operationKind)) {
            continue;
        }
        request::PathMatcher matcher(ep.addressPattern);
        std::map<std::string, std::string> captures;
        if (!matcher.Match(address, &captures)) {
            continue;
        }
        // Prefer the most literal pattern (/pets/mine over /pets/{id}).
        if (!best || matcher.ParameterNames().size() < bestTokens) {
            best = &ep;
            bestCaptures = std::move(captures);
            bestTokens = matcher.ParameterNames().size();
        }
    }
    if (!best) {
        CallResult out;
        fillFailure(out, GatewayError(ErrorKind::EndpointNotFound,
                                      "No " + operationKind + " endpoint matches " + address, address));
        LOG_WARN("No endpoint in document {} matches {} {}", documentId, operationKind, address);
        return out;
    }

    CallInput merged = input;
    for (const auto& [k, v] : bestCaptures) {
        merged.params.emplace(k, JSONValue(percentDecode(v)));
    }
    const std::size_t q = address.find('?');
    if (q != std::string::npos) {
        const std::string query = address.substr(q + 1);
        std::size_t start = 0;
        while (start <= query.size()) {
            std::size_t amp = query.find('&', start);
            if (amp == std::string::npos) amp = query.size();
            const std::string kv = query.substr(start, amp - start);
            if (!kv.empty()) {
                const std::size_t eq = kv.find('=');
                const std::string k = percentDecode(kv.substr(0, eq));
                const std::string v = eq == std::string::npos ? std::string() : percentDecode(kv.substr(eq + 1));
                merged.params.emplace(k, JSONValue(v));
            }
            start = amp + 1;
        }
    }
    return CallEndpoint(best->id, merged);
}

std::string Gateway::Subscribe(const std::string& endpointId, const CallInput& input, protocol::MessageHandler handler) {
    const auto ep = pImpl->store->GetEndpoint(endpointId);
    if (!ep) {
        throw GatewayError(ErrorKind::EndpointNotFound, "Endpoint not found: " + endpointId, endpointId);
    }
    if (ep->operationKind != "subscribe") {
        throw GatewayError(ErrorKind::InvalidConfiguration,
                           "Endpoint " + endpointId + " is a " + ep->operationKind + " operation, not subscribe",
                           endpointId);
    }
    std::optional<GatewayError> failure;
    CallResult result = pImpl->call(endpointId, input, std::move(handler), &failure);
    if (failure) {
        throw *failure;
    }
    return result.subscriptionId;
}

bool Gateway::Unsubscribe(const std::string& subscriptionId) {
    std::shared_ptr<protocol::IProtocolAdapter> adapter;
    {
        std::lock_guard<std::mutex> lock(pImpl->adaptersMutex);
        auto it = pImpl->subscriptions.find(subscriptionId);
        if (it == pImpl->subscriptions.end()) {
            return false;
        }
        adapter = it->second;
        pImpl->subscriptions.erase(it);
    }
    auto ps = std::dynamic_pointer_cast<protocol::IPubSubAdapter>(adapter);
    if (!ps) {
        return false;
    }
    ps->Unsubscribe(subscriptionId);
    LOG_INFO("Unsubscribed {}", subscriptionId);
    return true;
}

std::vector<CallLogRecord> Gateway::ListCallLogs(const std::string& endpointId, std::size_t limit) const {
    return pImpl->store->ListCallLogs(endpointId, limit);
}

AuthConfig Gateway::AddAuthConfig(AuthConfig config) {
    if (!pImpl->dispatcher.SupportsScheme(config.scheme)) {
        throw GatewayError(ErrorKind::InvalidConfiguration, "Unknown auth scheme: " + config.scheme, "scheme");
    }
    if (!config.global && !pImpl->store->GetApiDocument(config.apiDocumentId)) {
        throw GatewayError(ErrorKind::InvalidConfiguration, "Unknown document for auth config: " + config.apiDocumentId,
                           "api_document_id");
    }
    if (config.config.isNull()) {
        config.config = JSONValue::object();
    }
    if (!config.config.isObject()) {
        throw GatewayError(ErrorKind::InvalidConfiguration, "Auth config must be a JSON object", "config");
    }
    if (config.scheme == scheme::OAuth2) {
        (void)auth::OAuth2Flow::ReadSettings(config, pImpl->options.oauthDefaultScope);
    }
    if (config.id.empty()) {
        config.id = generateId();
    }
    pImpl->store->SaveAuthConfig(config);
    LOG_INFO("Added {} auth config {} (document {}, priority {}{})", config.scheme, config.id,
             config.global ? std::string("*") : config.apiDocumentId, config.priority, config.global ? ", global" : "");
    return config;
}

std::vector<AuthConfig> Gateway::ListAuthConfigs(const std::string& documentId) const {
    return pImpl->store->ListAuthConfigs(documentId);
}

bool Gateway::RemoveAuthConfig(const std::string& configId) {
    return pImpl->store->DeleteAuthConfig(configId);
}

auth::AuthorizationStart Gateway::BeginAuthorization(const std::string& userId, const std::string& documentId) {
    return pImpl->oauthFlow()->InitiateAuthorization(userId, documentId);
}

UserAuthorization Gateway::CompleteAuthorization(const std::string& stateId, const std::string& code,
                                                 const std::string& state) {
    return pImpl->oauthFlow()->HandleCallback(stateId, code, state);
}

UserAuthorization Gateway::RefreshAuthorization(const std::string& userId, const std::string& documentId) {
    return pImpl->oauthFlow()->RefreshAuthorization(userId, documentId);
}

std::size_t Gateway::PurgeExpiredAuthStates() {
    return pImpl->store->PurgeExpiredAuthStates(pImpl->clock());
}

std::shared_ptr<protocol::IProtocolAdapter> Gateway::AdapterFor(const std::string& protocolName) {
    return pImpl->adapterFor(protocolName);
}

void Gateway::Shutdown() {
    std::map<std::string, std::shared_ptr<protocol::IProtocolAdapter>> toClose;
    {
        std::lock_guard<std::mutex> lock(pImpl->adaptersMutex);
        if (pImpl->shutDown) {
            return;
        }
        pImpl->shutDown = true;
        toClose.swap(pImpl->adapters);
        pImpl->subscriptions.clear();
    }
    for (auto& [name, adapter] : toClose) {
        try {
            adapter->Shutdown();
        } catch (const std::exception& e) {
            LOG_WARN("Shutdown of {} adapter failed: {}", name, e.what());
        }
    }
    LOG_DEBUG("Gateway shut down ({} adapters)", toClose.size());
}

} // namespace apigw
