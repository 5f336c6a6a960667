#include "engine/HttpEngineClient.hpp"
#include "engine/EngineState.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fmt/core.h>

using namespace kw::util;
using namespace kw::types;
using json = nlohmann::json;

namespace kw::engine {

namespace {

std::string describeErrors(const std::string& body) {
    const auto j = json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.contains("errors") || !j["errors"].is_array() || j["errors"].empty()) return body;

    std::string out;
    for (const auto& e : j["errors"]) {
        if (!out.empty()) out += "; ";
        out += e.is_string() ? e.get<std::string>() : e.dump();
    }
    return out;
}

// Runs a decoder over a response body, reporting shape errors as engine errors
template <typename Fn>
auto decoding(const char* what, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const json::exception& e) {
        throw EngineError(fmt::format("unexpected {} response: {}", what, e.what()));
    }
}

}

InitMaterial parseInitResponse(const json& resp, const int threshold, const int shares) {
    auto m = decoding("init", [&] {
        InitMaterial out;
        const auto root = resp.value("root_token", "");
        if (!root.empty()) out.root_token = root;
        out.keys = resp.value("keys", std::vector<std::string>{});
        out.keys_base64 = resp.value("keys_base64", std::vector<std::string>{});
        out.secret_threshold = threshold;
        out.secret_shares = shares;
        return out;
    });

    if (m.shareCount() != static_cast<size_t>(shares))
        throw EngineError(fmt::format("init returned {} key shares, expected {}", m.shareCount(), shares));
    return m;
}

UnsealStatus parseUnsealStatus(const json& resp) {
    return decoding("unseal", [&] {
        return UnsealStatus{resp.value("sealed", true), resp.value("t", 0), resp.value("progress", 0)};
    });
}

RootGenerationAttempt parseRootGenerationAttempt(const json& resp) {
    return decoding("generate-root attempt", [&] {
        return RootGenerationAttempt{resp.value("nonce", ""), resp.value("otp", ""), resp.value("required", 0)};
    });
}

RootGenerationProgress parseRootGenerationProgress(const json& resp) {
    return decoding("generate-root update", [&] {
        RootGenerationProgress p;
        p.complete = resp.value("complete", false);
        p.progress = resp.value("progress", 0);
        p.encodedToken = resp.value("encoded_token", "");
        if (p.encodedToken.empty()) p.encodedToken = resp.value("encoded_root_token", "");
        return p;
    });
}

TokenLookup parseTokenLookup(const json& resp) {
    return decoding("token lookup", [&] {
        const auto& data = resp.at("data");
        TokenLookup lookup;
        lookup.accessor = data.value("accessor", "");
        lookup.displayName = data.value("display_name", "");
        if (data.contains("policies") && !data["policies"].is_null())
            lookup.policies = data["policies"].get<std::vector<std::string>>();
        return lookup;
    });
}

std::vector<std::string> parseAccessorList(const json& resp) {
    return decoding("accessor list", [&] {
        return resp.at("data").value("keys", std::vector<std::string>{});
    });
}

CreatedToken parseCreatedToken(json resp) {
    auto created = decoding("token create", [&] {
        const auto& auth = resp.at("auth");
        return CreatedToken{auth.at("client_token").get<std::string>(), auth.value("accessor", ""), {}};
    });
    if (created.token.empty()) throw EngineError("unexpected token create response: empty client_token");
    created.response = std::move(resp);
    return created;
}

bool hasMountOfType(const json& resp, const std::string& mountPoint, const std::string& engineType) {
    return decoding("mount list", [&] {
        const auto& mounts = resp.contains("data") && resp["data"].is_object() ? resp["data"] : resp;
        const auto it = mounts.find(mountPoint);
        if (it == mounts.end() || !it->is_object()) return false;
        return it->value("type", "") == engineType;
    });
}

HttpEngineClient::HttpEngineClient(const config::SecretStoreConfig& cfg)
    : protocol_(cfg.protocol),
      host_(cfg.server),
      serverName_(cfg.server_name),
      caFile_(cfg.ca_file_path),
      port_(cfg.port),
      verifyTls_(!cfg.ca_file_path.empty() && !cfg.insecure_skip_verify),
      timeoutSeconds_(static_cast<long>(cfg.request_timeout_seconds)) {
    ensureCurlGlobalInit();

    if (protocol_ == "https") {
        if (verifyTls_) log::Registry::http()->info("[HttpEngineClient] Using certificate verification for secret store connection");
        else log::Registry::http()->warn("[HttpEngineClient] Bypassing certificate verification for secret store connection");
    }
}

std::string HttpEngineClient::urlFor(const std::string& path) const {
    const auto& host = verifyTls_ && !serverName_.empty() ? serverName_ : host_;
    return fmt::format("{}://{}:{}/v1/{}", protocol_, host, port_, normalizePath(path));
}

HttpResponse HttpEngineClient::request(const std::string& method,
                                       const std::string& path,
                                       const std::string& token,
                                       const json* body) const {
    const auto url = urlFor(path);
    const std::string payload = body ? body->dump() : std::string{};

    SList hdrs;
    hdrs.add("Accept: application/json");
    if (body) hdrs.add("Content-Type: application/json");
    if (!token.empty()) hdrs.add("X-Vault-Token: " + token);

    std::string connectTo;
    SList connectToList;
    if (verifyTls_ && !serverName_.empty() && serverName_ != host_) {
        connectTo = fmt::format("{}:{}:{}:{}", serverName_, port_, host_, port_);
        connectToList.add(connectTo);
    }

    log::Registry::http()->debug("[HttpEngineClient] {} {}", method, url);

    auto resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_TIMEOUT, timeoutSeconds_);

        if (method == "GET") curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        else if (method != "POST") curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, method.c_str());

        if (body || method == "POST" || method == "PUT") {
            curl_easy_setopt(h, CURLOPT_POSTFIELDS, payload.c_str());
            curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(payload.size()));
        }

        if (verifyTls_) {
            curl_easy_setopt(h, CURLOPT_CAINFO, caFile_.c_str());
            curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 1L);
            curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 2L);
            if (connectToList.get()) curl_easy_setopt(h, CURLOPT_CONNECT_TO, connectToList.get());
        } else {
            curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 0L);
            curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 0L);
        }
    });

    if (!resp.reached())
        log::Registry::http()->debug("[HttpEngineClient] {} {} failed: {}", method, url, curl_easy_strerror(resp.curl));
    return resp;
}

json HttpEngineClient::call(const std::string& method,
                            const std::string& path,
                            const std::initializer_list<long> expected,
                            const std::string& token,
                            const json* body) const {
    const auto resp = request(method, path, token, body);

    if (!resp.reached())
        throw EngineError(fmt::format("{} {}: {}", method, path, curl_easy_strerror(resp.curl)));

    if (std::ranges::find(expected, resp.http) == expected.end())
        throw EngineError(fmt::format("{} {} returned status {}: {}", method, path, resp.http, describeErrors(resp.body)),
                          resp.http);

    if (resp.body.empty()) return json::object();
    auto parsed = json::parse(resp.body, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded())
        throw EngineError(fmt::format("{} {} returned malformed JSON", method, path), resp.http);
    return parsed;
}

std::optional<long> HttpEngineClient::healthCheck() {
    const auto resp = request("GET", "sys/health");
    if (!resp.reached()) return std::nullopt;
    return resp.http;
}

InitMaterial HttpEngineClient::initialize(const int threshold, const int shares) {
    const json body = {{"secret_shares", shares}, {"secret_threshold", threshold}};
    return parseInitResponse(call("PUT", "sys/init", {200}, {}, &body), threshold, shares);
}

UnsealStatus HttpEngineClient::submitUnsealKey(const std::string& key) {
    const json body = {{"key", key}};
    return parseUnsealStatus(call("PUT", "sys/unseal", {200}, {}, &body));
}

void HttpEngineClient::cancelRootGeneration() {
    call("DELETE", "sys/generate-root/attempt", {200, 204});
}

RootGenerationAttempt HttpEngineClient::startRootGeneration() {
    const json body = json::object();
    return parseRootGenerationAttempt(call("PUT", "sys/generate-root/attempt", {200}, {}, &body));
}

RootGenerationProgress HttpEngineClient::submitRootGenerationKey(const std::string& nonce, const std::string& key) {
    const json body = {{"key", key}, {"nonce", nonce}};
    return parseRootGenerationProgress(call("PUT", "sys/generate-root/update", {200}, {}, &body));
}

void HttpEngineClient::revokeSelf(const std::string& token) {
    call("POST", "auth/token/revoke-self", {200, 204}, token);
}

TokenLookup HttpEngineClient::lookupSelf(const std::string& token) {
    return parseTokenLookup(call("GET", "auth/token/lookup-self", {200}, token));
}

std::vector<std::string> HttpEngineClient::listAccessors(const std::string& token) {
    return parseAccessorList(call("LIST", "auth/token/accessors", {200}, token));
}

TokenLookup HttpEngineClient::lookupAccessor(const std::string& token, const std::string& accessor) {
    const json body = {{"accessor", accessor}};
    return parseTokenLookup(call("POST", "auth/token/lookup-accessor", {200}, token, &body));
}

void HttpEngineClient::revokeAccessor(const std::string& token, const std::string& accessor) {
    const json body = {{"accessor", accessor}};
    call("POST", "auth/token/revoke-accessor", {200, 204}, token, &body);
}

void HttpEngineClient::installPolicy(const std::string& token, const std::string& name, const std::string& policy) {
    const json body = {{"policy", policy}};
    call("PUT", "sys/policies/acl/" + name, {200, 204}, token, &body);
}

CreatedToken HttpEngineClient::createToken(const std::string& token, const json& params) {
    return parseCreatedToken(call("POST", "auth/token/create", {200}, token, &params));
}

bool HttpEngineClient::isSecretsEngineInstalled(const std::string& token, const std::string& mountPoint,
                                                const std::string& engineType) {
    return hasMountOfType(call("GET", "sys/mounts", {200}, token), mountPoint, engineType);
}

void HttpEngineClient::enableKVSecretsEngine(const std::string& token, const std::string& mountPoint,
                                             const std::string& kvVersion) {
    const json body = {{"type", "kv"}, {"options", {{"version", kvVersion}}}};
    call("POST", "sys/mounts/" + mountPoint, {200, 204}, token, &body);
}

std::optional<json> HttpEngineClient::readSecret(const std::string& token, const std::string& path) {
    const auto resp = request("GET", path, token);
    if (!resp.reached())
        throw EngineError(fmt::format("GET {}: {}", path, curl_easy_strerror(resp.curl)));
    if (resp.http == 404) return std::nullopt;
    if (resp.http != status::Ok)
        throw EngineError(fmt::format("GET {} returned status {}: {}", path, resp.http, describeErrors(resp.body)),
                          resp.http);

    const auto parsed = json::parse(resp.body, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded() || !parsed.contains("data"))
        throw EngineError(fmt::format("GET {} returned an unexpected body", path), resp.http);
    return parsed["data"];
}

void HttpEngineClient::writeSecret(const std::string& token, const std::string& path, const json& data) {
    call("POST", path, {200, 204}, token, &data);
}

}
