#pragma once

#include "engine/EngineClient.hpp"
#include "config/Config.hpp"
#include "util/curlWrappers.hpp"

#include <initializer_list>
#include <string>

namespace kw::engine {

// Response decoding. A body that does not have the expected shape raises EngineError.
types::InitMaterial parseInitResponse(const nlohmann::json& resp, int threshold, int shares);
UnsealStatus parseUnsealStatus(const nlohmann::json& resp);
RootGenerationAttempt parseRootGenerationAttempt(const nlohmann::json& resp);
RootGenerationProgress parseRootGenerationProgress(const nlohmann::json& resp);
TokenLookup parseTokenLookup(const nlohmann::json& resp);
std::vector<std::string> parseAccessorList(const nlohmann::json& resp);
CreatedToken parseCreatedToken(nlohmann::json resp);
bool hasMountOfType(const nlohmann::json& resp, const std::string& mountPoint, const std::string& engineType);

// EngineClient speaking the Vault-compatible HTTP API through libcurl.
class HttpEngineClient : public EngineClient {
public:
    explicit HttpEngineClient(const config::SecretStoreConfig& cfg);

    std::optional<long> healthCheck() override;

    types::InitMaterial initialize(int threshold, int shares) override;
    UnsealStatus submitUnsealKey(const std::string& key) override;

    void cancelRootGeneration() override;
    RootGenerationAttempt startRootGeneration() override;
    RootGenerationProgress submitRootGenerationKey(const std::string& nonce, const std::string& key) override;

    void revokeSelf(const std::string& token) override;
    TokenLookup lookupSelf(const std::string& token) override;
    std::vector<std::string> listAccessors(const std::string& token) override;
    TokenLookup lookupAccessor(const std::string& token, const std::string& accessor) override;
    void revokeAccessor(const std::string& token, const std::string& accessor) override;
    void installPolicy(const std::string& token, const std::string& name, const std::string& policy) override;
    CreatedToken createToken(const std::string& token, const nlohmann::json& params) override;

    bool isSecretsEngineInstalled(const std::string& token, const std::string& mountPoint,
                                  const std::string& engineType) override;
    void enableKVSecretsEngine(const std::string& token, const std::string& mountPoint,
                               const std::string& kvVersion) override;

    std::optional<nlohmann::json> readSecret(const std::string& token, const std::string& path) override;
    void writeSecret(const std::string& token, const std::string& path, const nlohmann::json& data) override;

    [[nodiscard]] std::string urlFor(const std::string& path) const;

private:
    std::string protocol_, host_, serverName_, caFile_;
    uint16_t port_;
    bool verifyTls_;
    long timeoutSeconds_;

    [[nodiscard]] util::HttpResponse request(const std::string& method,
                                             const std::string& path,
                                             const std::string& token = {},
                                             const nlohmann::json* body = nullptr) const;

    // Performs the request and throws EngineError unless the status is one of `expected`.
    nlohmann::json call(const std::string& method,
                        const std::string& path,
                        std::initializer_list<long> expected,
                        const std::string& token = {},
                        const nlohmann::json* body = nullptr) const;
};

}
