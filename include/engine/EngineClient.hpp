#pragma once

#include "errors/BootstrapError.hpp"
#include "types/InitMaterial.hpp"

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace kw::engine {

// Raised for transport failures and unexpected responses from the engine API.
class EngineError : public errors::BootstrapError {
public:
    explicit EngineError(const std::string& what, long httpStatus = 0,
                         errors::ErrorKind kind = errors::ErrorKind::Transient)
        : BootstrapError(kind, what), httpStatus_(httpStatus) {}

    [[nodiscard]] long httpStatus() const { return httpStatus_; }

private:
    long httpStatus_;
};

// Strips a leading "/" and "v1/" so paths can be given either way.
std::string normalizePath(const std::string& path);

struct UnsealStatus {
    bool sealed = true;
    int threshold = 0;
    int progress = 0;
};

struct RootGenerationAttempt {
    std::string nonce;
    std::string otp;
    int required = 0;
};

struct RootGenerationProgress {
    bool complete = false;
    int progress = 0;
    std::string encodedToken;
};

struct TokenLookup {
    std::string accessor;
    std::string displayName;
    std::vector<std::string> policies;

    [[nodiscard]] bool hasPolicy(const std::string& policy) const;
};

struct CreatedToken {
    std::string token;
    std::string accessor;
    nlohmann::json response;
};

// Administrative API of the secret-store engine. Paths passed to the secret
// methods are relative to the API root (e.g. "secret/edgex/core-data/redisdb").
class EngineClient {
public:
    virtual ~EngineClient() = default;

    // Status code of the health endpoint, or nullopt when the engine could not be reached
    virtual std::optional<long> healthCheck() = 0;

    virtual types::InitMaterial initialize(int threshold, int shares) = 0;
    virtual UnsealStatus submitUnsealKey(const std::string& key) = 0;

    virtual void cancelRootGeneration() = 0;
    virtual RootGenerationAttempt startRootGeneration() = 0;
    virtual RootGenerationProgress submitRootGenerationKey(const std::string& nonce, const std::string& key) = 0;

    virtual void revokeSelf(const std::string& token) = 0;
    virtual TokenLookup lookupSelf(const std::string& token) = 0;
    virtual std::vector<std::string> listAccessors(const std::string& token) = 0;
    virtual TokenLookup lookupAccessor(const std::string& token, const std::string& accessor) = 0;
    virtual void revokeAccessor(const std::string& token, const std::string& accessor) = 0;
    virtual void installPolicy(const std::string& token, const std::string& name, const std::string& policy) = 0;
    virtual CreatedToken createToken(const std::string& token, const nlohmann::json& params) = 0;

    virtual bool isSecretsEngineInstalled(const std::string& token, const std::string& mountPoint,
                                          const std::string& engineType) = 0;
    virtual void enableKVSecretsEngine(const std::string& token, const std::string& mountPoint,
                                       const std::string& kvVersion) = 0;

    // The secret's "data" object, or nullopt when nothing is stored at the path
    virtual std::optional<nlohmann::json> readSecret(const std::string& token, const std::string& path) = 0;
    virtual void writeSecret(const std::string& token, const std::string& path, const nlohmann::json& data) = 0;
};

}
