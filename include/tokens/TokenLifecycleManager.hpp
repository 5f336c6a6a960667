#pragma once

#include "engine/EngineClient.hpp"
#include "types/InitMaterial.hpp"
#include "types/Token.hpp"

#include <filesystem>
#include <functional>
#include <nlohmann/json.hpp>

namespace kw::tokens {

inline constexpr const auto* TOKEN_CREATOR_POLICY_NAME = "privileged-token-creator";
inline constexpr const auto* ROOT_POLICY = "root";

// Delegate token allowed to mint per-service tokens, handed to the token provider.
struct IssuingToken {
    types::Token token;
    nlohmann::json response;     // full auth/token/create response
    std::function<void()> revoke;
};

class TokenLifecycleManager {
public:
    explicit TokenLifecycleManager(engine::EngineClient& client) : client_(client) {}

    // Mints a fresh root token from the key shares via the generate-root protocol. The
    // returned token carries no accessor. Fatal on failure.
    types::Token regenerateRootToken(const types::InitMaterial& material) const;

    // Revokes the token with itself. No-op when the token is already revoked.
    void revokeSelf(types::Token& token) const;

    // Revoke every token with (or without) the root policy except `keep`. Listing
    // failures throw; a token that cannot be looked up or revoked is only logged.
    // Returns the number of revoked tokens.
    size_t revokeRootTokens(const types::Token& keep) const;
    size_t revokeNonRootTokens(const types::Token& keep) const;

    IssuingToken createTokenIssuingToken(const types::Token& root) const;

    // Writes the creation response for the token provider. Revokes the token and
    // aborts the run when the file cannot be written.
    static void writeAdminTokenFile(const IssuingToken& issuing, const std::filesystem::path& path);

private:
    engine::EngineClient& client_;

    size_t revokeMatching(const types::Token& keep, bool rootTokens) const;
};

// Revokes the transient root token exactly once when the run unwinds.
class RootTokenGuard {
public:
    RootTokenGuard(const TokenLifecycleManager& manager, types::Token& token) : manager_(manager), token_(token) {}
    ~RootTokenGuard();

    RootTokenGuard(const RootTokenGuard&) = delete;
    RootTokenGuard& operator=(const RootTokenGuard&) = delete;

private:
    const TokenLifecycleManager& manager_;
    types::Token& token_;
};

}
