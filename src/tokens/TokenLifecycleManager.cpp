#include "tokens/TokenLifecycleManager.hpp"
#include "crypto/util/encrypt.hpp"
#include "errors/BootstrapError.hpp"
#include "log/Registry.hpp"
#include "util/files.hpp"

#include <fmt/core.h>

using namespace kw::engine;
using namespace kw::types;
using namespace kw::crypto::util;
using json = nlohmann::json;

namespace kw::tokens {

namespace {

constexpr const auto* TOKEN_CREATOR_POLICY = R"(path "auth/token/create" {
  capabilities = ["create", "update", "sudo"]
}

path "auth/token/create-orphan" {
  capabilities = ["create", "update", "sudo"]
}

path "auth/token/create/*" {
  capabilities = ["create", "update", "sudo"]
}

path "sys/policies/acl/edgex-service-*" {
  capabilities = ["create", "read", "update", "delete"]
}

path "sys/policies/acl" {
  capabilities = ["list"]
}
)";

std::string xorWithOtp(const std::vector<uint8_t>& encoded, const std::string& otp) {
    if (encoded.size() != otp.size())
        throw std::runtime_error(fmt::format("encoded token length {} does not match OTP length {}",
                                             encoded.size(), otp.size()));

    std::string token(encoded.size(), '\0');
    for (size_t i = 0; i < encoded.size(); ++i)
        token[i] = static_cast<char>(encoded[i] ^ static_cast<uint8_t>(otp[i]));
    return token;
}

}

Token TokenLifecycleManager::regenerateRootToken(const InitMaterial& material) const {
    const auto keys = material.unsealKeys();
    if (keys.empty()) errors::fatal("cannot regenerate root token: init material holds no key shares");

    try {
        client_.cancelRootGeneration();
        const auto attempt = client_.startRootGeneration();
        if (attempt.nonce.empty() || attempt.otp.empty())
            errors::fatal("root token generation attempt returned no nonce or OTP");

        RootGenerationProgress progress;
        for (const auto& key : keys) {
            progress = client_.submitRootGenerationKey(attempt.nonce, key);
            if (progress.complete) break;
        }
        if (!progress.complete)
            errors::fatal(fmt::format("root token generation incomplete after {} key shares", keys.size()));

        // The accessor stays empty and is resolved by the revocation sweeps, so nothing
        // can fail between minting and handing the token to a RootTokenGuard
        auto decoded = b64_decode(progress.encodedToken);
        Token root{xorWithOtp(decoded, attempt.otp), {}, Token::Scope::Root, false};
        secure_wipe(decoded);

        log::Registry::token()->info("[TokenLifecycleManager] Generated transient root token");
        return root;
    } catch (const errors::BootstrapError& e) {
        if (e.isFatal()) throw;
        errors::fatal(fmt::format("could not regenerate root token: {}", e.what()));
    } catch (const std::exception& e) {
        errors::fatal(fmt::format("could not regenerate root token: {}", e.what()));
    }
}

void TokenLifecycleManager::revokeSelf(Token& token) const {
    if (!token.active()) return;
    client_.revokeSelf(token.value);
    token.revoked = true;
    log::Registry::token()->info("[TokenLifecycleManager] Revoked {} token", to_string(token.scope));
}

size_t TokenLifecycleManager::revokeRootTokens(const Token& keep) const {
    return revokeMatching(keep, true);
}

size_t TokenLifecycleManager::revokeNonRootTokens(const Token& keep) const {
    return revokeMatching(keep, false);
}

size_t TokenLifecycleManager::revokeMatching(const Token& keep, const bool rootTokens) const {
    const auto keepAccessor = keep.accessor.empty() ? client_.lookupSelf(keep.value).accessor : keep.accessor;
    const auto accessors = client_.listAccessors(keep.value);

    size_t revoked = 0;
    for (const auto& accessor : accessors) {
        if (accessor == keepAccessor) continue;

        try {
            const auto info = client_.lookupAccessor(keep.value, accessor);
            if (info.hasPolicy(ROOT_POLICY) != rootTokens) continue;

            client_.revokeAccessor(keep.value, accessor);
            ++revoked;
            log::Registry::token()->debug("[TokenLifecycleManager] Revoked {} token {} ({})",
                                          rootTokens ? "root" : "non-root", accessor, info.displayName);
        } catch (const EngineError& e) {
            log::Registry::token()->warn("[TokenLifecycleManager] Failed to revoke token with accessor {}: {}",
                                         accessor, e.what());
        }
    }

    log::Registry::token()->info("[TokenLifecycleManager] Revoked {} stale {} tokens", revoked,
                                 rootTokens ? "root" : "non-root");
    return revoked;
}

IssuingToken TokenLifecycleManager::createTokenIssuingToken(const Token& root) const {
    client_.installPolicy(root.value, TOKEN_CREATOR_POLICY_NAME, TOKEN_CREATOR_POLICY);

    const json params = {
        {"display_name", "token-provider"},
        {"no_parent", true},
        {"period", "1h"},
        {"policies", json::array({TOKEN_CREATOR_POLICY_NAME})},
        {"meta", {{"description", "Vault token issuing token for the token provider"}}}
    };
    auto created = client_.createToken(root.value, params);

    IssuingToken issuing;
    issuing.token = Token{created.token, created.accessor, Token::Scope::Delegate, false};
    issuing.response = std::move(created.response);

    auto& client = client_;
    issuing.revoke = [&client, rootValue = root.value, accessor = created.accessor] {
        try {
            client.revokeAccessor(rootValue, accessor);
            log::Registry::token()->info("[TokenLifecycleManager] Revoked token issuing token");
        } catch (const std::exception& e) {
            log::Registry::token()->error("[TokenLifecycleManager] Failed to revoke token issuing token: {}", e.what());
        }
    };

    log::Registry::token()->info("[TokenLifecycleManager] Created token issuing token");
    return issuing;
}

void TokenLifecycleManager::writeAdminTokenFile(const IssuingToken& issuing, const std::filesystem::path& path) {
    try {
        util::writeOwnerOnly(std::filesystem::absolute(path), issuing.response.dump() + "\n");
    } catch (const std::exception& e) {
        issuing.revoke();
        errors::fatal(fmt::format("failed to write token issuing token to {}: {}", path.string(), e.what()));
    }
    log::Registry::token()->info("[TokenLifecycleManager] Wrote token issuing token to {}", path.string());
}

RootTokenGuard::~RootTokenGuard() {
    if (!token_.active()) return;
    log::Registry::token()->info("[TokenLifecycleManager] Revoking transient root token");
    try {
        manager_.revokeSelf(token_);
    } catch (const std::exception& e) {
        log::Registry::token()->error("[TokenLifecycleManager] Could not revoke transient root token: {}", e.what());
    }
}

}
