#include "bootstrap/Bootstrap.hpp"
#include "bootstrap/HealthGate.hpp"
#include "bootstrap/VaultStateController.hpp"
#include "crypto/MasterKeyEncryption.hpp"
#include "errors/BootstrapError.hpp"
#include "log/Registry.hpp"
#include "provision/CertificateProvisioner.hpp"
#include "provision/CredentialProvisioner.hpp"
#include "provision/SecretsEngine.hpp"
#include "tokens/TokenLifecycleManager.hpp"
#include "tokens/TokenProvider.hpp"
#include "util/Cancellation.hpp"

#include <fmt/core.h>
#include <functional>

using namespace kw::engine;
using namespace kw::tokens;
using namespace kw::provision;
using namespace kw::types;

namespace kw::bootstrap {

namespace {

// Runs the stored callable when the scope unwinds, if one was set.
struct RevokeOnExit {
    std::function<void()> revoke;
    ~RevokeOnExit() { if (revoke) revoke(); }
};

}

std::string_view to_string(const RunResult::Outcome outcome) {
    switch (outcome) {
        case RunResult::Outcome::Completed: return "completed";
        case RunResult::Outcome::Standby: return "standby";
        case RunResult::Outcome::Cancelled: return "cancelled";
    }
    return "unknown";
}

Bootstrap::Bootstrap(EngineClient& client,
                     const config::Config& cfg,
                     std::optional<std::string> ikmHook,
                     std::shared_ptr<crypto::IkmReader> ikmReader)
    : client_(client), cfg_(cfg), ikmHook_(std::move(ikmHook)), ikmReader_(std::move(ikmReader)) {}

RunResult Bootstrap::run(util::Cancellation& cancellation) {
    const auto& ss = cfg_.secret_store;

    crypto::MasterKeyEncryption mke(ikmReader_, crypto::Kdf(ss.token_folder_path));
    crypto::IkmWipeGuard ikmGuard(mke);

    if (ikmHook_ && !ikmHook_->empty()) {
        try {
            mke.loadIkm(*ikmHook_);
        } catch (const std::exception& e) {
            errors::fatal(fmt::format("failed to load IKM from {}: {}", *ikmHook_, e.what()));
        }
        log::Registry::keywarden()->info("[Bootstrap] Init material will be encrypted at rest");
    } else {
        log::Registry::keywarden()->info("[Bootstrap] {} not set, init material is stored unencrypted", IKM_HOOK_ENV);
    }

    VaultStateController controller(client_, ss, InitMaterialStore(ss.tokenFilePath()), &mke);
    const auto unsealed = controller.runUntilReady(std::chrono::seconds(ss.vault_interval_seconds), cancellation);

    if (unsealed.outcome != UnsealResult::Outcome::Ready)
        log::Registry::keywarden()->info("[Bootstrap] Secret store is {}, skipping token and secret setup",
                                         to_string(unsealed.outcome));

    switch (unsealed.outcome) {
        case UnsealResult::Outcome::Standby: return {RunResult::Outcome::Standby};
        case UnsealResult::Outcome::Cancelled: return {RunResult::Outcome::Cancelled};
        case UnsealResult::Outcome::Ready: break;
    }
    auto material = *unsealed.material;

    // The engine rejects requests for a while after unsealing
    HealthGate gate(client_, std::chrono::milliseconds(ss.health_poll_interval_ms));
    if (!gate.waitUntilReady(cancellation)) return {RunResult::Outcome::Cancelled};

    const TokenLifecycleManager tokens(client_);
    auto root = tokens.regenerateRootToken(material);
    RootTokenGuard rootGuard(tokens, root);

    if (ss.revoke_root_tokens) {
        if (material.hasRootToken()) {
            material.stripRootToken();
            controller.persist(material);
            log::Registry::keywarden()->info("[Bootstrap] Root token stripped from persisted init material");
        }
        try {
            tokens.revokeRootTokens(root);
        } catch (const EngineError& e) {
            log::Registry::keywarden()->warn("[Bootstrap] Failed to revoke non-transient root tokens: {}", e.what());
        }
    } else {
        log::Registry::keywarden()->info("[Bootstrap] Not revoking existing root tokens");
    }

    try {
        tokens.revokeNonRootTokens(root);
    } catch (const EngineError& e) {
        log::Registry::keywarden()->warn("[Bootstrap] Failed to revoke non-root tokens: {}", e.what());
    }

    RevokeOnExit delegateGuard;
    if (!ss.token_provider_admin_token_path.empty()) {
        IssuingToken issuing;
        try {
            issuing = tokens.createTokenIssuingToken(root);
        } catch (const EngineError& e) {
            errors::fatal(fmt::format("failed to create token issuing token: {}", e.what()));
        }

        TokenLifecycleManager::writeAdminTokenFile(issuing, ss.token_provider_admin_token_path);

        // Long-running providers keep their own token fresh from here on
        if (ss.token_provider_type == ONESHOT_PROVIDER) delegateGuard.revoke = issuing.revoke;
    }

    if (const auto provider = TokenProvider::fromConfig(ss); provider.configured()) provider.launch();
    else log::Registry::keywarden()->info("[Bootstrap] No token provider configured");

    ensureKVSecretsEngine(client_, root.value);

    const auto generator = makePasswordGenerator(ss.password_provider, ss.password_provider_args);
    const CredentialProvisioner credentials(client_, root.value, *generator, cfg_.credentials);
    credentials.provisionAll(cfg_.databases);

    if (ss.hasCertificateConfig()) {
        const CertificateProvisioner certs(client_, root.value, ss.cert_path);
        certs.provision(ss.cert_file_path, ss.key_file_path);
    } else {
        log::Registry::keywarden()->info("[Bootstrap] Certificate upload skipped, certificate settings are blank");
    }

    log::Registry::keywarden()->info("[Bootstrap] Secret store setup completed");
    return {RunResult::Outcome::Completed};
}

}
