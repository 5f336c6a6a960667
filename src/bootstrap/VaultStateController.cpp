#include "bootstrap/VaultStateController.hpp"
#include "crypto/MasterKeyEncryption.hpp"
#include "errors/BootstrapError.hpp"
#include "log/Registry.hpp"
#include "util/Cancellation.hpp"

#include <fmt/core.h>

using namespace kw::engine;
using namespace kw::types;

namespace kw::bootstrap {

std::string_view to_string(const UnsealResult::Outcome outcome) {
    switch (outcome) {
        case UnsealResult::Outcome::Ready: return "ready";
        case UnsealResult::Outcome::Standby: return "standby";
        case UnsealResult::Outcome::Cancelled: return "cancelled";
    }
    return "unknown";
}

VaultStateController::VaultStateController(EngineClient& client,
                                           const config::SecretStoreConfig& cfg,
                                           InitMaterialStore store,
                                           const crypto::MasterKeyEncryption* mke)
    : client_(client), cfg_(cfg), store_(std::move(store)), mke_(mke) {}

bool VaultStateController::encrypting() const {
    return mke_ && mke_->isEncrypting();
}

UnsealResult VaultStateController::runUntilReady(const std::chrono::milliseconds interval,
                                                 const util::Cancellation& cancellation) {
    unsigned int failures = 0;

    while (!cancellation.isCancelled()) {
        const auto state = classify(client_.healthCheck());
        const auto action = actionFor(state);
        log::Registry::engine()->debug("[VaultStateController] Engine is {}, next action: {}",
                                       to_string(state), to_string(action));

        bool progressed = false;

        switch (action) {
            case UnsealAction::Retry:
                log::Registry::engine()->warn("[VaultStateController] Secret store is not reachable yet");
                break;

            case UnsealAction::LoadAndFinish:
                log::Registry::engine()->info("[VaultStateController] Secret store is initialized and unsealed");
                return {UnsealResult::Outcome::Ready, loadPersisted()};

            case UnsealAction::Stop:
                log::Registry::engine()->error("[VaultStateController] Secret store is unsealed and in standby mode, "
                                               "nothing to do on this node");
                return {UnsealResult::Outcome::Standby, std::nullopt};

            case UnsealAction::InitializeAndUnseal: {
                log::Registry::engine()->info("[VaultStateController] Initializing secret store with {}-of-{} key shares",
                                              cfg_.vault_secret_threshold, cfg_.vault_secret_shares);
                InitMaterial material;
                try {
                    material = client_.initialize(cfg_.vault_secret_threshold, cfg_.vault_secret_shares);
                } catch (const EngineError& e) {
                    log::Registry::engine()->error("[VaultStateController] Initialization failed: {}", e.what());
                    break;
                }

                persist(material);
                progressed = unseal(material);
                break;
            }

            case UnsealAction::LoadAndUnseal:
                log::Registry::engine()->info("[VaultStateController] Secret store is sealed, unsealing with persisted shares");
                progressed = unseal(loadPersisted());
                break;
        }

        // Confirm the new state right away after a successful unseal
        if (progressed) {
            failures = 0;
            continue;
        }

        ++failures;
        if (cfg_.max_unseal_attempts && failures >= cfg_.max_unseal_attempts)
            errors::fatal(fmt::format("secret store not ready after {} attempts", failures));

        if (!cancellation.sleepFor(interval)) break;
    }

    log::Registry::engine()->info("[VaultStateController] Cancelled while waiting for the secret store");
    return {UnsealResult::Outcome::Cancelled, std::nullopt};
}

bool VaultStateController::unseal(const InitMaterial& m) const {
    const auto keys = m.unsealKeys();
    if (keys.empty()) errors::fatal("init material holds no usable unseal keys");

    try {
        for (size_t i = 0; i < keys.size(); ++i) {
            const auto status = client_.submitUnsealKey(keys[i]);
            log::Registry::engine()->debug("[VaultStateController] Submitted key share {} (progress {}/{})",
                                           i + 1, status.progress, status.threshold);
            if (!status.sealed) {
                log::Registry::engine()->info("[VaultStateController] Secret store unsealed");
                return true;
            }
        }
        log::Registry::engine()->error("[VaultStateController] Secret store still sealed after submitting {} key shares",
                                       keys.size());
    } catch (const EngineError& e) {
        log::Registry::engine()->error("[VaultStateController] Unseal failed: {}", e.what());
    }
    return false;
}

InitMaterial VaultStateController::loadPersisted() const {
    InitMaterial m;
    try {
        m = store_.load();
    } catch (const std::exception& e) {
        errors::fatal(fmt::format("failed to load init material: {}", e.what()));
    }

    if (!m.isEncrypted()) return m;
    if (!encrypting()) errors::fatal("init material is encrypted but no IKM source is configured");

    try {
        return mke_->decryptInitMaterial(m);
    } catch (const std::exception& e) {
        errors::fatal(fmt::format("failed to decrypt init material: {}", e.what()));
    }
}

void VaultStateController::persist(const InitMaterial& m) const {
    InitMaterial copy = m;
    if (cfg_.revoke_root_tokens) copy.stripRootToken();

    try {
        if (encrypting()) copy = mke_->encryptInitMaterial(copy);
        store_.save(copy);
    } catch (const std::exception& e) {
        errors::fatal(fmt::format("failed to persist init material to {}: {}", store_.path().string(), e.what()));
    }

    log::Registry::engine()->info("[VaultStateController] Persisted init material to {}{}",
                                  store_.path().string(), encrypting() ? " (encrypted)" : "");
}

}
