#include "provision/SecretsEngine.hpp"
#include "errors/BootstrapError.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>

namespace kw::provision {

void ensureKVSecretsEngine(engine::EngineClient& client, const std::string& rootToken) {
    const std::string mount = std::string(KV_MOUNT_POINT) + "/";

    try {
        if (client.isSecretsEngineInstalled(rootToken, mount, KV_ENGINE_TYPE)) {
            log::Registry::provision()->info("[SecretsEngine] KV secrets engine already enabled at {}", mount);
            return;
        }

        log::Registry::provision()->info("[SecretsEngine] Enabling KV v{} secrets engine at {}", KV_VERSION, mount);
        client.enableKVSecretsEngine(rootToken, KV_MOUNT_POINT, KV_VERSION);
    } catch (const engine::EngineError& e) {
        errors::fatal(fmt::format("failed to enable KV secrets engine: {}", e.what()));
    }
}

}
