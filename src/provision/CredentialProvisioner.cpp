#include "provision/CredentialProvisioner.hpp"
#include "crypto/util/encrypt.hpp"
#include "errors/BootstrapError.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fmt/core.h>

using namespace kw::types;
using namespace kw::config;

namespace kw::provision {

static constexpr const auto* SECRET_PREFIX = "secret/edgex";

CredentialProvisioner::CredentialProvisioner(engine::EngineClient& client,
                                             std::string rootToken,
                                             const PasswordGenerator& generator,
                                             const CredentialsConfig& cfg)
    : client_(client), rootToken_(std::move(rootToken)), generator_(generator), cfg_(cfg) {}

std::string CredentialProvisioner::servicePath(const std::string& service, const std::string& database) {
    return fmt::format("{}/{}/{}", SECRET_PREFIX, service, database);
}

std::string CredentialProvisioner::databasePath(const std::string& database, const std::string& service) {
    return fmt::format("{}/{}/{}", SECRET_PREFIX, database, service);
}

std::string CredentialProvisioner::generatePassword() const {
    try {
        return generator_.generate();
    } catch (const std::runtime_error& e) {
        errors::fatal(fmt::format("failed to generate password with {}: {}", generator_.name(), e.what()));
    }
}

bool CredentialProvisioner::alreadyInStore(const std::string& path) const {
    return client_.readSecret(rootToken_, path).has_value();
}

std::optional<CredentialPair> CredentialProvisioner::storedPair(const nlohmann::json& data) {
    if (!data.is_object() || !data.contains("password") || !data["password"].is_string()) return std::nullopt;
    if (data.contains("username") && !data["username"].is_string()) return std::nullopt;
    auto pair = data.get<CredentialPair>();
    if (pair.password.empty()) return std::nullopt;
    return pair;
}

void CredentialProvisioner::uploadToStore(const CredentialPair& pair, const std::string& path) const {
    client_.writeSecret(rootToken_, path, pair);
}

ProvisionStats CredentialProvisioner::provisionAll(const std::vector<DatabaseEntry>& databases) const {
    std::vector<std::string> dbNames;
    for (const auto& entry : databases)
        if (std::ranges::find(dbNames, entry.database) == dbNames.end()) dbNames.push_back(entry.database);
    if (dbNames.empty()) dbNames.push_back(DatabaseEntry{}.database);

    ProvisionStats stats;

    for (const auto& db : dbNames) {
        std::vector<std::string> paths;
        for (const auto& entry : databases) {
            if (entry.database != db || entry.service.empty()) continue;
            paths.push_back(servicePath(entry.service, db));
            paths.push_back(databasePath(db, entry.service));
        }
        if (!cfg_.bootstrap_service.empty()) paths.push_back(servicePath(cfg_.bootstrap_service, db));

        try {
            std::vector<std::string> present, missing;
            for (const auto& path : paths) {
                if (!alreadyInStore(path)) {
                    missing.push_back(path);
                    continue;
                }
                present.push_back(path);
                ++stats.skipped;
                log::Registry::provision()->info("[CredentialProvisioner] Credentials already present at {}", path);
            }

            if (missing.empty()) continue;

            // Paths written by an earlier run keep their password; new paths get the same one
            std::optional<CredentialPair> pair;
            for (const auto& path : present) {
                if (const auto data = client_.readSecret(rootToken_, path)) pair = storedPair(*data);
                if (pair) break;
            }
            if (!pair) pair = CredentialPair{cfg_.usernameFor(db), generatePassword()};

            for (const auto& path : missing) {
                uploadToStore(*pair, path);
                ++stats.uploaded;
                log::Registry::provision()->info("[CredentialProvisioner] Uploaded {} credentials to {}", db, path);
            }

            crypto::util::secure_wipe(pair->password);
        } catch (const engine::EngineError& e) {
            errors::fatal(fmt::format("failed to provision credentials for {}: {}", db, e.what()));
        }
    }

    log::Registry::provision()->info("[CredentialProvisioner] Credentials provisioned ({} uploaded, {} already present)",
                                     stats.uploaded, stats.skipped);
    return stats;
}

}
