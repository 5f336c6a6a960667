#pragma once

#include "config/Config.hpp"
#include "engine/EngineClient.hpp"
#include "provision/PasswordGenerator.hpp"
#include "types/CredentialPair.hpp"

#include <optional>
#include <string>
#include <vector>

namespace kw::provision {

struct ProvisionStats {
    size_t uploaded = 0;
    size_t skipped = 0;
};

// Shares one credential pair per database between every service using it and
// publishes it under both the service prefix and the database prefix.
class CredentialProvisioner {
public:
    CredentialProvisioner(engine::EngineClient& client,
                          std::string rootToken,
                          const PasswordGenerator& generator,
                          const config::CredentialsConfig& cfg);

    static std::string servicePath(const std::string& service, const std::string& database);
    static std::string databasePath(const std::string& database, const std::string& service);

    [[nodiscard]] std::string generatePassword() const;

    [[nodiscard]] bool alreadyInStore(const std::string& path) const;
    void uploadToStore(const types::CredentialPair& pair, const std::string& path) const;

    // Fatal when a password cannot be generated or a path cannot be read or written
    ProvisionStats provisionAll(const std::vector<config::DatabaseEntry>& databases) const;

private:
    engine::EngineClient& client_;
    std::string rootToken_;
    const PasswordGenerator& generator_;
    const config::CredentialsConfig& cfg_;

    static std::optional<types::CredentialPair> storedPair(const nlohmann::json& data);
};

}
