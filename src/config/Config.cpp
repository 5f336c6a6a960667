#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>
#include <fmt/core.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace kw::config {

std::string SecretStoreConfig::baseUrl() const {
    return fmt::format("{}://{}:{}", protocol, server, port);
}

bool SecretStoreConfig::hasCertificateConfig() const {
    std::string all = cert_path + cert_file_path + key_file_path;
    return std::ranges::any_of(all, [](const unsigned char c) { return !std::isspace(c); });
}

const std::string& CredentialsConfig::usernameFor(const std::string& database) const {
    if (const auto it = database_usernames.find(database); it != database_usernames.end()) return it->second;
    return default_username;
}

static Config decodeRoot(const YAML::Node& root) {
    Config cfg;

    if (auto node = root["secret_store"]) YAML::convert<SecretStoreConfig>::decode(node, cfg.secret_store);
    if (auto node = root["credentials"]) YAML::convert<CredentialsConfig>::decode(node, cfg.credentials);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);
    if (auto node = root["databases"]) {
        if (!node.IsSequence()) throw std::runtime_error("config: 'databases' must be a list");
        for (const auto& entry : node) cfg.databases.push_back(entry.as<DatabaseEntry>());
    }

    const auto& ss = cfg.secret_store;
    if (ss.vault_secret_threshold < 1 || ss.vault_secret_shares < ss.vault_secret_threshold)
        throw std::runtime_error(fmt::format("config: invalid secret sharing {}-of-{}",
                                             ss.vault_secret_threshold, ss.vault_secret_shares));
    if (ss.protocol != "http" && ss.protocol != "https")
        throw std::runtime_error("config: secret_store.protocol must be http or https");
    if (ss.vault_interval_seconds == 0)
        throw std::runtime_error("config: secret_store.vault_interval_seconds must be greater than 0");
    if (ss.health_poll_interval_ms == 0)
        throw std::runtime_error("config: secret_store.health_poll_interval_ms must be greater than 0");

    return cfg;
}

Config loadConfig(const std::filesystem::path& path) {
    return decodeRoot(YAML::LoadFile(path.string()));
}

Config parseConfig(const std::string& yaml) {
    return decodeRoot(YAML::Load(yaml));
}

} // namespace kw::config
