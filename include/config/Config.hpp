#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace kw::config {

struct SecretStoreConfig {
    std::string protocol = "https";
    std::string server = "localhost";
    uint16_t port = 8200;
    std::string ca_file_path;
    std::string server_name;
    bool insecure_skip_verify = false;

    std::filesystem::path token_folder_path = "/vault/config/assets";
    std::string token_file = "resp-init.json";
    int vault_secret_threshold = 1;
    int vault_secret_shares = 1;
    bool revoke_root_tokens = true;

    std::string token_provider;
    std::vector<std::string> token_provider_args;
    std::string token_provider_type = "oneshot";
    std::string token_provider_admin_token_path;

    std::string password_provider;
    std::vector<std::string> password_provider_args;

    std::string cert_path = "secret/edgex/pki/tls/edgex-kong";
    std::string cert_file_path;
    std::string key_file_path;

    unsigned int vault_interval_seconds = 5;
    unsigned int health_poll_interval_ms = 1000;
    unsigned int max_unseal_attempts = 0; // 0 retries forever
    unsigned int request_timeout_seconds = 30;

    [[nodiscard]] std::string baseUrl() const;
    [[nodiscard]] std::filesystem::path tokenFilePath() const { return token_folder_path / token_file; }
    [[nodiscard]] bool hasCertificateConfig() const;
};

struct DatabaseEntry {
    std::string service;
    std::string database = "redisdb";
};

struct CredentialsConfig {
    std::string default_username = "redis5";
    std::map<std::string, std::string> database_usernames;
    std::string bootstrap_service = "bootstrap-redis";

    [[nodiscard]] const std::string& usernameFor(const std::string& database) const;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum keywarden = spdlog::level::info;
    spdlog::level::level_enum engine    = spdlog::level::info;
    spdlog::level::level_enum crypto    = spdlog::level::warn;
    spdlog::level::level_enum token     = spdlog::level::info;
    spdlog::level::level_enum provision = spdlog::level::info;
    spdlog::level::level_enum http      = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir; // empty logs to the console only
    LogLevelsConfig levels;
};

struct Config {
    SecretStoreConfig secret_store;
    std::vector<DatabaseEntry> databases;
    CredentialsConfig credentials;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);
Config parseConfig(const std::string& yaml);

} // namespace kw::config
