#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace kw::config;

template<>
struct convert<SecretStoreConfig> {
    static bool decode(const Node& node, SecretStoreConfig& rhs) {
        if (!node.IsMap()) return false;
        const SecretStoreConfig def;
        rhs.protocol = node["protocol"].as<std::string>(def.protocol);
        rhs.server = node["server"].as<std::string>(def.server);
        rhs.port = node["port"].as<uint16_t>(def.port);
        rhs.ca_file_path = node["ca_file_path"].as<std::string>("");
        rhs.server_name = node["server_name"].as<std::string>("");
        rhs.insecure_skip_verify = node["insecure_skip_verify"].as<bool>(false);
        rhs.token_folder_path = node["token_folder_path"].as<std::string>(def.token_folder_path.string());
        rhs.token_file = node["token_file"].as<std::string>(def.token_file);
        rhs.vault_secret_threshold = node["vault_secret_threshold"].as<int>(def.vault_secret_threshold);
        rhs.vault_secret_shares = node["vault_secret_shares"].as<int>(def.vault_secret_shares);
        rhs.revoke_root_tokens = node["revoke_root_tokens"].as<bool>(def.revoke_root_tokens);
        rhs.token_provider = node["token_provider"].as<std::string>("");
        rhs.token_provider_args = node["token_provider_args"].as<std::vector<std::string>>(std::vector<std::string>{});
        rhs.token_provider_type = node["token_provider_type"].as<std::string>(def.token_provider_type);
        rhs.token_provider_admin_token_path = node["token_provider_admin_token_path"].as<std::string>("");
        rhs.password_provider = node["password_provider"].as<std::string>("");
        rhs.password_provider_args = node["password_provider_args"].as<std::vector<std::string>>(std::vector<std::string>{});
        rhs.cert_path = node["cert_path"].as<std::string>(def.cert_path);
        rhs.cert_file_path = node["cert_file_path"].as<std::string>("");
        rhs.key_file_path = node["key_file_path"].as<std::string>("");
        rhs.vault_interval_seconds = node["vault_interval_seconds"].as<unsigned int>(def.vault_interval_seconds);
        rhs.health_poll_interval_ms = node["health_poll_interval_ms"].as<unsigned int>(def.health_poll_interval_ms);
        rhs.max_unseal_attempts = node["max_unseal_attempts"].as<unsigned int>(0);
        rhs.request_timeout_seconds = node["request_timeout_seconds"].as<unsigned int>(def.request_timeout_seconds);
        return true;
    }
};

template<>
struct convert<DatabaseEntry> {
    static bool decode(const Node& node, DatabaseEntry& rhs) {
        if (!node.IsMap()) return false;
        rhs.service = node["service"].as<std::string>("");
        rhs.database = node["database"].as<std::string>("redisdb");
        return true;
    }
};

template<>
struct convert<CredentialsConfig> {
    static bool decode(const Node& node, CredentialsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.default_username = node["default_username"].as<std::string>("redis5");
        rhs.database_usernames = node["database_usernames"].as<std::map<std::string, std::string>>(
            std::map<std::string, std::string>{});
        rhs.bootstrap_service = node["bootstrap_service"].as<std::string>("bootstrap-redis");
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.keywarden = spdlog::level::from_str(node["keywarden"].as<std::string>("info"));
        rhs.engine = spdlog::level::from_str(node["engine"].as<std::string>("info"));
        rhs.crypto = spdlog::level::from_str(node["crypto"].as<std::string>("warn"));
        rhs.token = spdlog::level::from_str(node["token"].as<std::string>("info"));
        rhs.provision = spdlog::level::from_str(node["provision"].as<std::string>("info"));
        rhs.http = spdlog::level::from_str(node["http"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("info"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (node["levels"]) rhs.levels = node["levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
