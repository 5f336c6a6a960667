#include "types/InitMaterial.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>

namespace kw::types {

size_t InitMaterial::shareCount() const {
    return std::max({keys.size(), keys_base64.size(), encrypted_keys.size()});
}

std::vector<std::string> InitMaterial::unsealKeys() const {
    return keys_base64.empty() ? keys : keys_base64;
}

void to_json(nlohmann::json& j, const InitMaterial& m) {
    j = {
        {"root_token", m.root_token.value_or("")},
        {"keys", m.keys},
        {"keys_base64", m.keys_base64},
        {"secret_threshold", m.secret_threshold},
        {"secret_shares", m.secret_shares}
    };
    if (!m.encrypted_keys.empty()) j["encrypted_keys"] = m.encrypted_keys;
    if (!m.nonces.empty()) j["nonces"] = m.nonces;
    if (!m.share_encodings.empty()) j["share_encodings"] = m.share_encodings;
}

void from_json(const nlohmann::json& j, InitMaterial& m) {
    const auto token = j.value("root_token", std::string{});
    m.root_token = token.empty() ? std::nullopt : std::optional(token);
    m.keys = j.value("keys", std::vector<std::string>{});
    m.keys_base64 = j.value("keys_base64", std::vector<std::string>{});
    m.encrypted_keys = j.value("encrypted_keys", std::vector<std::string>{});
    m.nonces = j.value("nonces", std::vector<std::string>{});
    m.share_encodings = j.value("share_encodings", std::vector<std::string>{});
    m.secret_threshold = j.value("secret_threshold", 0);
    m.secret_shares = j.value("secret_shares", static_cast<int>(m.shareCount()));
}

}
