#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace kw::types {

// Output of engine initialization, persisted between runs. Shares are held
// either in plaintext (keys / keys_base64) or as ciphertext (encrypted_keys / nonces).
struct InitMaterial {
    std::optional<std::string> root_token;
    std::vector<std::string> keys;            // hex
    std::vector<std::string> keys_base64;
    std::vector<std::string> encrypted_keys;  // hex ciphertext
    std::vector<std::string> nonces;          // hex
    std::vector<std::string> share_encodings; // plaintext forms ("hex", "base64") to restore on decrypt
    int secret_threshold = 0;
    int secret_shares = 0;

    [[nodiscard]] bool hasRootToken() const { return root_token && !root_token->empty(); }
    [[nodiscard]] bool isEncrypted() const { return !encrypted_keys.empty(); }
    [[nodiscard]] size_t shareCount() const;

    // Shares in the form the engine accepts for unseal / generate-root
    [[nodiscard]] std::vector<std::string> unsealKeys() const;

    void stripRootToken() { root_token.reset(); }

    bool operator==(const InitMaterial&) const = default;
};

void to_json(nlohmann::json& j, const InitMaterial& m);
void from_json(const nlohmann::json& j, InitMaterial& m);

}
