#include "crypto/MasterKeyEncryption.hpp"
#include "crypto/util/encrypt.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fmt/core.h>
#include <stdexcept>

using namespace kw::crypto::util;
using namespace kw::types;

namespace kw::crypto {

namespace {

// Key derived for a single share; never outlives the encrypt/decrypt call.
struct EncryptionContext {
    std::vector<uint8_t> key;

    explicit EncryptionContext(std::vector<uint8_t> k) : key(std::move(k)) {}
    ~EncryptionContext() { secure_wipe(key); }

    EncryptionContext(const EncryptionContext&) = delete;
    EncryptionContext& operator=(const EncryptionContext&) = delete;
};

constexpr const auto* HEX_ENCODING = "hex";
constexpr const auto* BASE64_ENCODING = "base64";

std::vector<uint8_t> plaintextShare(const InitMaterial& m, const size_t i) {
    if (i < m.keys.size() && !m.keys[i].empty()) return hex_decode(m.keys[i]);
    if (i < m.keys_base64.size()) return b64_decode(m.keys_base64[i]);
    throw std::runtime_error(fmt::format("init material has no plaintext share {}", i));
}

}

MasterKeyEncryption::MasterKeyEncryption(std::shared_ptr<IkmReader> reader, Kdf kdf)
    : reader_(std::move(reader)), kdf_(std::move(kdf)) {}

MasterKeyEncryption::~MasterKeyEncryption() {
    secure_wipe(ikm_);
}

void MasterKeyEncryption::loadIkm(const std::string& handle) {
    loadAttempted_ = true;
    if (!reader_) throw std::runtime_error("no IKM reader configured");

    ikm_ = reader_->read(handle);
    if (ikm_.empty()) throw std::runtime_error("IKM source returned no key material");

    // Prove the salt and derivation work before anything gets encrypted with them
    EncryptionContext check(kdf_.deriveKey(ikm_, AES_KEY_SIZE, "vault0"));

    encrypting_ = true;
    log::Registry::crypto()->debug("[MasterKeyEncryption] Loaded {} bytes of IKM", ikm_.size());
}

std::vector<uint8_t> MasterKeyEncryption::deriveShareKey(const size_t index) const {
    if (wiped_) throw std::runtime_error("IKM already wiped; cannot derive encryption key");
    return kdf_.deriveKey(ikm_, AES_KEY_SIZE, "vault" + std::to_string(index));
}

InitMaterial MasterKeyEncryption::encryptInitMaterial(const InitMaterial& m) const {
    if (!encrypting_) throw std::logic_error("encryptInitMaterial called with encryption disabled");

    InitMaterial out = m;
    out.encrypted_keys.clear();
    out.nonces.clear();
    out.share_encodings.clear();
    if (!m.keys.empty()) out.share_encodings.emplace_back(HEX_ENCODING);
    if (!m.keys_base64.empty()) out.share_encodings.emplace_back(BASE64_ENCODING);

    const size_t n = std::max(m.keys.size(), m.keys_base64.size());
    for (size_t i = 0; i < n; ++i) {
        EncryptionContext ctx(deriveShareKey(i));
        auto plaintext = plaintextShare(m, i);

        std::vector<uint8_t> nonce;
        const auto ciphertext = encrypt_aes256_gcm(plaintext, ctx.key, nonce);
        secure_wipe(plaintext);

        out.encrypted_keys.push_back(hex_encode(ciphertext));
        out.nonces.push_back(hex_encode(nonce));
    }

    for (auto& k : out.keys) secure_wipe(k);
    for (auto& k : out.keys_base64) secure_wipe(k);
    out.keys.clear();
    out.keys_base64.clear();
    return out;
}

InitMaterial MasterKeyEncryption::decryptInitMaterial(const InitMaterial& m) const {
    if (!encrypting_) throw std::logic_error("decryptInitMaterial called with encryption disabled");
    if (m.encrypted_keys.size() != m.nonces.size())
        throw std::runtime_error(fmt::format("init material has {} encrypted shares but {} nonces",
                                             m.encrypted_keys.size(), m.nonces.size()));

    // Files written without share_encodings get both forms back
    const auto restores = [&m](const char* encoding) {
        return m.share_encodings.empty() || std::ranges::find(m.share_encodings, encoding) != m.share_encodings.end();
    };
    const bool hex = restores(HEX_ENCODING);
    const bool base64 = restores(BASE64_ENCODING);
    if (!hex && !base64)
        throw std::runtime_error("init material names no known share encoding");

    InitMaterial out = m;
    out.keys.clear();
    out.keys_base64.clear();

    for (size_t i = 0; i < m.encrypted_keys.size(); ++i) {
        EncryptionContext ctx(deriveShareKey(i));
        auto plaintext = decrypt_aes256_gcm(hex_decode(m.encrypted_keys[i]), ctx.key, hex_decode(m.nonces[i]));

        if (hex) out.keys.push_back(hex_encode(plaintext));
        if (base64) out.keys_base64.push_back(b64_encode(plaintext));
        secure_wipe(plaintext);
    }

    out.encrypted_keys.clear();
    out.nonces.clear();
    out.share_encodings.clear();
    return out;
}

void MasterKeyEncryption::wipeIkm() {
    if (!loadAttempted_ || wiped_) return;
    secure_wipe(ikm_);
    wiped_ = true;
    log::Registry::crypto()->debug("[MasterKeyEncryption] IKM wiped from memory");
}

}
