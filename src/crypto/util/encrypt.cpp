#include "crypto/util/encrypt.hpp"
#include "log/Registry.hpp"

#include <sodium.h>
#include <mutex>
#include <stdexcept>

namespace kw::crypto::util {

void ensureSodiumInit() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (sodium_init() < 0) throw std::runtime_error("libsodium failed to initialize");
    });
}

static void requireAesGcm() {
    ensureSodiumInit();
    if (crypto_aead_aes256gcm_is_available() == 0)
        throw std::runtime_error("AES256-GCM not supported on this CPU");
}

std::vector<uint8_t> encrypt_aes256_gcm(
    const std::vector<uint8_t>& plaintext,
    const std::vector<uint8_t>& key,
    std::vector<uint8_t>& out_iv)
{
    if (key.size() != AES_KEY_SIZE) {
        log::Registry::crypto()->error("[encrypt_aes256_gcm] Invalid AES-256 key size: {} bytes", key.size());
        throw std::invalid_argument("Invalid AES-256 key size");
    }

    requireAesGcm();

    out_iv.resize(AES_IV_SIZE);
    randombytes_buf(out_iv.data(), AES_IV_SIZE);

    std::vector<uint8_t> ciphertext(plaintext.size() + AES_TAG_SIZE);
    unsigned long long ciphertext_len = 0;

    crypto_aead_aes256gcm_encrypt(
        ciphertext.data(), &ciphertext_len,
        plaintext.data(), plaintext.size(),
        nullptr, 0,  // no AAD
        nullptr, out_iv.data(), key.data());

    ciphertext.resize(ciphertext_len);
    return ciphertext;
}

std::vector<uint8_t> decrypt_aes256_gcm(
    const std::vector<uint8_t>& ciphertext_with_tag,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& iv)
{
    if (key.size() != AES_KEY_SIZE || iv.size() != AES_IV_SIZE) {
        log::Registry::crypto()->error("[decrypt_aes256_gcm] Invalid key or IV size: "
                                       "key size = {}, iv size = {}",
                                       key.size(), iv.size());
        throw std::invalid_argument("Invalid key or IV size");
    }
    if (ciphertext_with_tag.size() < AES_TAG_SIZE)
        throw std::runtime_error("Decryption failed: ciphertext shorter than auth tag");

    requireAesGcm();

    std::vector<uint8_t> decrypted(ciphertext_with_tag.size() - AES_TAG_SIZE);
    unsigned long long decrypted_len = 0;

    if (crypto_aead_aes256gcm_decrypt(
            decrypted.data(), &decrypted_len,
            nullptr,
            ciphertext_with_tag.data(), ciphertext_with_tag.size(),
            nullptr, 0,  // no AAD
            iv.data(), key.data()) != 0)
    {
        throw std::runtime_error("Decryption failed: authentication error");
    }

    decrypted.resize(decrypted_len);
    return decrypted;
}

std::vector<uint8_t> random_bytes(const size_t n) {
    ensureSodiumInit();
    std::vector<uint8_t> out(n);
    randombytes_buf(out.data(), out.size());
    return out;
}

std::string b64_encode(const std::vector<uint8_t>& data) {
    const size_t encoded_len = sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string result(encoded_len, '\0');

    sodium_bin2base64(result.data(), result.size(),
                      data.data(), data.size(),
                      sodium_base64_VARIANT_ORIGINAL);

    result.resize(encoded_len - 1); // trim null terminator
    return result;
}

std::vector<uint8_t> b64_decode(const std::string& b64) {
    std::string unpadded = b64;
    while (!unpadded.empty() && unpadded.back() == '=') unpadded.pop_back();

    std::vector<uint8_t> decoded(unpadded.size() * 3 / 4 + 1);
    size_t out_len = 0;
    if (sodium_base642bin(decoded.data(), decoded.size(),
                          unpadded.c_str(), unpadded.size(),
                          nullptr, &out_len, nullptr,
                          sodium_base64_VARIANT_ORIGINAL_NO_PADDING) != 0)
        throw std::runtime_error("Invalid base64 input");

    decoded.resize(out_len);
    return decoded;
}

std::string hex_encode(const std::vector<uint8_t>& data) {
    std::string result(data.size() * 2 + 1, '\0');
    sodium_bin2hex(result.data(), result.size(), data.data(), data.size());
    result.resize(data.size() * 2);
    return result;
}

std::vector<uint8_t> hex_decode(const std::string& hex) {
    if (hex.size() % 2 != 0) throw std::runtime_error("Invalid hex input: odd length");

    std::vector<uint8_t> decoded(hex.size() / 2);
    size_t out_len = 0;
    const char* end = nullptr;
    if (sodium_hex2bin(decoded.data(), decoded.size(), hex.c_str(), hex.size(),
                       nullptr, &out_len, &end) != 0 || end != hex.c_str() + hex.size())
        throw std::runtime_error("Invalid hex input");

    decoded.resize(out_len);
    return decoded;
}

void secure_wipe(std::vector<uint8_t>& buf) {
    if (!buf.empty()) sodium_memzero(buf.data(), buf.size());
    buf.clear();
}

void secure_wipe(std::string& buf) {
    if (!buf.empty()) sodium_memzero(buf.data(), buf.size());
    buf.clear();
}

}
