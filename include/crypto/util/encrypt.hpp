#pragma once

#include <vector>
#include <cstdint>
#include <string>

namespace kw::crypto::util {

constexpr size_t AES_KEY_SIZE = 32;      // 256-bit
constexpr size_t AES_IV_SIZE  = 12;      // GCM standard nonce
constexpr size_t AES_TAG_SIZE = 16;      // GCM auth tag

void ensureSodiumInit();

std::vector<uint8_t> encrypt_aes256_gcm(
    const std::vector<uint8_t>& plaintext,
    const std::vector<uint8_t>& key,
    std::vector<uint8_t>& out_iv);

std::vector<uint8_t> decrypt_aes256_gcm(
    const std::vector<uint8_t>& ciphertext_with_tag,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& iv);

std::vector<uint8_t> random_bytes(size_t n);

std::string b64_encode(const std::vector<uint8_t>& data);

// Accepts input with or without trailing '=' padding
std::vector<uint8_t> b64_decode(const std::string& b64);

std::string hex_encode(const std::vector<uint8_t>& data);

std::vector<uint8_t> hex_decode(const std::string& hex);

void secure_wipe(std::vector<uint8_t>& buf);
void secure_wipe(std::string& buf);

}
