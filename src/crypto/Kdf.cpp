#include "crypto/Kdf.hpp"
#include "crypto/util/encrypt.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <memory>
#include <stdexcept>

using namespace kw::crypto::util;

namespace kw::crypto {

namespace {
struct PkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};
}

Kdf::Kdf(std::filesystem::path saltDir) : saltDir_(std::move(saltDir)) {}

std::vector<uint8_t> Kdf::loadOrCreateSalt() const {
    const auto path = saltPath();
    if (std::filesystem::exists(path)) {
        auto salt = kw::util::readFileToVector(path);
        if (salt.size() != SALT_SIZE)
            throw std::runtime_error("KDF salt file has unexpected size: " + path.string());
        return salt;
    }

    auto salt = random_bytes(SALT_SIZE);
    kw::util::writeOwnerOnly(path, salt);
    log::Registry::crypto()->info("[Kdf] Created new KDF salt at {}", path.string());
    return salt;
}

std::vector<uint8_t> Kdf::deriveKey(const std::vector<uint8_t>& ikm,
                                    const size_t keyLen,
                                    const std::string& info) const {
    if (ikm.empty()) throw std::invalid_argument("KDF requires non-empty input keying material");

    const auto salt = loadOrCreateSalt();

    std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter> ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr));
    if (!ctx) throw std::runtime_error("EVP_PKEY_CTX_new_id(HKDF) failed");

    if (EVP_PKEY_derive_init(ctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_hkdf_md(ctx.get(), EVP_sha256()) <= 0 ||
        EVP_PKEY_CTX_set1_hkdf_salt(ctx.get(), salt.data(), static_cast<int>(salt.size())) <= 0 ||
        EVP_PKEY_CTX_set1_hkdf_key(ctx.get(), ikm.data(), static_cast<int>(ikm.size())) <= 0 ||
        EVP_PKEY_CTX_add1_hkdf_info(ctx.get(),
                                    reinterpret_cast<const unsigned char*>(info.data()),
                                    static_cast<int>(info.size())) <= 0)
        throw std::runtime_error("HKDF parameter setup failed");

    std::vector<uint8_t> key(keyLen);
    size_t outLen = key.size();
    if (EVP_PKEY_derive(ctx.get(), key.data(), &outLen) <= 0 || outLen != keyLen)
        throw std::runtime_error("HKDF derivation failed");

    return key;
}

}
