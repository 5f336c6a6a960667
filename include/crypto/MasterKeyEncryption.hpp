#pragma once

#include "crypto/IkmReader.hpp"
#include "crypto/Kdf.hpp"
#include "types/InitMaterial.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace kw::crypto {

class MasterKeyEncryption {
public:
    MasterKeyEncryption(std::shared_ptr<IkmReader> reader, Kdf kdf);
    ~MasterKeyEncryption();

    MasterKeyEncryption(const MasterKeyEncryption&) = delete;
    MasterKeyEncryption& operator=(const MasterKeyEncryption&) = delete;

    // Reads IKM through the reader and verifies a key can be derived from it.
    // Throws on any failure; encryption stays disabled in that case.
    void loadIkm(const std::string& handle);

    [[nodiscard]] types::InitMaterial encryptInitMaterial(const types::InitMaterial& m) const;
    [[nodiscard]] types::InitMaterial decryptInitMaterial(const types::InitMaterial& m) const;

    // Zeroes the IKM buffer. Only the first call after loadIkm() has an effect.
    void wipeIkm();

    [[nodiscard]] bool isEncrypting() const { return encrypting_; }
    [[nodiscard]] bool loadAttempted() const { return loadAttempted_; }
    [[nodiscard]] bool ikmWiped() const { return wiped_; }

private:
    std::shared_ptr<IkmReader> reader_;
    Kdf kdf_;
    std::vector<uint8_t> ikm_;
    bool encrypting_ = false;
    bool loadAttempted_ = false;
    bool wiped_ = false;

    [[nodiscard]] std::vector<uint8_t> deriveShareKey(size_t index) const;
};

// Wipes the IKM when the scope that attempted loadIkm() unwinds.
class IkmWipeGuard {
public:
    explicit IkmWipeGuard(MasterKeyEncryption& mke) : mke_(mke) {}
    ~IkmWipeGuard() { mke_.wipeIkm(); }

    IkmWipeGuard(const IkmWipeGuard&) = delete;
    IkmWipeGuard& operator=(const IkmWipeGuard&) = delete;

private:
    MasterKeyEncryption& mke_;
};

}
