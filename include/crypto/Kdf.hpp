#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace kw::crypto {

// HKDF over SHA-256. The salt lives next to the persisted init material and is
// created on first use.
class Kdf {
public:
    static constexpr size_t SALT_SIZE = 32;
    static constexpr const auto* SALT_FILE = "kdf-salt.dat";

    explicit Kdf(std::filesystem::path saltDir);

    [[nodiscard]] std::vector<uint8_t> deriveKey(const std::vector<uint8_t>& ikm,
                                                 size_t keyLen,
                                                 const std::string& info) const;

    [[nodiscard]] std::filesystem::path saltPath() const { return saltDir_ / SALT_FILE; }

private:
    std::filesystem::path saltDir_;

    [[nodiscard]] std::vector<uint8_t> loadOrCreateSalt() const;
};

}
