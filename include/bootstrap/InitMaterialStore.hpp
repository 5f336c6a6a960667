#pragma once

#include "types/InitMaterial.hpp"

#include <filesystem>

namespace kw::bootstrap {

// The init response file. Single writer, always rewritten with owner-only permissions.
class InitMaterialStore {
public:
    explicit InitMaterialStore(std::filesystem::path path) : path_(std::move(path)) {}

    [[nodiscard]] bool exists() const;

    // Throws when the file is missing or does not hold valid init material.
    [[nodiscard]] types::InitMaterial load() const;
    void save(const types::InitMaterial& m) const;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

}
