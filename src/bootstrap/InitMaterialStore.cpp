#include "bootstrap/InitMaterialStore.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace kw::types;
using json = nlohmann::json;

namespace kw::bootstrap {

bool InitMaterialStore::exists() const {
    std::error_code ec;
    return std::filesystem::is_regular_file(path_, ec);
}

InitMaterial InitMaterialStore::load() const {
    if (!exists()) throw std::runtime_error(fmt::format("init material file {} does not exist", path_.string()));

    const auto j = json::parse(util::readFileToString(path_), nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object())
        throw std::runtime_error(fmt::format("init material file {} is not valid JSON", path_.string()));

    auto m = j.get<InitMaterial>();
    if (m.shareCount() == 0)
        throw std::runtime_error(fmt::format("init material file {} holds no key shares", path_.string()));
    if (m.isEncrypted() && m.nonces.size() != m.encrypted_keys.size())
        throw std::runtime_error(fmt::format("init material file {} has {} nonces for {} encrypted shares",
                                             path_.string(), m.nonces.size(), m.encrypted_keys.size()));
    return m;
}

void InitMaterialStore::save(const InitMaterial& m) const {
    util::writeOwnerOnly(path_, json(m).dump(2));
    log::Registry::engine()->debug("[InitMaterialStore] Wrote init material to {}", path_.string());
}

}
