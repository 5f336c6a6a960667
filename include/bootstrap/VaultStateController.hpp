#pragma once

#include "bootstrap/InitMaterialStore.hpp"
#include "config/Config.hpp"
#include "engine/EngineClient.hpp"
#include "engine/EngineState.hpp"
#include "types/InitMaterial.hpp"

#include <chrono>
#include <optional>
#include <string_view>

namespace kw::crypto { class MasterKeyEncryption; }
namespace kw::util { class Cancellation; }

namespace kw::bootstrap {

struct UnsealResult {
    enum class Outcome { Ready, Standby, Cancelled };

    Outcome outcome = Outcome::Cancelled;
    std::optional<types::InitMaterial> material; // set when Ready
};

std::string_view to_string(UnsealResult::Outcome outcome);

// Drives the engine from whatever state it is found in to unsealed, initializing it
// when needed and keeping the init material file in step.
class VaultStateController {
public:
    VaultStateController(engine::EngineClient& client,
                         const config::SecretStoreConfig& cfg,
                         InitMaterialStore store,
                         const crypto::MasterKeyEncryption* mke = nullptr);

    UnsealResult runUntilReady(std::chrono::milliseconds interval, const util::Cancellation& cancellation);

    // Loads the persisted material and decrypts it when it was stored encrypted. Fatal on failure.
    [[nodiscard]] types::InitMaterial loadPersisted() const;

    // Writes a copy of `m`, without the root token unless retention is enabled and
    // encrypted when an IKM is loaded. `m` itself is never modified. Fatal on failure.
    void persist(const types::InitMaterial& m) const;

private:
    engine::EngineClient& client_;
    const config::SecretStoreConfig& cfg_;
    InitMaterialStore store_;
    const crypto::MasterKeyEncryption* mke_;

    [[nodiscard]] bool encrypting() const;

    // Submits shares until the engine reports unsealed
    bool unseal(const types::InitMaterial& m) const;
};

}
