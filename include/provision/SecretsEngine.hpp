#pragma once

#include "engine/EngineClient.hpp"

namespace kw::provision {

inline constexpr const auto* KV_MOUNT_POINT = "secret";
inline constexpr const auto* KV_ENGINE_TYPE = "kv";
inline constexpr const auto* KV_VERSION = "1";

// Mounts the KV (version 1) engine at "secret/" unless it is already there. Fatal on failure.
void ensureKVSecretsEngine(engine::EngineClient& client, const std::string& rootToken);

}
