#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <mutex>

namespace kw::config {

inline constexpr const auto* DEFAULT_CONFIG_PATH = "/etc/keywarden/config.yaml";

class ConfigRegistry {
public:
    static void init(const std::filesystem::path& path = DEFAULT_CONFIG_PATH);
    static const Config& get();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace kw::config
