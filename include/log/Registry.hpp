#pragma once

#include "config/Config.hpp"

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>

namespace kw::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const config::LoggingConfig& cnf = {});

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> keywarden() { return get("keywarden"); }
    static std::shared_ptr<spdlog::logger> engine()    { return get("engine"); }
    static std::shared_ptr<spdlog::logger> crypto()    { return get("crypto"); }
    static std::shared_ptr<spdlog::logger> token()     { return get("token"); }
    static std::shared_ptr<spdlog::logger> provision() { return get("provision"); }
    static std::shared_ptr<spdlog::logger> http()      { return get("http"); }

    [[nodiscard]] static bool isInitialized();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}
