#include "bootstrap/Bootstrap.hpp"
#include "config/ConfigRegistry.hpp"
#include "engine/HttpEngineClient.hpp"
#include "errors/BootstrapError.hpp"
#include "log/Registry.hpp"
#include "util/Cancellation.hpp"

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

using namespace kw;
using namespace kw::config;

namespace {

util::Cancellation cancellation;

void signalHandler(int) {
    cancellation.cancel();
}

struct CliOptions {
    std::filesystem::path configPath = DEFAULT_CONFIG_PATH;
    bool insecureSkipVerify = false;
    std::optional<unsigned int> vaultInterval;
    bool help = false;
};

void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options]\n\n"
              << "  --config <path>          Configuration file (default " << DEFAULT_CONFIG_PATH << ")\n"
              << "  --insecureSkipVerify     Skip TLS verification of the secret store\n"
              << "  --vaultInterval <secs>   Seconds between init/unseal attempts\n"
              << "  --help                   Show this message\n";
}

CliOptions parseArgs(const int argc, char** argv) {
    CliOptions opts;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument(std::string(arg) + " requires a value");
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") opts.help = true;
        else if (arg == "--config" || arg == "-c") opts.configPath = value();
        else if (arg == "--insecureSkipVerify") opts.insecureSkipVerify = true;
        else if (arg == "--vaultInterval") {
            const auto v = value();
            size_t pos = 0;
            const auto secs = std::stoul(v, &pos);
            if (pos != v.size() || secs == 0) throw std::invalid_argument("--vaultInterval must be a positive integer");
            opts.vaultInterval = static_cast<unsigned int>(secs);
        }
        else throw std::invalid_argument("unknown option " + std::string(arg));
    }

    return opts;
}

std::optional<std::string> ikmHookFromEnv() {
    if (const char* hook = std::getenv(bootstrap::IKM_HOOK_ENV); hook && *hook) return std::string(hook);
    return std::nullopt;
}

}

int main(const int argc, char** argv) {
    CliOptions opts;
    try {
        opts = parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n\n";
        printUsage(argv[0]);
        return EXIT_FAILURE;
    }

    if (opts.help) {
        printUsage(argv[0]);
        return EXIT_SUCCESS;
    }

    Config cfg;
    try {
        ConfigRegistry::init(opts.configPath);
        cfg = ConfigRegistry::get();
    } catch (const std::exception& e) {
        spdlog::error("[-] Failed to load configuration {}: {}", opts.configPath.string(), e.what());
        return EXIT_FAILURE;
    }

    if (opts.insecureSkipVerify) cfg.secret_store.insecure_skip_verify = true;
    if (opts.vaultInterval) cfg.secret_store.vault_interval_seconds = *opts.vaultInterval;

    try {
        log::Registry::init(cfg.logging);
        log::Registry::keywarden()->info("[*] Starting secret store setup against {}", cfg.secret_store.baseUrl());

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        engine::HttpEngineClient client(cfg.secret_store);
        bootstrap::Bootstrap bootstrap(client, cfg, ikmHookFromEnv());

        const auto result = bootstrap.run(cancellation);
        log::Registry::keywarden()->debug("[*] Setup run {}", bootstrap::to_string(result.outcome));

        switch (result.outcome) {
            case bootstrap::RunResult::Outcome::Completed:
                log::Registry::keywarden()->info("[✓] Secret store setup done successfully");
                break;
            case bootstrap::RunResult::Outcome::Standby:
                log::Registry::keywarden()->info("[*] Secret store node is in standby, exiting");
                break;
            case bootstrap::RunResult::Outcome::Cancelled:
                log::Registry::keywarden()->info("[!] Setup interrupted by signal, exiting");
                break;
        }

        return EXIT_SUCCESS;
    } catch (const errors::BootstrapError& e) {
        log::Registry::keywarden()->error("[-] Secret store setup failed ({}): {}", errors::to_string(e.kind()), e.what());
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        if (log::Registry::isInitialized()) log::Registry::keywarden()->error("[-] Secret store setup failed: {}", e.what());
        else spdlog::error("[-] Secret store setup failed: {}", e.what());
        return EXIT_FAILURE;
    }
}
