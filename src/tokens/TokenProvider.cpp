#include "tokens/TokenProvider.hpp"
#include "errors/BootstrapError.hpp"
#include "log/Registry.hpp"
#include "util/process.hpp"

#include <fmt/core.h>

namespace kw::tokens {

TokenProvider::TokenProvider(std::string executable, std::vector<std::string> args, std::string type)
    : executable_(std::move(executable)), args_(std::move(args)), type_(std::move(type)) {}

TokenProvider TokenProvider::fromConfig(const config::SecretStoreConfig& cfg) {
    return {cfg.token_provider, cfg.token_provider_args, cfg.token_provider_type};
}

void TokenProvider::launch() const {
    if (!configured()) errors::fatal("token provider launch requested but no executable is configured");

    log::Registry::token()->info("[TokenProvider] Launching {} token provider {}", type_, executable_);

    try {
        if (isOneShot()) {
            if (const int rc = util::runAndWait(executable_, args_); rc != 0)
                errors::fatal(fmt::format("token provider {} exited with status {}", executable_, rc));
            log::Registry::token()->info("[TokenProvider] Token provider completed successfully");
            return;
        }

        const auto pid = util::spawn(executable_, args_);
        log::Registry::token()->info("[TokenProvider] Token provider running with pid {}", pid);
    } catch (const errors::BootstrapError&) {
        throw;
    } catch (const std::runtime_error& e) {
        errors::fatal(fmt::format("failed to launch token provider {}: {}", executable_, e.what()));
    }
}

}
