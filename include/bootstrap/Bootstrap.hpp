#pragma once

#include "config/Config.hpp"
#include "crypto/IkmReader.hpp"
#include "engine/EngineClient.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace kw::util { class Cancellation; }

namespace kw::bootstrap {

inline constexpr const auto* IKM_HOOK_ENV = "IKM_HOOK";

struct RunResult {
    enum class Outcome { Completed, Standby, Cancelled };

    Outcome outcome = Outcome::Completed;

    // Always false: a finished run, standby node or cancellation never asks the caller to go again
    bool shouldContinue = false;
};

std::string_view to_string(RunResult::Outcome outcome);

// One pass of the secret store setup: unseal, mint a transient root token, clean up
// stale tokens, hand a delegate token to the token provider, then provision the KV
// engine, database credentials and the proxy certificate. Fatal errors are thrown as
// errors::BootstrapError after every cleanup guard has run.
class Bootstrap {
public:
    Bootstrap(engine::EngineClient& client,
              const config::Config& cfg,
              std::optional<std::string> ikmHook = std::nullopt,
              std::shared_ptr<crypto::IkmReader> ikmReader = std::make_shared<crypto::PipedHexReader>());

    RunResult run(util::Cancellation& cancellation);

private:
    engine::EngineClient& client_;
    const config::Config& cfg_;
    std::optional<std::string> ikmHook_;
    std::shared_ptr<crypto::IkmReader> ikmReader_;
};

}
