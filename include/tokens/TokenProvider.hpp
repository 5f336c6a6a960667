#pragma once

#include "config/Config.hpp"

#include <string>
#include <vector>

namespace kw::tokens {

inline constexpr const auto* ONESHOT_PROVIDER = "oneshot";

// External executable that issues per-service tokens with the delegate token.
class TokenProvider {
public:
    TokenProvider(std::string executable, std::vector<std::string> args, std::string type);

    static TokenProvider fromConfig(const config::SecretStoreConfig& cfg);

    [[nodiscard]] bool configured() const { return !executable_.empty(); }
    [[nodiscard]] bool isOneShot() const { return type_ == ONESHOT_PROVIDER; }

    // A one-shot provider runs to completion and a non-zero exit aborts the run.
    // Any other type is started and left running.
    void launch() const;

private:
    std::string executable_;
    std::vector<std::string> args_;
    std::string type_;
};

}
