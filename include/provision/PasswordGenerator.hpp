#pragma once

#include <memory>
#include <string>
#include <vector>

namespace kw::provision {

class PasswordGenerator {
public:
    virtual ~PasswordGenerator() = default;

    // Throws when no password could be produced
    virtual std::string generate() const = 0;
    [[nodiscard]] virtual std::string name() const = 0;
};

// Base64 of 33 random bytes from libsodium (44 characters, no padding)
class RandomPasswordGenerator : public PasswordGenerator {
public:
    static constexpr size_t RANDOM_BYTES = 33;

    std::string generate() const override;
    [[nodiscard]] std::string name() const override { return "builtin"; }
};

// Runs an external program and uses its trimmed stdout as the password
class ExecPasswordGenerator : public PasswordGenerator {
public:
    ExecPasswordGenerator(std::string executable, std::vector<std::string> args)
        : executable_(std::move(executable)), args_(std::move(args)) {}

    std::string generate() const override;
    [[nodiscard]] std::string name() const override { return executable_; }

private:
    std::string executable_;
    std::vector<std::string> args_;
};

// Empty name or "builtin" selects the random generator, anything else is an executable.
std::unique_ptr<PasswordGenerator> makePasswordGenerator(const std::string& name,
                                                         const std::vector<std::string>& args = {});

}
