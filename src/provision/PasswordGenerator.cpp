#include "provision/PasswordGenerator.hpp"
#include "crypto/util/encrypt.hpp"
#include "util/process.hpp"

#include <algorithm>
#include <array>
#include <fmt/core.h>
#include <stdexcept>
#include <string_view>

using namespace kw::crypto::util;

namespace kw::provision {

namespace {

constexpr std::array<std::string_view, 2> BUILTIN_NAMES{"", "builtin"};

std::string trim(const std::string& s) {
    constexpr std::string_view ws = " \t\r\n";
    const auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

}

std::string RandomPasswordGenerator::generate() const {
    auto raw = random_bytes(RANDOM_BYTES);
    auto password = b64_encode(raw);
    secure_wipe(raw);
    return password;
}

std::string ExecPasswordGenerator::generate() const {
    auto result = util::runAndCapture(executable_, args_);
    if (!result.ok()) {
        secure_wipe(result.output);
        throw std::runtime_error(fmt::format("password provider {} exited with status {}", executable_, result.exitCode));
    }

    auto password = trim(result.output);
    secure_wipe(result.output);
    if (password.empty()) throw std::runtime_error(fmt::format("password provider {} produced no output", executable_));
    return password;
}

std::unique_ptr<PasswordGenerator> makePasswordGenerator(const std::string& name, const std::vector<std::string>& args) {
    if (std::ranges::find(BUILTIN_NAMES, name) != BUILTIN_NAMES.end())
        return std::make_unique<RandomPasswordGenerator>();
    return std::make_unique<ExecPasswordGenerator>(name, args);
}

}
