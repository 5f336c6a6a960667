#include "crypto/IkmReader.hpp"
#include "crypto/util/encrypt.hpp"
#include "util/process.hpp"

#include <fmt/core.h>
#include <stdexcept>

namespace kw::crypto {

std::vector<uint8_t> PipedHexReader::read(const std::string& handle) {
    auto result = kw::util::runAndCapture(handle);
    if (!result.ok()) {
        crypto::util::secure_wipe(result.output);
        throw std::runtime_error(fmt::format("IKM hook {} exited with status {}", handle, result.exitCode));
    }

    std::string hex;
    hex.reserve(result.output.size());
    for (const char c : result.output)
        if (c != '\n' && c != '\r' && c != ' ' && c != '\t') hex.push_back(c);
    crypto::util::secure_wipe(result.output);

    if (hex.empty()) throw std::runtime_error("IKM hook produced no output: " + handle);

    try {
        auto ikm = crypto::util::hex_decode(hex);
        crypto::util::secure_wipe(hex);
        return ikm;
    } catch (const std::exception&) {
        crypto::util::secure_wipe(hex);
        throw std::runtime_error("IKM hook output is not valid hex: " + handle);
    }
}

}
