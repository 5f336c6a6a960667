#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace kw::crypto {

// Source of input keying material for at-rest encryption of the init material.
class IkmReader {
public:
    virtual ~IkmReader() = default;
    virtual std::vector<uint8_t> read(const std::string& handle) = 0;
};

// Executes the program named by the handle and hex-decodes its stdout.
class PipedHexReader : public IkmReader {
public:
    std::vector<uint8_t> read(const std::string& handle) override;
};

}
