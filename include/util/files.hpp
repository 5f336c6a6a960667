#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace kw::util {

std::vector<uint8_t> readFileToVector(const std::filesystem::path& path);

std::string readFileToString(const std::filesystem::path& path);

// Creates missing parent directories (0700) and writes the file with mode 0600,
// replacing any previous content.
void writeOwnerOnly(const std::filesystem::path& path, const std::vector<uint8_t>& data);
void writeOwnerOnly(const std::filesystem::path& path, const std::string& data);

}
