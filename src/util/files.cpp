#include "util/files.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace kw::util {

std::vector<uint8_t> readFileToVector(const fs::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw std::runtime_error("Failed to open file: " + path.string());

    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::vector<uint8_t> buffer(static_cast<size_t>(size));
    if (size > 0 && !in.read(reinterpret_cast<char*>(buffer.data()), size))
        throw std::runtime_error("Failed to read file: " + path.string());

    return buffer;
}

std::string readFileToString(const fs::path& path) {
    const auto bytes = readFileToVector(path);
    return {bytes.begin(), bytes.end()};
}

static void writeRaw(const fs::path& path, const void* data, const size_t size) {
    if (const auto parent = path.parent_path(); !parent.empty() && !fs::exists(parent)) {
        fs::create_directories(parent);
        fs::permissions(parent, fs::perms::owner_all, fs::perm_options::replace);
    }

    const int fd = ::open(path.c_str(), O_CREAT | O_TRUNC | O_WRONLY | O_CLOEXEC, 0600);
    if (fd < 0) throw std::runtime_error("Failed to open " + path.string() + " for writing: " + std::strerror(errno));

    // O_CREAT leaves the mode of an existing file untouched
    if (::fchmod(fd, S_IRUSR | S_IWUSR) != 0) {
        const int err = errno;
        ::close(fd);
        throw std::runtime_error("Failed to restrict permissions on " + path.string() + ": " + std::strerror(err));
    }

    const auto* p = static_cast<const char*>(data);
    size_t remaining = size;
    while (remaining > 0) {
        const ssize_t n = ::write(fd, p, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            const int err = errno;
            ::close(fd);
            throw std::runtime_error("Failed to write " + path.string() + ": " + std::strerror(err));
        }
        p += n;
        remaining -= static_cast<size_t>(n);
    }

    if (::close(fd) != 0) throw std::runtime_error("Failed to close " + path.string() + ": " + std::strerror(errno));
}

void writeOwnerOnly(const fs::path& path, const std::vector<uint8_t>& data) {
    writeRaw(path, data.data(), data.size());
}

void writeOwnerOnly(const fs::path& path, const std::string& data) {
    writeRaw(path, data.data(), data.size());
}

}
