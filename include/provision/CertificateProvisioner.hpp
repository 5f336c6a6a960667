#pragma once

#include "engine/EngineClient.hpp"
#include "types/CertificatePair.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace kw::provision {

class CertificateProvisioner {
public:
    enum class Outcome { Uploaded, AlreadyPresent };

    CertificateProvisioner(engine::EngineClient& client, std::string rootToken, std::string certPath);

    // True when the secret at the certificate path holds a non-empty cert and key
    [[nodiscard]] bool alreadyInStore() const;

    // Reads both files and checks they hold a PEM certificate and a PEM private key.
    static types::CertificatePair readFrom(const std::filesystem::path& certFile, const std::filesystem::path& keyFile);

    void uploadToStore(const types::CertificatePair& pair) const;

    // Uploads the pair from disk unless one is already stored. Fatal on failure.
    Outcome provision(const std::filesystem::path& certFile, const std::filesystem::path& keyFile) const;

    [[nodiscard]] const std::string& path() const { return certPath_; }

private:
    engine::EngineClient& client_;
    std::string rootToken_;
    std::string certPath_;
};

std::string_view to_string(CertificateProvisioner::Outcome outcome);

}
