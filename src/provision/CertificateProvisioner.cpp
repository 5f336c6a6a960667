#include "provision/CertificateProvisioner.hpp"
#include "crypto/util/encrypt.hpp"
#include "errors/BootstrapError.hpp"
#include "log/Registry.hpp"
#include "util/files.hpp"

#include <fmt/core.h>
#include <memory>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <stdexcept>

using namespace kw::types;

namespace kw::provision {

namespace {

struct BioDeleter { void operator()(BIO* b) const { BIO_free(b); } };
struct X509Deleter { void operator()(X509* x) const { X509_free(x); } };
struct PKeyDeleter { void operator()(EVP_PKEY* k) const { EVP_PKEY_free(k); } };

std::unique_ptr<BIO, BioDeleter> memBio(const std::string& pem) {
    std::unique_ptr<BIO, BioDeleter> bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) throw std::runtime_error("failed to allocate OpenSSL BIO");
    return bio;
}

void validateCertificate(const std::string& pem, const std::filesystem::path& file) {
    const auto bio = memBio(pem);
    const std::unique_ptr<X509, X509Deleter> cert(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
    if (!cert) throw std::runtime_error(fmt::format("{} does not contain a PEM certificate", file.string()));
}

void validatePrivateKey(const std::string& pem, const std::filesystem::path& file) {
    const auto bio = memBio(pem);
    const std::unique_ptr<EVP_PKEY, PKeyDeleter> key(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
    if (!key) throw std::runtime_error(fmt::format("{} does not contain a PEM private key", file.string()));
}

std::string readNonEmpty(const std::filesystem::path& file) {
    if (!std::filesystem::is_regular_file(file))
        throw std::runtime_error(fmt::format("{} does not exist", file.string()));
    auto content = util::readFileToString(file);
    if (content.empty()) throw std::runtime_error(fmt::format("{} is empty", file.string()));
    return content;
}

}

std::string_view to_string(const CertificateProvisioner::Outcome outcome) {
    switch (outcome) {
        case CertificateProvisioner::Outcome::Uploaded: return "uploaded";
        case CertificateProvisioner::Outcome::AlreadyPresent: return "already present";
    }
    return "unknown";
}

CertificateProvisioner::CertificateProvisioner(engine::EngineClient& client, std::string rootToken, std::string certPath)
    : client_(client), rootToken_(std::move(rootToken)), certPath_(engine::normalizePath(certPath)) {}

bool CertificateProvisioner::alreadyInStore() const {
    const auto data = client_.readSecret(rootToken_, certPath_);
    if (!data || !data->is_object()) return false;
    return !data->value("cert", "").empty() && !data->value("key", "").empty();
}

CertificatePair CertificateProvisioner::readFrom(const std::filesystem::path& certFile,
                                                 const std::filesystem::path& keyFile) {
    CertificatePair pair{readNonEmpty(certFile), readNonEmpty(keyFile)};
    try {
        validateCertificate(pair.certificate, certFile);
        validatePrivateKey(pair.privateKey, keyFile);
    } catch (const std::runtime_error&) {
        crypto::util::secure_wipe(pair.privateKey);
        throw;
    }
    return pair;
}

void CertificateProvisioner::uploadToStore(const CertificatePair& pair) const {
    client_.writeSecret(rootToken_, certPath_, pair);
}

CertificateProvisioner::Outcome CertificateProvisioner::provision(const std::filesystem::path& certFile,
                                                                  const std::filesystem::path& keyFile) const {
    try {
        if (alreadyInStore()) {
            log::Registry::provision()->info("[CertificateProvisioner] Certificate pair already in the secret store at {}",
                                             certPath_);
            return Outcome::AlreadyPresent;
        }

        auto pair = readFrom(certFile, keyFile);
        log::Registry::provision()->info("[CertificateProvisioner] Loaded certificate pair from {}", certFile.string());

        uploadToStore(pair);
        crypto::util::secure_wipe(pair.privateKey);
    } catch (const std::runtime_error& e) {
        errors::fatal(fmt::format("failed to provision certificate pair to {}: {}", certPath_, e.what()));
    }

    log::Registry::provision()->info("[CertificateProvisioner] Uploaded certificate pair to {}", certPath_);
    return Outcome::Uploaded;
}

}
