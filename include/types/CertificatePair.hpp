#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace kw::types {

// PEM encoded certificate and private key
struct CertificatePair {
    std::string certificate;
    std::string privateKey;
};

inline void to_json(nlohmann::json& j, const CertificatePair& p) {
    j = {{"cert", p.certificate}, {"key", p.privateKey}};
}

}
