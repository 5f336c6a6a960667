#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace kw::types {

struct CredentialPair {
    std::string username;
    std::string password;
};

inline void to_json(nlohmann::json& j, const CredentialPair& p) {
    j = {{"username", p.username}, {"password", p.password}};
}

inline void from_json(const nlohmann::json& j, CredentialPair& p) {
    p.username = j.value("username", "");
    p.password = j.value("password", "");
}

}
