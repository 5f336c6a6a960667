#pragma once

#include <string>
#include <string_view>

namespace kw::types {

struct Token {
    enum class Scope { Root, Delegate, Service };

    std::string value;
    std::string accessor;
    Scope scope = Scope::Service;
    bool revoked = false;

    [[nodiscard]] bool active() const { return !value.empty() && !revoked; }
};

std::string_view to_string(Token::Scope scope);

}
