#include "types/Token.hpp"

namespace kw::types {

std::string_view to_string(const Token::Scope scope) {
    switch (scope) {
        case Token::Scope::Root: return "root";
        case Token::Scope::Delegate: return "delegate";
        case Token::Scope::Service: return "service";
    }
    return "unknown";
}

}
