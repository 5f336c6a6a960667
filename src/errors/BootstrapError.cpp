#include "errors/BootstrapError.hpp"

namespace kw::errors {

std::string_view to_string(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Transient: return "transient";
        case ErrorKind::Terminal: return "terminal";
        case ErrorKind::Fatal: return "fatal";
        case ErrorKind::BestEffort: return "best-effort";
    }
    return "unknown";
}

BootstrapError::BootstrapError(const ErrorKind kind, const std::string& what)
    : std::runtime_error(what), kind_(kind) {}

void fatal(const std::string& what) {
    throw BootstrapError(ErrorKind::Fatal, what);
}

}
