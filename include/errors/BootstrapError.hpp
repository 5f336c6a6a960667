#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace kw::errors {

// Dispatch policy for a failure. Every error raised by the bootstrap path carries one.
enum class ErrorKind {
    Transient,   // retried on a fixed interval
    Terminal,    // stop without failing the process (standby node)
    Fatal,       // abort the run after cleanup guards have executed
    BestEffort   // logged as a warning, never escalated
};

std::string_view to_string(ErrorKind kind);

class BootstrapError : public std::runtime_error {
public:
    BootstrapError(ErrorKind kind, const std::string& what);

    [[nodiscard]] ErrorKind kind() const { return kind_; }
    [[nodiscard]] bool isFatal() const { return kind_ == ErrorKind::Fatal; }

private:
    ErrorKind kind_;
};

[[noreturn]] void fatal(const std::string& what);

}
