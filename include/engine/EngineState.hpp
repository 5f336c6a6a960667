#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace kw::engine {

enum class EngineState {
    Uninitialized,
    Sealed,
    Unsealed,
    Standby,
    Unreachable
};

// What the unseal loop does after observing a state
enum class UnsealAction {
    Retry,
    LoadAndFinish,
    Stop,
    InitializeAndUnseal,
    LoadAndUnseal
};

namespace status {
constexpr long Ok = 200;
constexpr long TooManyRequests = 429;     // unsealed standby node
constexpr long NotImplemented = 501;      // not initialized
constexpr long ServiceUnavailable = 503;  // sealed
}

inline constexpr std::array<std::pair<EngineState, UnsealAction>, 5> TRANSITIONS{{
    {EngineState::Unreachable,   UnsealAction::Retry},
    {EngineState::Unsealed,      UnsealAction::LoadAndFinish},
    {EngineState::Standby,       UnsealAction::Stop},
    {EngineState::Uninitialized, UnsealAction::InitializeAndUnseal},
    {EngineState::Sealed,        UnsealAction::LoadAndUnseal},
}};

// Maps a health check status code to a state. No code (transport error) and any
// unmapped code are Unreachable.
constexpr EngineState classify(const std::optional<long> statusCode) noexcept {
    if (!statusCode) return EngineState::Unreachable;
    switch (*statusCode) {
        case status::Ok: return EngineState::Unsealed;
        case status::TooManyRequests: return EngineState::Standby;
        case status::NotImplemented: return EngineState::Uninitialized;
        case status::ServiceUnavailable: return EngineState::Sealed;
        default: return EngineState::Unreachable;
    }
}

constexpr UnsealAction actionFor(const EngineState state) noexcept {
    for (const auto& [from, action] : TRANSITIONS)
        if (from == state) return action;
    return UnsealAction::Retry;
}

std::string_view to_string(EngineState state);
std::string_view to_string(UnsealAction action);

}
