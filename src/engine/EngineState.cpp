#include "engine/EngineState.hpp"

namespace kw::engine {

std::string_view to_string(const EngineState state) {
    switch (state) {
        case EngineState::Uninitialized: return "uninitialized";
        case EngineState::Sealed: return "sealed";
        case EngineState::Unsealed: return "unsealed";
        case EngineState::Standby: return "standby";
        case EngineState::Unreachable: return "unreachable";
    }
    return "unknown";
}

std::string_view to_string(const UnsealAction action) {
    switch (action) {
        case UnsealAction::Retry: return "retry";
        case UnsealAction::LoadAndFinish: return "load-and-finish";
        case UnsealAction::Stop: return "stop";
        case UnsealAction::InitializeAndUnseal: return "initialize-and-unseal";
        case UnsealAction::LoadAndUnseal: return "load-and-unseal";
    }
    return "unknown";
}

}
