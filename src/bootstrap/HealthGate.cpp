#include "bootstrap/HealthGate.hpp"
#include "engine/EngineState.hpp"
#include "log/Registry.hpp"
#include "util/Cancellation.hpp"

#include <algorithm>

using namespace kw::engine;

namespace kw::bootstrap {

static constexpr std::chrono::milliseconds WAIT_SLICE{50};

HealthGate::HealthGate(EngineClient& client, const std::chrono::milliseconds pollInterval)
    : AsyncService("HealthGate"), client_(client), pollInterval_(pollInterval) {}

HealthGate::~HealthGate() { stop(); }

void HealthGate::start() {
    if (isRunning()) return;
    ready_ = std::promise<void>();
    readyFuture_ = ready_.get_future();
    AsyncService::start();
}

bool HealthGate::waitUntilReady(const util::Cancellation& cancellation) {
    start();

    while (!cancellation.isCancelled()) {
        if (readyFuture_.wait_for(WAIT_SLICE) == std::future_status::ready) {
            stop();
            log::Registry::engine()->info("[HealthGate] Secret store is ready");
            return true;
        }
    }

    stop();
    log::Registry::engine()->info("[HealthGate] Cancelled while waiting for the secret store");
    return false;
}

void HealthGate::runLoop() {
    while (!interruptFlag_.load()) {
        std::optional<long> code;
        try {
            code = client_.healthCheck();
        } catch (const EngineError& e) {
            log::Registry::engine()->debug("[HealthGate] Health check failed: {}", e.what());
        }

        if (classify(code) == EngineState::Unsealed) {
            ready_.set_value();
            return;
        }

        log::Registry::engine()->debug("[HealthGate] Secret store not ready yet ({})", to_string(classify(code)));

        auto remaining = pollInterval_;
        while (remaining.count() > 0 && !interruptFlag_.load()) {
            const auto step = std::min(remaining, WAIT_SLICE);
            std::this_thread::sleep_for(step);
            remaining -= step;
        }
    }
}

}
