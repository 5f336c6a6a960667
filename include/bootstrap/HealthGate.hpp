#pragma once

#include "engine/EngineClient.hpp"
#include "services/AsyncService.hpp"

#include <chrono>
#include <future>

namespace kw::util { class Cancellation; }

namespace kw::bootstrap {

// Polls the health endpoint on a worker thread until the engine reports
// unsealed and active, then releases the waiting bootstrap flow.
class HealthGate : public services::AsyncService {
public:
    HealthGate(engine::EngineClient& client, std::chrono::milliseconds pollInterval);
    ~HealthGate() override;

    // Blocks until the engine is ready (true) or cancellation is requested (false).
    bool waitUntilReady(const util::Cancellation& cancellation);

    void start() override;

protected:
    void runLoop() override;

private:
    engine::EngineClient& client_;
    std::chrono::milliseconds pollInterval_;
    std::promise<void> ready_;
    std::future<void> readyFuture_;
};

}
