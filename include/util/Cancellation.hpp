#pragma once

#include <atomic>
#include <chrono>

namespace kw::util {

// Cooperative stop flag shared between the signal handler and the bootstrap flow.
class Cancellation {
public:
    void cancel() noexcept { cancelled_.store(true); }
    [[nodiscard]] bool isCancelled() const noexcept { return cancelled_.load(); }

    // Sleeps for `duration` in short slices. Returns false if cancelled before it elapsed.
    bool sleepFor(std::chrono::milliseconds duration) const;

private:
    std::atomic<bool> cancelled_{false};
};

}
