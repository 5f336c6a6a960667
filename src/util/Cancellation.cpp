#include "util/Cancellation.hpp"

#include <algorithm>
#include <thread>

namespace kw::util {

bool Cancellation::sleepFor(const std::chrono::milliseconds duration) const {
    constexpr std::chrono::milliseconds slice{50};
    const auto deadline = std::chrono::steady_clock::now() + duration;

    while (!isCancelled()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return true;
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(slice, deadline - now));
    }
    return false;
}

}
