#pragma once

#include <atomic>
#include <string>
#include <thread>

namespace kw::services {

// Runs runLoop() on a worker thread until it returns or stop() raises the interrupt flag.
class AsyncService {
public:
    explicit AsyncService(std::string serviceName);

    virtual ~AsyncService();

    AsyncService(const AsyncService&) = delete;
    AsyncService& operator=(const AsyncService&) = delete;

    virtual void start();

    virtual void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

protected:
    std::string serviceName_;
    std::atomic<bool> running_{false};
    std::atomic<bool> interruptFlag_{false};
    std::thread worker_;

    virtual void runLoop() = 0;
};

}
