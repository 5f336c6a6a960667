#include "services/AsyncService.hpp"
#include "log/Registry.hpp"

using namespace kw::services;
using namespace kw::log;

AsyncService::AsyncService(std::string serviceName) : serviceName_(std::move(serviceName)) {}

AsyncService::~AsyncService() {
    stop(); // ensure cleanup
}

void AsyncService::start() {
    if (isRunning()) return;
    if (worker_.joinable()) worker_.join(); // previous run finished on its own

    interruptFlag_.store(false);
    running_.store(true);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            Registry::keywarden()->error("[{}] Service encountered an error: {}", serviceName_, e.what());
        }
        running_.store(false);
    });

    Registry::keywarden()->debug("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    interruptFlag_.store(true);

    // Only join if we're not calling stop() from the same thread
    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) {
        worker_.join();
        Registry::keywarden()->debug("[{}] Service stopped.", serviceName_);
    }

    running_.store(false);
    interruptFlag_.store(false);
}
