#include "services/AsyncService.hpp"
#include "log/Registry.hpp"

using namespace mg::services;
using namespace mg::log;

AsyncService::AsyncService(std::string serviceName) : serviceName_(std::move(serviceName)) {}

AsyncService::~AsyncService() {
    // Subclasses must stop() in their own destructor; runLoop is gone by now.
    if (worker_.joinable()) {
        interruptFlag_.store(true);
        sleepCv_.notify_all();
        if (std::this_thread::get_id() != worker_.get_id()) worker_.join();
        else worker_.detach();
    }
}

void AsyncService::start() {
    if (isRunning()) return;
    if (worker_.joinable()) worker_.join();

    interruptFlag_.store(false);
    running_.store(true);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            Registry::mediagate()->error("[{}] Service encountered an error: {}", serviceName_, e.what());
        }
        running_.store(false);
    });

    Registry::mediagate()->info("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (!worker_.joinable()) return;

    Registry::mediagate()->info("[{}] Stopping service...", serviceName_);
    {
        std::scoped_lock lock(sleepMutex_);
        interruptFlag_.store(true);
    }
    sleepCv_.notify_all();

    // Only join if we're not calling stop() from the same thread
    if (std::this_thread::get_id() != worker_.get_id()) worker_.join();
    else worker_.detach();

    running_.store(false);
    interruptFlag_.store(false);

    Registry::mediagate()->info("[{}] Service stopped.", serviceName_);
}

void AsyncService::restart() {
    Registry::mediagate()->info("[{}] Restarting service...", serviceName_);
    stop();
    start();
}

bool AsyncService::lazySleep(const std::chrono::milliseconds d) {
    std::unique_lock lock(sleepMutex_);
    return !sleepCv_.wait_for(lock, d, [this] { return interruptFlag_.load(); });
}
