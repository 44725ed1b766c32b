#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <stdexcept>

using namespace mg::concurrency;

ThreadPool::ThreadPool(const unsigned int nThreads) {
    if (nThreads == 0) throw std::invalid_argument("ThreadPool requires at least one worker");
    for (unsigned int i = 0; i < nThreads; ++i) spawnWorker();
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop() {
    const auto self = std::this_thread::get_id();
    if (std::ranges::any_of(threads_, [&](const std::thread& t) { return t.get_id() == self; }))
        throw std::logic_error("ThreadPool::stop called from one of its own workers");

    {
        std::scoped_lock lock(mutex);
        if (stopFlag.load() && threads_.empty()) return;
        stopFlag.store(true);
    }
    cv.notify_all();

    // Workers run every queued task before exiting, so no promise is left unfulfilled.
    for (auto& t : threads_)
        if (t.joinable()) t.join();

    threads_.clear();
}

void ThreadPool::submit(std::shared_ptr<Task> task) {
    {
        std::scoped_lock lock(mutex);
        if (stopFlag.load()) throw std::runtime_error("ThreadPool is stopped");
        queue.push(std::move(task));
    }
    cv.notify_one();
}

size_t ThreadPool::queueDepth() const {
    std::scoped_lock lock(mutex);
    return queue.size();
}

unsigned int ThreadPool::workerCount() const {
    return static_cast<unsigned int>(threads_.size());
}

void ThreadPool::spawnWorker() {
    threads_.emplace_back([this] {
        while (true) {
            std::shared_ptr<Task> task;
            {
                std::unique_lock lock(mutex);
                cv.wait(lock, [this] {
                    return stopFlag.load() || !queue.empty();
                });

                if (stopFlag.load() && queue.empty()) break;

                task = std::move(queue.front());
                queue.pop();
            }

            try {
                (*task)();
            } catch (const std::exception& e) {
                // PromisedTask routes its own failures into the future; this is a bare Task
                if (log::Registry::isInitialized())
                    log::Registry::mediagate()->error("[ThreadPool] Task threw: {}", e.what());
            }
        }
    });
}
