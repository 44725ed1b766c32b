#pragma once

#include "concurrency/Task.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace mg::concurrency {

class ThreadPool {
public:
    explicit ThreadPool(unsigned int nThreads);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Runs what is still queued, then joins every worker. Must not be called from a worker.
    void stop();

    void submit(std::shared_ptr<Task> task);

    template <typename Fn>
    auto post(Fn&& fn) -> std::future<decltype(fn())> {
        using T = decltype(fn());
        auto task = std::make_shared<PromisedTask<T>>(std::forward<Fn>(fn));
        auto future = task->getFuture();
        submit(task);
        return future;
    }

    size_t queueDepth() const;

    [[nodiscard]] unsigned int workerCount() const;

    [[nodiscard]] bool isStopped() const { return stopFlag.load(); }

private:
    void spawnWorker();

    std::vector<std::thread> threads_;

    std::condition_variable cv;
    mutable std::mutex mutex;
    std::queue<std::shared_ptr<Task>> queue;

    std::atomic<bool> stopFlag{false};
};

}
