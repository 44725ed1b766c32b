#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace mg::transfer {

enum class Stage { Reading, Writing, Complete };

struct ProgressEvent {
    std::string path{};
    uint64_t bytesTransferred{};
    int64_t totalBytes{-1};
    size_t fileIndex{};
    size_t fileCount{};
    Stage stage{Stage::Reading};
    bool done{false};
};

// Multi-producer queue of progress events. Bounded: when full the oldest event is dropped,
// latest() always reflects the newest one.
class ProgressChannel {
public:
    static constexpr int64_t kUnknownTotal = -1;

    explicit ProgressChannel(size_t capacity = 256);

    void publish(ProgressEvent event);

    [[nodiscard]] std::optional<ProgressEvent> tryPop();

    // nullopt on timeout or once closed and drained
    [[nodiscard]] std::optional<ProgressEvent> waitPop(std::chrono::milliseconds timeout);

    [[nodiscard]] std::optional<ProgressEvent> latest() const;

    void close();
    [[nodiscard]] bool isClosed() const;

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ProgressEvent> queue_;
    std::optional<ProgressEvent> latest_;
    bool closed_{false};
};

}
