#include "transfer/ProgressChannel.hpp"

#include <algorithm>

using namespace mg::transfer;

ProgressChannel::ProgressChannel(const size_t capacity) : capacity_(std::max<size_t>(1, capacity)) {}

void ProgressChannel::publish(ProgressEvent event) {
    {
        std::scoped_lock lock(mutex_);
        if (closed_) return;
        latest_ = event;
        if (queue_.size() >= capacity_) queue_.pop_front();
        queue_.push_back(std::move(event));
    }
    cv_.notify_one();
}

std::optional<ProgressEvent> ProgressChannel::tryPop() {
    std::scoped_lock lock(mutex_);
    if (queue_.empty()) return std::nullopt;
    auto e = std::move(queue_.front());
    queue_.pop_front();
    return e;
}

std::optional<ProgressEvent> ProgressChannel::waitPop(const std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) return std::nullopt;
    auto e = std::move(queue_.front());
    queue_.pop_front();
    return e;
}

std::optional<ProgressEvent> ProgressChannel::latest() const {
    std::scoped_lock lock(mutex_);
    return latest_;
}

void ProgressChannel::close() {
    {
        std::scoped_lock lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool ProgressChannel::isClosed() const {
    std::scoped_lock lock(mutex_);
    return closed_;
}
