#pragma once

#include <algorithm>
#include <atomic>
#include <memory>
#include <vector>

namespace mg::concurrency {

// Copies share one flag; checked cooperatively at every buffer-sized I/O step.
class CancelToken {
public:
    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { flag_->store(true); }

    [[nodiscard]] bool isCancelled() const {
        return flag_->load() || std::ranges::any_of(linked_, [](const auto& f) { return f->load(); });
    }

    // Cancelled when either this token or `other` is; cancel() still only reaches this token's flag.
    [[nodiscard]] CancelToken linkedWith(const CancelToken& other) const {
        CancelToken t = *this;
        t.linked_.push_back(other.flag_);
        t.linked_.insert(t.linked_.end(), other.linked_.begin(), other.linked_.end());
        return t;
    }

    static CancelToken none() { return {}; }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
    std::vector<std::shared_ptr<std::atomic<bool>>> linked_;
};

}
