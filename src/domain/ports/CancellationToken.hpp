#pragma once

#include <atomic>
#include <memory>

namespace vpb::domain {

// Cooperative cancellation flag shared between the cache and a provider call.
// Copies observe the same flag.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const noexcept { flag_->store(true, std::memory_order_release); }
    bool isCancelled() const noexcept { return flag_->load(std::memory_order_acquire); }

    bool sameAs(const CancellationToken& other) const noexcept { return flag_ == other.flag_; }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace vpb::domain
