#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>

#include <boost/asio/any_io_executor.hpp>

#include "domain/ports/ICandleProvider.hpp"

namespace vpb::adapters::synthetic {

struct SyntheticConfig {
    double startPrice = 100.0;
    // Relative amplitude of the per-bar noise.
    double volatility = 0.004;
    std::chrono::milliseconds latency{40};
    bool skipWeekends = true;
    std::uint32_t seed = 42;
    std::size_t maxBarsPerCall = 100'000;
};

// Offline provider. Every bar is a pure function of (seed, symbol, open time), so
// overlapping windows always agree. Weekends are left out to produce real data gaps.
class SyntheticCandleProvider : public domain::ICandleProvider {
public:
    SyntheticCandleProvider(boost::asio::any_io_executor executor, SyntheticConfig config = {});

    void fetchWindow(const domain::FetchRequest& request,
                     domain::CancellationToken token,
                     Callback onComplete) override;

    domain::FetchResult generate(const domain::FetchRequest& request) const;

    std::size_t callCount() const noexcept { return calls_.load(std::memory_order_relaxed); }

private:
    double midPrice(std::uint64_t symbolHash, domain::TimestampMs t) const;

    boost::asio::any_io_executor executor_;
    SyntheticConfig config_;
    std::atomic<std::size_t> calls_{0};
};

}  // namespace vpb::adapters::synthetic
