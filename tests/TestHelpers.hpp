#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "domain/Types.h"
#include "domain/ports/ICandleProvider.hpp"

namespace vpb::testing {

inline domain::Candle makeCandle(domain::TimestampMs openTime, double close, double volume = 1.0) {
    domain::Candle candle;
    candle.openTime = openTime;
    candle.open = close;
    candle.high = close + 1.0;
    candle.low = close - 1.0;
    candle.close = close;
    candle.volume = volume;
    return candle;
}

// `count` candles starting at `start`, one every `stepMs`, closes counting up from `firstClose`.
inline domain::Series makeSeries(domain::TimestampMs start,
                                 std::size_t count,
                                 domain::TimestampMs stepMs,
                                 double firstClose = 100.0) {
    domain::Series series;
    series.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        series.push_back(makeCandle(start + static_cast<domain::TimestampMs>(i) * stepMs,
                                    firstClose + static_cast<double>(i)));
    }
    return series;
}

// Provider that parks every call until the test completes or fails it.
class FakeCandleProvider : public domain::ICandleProvider {
public:
    struct Call {
        domain::FetchRequest request;
        domain::CancellationToken token;
        Callback onComplete;
        bool settled{false};
    };

    void fetchWindow(const domain::FetchRequest& request,
                     domain::CancellationToken token,
                     Callback onComplete) override {
        calls.push_back(Call{request, std::move(token), std::move(onComplete), false});
    }

    void complete(std::size_t index, domain::Series series) {
        settle(index, domain::FetchResult::success(std::move(series)));
    }

    void fail(std::size_t index, const std::string& error) {
        settle(index, domain::FetchResult::failure(error));
    }

    std::size_t pending() const {
        std::size_t count = 0;
        for (const auto& call : calls) {
            if (!call.settled) {
                ++count;
            }
        }
        return count;
    }

    std::vector<Call> calls;

private:
    void settle(std::size_t index, domain::FetchResult result) {
        auto& call = calls.at(index);
        call.settled = true;
        call.onComplete(std::move(result));
    }
};

}  // namespace vpb::testing
