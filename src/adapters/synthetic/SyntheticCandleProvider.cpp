#include "adapters/synthetic/SyntheticCandleProvider.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <memory>
#include <string>
#include <utility>

#include <boost/asio/steady_timer.hpp>

#include "common/Log.hpp"

namespace vpb::adapters::synthetic {
namespace {

constexpr domain::TimestampMs kDayMs = 86'400'000;
constexpr domain::TimestampMs kWeekMs = 7 * kDayMs;
constexpr double kPi = 3.14159265358979323846;

std::uint64_t mix(std::uint64_t value) {
    value ^= value >> 33;
    value *= 0xff51afd7ed558ccdULL;
    value ^= value >> 33;
    value *= 0xc4ceb9fe1a85ec53ULL;
    value ^= value >> 33;
    return value;
}

// Uniform in [0, 1).
double unitNoise(std::uint64_t seed, domain::TimestampMs t, std::uint64_t salt) {
    const auto h = mix(seed ^ mix(static_cast<std::uint64_t>(t) + salt * 0x9e3779b97f4a7c15ULL));
    return static_cast<double>(h >> 11) / static_cast<double>(1ULL << 53);
}

bool isWeekend(domain::TimestampMs t) {
    const auto day = t >= 0 ? t / kDayMs : (t - kDayMs + 1) / kDayMs;
    // 1970-01-01 was a Thursday; 0 = Sunday.
    const auto weekday = ((day + 4) % 7 + 7) % 7;
    return weekday == 0 || weekday == 6;
}

}  // namespace

SyntheticCandleProvider::SyntheticCandleProvider(boost::asio::any_io_executor executor, SyntheticConfig config)
    : executor_(std::move(executor)), config_(config) {}

void SyntheticCandleProvider::fetchWindow(const domain::FetchRequest& request,
                                          domain::CancellationToken token,
                                          Callback onComplete) {
    calls_.fetch_add(1, std::memory_order_relaxed);

    auto timer = std::make_shared<boost::asio::steady_timer>(executor_, config_.latency);
    timer->async_wait([this, timer, request, token, onComplete = std::move(onComplete)](
                          const boost::system::error_code& ec) {
        if (ec) {
            onComplete(domain::FetchResult::failure("Synthetic provider timer failed: " + ec.message()));
            return;
        }
        if (token.isCancelled()) {
            onComplete(domain::FetchResult::failure("cancelled"));
            return;
        }
        onComplete(generate(request));
    });
}

double SyntheticCandleProvider::midPrice(std::uint64_t symbolHash, domain::TimestampMs t) const {
    const double days = static_cast<double>(t) / static_cast<double>(kDayMs);
    const double phase = static_cast<double>(symbolHash % 1000U) / 1000.0 * 2.0 * kPi;
    const double trend = 0.08 * std::sin(days / 45.0 * 2.0 * kPi + phase)
        + 0.03 * std::sin(days / 6.0 * 2.0 * kPi + 2.0 * phase)
        + 0.01 * std::sin(days * 2.0 * kPi);
    const double noise = (unitNoise(config_.seed ^ symbolHash, t, 1) - 0.5) * 2.0 * config_.volatility;
    return config_.startPrice * (1.0 + trend + noise);
}

domain::FetchResult SyntheticCandleProvider::generate(const domain::FetchRequest& request) const {
    const auto barMs = request.timeframe.barMs();
    if (barMs <= 0) {
        return domain::FetchResult::failure("Synthetic provider: invalid timeframe '" + request.timeframe.label + "'");
    }

    const auto window = domain::TimeRange::ordered(request.window.start, request.window.end);
    const auto first = domain::align_up_ms(window.start, barMs);
    if (first > window.end) {
        return domain::FetchResult::success({});
    }
    const auto bars = static_cast<std::size_t>((window.end - first) / barMs) + 1U;
    if (bars > config_.maxBarsPerCall) {
        return domain::FetchResult::failure("Synthetic provider: window of " + std::to_string(bars)
                                            + " bars exceeds limit of " + std::to_string(config_.maxBarsPerCall));
    }

    const auto symbolHash = mix(std::hash<std::string>{}(request.symbol));
    const bool skipWeekends = config_.skipWeekends && barMs < kWeekMs;

    domain::Series series;
    series.reserve(bars);
    for (auto t = first; t <= window.end; t += barMs) {
        if (skipWeekends && isWeekend(t)) {
            continue;
        }
        const double open = midPrice(symbolHash, t);
        const double close = midPrice(symbolHash, t + barMs);
        const double wick = config_.volatility * config_.startPrice;

        domain::Candle candle;
        candle.openTime = t;
        candle.open = open;
        candle.close = close;
        candle.high = std::max(open, close) + unitNoise(config_.seed, t, 2) * wick;
        candle.low = std::min(open, close) - unitNoise(config_.seed, t, 3) * wick;
        candle.volume = 1'000.0 + std::floor(unitNoise(config_.seed ^ symbolHash, t, 4) * 9'000.0);
        series.push_back(candle);
    }

    LOG_DEBUG("Synthetic provider " << request.symbol << ':' << request.timeframe.label << " window=" << window
                                    << " bars=" << series.size());
    return domain::FetchResult::success(std::move(series));
}

}  // namespace vpb::adapters::synthetic
