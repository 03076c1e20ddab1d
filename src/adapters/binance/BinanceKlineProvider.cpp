#include "adapters/binance/BinanceKlineProvider.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <exception>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/json.hpp>

#include "common/Log.hpp"
#include "infra/http/TlsHttpClient.hpp"

namespace vpb::adapters::binance {
namespace {

constexpr std::size_t kMaxLimit = 1000;
constexpr int kRateLimitPerMinute = 1200;
constexpr double kRateLimitThreshold = 0.9;
constexpr const char* kWeightHeader = "X-MBX-USED-WEIGHT";

constexpr domain::TimestampMs kMinute = 60'000;
constexpr domain::TimestampMs kHour = 60 * kMinute;
constexpr domain::TimestampMs kDay = 24 * kHour;

std::int64_t jsonToInt64(const boost::json::value& value) {
    if (value.is_int64()) {
        return value.as_int64();
    }
    if (value.is_uint64()) {
        return static_cast<std::int64_t>(value.as_uint64());
    }
    if (value.is_double()) {
        return static_cast<std::int64_t>(std::llround(value.as_double()));
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        try {
            return std::stoll(str);
        } catch (const std::exception& ex) {
            throw std::runtime_error("Failed to parse integer value: " + str + ", error: " + ex.what());
        }
    }
    throw std::runtime_error("Unsupported JSON type for integer conversion");
}

double jsonToDouble(const boost::json::value& value) {
    if (value.is_double()) {
        return value.as_double();
    }
    if (value.is_int64()) {
        return static_cast<double>(value.as_int64());
    }
    if (value.is_uint64()) {
        return static_cast<double>(value.as_uint64());
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        try {
            return std::stod(str);
        } catch (const std::exception& ex) {
            throw std::runtime_error("Failed to parse floating value: " + str + ", error: " + ex.what());
        }
    }
    throw std::runtime_error("Unsupported JSON type for floating conversion");
}

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

// Sleeps in short slices so a cancelled request stops waiting promptly.
bool sleepUnlessCancelled(std::chrono::milliseconds duration, const domain::CancellationToken& token) {
    constexpr std::chrono::milliseconds kSlice{50};
    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (std::chrono::steady_clock::now() < deadline) {
        if (token.isCancelled()) {
            return false;
        }
        std::this_thread::sleep_for(std::min(kSlice, duration));
    }
    return !token.isCancelled();
}

}  // namespace

std::optional<std::string_view> binanceInterval(domain::TimestampMs barMs) noexcept {
    switch (barMs) {
    case kMinute:
        return "1m";
    case 3 * kMinute:
        return "3m";
    case 5 * kMinute:
        return "5m";
    case 15 * kMinute:
        return "15m";
    case 30 * kMinute:
        return "30m";
    case kHour:
        return "1h";
    case 2 * kHour:
        return "2h";
    case 4 * kHour:
        return "4h";
    case 6 * kHour:
        return "6h";
    case 12 * kHour:
        return "12h";
    case kDay:
        return "1d";
    case 7 * kDay:
        return "1w";
    default:
        break;
    }
    return std::nullopt;
}

domain::Series parseKlines(std::string_view body) {
    boost::json::value json;
    try {
        json = boost::json::parse(body);
    } catch (const std::exception& ex) {
        throw std::runtime_error(std::string{"Failed to parse Binance response: "} + ex.what());
    }

    if (!json.is_array()) {
        throw std::runtime_error("Unexpected Binance response type (expected array)");
    }

    domain::Series rows;
    rows.reserve(json.as_array().size());
    for (const auto& rowValue : json.as_array()) {
        if (!rowValue.is_array()) {
            throw std::runtime_error("Unexpected Binance kline row type");
        }
        const auto& row = rowValue.as_array();
        if (row.size() < 6) {
            throw std::runtime_error("Incomplete Binance kline row");
        }

        domain::Candle candle;
        candle.openTime = jsonToInt64(row.at(0));
        candle.open = jsonToDouble(row.at(1));
        candle.high = jsonToDouble(row.at(2));
        candle.low = jsonToDouble(row.at(3));
        candle.close = jsonToDouble(row.at(4));
        candle.volume = jsonToDouble(row.at(5));
        rows.push_back(candle);
    }
    return rows;
}

BinanceKlineProvider::BinanceKlineProvider(boost::asio::thread_pool& pool, BinanceConfig config)
    : pool_(pool), config_(std::move(config)) {}

void BinanceKlineProvider::fetchWindow(const domain::FetchRequest& request,
                                       domain::CancellationToken token,
                                       Callback onComplete) {
    boost::asio::post(pool_, [this, request, token = std::move(token), onComplete = std::move(onComplete)]() {
        onComplete(fetchBlocking(request, token));
    });
}

domain::FetchResult BinanceKlineProvider::fetchBlocking(const domain::FetchRequest& request,
                                                        const domain::CancellationToken& token) const {
    const auto interval = binanceInterval(request.timeframe.barMs());
    if (!interval) {
        return domain::FetchResult::failure("Binance does not serve timeframe '" + request.timeframe.label + "'");
    }
    if (request.symbol.empty()) {
        return domain::FetchResult::failure("Binance request without symbol");
    }

    const auto symbol = toUpper(request.symbol);
    const auto window = domain::TimeRange::ordered(request.window.start, request.window.end);
    const auto limit = std::clamp<std::size_t>(config_.pageLimit == 0 ? kMaxLimit : config_.pageLimit, 1, kMaxLimit);
    const auto barMs = request.timeframe.barMs();

    domain::Series rows;
    auto pageStart = window.start;

    try {
        while (pageStart <= window.end) {
            if (token.isCancelled()) {
                return domain::FetchResult::failure("cancelled");
            }

            const auto pageEnd = std::min<domain::TimestampMs>(
                window.end, pageStart + static_cast<domain::TimestampMs>(limit) * barMs - 1);

            std::ostringstream target;
            target << "/api/v3/klines?symbol=" << symbol << "&interval=" << *interval << "&startTime=" << pageStart
                   << "&endTime=" << pageEnd << "&limit=" << limit;

            infra::http::HttpsGetRequest httpRequest;
            httpRequest.host = config_.host;
            httpRequest.target = target.str();
            httpRequest.timeoutSec = config_.timeoutSec;
            httpRequest.verifyPeer = config_.verifyPeer;
            httpRequest.captureHeader = kWeightHeader;

            infra::http::HttpsResponse response;
            bool succeeded = false;
            for (int attempt = 1; attempt <= config_.maxRetries; ++attempt) {
                LOG_DEBUG("Binance REST " << httpRequest.target << " attempt=" << attempt);
                response = infra::http::httpsGet(httpRequest);
                if (response.status == 200U) {
                    succeeded = true;
                    break;
                }
                const bool retryable = response.status == 429U || (response.status >= 500U && response.status < 600U);
                if (!retryable || attempt == config_.maxRetries) {
                    std::ostringstream oss;
                    oss << "Binance REST " << httpRequest.target << " returned HTTP " << response.status
                        << " after " << attempt << " attempt(s)";
                    return domain::FetchResult::failure(oss.str());
                }
                const auto backoff = std::chrono::milliseconds(1000LL << (attempt - 1));
                LOG_WARN("Binance REST backoff attempt " << attempt << " due to HTTP " << response.status
                                                         << ", sleeping " << backoff.count() << " ms");
                if (!sleepUnlessCancelled(backoff, token)) {
                    return domain::FetchResult::failure("cancelled");
                }
            }
            if (!succeeded) {
                return domain::FetchResult::failure("Binance REST request failed without success response");
            }

            auto page = parseKlines(response.body);
            for (auto& candle : page) {
                if (candle.openTime < window.start || candle.openTime > window.end) {
                    continue;
                }
                if (!rows.empty() && candle.openTime <= rows.back().openTime) {
                    continue;
                }
                rows.push_back(candle);
            }

            if (page.size() < limit) {
                break;
            }
            pageStart = pageEnd + 1;

            if (!response.capturedHeader.empty()) {
                try {
                    const int usedWeight = std::stoi(response.capturedHeader);
                    if (usedWeight > static_cast<int>(kRateLimitPerMinute * kRateLimitThreshold)
                        && !sleepUnlessCancelled(std::chrono::seconds(2), token)) {
                        return domain::FetchResult::failure("cancelled");
                    }
                } catch (const std::exception& ex) {
                    LOG_DEBUG("Binance REST ignoring malformed " << kWeightHeader << " '"
                                                                << response.capturedHeader << "': " << ex.what());
                }
            }
        }
    } catch (const std::exception& ex) {
        return domain::FetchResult::failure(ex.what());
    }

    return domain::FetchResult::success(std::move(rows));
}

}  // namespace vpb::adapters::binance
