#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <boost/asio/thread_pool.hpp>

#include "domain/ports/ICandleProvider.hpp"

namespace vpb::adapters::binance {

struct BinanceConfig {
    std::string host = "api.binance.com";
    int timeoutSec = 20;
    std::size_t pageLimit = 1000;
    int maxRetries = 5;
    bool verifyPeer = true;
};

std::optional<std::string_view> binanceInterval(domain::TimestampMs barMs) noexcept;

// Parses a /api/v3/klines payload. Throws std::runtime_error on malformed rows.
domain::Series parseKlines(std::string_view body);

// REST klines provider. Each window is paged through on `pool`; the token is checked
// between pages and before every retry.
class BinanceKlineProvider : public domain::ICandleProvider {
public:
    explicit BinanceKlineProvider(boost::asio::thread_pool& pool, BinanceConfig config = {});

    void fetchWindow(const domain::FetchRequest& request,
                     domain::CancellationToken token,
                     Callback onComplete) override;

    domain::FetchResult fetchBlocking(const domain::FetchRequest& request,
                                      const domain::CancellationToken& token) const;

private:
    boost::asio::thread_pool& pool_;
    BinanceConfig config_;
};

}  // namespace vpb::adapters::binance
