#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>

#include "adapters/binance/BinanceKlineProvider.hpp"
#include "adapters/providers/AggregatingProvider.hpp"
#include "adapters/synthetic/SyntheticCandleProvider.hpp"
#include "app/ViewportCache.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "domain/CacheKey.hpp"
#include "domain/Timeframe.hpp"

namespace {

using vpb::domain::TimeRange;
using vpb::domain::TimestampMs;

constexpr TimestampMs kMinuteMs = 60'000;
constexpr std::chrono::milliseconds kSettlePoll{100};
constexpr int kMaxSettlePolls = 600;

TimestampMs nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// Walks the viewport through the configured pan steps on the io_context thread, then waits
// for outstanding fetches and stops the loop.
class PanSimulation : public std::enable_shared_from_this<PanSimulation> {
public:
    PanSimulation(boost::asio::io_context& io,
                  vpb::app::ViewportCache& cache,
                  vpb::domain::CacheKey key,
                  TimeRange initial,
                  const vpb::common::Config& config)
        : io_(io), timer_(io), cache_(cache), key_(std::move(key)), viewport_(initial), config_(config) {}

    void start() { step(); }

private:
    void step() {
        const auto plan = cache_.planViewportFetch(key_, viewport_);
        if (plan.empty()) {
            LOG_INFO("Paso " << step_ << " viewport=" << viewport_ << " sin fetch");
        } else {
            LOG_INFO("Paso " << step_ << " viewport=" << viewport_
                             << " backfill=" << (plan.backfill ? describe(*plan.backfill) : std::string{"-"})
                             << " prefetch=" << (plan.prefetch ? describe(*plan.prefetch) : std::string{"-"}));
            const auto key = key_;
            cache_.executePlan(key_, plan, [key](vpb::domain::SeriesPtr series) {
                LOG_DEBUG("Fetch completado para " << key << ", velas totales=" << (series ? series->size() : 0U));
            });
        }

        if (step_ >= config_.panSteps) {
            waitForSettle();
            return;
        }

        ++step_;
        const auto shift = static_cast<TimestampMs>(config_.panStepMinutes) * kMinuteMs;
        viewport_ = TimeRange{viewport_.start + shift, viewport_.end + shift};

        timer_.expires_after(std::chrono::milliseconds(config_.panIntervalMs));
        timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
            if (!ec) {
                self->step();
            }
        });
    }

    void waitForSettle() {
        if (cache_.getStatus(key_) != vpb::core::EntryStatus::Fetching || polls_ >= kMaxSettlePolls) {
            if (polls_ >= kMaxSettlePolls) {
                LOG_WARN("Tiempo de espera agotado con fetches pendientes para " << key_);
            }
            report();
            io_.stop();
            return;
        }
        ++polls_;
        timer_.expires_after(kSettlePoll);
        timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
            if (!ec) {
                self->waitForSettle();
            }
        });
    }

    void report() const {
        const auto loaded = cache_.getLoadedRange(key_);
        const auto series = cache_.getSeries(key_);
        const auto visibleBars = series ? std::count_if(series->begin(), series->end(), [this](const auto& candle) {
            return viewport_.contains(candle.openTime);
        })
                                        : 0;

        LOG_INFO("Resultado para " << key_);
        LOG_INFO("  Rango cargado: " << (loaded ? describe(*loaded) : std::string{"(vacío)"}));
        LOG_INFO("  Estado: " << vpb::core::toString(cache_.getStatus(key_)));
        LOG_INFO("  Velas en cache: " << (series ? series->size() : 0U) << ", visibles: " << visibleBars);

        const auto snapshot = vpb::common::metrics::Registry::instance().snapshot();
        for (const auto& [name, value] : snapshot.counters) {
            LOG_INFO("  " << name << '=' << value);
        }
        for (const auto& [name, gauge] : snapshot.gauges) {
            LOG_INFO("  " << name << '=' << gauge.value);
        }
        for (const auto& [name, latency] : snapshot.latencies) {
            LOG_INFO("  " << name << " samples=" << latency.samples << " p95="
                          << (latency.p95Ms ? std::to_string(*latency.p95Ms) : std::string{"-"}) << "ms p99="
                          << (latency.p99Ms ? std::to_string(*latency.p99Ms) : std::string{"-"}) << "ms");
        }
    }

    static std::string describe(const TimeRange& range) {
        std::ostringstream oss;
        oss << range << " (" << vpb::domain::resolutionLabel(range.span()) << ')';
        return oss.str();
    }

    boost::asio::io_context& io_;
    boost::asio::steady_timer timer_;
    vpb::app::ViewportCache& cache_;
    vpb::domain::CacheKey key_;
    TimeRange viewport_;
    const vpb::common::Config& config_;
    std::uint32_t step_{0};
    int polls_{0};
};

}  // namespace

int main(int argc, char** argv) {
    std::set_terminate([] {
        auto eptr = std::current_exception();
        if (eptr) {
            try {
                std::rethrow_exception(eptr);
            } catch (const std::exception& ex) {
                std::fprintf(stderr, "std::terminate: %s\n", ex.what());
            } catch (...) {
                std::fprintf(stderr, "std::terminate: unknown exception\n");
            }
        } else {
            std::fprintf(stderr, "std::terminate without current_exception\n");
        }
        std::_Exit(1);
    });

    try {
        const auto config = vpb::common::Config::fromArgs(argc, argv);
        vpb::log::setLevel(config.logLevel);

        const auto timeframe = vpb::domain::timeframeFromLabel(config.timeframe);
        if (!timeframe) {
            LOG_ERR("Timeframe no soportado: " << config.timeframe);
            return EXIT_FAILURE;
        }

        LOG_INFO("Configuración cargada");
        LOG_INFO("  Nivel de log: " << vpb::log::levelToString(config.logLevel));
        LOG_INFO("  Proveedor: " << config.provider);
        LOG_INFO("  Símbolo: " << config.symbol << " timeframe=" << timeframe->label);
        LOG_INFO("  Viewport: " << config.viewportMinutes << " min, " << config.panSteps << " pasos de "
                                << config.panStepMinutes << " min");
        LOG_INFO("  Buffer x" << config.planner.bufferMultiple << ", minBars=" << config.planner.minBars
                              << ", maxBars=" << config.planner.maxBars);

        boost::asio::io_context io;
        boost::asio::thread_pool pool(config.fetchThreads);

        std::unique_ptr<vpb::domain::ICandleProvider> source;
        if (config.provider == "binance") {
            vpb::adapters::binance::BinanceConfig binanceConfig;
            binanceConfig.timeoutSec = config.httpTimeoutSec;
            source = std::make_unique<vpb::adapters::binance::BinanceKlineProvider>(pool, binanceConfig);
        } else {
            vpb::adapters::synthetic::SyntheticConfig syntheticConfig;
            syntheticConfig.latency = std::chrono::milliseconds(config.syntheticLatencyMs);
            source = std::make_unique<vpb::adapters::synthetic::SyntheticCandleProvider>(io.get_executor(),
                                                                                         syntheticConfig);
        }
        vpb::adapters::providers::AggregatingProvider provider(*source);
        vpb::app::ViewportCache cache(io.get_executor(), provider, config.planner);

        const vpb::domain::CacheKey key{config.symbol, timeframe->label};
        const auto end = vpb::domain::align_down_ms(nowMs(), timeframe->barMs());
        const auto initial =
            TimeRange{end - static_cast<TimestampMs>(config.viewportMinutes) * kMinuteMs, end};

        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&io](const boost::system::error_code& ec, int signal) {
            if (!ec) {
                LOG_INFO("Señal " << signal << " recibida, deteniendo...");
                io.stop();
            }
        });

        auto simulation = std::make_shared<PanSimulation>(io, cache, key, initial, config);
        simulation->start();
        io.run();

        cache.clear();
        pool.join();
        LOG_INFO("Demo finalizada");
    } catch (const std::exception& ex) {
        LOG_ERR("Error fatal: " << ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
