#include "adapters/providers/AggregatingProvider.hpp"

#include <utility>

#include "core/CandleSeries.hpp"

namespace vpb::adapters::providers {

AggregatingProvider::AggregatingProvider(domain::ICandleProvider& inner) noexcept : inner_{inner} {}

void AggregatingProvider::fetchWindow(const domain::FetchRequest& request,
                                      domain::CancellationToken token,
                                      Callback onComplete) {
    if (request.timeframe.group <= 1) {
        inner_.fetchWindow(request, std::move(token), std::move(onComplete));
        return;
    }

    const auto barMs = request.timeframe.barMs();
    const auto window = domain::TimeRange::ordered(request.window.start, request.window.end);

    // Widen to whole grouped bars so every bucket that opens inside the window is complete.
    auto baseRequest = request;
    baseRequest.timeframe = request.timeframe.base();
    baseRequest.window = domain::TimeRange{domain::align_down_ms(window.start, barMs),
                                           domain::align_up_ms(window.end + 1, barMs) - 1};

    inner_.fetchWindow(baseRequest, std::move(token),
                       [barMs, window, onComplete = std::move(onComplete)](domain::FetchResult result) {
                           if (result.ok) {
                               const auto bars =
                                   core::aggregateAligned(core::normalizeSeries(std::move(result.value)), barMs);
                               result.value = core::clipSeries(bars, window);
                           }
                           onComplete(std::move(result));
                       });
}

}  // namespace vpb::adapters::providers
