#pragma once

#include "domain/ports/ICandleProvider.hpp"

namespace vpb::adapters::providers {

// Serves grouped timeframes ("45m" = 15m x 3) from a provider that only knows native
// resolutions: asks for the base bars covering whole grouped bars and rolls them up into
// epoch-aligned buckets.
class AggregatingProvider : public domain::ICandleProvider {
public:
    explicit AggregatingProvider(domain::ICandleProvider& inner) noexcept;

    void fetchWindow(const domain::FetchRequest& request,
                     domain::CancellationToken token,
                     Callback onComplete) override;

private:
    domain::ICandleProvider& inner_;
};

}  // namespace vpb::adapters::providers
