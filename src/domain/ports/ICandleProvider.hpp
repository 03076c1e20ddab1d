#pragma once

#include <functional>

#include "domain/DomainContracts.h"
#include "domain/Timeframe.hpp"
#include "domain/Types.h"
#include "domain/ports/CancellationToken.hpp"

namespace vpb::domain {

struct FetchRequest {
    Symbol symbol;
    Timeframe timeframe;
    TimeRange window;
};

using FetchResult = Result<Series>;

// Resolves a symbol, timeframe and window into candles. Implementations complete
// asynchronously, on any thread, exactly once per call. Timeouts are reported as
// failed results. A call whose token was cancelled may still complete; its caller
// discards the outcome.
class ICandleProvider {
public:
    using Callback = std::function<void(FetchResult)>;

    virtual ~ICandleProvider() = default;

    virtual void fetchWindow(const FetchRequest& request,
                             CancellationToken token,
                             Callback onComplete) = 0;
};

}  // namespace vpb::domain
