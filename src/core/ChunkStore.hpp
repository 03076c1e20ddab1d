#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/ChunkMerge.hpp"
#include "domain/CacheKey.hpp"
#include "domain/Timeframe.hpp"
#include "domain/Types.h"
#include "domain/ports/CancellationToken.hpp"

namespace vpb::core {

using Clock = std::chrono::steady_clock;

enum class EntryStatus {
    Idle,
    Fetching,
    Live,
};

enum class PanDirection {
    None,
    Left,
    Right,
};

enum class FetchPriority {
    Primary,
    Prefetch,
};

const char* toString(EntryStatus status) noexcept;
const char* toString(PanDirection direction) noexcept;
const char* toString(FetchPriority priority) noexcept;

struct VelocitySample {
    PanDirection direction{PanDirection::None};
    // Chart milliseconds per wall-clock second.
    double speed{0.0};
    Clock::time_point at{};
};

struct ViewportSample {
    domain::TimeRange domain{};
    Clock::time_point at{};
};

struct RecentRequest {
    domain::TimeRange range{};
    Clock::time_point at{};
};

struct InFlightRequest {
    domain::CancellationToken token;
    FetchPriority priority{FetchPriority::Primary};
    domain::TimeRange range{};
};

struct Entry {
    domain::CacheKey key;
    domain::Timeframe timeframe;

    ChunkList chunks;
    std::optional<domain::TimeRange> loadedRange;
    EntryStatus status{EntryStatus::Idle};

    // Request id of the fetch holding the primary cancellation handle, empty when none.
    std::string primaryRequest;
    std::unordered_map<std::string, InFlightRequest> inFlight;

    std::deque<VelocitySample> velocity;
    std::optional<ViewportSample> lastViewport;
    std::deque<RecentRequest> recentRequests;

    std::uint64_t version{0};
    mutable domain::SeriesPtr flattened;
    mutable std::uint64_t flattenedVersion{0};
};

// Per cache-key state. Pure bookkeeping: no planning, no I/O.
class ChunkStore {
public:
    // Creates the entry on first access. Throws std::invalid_argument for an empty symbol
    // or an unknown timeframe label.
    Entry& getEntry(const domain::CacheKey& key);
    Entry* find(const domain::CacheKey& key);
    const Entry* find(const domain::CacheKey& key) const;

    domain::SeriesPtr getFlattenedSeries(const domain::CacheKey& key);
    std::optional<domain::TimeRange> loadedRange(const domain::CacheKey& key);
    EntryStatus status(const domain::CacheKey& key);

    // Inserts a chunk and refreshes the loaded range and the flattened view.
    void insertChunk(Entry& entry, Chunk chunk);

    bool erase(const domain::CacheKey& key);
    std::vector<domain::CacheKey> keys() const;
    std::vector<domain::CacheKey> keysForSymbol(const domain::Symbol& symbol) const;
    void clear();
    std::size_t size() const noexcept { return entries_.size(); }

    static domain::SeriesPtr flatten(const Entry& entry);

private:
    std::unordered_map<domain::CacheKey, Entry, domain::CacheKeyHash> entries_;
};

}  // namespace vpb::core
