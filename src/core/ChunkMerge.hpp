#pragma once

#include <optional>
#include <vector>

#include "domain/Types.h"

namespace vpb::core {

// A contiguous closed interval of cached candles. `data` is ascending and unique but
// may have holes (market closures); the interval records what was asked for.
struct Chunk {
    domain::TimeRange range{};
    domain::Series data;
};

inline bool operator==(const Chunk& lhs, const Chunk& rhs) {
    return lhs.range == rhs.range && lhs.data == rhs.data;
}

using ChunkList = std::vector<Chunk>;

// Folds `incoming` into `chunks` (sorted, non-overlapping). Every chunk that overlaps or
// touches the growing incoming interval is absorbed into it; candles from `incoming`
// win on equal timestamps. The result is sorted and non-overlapping and depends only on
// the arguments.
ChunkList mergeChunk(const ChunkList& chunks, Chunk incoming);

// Envelope of all chunk intervals, or nullopt for an empty list.
std::optional<domain::TimeRange> coveredRange(const ChunkList& chunks);

bool chunksWellFormed(const ChunkList& chunks) noexcept;

}  // namespace vpb::core
