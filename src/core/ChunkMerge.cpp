#include "core/ChunkMerge.hpp"

#include <utility>

#include "core/CandleSeries.hpp"

namespace vpb::core {

ChunkList mergeChunk(const ChunkList& chunks, Chunk incoming) {
    ChunkList before;
    ChunkList after;
    before.reserve(chunks.size() + 1);

    for (const auto& chunk : chunks) {
        if (chunk.range.end + 1 < incoming.range.start) {
            before.push_back(chunk);
            continue;
        }
        if (chunk.range.start > incoming.range.end + 1) {
            after.push_back(chunk);
            continue;
        }
        incoming.range = domain::envelope(incoming.range, chunk.range);
        incoming.data = mergeSeries(incoming.data, chunk.data);
    }

    before.push_back(std::move(incoming));
    for (auto& chunk : after) {
        before.push_back(std::move(chunk));
    }
    return before;
}

std::optional<domain::TimeRange> coveredRange(const ChunkList& chunks) {
    if (chunks.empty()) {
        return std::nullopt;
    }
    auto range = chunks.front().range;
    for (const auto& chunk : chunks) {
        range = domain::envelope(range, chunk.range);
    }
    return range;
}

bool chunksWellFormed(const ChunkList& chunks) noexcept {
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        if (chunks[i].range.start > chunks[i].range.end || !isStrictlyAscending(chunks[i].data)) {
            return false;
        }
        if (i > 0 && chunks[i - 1].range.end + 1 >= chunks[i].range.start) {
            return false;
        }
    }
    return true;
}

}  // namespace vpb::core
