#include <iostream>

#include "TestHelpers.hpp"
#include "core/ChunkMerge.hpp"

using vpb::core::Chunk;
using vpb::core::ChunkList;
using vpb::domain::TimeRange;
using vpb::testing::makeSeries;

namespace {

constexpr long long kMinute = 60'000;

Chunk chunkOf(long long startMinute, long long endMinute, double firstClose = 100.0) {
    Chunk chunk;
    chunk.range = TimeRange{startMinute * kMinute, endMinute * kMinute};
    chunk.data = makeSeries(chunk.range.start, static_cast<std::size_t>(endMinute - startMinute + 1), kMinute,
                            firstClose);
    return chunk;
}

}  // namespace

int main() {
    // Disjoint chunks stay separate and sorted regardless of arrival order.
    {
        ChunkList chunks;
        chunks = vpb::core::mergeChunk(chunks, chunkOf(20, 29));
        chunks = vpb::core::mergeChunk(chunks, chunkOf(0, 9));
        chunks = vpb::core::mergeChunk(chunks, chunkOf(40, 49));
        if (chunks.size() != 3 || !vpb::core::chunksWellFormed(chunks)) {
            std::cerr << "Expected three well-formed disjoint chunks, got " << chunks.size() << "\n";
            return 1;
        }
        if (chunks.front().range.start != 0 || chunks.back().range.start != 40 * kMinute) {
            std::cerr << "Expected chunks ordered by start\n";
            return 1;
        }
    }

    // A chunk bridging two neighbours absorbs both.
    {
        ChunkList chunks{chunkOf(0, 9), chunkOf(20, 29)};
        chunks = vpb::core::mergeChunk(chunks, chunkOf(8, 22));
        if (chunks.size() != 1) {
            std::cerr << "Expected the bridge to collapse everything into one chunk, got " << chunks.size() << "\n";
            return 1;
        }
        if (chunks.front().range != TimeRange{0, 29 * kMinute} || chunks.front().data.size() != 30) {
            std::cerr << "Expected [0, 29] with 30 candles\n";
            return 1;
        }
    }

    // Adjacent intervals (1 ms apart) merge.
    {
        Chunk left;
        left.range = TimeRange{0, 999};
        Chunk right;
        right.range = TimeRange{1000, 1999};
        const auto chunks = vpb::core::mergeChunk({left}, right);
        if (chunks.size() != 1 || chunks.front().range != TimeRange{0, 1999}) {
            std::cerr << "Expected touching chunks to merge\n";
            return 1;
        }
    }

    // Incoming data replaces cached candles at the same timestamp.
    {
        const ChunkList chunks{chunkOf(0, 9, 100.0)};
        const auto merged = vpb::core::mergeChunk(chunks, chunkOf(5, 14, 500.0));
        if (merged.size() != 1 || merged.front().data.size() != 15) {
            std::cerr << "Expected one chunk with 15 candles\n";
            return 1;
        }
        if (merged.front().data[5].close != 500.0) {
            std::cerr << "Expected fresh candle to win at minute 5, got " << merged.front().data[5].close << "\n";
            return 1;
        }
    }

    // Merging the same chunk twice changes nothing.
    {
        const ChunkList base{chunkOf(0, 9), chunkOf(30, 39), chunkOf(60, 69)};
        const Chunk samples[] = {chunkOf(5, 34, 250.0), chunkOf(100, 110), chunkOf(-20, -1), chunkOf(10, 29)};
        for (const auto& x : samples) {
            const auto once = vpb::core::mergeChunk(base, x);
            const auto twice = vpb::core::mergeChunk(once, x);
            if (once != twice) {
                std::cerr << "Expected merge to be idempotent for " << x.range << "\n";
                return 1;
            }
            if (!vpb::core::chunksWellFormed(once)) {
                std::cerr << "Expected well-formed chunks after merging " << x.range << "\n";
                return 1;
            }
        }
    }

    // Chunks keep their requested interval even when the data has holes.
    {
        Chunk gappy;
        gappy.range = TimeRange{0, 59 * kMinute};
        gappy.data = makeSeries(10 * kMinute, 5, kMinute);
        const auto merged = vpb::core::mergeChunk({}, gappy);
        const auto covered = vpb::core::coveredRange(merged);
        if (!covered || *covered != gappy.range) {
            std::cerr << "Expected covered range to match the requested interval\n";
            return 1;
        }
        if (vpb::core::coveredRange({})) {
            std::cerr << "Expected no covered range for an empty list\n";
            return 1;
        }
    }

    std::cout << "chunk merge tests passed\n";
    return 0;
}
