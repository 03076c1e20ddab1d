#pragma once

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>

#include "domain/Types.h"

namespace vpb::domain {

struct CacheKey {
    Symbol symbol;
    std::string timeframe;

    std::string toString() const { return symbol + ':' + timeframe; }
};

inline bool operator==(const CacheKey& lhs, const CacheKey& rhs) noexcept {
    return lhs.symbol == rhs.symbol && lhs.timeframe == rhs.timeframe;
}

inline bool operator!=(const CacheKey& lhs, const CacheKey& rhs) noexcept {
    return !(lhs == rhs);
}

inline std::ostream& operator<<(std::ostream& out, const CacheKey& key) {
    return out << key.symbol << ':' << key.timeframe;
}

struct CacheKeyHash {
    std::size_t operator()(const CacheKey& key) const noexcept {
        const auto h1 = std::hash<std::string>{}(key.symbol);
        const auto h2 = std::hash<std::string>{}(key.timeframe);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

}  // namespace vpb::domain
