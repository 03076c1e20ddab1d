#pragma once

#include <string>
#include <utility>

#include "domain/Types.h"

namespace vpb::domain {

template <typename T>
struct Result {
    T value{};
    bool ok{true};
    std::string error{};

    bool failed() const { return !ok; }

    static Result success(T value) {
        Result result;
        result.value = std::move(value);
        return result;
    }

    static Result failure(std::string message) {
        Result result;
        result.ok = false;
        result.error = std::move(message);
        return result;
    }
};

}  // namespace vpb::domain
