#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace accessory {

using Clock = std::function<int64_t()>;

inline int64_t monotonic_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

} // namespace accessory
