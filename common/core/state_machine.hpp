#pragma once

#include <types/enums.hpp>

namespace accessory {

// Discovered -> Connected -> Ranging; back to Discovered only on disconnect
constexpr bool is_legal_transition(DeviceStatus from, DeviceStatus to) {
    switch (from) {
        case DeviceStatus::Discovered:
            return to == DeviceStatus::Connected;
        case DeviceStatus::Connected:
            return to == DeviceStatus::Ranging || to == DeviceStatus::Discovered;
        case DeviceStatus::Ranging:
            return to == DeviceStatus::Discovered;
    }
    return false;
}

} // namespace accessory
