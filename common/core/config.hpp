#pragma once

#include <cstdint>
#include <string>

namespace accessory {

// Accessory GATT layout
constexpr const char* SERVICE_UUID = "2e938fd0-6a61-11ed-a1eb-0242ac120002";
constexpr const char* PAIRING_CHARACTERISTIC_UUID = "2e93941c-6a61-11ed-a1eb-0242ac120002";
// The accessory's RX characteristic: the central writes here
constexpr const char* OUTBOUND_CHARACTERISTIC_UUID = "2e93998a-6a61-11ed-a1eb-0242ac120002";
// The accessory's TX characteristic: the central subscribes here
constexpr const char* INBOUND_CHARACTERISTIC_UUID = "2e939af2-6a61-11ed-a1eb-0242ac120002";

struct Config {
    int64_t sweep_period_ms = 200;
    int64_t stale_after_ms = 5000;
    // Disconnects after which scanning is no longer resumed automatically
    uint32_t connection_iteration_limit = 5;
    std::string known_devices_path;
};

// $XDG_CONFIG_HOME/accessory/known_devices, or ~/.config/accessory/known_devices
std::string default_known_devices_path();

} // namespace accessory
