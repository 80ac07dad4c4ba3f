#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace accessory::identity {

// Parse MAC address string (AA:BB:CC:DD:EE:FF) to bytes
std::optional<std::array<uint8_t, 6>> parse_mac_address(std::string_view address);

// Format bytes back to AA:BB:CC:DD:EE:FF
std::string format_mac_address(std::span<const uint8_t, 6> mac);

// Stable 32-bit identifier for an accessory: first four bytes (big-endian)
// of SHA-256 over the six address bytes. Same address, same id, across runs.
uint32_t unique_id_for(std::span<const uint8_t, 6> mac);

// Convenience for transport addresses; nullopt if the address does not parse
std::optional<uint32_t> unique_id_for(std::string_view address);

} // namespace accessory::identity
