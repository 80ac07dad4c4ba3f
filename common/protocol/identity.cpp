#include "identity.hpp"
#include <openssl/sha.h>
#include <charconv>
#include <cstdio>

namespace accessory::identity {

std::optional<std::array<uint8_t, 6>> parse_mac_address(std::string_view address) {
    std::array<uint8_t, 6> result{};

    // Expect format: AA:BB:CC:DD:EE:FF
    if (address.size() != 17) {
        return std::nullopt;
    }

    size_t byte_idx = 0;
    for (size_t i = 0; i < address.size() && byte_idx < 6; i += 3) {
        if (i + 2 < address.size() && address[i + 2] != ':') {
            return std::nullopt;
        }
        auto part = address.substr(i, 2);
        uint8_t value;
        auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), value, 16);
        if (ec != std::errc{} || ptr != part.data() + part.size()) {
            return std::nullopt;
        }
        result[byte_idx++] = value;
    }

    return result;
}

std::string format_mac_address(std::span<const uint8_t, 6> mac) {
    char buf[18];
    std::snprintf(buf, sizeof(buf), "%02X:%02X:%02X:%02X:%02X:%02X",
                  mac[0], mac[1], mac[2], mac[3], mac[4], mac[5]);
    return buf;
}

uint32_t unique_id_for(std::span<const uint8_t, 6> mac) {
    std::array<uint8_t, SHA256_DIGEST_LENGTH> digest{};
    SHA256(mac.data(), mac.size(), digest.data());

    return (static_cast<uint32_t>(digest[0]) << 24) |
           (static_cast<uint32_t>(digest[1]) << 16) |
           (static_cast<uint32_t>(digest[2]) << 8) |
           static_cast<uint32_t>(digest[3]);
}

std::optional<uint32_t> unique_id_for(std::string_view address) {
    auto mac = parse_mac_address(address);
    if (!mac) {
        return std::nullopt;
    }
    return unique_id_for(std::span<const uint8_t, 6>(*mac));
}

} // namespace accessory::identity
