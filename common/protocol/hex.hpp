#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace accessory::hex {

inline std::optional<uint8_t> nibble(char c) {
    if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
    return std::nullopt;
}

// Parse "0a1bff" (spaces, ':' and an optional 0x prefix are ignored)
inline std::optional<std::vector<uint8_t>> parse(std::string_view text) {
    if (text.starts_with("0x") || text.starts_with("0X")) {
        text.remove_prefix(2);
    }

    std::vector<uint8_t> result;
    std::optional<uint8_t> high;
    for (char c : text) {
        if (c == ' ' || c == ':') continue;
        auto n = nibble(c);
        if (!n) return std::nullopt;
        if (high) {
            result.push_back(static_cast<uint8_t>((*high << 4) | *n));
            high.reset();
        } else {
            high = n;
        }
    }
    if (high) return std::nullopt;  // odd digit count
    return result;
}

// Log form: "0x01, 0x02, "
inline std::string dump(std::span<const uint8_t> data) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 6);
    for (uint8_t b : data) {
        out += "0x";
        out += digits[b >> 4];
        out += digits[b & 0x0f];
        out += ", ";
    }
    return out;
}

} // namespace accessory::hex
