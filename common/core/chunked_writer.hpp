#pragma once

#include "transport.hpp"
#include <types/enums.hpp>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace accessory {

// Number of writes needed for a payload of `length` bytes
constexpr size_t chunk_count(size_t length, size_t max_chunk) {
    return max_chunk == 0 ? 0 : (length + max_chunk - 1) / max_chunk;
}

// Splits outbound payloads to the negotiated write size and issues one
// transport write per chunk, in order, without waiting in between.
class ChunkedWriter {
public:
    explicit ChunkedWriter(Transport& transport) : transport_(transport) {}

    // TransportError if the write size is unknown or a write could not be
    // issued; chunks after a failed one are not sent. No retries.
    Error write(const std::string& device, const std::string& channel,
                std::span<const uint8_t> payload);

    // Chunks dispatched since the last reset
    uint32_t iterations() const { return iterations_; }
    void reset() { iterations_ = 0; }

private:
    Transport& transport_;
    uint32_t iterations_ = 0;
};

} // namespace accessory
