#include "chunked_writer.hpp"
#include <algorithm>
#include <iostream>

namespace accessory {

Error ChunkedWriter::write(const std::string& device, const std::string& channel,
                           std::span<const uint8_t> payload) {
    size_t mtu = transport_.max_write_size(device, channel);
    if (mtu == 0) {
        std::cerr << "writer: no write size negotiated for " << channel << std::endl;
        return Error::TransportError;
    }

    size_t total = chunk_count(payload.size(), mtu);
    size_t offset = 0;

    for (size_t i = 0; i < total; ++i) {
        size_t len = std::min(mtu, payload.size() - offset);
        auto chunk = payload.subspan(offset, len);

        if (!transport_.write(device, ChannelRole::Outbound, channel, chunk)) {
            std::cerr << "writer: chunk " << (i + 1) << "/" << total
                      << " could not be written" << std::endl;
            return Error::TransportError;
        }

        std::cout << "writer: wrote " << len << " bytes (" << (i + 1) << "/" << total << ")"
                  << std::endl;
        offset += len;
        ++iterations_;
    }

    return Error::None;
}

} // namespace accessory
