#pragma once

#include <types/enums.hpp>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace accessory {

// Asynchronous wireless transport capability.
//
// Every operation only issues a request; its completion arrives later as a
// TransportEvent and is never delivered from inside the call. A false return
// means the request could not be issued at all.
class Transport {
public:
    virtual ~Transport() = default;

    virtual bool start_scan() = 0;
    virtual void stop_scan() = 0;

    virtual bool connect(const std::string& device) = 0;
    virtual bool disconnect(const std::string& device) = 0;

    virtual bool discover_services(const std::string& device) = 0;
    virtual bool discover_characteristics(const std::string& device) = 0;

    virtual bool read(const std::string& device, ChannelRole role,
                      const std::string& channel) = 0;
    virtual bool write(const std::string& device, ChannelRole role,
                       const std::string& channel, std::span<const uint8_t> data) = 0;
    virtual bool set_notify(const std::string& device, ChannelRole role,
                            const std::string& channel, bool enable) = 0;

    // Negotiated maximum length of one write on the channel, 0 if unknown
    virtual size_t max_write_size(const std::string& device, const std::string& channel) = 0;
};

} // namespace accessory
