#pragma once

#include "enums.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace accessory {

// A characteristic found during discovery, tagged with the role it plays
struct DiscoveredChannel {
    ChannelRole role;
    std::string handle;
};

// One asynchronous transport callback, as a message.
// Fields not used by a kind are left empty.
struct TransportEvent {
    enum class Kind {
        AdapterReady,
        DeviceFound,
        ConnectFailed,
        Connected,
        Disconnected,
        ServicesFound,
        ServicesInvalidated,
        CharacteristicsFound,
        ValueUpdated,
        NotifyStateChanged,
        WriteResult,
    };

    Kind kind = Kind::AdapterReady;
    std::string handle;                // device handle
    std::string address;               // DeviceFound
    std::string name;                  // DeviceFound: advertised local name
    int64_t timestamp_ms = 0;          // DeviceFound
    std::string service;               // CharacteristicsFound
    std::vector<DiscoveredChannel> channels;  // CharacteristicsFound
    ChannelRole role = ChannelRole::Inbound;  // ValueUpdated, NotifyStateChanged, WriteResult
    std::vector<uint8_t> bytes;        // ValueUpdated
    bool active = false;               // NotifyStateChanged
    std::optional<std::string> error;  // transport failure, if any

    static TransportEvent adapter_ready() { return {}; }

    static TransportEvent device_found(std::string handle, std::string address,
                                       std::string name, int64_t timestamp_ms) {
        TransportEvent e;
        e.kind = Kind::DeviceFound;
        e.handle = std::move(handle);
        e.address = std::move(address);
        e.name = std::move(name);
        e.timestamp_ms = timestamp_ms;
        return e;
    }

    static TransportEvent for_device(Kind kind, std::string handle,
                                     std::optional<std::string> error = std::nullopt) {
        TransportEvent e;
        e.kind = kind;
        e.handle = std::move(handle);
        e.error = std::move(error);
        return e;
    }

    static TransportEvent characteristics_found(std::string handle, std::string service,
                                                std::vector<DiscoveredChannel> channels,
                                                std::optional<std::string> error = std::nullopt) {
        TransportEvent e;
        e.kind = Kind::CharacteristicsFound;
        e.handle = std::move(handle);
        e.service = std::move(service);
        e.channels = std::move(channels);
        e.error = std::move(error);
        return e;
    }

    static TransportEvent value_updated(std::string handle, ChannelRole role,
                                        std::vector<uint8_t> bytes,
                                        std::optional<std::string> error = std::nullopt) {
        TransportEvent e;
        e.kind = Kind::ValueUpdated;
        e.handle = std::move(handle);
        e.role = role;
        e.bytes = std::move(bytes);
        e.error = std::move(error);
        return e;
    }

    static TransportEvent notify_state_changed(std::string handle, ChannelRole role, bool active,
                                               std::optional<std::string> error = std::nullopt) {
        TransportEvent e;
        e.kind = Kind::NotifyStateChanged;
        e.handle = std::move(handle);
        e.role = role;
        e.active = active;
        e.error = std::move(error);
        return e;
    }

    static TransportEvent write_result(std::string handle, ChannelRole role,
                                       std::optional<std::string> error = std::nullopt) {
        TransportEvent e;
        e.kind = Kind::WriteResult;
        e.handle = std::move(handle);
        e.role = role;
        e.error = std::move(error);
        return e;
    }
};

inline std::string_view to_string(TransportEvent::Kind kind) {
    using Kind = TransportEvent::Kind;
    switch (kind) {
        case Kind::AdapterReady: return "adapter_ready";
        case Kind::DeviceFound: return "device_found";
        case Kind::ConnectFailed: return "connect_failed";
        case Kind::Connected: return "connected";
        case Kind::Disconnected: return "disconnected";
        case Kind::ServicesFound: return "services_found";
        case Kind::ServicesInvalidated: return "services_invalidated";
        case Kind::CharacteristicsFound: return "characteristics_found";
        case Kind::ValueUpdated: return "value_updated";
        case Kind::NotifyStateChanged: return "notify_state_changed";
        case Kind::WriteResult: return "write_result";
    }
    return "unknown";
}

} // namespace accessory
