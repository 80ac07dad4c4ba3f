#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace accessory {

enum class DeviceStatus : uint8_t {
    Discovered,
    Connected,
    Ranging,
};

inline std::string_view to_string(DeviceStatus status) {
    switch (status) {
        case DeviceStatus::Discovered: return "discovered";
        case DeviceStatus::Connected: return "connected";
        case DeviceStatus::Ranging: return "ranging";
    }
    return "unknown";
}

inline std::optional<DeviceStatus> device_status_from_string(std::string_view s) {
    if (s == "discovered") return DeviceStatus::Discovered;
    if (s == "connected") return DeviceStatus::Connected;
    if (s == "ranging") return DeviceStatus::Ranging;
    return std::nullopt;
}

// Logical sub-channels multiplexed over one accessory link
enum class ChannelRole : uint8_t {
    Pairing,   // secure characteristic, read once to fetch pairing data
    Inbound,   // accessory -> central notifications
    Outbound,  // central -> accessory writes
};

constexpr ChannelRole all_channel_roles[] = {
    ChannelRole::Pairing,
    ChannelRole::Inbound,
    ChannelRole::Outbound,
};

inline std::string_view to_string(ChannelRole role) {
    switch (role) {
        case ChannelRole::Pairing: return "pairing";
        case ChannelRole::Inbound: return "inbound";
        case ChannelRole::Outbound: return "outbound";
    }
    return "unknown";
}

enum class Error : uint8_t {
    None = 0,
    UnknownDevice,
    DuplicateDevice,
    IndexOutOfRange,
    TransportError,
    RetryBudgetExhausted,
};

inline std::string_view to_string(Error error) {
    switch (error) {
        case Error::None: return "none";
        case Error::UnknownDevice: return "unknown device";
        case Error::DuplicateDevice: return "duplicate device";
        case Error::IndexOutOfRange: return "index out of range";
        case Error::TransportError: return "transport error";
        case Error::RetryBudgetExhausted: return "retry budget exhausted";
    }
    return "unknown";
}

// D-Bus error name suffix (org.accessory.Error.<name>)
inline std::string_view error_name(Error error) {
    switch (error) {
        case Error::None: return "None";
        case Error::UnknownDevice: return "UnknownDevice";
        case Error::DuplicateDevice: return "DuplicateDevice";
        case Error::IndexOutOfRange: return "IndexOutOfRange";
        case Error::TransportError: return "TransportError";
        case Error::RetryBudgetExhausted: return "RetryBudgetExhausted";
    }
    return "Failed";
}

// Value or error, for operations that produce something on success
template<typename T>
struct Result {
    std::optional<T> value;
    Error error = Error::None;

    static Result ok(T v) { return Result{std::move(v), Error::None}; }
    static Result fail(Error e) { return Result{std::nullopt, e}; }

    bool has_value() const { return value.has_value(); }
    explicit operator bool() const { return has_value(); }
    const T& operator*() const { return *value; }
};

} // namespace accessory
