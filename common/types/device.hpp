#pragma once

#include "enums.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace accessory {

// Transport identity of one accessory (BlueZ: the device object path).
// Move-only: exactly one DeviceRecord owns it.
class Peripheral {
public:
    Peripheral() = default;
    Peripheral(std::string handle, std::string address)
        : handle_(std::move(handle)), address_(std::move(address)) {}

    Peripheral(Peripheral&& other) noexcept
        : handle_(std::move(other.handle_)), address_(std::move(other.address_)) {
        other.handle_.clear();
        other.address_.clear();
    }

    Peripheral& operator=(Peripheral&& other) noexcept {
        if (this != &other) {
            handle_ = std::move(other.handle_);
            address_ = std::move(other.address_);
            other.handle_.clear();
            other.address_.clear();
        }
        return *this;
    }

    Peripheral(const Peripheral&) = delete;
    Peripheral& operator=(const Peripheral&) = delete;

    bool is_valid() const { return !handle_.empty(); }
    const std::string& handle() const { return handle_; }
    const std::string& address() const { return address_; }

private:
    std::string handle_;
    std::string address_;
};

// One channel slot: Unresolved, or Resolved to a characteristic handle owned
// by the transport. Resolution is only legal from Unresolved.
class ChannelSlot {
public:
    bool resolved() const { return handle_.has_value(); }

    bool resolve(std::string handle) {
        if (handle_) return false;
        handle_ = std::move(handle);
        return true;
    }

    void clear() { handle_.reset(); }

    // Empty string when unresolved; never dereference a cleared slot
    const std::string& handle() const {
        static const std::string empty;
        return handle_ ? *handle_ : empty;
    }

private:
    std::optional<std::string> handle_;
};

struct DeviceRecord {
    uint32_t unique_id = 0;
    std::string display_name;
    DeviceStatus status = DeviceStatus::Discovered;
    int64_t last_seen_ms = 0;
    Peripheral peripheral;

    ChannelSlot pairing_channel;
    ChannelSlot inbound_channel;
    ChannelSlot outbound_channel;

    // Inbound subscription is active on the transport
    bool notifying = false;
    // on_connected already surfaced for the current link
    bool connected_notified = false;
    // A pairing read is outstanding; its payload surfaces once
    bool pairing_read_pending = false;

    std::optional<float> reported_distance;

    ChannelSlot& channel(ChannelRole role) { return channel_of(*this, role); }
    const ChannelSlot& channel(ChannelRole role) const { return channel_of(*this, role); }

    bool any_channel_resolved() const {
        return pairing_channel.resolved() || inbound_channel.resolved() ||
               outbound_channel.resolved();
    }

    void clear_channels() {
        pairing_channel.clear();
        inbound_channel.clear();
        outbound_channel.clear();
    }

private:
    template<typename Record>
    static auto channel_of(Record& record, ChannelRole role) -> decltype((record.pairing_channel)) {
        switch (role) {
            case ChannelRole::Pairing: return record.pairing_channel;
            case ChannelRole::Inbound: return record.inbound_channel;
            case ChannelRole::Outbound: break;
        }
        return record.outbound_channel;
    }
};

// Copy of a record, safe to hold across registry mutation
struct DeviceSnapshot {
    uint32_t unique_id = 0;
    std::string display_name;
    DeviceStatus status = DeviceStatus::Discovered;
    int64_t last_seen_ms = 0;
    std::string address;
    std::optional<float> reported_distance;
};

inline DeviceSnapshot snapshot_of(const DeviceRecord& record) {
    DeviceSnapshot snap;
    snap.unique_id = record.unique_id;
    snap.display_name = record.display_name;
    snap.status = record.status;
    snap.last_seen_ms = record.last_seen_ms;
    snap.address = record.peripheral.address();
    snap.reported_distance = record.reported_distance;
    return snap;
}

} // namespace accessory
