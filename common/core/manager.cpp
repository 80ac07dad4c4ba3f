#include "manager.hpp"
#include "state_machine.hpp"
#include <protocol/hex.hpp>
#include <protocol/identity.hpp>
#include <algorithm>
#include <iostream>

namespace accessory {

Manager::Manager(Transport& transport, KnownDeviceStore& known, Config config, Clock clock)
    : transport_(transport),
      known_(known),
      config_(std::move(config)),
      clock_(std::move(clock)),
      writer_(transport) {
    registry_.set_on_changed([this](size_t position, uint32_t id, bool inserted) {
        if (callbacks_.on_registry_changed) {
            callbacks_.on_registry_changed(position, id, inserted);
        }
    });
}

// ============================================================================
// Operator commands
// ============================================================================

void Manager::start() {
    connection_iterations_ = 0;

    if (!adapter_ready_) {
        std::cout << "manager: adapter not ready, start deferred" << std::endl;
        start_pending_ = true;
        return;
    }

    start_pending_ = false;
    if (transport_.start_scan()) {
        scanning_ = true;
        std::cout << "manager: scanning started" << std::endl;
    } else {
        std::cerr << "manager: failed to start scanning" << std::endl;
    }
}

void Manager::stop() {
    start_pending_ = false;
    if (scanning_) {
        transport_.stop_scan();
        scanning_ = false;
        std::cout << "manager: scanning stopped" << std::endl;
    }
}

Error Manager::pair(uint32_t id) {
    DeviceRecord* record = registry_.lookup(id);
    if (!record) return Error::UnknownDevice;

    if (record->status != DeviceStatus::Connected) {
        return Error::None;
    }
    if (!record->pairing_channel.resolved()) {
        std::cerr << "manager: pairing channel of " << id << " not discovered yet" << std::endl;
        return Error::UnknownDevice;
    }

    std::cout << "manager: pairing with " << record->display_name << " (" << id << ")" << std::endl;
    if (!transport_.read(record->peripheral.handle(), ChannelRole::Pairing,
                         record->pairing_channel.handle())) {
        return Error::TransportError;
    }
    record->pairing_read_pending = true;
    return Error::None;
}

Error Manager::connect(uint32_t id) {
    DeviceRecord* record = registry_.lookup(id);
    if (!record) return Error::UnknownDevice;

    if (record->status != DeviceStatus::Discovered) {
        return Error::None;
    }

    std::cout << "manager: connecting to " << record->display_name << " (" << id << ")" << std::endl;

    // Optimistic: the record shows Connected before the link is up.
    // Subscribers get on_connected only once the inbound channel notifies.
    transition(*record, DeviceStatus::Connected);

    if (!transport_.connect(record->peripheral.handle())) {
        std::cerr << "manager: connect request for " << id << " failed" << std::endl;
        transition(*record, DeviceStatus::Discovered);
        record->last_seen_ms = std::max(record->last_seen_ms, clock_());
        return Error::TransportError;
    }
    return Error::None;
}

Error Manager::disconnect(uint32_t id) {
    DeviceRecord* record = registry_.lookup(id);
    if (!record) return Error::UnknownDevice;

    if (record->status == DeviceStatus::Discovered) {
        return Error::None;
    }

    std::cout << "manager: disconnecting from " << record->display_name << " (" << id << ")"
              << std::endl;
    if (!transport_.disconnect(record->peripheral.handle())) {
        return Error::TransportError;
    }
    return Error::None;
}

Error Manager::send(std::span<const uint8_t> bytes, uint32_t id) {
    DeviceRecord* record = registry_.lookup(id);
    if (!record || !record->outbound_channel.resolved()) {
        return Error::UnknownDevice;
    }

    std::cout << "manager: sending " << bytes.size() << " bytes to " << id << std::endl;
    return writer_.write(record->peripheral.handle(), record->outbound_channel.handle(), bytes);
}

Error Manager::rename(uint32_t id, const std::string& name) {
    DeviceRecord* record = registry_.lookup(id);
    if (!record) return Error::UnknownDevice;

    record->display_name = name;
    if (known_.exists(id)) {
        known_.set(id, name);
    }
    return Error::None;
}

Error Manager::mark_ranging(uint32_t id) {
    DeviceRecord* record = registry_.lookup(id);
    if (!record) return Error::UnknownDevice;

    if (record->status != DeviceStatus::Connected) {
        return Error::None;
    }
    transition(*record, DeviceStatus::Ranging);
    return Error::None;
}

Error Manager::report_distance(uint32_t id, float metres) {
    DeviceRecord* record = registry_.lookup(id);
    if (!record) return Error::UnknownDevice;

    record->reported_distance = metres;
    return Error::None;
}

void Manager::remember(uint32_t id, const std::string& name) {
    known_.set(id, name);
}

std::optional<std::string> Manager::recall(uint32_t id) const {
    return known_.get(id);
}

bool Manager::is_known(uint32_t id) const {
    return known_.exists(id);
}

void Manager::forget_all() {
    known_.clear();
    std::cout << "manager: known devices cleared" << std::endl;
}

// ============================================================================
// Transport events
// ============================================================================

void Manager::handle(const TransportEvent& event) {
    using Kind = TransportEvent::Kind;

    switch (event.kind) {
        case Kind::AdapterReady: on_adapter_ready(); break;
        case Kind::DeviceFound: on_device_found(event); break;
        case Kind::ConnectFailed: on_connect_failed(event); break;
        case Kind::Connected: on_connected(event); break;
        case Kind::Disconnected: on_disconnected(event); break;
        case Kind::ServicesFound: on_services_found(event); break;
        case Kind::ServicesInvalidated: on_services_invalidated(event); break;
        case Kind::CharacteristicsFound: on_characteristics_found(event); break;
        case Kind::ValueUpdated: on_value_updated(event); break;
        case Kind::NotifyStateChanged: on_notify_state_changed(event); break;
        case Kind::WriteResult: on_write_result(event); break;
    }
}

DeviceRecord* Manager::record_for(const TransportEvent& event) {
    DeviceRecord* record = registry_.lookup_by_handle(event.handle);
    if (!record) {
        std::cerr << "manager: " << to_string(event.kind) << " for unknown device "
                  << event.handle << std::endl;
    }
    return record;
}

void Manager::on_adapter_ready() {
    std::cout << "manager: adapter ready" << std::endl;
    adapter_ready_ = true;
    if (start_pending_) {
        start_pending_ = false;
        start();
    }
}

void Manager::on_device_found(const TransportEvent& event) {
    // Only accessories that advertise a local name are tracked
    if (event.name.empty()) return;

    if (DeviceRecord* record = registry_.lookup_by_handle(event.handle)) {
        record->last_seen_ms = std::max(record->last_seen_ms, event.timestamp_ms);
        return;
    }

    auto id = identity::unique_id_for(event.address);
    if (!id) {
        std::cerr << "manager: unusable address " << event.address << " for " << event.name
                  << std::endl;
        return;
    }

    DeviceRecord record;
    record.unique_id = *id;
    record.display_name = known_.get(*id).value_or(event.name);
    record.last_seen_ms = event.timestamp_ms;
    record.peripheral = Peripheral(event.handle, event.address);

    std::string name = record.display_name;
    auto inserted = registry_.insert(std::move(record));
    if (!inserted) {
        std::cerr << "manager: cannot track " << event.address << ": "
                  << to_string(inserted.error) << " (id " << *id << ")" << std::endl;
        return;
    }

    std::cout << "manager: found " << name << " (" << *id << ") at position " << *inserted
              << std::endl;
}

void Manager::on_connect_failed(const TransportEvent& event) {
    DeviceRecord* record = record_for(event);
    if (!record) return;

    std::cerr << "manager: " << to_string(Error::TransportError) << ": failed to connect to "
              << record->unique_id << ": " << event.error.value_or("unknown") << std::endl;

    cleanup(*record);
    if (record->status != DeviceStatus::Discovered) {
        transition(*record, DeviceStatus::Discovered);
    }
    record->last_seen_ms = std::max(record->last_seen_ms, clock_());
}

void Manager::on_connected(const TransportEvent& event) {
    DeviceRecord* record = record_for(event);
    if (!record) return;

    std::cout << "manager: link up with " << record->unique_id << std::endl;

    // Link brought up from outside (e.g. the adapter reconnected on its own)
    if (record->status == DeviceStatus::Discovered) {
        transition(*record, DeviceStatus::Connected);
    }

    writer_.reset();

    if (!transport_.discover_services(record->peripheral.handle())) {
        std::cerr << "manager: service discovery request for " << record->unique_id
                  << " failed" << std::endl;
        cleanup(*record);
    }
}

void Manager::on_disconnected(const TransportEvent& event) {
    DeviceRecord* record = record_for(event);
    if (!record) return;

    uint32_t id = record->unique_id;
    std::cout << "manager: link down with " << id;
    if (event.error) std::cout << " (" << *event.error << ")";
    std::cout << std::endl;

    // Refresh so the sweeper does not evict the accessory right away
    record->last_seen_ms = std::max(record->last_seen_ms, clock_());
    cleanup(*record);
    if (record->status != DeviceStatus::Discovered) {
        transition(*record, DeviceStatus::Discovered);
    }

    ++connection_iterations_;

    if (callbacks_.on_disconnected) {
        callbacks_.on_disconnected(id);
    }

    if (connection_iterations_ < config_.connection_iteration_limit) {
        resume_scan();
    } else {
        std::cout << "manager: " << to_string(Error::RetryBudgetExhausted) << " after "
                  << connection_iterations_ << " connection iterations, not resuming scan"
                  << std::endl;
    }
}

void Manager::on_services_found(const TransportEvent& event) {
    DeviceRecord* record = record_for(event);
    if (!record) return;

    if (event.error) {
        std::cerr << "manager: error discovering services of " << record->unique_id << ": "
                  << *event.error << std::endl;
        cleanup(*record);
        return;
    }
    if (record->status == DeviceStatus::Discovered) return;

    std::cout << "manager: services of " << record->unique_id
              << " discovered, discovering characteristics" << std::endl;
    if (!transport_.discover_characteristics(record->peripheral.handle())) {
        cleanup(*record);
    }
}

void Manager::on_services_invalidated(const TransportEvent& event) {
    DeviceRecord* record = record_for(event);
    if (!record) return;

    std::cerr << "manager: accessory service of " << record->unique_id
              << " invalidated, rediscovering" << std::endl;
    cleanup(*record);
    if (record->status != DeviceStatus::Discovered) {
        transport_.discover_services(record->peripheral.handle());
    }
}

void Manager::on_characteristics_found(const TransportEvent& event) {
    DeviceRecord* record = record_for(event);
    if (!record) return;

    if (event.error) {
        std::cerr << "manager: error discovering characteristics of " << record->unique_id
                  << ": " << *event.error << std::endl;
        cleanup(*record);
        return;
    }

    // The link dropped while discovery was in flight
    if (record->status == DeviceStatus::Discovered) return;

    for (const auto& found : event.channels) {
        if (record->channel(found.role).resolve(found.handle)) {
            std::cout << "manager: " << to_string(found.role) << " channel of "
                      << record->unique_id << " at " << found.handle << std::endl;
        }
    }

    if (record->inbound_channel.resolved() && !record->notifying) {
        if (!transport_.set_notify(record->peripheral.handle(), ChannelRole::Inbound,
                                   record->inbound_channel.handle(), true)) {
            std::cerr << "manager: subscribe request for " << record->unique_id << " failed"
                      << std::endl;
            cleanup(*record);
        }
    }
}

void Manager::on_value_updated(const TransportEvent& event) {
    DeviceRecord* record = record_for(event);
    if (!record) return;

    if (event.error) {
        std::cerr << "manager: error reading " << to_string(event.role) << " channel of "
                  << record->unique_id << ": " << *event.error << std::endl;
        cleanup(*record);
        return;
    }
    if (record->status == DeviceStatus::Discovered) return;

    // Outbound carries our own writes back; pairing data only answers a read
    if (event.role == ChannelRole::Outbound) return;
    if (event.role == ChannelRole::Pairing) {
        if (!record->pairing_read_pending) return;
        record->pairing_read_pending = false;
    }

    std::cout << "manager: received " << event.bytes.size() << " bytes: "
              << hex::dump(event.bytes) << std::endl;

    uint32_t id = record->unique_id;
    if (event.role == ChannelRole::Pairing) {
        if (callbacks_.on_pairing_payload) {
            callbacks_.on_pairing_payload(event.bytes, id);
        }
    } else {
        std::string name = record->display_name;
        if (callbacks_.on_data_payload) {
            callbacks_.on_data_payload(event.bytes, name, id);
        }
    }
}

void Manager::on_notify_state_changed(const TransportEvent& event) {
    DeviceRecord* record = record_for(event);
    if (!record) return;

    if (event.error) {
        std::cerr << "manager: error changing notification state of " << record->unique_id
                  << ": " << *event.error << std::endl;
        return;
    }

    if (!event.active) {
        std::cout << "manager: notifications stopped on " << record->unique_id << std::endl;
        record->notifying = false;
        cleanup(*record);
        return;
    }

    if (record->status == DeviceStatus::Discovered) return;

    record->notifying = true;
    if (record->connected_notified) return;
    record->connected_notified = true;

    uint32_t id = record->unique_id;
    std::cout << "manager: notifications began on " << id << ", accessory usable" << std::endl;
    if (callbacks_.on_connected) {
        callbacks_.on_connected(id);
    }
}

void Manager::on_write_result(const TransportEvent& event) {
    if (!event.error) return;

    std::cerr << "manager: " << to_string(Error::TransportError) << ": write on "
              << to_string(event.role) << " channel of " << event.handle
              << " failed: " << *event.error << std::endl;
}

// ============================================================================
// Internals
// ============================================================================

bool Manager::transition(DeviceRecord& record, DeviceStatus to) {
    if (!is_legal_transition(record.status, to)) {
        std::cerr << "manager: refusing " << to_string(record.status) << " -> " << to_string(to)
                  << " for " << record.unique_id << std::endl;
        return false;
    }

    record.status = to;
    if (to == DeviceStatus::Discovered) {
        record.clear_channels();
        record.notifying = false;
        record.connected_notified = false;
    }
    return true;
}

void Manager::cleanup(DeviceRecord& record) {
    if (record.notifying && record.inbound_channel.resolved()) {
        transport_.set_notify(record.peripheral.handle(), ChannelRole::Inbound,
                              record.inbound_channel.handle(), false);
    }
    record.notifying = false;
    record.connected_notified = false;
    record.pairing_read_pending = false;
    record.clear_channels();
}

void Manager::resume_scan() {
    if (!scanning_) return;

    std::cout << "manager: resuming scan" << std::endl;
    if (!transport_.start_scan()) {
        std::cerr << "manager: failed to resume scanning" << std::endl;
    }
}

size_t Manager::sweep() {
    return sweep(clock_());
}

size_t Manager::sweep(int64_t now_ms) {
    if (sweeping_) return 0;
    sweeping_ = true;

    size_t evicted = 0;
    for (const auto& snap : registry_.snapshot()) {
        if (snap.status != DeviceStatus::Discovered) continue;
        if (now_ms - snap.last_seen_ms <= config_.stale_after_ms) continue;

        // Positions shift after each removal, and callbacks may have mutated
        // the registry: resolve against the live state.
        auto position = registry_.position_of(snap.unique_id);
        if (!position) continue;
        const DeviceRecord* live = registry_.lookup(snap.unique_id);
        if (live->status != DeviceStatus::Discovered ||
            now_ms - live->last_seen_ms <= config_.stale_after_ms) {
            continue;
        }

        std::cout << "manager: " << snap.display_name << " timed out, removed at index "
                  << *position << " (last seen " << snap.last_seen_ms << ", now " << now_ms
                  << ")" << std::endl;
        if (registry_.remove(*position) == Error::None) {
            ++evicted;
        }
    }

    sweeping_ = false;
    return evicted;
}

} // namespace accessory
