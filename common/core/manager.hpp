#pragma once

#include "chunked_writer.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "known_devices.hpp"
#include "registry.hpp"
#include "transport.hpp"
#include <types/device.hpp>
#include <types/events.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace accessory {

// Outward notifications for the UI and ranging layers. Unset slots are skipped.
struct Callbacks {
    std::function<void(size_t position, uint32_t id, bool inserted)> on_registry_changed;
    std::function<void(const std::vector<uint8_t>& bytes, uint32_t id)> on_pairing_payload;
    std::function<void(uint32_t id)> on_connected;
    std::function<void(uint32_t id)> on_disconnected;
    std::function<void(const std::vector<uint8_t>& bytes, const std::string& name, uint32_t id)>
        on_data_payload;
};

// Tracks every discovered accessory and drives each one through
// Discovered -> Connected -> Ranging.
//
// Not thread-safe: commands, transport events and sweep ticks must all be
// delivered from the same execution context (the daemon's poll loop).
class Manager {
public:
    Manager(Transport& transport, KnownDeviceStore& known, Config config = {},
            Clock clock = monotonic_ms);

    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;

    void set_callbacks(Callbacks callbacks) { callbacks_ = std::move(callbacks); }

    // Operator commands
    void start();
    void stop();
    Error pair(uint32_t id);
    Error connect(uint32_t id);
    Error disconnect(uint32_t id);
    Error send(std::span<const uint8_t> bytes, uint32_t id);
    Error rename(uint32_t id, const std::string& name);

    // Ranging layer hand-off
    Error mark_ranging(uint32_t id);
    Error report_distance(uint32_t id, float metres);

    // Known-device bookkeeping
    void remember(uint32_t id, const std::string& name);
    std::optional<std::string> recall(uint32_t id) const;
    bool is_known(uint32_t id) const;
    void forget_all();

    // Single entry point for transport callbacks
    void handle(const TransportEvent& event);

    // Staleness sweep; returns the number of records evicted
    size_t sweep();
    size_t sweep(int64_t now_ms);

    std::vector<DeviceSnapshot> devices() const { return registry_.snapshot(); }
    const Registry& registry() const { return registry_; }
    const Config& config() const { return config_; }

    bool adapter_ready() const { return adapter_ready_; }
    bool start_pending() const { return start_pending_; }
    bool scanning() const { return scanning_; }
    uint32_t connection_iterations() const { return connection_iterations_; }
    uint32_t write_iterations() const { return writer_.iterations(); }

private:
    void on_adapter_ready();
    void on_device_found(const TransportEvent& event);
    void on_connect_failed(const TransportEvent& event);
    void on_connected(const TransportEvent& event);
    void on_disconnected(const TransportEvent& event);
    void on_services_found(const TransportEvent& event);
    void on_services_invalidated(const TransportEvent& event);
    void on_characteristics_found(const TransportEvent& event);
    void on_value_updated(const TransportEvent& event);
    void on_notify_state_changed(const TransportEvent& event);
    void on_write_result(const TransportEvent& event);

    DeviceRecord* record_for(const TransportEvent& event);
    bool transition(DeviceRecord& record, DeviceStatus to);
    // Clears channel handles and rolls back the inbound subscription
    void cleanup(DeviceRecord& record);
    void resume_scan();

    Transport& transport_;
    KnownDeviceStore& known_;
    Config config_;
    Clock clock_;
    Registry registry_;
    ChunkedWriter writer_;
    Callbacks callbacks_;

    bool adapter_ready_ = false;
    bool start_pending_ = false;
    bool scanning_ = false;
    bool sweeping_ = false;

    // Bumped on every link drop; reset by start()
    uint32_t connection_iterations_ = 0;
};

} // namespace accessory
