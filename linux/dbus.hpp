#pragma once

#include <core/manager.hpp>
#include <dbus/dbus.h>
#include <cstdint>
#include <span>
#include <string>

namespace dbus_service {

// D-Bus service configuration
constexpr const char* SERVICE_NAME = "org.accessory.Manager";
constexpr const char* OBJECT_PATH = "/org/accessory/Manager";
constexpr const char* INTERFACE_NAME = "org.accessory.Manager";
// Method failures are replied as ERROR_PREFIX + accessory::error_name()
constexpr const char* ERROR_PREFIX = "org.accessory.Error.";

// Current state exposed via D-Bus properties
struct State {
    bool adapter_ready = false;
    bool scanning = false;
    uint32_t device_count = 0;
};

// Initialize D-Bus service, returns connection (caller owns)
// Method calls are forwarded to manager
DBusConnection* init(accessory::Manager* manager, State* state);

// Request the service name on the bus
bool request_name(DBusConnection* conn);

// Emit PropertiesChanged signal for given properties
void emit_properties_changed(DBusConnection* conn, const State& state,
                              const char** property_names, int num_properties);

// Update state from the manager and emit PropertiesChanged for what differs
void update_from_manager(DBusConnection* conn, State* state,
                         const accessory::Manager& manager);

// Notification signals
void emit_registry_changed(DBusConnection* conn, size_t position, uint32_t id, bool inserted);
void emit_device_connected(DBusConnection* conn, uint32_t id);
void emit_device_disconnected(DBusConnection* conn, uint32_t id);
void emit_pairing_payload(DBusConnection* conn, uint32_t id, std::span<const uint8_t> bytes);
void emit_data_payload(DBusConnection* conn, uint32_t id, const std::string& name,
                       std::span<const uint8_t> bytes);

// Process pending D-Bus messages (call in event loop)
void process_pending(DBusConnection* conn);

// Get file descriptor for polling
int get_fd(DBusConnection* conn);

// Cleanup
void cleanup(DBusConnection* conn);

} // namespace dbus_service
