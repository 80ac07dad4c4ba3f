#pragma once

#include <core/clock.hpp>
#include <core/transport.hpp>
#include <types/events.hpp>

#include <dbus/dbus.h>
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace bluez {

// Default ATT MTU (23) minus the 3-byte write request header
constexpr size_t DEFAULT_MAX_WRITE = 20;

// Check if a UUID list (variant contents, type "as") contains uuid
bool has_uuid(DBusMessageIter* uuids_iter, const char* uuid);

// Get adapter path (usually /org/bluez/hci0)
std::optional<std::string> get_adapter_path(DBusConnection* conn);

// Map a characteristic UUID to the role it plays, if it is one of ours
std::optional<accessory::ChannelRole> role_for_uuid(const std::string& uuid);

// BLE central over the BlueZ D-Bus API.
//
// Requests are sent asynchronously; replies and BlueZ signals are turned into
// accessory::TransportEvent messages and queued. The owner drains the queue
// with take_events() after dispatching the system bus.
class Central : public accessory::Transport {
public:
    explicit Central(DBusConnection* conn, accessory::Clock clock = accessory::monotonic_ms);
    ~Central() override;

    Central(const Central&) = delete;
    Central& operator=(const Central&) = delete;

    // Find the adapter and subscribe to BlueZ signals.
    // The caller routes signals to handle_signal() from its connection filter.
    bool init();

    bool start_scan() override;
    void stop_scan() override;
    bool connect(const std::string& device) override;
    bool disconnect(const std::string& device) override;
    bool discover_services(const std::string& device) override;
    bool discover_characteristics(const std::string& device) override;
    bool read(const std::string& device, accessory::ChannelRole role,
              const std::string& channel) override;
    bool write(const std::string& device, accessory::ChannelRole role,
               const std::string& channel, std::span<const uint8_t> data) override;
    bool set_notify(const std::string& device, accessory::ChannelRole role,
                    const std::string& channel, bool enable) override;
    size_t max_write_size(const std::string& device, const std::string& channel) override;

    bool has_events() const { return !events_.empty(); }
    std::vector<accessory::TransportEvent> take_events();

    // Process a D-Bus message that might be a BlueZ signal
    // Returns true if it was handled
    bool handle_signal(DBusMessage* msg);

private:
    struct Request {
        enum class Op {
            SetFilter,
            StartDiscovery,
            StopDiscovery,
            Connect,
            Disconnect,
            GetObjects,
            Read,
            Write,
            StartNotify,
            StopNotify,
        };

        Op op;
        std::string device;
        accessory::ChannelRole role = accessory::ChannelRole::Inbound;
        std::string channel;
    };

    struct PendingContext {
        Central* self;
        Request request;
    };

    static void on_reply(DBusPendingCall* pending, void* data);
    static void free_context(void* data);

    struct Accessory {
        std::string address;
        std::string name;
    };

    struct Channel {
        std::string device;
        accessory::ChannelRole role;
        size_t max_write = DEFAULT_MAX_WRITE;
    };

    bool send_async(DBusMessage* msg, Request request, int timeout_ms);
    void push(accessory::TransportEvent event) { events_.push_back(std::move(event)); }

    void on_interfaces_added(const char* path, DBusMessageIter* ifaces);
    void on_interfaces_removed(const char* path, DBusMessageIter* ifaces);
    void on_device_properties(const char* path, DBusMessageIter* props);
    void on_characteristic_properties(const char* path, DBusMessageIter* props);
    void on_adapter_properties(const char* path, DBusMessageIter* props);

    void complete(const Request& request, DBusMessage* reply,
                  const std::optional<std::string>& error);
    void forget_pending(DBusPendingCall* pending);

    void set_link_state(const std::string& device, bool connected,
                        std::optional<std::string> error = std::nullopt);
    void set_notifying(const std::string& channel, bool notifying);
    void cache_existing_accessories();
    void parse_characteristics(const std::string& device, DBusMessage* reply);

    DBusConnection* conn_;
    accessory::Clock clock_;
    std::string adapter_path_;
    std::unordered_set<DBusPendingCall*> pending_;

    std::deque<accessory::TransportEvent> events_;

    std::unordered_map<std::string, Accessory> accessories_;   // device path
    std::unordered_set<std::string> connected_;                // device paths
    std::unordered_set<std::string> awaiting_services_;        // device paths
    std::unordered_map<std::string, Channel> channels_;        // characteristic path
    std::unordered_set<std::string> notifying_;                // characteristic paths
};

} // namespace bluez
