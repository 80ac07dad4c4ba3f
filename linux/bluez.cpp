#include "bluez.hpp"
#include <core/config.hpp>
#include <strings.h>
#include <cstring>
#include <iostream>
#include <iterator>
#include <memory>

namespace bluez {

using accessory::ChannelRole;
using accessory::DiscoveredChannel;
using accessory::TransportEvent;

constexpr const char* BLUEZ = "org.bluez";
constexpr const char* DEVICE_IFACE = "org.bluez.Device1";
constexpr const char* ADAPTER_IFACE = "org.bluez.Adapter1";
constexpr const char* SERVICE_IFACE = "org.bluez.GattService1";
constexpr const char* CHARACTERISTIC_IFACE = "org.bluez.GattCharacteristic1";

constexpr int CONNECT_TIMEOUT_MS = 30000;
constexpr int REQUEST_TIMEOUT_MS = 10000;

// ATT write request header
constexpr uint16_t ATT_WRITE_HEADER = 3;

// "Already" errors are OK (already connected, already discovering, etc)
static bool is_already(const std::string& error) {
    return error.find("Already") != std::string::npos ||
           error.find("already") != std::string::npos ||
           error.find("InProgress") != std::string::npos;
}

static bool uuid_equals(const char* a, const char* b) {
    return strcasecmp(a, b) == 0;
}

// Helper to get a string property
static std::string get_string_property(DBusConnection* conn, const char* path,
                                        const char* iface, const char* prop) {
    DBusMessage* msg = dbus_message_new_method_call(BLUEZ, path,
        "org.freedesktop.DBus.Properties", "Get");
    if (!msg) return "";

    dbus_message_append_args(msg, DBUS_TYPE_STRING, &iface,
                             DBUS_TYPE_STRING, &prop, DBUS_TYPE_INVALID);

    DBusError err;
    dbus_error_init(&err);
    DBusMessage* reply = dbus_connection_send_with_reply_and_block(conn, msg, 2000, &err);
    dbus_message_unref(msg);

    if (dbus_error_is_set(&err)) {
        dbus_error_free(&err);
        return "";
    }

    std::string result;
    if (reply) {
        DBusMessageIter iter, variant;
        if (dbus_message_iter_init(reply, &iter) &&
            dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_VARIANT) {
            dbus_message_iter_recurse(&iter, &variant);
            if (dbus_message_iter_get_arg_type(&variant) == DBUS_TYPE_STRING) {
                const char* val;
                dbus_message_iter_get_basic(&variant, &val);
                result = val;
            }
        }
        dbus_message_unref(reply);
    }
    return result;
}

// Helper to get a bool property
static bool get_bool_property(DBusConnection* conn, const char* path,
                               const char* iface, const char* prop) {
    DBusMessage* msg = dbus_message_new_method_call(BLUEZ, path,
        "org.freedesktop.DBus.Properties", "Get");
    if (!msg) return false;

    dbus_message_append_args(msg, DBUS_TYPE_STRING, &iface,
                             DBUS_TYPE_STRING, &prop, DBUS_TYPE_INVALID);

    DBusError err;
    dbus_error_init(&err);
    DBusMessage* reply = dbus_connection_send_with_reply_and_block(conn, msg, 2000, &err);
    dbus_message_unref(msg);

    if (dbus_error_is_set(&err)) {
        dbus_error_free(&err);
        return false;
    }

    bool result = false;
    if (reply) {
        DBusMessageIter iter, variant;
        if (dbus_message_iter_init(reply, &iter) &&
            dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_VARIANT) {
            dbus_message_iter_recurse(&iter, &variant);
            if (dbus_message_iter_get_arg_type(&variant) == DBUS_TYPE_BOOLEAN) {
                dbus_bool_t val;
                dbus_message_iter_get_basic(&variant, &val);
                result = val;
            }
        }
        dbus_message_unref(reply);
    }
    return result;
}

static std::optional<std::string> variant_string(DBusMessageIter* variant) {
    int type = dbus_message_iter_get_arg_type(variant);
    if (type != DBUS_TYPE_STRING && type != DBUS_TYPE_OBJECT_PATH) return std::nullopt;
    const char* val;
    dbus_message_iter_get_basic(variant, &val);
    return std::string(val);
}

static std::optional<bool> variant_bool(DBusMessageIter* variant) {
    if (dbus_message_iter_get_arg_type(variant) != DBUS_TYPE_BOOLEAN) return std::nullopt;
    dbus_bool_t val;
    dbus_message_iter_get_basic(variant, &val);
    return val != 0;
}

static std::optional<uint16_t> variant_uint16(DBusMessageIter* variant) {
    if (dbus_message_iter_get_arg_type(variant) != DBUS_TYPE_UINT16) return std::nullopt;
    uint16_t val;
    dbus_message_iter_get_basic(variant, &val);
    return val;
}

// iter must point at an "ay"
static std::vector<uint8_t> read_bytes(DBusMessageIter* iter) {
    if (dbus_message_iter_get_arg_type(iter) != DBUS_TYPE_ARRAY ||
        dbus_message_iter_get_element_type(iter) != DBUS_TYPE_BYTE) {
        return {};
    }

    DBusMessageIter bytes;
    dbus_message_iter_recurse(iter, &bytes);

    const uint8_t* data = nullptr;
    int len = 0;
    dbus_message_iter_get_fixed_array(&bytes, &data, &len);
    if (!data || len <= 0) return {};
    return std::vector<uint8_t>(data, data + len);
}

// Walk an a{sv}: fn(name, variant) for every entry
template<typename Fn>
static void for_each_property(DBusMessageIter* props_iter, Fn&& fn) {
    if (dbus_message_iter_get_arg_type(props_iter) != DBUS_TYPE_ARRAY) return;

    DBusMessageIter props;
    dbus_message_iter_recurse(props_iter, &props);

    while (dbus_message_iter_get_arg_type(&props) == DBUS_TYPE_DICT_ENTRY) {
        DBusMessageIter prop_entry, variant;
        dbus_message_iter_recurse(&props, &prop_entry);

        const char* prop_name;
        dbus_message_iter_get_basic(&prop_entry, &prop_name);
        dbus_message_iter_next(&prop_entry);

        if (dbus_message_iter_get_arg_type(&prop_entry) == DBUS_TYPE_VARIANT) {
            dbus_message_iter_recurse(&prop_entry, &variant);
            fn(prop_name, &variant);
        }
        dbus_message_iter_next(&props);
    }
}

// Walk an a{sa{sv}}: fn(interface, props_iter) for every interface
template<typename Fn>
static void for_each_interface(DBusMessageIter* ifaces_iter, Fn&& fn) {
    if (dbus_message_iter_get_arg_type(ifaces_iter) != DBUS_TYPE_ARRAY) return;

    DBusMessageIter ifaces;
    dbus_message_iter_recurse(ifaces_iter, &ifaces);

    while (dbus_message_iter_get_arg_type(&ifaces) == DBUS_TYPE_DICT_ENTRY) {
        DBusMessageIter iface_entry;
        dbus_message_iter_recurse(&ifaces, &iface_entry);

        const char* iface_name;
        dbus_message_iter_get_basic(&iface_entry, &iface_name);
        dbus_message_iter_next(&iface_entry);

        fn(iface_name, &iface_entry);
        dbus_message_iter_next(&ifaces);
    }
}

// Walk a GetManagedObjects reply: fn(object_path, ifaces_iter)
template<typename Fn>
static void for_each_object(DBusMessage* reply, Fn&& fn) {
    DBusMessageIter iter, dict;
    if (!dbus_message_iter_init(reply, &iter) ||
        dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_ARRAY) {
        return;
    }

    dbus_message_iter_recurse(&iter, &dict);

    while (dbus_message_iter_get_arg_type(&dict) == DBUS_TYPE_DICT_ENTRY) {
        DBusMessageIter entry;
        dbus_message_iter_recurse(&dict, &entry);

        const char* obj_path;
        dbus_message_iter_get_basic(&entry, &obj_path);
        dbus_message_iter_next(&entry);

        fn(obj_path, &entry);
        dbus_message_iter_next(&dict);
    }
}

static DBusMessage* get_managed_objects(DBusConnection* conn) {
    DBusMessage* msg = dbus_message_new_method_call(BLUEZ, "/",
        "org.freedesktop.DBus.ObjectManager", "GetManagedObjects");
    if (!msg) return nullptr;

    DBusError err;
    dbus_error_init(&err);
    DBusMessage* reply = dbus_connection_send_with_reply_and_block(conn, msg, 5000, &err);
    dbus_message_unref(msg);

    if (dbus_error_is_set(&err)) {
        std::cerr << "bluez: GetManagedObjects failed: " << err.message << std::endl;
        dbus_error_free(&err);
        return nullptr;
    }
    return reply;
}

// Helpers to append a{sv} entries
static void append_dict_entry_begin(DBusMessageIter* dict, DBusMessageIter* entry,
                                    const char* key) {
    dbus_message_iter_open_container(dict, DBUS_TYPE_DICT_ENTRY, nullptr, entry);
    dbus_message_iter_append_basic(entry, DBUS_TYPE_STRING, &key);
}

static void append_dict_string(DBusMessageIter* dict, const char* key, const char* value) {
    DBusMessageIter entry, variant;
    append_dict_entry_begin(dict, &entry, key);
    dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, "s", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_STRING, &value);
    dbus_message_iter_close_container(&entry, &variant);
    dbus_message_iter_close_container(dict, &entry);
}

static void append_dict_bool(DBusMessageIter* dict, const char* key, bool value) {
    DBusMessageIter entry, variant;
    append_dict_entry_begin(dict, &entry, key);
    dbus_bool_t val = value ? TRUE : FALSE;
    dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, "b", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_BOOLEAN, &val);
    dbus_message_iter_close_container(&entry, &variant);
    dbus_message_iter_close_container(dict, &entry);
}

static void append_dict_string_array(DBusMessageIter* dict, const char* key, const char* value) {
    DBusMessageIter entry, variant, array;
    append_dict_entry_begin(dict, &entry, key);
    dbus_message_iter_open_container(&entry, DBUS_TYPE_VARIANT, "as", &variant);
    dbus_message_iter_open_container(&variant, DBUS_TYPE_ARRAY, "s", &array);
    dbus_message_iter_append_basic(&array, DBUS_TYPE_STRING, &value);
    dbus_message_iter_close_container(&variant, &array);
    dbus_message_iter_close_container(&entry, &variant);
    dbus_message_iter_close_container(dict, &entry);
}

static void append_empty_options(DBusMessage* msg) {
    DBusMessageIter iter, dict;
    dbus_message_iter_init_append(msg, &iter);
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sv}", &dict);
    dbus_message_iter_close_container(&iter, &dict);
}

bool has_uuid(DBusMessageIter* uuids_iter, const char* uuid) {
    if (dbus_message_iter_get_arg_type(uuids_iter) != DBUS_TYPE_ARRAY) {
        return false;
    }

    DBusMessageIter array_iter;
    dbus_message_iter_recurse(uuids_iter, &array_iter);

    while (dbus_message_iter_get_arg_type(&array_iter) == DBUS_TYPE_STRING) {
        const char* value;
        dbus_message_iter_get_basic(&array_iter, &value);
        if (uuid_equals(value, uuid)) {
            return true;
        }
        dbus_message_iter_next(&array_iter);
    }
    return false;
}

std::optional<ChannelRole> role_for_uuid(const std::string& uuid) {
    if (uuid_equals(uuid.c_str(), accessory::PAIRING_CHARACTERISTIC_UUID)) return ChannelRole::Pairing;
    if (uuid_equals(uuid.c_str(), accessory::INBOUND_CHARACTERISTIC_UUID)) return ChannelRole::Inbound;
    if (uuid_equals(uuid.c_str(), accessory::OUTBOUND_CHARACTERISTIC_UUID)) return ChannelRole::Outbound;
    return std::nullopt;
}

std::optional<std::string> get_adapter_path(DBusConnection* conn) {
    DBusMessage* reply = get_managed_objects(conn);
    if (!reply) return std::nullopt;

    std::optional<std::string> result;
    for_each_object(reply, [&](const char* obj_path, DBusMessageIter* ifaces) {
        if (result) return;
        for_each_interface(ifaces, [&](const char* iface_name, DBusMessageIter*) {
            if (strcmp(iface_name, ADAPTER_IFACE) == 0) {
                result = obj_path;
            }
        });
    });

    dbus_message_unref(reply);
    return result;
}

// ============================================================================
// Central
// ============================================================================

Central::Central(DBusConnection* conn, accessory::Clock clock)
    : conn_(conn), clock_(std::move(clock)) {}

Central::~Central() {
    for (DBusPendingCall* pending : pending_) {
        dbus_pending_call_cancel(pending);
        dbus_pending_call_unref(pending);
    }
}

bool Central::init() {
    DBusError err;
    dbus_error_init(&err);

    // Subscribe to InterfacesAdded / InterfacesRemoved (devices, GATT objects, adapters)
    dbus_bus_add_match(conn_,
        "type='signal',sender='org.bluez',interface='org.freedesktop.DBus.ObjectManager'",
        &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "bluez: failed to add ObjectManager match: " << err.message << std::endl;
        dbus_error_free(&err);
        return false;
    }

    // Subscribe to PropertiesChanged (advertisements, link state, notifications)
    dbus_bus_add_match(conn_,
        "type='signal',sender='org.bluez',interface='org.freedesktop.DBus.Properties',member='PropertiesChanged'",
        &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "bluez: failed to add PropertiesChanged match: " << err.message << std::endl;
        dbus_error_free(&err);
        return false;
    }

    dbus_connection_flush(conn_);

    auto adapter = get_adapter_path(conn_);
    if (!adapter) {
        std::cerr << "bluez: no adapter found, waiting for one" << std::endl;
        return true;
    }

    adapter_path_ = *adapter;
    std::cout << "bluez: using adapter " << adapter_path_ << std::endl;
    cache_existing_accessories();

    if (get_bool_property(conn_, adapter_path_.c_str(), ADAPTER_IFACE, "Powered")) {
        push(TransportEvent::adapter_ready());
    } else {
        std::cerr << "bluez: adapter is not powered on" << std::endl;
    }
    return true;
}

std::vector<TransportEvent> Central::take_events() {
    std::vector<TransportEvent> result(std::make_move_iterator(events_.begin()),
                                       std::make_move_iterator(events_.end()));
    events_.clear();
    return result;
}

void Central::cache_existing_accessories() {
    DBusMessage* reply = get_managed_objects(conn_);
    if (!reply) return;

    for_each_object(reply, [&](const char* obj_path, DBusMessageIter* ifaces) {
        for_each_interface(ifaces, [&](const char* iface_name, DBusMessageIter* props) {
            if (strcmp(iface_name, DEVICE_IFACE) != 0) return;

            Accessory info;
            bool ours = false;
            for_each_property(props, [&](const char* name, DBusMessageIter* variant) {
                if (strcmp(name, "UUIDs") == 0) {
                    ours = has_uuid(variant, accessory::SERVICE_UUID);
                } else if (strcmp(name, "Address") == 0) {
                    info.address = variant_string(variant).value_or("");
                } else if (strcmp(name, "Name") == 0) {
                    info.name = variant_string(variant).value_or("");
                }
            });
            if (ours) {
                accessories_[obj_path] = std::move(info);
            }
        });
    });

    dbus_message_unref(reply);
}

// ----------------------------------------------------------------------------
// Requests
// ----------------------------------------------------------------------------

bool Central::send_async(DBusMessage* msg, Request request, int timeout_ms) {
    if (!msg) return false;

    DBusPendingCall* pending = nullptr;
    bool sent = dbus_connection_send_with_reply(conn_, msg, &pending, timeout_ms);
    dbus_message_unref(msg);

    // A null pending call means the connection is gone
    if (!sent || !pending) {
        std::cerr << "bluez: failed to send request" << std::endl;
        return false;
    }

    auto ctx = std::make_unique<PendingContext>(PendingContext{this, std::move(request)});
    if (!dbus_pending_call_set_notify(pending, on_reply, ctx.get(), free_context)) {
        dbus_pending_call_cancel(pending);
        dbus_pending_call_unref(pending);
        return false;
    }
    // libdbus owns the context from here and frees it through free_context
    ctx.release();

    pending_.insert(pending);
    dbus_connection_flush(conn_);
    return true;
}

void Central::on_reply(DBusPendingCall* pending, void* data) {
    auto* ctx = static_cast<PendingContext*>(data);
    Central* self = ctx->self;

    DBusMessage* reply = dbus_pending_call_steal_reply(pending);
    std::optional<std::string> error;

    if (!reply) {
        error = "no reply";
    } else if (dbus_message_get_type(reply) == DBUS_MESSAGE_TYPE_ERROR) {
        DBusError err;
        dbus_error_init(&err);
        dbus_set_error_from_message(&err, reply);
        error = err.message ? err.message : (err.name ? err.name : "error");
        dbus_error_free(&err);
    }

    self->complete(ctx->request, reply, error);

    if (reply) dbus_message_unref(reply);
    // May free ctx
    self->forget_pending(pending);
}

void Central::free_context(void* data) {
    delete static_cast<PendingContext*>(data);
}

void Central::forget_pending(DBusPendingCall* pending) {
    if (pending_.erase(pending)) {
        dbus_pending_call_unref(pending);
    }
}

void Central::complete(const Request& request, DBusMessage* reply,
                       const std::optional<std::string>& error) {
    using Op = Request::Op;

    switch (request.op) {
        case Op::SetFilter:
            if (error) {
                std::cerr << "bluez: SetDiscoveryFilter failed: " << *error << std::endl;
            }
            break;

        case Op::StartDiscovery:
            if (error && !is_already(*error)) {
                std::cerr << "bluez: StartDiscovery failed: " << *error << std::endl;
            } else {
                std::cout << "bluez: discovery running" << std::endl;
            }
            break;

        case Op::StopDiscovery:
            if (error) {
                std::cerr << "bluez: StopDiscovery failed: " << *error << std::endl;
            }
            break;

        case Op::Connect:
            if (error && !is_already(*error)) {
                std::cerr << "bluez: Connect failed: " << *error << std::endl;
                push(TransportEvent::for_device(TransportEvent::Kind::ConnectFailed,
                                                request.device, error));
            } else {
                set_link_state(request.device, true);
            }
            break;

        case Op::Disconnect:
            if (error) {
                std::cerr << "bluez: Disconnect failed: " << *error << std::endl;
            }
            break;

        case Op::GetObjects:
            if (error) {
                push(TransportEvent::characteristics_found(request.device, "", {}, error));
            } else {
                parse_characteristics(request.device, reply);
            }
            break;

        case Op::Read: {
            if (error) {
                push(TransportEvent::value_updated(request.device, request.role, {}, error));
                break;
            }
            DBusMessageIter iter;
            std::vector<uint8_t> value;
            if (dbus_message_iter_init(reply, &iter)) {
                value = read_bytes(&iter);
            }
            push(TransportEvent::value_updated(request.device, request.role, std::move(value)));
            break;
        }

        case Op::Write:
            push(TransportEvent::write_result(request.device, request.role, error));
            break;

        case Op::StartNotify:
            if (error && !is_already(*error)) {
                push(TransportEvent::notify_state_changed(request.device, request.role, true, error));
            } else {
                set_notifying(request.channel, true);
            }
            break;

        case Op::StopNotify:
            if (error) {
                std::cerr << "bluez: StopNotify failed: " << *error << std::endl;
            }
            set_notifying(request.channel, false);
            break;
    }
}

bool Central::start_scan() {
    if (adapter_path_.empty()) {
        std::cerr << "bluez: no adapter found" << std::endl;
        return false;
    }

    // Only our service, LE only, and report every advertisement so that
    // last-seen timestamps keep moving
    DBusMessage* filter = dbus_message_new_method_call(BLUEZ, adapter_path_.c_str(),
        ADAPTER_IFACE, "SetDiscoveryFilter");
    if (!filter) return false;

    DBusMessageIter iter, dict;
    dbus_message_iter_init_append(filter, &iter);
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sv}", &dict);
    append_dict_string_array(&dict, "UUIDs", accessory::SERVICE_UUID);
    append_dict_string(&dict, "Transport", "le");
    append_dict_bool(&dict, "DuplicateData", true);
    dbus_message_iter_close_container(&iter, &dict);

    if (!send_async(filter, {Request::Op::SetFilter}, REQUEST_TIMEOUT_MS)) {
        return false;
    }

    DBusMessage* msg = dbus_message_new_method_call(BLUEZ, adapter_path_.c_str(),
        ADAPTER_IFACE, "StartDiscovery");
    return send_async(msg, {Request::Op::StartDiscovery}, REQUEST_TIMEOUT_MS);
}

void Central::stop_scan() {
    if (adapter_path_.empty()) return;

    DBusMessage* msg = dbus_message_new_method_call(BLUEZ, adapter_path_.c_str(),
        ADAPTER_IFACE, "StopDiscovery");
    send_async(msg, {Request::Op::StopDiscovery}, REQUEST_TIMEOUT_MS);
}

bool Central::connect(const std::string& device) {
    DBusMessage* msg = dbus_message_new_method_call(BLUEZ, device.c_str(), DEVICE_IFACE, "Connect");
    return send_async(msg, {Request::Op::Connect, device}, CONNECT_TIMEOUT_MS);
}

bool Central::disconnect(const std::string& device) {
    DBusMessage* msg = dbus_message_new_method_call(BLUEZ, device.c_str(), DEVICE_IFACE, "Disconnect");
    return send_async(msg, {Request::Op::Disconnect, device}, REQUEST_TIMEOUT_MS);
}

bool Central::discover_services(const std::string& device) {
    // BlueZ resolves services on its own after connecting; report once it has
    if (get_bool_property(conn_, device.c_str(), DEVICE_IFACE, "ServicesResolved")) {
        push(TransportEvent::for_device(TransportEvent::Kind::ServicesFound, device));
    } else {
        awaiting_services_.insert(device);
    }
    return true;
}

bool Central::discover_characteristics(const std::string& device) {
    DBusMessage* msg = dbus_message_new_method_call(BLUEZ, "/",
        "org.freedesktop.DBus.ObjectManager", "GetManagedObjects");
    return send_async(msg, {Request::Op::GetObjects, device}, REQUEST_TIMEOUT_MS);
}

void Central::parse_characteristics(const std::string& device, DBusMessage* reply) {
    struct Found {
        std::string path;
        std::string uuid;
        std::string service;
        std::optional<uint16_t> mtu;
    };

    std::string prefix = device + "/";
    std::string service_path;
    std::vector<Found> characteristics;

    for_each_object(reply, [&](const char* obj_path, DBusMessageIter* ifaces) {
        if (strncmp(obj_path, prefix.c_str(), prefix.size()) != 0) return;

        for_each_interface(ifaces, [&](const char* iface_name, DBusMessageIter* props) {
            if (strcmp(iface_name, SERVICE_IFACE) == 0) {
                for_each_property(props, [&](const char* name, DBusMessageIter* variant) {
                    if (strcmp(name, "UUID") == 0) {
                        auto uuid = variant_string(variant);
                        if (uuid && uuid_equals(uuid->c_str(), accessory::SERVICE_UUID)) {
                            service_path = obj_path;
                        }
                    }
                });
            } else if (strcmp(iface_name, CHARACTERISTIC_IFACE) == 0) {
                Found found;
                found.path = obj_path;
                for_each_property(props, [&](const char* name, DBusMessageIter* variant) {
                    if (strcmp(name, "UUID") == 0) {
                        found.uuid = variant_string(variant).value_or("");
                    } else if (strcmp(name, "Service") == 0) {
                        found.service = variant_string(variant).value_or("");
                    } else if (strcmp(name, "MTU") == 0) {
                        found.mtu = variant_uint16(variant);
                    }
                });
                characteristics.push_back(std::move(found));
            }
        });
    });

    if (service_path.empty()) {
        push(TransportEvent::characteristics_found(device, "", {}, "accessory service not found"));
        return;
    }

    std::vector<DiscoveredChannel> channels;
    for (const auto& found : characteristics) {
        if (found.service != service_path) continue;

        auto role = role_for_uuid(found.uuid);
        if (!role) continue;

        Channel channel{device, *role, DEFAULT_MAX_WRITE};
        if (found.mtu && *found.mtu > ATT_WRITE_HEADER) {
            channel.max_write = *found.mtu - ATT_WRITE_HEADER;
        }
        channels_[found.path] = channel;
        channels.push_back({*role, found.path});
    }

    push(TransportEvent::characteristics_found(device, service_path, std::move(channels)));
}

bool Central::read(const std::string& device, ChannelRole role, const std::string& channel) {
    DBusMessage* msg = dbus_message_new_method_call(BLUEZ, channel.c_str(),
        CHARACTERISTIC_IFACE, "ReadValue");
    if (!msg) return false;
    append_empty_options(msg);
    return send_async(msg, {Request::Op::Read, device, role, channel}, REQUEST_TIMEOUT_MS);
}

bool Central::write(const std::string& device, ChannelRole role, const std::string& channel,
                    std::span<const uint8_t> data) {
    DBusMessage* msg = dbus_message_new_method_call(BLUEZ, channel.c_str(),
        CHARACTERISTIC_IFACE, "WriteValue");
    if (!msg) return false;

    DBusMessageIter iter, array, dict;
    dbus_message_iter_init_append(msg, &iter);
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "y", &array);
    const uint8_t* bytes = data.data();
    dbus_message_iter_append_fixed_array(&array, DBUS_TYPE_BYTE, &bytes,
                                         static_cast<int>(data.size()));
    dbus_message_iter_close_container(&iter, &array);

    // Write with response
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sv}", &dict);
    append_dict_string(&dict, "type", "request");
    dbus_message_iter_close_container(&iter, &dict);

    return send_async(msg, {Request::Op::Write, device, role, channel}, REQUEST_TIMEOUT_MS);
}

bool Central::set_notify(const std::string& device, ChannelRole role, const std::string& channel,
                         bool enable) {
    DBusMessage* msg = dbus_message_new_method_call(BLUEZ, channel.c_str(),
        CHARACTERISTIC_IFACE, enable ? "StartNotify" : "StopNotify");
    auto op = enable ? Request::Op::StartNotify : Request::Op::StopNotify;
    return send_async(msg, {op, device, role, channel}, REQUEST_TIMEOUT_MS);
}

size_t Central::max_write_size(const std::string& device, const std::string& channel) {
    auto it = channels_.find(channel);
    if (it == channels_.end() || it->second.device != device) {
        return 0;
    }
    return it->second.max_write;
}

// ----------------------------------------------------------------------------
// State tracking
// ----------------------------------------------------------------------------

void Central::set_link_state(const std::string& device, bool connected,
                             std::optional<std::string> error) {
    if (connected) {
        if (connected_.insert(device).second) {
            push(TransportEvent::for_device(TransportEvent::Kind::Connected, device));
        }
        return;
    }

    if (!connected_.erase(device)) return;

    awaiting_services_.erase(device);
    for (auto it = channels_.begin(); it != channels_.end();) {
        if (it->second.device == device) {
            notifying_.erase(it->first);
            it = channels_.erase(it);
        } else {
            ++it;
        }
    }
    push(TransportEvent::for_device(TransportEvent::Kind::Disconnected, device, std::move(error)));
}

void Central::set_notifying(const std::string& channel, bool notifying) {
    auto it = channels_.find(channel);
    if (it == channels_.end()) return;

    bool changed = notifying ? notifying_.insert(channel).second : notifying_.erase(channel) > 0;
    if (changed) {
        push(TransportEvent::notify_state_changed(it->second.device, it->second.role, notifying));
    }
}

// ----------------------------------------------------------------------------
// Signals
// ----------------------------------------------------------------------------

void Central::on_interfaces_added(const char* path, DBusMessageIter* ifaces) {
    for_each_interface(ifaces, [&](const char* iface_name, DBusMessageIter* props) {
        if (strcmp(iface_name, ADAPTER_IFACE) == 0) {
            if (!adapter_path_.empty()) return;
            adapter_path_ = path;
            std::cout << "bluez: adapter appeared at " << adapter_path_ << std::endl;
            on_adapter_properties(path, props);
            return;
        }

        if (strcmp(iface_name, DEVICE_IFACE) != 0) return;

        Accessory info;
        bool ours = false;
        for_each_property(props, [&](const char* name, DBusMessageIter* variant) {
            if (strcmp(name, "UUIDs") == 0) {
                ours = has_uuid(variant, accessory::SERVICE_UUID);
            } else if (strcmp(name, "Address") == 0) {
                info.address = variant_string(variant).value_or("");
            } else if (strcmp(name, "Name") == 0) {
                info.name = variant_string(variant).value_or("");
            }
        });

        if (!ours) return;

        std::cout << "bluez: discovered accessory at " << path << std::endl;
        push(TransportEvent::device_found(path, info.address, info.name, clock_()));
        accessories_[path] = std::move(info);
    });
}

void Central::on_interfaces_removed(const char* path, DBusMessageIter* ifaces) {
    if (dbus_message_iter_get_arg_type(ifaces) != DBUS_TYPE_ARRAY) return;

    DBusMessageIter names;
    dbus_message_iter_recurse(ifaces, &names);

    while (dbus_message_iter_get_arg_type(&names) == DBUS_TYPE_STRING) {
        const char* iface_name;
        dbus_message_iter_get_basic(&names, &iface_name);

        if (strcmp(iface_name, DEVICE_IFACE) == 0) {
            set_link_state(path, false);
            accessories_.erase(path);
        } else if (strcmp(iface_name, SERVICE_IFACE) == 0) {
            // Our characteristics live below the service object
            std::string prefix = std::string(path) + "/";
            std::optional<std::string> device;
            for (auto it = channels_.begin(); it != channels_.end();) {
                if (it->first.compare(0, prefix.size(), prefix) == 0) {
                    device = it->second.device;
                    notifying_.erase(it->first);
                    it = channels_.erase(it);
                } else {
                    ++it;
                }
            }
            if (device && connected_.count(*device)) {
                push(TransportEvent::for_device(TransportEvent::Kind::ServicesInvalidated, *device));
            }
        } else if (strcmp(iface_name, ADAPTER_IFACE) == 0 && adapter_path_ == path) {
            std::cerr << "bluez: adapter " << adapter_path_ << " removed" << std::endl;
            adapter_path_.clear();
        }
        dbus_message_iter_next(&names);
    }
}

void Central::on_device_properties(const char* path, DBusMessageIter* props) {
    bool advertisement = false;
    std::optional<bool> connected;
    bool services_resolved = false;
    bool became_ours = false;
    std::optional<std::string> name;

    for_each_property(props, [&](const char* prop, DBusMessageIter* variant) {
        if (strcmp(prop, "Connected") == 0) {
            connected = variant_bool(variant);
        } else if (strcmp(prop, "ServicesResolved") == 0) {
            services_resolved = variant_bool(variant).value_or(false);
        } else if (strcmp(prop, "UUIDs") == 0) {
            became_ours = has_uuid(variant, accessory::SERVICE_UUID);
        } else if (strcmp(prop, "Name") == 0) {
            name = variant_string(variant);
            advertisement = true;
        } else if (strcmp(prop, "RSSI") == 0 || strcmp(prop, "ManufacturerData") == 0 ||
                   strcmp(prop, "ServiceData") == 0 || strcmp(prop, "TxPower") == 0) {
            advertisement = true;
        }
    });

    auto it = accessories_.find(path);
    if (it == accessories_.end()) {
        if (!became_ours) return;
        Accessory info;
        info.address = get_string_property(conn_, path, DEVICE_IFACE, "Address");
        info.name = get_string_property(conn_, path, DEVICE_IFACE, "Name");
        it = accessories_.emplace(path, std::move(info)).first;
        advertisement = true;
    }

    if (name) {
        it->second.name = *name;
    }

    if (advertisement) {
        push(TransportEvent::device_found(path, it->second.address, it->second.name, clock_()));
    }

    if (connected) {
        set_link_state(path, *connected);
    }

    if (services_resolved && awaiting_services_.erase(path)) {
        push(TransportEvent::for_device(TransportEvent::Kind::ServicesFound, path));
    }
}

void Central::on_characteristic_properties(const char* path, DBusMessageIter* props) {
    auto it = channels_.find(path);
    if (it == channels_.end()) return;

    for_each_property(props, [&](const char* prop, DBusMessageIter* variant) {
        if (strcmp(prop, "Value") == 0) {
            // BlueZ also refreshes Value after our own reads and writes. Only
            // inbound changes are notifications; pairing data comes from the
            // ReadValue reply.
            if (it->second.role != ChannelRole::Inbound) return;
            push(TransportEvent::value_updated(it->second.device, it->second.role,
                                               read_bytes(variant)));
        } else if (strcmp(prop, "Notifying") == 0) {
            if (auto notifying = variant_bool(variant)) {
                set_notifying(path, *notifying);
            }
        }
    });
}

void Central::on_adapter_properties(const char* path, DBusMessageIter* props) {
    if (adapter_path_ != path) return;

    for_each_property(props, [&](const char* prop, DBusMessageIter* variant) {
        if (strcmp(prop, "Powered") != 0) return;

        if (variant_bool(variant).value_or(false)) {
            std::cout << "bluez: adapter powered on" << std::endl;
            cache_existing_accessories();
            push(TransportEvent::adapter_ready());
        } else {
            std::cerr << "bluez: adapter powered off" << std::endl;
        }
    });
}

bool Central::handle_signal(DBusMessage* msg) {
    const char* iface = dbus_message_get_interface(msg);
    const char* member = dbus_message_get_member(msg);

    if (!iface || !member) return false;

    if (strcmp(iface, "org.freedesktop.DBus.ObjectManager") == 0) {
        DBusMessageIter iter;
        if (!dbus_message_iter_init(msg, &iter)) return false;

        // First arg: object path
        if (dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_OBJECT_PATH) return false;
        const char* obj_path;
        dbus_message_iter_get_basic(&iter, &obj_path);
        dbus_message_iter_next(&iter);

        if (strcmp(member, "InterfacesAdded") == 0) {
            on_interfaces_added(obj_path, &iter);
            return true;
        }
        if (strcmp(member, "InterfacesRemoved") == 0) {
            on_interfaces_removed(obj_path, &iter);
            return true;
        }
        return false;
    }

    if (strcmp(iface, "org.freedesktop.DBus.Properties") == 0 &&
        strcmp(member, "PropertiesChanged") == 0) {

        const char* obj_path = dbus_message_get_path(msg);
        if (!obj_path) return false;

        DBusMessageIter iter;
        if (!dbus_message_iter_init(msg, &iter)) return false;

        // First arg: interface name
        if (dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_STRING) return false;
        const char* changed_iface;
        dbus_message_iter_get_basic(&iter, &changed_iface);

        // Second arg: changed properties dict
        dbus_message_iter_next(&iter);

        if (strcmp(changed_iface, DEVICE_IFACE) == 0) {
            on_device_properties(obj_path, &iter);
        } else if (strcmp(changed_iface, CHARACTERISTIC_IFACE) == 0) {
            on_characteristic_properties(obj_path, &iter);
        } else if (strcmp(changed_iface, ADAPTER_IFACE) == 0) {
            on_adapter_properties(obj_path, &iter);
        } else {
            return false;
        }
        return true;
    }

    return false;
}

} // namespace bluez
