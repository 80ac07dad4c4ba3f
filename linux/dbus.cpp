#include "dbus.hpp"
#include <cstring>
#include <iostream>
#include <vector>

namespace dbus_service {

using accessory::Error;

// Global pointers for method dispatch (set in init)
static accessory::Manager* g_manager = nullptr;
static State* g_state = nullptr;

// Introspection XML
static const char* INTROSPECT_XML =
    "<!DOCTYPE node PUBLIC \"-//freedesktop//DTD D-BUS Object Introspection 1.0//EN\"\n"
    "\"http://www.freedesktop.org/standards/dbus/1.0/introspect.dtd\">\n"
    "<node>\n"
    "  <interface name=\"org.accessory.Manager\">\n"
    "    <method name=\"Start\"/>\n"
    "    <method name=\"Stop\"/>\n"
    "    <method name=\"Pair\">\n"
    "      <arg name=\"id\" type=\"u\" direction=\"in\"/>\n"
    "    </method>\n"
    "    <method name=\"Connect\">\n"
    "      <arg name=\"id\" type=\"u\" direction=\"in\"/>\n"
    "    </method>\n"
    "    <method name=\"Disconnect\">\n"
    "      <arg name=\"id\" type=\"u\" direction=\"in\"/>\n"
    "    </method>\n"
    "    <method name=\"Send\">\n"
    "      <arg name=\"id\" type=\"u\" direction=\"in\"/>\n"
    "      <arg name=\"payload\" type=\"ay\" direction=\"in\"/>\n"
    "    </method>\n"
    "    <method name=\"Rename\">\n"
    "      <arg name=\"id\" type=\"u\" direction=\"in\"/>\n"
    "      <arg name=\"name\" type=\"s\" direction=\"in\"/>\n"
    "    </method>\n"
    "    <method name=\"MarkRanging\">\n"
    "      <arg name=\"id\" type=\"u\" direction=\"in\"/>\n"
    "    </method>\n"
    "    <method name=\"ReportDistance\">\n"
    "      <arg name=\"id\" type=\"u\" direction=\"in\"/>\n"
    "      <arg name=\"metres\" type=\"d\" direction=\"in\"/>\n"
    "    </method>\n"
    "    <method name=\"Remember\">\n"
    "      <arg name=\"id\" type=\"u\" direction=\"in\"/>\n"
    "      <arg name=\"name\" type=\"s\" direction=\"in\"/>\n"
    "    </method>\n"
    "    <method name=\"Recall\">\n"
    "      <arg name=\"id\" type=\"u\" direction=\"in\"/>\n"
    "      <arg name=\"name\" type=\"s\" direction=\"out\"/>\n"
    "    </method>\n"
    "    <method name=\"IsKnown\">\n"
    "      <arg name=\"id\" type=\"u\" direction=\"in\"/>\n"
    "      <arg name=\"known\" type=\"b\" direction=\"out\"/>\n"
    "    </method>\n"
    "    <method name=\"ForgetAll\"/>\n"
    "    <method name=\"ListDevices\">\n"
    "      <arg name=\"devices\" type=\"a(ussxsd)\" direction=\"out\"/>\n"
    "    </method>\n"
    "    <signal name=\"RegistryChanged\">\n"
    "      <arg name=\"position\" type=\"u\"/>\n"
    "      <arg name=\"id\" type=\"u\"/>\n"
    "      <arg name=\"inserted\" type=\"b\"/>\n"
    "    </signal>\n"
    "    <signal name=\"DeviceConnected\">\n"
    "      <arg name=\"id\" type=\"u\"/>\n"
    "    </signal>\n"
    "    <signal name=\"DeviceDisconnected\">\n"
    "      <arg name=\"id\" type=\"u\"/>\n"
    "    </signal>\n"
    "    <signal name=\"PairingPayload\">\n"
    "      <arg name=\"id\" type=\"u\"/>\n"
    "      <arg name=\"payload\" type=\"ay\"/>\n"
    "    </signal>\n"
    "    <signal name=\"DataPayload\">\n"
    "      <arg name=\"id\" type=\"u\"/>\n"
    "      <arg name=\"name\" type=\"s\"/>\n"
    "      <arg name=\"payload\" type=\"ay\"/>\n"
    "    </signal>\n"
    "    <property name=\"AdapterReady\" type=\"b\" access=\"read\"/>\n"
    "    <property name=\"Scanning\" type=\"b\" access=\"read\"/>\n"
    "    <property name=\"DeviceCount\" type=\"u\" access=\"read\"/>\n"
    "  </interface>\n"
    "  <interface name=\"org.freedesktop.DBus.Properties\">\n"
    "    <method name=\"Get\">\n"
    "      <arg name=\"interface\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"property\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"value\" type=\"v\" direction=\"out\"/>\n"
    "    </method>\n"
    "    <method name=\"GetAll\">\n"
    "      <arg name=\"interface\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"properties\" type=\"a{sv}\" direction=\"out\"/>\n"
    "    </method>\n"
    "    <signal name=\"PropertiesChanged\">\n"
    "      <arg name=\"interface\" type=\"s\"/>\n"
    "      <arg name=\"changed_properties\" type=\"a{sv}\"/>\n"
    "      <arg name=\"invalidated_properties\" type=\"as\"/>\n"
    "    </signal>\n"
    "  </interface>\n"
    "  <interface name=\"org.freedesktop.DBus.Introspectable\">\n"
    "    <method name=\"Introspect\">\n"
    "      <arg name=\"xml\" type=\"s\" direction=\"out\"/>\n"
    "    </method>\n"
    "  </interface>\n"
    "</node>\n";

static const char* PROPERTY_NAMES[] = {"AdapterReady", "Scanning", "DeviceCount"};

// Helper to append variant with bool
static void append_variant_bool(DBusMessageIter* iter, dbus_bool_t value) {
    DBusMessageIter variant;
    dbus_message_iter_open_container(iter, DBUS_TYPE_VARIANT, "b", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_BOOLEAN, &value);
    dbus_message_iter_close_container(iter, &variant);
}

// Helper to append variant with uint32
static void append_variant_uint32(DBusMessageIter* iter, dbus_uint32_t value) {
    DBusMessageIter variant;
    dbus_message_iter_open_container(iter, DBUS_TYPE_VARIANT, "u", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_UINT32, &value);
    dbus_message_iter_close_container(iter, &variant);
}

// Append the value of one property; false if the name is not ours
static bool append_property(DBusMessageIter* iter, const State& state, const char* prop) {
    if (strcmp(prop, "AdapterReady") == 0) {
        append_variant_bool(iter, state.adapter_ready);
    } else if (strcmp(prop, "Scanning") == 0) {
        append_variant_bool(iter, state.scanning);
    } else if (strcmp(prop, "DeviceCount") == 0) {
        append_variant_uint32(iter, state.device_count);
    } else {
        return false;
    }
    return true;
}

static void append_bytes(DBusMessageIter* iter, std::span<const uint8_t> bytes) {
    DBusMessageIter array;
    dbus_message_iter_open_container(iter, DBUS_TYPE_ARRAY, "y", &array);
    const uint8_t* data = bytes.data();
    dbus_message_iter_append_fixed_array(&array, DBUS_TYPE_BYTE, &data,
                                         static_cast<int>(bytes.size()));
    dbus_message_iter_close_container(iter, &array);
}

// Method return for Error::None, error reply otherwise
static DBusMessage* reply_for(DBusMessage* msg, Error error) {
    if (error == Error::None) {
        return dbus_message_new_method_return(msg);
    }
    std::string name = std::string(ERROR_PREFIX) + std::string(accessory::error_name(error));
    std::string text(accessory::to_string(error));
    return dbus_message_new_error(msg, name.c_str(), text.c_str());
}

// Handle Get property
static DBusMessage* handle_get(DBusMessage* msg, const State& state) {
    const char* iface;
    const char* prop;

    if (!dbus_message_get_args(msg, nullptr,
            DBUS_TYPE_STRING, &iface,
            DBUS_TYPE_STRING, &prop,
            DBUS_TYPE_INVALID)) {
        return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Invalid arguments");
    }

    if (strcmp(iface, INTERFACE_NAME) != 0) {
        return dbus_message_new_error(msg, DBUS_ERROR_UNKNOWN_INTERFACE, "Unknown interface");
    }

    DBusMessage* reply = dbus_message_new_method_return(msg);
    DBusMessageIter iter;
    dbus_message_iter_init_append(reply, &iter);

    if (!append_property(&iter, state, prop)) {
        dbus_message_unref(reply);
        return dbus_message_new_error(msg, DBUS_ERROR_UNKNOWN_PROPERTY, "Unknown property");
    }
    return reply;
}

// Handle GetAll properties
static DBusMessage* handle_get_all(DBusMessage* msg, const State& state) {
    const char* iface;

    if (!dbus_message_get_args(msg, nullptr,
            DBUS_TYPE_STRING, &iface,
            DBUS_TYPE_INVALID)) {
        return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Invalid arguments");
    }

    if (strcmp(iface, INTERFACE_NAME) != 0) {
        return dbus_message_new_error(msg, DBUS_ERROR_UNKNOWN_INTERFACE, "Unknown interface");
    }

    DBusMessage* reply = dbus_message_new_method_return(msg);
    DBusMessageIter iter, dict, entry;
    dbus_message_iter_init_append(reply, &iter);
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sv}", &dict);

    for (const char* name : PROPERTY_NAMES) {
        dbus_message_iter_open_container(&dict, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
        dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &name);
        append_property(&entry, state, name);
        dbus_message_iter_close_container(&dict, &entry);
    }

    dbus_message_iter_close_container(&iter, &dict);
    return reply;
}

// Handle ListDevices: a(ussxsd) = id, name, status, last seen, address, distance (-1 if none)
static DBusMessage* handle_list_devices(DBusMessage* msg, const accessory::Manager& manager) {
    DBusMessage* reply = dbus_message_new_method_return(msg);
    DBusMessageIter iter, array, entry;
    dbus_message_iter_init_append(reply, &iter);
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "(ussxsd)", &array);

    for (const auto& device : manager.devices()) {
        dbus_message_iter_open_container(&array, DBUS_TYPE_STRUCT, nullptr, &entry);

        dbus_uint32_t id = device.unique_id;
        const char* name = device.display_name.c_str();
        std::string status_str(accessory::to_string(device.status));
        const char* status = status_str.c_str();
        dbus_int64_t last_seen = device.last_seen_ms;
        const char* address = device.address.c_str();
        double distance = device.reported_distance ? *device.reported_distance : -1.0;

        dbus_message_iter_append_basic(&entry, DBUS_TYPE_UINT32, &id);
        dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &name);
        dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &status);
        dbus_message_iter_append_basic(&entry, DBUS_TYPE_INT64, &last_seen);
        dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &address);
        dbus_message_iter_append_basic(&entry, DBUS_TYPE_DOUBLE, &distance);

        dbus_message_iter_close_container(&array, &entry);
    }

    dbus_message_iter_close_container(&iter, &array);
    return reply;
}

// Methods taking a single device id
static DBusMessage* handle_id_method(DBusMessage* msg, const char* member,
                                     accessory::Manager& manager) {
    static const char* ID_METHODS[] = {"Pair", "Connect", "Disconnect", "MarkRanging",
                                       "Recall", "IsKnown"};
    bool known = false;
    for (const char* name : ID_METHODS) {
        if (strcmp(member, name) == 0) known = true;
    }
    if (!known) return nullptr;

    dbus_uint32_t id;
    if (!dbus_message_get_args(msg, nullptr, DBUS_TYPE_UINT32, &id, DBUS_TYPE_INVALID)) {
        return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Expected device id");
    }

    std::cout << "dbus: " << member << "(" << id << ") called" << std::endl;

    if (strcmp(member, "Pair") == 0) return reply_for(msg, manager.pair(id));
    if (strcmp(member, "Connect") == 0) return reply_for(msg, manager.connect(id));
    if (strcmp(member, "Disconnect") == 0) return reply_for(msg, manager.disconnect(id));
    if (strcmp(member, "MarkRanging") == 0) return reply_for(msg, manager.mark_ranging(id));

    if (strcmp(member, "Recall") == 0) {
        auto name = manager.recall(id);
        if (!name) return reply_for(msg, Error::UnknownDevice);
        DBusMessage* reply = dbus_message_new_method_return(msg);
        const char* val = name->c_str();
        dbus_message_append_args(reply, DBUS_TYPE_STRING, &val, DBUS_TYPE_INVALID);
        return reply;
    }

    if (strcmp(member, "IsKnown") == 0) {
        DBusMessage* reply = dbus_message_new_method_return(msg);
        dbus_bool_t val = manager.is_known(id);
        dbus_message_append_args(reply, DBUS_TYPE_BOOLEAN, &val, DBUS_TYPE_INVALID);
        return reply;
    }

    return nullptr;
}

// Methods taking a device id and a name
static DBusMessage* handle_name_method(DBusMessage* msg, const char* member,
                                       accessory::Manager& manager) {
    dbus_uint32_t id;
    const char* name;
    if (!dbus_message_get_args(msg, nullptr,
            DBUS_TYPE_UINT32, &id,
            DBUS_TYPE_STRING, &name,
            DBUS_TYPE_INVALID)) {
        return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Expected device id and name");
    }

    std::cout << "dbus: " << member << "(" << id << ", " << name << ") called" << std::endl;

    if (strcmp(member, "Rename") == 0) {
        return reply_for(msg, manager.rename(id, name));
    }
    manager.remember(id, name);
    return dbus_message_new_method_return(msg);
}

static DBusMessage* handle_send(DBusMessage* msg, accessory::Manager& manager) {
    dbus_uint32_t id;
    const uint8_t* data = nullptr;
    int len = 0;
    if (!dbus_message_get_args(msg, nullptr,
            DBUS_TYPE_UINT32, &id,
            DBUS_TYPE_ARRAY, DBUS_TYPE_BYTE, &data, &len,
            DBUS_TYPE_INVALID)) {
        return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Expected device id and payload");
    }

    std::cout << "dbus: Send(" << id << ", " << len << " bytes) called" << std::endl;
    std::span<const uint8_t> payload(data, len > 0 ? static_cast<size_t>(len) : 0);
    return reply_for(msg, manager.send(payload, id));
}

static DBusMessage* handle_report_distance(DBusMessage* msg, accessory::Manager& manager) {
    dbus_uint32_t id;
    double metres;
    if (!dbus_message_get_args(msg, nullptr,
            DBUS_TYPE_UINT32, &id,
            DBUS_TYPE_DOUBLE, &metres,
            DBUS_TYPE_INVALID)) {
        return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Expected device id and distance");
    }
    return reply_for(msg, manager.report_distance(id, static_cast<float>(metres)));
}

// Message handler
static DBusHandlerResult message_handler(DBusConnection* conn, DBusMessage* msg, void* data) {
    (void)data;

    const char* iface = dbus_message_get_interface(msg);
    const char* member = dbus_message_get_member(msg);
    const char* path = dbus_message_get_path(msg);

    if (!path || strcmp(path, OBJECT_PATH) != 0 || !member || !g_manager) {
        return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
    }

    accessory::Manager& manager = *g_manager;
    DBusMessage* reply = nullptr;

    // Introspection
    if (iface && strcmp(iface, "org.freedesktop.DBus.Introspectable") == 0 &&
        strcmp(member, "Introspect") == 0) {
        reply = dbus_message_new_method_return(msg);
        dbus_message_append_args(reply, DBUS_TYPE_STRING, &INTROSPECT_XML, DBUS_TYPE_INVALID);
    }
    // Properties
    else if (iface && strcmp(iface, "org.freedesktop.DBus.Properties") == 0) {
        if (strcmp(member, "Get") == 0) {
            reply = handle_get(msg, *g_state);
        } else if (strcmp(member, "GetAll") == 0) {
            reply = handle_get_all(msg, *g_state);
        } else if (strcmp(member, "Set") == 0) {
            reply = dbus_message_new_error(msg, DBUS_ERROR_PROPERTY_READ_ONLY, "Property is read-only");
        }
    }
    // Our interface methods
    else if (iface && strcmp(iface, INTERFACE_NAME) == 0) {
        if (strcmp(member, "Start") == 0) {
            std::cout << "dbus: Start() called" << std::endl;
            manager.start();
            reply = dbus_message_new_method_return(msg);
        } else if (strcmp(member, "Stop") == 0) {
            std::cout << "dbus: Stop() called" << std::endl;
            manager.stop();
            reply = dbus_message_new_method_return(msg);
        } else if (strcmp(member, "ForgetAll") == 0) {
            std::cout << "dbus: ForgetAll() called" << std::endl;
            manager.forget_all();
            reply = dbus_message_new_method_return(msg);
        } else if (strcmp(member, "ListDevices") == 0) {
            reply = handle_list_devices(msg, manager);
        } else if (strcmp(member, "Send") == 0) {
            reply = handle_send(msg, manager);
        } else if (strcmp(member, "ReportDistance") == 0) {
            reply = handle_report_distance(msg, manager);
        } else if (strcmp(member, "Rename") == 0 || strcmp(member, "Remember") == 0) {
            reply = handle_name_method(msg, member, manager);
        } else {
            reply = handle_id_method(msg, member, manager);
        }
        if (!reply) {
            reply = dbus_message_new_error(msg, DBUS_ERROR_UNKNOWN_METHOD, "Unknown method");
        }
    }

    if (reply) {
        dbus_connection_send(conn, reply, nullptr);
        dbus_message_unref(reply);
        return DBUS_HANDLER_RESULT_HANDLED;
    }

    return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
}

DBusConnection* init(accessory::Manager* manager, State* state) {
    g_manager = manager;
    g_state = state;

    DBusError err;
    dbus_error_init(&err);

    DBusConnection* conn = dbus_bus_get(DBUS_BUS_SESSION, &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "dbus: connection error: " << err.message << std::endl;
        dbus_error_free(&err);
        return nullptr;
    }

    // Register object path
    DBusObjectPathVTable vtable = {};
    vtable.message_function = message_handler;

    if (!dbus_connection_register_object_path(conn, OBJECT_PATH, &vtable, nullptr)) {
        std::cerr << "dbus: failed to register object path" << std::endl;
        dbus_connection_unref(conn);
        return nullptr;
    }

    return conn;
}

bool request_name(DBusConnection* conn) {
    DBusError err;
    dbus_error_init(&err);

    int ret = dbus_bus_request_name(conn, SERVICE_NAME, DBUS_NAME_FLAG_REPLACE_EXISTING, &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "dbus: name error: " << err.message << std::endl;
        dbus_error_free(&err);
        return false;
    }

    if (ret != DBUS_REQUEST_NAME_REPLY_PRIMARY_OWNER) {
        std::cerr << "dbus: not primary owner of " << SERVICE_NAME << std::endl;
        return false;
    }

    std::cout << "dbus: registered service " << SERVICE_NAME << std::endl;
    return true;
}

void emit_properties_changed(DBusConnection* conn, const State& state,
                              const char** property_names, int num_properties) {
    DBusMessage* signal = dbus_message_new_signal(OBJECT_PATH,
        "org.freedesktop.DBus.Properties", "PropertiesChanged");
    if (!signal) return;

    DBusMessageIter iter, dict, entry;
    dbus_message_iter_init_append(signal, &iter);

    // Interface name
    const char* iface = INTERFACE_NAME;
    dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, &iface);

    // Changed properties dict
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sv}", &dict);

    for (int i = 0; i < num_properties; i++) {
        const char* prop = property_names[i];
        dbus_message_iter_open_container(&dict, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
        dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &prop);
        append_property(&entry, state, prop);
        dbus_message_iter_close_container(&dict, &entry);
    }
    dbus_message_iter_close_container(&iter, &dict);

    // Invalidated properties (empty array)
    DBusMessageIter invalidated;
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "s", &invalidated);
    dbus_message_iter_close_container(&iter, &invalidated);

    dbus_connection_send(conn, signal, nullptr);
    dbus_message_unref(signal);
}

void update_from_manager(DBusConnection* conn, State* state,
                         const accessory::Manager& manager) {
    std::vector<const char*> changed;

    if (state->adapter_ready != manager.adapter_ready()) {
        state->adapter_ready = manager.adapter_ready();
        changed.push_back("AdapterReady");
    }

    if (state->scanning != manager.scanning()) {
        state->scanning = manager.scanning();
        changed.push_back("Scanning");
    }

    uint32_t count = static_cast<uint32_t>(manager.registry().size());
    if (state->device_count != count) {
        state->device_count = count;
        changed.push_back("DeviceCount");
    }

    if (!changed.empty()) {
        emit_properties_changed(conn, *state, changed.data(), static_cast<int>(changed.size()));
    }
}

static void send_signal(DBusConnection* conn, DBusMessage* signal) {
    dbus_connection_send(conn, signal, nullptr);
    dbus_message_unref(signal);
}

void emit_registry_changed(DBusConnection* conn, size_t position, uint32_t id, bool inserted) {
    DBusMessage* signal = dbus_message_new_signal(OBJECT_PATH, INTERFACE_NAME, "RegistryChanged");
    if (!signal) return;

    dbus_uint32_t pos = static_cast<dbus_uint32_t>(position);
    dbus_uint32_t uid = id;
    dbus_bool_t ins = inserted;
    dbus_message_append_args(signal,
                             DBUS_TYPE_UINT32, &pos,
                             DBUS_TYPE_UINT32, &uid,
                             DBUS_TYPE_BOOLEAN, &ins,
                             DBUS_TYPE_INVALID);
    send_signal(conn, signal);
}

void emit_device_connected(DBusConnection* conn, uint32_t id) {
    DBusMessage* signal = dbus_message_new_signal(OBJECT_PATH, INTERFACE_NAME, "DeviceConnected");
    if (!signal) return;

    dbus_uint32_t uid = id;
    dbus_message_append_args(signal, DBUS_TYPE_UINT32, &uid, DBUS_TYPE_INVALID);
    send_signal(conn, signal);
}

void emit_device_disconnected(DBusConnection* conn, uint32_t id) {
    DBusMessage* signal = dbus_message_new_signal(OBJECT_PATH, INTERFACE_NAME, "DeviceDisconnected");
    if (!signal) return;

    dbus_uint32_t uid = id;
    dbus_message_append_args(signal, DBUS_TYPE_UINT32, &uid, DBUS_TYPE_INVALID);
    send_signal(conn, signal);
}

void emit_pairing_payload(DBusConnection* conn, uint32_t id, std::span<const uint8_t> bytes) {
    DBusMessage* signal = dbus_message_new_signal(OBJECT_PATH, INTERFACE_NAME, "PairingPayload");
    if (!signal) return;

    DBusMessageIter iter;
    dbus_message_iter_init_append(signal, &iter);
    dbus_uint32_t uid = id;
    dbus_message_iter_append_basic(&iter, DBUS_TYPE_UINT32, &uid);
    append_bytes(&iter, bytes);
    send_signal(conn, signal);
}

void emit_data_payload(DBusConnection* conn, uint32_t id, const std::string& name,
                       std::span<const uint8_t> bytes) {
    DBusMessage* signal = dbus_message_new_signal(OBJECT_PATH, INTERFACE_NAME, "DataPayload");
    if (!signal) return;

    DBusMessageIter iter;
    dbus_message_iter_init_append(signal, &iter);
    dbus_uint32_t uid = id;
    const char* name_str = name.c_str();
    dbus_message_iter_append_basic(&iter, DBUS_TYPE_UINT32, &uid);
    dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, &name_str);
    append_bytes(&iter, bytes);
    send_signal(conn, signal);
}

void process_pending(DBusConnection* conn) {
    dbus_connection_read_write(conn, 0);
    while (dbus_connection_dispatch(conn) == DBUS_DISPATCH_DATA_REMAINS) {
        // Keep processing
    }
}

int get_fd(DBusConnection* conn) {
    int fd = -1;
    if (!dbus_connection_get_unix_fd(conn, &fd)) {
        return -1;
    }
    return fd;
}

void cleanup(DBusConnection* conn) {
    if (conn) {
        dbus_connection_unregister_object_path(conn, OBJECT_PATH);
        dbus_connection_unref(conn);
    }
    g_manager = nullptr;
    g_state = nullptr;
}

} // namespace dbus_service
