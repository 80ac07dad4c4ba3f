#include "bluez.hpp"
#include "dbus.hpp"
#include "timer.hpp"

#include <core/config.hpp>
#include <core/known_devices.hpp>
#include <core/manager.hpp>
#include <protocol/hex.hpp>

#include <poll.h>
#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

// Global state (for daemon mode)
static std::atomic<bool> g_running{true};
static DBusConnection* g_session_dbus = nullptr;
static DBusConnection* g_system_dbus = nullptr;
static dbus_service::State g_dbus_state;

// Signal handler
static void signal_handler(int signum) {
    std::cout << "\nReceived signal " << signum << ", shutting down..." << std::endl;
    g_running = false;
}

// Route BlueZ signals from the system bus to the central
static DBusHandlerResult bluez_filter(DBusConnection* conn, DBusMessage* msg, void* data) {
    (void)conn;
    auto* central = static_cast<bluez::Central*>(data);

    if (dbus_message_get_type(msg) == DBUS_MESSAGE_TYPE_SIGNAL) {
        if (central->handle_signal(msg)) {
            return DBUS_HANDLER_RESULT_HANDLED;
        }
    }
    return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
}

// Hand every queued transport event to the manager
static void drain_events(bluez::Central& central, accessory::Manager& manager) {
    while (central.has_events()) {
        for (const auto& event : central.take_events()) {
            manager.handle(event);
        }
    }
}

// Main event loop
static void run_event_loop(bluez::Central& central, accessory::Manager& manager,
                           const timer::Periodic& sweep_timer) {
    while (g_running) {
        std::vector<pollfd> fds(3);

        // Session D-Bus fd (commands)
        fds[0].fd = dbus_service::get_fd(g_session_dbus);
        fds[0].events = POLLIN;

        // System D-Bus fd (BlueZ signals and replies)
        int system_fd = -1;
        if (!dbus_connection_get_unix_fd(g_system_dbus, &system_fd)) {
            system_fd = -1;
        }
        fds[1].fd = system_fd;
        fds[1].events = POLLIN;

        // Sweep timer
        fds[2].fd = timer::get_fd(sweep_timer);
        fds[2].events = POLLIN;

        int ret = poll(fds.data(), fds.size(), 100);
        if (ret < 0) {
            if (errno == EINTR) continue;
            std::cerr << "poll error: " << strerror(errno) << std::endl;
            break;
        }

        // Process system D-Bus (BlueZ signals and async replies)
        if (fds[1].revents & POLLIN) {
            dbus_connection_read_write(g_system_dbus, 0);
            while (dbus_connection_dispatch(g_system_dbus) == DBUS_DISPATCH_DATA_REMAINS) {}
        }
        drain_events(central, manager);

        // Process session D-Bus (commands); replies to commands may queue events
        if (fds[0].revents & POLLIN) {
            dbus_service::process_pending(g_session_dbus);
        }
        drain_events(central, manager);

        if (fds[2].revents & POLLIN) {
            // Several missed ticks collapse into one sweep
            if (timer::drain(sweep_timer) > 0) {
                manager.sweep();
            }
        }

        if (fds[1].revents & (POLLERR | POLLHUP)) {
            std::cerr << "System D-Bus connection lost" << std::endl;
            break;
        }

        dbus_service::update_from_manager(g_session_dbus, &g_dbus_state, manager);
        dbus_connection_flush(g_session_dbus);
    }
}

// ============================================================================
// Subcommand implementations
// ============================================================================

static int cmd_daemon(const accessory::Config& config) {
    // Set up signal handlers
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    std::cout << "Accessory daemon starting..." << std::endl;

    // Connect to system D-Bus (for BlueZ)
    DBusError err;
    dbus_error_init(&err);

    g_system_dbus = dbus_bus_get(DBUS_BUS_SYSTEM, &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "Failed to connect to system D-Bus: " << err.message << std::endl;
        dbus_error_free(&err);
        return 1;
    }

    accessory::FileKnownDeviceStore store(config.known_devices_path);
    std::cout << "Known devices: " << store.size() << " in " << store.path() << std::endl;

    bluez::Central central(g_system_dbus);
    accessory::Manager manager(central, store, config);

    // Initialize session D-Bus service
    g_session_dbus = dbus_service::init(&manager, &g_dbus_state);
    if (!g_session_dbus) {
        std::cerr << "Failed to initialize D-Bus service" << std::endl;
        dbus_connection_unref(g_system_dbus);
        return 1;
    }

    if (!dbus_service::request_name(g_session_dbus)) {
        std::cerr << "Failed to request D-Bus name" << std::endl;
        dbus_service::cleanup(g_session_dbus);
        dbus_connection_unref(g_system_dbus);
        return 1;
    }

    // Manager notifications become session bus signals
    accessory::Callbacks callbacks;
    callbacks.on_registry_changed = [](size_t position, uint32_t id, bool inserted) {
        dbus_service::emit_registry_changed(g_session_dbus, position, id, inserted);
    };
    callbacks.on_pairing_payload = [](const std::vector<uint8_t>& bytes, uint32_t id) {
        dbus_service::emit_pairing_payload(g_session_dbus, id, bytes);
    };
    callbacks.on_connected = [](uint32_t id) {
        std::cout << "Accessory " << id << " connected" << std::endl;
        dbus_service::emit_device_connected(g_session_dbus, id);
    };
    callbacks.on_disconnected = [](uint32_t id) {
        std::cout << "Accessory " << id << " disconnected" << std::endl;
        dbus_service::emit_device_disconnected(g_session_dbus, id);
    };
    callbacks.on_data_payload = [](const std::vector<uint8_t>& bytes, const std::string& name,
                                   uint32_t id) {
        dbus_service::emit_data_payload(g_session_dbus, id, name, bytes);
    };
    manager.set_callbacks(std::move(callbacks));

    // Set up BlueZ signal filter
    dbus_connection_add_filter(g_system_dbus, bluez_filter, &central, nullptr);
    if (!central.init()) {
        std::cerr << "Failed to initialize BlueZ central" << std::endl;
        dbus_connection_remove_filter(g_system_dbus, bluez_filter, &central);
        dbus_service::cleanup(g_session_dbus);
        dbus_connection_unref(g_system_dbus);
        return 1;
    }
    drain_events(central, manager);

    auto sweep_timer = timer::start(config.sweep_period_ms);
    if (!sweep_timer.is_open()) {
        std::cerr << "Failed to start sweep timer" << std::endl;
        dbus_connection_remove_filter(g_system_dbus, bluez_filter, &central);
        dbus_service::cleanup(g_session_dbus);
        dbus_connection_unref(g_system_dbus);
        return 1;
    }

    std::cout << "Daemon ready. D-Bus service: " << dbus_service::SERVICE_NAME << std::endl;

    // Run event loop
    run_event_loop(central, manager, sweep_timer);

    manager.stop();
    dbus_connection_flush(g_system_dbus);

    // Cleanup
    dbus_connection_remove_filter(g_system_dbus, bluez_filter, &central);
    dbus_service::cleanup(g_session_dbus);
    g_session_dbus = nullptr;

    std::cout << "Daemon stopped" << std::endl;
    return 0;
}

// ============================================================================
// Client side: call the daemon over the session bus
// ============================================================================

static DBusConnection* connect_session() {
    DBusError err;
    dbus_error_init(&err);

    DBusConnection* conn = dbus_bus_get(DBUS_BUS_SESSION, &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "Failed to connect to session D-Bus: " << err.message << std::endl;
        dbus_error_free(&err);
        return nullptr;
    }
    return conn;
}

// Call a daemon method, returns the reply (caller unrefs) or nullptr on failure.
// append fills in the arguments, if any.
static DBusMessage* call_daemon(DBusConnection* conn, const char* method,
                                const std::function<void(DBusMessage*)>& append = {}) {
    DBusMessage* msg = dbus_message_new_method_call(
        dbus_service::SERVICE_NAME,
        dbus_service::OBJECT_PATH,
        dbus_service::INTERFACE_NAME,
        method
    );
    if (!msg) {
        std::cerr << "Failed to create D-Bus message" << std::endl;
        return nullptr;
    }

    if (append) append(msg);

    DBusError err;
    dbus_error_init(&err);

    DBusMessage* reply = dbus_connection_send_with_reply_and_block(conn, msg, 5000, &err);
    dbus_message_unref(msg);

    if (dbus_error_is_set(&err)) {
        if (strncmp(err.name, dbus_service::ERROR_PREFIX, strlen(dbus_service::ERROR_PREFIX)) == 0) {
            std::cerr << method << " failed: " << err.message << std::endl;
        } else {
            std::cerr << method << " failed (is daemon running?): " << err.message << std::endl;
        }
        dbus_error_free(&err);
        return nullptr;
    }
    return reply;
}

static std::optional<uint32_t> parse_id(const char* text) {
    uint32_t id = 0;
    const char* end = text + strlen(text);
    auto [ptr, ec] = std::from_chars(text, end, id);
    if (ec != std::errc{} || ptr != end) {
        std::cerr << "Invalid device id: " << text << std::endl;
        return std::nullopt;
    }
    return id;
}

// Methods without arguments or results (Start, Stop, ForgetAll)
static int cmd_simple(const char* method, const char* done) {
    DBusConnection* conn = connect_session();
    if (!conn) return 1;

    DBusMessage* reply = call_daemon(conn, method);
    dbus_connection_unref(conn);
    if (!reply) return 1;

    dbus_message_unref(reply);
    std::cout << done << std::endl;
    return 0;
}

// Methods taking only a device id (Pair, Connect, Disconnect)
static int cmd_with_id(const char* method, const char* id_str) {
    auto id = parse_id(id_str);
    if (!id) return 1;

    DBusConnection* conn = connect_session();
    if (!conn) return 1;

    dbus_uint32_t uid = *id;
    DBusMessage* reply = call_daemon(conn, method, [&](DBusMessage* msg) {
        dbus_message_append_args(msg, DBUS_TYPE_UINT32, &uid, DBUS_TYPE_INVALID);
    });
    dbus_connection_unref(conn);
    if (!reply) return 1;

    dbus_message_unref(reply);
    std::cout << method << " requested for " << uid << std::endl;
    return 0;
}

// Methods taking a device id and a name (Rename, Remember)
static int cmd_with_name(const char* method, const char* id_str, const char* name) {
    auto id = parse_id(id_str);
    if (!id) return 1;

    DBusConnection* conn = connect_session();
    if (!conn) return 1;

    dbus_uint32_t uid = *id;
    DBusMessage* reply = call_daemon(conn, method, [&](DBusMessage* msg) {
        dbus_message_append_args(msg, DBUS_TYPE_UINT32, &uid,
                                 DBUS_TYPE_STRING, &name, DBUS_TYPE_INVALID);
    });
    dbus_connection_unref(conn);
    if (!reply) return 1;

    dbus_message_unref(reply);
    std::cout << uid << ": " << name << std::endl;
    return 0;
}

static int cmd_send(const char* id_str, const char* hex_str) {
    auto id = parse_id(id_str);
    if (!id) return 1;

    auto payload = accessory::hex::parse(hex_str);
    if (!payload) {
        std::cerr << "Invalid hex payload: " << hex_str << std::endl;
        return 1;
    }

    DBusConnection* conn = connect_session();
    if (!conn) return 1;

    dbus_uint32_t uid = *id;
    const uint8_t* data = payload->data();
    int len = static_cast<int>(payload->size());
    DBusMessage* reply = call_daemon(conn, "Send", [&](DBusMessage* msg) {
        dbus_message_append_args(msg, DBUS_TYPE_UINT32, &uid,
                                 DBUS_TYPE_ARRAY, DBUS_TYPE_BYTE, &data, len,
                                 DBUS_TYPE_INVALID);
    });
    dbus_connection_unref(conn);
    if (!reply) return 1;

    dbus_message_unref(reply);
    std::cout << "Sent " << payload->size() << " bytes to " << uid << std::endl;
    return 0;
}

static int cmd_recall(const char* id_str) {
    auto id = parse_id(id_str);
    if (!id) return 1;

    DBusConnection* conn = connect_session();
    if (!conn) return 1;

    dbus_uint32_t uid = *id;
    DBusMessage* reply = call_daemon(conn, "Recall", [&](DBusMessage* msg) {
        dbus_message_append_args(msg, DBUS_TYPE_UINT32, &uid, DBUS_TYPE_INVALID);
    });
    dbus_connection_unref(conn);
    if (!reply) return 1;

    const char* name = nullptr;
    DBusError err;
    dbus_error_init(&err);
    if (!dbus_message_get_args(reply, &err, DBUS_TYPE_STRING, &name, DBUS_TYPE_INVALID)) {
        std::cerr << "Unexpected reply: " << err.message << std::endl;
        dbus_error_free(&err);
        dbus_message_unref(reply);
        return 1;
    }

    std::cout << uid << ": " << name << std::endl;
    dbus_message_unref(reply);
    return 0;
}

static int cmd_list() {
    DBusConnection* conn = connect_session();
    if (!conn) return 1;

    DBusMessage* reply = call_daemon(conn, "ListDevices");
    dbus_connection_unref(conn);
    if (!reply) return 1;

    DBusMessageIter iter, array;
    if (!dbus_message_iter_init(reply, &iter) ||
        dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_ARRAY) {
        std::cerr << "Unexpected reply" << std::endl;
        dbus_message_unref(reply);
        return 1;
    }

    dbus_message_iter_recurse(&iter, &array);

    int count = 0;
    while (dbus_message_iter_get_arg_type(&array) == DBUS_TYPE_STRUCT) {
        DBusMessageIter entry;
        dbus_message_iter_recurse(&array, &entry);

        dbus_uint32_t id;
        const char* name;
        const char* status;
        dbus_int64_t last_seen;
        const char* address;
        double distance;

        dbus_message_iter_get_basic(&entry, &id);
        dbus_message_iter_next(&entry);
        dbus_message_iter_get_basic(&entry, &name);
        dbus_message_iter_next(&entry);
        dbus_message_iter_get_basic(&entry, &status);
        dbus_message_iter_next(&entry);
        dbus_message_iter_get_basic(&entry, &last_seen);
        dbus_message_iter_next(&entry);
        dbus_message_iter_get_basic(&entry, &address);
        dbus_message_iter_next(&entry);
        dbus_message_iter_get_basic(&entry, &distance);

        std::cout << id << "  " << name << "  " << address << "  " << status
                  << "  last seen " << last_seen << " ms";
        if (distance >= 0) {
            std::cout << "  " << distance << " m";
        }
        std::cout << std::endl;

        ++count;
        dbus_message_iter_next(&array);
    }

    if (count == 0) {
        std::cout << "No accessories in range" << std::endl;
    }

    dbus_message_unref(reply);
    return 0;
}

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  daemon [--store <path>]   Run the accessory daemon\n"
              << "  list                      List accessories in range\n"
              << "  start                     Start scanning\n"
              << "  stop                      Stop scanning\n"
              << "  connect <id>              Connect to an accessory\n"
              << "  pair <id>                 Read pairing data from a connected accessory\n"
              << "  disconnect <id>           Disconnect from an accessory\n"
              << "  send <id> <hex>           Write bytes to an accessory\n"
              << "  rename <id> <name>        Change an accessory's display name\n"
              << "  remember <id> <name>      Store an accessory as known\n"
              << "  recall <id>               Show the stored name of a known accessory\n"
              << "  forget                    Forget all known accessories\n"
              << "  help                      Show this help\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string cmd = argv[1];

    // Require n arguments after the command
    auto need = [&](int n, const char* usage) {
        if (argc < 2 + n) {
            std::cerr << "Usage: " << argv[0] << " " << usage << "\n";
            return false;
        }
        return true;
    };

    if (cmd == "daemon") {
        accessory::Config config;
        config.known_devices_path = accessory::default_known_devices_path();
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--store" && i + 1 < argc) {
                config.known_devices_path = argv[++i];
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }
        return cmd_daemon(config);
    } else if (cmd == "list") {
        return cmd_list();
    } else if (cmd == "start") {
        return cmd_simple("Start", "Scanning requested");
    } else if (cmd == "stop") {
        return cmd_simple("Stop", "Scanning stopped");
    } else if (cmd == "forget") {
        return cmd_simple("ForgetAll", "Known accessories cleared");
    } else if (cmd == "connect") {
        if (!need(1, "connect <id>")) return 1;
        return cmd_with_id("Connect", argv[2]);
    } else if (cmd == "pair") {
        if (!need(1, "pair <id>")) return 1;
        return cmd_with_id("Pair", argv[2]);
    } else if (cmd == "disconnect") {
        if (!need(1, "disconnect <id>")) return 1;
        return cmd_with_id("Disconnect", argv[2]);
    } else if (cmd == "send") {
        if (!need(2, "send <id> <hex>")) return 1;
        return cmd_send(argv[2], argv[3]);
    } else if (cmd == "rename") {
        if (!need(2, "rename <id> <name>")) return 1;
        return cmd_with_name("Rename", argv[2], argv[3]);
    } else if (cmd == "remember") {
        if (!need(2, "remember <id> <name>")) return 1;
        return cmd_with_name("Remember", argv[2], argv[3]);
    } else if (cmd == "recall") {
        if (!need(1, "recall <id>")) return 1;
        return cmd_recall(argv[2]);
    } else if (cmd == "help" || cmd == "--help" || cmd == "-h") {
        print_usage(argv[0]);
        return 0;
    } else {
        std::cerr << "Unknown command: " << cmd << std::endl;
        print_usage(argv[0]);
        return 1;
    }
}
