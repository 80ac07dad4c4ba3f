#pragma once

#include <core/known_devices.hpp>
#include <core/transport.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace accessory::testing {

// Records every request; completions are delivered by the test as events
class FakeTransport : public Transport {
public:
    struct Write {
        std::string device;
        std::string channel;
        std::vector<uint8_t> bytes;
    };

    struct Notify {
        std::string channel;
        bool enable;
    };

    bool start_scan() override {
        ++start_scans;
        return !fail_scan;
    }

    void stop_scan() override { ++stop_scans; }

    bool connect(const std::string& device) override {
        connects.push_back(device);
        return !fail_connect;
    }

    bool disconnect(const std::string& device) override {
        disconnects.push_back(device);
        return true;
    }

    bool discover_services(const std::string& device) override {
        service_discoveries.push_back(device);
        return true;
    }

    bool discover_characteristics(const std::string& device) override {
        characteristic_discoveries.push_back(device);
        return true;
    }

    bool read(const std::string&, ChannelRole role, const std::string& channel) override {
        reads.emplace_back(role, channel);
        return !fail_read;
    }

    bool write(const std::string& device, ChannelRole, const std::string& channel,
               std::span<const uint8_t> data) override {
        if (fail_write_after >= 0 && static_cast<int>(writes.size()) >= fail_write_after) {
            ++failed_writes;
            return false;
        }
        writes.push_back({device, channel, std::vector<uint8_t>(data.begin(), data.end())});
        return true;
    }

    bool set_notify(const std::string&, ChannelRole, const std::string& channel,
                    bool enable) override {
        notifies.push_back({channel, enable});
        return true;
    }

    size_t max_write_size(const std::string&, const std::string&) override {
        return max_write;
    }

    int start_scans = 0;
    int stop_scans = 0;
    std::vector<std::string> connects;
    std::vector<std::string> disconnects;
    std::vector<std::string> service_discoveries;
    std::vector<std::string> characteristic_discoveries;
    std::vector<std::pair<ChannelRole, std::string>> reads;
    std::vector<Write> writes;
    std::vector<Notify> notifies;
    int failed_writes = 0;

    size_t max_write = 20;
    bool fail_scan = false;
    bool fail_connect = false;
    bool fail_read = false;
    // Writes accepted before every further write fails; -1 never fails
    int fail_write_after = -1;
};

class MemoryKnownDeviceStore : public KnownDeviceStore {
public:
    std::optional<std::string> get(uint32_t id) const override {
        auto it = entries.find(id);
        if (it == entries.end()) return std::nullopt;
        return it->second;
    }

    void set(uint32_t id, const std::string& name) override { entries[id] = name; }
    bool exists(uint32_t id) const override { return entries.count(id) != 0; }
    void clear() override { entries.clear(); }

    std::map<uint32_t, std::string> entries;
};

} // namespace accessory::testing
