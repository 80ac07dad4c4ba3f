#pragma once

#include <types/device.hpp>
#include <types/enums.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace accessory {

// Owns every live DeviceRecord, in insertion order.
//
// Pointers returned by lookup() stay valid until the next insert or remove.
// Consumers that need to hold on to the contents use snapshot().
class Registry {
public:
    using ChangedFn = std::function<void(size_t position, uint32_t id, bool inserted)>;

    Registry() = default;
    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    void set_on_changed(ChangedFn fn) { on_changed_ = std::move(fn); }

    // Appends the record; DuplicateDevice if its unique_id is already present
    Result<size_t> insert(DeviceRecord record);

    // Destroys the record at position (and the peripheral it owns)
    Error remove(size_t position);

    DeviceRecord* lookup(uint32_t unique_id);
    const DeviceRecord* lookup(uint32_t unique_id) const;
    DeviceRecord* lookup_by_handle(const std::string& handle);

    std::optional<size_t> position_of(uint32_t unique_id) const;

    std::vector<DeviceSnapshot> snapshot() const;

    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

private:
    std::vector<DeviceRecord> records_;
    ChangedFn on_changed_;
};

} // namespace accessory
