#include "registry.hpp"
#include <algorithm>

namespace accessory {

Result<size_t> Registry::insert(DeviceRecord record) {
    if (position_of(record.unique_id)) {
        return Result<size_t>::fail(Error::DuplicateDevice);
    }

    uint32_t id = record.unique_id;
    records_.push_back(std::move(record));
    size_t position = records_.size() - 1;

    if (on_changed_) {
        on_changed_(position, id, true);
    }
    return Result<size_t>::ok(position);
}

Error Registry::remove(size_t position) {
    if (position >= records_.size()) {
        return Error::IndexOutOfRange;
    }

    uint32_t id = records_[position].unique_id;
    records_.erase(records_.begin() + static_cast<std::ptrdiff_t>(position));

    if (on_changed_) {
        on_changed_(position, id, false);
    }
    return Error::None;
}

DeviceRecord* Registry::lookup(uint32_t unique_id) {
    auto it = std::find_if(records_.begin(), records_.end(),
                           [&](const DeviceRecord& r) { return r.unique_id == unique_id; });
    return it != records_.end() ? &*it : nullptr;
}

const DeviceRecord* Registry::lookup(uint32_t unique_id) const {
    auto it = std::find_if(records_.begin(), records_.end(),
                           [&](const DeviceRecord& r) { return r.unique_id == unique_id; });
    return it != records_.end() ? &*it : nullptr;
}

DeviceRecord* Registry::lookup_by_handle(const std::string& handle) {
    if (handle.empty()) return nullptr;
    auto it = std::find_if(records_.begin(), records_.end(),
                           [&](const DeviceRecord& r) { return r.peripheral.handle() == handle; });
    return it != records_.end() ? &*it : nullptr;
}

std::optional<size_t> Registry::position_of(uint32_t unique_id) const {
    for (size_t i = 0; i < records_.size(); ++i) {
        if (records_[i].unique_id == unique_id) {
            return i;
        }
    }
    return std::nullopt;
}

std::vector<DeviceSnapshot> Registry::snapshot() const {
    std::vector<DeviceSnapshot> result;
    result.reserve(records_.size());
    for (const auto& record : records_) {
        result.push_back(snapshot_of(record));
    }
    return result;
}

} // namespace accessory
