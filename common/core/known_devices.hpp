#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace accessory {

// Persistent mapping of previously paired accessory ids to display names
class KnownDeviceStore {
public:
    virtual ~KnownDeviceStore() = default;

    virtual std::optional<std::string> get(uint32_t id) const = 0;
    virtual void set(uint32_t id, const std::string& name) = 0;
    virtual bool exists(uint32_t id) const = 0;
    virtual void clear() = 0;
};

// One "id<TAB>name" line per entry. Loaded on construction, rewritten after
// every change. A missing file is an empty store.
class FileKnownDeviceStore : public KnownDeviceStore {
public:
    explicit FileKnownDeviceStore(std::string path);

    std::optional<std::string> get(uint32_t id) const override;
    void set(uint32_t id, const std::string& name) override;
    bool exists(uint32_t id) const override;
    void clear() override;

    const std::string& path() const { return path_; }
    size_t size() const { return entries_.size(); }

private:
    void load();
    bool save() const;

    std::string path_;
    std::map<uint32_t, std::string> entries_;
};

} // namespace accessory
