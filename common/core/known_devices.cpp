#include "known_devices.hpp"
#include <charconv>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace accessory {

FileKnownDeviceStore::FileKnownDeviceStore(std::string path) : path_(std::move(path)) {
    load();
}

std::optional<std::string> FileKnownDeviceStore::get(uint32_t id) const {
    auto it = entries_.find(id);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

void FileKnownDeviceStore::set(uint32_t id, const std::string& name) {
    // Names are single-line
    std::string clean = name;
    for (auto& c : clean) {
        if (c == '\n' || c == '\r' || c == '\t') c = ' ';
    }
    entries_[id] = std::move(clean);
    save();
}

bool FileKnownDeviceStore::exists(uint32_t id) const {
    return entries_.count(id) != 0;
}

void FileKnownDeviceStore::clear() {
    entries_.clear();
    save();
}

void FileKnownDeviceStore::load() {
    std::ifstream in(path_);
    if (!in) return;

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty()) continue;

        auto tab = line.find('\t');
        if (tab == std::string::npos) {
            std::cerr << "store: " << path_ << ":" << line_no << ": malformed entry" << std::endl;
            continue;
        }

        uint32_t id = 0;
        auto [ptr, ec] = std::from_chars(line.data(), line.data() + tab, id);
        if (ec != std::errc{} || ptr != line.data() + tab) {
            std::cerr << "store: " << path_ << ":" << line_no << ": bad id" << std::endl;
            continue;
        }
        entries_[id] = line.substr(tab + 1);
    }
}

bool FileKnownDeviceStore::save() const {
    std::error_code ec;
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            std::cerr << "store: cannot create " << parent << ": " << ec.message() << std::endl;
            return false;
        }
    }

    std::ofstream out(path_, std::ios::trunc);
    if (!out) {
        std::cerr << "store: cannot write " << path_ << std::endl;
        return false;
    }
    for (const auto& [id, name] : entries_) {
        out << id << '\t' << name << '\n';
    }
    return static_cast<bool>(out);
}

} // namespace accessory
