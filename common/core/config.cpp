#include "config.hpp"
#include <cstdlib>

namespace accessory {

std::string default_known_devices_path() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::string(xdg) + "/accessory/known_devices";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::string(home) + "/.config/accessory/known_devices";
    }
    return "known_devices";
}

} // namespace accessory
