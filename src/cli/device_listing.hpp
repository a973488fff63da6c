#pragma once

#include "core/device.hpp"

#include <QString>
#include <vector>

namespace lumen::cli {

struct ListingOptions {
    bool includeLocation = true;
    bool includeCommands = false;
};

// One line per device, sorted by id:
//   <id>  <model>  <power>  <name> (<location>)
[[nodiscard]] QString format_device_table(const std::vector<Device>& devices,
                                          const ListingOptions& options = {});

// JSON output:
// {
//   "devices": [{ "id", "model", "firmwareVersion", "power", "brightness",
//                 "colorMode", "colorTemperature", "rgb": {r,g,b}, "hue",
//                 "saturation", "name", "location"?, "support"? }]
// }
[[nodiscard]] QString format_device_json(const std::vector<Device>& devices,
                                         const ListingOptions& options = {});

} // namespace lumen::cli
