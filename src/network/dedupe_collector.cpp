#include "network/dedupe_collector.hpp"

#include <utility>

namespace lumen::network {

bool DedupeCollector::offer(Device device) {
    if (seen_.contains(device.identity())) {
        return false;
    }
    seen_.insert(device.identity());
    devices_.push_back(std::move(device));
    return true;
}

std::vector<Device> DedupeCollector::finish() {
    seen_.clear();
    return std::exchange(devices_, {});
}

} // namespace lumen::network
