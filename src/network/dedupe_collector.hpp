#pragma once

#include "core/device.hpp"

#include <QSet>
#include <QString>
#include <cstddef>
#include <vector>

namespace lumen::network {

/**
 * DedupeCollector - Unique devices seen during one discovery session.
 *
 * Keyed by Device::identity(). The first advertisement for an id is kept and
 * later ones are dropped, even when their state differs. Not shared between
 * sessions or threads.
 */
class DedupeCollector {
public:
    // Returns true when the device was new and has been kept.
    bool offer(Device device);

    [[nodiscard]] bool contains(const QString& id) const { return seen_.contains(id); }
    [[nodiscard]] std::size_t size() const { return devices_.size(); }

    // Devices in first-seen order; leaves the collector empty.
    [[nodiscard]] std::vector<Device> finish();

private:
    QSet<QString> seen_;
    std::vector<Device> devices_;
};

} // namespace lumen::network
