#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "../fleet/fleet_config.h"

namespace FleetLayout {

/**
 * Picks metadata servers for new instances, striping them across racks (and
 * so across AZs, since the rack list is itself striped across AZs). The order
 * is deterministic:
 *
 *     rack 0, server 0
 *     rack 1, server 0
 *     ...
 *     rack 0, server 1
 *     rack 1, server 1
 *     ...
 *
 * cycling back to the start once every server has been used. Racks with
 * fewer servers drop out early, so they end up with fewer instances.
 *
 * Each allocation class keeps its own position in this order. A class used
 * for the first time starts at the beginning, independently of the others.
 */
class MetadataAllocator {
public:
    explicit MetadataAllocator(const FleetConfig& config);

    // Returns the server for the next allocation of "alloc_class". This does
    // not record an instance on it.
    const std::string& Next(const std::string& alloc_class);

    // Number of allocations made so far for "alloc_class"
    size_t Allocated(const std::string& alloc_class) const;

    const std::vector<std::string>& striped() const { return striped_; }

private:
    std::vector<std::string> striped_;
    absl::flat_hash_map<std::string, size_t> cursors_;
};

} // namespace FleetLayout
