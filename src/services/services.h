#pragma once

#include <optional>
#include <string>
#include <vector>

#include "absl/container/btree_map.h"

namespace YAML {
class Emitter;
}

namespace FleetLayout {

// Service name -> image identifier
using ImageMap = absl::btree_map<std::string, std::string>;

/**
 * How the layout generator decides instance counts and servers for a service.
 * The meaning of ServiceInfo::param depends on the policy.
 */
enum class PlacementPolicy {
    EXACT,            // param instances, allocation class "small"
    FRONTDOOR,        // param is the ratio against FRONTDOOR_MAX_INSTANCES
    PER_SHARD,        // param instances for every shard, own allocation class
    ONE_PER_STORAGE,  // one instance on each storage server
    COMPUTE,          // sized from each storage server's DRAM
    NONE              // never placed automatically
};

struct ServiceInfo {
    const char* name;
    bool sharded;
    bool oneach;      // usable with per-zone command execution
    bool alarms;      // supports alarm checks
    PlacementPolicy policy;
    int param;
};

// All known services, in the order they get deployed
const std::vector<ServiceInfo>& ServiceCatalog();
std::vector<std::string> ServiceNames();

// Returns nullptr for unknown services
const ServiceInfo* LookupService(const std::string& name);

bool ServiceNameIsValid(const std::string& name);
bool ServiceIsSharded(const std::string& name);
bool ServiceSupportsOneach(const std::string& name);
bool ServiceSupportsAlarms(const std::string& name);

// Placeholder images for every automatically placed service, e.g.
// "electric-moray" -> "ELECTRIC_MORAY_IMAGE".
ImageMap DefaultImageMap();

/**
 * Properties that distinguish otherwise identical instances of a service:
 * the image and, for sharded services, the shard number.
 */
struct InstanceProperties {
    std::optional<int> shard;
    std::string image;

    bool operator==(const InstanceProperties& other) const {
        return shard == other.shard && image == other.image;
    }
    bool operator!=(const InstanceProperties& other) const { return !(*this == other); }
};

/**
 * Count of service instances grouped by distinct InstanceProperties. There is
 * one per service per server, one per service per AZ and one per service for
 * the whole region. Few distinct configurations are expected for a service,
 * so buckets are kept in a flat list in the order they were first seen.
 */
class ServiceConfiguration {
public:
    struct Bucket {
        InstanceProperties properties;
        int count;
    };

    void Increment(const InstanceProperties& properties, int count = 1);

    // Number of instances having exactly these properties
    int Get(const InstanceProperties& properties) const;
    bool Has(const InstanceProperties& properties) const;

    int Total() const;
    bool empty() const { return buckets_.empty(); }
    const std::vector<Bucket>& buckets() const { return buckets_; }

    // Writes the list of {shard, image_uuid, count} entries. "shard" is
    // omitted for instances without one.
    void EmitSummary(YAML::Emitter& out) const;

private:
    std::vector<Bucket> buckets_;
};

} // namespace FleetLayout
