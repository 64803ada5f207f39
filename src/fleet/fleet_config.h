#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "../services/services.h"

namespace FleetLayout {

enum class ServerType { METADATA, STORAGE };

struct AvailabilityZone {
    std::string name;
    // Sorted lexically once loading completes
    std::vector<std::string> rack_names;
    int nmetadata = 0;
    int nstorage = 0;
};

/**
 * Rack names are unique across all availability zones.
 */
struct Rack {
    std::string name;
    std::string az;
    std::vector<std::string> servers_metadata;
    std::vector<std::string> servers_storage;
};

struct Server {
    std::string uuid;
    std::string rack;
    int64_t memory_gb;
    ServerType type;
};

/**
 * The availability zones, racks and servers available for a deployment, plus
 * the parameters that control it. Built by FleetConfigLoader and immutable
 * afterwards.
 */
struct FleetConfig {
    // AZ names in the order they were first seen
    std::vector<std::string> az_names;
    absl::flat_hash_map<std::string, AvailabilityZone> azs;

    // Rack names striped across AZs: the first rack of each AZ, then the
    // second rack of each AZ, and so on. Spreading instances across this list
    // also spreads them across AZs.
    std::vector<std::string> rack_names;
    absl::flat_hash_map<std::string, Rack> racks;

    std::vector<std::string> server_names;
    absl::flat_hash_map<std::string, Server> servers;
    std::vector<std::string> servers_metadata;
    std::vector<std::string> servers_storage;

    // Minimum count of each type of server across all AZs
    int min_nmetadata_per_az = 0;
    int min_nstorage_per_az = 0;

    int nshards = 0;
    // Image overrides from the fleet description
    ImageMap images;

    const Server& GetServer(const std::string& uuid) const;
    const Rack& GetRack(const std::string& name) const;
    const AvailabilityZone& GetAz(const std::string& name) const;
    const std::string& AzOfServer(const std::string& uuid) const;
};

} // namespace FleetLayout
