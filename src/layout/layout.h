#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/container/flat_hash_map.h"
#include "metadata_allocator.h"
#include "../fleet/fleet_config.h"
#include "../services/services.h"

namespace FleetLayout {

/**
 * A Layout specifies how many instances of which versions of all services run
 * on each server within a region. GenerateLayout() builds it through the
 * allocation methods below; after that it is only read.
 *
 * Every instance is counted three ways: per server and service, per service
 * and AZ, and per service across the whole region.
 */
class Layout {
public:
    explicit Layout(FleetConfig config);

    // Next metadata server for "alloc_class". See MetadataAllocator.
    const std::string& AllocateMetadataServer(const std::string& alloc_class);

    // Records one instance of "svcname" on "server".
    void AllocateInstance(const std::string& server, const std::string& svcname,
            const InstanceProperties& properties);

    void AddError(const std::string& message);
    void AddWarning(const std::string& message);

    // AZ names in the order they appear in the fleet description
    std::vector<std::string> Azs() const { return config_.az_names; }

    /**
     * Returns the configuration for the servers in "az": a YAML document
     * mapping each server to its services and, for each service, the list of
     * {shard, image_uuid, count} entries. Metadata servers come first, then
     * storage servers, and services are sorted by name. Returns nothing if the
     * layout has fatal errors.
     */
    std::optional<std::string> Serialize(const std::string& az) const;

    // Writes a table of instance counts per service (and shard) per AZ.
    void PrintSummary(std::ostream& out) const;

    // Writes the fatal errors or, if there are none, the warnings.
    void PrintIssues(std::ostream& out) const;

    size_t nerrors() const { return errors_.size(); }
    const std::vector<std::string>& errors() const { return errors_; }
    const std::vector<std::string>& warnings() const { return warnings_; }

    const FleetConfig& fleet() const { return config_; }

    // Aggregate views; nullptr when no such instance was placed
    const ServiceConfiguration* ServerServiceConfig(const std::string& server,
            const std::string& svcname) const;
    const ServiceConfiguration* ServiceConfigInAz(const std::string& svcname,
            const std::string& az) const;
    const ServiceConfiguration* ServiceConfig(const std::string& svcname) const;

private:
    using ConfigsByName = absl::btree_map<std::string, ServiceConfiguration>;

    FleetConfig config_;
    MetadataAllocator allocator_;

    std::vector<std::string> warnings_;
    std::vector<std::string> errors_;

    // server uuid -> service name -> instances on that server
    absl::flat_hash_map<std::string, ConfigsByName> configs_by_server_;
    // service name -> instances in the whole region
    ConfigsByName configs_by_service_;
    // service name -> az -> instances in that AZ
    absl::btree_map<std::string, ConfigsByName> configs_by_service_az_;
};

} // namespace FleetLayout
