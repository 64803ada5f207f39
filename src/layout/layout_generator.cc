#include "layout_generator.h"

#include <algorithm>
#include <cmath>

#include <glog/logging.h>

#include "../common/configuration.h"

namespace FleetLayout {

namespace {

std::string Plural(int count, const std::string& noun) {
    return std::to_string(count) + " " + noun + (count == 1 ? "" : "s");
}

/*
 * Checks the overall shape of the fleet. Returns false, having recorded a fatal
 * error, if no layout can be generated. Everything else is a warning.
 */
bool CheckFleet(const FleetConfig& config, Layout& layout) {
    if (config.servers_metadata.empty() || config.servers_storage.empty()) {
        layout.AddError("need at least one metadata server and one storage server");
        return false;
    }

    if (config.az_names.size() != 1 && config.az_names.size() != 3) {
        layout.AddError("only one- and three-datacenter deployments are supported");
        return false;
    }

    bool uneven_metadata = false;
    bool uneven_storage = false;
    for (const auto& az_name : config.az_names) {
        const AvailabilityZone& az = config.GetAz(az_name);
        uneven_metadata |= az.nmetadata != config.min_nmetadata_per_az;
        uneven_storage |= az.nstorage != config.min_nstorage_per_az;
    }

    if (uneven_metadata) {
        layout.AddWarning("datacenters have different numbers of metadata servers. "
                "The impact of a datacenter failure will differ depending on which "
                "datacenter fails.");
    }

    if (uneven_storage) {
        layout.AddWarning("datacenters have different numbers of storage servers.");
    }

    const int naz = static_cast<int>(config.az_names.size());
    const std::string requested = "requested " + std::to_string(config.nshards) +
        " shards with only " + Plural(config.min_nmetadata_per_az, "metadata server") +
        " in at least one datacenter. ";
    if (config.nshards > config.min_nmetadata_per_az) {
        // More shards than metadata servers means at least two primaries
        // always share a server. Test environments and fleets expecting new
        // hardware do this on purpose, so it is not fatal.
        layout.AddWarning(requested + "Multiple primary databases will wind up running on "
                "the same servers, and this configuration may not survive server failure. "
                "This is not recommended.");
    } else if (PERSHARD_INSTANCES * config.nshards > naz * config.min_nmetadata_per_az) {
        layout.AddWarning(requested + "Under some conditions, multiple databases may wind "
                "up running on the same servers. This is not recommended.");
    }

    const int nracks = static_cast<int>(config.rack_names.size());
    if (nracks < PERSHARD_INSTANCES) {
        layout.AddWarning("configuration has only " + Plural(nracks, "rack") +
                ". This configuration may not survive rack failure.");
    }

    return true;
}

void PlaceExact(Layout& layout, const ServiceInfo& info, const std::string& image) {
    for (int i = 0; i < info.param; ++i) {
        const std::string& server = layout.AllocateMetadataServer(ALLOC_CLASS_SMALL);
        layout.AllocateInstance(server, info.name, InstanceProperties{std::nullopt, image});
    }
}

// All front door services share one allocation class so that their total
// count on any two servers differs by at most one.
void PlaceFrontDoor(Layout& layout, const FleetConfig& config, const ServiceInfo& info,
        const std::string& image) {
    int count = FrontDoorInstanceCount(info.param, static_cast<int>(config.servers_metadata.size()));
    for (int i = 0; i < count; ++i) {
        const std::string& server = layout.AllocateMetadataServer(ALLOC_CLASS_FRONTDOOR);
        layout.AllocateInstance(server, info.name, InstanceProperties{std::nullopt, image});
    }
}

/*
 * Each per-shard service allocates from its own class. Since allocation is
 * deterministic, instance i of a shard of one service lands on the same server
 * as instance i of the same shard of every other per-shard service.
 */
void PlacePerShard(Layout& layout, const FleetConfig& config, const ServiceInfo& info,
        const std::string& image) {
    for (int shard = 1; shard <= config.nshards; ++shard) {
        for (int i = 0; i < info.param; ++i) {
            const std::string& server = layout.AllocateMetadataServer(info.name);
            layout.AllocateInstance(server, info.name, InstanceProperties{shard, image});
        }
    }
}

void PlaceOnePerStorage(Layout& layout, const FleetConfig& config, const ServiceInfo& info,
        const std::string& image) {
    for (const auto& server : config.servers_storage) {
        layout.AllocateInstance(server, info.name, InstanceProperties{std::nullopt, image});
    }
}

void PlaceCompute(Layout& layout, const FleetConfig& config, const ServiceInfo& info,
        const std::string& image, const LayoutParameters& parameters) {
    for (const auto& server : config.servers_storage) {
        int count = ComputeInstanceCount(config.GetServer(server).memory_gb, parameters);
        VLOG(2) << info.name << ": " << count << " instances on " << server;
        for (int i = 0; i < count; ++i) {
            layout.AllocateInstance(server, info.name, InstanceProperties{std::nullopt, image});
        }
    }
}

} // namespace

LayoutParameters LayoutParameters::FromConfiguration(const Configuration& configuration) {
    LayoutParameters parameters;
    parameters.compute_dram_percent = configuration.getComputeDramPercent();
    parameters.compute_dram_default_mb = configuration.getComputeDramDefaultMb();
    parameters.compute_min_per_server = configuration.getComputeMinPerServer();
    return parameters;
}

int FrontDoorInstanceCount(int ratio, int nmetadata) {
    CHECK_GT(ratio, 0);
    CHECK_LE(ratio, FRONTDOOR_MAX_INSTANCES);
    CHECK_GT(nmetadata, 0);
    // ceil(ratio * nmetadata / FRONTDOOR_MAX_INSTANCES)
    int count = (ratio * nmetadata + FRONTDOOR_MAX_INSTANCES - 1) / FRONTDOOR_MAX_INSTANCES;
    CHECK_LE(count, nmetadata);
    return std::max(FRONTDOOR_MIN_INSTANCES, count);
}

int ComputeInstanceCount(int64_t memory_gb, const LayoutParameters& parameters) {
    CHECK_GT(parameters.compute_dram_default_mb, 0);
    double avail_mb = static_cast<double>(memory_gb) * 1024 * parameters.compute_dram_percent;
    int count = static_cast<int>(std::floor(avail_mb / parameters.compute_dram_default_mb));
    return std::max(count, parameters.compute_min_per_server);
}

Layout GenerateLayout(const FleetConfig& config, const ImageMap& images,
        const LayoutParameters& parameters) {
    CHECK_GT(config.nshards, 0);
    CHECK(!config.az_names.empty());
    CHECK(!config.rack_names.empty());
    CHECK(!config.server_names.empty());

    // The fleet description's images win over the caller's defaults. This
    // mostly exists to get reproducible output for testing.
    ImageMap resolved = images;
    for (const auto& [svcname, image] : config.images) {
        resolved[svcname] = image;
    }
    for (const auto& [svcname, image] : resolved) {
        if (!ServiceNameIsValid(svcname)) {
            LOG(WARNING) << "Ignoring image " << image << " for unknown service " << svcname;
        }
    }

    Layout layout(config);
    if (!CheckFleet(config, layout)) {
        return layout;
    }

    for (const auto& info : ServiceCatalog()) {
        auto it = resolved.find(info.name);
        if (it == resolved.end()) {
            continue;
        }

        const std::string& image = it->second;
        switch (info.policy) {
            case PlacementPolicy::EXACT:
                PlaceExact(layout, info, image);
                break;
            case PlacementPolicy::FRONTDOOR:
                PlaceFrontDoor(layout, config, info, image);
                break;
            case PlacementPolicy::PER_SHARD:
                PlacePerShard(layout, config, info, image);
                break;
            case PlacementPolicy::ONE_PER_STORAGE:
                PlaceOnePerStorage(layout, config, info, image);
                break;
            case PlacementPolicy::COMPUTE:
                PlaceCompute(layout, config, info, image, parameters);
                break;
            case PlacementPolicy::NONE:
                LOG(INFO) << "Service " << info.name << " is not laid out automatically, skipping";
                break;
        }
    }

    return layout;
}

} // namespace FleetLayout
