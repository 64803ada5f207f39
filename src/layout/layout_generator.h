#pragma once

#include <cstdint>

#include "layout.h"
#include "../common/config.h"
#include "../fleet/fleet_config.h"
#include "../services/services.h"

namespace FleetLayout {

class Configuration;

/**
 * Sizing of compute zones on storage servers. The defaults use little DRAM on
 * purpose: compute zones are easy to add later, and a few per server are
 * always needed for internal jobs.
 */
struct LayoutParameters {
    // Fraction of each storage server's DRAM used for compute zones
    double compute_dram_percent = COMPUTE_DRAM_PERCENT;
    // DRAM per compute zone (megabytes)
    int compute_dram_default_mb = COMPUTE_DRAM_DEFAULT_MB;
    int compute_min_per_server = COMPUTE_MIN_PER_SERVER;

    static LayoutParameters FromConfiguration(const Configuration& configuration);
};

// Instances of a front door service with the given ratio. The service with the
// largest ratio gets one instance per metadata server and the others are
// scaled down proportionally, but never below FRONTDOOR_MIN_INSTANCES.
int FrontDoorInstanceCount(int ratio, int nmetadata);

// Compute zones that fit on a storage server with "memory_gb" of DRAM
int ComputeInstanceCount(int64_t memory_gb, const LayoutParameters& parameters);

/**
 * Lays out services on the servers of "config". "images" maps each service to
 * deploy to the image to use for it; images from the fleet description take
 * precedence. Only services with an image are deployed.
 *
 * This cannot fail, but the returned Layout may carry fatal errors, in which
 * case it holds no instances and cannot be serialized.
 */
Layout GenerateLayout(const FleetConfig& config, const ImageMap& images,
        const LayoutParameters& parameters = LayoutParameters());

} // namespace FleetLayout
