#pragma once

#include <cstdint>

namespace FleetLayout {

/// Placement constants
/// Instances of each per-shard service deployed for every shard
constexpr int PERSHARD_INSTANCES = 3;
/// Front door ratios are relative to this value. The front door service with
/// the largest ratio gets one instance per metadata server.
constexpr int FRONTDOOR_MAX_INSTANCES = 8;
/// Every front door service gets at least this many instances
constexpr int FRONTDOOR_MIN_INSTANCES = 2;

/// Compute zone defaults. These can be overridden through Configuration.
constexpr double COMPUTE_DRAM_PERCENT = 0.25;
constexpr int COMPUTE_DRAM_DEFAULT_MB = 1024;  // per compute zone
constexpr int COMPUTE_MIN_PER_SERVER = 4;

/// Servers described without a rack or AZ are assigned to these.
constexpr char DEFAULT_AZ[] = "default_az";
constexpr char DEFAULT_RACK[] = "default_rack";

/// Allocation classes shared between services
constexpr char ALLOC_CLASS_SMALL[] = "small";
constexpr char ALLOC_CLASS_FRONTDOOR[] = "frontdoor";

/// Fleet description limits
constexpr int64_t MIN_SHARDS = 1;
constexpr int64_t MAX_SHARDS = 1024;
constexpr int64_t MIN_SERVER_MEMORY_GB = 1;
constexpr int64_t MAX_SERVER_MEMORY_GB = 1024;

} // namespace FleetLayout
