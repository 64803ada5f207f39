#include "services.h"

#include <algorithm>
#include <cctype>

#include <yaml-cpp/yaml.h>

#include "../common/config.h"

namespace FleetLayout {

namespace {

/*
 * Instance counts and ratios are heuristics based loosely on experience.
 *
 * "nameservice" always gets three instances. "ops" must be deployed only once
 * per region, and "madtom" and "marlin-dashboard" gain nothing from a second
 * instance. The job services want two for availability, not for capacity.
 * "propeller" is a testing component and is never deployed by default.
 */
const std::vector<ServiceInfo> kServices = {
    {"nameservice",      false, true,  true,  PlacementPolicy::EXACT,           3},
    {"postgres",         true,  true,  true,  PlacementPolicy::PER_SHARD,       PERSHARD_INSTANCES},
    {"moray",            true,  true,  true,  PlacementPolicy::PER_SHARD,       PERSHARD_INSTANCES},
    {"electric-moray",   false, true,  true,  PlacementPolicy::FRONTDOOR,       FRONTDOOR_MAX_INSTANCES},
    {"storage",          false, true,  true,  PlacementPolicy::ONE_PER_STORAGE, 0},
    {"authcache",        false, true,  true,  PlacementPolicy::FRONTDOOR,       1},
    {"webapi",           false, true,  true,  PlacementPolicy::FRONTDOOR,       FRONTDOOR_MAX_INSTANCES},
    {"loadbalancer",     false, true,  true,  PlacementPolicy::FRONTDOOR,       FRONTDOOR_MAX_INSTANCES},
    {"jobsupervisor",    false, true,  true,  PlacementPolicy::EXACT,           2},
    {"jobpuller",        false, true,  true,  PlacementPolicy::EXACT,           2},
    {"medusa",           false, true,  true,  PlacementPolicy::EXACT,           2},
    {"ops",              false, true,  true,  PlacementPolicy::EXACT,           1},
    {"madtom",           false, true,  true,  PlacementPolicy::EXACT,           1},
    {"marlin-dashboard", false, true,  true,  PlacementPolicy::EXACT,           1},
    {"marlin",           false, false, false, PlacementPolicy::COMPUTE,         0},
    {"reshard",          false, true,  true,  PlacementPolicy::NONE,            0},
    {"propeller",        false, true,  false, PlacementPolicy::EXACT,           0},
};

} // namespace

const std::vector<ServiceInfo>& ServiceCatalog() {
    return kServices;
}

std::vector<std::string> ServiceNames() {
    std::vector<std::string> names;
    names.reserve(kServices.size());
    for (const auto& info : kServices) {
        names.emplace_back(info.name);
    }
    return names;
}

const ServiceInfo* LookupService(const std::string& name) {
    for (const auto& info : kServices) {
        if (name == info.name) {
            return &info;
        }
    }
    return nullptr;
}

bool ServiceNameIsValid(const std::string& name) {
    return LookupService(name) != nullptr;
}

bool ServiceIsSharded(const std::string& name) {
    const ServiceInfo* info = LookupService(name);
    return info != nullptr && info->sharded;
}

bool ServiceSupportsOneach(const std::string& name) {
    const ServiceInfo* info = LookupService(name);
    return info != nullptr && info->oneach;
}

bool ServiceSupportsAlarms(const std::string& name) {
    const ServiceInfo* info = LookupService(name);
    return info != nullptr && info->alarms;
}

ImageMap DefaultImageMap() {
    ImageMap images;
    for (const auto& info : kServices) {
        if (info.policy == PlacementPolicy::NONE ||
                (info.policy == PlacementPolicy::EXACT && info.param == 0)) {
            continue;
        }
        std::string image(info.name);
        std::transform(image.begin(), image.end(), image.begin(), [](unsigned char c) {
            return c == '-' ? '_' : static_cast<char>(std::toupper(c));
        });
        images[info.name] = image + "_IMAGE";
    }
    return images;
}

void ServiceConfiguration::Increment(const InstanceProperties& properties, int count) {
    for (auto& bucket : buckets_) {
        if (bucket.properties == properties) {
            bucket.count += count;
            return;
        }
    }
    buckets_.push_back(Bucket{properties, count});
}

int ServiceConfiguration::Get(const InstanceProperties& properties) const {
    for (const auto& bucket : buckets_) {
        if (bucket.properties == properties) {
            return bucket.count;
        }
    }
    return 0;
}

bool ServiceConfiguration::Has(const InstanceProperties& properties) const {
    return std::any_of(buckets_.begin(), buckets_.end(), [&](const Bucket& bucket) {
        return bucket.properties == properties;
    });
}

int ServiceConfiguration::Total() const {
    int total = 0;
    for (const auto& bucket : buckets_) {
        total += bucket.count;
    }
    return total;
}

// Callers diff this output, so the format must stay stable.
void ServiceConfiguration::EmitSummary(YAML::Emitter& out) const {
    out << YAML::BeginSeq;
    for (const auto& bucket : buckets_) {
        out << YAML::BeginMap;
        if (bucket.properties.shard.has_value()) {
            out << YAML::Key << "shard" << YAML::Value << *bucket.properties.shard;
        }
        out << YAML::Key << "image_uuid" << YAML::Value << bucket.properties.image;
        out << YAML::Key << "count" << YAML::Value << bucket.count;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
}

} // namespace FleetLayout
