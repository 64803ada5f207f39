#include "fleet_config.h"

#include <glog/logging.h>

namespace FleetLayout {

const Server& FleetConfig::GetServer(const std::string& uuid) const {
    auto it = servers.find(uuid);
    CHECK(it != servers.end()) << "Unknown server " << uuid;
    return it->second;
}

const Rack& FleetConfig::GetRack(const std::string& name) const {
    auto it = racks.find(name);
    CHECK(it != racks.end()) << "Unknown rack " << name;
    return it->second;
}

const AvailabilityZone& FleetConfig::GetAz(const std::string& name) const {
    auto it = azs.find(name);
    CHECK(it != azs.end()) << "Unknown availability zone " << name;
    return it->second;
}

const std::string& FleetConfig::AzOfServer(const std::string& uuid) const {
    return GetRack(GetServer(uuid).rack).az;
}

} // namespace FleetLayout
