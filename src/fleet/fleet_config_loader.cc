#include "fleet_config_loader.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include "fleet_schema.h"
#include "../common/config.h"
#include "../common/stripe.h"

namespace FleetLayout {

namespace {

std::vector<std::string> SortedCopy(std::vector<std::string> names) {
    std::sort(names.begin(), names.end());
    return names;
}

template<typename Map>
std::vector<std::string> SortedKeys(const Map& map) {
    std::vector<std::string> keys;
    keys.reserve(map.size());
    for (const auto& kv : map) {
        keys.push_back(kv.first);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

} // namespace

bool FleetConfigLoader::LoadFromFile(const std::string& filename) {
    Begin("file: \"" + filename + "\"");

    std::ifstream input(filename);
    if (!input.is_open()) {
        errors_.push_back(source_ + ": " + std::strerror(errno));
        return Finish();
    }

    std::stringstream contents;
    contents << input.rdbuf();
    if (input.bad()) {
        errors_.push_back(source_ + ": read failed: " + std::strerror(errno));
        return Finish();
    }

    ParseText(contents.str());
    return Finish();
}

bool FleetConfigLoader::LoadFromString(const std::string& text) {
    Begin("string");
    ParseText(text);
    return Finish();
}

bool FleetConfigLoader::LoadDirectly(const YAML::Node& config) {
    Begin("directly-passed");
    Parse(config);
    return Finish();
}

const FleetConfig& FleetConfigLoader::config() const {
    CHECK(done_ && errors_.empty()) << "No fleet description loaded";
    return config_;
}

const std::string& FleetConfigLoader::error() const {
    static const std::string kNoError;
    return errors_.empty() ? kNoError : errors_.front();
}

void FleetConfigLoader::Begin(const std::string& source) {
    CHECK(!started_) << "cannot re-use FleetConfigLoader";
    started_ = true;
    source_ = source;
}

void FleetConfigLoader::ParseText(const std::string& text) {
    YAML::Node parsed;
    try {
        parsed = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        errors_.push_back("parse " + source_ + ": " + e.what());
        return;
    }

    if (!parsed.IsDefined() || parsed.IsNull()) {
        errors_.push_back("parse " + source_ + ": empty document");
        return;
    }

    Parse(parsed);
}

void FleetConfigLoader::Parse(const YAML::Node& parsed) {
    std::string error;
    if (!ValidateFleetSchema(parsed, &error)) {
        errors_.push_back(error);
        return;
    }

    const YAML::Node images = parsed["images"];
    if (images && !CheckImages(images)) {
        return;
    }

    // Everything below was checked by the schema.
    int64_t nshards = 0;
    CHECK(ScalarToInteger(parsed["nshards"], &nshards));
    config_.nshards = static_cast<int>(nshards);
    if (images) {
        for (const auto& kv : images) {
            config_.images[kv.first.Scalar()] = kv.second.Scalar();
        }
    }

    for (const auto& server : parsed["servers"]) {
        AddServer(server);
    }

    if (!errors_.empty()) {
        return;
    }

    ComputeDerived();
}

bool FleetConfigLoader::CheckImages(const YAML::Node& images) {
    for (const auto& kv : images) {
        const std::string svcname = kv.first.Scalar();
        if (!IsStringScalar(kv.second)) {
            errors_.push_back("images[" + svcname + "]: not a string");
            return false;
        }
        if (!ServiceNameIsValid(svcname)) {
            errors_.push_back("images[" + svcname + "]: invalid service name");
            return false;
        }
    }
    return true;
}

/*
 * Structural problems are recorded but do not stop the scan. Only the first
 * one is reported.
 */
void FleetConfigLoader::AddServer(const YAML::Node& server) {
    const std::string uuid = server["uuid"].Scalar();
    const ServerType type = server["type"].Scalar() == "metadata" ?
        ServerType::METADATA : ServerType::STORAGE;
    int64_t memory_gb = 0;
    CHECK(ScalarToInteger(server["memory"], &memory_gb));
    const std::string rack_name = server["rack"] ? server["rack"].Scalar() : DEFAULT_RACK;
    const std::string az_name = server["az"] ? server["az"].Scalar() : DEFAULT_AZ;

    auto az_it = config_.azs.find(az_name);
    if (az_it == config_.azs.end()) {
        config_.az_names.push_back(az_name);
        az_it = config_.azs.emplace(az_name, AvailabilityZone{az_name, {}, 0, 0}).first;
    }
    AvailabilityZone& az = az_it->second;

    auto rack_it = config_.racks.find(rack_name);
    if (rack_it == config_.racks.end()) {
        config_.rack_names.push_back(rack_name);
        az.rack_names.push_back(rack_name);
        rack_it = config_.racks.emplace(rack_name, Rack{rack_name, az_name, {}, {}}).first;
    } else if (rack_it->second.az != az_name) {
        errors_.push_back("server " + uuid + ", rack " + rack_name + ", az " + az_name +
                ": rack already exists in different az " + rack_it->second.az);
    }
    Rack& rack = rack_it->second;

    if (config_.servers.contains(uuid)) {
        errors_.push_back("server " + uuid + ", rack " + rack_name + ", az " + az_name +
                ": duplicate server");
    }

    config_.server_names.push_back(uuid);
    config_.servers[uuid] = Server{uuid, rack_name, memory_gb, type};

    if (type == ServerType::METADATA) {
        rack.servers_metadata.push_back(uuid);
        config_.servers_metadata.push_back(uuid);
        az.nmetadata++;
    } else {
        rack.servers_storage.push_back(uuid);
        config_.servers_storage.push_back(uuid);
        az.nstorage++;
    }
}

void FleetConfigLoader::ComputeDerived() {
    CHECK(!config_.az_names.empty());

    bool first = true;
    for (const auto& az_name : config_.az_names) {
        const AvailabilityZone& az = config_.azs.at(az_name);
        if (first || az.nmetadata < config_.min_nmetadata_per_az) {
            config_.min_nmetadata_per_az = az.nmetadata;
        }
        if (first || az.nstorage < config_.min_nstorage_per_az) {
            config_.min_nstorage_per_az = az.nstorage;
        }
        first = false;
    }

    /*
     * Sort the racks within each AZ, then take one rack from each AZ in turn.
     * Spreading instances across racks in this order is then enough to also
     * spread them across AZs.
     */
    std::vector<std::vector<std::string>> racks_by_az;
    for (const auto& az_name : config_.az_names) {
        AvailabilityZone& az = config_.azs.at(az_name);
        std::sort(az.rack_names.begin(), az.rack_names.end());
        racks_by_az.push_back(az.rack_names);
    }
    std::vector<std::string> striped = Stripe(racks_by_az);
    CHECK(SortedCopy(striped) == SortedCopy(config_.rack_names))
        << "Striped rack list does not match the racks found";
    config_.rack_names = std::move(striped);

    CHECK(SortedKeys(config_.azs) == SortedCopy(config_.az_names));
    CHECK(SortedKeys(config_.racks) == SortedCopy(config_.rack_names));
    CHECK(SortedKeys(config_.servers) == SortedCopy(config_.server_names));
    CHECK(!config_.server_names.empty());

    VLOG(1) << "Loaded fleet description from " << source_ << ": "
            << config_.server_names.size() << " servers ("
            << config_.servers_metadata.size() << " metadata, "
            << config_.servers_storage.size() << " storage) in "
            << config_.rack_names.size() << " racks and "
            << config_.az_names.size() << " availability zones, "
            << config_.nshards << " shards";
}

/*
 * Invoked exactly once per loader, on success or failure.
 */
bool FleetConfigLoader::Finish() {
    CHECK(!done_);
    done_ = true;

    if (!errors_.empty()) {
        VLOG(1) << "Failed to load fleet description from " << source_ << ": "
                << errors_.front();
        return false;
    }
    return true;
}

} // namespace FleetLayout
