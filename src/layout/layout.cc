#include "layout.h"

#include <iomanip>
#include <map>
#include <utility>

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace FleetLayout {

namespace {

constexpr int SUMMARY_MARGIN_WIDTH = 4;
constexpr int SUMMARY_SERVICE_WIDTH = 16;
constexpr int SUMMARY_SHARD_WIDTH = 5;
constexpr int SUMMARY_AZ_WIDTH = 16;

void WriteSummaryRow(std::ostream& out, const std::string& service, const std::string& shard,
        const std::vector<std::string>& cells) {
    out << std::left << std::setw(SUMMARY_MARGIN_WIDTH) << ""
        << " " << std::setw(SUMMARY_SERVICE_WIDTH) << service
        << " " << std::right << std::setw(SUMMARY_SHARD_WIDTH) << shard;
    for (const auto& cell : cells) {
        out << " " << std::setw(SUMMARY_AZ_WIDTH) << cell;
    }
    out << "\n";
}

} // namespace

Layout::Layout(FleetConfig config)
    : config_(std::move(config)),
      allocator_(config_) {}

const std::string& Layout::AllocateMetadataServer(const std::string& alloc_class) {
    return allocator_.Next(alloc_class);
}

void Layout::AllocateInstance(const std::string& server, const std::string& svcname,
        const InstanceProperties& properties) {
    const std::string& az = config_.AzOfServer(server);
    configs_by_server_[server][svcname].Increment(properties);
    configs_by_service_[svcname].Increment(properties);
    configs_by_service_az_[svcname][az].Increment(properties);
}

void Layout::AddError(const std::string& message) {
    LOG(ERROR) << "Layout error: " << message;
    errors_.push_back(message);
}

void Layout::AddWarning(const std::string& message) {
    LOG(WARNING) << "Layout warning: " << message;
    warnings_.push_back(message);
}

std::optional<std::string> Layout::Serialize(const std::string& az) const {
    if (nerrors() > 0) {
        return std::nullopt;
    }

    // Grouping servers by type and services by name keeps this easy to review.
    std::vector<std::string> servers = config_.servers_metadata;
    servers.insert(servers.end(), config_.servers_storage.begin(), config_.servers_storage.end());

    YAML::Emitter out;
    out.SetIndent(4);
    out.SetStringFormat(YAML::DoubleQuoted);
    out << YAML::BeginMap;
    for (const auto& server : servers) {
        if (config_.AzOfServer(server) != az) {
            continue;
        }

        out << YAML::Key << server << YAML::Value << YAML::BeginMap;
        auto it = configs_by_server_.find(server);
        if (it != configs_by_server_.end()) {
            for (const auto& [svcname, svccfg] : it->second) {
                out << YAML::Key << svcname << YAML::Value;
                svccfg.EmitSummary(out);
            }
        }
        out << YAML::EndMap;
    }
    out << YAML::EndMap;

    if (!out.good()) {
        LOG(ERROR) << "Failed to serialize layout for " << az << ": " << out.GetLastError();
        return std::nullopt;
    }
    return std::string(out.c_str()) + "\n";
}

/*
 * Services appear in deployment order with the sharded ones last. Each
 * unsharded service gets one row with its instance count in each AZ. Each
 * sharded service gets one row per shard, in numeric shard order.
 */
void Layout::PrintSummary(std::ostream& out) const {
    if (nerrors() > 0) {
        return;
    }

    std::ios_base::fmtflags flags(out.flags());
    const std::vector<std::string>& azs = config_.az_names;
    WriteSummaryRow(out, "SERVICE", "SHARD", azs);

    for (const auto& info : ServiceCatalog()) {
        if (info.sharded) {
            continue;
        }
        // Services with no instances get no row
        auto it = configs_by_service_az_.find(info.name);
        if (it == configs_by_service_az_.end()) {
            continue;
        }

        std::vector<std::string> cells;
        for (const auto& az : azs) {
            auto az_it = it->second.find(az);
            cells.push_back(std::to_string(az_it == it->second.end() ? 0 : az_it->second.Total()));
        }
        WriteSummaryRow(out, info.name, "-", cells);
    }

    for (const auto& info : ServiceCatalog()) {
        if (!info.sharded) {
            continue;
        }
        auto it = configs_by_service_az_.find(info.name);
        if (it == configs_by_service_az_.end()) {
            continue;
        }

        // shard -> az -> count
        std::map<int, std::map<std::string, int>> rows;
        for (const auto& [az, svccfg] : it->second) {
            for (const auto& bucket : svccfg.buckets()) {
                CHECK(bucket.properties.shard.has_value())
                    << "Instance of sharded service " << info.name << " has no shard";
                rows[*bucket.properties.shard][az] += bucket.count;
            }
        }

        for (const auto& [shard, counts] : rows) {
            std::vector<std::string> cells;
            for (const auto& az : azs) {
                auto count_it = counts.find(az);
                cells.push_back(std::to_string(count_it == counts.end() ? 0 : count_it->second));
            }
            WriteSummaryRow(out, info.name, std::to_string(shard), cells);
        }
    }

    out.flags(flags);
}

void Layout::PrintIssues(std::ostream& out) const {
    if (!errors_.empty()) {
        for (const auto& error : errors_) {
            out << "error: " << error << "\n";
        }
    } else {
        for (const auto& warning : warnings_) {
            out << "warning: " << warning << "\n";
        }
    }
}

const ServiceConfiguration* Layout::ServerServiceConfig(const std::string& server,
        const std::string& svcname) const {
    auto it = configs_by_server_.find(server);
    if (it == configs_by_server_.end()) {
        return nullptr;
    }
    auto svc_it = it->second.find(svcname);
    return svc_it == it->second.end() ? nullptr : &svc_it->second;
}

const ServiceConfiguration* Layout::ServiceConfigInAz(const std::string& svcname,
        const std::string& az) const {
    auto it = configs_by_service_az_.find(svcname);
    if (it == configs_by_service_az_.end()) {
        return nullptr;
    }
    auto az_it = it->second.find(az);
    return az_it == it->second.end() ? nullptr : &az_it->second;
}

const ServiceConfiguration* Layout::ServiceConfig(const std::string& svcname) const {
    auto it = configs_by_service_.find(svcname);
    return it == configs_by_service_.end() ? nullptr : &it->second;
}

} // namespace FleetLayout
