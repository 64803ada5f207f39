#include "metadata_allocator.h"

#include <glog/logging.h>

#include "../common/stripe.h"

namespace FleetLayout {

MetadataAllocator::MetadataAllocator(const FleetConfig& config) {
    std::vector<std::vector<std::string>> servers_by_rack;
    servers_by_rack.reserve(config.rack_names.size());
    for (const auto& rack_name : config.rack_names) {
        servers_by_rack.push_back(config.GetRack(rack_name).servers_metadata);
    }
    striped_ = Stripe(servers_by_rack);
}

const std::string& MetadataAllocator::Next(const std::string& alloc_class) {
    CHECK(!striped_.empty()) << "No metadata servers to allocate from";
    size_t& cursor = cursors_[alloc_class];
    const std::string& server = striped_[cursor % striped_.size()];
    ++cursor;
    VLOG(3) << "Allocation class " << alloc_class << " #" << cursor << " -> " << server;
    return server;
}

size_t MetadataAllocator::Allocated(const std::string& alloc_class) const {
    auto it = cursors_.find(alloc_class);
    return it == cursors_.end() ? 0 : it->second;
}

} // namespace FleetLayout
