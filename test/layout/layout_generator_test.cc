#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/layout/layout_generator.h"
#include "test_fleet.h"

#include <algorithm>

using namespace FleetLayout;
using namespace FleetLayout::test;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::StartsWith;

namespace {

int CountOn(const Layout& layout, const std::string& server, const std::string& svcname) {
    const ServiceConfiguration* svccfg = layout.ServerServiceConfig(server, svcname);
    return svccfg == nullptr ? 0 : svccfg->Total();
}

int Total(const Layout& layout, const std::string& svcname) {
    const ServiceConfiguration* svccfg = layout.ServiceConfig(svcname);
    return svccfg == nullptr ? 0 : svccfg->Total();
}

} // namespace

class LayoutGeneratorTest : public ::testing::Test {
protected:
    ImageMap images_ = TestImages();
};

TEST(InstanceCountTest, FrontDoor) {
    // The largest ratio gets one instance per metadata server
    for (int nmetadata = 2; nmetadata <= 40; ++nmetadata) {
        EXPECT_EQ(FrontDoorInstanceCount(FRONTDOOR_MAX_INSTANCES, nmetadata), nmetadata);
    }
    EXPECT_EQ(FrontDoorInstanceCount(1, 3), 2);
    EXPECT_EQ(FrontDoorInstanceCount(1, 24), 3);
    EXPECT_EQ(FrontDoorInstanceCount(1, 25), 4);
    EXPECT_EQ(FrontDoorInstanceCount(4, 10), 5);
    // Never fewer than the minimum, even with one metadata server
    EXPECT_EQ(FrontDoorInstanceCount(FRONTDOOR_MAX_INSTANCES, 1), FRONTDOOR_MIN_INSTANCES);
}

TEST(InstanceCountTest, FrontDoorBounds) {
    for (int ratio = 1; ratio <= FRONTDOOR_MAX_INSTANCES; ++ratio) {
        for (int nmetadata = 2; nmetadata <= 50; ++nmetadata) {
            int count = FrontDoorInstanceCount(ratio, nmetadata);
            EXPECT_GE(count, FRONTDOOR_MIN_INSTANCES);
            EXPECT_LE(count, nmetadata);
        }
    }
}

TEST(InstanceCountTest, Compute) {
    LayoutParameters defaults;
    EXPECT_EQ(ComputeInstanceCount(64, defaults), 16);
    EXPECT_EQ(ComputeInstanceCount(256, defaults), 64);
    EXPECT_EQ(ComputeInstanceCount(8, defaults), COMPUTE_MIN_PER_SERVER);
    EXPECT_EQ(ComputeInstanceCount(1, defaults), COMPUTE_MIN_PER_SERVER);

    LayoutParameters parameters;
    parameters.compute_dram_percent = 0.5;
    parameters.compute_dram_default_mb = 2048;
    parameters.compute_min_per_server = 0;
    EXPECT_EQ(ComputeInstanceCount(64, parameters), 16);
    EXPECT_EQ(ComputeInstanceCount(3, parameters), 0);
}

TEST_F(LayoutGeneratorTest, NoStorageServers) {
    Layout layout = GenerateLayout(LoadFleet(3, {MakeServer("metadata", 0, 0)}), images_);
    EXPECT_THAT(layout.errors(), ElementsAre("need at least one metadata server and one storage server"));
    EXPECT_FALSE(layout.Serialize(DEFAULT_AZ).has_value());
}

TEST_F(LayoutGeneratorTest, NoMetadataServers) {
    Layout layout = GenerateLayout(LoadFleet(3, {MakeServer("storage", 0, 0)}), images_);
    EXPECT_THAT(layout.errors(), ElementsAre("need at least one metadata server and one storage server"));
    EXPECT_EQ(Total(layout, "storage"), 0);
}

TEST_F(LayoutGeneratorTest, TwoAzsUnsupported) {
    Layout layout = GenerateLayout(LoadFleet(3, {
        MakeServer("metadata", 0, 0, "az1"),
        MakeServer("storage", 1, 0, "az2")}), images_);
    EXPECT_THAT(layout.errors(), ElementsAre("only one- and three-datacenter deployments are supported"));
}

TEST_F(LayoutGeneratorTest, FourAzsUnsupported) {
    Layout layout = GenerateLayout(MakeUniformFleet(1, 4, 1, 1, {"a", "b", "c", "d"}), images_);
    EXPECT_EQ(layout.nerrors(), 1u);
}

TEST_F(LayoutGeneratorTest, ThreeAzsSupported) {
    Layout layout = GenerateLayout(MakeUniformFleet(1, 3, 1, 1, {"az1", "az2", "az3"}), images_);
    EXPECT_EQ(layout.nerrors(), 0u);
    EXPECT_THAT(layout.warnings(), IsEmpty());
}

// One metadata and one storage server in one rack, one shard
TEST_F(LayoutGeneratorTest, TwoServersOneShard) {
    Layout layout = GenerateLayout(LoadFleet(1, {
        MakeServer("metadata", 0, 0),
        MakeServer("storage", 0, 0)}), images_);
    ASSERT_EQ(layout.nerrors(), 0u);

    ASSERT_EQ(layout.warnings().size(), 2u);
    EXPECT_EQ(layout.warnings()[0],
              "requested 1 shards with only 1 metadata server in at least one datacenter. "
              "Under some conditions, multiple databases may wind up running on the same "
              "servers. This is not recommended.");
    EXPECT_EQ(layout.warnings()[1],
              "configuration has only 1 rack. This configuration may not survive rack failure.");

    const std::string metadata = "server_r00_metadata00";
    EXPECT_EQ(CountOn(layout, metadata, "nameservice"), 3);
    EXPECT_EQ(CountOn(layout, metadata, "postgres"), 3);
    EXPECT_EQ(CountOn(layout, metadata, "electric-moray"), 2);
    EXPECT_EQ(CountOn(layout, metadata, "authcache"), 2);
    EXPECT_EQ(CountOn(layout, "server_r00_storage00", "storage"), 1);
    EXPECT_EQ(CountOn(layout, "server_r00_storage00", "marlin"), 16);
}

TEST_F(LayoutGeneratorTest, TwoServersThreeShards) {
    Layout layout = GenerateLayout(LoadFleet(3, {
        MakeServer("metadata", 0, 0),
        MakeServer("storage", 0, 0)}), images_);
    ASSERT_EQ(layout.nerrors(), 0u);
    ASSERT_EQ(layout.warnings().size(), 2u);
    EXPECT_THAT(layout.warnings()[0], StartsWith(
        "requested 3 shards with only 1 metadata server in at least one datacenter. "
        "Multiple primary databases will wind up running on the same servers"));

    const ServiceConfiguration* moray = layout.ServerServiceConfig("server_r00_metadata00", "moray");
    ASSERT_NE(moray, nullptr);
    for (int shard = 1; shard <= 3; ++shard) {
        EXPECT_EQ(moray->Get(InstanceProperties{shard, "MORAY_IMAGE0"}), PERSHARD_INSTANCES);
    }
}

TEST_F(LayoutGeneratorTest, UnevenAzs) {
    Layout layout = GenerateLayout(LoadFleet(1, {
        MakeServer("metadata", 0, 0, "az1"),
        MakeServer("metadata", 0, 1, "az1"),
        MakeServer("storage", 0, 0, "az1"),
        MakeServer("metadata", 1, 0, "az2"),
        MakeServer("storage", 1, 0, "az2"),
        MakeServer("storage", 1, 1, "az2"),
        MakeServer("metadata", 2, 0, "az3"),
        MakeServer("storage", 2, 0, "az3")}), images_);
    ASSERT_EQ(layout.nerrors(), 0u);
    EXPECT_THAT(layout.warnings(), ElementsAre(
        StartsWith("datacenters have different numbers of metadata servers."),
        "datacenters have different numbers of storage servers."));
}

// Three metadata and two storage servers spread over three racks
TEST_F(LayoutGeneratorTest, SmallDeployment) {
    Layout layout = GenerateLayout(LoadFleet(3, {
        MakeServer("metadata", 0, 0),
        MakeServer("metadata", 1, 0),
        MakeServer("metadata", 2, 0),
        MakeServer("storage", 0, 0),
        MakeServer("storage", 1, 0)}), images_);
    ASSERT_EQ(layout.nerrors(), 0u);
    EXPECT_THAT(layout.warnings(), ElementsAre(HasSubstr("Under some conditions")));

    const std::vector<std::string> metadata = {
        "server_r00_metadata00", "server_r01_metadata00", "server_r02_metadata00"};
    for (const auto& server : metadata) {
        EXPECT_EQ(CountOn(layout, server, "nameservice"), 1) << server;
        EXPECT_EQ(CountOn(layout, server, "electric-moray"), 1) << server;
        EXPECT_EQ(CountOn(layout, server, "postgres"), 3) << server;
        EXPECT_EQ(CountOn(layout, server, "moray"), 3) << server;
        EXPECT_EQ(CountOn(layout, server, "storage"), 0) << server;
        EXPECT_EQ(CountOn(layout, server, "marlin"), 0) << server;
    }

    // Front door services continue where the previous one left off
    EXPECT_EQ(CountOn(layout, metadata[0], "authcache"), 1);
    EXPECT_EQ(CountOn(layout, metadata[1], "authcache"), 1);
    EXPECT_EQ(CountOn(layout, metadata[2], "authcache"), 0);

    // So do the "small" services
    EXPECT_EQ(CountOn(layout, metadata[0], "jobsupervisor"), 1);
    EXPECT_EQ(CountOn(layout, metadata[1], "jobsupervisor"), 1);
    EXPECT_EQ(CountOn(layout, metadata[2], "jobpuller"), 1);
    EXPECT_EQ(CountOn(layout, metadata[0], "jobpuller"), 1);
    EXPECT_EQ(CountOn(layout, metadata[0], "ops"), 1);
    EXPECT_EQ(CountOn(layout, metadata[1], "madtom"), 1);
    EXPECT_EQ(CountOn(layout, metadata[2], "marlin-dashboard"), 1);

    for (const auto& server : {"server_r00_storage00", "server_r01_storage00"}) {
        EXPECT_EQ(CountOn(layout, server, "storage"), 1) << server;
        EXPECT_EQ(CountOn(layout, server, "marlin"), 16) << server;
        EXPECT_EQ(CountOn(layout, server, "nameservice"), 0) << server;
    }

    EXPECT_EQ(Total(layout, "webapi"), 3);
    EXPECT_EQ(Total(layout, "authcache"), 2);
    EXPECT_EQ(Total(layout, "medusa"), 2);
    EXPECT_EQ(Total(layout, "ops"), 1);
}

TEST_F(LayoutGeneratorTest, ThreeRacksFourShards) {
    std::vector<YAML::Node> servers;
    for (int rack = 0; rack < 3; ++rack) {
        for (int i = 0; i < 4; ++i) {
            servers.push_back(MakeServer("metadata", rack, i));
        }
        servers.push_back(MakeServer("storage", rack, 0));
        servers.push_back(MakeServer("storage", rack, 1));
    }
    Layout layout = GenerateLayout(LoadFleet(4, servers), images_);
    ASSERT_EQ(layout.nerrors(), 0u);
    EXPECT_THAT(layout.warnings(), IsEmpty());

    EXPECT_EQ(Total(layout, "postgres"), 4 * PERSHARD_INSTANCES);
    EXPECT_EQ(Total(layout, "electric-moray"), 12);
    EXPECT_EQ(Total(layout, "authcache"), 2);
    EXPECT_EQ(Total(layout, "storage"), 6);
    EXPECT_EQ(Total(layout, "marlin"), 6 * 16);

    // The three instances of each shard land in three different racks
    const FleetConfig& fleet = layout.fleet();
    for (int shard = 1; shard <= 4; ++shard) {
        std::vector<std::string> racks;
        for (const auto& server : fleet.servers_metadata) {
            const ServiceConfiguration* svccfg = layout.ServerServiceConfig(server, "postgres");
            if (svccfg != nullptr && svccfg->Has(InstanceProperties{shard, "POSTGRES_IMAGE0"})) {
                racks.push_back(fleet.GetServer(server).rack);
            }
        }
        std::sort(racks.begin(), racks.end());
        EXPECT_THAT(racks, ElementsAre("rack_r00", "rack_r01", "rack_r02")) << "shard " << shard;
    }
}

TEST_F(LayoutGeneratorTest, PerShardServicesColocated) {
    Layout layout = GenerateLayout(MakeUniformFleet(5, 3, 3, 1, {"az1", "az2", "az3"}), images_);
    ASSERT_EQ(layout.nerrors(), 0u);

    for (const auto& server : layout.fleet().servers_metadata) {
        const ServiceConfiguration* postgres = layout.ServerServiceConfig(server, "postgres");
        const ServiceConfiguration* moray = layout.ServerServiceConfig(server, "moray");
        ASSERT_EQ(postgres == nullptr, moray == nullptr) << server;
        if (postgres == nullptr) {
            continue;
        }
        ASSERT_EQ(postgres->buckets().size(), moray->buckets().size()) << server;
        for (size_t i = 0; i < postgres->buckets().size(); ++i) {
            EXPECT_EQ(postgres->buckets()[i].properties.shard, moray->buckets()[i].properties.shard);
            EXPECT_EQ(postgres->buckets()[i].count, moray->buckets()[i].count);
        }
    }
}

// Each AZ gets one instance of every shard
TEST_F(LayoutGeneratorTest, ShardsSpreadAcrossAzs) {
    Layout layout = GenerateLayout(MakeUniformFleet(2, 3, 2, 1, {"az1", "az2", "az3"}), images_);
    ASSERT_EQ(layout.nerrors(), 0u);
    for (const auto& az : {"az1", "az2", "az3"}) {
        const ServiceConfiguration* postgres = layout.ServiceConfigInAz("postgres", az);
        ASSERT_NE(postgres, nullptr) << az;
        EXPECT_EQ(postgres->Get(InstanceProperties{1, "POSTGRES_IMAGE0"}), 1) << az;
        EXPECT_EQ(postgres->Get(InstanceProperties{2, "POSTGRES_IMAGE0"}), 1) << az;
    }
}

TEST_F(LayoutGeneratorTest, FrontDoorBalanced) {
    for (int nmetadata = 2; nmetadata <= 12; ++nmetadata) {
        Layout layout = GenerateLayout(MakeUniformFleet(1, 1, nmetadata, 1), images_);
        ASSERT_EQ(layout.nerrors(), 0u);

        int fewest = -1;
        int most = 0;
        for (const auto& server : layout.fleet().servers_metadata) {
            int count = 0;
            for (const auto& info : ServiceCatalog()) {
                if (info.policy == PlacementPolicy::FRONTDOOR) {
                    count += CountOn(layout, server, info.name);
                }
            }
            fewest = fewest < 0 ? count : std::min(fewest, count);
            most = std::max(most, count);
        }
        EXPECT_LE(most - fewest, 1) << nmetadata << " metadata servers";
        EXPECT_EQ(Total(layout, "webapi"), nmetadata);
    }
}

TEST_F(LayoutGeneratorTest, Deterministic) {
    FleetConfig config = MakeUniformFleet(4, 3, 3, 2, {"az1", "az2", "az3"});
    Layout first = GenerateLayout(config, images_);
    Layout second = GenerateLayout(config, images_);
    for (const auto& az : config.az_names) {
        EXPECT_EQ(*first.Serialize(az), *second.Serialize(az)) << az;
    }
}

TEST_F(LayoutGeneratorTest, OnlyServicesWithImagesAreDeployed) {
    Layout layout = GenerateLayout(MakeUniformFleet(1, 3, 1, 1),
                                   ImageMap{{"storage", "ST"}, {"webapi", "WA"}});
    ASSERT_EQ(layout.nerrors(), 0u);
    EXPECT_EQ(Total(layout, "storage"), 3);
    EXPECT_EQ(Total(layout, "webapi"), 3);
    EXPECT_EQ(layout.ServiceConfig("nameservice"), nullptr);
    EXPECT_EQ(layout.ServiceConfig("postgres"), nullptr);
}

TEST_F(LayoutGeneratorTest, FleetImagesTakePrecedence) {
    FleetConfig config = MakeUniformFleet(1, 3, 1, 1);
    config.images["webapi"] = "WEBAPI_IMAGE1";
    config.images["ops"] = "OPS_IMAGE1";
    Layout layout = GenerateLayout(config, ImageMap{{"webapi", "WEBAPI_IMAGE0"}});

    const ServiceConfiguration* webapi = layout.ServiceConfig("webapi");
    ASSERT_NE(webapi, nullptr);
    EXPECT_EQ(webapi->Get(InstanceProperties{std::nullopt, "WEBAPI_IMAGE1"}), 3);
    EXPECT_FALSE(webapi->Has(InstanceProperties{std::nullopt, "WEBAPI_IMAGE0"}));
    EXPECT_EQ(Total(layout, "ops"), 1);
}

TEST_F(LayoutGeneratorTest, UnplacedServicesSkipped) {
    images_["reshard"] = "RESHARD_IMAGE0";
    images_["propeller"] = "PROPELLER_IMAGE0";
    images_["milhouse"] = "MILHOUSE_IMAGE0";
    Layout layout = GenerateLayout(MakeUniformFleet(1, 3, 1, 1), images_);
    ASSERT_EQ(layout.nerrors(), 0u);
    EXPECT_EQ(layout.ServiceConfig("reshard"), nullptr);
    EXPECT_EQ(layout.ServiceConfig("propeller"), nullptr);
    EXPECT_EQ(layout.ServiceConfig("milhouse"), nullptr);
}

TEST_F(LayoutGeneratorTest, ComputeParameters) {
    LayoutParameters parameters;
    parameters.compute_dram_percent = 0.5;
    Layout layout = GenerateLayout(LoadFleet(1, {
        MakeServer("metadata", 0, 0),
        MakeServer("storage", 0, 0, "", 128),
        MakeServer("storage", 0, 1, "", 4)}), images_, parameters);
    ASSERT_EQ(layout.nerrors(), 0u);
    EXPECT_EQ(CountOn(layout, "server_r00_storage00", "marlin"), 64);
    EXPECT_EQ(CountOn(layout, "server_r00_storage01", "marlin"), COMPUTE_MIN_PER_SERVER);
}

// Three metadata and two storage servers in a single rack, one shard
TEST_F(LayoutGeneratorTest, SingleRackOneShard) {
    Layout layout = GenerateLayout(MakeUniformFleet(1, 1, 3, 2), images_);
    ASSERT_EQ(layout.nerrors(), 0u);
    EXPECT_THAT(layout.warnings(), ElementsAre(StartsWith("configuration has only 1 rack.")));

    for (const auto& server : layout.fleet().servers_metadata) {
        EXPECT_EQ(CountOn(layout, server, "postgres"), 1) << server;
        EXPECT_EQ(CountOn(layout, server, "moray"), 1) << server;
    }
    EXPECT_EQ(Total(layout, "postgres"), 3);
    EXPECT_EQ(Total(layout, "moray"), 3);
    EXPECT_EQ(Total(layout, "storage"), 2);
}
