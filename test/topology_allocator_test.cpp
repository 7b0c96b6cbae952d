/**
 * @file topology_allocator_test.cpp
 * @brief Port entry parsing, manifest rewriting, allocation and release
 *
 * @date 2025
 */

#include "ctfbox/network/topology_allocator.hpp"

#include "fake_control_plane.hpp"
#include "test_config.hpp"

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

#include <fstream>
#include <nlohmann/json.hpp>

using namespace ctfbox;
using namespace ctfbox::network;

using ctfbox::executor::GuardedExecutor;
using ctfbox::test::FakeControlPlane;

namespace {

const char* kWebManifest = R"(
version: "3.8"
services:
  web:
    image: ctf/web:latest
    container_name: web
    environment:
      FLAG: "flag{test}"
    ports:
      - "8080:80"
      - "127.0.0.1:9000:9000/udp"
    depends_on:
      - db
    networks:
      - ctfnet
  db:
    image: postgres:15
    ports:
      - target: 5432
        published: 5432
    networks:
      ctfnet:
        aliases: [database]
  worker:
    image: ctf/worker
    ports:
      - "7000-7002:7000-7002"
networks:
  ctfnet:
    external: true
  internal:
    driver: bridge
)";

std::vector<std::string> ServiceKeys(const YAML::Node& document) {
    std::vector<std::string> keys;
    for (auto it = document["services"].begin(); it != document["services"].end(); ++it) {
        keys.push_back(it->first.as<std::string>());
    }
    return keys;
}

std::vector<std::string> Aliases(const YAML::Node& service, const std::string& network) {
    std::vector<std::string> aliases;
    for (const auto& alias : service["networks"][network]["aliases"]) {
        aliases.push_back(alias.as<std::string>());
    }
    return aliases;
}

} // namespace

class TopologyAllocatorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        config = test::FastConfig(scratch.Path() / "pool");
        fake = std::make_shared<FakeControlPlane>();
        executor = std::make_unique<GuardedExecutor>(fake, config.timeouts);
        pool = std::make_unique<PortPool>(config.port_pool);
        allocator = std::make_unique<TopologyAllocator>(*pool, fake, *executor, config);
    }

    void TearDown() override
    {
        fake->ReleaseAll();
    }

    std::filesystem::path WriteManifest(const std::string& contents)
    {
        auto path = scratch.Path() / "docker-compose.yml";
        std::ofstream(path) << contents;
        return path;
    }

    test::ScratchDir scratch;
    core::EnvironmentConfig config;
    std::shared_ptr<FakeControlPlane> fake;
    std::unique_ptr<GuardedExecutor> executor;
    std::unique_ptr<PortPool> pool;
    std::unique_ptr<TopologyAllocator> allocator;
};


TEST(PortEntryParsing, ShortForms)
{
    auto bare = TopologyAllocator::ParsePortEntry(YAML::Load("80"));
    ASSERT_TRUE(bare.has_value());
    EXPECT_EQ(80, bare->internal_port);
    EXPECT_EQ("tcp", bare->protocol);

    auto mapped = TopologyAllocator::ParsePortEntry(YAML::Load("\"8080:80\""));
    ASSERT_TRUE(mapped.has_value());
    EXPECT_EQ(80, mapped->internal_port);

    auto with_ip = TopologyAllocator::ParsePortEntry(YAML::Load("\"127.0.0.1:9000:9001/UDP\""));
    ASSERT_TRUE(with_ip.has_value());
    EXPECT_EQ(9001, with_ip->internal_port);
    EXPECT_EQ("udp", with_ip->protocol);
}


TEST(PortEntryParsing, LongForm)
{
    auto port = TopologyAllocator::ParsePortEntry(YAML::Load("{target: 5432, published: 5432, protocol: tcp}"));
    ASSERT_TRUE(port.has_value());
    EXPECT_EQ(5432, port->internal_port);

    EXPECT_FALSE(TopologyAllocator::ParsePortEntry(YAML::Load("{published: 5432}")).has_value());
}


TEST(PortEntryParsing, RangesAndJunkAreNotRemapped)
{
    EXPECT_FALSE(TopologyAllocator::ParsePortEntry(YAML::Load("\"7000-7002:7000-7002\"")).has_value());
    EXPECT_FALSE(TopologyAllocator::ParsePortEntry(YAML::Load("\"http\"")).has_value());
    EXPECT_FALSE(TopologyAllocator::ParsePortEntry(YAML::Load("\"70000\"")).has_value());
    EXPECT_FALSE(TopologyAllocator::ParsePortEntry(YAML::Load("[80]")).has_value());
}


TEST(ManifestHelpers, CollectsDistinctPortsPlusExtras)
{
    auto manifest = YAML::Load(R"(
services:
  web:
    ports: ["8080:80", "8081:80", "443"]
  db:
    ports: ["80"]
)");

    auto declared = TopologyAllocator::CollectDeclaredPorts(manifest, {80, 1337}, "web");

    ASSERT_EQ(4u, declared.size());
    EXPECT_EQ("web", declared[0].service);
    EXPECT_EQ(80, declared[0].internal_port);
    EXPECT_EQ(443, declared[1].internal_port);
    EXPECT_EQ("db", declared[2].service);
    EXPECT_EQ(1337, declared[3].internal_port);
    EXPECT_EQ("web", declared[3].service);
}


TEST(ManifestHelpers, PrimaryServiceFallsBackToFirst)
{
    auto manifest = YAML::Load("services: {web: {image: a}, db: {image: b}}");

    EXPECT_EQ("db", TopologyAllocator::ResolvePrimaryService(manifest, "db"));
    EXPECT_EQ("web", TopologyAllocator::ResolvePrimaryService(manifest, ""));
    EXPECT_EQ("web", TopologyAllocator::ResolvePrimaryService(manifest, "cache"));
}


TEST(ManifestRewrite, RenamesServicesAndRemapsHostPorts)
{
    auto manifest = YAML::Load(kWebManifest);
    std::vector<PortMapping> ports = {
        {"web", 80, "tcp", 10000},
        {"web", 9000, "udp", 10001},
        {"db", 5432, "tcp", 10002},
        {"web", 1337, "tcp", 10003},
    };

    auto document = TopologyAllocator::RewriteManifest(manifest, "abcd1234", "ctfnet", ports, "web");

    EXPECT_EQ((std::vector<std::string>{"web-abcd1234", "db-abcd1234", "worker-abcd1234"}),
              ServiceKeys(document));

    auto web = document["services"]["web-abcd1234"];
    EXPECT_EQ("web-abcd1234", web["container_name"].as<std::string>());
    EXPECT_EQ("db-abcd1234", web["depends_on"][0].as<std::string>());
    EXPECT_EQ("10000:80", web["ports"][0].as<std::string>());
    EXPECT_EQ("127.0.0.1:10001:9000/udp", web["ports"][1].as<std::string>());
    EXPECT_EQ("10003:1337", web["ports"][2].as<std::string>());

    auto db = document["services"]["db-abcd1234"];
    EXPECT_EQ(5432, db["ports"][0]["target"].as<int>());
    EXPECT_EQ("10002", db["ports"][0]["published"].as<std::string>());
}


TEST(ManifestRewrite, PreservesUnrelatedFields)
{
    auto manifest = YAML::Load(kWebManifest);

    auto document = TopologyAllocator::RewriteManifest(manifest, "abcd1234", "ctfnet", {}, "web");

    EXPECT_EQ("3.8", document["version"].as<std::string>());
    auto web = document["services"]["web-abcd1234"];
    EXPECT_EQ("ctf/web:latest", web["image"].as<std::string>());
    EXPECT_EQ("flag{test}", web["environment"]["FLAG"].as<std::string>());

    // Ranges are kept verbatim
    auto worker = document["services"]["worker-abcd1234"];
    EXPECT_EQ("7000-7002:7000-7002", worker["ports"][0].as<std::string>());

    // Input untouched
    EXPECT_TRUE(manifest["services"]["web"]);
    EXPECT_EQ("8080:80", manifest["services"]["web"]["ports"][0].as<std::string>());
}


TEST(ManifestRewrite, EveryServiceJoinsTheCreatedNetwork)
{
    auto manifest = YAML::Load(kWebManifest);

    auto document = TopologyAllocator::RewriteManifest(manifest, "abcd1234", "ctfnet", {}, "web");
    const std::string dynamic = "ctfnet-abcd1234";

    auto web = document["services"]["web-abcd1234"];
    EXPECT_FALSE(web["networks"]["ctfnet"]);
    EXPECT_EQ(std::vector<std::string>{"web"}, Aliases(web, dynamic));

    auto db = document["services"]["db-abcd1234"];
    EXPECT_EQ((std::vector<std::string>{"database", "db"}), Aliases(db, dynamic));

    auto worker = document["services"]["worker-abcd1234"];
    EXPECT_TRUE(worker["networks"]["default"]);
    EXPECT_EQ(std::vector<std::string>{"worker"}, Aliases(worker, dynamic));

    auto networks = document["networks"];
    EXPECT_FALSE(networks["ctfnet"]);
    EXPECT_EQ("bridge", networks[dynamic]["driver"].as<std::string>());
    EXPECT_EQ(dynamic, networks[dynamic]["name"].as<std::string>());
    EXPECT_FALSE(networks[dynamic]["external"]);
    EXPECT_EQ("bridge", networks["internal"]["driver"].as<std::string>());
}


TEST(ManifestRewrite, NetworkModeServicesAreLeftAlone)
{
    auto manifest = YAML::Load("services: {sniffer: {image: a, network_mode: host}}");

    auto document = TopologyAllocator::RewriteManifest(manifest, "abcd1234", "ctfnet", {}, "sniffer");

    auto sniffer = document["services"]["sniffer-abcd1234"];
    EXPECT_EQ("host", sniffer["network_mode"].as<std::string>());
    EXPECT_FALSE(sniffer["networks"]);
}


TEST_F(TopologyAllocatorTest, AllocateWritesRewrittenManifest)
{
    auto original = WriteManifest(kWebManifest);

    AllocationRequest request;
    request.owner = "session-a";
    request.manifest = original;
    request.extra_internal_ports = {1337};

    auto allocation = allocator->Allocate(request);

    EXPECT_EQ(8u, allocation.suffix.size());
    EXPECT_EQ("ctfnet-" + allocation.suffix, allocation.network.name);
    EXPECT_TRUE(allocation.network.created);
    EXPECT_EQ(original.parent_path(), allocation.manifest_path.parent_path());
    EXPECT_NE(original, allocation.manifest_path);
    ASSERT_TRUE(std::filesystem::exists(allocation.manifest_path));
    EXPECT_EQ("web-" + allocation.suffix, allocation.service_names.at("web"));

    // web 80, web 9000/udp, db 5432, web 1337
    ASSERT_EQ(4u, allocation.ports.size());
    for (const auto& mapping : allocation.ports) {
        EXPECT_GE(mapping.host_port, config.port_pool.range_start);
        EXPECT_LE(mapping.host_port, config.port_pool.range_end);
    }
    ASSERT_TRUE(allocation.HostPortFor(1337).has_value());
    EXPECT_TRUE(allocation.HostPortFor(5432, "db").has_value());
    EXPECT_FALSE(allocation.HostPortFor(5432, "web").has_value());

    auto written = YAML::LoadFile(allocation.manifest_path.string());
    EXPECT_TRUE(written["services"]["web-" + allocation.suffix]);
    EXPECT_EQ(1u, pool->Leases().size());

    // Original manifest untouched
    EXPECT_TRUE(YAML::LoadFile(original.string())["services"]["web"]);
}


TEST_F(TopologyAllocatorTest, ParallelAllocationsNeverShare)
{
    auto original = WriteManifest(kWebManifest);

    AllocationRequest first;
    first.owner = "session-a";
    first.manifest = original;
    AllocationRequest second = first;
    second.owner = "session-b";

    auto a = allocator->Allocate(first);
    auto b = allocator->Allocate(second);

    EXPECT_NE(a.suffix, b.suffix);
    EXPECT_NE(a.network.name, b.network.name);
    EXPECT_NE(a.manifest_path, b.manifest_path);
    for (const auto& ma : a.ports) {
        for (const auto& mb : b.ports) {
            EXPECT_NE(ma.host_port, mb.host_port);
        }
    }
}


TEST_F(TopologyAllocatorTest, ReleaseReturnsEverything)
{
    AllocationRequest request;
    request.owner = "session-a";
    request.manifest = WriteManifest(kWebManifest);
    auto allocation = allocator->Allocate(request);

    EXPECT_TRUE(allocator->Release(allocation));

    EXPECT_FALSE(std::filesystem::exists(allocation.manifest_path));
    EXPECT_TRUE(pool->Leases().empty());
    EXPECT_TRUE(std::filesystem::exists(request.manifest));
}


TEST_F(TopologyAllocatorTest, MissingManifestIsAnAllocationError)
{
    AllocationRequest request;
    request.owner = "session-a";
    request.manifest = scratch.Path() / "nope.yml";

    EXPECT_THROW(allocator->Allocate(request), AllocationError);
}


TEST_F(TopologyAllocatorTest, ManifestWithoutServicesIsRejected)
{
    AllocationRequest request;
    request.owner = "session-a";
    request.manifest = WriteManifest("networks: {ctfnet: {external: true}}\n");

    EXPECT_THROW(allocator->Allocate(request), AllocationError);
}


TEST_F(TopologyAllocatorTest, ExhaustedPoolLeavesNothingBehind)
{
    pool->Acquire("hog", 10);

    AllocationRequest request;
    request.owner = "session-a";
    request.manifest = WriteManifest(kWebManifest);

    EXPECT_THROW(allocator->Allocate(request), AllocationError);

    std::size_t files = 0;
    for (const auto& entry : std::filesystem::directory_iterator(scratch.Path())) {
        files += entry.is_regular_file() ? 1 : 0;
    }
    EXPECT_EQ(1u, files);
    ASSERT_EQ(1u, pool->Leases().size());
    EXPECT_EQ("hog", pool->Leases()[0].owner);
}


TEST_F(TopologyAllocatorTest, NetworkOnlyAllocation)
{
    auto allocation = allocator->AllocateNetwork("session-a");

    EXPECT_TRUE(allocation.network.created);
    EXPECT_TRUE(fake->HasNetwork(allocation.network.name));
    EXPECT_TRUE(allocation.ports.empty());

    EXPECT_TRUE(allocator->Release(allocation));
    EXPECT_FALSE(fake->HasNetwork(allocation.network.name));
}


TEST_F(TopologyAllocatorTest, FixedNetworkIsSharedAndKept)
{
    auto network = allocator->EnsureFixedNetwork();

    EXPECT_EQ("ctfnet", network.name);
    EXPECT_FALSE(network.created);
    EXPECT_TRUE(fake->HasNetwork("ctfnet"));

    // Second session finds it in place
    EXPECT_EQ("ctfnet", allocator->EnsureFixedNetwork().name);

    TopologyAllocation allocation;
    allocation.owner = "session-a";
    allocation.network = network;
    EXPECT_TRUE(allocator->Release(allocation));
    EXPECT_TRUE(fake->HasNetwork("ctfnet"));
}


TEST_F(TopologyAllocatorTest, StragglersAreDisconnectedBeforeTheLastAttempt)
{
    auto allocation = allocator->AllocateNetwork("session-a");
    fake->AttachToNetwork(allocation.network.name, "c99");

    EXPECT_TRUE(allocator->Release(allocation));

    EXPECT_FALSE(fake->HasNetwork(allocation.network.name));
    auto operations = fake->Operations();
    EXPECT_NE(operations.end(), std::find(operations.begin(), operations.end(),
                                          "network disconnect " + allocation.network.name + " c99"));
}


TEST_F(TopologyAllocatorTest, RangedHostPortsAreReported)
{
    AllocationRequest request;
    request.owner = "session-a";
    request.manifest = WriteManifest(kWebManifest);

    auto allocation = allocator->Allocate(request);

    EXPECT_EQ(std::vector<std::string>{"worker: 7000-7002:7000-7002"}, allocation.verbatim_ports);
    EXPECT_EQ(1u, allocation.ToJSON()["verbatim_ports"].size());

    auto written = YAML::LoadFile(allocation.manifest_path.string());
    EXPECT_EQ("7000-7002:7000-7002",
              written["services"]["worker-" + allocation.suffix]["ports"][0].as<std::string>());

    allocator->Release(allocation);
}


TEST_F(TopologyAllocatorTest, AllocationsRecordTheirResources)
{
    AllocationRequest request;
    request.owner = "session-a";
    request.manifest = WriteManifest(kWebManifest);
    auto allocation = allocator->Allocate(request);
    auto network_only = allocator->AllocateNetwork("session-b");

    auto leases = pool->Leases();
    ASSERT_EQ(2u, leases.size());
    for (const auto& lease : leases) {
        if (lease.owner == "session-a") {
            EXPECT_EQ((std::vector<std::string>{allocation.network.name, allocation.manifest_path.string()}),
                      lease.resources);
        } else {
            EXPECT_TRUE(lease.ports.empty());
            EXPECT_EQ(std::vector<std::string>{network_only.network.name}, lease.resources);
        }
    }

    allocator->Release(allocation);
    allocator->Release(network_only);
    EXPECT_TRUE(pool->Leases().empty());
}


TEST_F(TopologyAllocatorTest, SweepRemovesOrphansAndSparesLiveSessions)
{
    allocator->EnsureFixedNetwork();

    AllocationRequest request;
    request.owner = "session-a";
    request.manifest = WriteManifest(kWebManifest);
    auto live = allocator->Allocate(request);
    fake->CreateNetwork(live.network.name);

    fake->CreateNetwork("ctfnet-deadbeef");
    fake->AttachToNetwork("ctfnet-deadbeef", "c42");
    auto stale = scratch.Path() / "docker-compose-deadbeef-0a1b2c.yml";
    std::ofstream(stale) << "services: {}\n";

    auto report = allocator->SweepOrphans({scratch.Path()});

    EXPECT_EQ(1, report.networks_removed);
    EXPECT_EQ(1, report.manifests_removed);
    EXPECT_EQ(2, report.skipped);
    EXPECT_EQ(0, report.errors);

    EXPECT_FALSE(fake->HasNetwork("ctfnet-deadbeef"));
    EXPECT_FALSE(std::filesystem::exists(stale));
    auto operations = fake->Operations();
    EXPECT_NE(operations.end(), std::find(operations.begin(), operations.end(),
                                          "network disconnect ctfnet-deadbeef c42"));

    EXPECT_TRUE(fake->HasNetwork(live.network.name));
    EXPECT_TRUE(fake->HasNetwork("ctfnet"));
    EXPECT_TRUE(std::filesystem::exists(live.manifest_path));
    EXPECT_TRUE(std::filesystem::exists(request.manifest));

    allocator->Release(live);
}


TEST_F(TopologyAllocatorTest, ResourcesOfExitedSessionsAreSwept)
{
    nlohmann::json registry;
    registry["leases"] = nlohmann::json::array();
    registry["leases"].push_back({{"owner", "crashed"},
                                  {"pid", 999999999},
                                  {"acquired_at", 0},
                                  {"ports", {10000}},
                                  {"resources", {"ctfnet-0badc0de"}}});
    std::ofstream(pool->GetRegistryPath()) << registry.dump();
    fake->CreateNetwork("ctfnet-0badc0de");

    auto report = allocator->SweepOrphans({});

    EXPECT_EQ(1, report.networks_removed);
    EXPECT_EQ(0, report.skipped);
    EXPECT_FALSE(fake->HasNetwork("ctfnet-0badc0de"));
    EXPECT_EQ(1, report.ToJSON()["networks_removed"].get<int>());
}


TEST_F(TopologyAllocatorTest, AllocationToJSON)
{
    AllocationRequest request;
    request.owner = "session-a";
    request.manifest = WriteManifest(kWebManifest);
    auto allocation = allocator->Allocate(request);

    auto j = allocation.ToJSON();

    EXPECT_EQ(allocation.suffix, j["suffix"]);
    EXPECT_EQ(allocation.network.name, j["network"]["name"]);
    EXPECT_EQ(allocation.ports.size(), j["ports"].size());

    allocator->Release(allocation);
}
