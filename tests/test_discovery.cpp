/*
 * Copyright (c) 2025-present
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 * The HybridLB Authors and Contributors.
 */

/**
 * @file test_discovery.cpp
 * @brief Loopback tests for probing, fetching and the discovery state machine.
 *
 * A DiscoveryServer bound to 127.0.0.1 on an ephemeral port plays the controller. Every other
 * 127.0.0.0/8 address refuses connections immediately, so whole /24s scan quickly.
 */

#include <gtest/gtest.h>

#include "hlb_core/discovery/DiscoveryFetcher.hpp"
#include "hlb_core/discovery/DiscoveryOrchestrator.hpp"
#include "hlb_core/discovery/PayloadCodec.hpp"
#include "hlb_core/discovery/ProbeScanner.hpp"
#include "hlb_core/http/DiscoveryServer.hpp"
#include "setting/AppConfig.hpp"
#include <algorithm>
#include <arpa/inet.h>
#include <boost/asio/ip/tcp.hpp>
#include <fcntl.h>
#include <filesystem>
#include <memory>
#include <netinet/in.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace std::chrono_literals;
using discovery::DiscoveryOrchestrator;
using discovery::RankedNetwork;

namespace
{

json
controllerPayload()
{
    return json{{"controller",
                 {{"ip", "192.168.56.10"},
                  {"of_listen_port", 6633},
                  {"rest_port", 8080},
                  {"metrics_port", 9100}}},
                {"vip", {{"ip", "10.0.0.100"}, {"port", 8080}, {"services", {8080}}}},
                {"backends", json::array({{{"name", "h1"}}})}};
}

// Controller stand-in serving payloadSource on 127.0.0.1:<ephemeral>
struct LoopbackController
{
    explicit LoopbackController(std::function<json()> payloadSource = controllerPayload)
    {
        auto state = std::make_shared<DiscoveryEndpointState>();
        state->payloadSource = std::move(payloadSource);
        state->advertiseIp = "127.0.0.1";
        server = std::make_unique<DiscoveryServer>(ioc, "127.0.0.1", 0, state, 1);
        server->start();
    }

    ~LoopbackController()
    {
        server->stop();
    }

    uint16_t port() const
    {
        return server->port();
    }

    net::io_context ioc;
    std::unique_ptr<DiscoveryServer> server;
};

// A loopback port with no listener
uint16_t
closedPort()
{
    net::io_context ioc;
    tcp::acceptor acceptor(ioc, tcp::endpoint(net::ip::make_address_v4("127.0.0.1"), 0));
    uint16_t port = acceptor.local_endpoint().port();
    acceptor.close();
    return port;
}

DiscoveryConfig
loopbackConfig(uint16_t port)
{
    DiscoveryConfig cfg;
    cfg.discoveryPort = port;
    cfg.expectedNetwork.reset();
    cfg.probeTimeout = 250ms;
    cfg.fetchTimeout = 1000ms;
    return cfg;
}

RankedNetwork
subnet(const std::string& cidr, int rank)
{
    return RankedNetwork{boost::asio::ip::make_network_v4(cidr), rank};
}

// Lowers the soft RLIMIT_NOFILE while alive
class DescriptorLimit
{
  public:
    explicit DescriptorLimit(rlim_t soft)
    {
        ::getrlimit(RLIMIT_NOFILE, &m_saved);
        rlimit lowered = m_saved;
        lowered.rlim_cur = soft;
        m_applied = ::setrlimit(RLIMIT_NOFILE, &lowered) == 0;
    }

    ~DescriptorLimit()
    {
        ::setrlimit(RLIMIT_NOFILE, &m_saved);
    }

    bool applied() const
    {
        return m_applied;
    }

  private:
    rlimit m_saved{};
    bool m_applied = false;
};

rlim_t
highestOpenDescriptor()
{
    rlim_t highest = 0;
    for (const auto& entry : std::filesystem::directory_iterator("/proc/self/fd"))
    {
        highest = std::max<rlim_t>(highest, std::stoul(entry.path().filename().string()));
    }
    return highest;
}

http::response<http::string_body>
request(uint16_t port, http::verb verb, const std::string& target)
{
    net::io_context ioc;
    beast::tcp_stream stream(ioc);
    stream.connect(tcp::endpoint(net::ip::make_address_v4("127.0.0.1"), port));

    http::request<http::empty_body> req{verb, target, 11};
    req.set(http::field::host, "127.0.0.1");
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res);
    return res;
}

DiscoveryOrchestrator::AddressProvider
failingProvider(bool& called)
{
    return [&called]() {
        called = true;
        return std::vector<discovery::LocalAddress>{};
    };
}

} // namespace

TEST(ProbeScanner, FindsOnlyListeningHost)
{
    LoopbackController controller;
    auto open = discovery::ProbeScanner::scan(boost::asio::ip::make_network_v4("127.0.0.0/24"),
                                              controller.port(),
                                              250ms,
                                              96);
    EXPECT_EQ(open, (std::vector<std::string>{"127.0.0.1"}));
}

TEST(ProbeScanner, EmptyWhenNothingListens)
{
    auto open = discovery::ProbeScanner::scan(boost::asio::ip::make_network_v4("127.0.5.0/28"),
                                              closedPort(),
                                              250ms,
                                              4);
    EXPECT_TRUE(open.empty());
}

TEST(DiscoveryFetcher, FetchesAndValidatesPayload)
{
    LoopbackController controller;
    discovery::DiscoveryFetcher fetcher("/discover", 1000ms);

    auto result = fetcher.fetch("127.0.0.1", controller.port());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->host, "127.0.0.1");
    EXPECT_EQ(result->controllerAddress, "192.168.56.10");
    EXPECT_TRUE(result->verified);
    ASSERT_TRUE(result->payload.has_value());
    EXPECT_EQ(result->payload->controller.openflowPort, 6633);
}

TEST(DiscoveryFetcher, StatusRouteCarriesPayload)
{
    LoopbackController controller;
    discovery::DiscoveryFetcher fetcher("/status?verbose=1", 1000ms);
    EXPECT_TRUE(fetcher.fetch("127.0.0.1", controller.port()).has_value());
}

TEST(DiscoveryFetcher, NonPayloadResponsesRejected)
{
    LoopbackController controller;
    EXPECT_FALSE(discovery::DiscoveryFetcher("/health", 1000ms).fetch("127.0.0.1", controller.port()));
    EXPECT_FALSE(
        discovery::DiscoveryFetcher("/no-such-path", 1000ms).fetch("127.0.0.1", controller.port()));
    EXPECT_FALSE(discovery::DiscoveryFetcher("/discover", 500ms).fetch("127.0.0.1", closedPort()));
}

TEST(DiscoveryOrchestrator, FindsControllerInFirstSubnet)
{
    LoopbackController controller;
    DiscoveryOrchestrator orchestrator(loopbackConfig(controller.port()));

    auto result = orchestrator.scanCandidates({subnet("127.0.0.0/24", 0), subnet("127.0.2.0/24", 1)});
    EXPECT_EQ(result.host, "127.0.0.1");
    EXPECT_EQ(result.controllerAddress, "192.168.56.10");
    EXPECT_TRUE(result.verified);
    ASSERT_TRUE(result.payload.has_value());
    EXPECT_EQ(result.payload->vip.address.to_string(), "10.0.0.100");
    EXPECT_EQ(result.payload->backends.size(), 1u);
    EXPECT_EQ(result.attemptedNetworks, (std::vector<std::string>{"127.0.0.0/24"}));
    EXPECT_EQ(orchestrator.state(), DiscoveryOrchestrator::State::Found);
    EXPECT_EQ(orchestrator.subnetIndex().value_or(99), 0u);
}

TEST(DiscoveryOrchestrator, MovesToNextSubnetAfterMiss)
{
    LoopbackController controller;
    DiscoveryOrchestrator orchestrator(loopbackConfig(controller.port()));

    auto result = orchestrator.scanCandidates({subnet("127.0.2.0/24", 0), subnet("127.0.0.0/24", 1)});
    EXPECT_EQ(result.host, "127.0.0.1");
    EXPECT_EQ(result.attemptedNetworks,
              (std::vector<std::string>{"127.0.2.0/24", "127.0.0.0/24"}));
    EXPECT_EQ(orchestrator.subnetIndex().value_or(99), 1u);
}

TEST(DiscoveryOrchestrator, ExhaustedListsEveryScannedNetwork)
{
    LoopbackController controller;
    DiscoveryOrchestrator orchestrator(loopbackConfig(controller.port()));

    try
    {
        orchestrator.scanCandidates({subnet("127.0.2.0/24", 0), subnet("127.0.3.0/24", 1)});
        FAIL() << "expected DiscoveryExhaustedError";
    }
    catch (const discovery::DiscoveryExhaustedError& e)
    {
        EXPECT_EQ(e.attemptedNetworks(),
                  (std::vector<std::string>{"127.0.2.0/24", "127.0.3.0/24"}));
        EXPECT_NE(std::string(e.what()).find("127.0.3.0/24"), std::string::npos);
    }
    EXPECT_EQ(orchestrator.state(), DiscoveryOrchestrator::State::AllExhausted);
}

TEST(DiscoveryOrchestrator, OpenPortWithoutVipIsNotAController)
{
    LoopbackController impostor([]() { return json{{"controller", {{"ip", "127.0.0.1"}}}}; });
    DiscoveryOrchestrator orchestrator(loopbackConfig(impostor.port()));

    EXPECT_THROW(orchestrator.scanCandidates({subnet("127.0.0.0/24", 0)}),
                 discovery::DiscoveryExhaustedError);
}

TEST(DiscoveryOrchestrator, NoCandidatesWithoutPrivateAddresses)
{
    auto cfg = loopbackConfig(closedPort());
    DiscoveryOrchestrator orchestrator(cfg, []() {
        return std::vector<discovery::LocalAddress>{
            {"eth0", boost::asio::ip::make_address_v4("203.0.113.7"), 24}};
    });

    EXPECT_TRUE(orchestrator.buildCandidates().empty());
    EXPECT_THROW(orchestrator.run(), discovery::NoCandidatesError);
    EXPECT_EQ(orchestrator.state(), DiscoveryOrchestrator::State::Idle);
}

TEST(DiscoveryOrchestrator, VerifiedOverrideSkipsEnumeration)
{
    LoopbackController controller;
    auto cfg = loopbackConfig(controller.port());
    cfg.controllerAddress = "127.0.0.1";

    bool enumerated = false;
    DiscoveryOrchestrator orchestrator(cfg, failingProvider(enumerated));
    auto result = orchestrator.run();

    EXPECT_FALSE(enumerated);
    EXPECT_TRUE(result.verified);
    EXPECT_EQ(result.host, "127.0.0.1");
    ASSERT_TRUE(result.payload.has_value());
    EXPECT_TRUE(result.attemptedNetworks.empty());
    EXPECT_EQ(orchestrator.state(), DiscoveryOrchestrator::State::Found);
}

TEST(DiscoveryOrchestrator, UnreachableOverrideStillUsed)
{
    auto cfg = loopbackConfig(closedPort());
    cfg.controllerAddress = "127.0.0.1";
    cfg.fetchTimeout = 500ms;

    bool enumerated = false;
    DiscoveryOrchestrator orchestrator(cfg, failingProvider(enumerated));
    auto result = orchestrator.run();

    EXPECT_FALSE(enumerated);
    EXPECT_FALSE(result.verified);
    EXPECT_FALSE(result.payload.has_value());
    EXPECT_EQ(result.controllerAddress, "127.0.0.1");
}

TEST(DiscoveryOrchestrator, TrustedOverrideDoesNoIo)
{
    auto cfg = loopbackConfig(closedPort());
    cfg.controllerAddress = "10.255.255.1";
    cfg.verifyOverride = false;

    bool enumerated = false;
    DiscoveryOrchestrator orchestrator(cfg, failingProvider(enumerated));
    auto result = orchestrator.run();

    EXPECT_FALSE(enumerated);
    EXPECT_FALSE(result.verified);
    EXPECT_EQ(result.controllerAddress, "10.255.255.1");
    EXPECT_EQ(orchestrator.state(), DiscoveryOrchestrator::State::Found);
}

TEST(DiscoveryOrchestrator, DescriptorExhaustionIsFatal)
{
    auto cfg = loopbackConfig(closedPort());
    cfg.maxInFlight = 96;
    DiscoveryOrchestrator orchestrator(cfg);

    DescriptorLimit limit(highestOpenDescriptor() + 8);
    ASSERT_TRUE(limit.applied());

    try
    {
        orchestrator.scanCandidates({subnet("127.0.9.0/24", 0), subnet("127.0.10.0/24", 1)});
        FAIL() << "expected DiscoveryResourceError";
    }
    catch (const discovery::DiscoveryResourceError& e)
    {
        EXPECT_EQ(e.code(), net::error::no_descriptors);
        EXPECT_NE(std::string(e.what()).find("127.0.9.0/24"), std::string::npos);
    }
    // The failing subnet is where scanning stopped
    EXPECT_EQ(orchestrator.subnetIndex().value_or(99), 0u);
}

TEST(DiscoveryServer, RoutesAndServerHeader)
{
    LoopbackController controller;

    auto health = request(controller.port(), http::verb::get, AppConfig::HEALTH_PATH);
    EXPECT_EQ(health.result(), http::status::ok);
    EXPECT_EQ(std::string(health[http::field::server]), AppConfig::SERVER_NAME);
    EXPECT_EQ(json::parse(health.body())["status"], "ok");

    auto status = request(controller.port(), http::verb::get, AppConfig::STATUS_PATH);
    EXPECT_EQ(status.result(), http::status::ok);
    auto body = json::parse(status.body());
    EXPECT_EQ(body["status"], "running");
    EXPECT_EQ(body["advertise_ip"], "127.0.0.1");
    EXPECT_TRUE(body.contains("uptime_s"));

    EXPECT_EQ(request(controller.port(), http::verb::options, "/discover").result(),
              http::status::no_content);
    EXPECT_EQ(request(controller.port(), http::verb::get, "/metrics").result(),
              http::status::not_found);
    EXPECT_EQ(request(controller.port(), http::verb::post, AppConfig::DISCOVER_PATH).result(),
              http::status::not_found);
}

TEST(DiscoveryServer, AcceptFailuresBackOff)
{
    LoopbackController controller;
    const uint16_t port = controller.port();
    std::size_t failures = 0;

    {
        DescriptorLimit limit(highestOpenDescriptor() + 4);
        ASSERT_TRUE(limit.applied());

        // Fill every free slot, then hand exactly one to the client socket
        std::vector<int> fillers;
        for (int fd = ::open("/dev/null", O_RDONLY); fd >= 0; fd = ::open("/dev/null", O_RDONLY))
        {
            fillers.push_back(fd);
        }
        ASSERT_FALSE(fillers.empty());
        ::close(fillers.back());
        fillers.pop_back();

        int client = ::socket(AF_INET, SOCK_STREAM, 0);
        ASSERT_GE(client, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        EXPECT_EQ(::connect(client, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);

        std::this_thread::sleep_for(550ms);
        failures = controller.server->acceptFailures();

        ::close(client);
        for (int fd : fillers)
        {
            ::close(fd);
        }
    }

    EXPECT_GE(failures, 1u);
    EXPECT_LE(failures, 10u);

    // Serving resumes once descriptors are available again
    EXPECT_TRUE(discovery::DiscoveryFetcher("/discover", 1000ms).fetch("127.0.0.1", port));
}
