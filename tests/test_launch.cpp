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
 * @file test_launch.cpp
 * @brief Tests for turning a discovery result into the topology launcher command line.
 */

#include <gtest/gtest.h>

#include "hlb_core/discovery/PayloadCodec.hpp"
#include "hlb_core/launch/DataplaneLaunchPlan.hpp"

using discovery::DiscoveryResult;

namespace
{
DiscoveryResult
discovered()
{
    DiscoveryResult result;
    result.host = "192.168.56.10";
    result.controllerAddress = "192.168.56.10";
    result.verified = true;
    result.payload = discovery::parseDiscoveryPayload(
        R"({"controller": {"ip": "192.168.56.10", "of_listen_port": 6633},
            "vip": {"ip": "10.0.0.150", "port": 8081}})");
    return result;
}
} // namespace

TEST(DataplaneLaunchPlan, UsesPayloadValues)
{
    auto plan = DataplaneLaunchPlan::fromDiscovery(discovered(), LaunchOverrides{});
    EXPECT_EQ(plan.controllerIp, "192.168.56.10");
    EXPECT_EQ(plan.controllerPort, 6633);
    EXPECT_EQ(plan.vipIp, "10.0.0.150");
    EXPECT_EQ(plan.httpPort, 8081);
    EXPECT_TRUE(plan.verified);
}

TEST(DataplaneLaunchPlan, UnverifiedOverrideUsesDefaults)
{
    DiscoveryResult result;
    result.host = "10.1.1.1";
    result.controllerAddress = "10.1.1.1";

    auto plan = DataplaneLaunchPlan::fromDiscovery(result, LaunchOverrides{});
    EXPECT_EQ(plan.controllerIp, "10.1.1.1");
    EXPECT_EQ(plan.controllerPort, 6653);
    EXPECT_EQ(plan.vipIp, "10.0.0.100");
    EXPECT_EQ(plan.httpPort, 8080);
    EXPECT_FALSE(plan.verified);
}

TEST(DataplaneLaunchPlan, VipAndHttpPortOverridesWin)
{
    LaunchOverrides overrides;
    overrides.vip = "10.0.0.9";
    overrides.httpPort = 9090;
    auto plan = DataplaneLaunchPlan::fromDiscovery(discovered(), overrides);
    EXPECT_EQ(plan.vipIp, "10.0.0.9");
    EXPECT_EQ(plan.httpPort, 9090);
}

TEST(DataplaneLaunchPlan, ControllerPortFlagOnlyWithoutPayload)
{
    LaunchOverrides overrides;
    overrides.controllerPort = 6633;

    DiscoveryResult unverified;
    unverified.host = "10.1.1.1";
    unverified.controllerAddress = "10.1.1.1";
    EXPECT_EQ(DataplaneLaunchPlan::fromDiscovery(unverified, overrides).controllerPort, 6633);

    overrides.controllerPort = 7000;
    // The fetched payload says 6633
    EXPECT_EQ(DataplaneLaunchPlan::fromDiscovery(discovered(), overrides).controllerPort, 6633);
}

TEST(DataplaneLaunchPlan, PythonScriptsRunUnderInterpreter)
{
    auto plan = DataplaneLaunchPlan::fromDiscovery(discovered(), LaunchOverrides{});
    auto argv = plan.command("topo/hybrid_topo.py", {"--hosts", "4"});
    std::vector<std::string> expected{"python3",
                                      "topo/hybrid_topo.py",
                                      "--controller-ip",
                                      "192.168.56.10",
                                      "--controller-port",
                                      "6633",
                                      "--vip",
                                      "10.0.0.150",
                                      "--http-port",
                                      "8081",
                                      "--hosts",
                                      "4"};
    EXPECT_EQ(argv, expected);

    auto shell = plan.command("./start.sh", {});
    EXPECT_EQ(shell.front(), "./start.sh");
    EXPECT_EQ(shell.size(), 9u);
}

TEST(DataplaneLaunchPlan, ExecReportsMissingProgram)
{
    auto error = execCommand({"/nonexistent/hlb-launcher-binary"});
    EXPECT_FALSE(error.empty());
    EXPECT_FALSE(execCommand({}).empty());
}
