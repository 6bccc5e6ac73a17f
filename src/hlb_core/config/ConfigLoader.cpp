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
#include "hlb_core/config/ConfigLoader.hpp"
#include "hlb_core/discovery/PayloadCodec.hpp"
#include "setting/AppConfig.hpp"
#include "utils/Logger.hpp"
#include "utils/Utils.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <utility>

using json = nlohmann::json;

namespace discovery
{
std::vector<Ipv4Network>
defaultPreferredBlocks()
{
    std::vector<Ipv4Network> blocks;
    for (const auto& cidr : AppConfig::PREFERRED_BLOCKS)
    {
        blocks.push_back(boost::asio::ip::make_network_v4(cidr));
    }
    return blocks;
}

Ipv4Network
defaultExpectedNetwork()
{
    return boost::asio::ip::make_network_v4(AppConfig::EXPECTED_NETWORK);
}
} // namespace discovery

DiscoveryConfig::DiscoveryConfig()
    : discoveryPort(AppConfig::DEFAULT_REST_PORT),
      discoveryPath(AppConfig::DISCOVER_PATH),
      preferredBlocks(discovery::defaultPreferredBlocks()),
      expectedNetwork(discovery::defaultExpectedNetwork()),
      probeTimeout(AppConfig::PROBE_TIMEOUT_MS),
      fetchTimeout(AppConfig::FETCH_TIMEOUT_MS),
      maxInFlight(AppConfig::MAX_PROBES_IN_FLIGHT),
      maxCandidates(AppConfig::MAX_CANDIDATE_NETWORKS)
{
}

ControllerConfig::ControllerConfig()
    : bindAddress(AppConfig::DEFAULT_BIND_ADDRESS),
      openflowPort(AppConfig::DEFAULT_OFP_PORT),
      restPort(AppConfig::DEFAULT_REST_PORT),
      metricsPort(AppConfig::DEFAULT_METRICS_PORT),
      vipIp(AppConfig::DEFAULT_VIP_IP),
      vipPort(AppConfig::DEFAULT_HTTP_PORT),
      vipServices{AppConfig::DEFAULT_HTTP_PORT},
      preferredBlocks(discovery::defaultPreferredBlocks())
{
}

namespace
{

/**
 * Walks argv one option at a time. Accepts both "--name value" and "--name=value".
 */
class ArgCursor
{
  public:
    ArgCursor(int argc, char* argv[])
        : m_argc(argc),
          m_argv(argv)
    {
    }

    bool next()
    {
        if (++m_index >= m_argc)
        {
            return false;
        }
        std::string_view arg = m_argv[m_index];
        m_inlineValue.reset();
        auto eq = arg.find('=');
        if (arg.starts_with("--") && eq != std::string_view::npos)
        {
            m_name = std::string(arg.substr(0, eq));
            m_inlineValue = std::string(arg.substr(eq + 1));
        }
        else
        {
            m_name = std::string(arg);
        }
        return true;
    }

    const std::string& name() const
    {
        return m_name;
    }

    std::string value()
    {
        if (m_inlineValue)
        {
            return *m_inlineValue;
        }
        if (m_index + 1 >= m_argc)
        {
            throw std::invalid_argument("Missing value for " + m_name);
        }
        return m_argv[++m_index];
    }

    std::vector<std::string> rest()
    {
        std::vector<std::string> out;
        while (++m_index < m_argc)
        {
            out.emplace_back(m_argv[m_index]);
        }
        return out;
    }

  private:
    int m_argc;
    char** m_argv;
    int m_index = 0;
    std::string m_name;
    std::optional<std::string> m_inlineValue;
};

bool
isLoggingFlag(const std::string& name)
{
    return name == "--log-level" || name == "--log-file";
}

void
requireIpv4(const std::string& value, const std::string& what)
{
    if (!utils::isIpv4(value))
    {
        throw std::invalid_argument("Invalid " + what + ": " + value);
    }
}

} // namespace

DataplaneOptions
ConfigLoader::parseDataplaneArgs(int argc, char* argv[])
{
    DataplaneOptions opts;
    DiscoveryConfig& dc = opts.discovery;

    std::optional<std::string> controllerIp;
    std::optional<std::string> restPort;
    std::optional<std::string> preferIface;
    std::optional<std::string> topologyScript;

    ArgCursor args(argc, argv);
    while (args.next())
    {
        const auto& name = args.name();
        if (name == "--")
        {
            opts.passThroughArgs = args.rest();
            break;
        }
        else if (name == "-h" || name == "--help")
        {
            opts.showHelp = true;
        }
        else if (isLoggingFlag(name))
        {
            args.value();
        }
        else if (name == "--controller-ip")
        {
            controllerIp = args.value();
        }
        else if (name == "--controller-rest-port" || name == "--discovery-port")
        {
            restPort = args.value();
        }
        else if (name == "--prefer-iface")
        {
            preferIface = args.value();
        }
        else if (name == "--discover-path")
        {
            dc.discoveryPath = args.value();
            if (!dc.discoveryPath.starts_with("/"))
            {
                dc.discoveryPath.insert(0, "/");
            }
        }
        else if (name == "--no-verify-controller")
        {
            dc.verifyOverride = false;
        }
        else if (name == "--no-expected-network")
        {
            dc.expectedNetwork.reset();
        }
        else if (name == "--vip")
        {
            opts.launch.vip = args.value();
            requireIpv4(*opts.launch.vip, "VIP");
        }
        else if (name == "--controller-port")
        {
            opts.launch.controllerPort = utils::parsePort(args.value());
        }
        else if (name == "--http-port")
        {
            opts.launch.httpPort = utils::parsePort(args.value());
        }
        else if (name == "--topology-script")
        {
            topologyScript = args.value();
        }
        else if (name == "--probe-timeout-ms")
        {
            dc.probeTimeout = std::chrono::milliseconds(utils::parseCount(args.value()));
        }
        else if (name == "--fetch-timeout-ms")
        {
            dc.fetchTimeout = std::chrono::milliseconds(utils::parseCount(args.value()));
        }
        else if (name == "--max-in-flight")
        {
            dc.maxInFlight = utils::parseCount(args.value());
        }
        else if (name == "--max-candidates")
        {
            dc.maxCandidates = utils::parseCount(args.value());
        }
        else
        {
            throw std::invalid_argument("Unknown option: " + name);
        }
    }

    if (!controllerIp)
    {
        controllerIp = utils::getEnv("CONTROLLER_IP");
    }
    if (controllerIp && !controllerIp->empty())
    {
        requireIpv4(*controllerIp, "controller address");
        dc.controllerAddress = controllerIp;
    }

    if (!restPort)
    {
        restPort = utils::getEnv("CONTROLLER_REST_PORT");
    }
    if (restPort)
    {
        dc.discoveryPort = utils::parsePort(*restPort);
    }

    if (!preferIface)
    {
        preferIface = utils::getEnv("PREFER_IFACE");
    }
    dc.preferredInterface = preferIface.value_or("");

    if (!topologyScript)
    {
        topologyScript = utils::getEnv("TOPOLOGY_SCRIPT");
    }
    opts.topologyScript = topologyScript.value_or("");

    if (dc.maxInFlight == 0)
    {
        throw std::invalid_argument("--max-in-flight must be at least 1");
    }
    if (dc.maxCandidates == 0)
    {
        throw std::invalid_argument("--max-candidates must be at least 1");
    }
    if (dc.fetchTimeout.count() == 0 || dc.probeTimeout.count() == 0)
    {
        throw std::invalid_argument("Timeouts must be positive");
    }

    return opts;
}

ControllerConfig
ConfigLoader::parseControllerArgs(int argc, char* argv[])
{
    ControllerConfig cfg;

    std::optional<std::string> advertiseIp;
    std::optional<std::string> preferIface;
    std::optional<std::string> configPath;
    std::optional<std::string> bind;
    std::optional<std::string> restPort;

    ArgCursor args(argc, argv);
    while (args.next())
    {
        const auto& name = args.name();
        if (name == "-h" || name == "--help")
        {
            cfg.showHelp = true;
        }
        else if (isLoggingFlag(name))
        {
            args.value();
        }
        else if (name == "--advertise-ip")
        {
            advertiseIp = args.value();
        }
        else if (name == "--prefer-iface")
        {
            preferIface = args.value();
        }
        else if (name == "--config")
        {
            configPath = args.value();
        }
        else if (name == "--bind")
        {
            bind = args.value();
        }
        else if (name == "--rest-port")
        {
            restPort = args.value();
        }
        else
        {
            throw std::invalid_argument("Unknown option: " + name);
        }
    }

    if (!configPath)
    {
        configPath = utils::getEnv("HYBRID_LB_CONFIG");
    }
    if (configPath)
    {
        cfg.configPath = *configPath;
        if (!loadControllerFile(cfg.configPath, cfg))
        {
            SPDLOG_LOGGER_WARN(Logger::instance(),
                               "Could not load controller config {}; using defaults",
                               cfg.configPath);
        }
    }

    if (!advertiseIp)
    {
        advertiseIp = utils::getEnv("ADVERTISE_IP");
    }
    if (advertiseIp && !advertiseIp->empty() && *advertiseIp != "auto")
    {
        requireIpv4(*advertiseIp, "advertise address");
        cfg.advertiseIp = advertiseIp;
    }

    if (!preferIface)
    {
        preferIface = utils::getEnv("PREFER_IFACE");
    }
    cfg.preferredInterface = preferIface.value_or("");

    if (bind)
    {
        requireIpv4(*bind, "bind address");
        cfg.bindAddress = *bind;
    }
    if (restPort)
    {
        cfg.restPort = utils::parsePort(*restPort);
    }

    return cfg;
}

bool
ConfigLoader::loadControllerFile(const std::string& path, ControllerConfig& cfg)
{
    std::ifstream in(path);
    if (!in.is_open())
    {
        return false;
    }

    json doc;
    try
    {
        doc = json::parse(in);
    }
    catch (const json::exception& e)
    {
        SPDLOG_LOGGER_WARN(Logger::instance(), "Controller config {} is not JSON: {}", path, e.what());
        return false;
    }
    if (!doc.is_object())
    {
        return false;
    }

    ControllerConfig merged = cfg;
    if (doc.contains("controller") && doc["controller"].is_object())
    {
        const auto& ctrl = doc["controller"];
        merged.openflowPort =
            discovery::portFromJson(ctrl.value("of_listen_port", json())).value_or(merged.openflowPort);
        merged.restPort =
            discovery::portFromJson(ctrl.value("rest_port", json())).value_or(merged.restPort);
        merged.metricsPort =
            discovery::portFromJson(ctrl.value("metrics_port", json())).value_or(merged.metricsPort);
    }
    if (doc.contains("vip") && doc["vip"].is_object())
    {
        const auto& vip = doc["vip"];
        if (vip.contains("ip"))
        {
            if (!vip["ip"].is_string() || !utils::isIpv4(vip["ip"].get<std::string>()))
            {
                SPDLOG_LOGGER_WARN(Logger::instance(), "Controller config {}: bad vip.ip", path);
                return false;
            }
            merged.vipIp = vip["ip"].get<std::string>();
        }
        if (vip.contains("services") && vip["services"].is_array())
        {
            merged.vipServices.clear();
            for (const auto& s : vip["services"])
            {
                if (auto port = discovery::portFromJson(s))
                {
                    merged.vipServices.push_back(*port);
                }
            }
        }
        merged.vipPort = discovery::portFromJson(vip.value("port", json()))
                             .value_or(discovery::preferredServicePort(merged.vipServices));
    }
    if (doc.contains("backends") && doc["backends"].is_array())
    {
        merged.backends.assign(doc["backends"].begin(), doc["backends"].end());
    }

    cfg = std::move(merged);
    return true;
}

std::string
ConfigLoader::dataplaneUsage()
{
    std::ostringstream os;
    os << "Usage: hlb-dataplane [options] [-- <topology args>]\n"
       << "  --controller-ip IP          Controller address; skips scanning (env CONTROLLER_IP)\n"
       << "  --controller-rest-port N    Discovery port, default " << AppConfig::DEFAULT_REST_PORT
       << " (env CONTROLLER_REST_PORT)\n"
       << "  --prefer-iface NAME         Scan this interface's subnet first (env PREFER_IFACE)\n"
       << "  --discover-path PATH        Discovery path, default " << AppConfig::DISCOVER_PATH << "\n"
       << "  --no-verify-controller      Trust --controller-ip without fetching the payload\n"
       << "  --no-expected-network       Do not add " << AppConfig::EXPECTED_NETWORK
       << " to the candidates\n"
       << "  --vip IP                    Override the advertised VIP\n"
       << "  --controller-port N         OpenFlow port when no payload is fetched, default "
       << AppConfig::DEFAULT_OFP_PORT << "\n"
       << "  --http-port N               Backend HTTP port passed to the topology\n"
       << "  --topology-script PATH      Exec this launcher with the discovered settings"
       << " (env TOPOLOGY_SCRIPT)\n"
       << "  --probe-timeout-ms N        TCP probe timeout, default " << AppConfig::PROBE_TIMEOUT_MS
       << "\n"
       << "  --fetch-timeout-ms N        Discovery GET timeout, default "
       << AppConfig::FETCH_TIMEOUT_MS << "\n"
       << "  --max-in-flight N           Concurrent probes, default "
       << AppConfig::MAX_PROBES_IN_FLIGHT << "\n"
       << "  --max-candidates N          Subnets to scan, default "
       << AppConfig::MAX_CANDIDATE_NETWORKS << "\n"
       << "  --log-level LEVEL           trace|debug|info|warn|err|critical|off\n"
       << "  --log-file PATH             Also log to PATH\n";
    return os.str();
}

std::string
ConfigLoader::controllerUsage()
{
    std::ostringstream os;
    os << "Usage: hlb-controller [options]\n"
       << "  --advertise-ip IP|auto      Address to advertise (env ADVERTISE_IP)\n"
       << "  --prefer-iface NAME         Advertise this interface's address (env PREFER_IFACE)\n"
       << "  --config PATH               Controller JSON config (env HYBRID_LB_CONFIG)\n"
       << "  --bind IP                   Listen address, default " << AppConfig::DEFAULT_BIND_ADDRESS
       << "\n"
       << "  --rest-port N               Discovery endpoint port, default "
       << AppConfig::DEFAULT_REST_PORT << "\n"
       << "  --log-level LEVEL           trace|debug|info|warn|err|critical|off\n"
       << "  --log-file PATH             Also log to PATH\n";
    return os.str();
}
