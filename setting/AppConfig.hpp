#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace AppConfig {
    static const std::string DISCOVER_PATH = "/discover";
    static const std::string STATUS_PATH = "/status";
    static const std::string HEALTH_PATH = "/health";
    static const std::string SERVER_NAME = "hlb-controller";

    static constexpr uint16_t DEFAULT_REST_PORT = 8080;
    static constexpr uint16_t DEFAULT_OFP_PORT = 6653;
    static constexpr uint16_t DEFAULT_METRICS_PORT = 9100;
    static constexpr uint16_t DEFAULT_HTTP_PORT = 8080;
    static const std::string DEFAULT_VIP_IP = "10.0.0.100";
    static const std::string DEFAULT_BIND_ADDRESS = "0.0.0.0";

    // VirtualBox host-only network used between the controller and dataplane VMs
    static const std::string EXPECTED_NETWORK = "192.168.56.0/24";
    static const std::string PREFERRED_BLOCKS[] = {
        "192.168.56.0/24", "192.168.0.0/16", "10.0.0.0/8", "172.16.0.0/12"};

    static constexpr int PROBE_TIMEOUT_MS = 250;
    static constexpr int FETCH_TIMEOUT_MS = 1000;
    static constexpr std::size_t MAX_PROBES_IN_FLIGHT = 96;
    static constexpr std::size_t MAX_CANDIDATE_NETWORKS = 4;
    static constexpr uint8_t MAX_SCAN_PREFIX = 24;
}
