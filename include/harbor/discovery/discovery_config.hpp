#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>

#include "harbor/config/config.hpp"
#include "harbor/discovery/broadcast_service.hpp"
#include "harbor/discovery/discovery_client.hpp"
#include "harbor/discovery/port_allocator.hpp"
#include "harbor/discovery/service_record.hpp"
#include "harbor/discovery/service_registry.hpp"
#include "harbor/health/health_monitor.hpp"

namespace harbor::discovery {

// Settings of the whole discovery stack, read from the "discovery" section.
// Durations are in milliseconds.
class DiscoveryConfig : public config::ConfigurationProperties {
public:
    struct RegistryConfig {
        int default_ttl_ms = 30000;
        int cleanup_interval_ms = 10000;
    };

    struct RangeConfig {
        int low = 0;
        int high = 0;
    };

    struct PortAllocatorConfig {
        // Merged over the built-in ranges; an entry replaces the built-in
        // range of the same name.
        std::map<std::string, RangeConfig> ranges;
        RangeConfig default_range{10000, 10999};
        std::vector<int> reserved_ports{22,   80,   443,  3306,
                                        5432, 6379, 8080, 9090};
        bool allow_ephemeral = false;
        bool check_os_bind = false;
    };

    struct HealthConfig {
        bool enabled = true;
        int check_interval_ms = 5000;
        int check_timeout_ms = 2000;
        int unhealthy_threshold = 3;
        int healthy_threshold = 2;
        std::string default_strategy = "tcp";
        bool enable_auto_removal = true;
        int removal_threshold = 5;
        int probe_concurrency = 8;
        std::string http_health_path = "/health";
    };

    struct ClientConfig {
        std::vector<std::string> preferred_strategies{"registry", "dns",
                                                      "broadcast"};
        bool enable_registry = true;
        bool enable_dns = true;
        bool enable_broadcast = false;
        int discovery_timeout_ms = 5000;
        int wait_poll_interval_ms = 100;
        int default_port_probe_timeout_ms = 100;
        // Merged over the built-in table
        std::map<std::string, int> default_ports;
    };

    struct BroadcastConfig {
        std::string multicast_address = "239.255.0.1";
        int port = 7001;
        int announcement_interval_ms = 5000;
        int discovery_timeout_ms = 3000;
        std::string interface_address;
        int ttl = 2;
        bool loopback = true;
        int max_message_age_ms = 60000;
    };

    // Registered by the daemon at startup and kept alive with heartbeats
    struct StaticService {
        std::string name;
        std::string host = "127.0.0.1";
        int port = 0;  // 0: allocate
        std::string protocol = "tcp";
        std::string version;
        std::string port_range_hint;
        int ttl_ms = 0;  // 0: registry default
        std::string health_strategy;  // empty: monitor default
        std::map<std::string, std::string> metadata;
    };

    RegistryConfig registry;
    PortAllocatorConfig port_allocator;
    HealthConfig health;
    ClientConfig client;
    BroadcastConfig broadcast;
    std::vector<StaticService> services;
    int snapshot_interval_ms = 60000;

    void from_ptree(const boost::property_tree::ptree& pt) override;
    void validate() const override;
    std::string properties_name() const override { return "discovery"; }

    RegistryOptions registry_options() const;
    PortAllocatorOptions port_allocator_options() const;
    health::HealthMonitorOptions health_options() const;
    DiscoveryClientOptions client_options() const;
    BroadcastOptions broadcast_options() const;

    static ServiceRecord to_record(const StaticService& service);
};

}  // namespace harbor::discovery
