#include "harbor/discovery/discovery_config.hpp"

#include <boost/asio/ip/address.hpp>
#include <set>
#include <stdexcept>

namespace harbor::discovery {

namespace {

bool valid_port(int port) { return port >= 1 && port <= 65535; }

void check_range(const std::string& name,
                 const DiscoveryConfig::RangeConfig& range) {
    if (!valid_port(range.low) || !valid_port(range.high) ||
        range.low > range.high) {
        throw std::invalid_argument("discovery.port_allocator range '" + name +
                                    "' must satisfy 1 <= low <= high <= 65535");
    }
}

PortRange to_port_range(const DiscoveryConfig::RangeConfig& range) {
    return {static_cast<uint16_t>(range.low), static_cast<uint16_t>(range.high)};
}

}  // namespace

void DiscoveryConfig::from_ptree(const boost::property_tree::ptree& pt) {
    if (auto registry_pt = pt.get_child_optional("registry")) {
        registry.default_ttl_ms =
            get_value(*registry_pt, "default_ttl_ms", registry.default_ttl_ms);
        registry.cleanup_interval_ms = get_value(
            *registry_pt, "cleanup_interval_ms", registry.cleanup_interval_ms);
    }

    if (auto alloc_pt = pt.get_child_optional("port_allocator")) {
        if (auto ranges_pt = alloc_pt->get_child_optional("ranges")) {
            port_allocator.ranges.clear();
            for (const auto& [name, range_pt] : *ranges_pt) {
                RangeConfig range;
                range.low = get_required_value<int>(range_pt, "low");
                range.high = get_required_value<int>(range_pt, "high");
                port_allocator.ranges[name] = range;
            }
        }
        if (auto default_pt = alloc_pt->get_child_optional("default_range")) {
            port_allocator.default_range.low = get_value(
                *default_pt, "low", port_allocator.default_range.low);
            port_allocator.default_range.high = get_value(
                *default_pt, "high", port_allocator.default_range.high);
        }
        load_vector(*alloc_pt, "reserved_ports", port_allocator.reserved_ports);
        port_allocator.allow_ephemeral = get_value(
            *alloc_pt, "allow_ephemeral", port_allocator.allow_ephemeral);
        port_allocator.check_os_bind =
            get_value(*alloc_pt, "check_os_bind", port_allocator.check_os_bind);
    }

    if (auto health_pt = pt.get_child_optional("health")) {
        health.enabled = get_value(*health_pt, "enabled", health.enabled);
        health.check_interval_ms = get_value(
            *health_pt, "check_interval_ms", health.check_interval_ms);
        health.check_timeout_ms =
            get_value(*health_pt, "check_timeout_ms", health.check_timeout_ms);
        health.unhealthy_threshold = get_value(
            *health_pt, "unhealthy_threshold", health.unhealthy_threshold);
        health.healthy_threshold = get_value(
            *health_pt, "healthy_threshold", health.healthy_threshold);
        health.default_strategy =
            get_value(*health_pt, "default_strategy", health.default_strategy);
        health.enable_auto_removal = get_value(
            *health_pt, "enable_auto_removal", health.enable_auto_removal);
        health.removal_threshold = get_value(
            *health_pt, "removal_threshold", health.removal_threshold);
        health.probe_concurrency = get_value(
            *health_pt, "probe_concurrency", health.probe_concurrency);
        health.http_health_path =
            get_value(*health_pt, "http_health_path", health.http_health_path);
    }

    if (auto client_pt = pt.get_child_optional("client")) {
        load_vector(*client_pt, "preferred_strategies",
                    client.preferred_strategies);
        client.enable_registry =
            get_value(*client_pt, "enable_registry", client.enable_registry);
        client.enable_dns =
            get_value(*client_pt, "enable_dns", client.enable_dns);
        client.enable_broadcast = get_value(*client_pt, "enable_broadcast",
                                            client.enable_broadcast);
        client.discovery_timeout_ms = get_value(
            *client_pt, "discovery_timeout_ms", client.discovery_timeout_ms);
        client.wait_poll_interval_ms = get_value(
            *client_pt, "wait_poll_interval_ms", client.wait_poll_interval_ms);
        client.default_port_probe_timeout_ms =
            get_value(*client_pt, "default_port_probe_timeout_ms",
                      client.default_port_probe_timeout_ms);
        if (auto ports_pt = client_pt->get_child_optional("default_ports")) {
            client.default_ports.clear();
            for (const auto& [type, port_pt] : *ports_pt) {
                client.default_ports[type] = port_pt.get_value<int>();
            }
        }
    }

    if (auto broadcast_pt = pt.get_child_optional("broadcast")) {
        broadcast.multicast_address = get_value(
            *broadcast_pt, "multicast_address", broadcast.multicast_address);
        broadcast.port = get_value(*broadcast_pt, "port", broadcast.port);
        broadcast.announcement_interval_ms =
            get_value(*broadcast_pt, "announcement_interval_ms",
                      broadcast.announcement_interval_ms);
        broadcast.discovery_timeout_ms = get_value(
            *broadcast_pt, "discovery_timeout_ms", broadcast.discovery_timeout_ms);
        broadcast.interface_address = get_value(
            *broadcast_pt, "interface_address", broadcast.interface_address);
        broadcast.ttl = get_value(*broadcast_pt, "ttl", broadcast.ttl);
        broadcast.loopback =
            get_value(*broadcast_pt, "loopback", broadcast.loopback);
        broadcast.max_message_age_ms = get_value(
            *broadcast_pt, "max_message_age_ms", broadcast.max_message_age_ms);
    }

    if (auto services_pt = pt.get_child_optional("services")) {
        services.clear();
        for (const auto& [key, service_pt] : *services_pt) {
            StaticService service;
            service.name = get_required_value<std::string>(service_pt, "name");
            service.host = get_value(service_pt, "host", service.host);
            service.port = get_value(service_pt, "port", service.port);
            service.protocol =
                get_value(service_pt, "protocol", service.protocol);
            service.version = get_value(service_pt, "version", service.version);
            service.port_range_hint = get_value(service_pt, "port_range_hint",
                                                service.port_range_hint);
            service.ttl_ms = get_value(service_pt, "ttl_ms", service.ttl_ms);
            service.health_strategy = get_value(service_pt, "health_strategy",
                                                service.health_strategy);
            if (auto meta_pt = service_pt.get_child_optional("metadata")) {
                for (const auto& [meta_key, meta_value] : *meta_pt) {
                    service.metadata[meta_key] =
                        meta_value.get_value<std::string>();
                }
            }
            services.push_back(std::move(service));
        }
    }

    snapshot_interval_ms =
        get_value(pt, "snapshot_interval_ms", snapshot_interval_ms);
}

void DiscoveryConfig::validate() const {
    if (registry.default_ttl_ms < 0) {
        throw std::invalid_argument("discovery.registry.default_ttl_ms must be >= 0");
    }
    if (registry.cleanup_interval_ms <= 0) {
        throw std::invalid_argument(
            "discovery.registry.cleanup_interval_ms must be > 0");
    }

    for (const auto& [name, range] : port_allocator.ranges) {
        if (name.empty() || name == PortAllocator::DEFAULT_RANGE ||
            name == PortAllocator::EPHEMERAL_RANGE) {
            throw std::invalid_argument(
                "discovery.port_allocator range name '" + name +
                "' is not allowed");
        }
        check_range(name, range);
    }
    check_range(PortAllocator::DEFAULT_RANGE, port_allocator.default_range);
    for (int port : port_allocator.reserved_ports) {
        if (!valid_port(port)) {
            throw std::invalid_argument(
                "discovery.port_allocator.reserved_ports contains invalid port " +
                std::to_string(port));
        }
    }

    if (health.check_interval_ms <= 0 || health.check_timeout_ms <= 0) {
        throw std::invalid_argument(
            "discovery.health intervals and timeouts must be > 0");
    }
    if (health.unhealthy_threshold < 1 || health.healthy_threshold < 1) {
        throw std::invalid_argument(
            "discovery.health thresholds must be >= 1");
    }
    if (health.removal_threshold < health.unhealthy_threshold) {
        throw std::invalid_argument(
            "discovery.health.removal_threshold must be >= unhealthy_threshold");
    }
    if (health.probe_concurrency < 1) {
        throw std::invalid_argument(
            "discovery.health.probe_concurrency must be >= 1");
    }
    health::probe_strategy_from_string(health.default_strategy);

    if (client.preferred_strategies.empty()) {
        throw std::invalid_argument(
            "discovery.client.preferred_strategies must not be empty");
    }
    std::set<std::string> seen;
    for (const auto& name : client.preferred_strategies) {
        strategy_from_string(name);
        if (!seen.insert(name).second) {
            throw std::invalid_argument(
                "discovery.client.preferred_strategies lists '" + name +
                "' twice");
        }
    }
    if (client.discovery_timeout_ms <= 0 || client.wait_poll_interval_ms <= 0 ||
        client.default_port_probe_timeout_ms <= 0) {
        throw std::invalid_argument(
            "discovery.client timeouts and intervals must be > 0");
    }
    for (const auto& [type, port] : client.default_ports) {
        if (!valid_port(port)) {
            throw std::invalid_argument("discovery.client.default_ports." +
                                        type + " is not a valid port");
        }
    }

    boost::system::error_code address_ec;
    auto group = boost::asio::ip::make_address(broadcast.multicast_address,
                                               address_ec);
    if (address_ec || !group.is_multicast()) {
        throw std::invalid_argument(
            "discovery.broadcast.multicast_address '" +
            broadcast.multicast_address + "' is not a multicast address");
    }
    if (!broadcast.interface_address.empty()) {
        boost::asio::ip::make_address_v4(broadcast.interface_address, address_ec);
        if (address_ec) {
            throw std::invalid_argument(
                "discovery.broadcast.interface_address must be an IPv4 address");
        }
    }
    if (!valid_port(broadcast.port)) {
        throw std::invalid_argument("discovery.broadcast.port is not a valid port");
    }
    if (broadcast.announcement_interval_ms <= 0 ||
        broadcast.discovery_timeout_ms <= 0 || broadcast.max_message_age_ms <= 0) {
        throw std::invalid_argument(
            "discovery.broadcast intervals and timeouts must be > 0");
    }
    if (broadcast.ttl < 1 || broadcast.ttl > 255) {
        throw std::invalid_argument("discovery.broadcast.ttl must be in 1..255");
    }

    std::set<std::string> names;
    for (const auto& service : services) {
        if (service.name.empty() || service.host.empty()) {
            throw std::invalid_argument(
                "discovery.services entries need a name and a host");
        }
        if (!names.insert(service.name).second) {
            throw std::invalid_argument("discovery.services lists '" +
                                        service.name + "' twice");
        }
        if (service.port != 0 && !valid_port(service.port)) {
            throw std::invalid_argument("discovery.services." + service.name +
                                        ".port is not a valid port");
        }
        if (service.ttl_ms < 0) {
            throw std::invalid_argument("discovery.services." + service.name +
                                        ".ttl_ms must be >= 0");
        }
        if (!service.health_strategy.empty()) {
            health::probe_strategy_from_string(service.health_strategy);
        }
    }

    if (snapshot_interval_ms < 0) {
        throw std::invalid_argument(
            "discovery.snapshot_interval_ms must be >= 0");
    }
}

RegistryOptions DiscoveryConfig::registry_options() const {
    RegistryOptions options;
    options.default_ttl = std::chrono::milliseconds(registry.default_ttl_ms);
    options.cleanup_interval =
        std::chrono::milliseconds(registry.cleanup_interval_ms);
    return options;
}

PortAllocatorOptions DiscoveryConfig::port_allocator_options() const {
    PortAllocatorOptions options;
    for (const auto& [name, range] : port_allocator.ranges) {
        options.ranges[name] = to_port_range(range);
    }
    options.default_range = to_port_range(port_allocator.default_range);
    options.reserved_ports.assign(port_allocator.reserved_ports.begin(),
                                  port_allocator.reserved_ports.end());
    options.allow_ephemeral = port_allocator.allow_ephemeral;
    options.check_os_bind = port_allocator.check_os_bind;
    return options;
}

health::HealthMonitorOptions DiscoveryConfig::health_options() const {
    health::HealthMonitorOptions options;
    options.check_interval = std::chrono::milliseconds(health.check_interval_ms);
    options.check_timeout = std::chrono::milliseconds(health.check_timeout_ms);
    options.unhealthy_threshold = health.unhealthy_threshold;
    options.healthy_threshold = health.healthy_threshold;
    options.default_strategy =
        health::probe_strategy_from_string(health.default_strategy);
    options.enable_auto_removal = health.enable_auto_removal;
    options.removal_threshold = health.removal_threshold;
    options.probe_concurrency =
        static_cast<std::size_t>(health.probe_concurrency);
    options.http_health_path = health.http_health_path;
    return options;
}

DiscoveryClientOptions DiscoveryConfig::client_options() const {
    DiscoveryClientOptions options;
    options.preferred_strategies.clear();
    for (const auto& name : client.preferred_strategies) {
        options.preferred_strategies.push_back(strategy_from_string(name));
    }
    options.enable_registry = client.enable_registry;
    options.enable_dns = client.enable_dns;
    options.enable_broadcast = client.enable_broadcast;
    options.discovery_timeout =
        std::chrono::milliseconds(client.discovery_timeout_ms);
    options.wait_poll_interval =
        std::chrono::milliseconds(client.wait_poll_interval_ms);
    options.default_port_probe_timeout =
        std::chrono::milliseconds(client.default_port_probe_timeout_ms);
    for (const auto& [type, port] : client.default_ports) {
        options.default_ports[type] = static_cast<uint16_t>(port);
    }
    return options;
}

BroadcastOptions DiscoveryConfig::broadcast_options() const {
    BroadcastOptions options;
    options.multicast_address = broadcast.multicast_address;
    options.port = static_cast<uint16_t>(broadcast.port);
    options.announcement_interval =
        std::chrono::milliseconds(broadcast.announcement_interval_ms);
    options.discovery_timeout =
        std::chrono::milliseconds(broadcast.discovery_timeout_ms);
    options.interface_address = broadcast.interface_address;
    options.ttl = broadcast.ttl;
    options.loopback = broadcast.loopback;
    options.max_message_age =
        std::chrono::milliseconds(broadcast.max_message_age_ms);
    return options;
}

ServiceRecord DiscoveryConfig::to_record(const StaticService& service) {
    ServiceRecord record;
    record.name = service.name;
    record.host = service.host;
    record.port = static_cast<uint16_t>(service.port);
    record.protocol = service.protocol;
    record.version = service.version;
    record.port_range_hint = service.port_range_hint;
    record.metadata = service.metadata;
    record.ttl = std::chrono::milliseconds(service.ttl_ms);
    return record;
}

}  // namespace harbor::discovery
