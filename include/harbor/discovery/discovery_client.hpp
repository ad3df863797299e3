// harbor/include/harbor/discovery/discovery_client.hpp
#pragma once

#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

#include "harbor/discovery/broadcast_service.hpp"
#include "harbor/discovery/dns_resolver.hpp"
#include "harbor/discovery/error.hpp"
#include "harbor/discovery/port_allocator.hpp"
#include "harbor/discovery/service_record.hpp"
#include "harbor/discovery/service_registry.hpp"

namespace harbor::discovery {

enum class DiscoveryStrategy {
    registry,
    dns,
    /// Probe localhost on the service type's well-known port.
    default_port,
    /// Ask the local network over UDP multicast.
    broadcast
};

std::string to_string(DiscoveryStrategy strategy);

/// @throws std::invalid_argument for unknown names.
DiscoveryStrategy strategy_from_string(const std::string& name);

struct DiscoveryResult {
    ServiceRecord record;
    DiscoveryStrategy strategy = DiscoveryStrategy::registry;
    std::chrono::microseconds latency{0};
    /// @brief Strategies tried, in order. Filled on failure too.
    std::vector<DiscoveryStrategy> attempted;
};

struct DiscoveryClientOptions {
    std::vector<DiscoveryStrategy> preferred_strategies{
        DiscoveryStrategy::registry, DiscoveryStrategy::dns,
        DiscoveryStrategy::broadcast};
    bool enable_registry = true;
    bool enable_dns = true;
    /// Needs a BroadcastService handed to the client.
    bool enable_broadcast = false;
    std::chrono::milliseconds discovery_timeout{5000};
    std::chrono::milliseconds wait_poll_interval{100};
    std::chrono::milliseconds default_port_probe_timeout{100};
    /// @brief Well-known port per service type, used by the DNS and
    /// default_port strategies.
    std::map<std::string, uint16_t> default_ports{
        {"database", 5432}, {"cache", 6379}, {"api", 8080},
        {"grpc", 9090},     {"metrics", 9100},
    };
};

/// @brief Facade for registering, locating and waiting for services.
///
/// The registry and allocator are borrowed and must outlive the client.
class DiscoveryClient {
public:
    /// @param resolver Used by the DNS strategy. When null and DNS is
    /// enabled, an AsioDnsResolver over options.default_ports is created.
    /// @param broadcast Used by the broadcast strategy, started on first use
    /// when it is not running yet.
    DiscoveryClient(ServiceRegistry& registry, PortAllocator& allocator,
                    DiscoveryClientOptions options = {},
                    std::shared_ptr<DnsResolver> resolver = nullptr,
                    std::shared_ptr<BroadcastService> broadcast = nullptr);

    // Non-copyable
    DiscoveryClient(const DiscoveryClient&) = delete;
    DiscoveryClient& operator=(const DiscoveryClient&) = delete;

    /// @brief Registers a service, allocating a port first when info.port is
    /// zero. The allocation is released again if registration fails.
    /// @param assigned_port Receives the port the service was registered
    /// with.
    boost::system::error_code register_service(const ServiceRecord& info,
                                               uint16_t& assigned_port,
                                               std::stop_token stop = {});

    boost::system::error_code register_service(const ServiceRecord& info,
                                               std::stop_token stop = {});

    /// @brief Tries each enabled strategy in priority order until one
    /// resolves the name, within discovery_timeout.
    /// @return On failure ec is service_not_found, discovery_timeout,
    /// invalid_service_info or cancelled, and result.attempted lists the
    /// strategies tried.
    DiscoveryResult discover(const std::string& name,
                             boost::system::error_code& ec,
                             std::stop_token stop = {});

    /// @brief Polls discover() until it succeeds or the timeout elapses.
    /// @return ec is discovery_timeout once the timeout has passed, or
    /// cancelled.
    DiscoveryResult wait_for_service(const std::string& name,
                                     std::chrono::milliseconds timeout,
                                     boost::system::error_code& ec,
                                     std::stop_token stop = {});

    boost::system::error_code heartbeat(const std::string& name);

    /// @brief Removes the service and frees the port it was allocated.
    boost::system::error_code deregister(const std::string& name);

    std::vector<ServiceRecord> list_services() const;
    std::vector<ServiceRecord> list_healthy_services() const;

    /// @brief "host:port" of a discovered service.
    std::string get_service_address(const std::string& name,
                                    boost::system::error_code& ec,
                                    std::stop_token stop = {});

    const DiscoveryClientOptions& options() const { return _options; }

private:
    using Clock = std::chrono::steady_clock;

    DiscoveryResult _discover(const std::string& name, Clock::time_point deadline,
                              boost::system::error_code& ec,
                              const std::stop_token& stop);

    bool _is_enabled(DiscoveryStrategy strategy) const;

    ServiceRecord _try_strategy(DiscoveryStrategy strategy,
                                const std::string& name,
                                std::chrono::milliseconds budget,
                                boost::system::error_code& ec);

    ServiceRecord _from_registry(const std::string& name,
                                 boost::system::error_code& ec);
    ServiceRecord _from_dns(const std::string& name,
                            std::chrono::milliseconds budget,
                            boost::system::error_code& ec);
    ServiceRecord _from_default_port(const std::string& name,
                                     std::chrono::milliseconds budget,
                                     boost::system::error_code& ec);
    ServiceRecord _from_broadcast(const std::string& name,
                                  std::chrono::milliseconds budget,
                                  boost::system::error_code& ec);

    ServiceRegistry& _registry;
    PortAllocator& _allocator;
    DiscoveryClientOptions _options;
    std::shared_ptr<DnsResolver> _resolver;
    std::shared_ptr<BroadcastService> _broadcast;
};

}  // namespace harbor::discovery
