#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "harbor/discovery/broadcast_service.hpp"
#include "harbor/discovery/discovery_client.hpp"
#include "harbor/discovery/discovery_config.hpp"
#include "harbor/discovery/port_allocator.hpp"
#include "harbor/discovery/service_registry.hpp"
#include "harbor/health/health_monitor.hpp"
#include "nlohmann/json.hpp"

namespace harbor::daemon {

/// @brief Wires registry, allocator, client and health monitor together,
/// registers the configured static services and keeps them alive until
/// SIGINT or SIGTERM.
class Daemon {
public:
    explicit Daemon(discovery::DiscoveryConfig config);
    ~Daemon();

    Daemon(const Daemon&) = delete;
    Daemon& operator=(const Daemon&) = delete;

    /// @brief Blocks until a termination signal or stop().
    /// @return Process exit code.
    int run();

    /// @brief Thread-safe.
    void stop();

    /// @brief Services, allocations and last health results.
    nlohmann::json snapshot() const;

    discovery::ServiceRegistry& registry() { return registry_; }
    discovery::PortAllocator& allocator() { return allocator_; }
    discovery::DiscoveryClient& client() { return client_; }
    health::HealthMonitor& monitor() { return monitor_; }
    /// @brief Null unless client.enable_broadcast is set.
    discovery::BroadcastService* broadcast() { return broadcast_.get(); }

private:
    struct StaticRegistration {
        discovery::ServiceRecord record;
        std::chrono::milliseconds heartbeat_interval{0};
        std::unique_ptr<boost::asio::steady_timer> timer;
    };

    bool register_static_services();
    void announce(const discovery::ServiceRecord& record, uint16_t port);
    void schedule_heartbeat(StaticRegistration& registration);
    void schedule_snapshot();
    void shutdown();

    discovery::DiscoveryConfig config_;
    discovery::ServiceRegistry registry_;
    discovery::PortAllocator allocator_;
    std::shared_ptr<discovery::BroadcastService> broadcast_;
    discovery::DiscoveryClient client_;
    health::HealthMonitor monitor_;

    boost::asio::io_context ioc_;
    boost::asio::signal_set signals_;
    boost::asio::steady_timer snapshot_timer_;
    std::vector<StaticRegistration> registrations_;
};

}  // namespace harbor::daemon
