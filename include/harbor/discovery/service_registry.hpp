// harbor/include/harbor/discovery/service_registry.hpp
#pragma once

#include <atomic>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "harbor/discovery/error.hpp"
#include "harbor/discovery/service_record.hpp"

namespace harbor::discovery {

struct RegistryOptions {
    /// @brief TTL applied to records registered without one. Zero disables
    /// expiry for such records.
    std::chrono::milliseconds default_ttl{30000};
    /// @brief Period of the background sweep that purges expired records.
    std::chrono::milliseconds cleanup_interval{10000};
};

/// @brief Authoritative, in-process store of registered services.
///
/// Records are keyed by service name; registering an existing name renews
/// it. A record whose last heartbeat is older than its TTL is treated as
/// absent by every query and is physically removed by the background sweep
/// started with start(). Mutations and the sweep take the lock exclusively,
/// queries share it.
class ServiceRegistry {
public:
    explicit ServiceRegistry(RegistryOptions options = {});
    ~ServiceRegistry();

    // Non-copyable
    ServiceRegistry(const ServiceRegistry&) = delete;
    ServiceRegistry& operator=(const ServiceRegistry&) = delete;

    /// @brief Starts the TTL sweep thread.
    /// @return errc::already_running if the sweep is already active.
    boost::system::error_code start();

    /// @brief Stops and joins the TTL sweep thread.
    /// @return errc::not_running if the sweep is not active.
    boost::system::error_code stop();

    bool is_running() const { return _running_cleanup; }

    /// @brief Inserts or renews a record.
    /// The stored record is marked healthy and its heartbeat refreshed; the
    /// original registration time is kept on renewal.
    /// @return errc::invalid_service_info on an empty name or host or a zero
    /// port.
    boost::system::error_code register_service(const ServiceRecord& record);

    /// @brief Returns a copy of a live record, or sets ec to
    /// errc::service_not_found when it is absent or expired.
    ServiceRecord get(const std::string& name,
                      boost::system::error_code& ec) const;

    /// @brief Refreshes the heartbeat, extending the TTL deadline.
    boost::system::error_code heartbeat(const std::string& name);

    boost::system::error_code update_health(const std::string& name,
                                            bool healthy);

    /// @brief Removes a record immediately.
    /// @return errc::service_not_found for names that are not registered.
    boost::system::error_code deregister(const std::string& name);

    /// @brief Snapshot of live records, optionally only the healthy ones.
    std::vector<ServiceRecord> list(bool filter_healthy = false) const;

    std::vector<ServiceRecord> list_by_protocol(
        const std::string& protocol) const;

    /// @brief Runs one sweep.
    /// @return Number of purged records.
    std::size_t cleanup_expired();

    /// @brief Number of stored records, including expired ones not yet
    /// swept.
    std::size_t size() const;

    const RegistryOptions& options() const { return _options; }

private:
    void _cleanup_loop();
    static boost::system::error_code _validate(ServiceRecord& record);

    RegistryOptions _options;

    mutable std::shared_mutex _mutex;
    std::unordered_map<std::string, ServiceRecord> _services;

    std::thread _cleanup_thread;
    std::atomic<bool> _running_cleanup{false};
    std::condition_variable _cleanup_cv;
    std::mutex _cleanup_mutex;
    std::mutex _lifecycle_mutex;
};

}  // namespace harbor::discovery
