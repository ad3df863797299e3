// harbor/src/discovery/service_registry.cpp
#include "harbor/discovery/service_registry.hpp"

#include "harbor/log/logger.hpp"

namespace harbor::discovery {

ServiceRegistry::ServiceRegistry(RegistryOptions options)
    : _options(options) {}

ServiceRegistry::~ServiceRegistry() {
    if (_running_cleanup) {
        stop();
    }
}

boost::system::error_code ServiceRegistry::start() {
    std::lock_guard<std::mutex> lifecycle(_lifecycle_mutex);
    if (_running_cleanup) {
        return errc::already_running;
    }
    _running_cleanup = true;
    _cleanup_thread = std::thread(&ServiceRegistry::_cleanup_loop, this);
    HARBOR_LOG_DEBUG << "Service registry sweep started, interval "
                     << _options.cleanup_interval.count() << "ms";
    return {};
}

boost::system::error_code ServiceRegistry::stop() {
    std::lock_guard<std::mutex> lifecycle(_lifecycle_mutex);
    if (!_running_cleanup) {
        return errc::not_running;
    }
    {
        std::lock_guard<std::mutex> lock(_cleanup_mutex);
        _running_cleanup = false;
    }
    _cleanup_cv.notify_one();
    if (_cleanup_thread.joinable()) {
        _cleanup_thread.join();
    }
    HARBOR_LOG_DEBUG << "Service registry sweep stopped";
    return {};
}

boost::system::error_code ServiceRegistry::register_service(
    const ServiceRecord& record_param) {
    ServiceRecord record = record_param;
    if (auto ec = _validate(record)) {
        return ec;
    }

    if (record.ttl.count() == 0) {
        record.ttl = _options.default_ttl;
    }

    auto now = std::chrono::steady_clock::now();
    record.last_heartbeat = now;
    record.healthy = true;

    bool renewed = false;
    {
        std::unique_lock<std::shared_mutex> lock(_mutex);
        auto it = _services.find(record.name);
        if (it != _services.end() && !it->second.is_expired(now)) {
            record.registered_at = it->second.registered_at;
            renewed = true;
        } else {
            record.registered_at = now;
        }
        _services[record.name] = record;
    }

    HARBOR_LOG_INFO << (renewed ? "Renewed" : "Registered") << " service "
                    << record.name << " at " << record.address() << " ("
                    << record.protocol << ", ttl " << record.ttl.count()
                    << "ms)";
    return {};
}

ServiceRecord ServiceRegistry::get(const std::string& name,
                                   boost::system::error_code& ec) const {
    ec = {};
    std::shared_lock<std::shared_mutex> lock(_mutex);
    auto it = _services.find(name);
    if (it == _services.end() || it->second.is_expired()) {
        ec = errc::service_not_found;
        return {};
    }
    return it->second;
}

boost::system::error_code ServiceRegistry::heartbeat(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(_mutex);
    auto it = _services.find(name);
    if (it == _services.end()) {
        return errc::service_not_found;
    }
    auto now = std::chrono::steady_clock::now();
    if (it->second.is_expired(now)) {
        // Too late: the sweep would have removed it anyway.
        _services.erase(it);
        return errc::service_not_found;
    }
    it->second.last_heartbeat = now;
    return {};
}

boost::system::error_code ServiceRegistry::update_health(
    const std::string& name, bool healthy) {
    std::unique_lock<std::shared_mutex> lock(_mutex);
    auto it = _services.find(name);
    if (it == _services.end() || it->second.is_expired()) {
        return errc::service_not_found;
    }
    it->second.healthy = healthy;
    return {};
}

boost::system::error_code ServiceRegistry::deregister(const std::string& name) {
    {
        std::unique_lock<std::shared_mutex> lock(_mutex);
        if (_services.erase(name) == 0) {
            return errc::service_not_found;
        }
    }
    HARBOR_LOG_INFO << "Deregistered service " << name;
    return {};
}

std::vector<ServiceRecord> ServiceRegistry::list(bool filter_healthy) const {
    std::vector<ServiceRecord> services;
    auto now = std::chrono::steady_clock::now();
    std::shared_lock<std::shared_mutex> lock(_mutex);
    services.reserve(_services.size());
    for (const auto& [name, record] : _services) {
        if (record.is_expired(now)) {
            continue;
        }
        if (filter_healthy && !record.healthy) {
            continue;
        }
        services.push_back(record);
    }
    return services;
}

std::vector<ServiceRecord> ServiceRegistry::list_by_protocol(
    const std::string& protocol) const {
    std::vector<ServiceRecord> services;
    auto now = std::chrono::steady_clock::now();
    std::shared_lock<std::shared_mutex> lock(_mutex);
    for (const auto& [name, record] : _services) {
        if (record.protocol == protocol && !record.is_expired(now)) {
            services.push_back(record);
        }
    }
    return services;
}

std::size_t ServiceRegistry::cleanup_expired() {
    std::vector<std::string> purged;
    {
        std::unique_lock<std::shared_mutex> lock(_mutex);
        auto now = std::chrono::steady_clock::now();
        for (auto it = _services.begin(); it != _services.end();) {
            if (it->second.is_expired(now)) {
                purged.push_back(it->first);
                it = _services.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto& name : purged) {
        HARBOR_LOG_INFO << "Service " << name
                        << " expired without heartbeat, purged";
    }
    return purged.size();
}

std::size_t ServiceRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    return _services.size();
}

void ServiceRegistry::_cleanup_loop() {
    while (_running_cleanup) {
        {
            std::unique_lock<std::mutex> lock(_cleanup_mutex);
            _cleanup_cv.wait_for(lock, _options.cleanup_interval,
                                 [this] { return !_running_cleanup; });
        }

        if (!_running_cleanup) {
            break;  // Exit if signaled to stop
        }

        cleanup_expired();
    }
}

boost::system::error_code ServiceRegistry::_validate(ServiceRecord& record) {
    if (record.name.empty()) {
        HARBOR_LOG_WARN << "Rejected registration: service name is required";
        return errc::invalid_service_info;
    }
    if (record.host.empty()) {
        HARBOR_LOG_WARN << "Rejected registration of " << record.name
                        << ": service host is required";
        return errc::invalid_service_info;
    }
    if (record.port == 0) {
        HARBOR_LOG_WARN << "Rejected registration of " << record.name
                        << ": invalid port 0";
        return errc::invalid_service_info;
    }
    if (record.protocol.empty()) {
        record.protocol = "tcp";
    }
    return {};
}

}  // namespace harbor::discovery
