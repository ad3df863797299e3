// harbor/src/discovery/discovery_client.cpp
#include "harbor/discovery/discovery_client.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <sstream>
#include <stdexcept>

#include "harbor/health/probes.hpp"
#include "harbor/log/logger.hpp"

namespace harbor::discovery {

std::string to_string(DiscoveryStrategy strategy) {
    switch (strategy) {
        case DiscoveryStrategy::registry:
            return "registry";
        case DiscoveryStrategy::dns:
            return "dns";
        case DiscoveryStrategy::default_port:
            return "default_port";
        case DiscoveryStrategy::broadcast:
            return "broadcast";
    }
    return "unknown";
}

DiscoveryStrategy strategy_from_string(const std::string& name) {
    if (name == "registry") return DiscoveryStrategy::registry;
    if (name == "dns") return DiscoveryStrategy::dns;
    if (name == "default_port") return DiscoveryStrategy::default_port;
    if (name == "broadcast") return DiscoveryStrategy::broadcast;
    throw std::invalid_argument("Unknown discovery strategy: " + name);
}

DiscoveryClient::DiscoveryClient(ServiceRegistry& registry,
                                 PortAllocator& allocator,
                                 DiscoveryClientOptions options,
                                 std::shared_ptr<DnsResolver> resolver,
                                 std::shared_ptr<BroadcastService> broadcast)
    : _registry(registry),
      _allocator(allocator),
      _options(std::move(options)),
      _resolver(std::move(resolver)),
      _broadcast(std::move(broadcast)) {
    if (!_resolver && _options.enable_dns) {
        _resolver = make_asio_dns_resolver(_options.default_ports);
    }
}

boost::system::error_code DiscoveryClient::register_service(
    const ServiceRecord& info, std::stop_token stop) {
    uint16_t assigned_port = 0;
    return register_service(info, assigned_port, std::move(stop));
}

boost::system::error_code DiscoveryClient::register_service(
    const ServiceRecord& info, uint16_t& assigned_port, std::stop_token stop) {
    assigned_port = 0;
    if (info.name.empty()) {
        return errc::invalid_service_info;
    }
    if (stop.stop_requested()) {
        return errc::cancelled;
    }

    ServiceRecord record = info;
    bool allocated_here = false;
    if (record.port == 0) {
        // A re-registration keeps the port the service already holds, which
        // must then survive a failed registry write.
        std::string hint = record.port_range_hint.empty()
                               ? _allocator.range_for_service(record.name)
                               : record.port_range_hint;
        boost::system::error_code ec;
        record.port = _allocator.allocate(record.name, hint, ec, allocated_here);
        if (ec) {
            HARBOR_LOG_WARN << "Port allocation for " << record.name
                            << " failed: " << ec.message();
            return ec;
        }
        HARBOR_LOG_DEBUG << "Assigned port " << record.port << " to "
                         << record.name << " from range " << hint;

        if (stop.stop_requested()) {
            if (allocated_here) {
                _allocator.release(record.port);
            }
            return errc::cancelled;
        }
    }

    if (auto ec = _registry.register_service(record)) {
        if (allocated_here) {
            _allocator.release(record.port);
        }
        return ec;
    }

    assigned_port = record.port;
    return {};
}

DiscoveryResult DiscoveryClient::discover(const std::string& name,
                                          boost::system::error_code& ec,
                                          std::stop_token stop) {
    return _discover(name, Clock::now() + _options.discovery_timeout, ec, stop);
}

DiscoveryResult DiscoveryClient::wait_for_service(
    const std::string& name, std::chrono::milliseconds timeout,
    boost::system::error_code& ec, std::stop_token stop) {
    const auto deadline = Clock::now() + timeout;

    std::mutex sleep_mutex;
    std::condition_variable_any sleep_cv;

    while (true) {
        auto now = Clock::now();
        auto attempt_deadline =
            std::min(now + _options.discovery_timeout, deadline);
        auto result = _discover(name, attempt_deadline, ec, stop);
        if (!ec || ec == errc::cancelled || ec == errc::invalid_service_info) {
            return result;
        }

        now = Clock::now();
        if (now >= deadline) {
            HARBOR_LOG_DEBUG << "Gave up waiting for " << name << " after "
                             << timeout.count() << "ms";
            ec = errc::discovery_timeout;
            return result;
        }

        auto pause = std::min<Clock::duration>(_options.wait_poll_interval,
                                               deadline - now);
        std::unique_lock<std::mutex> lock(sleep_mutex);
        sleep_cv.wait_for(lock, stop, pause, [] { return false; });
        if (stop.stop_requested()) {
            ec = errc::cancelled;
            return result;
        }
    }
}

boost::system::error_code DiscoveryClient::heartbeat(const std::string& name) {
    return _registry.heartbeat(name);
}

boost::system::error_code DiscoveryClient::deregister(const std::string& name) {
    if (_allocator.release_service(name)) {
        HARBOR_LOG_DEBUG << "Released port of " << name;
    }
    return _registry.deregister(name);
}

std::vector<ServiceRecord> DiscoveryClient::list_services() const {
    return _registry.list(false);
}

std::vector<ServiceRecord> DiscoveryClient::list_healthy_services() const {
    return _registry.list(true);
}

std::string DiscoveryClient::get_service_address(const std::string& name,
                                                 boost::system::error_code& ec,
                                                 std::stop_token stop) {
    auto result = discover(name, ec, std::move(stop));
    if (ec) {
        return {};
    }
    return result.record.address();
}

DiscoveryResult DiscoveryClient::_discover(const std::string& name,
                                           Clock::time_point deadline,
                                           boost::system::error_code& ec,
                                           const std::stop_token& stop) {
    ec = {};
    DiscoveryResult result;
    if (name.empty()) {
        ec = errc::invalid_service_info;
        return result;
    }

    const auto started = Clock::now();
    std::ostringstream failures;

    for (auto strategy : _options.preferred_strategies) {
        if (stop.stop_requested()) {
            ec = errc::cancelled;
            return result;
        }
        if (!_is_enabled(strategy)) {
            continue;
        }
        auto now = Clock::now();
        if (now >= deadline) {
            break;
        }

        auto budget =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        result.attempted.push_back(strategy);

        boost::system::error_code strategy_ec;
        auto record = _try_strategy(strategy, name, budget, strategy_ec);
        if (!strategy_ec) {
            result.record = std::move(record);
            result.strategy = strategy;
            result.latency = std::chrono::duration_cast<std::chrono::microseconds>(
                Clock::now() - started);
            return result;
        }
        failures << ' ' << to_string(strategy) << '(' << strategy_ec.message()
                 << ')';
    }

    result.latency = std::chrono::duration_cast<std::chrono::microseconds>(
        Clock::now() - started);
    ec = Clock::now() >= deadline ? errc::discovery_timeout
                                  : errc::service_not_found;
    HARBOR_LOG_DEBUG << "Discovery of " << name << " failed:"
                     << (result.attempted.empty() ? " no strategy attempted"
                                                  : failures.str());
    return result;
}

bool DiscoveryClient::_is_enabled(DiscoveryStrategy strategy) const {
    switch (strategy) {
        case DiscoveryStrategy::registry:
            return _options.enable_registry;
        case DiscoveryStrategy::dns:
            return _options.enable_dns && _resolver;
        case DiscoveryStrategy::default_port:
            return true;
        case DiscoveryStrategy::broadcast:
            return _options.enable_broadcast && _broadcast;
    }
    return false;
}

ServiceRecord DiscoveryClient::_try_strategy(DiscoveryStrategy strategy,
                                             const std::string& name,
                                             std::chrono::milliseconds budget,
                                             boost::system::error_code& ec) {
    switch (strategy) {
        case DiscoveryStrategy::registry:
            return _from_registry(name, ec);
        case DiscoveryStrategy::dns:
            return _from_dns(name, budget, ec);
        case DiscoveryStrategy::default_port:
            return _from_default_port(name, budget, ec);
        case DiscoveryStrategy::broadcast:
            return _from_broadcast(name, budget, ec);
    }
    ec = errc::strategy_disabled;
    return {};
}

ServiceRecord DiscoveryClient::_from_registry(const std::string& name,
                                              boost::system::error_code& ec) {
    auto record = _registry.get(name, ec);
    if (ec) {
        return {};
    }
    if (!record.healthy) {
        ec = errc::service_not_found;
        return {};
    }
    return record;
}

ServiceRecord DiscoveryClient::_from_dns(const std::string& name,
                                         std::chrono::milliseconds budget,
                                         boost::system::error_code& ec) {
    auto endpoint = _resolver->resolve(name, budget, ec);
    if (ec) {
        return {};
    }

    ServiceRecord record;
    record.name = name;
    record.host = endpoint.host;
    record.port = endpoint.port;
    record.protocol = "tcp";
    record.metadata["source"] = "dns";
    return record;
}

ServiceRecord DiscoveryClient::_from_default_port(
    const std::string& name, std::chrono::milliseconds budget,
    boost::system::error_code& ec) {
    auto it = _options.default_ports.find(service_type_for(name));
    if (it == _options.default_ports.end()) {
        ec = errc::service_not_found;
        return {};
    }

    const std::string host = "localhost";
    ec = health::probe_tcp(host, it->second,
                           std::min(budget, _options.default_port_probe_timeout));
    if (ec) {
        return {};
    }

    ServiceRecord record;
    record.name = name;
    record.host = host;
    record.port = it->second;
    record.protocol = "tcp";
    record.metadata["source"] = "default_port";
    return record;
}

ServiceRecord DiscoveryClient::_from_broadcast(const std::string& name,
                                               std::chrono::milliseconds budget,
                                               boost::system::error_code& ec) {
    if (!_broadcast->is_running()) {
        ec = _broadcast->start();
        if (ec && ec != errc::already_running) {
            return {};
        }
    }
    return _broadcast->discover(
        name, std::min(budget, _broadcast->options().discovery_timeout), ec);
}

}  // namespace harbor::discovery
