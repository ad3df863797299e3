// harbor/src/discovery/port_allocator.cpp
#include "harbor/discovery/port_allocator.hpp"

#include <algorithm>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <mutex>

#include "harbor/discovery/service_record.hpp"
#include "harbor/log/logger.hpp"

namespace harbor::discovery {

namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

constexpr int kEphemeralAttempts = 8;

}  // namespace

void to_json(nlohmann::json& j, const PortAllocation& a) {
    auto age = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - a.allocated_at);
    j = nlohmann::json{{"port", a.port},
                       {"service_name", a.service_name},
                       {"range_name", a.range_name},
                       {"allocated_ago_ms", age.count()}};
}

PortAllocator::PortAllocator(PortAllocatorOptions options)
    : _options(std::move(options)),
      _reserved(_options.reserved_ports.begin(), _options.reserved_ports.end()) {}

uint16_t PortAllocator::allocate(const std::string& service_name,
                                 const std::string& range_hint,
                                 boost::system::error_code& ec) {
    bool created = false;
    return allocate(service_name, range_hint, ec, created);
}

uint16_t PortAllocator::allocate(const std::string& service_name,
                                 const std::string& range_hint,
                                 boost::system::error_code& ec, bool& created) {
    ec = {};
    created = false;
    if (service_name.empty()) {
        ec = errc::invalid_service_info;
        return 0;
    }

    PortRange range;
    std::string range_name;
    if (range_hint.empty() || range_hint == DEFAULT_RANGE) {
        range = _options.default_range;
        range_name = DEFAULT_RANGE;
    } else {
        auto it = _options.ranges.find(range_hint);
        if (it == _options.ranges.end()) {
            ec = errc::unknown_port_range;
            return 0;
        }
        range = it->second;
        range_name = it->first;
    }

    std::unique_lock<std::shared_mutex> lock(_mutex);
    auto existing = _service_ports.find(service_name);
    if (existing != _service_ports.end()) {
        return existing->second;
    }

    uint16_t port = _allocate_from_range(service_name, range, range_name, ec);
    if (!ec) {
        created = true;
        return port;
    }

    if (_options.allow_ephemeral) {
        HARBOR_LOG_DEBUG << "Port range '" << range_name
                         << "' exhausted, falling back to ephemeral port for "
                         << service_name;
        ec = {};
        port = _allocate_ephemeral(service_name, ec);
        created = !ec;
        return port;
    }

    HARBOR_LOG_WARN << "Port range '" << range_name << "' [" << range.low
                    << ", " << range.high << "] exhausted, cannot allocate for "
                    << service_name;
    return 0;
}

uint16_t PortAllocator::allocate_in_range(const std::string& service_name,
                                          uint16_t low, uint16_t high,
                                          boost::system::error_code& ec) {
    ec = {};
    PortRange range{low, high};
    if (!range.valid()) {
        ec = errc::invalid_port_range;
        return 0;
    }
    if (service_name.empty()) {
        ec = errc::invalid_service_info;
        return 0;
    }

    std::unique_lock<std::shared_mutex> lock(_mutex);
    auto existing = _service_ports.find(service_name);
    if (existing != _service_ports.end()) {
        return existing->second;
    }
    return _allocate_from_range(service_name, range, "custom", ec);
}

uint16_t PortAllocator::allocate_specific(const std::string& service_name,
                                          uint16_t port,
                                          boost::system::error_code& ec) {
    ec = {};
    if (port == 0) {
        ec = errc::invalid_port_range;
        return 0;
    }
    if (service_name.empty()) {
        ec = errc::invalid_service_info;
        return 0;
    }

    std::unique_lock<std::shared_mutex> lock(_mutex);
    auto existing = _service_ports.find(service_name);
    if (existing != _service_ports.end()) {
        return existing->second;
    }
    if (!_is_free(port) || (_options.check_os_bind && !_can_bind(port))) {
        ec = errc::port_already_allocated;
        return 0;
    }
    return _reserve(port, service_name, "specific");
}

void PortAllocator::release(uint16_t port) {
    std::unique_lock<std::shared_mutex> lock(_mutex);
    auto it = _allocations.find(port);
    if (it == _allocations.end()) {
        return;
    }
    _service_ports.erase(it->second.service_name);
    _allocations.erase(it);
}

bool PortAllocator::release_service(const std::string& service_name) {
    std::unique_lock<std::shared_mutex> lock(_mutex);
    auto it = _service_ports.find(service_name);
    if (it == _service_ports.end()) {
        return false;
    }
    _allocations.erase(it->second);
    _service_ports.erase(it);
    return true;
}

bool PortAllocator::is_port_available(uint16_t port) const {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    return port != 0 && _is_free(port);
}

std::optional<uint16_t> PortAllocator::port_for_service(
    const std::string& service_name) const {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    auto it = _service_ports.find(service_name);
    if (it == _service_ports.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<PortAllocation> PortAllocator::allocation(uint16_t port) const {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    auto it = _allocations.find(port);
    if (it == _allocations.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<PortAllocation> PortAllocator::list_allocations() const {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    std::vector<PortAllocation> allocations;
    allocations.reserve(_allocations.size());
    for (const auto& [port, allocation] : _allocations) {
        allocations.push_back(allocation);
    }
    return allocations;
}

boost::system::error_code PortAllocator::add_reserved_port(uint16_t port) {
    if (port == 0) {
        return errc::invalid_port_range;
    }
    std::unique_lock<std::shared_mutex> lock(_mutex);
    if (_reserved.insert(port).second) {
        HARBOR_LOG_INFO << "Reserved port " << port;
    }
    return {};
}

bool PortAllocator::remove_reserved_port(uint16_t port) {
    std::unique_lock<std::shared_mutex> lock(_mutex);
    if (_reserved.erase(port) == 0) {
        return false;
    }
    HARBOR_LOG_INFO << "Port " << port << " is no longer reserved";
    return true;
}

std::vector<uint16_t> PortAllocator::reserved_ports() const {
    std::shared_lock<std::shared_mutex> lock(_mutex);
    return {_reserved.begin(), _reserved.end()};
}

std::string PortAllocator::range_for_service(
    const std::string& service_name) const {
    std::string type = service_type_for(service_name);
    if (!type.empty() && _options.ranges.count(type)) {
        return type;
    }
    return DEFAULT_RANGE;
}

bool PortAllocator::_is_free(uint16_t port) const {
    return _allocations.find(port) == _allocations.end() && !_is_reserved(port);
}

bool PortAllocator::_is_reserved(uint16_t port) const {
    return _reserved.count(port) != 0;
}

uint16_t PortAllocator::_reserve(uint16_t port, const std::string& service_name,
                                 const std::string& range_name) {
    _allocations[port] = PortAllocation{port, service_name, range_name,
                                        std::chrono::steady_clock::now()};
    _service_ports[service_name] = port;
    HARBOR_LOG_DEBUG << "Allocated port " << port << " from range '"
                     << range_name << "' to " << service_name;
    return port;
}

uint16_t PortAllocator::_allocate_from_range(const std::string& service_name,
                                             const PortRange& range,
                                             const std::string& range_name,
                                             boost::system::error_code& ec) {
    // 32-bit counter so that a range ending at 65535 terminates.
    for (uint32_t port = range.low; port <= range.high; ++port) {
        auto candidate = static_cast<uint16_t>(port);
        if (!_is_free(candidate)) {
            continue;
        }
        if (_options.check_os_bind && !_can_bind(candidate)) {
            continue;
        }
        return _reserve(candidate, service_name, range_name);
    }
    ec = errc::port_range_exhausted;
    return 0;
}

uint16_t PortAllocator::_allocate_ephemeral(const std::string& service_name,
                                            boost::system::error_code& ec) {
    for (int attempt = 0; attempt < kEphemeralAttempts; ++attempt) {
        net::io_context ioc;
        tcp::acceptor acceptor(ioc);
        boost::system::error_code bind_ec;
        acceptor.open(tcp::v4(), bind_ec);
        if (!bind_ec) {
            acceptor.bind(tcp::endpoint(tcp::v4(), 0), bind_ec);
        }
        if (bind_ec) {
            HARBOR_LOG_ERROR << "Failed to obtain ephemeral port for "
                             << service_name << ": " << bind_ec.message();
            ec = bind_ec;
            return 0;
        }
        uint16_t port = acceptor.local_endpoint(bind_ec).port();
        boost::system::error_code ignored;
        acceptor.close(ignored);
        if (!bind_ec && _is_free(port)) {
            return _reserve(port, service_name, EPHEMERAL_RANGE);
        }
    }
    ec = errc::port_range_exhausted;
    return 0;
}

bool PortAllocator::_can_bind(uint16_t port) {
    net::io_context ioc;
    tcp::acceptor acceptor(ioc);
    boost::system::error_code ec;
    acceptor.open(tcp::v4(), ec);
    if (!ec) {
        acceptor.bind(tcp::endpoint(tcp::v4(), port), ec);
    }
    boost::system::error_code ignored;
    acceptor.close(ignored);
    return !ec;
}

}  // namespace harbor::discovery
