// harbor/include/harbor/discovery/dns_resolver.hpp
#pragma once

#include <boost/asio/ip/tcp.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace harbor::discovery {

/// @brief Resolves host to TCP endpoints on port, waiting at most timeout.
///
/// IP literals are converted without a lookup. Host names are resolved on a
/// single process-wide lookup thread; when the deadline passes the caller
/// gets asio::error::timed_out and the queued lookup is cancelled. No thread
/// is created per call.
std::vector<boost::asio::ip::tcp::endpoint> resolve_endpoints(
    const std::string& host, uint16_t port, std::chrono::milliseconds timeout,
    boost::system::error_code& ec);

struct ResolvedEndpoint {
    std::string host;
    uint16_t port = 0;
};

/// @brief Name-to-address lookup used by the DNS discovery strategy.
class DnsResolver {
public:
    virtual ~DnsResolver() = default;

    /// @brief Resolves a service name within the given time.
    /// @return The endpoint, or an empty one with ec set on failure or
    /// timeout.
    virtual ResolvedEndpoint resolve(const std::string& service_name,
                                     std::chrono::milliseconds timeout,
                                     boost::system::error_code& ec) = 0;
};

/// @brief Resolves through the system resolver with Boost.Asio.
///
/// DNS carries no port, so the port is taken from the service type's entry in
/// default_ports, falling back to 80.
class AsioDnsResolver : public DnsResolver {
public:
    static constexpr uint16_t FALLBACK_PORT = 80;

    explicit AsioDnsResolver(std::map<std::string, uint16_t> default_ports);

    ResolvedEndpoint resolve(const std::string& service_name,
                             std::chrono::milliseconds timeout,
                             boost::system::error_code& ec) override;

private:
    uint16_t _port_for(const std::string& service_name) const;

    std::map<std::string, uint16_t> _default_ports;
};

std::shared_ptr<DnsResolver> make_asio_dns_resolver(
    std::map<std::string, uint16_t> default_ports);

}  // namespace harbor::discovery
