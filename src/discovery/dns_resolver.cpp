// harbor/src/discovery/dns_resolver.cpp
#include "harbor/discovery/dns_resolver.hpp"

#include <boost/asio.hpp>
#include <condition_variable>
#include <mutex>

#include "harbor/discovery/service_record.hpp"
#include "harbor/log/logger.hpp"

namespace harbor::discovery {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

// Shared between the caller and the completion handler, which runs after a
// caller that gave up waiting has returned.
struct PendingLookup {
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    std::vector<tcp::endpoint> endpoints;
    boost::system::error_code ec;
};

// getaddrinfo cannot be interrupted. Asio runs it on the resolver service's
// own thread, one per execution context, so every lookup of the process
// queues on this context instead of starting a thread of its own.
asio::thread_pool& lookup_context() {
    static asio::thread_pool context(1);
    return context;
}

}  // namespace

std::vector<tcp::endpoint> resolve_endpoints(const std::string& host,
                                             uint16_t port,
                                             std::chrono::milliseconds timeout,
                                             boost::system::error_code& ec) {
    ec = {};
    boost::system::error_code parse_ec;
    auto address = asio::ip::make_address(host, parse_ec);
    if (!parse_ec) {
        return {tcp::endpoint(address, port)};
    }
    if (host.empty()) {
        ec = asio::error::host_not_found;
        return {};
    }

    auto pending = std::make_shared<PendingLookup>();
    auto resolver = std::make_shared<tcp::resolver>(lookup_context());
    resolver->async_resolve(
        host, std::to_string(port),
        [pending, resolver](const boost::system::error_code& error,
                            const tcp::resolver::results_type& results) {
            std::lock_guard<std::mutex> lock(pending->mutex);
            pending->done = true;
            pending->ec = error;
            for (const auto& entry : results) {
                pending->endpoints.push_back(entry.endpoint());
            }
            pending->cv.notify_one();
        });

    std::unique_lock<std::mutex> lock(pending->mutex);
    if (!pending->cv.wait_for(lock, timeout, [&] { return pending->done; })) {
        lock.unlock();
        // The resolver is only touched from the lookup thread.
        asio::post(lookup_context(), [resolver]() { resolver->cancel(); });
        ec = asio::error::timed_out;
        return {};
    }
    if (pending->ec) {
        ec = pending->ec;
        return {};
    }
    if (pending->endpoints.empty()) {
        ec = asio::error::host_not_found;
        return {};
    }
    return pending->endpoints;
}

AsioDnsResolver::AsioDnsResolver(std::map<std::string, uint16_t> default_ports)
    : _default_ports(std::move(default_ports)) {}

ResolvedEndpoint AsioDnsResolver::resolve(const std::string& service_name,
                                          std::chrono::milliseconds timeout,
                                          boost::system::error_code& ec) {
    auto endpoints = resolve_endpoints(service_name, 0, timeout, ec);
    if (ec == asio::error::timed_out) {
        HARBOR_LOG_DEBUG << "DNS lookup of " << service_name << " timed out after "
                         << timeout.count() << "ms";
        return {};
    }
    if (ec) {
        HARBOR_LOG_DEBUG << "DNS lookup of " << service_name
                         << " failed: " << ec.message();
        return {};
    }

    return {endpoints.front().address().to_string(), _port_for(service_name)};
}

uint16_t AsioDnsResolver::_port_for(const std::string& service_name) const {
    auto it = _default_ports.find(service_type_for(service_name));
    if (it != _default_ports.end()) {
        return it->second;
    }
    return FALLBACK_PORT;
}

std::shared_ptr<DnsResolver> make_asio_dns_resolver(
    std::map<std::string, uint16_t> default_ports) {
    return std::make_shared<AsioDnsResolver>(std::move(default_ports));
}

}  // namespace harbor::discovery
