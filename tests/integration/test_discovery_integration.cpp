// tests/integration/test_discovery_integration.cpp
#define BOOST_TEST_MODULE DiscoveryIntegrationTests
#include <boost/test/unit_test.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include "harbor/discovery/discovery_client.hpp"
#include "harbor/discovery/port_allocator.hpp"
#include "harbor/discovery/service_registry.hpp"
#include "harbor/health/health_monitor.hpp"
#include "../support/local_servers.hpp"

using namespace harbor::discovery;
using namespace std::chrono_literals;

namespace {

// Registry, allocator and client wired as in the daemon, DNS disabled.
struct DiscoveryStack {
    ServiceRegistry registry;
    PortAllocator allocator;
    DiscoveryClient client;

    DiscoveryStack()
        : registry(RegistryOptions{30s, 50ms}),
          client(registry, allocator, client_options()) {
        registry.start();
    }

    ~DiscoveryStack() { registry.stop(); }

    static DiscoveryClientOptions client_options() {
        DiscoveryClientOptions options;
        options.enable_dns = false;
        options.discovery_timeout = 1s;
        options.wait_poll_interval = 100ms;
        return options;
    }

    static ServiceRecord info(const std::string& name) {
        ServiceRecord record;
        record.name = name;
        record.host = "127.0.0.1";
        record.protocol = "http";
        return record;
    }
};

}  // namespace

BOOST_FIXTURE_TEST_SUITE(DiscoveryIntegrationSuite, DiscoveryStack)

BOOST_AUTO_TEST_CASE(test_register_discover_deregister_api_service) {
    auto record = info("api");
    record.port_range_hint = "api";
    uint16_t port = 0;
    BOOST_REQUIRE(!client.register_service(record, port));
    BOOST_CHECK_GE(port, 8081);
    BOOST_CHECK_LE(port, 8099);

    boost::system::error_code ec;
    auto result = client.discover("api", ec);
    BOOST_REQUIRE(!ec);
    BOOST_CHECK(result.strategy == DiscoveryStrategy::registry);
    BOOST_CHECK_EQUAL(result.record.port, port);
    BOOST_CHECK_EQUAL(client.get_service_address("api", ec),
                      "127.0.0.1:" + std::to_string(port));

    BOOST_CHECK(!client.heartbeat("api"));
    BOOST_CHECK(!client.deregister("api"));
    client.discover("api", ec);
    BOOST_CHECK(ec == errc::service_not_found);
    BOOST_CHECK(allocator.is_port_available(port));

    // The port goes back into the pool and is the first handed out again.
    auto next_record = info("billing-api");
    next_record.port_range_hint = "api";
    uint16_t next = 0;
    BOOST_REQUIRE(!client.register_service(next_record, next));
    BOOST_CHECK_EQUAL(next, port);
}

BOOST_AUTO_TEST_CASE(test_concurrent_registrations_get_unique_ports) {
    std::mutex ports_mutex;
    std::vector<uint16_t> ports;
    std::atomic<int> successes{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 15; ++i) {
        threads.emplace_back([&, i]() {
            uint16_t port = 0;
            auto record = info("stress-api-" + std::to_string(i));
            record.port_range_hint = "api";
            if (client.register_service(record, port)) {
                return;
            }
            boost::system::error_code ec;
            auto result = client.discover(record.name, ec);
            if (ec || result.record.port != port) {
                return;
            }
            if (client.heartbeat(record.name)) {
                return;
            }
            ++successes;
            std::lock_guard<std::mutex> lock(ports_mutex);
            ports.push_back(port);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    BOOST_CHECK_GE(successes.load(), 10);
    std::set<uint16_t> unique(ports.begin(), ports.end());
    BOOST_CHECK_EQUAL(unique.size(), ports.size());
    for (auto port : ports) {
        BOOST_CHECK(port >= 8081 && port <= 8099);
    }
}

BOOST_AUTO_TEST_CASE(test_wait_for_missing_service_times_out) {
    boost::system::error_code ec;
    auto started = std::chrono::steady_clock::now();
    client.wait_for_service("never-appears", 500ms, ec);
    auto elapsed = std::chrono::steady_clock::now() - started;

    BOOST_CHECK(ec == errc::discovery_timeout);
    BOOST_CHECK(elapsed >= 500ms);
    BOOST_CHECK(elapsed < 1s);
}

BOOST_AUTO_TEST_CASE(test_expired_service_keeps_its_port_until_deregistered) {
    auto record = info("ephemeral-worker");
    record.ttl = 60ms;
    uint16_t port = 0;
    BOOST_REQUIRE(!client.register_service(record, port));

    std::this_thread::sleep_for(300ms);
    boost::system::error_code ec;
    client.discover("ephemeral-worker", ec);
    BOOST_CHECK(ec == errc::service_not_found);
    BOOST_CHECK_EQUAL(registry.size(), 0);

    // TTL expiry does not touch the allocation; deregister does.
    BOOST_CHECK(!allocator.is_port_available(port));
    client.deregister("ephemeral-worker");
    BOOST_CHECK(allocator.is_port_available(port));
}

BOOST_AUTO_TEST_CASE(test_health_monitor_hides_dead_service_from_discovery) {
    harbor::test::TcpListener listener;
    auto record = info("inventory-api");
    record.port = listener.port();
    BOOST_REQUIRE(!client.register_service(record));

    harbor::health::HealthMonitorOptions options;
    options.check_interval = 30ms;
    options.check_timeout = 300ms;
    options.enable_auto_removal = false;
    harbor::health::HealthMonitor monitor(registry, options, &allocator);
    BOOST_REQUIRE(!monitor.start());

    listener.stop();
    boost::system::error_code ec;
    auto deadline = std::chrono::steady_clock::now() + 3s;
    do {
        std::this_thread::sleep_for(30ms);
        client.discover("inventory-api", ec);
    } while (!ec && std::chrono::steady_clock::now() < deadline);

    BOOST_CHECK(ec == errc::service_not_found);
    BOOST_CHECK_EQUAL(client.list_services().size(), 1);
    BOOST_CHECK(client.list_healthy_services().empty());

    monitor.stop();
}

BOOST_AUTO_TEST_SUITE_END()
