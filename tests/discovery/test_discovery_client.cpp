// tests/discovery/test_discovery_client.cpp
#define BOOST_TEST_MODULE DiscoveryClientTest

#include "harbor/discovery/discovery_client.hpp"
#include <atomic>
#include <boost/asio/error.hpp>
#include <boost/test/unit_test.hpp>
#include <chrono>
#include <stop_token>
#include <thread>
#include <vector>

#include "../support/local_servers.hpp"

using namespace harbor::discovery;
using namespace std::chrono_literals;

namespace {

// Resolves a fixed set of names, counting lookups.
class FakeResolver : public DnsResolver {
public:
  std::map<std::string, ResolvedEndpoint> entries;
  std::atomic<int> lookups{0};

  ResolvedEndpoint resolve(const std::string &service_name,
                           std::chrono::milliseconds,
                           boost::system::error_code &ec) override {
    ++lookups;
    auto it = entries.find(service_name);
    if (it == entries.end()) {
      ec = boost::asio::error::host_not_found;
      return {};
    }
    ec = {};
    return it->second;
  }
};

struct ClientFixture {
  ServiceRegistry registry;
  PortAllocator allocator;
  std::shared_ptr<FakeResolver> resolver = std::make_shared<FakeResolver>();

  DiscoveryClientOptions options() const {
    DiscoveryClientOptions options;
    options.discovery_timeout = 1s;
    options.wait_poll_interval = 20ms;
    return options;
  }

  ServiceRecord info(const std::string &name, uint16_t port = 0) const {
    ServiceRecord record;
    record.name = name;
    record.host = "127.0.0.1";
    record.port = port;
    return record;
  }
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(DiscoveryClientTestSuite, ClientFixture)

BOOST_AUTO_TEST_CASE(test_strategy_names) {
  BOOST_CHECK_EQUAL(to_string(DiscoveryStrategy::registry), "registry");
  BOOST_CHECK(strategy_from_string("dns") == DiscoveryStrategy::dns);
  BOOST_CHECK(strategy_from_string("default_port") ==
              DiscoveryStrategy::default_port);
  BOOST_CHECK(strategy_from_string(to_string(DiscoveryStrategy::broadcast)) ==
              DiscoveryStrategy::broadcast);
  BOOST_CHECK_THROW(strategy_from_string("consul"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_register_allocates_port_from_derived_range) {
  DiscoveryClient client(registry, allocator, options(), resolver);

  uint16_t port = 0;
  BOOST_CHECK(!client.register_service(info("user-api"), port));
  BOOST_CHECK_GE(port, 8081);
  BOOST_CHECK_LE(port, 8099);

  boost::system::error_code ec;
  auto record = registry.get("user-api", ec);
  BOOST_CHECK(!ec);
  BOOST_CHECK_EQUAL(record.port, port);
  BOOST_CHECK_EQUAL(allocator.allocation(port)->range_name, "api");
}

BOOST_AUTO_TEST_CASE(test_register_honours_range_hint) {
  DiscoveryClient client(registry, allocator, options(), resolver);

  auto record = info("worker");
  record.port_range_hint = "grpc";
  uint16_t port = 0;
  BOOST_CHECK(!client.register_service(record, port));
  BOOST_CHECK_EQUAL(port, 9091);
}

BOOST_AUTO_TEST_CASE(test_register_keeps_explicit_port) {
  DiscoveryClient client(registry, allocator, options(), resolver);

  uint16_t port = 0;
  BOOST_CHECK(!client.register_service(info("fixed", 7000), port));
  BOOST_CHECK_EQUAL(port, 7000);
  BOOST_CHECK(allocator.list_allocations().empty());
}

BOOST_AUTO_TEST_CASE(test_failed_registration_releases_port) {
  DiscoveryClient client(registry, allocator, options(), resolver);

  auto record = info("hostless-api");
  record.host.clear();
  BOOST_CHECK(client.register_service(record) == errc::invalid_service_info);
  BOOST_CHECK(allocator.list_allocations().empty());
  BOOST_CHECK_EQUAL(registry.size(), 0);
}

BOOST_AUTO_TEST_CASE(test_failed_reregistration_keeps_held_port) {
  DiscoveryClient client(registry, allocator, options(), resolver);

  uint16_t port = 0;
  BOOST_REQUIRE(!client.register_service(info("orders-api"), port));

  auto broken = info("orders-api");
  broken.host.clear();
  BOOST_CHECK(client.register_service(broken) == errc::invalid_service_info);
  BOOST_CHECK_EQUAL(*allocator.port_for_service("orders-api"), port);
  boost::system::error_code ec;
  BOOST_CHECK_EQUAL(registry.get("orders-api", ec).port, port);
}

BOOST_AUTO_TEST_CASE(test_concurrent_invalid_reregistration_keeps_port) {
  DiscoveryClient client(registry, allocator, options(), resolver);

  std::atomic<bool> go{false};
  uint16_t port = 0;
  std::vector<std::thread> threads;
  threads.emplace_back([&]() {
    while (!go) {
      std::this_thread::yield();
    }
    client.register_service(info("race-api"), port);
  });
  for (int i = 0; i < 6; ++i) {
    threads.emplace_back([&]() {
      auto broken = info("race-api");
      broken.host.clear();
      while (!go) {
        std::this_thread::yield();
      }
      for (int attempt = 0; attempt < 20; ++attempt) {
        client.register_service(broken);
      }
    });
  }
  go = true;
  for (auto &thread : threads) {
    thread.join();
  }

  boost::system::error_code ec;
  auto record = registry.get("race-api", ec);
  BOOST_REQUIRE(!ec);
  BOOST_CHECK_EQUAL(record.port, port);
  auto held = allocator.port_for_service("race-api");
  BOOST_REQUIRE(held.has_value());
  BOOST_CHECK_EQUAL(*held, port);
}

BOOST_AUTO_TEST_CASE(test_register_rejects_unknown_hint_and_empty_name) {
  DiscoveryClient client(registry, allocator, options(), resolver);

  auto record = info("svc");
  record.port_range_hint = "nope";
  BOOST_CHECK(client.register_service(record) == errc::unknown_port_range);
  BOOST_CHECK(client.register_service(info("")) == errc::invalid_service_info);
}

BOOST_AUTO_TEST_CASE(test_register_cancelled_before_start) {
  DiscoveryClient client(registry, allocator, options(), resolver);

  std::stop_source source;
  source.request_stop();
  BOOST_CHECK(client.register_service(info("user-api"), source.get_token()) ==
              errc::cancelled);
  BOOST_CHECK(allocator.list_allocations().empty());
  BOOST_CHECK_EQUAL(registry.size(), 0);
}

BOOST_AUTO_TEST_CASE(test_discover_from_registry) {
  DiscoveryClient client(registry, allocator, options(), resolver);
  client.register_service(info("auth-service", 9001));

  boost::system::error_code ec;
  auto result = client.discover("auth-service", ec);
  BOOST_CHECK(!ec);
  BOOST_CHECK(result.strategy == DiscoveryStrategy::registry);
  BOOST_CHECK_EQUAL(result.record.address(), "127.0.0.1:9001");
  BOOST_REQUIRE_EQUAL(result.attempted.size(), 1);
  BOOST_CHECK_EQUAL(resolver->lookups.load(), 0);
}

BOOST_AUTO_TEST_CASE(test_discover_falls_back_to_dns) {
  resolver->entries["external-api"] = {"10.0.0.7", 8080};
  DiscoveryClient client(registry, allocator, options(), resolver);

  boost::system::error_code ec;
  auto result = client.discover("external-api", ec);
  BOOST_CHECK(!ec);
  BOOST_CHECK(result.strategy == DiscoveryStrategy::dns);
  BOOST_CHECK_EQUAL(result.record.address(), "10.0.0.7:8080");
  BOOST_CHECK(result.attempted == (std::vector<DiscoveryStrategy>{
                                      DiscoveryStrategy::registry,
                                      DiscoveryStrategy::dns}));
}

BOOST_AUTO_TEST_CASE(test_unhealthy_registry_record_falls_through) {
  resolver->entries["flaky-api"] = {"10.0.0.8", 8080};
  DiscoveryClient client(registry, allocator, options(), resolver);
  client.register_service(info("flaky-api", 9001));
  registry.update_health("flaky-api", false);

  boost::system::error_code ec;
  auto result = client.discover("flaky-api", ec);
  BOOST_CHECK(!ec);
  BOOST_CHECK(result.strategy == DiscoveryStrategy::dns);
  BOOST_CHECK_EQUAL(result.record.host, "10.0.0.8");
}

BOOST_AUTO_TEST_CASE(test_discover_not_found_lists_attempts) {
  DiscoveryClient client(registry, allocator, options(), resolver);

  boost::system::error_code ec;
  auto result = client.discover("ghost", ec);
  BOOST_CHECK(ec == errc::service_not_found);
  BOOST_CHECK_EQUAL(result.attempted.size(), 2);
  BOOST_CHECK_EQUAL(resolver->lookups.load(), 1);
}

BOOST_AUTO_TEST_CASE(test_disabled_strategies_are_skipped) {
  auto opts = options();
  opts.enable_dns = false;
  resolver->entries["external-api"] = {"10.0.0.7", 8080};
  DiscoveryClient client(registry, allocator, opts, resolver);

  boost::system::error_code ec;
  auto result = client.discover("external-api", ec);
  BOOST_CHECK(ec == errc::service_not_found);
  BOOST_REQUIRE_EQUAL(result.attempted.size(), 1);
  BOOST_CHECK(result.attempted[0] == DiscoveryStrategy::registry);
  BOOST_CHECK_EQUAL(resolver->lookups.load(), 0);
}

BOOST_AUTO_TEST_CASE(test_strategy_order_is_respected) {
  auto opts = options();
  opts.preferred_strategies = {DiscoveryStrategy::dns,
                               DiscoveryStrategy::registry};
  resolver->entries["both"] = {"10.0.0.9", 8080};
  DiscoveryClient client(registry, allocator, opts, resolver);
  client.register_service(info("both", 9001));

  boost::system::error_code ec;
  auto result = client.discover("both", ec);
  BOOST_CHECK(!ec);
  BOOST_CHECK(result.strategy == DiscoveryStrategy::dns);
}

BOOST_AUTO_TEST_CASE(test_default_port_strategy) {
  harbor::test::TcpListener listener;
  auto opts = options();
  opts.preferred_strategies = {DiscoveryStrategy::registry,
                               DiscoveryStrategy::default_port};
  opts.default_ports["cache"] = listener.port();
  DiscoveryClient client(registry, allocator, opts, resolver);

  boost::system::error_code ec;
  auto result = client.discover("session-cache", ec);
  BOOST_CHECK(!ec);
  BOOST_CHECK(result.strategy == DiscoveryStrategy::default_port);
  BOOST_CHECK_EQUAL(result.record.port, listener.port());

  listener.stop();
  client.discover("session-cache", ec);
  BOOST_CHECK(ec == errc::service_not_found);
}

BOOST_AUTO_TEST_CASE(test_discover_empty_name) {
  DiscoveryClient client(registry, allocator, options(), resolver);
  boost::system::error_code ec;
  client.discover("", ec);
  BOOST_CHECK(ec == errc::invalid_service_info);
}

BOOST_AUTO_TEST_CASE(test_wait_for_service_times_out) {
  auto opts = options();
  opts.wait_poll_interval = 100ms;
  DiscoveryClient client(registry, allocator, opts, resolver);

  boost::system::error_code ec;
  auto started = std::chrono::steady_clock::now();
  client.wait_for_service("never-appears", 300ms, ec);
  auto elapsed = std::chrono::steady_clock::now() - started;

  BOOST_CHECK(ec == errc::discovery_timeout);
  BOOST_CHECK(elapsed >= 300ms);
  BOOST_CHECK(elapsed < 300ms + 2 * opts.wait_poll_interval);
}

BOOST_AUTO_TEST_CASE(test_wait_for_service_sees_late_registration) {
  DiscoveryClient client(registry, allocator, options(), resolver);

  std::thread producer([this]() {
    std::this_thread::sleep_for(100ms);
    registry.register_service(info("late-api", 9100));
  });

  boost::system::error_code ec;
  auto result = client.wait_for_service("late-api", 2s, ec);
  producer.join();

  BOOST_CHECK(!ec);
  BOOST_CHECK_EQUAL(result.record.port, 9100);
}

BOOST_AUTO_TEST_CASE(test_wait_for_service_cancellation) {
  DiscoveryClient client(registry, allocator, options(), resolver);

  std::stop_source source;
  std::thread canceller([&source]() {
    std::this_thread::sleep_for(100ms);
    source.request_stop();
  });

  boost::system::error_code ec;
  auto started = std::chrono::steady_clock::now();
  client.wait_for_service("never-appears", 5s, ec, source.get_token());
  auto elapsed = std::chrono::steady_clock::now() - started;
  canceller.join();

  BOOST_CHECK(ec == errc::cancelled);
  BOOST_CHECK(elapsed < 1s);
}

BOOST_AUTO_TEST_CASE(test_deregister_releases_port) {
  DiscoveryClient client(registry, allocator, options(), resolver);

  uint16_t port = 0;
  client.register_service(info("user-api"), port);
  BOOST_CHECK(!allocator.is_port_available(port));

  BOOST_CHECK(!client.deregister("user-api"));
  BOOST_CHECK(allocator.is_port_available(port));
  BOOST_CHECK(client.list_services().empty());
  BOOST_CHECK(client.deregister("user-api") == errc::service_not_found);
}

BOOST_AUTO_TEST_CASE(test_listing_and_address) {
  DiscoveryClient client(registry, allocator, options(), resolver);
  client.register_service(info("svc-a", 9001));
  client.register_service(info("svc-b", 9002));
  registry.update_health("svc-b", false);

  BOOST_CHECK_EQUAL(client.list_services().size(), 2);
  BOOST_CHECK_EQUAL(client.list_healthy_services().size(), 1);
  BOOST_CHECK(!client.heartbeat("svc-a"));

  boost::system::error_code ec;
  BOOST_CHECK_EQUAL(client.get_service_address("svc-a", ec), "127.0.0.1:9001");
  BOOST_CHECK(!ec);
}

BOOST_AUTO_TEST_CASE(test_asio_resolver_uses_default_ports) {
  AsioDnsResolver asio_resolver({{"metrics", 9100}});

  boost::system::error_code ec;
  auto endpoint = asio_resolver.resolve("localhost", 2s, ec);
  BOOST_REQUIRE(!ec);
  BOOST_CHECK(!endpoint.host.empty());
  BOOST_CHECK_EQUAL(endpoint.port, AsioDnsResolver::FALLBACK_PORT);

  asio_resolver.resolve("missing-service.invalid", 2s, ec);
  BOOST_CHECK(ec);
}

BOOST_AUTO_TEST_CASE(test_resolve_endpoints_literal_and_deadline) {
  boost::system::error_code ec;
  auto endpoints = resolve_endpoints("127.0.0.1", 8080, 0ms, ec);
  BOOST_REQUIRE(!ec);
  BOOST_REQUIRE_EQUAL(endpoints.size(), 1);
  BOOST_CHECK_EQUAL(endpoints.front().port(), 8080);

  resolve_endpoints("", 80, 100ms, ec);
  BOOST_CHECK(ec == boost::asio::error::host_not_found);

  // Either the lookup fails outright or the caller stops waiting on time.
  auto started = std::chrono::steady_clock::now();
  resolve_endpoints("missing-service.invalid", 80, 150ms, ec);
  BOOST_CHECK(ec);
  BOOST_CHECK(std::chrono::steady_clock::now() - started < 1s);
}

BOOST_AUTO_TEST_CASE(test_repeated_lookups_share_one_thread) {
  AsioDnsResolver asio_resolver(std::map<std::string, uint16_t>{});
  std::vector<std::thread> callers;
  std::atomic<int> answered{0};
  for (int i = 0; i < 16; ++i) {
    callers.emplace_back([&] {
      boost::system::error_code ec;
      asio_resolver.resolve("missing-service.invalid", 100ms, ec);
      if (ec) {
        ++answered;
      }
    });
  }
  for (auto& caller : callers) {
    caller.join();
  }
  BOOST_CHECK_EQUAL(answered.load(), 16);
}

BOOST_AUTO_TEST_SUITE_END()
