// tests/daemon/test_daemon.cpp
#define BOOST_TEST_MODULE DaemonTests
#include <boost/test/unit_test.hpp>

#include <chrono>
#include <thread>

#include "harbor/core/command_line_parser.hpp"
#include "harbor/daemon/daemon.hpp"

using harbor::daemon::Daemon;
using harbor::discovery::DiscoveryConfig;
using namespace std::chrono_literals;

namespace {

DiscoveryConfig daemon_config() {
    DiscoveryConfig config;
    config.health.enabled = false;
    config.client.enable_dns = false;
    config.snapshot_interval_ms = 50;

    DiscoveryConfig::StaticService service;
    service.name = "orders-api";
    service.ttl_ms = 300;
    config.services.push_back(service);
    return config;
}

template <typename Predicate>
bool wait_until(Predicate predicate, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(10ms);
    }
    return true;
}

}  // namespace

BOOST_AUTO_TEST_SUITE(DaemonTestSuite)

BOOST_AUTO_TEST_CASE(test_static_services_are_registered_and_kept_alive) {
    Daemon daemon(daemon_config());
    int exit_code = -1;
    std::thread runner([&]() { exit_code = daemon.run(); });

    BOOST_REQUIRE(wait_until([&]() { return daemon.registry().size() == 1; }, 2s));

    // Longer than the TTL: heartbeats must have renewed the record.
    std::this_thread::sleep_for(600ms);
    boost::system::error_code ec;
    auto record = daemon.registry().get("orders-api", ec);
    BOOST_CHECK(!ec);
    BOOST_CHECK_GE(record.port, 8081);
    BOOST_CHECK_LE(record.port, 8099);

    auto snapshot = daemon.snapshot();
    BOOST_CHECK_EQUAL(snapshot["services"].size(), 1u);
    BOOST_CHECK_EQUAL(snapshot["allocations"].size(), 1u);
    BOOST_CHECK_EQUAL(snapshot["services"][0]["name"].get<std::string>(),
                      "orders-api");

    daemon.stop();
    runner.join();
    BOOST_CHECK_EQUAL(exit_code, 0);
    BOOST_CHECK_EQUAL(daemon.registry().size(), 0);
    BOOST_CHECK(daemon.allocator().list_allocations().empty());
}

BOOST_AUTO_TEST_CASE(test_static_services_are_announced_with_assigned_port) {
    auto config = daemon_config();
    config.client.enable_broadcast = true;
    // Unlikely to collide with a real deployment.
    config.broadcast.port = 27411;
    config.broadcast.multicast_address = "239.255.77.1";
    Daemon daemon(config);
    BOOST_REQUIRE(daemon.broadcast() != nullptr);

    std::thread runner([&]() { daemon.run(); });
    BOOST_REQUIRE(wait_until([&]() { return daemon.registry().size() == 1; }, 2s));

    boost::system::error_code ec;
    auto record = daemon.registry().get("orders-api", ec);
    BOOST_REQUIRE(!ec);
    auto announced = daemon.broadcast()->local_services();
    BOOST_REQUIRE_EQUAL(announced.size(), 1u);
    BOOST_CHECK_EQUAL(announced[0].name, "orders-api");
    BOOST_CHECK_EQUAL(announced[0].port, record.port);

    daemon.stop();
    runner.join();
    BOOST_CHECK(!daemon.broadcast()->is_running());
}

BOOST_AUTO_TEST_CASE(test_broadcast_is_off_by_default) {
    Daemon daemon(daemon_config());
    BOOST_CHECK(daemon.broadcast() == nullptr);
}

BOOST_AUTO_TEST_CASE(test_stop_before_run_returns_immediately) {
    Daemon daemon(daemon_config());
    daemon.stop();
    BOOST_CHECK_EQUAL(daemon.run(), 0);
}

BOOST_AUTO_TEST_CASE(test_invalid_static_service_fails_startup) {
    auto config = daemon_config();
    config.services[0].port_range_hint = "no-such-range";
    Daemon daemon(config);
    BOOST_CHECK_EQUAL(daemon.run(), 1);
    BOOST_CHECK(!daemon.registry().is_running());
}

BOOST_AUTO_TEST_CASE(test_command_line_parser) {
    char arg0[] = "harbord";
    char arg1[] = "-c";
    char arg2[] = "custom.yaml";
    char* argv[] = {arg0, arg1, arg2};
    auto options = harbor::core::CommandLineParser::parse(3, argv);
    BOOST_CHECK_EQUAL(options.config_file, "custom.yaml");
    BOOST_CHECK(!options.test);
    BOOST_CHECK(!options.show_help);

    char arg3[] = "--test";
    char arg4[] = "check.yaml";
    char* test_argv[] = {arg0, arg3, arg4};
    options = harbor::core::CommandLineParser::parse(3, test_argv);
    BOOST_CHECK(options.test);
    BOOST_CHECK_EQUAL(options.config_file, "check.yaml");

    char arg5[] = "--bogus";
    char* bad_argv[] = {arg0, arg5};
    options = harbor::core::CommandLineParser::parse(2, bad_argv);
    BOOST_CHECK(options.parse_error);
}

BOOST_AUTO_TEST_SUITE_END()
