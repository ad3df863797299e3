// tests/config/test_config.cpp
#define BOOST_TEST_MODULE ConfigTests
#include <boost/filesystem.hpp>  // for file operations
#include <boost/test/unit_test.hpp>
#include <fstream>

#include "harbor/config/config.hpp"
#include "harbor/log/log_config.hpp"

namespace fs = boost::filesystem;

namespace {

// Properties class with only the hooks the manager calls.
class ListenerProperties : public harbor::config::ConfigurationProperties {
public:
    std::string host = "0.0.0.0";
    int port = 0;

    void from_ptree(const boost::property_tree::ptree& pt) override {
        host = get_value(pt, "host", host);
        port = get_required_value<int>(pt, "port");
    }
    void validate() const override {
        if (port <= 0) {
            throw std::invalid_argument("listener.port must be > 0");
        }
    }
    std::string properties_name() const override { return "listener"; }
};

}  // namespace

// Test fixture: create and cleanup temporary config files
struct ConfigFixture {
    const fs::path temp_dir =
        fs::temp_directory_path() / fs::unique_path("harbor_config_%%%%%%");

    ConfigFixture() { fs::create_directories(temp_dir); }

    ~ConfigFixture() { fs::remove_all(temp_dir); }

    fs::path create_temp_file(const std::string& filename,
                              const std::string& content) {
        fs::path file_path = temp_dir / filename;
        std::ofstream ofs(file_path.string());
        ofs << content;
        ofs.close();
        return file_path;
    }
};

BOOST_FIXTURE_TEST_SUITE(ConfigTestSuite, ConfigFixture)

BOOST_AUTO_TEST_CASE(test_load_nested_yaml) {
    const std::string yaml_content = R"(
registry:
  default_ttl_ms: 15000
  hosts:
    - alpha
    - beta
)";
    auto config_path = create_temp_file("nested.yaml", yaml_content);

    harbor::config::ConfigManager config_manager;
    BOOST_CHECK_NO_THROW(config_manager.load_config(
        config_path.string(), harbor::config::ConfigFormat::YAML));

    const auto& config_tree = config_manager.get_config_tree();
    BOOST_CHECK_EQUAL(config_tree.get<int>("registry.default_ttl_ms"), 15000);

    std::vector<std::string> hosts;
    for (const auto& [key, child] : config_tree.get_child("registry.hosts")) {
        BOOST_CHECK(key.empty());
        hosts.push_back(child.get_value<std::string>());
    }
    BOOST_CHECK(hosts == (std::vector<std::string>{"alpha", "beta"}));
}

BOOST_AUTO_TEST_CASE(test_load_json) {
    auto config_path =
        create_temp_file("config.json", R"({"log": {"global_level": "debug"}})");

    harbor::config::ConfigManager config_manager;
    config_manager.load_config(
        config_path.string(),
        harbor::config::format_from_path(config_path.string()));
    BOOST_CHECK_EQUAL(
        config_manager.get_config_tree().get<std::string>("log.global_level"),
        "debug");
}

BOOST_AUTO_TEST_CASE(test_format_from_path) {
    using harbor::config::ConfigFormat;
    BOOST_CHECK(harbor::config::format_from_path("a/b.json") == ConfigFormat::JSON);
    BOOST_CHECK(harbor::config::format_from_path("b.ini") == ConfigFormat::INI);
    BOOST_CHECK(harbor::config::format_from_path("c.yaml") == ConfigFormat::YAML);
    BOOST_CHECK(harbor::config::format_from_path("noext") == ConfigFormat::YAML);
}

BOOST_AUTO_TEST_CASE(test_invalid_file_path) {
    harbor::config::ConfigManager config_manager;
    BOOST_CHECK_THROW(
        config_manager.load_config("non_existent_file.yaml",
                                   harbor::config::ConfigFormat::YAML),
        std::runtime_error);
}

BOOST_AUTO_TEST_CASE(test_malformed_yaml) {
    auto config_path = create_temp_file("broken.yaml", "log: [unclosed\n");
    harbor::config::ConfigManager config_manager;
    BOOST_CHECK_THROW(
        config_manager.load_config(config_path.string(),
                                   harbor::config::ConfigFormat::YAML),
        std::runtime_error);
}

BOOST_AUTO_TEST_CASE(test_registered_properties_are_populated) {
    const std::string yaml_content = R"(
log:
  global_level: warn
  console:
    enabled: false
  file:
    enabled: true
    log_file: /tmp/harbor-test.log
    max_files: 3
)";
    auto config_path = create_temp_file("log.yaml", yaml_content);

    harbor::config::ConfigManager config_manager;
    auto log_config = std::make_shared<harbor::log::LogConfig>();
    config_manager.register_configuration_properties(log_config);
    config_manager.load_config(config_path.string());

    BOOST_CHECK(log_config->global_level == harbor::log::LogConfig::LogLevel::WARN);
    BOOST_CHECK(!log_config->console.enabled);
    BOOST_CHECK(log_config->file.enabled);
    BOOST_CHECK_EQUAL(log_config->file.max_files, 3);

    BOOST_CHECK_EQUAL(
        config_manager.get_configuration_properties<harbor::log::LogConfig>(),
        log_config);
    BOOST_CHECK(config_manager.get_config_by_name("log") != nullptr);
    BOOST_CHECK(config_manager.get_config_by_name("missing") == nullptr);
}

BOOST_AUTO_TEST_CASE(test_plain_properties_subclass_is_loaded) {
    auto config_path = create_temp_file(
        "listener.yaml", "listener:\n  host: 127.0.0.1\n  port: 7001\n");

    harbor::config::ConfigManager config_manager;
    auto listener = std::make_shared<ListenerProperties>();
    config_manager.register_configuration_properties(listener);
    config_manager.load_config(config_path.string());

    BOOST_CHECK_EQUAL(listener->host, "127.0.0.1");
    BOOST_CHECK_EQUAL(listener->port, 7001);
    BOOST_CHECK_EQUAL(
        config_manager.get_configuration_properties<ListenerProperties>(),
        listener);
}

BOOST_AUTO_TEST_CASE(test_missing_section_uses_defaults) {
    auto config_path = create_temp_file("empty.yaml", "other: 1\n");

    harbor::config::ConfigManager config_manager;
    auto log_config = std::make_shared<harbor::log::LogConfig>();
    config_manager.register_configuration_properties(log_config);
    BOOST_CHECK_NO_THROW(config_manager.load_config(config_path.string()));
    BOOST_CHECK(log_config->global_level == harbor::log::LogConfig::LogLevel::INFO);
}

BOOST_AUTO_TEST_CASE(test_invalid_section_is_rejected) {
    auto config_path =
        create_temp_file("bad_level.yaml", "log:\n  global_level: loud\n");

    harbor::config::ConfigManager config_manager;
    config_manager.register_configuration_properties(
        std::make_shared<harbor::log::LogConfig>());
    BOOST_CHECK_THROW(config_manager.load_config(config_path.string()),
                      std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_config_reset) {
    auto config_path =
        create_temp_file("reset_test.yaml", "temp:\n  data: should_be_reset\n");
    harbor::config::ConfigManager config_manager;
    config_manager.register_configuration_properties(
        std::make_shared<harbor::log::LogConfig>());
    config_manager.load_config(config_path.string());
    BOOST_CHECK_EQUAL(
        config_manager.get_config_tree().get<std::string>("temp.data"),
        "should_be_reset");

    config_manager.reset();
    BOOST_CHECK_THROW(
        config_manager.get_config_tree().get<std::string>("temp.data"),
        boost::property_tree::ptree_bad_path);
    BOOST_CHECK(config_manager.get_config_by_name("log") == nullptr);
}

BOOST_AUTO_TEST_SUITE_END()
