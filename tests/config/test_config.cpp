// tests/config/test_config.cpp
#define BOOST_TEST_MODULE config_tests
#include <boost/filesystem.hpp>
#include <boost/test/unit_test.hpp>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>

#include "kiln/config/compilation_config.hpp"
#include "kiln/config/config.hpp"
#include "kiln/log/log_config.hpp"

namespace fs = boost::filesystem;
using kiln::config::CompilationConfig;
using kiln::config::ConfigFormat;
using kiln::config::ConfigManager;
using kiln::log::LogConfig;

namespace {

// Temporary config files, and a config manager without registered properties
struct ConfigFixture {
    const fs::path temp_dir =
        fs::temp_directory_path() / fs::unique_path("kiln-config-%%%%-%%%%");
    ConfigManager& manager = ConfigManager::instance();

    ConfigFixture() {
        fs::create_directories(temp_dir);
        manager.reset();
    }

    ~ConfigFixture() {
        manager.reset();
        boost::system::error_code ec;
        fs::remove_all(temp_dir, ec);
    }

    fs::path create_file(const std::string& filename,
                         const std::string& content) {
        fs::path file_path = temp_dir / filename;
        std::ofstream ofs(file_path.string());
        ofs << content;
        return file_path;
    }
};

}  // namespace

BOOST_FIXTURE_TEST_SUITE(config_manager_suite, ConfigFixture)

BOOST_AUTO_TEST_CASE(test_load_nested_yaml) {
    fs::path path = create_file("nested.yaml", R"(
compilation:
  enabled: true
  directory: var/cache/kiln
app:
  name: mailer
  ports: [25, 587]
)");

    BOOST_CHECK_NO_THROW(manager.load_config(path.string()));

    const auto& tree = manager.get_config_tree();
    BOOST_CHECK_EQUAL(tree.get<std::string>("compilation.directory"),
                      "var/cache/kiln");
    BOOST_CHECK(tree.get<bool>("compilation.enabled"));
    BOOST_CHECK_EQUAL(tree.get<std::string>("app.name"), "mailer");
    BOOST_CHECK_EQUAL(tree.get_child("app.ports").size(), 2u);
}

BOOST_AUTO_TEST_CASE(test_load_json_string) {
    manager.load_config_string(R"({"app": {"name": "mailer", "retries": 3}})",
                               ConfigFormat::JSON);

    const auto& tree = manager.get_config_tree();
    BOOST_CHECK_EQUAL(tree.get<std::string>("app.name"), "mailer");
    BOOST_CHECK_EQUAL(tree.get<int>("app.retries"), 3);
}

BOOST_AUTO_TEST_CASE(test_invalid_file_path) {
    BOOST_CHECK_THROW(manager.load_config(
                          (temp_dir / "missing.yaml").string()),
                      std::runtime_error);
}

BOOST_AUTO_TEST_CASE(test_malformed_yaml) {
    BOOST_CHECK_THROW(manager.load_config_string("app: [unclosed"),
                      std::runtime_error);
}

BOOST_AUTO_TEST_CASE(test_singleton_and_reset) {
    BOOST_CHECK_EQUAL(&manager, &ConfigManager::instance());

    manager.load_config_string("temp:\n  data: should_be_reset\n");
    BOOST_CHECK_EQUAL(manager.get_config_tree().get<std::string>("temp.data"),
                      "should_be_reset");

    manager.reset();
    BOOST_CHECK_THROW(
        manager.get_config_tree().get<std::string>("temp.data"),
        boost::property_tree::ptree_bad_path);
}

BOOST_AUTO_TEST_SUITE_END()

// =====================================
// Compilation settings
// =====================================

BOOST_FIXTURE_TEST_SUITE(compilation_config_suite, ConfigFixture)

BOOST_AUTO_TEST_CASE(test_defaults_without_section) {
    auto compilation = std::make_shared<CompilationConfig>();
    manager.register_configuration_properties(compilation);

    manager.load_config_string("app:\n  name: mailer\n");

    BOOST_CHECK(!compilation->enabled);
    BOOST_CHECK_EQUAL(compilation->container_name, "CompiledContainer");
    BOOST_CHECK_EQUAL(compilation->parent_type, "kiln::di::CompiledContainer");
    BOOST_CHECK(compilation->autowiring);
    BOOST_CHECK(compilation->known_classes.empty());
}

BOOST_AUTO_TEST_CASE(test_compilation_section) {
    auto compilation = std::make_shared<CompilationConfig>();
    manager.register_configuration_properties(compilation);

    fs::path path = create_file("kiln.yaml", R"(
compilation:
  enabled: true
  directory: var/cache/kiln
  container_name: app::AppContainer
  parent_type: app::BaseContainer
  autowiring: false
  known_classes:
    - app::Mailer
    - app::Transport
)");
    manager.load_config(path.string());

    BOOST_CHECK(compilation->enabled);
    BOOST_CHECK_EQUAL(compilation->directory, "var/cache/kiln");
    BOOST_CHECK_EQUAL(compilation->container_name, "app::AppContainer");
    BOOST_CHECK_EQUAL(compilation->parent_type, "app::BaseContainer");
    BOOST_CHECK(!compilation->autowiring);
    BOOST_REQUIRE_EQUAL(compilation->known_classes.size(), 2u);
    BOOST_CHECK_EQUAL(compilation->known_classes[1], "app::Transport");

    BOOST_CHECK(manager.get_configuration_properties<CompilationConfig>() ==
                compilation);
}

BOOST_AUTO_TEST_CASE(test_enabled_without_directory_is_rejected) {
    manager.register_configuration_properties(
        std::make_shared<CompilationConfig>());

    BOOST_CHECK_THROW(
        manager.load_config_string("compilation:\n  enabled: true\n"),
        std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_validate) {
    CompilationConfig config;
    BOOST_CHECK_NO_THROW(config.validate());

    config.enabled = true;
    BOOST_CHECK_THROW(config.validate(), std::invalid_argument);

    config.directory = "/tmp/kiln";
    BOOST_CHECK_NO_THROW(config.validate());

    config.container_name.clear();
    BOOST_CHECK_THROW(config.validate(), std::invalid_argument);

    config.container_name = "AppContainer";
    config.parent_type.clear();
    BOOST_CHECK_THROW(config.validate(), std::invalid_argument);

    auto copy = config.clone();
    BOOST_CHECK_EQUAL(copy->properties_name(), "compilation");
}

BOOST_AUTO_TEST_SUITE_END()

// =====================================
// Log settings
// =====================================

BOOST_FIXTURE_TEST_SUITE(log_config_suite, ConfigFixture)

BOOST_AUTO_TEST_CASE(test_log_section) {
    auto log_config = std::make_shared<LogConfig>();
    manager.register_configuration_properties(log_config);

    manager.load_config_string(R"(
log:
  global_level: warning
  console:
    enabled: false
  file:
    enabled: true
    log_file: logs/app.log
    max_files: 3
)");

    BOOST_CHECK(log_config->global_level == LogConfig::LogLevel::WARN);
    BOOST_CHECK(!log_config->console.enabled);
    BOOST_CHECK(log_config->file.enabled);
    BOOST_CHECK_EQUAL(log_config->file.log_file, "logs/app.log");
    BOOST_CHECK_EQUAL(log_config->file.max_files, 3);
    BOOST_CHECK_EQUAL(log_config->file.max_file_size, 10485760);
}

BOOST_AUTO_TEST_CASE(test_level_names) {
    BOOST_CHECK(LogConfig::level_from_string("TRACE") ==
                LogConfig::LogLevel::TRACE);
    BOOST_CHECK(LogConfig::level_from_string("critical") ==
                LogConfig::LogLevel::FATAL);
    BOOST_CHECK_EQUAL(LogConfig::level_to_string(LogConfig::LogLevel::WARN),
                      "warn");
    BOOST_CHECK_THROW(LogConfig::level_from_string("verbose"),
                      std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_invalid_file_settings) {
    LogConfig config;
    config.file.enabled = true;
    config.file.max_files = 0;
    BOOST_CHECK_THROW(config.validate(), std::invalid_argument);

    config.file.max_files = 5;
    config.file.log_file.clear();
    BOOST_CHECK_THROW(config.validate(), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
