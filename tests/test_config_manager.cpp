// EN: Unit tests for the YAML configuration manager and session options
// FR: Tests unitaires du gestionnaire de configuration YAML et des options de session

#include <gtest/gtest.h>
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include "relic/session_options.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace RIE;

namespace {

const char* SESSION_YAML = R"(
logging:
  level: DEBUG
  file: ""

import:
  delimiter: ";"
  strict_mode: true

merge:
  enabled: false

autofill:
  enabled: true
  skip_zero_group: true
  debuff_category: false

snapshot:
  indent: 4
)";

} // namespace

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        ConfigManager::getInstance().reset();
        test_dir_ = std::filesystem::temp_directory_path() / "rie_config_test";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        ConfigManager::getInstance().reset();
        unsetenv("RIE_SNAPSHOT_INDENT");
        unsetenv("RIE_LOG_LEVEL");
        unsetenv("RIE_TEST_DATA_DIR");
        std::filesystem::remove_all(test_dir_);
    }

    std::filesystem::path test_dir_;
};

TEST_F(ConfigManagerTest, ScalarTypesAreDetected) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(R"(
import:
  delimiter: ","
  strict_mode: false
export:
  indent: 2
  ratio: 1.5
  columns: [name, ids]
)"));

    EXPECT_EQ(config.get("import", "delimiter").as<std::string>(), ",");
    EXPECT_FALSE(config.get("import", "strict_mode").as<bool>());
    EXPECT_EQ(config.get("export", "indent").as<int>(), 2);
    EXPECT_DOUBLE_EQ(config.get("export", "ratio").as<double>(), 1.5);
    EXPECT_EQ(config.get("export", "columns").as<std::vector<std::string>>(),
              (std::vector<std::string>{"name", "ids"}));
    EXPECT_FALSE(config.get("export", "missing").isValid());
    EXPECT_EQ(config.get("export", "missing").asOrDefault<int>(7), 7);
}

TEST_F(ConfigManagerTest, QuotedNumbersStayStrings) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString("export:\n  indent: \"4\"\n"));

    EXPECT_EQ(config.get("export", "indent").tryAs<std::string>(), std::optional<std::string>("4"));
    EXPECT_FALSE(config.get("export", "indent").tryAs<int>().has_value());
}

TEST_F(ConfigManagerTest, EnvironmentVariablesAreExpanded) {
    setenv("RIE_TEST_DATA_DIR", "/srv/relics", 1);
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString("logging:\n  file: ${RIE_TEST_DATA_DIR}/rie.log\n"
                                      "  other: ${RIE_TEST_UNSET_VARIABLE}/x\n"));

    EXPECT_EQ(config.get("logging", "file").as<std::string>(), "/srv/relics/rie.log");
    EXPECT_EQ(config.get("logging", "other").as<std::string>(), "${RIE_TEST_UNSET_VARIABLE}/x");
}

TEST_F(ConfigManagerTest, InvalidYamlKeepsPreviousValues) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString("export:\n  indent: 3\n"));

    EXPECT_FALSE(config.loadFromString("export: [unclosed\n"));
    EXPECT_FALSE(config.loadFromString("- just\n- a list\n"));
    EXPECT_FALSE(config.loadFromFile((test_dir_ / "absent.yaml").string()));

    EXPECT_EQ(config.get("export", "indent").as<int>(), 3);
}

TEST_F(ConfigManagerTest, ValidationReportsEveryViolation) {
    auto& config = ConfigManager::getInstance();
    config.addValidationRules(sessionValidationRules());
    ASSERT_TRUE(config.loadFromString(R"(
logging:
  level: LOUD
import:
  strict_mode: "yes"
snapshot:
  indent: 12
)"));

    std::vector<std::string> errors;
    EXPECT_FALSE(config.validate(errors));
    EXPECT_EQ(errors.size(), 3u);
}

TEST_F(ConfigManagerTest, ValidConfigurationPasses) {
    auto& config = ConfigManager::getInstance();
    config.addValidationRules(sessionValidationRules());
    ASSERT_TRUE(config.loadFromString(SESSION_YAML));

    std::vector<std::string> errors;
    EXPECT_TRUE(config.validate(errors));
    EXPECT_TRUE(errors.empty());
}

TEST_F(ConfigManagerTest, EnvironmentOverridesWin) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(SESSION_YAML));
    setenv("RIE_SNAPSHOT_INDENT", "0", 1);
    setenv("RIE_LOG_LEVEL", "WARN", 1);

    config.loadEnvironmentOverrides();

    EXPECT_EQ(config.get("snapshot", "indent").as<int>(), 0);
    EXPECT_EQ(config.get("logging", "level").as<std::string>(), "WARN");
}

TEST_F(ConfigManagerTest, NonNumericIndentOverrideIsIgnored) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(SESSION_YAML));
    setenv("RIE_SNAPSHOT_INDENT", "wide", 1);

    config.loadEnvironmentOverrides();

    EXPECT_EQ(config.get("snapshot", "indent").as<int>(), 4);
}

TEST_F(ConfigManagerTest, SaveAndReload) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(SESSION_YAML));
    auto path = test_dir_ / "saved.yaml";

    ASSERT_TRUE(config.saveToFile(path.string()));
    const std::string before = config.dump();

    config.reset();
    ASSERT_TRUE(config.loadFromFile(path.string()));
    EXPECT_EQ(config.dump(), before);
}

TEST_F(ConfigManagerTest, SessionOptionsFromConfiguration) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(SESSION_YAML));

    SessionOptions options = loadSessionOptions(config);

    EXPECT_EQ(options.logLevel, "DEBUG");
    EXPECT_EQ(options.parser.delimiter, ';');
    EXPECT_TRUE(options.parser.strict_mode);
    EXPECT_FALSE(options.mergeEnabled);
    EXPECT_TRUE(options.autofillEnabled);
    EXPECT_TRUE(options.autofill.skipZeroGroup);
    EXPECT_FALSE(options.autofill.debuffCategory);
    EXPECT_TRUE(options.autofill.nightfarerDisplayGroup);
    EXPECT_EQ(options.snapshotIndent, 4);
}

TEST_F(ConfigManagerTest, SessionOptionsDefaults) {
    SessionOptions options = loadSessionOptions(ConfigManager::getInstance());

    EXPECT_EQ(options.logLevel, "INFO");
    EXPECT_TRUE(options.logFile.empty());
    EXPECT_EQ(options.parser.delimiter, ',');
    EXPECT_TRUE(options.mergeEnabled);
    EXPECT_TRUE(options.autofillEnabled);
    EXPECT_FALSE(options.autofill.skipZeroGroup);
    EXPECT_EQ(options.snapshotIndent, 2);
}

TEST_F(ConfigManagerTest, ExportSectionDoesNotChangeSnapshotIndent) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString("export:\n  indent: 6\n"));

    SessionOptions options = loadSessionOptions(config);

    EXPECT_EQ(options.snapshotIndent, 2);
}
