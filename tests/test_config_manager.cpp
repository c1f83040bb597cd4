#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"

using namespace LRP;

// EN: Test fixture resetting the ConfigManager singleton around each test
// FR: Fixture remettant à zéro le singleton ConfigManager autour de chaque test
class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        ConfigManager::getInstance().reset();
        test_dir = std::filesystem::temp_directory_path() /
                   ("lrp_config_test_" + Logger::generateCorrelationId());
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        ConfigManager::getInstance().reset();
        std::filesystem::remove_all(test_dir);
        Logger::getInstance().setLogLevel(LogLevel::INFO);
    }

    std::string writeFile(const std::string& name, const std::string& content) {
        const auto path = test_dir / name;
        std::ofstream out(path);
        out << content;
        return path.string();
    }

    std::filesystem::path test_dir;
};

TEST_F(ConfigManagerTest, ParsesTypedValuesFromYaml) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(R"(
reasoning_pipeline:
  parallel_execution: false
  num_perspectives: 5
  stage_timeout_seconds: 2.5
  log_level: DEBUG
  quoted_number: "42"
  tags: [alpha, beta]
)"));

    EXPECT_EQ(config.get("reasoning_pipeline", "parallel_execution").as<bool>(), false);
    EXPECT_EQ(config.get("reasoning_pipeline", "num_perspectives").as<int>(), 5);
    EXPECT_DOUBLE_EQ(config.get("reasoning_pipeline", "stage_timeout_seconds").as<double>(), 2.5);
    EXPECT_EQ(config.get("reasoning_pipeline", "log_level").as<std::string>(), "DEBUG");
    EXPECT_EQ(config.get("reasoning_pipeline", "quoted_number").as<std::string>(), "42");

    auto tags = config.get("reasoning_pipeline", "tags").as<std::vector<std::string>>();
    ASSERT_EQ(tags.size(), 2u);
    EXPECT_EQ(tags[1], "beta");
}

TEST_F(ConfigManagerTest, ReportsMissingAndMalformedFiles) {
    auto& config = ConfigManager::getInstance();
    EXPECT_FALSE(config.loadFromFile((test_dir / "missing.yaml").string()));
    EXPECT_FALSE(config.loadFromString("key: [unterminated"));
    EXPECT_FALSE(config.loadFromString("- just\n- a list\n"));
}

TEST_F(ConfigManagerTest, LoadingReplacesPreviousSections) {
    auto& config = ConfigManager::getInstance();
    config.set("stale", "key", ConfigValue(1));

    const std::string path = writeFile("pipeline.yaml", "reasoning_pipeline:\n  enable_compaction: false\n");
    ASSERT_TRUE(config.loadFromFile(path));

    EXPECT_FALSE(config.has("stale", "key"));
    EXPECT_FALSE(config.get("reasoning_pipeline", "enable_compaction").as<bool>());
    ASSERT_EQ(config.getSectionNames().size(), 1u);
}

TEST_F(ConfigManagerTest, ExpandsEnvironmentVariables) {
    ::setenv("LRP_TEST_MODEL_NAME", "reasoner-large", 1);
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(R"(
agent:
  model: "${LRP_TEST_MODEL_NAME}"
  unknown: "${LRP_TEST_UNSET_VARIABLE}"
)"));

    EXPECT_EQ(config.get("agent", "model").as<std::string>(), "reasoner-large");
    EXPECT_EQ(config.get("agent", "unknown").as<std::string>(), "${LRP_TEST_UNSET_VARIABLE}");
    ::unsetenv("LRP_TEST_MODEL_NAME");
}

TEST_F(ConfigManagerTest, AppliesEnvironmentOverrides) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString("reasoning_pipeline:\n  num_perspectives: 3\n"));

    ::setenv("LRPTEST_REASONING_PIPELINE__NUM_PERSPECTIVES", "7", 1);
    ::setenv("LRPTEST_REASONING_PIPELINE__ERROR_STRATEGY", "fail_fast", 1);
    ::setenv("LRPTEST_MALFORMED", "ignored", 1);

    EXPECT_EQ(config.loadEnvironmentOverrides("LRPTEST_"), 2u);
    EXPECT_EQ(config.get("reasoning_pipeline", "num_perspectives").as<int>(), 7);
    EXPECT_EQ(config.get("reasoning_pipeline", "error_strategy").as<std::string>(), "fail_fast");

    ::unsetenv("LRPTEST_REASONING_PIPELINE__NUM_PERSPECTIVES");
    ::unsetenv("LRPTEST_REASONING_PIPELINE__ERROR_STRATEGY");
    ::unsetenv("LRPTEST_MALFORMED");
}

TEST_F(ConfigManagerTest, ValidatesAgainstRules) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(R"(
pipeline:
  workers: 0
  mode: turbo
  ratio: 3
)"));

    ConfigManager::ValidationRule workers;
    workers.key = "pipeline.workers";
    workers.type = "int";
    workers.min_value = 1;

    ConfigManager::ValidationRule mode;
    mode.key = "pipeline.mode";
    mode.type = "string";
    mode.allowed_values = {"fast", "safe"};

    ConfigManager::ValidationRule ratio;
    ratio.key = "pipeline.ratio";
    ratio.type = "double";

    ConfigManager::ValidationRule name;
    name.key = "pipeline.name";
    name.type = "string";
    name.required = true;

    config.addValidationRules({workers, mode, ratio, name});

    std::vector<std::string> errors;
    EXPECT_FALSE(config.validate(errors));
    ASSERT_EQ(errors.size(), 3u);
    EXPECT_NE(errors[0].find("pipeline.workers"), std::string::npos);
    EXPECT_NE(errors[1].find("pipeline.mode"), std::string::npos);
    EXPECT_NE(errors[2].find("Required configuration missing: pipeline.name"), std::string::npos);

    config.set("pipeline", "workers", ConfigValue(2));
    config.set("pipeline", "mode", ConfigValue("safe"));
    config.set("pipeline", "name", ConfigValue("main"));
    EXPECT_TRUE(config.validate(errors));
    EXPECT_TRUE(errors.empty());
}

TEST_F(ConfigManagerTest, SavesAndReloadsConfiguration) {
    auto& config = ConfigManager::getInstance();
    config.set("reasoning_pipeline", "num_perspectives", ConfigValue(4));
    config.set("reasoning_pipeline", "enable_tracing", ConfigValue(true));
    config.set("reasoning_pipeline", "log_level", ConfigValue("WARN"));

    const std::string path = (test_dir / "saved.yaml").string();
    ASSERT_TRUE(config.saveToFile(path));

    config.reset();
    ASSERT_TRUE(config.loadFromFile(path));
    EXPECT_EQ(config.get("reasoning_pipeline", "num_perspectives").as<int>(), 4);
    EXPECT_TRUE(config.get("reasoning_pipeline", "enable_tracing").as<bool>());
    EXPECT_EQ(config.get("reasoning_pipeline", "log_level").as<std::string>(), "WARN");
}

TEST_F(ConfigManagerTest, SectionsAndDefaultKeys) {
    auto& config = ConfigManager::getInstance();
    CONFIG_SET("verbose", true);
    EXPECT_TRUE(CONFIG_GET("verbose").as<bool>());
    EXPECT_TRUE(config.has("verbose"));

    config.remove("verbose");
    EXPECT_FALSE(config.has("verbose"));
    EXPECT_FALSE(CONFIG_GET("verbose").isValid());

    ConfigSection section;
    section.set("b", ConfigValue(1));
    section.set("a", ConfigValue(2));
    config.setSection("custom", section);

    auto keys = config.getSection("custom").keys();
    ASSERT_EQ(keys.size(), 2u);
    EXPECT_EQ(keys[0], "a");
    EXPECT_NE(config.dump().find("[custom]"), std::string::npos);
}

TEST(ConfigValueTest, TypedAccess) {
    ConfigValue empty;
    EXPECT_FALSE(empty.isValid());
    EXPECT_THROW(empty.as<int>(), std::runtime_error);
    EXPECT_EQ(empty.asOrDefault<int>(9), 9);

    ConfigValue number(12);
    EXPECT_EQ(number.as<int>(), 12);
    EXPECT_FALSE(number.tryAs<std::string>().has_value());
    EXPECT_THROW(number.as<bool>(), std::runtime_error);
    EXPECT_EQ(number.toString(), "12");
}
