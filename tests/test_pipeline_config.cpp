#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include "orchestrator/pipeline_config.hpp"
#include "orchestrator/pipeline_errors.hpp"
#include "orchestrator/pipeline_utils.hpp"

using namespace LRP;
using namespace LRP::Orchestrator;

// EN: Test fixture for PipelineConfig loading and validation
// FR: Fixture de test pour le chargement et la validation de PipelineConfig
class PipelineConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        ConfigManager::getInstance().reset();
    }

    void TearDown() override {
        ConfigManager::getInstance().reset();
        Logger::getInstance().setLogLevel(LogLevel::INFO);
    }

    PipelineConfig load(const std::string& yaml) {
        auto& manager = ConfigManager::getInstance();
        EXPECT_TRUE(manager.loadFromString(yaml));
        return loadPipelineConfig(manager);
    }
};

TEST_F(PipelineConfigTest, DefaultsAreValid) {
    PipelineConfig config;
    EXPECT_TRUE(config.validate().empty());
    EXPECT_TRUE(config.parallel_execution);
    EXPECT_EQ(config.num_perspectives, 3u);
    EXPECT_EQ(config.error_strategy, PipelineErrorStrategy::CONTINUE);
    EXPECT_EQ(config.cache_strategy, CacheStrategy::MEMORY);
    EXPECT_EQ(config.cache_ttl, std::chrono::seconds(3600));
    EXPECT_TRUE(config.enable_metrics);
    EXPECT_FALSE(config.enable_tracing);
    for (StageType type : kStageOrder) {
        EXPECT_TRUE(config.isStageEnabled(type));
    }
}

TEST_F(PipelineConfigTest, ValidateCollectsEveryProblem) {
    PipelineConfig config;
    config.num_perspectives = 0;
    config.max_parallel_perspectives = 0;
    config.log_level = "LOUD";

    auto errors = config.validate();
    ASSERT_EQ(errors.size(), 3u);
    EXPECT_NE(errors[0].find("num_perspectives"), std::string::npos);
    EXPECT_NE(errors[1].find("max_parallel_perspectives"), std::string::npos);
    EXPECT_NE(errors[2].find("LOUD"), std::string::npos);

    config = PipelineConfig{};
    config.num_perspectives = kMaxPerspectives + 1;
    EXPECT_EQ(config.validate().size(), 1u);
}

TEST_F(PipelineConfigTest, LoadsSectionFromYaml) {
    PipelineConfig config = load(R"(
reasoning_pipeline:
  enable_compaction: false
  enable_reranking: false
  parallel_execution: false
  num_perspectives: 5
  max_parallel_perspectives: 2
  stage_timeout_seconds: 1.5
  cache_ttl_seconds: 60
  error_strategy: fail_fast
  cache_strategy: none
  enable_tracing: true
  log_level: DEBUG
)");

    EXPECT_FALSE(config.enable_compaction);
    EXPECT_FALSE(config.isStageEnabled(StageType::RERANKING));
    EXPECT_TRUE(config.isStageEnabled(StageType::PREPROCESSING));
    EXPECT_FALSE(config.parallel_execution);
    EXPECT_EQ(config.num_perspectives, 5u);
    EXPECT_EQ(config.max_parallel_perspectives, 2u);
    EXPECT_EQ(config.stage_timeout, std::chrono::milliseconds(1500));
    EXPECT_EQ(config.cache_ttl, std::chrono::seconds(60));
    EXPECT_EQ(config.error_strategy, PipelineErrorStrategy::FAIL_FAST);
    EXPECT_EQ(config.cache_strategy, CacheStrategy::NONE);
    EXPECT_TRUE(config.enable_tracing);
    EXPECT_EQ(config.log_level, "DEBUG");
}

TEST_F(PipelineConfigTest, MissingKeysKeepDefaults) {
    PipelineConfig config = load("reasoning_pipeline:\n  num_perspectives: 4\n");
    EXPECT_EQ(config.num_perspectives, 4u);
    EXPECT_TRUE(config.enable_preprocessing);
    EXPECT_EQ(config.stage_timeout, std::chrono::milliseconds(60000));

    PipelineConfig empty = load("other_section:\n  key: value\n");
    EXPECT_EQ(empty.num_perspectives, 3u);
}

TEST_F(PipelineConfigTest, RejectsUnknownEnumsAndWrongTypes) {
    auto& manager = ConfigManager::getInstance();
    ASSERT_TRUE(manager.loadFromString(R"(
reasoning_pipeline:
  error_strategy: retry_forever
  num_perspectives: many
  parallel_execution: 3
)"));

    try {
        loadPipelineConfig(manager);
        FAIL() << "Expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(e.errors().size(), 3u);
        const std::string message = e.what();
        EXPECT_NE(message.find("reasoning_pipeline.error_strategy"), std::string::npos);
        EXPECT_NE(message.find("reasoning_pipeline.num_perspectives"), std::string::npos);
        EXPECT_NE(message.find("reasoning_pipeline.parallel_execution"), std::string::npos);
    }
}

TEST_F(PipelineConfigTest, RejectsOutOfRangeValues) {
    auto& manager = ConfigManager::getInstance();
    ASSERT_TRUE(manager.loadFromString("reasoning_pipeline:\n  num_perspectives: 40\n  cache_ttl_seconds: -5\n"));
    EXPECT_THROW(loadPipelineConfig(manager), ConfigurationError);
}

TEST_F(PipelineConfigTest, ValidationRulesMatchLoader) {
    auto& manager = ConfigManager::getInstance();
    ASSERT_TRUE(manager.loadFromString(R"(
reasoning_pipeline:
  num_perspectives: 0
  cache_strategy: disk
  log_level: INFO
)"));
    manager.addValidationRules(pipelineConfigRules());

    std::vector<std::string> errors;
    EXPECT_FALSE(manager.validate(errors));
    EXPECT_EQ(errors.size(), 2u);
}

TEST(PipelineUtilsTest, EnumNamesRoundTrip) {
    for (StageType type : kStageOrder) {
        auto parsed = PipelineUtils::parseStageType(PipelineUtils::stageTypeToString(type));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, type);
    }
    EXPECT_EQ(PipelineUtils::stageTypeToString(StageType::WORKING_AWARENESS), "working_awareness");
    EXPECT_EQ(PipelineUtils::stageTitle(StageType::FINAL_RESPONSE), "Final Response");
    EXPECT_FALSE(PipelineUtils::parseStageType("postprocessing").has_value());
    EXPECT_EQ(PipelineUtils::parseErrorStrategy("FAIL_FAST"), PipelineErrorStrategy::FAIL_FAST);
    EXPECT_FALSE(PipelineUtils::parseCacheStrategy("redis").has_value());
}

TEST(PipelineUtilsTest, TextHelpers) {
    EXPECT_EQ(PipelineUtils::truncate("abcdef", 3), "abc...");
    EXPECT_EQ(PipelineUtils::truncate("abc", 3), "abc");
    EXPECT_TRUE(PipelineUtils::isBlank(" \t\n"));
    EXPECT_FALSE(PipelineUtils::isBlank(" x "));
    EXPECT_EQ(PipelineUtils::formatDuration(12.346), "12.35ms");
}
