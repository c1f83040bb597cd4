#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "infrastructure/logging/logger.hpp"

using namespace LRP;

// EN: Redirects the logger to a temporary file and reads the NDJSON lines back.
// FR: Redirige le logger vers un fichier temporaire et relit les lignes NDJSON.
class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_path = std::filesystem::temp_directory_path() /
                   ("lrp_logger_test_" + Logger::generateCorrelationId() + ".log");
        auto& logger = Logger::getInstance();
        ASSERT_TRUE(logger.setOutputFile(log_path.string()));
        logger.setLogLevel(LogLevel::DEBUG);
        logger.setCorrelationId("");
        logger.clearGlobalMetadata();
    }

    void TearDown() override {
        auto& logger = Logger::getInstance();
        logger.resetOutput();
        logger.clearGlobalMetadata();
        logger.setCorrelationId("");
        logger.setLogLevel(LogLevel::INFO);
        std::filesystem::remove(log_path);
    }

    std::vector<nlohmann::json> readLines() {
        Logger::getInstance().flush();
        std::vector<nlohmann::json> lines;
        std::ifstream in(log_path);
        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty()) {
                lines.push_back(nlohmann::json::parse(line));
            }
        }
        return lines;
    }

    std::filesystem::path log_path;
};

TEST_F(LoggerTest, WritesOneJsonObjectPerLine) {
    LOG_INFO("test_module", "hello");
    LOG_ERROR("test_module", "boom");

    auto lines = readLines();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0]["level"].get<std::string>(), "INFO");
    EXPECT_EQ(lines[0]["module"].get<std::string>(), "test_module");
    EXPECT_EQ(lines[0]["message"].get<std::string>(), "hello");
    EXPECT_TRUE(lines[0].contains("timestamp"));
    EXPECT_TRUE(lines[0].contains("thread_id"));
    EXPECT_EQ(lines[1]["level"].get<std::string>(), "ERROR");
}

TEST_F(LoggerTest, FiltersBelowCurrentLevel) {
    Logger::getInstance().setLogLevel(LogLevel::WARN);

    LOG_DEBUG("level", "dropped");
    LOG_INFO("level", "dropped");
    LOG_WARN("level", "kept");
    LOG_ERROR("level", "kept");

    auto lines = readLines();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0]["level"].get<std::string>(), "WARN");
    EXPECT_EQ(lines[1]["level"].get<std::string>(), "ERROR");
}

TEST_F(LoggerTest, EscapesSpecialCharacters) {
    LOG_INFO("escape", "quote \" backslash \\ newline \n end");

    auto lines = readLines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0]["message"].get<std::string>(), "quote \" backslash \\ newline \n end");
}

TEST_F(LoggerTest, MergesMetadataWithoutOverridingReservedKeys) {
    Logger::getInstance().addGlobalMetadata("service", "lrp");
    const std::unordered_map<std::string, std::string> meta = {{"stage", "compaction"}, {"level", "bogus"}};
    LOG_INFO_META("meta", "with metadata", meta);

    auto lines = readLines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0]["stage"].get<std::string>(), "compaction");
    EXPECT_EQ(lines[0]["service"].get<std::string>(), "lrp");
    EXPECT_EQ(lines[0]["level"].get<std::string>(), "INFO");
}

TEST_F(LoggerTest, ScopedCorrelationIdIsThreadLocalAndRestored) {
    Logger::getInstance().setCorrelationId("global-id");
    {
        ScopedCorrelationId scoped("run-1");
        LOG_INFO("corr", "inside scope");

        std::thread other([] { LOG_INFO("corr", "other thread"); });
        other.join();
    }
    LOG_INFO("corr", "after scope");

    auto lines = readLines();
    ASSERT_EQ(lines.size(), 3u);
    for (const auto& line : lines) {
        if (line.at("message").get<std::string>() == "inside scope") {
            EXPECT_EQ(line.at("correlation_id").get<std::string>(), "run-1");
        } else {
            EXPECT_EQ(line.at("correlation_id").get<std::string>(), "global-id");
        }
    }
}

TEST(LoggerStaticTest, GeneratesUuidLikeCorrelationIds) {
    const std::string first = Logger::generateCorrelationId();
    const std::string second = Logger::generateCorrelationId();

    EXPECT_EQ(first.size(), 36u);
    EXPECT_EQ(first[8], '-');
    EXPECT_EQ(first[13], '-');
    EXPECT_NE(first, second);
}

TEST(LoggerStaticTest, ParsesLevelNames) {
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("INFO"), LogLevel::INFO);
    EXPECT_EQ(parseLogLevel("Warning"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("ERROR"), LogLevel::ERROR);
    EXPECT_THROW(parseLogLevel("verbose"), std::invalid_argument);
    EXPECT_TRUE(isValidLogLevel("warn"));
    EXPECT_FALSE(isValidLogLevel(""));
}
