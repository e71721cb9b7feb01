// EN: Unit tests for the NDJSON logger
// FR: Tests unitaires du logger NDJSON

#include <gtest/gtest.h>
#include "infrastructure/logging/logger.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

using namespace RIE;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& logger = Logger::getInstance();
        logger.setOutputStream(&output_);
        logger.setLogLevel(LogLevel::DEBUG);
        logger.setCorrelationId("");
        logger.clearGlobalMetadata();
    }

    void TearDown() override {
        auto& logger = Logger::getInstance();
        logger.setOutputStream(nullptr);
        logger.clearGlobalMetadata();
        logger.setCorrelationId("");
        logger.setLogLevel(LogLevel::ERROR);
    }

    std::vector<nlohmann::json> lines() const {
        std::vector<nlohmann::json> parsed;
        std::istringstream stream(output_.str());
        std::string line;
        while (std::getline(stream, line)) {
            if (!line.empty()) {
                parsed.push_back(nlohmann::json::parse(line));
            }
        }
        return parsed;
    }

    std::ostringstream output_;
};

TEST_F(LoggerTest, WritesOneJsonObjectPerLine) {
    LOG_INFO("session", "Import completed");
    LOG_ERROR("session", "Import failed");

    auto entries = lines();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0]["level"], "INFO");
    EXPECT_EQ(entries[0]["module"], "session");
    EXPECT_EQ(entries[0]["message"], "Import completed");
    EXPECT_TRUE(entries[0].contains("timestamp"));
    EXPECT_TRUE(entries[0].contains("thread_id"));
    EXPECT_FALSE(entries[0].contains("correlation_id"));
    EXPECT_EQ(entries[1]["level"], "ERROR");
}

TEST_F(LoggerTest, LevelFilterDropsLowerLevels) {
    Logger::getInstance().setLogLevel(LogLevel::WARN);

    LOG_DEBUG("merger", "hidden");
    LOG_INFO("merger", "hidden");
    LOG_WARN("merger", "shown");
    LOG_ERROR("merger", "shown");

    auto entries = lines();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0]["level"], "WARN");
    EXPECT_EQ(entries[1]["level"], "ERROR");
}

TEST_F(LoggerTest, SpecialCharactersAreEscaped) {
    LOG_WARN("project_store", "Unknown nightfarer \"Ghost\"\n\tpath C:\\relics");

    auto entries = lines();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0]["message"], "Unknown nightfarer \"Ghost\"\n\tpath C:\\relics");
}

TEST_F(LoggerTest, MetadataIsMergedIntoEntry) {
    Logger::getInstance().addGlobalMetadata("command", "import");
    std::unordered_map<std::string, std::string> metadata = {
        {"imported", "4"},
        {"command", "reconcile"}
    };

    LOG_INFO_META("session", "Import completed", metadata);

    auto entries = lines();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0]["imported"], "4");
    EXPECT_EQ(entries[0]["command"], "reconcile");
}

TEST_F(LoggerTest, CorrelationIdIsAttached) {
    auto& logger = Logger::getInstance();
    std::string id = logger.generateCorrelationId();

    EXPECT_EQ(id.size(), 36u);
    EXPECT_EQ(id[8], '-');
    EXPECT_EQ(id[23], '-');
    EXPECT_NE(id, logger.generateCorrelationId());

    logger.setCorrelationId(id);
    LOG_INFO("riectl", "Run started");

    auto entries = lines();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0]["correlation_id"], id);
}

TEST_F(LoggerTest, ParseLogLevelNames) {
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("INFO"), LogLevel::INFO);
    EXPECT_EQ(parseLogLevel("Warning"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("warn"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("ERROR"), LogLevel::ERROR);
    EXPECT_FALSE(parseLogLevel("verbose").has_value());
    EXPECT_EQ(Logger::levelToString(LogLevel::WARN), "WARN");
}

TEST_F(LoggerTest, FileOutput) {
    auto path = std::filesystem::temp_directory_path() / "rie_logger_test.log";
    std::filesystem::remove(path);

    auto& logger = Logger::getInstance();
    logger.setOutputStream(nullptr);
    ASSERT_TRUE(logger.setOutputFile(path.string()));
    LOG_INFO("riectl", "Written to file");
    logger.flush();

    std::ifstream file(path);
    std::string line;
    ASSERT_TRUE(std::getline(file, line));
    EXPECT_EQ(nlohmann::json::parse(line)["message"], "Written to file");

    std::filesystem::remove(path);
}
