#include <gtest/gtest.h>

#include "Logger.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace rasterdl;
namespace fs = std::filesystem;

class LoggerTest : public ::testing::Test {
protected:
    fs::path log_path;

    void SetUp() override {
        Logger::clearFacilityLevels();
        Logger::setDefaultLevel(LogLevel::INFO);
        log_path = fs::temp_directory_path() /
                   ("rasterdl_logger_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) + ".log");
        fs::remove(log_path);
        Logger::setLogFile(log_path.string());
    }

    void TearDown() override {
        Logger::setLogFile(std::nullopt);
        Logger::clearFacilityLevels();
        Logger::setDefaultLevel(LogLevel::INFO);
        fs::remove(log_path);
    }

    std::string log_contents() const {
        std::ifstream file(log_path);
        std::stringstream ss;
        ss << file.rdbuf();
        return ss.str();
    }
};

TEST_F(LoggerTest, FacilityLevelOverridesDefault) {
    Logger::setFacilityLevel("ParallelDispatcher", LogLevel::TRACE);

    Logger dispatcher("ParallelDispatcher");
    Logger planner("TilePlanner");

    EXPECT_TRUE(dispatcher.shouldOutput(LogLevel::TRACE));
    EXPECT_FALSE(planner.shouldOutput(LogLevel::DEBUG));
    EXPECT_TRUE(planner.shouldOutput(LogLevel::INFO));
}

TEST_F(LoggerTest, InstanceLevelAppliesWithoutFacilityLevel) {
    Logger logger("TileDecoder", LogLevel::ERROR);

    EXPECT_FALSE(logger.shouldOutput(LogLevel::WARNING));

    Logger::setFacilityLevel("TileDecoder", LogLevel::DEBUG);
    EXPECT_TRUE(logger.shouldOutput(LogLevel::DEBUG));
}

TEST_F(LoggerTest, ParsesLogConfiguration) {
    EXPECT_TRUE(Logger::parseLogConfig("2, ParallelDispatcher=5,EarthEngineClient=9"));

    EXPECT_EQ(Logger::getFacilityLevel("ParallelDispatcher"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::getFacilityLevel("EarthEngineClient"), LogLevel::TRACE);  // clamped
    EXPECT_EQ(Logger::getFacilityLevel("TilePlanner"), LogLevel::WARNING);
}

TEST_F(LoggerTest, InvalidTokensAreReported) {
    EXPECT_FALSE(Logger::parseLogConfig("TilePlanner=loud,4"));
    EXPECT_EQ(Logger::getFacilityLevel("Anything"), LogLevel::DETAILED);
}

TEST_F(LoggerTest, WritesComponentAndLevelToFile) {
    Logger logger("TileFetcher");
    logger.info("Requesting Tile[0:10,0:10]");
    logger.debug("hidden");
    logger.flush();

    const std::string contents = log_contents();
    EXPECT_NE(contents.find("INFO  TileFetcher: Requesting Tile[0:10,0:10]"), std::string::npos);
    EXPECT_EQ(contents.find("hidden"), std::string::npos);
}

TEST_F(LoggerTest, CollapsesRepeatedMessages) {
    Logger logger("ArrayAssembler");
    for (int i = 0; i < 4; ++i) {
        logger.warning("same message");
    }
    logger.warning("different message");
    logger.flush();

    const std::string contents = log_contents();
    size_t occurrences = 0;
    for (size_t pos = contents.find("same message"); pos != std::string::npos;
         pos = contents.find("same message", pos + 1)) {
        occurrences++;
    }
    EXPECT_EQ(occurrences, 1u);
    EXPECT_NE(contents.find("The previous message occurred 4 times."), std::string::npos);
    EXPECT_NE(contents.find("different message"), std::string::npos);
}
