#include "Logger.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace locus;

namespace {

class LoggerTest : public ::testing::Test {
protected:
    void TearDown() override {
        Logger::clearFacilityLevels();
        Logger::setDefaultLevel(LogLevel::INFO);
        Logger::setSharedLogFile(std::nullopt);
    }

    static std::string read_file(const std::filesystem::path& path) {
        std::ifstream in(path);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    static std::filesystem::path temp_log(const std::string& name) {
        auto path = std::filesystem::temp_directory_path() / name;
        std::filesystem::remove(path);
        return path;
    }
};

size_t count_of(const std::string& haystack, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) {
        ++count;
    }
    return count;
}

} // namespace

TEST_F(LoggerTest, ParsesMixedConfig) {
    Logger::parseLogConfig("4,NearbySearchEngine=6");

    EXPECT_EQ(Logger::getFacilityLevel("NearbySearchEngine"), LogLevel::TRACE);
    EXPECT_EQ(Logger::getFacilityLevel("PostalLookupService"), LogLevel::DETAILED);
}

TEST_F(LoggerTest, DefaultKeywordSetsFallback) {
    Logger::parseLogConfig("default=2, GeocodingResolver = 5");

    EXPECT_EQ(Logger::getFacilityLevel("GeocodingResolver"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::getFacilityLevel("Other"), LogLevel::WARNING);
}

TEST_F(LoggerTest, OutOfRangeLevelsAreClamped) {
    Logger::parseLogConfig("9,StaticMatcher=0");

    EXPECT_EQ(Logger::getFacilityLevel("Other"), LogLevel::TRACE);
    EXPECT_EQ(Logger::getFacilityLevel("StaticMatcher"), LogLevel::ERROR);
}

TEST_F(LoggerTest, InvalidTokensAreIgnored) {
    Logger::parseLogConfig("abc,NominatimGeocoder=loud");

    EXPECT_EQ(Logger::getFacilityLevel("NominatimGeocoder"), LogLevel::INFO);
}

TEST_F(LoggerTest, ClearFacilityLevelsKeepsDefault) {
    Logger::setDefaultLevel(LogLevel::DEBUG);
    Logger::setFacilityLevel("LocationIndexClient", LogLevel::ERROR);
    Logger::clearFacilityLevels();

    EXPECT_EQ(Logger::getFacilityLevel("LocationIndexClient"), LogLevel::DEBUG);
}

TEST_F(LoggerTest, FacilityLevelGatesOutput) {
    Logger logger("NearbySearchEngine");
    Logger::setFacilityLevel("NearbySearchEngine", LogLevel::WARNING);

    EXPECT_TRUE(logger.shouldOutput(LogLevel::ERROR));
    EXPECT_TRUE(logger.shouldOutput(LogLevel::WARNING));
    EXPECT_FALSE(logger.shouldOutput(LogLevel::INFO));

    Logger::setFacilityLevel("NearbySearchEngine", LogLevel::TRACE);
    EXPECT_TRUE(logger.shouldOutput(LogLevel::TRACE));
}

TEST_F(LoggerTest, WritesToOwnLogFile) {
    auto path = temp_log("locus_logger_test.log");
    {
        Logger logger(LogLevel::DEBUG, path.string());
        logger.debug("cache hit for nearby:1,2");
        logger.trace("too verbose");
    }

    std::string contents = read_file(path);
    EXPECT_NE(contents.find("DEBUG cache hit for nearby:1,2"), std::string::npos);
    EXPECT_EQ(contents.find("too verbose"), std::string::npos);
    std::filesystem::remove(path);
}

TEST_F(LoggerTest, CollapsesRepeatedMessages) {
    auto path = temp_log("locus_logger_repeat.log");
    Logger::setSharedLogFile(path.string());
    {
        Logger logger("PostalLookupService");
        logger.info("upstream slow");
        logger.info("upstream slow");
        logger.info("upstream slow");
        logger.info("recovered");
    }
    Logger::setSharedLogFile(std::nullopt);

    std::string contents = read_file(path);
    EXPECT_EQ(count_of(contents, "upstream slow"), 1u);
    EXPECT_NE(contents.find("[PostalLookupService] The previous message occurred 3 times."), std::string::npos);
    EXPECT_NE(contents.find("recovered"), std::string::npos);
    std::filesystem::remove(path);
}
