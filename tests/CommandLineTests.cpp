#include "CommandLineInterface.hpp"
#include "FakeHttpClient.hpp"
#include "LocusServices.hpp"
#include "Logger.hpp"
#include "SimpleCommandLineParser.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <memory>

using namespace locus;
using locus::test::FakeHttpClient;
using Command = CommandLineInterface::Command;

namespace {

class CommandLineTest : public ::testing::Test {
protected:
    void TearDown() override {
        Logger::clearFacilityLevels();
        Logger::setDefaultLevel(LogLevel::INFO);
        Logger::setSharedLogFile(std::nullopt);
    }

    std::shared_ptr<FakeHttpClient> http_ = std::make_shared<FakeHttpClient>();

    LocusServices make_services(const LocusConfig& config) {
        return LocusServices(config, http_,
                             std::make_shared<const LocationStore>(LocationStore::with_default_locations()),
                             std::make_shared<ManualClock>());
    }

    int run_capturing(CommandLineInterface& cli, LocusServices& services, nlohmann::json& output) {
        ::testing::internal::CaptureStdout();
        int status = cli.run(services);
        output = nlohmann::json::parse(::testing::internal::GetCapturedStdout());
        return status;
    }
};

} // namespace

TEST_F(CommandLineTest, ParsesCommandAndJoinsArgument) {
    CommandLineInterface cli;
    ASSERT_TRUE(cli.parse_arguments({"geocode", "Frankfurt", "am", "Main"}));
    EXPECT_EQ(cli.command(), Command::GEOCODE);
    EXPECT_EQ(cli.argument(), "Frankfurt am Main");
    EXPECT_EQ(cli.exit_code(), 0);
}

TEST_F(CommandLineTest, KnowsEveryCommandName) {
    EXPECT_TRUE(CommandLineInterface::parse_command("search") == Command::SEARCH);
    EXPECT_TRUE(CommandLineInterface::parse_command("nearby") == Command::NEARBY);
    EXPECT_TRUE(CommandLineInterface::parse_command("reverse") == Command::REVERSE);
    EXPECT_TRUE(CommandLineInterface::parse_command("postal") == Command::POSTAL);
    EXPECT_TRUE(CommandLineInterface::parse_command("city") == Command::CITY);
    EXPECT_TRUE(CommandLineInterface::parse_command("region") == Command::REGION);
    EXPECT_TRUE(CommandLineInterface::parse_command("lookup") == Command::LOOKUP);
    EXPECT_TRUE(CommandLineInterface::parse_command("validate") == Command::VALIDATE);
    EXPECT_FALSE(CommandLineInterface::parse_command("teleport").has_value());
}

TEST_F(CommandLineTest, AcceptsNegativeCoordinates) {
    CommandLineInterface cli;
    ASSERT_TRUE(cli.parse_arguments({"reverse", "--lat", "40.4168", "--lng", "-3.7038"}));
    EXPECT_EQ(cli.command(), Command::REVERSE);
}

TEST_F(CommandLineTest, RejectsUnknownCommand) {
    CommandLineInterface cli;
    EXPECT_FALSE(cli.parse_arguments({"teleport", "Berlin"}));
    EXPECT_EQ(cli.exit_code(), 1);
}

TEST_F(CommandLineTest, RejectsNonNumericRadius) {
    CommandLineInterface cli;
    EXPECT_FALSE(cli.parse_arguments({"nearby", "Berlin", "--radius", "25km"}));
    EXPECT_EQ(cli.exit_code(), 1);
}

TEST_F(CommandLineTest, ReverseNeedsBothCoordinates) {
    CommandLineInterface cli;
    EXPECT_FALSE(cli.parse_arguments({"reverse", "--lat", "48.5"}));
    EXPECT_EQ(cli.exit_code(), 1);
}

TEST_F(CommandLineTest, PostalNeedsArgument) {
    CommandLineInterface cli;
    EXPECT_FALSE(cli.parse_arguments({"postal"}));
    EXPECT_EQ(cli.exit_code(), 1);
}

TEST_F(CommandLineTest, HelpIsNotAnError) {
    CommandLineInterface cli;
    ::testing::internal::CaptureStdout();
    EXPECT_FALSE(cli.parse_arguments({"--help"}));
    std::string help = ::testing::internal::GetCapturedStdout();
    EXPECT_EQ(cli.exit_code(), 0);
    EXPECT_NE(help.find("nearby"), std::string::npos);
}

TEST_F(CommandLineTest, HelpListsEveryRegisteredOption) {
    CommandLineInterface cli;
    ::testing::internal::CaptureStdout();
    EXPECT_FALSE(cli.parse_arguments({"--help"}));
    std::string help = ::testing::internal::GetCapturedStdout();
    for (const char* option : {"--config VALUE", "--country VALUE", "--radius VALUE", "--limit VALUE",
                               "--lat VALUE", "--lng VALUE", "-s, --silent", "-v, --verbose",
                               "--log-level VALUE", "--log-file VALUE", "--create-config VALUE",
                               "--version", "-h, --help"}) {
        EXPECT_NE(help.find(option), std::string::npos) << option;
    }
}

TEST(CommandLineParser, UnsetOptionsStayUnset) {
    SimpleCommandLineParser parser("locus-cli", "test");
    parser.add_option("radius", "r", "Search radius in km");
    parser.add_flag("silent", "s", "Only log errors");

    ASSERT_TRUE(parser.parse(std::vector<std::string>{"nearby", "-r", "-0.5"}));
    EXPECT_EQ(parser.get("radius").value_or(""), "-0.5");
    EXPECT_FALSE(parser.get_flag("silent"));
    EXPECT_FALSE(parser.get("silent").has_value());
    EXPECT_EQ(parser.get_positional(), std::vector<std::string>{"nearby"});

    ASSERT_TRUE(parser.parse(std::vector<std::string>{"nearby"}));
    EXPECT_FALSE(parser.get("radius").has_value());
}

TEST(CommandLineParser, RejectsUnknownOptionsAndMissingValues) {
    SimpleCommandLineParser parser("locus-cli", "test");
    parser.add_option("radius", "r", "Search radius in km");

    EXPECT_FALSE(parser.parse(std::vector<std::string>{"--teleport"}));
    EXPECT_FALSE(parser.parse(std::vector<std::string>{"--radius"}));
    EXPECT_FALSE(parser.help_requested());
    EXPECT_TRUE(parser.parse(std::vector<std::string>{"--radius=10"}));
    EXPECT_DOUBLE_EQ(parser.get_as<double>("radius").value_or(0.0), 10.0);
}

TEST_F(CommandLineTest, SilentFlagLowersLogLevel) {
    CommandLineInterface cli;
    ASSERT_TRUE(cli.parse_arguments({"search", "ber", "--silent"}));
    EXPECT_EQ(cli.get_config().log_level, 1);
    EXPECT_EQ(Logger::getFacilityLevel("Anything"), LogLevel::ERROR);
}

TEST_F(CommandLineTest, LogLevelOptionSetsFacilities) {
    CommandLineInterface cli;
    ASSERT_TRUE(cli.parse_arguments({"search", "ber", "--log-level", "2,StaticMatcher=6"}));
    EXPECT_EQ(cli.get_config().log_level, 2);
    EXPECT_EQ(Logger::getFacilityLevel("StaticMatcher"), LogLevel::TRACE);
}

TEST_F(CommandLineTest, NearbyUsesCountryListAndLimit) {
    http_->respond("/locations/nearby", R"({"results": []})");

    CommandLineInterface cli;
    ASSERT_TRUE(cli.parse_arguments({"nearby", "--lat", "48.52", "--lng=9.05",
                                     "--country", "DE, AT", "--limit", "6", "--radius", "10"}));
    auto services = make_services(cli.get_config());

    nlohmann::json output;
    EXPECT_EQ(run_capturing(cli, services, output), 0);
    EXPECT_EQ(output["totalFound"], 0);
    EXPECT_EQ(http_->request_count(), 2u);
    EXPECT_EQ(http_->requests_matching("radius=10&country=AT&limit=3"), 1u);
    EXPECT_EQ(http_->requests_matching("radius=10&country=DE&limit=3"), 1u);
}

TEST_F(CommandLineTest, NearbyRejectsBadCountryAtRunTime) {
    CommandLineInterface cli;
    ASSERT_TRUE(cli.parse_arguments({"nearby", "--lat", "48.52", "--lng", "9.05", "--country", "Germany"}));
    auto services = make_services(cli.get_config());

    ::testing::internal::CaptureStderr();
    EXPECT_EQ(cli.run(services), 1);
    std::string errors = ::testing::internal::GetCapturedStderr();
    EXPECT_NE(errors.find("two-letter"), std::string::npos);
    EXPECT_EQ(http_->request_count(), 0u);
}

TEST_F(CommandLineTest, GeocodeFromStaticStore) {
    CommandLineInterface cli;
    ASSERT_TRUE(cli.parse_arguments({"geocode", "Hamburg"}));
    auto services = make_services(cli.get_config());

    nlohmann::json output;
    EXPECT_EQ(run_capturing(cli, services, output), 0);
    EXPECT_EQ(output["source"], "static");
    EXPECT_EQ(output["hierarchy"]["city"], "Hamburg");
    EXPECT_EQ(http_->request_count(), 0u);
}

TEST_F(CommandLineTest, GeocodeNotFoundExitsWithTwo) {
    http_->respond("/search", "[]");

    CommandLineInterface cli;
    ASSERT_TRUE(cli.parse_arguments({"geocode", "Xyzzyville"}));
    auto services = make_services(cli.get_config());

    nlohmann::json output;
    EXPECT_EQ(run_capturing(cli, services, output), 2);
    EXPECT_TRUE(output.is_null());
}

TEST_F(CommandLineTest, ValidateFormatsAndChecks) {
    CommandLineInterface cli;
    ASSERT_TRUE(cli.parse_arguments({"validate", "1234ab", "--country", "NL"}));
    auto services = make_services(cli.get_config());

    nlohmann::json output;
    EXPECT_EQ(run_capturing(cli, services, output), 0);
    EXPECT_EQ(output["valid"], true);
    EXPECT_EQ(output["formatted"], "1234 AB");
    EXPECT_EQ(output["country"], "NL");
}

TEST_F(CommandLineTest, ValidateInvalidCodeExitsWithTwo) {
    CommandLineInterface cli;
    ASSERT_TRUE(cli.parse_arguments({"validate", "7207"}));
    auto services = make_services(cli.get_config());

    nlohmann::json output;
    EXPECT_EQ(run_capturing(cli, services, output), 2);
    EXPECT_EQ(output["valid"], false);
    EXPECT_EQ(output["country"], "DE");
}
