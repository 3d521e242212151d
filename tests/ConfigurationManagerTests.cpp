#include "ConfigurationManager.hpp"

#include <gtest/gtest.h>

#include <filesystem>

using namespace locus;

TEST(ConfigurationManager, ParsesKeyValueText) {
    ConfigurationManager manager;
    manager.load_from_string(
        "# comment\n"
        "\n"
        "nominatim_url = https://geo.example.org\n"
        "default_countries = de, it ,,fr\n"
        "default_radius_km=12.5\n"
        "enable_cache=no\n"
        "lookup_cache_ttl_seconds=60\n"
        "log_level=5\n"
        "not a pair\n");

    LocusConfig config = manager.to_locus_config();
    EXPECT_EQ(config.nominatim_url, "https://geo.example.org");
    EXPECT_EQ(config.default_countries, (std::vector<std::string>{"de", "it", "fr"}));
    EXPECT_DOUBLE_EQ(config.default_radius_km, 12.5);
    EXPECT_FALSE(config.enable_cache);
    EXPECT_EQ(config.lookup_cache_ttl, std::chrono::seconds(60));
    EXPECT_EQ(config.log_level, 5);
    EXPECT_FALSE(config.locations_file.has_value());
}

TEST(ConfigurationManager, UnparseableNumbersKeepDefaults) {
    ConfigurationManager manager;
    manager.load_from_string("timeout_seconds=soon\ndefault_radius_km=far\n");

    LocusConfig config = manager.to_locus_config();
    LocusConfig defaults;
    EXPECT_EQ(config.timeout_seconds, defaults.timeout_seconds);
    EXPECT_DOUBLE_EQ(config.default_radius_km, defaults.default_radius_km);
}

TEST(ConfigurationManager, RoundTripsThroughLocusConfig) {
    LocusConfig original;
    original.default_countries = {"AT", "CH"};
    original.nearby_cache_ttl = std::chrono::seconds(90);
    original.locations_file = "/tmp/places.json";
    original.log_file = "/tmp/locus.log";

    ConfigurationManager manager;
    manager.from_locus_config(original);
    LocusConfig copy = manager.to_locus_config();

    EXPECT_EQ(copy.default_countries, original.default_countries);
    EXPECT_EQ(copy.nearby_cache_ttl, original.nearby_cache_ttl);
    EXPECT_EQ(copy.geocode_cache_ttl, original.geocode_cache_ttl);
    EXPECT_EQ(copy.locations_file, original.locations_file);
    EXPECT_EQ(copy.log_file, original.log_file);
    EXPECT_EQ(copy.enable_cache, original.enable_cache);
}

TEST(ConfigurationManager, SavesAndLoadsFile) {
    auto path = std::filesystem::temp_directory_path() / "locus_config_test.conf";

    ConfigurationManager writer;
    writer.set_value("location_index_url", "http://index.local/api");
    writer.set_value("default_max_results", "20");
    ASSERT_TRUE(writer.save_to_file(path.string()));

    ConfigurationManager reader;
    ASSERT_TRUE(reader.load_from_file(path.string()));
    EXPECT_EQ(reader.get_string("location_index_url"), "http://index.local/api");
    EXPECT_EQ(reader.get_int("default_max_results"), 20);

    std::filesystem::remove(path);
}

TEST(ConfigurationManager, MissingFileFails) {
    ConfigurationManager manager;
    EXPECT_FALSE(manager.load_from_file("/nonexistent/locus.conf"));
}

TEST(ConfigurationManager, SplitListTrimsAndDropsEmpty) {
    EXPECT_EQ(ConfigurationManager::split_list(" DE , ,FR,"), (std::vector<std::string>{"DE", "FR"}));
    EXPECT_TRUE(ConfigurationManager::split_list("").empty());
}
