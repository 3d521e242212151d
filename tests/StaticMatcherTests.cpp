#include "StaticMatcher.hpp"

#include <gtest/gtest.h>

#include <memory>

using namespace locus;

namespace {

LocationRecord make_place(const std::string& name, double lat, double lng,
                          std::optional<int64_t> population,
                          std::vector<std::string> variants = {}) {
    LocationRecord record;
    record.name = name;
    record.name_variants = std::move(variants);
    record.coordinates = GeographicCoordinates(lat, lng);
    record.country = "Germany";
    record.country_code = "DE";
    record.region = "Testland";
    record.population = population;
    return record;
}

StaticMatcher default_matcher() {
    return StaticMatcher(std::make_shared<const LocationStore>(LocationStore::with_default_locations()));
}

} // namespace

TEST(StaticMatcher, PrefixScoresPointNine) {
    auto results = default_matcher().match("berl");
    ASSERT_FALSE(results.empty());
    EXPECT_EQ(results[0].name, "Berlin");
    EXPECT_DOUBLE_EQ(results[0].relevance_score, 0.9);
}

TEST(StaticMatcher, ExactScoresOne) {
    auto results = default_matcher().match("berlin");
    ASSERT_FALSE(results.empty());
    EXPECT_EQ(results[0].name, "Berlin");
    EXPECT_DOUBLE_EQ(results[0].relevance_score, 1.0);
}

TEST(StaticMatcher, QueryIsNormalized) {
    auto results = default_matcher().match("  BERLIN ");
    ASSERT_FALSE(results.empty());
    EXPECT_DOUBLE_EQ(results[0].relevance_score, 1.0);
}

TEST(StaticMatcher, ShortQueryMatchesNothing) {
    EXPECT_TRUE(default_matcher().match("b").empty());
    EXPECT_TRUE(default_matcher().match("   ").empty());
}

TEST(StaticMatcher, VariantMatchReturnsVariantName) {
    auto results = default_matcher().match("münchen");
    ASSERT_FALSE(results.empty());
    EXPECT_EQ(results[0].name, "München");
    EXPECT_EQ(results[0].hierarchy.city, "Munich");
    EXPECT_DOUBLE_EQ(results[0].relevance_score, 1.0);
}

TEST(StaticMatcher, PopulationBreaksTies) {
    auto store = std::make_shared<const LocationStore>(std::vector<LocationRecord>{
        make_place("Neustadt am Rübenberge", 52.50, 9.46, 45000),
        make_place("Neustadt an der Weinstraße", 49.35, 8.14, 53000),
        make_place("Neustadt bei Coburg", 50.33, 11.12, std::nullopt),
    });
    StaticMatcher matcher(store);

    auto results = matcher.match("neustadt");
    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].name, "Neustadt an der Weinstraße");
    EXPECT_EQ(results[1].name, "Neustadt am Rübenberge");
    EXPECT_EQ(results[2].name, "Neustadt bei Coburg");
}

TEST(StaticMatcher, HigherScoreBeatsPopulation) {
    auto store = std::make_shared<const LocationStore>(std::vector<LocationRecord>{
        make_place("Großstadt Ulmen", 50.0, 7.0, 900000),
        make_place("Ulmen", 50.2, 7.0, 3000),
    });
    StaticMatcher matcher(store);

    auto results = matcher.match("ulmen");
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].name, "Ulmen");
    EXPECT_DOUBLE_EQ(results[0].relevance_score, 1.0);
    EXPECT_DOUBLE_EQ(results[1].relevance_score, 0.7);
}

TEST(StaticMatcher, ResultsRespectLimitAndScoreRange) {
    auto results = default_matcher().match("en", 3);
    EXPECT_LE(results.size(), 3u);
    for (const auto& result : results) {
        EXPECT_GE(result.relevance_score, 0.0);
        EXPECT_LE(result.relevance_score, 1.0);
    }
}

TEST(StaticMatcher, DisplayNameOmitsDistrictEqualToCity) {
    LocationHierarchy hierarchy;
    hierarchy.city = "Stuttgart";
    hierarchy.district = "Stuttgart";
    hierarchy.region = "Baden-Württemberg";
    EXPECT_EQ(StaticMatcher::format_display_name(hierarchy), "Stuttgart, Baden-Württemberg");

    hierarchy.city = "Metzingen";
    hierarchy.district = "Reutlingen";
    EXPECT_EQ(StaticMatcher::format_display_name(hierarchy), "Metzingen, Reutlingen, Baden-Württemberg");
}

TEST(StaticMatcher, BestMatchExactHasFullConfidence) {
    auto result = default_matcher().best_match("Hamburg");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->hierarchy.city, "Hamburg");
    EXPECT_EQ(result->source, GeocodingSource::STATIC);
    EXPECT_DOUBLE_EQ(result->confidence, 1.0);
}

TEST(StaticMatcher, BestMatchPartial) {
    auto result = default_matcher().best_match("urach");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->hierarchy.city, "Bad Urach");
    EXPECT_DOUBLE_EQ(result->confidence, 0.8);
}

TEST(StaticMatcher, BestMatchUnknown) {
    EXPECT_FALSE(default_matcher().best_match("Atlantis").has_value());
    EXPECT_FALSE(default_matcher().best_match("").has_value());
}
