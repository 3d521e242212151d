#include "GeocodingResolver.hpp"
#include "FakeHttpClient.hpp"

#include <gtest/gtest.h>

#include <memory>

using namespace locus;
using locus::test::FakeHttpClient;

namespace {

const std::string kParisResponse = R"([{
  "lat": "48.8566", "lon": "2.3522",
  "display_name": "Paris, Île-de-France, France métropolitaine, France",
  "address": {"city": "Paris", "state": "Île-de-France", "country": "France", "country_code": "fr"}
}])";

class GeocodingResolverTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeHttpClient> http_ = std::make_shared<FakeHttpClient>();
    std::shared_ptr<ManualClock> clock_ = std::make_shared<ManualClock>();
    std::shared_ptr<const StaticMatcher> matcher_ = std::make_shared<const StaticMatcher>(
        std::make_shared<const LocationStore>(LocationStore::with_default_locations()));

    GeocodingResolver make_resolver() {
        return GeocodingResolver(matcher_, std::make_shared<NominatimGeocoder>(http_),
                                 CacheConfig{std::chrono::hours(24), true}, clock_);
    }
};

} // namespace

TEST_F(GeocodingResolverTest, StaticStoreAnswersWithoutNetwork) {
    auto resolver = make_resolver();
    auto result = resolver.geocode("Munich");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->source, GeocodingSource::STATIC);
    EXPECT_EQ(result->hierarchy.city, "Munich");
    EXPECT_EQ(http_->request_count(), 0u);
}

TEST_F(GeocodingResolverTest, FallsBackToExternalGeocoder) {
    http_->respond("/search", kParisResponse);
    auto resolver = make_resolver();

    auto result = resolver.geocode("Paris", GeocodingOptions{std::string("FR"), true, 1});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->source, GeocodingSource::EXTERNAL);
    EXPECT_EQ(result->hierarchy.country_code, "FR");
    EXPECT_EQ(http_->requests_matching("countrycodes=fr"), 1u);
}

TEST_F(GeocodingResolverTest, SecondCallIsServedFromCache) {
    http_->respond("/search", kParisResponse);
    auto resolver = make_resolver();

    ASSERT_TRUE(resolver.geocode("Paris").has_value());
    ASSERT_TRUE(resolver.geocode("  PARIS ").has_value());

    EXPECT_EQ(http_->request_count(), 1u);
    EXPECT_EQ(resolver.cache_stats().cache_hits, 1u);
}

TEST_F(GeocodingResolverTest, CacheExpiresAfterTtl) {
    http_->respond("/search", kParisResponse);
    auto resolver = make_resolver();

    ASSERT_TRUE(resolver.geocode("Paris").has_value());
    clock_->advance(std::chrono::hours(24));
    ASSERT_TRUE(resolver.geocode("Paris").has_value());

    EXPECT_EQ(http_->request_count(), 2u);
}

TEST_F(GeocodingResolverTest, UseCacheFalseBypassesReadAndWrite) {
    http_->respond("/search", kParisResponse);
    auto resolver = make_resolver();

    GeocodingOptions no_cache;
    no_cache.use_cache = false;

    ASSERT_TRUE(resolver.geocode("Paris", no_cache).has_value());
    ASSERT_TRUE(resolver.geocode("Paris", no_cache).has_value());
    EXPECT_EQ(http_->request_count(), 2u);
    EXPECT_EQ(resolver.cache_stats().entries, 0u);
}

TEST_F(GeocodingResolverTest, FailuresAreNotCached) {
    http_->respond("/search", "[]");
    auto resolver = make_resolver();

    EXPECT_FALSE(resolver.geocode("Atlantis").has_value());
    EXPECT_FALSE(resolver.geocode("Atlantis").has_value());
    EXPECT_EQ(http_->request_count(), 2u);
}

TEST_F(GeocodingResolverTest, BlankInputDoesNoLookup) {
    auto resolver = make_resolver();
    EXPECT_FALSE(resolver.geocode("   ").has_value());
    EXPECT_EQ(http_->request_count(), 0u);
    EXPECT_EQ(resolver.cache_stats().total_requests, 0u);
}

TEST_F(GeocodingResolverTest, UnreachableProviderYieldsNothing) {
    http_->fail("/search");
    auto resolver = make_resolver();
    EXPECT_FALSE(resolver.geocode("Atlantis").has_value());
}

TEST_F(GeocodingResolverTest, SearchUsesStaticStore) {
    auto resolver = make_resolver();
    auto results = resolver.search("köl", 5);
    ASSERT_FALSE(results.empty());
    EXPECT_EQ(results[0].name, "Köln");
    EXPECT_EQ(http_->request_count(), 0u);
}

TEST_F(GeocodingResolverTest, ClearCacheForcesRefetch) {
    http_->respond("/search", kParisResponse);
    auto resolver = make_resolver();

    resolver.geocode("Paris");
    resolver.clear_cache();
    resolver.geocode("Paris");
    EXPECT_EQ(http_->request_count(), 2u);
}
