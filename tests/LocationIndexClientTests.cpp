#include "LocationIndexClient.hpp"
#include "FakeHttpClient.hpp"

#include <gtest/gtest.h>

#include <memory>

using namespace locus;
using locus::test::FakeHttpClient;

TEST(LocationIndexClientParse, ReadsPrimaryFieldNames) {
    auto outcome = LocationIndexClient::parse_results(R"({"results": [{
        "id": "r1", "name": "Tübingen", "city": "Tübingen", "postalCode": "72070",
        "region": "Baden-Württemberg", "district": "Landkreis Tübingen", "countryCode": "de",
        "coordinates": {"lat": 48.52, "lng": 9.05}, "confidence": 0.95, "relevanceScore": 0.7
    }]})");

    ASSERT_TRUE(outcome.is_ok());
    ASSERT_EQ(outcome.value().size(), 1u);
    const IndexRow& row = outcome.value()[0];
    EXPECT_EQ(row.id, "r1");
    EXPECT_EQ(row.city, "Tübingen");
    EXPECT_EQ(row.postal_code, "72070");
    EXPECT_EQ(row.region, "Baden-Württemberg");
    ASSERT_TRUE(row.district.has_value());
    EXPECT_EQ(*row.district, "Landkreis Tübingen");
    EXPECT_EQ(row.country_code, "DE");
    EXPECT_DOUBLE_EQ(row.coordinates.lat, 48.52);
    EXPECT_DOUBLE_EQ(row.coordinates.lng, 9.05);
    EXPECT_DOUBLE_EQ(row.confidence.value(), 0.95);
    EXPECT_DOUBLE_EQ(row.relevance_score.value(), 0.7);
}

TEST(LocationIndexClientParse, AcceptsAlternativeFieldNames) {
    auto outcome = LocationIndexClient::parse_results(R"({"results": [{
        "id": 42, "name": "Reutlingen", "postal_code": "72764",
        "admin_name1": "Baden-Württemberg", "admin_name2": "Reutlingen", "country": "DE",
        "coordinates": {"latitude": 48.49, "longitude": 9.21}, "relevanceScore": 0.6
    }]})");

    ASSERT_TRUE(outcome.is_ok());
    ASSERT_EQ(outcome.value().size(), 1u);
    const IndexRow& row = outcome.value()[0];
    EXPECT_EQ(row.id, "42");
    EXPECT_EQ(row.city, "Reutlingen");
    EXPECT_EQ(row.postal_code, "72764");
    EXPECT_EQ(row.region, "Baden-Württemberg");
    EXPECT_EQ(row.district.value_or(""), "Reutlingen");
    EXPECT_EQ(row.country_code, "DE");
    EXPECT_DOUBLE_EQ(row.coordinates.lat, 48.49);
    EXPECT_DOUBLE_EQ(row.confidence.value(), 0.6);
}

TEST(LocationIndexClientParse, DropsRowsWithoutUsableCoordinates) {
    auto outcome = LocationIndexClient::parse_results(R"({"results": [
        {"name": "NoCoords", "postalCode": "1"},
        {"name": "HalfCoords", "coordinates": {"lat": 1.0}},
        {"name": "StringCoords", "coordinates": {"lat": "1.0", "lng": "2.0"}},
        "not an object",
        {"name": "Good", "coordinates": {"lat": 1.0, "lon": 2.0}}
    ]})");

    ASSERT_TRUE(outcome.is_ok());
    ASSERT_EQ(outcome.value().size(), 1u);
    EXPECT_EQ(outcome.value()[0].name, "Good");
    EXPECT_DOUBLE_EQ(outcome.value()[0].coordinates.lng, 2.0);
    EXPECT_FALSE(outcome.value()[0].district.has_value());
    EXPECT_FALSE(outcome.value()[0].confidence.has_value());
}

TEST(LocationIndexClientParse, EmptyResultsIsSuccess) {
    auto outcome = LocationIndexClient::parse_results(R"({"results": []})");
    ASSERT_TRUE(outcome.is_ok());
    EXPECT_TRUE(outcome.value().empty());
}

TEST(LocationIndexClientParse, RejectsBodiesWithoutResultsArray) {
    EXPECT_EQ(LocationIndexClient::parse_results("[]").error(), ErrorKind::MALFORMED_UPSTREAM_DATA);
    EXPECT_EQ(LocationIndexClient::parse_results(R"({"results": {}})").error(),
              ErrorKind::MALFORMED_UPSTREAM_DATA);
    EXPECT_EQ(LocationIndexClient::parse_results("<html>").error(), ErrorKind::MALFORMED_UPSTREAM_DATA);
}

TEST(LocationIndexClientRequests, NearbyBuildsQueryString) {
    auto http = std::make_shared<FakeHttpClient>();
    http->respond("/locations/nearby", R"({"results": []})");
    LocationIndexClient client(http, "http://index.local/api/");

    auto outcome = client.nearby(GeographicCoordinates(48.5, 9.0), 25.0, "DE", 13);
    ASSERT_TRUE(outcome.is_ok());
    ASSERT_EQ(http->request_count(), 1u);
    EXPECT_EQ(http->requests()[0],
              "http://index.local/api/locations/nearby?lat=48.5&lng=9&radius=25&country=DE&limit=13");
}

TEST(LocationIndexClientRequests, LookupEndpointsCarryTheirKey) {
    auto http = std::make_shared<FakeHttpClient>();
    http->respond("/locations/", R"({"results": []})");
    LocationIndexClient client(http, "http://index.local/api");

    EXPECT_TRUE(client.postal_lookup("72070", "DE", 8).is_ok());
    EXPECT_TRUE(client.city_lookup("Bad Urach", "DE", 8).is_ok());
    EXPECT_TRUE(client.region_lookup("Bayern", "DE", 50).is_ok());

    EXPECT_EQ(http->requests_matching("/locations/postal-lookup?postal_code=72070&country=DE&limit=8"), 1u);
    EXPECT_EQ(http->requests_matching("/locations/city-lookup?city=Bad+Urach&country=DE&limit=8"), 1u);
    EXPECT_EQ(http->requests_matching("/locations/region-lookup?region=Bayern&country=DE&limit=50"), 1u);
}

TEST(LocationIndexClientRequests, HttpErrorIsUpstreamUnavailable) {
    auto http = std::make_shared<FakeHttpClient>();
    http->respond("/locations/nearby", "oops", 500);
    LocationIndexClient client(http, "http://index.local/api");

    auto outcome = client.nearby(GeographicCoordinates(0, 0), 5.0, "IT", 1);
    ASSERT_FALSE(outcome.is_ok());
    EXPECT_EQ(outcome.error(), ErrorKind::UPSTREAM_UNAVAILABLE);
    EXPECT_EQ(outcome.reason(), "HTTP 500");
}

TEST(LocationIndexClientRequests, TransportErrorKeepsMessage) {
    auto http = std::make_shared<FakeHttpClient>();
    http->fail("/locations/", "Connection refused");
    LocationIndexClient client(http, "http://index.local/api");

    auto outcome = client.city_lookup("Ulm", "DE", 8);
    ASSERT_FALSE(outcome.is_ok());
    EXPECT_EQ(outcome.error(), ErrorKind::UPSTREAM_UNAVAILABLE);
    EXPECT_EQ(outcome.reason(), "Connection refused");
}
