/**
 * @file StaticMatcher.hpp
 * @brief Name matching against the in-memory location store
 */

#pragma once

#include "locus.hpp"
#include "LocationStore.hpp"
#include "Logger.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace locus {

/**
 * @brief Exact / prefix / substring matcher with relevance scoring
 *
 * Pure computation over an immutable store; safe to share across threads.
 */
class StaticMatcher {
public:
    static constexpr size_t MIN_QUERY_LENGTH = 2;

    explicit StaticMatcher(std::shared_ptr<const LocationStore> store);

    /**
     * @brief Autocomplete search
     *
     * Each record is scored against its canonical name and then its
     * variants; the best score wins. Sorted by relevance, then population.
     *
     * @param query Free text; fewer than MIN_QUERY_LENGTH characters yields nothing
     * @param limit Maximum number of rows returned
     */
    std::vector<LocationSearchResult> match(const std::string& query, size_t limit = 10) const;

    /**
     * @brief Single best record for geocoding
     *
     * First exact name/variant match in store order, otherwise the first
     * record containing the query. Confidence 1.0 for exact, 0.8 for partial.
     */
    std::optional<GeocodingResult> best_match(const std::string& query) const;

    /**
     * @brief "city[, district], region"; district omitted when equal to city
     */
    static std::string format_display_name(const LocationHierarchy& hierarchy);

    const LocationStore& store() const { return *store_; }

private:
    std::shared_ptr<const LocationStore> store_;
    Logger logger_;

    struct ScoredName {
        double score = 0.0;
        std::string matched_name;
    };

    std::optional<ScoredName> score_record(const LocationRecord& record,
                                           const std::string& normalized_query) const;
};

} // namespace locus
