/**
 * @file LocationStore.hpp
 * @brief Read-only in-memory table of curated places
 *
 * Loaded once at startup (built-in German dataset or a JSON file) and never
 * mutated afterwards, so concurrent readers need no locking.
 */

#pragma once

#include "locus.hpp"
#include "Logger.hpp"

#include <optional>
#include <string>
#include <vector>

namespace locus {

class LocationStore {
public:
    LocationStore() = default;
    explicit LocationStore(std::vector<LocationRecord> records);

    /**
     * @brief Store populated with the built-in German reference places
     */
    static LocationStore with_default_locations();

    /**
     * @brief Load records from a JSON array file
     *
     * Each element follows the record layout:
     * { "name", "nameVariants"[], "coordinates": {"lat","lng"}, "country",
     *   "countryCode", "region", "district", "population", "locationType",
     *   "postalCodes"[] }
     * Elements with missing names or out-of-range coordinates are skipped.
     *
     * @return Store, or nullopt when the file cannot be read or parsed
     */
    static std::optional<LocationStore> load_from_file(const std::string& path);

    /**
     * @brief Parse records from JSON text; same rules as load_from_file
     */
    static std::optional<LocationStore> load_from_json(const std::string& json_text);

    const std::vector<LocationRecord>& records() const { return records_; }
    size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

    /**
     * @brief Sorted distinct region names
     */
    std::vector<std::string> regions() const;

    /**
     * @brief Records of one region, most populous first
     */
    std::vector<LocationRecord> cities_in_region(const std::string& region) const;

    /**
     * @brief Records listing the given postal code
     */
    std::vector<LocationRecord> find_by_postal_code(const std::string& postal_code) const;

private:
    std::vector<LocationRecord> records_;
};

/**
 * @brief Built-in reference places (major German cities and towns)
 */
const std::vector<LocationRecord>& default_german_locations();

} // namespace locus
