/**
 * @file LocationStore.cpp
 * @brief Reference place table and its loaders
 */

#include "LocationStore.hpp"
#include "CountryCodes.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <set>
#include <sstream>

using json = nlohmann::json;

namespace locus {

namespace {

LocationRecord make_record(const std::string& name,
                           std::vector<std::string> variants,
                           double lat, double lng,
                           const std::string& region,
                           std::optional<std::string> district,
                           int64_t population,
                           LocationType type,
                           std::vector<std::string> postal_codes) {
    LocationRecord record;
    record.name = name;
    record.name_variants = std::move(variants);
    record.coordinates = GeographicCoordinates(lat, lng);
    record.country = "Germany";
    record.country_code = "DE";
    record.region = region;
    record.district = std::move(district);
    record.population = population;
    record.location_type = type;
    record.postal_codes = std::move(postal_codes);
    return record;
}

std::optional<std::string> optional_string(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_string() && !j[key].get<std::string>().empty()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::vector<std::string> string_array(const json& j, const char* key) {
    std::vector<std::string> values;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& item : j[key]) {
            if (item.is_string()) {
                values.push_back(item.get<std::string>());
            }
        }
    }
    return values;
}

} // namespace

const std::vector<LocationRecord>& default_german_locations() {
    static const std::vector<LocationRecord> locations = {
        make_record("Berlin", {}, 52.5200, 13.4050, "Berlin", std::nullopt, 3669491, LocationType::CITY,
                    {"10115", "10117", "10119"}),
        make_record("Munich", {"München"}, 48.1351, 11.5820, "Bayern", "München", 1488202, LocationType::CITY,
                    {"80331", "80333", "80335"}),
        make_record("Hamburg", {}, 53.5511, 9.9937, "Hamburg", std::nullopt, 1899160, LocationType::CITY,
                    {"20095", "20097", "20099"}),
        make_record("Cologne", {"Köln"}, 50.9375, 6.9603, "Nordrhein-Westfalen", "Köln", 1085664, LocationType::CITY,
                    {"50667", "50668", "50670"}),
        make_record("Frankfurt am Main", {"Frankfurt"}, 50.1109, 8.6821, "Hessen", "Frankfurt am Main", 753056, LocationType::CITY,
                    {"60311", "60313", "60316"}),
        make_record("Stuttgart", {}, 48.7758, 9.1829, "Baden-Württemberg", "Stuttgart", 626275, LocationType::CITY,
                    {"70173", "70174", "70176"}),
        make_record("Düsseldorf", {}, 51.2277, 6.7735, "Nordrhein-Westfalen", "Düsseldorf", 619294, LocationType::CITY,
                    {"40210", "40211", "40212"}),
        make_record("Dortmund", {}, 51.5136, 7.4653, "Nordrhein-Westfalen", "Dortmund", 588250, LocationType::CITY,
                    {"44135", "44137", "44139"}),
        make_record("Essen", {}, 51.4556, 7.0116, "Nordrhein-Westfalen", "Essen", 582760, LocationType::CITY,
                    {"45127", "45128", "45130"}),
        make_record("Leipzig", {}, 51.3397, 12.3731, "Sachsen", "Leipzig", 593145, LocationType::CITY,
                    {"04103", "04105", "04107"}),
        make_record("Bremen", {}, 53.0793, 8.8017, "Bremen", std::nullopt, 569352, LocationType::CITY,
                    {"28195", "28197", "28199"}),
        make_record("Dresden", {}, 51.0504, 13.7373, "Sachsen", "Dresden", 556780, LocationType::CITY,
                    {"01067", "01069", "01097"}),
        make_record("Hannover", {}, 52.3759, 9.7320, "Niedersachsen", "Hannover", 538068, LocationType::CITY,
                    {"30159", "30161", "30163"}),
        make_record("Nuremberg", {"Nürnberg"}, 49.4521, 11.0767, "Bayern", "Nürnberg", 518365, LocationType::CITY,
                    {"90402", "90403", "90408"}),
        make_record("Duisburg", {}, 51.4344, 6.7623, "Nordrhein-Westfalen", "Duisburg", 498590, LocationType::CITY,
                    {"47051", "47053", "47055"}),
        make_record("Reutlingen", {}, 48.4919, 9.2041, "Baden-Württemberg", "Reutlingen", 116456, LocationType::CITY,
                    {"72764", "72766", "72768"}),
        make_record("Tübingen", {}, 48.5216, 9.0576, "Baden-Württemberg", "Tübingen", 91506, LocationType::CITY,
                    {"72070", "72072", "72074"}),
        make_record("Metzingen", {}, 48.5378, 9.2828, "Baden-Württemberg", "Reutlingen", 22204, LocationType::TOWN,
                    {"72555"}),
        make_record("Bad Urach", {}, 48.4947, 9.3969, "Baden-Württemberg", "Reutlingen", 12500, LocationType::TOWN,
                    {"72574"}),
        make_record("Pfullingen", {}, 48.4622, 9.2319, "Baden-Württemberg", "Reutlingen", 18500, LocationType::TOWN,
                    {"72793"}),
        make_record("Eningen unter Achalm", {}, 48.4667, 9.2833, "Baden-Württemberg", "Reutlingen", 11200, LocationType::TOWN,
                    {"72800"}),
        make_record("Karlsruhe", {}, 49.0069, 8.4037, "Baden-Württemberg", "Karlsruhe", 308436, LocationType::CITY,
                    {"76131", "76133", "76135"}),
        make_record("Mannheim", {}, 49.4875, 8.4660, "Baden-Württemberg", "Mannheim", 309370, LocationType::CITY,
                    {"68159", "68161", "68163"}),
        make_record("Freiburg im Breisgau", {"Freiburg"}, 49.0134, 7.8342, "Baden-Württemberg", "Breisgau-Hochschwarzwald", 230241, LocationType::CITY,
                    {"79098", "79100", "79102"}),
        make_record("Heidelberg", {}, 49.3988, 8.6724, "Baden-Württemberg", "Rhein-Neckar-Kreis", 159914, LocationType::CITY,
                    {"69115", "69117", "69120"}),
        make_record("Heilbronn", {}, 49.1427, 9.2109, "Baden-Württemberg", "Heilbronn", 126458, LocationType::CITY,
                    {"74072", "74074", "74076"}),
        make_record("Ulm", {}, 48.3984, 9.9916, "Baden-Württemberg", "Alb-Donau-Kreis", 126329, LocationType::CITY,
                    {"89073", "89075", "89077"}),
        make_record("Pforzheim", {}, 48.8944, 8.6982, "Baden-Württemberg", "Enzkreis", 125542, LocationType::CITY,
                    {"75172", "75173", "75175"}),
        make_record("Konstanz", {}, 47.6779, 9.1732, "Baden-Württemberg", "Konstanz", 85000, LocationType::CITY,
                    {"78462", "78464", "78467"}),
        make_record("Aalen", {}, 48.8374, 10.0933, "Baden-Württemberg", "Ostalbkreis", 68000, LocationType::CITY,
                    {"73430", "73432", "73434"}),
        make_record("Sindelfingen", {}, 48.7144, 9.0003, "Baden-Württemberg", "Böblingen", 64000, LocationType::CITY,
                    {"71063", "71065", "71067"}),
        make_record("Böblingen", {}, 48.6856, 9.0119, "Baden-Württemberg", "Böblingen", 50000, LocationType::CITY,
                    {"71032", "71034"}),
        make_record("Esslingen am Neckar", {"Esslingen"}, 48.7394, 9.3089, "Baden-Württemberg", "Esslingen", 93000, LocationType::CITY,
                    {"73728", "73730", "73732"}),
        make_record("Göppingen", {}, 48.7039, 9.6528, "Baden-Württemberg", "Göppingen", 58000, LocationType::CITY,
                    {"73033", "73035", "73037"}),
        make_record("Schwäbisch Gmünd", {}, 48.7989, 9.7969, "Baden-Württemberg", "Ostalbkreis", 60000, LocationType::CITY,
                    {"73525", "73527", "73529"}),
        make_record("Villingen-Schwenningen", {}, 48.0606, 8.4594, "Baden-Württemberg", "Schwarzwald-Baar-Kreis", 85000, LocationType::CITY,
                    {"78050", "78052", "78054"}),
        make_record("Ravensburg", {}, 47.7817, 9.6128, "Baden-Württemberg", "Ravensburg", 50000, LocationType::CITY,
                    {"88212", "88214", "88216"}),
        make_record("Friedrichshafen", {}, 47.6547, 9.4758, "Baden-Württemberg", "Bodenseekreis", 60000, LocationType::CITY,
                    {"88045", "88046", "88048"}),
        make_record("Augsburg", {}, 48.3705, 10.8978, "Bayern", "Augsburg", 300000, LocationType::CITY,
                    {"86150", "86152", "86154"}),
        make_record("Würzburg", {}, 49.7913, 9.9534, "Bayern", "Würzburg", 128000, LocationType::CITY,
                    {"97070", "97072", "97074"}),
        make_record("Regensburg", {}, 49.0134, 12.1016, "Bayern", "Regensburg", 153000, LocationType::CITY,
                    {"93047", "93049", "93051"}),
        make_record("Ingolstadt", {}, 48.7665, 11.4257, "Bayern", "Ingolstadt", 138000, LocationType::CITY,
                    {"85049", "85051", "85053"}),
        make_record("Fürth", {}, 49.4775, 10.9889, "Bayern", "Fürth", 128000, LocationType::CITY,
                    {"90762", "90763", "90765"}),
        make_record("Erlangen", {}, 49.5897, 11.0047, "Bayern", "Erlangen-Höchstadt", 112000, LocationType::CITY,
                    {"91052", "91054", "91056"}),
        make_record("Bayreuth", {}, 49.9481, 11.5783, "Bayern", "Bayreuth", 75000, LocationType::CITY,
                    {"95444", "95445", "95447"}),
        make_record("Bamberg", {}, 49.8988, 10.9027, "Bayern", "Bamberg", 77000, LocationType::CITY,
                    {"96047", "96049", "96050"}),
        make_record("Aschaffenburg", {}, 49.9769, 9.1503, "Bayern", "Aschaffenburg", 71000, LocationType::CITY,
                    {"63739", "63741", "63743"}),
        make_record("Landshut", {}, 48.5370, 12.1508, "Bayern", "Landshut", 73000, LocationType::CITY,
                    {"84028", "84030", "84032"}),
        make_record("Bonn", {}, 50.7374, 7.0982, "Nordrhein-Westfalen", "Bonn", 330000, LocationType::CITY,
                    {"53111", "53113", "53115"}),
        make_record("Münster", {}, 51.9607, 7.6261, "Nordrhein-Westfalen", "Münster", 315000, LocationType::CITY,
                    {"48143", "48145", "48147"}),
        make_record("Aachen", {}, 50.7753, 6.0839, "Nordrhein-Westfalen", "Aachen", 249000, LocationType::CITY,
                    {"52062", "52064", "52066"}),
        make_record("Bielefeld", {}, 52.0302, 8.5325, "Nordrhein-Westfalen", "Bielefeld", 334000, LocationType::CITY,
                    {"33602", "33604", "33607"}),
        make_record("Wuppertal", {}, 51.2562, 7.1508, "Nordrhein-Westfalen", "Wuppertal", 355000, LocationType::CITY,
                    {"42103", "42105", "42107"}),
        make_record("Gelsenkirchen", {}, 51.5177, 7.0857, "Nordrhein-Westfalen", "Gelsenkirchen", 260000, LocationType::CITY,
                    {"45879", "45881", "45883"}),
        make_record("Bochum", {}, 51.4819, 7.2162, "Nordrhein-Westfalen", "Bochum", 365000, LocationType::CITY,
                    {"44787", "44789", "44791"}),
    };
    return locations;
}

LocationStore::LocationStore(std::vector<LocationRecord> records)
    : records_(std::move(records)) {
}

LocationStore LocationStore::with_default_locations() {
    return LocationStore(default_german_locations());
}

std::optional<LocationStore> LocationStore::load_from_file(const std::string& path) {
    Logger logger("LocationStore");

    std::ifstream file(path);
    if (!file.is_open()) {
        logger.error("Cannot open location file: " + path);
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_json(buffer.str());
}

std::optional<LocationStore> LocationStore::load_from_json(const std::string& json_text) {
    Logger logger("LocationStore");

    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::exception& e) {
        logger.error("JSON parsing error: " + std::string(e.what()));
        return std::nullopt;
    }

    if (!root.is_array()) {
        logger.error("Location file must contain a JSON array");
        return std::nullopt;
    }

    std::vector<LocationRecord> records;
    size_t skipped = 0;

    for (const auto& item : root) {
        try {
            LocationRecord record;
            record.name = item.value("name", "");
            const auto& coords = item.at("coordinates");
            record.coordinates = GeographicCoordinates(coords.at("lat").get<double>(),
                                                       coords.at("lng").get<double>());

            if (record.name.empty() || !record.coordinates.is_valid()) {
                ++skipped;
                continue;
            }

            record.name_variants = string_array(item, "nameVariants");
            record.country_code = item.value("countryCode", "");
            record.country = item.value("country", country_name(record.country_code));
            record.region = item.value("region", "");
            record.district = optional_string(item, "district");
            if (item.contains("population") && item["population"].is_number_integer()) {
                record.population = item["population"].get<int64_t>();
            }
            record.location_type = parse_location_type(item.value("locationType", "city"));
            record.postal_codes = string_array(item, "postalCodes");

            records.push_back(std::move(record));
        } catch (const json::exception& e) {
            logger.debug("Skipping malformed location entry: " + std::string(e.what()));
            ++skipped;
        }
    }

    if (skipped > 0) {
        logger.warning("Skipped " + std::to_string(skipped) + " invalid location entries");
    }
    logger.info("Loaded " + std::to_string(records.size()) + " reference locations");

    return LocationStore(std::move(records));
}

std::vector<std::string> LocationStore::regions() const {
    std::set<std::string> unique;
    for (const auto& record : records_) {
        unique.insert(record.region);
    }
    return std::vector<std::string>(unique.begin(), unique.end());
}

std::vector<LocationRecord> LocationStore::cities_in_region(const std::string& region) const {
    std::vector<LocationRecord> result;
    std::copy_if(records_.begin(), records_.end(), std::back_inserter(result),
        [&region](const LocationRecord& record) { return record.region == region; });

    std::stable_sort(result.begin(), result.end(),
        [](const LocationRecord& a, const LocationRecord& b) {
            return a.population.value_or(0) > b.population.value_or(0);
        });
    return result;
}

std::vector<LocationRecord> LocationStore::find_by_postal_code(const std::string& postal_code) const {
    std::vector<LocationRecord> result;
    for (const auto& record : records_) {
        if (std::find(record.postal_codes.begin(), record.postal_codes.end(), postal_code) !=
            record.postal_codes.end()) {
            result.push_back(record);
        }
    }
    return result;
}

} // namespace locus
