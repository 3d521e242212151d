/**
 * @file StringUtils.hpp
 * @brief Text normalization helpers used by matching and request building
 */

#pragma once

#include <string>
#include <vector>

namespace locus {

/**
 * @brief Strip leading and trailing whitespace
 */
std::string trim(const std::string& value);

/**
 * @brief Lower-case ASCII and UTF-8 encoded Latin-1 capitals (Ä, Ö, Ü, ...)
 *
 * Place names in the reference data are German/European; folding the
 * Latin-1 supplement keeps "MÜNCHEN" and "münchen" equal.
 */
std::string to_lower(const std::string& value);

std::string to_upper_ascii(const std::string& value);

/**
 * @brief trim() followed by to_lower()
 */
std::string normalize_query(const std::string& value);

bool contains(const std::string& haystack, const std::string& needle);
bool starts_with(const std::string& value, const std::string& prefix);

/**
 * @brief Percent-encode a query parameter value (spaces become '+')
 */
std::string url_encode(const std::string& value);

/**
 * @brief Join with a separator
 */
std::string join(const std::vector<std::string>& parts, const std::string& separator);

} // namespace locus
