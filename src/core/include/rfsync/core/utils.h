#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace rfsync {
namespace core {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Formats a time point in ISO 8601 format
 *
 * @param tp The time point to format
 * @return std::string The formatted string (YYYY-MM-DDThh:mm:ss.sssZ)
 */
std::string formatIsoTimestamp(Timestamp tp);

/**
 * @brief Gets the current timestamp in ISO 8601 format
 */
std::string getIsoTimestamp();

/**
 * @brief Parses a string value into a boolean
 *
 * @param value The string to parse
 * @return bool The parsed boolean value
 */
bool parseBoolean(const std::string& value);

/**
 * @brief Namespace containing string manipulation utilities
 */
namespace string_utils {

std::string trim(const std::string& str);
std::string toLower(const std::string& str);
std::string toUpper(const std::string& str);
std::vector<std::string> split(const std::string& str, char delimiter);
std::string join(const std::vector<std::string>& parts, const std::string& separator);

/**
 * @brief Parses an ISO 8601 formatted UTC timestamp string into a time_point
 *
 * @throws std::invalid_argument if the string is not a valid timestamp
 */
Timestamp parseIsoTimestamp(const std::string& timestamp);

/**
 * @brief Canonicalizes a MAC address to lower-case colon separated form
 *
 * Accepts colon, dash and dot separated as well as bare hex notations.
 *
 * @return std::nullopt when the input does not contain exactly 12 hex digits
 */
std::optional<std::string> normalizeMac(const std::string& mac);

} // namespace string_utils

} // namespace core
} // namespace rfsync
