#include "rfsync/core/utils.h"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace rfsync {
namespace core {

std::string formatIsoTimestamp(Timestamp tp) {
    auto itt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm = {};
    gmtime_r(&itt, &tm);

    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      tp.time_since_epoch())
                      .count() %
                  1000;
    if (millis < 0) {
        millis += 1000;
    }

    std::ostringstream ss;
    ss << std::put_time(&tm, "%FT%T.") << std::setfill('0') << std::setw(3)
       << millis << "Z";
    return ss.str();
}

std::string getIsoTimestamp() {
    return formatIsoTimestamp(std::chrono::system_clock::now());
}

bool parseBoolean(const std::string& value) {
    std::string lowerValue = string_utils::toLower(string_utils::trim(value));
    return lowerValue == "true" || lowerValue == "yes" || lowerValue == "1" ||
           lowerValue == "on";
}

namespace string_utils {

std::string trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });

    auto end = std::find_if_not(str.rbegin(), str.rend(), [](unsigned char c) {
                   return std::isspace(c);
               }).base();

    return (start < end) ? std::string(start, end) : std::string();
}

std::string toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string toUpper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return result;
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string item;

    while (std::getline(ss, item, delimiter)) {
        tokens.push_back(item);
    }

    return tokens;
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += parts[i];
    }
    return result;
}

Timestamp parseIsoTimestamp(const std::string& timestamp) {
    static const std::regex iso8601Pattern(
        R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}(?:\.(\d{1,3}))?Z)");
    std::smatch matches;
    if (!std::regex_match(timestamp, matches, iso8601Pattern)) {
        throw std::invalid_argument("Invalid ISO 8601 timestamp format: " +
                                    timestamp);
    }

    std::tm tm = {};
    std::stringstream ss(timestamp.substr(0, 19));
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        throw std::invalid_argument("Failed to parse timestamp: " + timestamp);
    }

    auto timepoint = std::chrono::system_clock::from_time_t(timegm(&tm));

    if (matches.size() > 1 && matches[1].matched) {
        std::string msStr = matches[1].str();
        msStr.resize(3, '0');
        timepoint += std::chrono::milliseconds(std::stoi(msStr));
    }

    return timepoint;
}

std::optional<std::string> normalizeMac(const std::string& mac) {
    std::string hex;
    for (unsigned char c : mac) {
        if (std::isxdigit(c)) {
            hex.push_back(static_cast<char>(std::tolower(c)));
        } else if (c != ':' && c != '-' && c != '.' && !std::isspace(c)) {
            return std::nullopt;
        }
    }

    if (hex.size() != 12) {
        return std::nullopt;
    }

    std::string result;
    for (size_t i = 0; i < hex.size(); i += 2) {
        if (!result.empty()) {
            result.push_back(':');
        }
        result.append(hex, i, 2);
    }
    return result;
}

} // namespace string_utils

} // namespace core
} // namespace rfsync
