// Collector - String Utilities
// String, size and timestamp formatting

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstdint>

namespace collector::utils {

/**
 * @brief String manipulation utilities
 */
class StringUtils {
public:
    // Case conversion
    static std::string toLower(const std::string& str);

    // Splitting and joining
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string join(const std::vector<std::string>& parts, const std::string& separator);

    // Search
    static bool startsWith(const std::string& str, const std::string& prefix);
    static bool endsWith(const std::string& str, const std::string& suffix);

    // Formatting
    static std::string formatBytes(int64_t bytes);
    static std::string formatRate(double bytesPerSecond);

    // ISO-8601 UTC with milliseconds, e.g. 2024-01-02T03:04:05.678Z
    static std::string formatIsoTimestamp(std::chrono::system_clock::time_point time);
    static std::optional<std::chrono::system_clock::time_point> parseIsoTimestamp(const std::string& str);
};

} // namespace collector::utils
