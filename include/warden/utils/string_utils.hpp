/**
 * @file string_utils.hpp
 * @brief String manipulation helpers shared across backends
 *
 * Small, allocation-friendly helpers for trimming, splitting, joining and
 * parsing the human-friendly quantities that appear in sandbox policies
 * ("512m", "1.5g").
 *
 * @date 2025
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace warden {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string utilities
 */
class StringUtils {
public:
    /**
     * @brief Trim leading and trailing whitespace
     * @param str Input string
     * @return Trimmed copy
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Convert to lowercase (ASCII)
     * @param str Input string
     * @return Lowercased copy
     */
    static std::string ToLower(const std::string& str);

    /**
     * @brief Split string by delimiter
     * @param str Input string
     * @param delimiter Separator character
     * @return Tokens, empty tokens skipped
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /**
     * @brief Join strings with delimiter
     */
    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool Contains(const std::string& str, const std::string& substring);

    /**
     * @brief Cut a string to at most max_length bytes
     * @param str Input string
     * @param max_length Maximum length in bytes, suffix included
     * @param suffix Marker appended when truncation happens
     * @return Original string or truncated copy
     */
    static std::string Truncate(const std::string& str, std::size_t max_length,
                                const std::string& suffix = "");

    /**
     * @brief Parse a byte quantity
     *
     * Accepts a plain integer (bytes) or a number followed by a unit:
     * b, k/kb, m/mb, g/gb, t/tb (powers of 1024, case-insensitive).
     * Fractions are allowed with a unit ("1.5g").
     *
     * @param text Quantity text
     * @return Byte count, or nullopt if the text is not a valid quantity
     */
    static std::optional<std::uint64_t> ParseByteSize(const std::string& text);

    /**
     * @brief Format a byte count for logs ("512.00 MB")
     */
    static std::string FormatSize(std::uint64_t bytes);
};

} // namespace utils
} // namespace warden
