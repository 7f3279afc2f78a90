/**
 * @file string_utils.hpp
 * @brief String manipulation and payload encoding utilities
 *
 * Provides the small set of string helpers used across the execution pipeline:
 * trimming, case folding, splitting and joining, plus Base64 and data-URI
 * encoding for moving binary artifacts across the sandbox boundary.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

namespace codecell {
namespace utils {

/**
 * @class StringUtils
 * @brief String utilities for request payloads and runtime output
 *
 * Provides static methods for:
 * - String manipulation (trim, split, join, case conversion)
 * - Prefix/suffix/substring checks
 * - Base64 encoding/decoding (OpenSSL EVP backed)
 * - Data-URI wrapping of binary artifacts
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * // Wrap bytes read from a sandbox artifact for JSON transport
 * std::string uri = StringUtils::ToDataUri(file_bytes);
 * // "data:application/octet-stream;base64,...."
 *
 * // Decode an uploaded payload
 * if (StringUtils::HasBase64Marker(content)) {
 *     std::string bytes = StringUtils::DecodeDataUri(content);
 * }
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * String Manipulation
     ***************************************************************************/

    /**
     * @brief Trim whitespace from both ends of string
     * @param str Input string
     * @return Trimmed string
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Convert string to lowercase
     * @param str Input string
     * @return Lowercase string
     */
    static std::string ToLower(const std::string& str);

    /**
     * @brief Split string by delimiter
     *
     * @param str Input string
     * @param delimiter Character to split on
     * @return Vector of substrings (empty fields preserved)
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /**
     * @brief Join strings with delimiter
     *
     * @param strings Vector of strings to join
     * @param delimiter Separator string
     * @return Joined string
     */
    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);

    /***************************************************************************
     * String Checking
     ***************************************************************************/

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool EndsWith(const std::string& str, const std::string& suffix);
    static bool Contains(const std::string& str, const std::string& substring);

    /***************************************************************************
     * Encoding and Decoding
     ***************************************************************************/

    /**
     * @brief Encode bytes to Base64 (standard alphabet, padded)
     * @param bytes Raw bytes
     * @return Base64-encoded string
     */
    static std::string ToBase64(const std::string& bytes);

    /**
     * @brief Decode Base64 string
     *
     * Whitespace (line breaks from wrapped encoders) is ignored. Padding is
     * required, as is the standard alphabet.
     *
     * @param base64 Base64-encoded string
     * @return Decoded bytes
     *
     * @throws std::invalid_argument if base64 string is malformed
     */
    static std::string FromBase64(const std::string& base64);

    /**
     * @brief Check whether content carries the ";base64," data-URI marker
     * @param content Upload content
     * @return true if content must be decoded as binary
     */
    static bool HasBase64Marker(const std::string& content);

    /**
     * @brief Wrap bytes as a base64 data URI
     *
     * @param bytes Raw bytes
     * @param mime_type MIME type placed in the URI header
     * @return "data:<mime_type>;base64,<payload>"
     */
    static std::string ToDataUri(const std::string& bytes,
                                 const std::string& mime_type = "application/octet-stream");

    /**
     * @brief Decode the payload that follows the ";base64," marker
     *
     * @param content Content containing the marker
     * @return Decoded bytes
     *
     * @throws std::invalid_argument if the marker is missing or payload is malformed
     */
    static std::string DecodeDataUri(const std::string& content);
};

} // namespace utils
} // namespace codecell
