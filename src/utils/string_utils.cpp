/**
 * @file string_utils.cpp
 * @brief Implementation of string manipulation and payload encoding utilities
 *
 * Base64 work is delegated to OpenSSL's EVP block codec. Input validation is
 * done up front so that malformed uploads are rejected with a precise reason
 * instead of silently decoding to garbage.
 *
 * **Data URI format**:
 * ```
 * data:application/octet-stream;base64,SGVsbG8=
 * ```
 *
 * @date 2025
 */

#include "codecell/utils/string_utils.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace codecell {
namespace utils {

namespace {

constexpr const char* kBase64Marker = ";base64,";

bool IsBase64Char(unsigned char c) {
    return std::isalnum(c) || c == '+' || c == '/';
}

} // anonymous namespace

// ============================================================================
// STRING MANIPULATION
// ============================================================================

std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream stream(str);

    while (std::getline(stream, current, delimiter)) {
        parts.push_back(current);
    }

    return parts;
}

std::string StringUtils::Join(const std::vector<std::string>& strings,
                             const std::string& delimiter) {
    if (strings.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << strings[0];

    for (std::size_t i = 1; i < strings.size(); ++i) {
        oss << delimiter << strings[i];
    }

    return oss.str();
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::EndsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

// ============================================================================
// BASE64
// ============================================================================

std::string StringUtils::ToBase64(const std::string& bytes) {
    if (bytes.empty()) {
        return "";
    }

    // EVP_EncodeBlock writes 4 output chars per 3 input bytes plus a NUL
    std::string result(4 * ((bytes.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&result[0]),
                                  reinterpret_cast<const unsigned char*>(bytes.data()),
                                  static_cast<int>(bytes.size()));
    result.resize(static_cast<std::size_t>(written));
    return result;
}

std::string StringUtils::FromBase64(const std::string& base64) {
    std::string compact;
    compact.reserve(base64.size());
    for (unsigned char c : base64) {
        if (!std::isspace(c)) {
            compact.push_back(static_cast<char>(c));
        }
    }

    if (compact.empty()) {
        return "";
    }

    if (compact.size() % 4 != 0) {
        throw std::invalid_argument("Invalid base64 payload: length is not a multiple of 4");
    }

    std::size_t padding = 0;
    for (std::size_t i = 0; i < compact.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(compact[i]);
        if (c == '=') {
            // Padding is only legal in the final two positions
            if (i + 2 < compact.size()) {
                throw std::invalid_argument("Invalid base64 payload: misplaced padding");
            }
            ++padding;
        } else if (padding > 0 || !IsBase64Char(c)) {
            throw std::invalid_argument("Invalid base64 payload: unexpected character");
        }
    }

    std::string result(compact.size() / 4 * 3, '\0');
    int decoded = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&result[0]),
                                  reinterpret_cast<const unsigned char*>(compact.data()),
                                  static_cast<int>(compact.size()));
    if (decoded < 0) {
        throw std::invalid_argument("Invalid base64 payload");
    }

    // EVP_DecodeBlock counts padding as zero bytes
    result.resize(static_cast<std::size_t>(decoded) - padding);
    return result;
}

// ============================================================================
// DATA URIs
// ============================================================================

bool StringUtils::HasBase64Marker(const std::string& content) {
    return Contains(content, kBase64Marker);
}

std::string StringUtils::ToDataUri(const std::string& bytes, const std::string& mime_type) {
    return "data:" + mime_type + kBase64Marker + ToBase64(bytes);
}

std::string StringUtils::DecodeDataUri(const std::string& content) {
    auto marker = content.find(kBase64Marker);
    if (marker == std::string::npos) {
        throw std::invalid_argument("Content has no base64 marker");
    }

    return FromBase64(content.substr(marker + std::char_traits<char>::length(kBase64Marker)));
}

} // namespace utils
} // namespace codecell
