/**
 * MatBridge - Path and name utilities
 *
 * Small string helpers shared by the extractor, parsers and tables.
 */

#pragma once

#include <string>
#include <string_view>
#include <algorithm>
#include <cctype>

namespace matbridge {

/**
 * Lowercase an ASCII string.
 */
inline std::string to_lower(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

/**
 * Trim ASCII whitespace from both ends.
 */
inline std::string_view trim(std::string_view text) {
    size_t start = 0;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) start++;
    size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) end--;
    return text.substr(start, end - start);
}

/**
 * Normalize path separators to forward slashes.
 */
inline std::string normalize_separators(std::string_view path) {
    std::string result(path);
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

/**
 * Final component of a slash or backslash separated path.
 */
inline std::string path_basename(std::string_view path) {
    std::string normalized = normalize_separators(path);
    size_t pos = normalized.rfind('/');
    if (pos == std::string::npos) return normalized;
    return normalized.substr(pos + 1);
}

/**
 * Basename without its last extension.
 */
inline std::string path_stem(std::string_view path) {
    std::string base = path_basename(path);
    size_t dot = base.rfind('.');
    if (dot == std::string::npos || dot == 0) return base;
    return base.substr(0, dot);
}

/**
 * Lowercase extension of a slash separated path, including the dot.
 */
inline std::string extension_lower(std::string_view path) {
    std::string base = path_basename(path);
    size_t dot = base.rfind('.');
    if (dot == std::string::npos || dot == 0) return "";
    return to_lower(base.substr(dot));
}

/**
 * Check if text ends with suffix (case-insensitive).
 */
inline bool ends_with_ci(std::string_view text, std::string_view suffix) {
    if (suffix.size() > text.size()) return false;
    return to_lower(text.substr(text.size() - suffix.size())) == to_lower(suffix);
}

/**
 * Case-insensitive substring test.
 */
inline bool contains_ci(std::string_view text, std::string_view needle) {
    return to_lower(text).find(to_lower(needle)) != std::string::npos;
}

/**
 * Key used to compare Unity property names: leading underscores dropped,
 * lowercase. "_Albedo_Map" and "albedo_map" compare equal.
 */
inline std::string property_key(std::string_view name) {
    size_t start = 0;
    while (start < name.size() && name[start] == '_') start++;
    return to_lower(name.substr(start));
}

} // namespace matbridge
