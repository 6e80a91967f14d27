/**
 * @file text_match.h
 * @brief voxgate - Small string helpers shared by the keyword classifiers
 */

#ifndef VOXGATE_TEXT_MATCH_H
#define VOXGATE_TEXT_MATCH_H

#include <cstddef>
#include <string>
#include <vector>

namespace voxgate {
namespace util {

std::string to_lower(const std::string& text);

/// Strips leading/trailing whitespace
std::string trim(const std::string& text);

/// Lower-cased and trimmed
std::string normalize(const std::string& text);

/**
 * Finds the first keyword (in list order) contained in an already lower-cased text.
 *
 * @param matched Receives the keyword on a hit (may be nullptr)
 */
bool contains_any(const std::string& lowered_text, const std::vector<std::string>& keywords,
                  std::string* matched = nullptr);

/// True if lowered_text begins with any of the prefixes
bool starts_with_any(const std::string& lowered_text, const std::vector<std::string>& prefixes);

/// Whitespace-separated word count
size_t word_count(const std::string& text);

/// At most max_chars characters of text
std::string truncate(const std::string& text, size_t max_chars);

}  // namespace util
}  // namespace voxgate

#endif  // VOXGATE_TEXT_MATCH_H
