#include "voxgate/util/text_match.h"

#include <cctype>

namespace voxgate {
namespace util {

std::string to_lower(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

std::string trim(const std::string& text) {
    size_t start = 0;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
        ++start;
    }
    size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(start, end - start);
}

std::string normalize(const std::string& text) {
    return to_lower(trim(text));
}

bool contains_any(const std::string& lowered_text, const std::vector<std::string>& keywords,
                  std::string* matched) {
    for (const auto& keyword : keywords) {
        if (!keyword.empty() && lowered_text.find(keyword) != std::string::npos) {
            if (matched != nullptr) {
                *matched = keyword;
            }
            return true;
        }
    }
    return false;
}

bool starts_with_any(const std::string& lowered_text, const std::vector<std::string>& prefixes) {
    for (const auto& prefix : prefixes) {
        if (!prefix.empty() && lowered_text.compare(0, prefix.size(), prefix) == 0) {
            return true;
        }
    }
    return false;
}

size_t word_count(const std::string& text) {
    size_t count = 0;
    bool in_word = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            ++count;
        }
    }
    return count;
}

std::string truncate(const std::string& text, size_t max_chars) {
    if (text.size() <= max_chars) {
        return text;
    }
    return text.substr(0, max_chars);
}

}  // namespace util
}  // namespace voxgate
