#pragma once
// Ingredient parser: raw INCI text -> normalized tokens
//
//   "Aqua, Parfum (Fragrance, Linalool), Methylparaben [0.2%]"
//     -> {"aqua", "parfum (fragrance, linalool)", "methylparaben"}

#include "types.hpp"
#include <cctype>
#include <string>
#include <vector>

namespace warden {

namespace detail {

// A comma splits unless a ')' follows before any '(' does
inline bool comma_inside_parens(const std::string& text, size_t comma) {
    for (size_t i = comma + 1; i < text.size(); ++i) {
        if (text[i] == '(') return false;
        if (text[i] == ')') return true;
    }
    return false;
}

inline std::string strip_brackets(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        if (s[i] == '[') {
            size_t close = s.find(']', i + 1);
            if (close != std::string::npos) {
                i = close + 1;
                continue;
            }
        }
        out += s[i];
        ++i;
    }
    return out;
}

// "1. water" / "2) glycerin" -> "water" / "glycerin"
inline std::string strip_numbering(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    if (i == 0 || i >= s.size() || (s[i] != '.' && s[i] != ')')) return s;
    ++i;
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    return s.substr(i);
}

inline std::string strip_chars(const std::string& s, const char* chars) {
    size_t start = s.find_first_not_of(chars);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(chars);
    return s.substr(start, end - start + 1);
}

} // namespace detail

inline std::string normalize_ingredient(const std::string& name) {
    return normalize(name);
}

inline std::vector<std::string> parse_ingredients(const std::string& text) {
    std::vector<std::string> ingredients;
    if (text.empty()) return ingredients;

    std::vector<std::string> raw;
    size_t start = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == ',' && !detail::comma_inside_parens(text, i)) {
            raw.push_back(text.substr(start, i - start));
            start = i + 1;
        }
    }
    raw.push_back(text.substr(start));

    for (const auto& item : raw) {
        std::string cleaned = normalize(item);
        cleaned = detail::strip_brackets(cleaned);
        cleaned = detail::strip_numbering(cleaned);
        cleaned = detail::strip_chars(cleaned, " .");
        if (cleaned.size() > 1) {
            ingredients.push_back(cleaned);
        }
    }
    return ingredients;
}

// A candidate's ingredients as a list, tokenizing the raw text if needed
inline std::vector<std::string> ingredient_list(const Candidate& candidate) {
    if (!candidate.ingredients.empty()) return candidate.ingredients;
    return parse_ingredients(candidate.ingredients_text);
}

} // namespace warden
