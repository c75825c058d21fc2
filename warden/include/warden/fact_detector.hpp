#pragma once
// Fact detector: explicit self-statements in a user message
//
//   "I'm 34"                    -> age: 34
//   "my skin is oily"           -> skin_type: oily
//   "I'm allergic to parabens." -> allergy: parabens
//
// Each pattern contributes at most its first match. Matching runs on the
// lowercased message, so values come back lowercase.

#include "types.hpp"
#include <regex>
#include <string>
#include <vector>

namespace warden {

class FactDetector {
public:
    FactDetector() {
        add(R"(\bi(?:'m| am) (\d+)\b)", FactCategory::Age);
        add(R"(\bmy skin (?:is|type is) (\w+))", FactCategory::SkinType);
        add(R"(\bi have (\w+) skin\b)", FactCategory::SkinType);
        add(R"(\bi(?:'m| am) allergic to (.+?)(?:\.|,|$))", FactCategory::Allergy);
        add(R"(\bi have (?:an? )?allergy to (.+?)(?:\.|,|$))", FactCategory::Allergy);
        add(R"(\bi(?:'m| am) sensitive to (.+?)(?:\.|,|$))", FactCategory::Sensitivity);
        add(R"(\bi prefer (.+?)(?:\.|,|$))", FactCategory::Preference);
        add(R"(\bi like (.+?)(?:\.|,|!|$))", FactCategory::Preference);
        add(R"(\bi don'?t like (.+?)(?:\.|,|!|$))", FactCategory::Aversion);
    }

    std::vector<Fact> detect(const std::string& text) const {
        std::vector<Fact> facts;
        std::string lower = text;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        for (const auto& [pattern, category] : patterns_) {
            std::smatch match;
            if (!std::regex_search(lower, match, pattern)) continue;
            std::string value = normalize(match[1].str());
            if (value.empty()) continue;
            facts.push_back({category, value, text});
        }
        return facts;
    }

private:
    std::vector<std::pair<std::regex, FactCategory>> patterns_;

    void add(const char* regex, FactCategory category) {
        patterns_.emplace_back(std::regex(regex, std::regex::ECMAScript | std::regex::optimize),
                               category);
    }
};

} // namespace warden
