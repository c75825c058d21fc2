#pragma once
// Safety index: advisory 0-10 score per product
//
// Starts at 10 and subtracts per flagged ingredient:
//   irritant      high 2.0, medium 1.0, low 0.5
//   comedogenic   rating >= 4: 1.5, rating 3: 0.5
// Empty ingredient lists score a neutral 5.0.

#include "types.hpp"
#include <algorithm>
#include <cmath>
#include <string>
#include <unordered_map>
#include <vector>

namespace warden {

struct IrritantInfo {
    std::string risk;      // high / medium / low
    std::string concern;
};

struct SafetyScore {
    double score = 5.0;
    std::vector<SafetyFlag> flags;
};

class SafetyIndex {
public:
    SafetyIndex() = default;
    SafetyIndex(std::unordered_map<std::string, IrritantInfo> irritants,
                std::unordered_map<std::string, int> comedogenic)
        : irritants_(std::move(irritants)), comedogenic_(std::move(comedogenic)) {}

    // Built-in tables (src/builtin_tables.cpp)
    static const SafetyIndex& builtin();

    SafetyScore compute(const std::vector<std::string>& ingredients) const {
        SafetyScore result;
        if (ingredients.empty()) return result;

        double score = 10.0;
        for (const auto& ingredient : ingredients) {
            std::string token = normalize(ingredient);

            auto irr = irritants_.find(token);
            if (irr != irritants_.end()) {
                score -= penalty(irr->second.risk);
                SafetyFlag flag;
                flag.ingredient = ingredient;
                flag.kind = SafetyFlag::Kind::Irritant;
                flag.risk = irr->second.risk;
                flag.concern = irr->second.concern;
                result.flags.push_back(std::move(flag));
            }

            auto com = comedogenic_.find(token);
            if (com != comedogenic_.end() && com->second >= 3) {
                score -= com->second >= 4 ? 1.5 : 0.5;
                SafetyFlag flag;
                flag.ingredient = ingredient;
                flag.kind = SafetyFlag::Kind::Comedogenic;
                flag.rating = com->second;
                flag.concern = "comedogenic rating " + std::to_string(com->second) + "/5";
                result.flags.push_back(std::move(flag));
            }
        }

        result.score = std::round(std::clamp(score, 0.0, 10.0) * 10.0) / 10.0;
        return result;
    }

private:
    std::unordered_map<std::string, IrritantInfo> irritants_;
    std::unordered_map<std::string, int> comedogenic_;

    static double penalty(const std::string& risk) {
        if (risk == "high") return 2.0;
        if (risk == "medium") return 1.0;
        return 0.5;
    }
};

} // namespace warden
