#pragma once
// Ingredient interaction analyzer: incompatible actives within one product
//
// Each rule pairs two ingredient groups. A product containing any member of
// both groups gets one advisory warning per rule label. Rules are directional
// as written: "Benzoyl Peroxide + Vitamin C" is its own entry with its own
// concern text, and nothing here mirrors a rule into the reverse direction.
// asymmetric_pairs() lists the rules that have no reverse counterpart.
//
// Advisory only. This never vetoes a candidate.

#include "types.hpp"
#include <nlohmann/json.hpp>
#include "ontology.hpp"  // OntologyError
#include <fstream>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace warden {

struct InteractionRule {
    std::vector<std::string> group_a;
    std::vector<std::string> group_b;
    InteractionSeverity severity = InteractionSeverity::Low;
    std::string label;
    std::string concern;
};

class InteractionTable {
public:
    InteractionTable() = default;

    InteractionTable(int version, std::vector<InteractionRule> rules)
        : version_(version), rules_(std::move(rules)) {
        for (auto& rule : rules_) {
            if (rule.label.empty()) {
                throw OntologyError("interaction rule without label");
            }
            if (rule.group_a.empty() || rule.group_b.empty()) {
                throw OntologyError("interaction rule '" + rule.label + "' has an empty group");
            }
            for (auto& m : rule.group_a) m = normalize(m);
            for (auto& m : rule.group_b) m = normalize(m);
        }
    }

    // Built-in table (src/builtin_tables.cpp)
    static const InteractionTable& builtin();

    static InteractionTable from_json(const nlohmann::json& doc) {
        if (!doc.is_object() || !doc.contains("interactions") || !doc["interactions"].is_array()) {
            throw OntologyError("interaction resource needs an 'interactions' array");
        }
        std::vector<InteractionRule> rules;
        for (const auto& entry : doc["interactions"]) {
            InteractionRule rule;
            try {
                rule.group_a = entry.at("group_a").get<std::vector<std::string>>();
                rule.group_b = entry.at("group_b").get<std::vector<std::string>>();
                rule.label = entry.at("label").get<std::string>();
                rule.concern = entry.value("concern", "");
                std::string severity = entry.at("severity").get<std::string>();
                auto parsed = parse_interaction_severity(severity);
                if (!parsed) {
                    throw OntologyError("invalid severity '" + severity + "' in '" + rule.label + "'");
                }
                rule.severity = *parsed;
            } catch (const nlohmann::json::exception& e) {
                throw OntologyError(std::string("malformed interaction rule: ") + e.what());
            }
            rules.push_back(std::move(rule));
        }
        return InteractionTable(doc.value("version", 0), std::move(rules));
    }

    static InteractionTable load(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            throw OntologyError("cannot open interaction resource: " + path);
        }
        try {
            return from_json(nlohmann::json::parse(in));
        } catch (const nlohmann::json::parse_error& e) {
            throw OntologyError("invalid interaction resource " + path + ": " + e.what());
        }
    }

    nlohmann::json to_json() const {
        nlohmann::json entries = nlohmann::json::array();
        for (const auto& rule : rules_) {
            entries.push_back({
                {"group_a", rule.group_a},
                {"group_b", rule.group_b},
                {"severity", to_string(rule.severity)},
                {"label", rule.label},
                {"concern", rule.concern}
            });
        }
        return {{"version", version_}, {"interactions", entries}};
    }

    int version() const { return version_; }
    const std::vector<InteractionRule>& rules() const { return rules_; }

    std::vector<InteractionWarning> find_interactions(const std::vector<std::string>& ingredients) const {
        // normalized -> spelling in the product (last spelling wins)
        std::unordered_map<std::string, std::string> present;
        for (const auto& ingredient : ingredients) {
            present[normalize(ingredient)] = ingredient;
        }

        std::vector<InteractionWarning> warnings;
        std::unordered_set<std::string> seen_labels;

        for (const auto& rule : rules_) {
            const std::string* match_a = first_present(rule.group_a, present);
            if (!match_a) continue;
            const std::string* match_b = first_present(rule.group_b, present);
            if (!match_b) continue;

            // Same rule reached through different aliases
            if (!seen_labels.insert(rule.label).second) continue;

            warnings.push_back({*match_a, *match_b, rule.severity, rule.label, rule.concern});
        }

        return warnings;
    }

    // Labels of rules whose reverse direction (some member of group_b
    // paired with some member of group_a) has no rule of its own
    std::vector<std::string> asymmetric_pairs() const {
        std::vector<std::string> labels;
        for (const auto& rule : rules_) {
            bool mirrored = false;
            for (const auto& other : rules_) {
                if (&other == &rule) continue;
                if (overlaps(other.group_a, rule.group_b) && overlaps(other.group_b, rule.group_a)) {
                    mirrored = true;
                    break;
                }
            }
            if (!mirrored) labels.push_back(rule.label);
        }
        return labels;
    }

private:
    int version_ = 0;
    std::vector<InteractionRule> rules_;

    static const std::string* first_present(
            const std::vector<std::string>& group,
            const std::unordered_map<std::string, std::string>& present) {
        for (const auto& member : group) {
            auto it = present.find(member);
            if (it != present.end()) return &it->second;
        }
        return nullptr;
    }

    static bool overlaps(const std::vector<std::string>& a, const std::vector<std::string>& b) {
        for (const auto& x : a) {
            for (const auto& y : b) {
                if (x == y) return true;
            }
        }
        return false;
    }
};

} // namespace warden
