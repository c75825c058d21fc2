#pragma once
// JSON conversions for the core types (nlohmann ADL hooks)
//
// Store values, tool arguments and tool results all go through these.
// Readers are lenient about missing optional fields; a missing required
// field throws nlohmann::json::out_of_range.

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace warden {

using json = nlohmann::json;

// ── Constraint ─────────────────────────────────────────────────────

inline void to_json(json& j, const Constraint& c) {
    j = {
        {"ingredient", c.ingredient},
        {"severity", to_string(c.severity)},
        {"source", to_string(c.source)},
        {"content", c.content}
    };
}

inline void from_json(const json& j, Constraint& c) {
    c.ingredient = j.at("ingredient").get<std::string>();
    c.severity = parse_severity(j.value("severity", "absolute")).value_or(Severity::Absolute);
    c.source = parse_constraint_source(j.value("source", "user_stated"))
                   .value_or(ConstraintSource::UserStated);
    c.content = j.value("content", "");
}

// ── Match / Violation ──────────────────────────────────────────────

inline void to_json(json& j, const Match& m) {
    j = {
        {"ingredient", m.ingredient},
        {"allergen", m.allergen},
        {"match_type", to_string(m.match_type)}
    };
}

inline void from_json(const json& j, Match& m) {
    m.ingredient = j.at("ingredient").get<std::string>();
    m.allergen = j.at("allergen").get<std::string>();
    m.match_type = j.value("match_type", "direct") == "group" ? MatchType::Group : MatchType::Direct;
}

inline void to_json(json& j, const Violation& v) {
    j = {
        {"product", v.product},
        {"gate", to_string(v.gate)}
    };
    if (v.gate == Gate::RuleBased) {
        j["matches"] = v.matches;
    } else {
        j["reason"] = v.reason;
    }
}

// ── Advisory annotations ───────────────────────────────────────────

inline void to_json(json& j, const InteractionWarning& w) {
    j = {
        {"ingredient_a", w.ingredient_a},
        {"ingredient_b", w.ingredient_b},
        {"severity", to_string(w.severity)},
        {"label", w.label},
        {"concern", w.concern}
    };
}

inline void to_json(json& j, const SafetyFlag& f) {
    j = {
        {"ingredient", f.ingredient},
        {"kind", to_string(f.kind)},
        {"concern", f.concern}
    };
    if (f.kind == SafetyFlag::Kind::Irritant) {
        j["risk"] = f.risk;
    } else {
        j["rating"] = f.rating;
    }
}

// ── Candidate ──────────────────────────────────────────────────────

inline void to_json(json& j, const Candidate& c) {
    j = {
        {"name", c.name},
        {"brand", c.brand},
        {"ingredients", c.ingredients}
    };
    if (!c.ingredients_text.empty()) j["ingredients_text"] = c.ingredients_text;
    if (c.safety_score) j["safety_score"] = *c.safety_score;
    if (!c.interactions.empty()) j["interactions"] = c.interactions;
    if (!c.safety_flags.empty()) j["safety_flags"] = c.safety_flags;
}

// "ingredients" may be a list or a raw INCI string
inline void from_json(const json& j, Candidate& c) {
    c.name = j.value("name", "");
    c.brand = j.value("brand", "");
    c.ingredients.clear();
    c.ingredients_text.clear();
    if (j.contains("ingredients")) {
        const auto& ing = j["ingredients"];
        if (ing.is_string()) {
            c.ingredients_text = ing.get<std::string>();
        } else if (ing.is_array()) {
            c.ingredients = ing.get<std::vector<std::string>>();
        }
    }
    if (c.ingredients_text.empty()) c.ingredients_text = j.value("ingredients_text", "");
    if (j.contains("safety_score") && j["safety_score"].is_number()) {
        c.safety_score = j["safety_score"].get<double>();
    }
}

// ── Facts ──────────────────────────────────────────────────────────

inline void to_json(json& j, const Fact& f) {
    j = {
        {"category", to_string(f.category)},
        {"value", f.value},
        {"content", to_string(f.category) + ": " + f.value}
    };
    if (!f.source_text.empty()) j["source_text"] = f.source_text;
}

inline void from_json(const json& j, Fact& f) {
    auto category = parse_fact_category(j.value("category", ""));
    if (!category) {
        throw std::invalid_argument("unknown fact category: " + j.value("category", ""));
    }
    f.category = *category;
    f.value = j.value("value", "");
    f.source_text = j.value("source_text", "");
}

// Store layout of a confirmation; the key lives outside the value
inline void to_json(json& j, const PendingConfirmation& p) {
    j = {
        {"category", to_string(p.category)},
        {"old_key", p.old_key},
        {"old_value", p.old_value},
        {"new_value", p.new_value},
        {"detected_at", p.detected_at},
        {"attempts", p.attempts},
        {"source_message", p.source_quote}
    };
}

inline void from_json(const json& j, PendingConfirmation& p) {
    p.category = parse_fact_category(j.value("category", "")).value_or(FactCategory::SkinType);
    p.old_key = j.value("old_key", "");
    p.old_value = j.value("old_value", "");
    p.new_value = j.value("new_value", "");
    p.detected_at = j.value("detected_at", Timestamp{0});
    p.attempts = j.value("attempts", 0);
    p.source_quote = j.value("source_message", "");
}

} // namespace warden
