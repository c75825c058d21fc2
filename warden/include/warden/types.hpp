#pragma once
// Core types: constraints, matches, vetoes, facts
//
// Everything here is per-user and per-turn. Nothing is shared
// between users except the immutable ontology tables.

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace warden {

// Timestamp as Unix millis
using Timestamp = int64_t;

inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

// Trim + lowercase. The canonical form of every ingredient and allergen token.
inline std::string normalize(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        start++;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        end--;
    }
    std::string result = s.substr(start, end - start);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// ═══════════════════════════════════════════════════════════════════
// Enumerations
// ═══════════════════════════════════════════════════════════════════

enum class Severity : uint8_t {
    Absolute = 0,     // Allergy: never recommend
    High = 1,         // Sensitivity: avoid
    Preference = 2,   // Soft dislike
};

enum class ConstraintSource : uint8_t {
    UserStated = 0,   // Detected in conversation
    UserApi = 1,      // Declared through the profile API
    Migrated = 2,     // Imported from a legacy store
};

enum class MatchType : uint8_t {
    Direct = 0,       // Ingredient equals a declared allergen
    Group = 1,        // Ingredient shares a synonym group with one
};

enum class Gate : uint8_t {
    RuleBased = 0,
    LlmCheck = 1,
};

enum class InteractionSeverity : uint8_t {
    High = 0,
    Medium = 1,
    Low = 2,
};

enum class FactCategory : uint8_t {
    SkinType = 0,
    Age = 1,
    Allergy = 2,
    Sensitivity = 3,
    Preference = 4,
    Aversion = 5,
};

inline std::string to_string(Severity s) {
    switch (s) {
        case Severity::Absolute: return "absolute";
        case Severity::High: return "high";
        case Severity::Preference: return "preference";
    }
    return "absolute";
}

inline std::optional<Severity> parse_severity(const std::string& s) {
    if (s == "absolute") return Severity::Absolute;
    if (s == "high") return Severity::High;
    if (s == "preference") return Severity::Preference;
    return std::nullopt;
}

inline std::string to_string(ConstraintSource s) {
    switch (s) {
        case ConstraintSource::UserStated: return "user_stated";
        case ConstraintSource::UserApi: return "user_api";
        case ConstraintSource::Migrated: return "migrated";
    }
    return "user_stated";
}

inline std::optional<ConstraintSource> parse_constraint_source(const std::string& s) {
    if (s == "user_stated") return ConstraintSource::UserStated;
    if (s == "user_api") return ConstraintSource::UserApi;
    if (s == "migrated") return ConstraintSource::Migrated;
    return std::nullopt;
}

inline std::string to_string(MatchType t) {
    return t == MatchType::Direct ? "direct" : "group";
}

inline std::string to_string(Gate g) {
    return g == Gate::RuleBased ? "rule_based" : "llm_check";
}

inline std::string to_string(InteractionSeverity s) {
    switch (s) {
        case InteractionSeverity::High: return "high";
        case InteractionSeverity::Medium: return "medium";
        case InteractionSeverity::Low: return "low";
    }
    return "low";
}

inline std::optional<InteractionSeverity> parse_interaction_severity(const std::string& s) {
    if (s == "high") return InteractionSeverity::High;
    if (s == "medium") return InteractionSeverity::Medium;
    if (s == "low") return InteractionSeverity::Low;
    return std::nullopt;
}

inline std::string to_string(FactCategory c) {
    switch (c) {
        case FactCategory::SkinType: return "skin_type";
        case FactCategory::Age: return "age";
        case FactCategory::Allergy: return "allergy";
        case FactCategory::Sensitivity: return "sensitivity";
        case FactCategory::Preference: return "preference";
        case FactCategory::Aversion: return "aversion";
    }
    return "preference";
}

inline std::optional<FactCategory> parse_fact_category(const std::string& s) {
    if (s == "skin_type") return FactCategory::SkinType;
    if (s == "age") return FactCategory::Age;
    if (s == "allergy") return FactCategory::Allergy;
    if (s == "sensitivity") return FactCategory::Sensitivity;
    if (s == "preference") return FactCategory::Preference;
    if (s == "aversion") return FactCategory::Aversion;
    return std::nullopt;
}

// ═══════════════════════════════════════════════════════════════════
// Entities
// ═══════════════════════════════════════════════════════════════════

// A user's declared restriction. Never mutated, only superseded or deleted.
struct Constraint {
    std::string ingredient;        // Ingredient or group name, normalized
    Severity severity = Severity::Absolute;
    ConstraintSource source = ConstraintSource::UserStated;
    std::string content;           // "Allergic to parabens"
};

// One ingredient of one candidate hitting one allergen
struct Match {
    std::string ingredient;        // As spelled in the candidate
    std::string allergen;          // Declared allergen (direct) or group name (group)
    MatchType match_type = MatchType::Direct;
};

// A vetoed candidate. Lives for one response only.
struct Violation {
    std::string product;
    Gate gate = Gate::RuleBased;
    std::vector<Match> matches;    // rule_based: every match found
    std::string reason;            // llm_check: the flagged line

    const Match* primary() const {
        return matches.empty() ? nullptr : &matches.front();
    }

    std::string summary() const {
        if (gate == Gate::LlmCheck) return reason;
        std::string out;
        for (const auto& m : matches) {
            if (!out.empty()) out += ", ";
            out += m.ingredient + " (" + m.allergen + ")";
        }
        return out;
    }
};

struct InteractionWarning {
    std::string ingredient_a;
    std::string ingredient_b;
    InteractionSeverity severity = InteractionSeverity::Low;
    std::string label;
    std::string concern;
};

// Advisory finding from the safety index
struct SafetyFlag {
    enum class Kind : uint8_t { Irritant = 0, Comedogenic = 1 };

    std::string ingredient;
    Kind kind = Kind::Irritant;
    std::string risk;              // Irritant: high/medium/low
    int rating = 0;                // Comedogenic: 0-5
    std::string concern;
};

inline std::string to_string(SafetyFlag::Kind k) {
    return k == SafetyFlag::Kind::Irritant ? "irritant" : "comedogenic";
}

// Something the user said about themselves
struct Fact {
    FactCategory category = FactCategory::Preference;
    std::string value;
    std::string source_text;
};

// Unresolved contradiction between a stored fact and a new one
struct PendingConfirmation {
    std::string key;               // Store key of the confirmation itself
    FactCategory category = FactCategory::SkinType;
    std::string old_key;
    std::string old_value;
    std::string new_value;
    Timestamp detected_at = 0;
    int attempts = 0;
    std::string source_quote;
};

// A product proposed by discovery, plus the advisory annotations
// the pipeline attaches to survivors
struct Candidate {
    std::string name;
    std::string brand;
    std::vector<std::string> ingredients;   // Preferred when non-empty
    std::string ingredients_text;           // Raw INCI string otherwise
    std::optional<double> safety_score;

    std::vector<InteractionWarning> interactions;
    std::vector<SafetyFlag> safety_flags;

    std::string display_name() const {
        return name.empty() ? "Unknown" : name;
    }
};

} // namespace warden
