#pragma once
// Override detector: catches attempts to talk the concierge out of its
// safety constraints ("show it anyway", "ignore my allergies", ...)
//
// Runs on every inbound message before anything else, and before any
// generative call. A hit short-circuits the whole turn with OVERRIDE_REFUSAL.
// Deterministic on purpose: the generative layer is not trusted to hold
// the line under adversarial pressure.
//
// Patterns are word-boundary anchored and applied to normalized text:
// lowercase, smart quotes straightened, punctuation except apostrophes
// removed, whitespace collapsed.

#include <cctype>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace warden {

inline const char* const OVERRIDE_REFUSAL =
    "I understand you'd like to see those products, but I can't recommend items "
    "containing ingredients you're allergic to. Your safety is my top priority. "
    "I can help you find alternatives that work for your skin without those ingredients.";

enum class OverrideCategory {
    ShowAnyway,          // "show it anyway"
    DisableSafety,       // "bypass the allergy check", "turn off safety filter"
    AcceptRisk,          // "i'll take the risk"
    DontCare,            // "i don't care about allergies"
    DenyAllergy,         // "i don't actually have allergies"
    ShowUnsafe,          // "show the unsafe ones", "everything regardless"
    IncludeBlocked,      // "include the flagged items"
    EraseConstraints,    // "remove my allergies", "forget my allergy"
    PretendNotAllergic,  // "pretend i'm not allergic"
    StopFiltering,       // "stop filtering products"
};

inline const char* category_name(OverrideCategory c) {
    switch (c) {
        case OverrideCategory::ShowAnyway: return "show_anyway";
        case OverrideCategory::DisableSafety: return "disable_safety";
        case OverrideCategory::AcceptRisk: return "accept_risk";
        case OverrideCategory::DontCare: return "dont_care";
        case OverrideCategory::DenyAllergy: return "deny_allergy";
        case OverrideCategory::ShowUnsafe: return "show_unsafe";
        case OverrideCategory::IncludeBlocked: return "include_blocked";
        case OverrideCategory::EraseConstraints: return "erase_constraints";
        case OverrideCategory::PretendNotAllergic: return "pretend_not_allergic";
        case OverrideCategory::StopFiltering: return "stop_filtering";
    }
    return "unknown";
}

struct OverridePattern {
    OverrideCategory category;
    std::regex pattern;
};

class OverrideDetector {
public:
    OverrideDetector() {
        using C = OverrideCategory;
        add(C::ShowAnyway, R"(\b(?:show|give|list|recommend|tell)\b.{0,30}\banyway\b)");

        add(C::DisableSafety, R"(\bignore\b.{0,15}\b(?:allerg|sensitiv))");
        add(C::DisableSafety, R"(\boverride\b.{0,15}\b(?:safety|allerg|filter|check))");
        add(C::DisableSafety, R"(\bbypass\b.{0,15}\b(?:safety|allerg|filter|check))");
        add(C::DisableSafety, R"(\bskip\b.{0,15}\b(?:safety|allerg|filter|check))");
        add(C::DisableSafety, R"(\bdisable\b.{0,15}\b(?:safety|allerg|filter|check))");
        add(C::DisableSafety, R"(\bturn\s+off\b.{0,15}\b(?:safety|allerg|filter|check))");

        add(C::AcceptRisk,
            R"(\b(?:i'?ll|i\s+will|willing\s+to)\b.{0,15}\b(?:take|accept)\b.{0,10}\brisk)");

        add(C::DontCare,
            R"(\bdon'?t\s+care\b.{0,15}\b(?:allerg|safety|sensitiv|ingredient|reaction))");

        add(C::DenyAllergy, R"(\bi\s+(?:don'?t|do\s+not)\s+(?:actually\s+)?have\b.{0,10}\ballerg)");

        add(C::ShowUnsafe, R"(\bshow\b.{0,15}\bunsafe\b)");
        add(C::ShowUnsafe, R"(\bjust\s+give\b.{0,15}\b(?:all|every)\b.{0,10}\bproduct)");
        add(C::ShowUnsafe,
            R"(\b(?:show|give|list)\b.{0,15}\b(?:everything|all)\b.{0,15}\bregardless\b)");

        add(C::IncludeBlocked,
            R"(\b(?:include|add)\b.{0,15}\b(?:unsafe|flagged|blocked|filtered|removed)\b)");

        add(C::EraseConstraints,
            R"(\b(?:remove|delete|clear)\b.{0,15}\b(?:my\s+)?(?:allerg|constraint|restriction|safety\s+(?:filter|check)))");
        add(C::EraseConstraints, R"(\bforget\b.{0,15}\b(?:my\s+)?allerg)");

        add(C::PretendNotAllergic, R"(\bpretend\b.{0,15}\b(?:not\s+allergic|no\s+allerg))");
        add(C::PretendNotAllergic, R"(\bnot\s+(?:really|actually)\s+allergic\b)");

        add(C::StopFiltering, R"(\bstop\b.{0,10}\b(?:filter|block|check|flag))");
    }

    // May throw std::regex_error; callers treat any exception as a refusal
    bool is_override_attempt(const std::string& message) const {
        return matched_category(message).has_value();
    }

    std::optional<OverrideCategory> matched_category(const std::string& message) const {
        std::string text = normalize_message(message);
        for (const auto& p : patterns_) {
            if (std::regex_search(text, p.pattern)) {
                return p.category;
            }
        }
        return std::nullopt;
    }

    size_t pattern_count() const { return patterns_.size(); }

    static std::string normalize_message(const std::string& message) {
        std::string text;
        text.reserve(message.size());

        for (size_t i = 0; i < message.size(); ++i) {
            unsigned char c = static_cast<unsigned char>(message[i]);
            // U+2018/U+2019 -> ', U+201C/U+201D -> "
            if (c == 0xE2 && i + 2 < message.size() &&
                static_cast<unsigned char>(message[i + 1]) == 0x80) {
                unsigned char third = static_cast<unsigned char>(message[i + 2]);
                if (third == 0x98 || third == 0x99) {
                    text += '\'';
                    i += 2;
                    continue;
                }
                if (third == 0x9C || third == 0x9D) {
                    text += '"';
                    i += 2;
                    continue;
                }
            }
            text += static_cast<char>(std::tolower(c));
        }

        text = collapse_whitespace(text);

        // ASCII punctuation only; UTF-8 sequences (non-ASCII letters) pass through
        for (auto& ch : text) {
            unsigned char c = static_cast<unsigned char>(ch);
            if (c < 0x80 && !std::isalnum(c) && c != '_' && c != '\'' && !std::isspace(c)) {
                ch = ' ';
            }
        }

        return collapse_whitespace(text);
    }

private:
    std::vector<OverridePattern> patterns_;

    void add(OverrideCategory category, const char* regex) {
        patterns_.push_back({category, std::regex(regex, std::regex::ECMAScript | std::regex::optimize)});
    }

    static std::string collapse_whitespace(const std::string& s) {
        std::string out;
        out.reserve(s.size());
        bool in_space = false;
        for (char ch : s) {
            if (std::isspace(static_cast<unsigned char>(ch))) {
                in_space = true;
                continue;
            }
            if (in_space && !out.empty()) out += ' ';
            in_space = false;
            out += ch;
        }
        return out;
    }
};

} // namespace warden
