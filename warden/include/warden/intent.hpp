#pragma once
// Intent classification for one user message
//
// The generative service gets a fixed triage prompt and must answer with
// a bare intent name. Anything it says that is not a known routable intent,
// and any failure to answer at all, lands on general_chat.

#include "generator.hpp"
#include "log.hpp"
#include "types.hpp"
#include <optional>
#include <string>

namespace warden {

enum class Intent : uint8_t {
    ProductSearch = 0,
    IngredientCheck = 1,
    RoutineAdvice = 2,
    GeneralChat = 3,
    MemoryQuery = 4,
    Unrecognized = 5,
};

inline std::string to_string(Intent i) {
    switch (i) {
        case Intent::ProductSearch: return "product_search";
        case Intent::IngredientCheck: return "ingredient_check";
        case Intent::RoutineAdvice: return "routine_advice";
        case Intent::GeneralChat: return "general_chat";
        case Intent::MemoryQuery: return "memory_query";
        case Intent::Unrecognized: return "unrecognized";
    }
    return "unrecognized";
}

// Unknown labels map to Unrecognized, never to nullopt
inline Intent parse_intent(const std::string& label) {
    const std::string s = normalize(label);
    if (s == "product_search") return Intent::ProductSearch;
    if (s == "ingredient_check") return Intent::IngredientCheck;
    if (s == "routine_advice") return Intent::RoutineAdvice;
    if (s == "general_chat") return Intent::GeneralChat;
    if (s == "memory_query") return Intent::MemoryQuery;
    return Intent::Unrecognized;
}

inline const char* const TRIAGE_SYSTEM_PROMPT =
    "You are a triage router for an AI beauty and skincare concierge.\n"
    "Classify the user's message into exactly one intent.\n"
    "\n"
    "Intents:\n"
    "- product_search: User wants product recommendations or is looking for specific products\n"
    "- ingredient_check: User asks about specific ingredients, safety, or compatibility\n"
    "- routine_advice: User wants skincare routine help, ordering, or regimen advice\n"
    "- general_chat: Greetings, thanks, off-topic, or general conversation\n"
    "\n"
    "Respond with ONLY the intent name, nothing else.";

class IntentClassifier {
public:
    // generator may be null: everything is then general_chat
    explicit IntentClassifier(TextGenerator* generator) : generator_(generator) {}

    Intent classify(const std::string& message) const {
        if (!generator_ || message.empty()) return Intent::GeneralChat;

        std::string raw;
        try {
            raw = generator_->generate(TRIAGE_SYSTEM_PROMPT, {{"user", message}});
        } catch (const std::exception& e) {
            log::warn("triage", "Intent classification failed, defaulting to general_chat: %s",
                      e.what());
            return Intent::GeneralChat;
        }

        Intent intent = parse_intent(raw);
        if (intent == Intent::Unrecognized) {
            log::warn("triage", "Unknown intent '%s', defaulting to general_chat",
                      normalize(raw).c_str());
            return Intent::GeneralChat;
        }
        return intent;
    }

private:
    TextGenerator* generator_;
};

} // namespace warden
