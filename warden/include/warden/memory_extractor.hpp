#pragma once
// Background memory extraction over a finished conversation
//
// The generative service reads the transcript and answers one fact per
// line as "category: value". Lines with an unknown category are dropped.
// Facts are stored through the MemoryService, so allergies still become
// constraints and skin_type/age still go through conflict detection.

#include "extraction_queue.hpp"
#include "generator.hpp"
#include "log.hpp"
#include "memory_service.hpp"
#include "types.hpp"
#include <sstream>
#include <string>
#include <vector>

namespace warden {

// Default delay before a conversation is processed (user may reconnect)
constexpr Timestamp EXTRACTION_DELAY_MS = 30000;

inline const char* const EXTRACTION_INSTRUCTIONS =
    "Extract noteworthy facts the user stated about themselves in this beauty consultation.\n"
    "\n"
    "Answer with one fact per line, formatted as <category>: <value>\n"
    "Categories: skin_type, age, allergy, sensitivity, preference, aversion\n"
    "\n"
    "Extract skin type, age, ingredient allergies and sensitivities, and texture, format or\n"
    "brand preferences and aversions.\n"
    "Do not extract one-time search queries, transient shopping context, conversational\n"
    "filler, or anything the assistant said.\n"
    "If there is nothing to extract, answer NONE.";

inline std::vector<Fact> parse_extracted_facts(const std::string& response,
                                               const std::string& source) {
    std::vector<Fact> facts;
    std::istringstream lines(response);
    std::string line;
    while (std::getline(lines, line)) {
        std::string text = normalize(line);
        if (!text.empty() && (text[0] == '-' || text[0] == '*')) text = normalize(text.substr(1));

        size_t colon = text.find(':');
        if (colon == std::string::npos) continue;

        auto category = parse_fact_category(normalize(text.substr(0, colon)));
        std::string value = normalize(text.substr(colon + 1));
        if (!category || value.empty()) continue;
        facts.push_back({*category, value, source});
    }
    return facts;
}

class MemoryExtractor {
public:
    MemoryExtractor(TextGenerator& generator, MemoryService& memory)
        : generator_(generator), memory_(memory) {}

    // Throws GenerationError or StoreError; the queue retries later
    size_t extract(const std::string& user_id, const std::vector<ChatMessage>& conversation) {
        std::ostringstream transcript;
        for (const auto& m : conversation) {
            transcript << m.role << ": " << m.content << "\n";
        }

        std::string response = generator_.generate(EXTRACTION_INSTRUCTIONS,
                                                   {{"user", transcript.str()}});
        auto facts = parse_extracted_facts(response, "background_extraction");
        memory_.store_facts(user_id, facts);
        log::info("extract", "Stored %zu facts for %s from %zu messages",
                  facts.size(), user_id.c_str(), conversation.size());
        return facts.size();
    }

    // Idempotent per conversation_id
    CancellationToken schedule(ExtractionQueue& queue,
                               const std::string& conversation_id,
                               const std::string& user_id,
                               std::vector<ChatMessage> conversation,
                               Timestamp at = now(),
                               Timestamp delay_ms = EXTRACTION_DELAY_MS) {
        return queue.schedule(conversation_id, at + delay_ms,
            [this, user_id, conversation = std::move(conversation)] {
                extract(user_id, conversation);
            });
    }

private:
    TextGenerator& generator_;
    MemoryService& memory_;
};

} // namespace warden
