#pragma once
// Generative text service: the opaque model behind Gate 2, intent
// classification and background fact extraction.
//
// Implementations must be callable from several turns at once and must
// bound every call; a call that fails or runs out of time throws
// GenerationError.

#include <stdexcept>
#include <string>
#include <vector>

namespace warden {

class GenerationError : public std::runtime_error {
public:
    explicit GenerationError(const std::string& what) : std::runtime_error(what) {}
};

struct ChatMessage {
    std::string role;      // "user" or "assistant"
    std::string content;
};

class TextGenerator {
public:
    virtual ~TextGenerator() = default;

    virtual std::string generate(const std::string& system_prompt,
                                 const std::vector<ChatMessage>& messages) = 0;
};

} // namespace warden
