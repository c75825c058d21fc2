#pragma once
// HTTP generator: OpenAI-compatible /chat/completions client over libcurl
//
// Every request is bounded by timeout_ms (connect + transfer). Transport
// errors, non-2xx statuses and malformed bodies all surface as
// GenerationError so callers apply one failure policy.

#include "generator.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace warden {

struct LlmConfig {
    std::string base_url = "https://openrouter.ai/api/v1";
    std::string model = "anthropic/claude-sonnet-4";
    std::string api_key;
    long timeout_ms = 60000;
    double temperature = 0.0;
};

class HttpGenerator : public TextGenerator {
public:
    explicit HttpGenerator(LlmConfig config);

    std::string generate(const std::string& system_prompt,
                         const std::vector<ChatMessage>& messages) override;

    const LlmConfig& config() const { return config_; }

    // Wire format, exposed for tests
    static nlohmann::json build_request(const LlmConfig& config,
                                        const std::string& system_prompt,
                                        const std::vector<ChatMessage>& messages);
    static std::string parse_response(const std::string& body);

private:
    LlmConfig config_;
    std::string endpoint_;
};

} // namespace warden
