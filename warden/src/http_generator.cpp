#include <warden/http_generator.hpp>
#include <warden/log.hpp>

#include <curl/curl.h>

#include <mutex>
#include <sstream>

namespace warden {

namespace {

// curl_global_init is not thread-safe; run it exactly once per process
void ensure_curl_global() {
    static std::once_flag once;
    static CURLcode init_code = CURLE_OK;
    std::call_once(once, [] { init_code = curl_global_init(CURL_GLOBAL_DEFAULT); });
    if (init_code != CURLE_OK) {
        throw GenerationError("curl_global_init failed");
    }
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    auto* buffer = static_cast<std::string*>(userdata);
    buffer->append(ptr, total);
    return total;
}

struct CurlHandle {
    CURL* handle = curl_easy_init();
    struct curl_slist* headers = nullptr;

    ~CurlHandle() {
        if (headers) curl_slist_free_all(headers);
        if (handle) curl_easy_cleanup(handle);
    }
};

} // namespace

HttpGenerator::HttpGenerator(LlmConfig config)
    : config_(std::move(config)) {
    endpoint_ = config_.base_url;
    while (!endpoint_.empty() && endpoint_.back() == '/') endpoint_.pop_back();
    endpoint_ += "/chat/completions";
}

nlohmann::json HttpGenerator::build_request(const LlmConfig& config,
                                            const std::string& system_prompt,
                                            const std::vector<ChatMessage>& messages) {
    nlohmann::json wire = nlohmann::json::array();
    if (!system_prompt.empty()) {
        wire.push_back({{"role", "system"}, {"content", system_prompt}});
    }
    for (const auto& m : messages) {
        wire.push_back({{"role", m.role}, {"content", m.content}});
    }
    return {
        {"model", config.model},
        {"messages", wire},
        {"temperature", config.temperature}
    };
}

std::string HttpGenerator::parse_response(const std::string& body) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw GenerationError(std::string("unparseable completion: ") + e.what());
    }

    if (doc.contains("error")) {
        const auto& err = doc["error"];
        std::string message = err.is_object() ? err.value("message", err.dump()) : err.dump();
        throw GenerationError("completion error: " + message);
    }

    const auto choices = doc.find("choices");
    if (choices == doc.end() || !choices->is_array() || choices->empty()) {
        throw GenerationError("completion has no choices");
    }
    const auto& message = (*choices)[0].value("message", nlohmann::json::object());
    const auto content = message.find("content");
    if (content == message.end() || !content->is_string()) {
        throw GenerationError("completion has no text content");
    }
    return content->get<std::string>();
}

std::string HttpGenerator::generate(const std::string& system_prompt,
                                    const std::vector<ChatMessage>& messages) {
    ensure_curl_global();

    CurlHandle curl;
    if (!curl.handle) {
        throw GenerationError("curl_easy_init failed");
    }

    const std::string body = build_request(config_, system_prompt, messages).dump();
    std::string response;

    curl_easy_setopt(curl.handle, CURLOPT_URL, endpoint_.c_str());
    curl_easy_setopt(curl.handle, CURLOPT_POST, 1L);
    curl_easy_setopt(curl.handle, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl.handle, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.handle, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl.handle, CURLOPT_TIMEOUT_MS, config_.timeout_ms);
    curl_easy_setopt(curl.handle, CURLOPT_CONNECTTIMEOUT_MS, config_.timeout_ms);
    curl_easy_setopt(curl.handle, CURLOPT_NOSIGNAL, 1L);

    curl.headers = curl_slist_append(curl.headers, "Content-Type: application/json");
    if (!config_.api_key.empty()) {
        const std::string auth = "Authorization: Bearer " + config_.api_key;
        curl.headers = curl_slist_append(curl.headers, auth.c_str());
    }
    curl_easy_setopt(curl.handle, CURLOPT_HTTPHEADER, curl.headers);

    const CURLcode code = curl_easy_perform(curl.handle);
    if (code != CURLE_OK) {
        std::ostringstream oss;
        oss << "POST " << endpoint_ << " failed: " << curl_easy_strerror(code);
        throw GenerationError(oss.str());
    }

    long status = 0;
    curl_easy_getinfo(curl.handle, CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        std::ostringstream oss;
        oss << "POST " << endpoint_ << " returned HTTP " << status;
        throw GenerationError(oss.str());
    }

    log::debug("llm", "completion received (%zu bytes)", response.size());
    return parse_response(response);
}

} // namespace warden
