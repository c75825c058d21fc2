#pragma once
// Configuration: JSON file, then environment, then command-line flags
//
//   {
//     "db_path": "~/.warden/warden.db",
//     "constraint_load_policy": "fail_closed",
//     "ontology_path": "", "interactions_path": "", "catalog_path": "",
//     "extraction_delay_ms": 30000,
//     "verbose": false,
//     "llm": {"base_url": "...", "model": "...", "api_key": "", "timeout_ms": 60000}
//   }
//
// Environment: WARDEN_LLM_URL, WARDEN_LLM_MODEL, WARDEN_LLM_API_KEY,
// WARDEN_LLM_TIMEOUT_MS, WARDEN_DB_PATH, WARDEN_CONSTRAINT_POLICY, WARDEN_VERBOSE

#include "http_generator.hpp"
#include "memory_service.hpp"
#include "memory_extractor.hpp"
#include <cstdlib>
#include <fstream>
#include <functional>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace warden {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

inline std::string default_db_path() {
    const char* home = std::getenv("HOME");
    return std::string(home ? home : "/tmp") + "/.warden/warden.db";
}

// "~/x" -> "$HOME/x"
inline std::string expand_home(const std::string& path) {
    if (path.size() < 2 || path[0] != '~' || path[1] != '/') return path;
    const char* home = std::getenv("HOME");
    return std::string(home ? home : "/tmp") + path.substr(1);
}

using EnvLookup = std::function<const char*(const char*)>;

struct Config {
    LlmConfig llm;
    std::string db_path = default_db_path();
    std::string ontology_path;
    std::string interactions_path;
    std::string catalog_path;
    ConstraintLoadPolicy constraint_load_policy = ConstraintLoadPolicy::FailClosed;
    Timestamp extraction_delay_ms = EXTRACTION_DELAY_MS;
    bool verbose = false;

    static Config from_json(const nlohmann::json& doc) {
        if (!doc.is_object()) throw ConfigError("config must be a JSON object");

        Config c;
        try {
            c.db_path = expand_home(doc.value("db_path", c.db_path));
            c.ontology_path = expand_home(doc.value("ontology_path", ""));
            c.interactions_path = expand_home(doc.value("interactions_path", ""));
            c.catalog_path = expand_home(doc.value("catalog_path", ""));
            c.extraction_delay_ms = doc.value("extraction_delay_ms", c.extraction_delay_ms);
            c.verbose = doc.value("verbose", false);
            if (doc.contains("constraint_load_policy")) {
                c.set_policy(doc["constraint_load_policy"].get<std::string>());
            }
            if (doc.contains("llm")) {
                const auto& llm = doc["llm"];
                c.llm.base_url = llm.value("base_url", c.llm.base_url);
                c.llm.model = llm.value("model", c.llm.model);
                c.llm.api_key = llm.value("api_key", c.llm.api_key);
                c.llm.timeout_ms = llm.value("timeout_ms", c.llm.timeout_ms);
                c.llm.temperature = llm.value("temperature", c.llm.temperature);
            }
        } catch (const nlohmann::json::exception& e) {
            throw ConfigError(std::string("invalid config: ") + e.what());
        }
        if (c.llm.timeout_ms <= 0) throw ConfigError("llm.timeout_ms must be positive");
        return c;
    }

    static Config load(const std::string& path) {
        std::ifstream in(path);
        if (!in) throw ConfigError("cannot open config " + path);
        nlohmann::json doc;
        try {
            doc = nlohmann::json::parse(in);
        } catch (const nlohmann::json::parse_error& e) {
            throw ConfigError("cannot parse config " + path + ": " + e.what());
        }
        return from_json(doc);
    }

    void apply_env(const EnvLookup& getenv = [](const char* name) { return std::getenv(name); }) {
        if (const char* v = getenv("WARDEN_LLM_URL")) llm.base_url = v;
        if (const char* v = getenv("WARDEN_LLM_MODEL")) llm.model = v;
        if (const char* v = getenv("WARDEN_LLM_API_KEY")) llm.api_key = v;
        if (const char* v = getenv("WARDEN_LLM_TIMEOUT_MS")) {
            try {
                llm.timeout_ms = std::stol(v);
            } catch (const std::exception&) {
                throw ConfigError(std::string("WARDEN_LLM_TIMEOUT_MS is not a number: ") + v);
            }
            if (llm.timeout_ms <= 0) throw ConfigError("WARDEN_LLM_TIMEOUT_MS must be positive");
        }
        if (const char* v = getenv("WARDEN_DB_PATH")) db_path = expand_home(v);
        if (const char* v = getenv("WARDEN_CONSTRAINT_POLICY")) set_policy(v);
        if (const char* v = getenv("WARDEN_VERBOSE")) {
            std::string s = v;
            verbose = !(s.empty() || s == "0" || s == "false");
        }
    }

    void set_policy(const std::string& name) {
        auto policy = parse_constraint_load_policy(name);
        if (!policy) throw ConfigError("unknown constraint_load_policy: " + name);
        constraint_load_policy = *policy;
    }

    nlohmann::json to_json() const {
        return {
            {"db_path", db_path},
            {"ontology_path", ontology_path},
            {"interactions_path", interactions_path},
            {"catalog_path", catalog_path},
            {"constraint_load_policy", to_string(constraint_load_policy)},
            {"extraction_delay_ms", extraction_delay_ms},
            {"verbose", verbose},
            {"llm", {
                {"base_url", llm.base_url},
                {"model", llm.model},
                {"api_key_set", !llm.api_key.empty()},
                {"timeout_ms", llm.timeout_ms},
                {"temperature", llm.temperature}
            }}
        };
    }
};

} // namespace warden
