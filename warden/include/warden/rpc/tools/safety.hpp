#pragma once
// Safety tools: override check, allergen expansion and matching,
// ingredient parsing, interactions, safety score, dual-gate filter

#include "../protocol.hpp"
#include "../types.hpp"
#include "../../runtime.hpp"
#include "../../serialize.hpp"
#include <sstream>
#include <unordered_map>

namespace warden::rpc::tools::safety {

using json = nlohmann::json;

// "ingredients" as a list, or a raw INCI string to be parsed
inline std::vector<std::string> ingredients_param(const json& params) {
    if (!params.contains("ingredients")) {
        throw ParamError("Missing required parameter: ingredients");
    }
    if (params["ingredients"].is_string()) {
        return parse_ingredients(params["ingredients"].get<std::string>());
    }
    return string_list(params, "ingredients", true);
}

inline json ingredients_schema() {
    return {
        {"description", "Ingredient list, or a raw comma-separated INCI string"},
        {"oneOf", json::array({
            {{"type", "array"}, {"items", {{"type", "string"}}}},
            {{"type", "string"}}
        })}
    };
}

inline void register_schemas(std::vector<ToolSchema>& tools) {
    tools.push_back({
        "check_override",
        "Check whether a message tries to talk the assistant out of enforcing safety "
        "constraints. Returns the fixed refusal when it does.",
        {
            {"type", "object"},
            {"properties", {
                {"message", {{"type", "string"}, {"description", "User message"}}}
            }},
            {"required", {"message"}}
        }
    });

    tools.push_back({
        "expand_allergens",
        "Expand allergens through the synonym ontology: a group name yields all members, "
        "a member yields its group and all siblings.",
        {
            {"type", "object"},
            {"properties", {
                {"allergens", {{"type", "array"}, {"items", {{"type", "string"}}}}}
            }},
            {"required", {"allergens"}}
        }
    });

    tools.push_back({
        "match_allergens",
        "Find ingredients that equal or share a synonym group with a declared allergen.",
        {
            {"type", "object"},
            {"properties", {
                {"ingredients", ingredients_schema()},
                {"allergens", {{"type", "array"}, {"items", {{"type", "string"}}}}}
            }},
            {"required", {"ingredients", "allergens"}}
        }
    });

    tools.push_back({
        "parse_ingredients",
        "Split a raw INCI ingredient string into normalized ingredient names.",
        {
            {"type", "object"},
            {"properties", {
                {"text", {{"type", "string"}, {"description", "Raw ingredient string"}}}
            }},
            {"required", {"text"}}
        }
    });

    tools.push_back({
        "find_interactions",
        "List known problematic ingredient combinations within one product.",
        {
            {"type", "object"},
            {"properties", {
                {"ingredients", ingredients_schema()}
            }},
            {"required", {"ingredients"}}
        }
    });

    tools.push_back({
        "safety_score",
        "Advisory 0-10 safety score with irritant and comedogenic flags.",
        {
            {"type", "object"},
            {"properties", {
                {"ingredients", ingredients_schema()}
            }},
            {"required", {"ingredients"}}
        }
    });

    tools.push_back({
        "filter_candidates",
        "Run the dual-gate safety filter over candidate products. Constraints are expanded "
        "through the ontology first.",
        {
            {"type", "object"},
            {"properties", {
                {"candidates", {{"type", "array"}, {"items", {{"type", "object"}}},
                               {"description", "Products: {name, brand, ingredients}"}}},
                {"constraints", {{"type", "array"}, {"items", {{"type", "string"}}}}},
                {"llm_check", {{"type", "boolean"}, {"default", true},
                              {"description", "Run the generative second gate when configured"}}}
            }},
            {"required", {"candidates", "constraints"}}
        }
    });
}

inline ToolResult check_override(Runtime& rt, const json& params) {
    std::string message = require_string(params, "message");
    bool refused = rt.pipeline().is_refused(message);

    json result = {{"override", refused}};
    if (refused) {
        if (auto category = rt.detector().matched_category(message)) {
            result["category"] = category_name(*category);
        }
        result["refusal"] = OVERRIDE_REFUSAL;
        return ToolResult::ok(OVERRIDE_REFUSAL, result);
    }
    return ToolResult::ok("No override attempt detected", result);
}

inline ToolResult expand_allergens(Runtime& rt, const json& params) {
    auto allergens = string_list(params, "allergens", true);
    auto expanded = rt.ontology().expand(allergens);

    std::ostringstream ss;
    ss << allergens.size() << " allergen(s) expand to " << expanded.size() << ":";
    for (const auto& token : expanded) ss << " " << token;
    return ToolResult::ok(ss.str(), {{"expanded", expanded}});
}

inline ToolResult match_allergens(Runtime& rt, const json& params) {
    auto ingredients = ingredients_param(params);
    auto allergens = string_list(params, "allergens", true);
    auto matches = rt.ontology().find_allergen_matches(ingredients, allergens);

    if (matches.empty()) {
        return ToolResult::ok("No allergen matches", {{"matches", json::array()}});
    }
    std::ostringstream ss;
    ss << matches.size() << " match(es):";
    for (const auto& m : matches) {
        ss << "\n- " << m.ingredient << " -> " << m.allergen << " (" << to_string(m.match_type) << ")";
    }
    return ToolResult::ok(ss.str(), {{"matches", matches}});
}

inline ToolResult parse(Runtime&, const json& params) {
    auto ingredients = parse_ingredients(require_string(params, "text"));
    std::ostringstream ss;
    for (size_t i = 0; i < ingredients.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << ingredients[i];
    }
    return ToolResult::ok(ss.str(), {{"ingredients", ingredients}});
}

inline ToolResult find_interactions(Runtime& rt, const json& params) {
    auto warnings = rt.interactions().find_interactions(ingredients_param(params));
    if (warnings.empty()) {
        return ToolResult::ok("No known interactions", {{"interactions", json::array()}});
    }
    std::ostringstream ss;
    for (const auto& w : warnings) {
        ss << "[" << to_string(w.severity) << "] " << w.label << " (" << w.ingredient_a
           << " + " << w.ingredient_b << "): " << w.concern << "\n";
    }
    return ToolResult::ok(ss.str(), {{"interactions", warnings}});
}

inline ToolResult safety_score(Runtime& rt, const json& params) {
    SafetyScore score = rt.safety().compute(ingredients_param(params));
    std::ostringstream ss;
    ss << "Safety score " << score.score << "/10";
    for (const auto& f : score.flags) {
        ss << "\n- " << f.ingredient << " (" << to_string(f.kind) << "): " << f.concern;
    }
    return ToolResult::ok(ss.str(), {{"score", score.score}, {"flags", score.flags}});
}

inline ToolResult filter_candidates(Runtime& rt, const json& params) {
    if (!params.contains("candidates") || !params["candidates"].is_array()) {
        throw ParamError("Missing required parameter: candidates");
    }
    std::vector<Candidate> candidates;
    for (const auto& item : params["candidates"]) {
        if (!item.is_object()) throw ParamError("Each candidate must be an object");
        candidates.push_back(item.get<Candidate>());
    }
    auto expanded = rt.ontology().expand(string_list(params, "constraints", true));
    std::vector<std::string> constraints(expanded.begin(), expanded.end());

    TextGenerator* generator = params.value("llm_check", true) ? rt.generator() : nullptr;
    DualGateFilter filter(rt.ontology(), generator);
    FilterResult result = filter.apply(candidates, constraints);

    std::ostringstream ss;
    ss << result.survivors.size() << " of " << candidates.size() << " candidate(s) passed";
    for (const auto& v : result.violations) {
        ss << "\n- vetoed " << v.product << " [" << to_string(v.gate) << "]: " << v.summary();
    }
    if (result.all_vetoed) ss << "\nAll candidates were vetoed";

    return ToolResult::ok(ss.str(), {
        {"survivors", result.survivors},
        {"violations", result.violations},
        {"all_vetoed", result.all_vetoed},
        {"llm_check_ran", result.llm_check_ran},
        {"llm_check_failed", result.llm_check_failed}
    });
}

inline void register_handlers(Runtime& rt, std::unordered_map<std::string, ToolHandler>& handlers) {
    handlers["check_override"] = [&rt](const json& p) { return check_override(rt, p); };
    handlers["expand_allergens"] = [&rt](const json& p) { return expand_allergens(rt, p); };
    handlers["match_allergens"] = [&rt](const json& p) { return match_allergens(rt, p); };
    handlers["parse_ingredients"] = [&rt](const json& p) { return parse(rt, p); };
    handlers["find_interactions"] = [&rt](const json& p) { return find_interactions(rt, p); };
    handlers["safety_score"] = [&rt](const json& p) { return safety_score(rt, p); };
    handlers["filter_candidates"] = [&rt](const json& p) { return filter_candidates(rt, p); };
}

} // namespace warden::rpc::tools::safety
