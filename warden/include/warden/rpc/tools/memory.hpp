#pragma once
// Memory tools: fact detection, constraints, pending confirmations,
// conflict resolution, and the full per-turn pipeline

#include "../protocol.hpp"
#include "../types.hpp"
#include "../../runtime.hpp"
#include "../../serialize.hpp"
#include <sstream>
#include <unordered_map>

namespace warden::rpc::tools::memory {

using json = nlohmann::json;

inline json user_schema(json properties, std::vector<std::string> required) {
    properties["user_id"] = {{"type", "string"}, {"description", "User identifier"}};
    required.insert(required.begin(), "user_id");
    return {
        {"type", "object"},
        {"properties", properties},
        {"required", required}
    };
}

inline void register_schemas(std::vector<ToolSchema>& tools) {
    tools.push_back({
        "detect_facts",
        "Detect explicit self-statements (age, skin type, allergy, sensitivity, preference, "
        "aversion) in a message. With store=true and a user_id, persist them.",
        {
            {"type", "object"},
            {"properties", {
                {"message", {{"type", "string"}}},
                {"user_id", {{"type", "string"}}},
                {"store", {{"type", "boolean"}, {"default", false}}}
            }},
            {"required", {"message"}}
        }
    });

    tools.push_back({
        "add_constraint",
        "Declare an allergy (absolute), sensitivity (high) or soft dislike (preference).",
        user_schema({
            {"ingredient", {{"type", "string"}}},
            {"severity", {{"type", "string"}, {"enum", {"absolute", "high", "preference"}},
                         {"default", "absolute"}}}
        }, {"ingredient"})
    });

    tools.push_back({
        "list_constraints",
        "List a user's stored constraints.",
        user_schema(json::object(), {})
    });

    tools.push_back({
        "remove_constraint",
        "Remove a user's constraint on an ingredient.",
        user_schema({{"ingredient", {{"type", "string"}}}}, {"ingredient"})
    });

    tools.push_back({
        "pending_confirmations",
        "List unresolved contradictions between stored and newly stated facts, with the "
        "prompt block the response would carry. Listing does not count as surfacing.",
        user_schema(json::object(), {})
    });

    tools.push_back({
        "resolve_conflict",
        "Resolve a pending confirmation: accept_new, keep_both or ignore.",
        user_schema({
            {"key", {{"type", "string"}, {"description", "Confirmation key"}}},
            {"resolution", {{"type", "string"}, {"enum", {"accept_new", "keep_both", "ignore"}}}}
        }, {"key", "resolution"})
    });

    tools.push_back({
        "process_turn",
        "Run one conversational turn through the safety pipeline and return the merged "
        "response context.",
        user_schema({
            {"message", {{"type", "string"}}},
            {"constraints", {{"type", "array"}, {"items", {{"type", "string"}}},
                            {"description", "Extra constraints for this turn"}}},
            {"conversation_id", {{"type", "string"},
                                {"description", "Enables delayed background extraction"}}}
        }, {"message"})
    });
}

inline ToolResult detect_facts(Runtime& rt, const json& params) {
    std::string message = require_string(params, "message");
    auto facts = FactDetector().detect(message);

    json result = {{"facts", facts}};
    std::ostringstream ss;
    ss << facts.size() << " fact(s) detected";
    for (const auto& f : facts) ss << "\n- " << to_string(f.category) << ": " << f.value;

    if (params.value("store", false)) {
        std::string user_id = require_string(params, "user_id");
        auto notifications = rt.memory().store_facts(user_id, facts);
        result["notifications"] = notifications;
        for (const auto& n : notifications) ss << "\n" << n;
    }
    return ToolResult::ok(ss.str(), result);
}

inline ToolResult add_constraint(Runtime& rt, const json& params) {
    std::string user_id = require_string(params, "user_id");
    Constraint c;
    c.ingredient = require_string(params, "ingredient");
    auto severity = parse_severity(params.value("severity", "absolute"));
    if (!severity) throw ParamError("Unknown severity: " + params.value("severity", ""));
    c.severity = *severity;
    c.source = ConstraintSource::UserApi;

    std::string key = rt.memory().add_constraint(user_id, c);
    return ToolResult::ok("Stored constraint " + key, {{"key", key}});
}

inline ToolResult list_constraints(Runtime& rt, const json& params) {
    std::string user_id = require_string(params, "user_id");
    auto constraints = rt.memory().load_constraints(user_id);

    std::ostringstream ss;
    ss << constraints.size() << " constraint(s)";
    for (const auto& c : constraints) {
        ss << "\n- " << c.ingredient << " [" << to_string(c.severity) << "]";
    }
    return ToolResult::ok(ss.str(), {{"constraints", constraints}});
}

inline ToolResult remove_constraint(Runtime& rt, const json& params) {
    std::string user_id = require_string(params, "user_id");
    std::string ingredient = require_string(params, "ingredient");
    if (!rt.memory().remove_constraint(user_id, ingredient)) {
        return ToolResult::error("No constraint on " + ingredient);
    }
    return ToolResult::ok("Removed constraint on " + ingredient, {{"removed", true}});
}

inline ToolResult pending_confirmations(Runtime& rt, const json& params) {
    std::string user_id = require_string(params, "user_id");
    auto pending = rt.memory().resolver().load_pending(user_id);

    json list = json::array();
    for (const auto& p : pending) {
        json item = p;
        item["key"] = p.key;
        list.push_back(item);
    }
    std::string prompt = ConflictResolver::format_prompt(pending);
    return ToolResult::ok(prompt.empty() ? "No pending confirmations" : prompt,
                          {{"confirmations", list}, {"prompt", prompt}});
}

inline ToolResult resolve_conflict(Runtime& rt, const json& params) {
    std::string user_id = require_string(params, "user_id");
    std::string key = require_string(params, "key");
    std::string action = require_string(params, "resolution");

    auto resolution = parse_resolution(action);
    if (!resolution) throw ParamError("Unknown resolution: " + action);

    auto value = rt.store().get(ns::pending_confirmations(user_id), key);
    if (!value) return ToolResult::error("No pending confirmation " + key);

    PendingConfirmation pending = value->get<PendingConfirmation>();
    pending.key = key;
    ResolveOutcome outcome = rt.memory().resolver().resolve(user_id, pending, *resolution);

    static const char* const names[] = {"accepted", "kept_both", "attempt_recorded", "auto_accepted"};
    const char* name = names[static_cast<int>(outcome)];
    return ToolResult::ok(std::string("Conflict ") + name, {
        {"outcome", name},
        {"resolved", is_terminal(outcome)}
    });
}

inline ToolResult process_turn(Runtime& rt, const json& params) {
    TurnRequest request;
    request.user_id = require_string(params, "user_id");
    request.message = require_string(params, "message");
    request.constraints = string_list(params, "constraints", false);

    TurnResult turn = rt.process_turn(request, params.value("conversation_id", ""));
    if (turn.refused) {
        return ToolResult::ok(turn.refusal, {{"refused", true}, {"refusal", turn.refusal}});
    }

    const TurnState& s = turn.state;
    json stages = json::array();
    for (Stage stage : turn.stages) stages.push_back(to_string(stage));

    json result = {
        {"refused", false},
        {"intent", to_string(s.intent)},
        {"stages", stages},
        {"constraints", s.constraints},
        {"candidates", s.candidates},
        {"violations", s.violations},
        {"notifications", s.notifications},
        {"all_vetoed", s.all_vetoed},
        {"constraints_unavailable", s.constraints_unavailable},
        {"llm_check_failed", s.llm_check_failed},
        {"response_context", turn.response_context}
    };
    return ToolResult::ok(turn.response_context.empty() ? "(no context)" : turn.response_context,
                          result);
}

inline void register_handlers(Runtime& rt, std::unordered_map<std::string, ToolHandler>& handlers) {
    handlers["detect_facts"] = [&rt](const json& p) { return detect_facts(rt, p); };
    handlers["add_constraint"] = [&rt](const json& p) { return add_constraint(rt, p); };
    handlers["list_constraints"] = [&rt](const json& p) { return list_constraints(rt, p); };
    handlers["remove_constraint"] = [&rt](const json& p) { return remove_constraint(rt, p); };
    handlers["pending_confirmations"] = [&rt](const json& p) { return pending_confirmations(rt, p); };
    handlers["resolve_conflict"] = [&rt](const json& p) { return resolve_conflict(rt, p); };
    handlers["process_turn"] = [&rt](const json& p) { return process_turn(rt, p); };
}

} // namespace warden::rpc::tools::memory
