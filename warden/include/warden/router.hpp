#pragma once
// Pipeline router: stage sequence per intent, and the turn-state reducer
//
//   product_search / ingredient_check / routine_advice:
//     intent_classification -> pre_filter -> discovery -> post_filter -> response
//   general_chat / memory_query / unrecognized:
//     intent_classification -> response
//
// Stages never write TurnState directly. Each returns a StageOutput and
// merge() folds it in:
//   intent, constraints, candidates, flags   overwrite when present
//   violations, notifications, memory_context append

#include "intent.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace warden {

enum class Stage : uint8_t {
    IntentClassification = 0,
    PreFilter = 1,
    Discovery = 2,
    PostFilter = 3,
    Response = 4,
};

inline std::string to_string(Stage s) {
    switch (s) {
        case Stage::IntentClassification: return "intent_classification";
        case Stage::PreFilter: return "pre_filter";
        case Stage::Discovery: return "discovery";
        case Stage::PostFilter: return "post_filter";
        case Stage::Response: return "response";
    }
    return "response";
}

// Request-scoped state of one turn
struct TurnState {
    std::string user_id;
    std::string message;
    Intent intent = Intent::GeneralChat;

    std::vector<std::string> constraints;      // Expanded after pre_filter
    std::vector<Candidate> candidates;         // Survivors after post_filter
    size_t candidates_considered = 0;
    std::vector<Violation> violations;
    std::vector<std::string> notifications;
    std::vector<std::string> memory_context;

    bool all_vetoed = false;
    bool constraints_unavailable = false;
    bool llm_check_failed = false;
};

struct StageOutput {
    std::optional<Intent> intent;
    std::optional<std::vector<std::string>> constraints;
    std::optional<std::vector<Candidate>> candidates;
    std::optional<size_t> candidates_considered;
    std::vector<Violation> violations;
    std::vector<std::string> notifications;
    std::vector<std::string> memory_context;

    std::optional<bool> all_vetoed;
    std::optional<bool> constraints_unavailable;
    std::optional<bool> llm_check_failed;
};

inline void merge(TurnState& state, StageOutput&& out) {
    if (out.intent) state.intent = *out.intent;
    if (out.constraints) state.constraints = std::move(*out.constraints);
    if (out.candidates) state.candidates = std::move(*out.candidates);
    if (out.candidates_considered) state.candidates_considered = *out.candidates_considered;

    for (auto& v : out.violations) state.violations.push_back(std::move(v));
    for (auto& n : out.notifications) state.notifications.push_back(std::move(n));
    for (auto& m : out.memory_context) state.memory_context.push_back(std::move(m));

    if (out.all_vetoed) state.all_vetoed = *out.all_vetoed;
    if (out.constraints_unavailable) state.constraints_unavailable = *out.constraints_unavailable;
    if (out.llm_check_failed) state.llm_check_failed = *out.llm_check_failed;
}

class PipelineRouter {
public:
    static bool requires_safety(Intent intent) {
        return intent == Intent::ProductSearch ||
               intent == Intent::IngredientCheck ||
               intent == Intent::RoutineAdvice;
    }

    // Stage after `current`; nullopt once response is reached
    static std::optional<Stage> next(Stage current, Intent intent) {
        switch (current) {
            case Stage::IntentClassification:
                return requires_safety(intent) ? Stage::PreFilter : Stage::Response;
            case Stage::PreFilter: return Stage::Discovery;
            case Stage::Discovery: return Stage::PostFilter;
            case Stage::PostFilter: return Stage::Response;
            case Stage::Response: return std::nullopt;
        }
        return std::nullopt;
    }

    static std::vector<Stage> plan(Intent intent) {
        std::vector<Stage> stages{Stage::IntentClassification};
        while (auto s = next(stages.back(), intent)) {
            stages.push_back(*s);
        }
        return stages;
    }
};

} // namespace warden
