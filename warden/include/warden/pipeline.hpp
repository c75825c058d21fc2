#pragma once
// Turn pipeline: one user message from override check to response context
//
//   override check        refusal short-circuits everything, before any I/O
//   intent_classification memory load, fact capture, intent label
//   pre_filter            constraint expansion through the ontology
//   discovery             candidate fetch
//   post_filter           dual-gate veto, then advisory annotations
//   response              context text for the response generator
//
// All collaborators except the tables are optional. Without a memory
// service the turn only sees constraints passed in the request; without a
// generator every intent is general_chat and Gate 2 is skipped.

#include "candidate_source.hpp"
#include "fact_detector.hpp"
#include "intent.hpp"
#include "interactions.hpp"
#include "log.hpp"
#include "memory_service.hpp"
#include "ontology.hpp"
#include "override_detector.hpp"
#include "router.hpp"
#include "safety_filter.hpp"
#include "safety_index.hpp"
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace warden {

struct TurnRequest {
    std::string user_id;
    std::string message;
    std::vector<std::string> constraints;   // Declared by the caller for this turn
};

struct TurnResult {
    bool refused = false;
    std::string refusal;
    TurnState state;
    std::vector<Stage> stages;              // Visited, in order
    std::string response_context;
};

inline const char* const CONSTRAINTS_UNAVAILABLE_NOTICE =
    "Your saved allergy and sensitivity information could not be loaded right now, so no "
    "products can be recommended safely. Explain this to the user and offer general advice "
    "instead.";

inline const char* const ALL_VETOED_NOTICE =
    "All products were filtered out due to safety constraints. "
    "Suggest the user broaden their search or offer general advice.";

struct PipelineDeps {
    const OverrideDetector& detector;
    const AllergenOntology& ontology;
    const InteractionTable& interactions;
    const SafetyIndex& safety;
    MemoryService* memory = nullptr;
    TextGenerator* generator = nullptr;
    CandidateSource* source = nullptr;
};

class TurnPipeline {
public:
    explicit TurnPipeline(PipelineDeps deps)
        : deps_(deps),
          classifier_(deps.generator),
          filter_(deps.ontology, deps.generator) {}

    TurnResult run(const TurnRequest& request) const {
        TurnResult result;
        result.state.user_id = request.user_id;
        result.state.message = request.message;

        if (is_refused(request.message)) {
            result.refused = true;
            result.refusal = OVERRIDE_REFUSAL;
            log::info("pipeline", "Override attempt refused for %s", request.user_id.c_str());
            return result;
        }

        std::optional<Stage> stage = Stage::IntentClassification;
        while (stage) {
            result.stages.push_back(*stage);
            merge(result.state, run_stage(*stage, request, result.state));
            stage = PipelineRouter::next(*stage, result.state.intent);
        }
        result.response_context = build_response_context(result.state);
        return result;
    }

    // Any detector failure counts as an override: refuse, never bypass
    bool is_refused(const std::string& message) const {
        try {
            return deps_.detector.is_override_attempt(message);
        } catch (const std::exception& e) {
            log::error("pipeline", "Override detector failed, refusing turn: %s", e.what());
            return true;
        }
    }

    static std::string build_response_context(const TurnState& state) {
        std::vector<std::string> parts;

        if (!state.notifications.empty()) {
            std::ostringstream ss;
            ss << "Memory updates to acknowledge:";
            for (const auto& n : state.notifications) ss << "\n- " << n;
            parts.push_back(ss.str());
        }

        if (!state.memory_context.empty()) {
            std::ostringstream ss;
            ss << "User context from previous conversations:";
            for (const auto& m : state.memory_context) ss << "\n- " << m;
            parts.push_back(ss.str());
        }

        if (PipelineRouter::requires_safety(state.intent)) {
            if (state.constraints_unavailable) {
                parts.push_back(CONSTRAINTS_UNAVAILABLE_NOTICE);
            }

            if (!state.violations.empty()) {
                std::ostringstream ss;
                ss << "Safety violations found:";
                for (const auto& v : state.violations) {
                    ss << "\n- " << v.product << ": flagged for " << v.summary();
                }
                parts.push_back(ss.str());
            }

            if (!state.candidates.empty()) {
                std::ostringstream ss;
                ss << "Safe products found:";
                for (const auto& c : state.candidates) {
                    ss << "\n- " << c.display_name() << " by "
                       << (c.brand.empty() ? "Unknown" : c.brand) << " (safety: ";
                    if (c.safety_score) {
                        ss << std::fixed << std::setprecision(1) << *c.safety_score;
                    } else {
                        ss << "N/A";
                    }
                    ss << "/10)";
                    for (const auto& w : c.interactions) {
                        ss << "\n  - Interaction (" << to_string(w.severity) << ") "
                           << w.label << ": " << w.concern;
                    }
                }
                parts.push_back(ss.str());
            } else if (state.all_vetoed) {
                parts.push_back(ALL_VETOED_NOTICE);
            }
        }

        std::string context;
        for (const auto& p : parts) {
            if (!context.empty()) context += "\n\n";
            context += p;
        }
        return context;
    }

private:
    PipelineDeps deps_;
    FactDetector facts_;
    IntentClassifier classifier_;
    DualGateFilter filter_;

    StageOutput run_stage(Stage stage, const TurnRequest& request, const TurnState& state) const {
        switch (stage) {
            case Stage::IntentClassification: return classify(request);
            case Stage::PreFilter: return pre_filter(state);
            case Stage::Discovery: return discover(state);
            case Stage::PostFilter: return post_filter(state);
            case Stage::Response: return {};
        }
        return {};
    }

    StageOutput classify(const TurnRequest& request) const {
        StageOutput out;
        std::vector<std::string> constraints = request.constraints;

        if (deps_.memory && !request.user_id.empty()) {
            MemoryContext ctx = deps_.memory->load_context(request.user_id);
            for (const auto& c : ctx.constraints) constraints.push_back(c.ingredient);
            out.memory_context = std::move(ctx.memory_context);
            out.constraints_unavailable = ctx.constraints_unavailable;

            // Constraints stated in this very message apply to this turn too
            auto detected = facts_.detect(request.message);
            for (const auto& f : detected) {
                if (f.category == FactCategory::Allergy || f.category == FactCategory::Sensitivity) {
                    constraints.push_back(f.value);
                }
            }
            try {
                out.notifications = deps_.memory->store_facts(request.user_id, detected);
            } catch (const std::exception& e) {
                log::warn("pipeline", "Failed to store detected facts: %s", e.what());
            }
        }

        out.constraints = std::move(constraints);
        out.intent = classifier_.classify(request.message);
        log::debug("pipeline", "Intent: %s", to_string(*out.intent).c_str());
        return out;
    }

    StageOutput pre_filter(const TurnState& state) const {
        StageOutput out;
        auto expanded = deps_.ontology.expand(state.constraints);
        out.constraints = std::vector<std::string>(expanded.begin(), expanded.end());
        log::debug("pipeline", "Expanded %zu constraints to %zu tokens",
                   state.constraints.size(), expanded.size());
        return out;
    }

    StageOutput discover(const TurnState& state) const {
        StageOutput out;
        out.candidates = std::vector<Candidate>{};
        if (state.constraints_unavailable) {
            log::warn("pipeline", "Skipping discovery: constraints unavailable");
            return out;
        }
        if (!deps_.source) return out;

        try {
            out.candidates = deps_.source->fetch(state.message, state.constraints);
        } catch (const std::exception& e) {
            log::error("pipeline", "Candidate fetch failed: %s", e.what());
        }
        out.candidates_considered = out.candidates->size();
        return out;
    }

    StageOutput post_filter(const TurnState& state) const {
        StageOutput out;
        if (state.constraints_unavailable) {
            out.candidates = std::vector<Candidate>{};
            out.all_vetoed = false;
            return out;
        }

        FilterResult filtered = filter_.apply(state.candidates, state.constraints);
        for (auto& survivor : filtered.survivors) {
            auto ingredients = ingredient_list(survivor);
            survivor.interactions = deps_.interactions.find_interactions(ingredients);
            SafetyScore score = deps_.safety.compute(ingredients);
            survivor.safety_score = score.score;
            survivor.safety_flags = std::move(score.flags);
        }

        out.candidates = std::move(filtered.survivors);
        out.violations = std::move(filtered.violations);
        out.all_vetoed = filtered.all_vetoed;
        out.llm_check_failed = filtered.llm_check_failed;
        return out;
    }
};

} // namespace warden
