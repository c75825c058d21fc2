#pragma once
// Dual-gate safety filter
//
// Gate 1 (rule_based): every candidate's ingredients against the expanded
// constraint set through the ontology matcher. Any match vetoes.
//
// Gate 2 (llm_check): Gate-1 survivors and the constraint list go to the
// generative service. Each response line containing UNSAFE vetoes every
// survivor whose name appears in that line. Gate 2 failing for any reason
// keeps the Gate-1 result.
//
// For unique candidate names: survivors + violations == candidates.

#include "generator.hpp"
#include "ingredient_parser.hpp"
#include "log.hpp"
#include "ontology.hpp"
#include "types.hpp"
#include <sstream>
#include <string>
#include <vector>

namespace warden {

constexpr size_t LLM_CHECK_MAX_INGREDIENTS = 30;

struct FilterResult {
    std::vector<Candidate> survivors;
    std::vector<Violation> violations;
    bool all_vetoed = false;
    bool llm_check_ran = false;
    bool llm_check_failed = false;
};

inline std::string lowercase(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

inline std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

class DualGateFilter {
public:
    // generator may be null: Gate 2 is then skipped
    DualGateFilter(const AllergenOntology& ontology, TextGenerator* generator)
        : ontology_(ontology), generator_(generator) {}

    FilterResult apply(const std::vector<Candidate>& candidates,
                       const std::vector<std::string>& constraints) const {
        FilterResult result;
        if (constraints.empty() || candidates.empty()) {
            result.survivors = candidates;
            return result;
        }

        rule_gate(candidates, constraints, result);
        if (!result.survivors.empty()) {
            llm_gate(constraints, result);
        }

        result.all_vetoed = result.survivors.empty();
        return result;
    }

    void rule_gate(const std::vector<Candidate>& candidates,
                   const std::vector<std::string>& constraints,
                   FilterResult& result) const {
        for (const auto& candidate : candidates) {
            auto matches = ontology_.find_allergen_matches(ingredient_list(candidate), constraints);
            if (matches.empty()) {
                result.survivors.push_back(candidate);
                continue;
            }
            Violation v;
            v.product = candidate.display_name();
            v.gate = Gate::RuleBased;
            v.matches = std::move(matches);
            log::info("safety", "Product vetoed by rule-based gate: %s (%s)",
                      v.product.c_str(), v.summary().c_str());
            result.violations.push_back(std::move(v));
        }
    }

    void llm_gate(const std::vector<std::string>& constraints, FilterResult& result) const {
        if (!generator_) return;

        result.llm_check_ran = true;
        std::string response;
        try {
            response = generator_->generate(build_safety_prompt(constraints, result.survivors),
                                            {{"user", "Check these products for safety."}});
        } catch (const std::exception& e) {
            result.llm_check_failed = true;
            log::error("safety", "LLM safety check failed, keeping rule-based results: %s",
                       e.what());
            return;
        }

        std::istringstream lines(response);
        std::string line;
        while (std::getline(lines, line)) {
            const std::string lower = lowercase(line);
            if (lower.find("unsafe") == std::string::npos) continue;

            for (auto it = result.survivors.begin(); it != result.survivors.end();) {
                const std::string name = lowercase(it->display_name());
                if (lower.find(name) == std::string::npos) {
                    ++it;
                    continue;
                }
                Violation v;
                v.product = it->display_name();
                v.gate = Gate::LlmCheck;
                v.reason = trim(line);
                log::info("safety", "Product vetoed by LLM check: %s", v.product.c_str());
                result.violations.push_back(std::move(v));
                it = result.survivors.erase(it);
            }
        }
    }

    static std::string build_safety_prompt(const std::vector<std::string>& constraints,
                                           const std::vector<Candidate>& survivors) {
        std::ostringstream allergies;
        for (size_t i = 0; i < constraints.size(); ++i) {
            if (i > 0) allergies << ", ";
            allergies << constraints[i];
        }

        std::ostringstream products;
        for (size_t i = 0; i < survivors.size(); ++i) {
            if (i > 0) products << "\n";
            products << "- " << survivors[i].display_name() << ": ";
            auto ingredients = ingredient_list(survivors[i]);
            size_t n = std::min(ingredients.size(), LLM_CHECK_MAX_INGREDIENTS);
            for (size_t k = 0; k < n; ++k) {
                if (k > 0) products << ", ";
                products << ingredients[k];
            }
        }

        std::ostringstream prompt;
        prompt << "You are a safety checker for beauty products.\n"
               << "Given the user's known allergies/sensitivities and a list of products with "
                  "their ingredients,\n"
               << "identify any products that may be unsafe.\n\n"
               << "User allergies: " << allergies.str() << "\n\n"
               << "Products:\n" << products.str() << "\n\n"
               << "For each product, respond with:\n"
               << "- SAFE if no concerns\n"
               << "- UNSAFE: <reason> if there are concerns\n\n"
               << "Be thorough and check for ingredient synonyms and related compounds.\n"
               << "For example, \"paraben allergy\" means ALL parabens (methylparaben, "
                  "ethylparaben, etc.) are unsafe.";
        return prompt.str();
    }

private:
    const AllergenOntology& ontology_;
    TextGenerator* generator_;
};

} // namespace warden
