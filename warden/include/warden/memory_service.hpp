#pragma once
// Memory service: per-turn load and store of a user's long-term memory
//
// load_context() reads constraints, facts and pending confirmations fresh
// from the store every turn. store_facts() persists detected facts:
// allergies and sensitivities become constraints, everything else is a
// user fact that first goes through conflict detection.
//
// A store failure while loading constraints or facts is governed by the
// constraint-load policy:
//   fail_closed  constraints_unavailable = true, caller blocks recommendations
//   fail_open    empty constraint set, warning logged

#include "conflict_resolver.hpp"
#include "fact_store.hpp"
#include "log.hpp"
#include "serialize.hpp"
#include "types.hpp"
#include <cstdio>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace warden {

enum class ConstraintLoadPolicy : uint8_t {
    FailClosed = 0,
    FailOpen = 1,
};

inline std::string to_string(ConstraintLoadPolicy p) {
    return p == ConstraintLoadPolicy::FailOpen ? "fail_open" : "fail_closed";
}

inline std::optional<ConstraintLoadPolicy> parse_constraint_load_policy(const std::string& s) {
    if (s == "fail_closed") return ConstraintLoadPolicy::FailClosed;
    if (s == "fail_open") return ConstraintLoadPolicy::FailOpen;
    return std::nullopt;
}

struct MemoryContext {
    std::vector<Constraint> constraints;
    std::vector<std::string> memory_context;        // Fact lines + conflict prompt
    std::vector<PendingConfirmation> confirmations; // As surfaced this turn
    std::string conflict_prompt;
    bool constraints_unavailable = false;
};

// 8 hex chars for fact keys ("skin_type_3fa91c0e")
inline std::string short_id() {
    thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<uint32_t> dis;
    char buf[9];
    std::snprintf(buf, sizeof(buf), "%08x", dis(gen));
    return buf;
}

inline std::string underscored(const std::string& value) {
    std::string out = value;
    std::replace(out.begin(), out.end(), ' ', '_');
    return out;
}

class MemoryService {
public:
    explicit MemoryService(FactStore& store,
                           ConstraintLoadPolicy policy = ConstraintLoadPolicy::FailClosed)
        : store_(store), resolver_(store), policy_(policy) {}

    ConstraintLoadPolicy policy() const { return policy_; }
    ConflictResolver& resolver() { return resolver_; }

    MemoryContext load_context(const std::string& user_id) {
        MemoryContext ctx;

        try {
            ctx.constraints = load_constraints(user_id);
            for (const auto& item : store_.search(ns::user_facts(user_id))) {
                ctx.memory_context.push_back(item.value.value("content", item.value.dump()));
            }
        } catch (const StoreError& e) {
            ctx.constraints.clear();
            ctx.memory_context.clear();
            if (policy_ == ConstraintLoadPolicy::FailClosed) {
                ctx.constraints_unavailable = true;
                log::error("memory", "Constraint load failed, blocking recommendations: %s", e.what());
            } else {
                log::warn("memory", "Constraint load failed, proceeding without constraints: %s",
                          e.what());
            }
            return ctx;
        }

        // Surfacing counts as an ignore; see ConflictResolver
        try {
            ctx.confirmations = resolver_.load_pending(user_id);
            ctx.conflict_prompt = ConflictResolver::format_prompt(ctx.confirmations);
            for (const auto& pending : ctx.confirmations) {
                resolver_.resolve(user_id, pending, Resolution::Ignore);
            }
        } catch (const StoreError& e) {
            log::warn("memory", "Pending confirmations unavailable: %s", e.what());
        }
        if (!ctx.conflict_prompt.empty()) {
            ctx.memory_context.push_back(ctx.conflict_prompt);
        }
        return ctx;
    }

    // Throws StoreError
    std::vector<Constraint> load_constraints(const std::string& user_id) {
        std::vector<Constraint> constraints;
        for (const auto& item : store_.search(ns::constraints(user_id))) {
            if (!item.value.is_object() || item.value.value("ingredient", "").empty()) {
                log::warn("memory", "Skipping malformed constraint %s", item.key.c_str());
                continue;
            }
            constraints.push_back(item.value.get<Constraint>());
        }
        return constraints;
    }

    // Persist facts, returning one user-facing notification per fact.
    // Throws StoreError.
    std::vector<std::string> store_facts(const std::string& user_id,
                                         const std::vector<Fact>& facts,
                                         Timestamp at = now()) {
        std::vector<std::string> notifications;
        for (const auto& fact : facts) {
            const std::string& value = fact.value;
            switch (fact.category) {
                case FactCategory::Allergy:
                    add_constraint(user_id, {value, Severity::Absolute,
                                             ConstraintSource::UserStated, "Allergic to " + value});
                    notifications.push_back("I've noted your " + value + " allergy. "
                        "I'll filter out products containing " + value + " going forward.");
                    break;

                case FactCategory::Sensitivity:
                    add_constraint(user_id, {value, Severity::High,
                                             ConstraintSource::UserStated, "Sensitive to " + value});
                    notifications.push_back("I've noted your sensitivity to " + value + ". "
                        "I'll avoid recommending products with " + value + ".");
                    break;

                default: {
                    if (has_fact(user_id, fact)) {
                        log::debug("memory", "Already known %s: %s",
                                   to_string(fact.category).c_str(), value.c_str());
                        break;
                    }
                    std::string key = to_string(fact.category) + "_" + short_id();
                    resolver_.check_and_store_conflict(user_id, key, fact, at);
                    store_.put(ns::user_facts(user_id), key, json(fact));
                    if (auto note = fact_notification(fact)) {
                        notifications.push_back(*note);
                    }
                    break;
                }
            }
        }
        return notifications;
    }

    // Key: allergy_<ingredient>, sensitivity_<ingredient>, preference_<ingredient>
    std::string add_constraint(const std::string& user_id, const Constraint& constraint) {
        Constraint stored = constraint;
        stored.ingredient = normalize(constraint.ingredient);
        if (stored.ingredient.empty()) {
            throw std::invalid_argument("constraint has no ingredient");
        }
        if (stored.content.empty()) stored.content = default_content(stored);

        std::string key = key_prefix(stored.severity) + underscored(stored.ingredient);
        store_.put(ns::constraints(user_id), key, json(stored));
        log::debug("memory", "Stored constraint %s for %s", key.c_str(), user_id.c_str());
        return key;
    }

    bool remove_constraint(const std::string& user_id, const std::string& ingredient) {
        const std::string token = underscored(normalize(ingredient));
        bool removed = false;
        for (Severity s : {Severity::Absolute, Severity::High, Severity::Preference}) {
            const std::string key = key_prefix(s) + token;
            if (store_.get(ns::constraints(user_id), key)) {
                store_.remove(ns::constraints(user_id), key);
                removed = true;
            }
        }
        return removed;
    }

    std::vector<StoreItem> facts(const std::string& user_id) {
        return store_.search(ns::user_facts(user_id));
    }

private:
    FactStore& store_;
    ConflictResolver resolver_;
    ConstraintLoadPolicy policy_;

    // Same category and value already stored
    bool has_fact(const std::string& user_id, const Fact& fact) {
        const std::string category = to_string(fact.category);
        for (const auto& item : store_.search(ns::user_facts(user_id))) {
            if (item.value.is_object() &&
                item.value.value("category", "") == category &&
                item.value.value("value", "") == fact.value) {
                return true;
            }
        }
        return false;
    }

    static std::string key_prefix(Severity s) {
        switch (s) {
            case Severity::Absolute: return "allergy_";
            case Severity::High: return "sensitivity_";
            case Severity::Preference: return "preference_";
        }
        return "allergy_";
    }

    static std::string default_content(const Constraint& c) {
        switch (c.severity) {
            case Severity::Absolute: return "Allergic to " + c.ingredient;
            case Severity::High: return "Sensitive to " + c.ingredient;
            case Severity::Preference: return "Prefers to avoid " + c.ingredient;
        }
        return c.ingredient;
    }

    static std::optional<std::string> fact_notification(const Fact& fact) {
        switch (fact.category) {
            case FactCategory::SkinType:
                return "I've noted that you have " + fact.value + " skin.";
            case FactCategory::Preference:
                return "I've noted your preference for " + fact.value + ".";
            case FactCategory::Aversion:
                return "I've noted that you prefer to avoid " + fact.value + ".";
            default:
                return std::nullopt;
        }
    }
};

} // namespace warden
