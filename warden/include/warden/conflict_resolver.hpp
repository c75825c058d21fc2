#pragma once
// Memory conflict resolver: contradictions between stored and new facts
//
// Only skin_type and age can contradict. When a new value disagrees with
// a stored one, a PendingConfirmation is written. Each turn surfaces all
// pending confirmations to the response (and counts that as an ignore).
// A confirmation reaches a terminal state after at most
// MAX_IGNORED_ATTEMPTS surfacings:
//
//   accept_new  old fact deleted, confirmation deleted
//   keep_both   old fact qualified with " (sometimes)", confirmation deleted
//   ignore      attempts += 1; at MAX_IGNORED_ATTEMPTS behaves as accept_new

#include "fact_store.hpp"
#include "log.hpp"
#include "serialize.hpp"
#include "types.hpp"
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace warden {

constexpr int MAX_IGNORED_ATTEMPTS = 3;

enum class Resolution : uint8_t {
    AcceptNew = 0,
    KeepBoth = 1,
    Ignore = 2,
};

inline std::string to_string(Resolution r) {
    switch (r) {
        case Resolution::AcceptNew: return "accept_new";
        case Resolution::KeepBoth: return "keep_both";
        case Resolution::Ignore: return "ignore";
    }
    return "ignore";
}

inline std::optional<Resolution> parse_resolution(const std::string& s) {
    if (s == "accept_new") return Resolution::AcceptNew;
    if (s == "keep_both") return Resolution::KeepBoth;
    if (s == "ignore") return Resolution::Ignore;
    return std::nullopt;
}

// What resolve() did to the confirmation
enum class ResolveOutcome : uint8_t {
    Accepted = 0,
    KeptBoth = 1,
    AttemptRecorded = 2,   // Still pending
    AutoAccepted = 3,      // Ignored too often
};

inline bool is_terminal(ResolveOutcome o) {
    return o != ResolveOutcome::AttemptRecorded;
}

inline bool is_contradiction_category(FactCategory c) {
    return c == FactCategory::SkinType || c == FactCategory::Age;
}

inline std::string confirmation_key(FactCategory category, const std::string& old_key) {
    return "conflict_" + to_string(category) + "_" + old_key;
}

class ConflictResolver {
public:
    explicit ConflictResolver(FactStore& store) : store_(store) {}

    // Compare a fact about to be stored under new_key against stored facts.
    // Store failures are logged and reported as no conflict.
    std::optional<PendingConfirmation> check_and_store_conflict(const std::string& user_id,
                                                                const std::string& new_key,
                                                                const Fact& fact,
                                                                Timestamp now) {
        if (!is_contradiction_category(fact.category)) return std::nullopt;

        try {
            for (const auto& item : store_.search(ns::user_facts(user_id))) {
                if (item.key == new_key) continue;
                if (item.value.value("category", "") != to_string(fact.category)) continue;

                std::string existing = item.value.value("value", "");
                if (existing == fact.value) continue;

                PendingConfirmation pending;
                pending.key = confirmation_key(fact.category, item.key);
                pending.category = fact.category;
                pending.old_key = item.key;
                pending.old_value = existing;
                pending.new_value = fact.value;
                pending.detected_at = now;
                pending.attempts = 0;
                pending.source_quote = fact.source_text;

                store_.put(ns::pending_confirmations(user_id), pending.key, json(pending));
                log::info("memory", "Conflict detected for %s: %s -> %s",
                          to_string(fact.category).c_str(), existing.c_str(), fact.value.c_str());
                return pending;
            }
        } catch (const StoreError& e) {
            log::warn("memory", "Conflict check failed: %s", e.what());
        }
        return std::nullopt;
    }

    // Throws StoreError
    std::vector<PendingConfirmation> load_pending(const std::string& user_id) {
        std::vector<PendingConfirmation> pending;
        for (const auto& item : store_.search(ns::pending_confirmations(user_id))) {
            PendingConfirmation p = item.value.get<PendingConfirmation>();
            p.key = item.key;
            pending.push_back(std::move(p));
        }
        return pending;
    }

    // Throws StoreError
    ResolveOutcome resolve(const std::string& user_id,
                           const PendingConfirmation& pending,
                           Resolution resolution) {
        const std::string category = to_string(pending.category);

        switch (resolution) {
            case Resolution::AcceptNew:
                accept_new(user_id, pending);
                log::info("memory", "Conflict resolved: accepted new %s", category.c_str());
                return ResolveOutcome::Accepted;

            case Resolution::KeepBoth: {
                if (!pending.old_key.empty()) {
                    std::string qualified = pending.old_value + " (sometimes)";
                    store_.put(ns::user_facts(user_id), pending.old_key, {
                        {"category", category},
                        {"value", qualified},
                        {"content", category + ": " + pending.old_value + " (varies)"}
                    });
                }
                store_.remove(ns::pending_confirmations(user_id), pending.key);
                log::info("memory", "Conflict resolved: keeping both %s values", category.c_str());
                return ResolveOutcome::KeptBoth;
            }

            case Resolution::Ignore: {
                PendingConfirmation updated = pending;
                updated.attempts += 1;
                if (updated.attempts >= MAX_IGNORED_ATTEMPTS) {
                    accept_new(user_id, pending);
                    log::info("memory", "Conflict auto-resolved after %d attempts (%s)",
                              updated.attempts, category.c_str());
                    return ResolveOutcome::AutoAccepted;
                }
                store_.put(ns::pending_confirmations(user_id), pending.key, json(updated));
                log::debug("memory", "Conflict ignored, attempts=%d", updated.attempts);
                return ResolveOutcome::AttemptRecorded;
            }
        }
        return ResolveOutcome::AttemptRecorded;
    }

    // Response-context block; empty when nothing is pending
    static std::string format_prompt(const std::vector<PendingConfirmation>& pending) {
        if (pending.empty()) return "";

        std::ostringstream ss;
        ss << "PENDING CONFIRMATIONS (address these naturally in your response):";
        for (const auto& p : pending) {
            const std::string cat = to_string(p.category);
            const std::string old_value = p.old_value.empty() ? "unknown" : p.old_value;
            const std::string new_value = p.new_value.empty() ? "unknown" : p.new_value;
            ss << "\n- The user previously mentioned having " << old_value << " " << cat
               << ", but recently indicated " << new_value << " " << cat
               << ". Naturally ask if their " << cat
               << " has changed or if it varies seasonally.";
        }
        return ss.str();
    }

private:
    FactStore& store_;

    void accept_new(const std::string& user_id, const PendingConfirmation& pending) {
        if (!pending.old_key.empty()) {
            store_.remove(ns::user_facts(user_id), pending.old_key);
        }
        store_.remove(ns::pending_confirmations(user_id), pending.key);
    }
};

} // namespace warden
