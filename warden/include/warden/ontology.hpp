#pragma once
// Allergen ontology: canonical synonym groups and the matcher built on them
//
// Groups are flat: a member resolves to exactly one group, and a group
// name resolves to itself. One hop through the reverse index therefore
// gives the full closure of any token.
//
// The ontology is a versioned resource. The built-in table ships with the
// library; deployments may load a replacement from JSON:
//
//   {"version": 2, "allergen_groups": {"paraben": ["methylparaben", ...]}}
//
// Instances are immutable after construction and safe to share.

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace warden {

class OntologyError : public std::runtime_error {
public:
    explicit OntologyError(const std::string& what) : std::runtime_error(what) {}
};

struct AllergenGroup {
    std::string name;
    std::vector<std::string> members;
};

class AllergenOntology {
public:
    AllergenOntology() = default;

    AllergenOntology(int version, std::vector<AllergenGroup> groups)
        : version_(version) {
        for (auto& group : groups) {
            group.name = normalize(group.name);
            if (group.name.empty()) {
                throw OntologyError("allergen group with empty name");
            }
            if (group_index_.count(group.name)) {
                throw OntologyError("duplicate allergen group: " + group.name);
            }
            for (auto& member : group.members) {
                member = normalize(member);
            }
            group_index_[group.name] = groups_.size();
            groups_.push_back(std::move(group));
        }

        // Reverse index. Group names first so a member that collides with
        // another group's name is caught below.
        for (const auto& group : groups_) {
            reverse_[group.name] = group.name;
        }
        for (const auto& group : groups_) {
            for (const auto& member : group.members) {
                auto it = reverse_.find(member);
                if (it != reverse_.end() && it->second != group.name) {
                    throw OntologyError("ingredient '" + member + "' belongs to both '" +
                                        it->second + "' and '" + group.name + "'");
                }
                reverse_[member] = group.name;
            }
        }
    }

    // Built-in table (src/builtin_tables.cpp)
    static const AllergenOntology& builtin();

    static AllergenOntology from_json(const nlohmann::json& doc) {
        if (!doc.is_object() || !doc.contains("allergen_groups") ||
            !doc["allergen_groups"].is_object()) {
            throw OntologyError("ontology resource needs an 'allergen_groups' object");
        }
        int version = doc.value("version", 0);
        std::vector<AllergenGroup> groups;
        for (const auto& [name, members] : doc["allergen_groups"].items()) {
            if (!members.is_array()) {
                throw OntologyError("members of '" + name + "' must be an array");
            }
            AllergenGroup group;
            group.name = name;
            for (const auto& m : members) {
                if (!m.is_string()) {
                    throw OntologyError("non-string member in '" + name + "'");
                }
                group.members.push_back(m.get<std::string>());
            }
            groups.push_back(std::move(group));
        }
        return AllergenOntology(version, std::move(groups));
    }

    static AllergenOntology load(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            throw OntologyError("cannot open ontology resource: " + path);
        }
        try {
            return from_json(nlohmann::json::parse(in));
        } catch (const nlohmann::json::exception& e) {
            throw OntologyError("invalid ontology resource " + path + ": " + e.what());
        }
    }

    nlohmann::json to_json() const {
        nlohmann::json groups = nlohmann::json::object();
        for (const auto& group : groups_) {
            groups[group.name] = group.members;
        }
        return {{"version", version_}, {"allergen_groups", groups}};
    }

    int version() const { return version_; }
    const std::vector<AllergenGroup>& groups() const { return groups_; }

    bool is_group(const std::string& token) const {
        return group_index_.count(normalize(token)) != 0;
    }

    const AllergenGroup* find_group(const std::string& name) const {
        auto it = group_index_.find(normalize(name));
        return it == group_index_.end() ? nullptr : &groups_[it->second];
    }

    // Group an ingredient (or group name) belongs to
    std::optional<std::string> group_of(const std::string& ingredient) const {
        auto it = reverse_.find(normalize(ingredient));
        if (it == reverse_.end()) return std::nullopt;
        return it->second;
    }

    // Closure of the declared allergens through their synonym groups.
    // ["paraben"] -> {"paraben", "methylparaben", "ethylparaben", ...}
    std::set<std::string> expand(const std::vector<std::string>& allergens) const {
        std::set<std::string> expanded;
        for (const auto& allergen : allergens) {
            std::string token = normalize(allergen);
            if (token.empty()) continue;
            expanded.insert(token);

            auto it = reverse_.find(token);
            if (it == reverse_.end()) continue;

            const auto& group = groups_[group_index_.at(it->second)];
            expanded.insert(group.name);
            expanded.insert(group.members.begin(), group.members.end());
        }
        return expanded;
    }

    // Direct matches win over group matches; one entry per ingredient at most
    std::vector<Match> find_allergen_matches(const std::vector<std::string>& ingredients,
                                             const std::vector<std::string>& allergens) const {
        std::vector<Match> matches;

        std::vector<std::string> normalized_allergens;
        std::set<std::string> allergen_groups;
        normalized_allergens.reserve(allergens.size());
        for (const auto& allergen : allergens) {
            std::string token = normalize(allergen);
            normalized_allergens.push_back(token);
            auto group = group_of(token);
            allergen_groups.insert(group ? *group : token);
        }

        for (const auto& ingredient : ingredients) {
            std::string token = normalize(ingredient);

            bool direct = false;
            for (size_t i = 0; i < allergens.size(); ++i) {
                if (normalized_allergens[i] == token) {
                    matches.push_back({ingredient, allergens[i], MatchType::Direct});
                    direct = true;
                    break;
                }
            }
            if (direct) continue;

            auto group = group_of(token);
            if (group && allergen_groups.count(*group)) {
                matches.push_back({ingredient, *group, MatchType::Group});
            }
        }

        return matches;
    }

private:
    int version_ = 0;
    std::vector<AllergenGroup> groups_;
    std::unordered_map<std::string, size_t> group_index_;
    std::unordered_map<std::string, std::string> reverse_;
};

} // namespace warden
