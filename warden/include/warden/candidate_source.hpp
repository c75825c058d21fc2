#pragma once
// Candidate fetch: where discovery gets products from
//
// CandidateSource is the seam to the external search. CatalogSource is a
// local JSON catalog ([{name, brand, ingredients}, ...]) with plain keyword
// ranking, enough for wardend and tests. It skips products containing an
// expanded constraint token only when prefilter is on; the dual-gate
// filter runs afterwards either way.

#include "ingredient_parser.hpp"
#include "serialize.hpp"
#include "types.hpp"
#include <algorithm>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace warden {

class CandidateSource {
public:
    virtual ~CandidateSource() = default;

    virtual std::vector<Candidate> fetch(const std::string& query,
                                         const std::vector<std::string>& expanded_constraints) = 0;
};

class CatalogSource : public CandidateSource {
public:
    explicit CatalogSource(std::vector<Candidate> products, size_t limit = 10, bool prefilter = false)
        : products_(std::move(products)), limit_(limit), prefilter_(prefilter) {}

    static CatalogSource from_json(const nlohmann::json& doc, size_t limit = 10) {
        const nlohmann::json& list = doc.is_object() ? doc.at("products") : doc;
        if (!list.is_array()) {
            throw std::invalid_argument("catalog must be an array of products");
        }
        std::vector<Candidate> products;
        for (const auto& item : list) {
            products.push_back(item.get<Candidate>());
        }
        return CatalogSource(std::move(products), limit);
    }

    static CatalogSource load(const std::string& path, size_t limit = 10) {
        std::ifstream in(path);
        if (!in) {
            throw std::runtime_error("cannot open catalog " + path);
        }
        return from_json(nlohmann::json::parse(in), limit);
    }

    std::vector<Candidate> fetch(const std::string& query,
                                 const std::vector<std::string>& expanded_constraints) override {
        const auto terms = tokenize(query);
        const std::set<std::string> blocked(expanded_constraints.begin(), expanded_constraints.end());

        std::vector<std::pair<int, size_t>> ranked;
        for (size_t i = 0; i < products_.size(); ++i) {
            if (prefilter_ && contains_blocked(products_[i], blocked)) continue;
            int score = relevance(products_[i], terms);
            if (score > 0 || terms.empty()) ranked.emplace_back(score, i);
        }
        std::stable_sort(ranked.begin(), ranked.end(),
                         [](const auto& a, const auto& b) { return a.first > b.first; });

        std::vector<Candidate> out;
        for (const auto& [_, index] : ranked) {
            if (out.size() >= limit_) break;
            out.push_back(products_[index]);
        }
        return out;
    }

    size_t size() const { return products_.size(); }
    void set_prefilter(bool on) { prefilter_ = on; }

private:
    std::vector<Candidate> products_;
    size_t limit_;
    bool prefilter_;

    static std::vector<std::string> tokenize(const std::string& text) {
        std::vector<std::string> terms;
        std::string word;
        std::istringstream in(normalize(text));
        while (in >> word) {
            word.erase(std::remove_if(word.begin(), word.end(),
                                      [](unsigned char c) { return !std::isalnum(c); }),
                       word.end());
            if (word.size() > 2) terms.push_back(word);
        }
        return terms;
    }

    static int relevance(const Candidate& c, const std::vector<std::string>& terms) {
        const std::string haystack = normalize(c.name + " " + c.brand);
        int score = 0;
        for (const auto& t : terms) {
            if (haystack.find(t) != std::string::npos) score += 2;
        }
        for (const auto& ingredient : ingredient_list(c)) {
            for (const auto& t : terms) {
                if (ingredient.find(t) != std::string::npos) score += 1;
            }
        }
        return score;
    }

    static bool contains_blocked(const Candidate& c, const std::set<std::string>& blocked) {
        for (const auto& ingredient : ingredient_list(c)) {
            if (blocked.count(normalize(ingredient))) return true;
        }
        return false;
    }
};

} // namespace warden
