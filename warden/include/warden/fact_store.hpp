#pragma once
// Long-term fact store: namespaced key -> JSON value
//
// Namespaces are (kind, user_id):
//   user_facts             skin type, age, preferences, aversions
//   constraints            allergies and sensitivities
//   pending_confirmations  unresolved contradictions
//
// The core reads and writes through this interface every turn and never
// caches across turns. Failures throw StoreError.

#include <nlohmann/json.hpp>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace warden {

class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& what) : std::runtime_error(what) {}
};

struct Namespace {
    std::string kind;
    std::string user_id;

    std::string to_string() const { return kind + "/" + user_id; }

    bool operator==(const Namespace& other) const {
        return kind == other.kind && user_id == other.user_id;
    }
};

namespace ns {

inline Namespace user_facts(const std::string& user_id) { return {"user_facts", user_id}; }
inline Namespace constraints(const std::string& user_id) { return {"constraints", user_id}; }
inline Namespace pending_confirmations(const std::string& user_id) {
    return {"pending_confirmations", user_id};
}

} // namespace ns

struct StoreItem {
    std::string key;
    nlohmann::json value;
};

class FactStore {
public:
    virtual ~FactStore() = default;

    // All items of a namespace, ordered by key
    virtual std::vector<StoreItem> search(const Namespace& ns) = 0;
    virtual std::optional<nlohmann::json> get(const Namespace& ns, const std::string& key) = 0;
    virtual void put(const Namespace& ns, const std::string& key, const nlohmann::json& value) = 0;
    virtual void remove(const Namespace& ns, const std::string& key) = 0;
};

// Process-local store for tests and the stateless tool mode
class MemoryFactStore : public FactStore {
public:
    std::vector<StoreItem> search(const Namespace& ns) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<StoreItem> items;
        auto it = data_.find(ns.to_string());
        if (it == data_.end()) return items;
        for (const auto& [key, value] : it->second) {
            items.push_back({key, value});
        }
        return items;
    }

    std::optional<nlohmann::json> get(const Namespace& ns, const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = data_.find(ns.to_string());
        if (it == data_.end()) return std::nullopt;
        auto kit = it->second.find(key);
        if (kit == it->second.end()) return std::nullopt;
        return kit->second;
    }

    void put(const Namespace& ns, const std::string& key, const nlohmann::json& value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        data_[ns.to_string()][key] = value;
    }

    void remove(const Namespace& ns, const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = data_.find(ns.to_string());
        if (it == data_.end()) return;
        it->second.erase(key);
        if (it->second.empty()) data_.erase(it);
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t total = 0;
        for (const auto& [_, items] : data_) total += items.size();
        return total;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::map<std::string, nlohmann::json>> data_;
};

} // namespace warden
