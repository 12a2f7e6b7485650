#pragma once
// Intent Catalog: which intents exist and which slots each one requires
//
// The stack consults the catalog on push (unknown intents are rejected) and
// when recomputing completion progress. The catalog is read-mostly; the
// static implementation guards registrations with a reader/writer lock.

#include "types.hpp"
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sandhi {

struct IntentInfo {
    std::string name;
    std::string id;                            // Stable id used in cache keys
    std::vector<std::string> required_slots;
    std::vector<std::string> keywords;         // Only used by KeywordClassifier
    std::string description;
};

inline void to_json(json& j, const IntentInfo& info) {
    j = json{
        {"name", info.name},
        {"id", info.id},
        {"required_slots", info.required_slots},
        {"keywords", info.keywords},
        {"description", info.description}
    };
}

inline void from_json(const json& j, IntentInfo& info) {
    info.name = j.at("name").get<std::string>();
    info.id = j.contains("id") ? value_to_string(j.at("id")) : info.name;
    info.required_slots = j.value("required_slots", std::vector<std::string>{});
    info.keywords = j.value("keywords", std::vector<std::string>{});
    info.description = j.value("description", std::string{});
}

class IntentCatalog {
public:
    virtual ~IntentCatalog() = default;
    virtual std::optional<IntentInfo> find(const std::string& intent_name) const = 0;

    std::vector<std::string> required_slots(const std::string& intent_name) const {
        auto info = find(intent_name);
        return info ? info->required_slots : std::vector<std::string>{};
    }
};

class StaticIntentCatalog : public IntentCatalog {
public:
    StaticIntentCatalog() = default;

    // Register (or replace) an intent
    void add(IntentInfo info) {
        if (info.id.empty()) info.id = info.name;
        std::unique_lock lock(mutex_);
        intents_[info.name] = std::move(info);
    }

    void add(const std::string& name, std::vector<std::string> required_slots) {
        IntentInfo info;
        info.name = name;
        info.id = name;
        info.required_slots = std::move(required_slots);
        add(std::move(info));
    }

    bool remove(const std::string& name) {
        std::unique_lock lock(mutex_);
        return intents_.erase(name) > 0;
    }

    // Reserved transfer targets (timeout, error recovery, session end) carry
    // no slots but must be pushable
    void add_system_intents(const std::vector<std::string>& names) {
        for (const auto& name : names) {
            if (!find(name)) add(name, {});
        }
    }

    // Load entries from a JSON array; returns number loaded
    size_t load(const json& entries) {
        size_t loaded = 0;
        if (!entries.is_array()) return 0;
        for (const auto& entry : entries) {
            add(entry.get<IntentInfo>());
            ++loaded;
        }
        return loaded;
    }

    std::optional<IntentInfo> find(const std::string& intent_name) const override {
        std::shared_lock lock(mutex_);
        auto it = intents_.find(intent_name);
        if (it == intents_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<IntentInfo> all() const {
        std::shared_lock lock(mutex_);
        std::vector<IntentInfo> out;
        out.reserve(intents_.size());
        for (const auto& [_, info] : intents_) out.push_back(info);
        return out;
    }

    size_t size() const {
        std::shared_lock lock(mutex_);
        return intents_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, IntentInfo> intents_;
};

} // namespace sandhi
