#pragma once
// Slot Inheritance: fill missing slot values from prior context
//
// Rules are processed in descending priority (ties keep registration
// order). Each rule either applies or is skipped with a reason:
//
//   1. SUPPLEMENT and target already filled    "already has value"
//   2. source kind unavailable                  "source unavailable"
//   3. condition false                          "condition false"
//   4. source value older than the rule's TTL   "TTL expired"
//   5. no source value                          "source empty"
//   6. transform name not registered            "unknown transform"
//
// The engine only adds keys or replaces targeted ones; it never removes a
// key that was present in the input.

#include "collaborators.hpp"
#include "transforms.hpp"
#include "types.hpp"
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace sandhi {

enum class SourceKind : uint8_t {
    Context = 0,      // Conversation history
    Session = 1,
    UserProfile = 2,
    Dependency = 3,   // Other slots of the same intent
    Default = 4,
};

enum class MergeStrategy : uint8_t {
    Override = 0,
    Merge = 1,
    Supplement = 2,
    Conditional = 3,  // Gated by its condition, then overrides
};

inline const char* source_kind_name(SourceKind k) {
    switch (k) {
        case SourceKind::Context: return "context";
        case SourceKind::Session: return "session";
        case SourceKind::UserProfile: return "user_profile";
        case SourceKind::Dependency: return "dependency";
        case SourceKind::Default: return "default";
    }
    return "unknown";
}

inline std::optional<SourceKind> parse_source_kind(const std::string& s) {
    if (s == "context") return SourceKind::Context;
    if (s == "session") return SourceKind::Session;
    if (s == "user_profile") return SourceKind::UserProfile;
    if (s == "dependency") return SourceKind::Dependency;
    if (s == "default") return SourceKind::Default;
    return std::nullopt;
}

// Human-readable origin, used in InheritanceResult::sources
inline const char* source_description(SourceKind k) {
    switch (k) {
        case SourceKind::Context: return "conversation history";
        case SourceKind::Session: return "session context";
        case SourceKind::UserProfile: return "user profile";
        case SourceKind::Dependency: return "dependent slot";
        case SourceKind::Default: return "default value";
    }
    return "unknown source";
}

inline const char* strategy_name(MergeStrategy s) {
    switch (s) {
        case MergeStrategy::Override: return "override";
        case MergeStrategy::Merge: return "merge";
        case MergeStrategy::Supplement: return "supplement";
        case MergeStrategy::Conditional: return "conditional";
    }
    return "unknown";
}

inline std::optional<MergeStrategy> parse_strategy(const std::string& s) {
    if (s == "override") return MergeStrategy::Override;
    if (s == "merge") return MergeStrategy::Merge;
    if (s == "supplement") return MergeStrategy::Supplement;
    if (s == "conditional") return MergeStrategy::Conditional;
    return std::nullopt;
}

struct InheritanceCondition {
    enum class Kind : uint8_t { Always, SlotEmpty, SlotEquals, UserAttribute, TimeWindow };

    Kind kind = Kind::Always;
    std::string slot;                 // SlotEmpty, SlotEquals
    std::string attribute;            // UserAttribute
    Value value;                      // SlotEquals, UserAttribute
    int64_t max_age_seconds = 3600;   // TimeWindow

    static InheritanceCondition always() { return {}; }

    static InheritanceCondition slot_empty(std::string slot) {
        InheritanceCondition c;
        c.kind = Kind::SlotEmpty;
        c.slot = std::move(slot);
        return c;
    }

    static InheritanceCondition slot_equals(std::string slot, Value value) {
        InheritanceCondition c;
        c.kind = Kind::SlotEquals;
        c.slot = std::move(slot);
        c.value = std::move(value);
        return c;
    }

    static InheritanceCondition user_attribute(std::string attribute, Value value) {
        InheritanceCondition c;
        c.kind = Kind::UserAttribute;
        c.attribute = std::move(attribute);
        c.value = std::move(value);
        return c;
    }

    static InheritanceCondition time_window(int64_t max_age_seconds) {
        InheritanceCondition c;
        c.kind = Kind::TimeWindow;
        c.max_age_seconds = max_age_seconds;
        return c;
    }
};

struct InheritanceRule {
    std::string source_slot;
    std::string target_slot;
    SourceKind source = SourceKind::Context;
    MergeStrategy strategy = MergeStrategy::Supplement;
    std::optional<InheritanceCondition> condition;
    std::string transform;                // Empty = none
    int priority = 0;                     // Higher first
    std::optional<int64_t> ttl_seconds;

    std::string describe() const {
        return std::string(source_kind_name(source)) + ":" + source_slot + "->" + target_slot;
    }
};

// Everything the engine may read, gathered by the caller for one pass
struct SourceBundle {
    std::map<SourceKind, SourceMap> values;
    std::set<SourceKind> unavailable;
    Timestamp now = 0;

    void set(SourceKind kind, const std::string& slot, Value value, Timestamp ts = 0) {
        values[kind][slot] = SourceValue{std::move(value), ts};
    }

    void set_all(SourceKind kind, SourceMap map) {
        values[kind] = std::move(map);
    }

    void mark_unavailable(SourceKind kind) {
        unavailable.insert(kind);
    }

    bool available(SourceKind kind) const {
        return unavailable.count(kind) == 0;
    }

    const SourceValue* find(SourceKind kind, const std::string& slot) const {
        auto bucket = values.find(kind);
        if (bucket == values.end()) return nullptr;
        auto it = bucket->second.find(slot);
        return it != bucket->second.end() ? &it->second : nullptr;
    }
};

struct InheritanceResult {
    ValueMap values;                                   // Superset of the input
    std::map<std::string, std::string> sources;        // slot -> description
    std::vector<InheritanceRule> applied;
    std::vector<std::pair<InheritanceRule, std::string>> skipped;
    bool from_cache = false;

    // Slots this pass filled or changed
    ValueMap inherited() const {
        ValueMap out;
        for (const auto& [slot, _] : sources) {
            auto it = values.find(slot);
            if (it != values.end()) out[slot] = it->second;
        }
        return out;
    }
};

class SlotInheritanceEngine {
public:
    explicit SlotInheritanceEngine(TransformRegistry transforms = TransformRegistry::with_builtins(),
                                   bool verbose = false);

    void add_rule(InheritanceRule rule);
    size_t remove_rules_for(const std::string& target_slot);
    void clear_rules();
    std::vector<InheritanceRule> rules() const;

    TransformRegistry& transforms() { return transforms_; }

    InheritanceResult inherit(const std::vector<std::string>& required_slots,
                              const ValueMap& current_values,
                              const SourceBundle& sources) const;

private:
    // Reason to skip, or nullopt if the rule may apply
    std::optional<std::string> check_rule(const InheritanceRule& rule, const ValueMap& values,
                                          const SourceBundle& sources) const;
    bool condition_holds(const InheritanceCondition& cond, const InheritanceRule& rule,
                         const ValueMap& values, const SourceBundle& sources) const;
    static Value combine(MergeStrategy strategy, const Value& incoming, const Value* existing);

    TransformRegistry transforms_;
    bool verbose_;
    mutable std::shared_mutex mutex_;
    std::vector<InheritanceRule> rules_;
};

} // namespace sandhi
