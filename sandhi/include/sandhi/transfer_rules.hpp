#pragma once
// Transfer Rules: declarative description of when the active intent changes
//
// A rule names where it applies (from), where it goes (to), what kind of
// switch it is (trigger), and the conditions that must all hold. Lower
// priority is evaluated first.

#include "errors.hpp"
#include "types.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace sandhi {

enum class TriggerKind : uint8_t {
    ExplicitChange = 0,
    Interruption = 1,
    SystemSuggestion = 2,
    ContextDriven = 3,
    UserClarification = 4,
    Timeout = 5,
    ErrorRecovery = 6,
};

enum class ConditionKind : uint8_t {
    ConfidenceThreshold = 0,
    PatternMatch = 1,
    ContextMatch = 2,
    SlotCompletion = 3,
    SemanticSimilarity = 4,
};

// How the caller should mutate the stack
enum class TransferType : uint8_t {
    None = 0,
    PushOnly = 1,
    PopOnly = 2,
    PopThenPush = 3,
};

inline const char* trigger_name(TriggerKind t) {
    switch (t) {
        case TriggerKind::ExplicitChange: return "explicit_change";
        case TriggerKind::Interruption: return "interruption";
        case TriggerKind::SystemSuggestion: return "system_suggestion";
        case TriggerKind::ContextDriven: return "context_driven";
        case TriggerKind::UserClarification: return "user_clarification";
        case TriggerKind::Timeout: return "timeout";
        case TriggerKind::ErrorRecovery: return "error_recovery";
    }
    return "unknown";
}

inline std::optional<TriggerKind> parse_trigger(const std::string& s) {
    if (s == "explicit_change") return TriggerKind::ExplicitChange;
    if (s == "interruption") return TriggerKind::Interruption;
    if (s == "system_suggestion") return TriggerKind::SystemSuggestion;
    if (s == "context_driven") return TriggerKind::ContextDriven;
    if (s == "user_clarification") return TriggerKind::UserClarification;
    if (s == "timeout") return TriggerKind::Timeout;
    if (s == "error_recovery") return TriggerKind::ErrorRecovery;
    return std::nullopt;
}

inline const char* condition_name(ConditionKind c) {
    switch (c) {
        case ConditionKind::ConfidenceThreshold: return "confidence_threshold";
        case ConditionKind::PatternMatch: return "pattern_match";
        case ConditionKind::ContextMatch: return "context_match";
        case ConditionKind::SlotCompletion: return "slot_completion";
        case ConditionKind::SemanticSimilarity: return "semantic_similarity";
    }
    return "unknown";
}

inline std::optional<ConditionKind> parse_condition(const std::string& s) {
    if (s == "confidence_threshold") return ConditionKind::ConfidenceThreshold;
    if (s == "pattern_match") return ConditionKind::PatternMatch;
    if (s == "context_match") return ConditionKind::ContextMatch;
    if (s == "slot_completion") return ConditionKind::SlotCompletion;
    if (s == "semantic_similarity") return ConditionKind::SemanticSimilarity;
    return std::nullopt;
}

inline const char* transfer_type_name(TransferType t) {
    switch (t) {
        case TransferType::None: return "none";
        case TransferType::PushOnly: return "push_only";
        case TransferType::PopOnly: return "pop_only";
        case TransferType::PopThenPush: return "pop_then_push";
    }
    return "unknown";
}

// Stack mutation implied by a trigger; a clarification back to the previous
// intent is the only pop-only case
inline TransferType transfer_type_for(TriggerKind trigger, bool to_previous) {
    switch (trigger) {
        case TriggerKind::ExplicitChange: return TransferType::PopThenPush;
        case TriggerKind::Interruption:
        case TriggerKind::SystemSuggestion:
        case TriggerKind::ContextDriven:
        case TriggerKind::Timeout:
        case TriggerKind::ErrorRecovery:
            return TransferType::PushOnly;
        case TriggerKind::UserClarification:
            return to_previous ? TransferType::PopOnly : TransferType::PushOnly;
    }
    return TransferType::None;
}

// Intent reference in a rule: a concrete name, any intent, or the intent
// beneath the current top (to side only)
struct IntentPattern {
    enum class Kind : uint8_t { Specific, Any, Previous };

    Kind kind = Kind::Any;
    std::string name;   // Set for Specific only

    static IntentPattern specific(std::string n) { return {Kind::Specific, std::move(n)}; }
    static IntentPattern any() { return {Kind::Any, {}}; }
    static IntentPattern previous() { return {Kind::Previous, {}}; }

    bool is_any() const { return kind == Kind::Any; }
    bool is_previous() const { return kind == Kind::Previous; }

    bool matches(const std::string& intent) const {
        switch (kind) {
            case Kind::Any: return true;
            case Kind::Specific: return name == intent;
            case Kind::Previous: return false;
        }
        return false;
    }

    // Text form used in config files and logs
    std::string str() const {
        switch (kind) {
            case Kind::Any: return "*";
            case Kind::Previous: return "previous";
            case Kind::Specific: return name;
        }
        return name;
    }

    static IntentPattern parse(const std::string& s) {
        if (s == "*" || s == "any") return any();
        if (s == "previous") return previous();
        return specific(s);
    }
};

struct TransferRule {
    std::string id;
    IntentPattern from = IntentPattern::any();
    IntentPattern to = IntentPattern::any();
    TriggerKind trigger = TriggerKind::ExplicitChange;
    std::vector<ConditionKind> conditions;
    double confidence_threshold = 0.7;
    double similarity_threshold = 0.5;    // SemanticSimilarity cutoff
    int priority = 1;                     // Lower first
    std::vector<std::string> patterns;    // Literal, case-insensitive
    ValueMap context_requirements;
    bool enabled = true;
    std::string description;

    bool has_condition(ConditionKind c) const {
        for (auto k : conditions) {
            if (k == c) return true;
        }
        return false;
    }
};

inline void to_json(json& j, const TransferRule& r) {
    json conditions = json::array();
    for (auto c : r.conditions) conditions.push_back(condition_name(c));
    j = json{
        {"id", r.id},
        {"from", r.from.str()},
        {"to", r.to.str()},
        {"trigger", trigger_name(r.trigger)},
        {"conditions", conditions},
        {"confidence_threshold", r.confidence_threshold},
        {"similarity_threshold", r.similarity_threshold},
        {"priority", r.priority},
        {"patterns", r.patterns},
        {"context_requirements", r.context_requirements},
        {"enabled", r.enabled},
        {"description", r.description}
    };
}

// Throws std::invalid_argument on unknown trigger/condition names
inline void from_json(const json& j, TransferRule& r) {
    r.id = j.at("id").get<std::string>();
    if (r.id.empty()) throw std::invalid_argument("transfer rule without id");
    r.from = IntentPattern::parse(j.value("from", std::string("*")));
    if (r.from.is_previous()) {
        throw std::invalid_argument("rule " + r.id + ": 'previous' is only valid as a target");
    }
    r.to = IntentPattern::parse(j.value("to", std::string("*")));

    auto trigger = parse_trigger(j.at("trigger").get<std::string>());
    if (!trigger) throw std::invalid_argument("rule " + r.id + ": unknown trigger");
    r.trigger = *trigger;

    r.conditions.clear();
    for (const auto& c : j.value("conditions", json::array())) {
        auto kind = parse_condition(c.get<std::string>());
        if (!kind) {
            throw std::invalid_argument("rule " + r.id + ": unknown condition " + c.dump());
        }
        r.conditions.push_back(*kind);
    }

    r.confidence_threshold = j.value("confidence_threshold", r.confidence_threshold);
    r.similarity_threshold = j.value("similarity_threshold", r.similarity_threshold);
    r.priority = j.value("priority", r.priority);
    r.patterns = j.value("patterns", std::vector<std::string>{});
    r.context_requirements = j.value("context_requirements", ValueMap{});
    r.enabled = j.value("enabled", true);
    r.description = j.value("description", std::string{});
}

struct TransferDecision {
    bool should_transfer = false;
    std::string target_intent;              // Resolved; never the literal "previous"
    bool to_previous = false;               // Target came from a "go back"
    std::optional<TriggerKind> trigger;
    double confidence = 0.0;
    std::string rule_id;                    // Empty for special cases
    std::string reason;
    TransferType transfer_type = TransferType::None;
    bool save_context = false;              // Interrupted frame keeps its context
    ErrorCode error = ErrorCode::None;      // SourceUnavailable when classification failed

    static TransferDecision none(std::string why) {
        TransferDecision d;
        d.reason = std::move(why);
        return d;
    }
};

inline void to_json(json& j, const TransferDecision& d) {
    j = json{
        {"should_transfer", d.should_transfer},
        {"target_intent", d.should_transfer ? json(d.target_intent) : json(nullptr)},
        {"trigger", d.trigger ? json(trigger_name(*d.trigger)) : json(nullptr)},
        {"confidence", d.confidence},
        {"rule_id", d.rule_id.empty() ? json(nullptr) : json(d.rule_id)},
        {"reason", d.reason},
        {"transfer_type", transfer_type_name(d.transfer_type)},
        {"save_context", d.save_context}
    };
    if (d.error != ErrorCode::None) j["error"] = error_name(d.error);
}

} // namespace sandhi
