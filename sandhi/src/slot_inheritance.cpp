// Slot Inheritance: rule walk, conditions and merge strategies

#include <sandhi/slot_inheritance.hpp>
#include <algorithm>
#include <iostream>

namespace sandhi {

SlotInheritanceEngine::SlotInheritanceEngine(TransformRegistry transforms, bool verbose)
    : transforms_(std::move(transforms))
    , verbose_(verbose)
{}

void SlotInheritanceEngine::add_rule(InheritanceRule rule) {
    std::unique_lock lock(mutex_);
    rules_.push_back(std::move(rule));
    std::stable_sort(rules_.begin(), rules_.end(),
                     [](const InheritanceRule& a, const InheritanceRule& b) {
                         return a.priority > b.priority;
                     });
}

size_t SlotInheritanceEngine::remove_rules_for(const std::string& target_slot) {
    std::unique_lock lock(mutex_);
    size_t before = rules_.size();
    rules_.erase(std::remove_if(rules_.begin(), rules_.end(),
                                [&](const InheritanceRule& r) {
                                    return r.target_slot == target_slot;
                                }),
                 rules_.end());
    return before - rules_.size();
}

void SlotInheritanceEngine::clear_rules() {
    std::unique_lock lock(mutex_);
    rules_.clear();
}

std::vector<InheritanceRule> SlotInheritanceEngine::rules() const {
    std::shared_lock lock(mutex_);
    return rules_;
}

bool SlotInheritanceEngine::condition_holds(const InheritanceCondition& cond,
                                            const InheritanceRule& rule,
                                            const ValueMap& values,
                                            const SourceBundle& sources) const {
    switch (cond.kind) {
        case InheritanceCondition::Kind::Always:
            return true;

        case InheritanceCondition::Kind::SlotEmpty:
            return !has_filled(values, cond.slot);

        case InheritanceCondition::Kind::SlotEquals: {
            auto it = values.find(cond.slot);
            Value actual = it != values.end() ? it->second : Value();
            return value_to_string(actual) == value_to_string(cond.value);
        }

        case InheritanceCondition::Kind::UserAttribute: {
            const SourceValue* attr = sources.find(SourceKind::UserProfile, cond.attribute);
            if (!attr) return false;
            return value_to_string(attr->value) == value_to_string(cond.value);
        }

        case InheritanceCondition::Kind::TimeWindow: {
            // Needs a dated source value; unknown age never qualifies
            const SourceValue* src = sources.find(rule.source, rule.source_slot);
            if (!src || src->timestamp == 0) return false;
            return sources.now - src->timestamp <= seconds_to_ms(cond.max_age_seconds);
        }
    }
    return false;
}

std::optional<std::string> SlotInheritanceEngine::check_rule(const InheritanceRule& rule,
                                                              const ValueMap& values,
                                                              const SourceBundle& sources) const {
    if (rule.strategy == MergeStrategy::Supplement && has_filled(values, rule.target_slot)) {
        return std::string("already has value");
    }
    if (!sources.available(rule.source)) {
        return std::string("source unavailable");
    }
    if (rule.condition && !condition_holds(*rule.condition, rule, values, sources)) {
        return std::string("condition false");
    }

    const SourceValue* src = sources.find(rule.source, rule.source_slot);
    if (rule.ttl_seconds && src && src->timestamp != 0 &&
        sources.now - src->timestamp > seconds_to_ms(*rule.ttl_seconds)) {
        return std::string("TTL expired");
    }
    if (!src || src->value.is_null()) {
        return std::string("source empty");
    }
    return std::nullopt;
}

Value SlotInheritanceEngine::combine(MergeStrategy strategy, const Value& incoming,
                                     const Value* existing) {
    switch (strategy) {
        case MergeStrategy::Override:
        case MergeStrategy::Conditional:
            return incoming;

        case MergeStrategy::Supplement:
            return (existing && is_filled(*existing)) ? *existing : incoming;

        case MergeStrategy::Merge:
            if (existing && existing->is_array() && incoming.is_array()) {
                Value merged = *existing;
                for (const auto& item : incoming) {
                    if (std::find(merged.begin(), merged.end(), item) == merged.end()) {
                        merged.push_back(item);
                    }
                }
                return merged;
            }
            if (existing && existing->is_object() && incoming.is_object()) {
                Value merged = *existing;
                merged.update(incoming);
                return merged;
            }
            return incoming;
    }
    return incoming;
}

InheritanceResult SlotInheritanceEngine::inherit(const std::vector<std::string>& required_slots,
                                                 const ValueMap& current_values,
                                                 const SourceBundle& sources) const {
    InheritanceResult result;
    result.values = current_values;

    std::set<std::string> required(required_slots.begin(), required_slots.end());
    for (const auto& rule : rules()) {
        if (!required.count(rule.target_slot)) continue;

        try {
            if (auto reason = check_rule(rule, result.values, sources)) {
                result.skipped.emplace_back(rule, *reason);
                continue;
            }

            Value incoming = sources.find(rule.source, rule.source_slot)->value;
            if (!rule.transform.empty()) {
                auto transformed = transforms_.apply(rule.transform, incoming);
                if (!transformed) {
                    result.skipped.emplace_back(rule, "unknown transform");
                    continue;
                }
                incoming = std::move(*transformed);
            }

            auto existing = result.values.find(rule.target_slot);
            const Value* prior = existing != result.values.end() ? &existing->second : nullptr;
            result.values[rule.target_slot] = combine(rule.strategy, incoming, prior);
            result.sources[rule.target_slot] =
                std::string(source_description(rule.source)) + " (" + rule.source_slot + ")";
            result.applied.push_back(rule);

            if (verbose_) {
                std::cerr << "[SlotInheritance] " << rule.target_slot << " <- "
                          << result.sources[rule.target_slot] << "\n";
            }
        } catch (const std::exception& e) {
            std::cerr << "[SlotInheritance] Rule " << rule.describe()
                      << " failed: " << e.what() << "\n";
            result.skipped.emplace_back(rule, std::string("error: ") + e.what());
        }
    }
    return result;
}

} // namespace sandhi
