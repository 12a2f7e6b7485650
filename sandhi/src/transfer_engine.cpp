// Transfer Engine: special cases, rule walk, execution

#include <sandhi/transfer_engine.hpp>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <set>

namespace sandhi {

namespace {

std::set<std::string> tokenize(const std::string& text) {
    std::set<std::string> tokens;
    std::string word;
    auto flush = [&]() {
        if (!word.empty()) {
            tokens.insert(word);
            word.clear();
        }
    };

    for (size_t i = 0; i < text.size();) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (c < 0x80) {
            if (std::isalnum(c)) {
                word += static_cast<char>(std::tolower(c));
            } else {
                flush();
            }
            ++i;
            continue;
        }
        flush();
        size_t len = (c >= 0xF0) ? 4 : (c >= 0xE0) ? 3 : (c >= 0xC0) ? 2 : 1;
        tokens.insert(text.substr(i, len));
        i += len;
    }
    flush();
    return tokens;
}

InterruptionKind interruption_for(TriggerKind trigger) {
    switch (trigger) {
        case TriggerKind::ExplicitChange:
        case TriggerKind::Interruption:
            return InterruptionKind::UserInitiated;
        case TriggerKind::SystemSuggestion: return InterruptionKind::SystemSuggestion;
        case TriggerKind::ContextDriven: return InterruptionKind::ContextSwitch;
        case TriggerKind::UserClarification: return InterruptionKind::Clarification;
        case TriggerKind::Timeout:
        case TriggerKind::ErrorRecovery:
            return InterruptionKind::UrgentInterruption;
    }
    return InterruptionKind::UserInitiated;
}

bool sort_by_priority(const TransferRule& a, const TransferRule& b) {
    return a.priority < b.priority;
}

} // namespace

double token_similarity(const std::string& a, const std::string& b) {
    auto ta = tokenize(a);
    auto tb = tokenize(b);
    if (ta.empty() || tb.empty()) return 0.0;

    size_t common = 0;
    for (const auto& t : ta) {
        if (tb.count(t)) ++common;
    }
    size_t total = ta.size() + tb.size() - common;
    return static_cast<double>(common) / static_cast<double>(total);
}

TransferEngine::TransferEngine(IntentStackStore& stacks, KVStore& store,
                               Classifier& classifier, TransferConfig config, Clock clock)
    : stacks_(stacks)
    , store_(store)
    , classifier_(classifier)
    , config_(std::move(config))
    , clock_(std::move(clock))
    , log_(store, config_)
{}

// ═══════════════════════════════════════════════════════════════════════════
// Rules
// ═══════════════════════════════════════════════════════════════════════════

void TransferEngine::add_rule(TransferRule rule) {
    std::unique_lock lock(rules_mutex_);
    erase_rule_locked(rule.id);

    std::vector<TransferRule>* bucket = rule.from.is_any()
        ? &any_rules_ : &specific_rules_[rule.from.name];
    if (config_.verbose) {
        std::cerr << "[TransferEngine] Added rule " << rule.id << " ("
                  << rule.from.str() << " -> " << rule.to.str() << ")\n";
    }
    bucket->push_back(std::move(rule));
    std::stable_sort(bucket->begin(), bucket->end(), sort_by_priority);
}

bool TransferEngine::remove_rule(const std::string& id) {
    std::unique_lock lock(rules_mutex_);
    return erase_rule_locked(id);
}

bool TransferEngine::erase_rule_locked(const std::string& id) {
    auto erase_from = [&id](std::vector<TransferRule>& rules) {
        auto it = std::find_if(rules.begin(), rules.end(),
                               [&id](const TransferRule& r) { return r.id == id; });
        if (it == rules.end()) return false;
        rules.erase(it);
        return true;
    };

    if (erase_from(any_rules_)) return true;
    for (auto it = specific_rules_.begin(); it != specific_rules_.end(); ++it) {
        if (erase_from(it->second)) {
            if (it->second.empty()) specific_rules_.erase(it);
            return true;
        }
    }
    return false;
}

std::vector<TransferRule> TransferEngine::rules_for(const std::string& current_intent) const {
    std::shared_lock lock(rules_mutex_);
    std::vector<TransferRule> out;
    auto it = specific_rules_.find(current_intent);
    if (it != specific_rules_.end()) out = it->second;
    out.insert(out.end(), any_rules_.begin(), any_rules_.end());
    // Stable: on equal priority, intent-specific rules precede wildcard ones
    std::stable_sort(out.begin(), out.end(), sort_by_priority);
    return out;
}

std::vector<TransferRule> TransferEngine::rules() const {
    std::shared_lock lock(rules_mutex_);
    std::vector<TransferRule> out;
    for (const auto& [_, bucket] : specific_rules_) {
        out.insert(out.end(), bucket.begin(), bucket.end());
    }
    out.insert(out.end(), any_rules_.begin(), any_rules_.end());
    std::stable_sort(out.begin(), out.end(), sort_by_priority);
    return out;
}

size_t TransferEngine::rule_count() const {
    std::shared_lock lock(rules_mutex_);
    size_t n = any_rules_.size();
    for (const auto& [_, bucket] : specific_rules_) n += bucket.size();
    return n;
}

void TransferEngine::install_default_rules() {
    TransferRule explicit_change;
    explicit_change.id = "explicit_change_all";
    explicit_change.trigger = TriggerKind::ExplicitChange;
    explicit_change.conditions = {ConditionKind::ConfidenceThreshold};
    explicit_change.confidence_threshold = 0.8;
    explicit_change.priority = 1;
    explicit_change.description = "explicit intent change";
    add_rule(std::move(explicit_change));

    TransferRule query;
    query.id = "query_interruption";
    query.to = IntentPattern::specific("check_balance");
    query.trigger = TriggerKind::Interruption;
    query.conditions = {ConditionKind::PatternMatch};
    query.confidence_threshold = 0.6;
    query.priority = 2;
    query.patterns = {"余额", "账户", "balance"};
    query.description = "balance query interrupts the current task";
    add_rule(std::move(query));

    TransferRule suggestion;
    suggestion.id = "booking_suggestion";
    suggestion.from = IntentPattern::specific("check_balance");
    suggestion.to = IntentPattern::specific("book_flight");
    suggestion.trigger = TriggerKind::SystemSuggestion;
    suggestion.conditions = {ConditionKind::ContextMatch};
    suggestion.confidence_threshold = 0.5;
    suggestion.priority = 3;
    suggestion.context_requirements = {{"balance_sufficient", true}};
    suggestion.description = "suggest booking when the balance is sufficient";
    add_rule(std::move(suggestion));

    TransferRule cancel;
    cancel.id = "cancel_return";
    cancel.to = IntentPattern::previous();
    cancel.trigger = TriggerKind::UserClarification;
    cancel.conditions = {ConditionKind::PatternMatch};
    cancel.confidence_threshold = 0.4;
    cancel.priority = 0;
    cancel.patterns = {"取消", "返回", "回去", "cancel", "back"};
    cancel.description = "cancel or return to the previous intent";
    add_rule(std::move(cancel));
}

size_t TransferEngine::load_rules(const json& entries, std::string* error) {
    if (!entries.is_array()) {
        if (error) *error = "transfer rules must be a JSON array";
        return 0;
    }

    size_t loaded = 0;
    for (const auto& entry : entries) {
        try {
            add_rule(entry.get<TransferRule>());
            ++loaded;
        } catch (const json::exception& e) {
            std::cerr << "[TransferEngine] Skipping malformed rule: " << e.what() << "\n";
            if (error) *error = e.what();
        } catch (const std::invalid_argument& e) {
            std::cerr << "[TransferEngine] Skipping rule: " << e.what() << "\n";
            if (error) *error = e.what();
        }
    }
    return loaded;
}

// ═══════════════════════════════════════════════════════════════════════════
// Activity
// ═══════════════════════════════════════════════════════════════════════════

bool TransferEngine::record_activity(const std::string& session) {
    try {
        // No store TTL: a stamp must survive any silence longer than the window
        store_.set(activity_key(session), std::to_string(clock_()));
        return true;
    } catch (const StoreError& e) {
        std::cerr << "[TransferEngine] Cannot record activity for " << session
                  << ": " << e.what() << "\n";
        return false;
    }
}

std::optional<Timestamp> TransferEngine::last_activity(const std::string& session) {
    auto raw = store_.get(activity_key(session));
    if (!raw) return std::nullopt;
    try {
        return static_cast<Timestamp>(std::stoll(*raw));
    } catch (const std::exception&) {
        std::cerr << "[TransferEngine] Ignoring unreadable activity stamp for "
                  << session << "\n";
        return std::nullopt;
    }
}

bool TransferEngine::timed_out(const std::string& session) {
    try {
        auto last = last_activity(session);
        if (!last) return false;
        return clock_() - *last > seconds_to_ms(config_.session_timeout_seconds);
    } catch (const StoreError& e) {
        std::cerr << "[TransferEngine] Timeout check failed for " << session
                  << ": " << e.what() << "\n";
        return false;
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Evaluation
// ═══════════════════════════════════════════════════════════════════════════

std::string TransferEngine::resolve_previous(const std::string& session) {
    try {
        auto frames = stacks_.frames(session);
        if (frames.size() >= 2) return frames[frames.size() - 2].intent_name;
    } catch (const StoreError& e) {
        std::cerr << "[TransferEngine] Cannot resolve previous intent for " << session
                  << ": " << e.what() << "\n";
    }
    return "unknown";
}

std::optional<TransferDecision> TransferEngine::special_case(const std::string& session,
                                                             const std::string& input,
                                                             const ValueMap& context) {
    auto decide = [](std::string target, TriggerKind trigger, double confidence,
                     std::string reason, bool to_previous) {
        TransferDecision d;
        d.should_transfer = true;
        d.target_intent = std::move(target);
        d.to_previous = to_previous;
        d.trigger = trigger;
        d.confidence = confidence;
        d.reason = std::move(reason);
        d.transfer_type = transfer_type_for(trigger, to_previous);
        return d;
    };

    if (timed_out(session)) {
        return decide(config_.timeout_target, TriggerKind::Timeout, 1.0,
                      "session timed out", false);
    }

    auto errors = context.find(config_.error_count_key);
    if (errors != context.end() && errors->second.is_number() &&
        errors->second.get<double>() >= config_.error_threshold) {
        return decide(config_.error_target, TriggerKind::ErrorRecovery, 1.0,
                      "too many consecutive errors", false);
    }

    for (const auto& pattern : config_.back_patterns) {
        if (contains_ci(input, pattern)) {
            return decide(resolve_previous(session), TriggerKind::UserClarification, 0.9,
                          "user asked to go back", true);
        }
    }
    for (const auto& pattern : config_.exit_patterns) {
        if (contains_ci(input, pattern)) {
            return decide(config_.exit_target, TriggerKind::UserClarification, 0.9,
                          "user asked to exit", false);
        }
    }
    return std::nullopt;
}

bool TransferEngine::rule_holds(const TransferRule& rule, const std::string& session,
                                const std::string& input, const ValueMap& context,
                                double confidence) {
    for (ConditionKind condition : rule.conditions) {
        switch (condition) {
            case ConditionKind::ConfidenceThreshold:
                if (confidence < rule.confidence_threshold) return false;
                break;

            case ConditionKind::PatternMatch: {
                if (rule.patterns.empty()) break;
                bool any = std::any_of(rule.patterns.begin(), rule.patterns.end(),
                    [&input](const std::string& p) { return contains_ci(input, p); });
                if (!any) return false;
                break;
            }

            case ConditionKind::ContextMatch:
                for (const auto& [key, expected] : rule.context_requirements) {
                    auto it = context.find(key);
                    if (it == context.end() || it->second != expected) return false;
                }
                break;

            case ConditionKind::SlotCompletion: {
                auto flag = context.find("slots_complete");
                if (flag != context.end() && flag->second.is_boolean() &&
                    flag->second.get<bool>()) {
                    break;
                }
                // Throws StoreError; the caller skips just this rule
                auto frame = stacks_.active(session);
                if (!frame || frame->completion_progress < 1.0) return false;
                break;
            }

            case ConditionKind::SemanticSimilarity: {
                double best = 0.0;
                for (const auto& p : rule.patterns) {
                    best = std::max(best, token_similarity(input, p));
                }
                if (best < rule.similarity_threshold) return false;
                break;
            }
        }
    }
    return true;
}

TransferDecision TransferEngine::evaluate(const std::string& session, const std::string& user,
                                          const std::string& current_intent,
                                          const std::string& input,
                                          const ValueMap& context) {
    if (auto special = special_case(session, input, context)) {
        if (config_.verbose) {
            std::cerr << "[TransferEngine] " << session << ": " << special->reason
                      << " -> " << special->target_intent << "\n";
        }
        return *special;
    }

    // Copies: a timed-out call keeps running after we return
    Classifier* classifier = &classifier_;
    std::string text = input;
    ValueMap ctx = context;
    std::string failure;
    auto classified = call_with_timeout(
        [classifier, text, ctx]() { return classifier->classify(text, ctx); },
        config_.classifier_timeout_ms, &failure);
    if (!classified) {
        std::cerr << "[TransferEngine] Classifier unavailable for " << session
                  << " (user " << user << "): " << failure << "\n";
        auto d = TransferDecision::none("classifier unavailable: " + failure);
        d.error = ErrorCode::SourceUnavailable;
        return d;
    }

    const std::string& candidate = classified->intent;
    if (candidate == current_intent) {
        auto d = TransferDecision::none("classified intent is the current intent");
        d.confidence = classified->confidence;
        return d;
    }

    for (const auto& rule : rules_for(current_intent)) {
        if (!rule.enabled) continue;
        if (!rule.to.is_previous() && !rule.to.matches(candidate)) continue;

        try {
            if (!rule_holds(rule, session, input, context, classified->confidence)) continue;
        } catch (const std::exception& e) {
            std::cerr << "[TransferEngine] Rule " << rule.id << " skipped: " << e.what() << "\n";
            continue;
        }

        TransferDecision d;
        d.should_transfer = true;
        d.to_previous = rule.to.is_previous();
        d.target_intent = d.to_previous ? resolve_previous(session) : candidate;
        d.trigger = rule.trigger;
        d.confidence = classified->confidence;
        d.rule_id = rule.id;
        d.reason = rule.description.empty() ? "rule " + rule.id : rule.description;
        d.transfer_type = transfer_type_for(rule.trigger, d.to_previous);
        d.save_context = rule.trigger == TriggerKind::Interruption ||
                         rule.trigger == TriggerKind::SystemSuggestion;

        if (config_.verbose) {
            std::cerr << "[TransferEngine] " << session << ": " << current_intent
                      << " -> " << d.target_intent << " (rule " << rule.id
                      << ", confidence " << d.confidence << ")\n";
        }
        return d;
    }

    auto d = TransferDecision::none("no transfer rule matched");
    d.confidence = classified->confidence;
    return d;
}

// ═══════════════════════════════════════════════════════════════════════════
// Execution
// ═══════════════════════════════════════════════════════════════════════════

ExecuteResult TransferEngine::execute(const std::string& session, const std::string& user,
                                      const TransferDecision& decision,
                                      const ValueMap& context) {
    if (!decision.should_transfer || !decision.trigger) {
        return ExecuteResult::failure(ErrorCode::InvalidArgument, "decision does not transfer");
    }

    std::optional<IntentFrame> current;
    try {
        current = stacks_.active(session);
    } catch (const StoreError& e) {
        return ExecuteResult::failure(ErrorCode::StoreFailure, e.what());
    }
    std::string from = current ? current->intent_name : std::string{};

    // Interrupted frame keeps a snapshot of the context it was suspended in
    if (decision.save_context && current && !context.empty()) {
        auto saved = stacks_.update_context(session, current->frame_id, context);
        if (!saved.ok()) {
            std::cerr << "[TransferEngine] Context not saved for " << session
                      << ": " << saved.message << "\n";
        }
    }

    ExecuteResult result;
    result.applied = decision.transfer_type;
    switch (decision.transfer_type) {
        case TransferType::PushOnly: {
            auto pushed = stacks_.push(session, user, decision.target_intent, context,
                                       interruption_for(*decision.trigger), decision.reason);
            if (!pushed.ok()) return ExecuteResult::failure(pushed.error, pushed.message);
            result.active = pushed.frame;
            result.depth = pushed.depth;
            break;
        }
        case TransferType::PopThenPush: {
            auto replaced = stacks_.replace_top(session, user, decision.target_intent,
                                                context, decision.reason);
            if (!replaced.ok()) return ExecuteResult::failure(replaced.error, replaced.message);
            result.active = replaced.frame;
            result.removed = replaced.replaced;
            result.depth = replaced.depth;
            break;
        }
        case TransferType::PopOnly: {
            auto popped = stacks_.pop(session, decision.reason);
            if (!popped.ok()) return ExecuteResult::failure(popped.error, popped.message);
            if (!popped.frame) {
                return ExecuteResult::failure(ErrorCode::FrameNotFound,
                                              "nothing to pop in " + session);
            }
            result.removed = popped.frame;
            result.active = popped.resumed;
            result.depth = popped.depth;
            break;
        }
        case TransferType::None:
            return ExecuteResult::failure(ErrorCode::InvalidArgument, "no transfer type");
    }

    log_transfer(session, user, from, decision);
    record_activity(session);

    if (config_.verbose) {
        std::cerr << "[TransferEngine] Executed " << transfer_type_name(decision.transfer_type)
                  << " " << (from.empty() ? "(none)" : from) << " -> "
                  << decision.target_intent << "\n";
    }
    return result;
}

void TransferEngine::log_transfer(const std::string& session, const std::string& user,
                                  const std::string& from, const TransferDecision& decision) {
    TransferRecord rec;
    rec.session_id = session;
    rec.user_id = user;
    rec.from_intent = from;
    rec.to_intent = decision.target_intent;
    rec.trigger = decision.trigger ? trigger_name(*decision.trigger) : "";
    rec.transfer_type = transfer_type_name(decision.transfer_type);
    rec.rule_id = decision.rule_id;
    rec.reason = decision.reason;
    rec.confidence = decision.confidence;
    rec.at = clock_();
    try {
        log_.record(rec);
    } catch (const StoreError& e) {
        std::cerr << "[TransferEngine] Transfer not logged for " << session
                  << ": " << e.what() << "\n";
    }
}

} // namespace sandhi
