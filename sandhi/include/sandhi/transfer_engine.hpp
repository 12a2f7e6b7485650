#pragma once
// Transfer Engine: decides whether and how the active intent switches
//
// evaluate() checks the special cases first (inactivity timeout, repeated
// errors, exit / go-back phrases) without classifying; otherwise it
// classifies the input and walks the rules for the current intent plus the
// wildcard rules in ascending priority. The first rule whose conditions all
// hold wins. No match is a normal negative decision, not an error.
//
// execute() applies a decision to the intent stack and logs it.

#include "collaborators.hpp"
#include "config.hpp"
#include "intent_stack.hpp"
#include "store.hpp"
#include "transfer_log.hpp"
#include "transfer_rules.hpp"
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace sandhi {

constexpr const char* ACTIVITY_KEY_PREFIX = "intent_transfer:last_activity:";

struct ExecuteResult : StackResult {
    TransferType applied = TransferType::None;
    std::optional<IntentFrame> active;    // Top frame afterwards, if Active
    std::optional<IntentFrame> removed;   // Popped or replaced frame
    size_t depth = 0;

    static ExecuteResult failure(ErrorCode code, std::string msg) {
        ExecuteResult r;
        r.error = code;
        r.message = std::move(msg);
        return r;
    }
};

class TransferEngine {
public:
    TransferEngine(IntentStackStore& stacks, KVStore& store, Classifier& classifier,
                   TransferConfig config = {}, Clock clock = system_clock());

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    TransferDecision evaluate(const std::string& session, const std::string& user,
                              const std::string& current_intent, const std::string& input,
                              const ValueMap& context = {});

    ExecuteResult execute(const std::string& session, const std::string& user,
                          const TransferDecision& decision, const ValueMap& context = {});

    // Rule management. add_rule replaces a rule with the same id.
    void add_rule(TransferRule rule);
    bool remove_rule(const std::string& id);
    std::vector<TransferRule> rules_for(const std::string& current_intent) const;
    std::vector<TransferRule> rules() const;
    size_t rule_count() const;

    void install_default_rules();

    // Load rules from a JSON array; bad entries are reported and skipped
    size_t load_rules(const json& entries, std::string* error = nullptr);

    // Refresh the inactivity clock for a session
    bool record_activity(const std::string& session);
    std::optional<Timestamp> last_activity(const std::string& session);

    std::vector<TransferRecord> history(const std::string& session, size_t limit = 10) {
        return log_.history(session, limit);
    }
    TransferStats statistics(const std::string& session) {
        return log_.statistics(session);
    }

    const TransferConfig& config() const { return config_; }

private:
    static std::string activity_key(const std::string& session) {
        return ACTIVITY_KEY_PREFIX + session;
    }

    std::optional<TransferDecision> special_case(const std::string& session,
                                                 const std::string& input,
                                                 const ValueMap& context);
    bool timed_out(const std::string& session);
    // Caller holds rules_mutex_ exclusively
    bool erase_rule_locked(const std::string& id);
    std::string resolve_previous(const std::string& session);

    bool rule_holds(const TransferRule& rule, const std::string& session,
                    const std::string& input, const ValueMap& context, double confidence);

    void log_transfer(const std::string& session, const std::string& user,
                      const std::string& from, const TransferDecision& decision);

    IntentStackStore& stacks_;
    KVStore& store_;
    Classifier& classifier_;
    TransferConfig config_;
    Clock clock_;
    TransferLog log_;

    mutable std::shared_mutex rules_mutex_;
    std::map<std::string, std::vector<TransferRule>> specific_rules_;   // By from-intent
    std::vector<TransferRule> any_rules_;
};

// Jaccard overlap of word tokens; each non-ASCII code point is its own token
double token_similarity(const std::string& a, const std::string& b);

} // namespace sandhi
