#pragma once
// Conversation Inheritance: gathers slot sources and runs cached inheritance
//
// Sources come from host collaborators, each call bounded by
// source_timeout_ms. A collaborator that throws or times out marks its
// source kind unavailable for that pass; rules reading it are skipped.
// Collaborators are borrowed and must outlive this object, including any
// call that is still running after its timeout.
//
// Results computed while a source was unavailable are never cached.

#include "collaborators.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "inheritance_cache.hpp"
#include "intent_stack.hpp"
#include "slot_inheritance.hpp"
#include <optional>
#include <string>
#include <vector>

namespace sandhi {

struct FillResult : StackResult {
    InheritanceResult inheritance;
    std::optional<IntentFrame> frame;   // Active frame after the write-back

    static FillResult failure(ErrorCode code, std::string msg) {
        FillResult r;
        r.error = code;
        r.message = std::move(msg);
        return r;
    }
};

class ConversationInheritance {
public:
    ConversationInheritance(SlotInheritanceEngine& engine,
                            InheritanceCache* cache,
                            HistorySource* history,
                            SessionContextSource* session,
                            ProfileSource* profile,
                            InheritanceConfig config = {},
                            Clock clock = system_clock());

    // Booking-domain rule set: departure/arrival city, passenger, phone, card
    void install_default_rules();

    // Collect every source kind for one pass. fingerprint, when given,
    // receives the inputs that identify this context for the cache.
    SourceBundle gather(const std::string& session, const std::string& user,
                        const ValueMap& current_values,
                        FingerprintInput* fingerprint = nullptr);

    InheritanceResult inherit_for(const std::string& session, const std::string& user,
                                  const std::string& intent_id,
                                  const std::vector<std::string>& required_slots,
                                  const ValueMap& current_values);

    // Inherit for the session's active frame and write the new values back
    FillResult fill_active_frame(IntentStackStore& stacks, const std::string& session);

    SlotInheritanceEngine& engine() { return engine_; }
    const InheritanceConfig& config() const { return config_; }

    // Flattened profile view used by USER_PROFILE rules
    static SourceMap flatten_profile(const UserProfile& profile);

    // Split "<slot>_timestamp" entries off a session context; undated
    // values are stamped with fallback
    static SourceMap date_session_context(const ValueMap& context, Timestamp fallback);

private:
    SlotInheritanceEngine& engine_;
    InheritanceCache* cache_;
    HistorySource* history_;
    SessionContextSource* session_;
    ProfileSource* profile_;
    InheritanceConfig config_;
    Clock clock_;
};

} // namespace sandhi
