#pragma once
// Intent Stack: bounded, preemption-capable frame stack per session
//
// Invariants after every committed mutation:
//   - depth <= config.max_depth
//   - at most one frame is Active, and if one is, it is the top
//
// Each session's stack is one JSON array under "intent_stack:stack:<session>".
// Mutations run load -> mutate copy -> commit while holding that session's
// mutex, so a failed commit leaves the stored stack untouched. Sessions never
// contend with each other.

#include "catalog.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "intent_frame.hpp"
#include "store.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sandhi {

constexpr const char* STACK_KEY_PREFIX = "intent_stack:stack:";

struct StackResult {
    ErrorCode error = ErrorCode::None;
    std::string message;

    bool ok() const { return error == ErrorCode::None; }
};

struct PushResult : StackResult {
    std::optional<IntentFrame> frame;      // The new top
    std::optional<IntentFrame> replaced;   // Set by replace_top when a frame was popped
    size_t depth = 0;

    static PushResult success(IntentFrame f, size_t d) {
        PushResult r;
        r.frame = std::move(f);
        r.depth = d;
        return r;
    }

    static PushResult failure(ErrorCode code, std::string msg, size_t d = 0) {
        PushResult r;
        r.error = code;
        r.message = std::move(msg);
        r.depth = d;
        return r;
    }
};

struct PopResult : StackResult {
    std::optional<IntentFrame> frame;     // Removed frame, nullopt on empty stack
    std::optional<IntentFrame> resumed;   // New top if it was reactivated
    size_t depth = 0;

    static PopResult failure(ErrorCode code, std::string msg) {
        PopResult r;
        r.error = code;
        r.message = std::move(msg);
        return r;
    }
};

struct UpdateResult : StackResult {
    std::optional<IntentFrame> frame;

    static UpdateResult failure(ErrorCode code, std::string msg) {
        UpdateResult r;
        r.error = code;
        r.message = std::move(msg);
        return r;
    }
};

struct SweepResult : StackResult {
    std::vector<IntentFrame> removed;    // Marked Expired
    std::optional<IntentFrame> resumed;
    size_t depth = 0;

    static SweepResult failure(ErrorCode code, std::string msg) {
        SweepResult r;
        r.error = code;
        r.message = std::move(msg);
        return r;
    }
};

struct ClearResult : StackResult {
    bool existed = false;

    static ClearResult failure(ErrorCode code, std::string msg) {
        ClearResult r;
        r.error = code;
        r.message = std::move(msg);
        return r;
    }
};

struct StackStats {
    size_t total_frames = 0;
    size_t current_depth = 0;
    std::string active_intent;                      // Empty when nothing is active
    std::map<std::string, size_t> status_counts;    // Every status, zeros included
    std::map<std::string, size_t> interruption_types;
    double average_progress = 0.0;
    Timestamp oldest_frame_at = 0;
    Timestamp newest_frame_at = 0;
    double utilization = 0.0;                       // depth / max_depth
};

inline void to_json(json& j, const StackStats& s) {
    j = json{
        {"total_frames", s.total_frames},
        {"current_depth", s.current_depth},
        {"active_intent", s.active_intent.empty() ? json(nullptr) : json(s.active_intent)},
        {"status_counts", s.status_counts},
        {"interruption_types", s.interruption_types},
        {"average_progress", s.average_progress},
        {"oldest_frame_at", s.oldest_frame_at},
        {"newest_frame_at", s.newest_frame_at},
        {"stack_utilization", s.utilization}
    };
}

class IntentStackStore {
public:
    IntentStackStore(KVStore& store, const IntentCatalog& catalog,
                     StackConfig config = {}, Clock clock = system_clock());

    IntentStackStore(const IntentStackStore&) = delete;
    IntentStackStore& operator=(const IntentStackStore&) = delete;

    // Push a new Active frame; the current Active frame becomes Interrupted.
    // Without an explicit kind the interruption is UserInitiated.
    PushResult push(const std::string& session, const std::string& user,
                    const std::string& intent, const ValueMap& context = {},
                    std::optional<InterruptionKind> kind = std::nullopt,
                    const std::string& reason = "");

    // Remove the top (whatever its status) as Completed; an Interrupted
    // frame beneath resumes
    PopResult pop(const std::string& session, const std::string& reason = "");

    // Pop then push under one lock and one commit
    PushResult replace_top(const std::string& session, const std::string& user,
                           const std::string& intent, const ValueMap& context = {},
                           const std::string& reason = "");

    // Read-only; store errors propagate as StoreError
    std::optional<IntentFrame> peek(const std::string& session);
    std::optional<IntentFrame> active(const std::string& session);
    std::vector<IntentFrame> frames(const std::string& session);
    StackStats statistics(const std::string& session);
    std::vector<std::string> sessions();

    // Sessions with a lock entry right now (zero when no call is in flight)
    size_t tracked_sessions() const {
        std::lock_guard<std::mutex> lock(locks_mutex_);
        return session_locks_.size();
    }

    UpdateResult update_context(const std::string& session, const std::string& frame_id,
                                const ValueMap& patch);

    // Merge slot values; missing replaces the missing list before filled
    // names are pruned from it
    UpdateResult update_slots(const std::string& session, const std::string& frame_id,
                              const ValueMap& patch,
                              const std::optional<std::vector<std::string>>& missing = std::nullopt);

    // Remove every frame with at > expires_at; see DESIGN.md for the policy
    SweepResult sweep_expired(const std::string& session, Timestamp at);
    SweepResult sweep_expired(const std::string& session) { return sweep_expired(session, clock_()); }

    ClearResult clear(const std::string& session);

    const StackConfig& config() const { return config_; }
    Timestamp current_time() const { return clock_(); }

private:
    static std::string stack_key(const std::string& session) {
        return STACK_KEY_PREFIX + session;
    }

    // Holds one session's mutex for its lifetime
    class SessionLock;

    std::shared_ptr<std::mutex> session_mutex(const std::string& session);
    // Drops the map entry once no other caller holds the mutex
    void release_session_mutex(const std::string& session,
                               const std::shared_ptr<std::mutex>& m);

    std::vector<IntentFrame> load(const std::string& session);
    void commit(const std::string& session, const std::vector<IntentFrame>& frames);

    // Build the frame that goes on top of frames (does not append)
    IntentFrame make_frame(const std::vector<IntentFrame>& frames, const IntentInfo& info,
                           const std::string& session, const std::string& user,
                           const ValueMap& context, Timestamp at) const;

    static void interrupt_active(std::vector<IntentFrame>& frames, InterruptionKind kind,
                                 const std::string& reason, Timestamp at);
    static std::optional<IntentFrame> resume_top(std::vector<IntentFrame>& frames, Timestamp at);

    // Runs fn under the session lock, converting store failures to result codes
    template <typename Result, typename Fn>
    Result mutate(const std::string& session, const char* op, Fn&& fn);

    KVStore& store_;
    const IntentCatalog& catalog_;
    StackConfig config_;
    Clock clock_;

    mutable std::mutex locks_mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> session_locks_;
};

} // namespace sandhi
