// Intent Stack: per-session load/mutate/commit over a KVStore

#include <sandhi/intent_stack.hpp>
#include <algorithm>
#include <iostream>

namespace sandhi {

IntentStackStore::IntentStackStore(KVStore& store, const IntentCatalog& catalog,
                                   StackConfig config, Clock clock)
    : store_(store)
    , catalog_(catalog)
    , config_(std::move(config))
    , clock_(std::move(clock))
{}

class IntentStackStore::SessionLock {
public:
    SessionLock(IntentStackStore& owner, const std::string& session)
        : owner_(owner)
        , session_(session)
        , mutex_(owner.session_mutex(session))
        , lock_(*mutex_)
    {}

    ~SessionLock() {
        lock_.unlock();
        owner_.release_session_mutex(session_, mutex_);
    }

    SessionLock(const SessionLock&) = delete;
    SessionLock& operator=(const SessionLock&) = delete;

private:
    IntentStackStore& owner_;
    std::string session_;
    std::shared_ptr<std::mutex> mutex_;
    std::unique_lock<std::mutex> lock_;
};

std::shared_ptr<std::mutex> IntentStackStore::session_mutex(const std::string& session) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto& m = session_locks_[session];
    if (!m) m = std::make_shared<std::mutex>();
    return m;
}

void IntentStackStore::release_session_mutex(const std::string& session,
                                             const std::shared_ptr<std::mutex>& m) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto it = session_locks_.find(session);
    // One reference in the map, one held by the releasing caller
    if (it != session_locks_.end() && it->second == m && m.use_count() == 2) {
        session_locks_.erase(it);
    }
}

template <typename Result, typename Fn>
Result IntentStackStore::mutate(const std::string& session, const char* op, Fn&& fn) {
    SessionLock lock(*this, session);
    try {
        return fn();
    } catch (const CorruptStateError& e) {
        std::cerr << "[IntentStack] " << op << " " << session
                  << ": corrupt stack: " << e.what() << "\n";
        return Result::failure(ErrorCode::CorruptState, e.what());
    } catch (const StoreError& e) {
        std::cerr << "[IntentStack] " << op << " " << session
                  << ": store failure: " << e.what() << "\n";
        return Result::failure(ErrorCode::StoreFailure, e.what());
    }
}

std::vector<IntentFrame> IntentStackStore::load(const std::string& session) {
    auto raw = store_.get(stack_key(session));
    if (!raw) return {};

    json doc;
    try {
        doc = json::parse(*raw);
    } catch (const json::exception& e) {
        throw CorruptStateError("stack " + session + " is not JSON: " + e.what());
    }
    if (!doc.is_array()) {
        throw CorruptStateError("stack " + session + " is not an array");
    }

    std::vector<IntentFrame> frames;
    frames.reserve(doc.size());
    for (const auto& record : doc) {
        frames.push_back(record.get<IntentFrame>());
    }
    return frames;
}

void IntentStackStore::commit(const std::string& session,
                              const std::vector<IntentFrame>& frames) {
    if (frames.empty()) {
        store_.del(stack_key(session));
        return;
    }
    json doc = json::array();
    for (const auto& f : frames) doc.push_back(f);
    store_.set(stack_key(session), doc.dump(), config_.store_ttl_seconds);
}

IntentFrame IntentStackStore::make_frame(const std::vector<IntentFrame>& frames,
                                         const IntentInfo& info,
                                         const std::string& session,
                                         const std::string& user,
                                         const ValueMap& context,
                                         Timestamp at) const {
    IntentFrame frame;
    frame.frame_id = generate_frame_id();
    frame.intent_name = info.name;
    frame.intent_id = info.id;
    frame.session_id = session;
    frame.user_id = user;
    frame.status = FrameStatus::Active;
    frame.saved_context = context;
    frame.required_slots = info.required_slots;
    frame.missing_slots = info.required_slots;
    frame.recompute_progress();
    frame.created_at = at;
    frame.updated_at = at;
    frame.expires_at = config_.frame_ttl_seconds > 0
        ? at + seconds_to_ms(config_.frame_ttl_seconds) : 0;
    frame.parent_frame_id = frames.empty() ? std::string{} : frames.back().frame_id;
    frame.depth = frames.size();
    return frame;
}

void IntentStackStore::interrupt_active(std::vector<IntentFrame>& frames,
                                        InterruptionKind kind,
                                        const std::string& reason, Timestamp at) {
    for (auto it = frames.rbegin(); it != frames.rend(); ++it) {
        if (it->status != FrameStatus::Active) continue;
        it->status = FrameStatus::Interrupted;
        it->interruption_kind = kind;
        it->interruption_reason = reason;
        it->updated_at = at;
        return;
    }
}

std::optional<IntentFrame> IntentStackStore::resume_top(std::vector<IntentFrame>& frames,
                                                        Timestamp at) {
    if (frames.empty() || frames.back().status != FrameStatus::Interrupted) {
        return std::nullopt;
    }
    frames.back().status = FrameStatus::Active;
    frames.back().updated_at = at;
    return frames.back();
}

PushResult IntentStackStore::push(const std::string& session, const std::string& user,
                                  const std::string& intent, const ValueMap& context,
                                  std::optional<InterruptionKind> kind,
                                  const std::string& reason) {
    auto info = catalog_.find(intent);
    if (!info) {
        std::cerr << "[IntentStack] push " << session << ": unknown intent " << intent << "\n";
        return PushResult::failure(ErrorCode::UnknownIntent, "unknown intent: " + intent);
    }

    return mutate<PushResult>(session, "push", [&]() {
        auto frames = load(session);
        if (frames.size() >= config_.max_depth) {
            std::cerr << "[IntentStack] push " << session << " -> " << intent
                      << ": stack full (" << frames.size() << "/" << config_.max_depth << ")\n";
            return PushResult::failure(ErrorCode::StackOverflow,
                "stack depth limit " + std::to_string(config_.max_depth) + " reached",
                frames.size());
        }

        Timestamp at = clock_();
        interrupt_active(frames, kind.value_or(InterruptionKind::UserInitiated),
                         reason.empty() ? "new intent pushed" : reason, at);
        IntentFrame frame = make_frame(frames, *info, session, user, context, at);
        frames.push_back(frame);
        commit(session, frames);

        if (config_.verbose) {
            std::cerr << "[IntentStack] push " << session << " -> " << intent
                      << " (depth " << frame.depth << ")\n";
        }
        return PushResult::success(std::move(frame), frames.size());
    });
}

PopResult IntentStackStore::pop(const std::string& session, const std::string& reason) {
    return mutate<PopResult>(session, "pop", [&]() {
        auto frames = load(session);
        PopResult result;
        if (frames.empty()) return result;

        Timestamp at = clock_();
        IntentFrame removed = std::move(frames.back());
        frames.pop_back();
        removed.status = FrameStatus::Completed;
        removed.updated_at = at;

        result.resumed = resume_top(frames, at);
        commit(session, frames);

        if (config_.verbose) {
            std::cerr << "[IntentStack] pop " << session << " <- " << removed.intent_name;
            if (!reason.empty()) std::cerr << " (" << reason << ")";
            if (result.resumed) std::cerr << ", resumed " << result.resumed->intent_name;
            std::cerr << "\n";
        }
        result.frame = std::move(removed);
        result.depth = frames.size();
        return result;
    });
}

PushResult IntentStackStore::replace_top(const std::string& session, const std::string& user,
                                         const std::string& intent, const ValueMap& context,
                                         const std::string& reason) {
    auto info = catalog_.find(intent);
    if (!info) {
        std::cerr << "[IntentStack] replace " << session << ": unknown intent " << intent << "\n";
        return PushResult::failure(ErrorCode::UnknownIntent, "unknown intent: " + intent);
    }

    return mutate<PushResult>(session, "replace", [&]() {
        auto frames = load(session);
        Timestamp at = clock_();

        std::optional<IntentFrame> replaced;
        if (!frames.empty()) {
            replaced = std::move(frames.back());
            frames.pop_back();
            replaced->status = FrameStatus::Completed;
            replaced->updated_at = at;
        }
        if (frames.size() >= config_.max_depth) {
            return PushResult::failure(ErrorCode::StackOverflow,
                "stack depth limit " + std::to_string(config_.max_depth) + " reached",
                frames.size() + (replaced ? 1 : 0));
        }

        // Frames beneath are already Interrupted; only a stray Active is touched
        interrupt_active(frames, InterruptionKind::ContextSwitch,
                         reason.empty() ? "intent replaced" : reason, at);
        IntentFrame frame = make_frame(frames, *info, session, user, context, at);
        frames.push_back(frame);
        commit(session, frames);

        if (config_.verbose) {
            std::cerr << "[IntentStack] replace " << session << ": "
                      << (replaced ? replaced->intent_name : std::string("(empty)"))
                      << " -> " << intent << "\n";
        }
        auto result = PushResult::success(std::move(frame), frames.size());
        result.replaced = std::move(replaced);
        return result;
    });
}

std::optional<IntentFrame> IntentStackStore::peek(const std::string& session) {
    SessionLock lock(*this, session);
    auto frames = load(session);
    if (frames.empty()) return std::nullopt;
    return frames.back();
}

std::optional<IntentFrame> IntentStackStore::active(const std::string& session) {
    SessionLock lock(*this, session);
    auto frames = load(session);
    for (auto it = frames.rbegin(); it != frames.rend(); ++it) {
        if (it->status == FrameStatus::Active) return *it;
    }
    return std::nullopt;
}

std::vector<IntentFrame> IntentStackStore::frames(const std::string& session) {
    SessionLock lock(*this, session);
    return load(session);
}

UpdateResult IntentStackStore::update_context(const std::string& session,
                                              const std::string& frame_id,
                                              const ValueMap& patch) {
    return mutate<UpdateResult>(session, "update_context", [&]() {
        auto frames = load(session);
        for (auto& frame : frames) {
            if (frame.frame_id != frame_id) continue;
            for (const auto& [key, value] : patch) {
                frame.saved_context[key] = value;
            }
            frame.recompute_progress();
            frame.updated_at = clock_();
            commit(session, frames);

            UpdateResult result;
            result.frame = frame;
            return result;
        }
        return UpdateResult::failure(ErrorCode::FrameNotFound,
                                     "frame " + frame_id + " not in stack " + session);
    });
}

UpdateResult IntentStackStore::update_slots(const std::string& session,
                                            const std::string& frame_id,
                                            const ValueMap& patch,
                                            const std::optional<std::vector<std::string>>& missing) {
    return mutate<UpdateResult>(session, "update_slots", [&]() {
        auto frames = load(session);
        for (auto& frame : frames) {
            if (frame.frame_id != frame_id) continue;
            for (const auto& [slot, value] : patch) {
                frame.collected_slots[slot] = value;
            }
            if (missing) frame.missing_slots = *missing;
            frame.prune_missing();
            frame.recompute_progress();
            frame.updated_at = clock_();
            commit(session, frames);

            if (config_.verbose) {
                std::cerr << "[IntentStack] slots " << session << "/" << frame.intent_name
                          << " progress " << frame.completion_progress << "\n";
            }
            UpdateResult result;
            result.frame = frame;
            return result;
        }
        return UpdateResult::failure(ErrorCode::FrameNotFound,
                                     "frame " + frame_id + " not in stack " + session);
    });
}

SweepResult IntentStackStore::sweep_expired(const std::string& session, Timestamp at) {
    return mutate<SweepResult>(session, "sweep", [&]() {
        auto frames = load(session);
        SweepResult result;
        if (frames.empty()) return result;

        bool top_removed = frames.back().expired(at);
        std::vector<IntentFrame> kept;
        kept.reserve(frames.size());
        for (auto& frame : frames) {
            if (frame.expired(at)) {
                frame.status = FrameStatus::Expired;
                frame.updated_at = at;
                result.removed.push_back(std::move(frame));
            } else {
                kept.push_back(std::move(frame));
            }
        }

        if (result.removed.empty()) {
            result.depth = kept.size();
            return result;
        }

        // Re-index so depth and parent links describe the surviving stack
        for (size_t i = 0; i < kept.size(); ++i) {
            kept[i].depth = i;
            kept[i].parent_frame_id = i == 0 ? std::string{} : kept[i - 1].frame_id;
        }
        if (top_removed) result.resumed = resume_top(kept, at);

        commit(session, kept);
        result.depth = kept.size();

        std::cerr << "[IntentStack] sweep " << session << ": expired "
                  << result.removed.size() << " frame(s)";
        if (result.resumed) std::cerr << ", resumed " << result.resumed->intent_name;
        std::cerr << "\n";
        return result;
    });
}

StackStats IntentStackStore::statistics(const std::string& session) {
    auto snapshot = frames(session);

    StackStats stats;
    stats.total_frames = snapshot.size();
    stats.current_depth = snapshot.size();
    for (FrameStatus s : {FrameStatus::Active, FrameStatus::Interrupted,
                          FrameStatus::Completed, FrameStatus::Expired}) {
        stats.status_counts[status_name(s)] = 0;
    }
    stats.utilization = config_.max_depth > 0
        ? static_cast<double>(snapshot.size()) / static_cast<double>(config_.max_depth)
        : 0.0;
    if (snapshot.empty()) return stats;

    double progress_sum = 0.0;
    stats.oldest_frame_at = snapshot.front().created_at;
    stats.newest_frame_at = snapshot.front().created_at;
    for (const auto& frame : snapshot) {
        stats.status_counts[status_name(frame.status)]++;
        if (frame.interruption_kind != InterruptionKind::None) {
            stats.interruption_types[interruption_name(frame.interruption_kind)]++;
        }
        progress_sum += frame.completion_progress;
        stats.oldest_frame_at = std::min(stats.oldest_frame_at, frame.created_at);
        stats.newest_frame_at = std::max(stats.newest_frame_at, frame.created_at);
    }
    for (auto it = snapshot.rbegin(); it != snapshot.rend(); ++it) {
        if (it->status == FrameStatus::Active) {
            stats.active_intent = it->intent_name;
            break;
        }
    }
    stats.average_progress = progress_sum / static_cast<double>(snapshot.size());
    return stats;
}

std::vector<std::string> IntentStackStore::sessions() {
    std::string prefix = STACK_KEY_PREFIX;
    std::vector<std::string> out;
    for (const auto& key : store_.keys_with_prefix(prefix)) {
        out.push_back(key.substr(prefix.size()));
    }
    return out;
}

ClearResult IntentStackStore::clear(const std::string& session) {
    return mutate<ClearResult>(session, "clear", [&]() {
        ClearResult result;
        result.existed = store_.del(stack_key(session));
        if (config_.verbose && result.existed) {
            std::cerr << "[IntentStack] cleared " << session << "\n";
        }
        return result;
    });
}

} // namespace sandhi
