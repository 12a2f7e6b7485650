#pragma once
// Intent Frame: one in-progress intent instance on a session's stack
//
// A frame carries its own saved context and slot-fill state. The parent is
// stored as a frame id (never a pointer) so a stack serializes as a flat
// JSON array.

#include "types.hpp"
#include "errors.hpp"
#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace sandhi {

enum class FrameStatus : uint8_t {
    Active = 0,
    Interrupted = 1,
    Completed = 2,   // Terminal
    Expired = 3,     // Terminal
};

enum class InterruptionKind : uint8_t {
    None = 0,
    UserInitiated = 1,
    SystemSuggestion = 2,
    UrgentInterruption = 3,
    ContextSwitch = 4,
    Clarification = 5,
};

inline const char* status_name(FrameStatus s) {
    switch (s) {
        case FrameStatus::Active: return "active";
        case FrameStatus::Interrupted: return "interrupted";
        case FrameStatus::Completed: return "completed";
        case FrameStatus::Expired: return "expired";
    }
    return "unknown";
}

inline std::optional<FrameStatus> parse_status(const std::string& s) {
    if (s == "active") return FrameStatus::Active;
    if (s == "interrupted") return FrameStatus::Interrupted;
    if (s == "completed") return FrameStatus::Completed;
    if (s == "expired") return FrameStatus::Expired;
    return std::nullopt;
}

inline const char* interruption_name(InterruptionKind k) {
    switch (k) {
        case InterruptionKind::None: return "none";
        case InterruptionKind::UserInitiated: return "user_initiated";
        case InterruptionKind::SystemSuggestion: return "system_suggestion";
        case InterruptionKind::UrgentInterruption: return "urgent_interruption";
        case InterruptionKind::ContextSwitch: return "context_switch";
        case InterruptionKind::Clarification: return "clarification";
    }
    return "unknown";
}

inline std::optional<InterruptionKind> parse_interruption(const std::string& s) {
    if (s == "none" || s.empty()) return InterruptionKind::None;
    if (s == "user_initiated") return InterruptionKind::UserInitiated;
    if (s == "system_suggestion") return InterruptionKind::SystemSuggestion;
    if (s == "urgent_interruption") return InterruptionKind::UrgentInterruption;
    if (s == "context_switch") return InterruptionKind::ContextSwitch;
    if (s == "clarification") return InterruptionKind::Clarification;
    return std::nullopt;
}

struct IntentFrame {
    std::string frame_id;
    std::string intent_name;
    std::string intent_id;
    std::string session_id;
    std::string user_id;
    FrameStatus status = FrameStatus::Active;

    ValueMap saved_context;
    ValueMap collected_slots;
    std::vector<std::string> missing_slots;
    std::vector<std::string> required_slots;   // Copied from the catalog at push
    double completion_progress = 0.0;

    InterruptionKind interruption_kind = InterruptionKind::None;
    std::string interruption_reason;

    Timestamp created_at = 0;
    Timestamp updated_at = 0;
    Timestamp expires_at = 0;   // 0 = never

    std::string parent_frame_id;   // Empty for the bottom frame
    size_t depth = 0;

    bool terminal() const {
        return status == FrameStatus::Completed || status == FrameStatus::Expired;
    }

    bool expired(Timestamp at) const {
        return expires_at != 0 && at > expires_at;
    }

    // |collected ∩ required| / |required|; 1.0 when nothing is required
    void recompute_progress() {
        if (required_slots.empty()) {
            completion_progress = 1.0;
            return;
        }
        size_t filled = 0;
        for (const auto& slot : required_slots) {
            if (has_filled(collected_slots, slot)) ++filled;
        }
        completion_progress = static_cast<double>(filled) /
                              static_cast<double>(required_slots.size());
    }

    // Drop names that now hold a value
    void prune_missing() {
        missing_slots.erase(
            std::remove_if(missing_slots.begin(), missing_slots.end(),
                [this](const std::string& s) { return has_filled(collected_slots, s); }),
            missing_slots.end());
    }

    // Required slots without a value, in declaration order
    std::vector<std::string> unfilled_required() const {
        std::vector<std::string> out;
        for (const auto& slot : required_slots) {
            if (!has_filled(collected_slots, slot)) out.push_back(slot);
        }
        return out;
    }
};

inline void to_json(json& j, const IntentFrame& f) {
    j = json{
        {"frame_id", f.frame_id},
        {"intent_name", f.intent_name},
        {"intent_id", f.intent_id},
        {"session_id", f.session_id},
        {"user_id", f.user_id},
        {"status", status_name(f.status)},
        {"saved_context", f.saved_context},
        {"collected_slots", f.collected_slots},
        {"missing_slots", f.missing_slots},
        {"required_slots", f.required_slots},
        {"completion_progress", f.completion_progress},
        {"interruption_type", interruption_name(f.interruption_kind)},
        {"interruption_reason", f.interruption_reason},
        {"created_at", f.created_at},
        {"updated_at", f.updated_at},
        {"expires_at", f.expires_at},
        {"parent_frame_id", f.parent_frame_id.empty() ? json(nullptr) : json(f.parent_frame_id)},
        {"depth", f.depth}
    };
}

// Throws CorruptStateError on unknown enum strings or missing identity fields
inline void from_json(const json& j, IntentFrame& f) {
    try {
        f.frame_id = j.at("frame_id").get<std::string>();
        f.intent_name = j.at("intent_name").get<std::string>();
        f.intent_id = j.value("intent_id", f.intent_name);
        f.session_id = j.value("session_id", std::string{});
        f.user_id = j.value("user_id", std::string{});

        auto status = parse_status(j.at("status").get<std::string>());
        if (!status) throw CorruptStateError("unknown frame status in " + f.frame_id);
        f.status = *status;

        f.saved_context = j.value("saved_context", ValueMap{});
        f.collected_slots = j.value("collected_slots", ValueMap{});
        f.missing_slots = j.value("missing_slots", std::vector<std::string>{});
        f.required_slots = j.value("required_slots", std::vector<std::string>{});
        f.completion_progress = j.value("completion_progress", 0.0);

        auto kind = parse_interruption(j.value("interruption_type", std::string{}));
        if (!kind) throw CorruptStateError("unknown interruption type in " + f.frame_id);
        f.interruption_kind = *kind;
        f.interruption_reason = j.value("interruption_reason", std::string{});

        f.created_at = j.value("created_at", Timestamp{0});
        f.updated_at = j.value("updated_at", Timestamp{0});
        f.expires_at = j.value("expires_at", Timestamp{0});

        const auto& parent = j.contains("parent_frame_id") ? j.at("parent_frame_id") : json();
        f.parent_frame_id = parent.is_string() ? parent.get<std::string>() : std::string{};
        f.depth = j.value("depth", size_t{0});
    } catch (const json::exception& e) {
        throw CorruptStateError(std::string("malformed frame: ") + e.what());
    }
}

} // namespace sandhi
