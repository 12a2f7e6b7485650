// Conversation Inheritance: source gathering, caching and frame write-back

#include <sandhi/inheritance_manager.hpp>
#include <iostream>

namespace sandhi {

namespace {

const std::string TIMESTAMP_SUFFIX = "_timestamp";

bool is_timestamp_key(const std::string& key) {
    return key.size() > TIMESTAMP_SUFFIX.size() &&
           key.compare(key.size() - TIMESTAMP_SUFFIX.size(), TIMESTAMP_SUFFIX.size(),
                       TIMESTAMP_SUFFIX) == 0;
}

std::vector<std::string> source_keys(const SourceMap& map) {
    std::vector<std::string> keys;
    keys.reserve(map.size());
    for (const auto& [k, _] : map) keys.push_back(k);
    return keys;
}

} // namespace

ConversationInheritance::ConversationInheritance(SlotInheritanceEngine& engine,
                                                 InheritanceCache* cache,
                                                 HistorySource* history,
                                                 SessionContextSource* session,
                                                 ProfileSource* profile,
                                                 InheritanceConfig config,
                                                 Clock clock)
    : engine_(engine)
    , cache_(cache)
    , history_(history)
    , session_(session)
    , profile_(profile)
    , config_(std::move(config))
    , clock_(std::move(clock))
{
    if (config_.install_default_rules) install_default_rules();
}

void ConversationInheritance::install_default_rules() {
    InheritanceRule departure;
    departure.source_slot = "departure_city";
    departure.target_slot = "departure_city";
    departure.source = SourceKind::Session;
    departure.strategy = MergeStrategy::Supplement;
    departure.priority = 10;
    departure.ttl_seconds = 3600;
    engine_.add_rule(departure);

    // Last trip's destination is a likely origin for the next one
    InheritanceRule arrival;
    arrival.source_slot = "arrival_city";
    arrival.target_slot = "departure_city";
    arrival.source = SourceKind::Session;
    arrival.strategy = MergeStrategy::Supplement;
    arrival.condition = InheritanceCondition::slot_empty("departure_city");
    arrival.transform = "extract_city";
    arrival.priority = 5;
    engine_.add_rule(arrival);

    InheritanceRule passenger;
    passenger.source_slot = "passenger_name";
    passenger.target_slot = "passenger_name";
    passenger.source = SourceKind::UserProfile;
    passenger.strategy = MergeStrategy::Supplement;
    passenger.transform = "normalize_name";
    passenger.priority = 15;
    engine_.add_rule(passenger);

    InheritanceRule phone;
    phone.source_slot = "phone_number";
    phone.target_slot = "phone_number";
    phone.source = SourceKind::UserProfile;
    phone.strategy = MergeStrategy::Supplement;
    phone.transform = "format_phone";
    phone.priority = 15;
    engine_.add_rule(phone);

    InheritanceRule card;
    card.source_slot = "card_number";
    card.target_slot = "card_number";
    card.source = SourceKind::Session;
    card.strategy = MergeStrategy::Supplement;
    card.condition = InheritanceCondition::time_window(1800);
    card.priority = 20;
    engine_.add_rule(card);
}

SourceMap ConversationInheritance::flatten_profile(const UserProfile& profile) {
    SourceMap out;
    const Timestamp ts = profile.last_updated;
    const json& prefs = profile.preferences;

    if (prefs.is_object()) {
        auto cities = prefs.find("preferred_departure_cities");
        if (cities != prefs.end() && cities->is_array() && !cities->empty()) {
            out["preferred_departure_city"] = SourceValue{cities->front(), ts};
        }
        auto contact = prefs.find("contact_info");
        if (contact != prefs.end() && contact->is_object()) {
            if (contact->contains("phone")) {
                out["phone_number"] = SourceValue{contact->at("phone"), ts};
            }
            if (contact->contains("name")) {
                out["passenger_name"] = SourceValue{contact->at("name"), ts};
            }
        }
    }

    // Observed behaviour beats declared preferences
    if (profile.frequent_values.is_object()) {
        for (const auto& [slot, stats] : profile.frequent_values.items()) {
            if (stats.is_object() && stats.contains("most_frequent")) {
                out[slot] = SourceValue{stats.at("most_frequent"), ts};
            }
        }
    }
    return out;
}

SourceMap ConversationInheritance::date_session_context(const ValueMap& context,
                                                        Timestamp fallback) {
    SourceMap out;
    for (const auto& [key, value] : context) {
        if (is_timestamp_key(key)) continue;
        Timestamp ts = fallback;
        auto stamp = context.find(key + TIMESTAMP_SUFFIX);
        if (stamp != context.end() && stamp->second.is_number()) {
            ts = stamp->second.get<Timestamp>();
        }
        out[key] = SourceValue{value, ts};
    }
    return out;
}

SourceBundle ConversationInheritance::gather(const std::string& session,
                                             const std::string& user,
                                             const ValueMap& current_values,
                                             FingerprintInput* fingerprint) {
    SourceBundle bundle;
    bundle.now = clock_();
    const int64_t timeout = config_.source_timeout_ms;
    Timestamp profile_updated = 0;

    if (history_) {
        HistorySource* src = history_;
        std::string u = user;
        size_t limit = config_.history_limit;
        std::string error;
        auto values = call_with_timeout([src, u, limit] { return src->recent_slot_values(u, limit); },
                                        timeout, &error);
        if (values) {
            bundle.set_all(SourceKind::Context, std::move(*values));
        } else {
            std::cerr << "[Inheritance] History source failed for " << user << ": " << error << "\n";
            bundle.mark_unavailable(SourceKind::Context);
        }
    }

    if (session_) {
        SessionContextSource* src = session_;
        std::string s = session;
        std::string error;
        auto context = call_with_timeout([src, s] { return src->current_context(s); },
                                         timeout, &error);
        if (context) {
            bundle.set_all(SourceKind::Session, date_session_context(*context, bundle.now));
        } else {
            std::cerr << "[Inheritance] Session source failed for " << session << ": " << error << "\n";
            bundle.mark_unavailable(SourceKind::Session);
        }
    }

    if (profile_) {
        ProfileSource* src = profile_;
        std::string u = user;
        std::string error;
        auto profile = call_with_timeout([src, u] { return src->profile(u); }, timeout, &error);
        if (profile) {
            profile_updated = profile->last_updated;
            bundle.set_all(SourceKind::UserProfile, flatten_profile(*profile));
        } else {
            std::cerr << "[Inheritance] Profile source failed for " << user << ": " << error << "\n";
            bundle.mark_unavailable(SourceKind::UserProfile);
        }
    }

    for (const auto& [slot, value] : current_values) {
        bundle.set(SourceKind::Dependency, slot, value, bundle.now);
    }
    for (const auto& [slot, value] : config_.default_values) {
        bundle.set(SourceKind::Default, slot, value);
    }

    if (fingerprint) {
        fingerprint->current_values = current_values;
        fingerprint->profile_last_updated = profile_updated;
        auto session_it = bundle.values.find(SourceKind::Session);
        fingerprint->session_keys = session_it != bundle.values.end()
            ? source_keys(session_it->second) : std::vector<std::string>{};
        auto context_it = bundle.values.find(SourceKind::Context);
        fingerprint->conversation_keys = context_it != bundle.values.end()
            ? source_keys(context_it->second) : std::vector<std::string>{};
    }
    return bundle;
}

InheritanceResult ConversationInheritance::inherit_for(const std::string& session,
                                                       const std::string& user,
                                                       const std::string& intent_id,
                                                       const std::vector<std::string>& required_slots,
                                                       const ValueMap& current_values) {
    FingerprintInput fp;
    SourceBundle bundle = gather(session, user, current_values, &fp);

    const bool caching = config_.use_cache && cache_ != nullptr;
    CacheKey key{user, intent_id, required_slots, context_fingerprint(fp)};

    if (caching) {
        if (auto entry = cache_->get(key)) {
            InheritanceResult result;
            result.values = current_values;
            for (const auto& [slot, value] : entry->values) {
                result.values[slot] = value;
            }
            result.sources = entry->sources;
            result.from_cache = true;
            if (config_.verbose) {
                std::cerr << "[Inheritance] Cache hit for " << user << "/" << intent_id << "\n";
            }
            return result;
        }
    }

    InheritanceResult result = engine_.inherit(required_slots, current_values, bundle);

    ValueMap inherited = result.inherited();
    if (caching && !inherited.empty()) {
        if (bundle.unavailable.empty()) {
            cache_->set(key, inherited, result.sources);
        } else if (config_.verbose) {
            std::cerr << "[Inheritance] Not caching partial result for " << user << "\n";
        }
    }

    if (config_.verbose) {
        std::cerr << "[Inheritance] " << user << "/" << intent_id << ": inherited "
                  << inherited.size() << ", applied " << result.applied.size()
                  << ", skipped " << result.skipped.size() << "\n";
    }
    return result;
}

FillResult ConversationInheritance::fill_active_frame(IntentStackStore& stacks,
                                                      const std::string& session) {
    std::optional<IntentFrame> frame;
    try {
        frame = stacks.active(session);
    } catch (const CorruptStateError& e) {
        return FillResult::failure(ErrorCode::CorruptState, e.what());
    } catch (const StoreError& e) {
        return FillResult::failure(ErrorCode::StoreFailure, e.what());
    }
    if (!frame) {
        return FillResult::failure(ErrorCode::FrameNotFound, "no active frame in " + session);
    }

    const std::string& intent_id = frame->intent_id.empty() ? frame->intent_name : frame->intent_id;
    FillResult out;
    out.inheritance = inherit_for(session, frame->user_id, intent_id,
                                  frame->required_slots, frame->collected_slots);

    ValueMap patch = out.inheritance.inherited();
    if (patch.empty()) {
        out.frame = std::move(frame);
        return out;
    }

    UpdateResult update = stacks.update_slots(session, frame->frame_id, patch);
    if (!update.ok()) {
        out.error = update.error;
        out.message = update.message;
        return out;
    }
    out.frame = std::move(update.frame);
    std::cerr << "[Inheritance] Filled " << patch.size() << " slot(s) on "
              << out.frame->intent_name << " in " << session << "\n";
    return out;
}

} // namespace sandhi
