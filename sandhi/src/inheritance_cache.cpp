// Inheritance Cache: keys, fingerprints and TTL-checked reads

#include <sandhi/inheritance_cache.hpp>
#include <sandhi/version.hpp>
#include <algorithm>
#include <iostream>

namespace sandhi {

namespace {

// Split an escaped key on ':'; escaping guarantees no stray separators
std::vector<std::string> split_key(const std::string& key) {
    std::vector<std::string> parts;
    size_t start = 0;
    for (size_t i = 0; i <= key.size(); ++i) {
        if (i == key.size() || key[i] == ':') {
            parts.push_back(key.substr(start, i - start));
            start = i + 1;
        }
    }
    return parts;
}

} // namespace

std::string escape_key_component(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '%': out += "%25"; break;
            case ':': out += "%3A"; break;
            case ',': out += "%2C"; break;
            default: out += c;
        }
    }
    return out;
}

std::string CacheKey::str() const {
    std::vector<std::string> sorted = slots;
    std::sort(sorted.begin(), sorted.end());

    std::string joined;
    for (size_t i = 0; i < sorted.size(); ++i) {
        if (i) joined += ',';
        joined += escape_key_component(sorted[i]);
    }
    return std::string(CACHE_KEY_PREFIX) + escape_key_component(user_id) + ":" +
           escape_key_component(intent_id) + ":" + joined + ":" +
           escape_key_component(fingerprint);
}

std::string context_fingerprint(const FingerprintInput& input) {
    std::vector<std::string> session_keys = input.session_keys;
    std::vector<std::string> conversation_keys = input.conversation_keys;
    std::sort(session_keys.begin(), session_keys.end());
    std::sort(conversation_keys.begin(), conversation_keys.end());

    // std::map and json objects serialize with sorted keys, so dump() is canonical
    json relevant = {
        {"current_values", input.current_values},
        {"user_profile_timestamp", input.profile_last_updated},
        {"session_context_keys", session_keys},
        {"conversation_context_keys", conversation_keys}
    };
    return hex16(fnv1a64(relevant.dump()));
}

InheritanceCache::InheritanceCache(KVStore& store, CacheConfig config, Clock clock)
    : store_(store)
    , config_(std::move(config))
    , clock_(std::move(clock))
{}

std::optional<CacheEntry> InheritanceCache::get(const CacheKey& key, ErrorCode* error) {
    if (error) *error = ErrorCode::None;
    const std::string k = key.str();

    std::optional<std::string> raw;
    try {
        raw = store_.get(k);
    } catch (const StoreError& e) {
        std::cerr << "[InheritanceCache] Read failed for " << k << ": " << e.what() << "\n";
        misses_++;
        if (error) *error = ErrorCode::StoreFailure;
        return std::nullopt;
    }
    if (!raw) {
        misses_++;
        return std::nullopt;
    }

    CacheEntry entry;
    try {
        auto doc = json::parse(*raw);
        int format = doc.value("format", 1);
        if (!version::cache_format_compatible(format)) {
            throw std::runtime_error("unsupported format " + std::to_string(format));
        }
        entry.values = doc.at("inherited_values").get<ValueMap>();
        entry.sources = doc.at("inheritance_sources").get<std::map<std::string, std::string>>();
        entry.cached_at = doc.at("cached_at").get<Timestamp>();
        entry.ttl_seconds = doc.at("ttl_seconds").get<int64_t>();
    } catch (const std::exception& e) {
        std::cerr << "[InheritanceCache] Evicting corrupt entry " << k << ": " << e.what() << "\n";
        corrupt_++;
        misses_++;
        if (error) *error = ErrorCode::CacheCorrupt;
        try {
            store_.del(k);
        } catch (const StoreError& del_error) {
            std::cerr << "[InheritanceCache] Eviction failed: " << del_error.what() << "\n";
        }
        return std::nullopt;
    }

    if (entry.expired(clock_())) {
        expired_++;
        misses_++;
        try {
            store_.del(k);
        } catch (const StoreError& e) {
            std::cerr << "[InheritanceCache] Eviction failed: " << e.what() << "\n";
        }
        return std::nullopt;
    }

    hits_++;
    if (config_.verbose) {
        std::cerr << "[InheritanceCache] Hit " << k << "\n";
    }
    return entry;
}

bool InheritanceCache::set(const CacheKey& key, const ValueMap& values,
                           const std::map<std::string, std::string>& sources,
                           std::optional<int64_t> ttl_seconds) {
    int64_t ttl = ttl_seconds.value_or(config_.default_ttl_seconds);
    json payload = {
        {"format", SANDHI_CACHE_FORMAT_VERSION},
        {"inherited_values", values},
        {"inheritance_sources", sources},
        {"cached_at", clock_()},
        {"ttl_seconds", ttl}
    };

    const std::string k = key.str();
    try {
        store_.set(k, payload.dump(), ttl);
    } catch (const StoreError& e) {
        std::cerr << "[InheritanceCache] Write failed for " << k << ": " << e.what() << "\n";
        return false;
    }
    writes_++;
    if (config_.verbose) {
        std::cerr << "[InheritanceCache] Stored " << k << " (ttl " << ttl << "s)\n";
    }
    return true;
}

size_t InheritanceCache::invalidate_user(const std::string& user_id) {
    std::string prefix = std::string(CACHE_KEY_PREFIX) + escape_key_component(user_id) + ":";
    size_t removed = store_.delete_by_prefix(prefix);
    std::cerr << "[InheritanceCache] Invalidated " << removed << " entr"
              << (removed == 1 ? "y" : "ies") << " for user " << user_id << "\n";
    return removed;
}

size_t InheritanceCache::invalidate_intent(const std::string& intent_id) {
    // Intent is the third field, not a prefix: scan and match
    const std::string wanted = escape_key_component(intent_id);
    size_t removed = 0;
    for (const auto& k : store_.keys_with_prefix(CACHE_KEY_PREFIX)) {
        auto parts = split_key(k);
        if (parts.size() == 5 && parts[2] == wanted && store_.del(k)) ++removed;
    }
    std::cerr << "[InheritanceCache] Invalidated " << removed << " entr"
              << (removed == 1 ? "y" : "ies") << " for intent " << intent_id << "\n";
    return removed;
}

size_t InheritanceCache::entry_count() {
    return store_.keys_with_prefix(CACHE_KEY_PREFIX).size();
}

CacheStats InheritanceCache::statistics() const {
    CacheStats s;
    s.hits = hits_.load();
    s.misses = misses_.load();
    s.writes = writes_.load();
    s.expired_evictions = expired_.load();
    s.corrupt_evictions = corrupt_.load();
    uint64_t total = s.hits + s.misses;
    s.hit_rate = total > 0 ? static_cast<double>(s.hits) / static_cast<double>(total) : 0.0;
    return s;
}

void InheritanceCache::reset_statistics() {
    hits_ = 0;
    misses_ = 0;
    writes_ = 0;
    expired_ = 0;
    corrupt_ = 0;
}

} // namespace sandhi
