#pragma once
// Inheritance Cache: memoized inheritance results per (user, intent, slots, context)
//
// Key layout:  inheritance:<user>:<intent>:<slot,slot,...>:<fingerprint>
// Components are escaped ('%' -> %25, ':' -> %3A, ',' -> %2C) so the five
// fields always split cleanly. The fingerprint covers only what changes an
// inheritance outcome, so unrelated context churn still hits.
//
// Entries are written wholesale and never patched. A malformed payload is
// evicted and counted as a miss.

#include "config.hpp"
#include "errors.hpp"
#include "store.hpp"
#include "types.hpp"
#include <atomic>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sandhi {

constexpr const char* CACHE_KEY_PREFIX = "inheritance:";

struct CacheKey {
    std::string user_id;
    std::string intent_id;
    std::vector<std::string> slots;   // Sorted by str()
    std::string fingerprint;

    std::string str() const;
};

// Fields of the inheritance context that can change an outcome
struct FingerprintInput {
    ValueMap current_values;
    Timestamp profile_last_updated = 0;
    std::vector<std::string> session_keys;
    std::vector<std::string> conversation_keys;
};

std::string context_fingerprint(const FingerprintInput& input);

std::string escape_key_component(const std::string& s);

struct CacheEntry {
    ValueMap values;
    std::map<std::string, std::string> sources;
    Timestamp cached_at = 0;
    int64_t ttl_seconds = 0;

    bool expired(Timestamp at) const {
        return at - cached_at > seconds_to_ms(ttl_seconds);
    }
};

struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t writes = 0;
    uint64_t expired_evictions = 0;
    uint64_t corrupt_evictions = 0;
    double hit_rate = 0.0;
};

inline void to_json(json& j, const CacheStats& s) {
    j = json{
        {"hits", s.hits},
        {"misses", s.misses},
        {"writes", s.writes},
        {"expired_evictions", s.expired_evictions},
        {"corrupt_evictions", s.corrupt_evictions},
        {"hit_rate", s.hit_rate}
    };
}

class InheritanceCache {
public:
    InheritanceCache(KVStore& store, CacheConfig config = {}, Clock clock = system_clock());

    InheritanceCache(const InheritanceCache&) = delete;
    InheritanceCache& operator=(const InheritanceCache&) = delete;

    // Hit, or nullopt with *error set to CacheCorrupt / StoreFailure when the
    // miss was caused by a bad payload or a failing store
    std::optional<CacheEntry> get(const CacheKey& key, ErrorCode* error = nullptr);

    // Store or overwrite; false if the store failed
    bool set(const CacheKey& key, const ValueMap& values,
             const std::map<std::string, std::string>& sources,
             std::optional<int64_t> ttl_seconds = std::nullopt);

    // Bulk deletion; return number of entries removed
    size_t invalidate_user(const std::string& user_id);
    size_t invalidate_intent(const std::string& intent_id);

    // Live entries in the backing store (counters are per process)
    size_t entry_count();

    CacheStats statistics() const;
    void reset_statistics();

private:
    KVStore& store_;
    CacheConfig config_;
    Clock clock_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> writes_{0};
    std::atomic<uint64_t> expired_{0};
    std::atomic<uint64_t> corrupt_{0};
};

} // namespace sandhi
