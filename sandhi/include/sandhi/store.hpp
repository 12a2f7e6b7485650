#pragma once
// Key-value store: the persistence seam for stacks, activity and cache
//
// get/set/del/delete_by_prefix is all the core needs; keys_with_prefix exists
// for bulk invalidation where the discriminator is not a key prefix.
// Backends throw StoreError on failure, never return a fake miss.

#include "types.hpp"
#include "errors.hpp"
#include <algorithm>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sandhi {

class KVStore {
public:
    virtual ~KVStore() = default;

    // Value for key, nullopt if absent or expired
    virtual std::optional<std::string> get(const std::string& key) = 0;

    // Store value; ttl_seconds <= 0 means no expiry
    virtual void set(const std::string& key, const std::string& value,
                     int64_t ttl_seconds = 0) = 0;

    // Returns true if something was deleted
    virtual bool del(const std::string& key) = 0;

    // Returns number of keys deleted
    virtual size_t delete_by_prefix(const std::string& prefix) = 0;

    // Live keys starting with prefix, sorted
    virtual std::vector<std::string> keys_with_prefix(const std::string& prefix) = 0;
};

// In-memory store with lazy TTL eviction
class MemoryStore : public KVStore {
public:
    explicit MemoryStore(Clock clock = system_clock())
        : clock_(std::move(clock)) {}

    std::optional<std::string> get(const std::string& key) override {
        {
            std::shared_lock lock(mutex_);
            auto it = entries_.find(key);
            if (it == entries_.end()) return std::nullopt;
            if (!expired(it->second)) return it->second.value;
        }
        std::unique_lock lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end() && expired(it->second)) {
            entries_.erase(it);
        }
        return std::nullopt;
    }

    void set(const std::string& key, const std::string& value,
             int64_t ttl_seconds = 0) override {
        std::unique_lock lock(mutex_);
        Entry e;
        e.value = value;
        e.expires_at = ttl_seconds > 0 ? clock_() + seconds_to_ms(ttl_seconds) : 0;
        entries_[key] = std::move(e);
    }

    bool del(const std::string& key) override {
        std::unique_lock lock(mutex_);
        return entries_.erase(key) > 0;
    }

    size_t delete_by_prefix(const std::string& prefix) override {
        std::unique_lock lock(mutex_);
        size_t removed = 0;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (it->first.compare(0, prefix.size(), prefix) == 0) {
                it = entries_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    std::vector<std::string> keys_with_prefix(const std::string& prefix) override {
        std::shared_lock lock(mutex_);
        std::vector<std::string> keys;
        for (const auto& [key, entry] : entries_) {
            if (key.compare(0, prefix.size(), prefix) == 0 && !expired(entry)) {
                keys.push_back(key);
            }
        }
        std::sort(keys.begin(), keys.end());
        return keys;
    }

    size_t size() const {
        std::shared_lock lock(mutex_);
        return entries_.size();
    }

private:
    struct Entry {
        std::string value;
        Timestamp expires_at = 0;  // 0 = never
    };

    bool expired(const Entry& e) const {
        return e.expires_at != 0 && clock_() > e.expires_at;
    }

    Clock clock_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace sandhi
