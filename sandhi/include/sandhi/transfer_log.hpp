#pragma once
// Transfer Log: per-session history of executed transfers
//
// Stored newest-first as one JSON array under
// "intent_transfer:history:<session>", trimmed to history_limit entries.

#include "config.hpp"
#include "store.hpp"
#include "transfer_rules.hpp"
#include <algorithm>
#include <iostream>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace sandhi {

constexpr const char* HISTORY_KEY_PREFIX = "intent_transfer:history:";

struct TransferRecord {
    std::string session_id;
    std::string user_id;
    std::string from_intent;
    std::string to_intent;
    std::string trigger;         // trigger_name()
    std::string transfer_type;   // transfer_type_name()
    std::string rule_id;
    std::string reason;
    double confidence = 0.0;
    Timestamp at = 0;
};

inline void to_json(json& j, const TransferRecord& r) {
    j = json{
        {"session_id", r.session_id},
        {"user_id", r.user_id},
        {"from_intent", r.from_intent},
        {"to_intent", r.to_intent},
        {"trigger", r.trigger},
        {"transfer_type", r.transfer_type},
        {"rule_id", r.rule_id},
        {"reason", r.reason},
        {"confidence", r.confidence},
        {"at", r.at}
    };
}

inline void from_json(const json& j, TransferRecord& r) {
    r.session_id = j.value("session_id", std::string{});
    r.user_id = j.value("user_id", std::string{});
    r.from_intent = j.value("from_intent", std::string{});
    r.to_intent = j.value("to_intent", std::string{});
    r.trigger = j.value("trigger", std::string{});
    r.transfer_type = j.value("transfer_type", std::string{});
    r.rule_id = j.value("rule_id", std::string{});
    r.reason = j.value("reason", std::string{});
    r.confidence = j.value("confidence", 0.0);
    r.at = j.value("at", Timestamp{0});
}

struct TransferStats {
    size_t total = 0;
    std::map<std::string, size_t> by_trigger;
    std::map<std::string, size_t> patterns;   // "from -> to"
    double average_confidence = 0.0;
    Timestamp earliest = 0;
    Timestamp latest = 0;
};

inline void to_json(json& j, const TransferStats& s) {
    j = json{
        {"total_transfers", s.total},
        {"transfer_types", s.by_trigger},
        {"common_patterns", s.patterns},
        {"avg_confidence", s.average_confidence},
        {"time_range", {
            {"earliest", s.earliest ? json(s.earliest) : json(nullptr)},
            {"latest", s.latest ? json(s.latest) : json(nullptr)}
        }}
    };
}

class TransferLog {
public:
    TransferLog(KVStore& store, TransferConfig config = {})
        : store_(store), config_(std::move(config)) {}

    // Prepend a record; throws StoreError
    void record(const TransferRecord& rec) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto records = load(rec.session_id);
        records.insert(records.begin(), rec);
        if (records.size() > config_.history_limit) records.resize(config_.history_limit);

        json doc = json::array();
        for (const auto& r : records) doc.push_back(r);
        store_.set(key(rec.session_id), doc.dump(), config_.history_ttl_seconds);
    }

    // Newest first, at most limit entries
    std::vector<TransferRecord> history(const std::string& session, size_t limit = 10) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto records = load(session);
        if (records.size() > limit) records.resize(limit);
        return records;
    }

    TransferStats statistics(const std::string& session) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto records = load(session);

        TransferStats stats;
        stats.total = records.size();
        if (records.empty()) return stats;

        double confidence_sum = 0.0;
        size_t confidence_count = 0;
        stats.earliest = records.front().at;
        stats.latest = records.front().at;
        for (const auto& r : records) {
            stats.by_trigger[r.trigger]++;
            stats.patterns[r.from_intent + " -> " + r.to_intent]++;
            if (r.confidence > 0.0) {
                confidence_sum += r.confidence;
                ++confidence_count;
            }
            stats.earliest = std::min(stats.earliest, r.at);
            stats.latest = std::max(stats.latest, r.at);
        }
        if (confidence_count > 0) {
            stats.average_confidence = confidence_sum / static_cast<double>(confidence_count);
        }
        return stats;
    }

    bool clear(const std::string& session) {
        std::lock_guard<std::mutex> lock(mutex_);
        return store_.del(key(session));
    }

private:
    static std::string key(const std::string& session) {
        return HISTORY_KEY_PREFIX + session;
    }

    // A damaged history is dropped rather than failing the transfer
    std::vector<TransferRecord> load(const std::string& session) {
        std::vector<TransferRecord> records;
        auto raw = store_.get(key(session));
        if (!raw) return records;
        try {
            auto doc = json::parse(*raw);
            if (!doc.is_array()) throw std::runtime_error("not an array");
            for (const auto& entry : doc) records.push_back(entry.get<TransferRecord>());
        } catch (const std::exception& e) {
            std::cerr << "[TransferLog] Discarding unreadable history for "
                      << session << ": " << e.what() << "\n";
            records.clear();
        }
        return records;
    }

    KVStore& store_;
    TransferConfig config_;
    std::mutex mutex_;
};

} // namespace sandhi
