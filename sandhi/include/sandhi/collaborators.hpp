#pragma once
// Collaborators: interfaces the core consumes but never implements
//
// Classifier, conversation history, session context and user profile are
// supplied by the host. Every call out goes through call_with_timeout; a
// throw or a timeout is a failure for that call only, never retried.

#include "types.hpp"
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace sandhi {

struct Classification {
    std::string intent;
    double confidence = 0.0;
};

// A slot value as a source saw it; timestamp 0 means "age unknown"
struct SourceValue {
    Value value;
    Timestamp timestamp = 0;
};

using SourceMap = std::map<std::string, SourceValue>;

struct UserProfile {
    json preferences = json::object();
    json frequent_values = json::object();   // slot -> {"most_frequent": v, ...}
    Timestamp last_updated = 0;              // Part of the cache fingerprint
};

class Classifier {
public:
    virtual ~Classifier() = default;
    virtual Classification classify(const std::string& text, const ValueMap& context) = 0;
};

class HistorySource {
public:
    virtual ~HistorySource() = default;
    // Most recent value per slot across the user's last `limit` turns
    virtual SourceMap recent_slot_values(const std::string& user, size_t limit) = 0;
};

class SessionContextSource {
public:
    virtual ~SessionContextSource() = default;
    // "<slot>_timestamp" entries (Unix millis) date the matching slot
    virtual ValueMap current_context(const std::string& session) = 0;
};

class ProfileSource {
public:
    virtual ~ProfileSource() = default;
    virtual UserProfile profile(const std::string& user) = 0;
};

// Run fn on a worker thread and wait at most timeout_ms.
// nullopt on timeout or throw, with the reason in *error. A timed-out call
// keeps running detached, so whatever fn touches must outlive it.
template <typename Fn>
auto call_with_timeout(Fn fn, int64_t timeout_ms, std::string* error = nullptr)
    -> std::optional<decltype(fn())> {
    using R = decltype(fn());

    auto promise = std::make_shared<std::promise<R>>();
    auto fut = promise->get_future();
    std::thread([promise, fn = std::move(fn)]() mutable {
        try {
            promise->set_value(fn());
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    if (timeout_ms > 0 &&
        fut.wait_for(std::chrono::milliseconds(timeout_ms)) == std::future_status::timeout) {
        if (error) *error = "timed out after " + std::to_string(timeout_ms) + "ms";
        return std::nullopt;
    }

    try {
        return fut.get();
    } catch (const std::exception& e) {
        if (error) *error = e.what();
        return std::nullopt;
    }
}

} // namespace sandhi
