#pragma once
// Core types: time, values, identifiers
//
// A value is whatever JSON can carry. Maps of values are ordered so that
// anything derived from them (fingerprints, serialized stacks) is stable.

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <map>
#include <random>
#include <string>
#include <vector>

namespace sandhi {

using json = nlohmann::json;

// Timestamp as Unix millis
using Timestamp = int64_t;

// Current time as Timestamp
inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

// Time source injected into every component that reads the clock
using Clock = std::function<Timestamp()>;

inline Clock system_clock() {
    return [] { return now(); };
}

constexpr int64_t MS_PER_SECOND = 1000;

inline Timestamp seconds_to_ms(int64_t seconds) {
    return seconds * MS_PER_SECOND;
}

// Opaque slot/context value and keyed collections of them
using Value = json;
using ValueMap = std::map<std::string, Value>;

// A value counts as filled unless it is null or an empty string/array/object
inline bool is_filled(const Value& v) {
    if (v.is_null()) return false;
    if (v.is_string()) return !v.get_ref<const std::string&>().empty();
    if (v.is_array() || v.is_object()) return !v.empty();
    return true;
}

inline bool has_filled(const ValueMap& values, const std::string& key) {
    auto it = values.find(key);
    return it != values.end() && is_filled(it->second);
}

// String form used for loose comparisons ("42" equals 42)
inline std::string value_to_string(const Value& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_null()) return "";
    return v.dump();
}

// Random frame identifier: "frame_" + 12 hex chars
inline std::string generate_frame_id() {
    static thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dis;
    char buf[13];
    snprintf(buf, sizeof(buf), "%012llx",
             static_cast<unsigned long long>(dis(gen) & 0xFFFFFFFFFFFFULL));
    return std::string("frame_") + buf;
}

// FNV-1a 64-bit (simple, no external deps)
inline uint64_t fnv1a64(const std::string& data) {
    uint64_t hash = 0xcbf29ce484222325ULL;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 0x100000001b3ULL;
    }
    return hash;
}

inline std::string hex16(uint64_t v) {
    char buf[17];
    snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(v));
    return buf;
}

// ASCII lowercase; multi-byte UTF-8 sequences pass through untouched
inline std::string ascii_lower(std::string s) {
    for (char& c : s) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return s;
}

inline bool contains_ci(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return false;
    return ascii_lower(haystack).find(ascii_lower(needle)) != std::string::npos;
}

} // namespace sandhi
