#pragma once
// Value transforms applied to inherited slot values
//
// Pure functions looked up by name. A transform may throw; the inheritance
// engine turns that into a skip for the one rule that used it.

#include "types.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace sandhi {

using Transform = std::function<Value(const Value&)>;

namespace transforms {

inline std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

inline bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

inline Value to_lowercase(const Value& v) {
    return ascii_lower(value_to_string(v));
}

inline Value to_uppercase(const Value& v) {
    std::string s = value_to_string(v);
    for (char& c : s) {
        if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
    }
    return s;
}

// "2024-03-01T08:30:00" -> "2024-03-01"; anything else passes through as text
inline Value normalize_date(const Value& v) {
    std::string s = trim(value_to_string(v));
    if (s.size() < 10) return s;
    for (size_t i : {0u, 1u, 2u, 3u, 5u, 6u, 8u, 9u}) {
        if (s[i] < '0' || s[i] > '9') return s;
    }
    if (s[4] != '-' || s[7] != '-') return s;
    if (s.size() > 10 && s[10] != 'T' && s[10] != ' ') return s;
    return s.substr(0, 10);
}

// Short city names gain their administrative suffix: 北京 -> 北京市
inline Value extract_city(const Value& v) {
    static const std::map<std::string, std::string> known = {
        {"北京", "北京市"}, {"上海", "上海市"}, {"广州", "广州市"},
        {"深圳", "深圳市"}, {"杭州", "杭州市"}, {"南京", "南京市"},
    };
    std::string s = trim(value_to_string(v));
    for (const char* suffix : {"市", "区", "县", "镇"}) {
        if (ends_with(s, suffix)) return s;
    }
    auto it = known.find(s);
    return it != known.end() ? it->second : s;
}

// Digits only; eleven digits are grouped 3-4-4
inline Value format_phone(const Value& v) {
    std::string digits;
    for (char c : value_to_string(v)) {
        if (c >= '0' && c <= '9') digits += c;
    }
    if (digits.size() == 11) {
        return digits.substr(0, 3) + "-" + digits.substr(3, 4) + "-" + digits.substr(7);
    }
    return digits;
}

// Title case per word: "  zhang SAN " -> "Zhang San"
inline Value normalize_name(const Value& v) {
    std::string s = trim(value_to_string(v));
    bool word_start = true;
    for (char& c : s) {
        bool alpha = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
        if (alpha) {
            if (word_start && c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
            if (!word_start && c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
            word_start = false;
        } else {
            word_start = true;
        }
    }
    return s;
}

} // namespace transforms

class TransformRegistry {
public:
    // Registry preloaded with the builtin transforms
    static TransformRegistry with_builtins() {
        TransformRegistry r;
        r.add("to_lowercase", transforms::to_lowercase);
        r.add("to_uppercase", transforms::to_uppercase);
        r.add("normalize_date", transforms::normalize_date);
        r.add("extract_city", transforms::extract_city);
        r.add("format_phone", transforms::format_phone);
        r.add("normalize_name", transforms::normalize_name);
        return r;
    }

    TransformRegistry() = default;
    TransformRegistry(const TransformRegistry& other) : transforms_(other.snapshot()) {}
    TransformRegistry& operator=(const TransformRegistry& other) {
        if (this != &other) {
            auto copy = other.snapshot();
            std::unique_lock lock(mutex_);
            transforms_ = std::move(copy);
        }
        return *this;
    }

    void add(const std::string& name, Transform fn) {
        std::unique_lock lock(mutex_);
        transforms_[name] = std::move(fn);
    }

    bool contains(const std::string& name) const {
        std::shared_lock lock(mutex_);
        return transforms_.count(name) > 0;
    }

    // nullopt if no transform has that name
    std::optional<Value> apply(const std::string& name, const Value& v) const {
        Transform fn;
        {
            std::shared_lock lock(mutex_);
            auto it = transforms_.find(name);
            if (it == transforms_.end()) return std::nullopt;
            fn = it->second;
        }
        return fn(v);
    }

    std::vector<std::string> names() const {
        std::shared_lock lock(mutex_);
        std::vector<std::string> out;
        for (const auto& [name, _] : transforms_) out.push_back(name);
        return out;
    }

private:
    std::map<std::string, Transform> snapshot() const {
        std::shared_lock lock(mutex_);
        return transforms_;
    }

    mutable std::shared_mutex mutex_;
    std::map<std::string, Transform> transforms_;
};

} // namespace sandhi
