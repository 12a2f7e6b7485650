#pragma once
// Configuration: one struct per component, defaults in-class
//
// Load order: defaults -> JSON file -> environment.
//   SANDHI_DB_PATH          SQLite file for the CLI
//   SANDHI_MAX_DEPTH        intent stack depth bound
//   SANDHI_CACHE_TTL        inheritance cache TTL (seconds)
//   SANDHI_SESSION_TIMEOUT  inactivity window (seconds)

#include "types.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace sandhi {

struct StackConfig {
    size_t max_depth = 5;                  // Frames per session
    int64_t frame_ttl_seconds = 86400;     // 24 hours until a frame expires
    int64_t store_ttl_seconds = 86400;     // Backing-store TTL for the stack record
    bool verbose = false;
};

struct TransferConfig {
    int64_t session_timeout_seconds = 1800;   // 30 minutes of silence
    int error_threshold = 3;                  // Consecutive errors before recovery
    std::string error_count_key = "error_count";
    std::string timeout_target = "timeout";
    std::string error_target = "error-recovery";
    std::string exit_target = "session-end";
    std::vector<std::string> exit_patterns = {
        "退出", "结束", "不要", "算了", "exit", "quit", "stop"
    };
    std::vector<std::string> back_patterns = {
        "返回上一步", "回到上一个", "go back", "previous step"
    };
    int64_t classifier_timeout_ms = 2000;
    size_t history_limit = 50;                // Transfer records kept per session
    int64_t history_ttl_seconds = 86400;
    bool verbose = false;
};

struct InheritanceConfig {
    size_t history_limit = 10;          // Conversation turns scanned for values
    int64_t source_timeout_ms = 1000;   // Per-collaborator call bound
    bool use_cache = true;
    bool install_default_rules = true;
    ValueMap default_values;            // DEFAULT source
    bool verbose = false;
};

struct CacheConfig {
    int64_t default_ttl_seconds = 1800;  // 30 minutes
    bool verbose = false;
};

struct SweeperConfig {
    int64_t interval_ms = 60000;  // 1 minute between sweeps
    bool enabled = false;
};

struct SandhiConfig {
    std::string db_path = "./sandhi.db";
    StackConfig stack;
    TransferConfig transfer;
    InheritanceConfig inheritance;
    CacheConfig cache;
    SweeperConfig sweeper;

    json intents = json::array();         // Catalog entries (see catalog.hpp)
    json transfer_rules = json::array();  // Extra rules (see transfer_rules.hpp)
};

// ═══════════════════════════════════════════════════════════════════════════
// JSON binding
// ═══════════════════════════════════════════════════════════════════════════

inline void from_json(const json& j, StackConfig& c) {
    c.max_depth = j.value("max_depth", c.max_depth);
    c.frame_ttl_seconds = j.value("frame_ttl_seconds", c.frame_ttl_seconds);
    c.store_ttl_seconds = j.value("store_ttl_seconds", c.store_ttl_seconds);
    c.verbose = j.value("verbose", c.verbose);
}

inline void from_json(const json& j, TransferConfig& c) {
    c.session_timeout_seconds = j.value("session_timeout_seconds", c.session_timeout_seconds);
    c.error_threshold = j.value("error_threshold", c.error_threshold);
    c.error_count_key = j.value("error_count_key", c.error_count_key);
    c.timeout_target = j.value("timeout_target", c.timeout_target);
    c.error_target = j.value("error_target", c.error_target);
    c.exit_target = j.value("exit_target", c.exit_target);
    c.exit_patterns = j.value("exit_patterns", c.exit_patterns);
    c.back_patterns = j.value("back_patterns", c.back_patterns);
    c.classifier_timeout_ms = j.value("classifier_timeout_ms", c.classifier_timeout_ms);
    c.history_limit = j.value("history_limit", c.history_limit);
    c.history_ttl_seconds = j.value("history_ttl_seconds", c.history_ttl_seconds);
    c.verbose = j.value("verbose", c.verbose);
}

inline void from_json(const json& j, InheritanceConfig& c) {
    c.history_limit = j.value("history_limit", c.history_limit);
    c.source_timeout_ms = j.value("source_timeout_ms", c.source_timeout_ms);
    c.use_cache = j.value("use_cache", c.use_cache);
    c.install_default_rules = j.value("install_default_rules", c.install_default_rules);
    if (j.contains("default_values")) {
        c.default_values = j.at("default_values").get<ValueMap>();
    }
    c.verbose = j.value("verbose", c.verbose);
}

inline void from_json(const json& j, CacheConfig& c) {
    c.default_ttl_seconds = j.value("default_ttl_seconds", c.default_ttl_seconds);
    c.verbose = j.value("verbose", c.verbose);
}

inline void from_json(const json& j, SweeperConfig& c) {
    c.interval_ms = j.value("interval_ms", c.interval_ms);
    c.enabled = j.value("enabled", c.enabled);
}

inline void from_json(const json& j, SandhiConfig& c) {
    c.db_path = j.value("db_path", c.db_path);
    if (j.contains("stack")) j.at("stack").get_to(c.stack);
    if (j.contains("transfer")) j.at("transfer").get_to(c.transfer);
    if (j.contains("inheritance")) j.at("inheritance").get_to(c.inheritance);
    if (j.contains("cache")) j.at("cache").get_to(c.cache);
    if (j.contains("sweeper")) j.at("sweeper").get_to(c.sweeper);
    if (j.contains("intents")) c.intents = j.at("intents");
    if (j.contains("transfer_rules")) c.transfer_rules = j.at("transfer_rules");
}

// ═══════════════════════════════════════════════════════════════════════════
// Loading
// ═══════════════════════════════════════════════════════════════════════════

inline void apply_env_overrides(SandhiConfig& c) {
    if (const char* v = std::getenv("SANDHI_DB_PATH")) {
        c.db_path = v;
    }
    if (const char* v = std::getenv("SANDHI_MAX_DEPTH")) {
        long depth = std::strtol(v, nullptr, 10);
        if (depth > 0) c.stack.max_depth = static_cast<size_t>(depth);
    }
    if (const char* v = std::getenv("SANDHI_CACHE_TTL")) {
        long ttl = std::strtol(v, nullptr, 10);
        if (ttl > 0) c.cache.default_ttl_seconds = ttl;
    }
    if (const char* v = std::getenv("SANDHI_SESSION_TIMEOUT")) {
        long t = std::strtol(v, nullptr, 10);
        if (t > 0) c.transfer.session_timeout_seconds = t;
    }
}

// Parse a config document; nullopt (with error filled) on malformed input
inline std::optional<SandhiConfig> parse_config(const std::string& text,
                                                std::string* error = nullptr) {
    try {
        SandhiConfig config = json::parse(text).get<SandhiConfig>();
        if (config.stack.max_depth == 0) {
            if (error) *error = "stack.max_depth must be positive";
            return std::nullopt;
        }
        return config;
    } catch (const json::exception& e) {
        if (error) *error = e.what();
        return std::nullopt;
    }
}

// Load config file, then apply environment overrides
inline std::optional<SandhiConfig> load_config(const std::string& path,
                                               std::string* error = nullptr) {
    std::ifstream in(path);
    if (!in) {
        if (error) *error = "cannot read " + path;
        return std::nullopt;
    }
    std::string text((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());
    auto config = parse_config(text, error);
    if (!config) {
        std::cerr << "[config] Failed to load " << path << ": "
                  << (error ? *error : std::string("parse error")) << "\n";
        return std::nullopt;
    }
    apply_env_overrides(*config);
    return config;
}

} // namespace sandhi
