#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace chanflow {

struct SchedulerConfig {
    uint32_t debounce_ms = 1000;
    uint32_t max_attempts = 3;
    // Per-channel debounce window, keyed by chat key
    std::unordered_map<std::string, uint32_t> debounce_overrides;

    std::chrono::milliseconds debounce_for(const std::string& chat_key) const;
};

struct BroadcastConfig {
    uint32_t message_inbox_capacity = 256;
    uint32_t channel_inbox_capacity = 64;
};

struct QuotaConfig {
    int64_t daily_reply_limit = 0;       // 0 = unlimited
    std::vector<std::string> whitelist;  // sender ids exempt from the limit

    bool is_whitelisted(const std::string& sender_id) const;
};

struct Config {
    SchedulerConfig scheduler;
    BroadcastConfig broadcast;
    QuotaConfig quota;
    bool verbose = false;

    // Load from ~/.chanflow/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Typed parse; values of the wrong type are ignored
    static Config from_json(const nlohmann::json& j);
};

} // namespace chanflow
