#include "config.hpp"
#include "util.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace chanflow {

std::chrono::milliseconds SchedulerConfig::debounce_for(const std::string& chat_key) const {
    auto it = debounce_overrides.find(chat_key);
    if (it != debounce_overrides.end()) return std::chrono::milliseconds(it->second);
    return std::chrono::milliseconds(debounce_ms);
}

bool QuotaConfig::is_whitelisted(const std::string& sender_id) const {
    return std::find(whitelist.begin(), whitelist.end(), sender_id) != whitelist.end();
}

nlohmann::json Config::defaults_json() {
    return {
        {"verbose", false},
        {"scheduler", {
            {"debounce_ms", 1000},
            {"max_attempts", 3},
            {"debounce_overrides", nlohmann::json::object()}
        }},
        {"broadcast", {
            {"message_inbox_capacity", 256},
            {"channel_inbox_capacity", 64}
        }},
        {"quota", {
            {"daily_reply_limit", 0},
            {"whitelist", nlohmann::json::array()}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static bool read_uint(const nlohmann::json& value, uint32_t& out) {
    if (!value.is_number_integer()) return false;
    auto v = value.get<int64_t>();
    if (v < 0 || v > static_cast<int64_t>(UINT32_MAX)) return false;
    out = static_cast<uint32_t>(v);
    return true;
}

// Positive values only; zero would disable the component.
static void read_positive(const nlohmann::json& obj, const char* key, uint32_t& out) {
    uint32_t v = 0;
    if (obj.contains(key) && read_uint(obj[key], v) && v > 0) out = v;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("verbose") && j["verbose"].is_boolean())
        cfg.verbose = j["verbose"].get<bool>();

    if (j.contains("scheduler") && j["scheduler"].is_object()) {
        auto& s = j["scheduler"];
        if (s.contains("debounce_ms"))
            read_uint(s["debounce_ms"], cfg.scheduler.debounce_ms);
        read_positive(s, "max_attempts", cfg.scheduler.max_attempts);
        if (s.contains("debounce_overrides") && s["debounce_overrides"].is_object()) {
            for (auto& [key, value] : s["debounce_overrides"].items()) {
                uint32_t ms = 0;
                if (read_uint(value, ms)) cfg.scheduler.debounce_overrides[key] = ms;
            }
        }
    }

    if (j.contains("broadcast") && j["broadcast"].is_object()) {
        auto& b = j["broadcast"];
        read_positive(b, "message_inbox_capacity", cfg.broadcast.message_inbox_capacity);
        read_positive(b, "channel_inbox_capacity", cfg.broadcast.channel_inbox_capacity);
    }

    if (j.contains("quota") && j["quota"].is_object()) {
        auto& q = j["quota"];
        if (q.contains("daily_reply_limit") && q["daily_reply_limit"].is_number_integer())
            cfg.quota.daily_reply_limit = q["daily_reply_limit"].get<int64_t>();
        if (q.contains("whitelist") && q["whitelist"].is_array()) {
            for (const auto& id : q["whitelist"]) {
                if (id.is_string()) cfg.quota.whitelist.push_back(id.get<std::string>());
            }
        }
    }

    return cfg;
}

// Env values must be plain non-negative integers; anything else is ignored.
static bool parse_env_uint(const char* name, uint32_t& out) {
    const char* v = std::getenv(name);
    if (!v || !*v) return false;
    char* end = nullptr;
    errno = 0;
    unsigned long parsed = std::strtoul(v, &end, 10);
    if (*end != '\0' || v[0] == '-' || errno == ERANGE || parsed > UINT32_MAX) {
        std::cerr << "[config] Ignoring invalid " << name << "=" << v << "\n";
        return false;
    }
    out = static_cast<uint32_t>(parsed);
    return true;
}

Config Config::load() {
    std::string config_path = expand_home("~/.chanflow/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
                }
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed " << config_path << ": " << e.what()
                      << " (using defaults)\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    uint32_t v = 0;
    if (parse_env_uint("CHANFLOW_DEBOUNCE_MS", v))
        cfg.scheduler.debounce_ms = v;
    if (parse_env_uint("CHANFLOW_MAX_ATTEMPTS", v) && v > 0)
        cfg.scheduler.max_attempts = v;
    if (parse_env_uint("CHANFLOW_INBOX_CAPACITY", v) && v > 0)
        cfg.broadcast.message_inbox_capacity = v;
    if (parse_env_uint("CHANFLOW_DAILY_REPLY_LIMIT", v))
        cfg.quota.daily_reply_limit = v;

    return cfg;
}

} // namespace chanflow
