#pragma once
#include <string>
#include <functional>
#include <unordered_map>
#include <mutex>
#include <cstdint>

namespace chanflow {

// Returns the current date as YYYY-MM-DD
using DateSource = std::function<std::string()>;

// Temporary same-day boosts to a channel's daily reply limit.
// In-memory only: a restart forgets every boost.
class DailyQuota {
public:
    // Defaults to the local calendar date
    explicit DailyQuota(DateSource today = {});

    // Today's boost for key, 0 if none or recorded on an earlier date
    int64_t get_boost(const std::string& key) const;

    void set_boost(const std::string& key, int64_t amount);

    // Add to today's boost (a stale boost counts as 0). Returns the new total.
    int64_t add_boost(const std::string& key, int64_t amount);

    void clear_boost(const std::string& key);

    int64_t effective_limit(const std::string& key, int64_t base_limit) const;

    // False when base_limit <= 0 (unlimited)
    bool limit_reached(const std::string& key, int64_t daily_count,
                       int64_t base_limit) const;

private:
    struct Record {
        std::string date;
        int64_t boost = 0;
    };

    int64_t current_locked(const std::string& key, const std::string& today) const;
    void store_locked(const std::string& key, const std::string& today, int64_t amount);

    DateSource today_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Record> records_;
};

} // namespace chanflow
