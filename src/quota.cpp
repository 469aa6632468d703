#include "quota.hpp"
#include "util.hpp"
#include <iostream>

namespace chanflow {

DailyQuota::DailyQuota(DateSource today)
    : today_(today ? std::move(today) : DateSource(local_date_today))
{}

int64_t DailyQuota::current_locked(const std::string& key, const std::string& today) const {
    auto it = records_.find(key);
    if (it == records_.end() || it->second.date != today) return 0;
    return it->second.boost;
}

void DailyQuota::store_locked(const std::string& key, const std::string& today,
                              int64_t amount) {
    records_[key] = Record{today, amount};
    std::cerr << "[quota] Boost for " << key << " set to " << amount
              << " for " << today << "\n";
}

int64_t DailyQuota::get_boost(const std::string& key) const {
    std::string today = today_();
    std::lock_guard<std::mutex> lock(mutex_);
    return current_locked(key, today);
}

void DailyQuota::set_boost(const std::string& key, int64_t amount) {
    std::string today = today_();
    std::lock_guard<std::mutex> lock(mutex_);
    store_locked(key, today, amount);
}

int64_t DailyQuota::add_boost(const std::string& key, int64_t amount) {
    std::string today = today_();
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t total = current_locked(key, today) + amount;
    store_locked(key, today, total);
    return total;
}

void DailyQuota::clear_boost(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.erase(key);
}

int64_t DailyQuota::effective_limit(const std::string& key, int64_t base_limit) const {
    return base_limit + get_boost(key);
}

bool DailyQuota::limit_reached(const std::string& key, int64_t daily_count,
                               int64_t base_limit) const {
    if (base_limit <= 0) return false;
    return daily_count >= effective_limit(key, base_limit);
}

} // namespace chanflow
