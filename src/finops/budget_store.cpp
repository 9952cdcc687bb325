#include "finops/budget_store.hpp"

#include <format>

namespace llmshield {

InMemoryBudgetStore::Entry* InMemoryBudgetStore::find_live(const std::string& key) {
    const auto it = data_.find(key);
    if (it == data_.end()) return nullptr;
    if (it->second.expires_at && Clock::now() >= *it->second.expires_at) {
        data_.erase(it);
        return nullptr;
    }
    return &it->second;
}

std::optional<std::string> InMemoryBudgetStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto* entry = find_live(key);
    if (!entry) return std::nullopt;
    return std::format("{}", entry->value);
}

std::string InMemoryBudgetStore::incrbyfloat(const std::string& key, double amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* entry = find_live(key);
    if (!entry) {
        entry = &data_[key];
    }
    entry->value += amount;
    return std::format("{}", entry->value);
}

int InMemoryBudgetStore::expire(const std::string& key, int64_t seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* entry = find_live(key);
    if (!entry) return 0;
    if (seconds <= 0) {
        data_.erase(key);
        return 1;
    }
    entry->expires_at = Clock::now() + std::chrono::seconds(seconds);
    return 1;
}

size_t InMemoryBudgetStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.size();
}

std::optional<std::chrono::seconds> InMemoryBudgetStore::ttl(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = data_.find(key);
    if (it == data_.end() || !it->second.expires_at) return std::nullopt;
    return std::chrono::duration_cast<std::chrono::seconds>(*it->second.expires_at - Clock::now());
}

} // namespace llmshield
