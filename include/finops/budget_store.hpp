#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace llmshield {

/**
 * @brief Counter store backing budget enforcement
 *
 * Mirrors the Redis primitives the tracker needs. incrbyfloat must be atomic
 * per key against concurrent callers; the tracker never does read-modify-write.
 * Implementations report failures by throwing; the tracker does not catch them.
 */
class IBudgetStore {
public:
    virtual ~IBudgetStore() = default;

    /// Current value as a decimal string, nullopt if absent or expired
    [[nodiscard]] virtual std::optional<std::string> get(const std::string& key) = 0;

    /// Atomically add amount (absent = 0) and return the new value
    virtual std::string incrbyfloat(const std::string& key, double amount) = 0;

    /// Set time-to-live. Returns 1 if the key exists, 0 otherwise.
    virtual int expire(const std::string& key, int64_t seconds) = 0;
};

/**
 * @brief In-process store for standalone use and tests
 *
 * One mutex serializes all operations. Expired keys are dropped on access.
 * A non-positive TTL deletes the key.
 */
class InMemoryBudgetStore : public IBudgetStore {
public:
    using Clock = std::chrono::steady_clock;

    [[nodiscard]] std::optional<std::string> get(const std::string& key) override;
    std::string incrbyfloat(const std::string& key, double amount) override;
    int expire(const std::string& key, int64_t seconds) override;

    [[nodiscard]] size_t size() const;
    [[nodiscard]] std::optional<std::chrono::seconds> ttl(const std::string& key) const;

private:
    struct Entry {
        double value = 0.0;
        std::optional<Clock::time_point> expires_at;
    };

    // Caller holds mutex_
    Entry* find_live(const std::string& key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> data_;
};

} // namespace llmshield
