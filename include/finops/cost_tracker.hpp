#pragma once

#include "finops/anomaly_detector.hpp"
#include "finops/budget_store.hpp"
#include "finops/pricing.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace llmshield {

enum class BudgetPeriod {
    HOURLY,
    DAILY,
    MONTHLY
};

[[nodiscard]] const char* budget_period_to_string(BudgetPeriod p);
[[nodiscard]] std::optional<BudgetPeriod> parse_budget_period(std::string_view s);

/// Period length in seconds (monthly = 31 days)
[[nodiscard]] int64_t budget_period_seconds(BudgetPeriod p);

struct BudgetConfig {
    double soft_limit = 0.0;        // USD, warning above
    double hard_limit = 0.0;        // USD, denied above
    BudgetPeriod period = BudgetPeriod::DAILY;
};

struct CostRecord {
    std::string entity_id;
    std::string model;
    uint64_t input_tokens = 0;
    uint64_t output_tokens = 0;
    double cost = 0.0;              // USD
    std::chrono::system_clock::time_point timestamp;
};

struct BudgetCheckResult {
    bool allowed = true;
    double current_spend = 0.0;
    double remaining_budget = 0.0;  // +inf when the entity has no budget
    std::optional<std::string> warning;
};

/**
 * @brief Budget enforcement over a pluggable counter store
 *
 * Spend accumulates per entity under "<prefix>:cost:<entity>:<period key>",
 * the period key being the current UTC hour, day or month. Every increment
 * refreshes a TTL of twice the period so stale keys clean themselves up.
 *
 * check_budget is an advisory snapshot: concurrent record_cost calls between a
 * check and the matching record are not serialized.
 *
 * With cascade_to_global, recording for any entity other than "global" also
 * increments the "global" counter when a "global" budget is configured.
 *
 * Store failures propagate to the caller.
 */
class CostTracker {
public:
    static constexpr std::string_view kGlobalEntity = "global";

    struct Config {
        std::unordered_map<std::string, BudgetConfig> budgets;
        PricingTable pricing;
        bool cascade_to_global = true;
        std::string key_prefix = "llm-shield";
        size_t max_records = 10000;             // In-process record log bound
        double anomaly_threshold = 2.5;
    };

    /// @throws ShieldError(CONFIG_ERROR) on invalid budget limits
    explicit CostTracker(Config config, std::shared_ptr<IBudgetStore> store = nullptr);

    [[nodiscard]] BudgetCheckResult check_budget(const std::string& entity_id,
                                                 std::string_view model,
                                                 uint64_t est_input_tokens,
                                                 uint64_t est_output_tokens = 500);

    CostRecord record_cost(const std::string& entity_id,
                           std::string_view model,
                           uint64_t input_tokens,
                           uint64_t output_tokens);

    [[nodiscard]] double get_current_spend(const std::string& entity_id);

    /// Copy of the in-process record log, oldest first
    [[nodiscard]] std::vector<CostRecord> records() const;

    /// Z-score of cost against this entity's previously recorded costs
    [[nodiscard]] AnomalyResult check_anomaly(const std::string& entity_id, double cost) const;

    [[nodiscard]] std::string budget_key(
        std::string_view entity_id, BudgetPeriod period,
        std::chrono::system_clock::time_point at = std::chrono::system_clock::now()) const;

    [[nodiscard]] const BudgetConfig* find_budget(const std::string& entity_id) const;
    [[nodiscard]] const PricingTable& pricing() const { return config_.pricing; }

    struct Stats {
        uint64_t total_recorded = 0;
        uint64_t budget_denials = 0;
        uint64_t budget_warnings = 0;
        size_t records_retained = 0;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    [[nodiscard]] double read_spend(const std::string& key);
    void increment(const std::string& entity_id, const BudgetConfig& budget, double cost);

    Config config_;
    std::shared_ptr<IBudgetStore> store_;

    std::deque<CostRecord> records_;      // Oldest first
    mutable std::shared_mutex records_mutex_;

    std::atomic<uint64_t> total_recorded_{0};
    std::atomic<uint64_t> budget_denials_{0};
    std::atomic<uint64_t> budget_warnings_{0};
};

} // namespace llmshield
