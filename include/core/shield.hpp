#pragma once

#include "audit/audit_logger.hpp"
#include "audit/audit_store.hpp"
#include "cache/scan_cache.hpp"
#include "config/config_types.hpp"
#include "core/types.hpp"
#include "finops/budget_store.hpp"
#include "finops/cost_tracker.hpp"
#include "policy/policy_engine.hpp"
#include "scanner/scanner_chain.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace llmshield {

/**
 * @brief Single entry point: scanner chain, cost tracking and auditing
 *
 * Chain wiring (each stage unless disabled in the config):
 * 1. Heuristic injection scanner
 * 2. PII scanner
 * 3. Tool policy scanner
 *
 * Unset config values fall back to the active preset. Budget calls answer
 * "allowed, zero spend" when no cost tracker is configured.
 *
 * scan() is safe to call from many threads. Audit records are handed to the
 * background writer and never delay the caller.
 */
class Shield {
public:
    /// Externally owned stores; null members fall back to config-built defaults
    struct Dependencies {
        std::shared_ptr<IBudgetStore> budget_store;
        std::shared_ptr<IAuditStore> audit_store;
    };

    Shield() : Shield(ShieldConfig{}) {}

    /// @throws ShieldError on invalid configuration (patterns, pins, budgets, audit store)
    explicit Shield(const ShieldConfig& config, Dependencies deps = {});
    ~Shield();

    Shield(const Shield&) = delete;
    Shield& operator=(const Shield&) = delete;

    [[nodiscard]] ScanResult scan(std::string_view input, const ScanContext& context = {});

    [[nodiscard]] BudgetCheckResult check_budget(const std::string& entity_id,
                                                 std::string_view model,
                                                 uint64_t est_input_tokens,
                                                 uint64_t est_output_tokens = 500);

    /// nullopt when no cost tracker is configured
    std::optional<CostRecord> record_cost(const std::string& entity_id,
                                          std::string_view model,
                                          uint64_t input_tokens,
                                          uint64_t output_tokens);

    [[nodiscard]] double get_current_spend(const std::string& entity_id);

    /// Flush and close the audit logger. Idempotent.
    void close();

    [[nodiscard]] const PolicyEngine& policy() const { return policy_; }
    [[nodiscard]] const ScannerChain& chain() const { return chain_; }
    [[nodiscard]] PresetName preset() const { return config_.preset; }

    // Null when the component is not configured
    [[nodiscard]] CostTracker* cost_tracker() const { return cost_tracker_.get(); }
    [[nodiscard]] AuditLogger* audit_logger() const { return audit_logger_.get(); }
    [[nodiscard]] ScanCache<ScanResult>* scan_cache() const { return scan_cache_.get(); }

    struct Stats {
        uint64_t total_scans;
        uint64_t blocked;
        uint64_t warned;
        uint64_t cache_hits;
    };

    [[nodiscard]] Stats stats() const {
        return {
            .total_scans = total_scans_.load(std::memory_order_relaxed),
            .blocked = blocked_.load(std::memory_order_relaxed),
            .warned = warned_.load(std::memory_order_relaxed),
            .cache_hits = cache_hits_.load(std::memory_order_relaxed),
        };
    }

    /// SHA-256 over input, agent, preset and declared tools
    [[nodiscard]] static std::string cache_key(std::string_view input, const ScanContext& context);

private:
    void setup_scanners();
    void setup_cost_tracker(std::shared_ptr<IBudgetStore> store);
    void setup_audit(std::shared_ptr<IAuditStore> store);
    void count(const ScanResult& result);

    ShieldConfig config_;
    PolicyEngine policy_;
    ScannerChain chain_;
    std::unique_ptr<CostTracker> cost_tracker_;
    std::unique_ptr<AuditLogger> audit_logger_;
    std::unique_ptr<ScanCache<ScanResult>> scan_cache_;

    std::atomic<uint64_t> total_scans_{0};
    std::atomic<uint64_t> blocked_{0};
    std::atomic<uint64_t> warned_{0};
    std::atomic<uint64_t> cache_hits_{0};
};

} // namespace llmshield
