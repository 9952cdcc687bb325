#pragma once

#include "core/types.hpp"
#include "finops/cost_tracker.hpp"
#include "finops/pricing.hpp"
#include "policy/tool_policy_scanner.hpp"
#include "scanner/heuristic_scanner.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace llmshield {

// ============================================================================
// Configuration Types
// ============================================================================
//
// Unset optionals fall back to the active preset when the Shield is built.

struct InjectionConfig {
    bool enabled = true;
    std::optional<InjectionStrictness> strictness;
    std::optional<double> threshold;            // Wins over strictness
    std::optional<Decision> action;             // block | warn
    std::vector<std::string> custom_patterns;
};

struct PiiConfig {
    bool enabled = true;
    std::optional<PiiAction> action;            // Default action
    std::unordered_map<PiiType, PiiAction> types;   // Per-type overrides
    std::vector<PiiType> allowed_types;
};

struct ToolsConfig {
    bool enabled = true;
    bool read_only_mode = false;
    std::optional<std::vector<std::string>> dangerous_patterns;
    std::optional<size_t> max_chain_depth;
    std::unordered_map<std::string, ToolPermissions> permissions;   // Keyed by agent id
    std::vector<ToolManifestPin> manifest_pins;
};

struct CostConfig {
    bool enabled = true;
    bool apply_preset_budget = false;           // Derive a "global" daily budget from the preset
    bool cascade_to_global = true;
    std::unordered_map<std::string, BudgetConfig> budgets;
    std::map<std::string, ModelPricing> pricing;    // Overrides / additions
};

enum class AuditStoreKind {
    CONSOLE,
    MEMORY,
    FILE
};

[[nodiscard]] const char* audit_store_kind_to_string(AuditStoreKind k);
[[nodiscard]] std::optional<AuditStoreKind> parse_audit_store_kind(std::string_view s);

struct AuditConfig {
    bool enabled = false;
    AuditStoreKind store = AuditStoreKind::CONSOLE;
    std::string file_path = "llm-shield-audit.jsonl";
    size_t max_file_size_bytes = 100ULL * 1024 * 1024;
    int max_files = 10;
    size_t batch_size = 100;
    std::chrono::milliseconds flush_interval{1000};
    int retention_days = 0;                     // 0 = keep forever
};

struct CacheConfig {
    bool enabled = false;
    size_t max_size = 1000;
    std::chrono::milliseconds ttl{300000};
};

/**
 * @brief Single settings object accepted by Shield
 */
struct ShieldConfig {
    PresetName preset = PresetName::PUBLIC_WEBSITE;
    bool early_exit = true;
    size_t max_input_bytes = 256 * 1024;        // 0 = unlimited

    InjectionConfig injection;
    PiiConfig pii;
    ToolsConfig tools;
    CostConfig cost;
    AuditConfig audit;
    CacheConfig cache;
};

} // namespace llmshield
