#include "core/shield.hpp"
#include "audit/console_store.hpp"
#include "audit/file_store.hpp"
#include "audit/memory_store.hpp"
#include "core/error.hpp"
#include "core/hash.hpp"
#include "core/utils.hpp"
#include "policy/tool_policy_scanner.hpp"
#include "scanner/heuristic_scanner.hpp"
#include "scanner/pii_scanner.hpp"

#include <format>
#include <limits>

namespace llmshield {

// ============================================================================
// Construction
// ============================================================================

Shield::Shield(const ShieldConfig& config, Dependencies deps)
    : config_(config),
      policy_(config.preset),
      chain_(ScannerChain::Config{
          .early_exit = config.early_exit,
          .max_input_bytes = config.max_input_bytes,
      }) {
    setup_scanners();
    setup_cost_tracker(std::move(deps.budget_store));
    setup_audit(std::move(deps.audit_store));

    if (config_.cache.enabled) {
        scan_cache_ = std::make_unique<ScanCache<ScanResult>>(ScanCache<ScanResult>::Config{
            .max_size = config_.cache.max_size,
            .ttl = config_.cache.ttl,
        });
    }

    utils::log::info(std::format("Shield ready: preset={}, scanners=[{}], cost={}, audit={}, cache={}",
        preset_to_string(config_.preset),
        utils::join(chain_.scanner_names(), ", "),
        utils::booltostr(cost_tracker_ != nullptr),
        utils::booltostr(audit_logger_ != nullptr),
        utils::booltostr(scan_cache_ != nullptr)));
}

Shield::~Shield() {
    close();
}

void Shield::setup_scanners() {
    const auto& inj = config_.injection;
    if (inj.enabled) {
        HeuristicScanner::Config hc;
        hc.threshold = inj.threshold;
        hc.strictness = inj.strictness;
        if (!hc.threshold && !hc.strictness) {
            hc.threshold = policy_.injection_threshold();
        }
        hc.action = inj.action.value_or(policy_.injection_action());
        hc.custom_patterns = inj.custom_patterns;
        chain_.add(std::make_shared<HeuristicScanner>(hc));
    }

    const auto& pii = config_.pii;
    if (pii.enabled) {
        PiiScanner::Config pc;
        pc.default_action = pii.action.value_or(policy_.pii_action());
        // An explicit default action replaces the preset's per-type entries
        if (!pii.action) {
            pc.type_actions = policy_.pii_type_actions();
        }
        for (const auto& [type, action] : pii.types) {
            pc.type_actions[type] = action;
        }
        pc.allowed_types.insert(pii.allowed_types.begin(), pii.allowed_types.end());
        chain_.add(std::make_shared<PiiScanner>(pc));
    }

    const auto& tools = config_.tools;
    if (tools.enabled) {
        ToolPolicy tp;
        tp.permissions = tools.permissions;
        tp.dangerous_patterns = tools.dangerous_patterns.value_or(policy_.dangerous_tool_patterns());
        tp.read_only_mode = tools.read_only_mode;
        tp.max_chain_depth = tools.max_chain_depth.value_or(policy_.max_tool_chain_depth());
        chain_.add(std::make_shared<ToolPolicyScanner>(std::move(tp), tools.manifest_pins));
    }
}

void Shield::setup_cost_tracker(std::shared_ptr<IBudgetStore> store) {
    const auto& cost = config_.cost;
    if (!cost.enabled) return;

    CostTracker::Config tc;
    tc.budgets = cost.budgets;
    tc.cascade_to_global = cost.cascade_to_global;
    for (const auto& [model, pricing] : cost.pricing) {
        tc.pricing.set(model, pricing);
    }

    if (cost.apply_preset_budget && !tc.budgets.contains(std::string(CostTracker::kGlobalEntity))) {
        const double hard = policy_.daily_budget();
        tc.budgets.emplace(std::string(CostTracker::kGlobalEntity), BudgetConfig{
            .soft_limit = hard * policy_.warn_at_percent() / 100.0,
            .hard_limit = hard,
            .period = BudgetPeriod::DAILY,
        });
    }

    if (tc.budgets.empty()) return;
    cost_tracker_ = std::make_unique<CostTracker>(std::move(tc), std::move(store));
}

void Shield::setup_audit(std::shared_ptr<IAuditStore> store) {
    const auto& audit = config_.audit;
    if (!audit.enabled) return;

    if (!store) {
        switch (audit.store) {
            case AuditStoreKind::CONSOLE:
                store = std::make_shared<ConsoleAuditStore>();
                break;
            case AuditStoreKind::MEMORY:
                store = std::make_shared<MemoryAuditStore>();
                break;
            case AuditStoreKind::FILE:
                store = std::make_shared<FileAuditStore>(FileAuditStore::Config{
                    .output_file = audit.file_path,
                    .max_file_size_bytes = audit.max_file_size_bytes,
                    .max_files = audit.max_files,
                    .retention_days = audit.retention_days,
                });
                break;
        }
    }

    audit_logger_ = std::make_unique<AuditLogger>(std::move(store), AuditLogger::Config{
        .batch_size = audit.batch_size,
        .flush_interval = audit.flush_interval,
    });
}

// ============================================================================
// Scanning
// ============================================================================

std::string Shield::cache_key(std::string_view input, const ScanContext& context) {
    std::string material;
    material.reserve(input.size() + 64);
    material.append(input);
    material += '\x1f';
    material += context.agent_id;
    material += '\x1f';
    material += context.preset ? preset_to_string(*context.preset) : "";
    for (const auto& tool : context.tools) {
        material += '\x1f';
        material += tool.server_id;
        material += '/';
        material += tool.name;
    }
    return hash::sha256_hex(material);
}

ScanResult Shield::scan(std::string_view input, const ScanContext& context) {
    total_scans_.fetch_add(1, std::memory_order_relaxed);

    ScanContext ctx = context;
    if (!ctx.preset) {
        ctx.preset = config_.preset;
    }

    ScanResult result;
    std::string key;
    bool hit = false;
    if (scan_cache_) {
        key = cache_key(input, ctx);
        if (auto cached = scan_cache_->get(key)) {
            result = std::move(*cached);
            result.meta.cached = true;
            cache_hits_.fetch_add(1, std::memory_order_relaxed);
            hit = true;
        }
    }

    if (!hit) {
        result = chain_.run(input, ctx);
        if (scan_cache_) {
            scan_cache_->set(key, result);
        }
    }

    count(result);

    if (audit_logger_) {
        AuditExtras extras;
        extras.tools_called.reserve(ctx.tools.size());
        for (const auto& tool : ctx.tools) {
            extras.tools_called.push_back(tool.name);
        }
        audit_logger_->enqueue(input, result, ctx, extras);
    }

    return result;
}

void Shield::count(const ScanResult& result) {
    switch (result.decision) {
        case Decision::BLOCK:
            blocked_.fetch_add(1, std::memory_order_relaxed);
            break;
        case Decision::WARN:
            warned_.fetch_add(1, std::memory_order_relaxed);
            break;
        case Decision::ALLOW:
            break;
    }
}

// ============================================================================
// Cost
// ============================================================================

BudgetCheckResult Shield::check_budget(const std::string& entity_id,
                                       std::string_view model,
                                       uint64_t est_input_tokens,
                                       uint64_t est_output_tokens) {
    if (!cost_tracker_) {
        return BudgetCheckResult{
            .allowed = true,
            .current_spend = 0.0,
            .remaining_budget = std::numeric_limits<double>::infinity(),
            .warning = std::nullopt,
        };
    }
    return cost_tracker_->check_budget(entity_id, model, est_input_tokens, est_output_tokens);
}

std::optional<CostRecord> Shield::record_cost(const std::string& entity_id,
                                              std::string_view model,
                                              uint64_t input_tokens,
                                              uint64_t output_tokens) {
    if (!cost_tracker_) return std::nullopt;
    return cost_tracker_->record_cost(entity_id, model, input_tokens, output_tokens);
}

double Shield::get_current_spend(const std::string& entity_id) {
    if (!cost_tracker_) return 0.0;
    return cost_tracker_->get_current_spend(entity_id);
}

void Shield::close() {
    if (audit_logger_) {
        audit_logger_->close();
    }
}

} // namespace llmshield
