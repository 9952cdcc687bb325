#include "finops/cost_tracker.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <format>
#include <limits>
#include <mutex>

namespace llmshield {

const char* budget_period_to_string(BudgetPeriod p) {
    switch (p) {
        case BudgetPeriod::HOURLY:  return "hourly";
        case BudgetPeriod::DAILY:   return "daily";
        case BudgetPeriod::MONTHLY: return "monthly";
    }
    return "daily";
}

std::optional<BudgetPeriod> parse_budget_period(std::string_view s) {
    if (s == "hourly") return BudgetPeriod::HOURLY;
    if (s == "daily") return BudgetPeriod::DAILY;
    if (s == "monthly") return BudgetPeriod::MONTHLY;
    return std::nullopt;
}

int64_t budget_period_seconds(BudgetPeriod p) {
    switch (p) {
        case BudgetPeriod::HOURLY:  return 3600;
        case BudgetPeriod::DAILY:   return 86400;
        case BudgetPeriod::MONTHLY: return 86400 * 31;
    }
    return 86400;
}

CostTracker::CostTracker(Config config, std::shared_ptr<IBudgetStore> store)
    : config_(std::move(config)),
      store_(store ? std::move(store) : std::make_shared<InMemoryBudgetStore>()) {
    for (const auto& [entity, budget] : config_.budgets) {
        if (entity.empty()) {
            throw ShieldError(ErrorCategory::CONFIG_ERROR, "Budget with empty entity id");
        }
        if (budget.hard_limit <= 0.0 || budget.soft_limit < 0.0
            || budget.soft_limit > budget.hard_limit) {
            throw ShieldError(ErrorCategory::CONFIG_ERROR,
                std::format("Invalid budget for '{}': soft {} / hard {} "
                            "(need 0 <= soft <= hard, hard > 0)",
                            entity, budget.soft_limit, budget.hard_limit));
        }
    }
}

const BudgetConfig* CostTracker::find_budget(const std::string& entity_id) const {
    const auto it = config_.budgets.find(entity_id);
    return it != config_.budgets.end() ? &it->second : nullptr;
}

std::string CostTracker::budget_key(std::string_view entity_id, BudgetPeriod period,
                                    std::chrono::system_clock::time_point at) const {
    const auto time_t = std::chrono::system_clock::to_time_t(at);
    struct tm tm;
    gmtime_r(&time_t, &tm);

    std::string period_key;
    switch (period) {
        case BudgetPeriod::HOURLY:
            period_key = std::format("{:04d}-{:02d}-{:02d}-{:02d}",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour);
            break;
        case BudgetPeriod::DAILY:
            period_key = std::format("{:04d}-{:02d}-{:02d}",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
            break;
        case BudgetPeriod::MONTHLY:
            period_key = std::format("{:04d}-{:02d}", tm.tm_year + 1900, tm.tm_mon + 1);
            break;
    }
    return std::format("{}:cost:{}:{}", config_.key_prefix, entity_id, period_key);
}

double CostTracker::read_spend(const std::string& key) {
    const auto raw = store_->get(key);
    if (!raw) return 0.0;
    const auto value = utils::try_parse_double(*raw);
    if (!value) {
        throw ShieldError(ErrorCategory::STORE_ERROR,
            std::format("Budget store returned a non-numeric value for '{}': '{}'", key, *raw));
    }
    return *value;
}

BudgetCheckResult CostTracker::check_budget(const std::string& entity_id,
                                            std::string_view model,
                                            uint64_t est_input_tokens,
                                            uint64_t est_output_tokens) {
    BudgetCheckResult result;
    const auto* budget = find_budget(entity_id);
    if (!budget) {
        result.remaining_budget = std::numeric_limits<double>::infinity();
        return result;
    }

    const double estimated = config_.pricing.estimate_cost(model, est_input_tokens, est_output_tokens);
    const double current = read_spend(budget_key(entity_id, budget->period));
    result.current_spend = current;

    if (current + estimated > budget->hard_limit) {
        budget_denials_.fetch_add(1, std::memory_order_relaxed);
        result.allowed = false;
        result.remaining_budget = std::max(0.0, budget->hard_limit - current);
        result.warning = std::format("Hard budget limit reached: ${:.2f} / ${}",
                                     current, budget->hard_limit);
        utils::log::info(std::format("Budget denied for '{}': {}", entity_id, *result.warning));
        return result;
    }

    result.allowed = true;
    result.remaining_budget = budget->hard_limit - current;
    if (current + estimated > budget->soft_limit) {
        budget_warnings_.fetch_add(1, std::memory_order_relaxed);
        const auto pct = static_cast<long>(std::floor(current / budget->hard_limit * 100.0 + 0.5));
        result.warning = std::format("Approaching budget: ${:.2f} / ${} ({}%)",
                                     current, budget->hard_limit, pct);
    }
    return result;
}

void CostTracker::increment(const std::string& entity_id, const BudgetConfig& budget, double cost) {
    const auto key = budget_key(entity_id, budget.period);
    (void)store_->incrbyfloat(key, cost);
    (void)store_->expire(key, budget_period_seconds(budget.period) * 2);
}

CostRecord CostTracker::record_cost(const std::string& entity_id,
                                    std::string_view model,
                                    uint64_t input_tokens,
                                    uint64_t output_tokens) {
    CostRecord record{
        .entity_id = entity_id,
        .model = std::string(model),
        .input_tokens = input_tokens,
        .output_tokens = output_tokens,
        .cost = config_.pricing.estimate_cost(model, input_tokens, output_tokens),
        .timestamp = utils::now(),
    };

    if (const auto* budget = find_budget(entity_id)) {
        increment(entity_id, *budget, record.cost);
    }

    if (config_.cascade_to_global && entity_id != kGlobalEntity) {
        if (const auto* global = find_budget(std::string(kGlobalEntity))) {
            increment(std::string(kGlobalEntity), *global, record.cost);
        }
    }

    total_recorded_.fetch_add(1, std::memory_order_relaxed);
    {
        std::unique_lock lock(records_mutex_);
        if (config_.max_records > 0 && records_.size() >= config_.max_records) {
            records_.pop_front();
        }
        records_.push_back(record);
    }
    return record;
}

double CostTracker::get_current_spend(const std::string& entity_id) {
    const auto* budget = find_budget(entity_id);
    if (!budget) return 0.0;
    return read_spend(budget_key(entity_id, budget->period));
}

std::vector<CostRecord> CostTracker::records() const {
    std::shared_lock lock(records_mutex_);
    return {records_.begin(), records_.end()};
}

AnomalyResult CostTracker::check_anomaly(const std::string& entity_id, double cost) const {
    std::vector<double> history;
    {
        std::shared_lock lock(records_mutex_);
        for (const auto& r : records_) {
            if (r.entity_id == entity_id) history.push_back(r.cost);
        }
    }
    return detect_anomaly(cost, history, config_.anomaly_threshold);
}

CostTracker::Stats CostTracker::get_stats() const {
    std::shared_lock lock(records_mutex_);
    return {
        total_recorded_.load(std::memory_order_relaxed),
        budget_denials_.load(std::memory_order_relaxed),
        budget_warnings_.load(std::memory_order_relaxed),
        records_.size()
    };
}

} // namespace llmshield
