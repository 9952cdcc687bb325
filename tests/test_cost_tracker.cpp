#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "finops/cost_tracker.hpp"
#include "core/error.hpp"
#include "mocks/mock_stores.hpp"

#include <chrono>
#include <cmath>
#include <memory>
#include <thread>
#include <vector>

using namespace llmshield;
using Catch::Approx;

namespace {

// claude-sonnet-4-6: $3 / 1M input, $15 / 1M output
constexpr std::string_view kModel = "claude-sonnet-4-6";

CostTracker::Config make_config() {
    CostTracker::Config cfg;
    cfg.budgets["support-bot"] = BudgetConfig{.soft_limit = 5.0, .hard_limit = 10.0,
                                              .period = BudgetPeriod::DAILY};
    cfg.budgets["global"] = BudgetConfig{.soft_limit = 80.0, .hard_limit = 100.0,
                                         .period = BudgetPeriod::DAILY};
    return cfg;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

TEST_CASE("CostTracker: invalid budgets are config errors", "[cost]") {
    CostTracker::Config cfg;
    cfg.budgets["x"] = BudgetConfig{.soft_limit = 20.0, .hard_limit = 10.0,
                                    .period = BudgetPeriod::DAILY};
    try {
        CostTracker tracker(cfg);
        FAIL("expected ShieldError");
    } catch (const ShieldError& e) {
        CHECK(e.category() == ErrorCategory::CONFIG_ERROR);
    }

    CostTracker::Config zero;
    zero.budgets["y"] = BudgetConfig{.soft_limit = 0.0, .hard_limit = 0.0,
                                     .period = BudgetPeriod::DAILY};
    CHECK_THROWS_AS(CostTracker(zero), ShieldError);
}

TEST_CASE("CostTracker: period keys", "[cost]") {
    CostTracker tracker(make_config());
    // 2026-03-05T07:08:09Z
    const auto at = std::chrono::system_clock::from_time_t(1772694489);

    CHECK(tracker.budget_key("a", BudgetPeriod::HOURLY, at) == "llm-shield:cost:a:2026-03-05-07");
    CHECK(tracker.budget_key("a", BudgetPeriod::DAILY, at) == "llm-shield:cost:a:2026-03-05");
    CHECK(tracker.budget_key("a", BudgetPeriod::MONTHLY, at) == "llm-shield:cost:a:2026-03");
}

// ============================================================================
// Budget checks
// ============================================================================

TEST_CASE("CostTracker: entity without budget is always allowed", "[cost]") {
    CostTracker tracker(make_config());
    auto r = tracker.check_budget("unknown", kModel, 1'000'000, 1'000'000);
    CHECK(r.allowed);
    CHECK(r.current_spend == Approx(0.0));
    CHECK(std::isinf(r.remaining_budget));
    CHECK_FALSE(r.warning.has_value());
}

TEST_CASE("CostTracker: fresh budget allows without warning", "[cost]") {
    CostTracker tracker(make_config());
    auto r = tracker.check_budget("support-bot", kModel, 1000, 500);
    CHECK(r.allowed);
    CHECK(r.current_spend == Approx(0.0));
    CHECK(r.remaining_budget == Approx(10.0));
    CHECK_FALSE(r.warning.has_value());
}

TEST_CASE("CostTracker: projected spend over soft limit warns", "[cost]") {
    CostTracker tracker(make_config());
    (void)tracker.record_cost("support-bot", kModel, 2'000'000, 0);    // $6

    auto r = tracker.check_budget("support-bot", kModel, 1000, 500);
    CHECK(r.allowed);
    CHECK(r.current_spend == Approx(6.0));
    CHECK(r.remaining_budget == Approx(4.0));
    REQUIRE(r.warning.has_value());
    CHECK(*r.warning == "Approaching budget: $6.00 / $10 (60%)");
    CHECK(tracker.get_stats().budget_warnings == 1);
}

TEST_CASE("CostTracker: projected spend over hard limit is denied", "[cost]") {
    CostTracker tracker(make_config());
    (void)tracker.record_cost("support-bot", kModel, 3'000'000, 0);    // $9

    auto r = tracker.check_budget("support-bot", kModel, 1'000'000, 0); // +$3
    CHECK_FALSE(r.allowed);
    CHECK(r.current_spend == Approx(9.0));
    CHECK(r.remaining_budget == Approx(1.0));
    REQUIRE(r.warning.has_value());
    CHECK(*r.warning == "Hard budget limit reached: $9.00 / $10");
    CHECK(tracker.get_stats().budget_denials == 1);
}

TEST_CASE("CostTracker: remaining budget never goes negative", "[cost]") {
    CostTracker tracker(make_config());
    (void)tracker.record_cost("support-bot", kModel, 4'000'000, 0);    // $12

    auto r = tracker.check_budget("support-bot", kModel, 1, 0);
    CHECK_FALSE(r.allowed);
    CHECK(r.remaining_budget == Approx(0.0));
}

// ============================================================================
// Recording
// ============================================================================

TEST_CASE("CostTracker: record_cost returns a priced record", "[cost]") {
    CostTracker tracker(make_config());
    auto rec = tracker.record_cost("support-bot", kModel, 1'000'000, 100'000);
    CHECK(rec.entity_id == "support-bot");
    CHECK(rec.model == kModel);
    CHECK(rec.input_tokens == 1'000'000);
    CHECK(rec.output_tokens == 100'000);
    CHECK(rec.cost == Approx(4.5));
    CHECK(tracker.records().size() == 1);
    CHECK(tracker.get_stats().total_recorded == 1);
}

TEST_CASE("CostTracker: recording cascades to global", "[cost]") {
    auto store = std::make_shared<InMemoryBudgetStore>();
    CostTracker tracker(make_config(), store);

    (void)tracker.record_cost("support-bot", kModel, 1'000'000, 0);   // $3

    CHECK(tracker.get_current_spend("support-bot") == Approx(3.0));
    CHECK(tracker.get_current_spend("global") == Approx(3.0));
    CHECK(store->size() == 2);
}

TEST_CASE("CostTracker: cascade can be disabled", "[cost]") {
    auto cfg = make_config();
    cfg.cascade_to_global = false;
    CostTracker tracker(cfg);

    (void)tracker.record_cost("support-bot", kModel, 1'000'000, 0);
    CHECK(tracker.get_current_spend("support-bot") == Approx(3.0));
    CHECK(tracker.get_current_spend("global") == Approx(0.0));
}

TEST_CASE("CostTracker: entity without budget still feeds global", "[cost]") {
    CostTracker tracker(make_config());
    (void)tracker.record_cost("marketing-bot", kModel, 1'000'000, 0);
    CHECK(tracker.get_current_spend("marketing-bot") == Approx(0.0));
    CHECK(tracker.get_current_spend("global") == Approx(3.0));
}

TEST_CASE("CostTracker: counters expire after twice the period", "[cost]") {
    auto store = std::make_shared<InMemoryBudgetStore>();
    CostTracker tracker(make_config(), store);
    (void)tracker.record_cost("support-bot", kModel, 1000, 0);

    auto ttl = store->ttl(tracker.budget_key("support-bot", BudgetPeriod::DAILY));
    REQUIRE(ttl.has_value());
    CHECK(ttl->count() > 86400);
    CHECK(ttl->count() <= 2 * 86400);
}

TEST_CASE("CostTracker: concurrent recording loses no updates", "[cost]") {
    CostTracker tracker(make_config());

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&tracker] {
            for (int i = 0; i < 100; ++i) {
                (void)tracker.record_cost("support-bot", kModel, 1000, 0);  // $0.003
            }
        });
    }
    for (auto& th : threads) th.join();

    CHECK(tracker.get_current_spend("support-bot") == Approx(2.4));
    CHECK(tracker.get_current_spend("global") == Approx(2.4));
    CHECK(tracker.records().size() == 800);
}

TEST_CASE("CostTracker: record log is bounded", "[cost]") {
    auto cfg = make_config();
    cfg.max_records = 3;
    CostTracker tracker(cfg);
    for (int i = 1; i <= 5; ++i) {
        (void)tracker.record_cost("support-bot", kModel, static_cast<uint64_t>(i), 0);
    }
    auto records = tracker.records();
    REQUIRE(records.size() == 3);
    CHECK(records.front().input_tokens == 3);
    CHECK(records.back().input_tokens == 5);
}

TEST_CASE("CostTracker: anomaly check over recorded history", "[cost]") {
    CostTracker tracker(make_config());
    for (int i = 0; i < 4; ++i) {
        (void)tracker.record_cost("support-bot", kModel, 1'000'000, 0);    // $3
    }
    CHECK_FALSE(tracker.check_anomaly("support-bot", 3.0).is_anomaly);
    CHECK(tracker.check_anomaly("support-bot", 30.0).is_anomaly);
    // Other entities have no history
    CHECK_FALSE(tracker.check_anomaly("other", 30.0).is_anomaly);
}

// ============================================================================
// Store failures
// ============================================================================

TEST_CASE("CostTracker: store failures propagate", "[cost]") {
    CostTracker tracker(make_config(), std::make_shared<llmshield::testing::UnreachableBudgetStore>());
    CHECK_THROWS(tracker.check_budget("support-bot", kModel, 10, 10));
    CHECK_THROWS(tracker.record_cost("support-bot", kModel, 10, 10));
    CHECK_THROWS(tracker.get_current_spend("support-bot"));
}

TEST_CASE("CostTracker: non-numeric store value is a store error", "[cost]") {
    CostTracker tracker(make_config(), std::make_shared<llmshield::testing::FixedValueBudgetStore>("oops"));
    try {
        (void)tracker.get_current_spend("support-bot");
        FAIL("expected ShieldError");
    } catch (const ShieldError& e) {
        CHECK(e.category() == ErrorCategory::STORE_ERROR);
    }
}

// ============================================================================
// In-memory store
// ============================================================================

TEST_CASE("InMemoryBudgetStore: incrbyfloat and expire", "[cost]") {
    InMemoryBudgetStore store;
    CHECK_FALSE(store.get("k").has_value());
    CHECK(store.expire("k", 10) == 0);

    CHECK(store.incrbyfloat("k", 1.5) == "1.5");
    CHECK(store.incrbyfloat("k", 2.0) == "3.5");
    CHECK(store.get("k") == std::optional<std::string>("3.5"));

    CHECK(store.expire("k", 60) == 1);
    REQUIRE(store.ttl("k").has_value());

    CHECK(store.expire("k", 0) == 1);
    CHECK_FALSE(store.get("k").has_value());
    CHECK(store.size() == 0);
}
