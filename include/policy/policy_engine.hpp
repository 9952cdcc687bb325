#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace llmshield {

/**
 * @brief Fixed bundle of scanner defaults for one trust level
 */
struct PolicyPreset {
    PresetName name = PresetName::PUBLIC_WEBSITE;

    struct Injection {
        double threshold = 0.25;
        Decision action = Decision::BLOCK;
    } injection;

    struct Pii {
        PiiAction action = PiiAction::MASK;         // Default for unlisted types
        PiiAction email_action = PiiAction::MASK;
        PiiAction phone_action = PiiAction::MASK;
        PiiAction credit_card_action = PiiAction::BLOCK;
        PiiAction iban_action = PiiAction::BLOCK;
    } pii;

    struct Tools {
        std::vector<std::string> dangerous_patterns;
        size_t max_chain_depth = 3;
    } tools;

    struct Cost {
        double default_daily_budget = 10.0;         // USD
        double warn_at_percent = 80.0;
    } cost;
};

/**
 * @brief Preset lookup
 *
 * Three presets with decreasing injection strictness and increasing tool
 * permissiveness:
 * - public_website:   threshold 0.25 block, cards/IBAN blocked, 12 dangerous patterns
 * - internal_support: threshold 0.35 block, all PII masked, 7 dangerous patterns
 * - ops_agent:        threshold 0.5 warn, email/phone allowed, 4 dangerous patterns
 *
 * Immutable after construction.
 */
class PolicyEngine {
public:
    explicit PolicyEngine(PresetName preset = PresetName::PUBLIC_WEBSITE);

    [[nodiscard]] static const PolicyPreset& get_preset(PresetName preset);

    [[nodiscard]] const PolicyPreset& preset() const { return *preset_; }
    [[nodiscard]] PresetName preset_name() const { return preset_->name; }

    [[nodiscard]] double injection_threshold() const { return preset_->injection.threshold; }
    [[nodiscard]] Decision injection_action() const { return preset_->injection.action; }

    /// Per-type action where the preset lists one, else the preset default
    [[nodiscard]] PiiAction pii_action(std::optional<PiiType> type = std::nullopt) const;

    /// The per-type entries of the preset (email, phone, credit card, IBAN)
    [[nodiscard]] std::unordered_map<PiiType, PiiAction> pii_type_actions() const;

    [[nodiscard]] const std::vector<std::string>& dangerous_tool_patterns() const {
        return preset_->tools.dangerous_patterns;
    }
    [[nodiscard]] size_t max_tool_chain_depth() const { return preset_->tools.max_chain_depth; }
    [[nodiscard]] double daily_budget() const { return preset_->cost.default_daily_budget; }
    [[nodiscard]] double warn_at_percent() const { return preset_->cost.warn_at_percent; }

private:
    const PolicyPreset* preset_;
};

} // namespace llmshield
