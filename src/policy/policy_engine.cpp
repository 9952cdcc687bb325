#include "policy/policy_engine.hpp"

namespace llmshield {

namespace {

PolicyPreset make_public_website() {
    PolicyPreset p;
    p.name = PresetName::PUBLIC_WEBSITE;
    p.injection = {.threshold = 0.25, .action = Decision::BLOCK};
    p.pii = {
        .action = PiiAction::MASK,
        .email_action = PiiAction::MASK,
        .phone_action = PiiAction::MASK,
        .credit_card_action = PiiAction::BLOCK,
        .iban_action = PiiAction::BLOCK,
    };
    p.tools = {
        .dangerous_patterns = {
            "delete_*", "remove_*", "drop_*", "destroy_*", "admin_*", "execute_*",
            "send_email", "payment_*", "transfer_*", "write_*", "create_*", "update_*",
        },
        .max_chain_depth = 3,
    };
    p.cost = {.default_daily_budget = 10.0, .warn_at_percent = 80.0};
    return p;
}

PolicyPreset make_internal_support() {
    PolicyPreset p;
    p.name = PresetName::INTERNAL_SUPPORT;
    p.injection = {.threshold = 0.35, .action = Decision::BLOCK};
    p.pii = {
        .action = PiiAction::MASK,
        .email_action = PiiAction::MASK,
        .phone_action = PiiAction::MASK,
        .credit_card_action = PiiAction::MASK,
        .iban_action = PiiAction::MASK,
    };
    p.tools = {
        .dangerous_patterns = {
            "delete_*", "remove_*", "drop_*", "destroy_*", "admin_*", "payment_*", "transfer_*",
        },
        .max_chain_depth = 5,
    };
    p.cost = {.default_daily_budget = 50.0, .warn_at_percent = 70.0};
    return p;
}

PolicyPreset make_ops_agent() {
    PolicyPreset p;
    p.name = PresetName::OPS_AGENT;
    p.injection = {.threshold = 0.5, .action = Decision::WARN};
    p.pii = {
        .action = PiiAction::MASK,
        .email_action = PiiAction::ALLOW,
        .phone_action = PiiAction::ALLOW,
        .credit_card_action = PiiAction::MASK,
        .iban_action = PiiAction::MASK,
    };
    p.tools = {
        .dangerous_patterns = {"drop_*", "destroy_*", "wipe_*", "shutdown_*"},
        .max_chain_depth = 8,
    };
    p.cost = {.default_daily_budget = 100.0, .warn_at_percent = 60.0};
    return p;
}

} // anonymous namespace

const PolicyPreset& PolicyEngine::get_preset(PresetName preset) {
    static const PolicyPreset public_website = make_public_website();
    static const PolicyPreset internal_support = make_internal_support();
    static const PolicyPreset ops_agent = make_ops_agent();

    switch (preset) {
        case PresetName::PUBLIC_WEBSITE:   return public_website;
        case PresetName::INTERNAL_SUPPORT: return internal_support;
        case PresetName::OPS_AGENT:        return ops_agent;
    }
    return public_website;
}

PolicyEngine::PolicyEngine(PresetName preset)
    : preset_(&get_preset(preset)) {}

PiiAction PolicyEngine::pii_action(std::optional<PiiType> type) const {
    if (!type) return preset_->pii.action;
    switch (*type) {
        case PiiType::EMAIL:       return preset_->pii.email_action;
        case PiiType::PHONE:       return preset_->pii.phone_action;
        case PiiType::CREDIT_CARD: return preset_->pii.credit_card_action;
        case PiiType::IBAN:        return preset_->pii.iban_action;
        default:                   return preset_->pii.action;
    }
}

std::unordered_map<PiiType, PiiAction> PolicyEngine::pii_type_actions() const {
    return {
        {PiiType::EMAIL, preset_->pii.email_action},
        {PiiType::PHONE, preset_->pii.phone_action},
        {PiiType::CREDIT_CARD, preset_->pii.credit_card_action},
        {PiiType::IBAN, preset_->pii.iban_action},
    };
}

} // namespace llmshield
