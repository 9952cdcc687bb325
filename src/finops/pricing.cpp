#include "finops/pricing.hpp"

namespace llmshield {

PricingTable::PricingTable() {
    prices_ = {
        // OpenAI
        {"gpt-5.2",           {2.50, 10.0}},
        {"gpt-5.1",           {2.50, 10.0}},
        {"gpt-5",             {2.50, 10.0}},
        {"gpt-4.1",           {2.00, 8.00}},
        {"gpt-4o",            {2.50, 10.0}},
        {"gpt-4o-mini",       {0.15, 0.60}},
        {"o3",                {10.0, 40.0}},
        {"o3-mini",           {1.10, 4.40}},
        {"o4-mini",           {1.10, 4.40}},

        // Anthropic
        {"claude-opus-4-6",   {15.0, 75.0}},
        {"claude-sonnet-4-6", {3.00, 15.0}},
        {"claude-haiku-4-5",  {0.80, 4.00}},

        // Aliases
        {"gpt-5.2-turbo",     {2.50, 10.0}},
        {"opus",              {15.0, 75.0}},
        {"sonnet",            {3.00, 15.0}},
        {"haiku",             {0.80, 4.00}},
    };
}

const PricingTable& PricingTable::builtin() {
    static const PricingTable table;
    return table;
}

void PricingTable::set(std::string model, ModelPricing pricing) {
    prices_.insert_or_assign(std::move(model), pricing);
}

ModelPricing PricingTable::lookup(std::string_view model) const {
    if (const auto it = prices_.find(model); it != prices_.end()) {
        return it->second;
    }

    const ModelPricing* best = nullptr;
    size_t best_len = 0;
    for (const auto& [name, pricing] : prices_) {
        if (name.size() > best_len && model.starts_with(name)) {
            best = &pricing;
            best_len = name.size();
        }
    }
    return best ? *best : kFallback;
}

double PricingTable::estimate_cost(std::string_view model,
                                   uint64_t input_tokens,
                                   uint64_t output_tokens) const {
    const auto p = lookup(model);
    return (static_cast<double>(input_tokens) / 1'000'000.0) * p.input_per_1m
         + (static_cast<double>(output_tokens) / 1'000'000.0) * p.output_per_1m;
}

double estimate_cost(std::string_view model, uint64_t input_tokens, uint64_t output_tokens) {
    return PricingTable::builtin().estimate_cost(model, input_tokens, output_tokens);
}

} // namespace llmshield
